// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_REACTOR_HOOKS_H
#define DUTCHX_REACTOR_HOOKS_H

/**
 * Hook registry
 *
 * Orders name their custom validation and pre/post execution hooks by
 * CKeyID. The host registers a strategy for each identity it deploys. An
 * order that names an identity nobody registered fails exactly like a call
 * into a missing contract.
 *
 * Validators are read-only. Execution hooks see the operation's token view
 * and may move funds through it.
 */

#include "consensus/validation.h"
#include "ledger/tokenview.h"
#include "primitives/order.h"
#include "pubkey.h"

#include <functional>
#include <map>

struct ResolvedCrossChainOrder;

typedef std::function<bool(const CKeyID& filler, const ResolvedOrder& order)> ValidationHook;
typedef std::function<bool(const CKeyID& filler, const ResolvedOrder& order, CTokenViewCache& view)> ExecutionHook;
typedef std::function<bool(const CKeyID& filler, const ResolvedCrossChainOrder& order)> CrossChainValidationHook;

class CHookRegistry
{
private:
    std::map<CKeyID, ValidationHook> mapValidators;
    std::map<CKeyID, ExecutionHook> mapExecutionHooks;
    std::map<CKeyID, CrossChainValidationHook> mapCrossChainValidators;

public:
    void RegisterValidator(const CKeyID& id, ValidationHook hook) { mapValidators[id] = hook; }
    void RegisterExecutionHook(const CKeyID& id, ExecutionHook hook) { mapExecutionHooks[id] = hook; }
    void RegisterCrossChainValidator(const CKeyID& id, CrossChainValidationHook hook) { mapCrossChainValidators[id] = hook; }

    //! Null validationContract passes. Fails with "validation-contract-unknown" or "validation-failed".
    bool RunValidation(const CKeyID& filler, const ResolvedOrder& order, CValidationState& state) const;
    bool RunCrossChainValidation(const CKeyID& validator, const CKeyID& filler,
                                 const ResolvedCrossChainOrder& order, CValidationState& state) const;

    //! Null hook passes. Fails with "hook-unknown" or "pre-execution-hook-failed".
    bool RunPreExecutionHook(const CKeyID& filler, const ResolvedOrder& order, CTokenViewCache& view, CValidationState& state) const;
    bool RunPostExecutionHook(const CKeyID& filler, const ResolvedOrder& order, CTokenViewCache& view, CValidationState& state) const;
};

#endif // DUTCHX_REACTOR_HOOKS_H
