// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "reactor/hooks.h"

#include "logging.h"

bool CHookRegistry::RunValidation(const CKeyID& filler, const ResolvedOrder& order, CValidationState& state) const
{
    const CKeyID& validator = order.info.validationContract;
    if (validator.IsNull()) {
        return true;
    }

    auto it = mapValidators.find(validator);
    if (it == mapValidators.end()) {
        return state.DoS(0, false, REJECT_POLICY, "validation-contract-unknown");
    }
    if (!it->second(filler, order)) {
        LogPrint(BCLog::REACTOR, "RunValidation: %s rejected %s\n",
                 validator.ToString(), order.hash.ToString().substr(0, 16));
        return state.DoS(0, false, REJECT_POLICY, "validation-failed");
    }
    return true;
}

bool CHookRegistry::RunCrossChainValidation(const CKeyID& validator, const CKeyID& filler,
                                            const ResolvedCrossChainOrder& order, CValidationState& state) const
{
    if (validator.IsNull()) {
        return true;
    }

    auto it = mapCrossChainValidators.find(validator);
    if (it == mapCrossChainValidators.end()) {
        return state.DoS(0, false, REJECT_POLICY, "validation-contract-unknown");
    }
    if (!it->second(filler, order)) {
        return state.DoS(0, false, REJECT_POLICY, "validation-failed");
    }
    return true;
}

bool CHookRegistry::RunPreExecutionHook(const CKeyID& filler, const ResolvedOrder& order, CTokenViewCache& view, CValidationState& state) const
{
    const CKeyID& hook = order.info.preExecutionHook;
    if (hook.IsNull()) {
        return true;
    }

    auto it = mapExecutionHooks.find(hook);
    if (it == mapExecutionHooks.end()) {
        return state.DoS(0, false, REJECT_POLICY, "hook-unknown");
    }
    if (!it->second(filler, order, view)) {
        return state.DoS(0, false, REJECT_POLICY, "pre-execution-hook-failed");
    }
    return true;
}

bool CHookRegistry::RunPostExecutionHook(const CKeyID& filler, const ResolvedOrder& order, CTokenViewCache& view, CValidationState& state) const
{
    const CKeyID& hook = order.info.postExecutionHook;
    if (hook.IsNull()) {
        return true;
    }

    auto it = mapExecutionHooks.find(hook);
    if (it == mapExecutionHooks.end()) {
        return state.DoS(0, false, REJECT_POLICY, "hook-unknown");
    }
    if (!it->second(filler, order, view)) {
        return state.DoS(0, false, REJECT_POLICY, "post-execution-hook-failed");
    }
    return true;
}
