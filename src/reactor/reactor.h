// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_REACTOR_REACTOR_H
#define DUTCHX_REACTOR_REACTOR_H

/**
 * Reactor (fill engine)
 *
 * Executes one order or a batch of orders for a single filler:
 *
 *   1. resolve every order, preserving batch order
 *   2. per order: reactor identity, deadline, output domain, custom validation
 *   3. append protocol fee outputs
 *   4. pre-execution hooks
 *   5. collect every input from its own maker via permit, paid to the filler
 *   6. invoke the filler callback once with the whole resolved batch
 *   7. pay every output from the filler, then post-execution hooks
 *   8. one CFillEvent per order, in batch order
 *
 * All token movement happens in a child of the caller's view which is only
 * flushed when the whole batch succeeded. Any failure leaves the caller's
 * view untouched.
 */

#include "consensus/validation.h"
#include "ledger/tokenview.h"
#include "permit/signaturetransfer.h"
#include "primitives/order.h"
#include "reactor/hooks.h"
#include "reactor/protocolfees.h"

#include <functional>
#include <vector>

/**
 * Filler callback. Receives the resolved batch after inputs reached the
 * filler; by the time it returns the filler must hold every output.
 */
typedef std::function<bool(const std::vector<ResolvedOrder>& orders,
                           const std::vector<unsigned char>& fillerData,
                           CTokenViewCache& view)> FillCallback;

class CReactor
{
private:
    CKeyID id;
    CTransferCollaborator& permit;
    const CHookRegistry& hooks;
    FeeController feeController;

    bool PrepareOrder(ResolvedOrder& order, const FillContext& ctx, CValidationState& state) const;
    bool TransferInput(const ResolvedOrder& order, const FillContext& ctx, CTokenViewCache& view, CValidationState& state);
    bool FillOutputs(const ResolvedOrder& order, const FillContext& ctx, CTokenViewCache& view, CValidationState& state) const;

public:
    CReactor(const CKeyID& idIn, CTransferCollaborator& permitIn, const CHookRegistry& hooksIn,
             FeeController feeControllerIn = FeeController());

    const CKeyID& GetId() const { return id; }

    bool Execute(const SignedOrder& order, const FillContext& ctx, const FillCallback& callback,
                 const std::vector<unsigned char>& fillerData, CTokenViewCache& view,
                 CValidationState& state, std::vector<CFillEvent>* pEvents = nullptr);

    bool ExecuteBatch(const std::vector<SignedOrder>& orders, const FillContext& ctx, const FillCallback& callback,
                      const std::vector<unsigned char>& fillerData, CTokenViewCache& view,
                      CValidationState& state, std::vector<CFillEvent>* pEvents = nullptr);
};

#endif // DUTCHX_REACTOR_REACTOR_H
