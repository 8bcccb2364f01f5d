// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "reactor/reactor.h"

#include "auction/resolver.h"
#include "chainparams.h"
#include "logging.h"

CReactor::CReactor(const CKeyID& idIn, CTransferCollaborator& permitIn, const CHookRegistry& hooksIn,
                   FeeController feeControllerIn)
    : id(idIn), permit(permitIn), hooks(hooksIn), feeController(feeControllerIn)
{
}

bool CReactor::PrepareOrder(ResolvedOrder& order, const FillContext& ctx, CValidationState& state) const
{
    if (order.info.reactor != id) {
        return state.DoS(100, false, REJECT_UNAUTHORIZED, "invalid-reactor");
    }
    if (ctx.nTime > order.info.deadline) {
        return state.DoS(0, false, REJECT_TIMING, "deadline-passed");
    }

    const uint64_t nChainId = Params().GetConsensus().nChainId;
    for (const OutputToken& output : order.outputs) {
        if (output.chainId != 0 && output.chainId != nChainId) {
            return state.DoS(100, false, REJECT_INVALID, "bad-output-chain");
        }
    }

    if (!hooks.RunValidation(ctx.filler, order, state)) {
        return false;
    }
    return InjectFees(order, feeController, state);
}

bool CReactor::TransferInput(const ResolvedOrder& order, const FillContext& ctx, CTokenViewCache& view, CValidationState& state)
{
    PermitTransferFrom permitData;
    permitData.permitted.token = order.input.token;
    permitData.permitted.amount = order.input.maxAmount;
    permitData.nonce = order.info.nonce;
    permitData.deadline = order.info.deadline;

    SignatureTransferDetails details;
    details.to = ctx.filler;
    details.requestedAmount = order.input.amount;

    return permit.PermitWitnessTransferFrom(view, permitData, details, order.info.swapper, id,
                                            order.hash, order.vchSig, ctx.nTime, state);
}

bool CReactor::FillOutputs(const ResolvedOrder& order, const FillContext& ctx, CTokenViewCache& view, CValidationState& state) const
{
    for (const OutputToken& output : order.outputs) {
        if (!view.Transfer(output.token, ctx.filler, output.recipient, output.amount, state)) {
            return false;
        }
    }
    return true;
}

bool CReactor::Execute(const SignedOrder& order, const FillContext& ctx, const FillCallback& callback,
                       const std::vector<unsigned char>& fillerData, CTokenViewCache& view,
                       CValidationState& state, std::vector<CFillEvent>* pEvents)
{
    return ExecuteBatch(std::vector<SignedOrder>(1, order), ctx, callback, fillerData, view, state, pEvents);
}

bool CReactor::ExecuteBatch(const std::vector<SignedOrder>& orders, const FillContext& ctx, const FillCallback& callback,
                            const std::vector<unsigned char>& fillerData, CTokenViewCache& view,
                            CValidationState& state, std::vector<CFillEvent>* pEvents)
{
    if (orders.empty()) {
        return state.DoS(10, false, REJECT_INVALID, "bad-batch-empty");
    }
    if (orders.size() > Params().GetConsensus().nMaxBatchSize) {
        return state.DoS(100, false, REJECT_INVALID, "bad-batch-size");
    }

    std::vector<ResolvedOrder> vResolved;
    vResolved.reserve(orders.size());
    for (const SignedOrder& order : orders) {
        ResolvedOrder resolved;
        if (!ResolveOrder(order, ctx, resolved, state)) {
            LogPrint(BCLog::REACTOR, "ExecuteBatch: resolve failed: %s\n", state.GetRejectReason());
            return false;
        }
        if (!PrepareOrder(resolved, ctx, state)) {
            LogPrint(BCLog::REACTOR, "ExecuteBatch: order %s rejected: %s\n",
                     resolved.hash.ToString().substr(0, 16), state.GetRejectReason());
            return false;
        }
        vResolved.push_back(resolved);
    }

    CTokenViewCache viewBatch(&view);

    for (const ResolvedOrder& order : vResolved) {
        if (!hooks.RunPreExecutionHook(ctx.filler, order, viewBatch, state)) return false;
        if (!TransferInput(order, ctx, viewBatch, state)) {
            LogPrint(BCLog::REACTOR, "ExecuteBatch: input of %s not collected: %s\n",
                     order.hash.ToString().substr(0, 16), state.GetRejectReason());
            return false;
        }
    }

    if (callback && !callback(vResolved, fillerData, viewBatch)) {
        return state.DoS(0, false, REJECT_POLICY, "filler-callback-failed");
    }

    for (const ResolvedOrder& order : vResolved) {
        if (!FillOutputs(order, ctx, viewBatch, state)) {
            LogPrint(BCLog::REACTOR, "ExecuteBatch: outputs of %s not paid: %s\n",
                     order.hash.ToString().substr(0, 16), state.GetRejectReason());
            return false;
        }
        if (!hooks.RunPostExecutionHook(ctx.filler, order, viewBatch, state)) return false;
    }

    if (!viewBatch.Flush()) {
        return state.Error("reactor-flush-failed");
    }

    for (const ResolvedOrder& order : vResolved) {
        LogPrint(BCLog::REACTOR, "Fill: order=%s filler=%s swapper=%s nonce=%d\n",
                 order.hash.ToString().substr(0, 16), ctx.filler.ToString(),
                 order.info.swapper.ToString(), order.info.nonce);
        if (pEvents) {
            CFillEvent event;
            event.orderHash = order.hash;
            event.filler = ctx.filler;
            event.swapper = order.info.swapper;
            event.nonce = order.info.nonce;
            pEvents->push_back(event);
        }
    }
    return true;
}
