// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/settler.h"

#include "logging.h"

CSettler::CSettler(const CKeyID& idIn, CTransferCollaborator& permitIn, const CHookRegistry& hooksIn,
                   CSettlementDB& dbIn, SettlementEventSink eventSinkIn)
    : id(idIn), permit(permitIn), hooks(hooksIn), db(dbIn), eventSink(eventSinkIn)
{
}

bool CSettler::GetSettlement(const uint256& orderHash, ActiveSettlement& settlement) const
{
    return db.ReadSettlement(orderHash, settlement);
}

bool CSettler::LoadSettlement(const uint256& orderHash, SettlementTransition transition, const CSettlementDB::Batch& batch,
                              ActiveSettlement& settlement, SettlementStatus& nextRet, CValidationState& state) const
{
    if (!batch.ReadSettlement(orderHash, settlement)) {
        return state.DoS(0, false, REJECT_INVALID, "settlement-not-found");
    }
    if (!GetNextStatus(settlement.status, transition, nextRet, state)) {
        LogPrint(BCLog::SETTLEMENT, "%s: %s refused for %s: %s\n", __func__,
                 SettlementTransitionToString(transition), orderHash.ToString().substr(0, 16), state.GetRejectReason());
        return false;
    }
    return true;
}

bool CSettler::StageSettlement(const ActiveSettlement& settlement, CTokenViewCache& viewChild,
                               CSettlementDB::Batch& batch, CValidationState& state)
{
    if (!viewChild.Flush()) {
        return state.Error("settlement-flush-failed");
    }
    batch.WriteSettlement(settlement);
    return true;
}

void CSettler::NotifyEvent(SettlementEventType type, const uint256& orderHash, const CKeyID& actor) const
{
    if (!eventSink) return;
    CSettlementEvent event;
    event.type = type;
    event.orderHash = orderHash;
    event.actor = actor;
    eventSink(event);
}

bool CSettler::InitiateSettlement(const SignedOrder& order, const CKeyID& destinationFiller, const SettlementContext& ctx,
                                  CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state,
                                  uint256* pOrderHash)
{
    ResolvedCrossChainOrder resolved;
    if (!ResolveCrossChainOrder(order, ctx.nTime, resolved, state)) {
        return false;
    }
    if (resolved.info.settler != id) {
        return state.DoS(100, false, REJECT_UNAUTHORIZED, "settlement-bad-settler");
    }
    if (ctx.nTime > resolved.info.initiateDeadline) {
        return state.DoS(0, false, REJECT_TIMING, "initiate-deadline-passed");
    }
    if (batch.HasSettlement(resolved.hash)) {
        return state.DoS(0, false, REJECT_DUPLICATE, "settlement-exists");
    }
    if (!hooks.RunCrossChainValidation(resolved.info.validationContract, ctx.caller, resolved, state)) {
        return false;
    }

    CTokenViewCache viewChild(&view);

    PermitTransferFrom permitData;
    permitData.permitted.token = resolved.input.token;
    permitData.permitted.amount = resolved.input.maxAmount;
    permitData.nonce = resolved.info.nonce;
    permitData.deadline = resolved.info.initiateDeadline;

    SignatureTransferDetails details;
    details.to = id;
    details.requestedAmount = resolved.input.amount;

    if (!permit.PermitWitnessTransferFrom(viewChild, permitData, details, resolved.info.offerer, id,
                                          resolved.hash, resolved.vchSig, ctx.nTime, state)) {
        return false;
    }
    if (!viewChild.Transfer(resolved.fillerCollateral.token, ctx.caller, id, resolved.fillerCollateral.amount, state)) {
        return false;
    }

    ActiveSettlement settlement;
    settlement.orderHash = resolved.hash;
    settlement.status = SettlementStatus::PENDING;
    settlement.offerer = resolved.info.offerer;
    settlement.originFiller = ctx.caller;
    settlement.destinationFiller = destinationFiller;
    settlement.settlementOracle = resolved.info.settlementOracle;
    settlement.fillDeadline = ctx.nTime + resolved.info.fillPeriod;
    settlement.optimisticDeadline = ctx.nTime + resolved.info.optimisticPeriod;
    settlement.challengeDeadline = ctx.nTime + resolved.info.challengePeriod;
    settlement.input = resolved.input;
    settlement.fillerCollateral = resolved.fillerCollateral;
    settlement.challengerCollateral = resolved.challengerCollateral;
    settlement.outputs = resolved.outputs;

    if (!StageSettlement(settlement, viewChild, batch, state)) {
        return false;
    }

    LogPrint(BCLog::SETTLEMENT, "InitiateSettlement: %s\n", settlement.ToString());
    NotifyEvent(SettlementEventType::INITIATE, settlement.orderHash, ctx.caller);
    if (pOrderHash) *pOrderHash = settlement.orderHash;
    return true;
}

bool CSettler::ChallengeSettlement(const uint256& orderHash, const SettlementContext& ctx,
                                   CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state)
{
    if (ctx.caller.IsNull()) {
        return state.DoS(100, false, REJECT_INVALID, "bad-challenger");
    }

    ActiveSettlement settlement;
    SettlementStatus next;
    if (!LoadSettlement(orderHash, SettlementTransition::CHALLENGE, batch, settlement, next, state)) {
        return false;
    }
    if (ctx.nTime >= settlement.challengeDeadline) {
        return state.DoS(0, false, REJECT_TIMING, "challenge-period-over");
    }

    CTokenViewCache viewChild(&view);
    if (!viewChild.Transfer(settlement.challengerCollateral.token, ctx.caller, id,
                            settlement.challengerCollateral.amount, state)) {
        return false;
    }

    settlement.status = next;
    settlement.challenger = ctx.caller;
    if (!StageSettlement(settlement, viewChild, batch, state)) {
        return false;
    }

    LogPrint(BCLog::SETTLEMENT, "SettlementChallenged: %s by %s\n",
             orderHash.ToString().substr(0, 16), ctx.caller.ToString());
    NotifyEvent(SettlementEventType::CHALLENGED, orderHash, ctx.caller);
    return true;
}

bool CSettler::FinalizeOptimistically(const uint256& orderHash, const SettlementContext& ctx,
                                      CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state)
{
    ActiveSettlement settlement;
    SettlementStatus next;
    if (!LoadSettlement(orderHash, SettlementTransition::FINALIZE_OPTIMISTICALLY, batch, settlement, next, state)) {
        return false;
    }
    if (ctx.nTime < settlement.optimisticDeadline) {
        return state.DoS(0, false, REJECT_TIMING, "optimistic-period-active");
    }

    CTokenViewCache viewChild(&view);
    if (!viewChild.Transfer(settlement.input.token, id, settlement.originFiller, settlement.input.amount, state)) return false;
    if (!viewChild.Transfer(settlement.fillerCollateral.token, id, settlement.originFiller,
                            settlement.fillerCollateral.amount, state)) {
        return false;
    }

    settlement.status = next;
    if (!StageSettlement(settlement, viewChild, batch, state)) {
        return false;
    }

    LogPrint(BCLog::SETTLEMENT, "FinalizeOptimistically: %s paid to %s\n",
             orderHash.ToString().substr(0, 16), settlement.originFiller.ToString());
    NotifyEvent(SettlementEventType::FINALIZE_OPTIMISTICALLY, orderHash, ctx.caller);
    return true;
}

bool CSettler::Finalize(const uint256& orderHash, int64_t nFillTimestamp, const SettlementContext& ctx,
                        CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state)
{
    ActiveSettlement settlement;
    SettlementStatus next;
    if (!LoadSettlement(orderHash, SettlementTransition::FINALIZE, batch, settlement, next, state)) {
        return false;
    }
    if (ctx.caller != settlement.settlementOracle) {
        return state.DoS(100, false, REJECT_UNAUTHORIZED, "finalize-not-oracle");
    }
    if (nFillTimestamp > settlement.fillDeadline) {
        return state.DoS(0, false, REJECT_TIMING, "order-fill-exceeded-deadline");
    }

    CTokenViewCache viewChild(&view);
    if (settlement.IsChallenged()) {
        // The challenge was false: its bond compensates the filler
        if (!viewChild.Transfer(settlement.challengerCollateral.token, id, settlement.originFiller,
                                settlement.challengerCollateral.amount, state)) {
            return false;
        }
    }
    if (!viewChild.Transfer(settlement.input.token, id, settlement.originFiller, settlement.input.amount, state)) return false;
    if (!viewChild.Transfer(settlement.fillerCollateral.token, id, settlement.originFiller,
                            settlement.fillerCollateral.amount, state)) {
        return false;
    }

    settlement.status = next;
    if (!StageSettlement(settlement, viewChild, batch, state)) {
        return false;
    }

    LogPrint(BCLog::SETTLEMENT, "FinalizeSettlement: %s filled at %d, paid to %s\n",
             orderHash.ToString().substr(0, 16), nFillTimestamp, settlement.originFiller.ToString());
    NotifyEvent(SettlementEventType::FINALIZE, orderHash, ctx.caller);
    return true;
}

bool CSettler::CancelSettlement(const uint256& orderHash, const SettlementContext& ctx,
                                CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state)
{
    ActiveSettlement settlement;
    SettlementStatus next;
    if (!LoadSettlement(orderHash, SettlementTransition::CANCEL, batch, settlement, next, state)) {
        return false;
    }
    if (ctx.nTime <= settlement.challengeDeadline) {
        return state.DoS(0, false, REJECT_TIMING, "challenge-period-active");
    }

    CTokenViewCache viewChild(&view);
    if (!viewChild.Transfer(settlement.input.token, id, settlement.offerer, settlement.input.amount, state)) return false;

    const CollateralToken& collateral = settlement.fillerCollateral;
    if (!settlement.IsChallenged()) {
        if (!viewChild.Transfer(collateral.token, id, settlement.originFiller, collateral.amount, state)) return false;
    } else {
        // The filler never proved delivery: half its collateral to the
        // challenger (rounded down), the rest to the maker
        const CAmount nChallengerShare = collateral.amount / 2;
        if (!viewChild.Transfer(collateral.token, id, settlement.challenger, nChallengerShare, state)) return false;
        if (!viewChild.Transfer(collateral.token, id, settlement.offerer, collateral.amount - nChallengerShare, state)) return false;
        if (!viewChild.Transfer(settlement.challengerCollateral.token, id, settlement.challenger,
                                settlement.challengerCollateral.amount, state)) {
            return false;
        }
    }

    settlement.status = next;
    if (!StageSettlement(settlement, viewChild, batch, state)) {
        return false;
    }

    LogPrint(BCLog::SETTLEMENT, "CancelSettlement: %s refunded to %s\n",
             orderHash.ToString().substr(0, 16), settlement.offerer.ToString());
    NotifyEvent(SettlementEventType::CANCEL, orderHash, ctx.caller);
    return true;
}

bool CommitSettlementChanges(CTokenViewCache& view, CSettlementDB::Batch& batch)
{
    if (!view.Flush()) {
        return error("%s: token view flush failed", __func__);
    }
    if (!batch.Commit()) {
        return error("%s: settlement batch commit failed", __func__);
    }
    return true;
}
