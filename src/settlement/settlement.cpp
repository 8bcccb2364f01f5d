// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/settlement.h"

#include "auction/orders.h"
#include "chainparams.h"
#include "hash.h"
#include "logging.h"
#include "utilstrencodings.h"
#include "version.h"

bool SettlementInfo::IsTriviallyValid(std::string& strError) const
{
    if (settler.IsNull()) {
        strError = "bad-order-null-settler";
        return false;
    }
    if (offerer.IsNull()) {
        strError = "bad-order-null-swapper";
        return false;
    }
    if (settlementOracle.IsNull()) {
        strError = "bad-settlement-null-oracle";
        return false;
    }
    if (initiateDeadline < 0) {
        strError = "bad-order-deadline";
        return false;
    }

    const Consensus::Params& consensus = Params().GetConsensus();
    if (fillPeriod <= 0 || fillPeriod > consensus.nMaxFillPeriod ||
        optimisticPeriod <= 0 || optimisticPeriod > consensus.nMaxOptimisticPeriod ||
        challengePeriod <= 0 || challengePeriod > consensus.nMaxChallengePeriod) {
        strError = "bad-settlement-period";
        return false;
    }
    return true;
}

static bool CheckCollateral(const CollateralToken& collateral, std::string& strError)
{
    if (!AmountRange(collateral.amount)) {
        strError = "bad-amount-range";
        return false;
    }
    if (collateral.token.IsNull() && collateral.amount != 0) {
        strError = "bad-order-null-token";
        return false;
    }
    return true;
}

// Cross-chain outputs always name their destination domain
static bool CheckOutputDomain(const CKeyID& token, const CKeyID& recipient, uint64_t nChainId, std::string& strError)
{
    if (token.IsNull()) {
        strError = "bad-order-null-token";
        return false;
    }
    if (recipient.IsNull()) {
        strError = "bad-order-null-recipient";
        return false;
    }
    if (nChainId == 0) {
        strError = "bad-output-chain";
        return false;
    }
    return true;
}

static bool CheckOutputCount(size_t nOutputs, std::string& strError)
{
    if (nOutputs == 0) {
        strError = "bad-order-no-outputs";
        return false;
    }
    if (nOutputs > Params().GetConsensus().nMaxOutputsPerOrder) {
        strError = "bad-order-too-many-outputs";
        return false;
    }
    return true;
}

// =============================================================================
// CCrossChainLimitOrder
// =============================================================================

uint256 CCrossChainLimitOrder::GetHash() const
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    ss << GetTypeHash(CROSSCHAIN_LIMIT_ORDER_TYPE);
    ss << info << input << fillerCollateral << challengerCollateral << outputs;
    return ss.GetHash();
}

bool CCrossChainLimitOrder::IsTriviallyValid(std::string& strError) const
{
    if (!info.IsTriviallyValid(strError)) return false;
    if (input.token.IsNull()) {
        strError = "bad-order-null-token";
        return false;
    }
    if (!AmountRange(input.amount) || !AmountRange(input.maxAmount)) {
        strError = "bad-amount-range";
        return false;
    }
    if (input.amount > input.maxAmount) {
        strError = "bad-order-input-amount";
        return false;
    }
    if (!CheckCollateral(fillerCollateral, strError)) return false;
    if (!CheckCollateral(challengerCollateral, strError)) return false;
    if (!CheckOutputCount(outputs.size(), strError)) return false;
    for (const OutputToken& output : outputs) {
        if (!CheckOutputDomain(output.token, output.recipient, output.chainId, strError)) return false;
        if (!AmountRange(output.amount)) {
            strError = "bad-amount-range";
            return false;
        }
    }
    return true;
}

// =============================================================================
// CCrossChainDutchOrder
// =============================================================================

uint256 CCrossChainDutchOrder::GetHash() const
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    ss << GetTypeHash(CROSSCHAIN_DUTCH_ORDER_TYPE);
    ss << info << decayStartTime << decayEndTime << input;
    ss << fillerCollateral << challengerCollateral << outputs;
    return ss.GetHash();
}

bool CCrossChainDutchOrder::IsTriviallyValid(std::string& strError) const
{
    if (!info.IsTriviallyValid(strError)) return false;
    if (input.token.IsNull()) {
        strError = "bad-order-null-token";
        return false;
    }
    if (!AmountRange(input.startAmount) || !AmountRange(input.endAmount)) {
        strError = "bad-amount-range";
        return false;
    }
    if (!CheckCollateral(fillerCollateral, strError)) return false;
    if (!CheckCollateral(challengerCollateral, strError)) return false;
    if (!CheckOutputCount(outputs.size(), strError)) return false;
    for (const DutchOutput& output : outputs) {
        if (!CheckOutputDomain(output.token, output.recipient, output.chainId, strError)) return false;
        if (!AmountRange(output.startAmount) || !AmountRange(output.endAmount)) {
            strError = "bad-amount-range";
            return false;
        }
    }
    if (decayEndTime < decayStartTime) {
        strError = "bad-order-end-before-start";
        return false;
    }
    if (info.initiateDeadline < decayEndTime) {
        strError = "bad-order-deadline-before-end";
        return false;
    }
    return CheckDutchAmounts(input, outputs, strError);
}

// =============================================================================
// Resolution
// =============================================================================

bool ResolveCrossChainLimitOrder(const CCrossChainLimitOrder& order, int64_t nTime,
                                 ResolvedCrossChainOrder& resolvedRet, CValidationState& state)
{
    std::string strError;
    if (!order.IsTriviallyValid(strError)) {
        return state.DoS(100, false, REJECT_INVALID, strError);
    }

    resolvedRet.nType = ORDER_CROSSCHAIN_LIMIT;
    resolvedRet.info = order.info;
    resolvedRet.input = order.input;
    resolvedRet.fillerCollateral = order.fillerCollateral;
    resolvedRet.challengerCollateral = order.challengerCollateral;
    resolvedRet.outputs = order.outputs;
    resolvedRet.hash = order.GetHash();
    return true;
}

bool ResolveCrossChainDutchOrder(const CCrossChainDutchOrder& order, int64_t nTime,
                                 ResolvedCrossChainOrder& resolvedRet, CValidationState& state)
{
    std::string strError;
    if (!order.IsTriviallyValid(strError)) {
        return state.DoS(100, false, REJECT_INVALID, strError);
    }

    resolvedRet.nType = ORDER_CROSSCHAIN_DUTCH;
    resolvedRet.info = order.info;
    resolvedRet.fillerCollateral = order.fillerCollateral;
    resolvedRet.challengerCollateral = order.challengerCollateral;
    resolvedRet.hash = order.GetHash();
    if (!DecayInput(order.input, order.decayStartTime, order.decayEndTime, nTime, resolvedRet.input, state)) return false;
    if (!DecayOutputs(order.outputs, order.decayStartTime, order.decayEndTime, nTime, resolvedRet.outputs, state)) return false;
    return true;
}

bool ResolveCrossChainOrder(const SignedOrder& signedOrder, int64_t nTime,
                            ResolvedCrossChainOrder& resolvedRet, CValidationState& state)
{
    std::string strError;
    if (signedOrder.nType == ORDER_CROSSCHAIN_LIMIT) {
        CCrossChainLimitOrder order;
        if (!DecodeOrder(signedOrder.vchOrder, order, strError)) {
            return state.DoS(100, false, REJECT_INVALID, strError);
        }
        if (!ResolveCrossChainLimitOrder(order, nTime, resolvedRet, state)) return false;
    } else if (signedOrder.nType == ORDER_CROSSCHAIN_DUTCH) {
        CCrossChainDutchOrder order;
        if (!DecodeOrder(signedOrder.vchOrder, order, strError)) {
            return state.DoS(100, false, REJECT_INVALID, strError);
        }
        if (!ResolveCrossChainDutchOrder(order, nTime, resolvedRet, state)) return false;
    } else {
        return state.DoS(100, false, REJECT_INVALID, "bad-order-type");
    }
    resolvedRet.vchSig = signedOrder.vchSig;
    return true;
}

// =============================================================================
// Lifecycle
// =============================================================================

std::string SettlementStatusToString(SettlementStatus status)
{
    switch (status) {
    case SettlementStatus::PENDING: return "pending";
    case SettlementStatus::CHALLENGED: return "challenged";
    case SettlementStatus::CANCELLED: return "cancelled";
    case SettlementStatus::SUCCESS: return "success";
    }
    return "unknown";
}

std::string SettlementTransitionToString(SettlementTransition transition)
{
    switch (transition) {
    case SettlementTransition::CHALLENGE: return "challenge";
    case SettlementTransition::FINALIZE: return "finalize";
    case SettlementTransition::FINALIZE_OPTIMISTICALLY: return "finalize-optimistically";
    case SettlementTransition::CANCEL: return "cancel";
    }
    return "unknown";
}

namespace {

struct TransitionRule
{
    SettlementStatus from;
    SettlementTransition transition;
    SettlementStatus to;
};

const TransitionRule SETTLEMENT_TRANSITIONS[] = {
    {SettlementStatus::PENDING,    SettlementTransition::CHALLENGE,               SettlementStatus::CHALLENGED},
    {SettlementStatus::PENDING,    SettlementTransition::FINALIZE,                SettlementStatus::SUCCESS},
    {SettlementStatus::PENDING,    SettlementTransition::FINALIZE_OPTIMISTICALLY, SettlementStatus::SUCCESS},
    {SettlementStatus::PENDING,    SettlementTransition::CANCEL,                  SettlementStatus::CANCELLED},
    {SettlementStatus::CHALLENGED, SettlementTransition::FINALIZE,                SettlementStatus::SUCCESS},
    {SettlementStatus::CHALLENGED, SettlementTransition::CANCEL,                  SettlementStatus::CANCELLED},
};

} // anonymous namespace

bool GetNextStatus(SettlementStatus from, SettlementTransition transition,
                   SettlementStatus& toRet, CValidationState& state)
{
    if (IsTerminal(from)) {
        return state.DoS(0, false, REJECT_POLICY, "settlement-terminal",
                         strprintf("%s from %s", SettlementTransitionToString(transition), SettlementStatusToString(from)));
    }
    for (const TransitionRule& rule : SETTLEMENT_TRANSITIONS) {
        if (rule.from == from && rule.transition == transition) {
            toRet = rule.to;
            return true;
        }
    }
    return state.DoS(0, false, REJECT_POLICY, "settlement-bad-transition",
                     strprintf("%s from %s", SettlementTransitionToString(transition), SettlementStatusToString(from)));
}

std::string ActiveSettlement::ToString() const
{
    return strprintf("ActiveSettlement(order=%s, status=%s, offerer=%s, filler=%s, challenger=%s, "
                     "fill=%d, optimistic=%d, challenge=%d, input=%d)",
                     orderHash.ToString().substr(0, 16), SettlementStatusToString(status),
                     offerer.ToString(), originFiller.ToString(),
                     challenger.IsNull() ? "none" : challenger.ToString(),
                     fillDeadline, optimisticDeadline, challengeDeadline, input.amount);
}
