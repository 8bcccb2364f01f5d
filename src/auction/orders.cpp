// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "auction/orders.h"

#include "chainparams.h"
#include "hash.h"

#include <string.h>

uint256 GetTypeHash(const char* pszType)
{
    return Hash(pszType, pszType + strlen(pszType));
}

bool CheckOrderInfo(const OrderInfo& info, std::string& strError)
{
    if (info.reactor.IsNull()) {
        strError = "bad-order-null-reactor";
        return false;
    }
    if (info.swapper.IsNull()) {
        strError = "bad-order-null-swapper";
        return false;
    }
    if (info.deadline < 0) {
        strError = "bad-order-deadline";
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

static bool CheckOutputRecipient(const CKeyID& token, const CKeyID& recipient, std::string& strError)
{
    if (token.IsNull()) {
        strError = "bad-order-null-token";
        return false;
    }
    if (recipient.IsNull()) {
        strError = "bad-order-null-recipient";
        return false;
    }
    return true;
}

static bool CheckOverrides(CAmount nInputOverride, const std::vector<CAmount>& vOutputOverrides, std::string& strError)
{
    if (!AmountRange(nInputOverride)) {
        strError = "bad-amount-range";
        return false;
    }
    for (const CAmount& nOverride : vOutputOverrides) {
        if (!AmountRange(nOverride)) {
            strError = "bad-amount-range";
            return false;
        }
    }
    return true;
}

bool CheckDutchAmounts(const DutchInput& input, const std::vector<DutchOutput>& outputs, std::string& strError)
{
    if (input.Decays()) {
        for (const DutchOutput& output : outputs) {
            if (output.Decays()) {
                strError = "bad-order-input-and-output-decay";
                return false;
            }
        }
    }
    if (input.startAmount > input.endAmount) {
        strError = "bad-order-incorrect-amounts";
        return false;
    }
    for (const DutchOutput& output : outputs) {
        if (output.startAmount < output.endAmount) {
            strError = "bad-order-incorrect-amounts";
            return false;
        }
    }
    return true;
}

// =============================================================================
// CLimitOrder
// =============================================================================

uint256 CLimitOrder::GetHash() const
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    ss << GetTypeHash(LIMIT_ORDER_TYPE);
    ss << info << input << outputs;
    return ss.GetHash();
}

bool CLimitOrder::IsTriviallyValid(std::string& strError) const
{
    if (!CheckOrderInfo(info, strError)) return false;
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
    if (!CheckOutputCount(outputs.size(), strError)) return false;
    for (const OutputToken& output : outputs) {
        if (!CheckOutputRecipient(output.token, output.recipient, strError)) return false;
        if (!AmountRange(output.amount)) {
            strError = "bad-amount-range";
            return false;
        }
    }
    return true;
}

// =============================================================================
// CDutchOrder
// =============================================================================

uint256 CDutchOrder::GetHash() const
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    ss << GetTypeHash(DUTCH_ORDER_TYPE);
    ss << info << cosigner << decayStartTime << decayEndTime;
    ss << exclusiveFiller << exclusivityOverrideBps << input << outputs;
    return ss.GetHash();
}

bool CDutchOrder::IsTriviallyValid(std::string& strError) const
{
    if (!CheckOrderInfo(info, strError)) return false;
    if (input.token.IsNull()) {
        strError = "bad-order-null-token";
        return false;
    }
    if (!AmountRange(input.startAmount) || !AmountRange(input.endAmount)) {
        strError = "bad-amount-range";
        return false;
    }
    if (!CheckOutputCount(outputs.size(), strError)) return false;
    for (const DutchOutput& output : outputs) {
        if (!CheckOutputRecipient(output.token, output.recipient, strError)) return false;
        if (!AmountRange(output.startAmount) || !AmountRange(output.endAmount)) {
            strError = "bad-amount-range";
            return false;
        }
    }
    if (!CheckDutchAmounts(input, outputs, strError)) return false;
    if (exclusivityOverrideBps < 0 || cosignerData.exclusivityOverrideBps < 0) {
        strError = "bad-order-exclusivity-bps";
        return false;
    }
    return CheckOverrides(cosignerData.inputOverride, cosignerData.outputOverrides, strError);
}

// =============================================================================
// CPriorityOrder
// =============================================================================

uint256 CPriorityOrder::GetHash() const
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    ss << GetTypeHash(PRIORITY_ORDER_TYPE);
    ss << info << cosigner << auctionStartBlock << baselinePriorityFee;
    ss << input << outputs;
    return ss.GetHash();
}

bool CPriorityOrder::IsTriviallyValid(std::string& strError) const
{
    if (!CheckOrderInfo(info, strError)) return false;
    if (input.token.IsNull()) {
        strError = "bad-order-null-token";
        return false;
    }
    if (!AmountRange(input.amount)) {
        strError = "bad-amount-range";
        return false;
    }
    if (auctionStartBlock < 0 || baselinePriorityFee < 0 || cosignerData.auctionTargetBlock < 0) {
        strError = "bad-order-auction-params";
        return false;
    }
    if (input.mpsPerPriorityFeeWei < 0) {
        strError = "bad-priority-fee";
        return false;
    }
    if (!CheckOutputCount(outputs.size(), strError)) return false;
    for (const PriorityOutput& output : outputs) {
        if (!CheckOutputRecipient(output.token, output.recipient, strError)) return false;
        if (!AmountRange(output.amount)) {
            strError = "bad-amount-range";
            return false;
        }
        if (output.mpsPerPriorityFeeWei < 0) {
            strError = "bad-priority-fee";
            return false;
        }
        if (output.mpsPerPriorityFeeWei > 0 && input.mpsPerPriorityFeeWei > 0) {
            strError = "bad-order-input-and-output-scaled";
            return false;
        }
    }
    return true;
}

// =============================================================================
// CHybridOrder
// =============================================================================

uint256 CHybridOrder::GetHash() const
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    ss << GetTypeHash(HYBRID_ORDER_TYPE);
    ss << info << cosigner << auctionStartBlock << auctionEndBlock;
    ss << baselinePriorityFee << priorityCurve << input << outputs;
    return ss.GetHash();
}

bool CHybridOrder::IsTriviallyValid(std::string& strError) const
{
    if (!CheckOrderInfo(info, strError)) return false;
    if (input.token.IsNull()) {
        strError = "bad-order-null-token";
        return false;
    }
    if (!AmountRange(input.startAmount) || !AmountRange(input.endAmount)) {
        strError = "bad-amount-range";
        return false;
    }
    if (auctionStartBlock < 0 || baselinePriorityFee < 0 || cosignerData.auctionTargetBlock < 0) {
        strError = "bad-order-auction-params";
        return false;
    }
    if (auctionEndBlock < auctionStartBlock) {
        strError = "bad-order-end-before-start";
        return false;
    }
    if (priorityCurve.size() > Params().GetConsensus().nMaxPriorityCurvePoints) {
        strError = "bad-priority-curve-size";
        return false;
    }
    if (!CheckPriorityCurve(priorityCurve, strError)) return false;
    if (!CheckOutputCount(outputs.size(), strError)) return false;
    for (const DutchOutput& output : outputs) {
        if (!CheckOutputRecipient(output.token, output.recipient, strError)) return false;
        if (!AmountRange(output.startAmount) || !AmountRange(output.endAmount)) {
            strError = "bad-amount-range";
            return false;
        }
    }
    if (!CheckDutchAmounts(input, outputs, strError)) return false;
    return CheckOverrides(cosignerData.inputOverride, cosignerData.outputOverrides, strError);
}
