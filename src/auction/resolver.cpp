// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "auction/resolver.h"

#include "auction/cosigner.h"
#include "auction/decay.h"
#include "auction/mathutil.h"
#include "logging.h"

// Clamp and apply cosigner amount overrides to Dutch-style amounts.
static bool ApplyAmountOverrides(CAmount nInputOverride, const std::vector<CAmount>& vOutputOverrides,
                                 DutchInput& input, std::vector<DutchOutput>& outputs, CValidationState& state)
{
    if (nInputOverride != 0) {
        if (nInputOverride > input.startAmount) {
            return state.DoS(100, false, REJECT_INVALID, "bad-input-override");
        }
        input.startAmount = nInputOverride;
    }

    if (vOutputOverrides.empty()) {
        return true;
    }
    if (vOutputOverrides.size() != outputs.size()) {
        return state.DoS(100, false, REJECT_INVALID, "bad-output-override");
    }
    for (size_t i = 0; i < outputs.size(); i++) {
        if (vOutputOverrides[i] == 0) continue;
        if (vOutputOverrides[i] < outputs[i].startAmount) {
            return state.DoS(100, false, REJECT_INVALID, "bad-output-override");
        }
        outputs[i].startAmount = vOutputOverrides[i];
    }
    return true;
}

// Effective auction start block for the block-based variants. Returns false
// on a bad cosignature or a target block later than the signed start.
static bool GetAuctionStartBlock(const CKeyID& cosigner, const uint256& cosignerDigest,
                                 const std::vector<unsigned char>& vchCosignature,
                                 int64_t nSignedStart, int64_t nTargetBlock, const FillContext& ctx,
                                 bool& fCosignedRet, int64_t& nStartRet, CValidationState& state)
{
    fCosignedRet = false;
    nStartRet = nSignedStart;
    if (cosigner.IsNull()) {
        return true;
    }
    if (nTargetBlock != 0 && ctx.nHeight >= nSignedStart) {
        // The auction already started under the maker's terms
        return true;
    }

    if (!VerifyCosignature(cosigner, cosignerDigest, vchCosignature, state)) {
        return false;
    }
    if (nTargetBlock > nSignedStart) {
        return state.DoS(100, false, REJECT_INVALID, "bad-cosigner-target-block");
    }
    if (nTargetBlock != 0) {
        nStartRet = nTargetBlock;
    }
    fCosignedRet = true;
    return true;
}

bool ApplyExclusivityOverride(std::vector<OutputToken>& outputs, int64_t nOverrideBps, CValidationState& state)
{
    if (nOverrideBps == 0) {
        return state.DoS(0, false, REJECT_POLICY, "no-exclusive-override");
    }
    for (OutputToken& output : outputs) {
        if (!MulDivUp(output.amount, BPS + nOverrideBps, BPS, output.amount)) {
            return state.DoS(100, false, REJECT_INVALID, "bad-amount-overflow");
        }
    }
    return true;
}

bool ResolveLimitOrder(const CLimitOrder& order, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state)
{
    std::string strError;
    if (!order.IsTriviallyValid(strError)) {
        return state.DoS(100, false, REJECT_INVALID, strError);
    }

    resolvedRet.nType = ORDER_LIMIT;
    resolvedRet.info = order.info;
    resolvedRet.input = order.input;
    resolvedRet.outputs = order.outputs;
    resolvedRet.hash = order.GetHash();
    return true;
}

bool ResolveDutchOrder(const CDutchOrder& order, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state)
{
    std::string strError;
    if (!order.IsTriviallyValid(strError)) {
        return state.DoS(100, false, REJECT_INVALID, strError);
    }

    const uint256 hash = order.GetHash();

    int64_t nDecayStart = order.decayStartTime;
    int64_t nDecayEnd = order.decayEndTime;
    CKeyID exclusiveFiller = order.exclusiveFiller;
    int64_t nExclusivityBps = order.exclusivityOverrideBps;
    DutchInput input = order.input;
    std::vector<DutchOutput> outputs = order.outputs;

    if (!order.cosigner.IsNull()) {
        const DutchCosignerData& data = order.cosignerData;
        if (!VerifyCosignature(order.cosigner, GetCosignerDigest(hash, data), order.vchCosignature, state)) {
            return false;
        }
        if (data.decayStartTime != 0) nDecayStart = data.decayStartTime;
        if (data.decayEndTime != 0) nDecayEnd = data.decayEndTime;
        if (!data.exclusiveFiller.IsNull()) exclusiveFiller = data.exclusiveFiller;
        if (data.exclusivityOverrideBps != 0) nExclusivityBps = data.exclusivityOverrideBps;
        if (!ApplyAmountOverrides(data.inputOverride, data.outputOverrides, input, outputs, state)) {
            return false;
        }
    }

    if (nDecayEnd < nDecayStart) {
        return state.DoS(100, false, REJECT_INVALID, "bad-order-end-before-start");
    }
    if (order.info.deadline < nDecayEnd) {
        return state.DoS(100, false, REJECT_INVALID, "bad-order-deadline-before-end");
    }
    if (!CheckDutchAmounts(input, outputs, strError)) {
        return state.DoS(100, false, REJECT_INVALID, strError);
    }

    resolvedRet.nType = ORDER_DUTCH;
    resolvedRet.info = order.info;
    resolvedRet.hash = hash;
    if (!DecayInput(input, nDecayStart, nDecayEnd, ctx.nTime, resolvedRet.input, state)) return false;
    if (!DecayOutputs(outputs, nDecayStart, nDecayEnd, ctx.nTime, resolvedRet.outputs, state)) return false;

    if (!exclusiveFiller.IsNull() && ctx.nTime <= nDecayStart && ctx.filler != exclusiveFiller) {
        LogPrint(BCLog::AUCTION, "ResolveDutchOrder: %s inside exclusivity window, filler %s\n",
                 hash.ToString().substr(0, 16), ctx.filler.ToString());
        if (!ApplyExclusivityOverride(resolvedRet.outputs, nExclusivityBps, state)) {
            return false;
        }
    }
    return true;
}

bool ResolvePriorityOrder(const CPriorityOrder& order, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state)
{
    std::string strError;
    if (!order.IsTriviallyValid(strError)) {
        return state.DoS(100, false, REJECT_INVALID, strError);
    }

    const uint256 hash = order.GetHash();

    bool fCosigned = false;
    int64_t nStartBlock = 0;
    if (!GetAuctionStartBlock(order.cosigner, GetCosignerDigest(hash, order.cosignerData), order.vchCosignature,
                              order.auctionStartBlock, order.cosignerData.auctionTargetBlock, ctx,
                              fCosigned, nStartBlock, state)) {
        return false;
    }
    if (ctx.nHeight < nStartBlock) {
        return state.DoS(0, false, REJECT_TIMING, "order-not-fillable");
    }

    const CAmount nFee = GetEffectivePriorityFee(ctx.nPriorityFee, order.baselinePriorityFee);

    resolvedRet.nType = ORDER_PRIORITY;
    resolvedRet.info = order.info;
    resolvedRet.hash = hash;
    if (!ScalePriorityInput(order.input, nFee, resolvedRet.input, state)) return false;
    if (!ScalePriorityOutputs(order.outputs, nFee, resolvedRet.outputs, state)) return false;
    return true;
}

bool ResolveHybridOrder(const CHybridOrder& order, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state)
{
    std::string strError;
    if (!order.IsTriviallyValid(strError)) {
        return state.DoS(100, false, REJECT_INVALID, strError);
    }

    const uint256 hash = order.GetHash();

    bool fCosigned = false;
    int64_t nStartBlock = 0;
    if (!GetAuctionStartBlock(order.cosigner, GetCosignerDigest(hash, order.cosignerData), order.vchCosignature,
                              order.auctionStartBlock, order.cosignerData.auctionTargetBlock, ctx,
                              fCosigned, nStartBlock, state)) {
        return false;
    }

    DutchInput input = order.input;
    std::vector<DutchOutput> outputs = order.outputs;
    if (fCosigned) {
        if (!ApplyAmountOverrides(order.cosignerData.inputOverride, order.cosignerData.outputOverrides,
                                  input, outputs, state)) {
            return false;
        }
        if (!CheckDutchAmounts(input, outputs, strError)) {
            return state.DoS(100, false, REJECT_INVALID, strError);
        }
    }

    if (ctx.nHeight < nStartBlock) {
        return state.DoS(0, false, REJECT_TIMING, "order-not-fillable");
    }

    resolvedRet.nType = ORDER_HYBRID;
    resolvedRet.info = order.info;
    resolvedRet.hash = hash;
    if (!DecayInput(input, nStartBlock, order.auctionEndBlock, ctx.nHeight, resolvedRet.input, state)) return false;
    if (!DecayOutputs(outputs, nStartBlock, order.auctionEndBlock, ctx.nHeight, resolvedRet.outputs, state)) return false;

    int64_t nMultiplier = MPS;
    const CAmount nFee = GetEffectivePriorityFee(ctx.nPriorityFee, order.baselinePriorityFee);
    if (!EvaluatePriorityCurve(order.priorityCurve, nFee, nMultiplier, state)) {
        return false;
    }
    if (input.Decays()) {
        return ApplyMultiplierToInput(resolvedRet.input, nMultiplier, state);
    }
    return ApplyMultiplierToOutputs(resolvedRet.outputs, nMultiplier, state);
}

template<typename T>
static bool DecodeAndResolve(const SignedOrder& signedOrder, const FillContext& ctx, ResolvedOrder& resolvedRet,
                             CValidationState& state,
                             bool (*resolve)(const T&, const FillContext&, ResolvedOrder&, CValidationState&))
{
    T order;
    std::string strError;
    if (!DecodeOrder(signedOrder.vchOrder, order, strError)) {
        return state.DoS(100, false, REJECT_INVALID, strError);
    }
    if (!resolve(order, ctx, resolvedRet, state)) {
        return false;
    }
    resolvedRet.vchSig = signedOrder.vchSig;
    return true;
}

bool ResolveOrder(const SignedOrder& signedOrder, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state)
{
    switch (signedOrder.nType) {
    case ORDER_LIMIT:
        return DecodeAndResolve<CLimitOrder>(signedOrder, ctx, resolvedRet, state, ResolveLimitOrder);
    case ORDER_DUTCH:
        return DecodeAndResolve<CDutchOrder>(signedOrder, ctx, resolvedRet, state, ResolveDutchOrder);
    case ORDER_PRIORITY:
        return DecodeAndResolve<CPriorityOrder>(signedOrder, ctx, resolvedRet, state, ResolvePriorityOrder);
    case ORDER_HYBRID:
        return DecodeAndResolve<CHybridOrder>(signedOrder, ctx, resolvedRet, state, ResolveHybridOrder);
    default:
        LogPrint(BCLog::AUCTION, "ResolveOrder: unsupported order type %s\n", OrderTypeToString(signedOrder.nType));
        return state.DoS(100, false, REJECT_INVALID, "bad-order-type");
    }
}
