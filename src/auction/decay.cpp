// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "auction/decay.h"

#include <algorithm>
#include <limits>

bool LinearDecay(int64_t nStartBound, int64_t nEndBound, int64_t nCurrent,
                 CAmount nStartAmount, CAmount nEndAmount,
                 CAmount& nAmountRet, CValidationState& state)
{
    if (nEndBound < nStartBound) {
        return state.DoS(100, false, REJECT_INVALID, "bad-decay-end-before-start");
    }

    if (nCurrent >= nEndBound || nStartAmount == nEndAmount) {
        nAmountRet = nEndAmount;
        return true;
    }
    if (nCurrent <= nStartBound) {
        nAmountRet = nStartAmount;
        return true;
    }

    // nStartBound < nCurrent < nEndBound; differences of int64 bounds fit in uint64
    const uint64_t nElapsed = (uint64_t)nCurrent - (uint64_t)nStartBound;
    const uint64_t nDuration = (uint64_t)nEndBound - (uint64_t)nStartBound;

    if (nStartAmount > nEndAmount) {
        // Decaying down: subtract the floored delta, so the amount rounds up
        const unsigned __int128 nDelta = (unsigned __int128)(nStartAmount - nEndAmount) * nElapsed / nDuration;
        nAmountRet = nStartAmount - (CAmount)nDelta;
    } else {
        // Decaying up: add the floored delta, so the amount rounds down
        const unsigned __int128 nDelta = (unsigned __int128)(nEndAmount - nStartAmount) * nElapsed / nDuration;
        nAmountRet = nStartAmount + (CAmount)nDelta;
    }
    return true;
}

bool DecayInput(const DutchInput& input, int64_t nStartBound, int64_t nEndBound, int64_t nCurrent,
                InputToken& inputRet, CValidationState& state)
{
    CAmount nAmount = 0;
    if (!LinearDecay(nStartBound, nEndBound, nCurrent, input.startAmount, input.endAmount, nAmount, state)) {
        return false;
    }
    inputRet.token = input.token;
    inputRet.amount = nAmount;
    inputRet.maxAmount = input.endAmount;
    return true;
}

bool DecayOutputs(const std::vector<DutchOutput>& outputs, int64_t nStartBound, int64_t nEndBound, int64_t nCurrent,
                  std::vector<OutputToken>& outputsRet, CValidationState& state)
{
    outputsRet.clear();
    outputsRet.reserve(outputs.size());
    for (const DutchOutput& output : outputs) {
        OutputToken resolved;
        if (!LinearDecay(nStartBound, nEndBound, nCurrent, output.startAmount, output.endAmount, resolved.amount, state)) {
            return false;
        }
        resolved.token = output.token;
        resolved.recipient = output.recipient;
        resolved.chainId = output.chainId;
        outputsRet.push_back(resolved);
    }
    return true;
}

CAmount GetEffectivePriorityFee(CAmount nPriorityFee, CAmount nBaselinePriorityFee)
{
    if (nPriorityFee <= nBaselinePriorityFee) {
        return 0;
    }
    return nPriorityFee - nBaselinePriorityFee;
}

// nPriorityFee * nMpsPerFee, capped at int64 max so oversized products saturate
static int64_t GetScaledMps(CAmount nPriorityFee, int64_t nMpsPerFee)
{
    const unsigned __int128 nProduct = (unsigned __int128)nPriorityFee * (unsigned __int128)nMpsPerFee;
    if (nProduct > (unsigned __int128)std::numeric_limits<int64_t>::max()) {
        return std::numeric_limits<int64_t>::max();
    }
    return (int64_t)nProduct;
}

bool ScalePriorityInput(const PriorityInput& input, CAmount nPriorityFee, InputToken& inputRet, CValidationState& state)
{
    if (nPriorityFee < 0 || input.mpsPerPriorityFeeWei < 0) {
        return state.DoS(100, false, REJECT_INVALID, "bad-priority-fee");
    }
    const int64_t nScaled = std::min(MPS, GetScaledMps(nPriorityFee, input.mpsPerPriorityFeeWei));
    CAmount nAmount = 0;
    if (!MulDivDown(input.amount, MPS - nScaled, MPS, nAmount)) {
        return state.DoS(100, false, REJECT_INVALID, "bad-amount-overflow");
    }
    inputRet.token = input.token;
    inputRet.amount = nAmount;
    inputRet.maxAmount = input.amount;
    return true;
}

bool ScalePriorityOutputs(const std::vector<PriorityOutput>& outputs, CAmount nPriorityFee,
                          std::vector<OutputToken>& outputsRet, CValidationState& state)
{
    if (nPriorityFee < 0) {
        return state.DoS(100, false, REJECT_INVALID, "bad-priority-fee");
    }
    outputsRet.clear();
    outputsRet.reserve(outputs.size());
    for (const PriorityOutput& output : outputs) {
        if (output.mpsPerPriorityFeeWei < 0) {
            return state.DoS(100, false, REJECT_INVALID, "bad-priority-fee");
        }
        const int64_t nScaled = GetScaledMps(nPriorityFee, output.mpsPerPriorityFeeWei);
        if (nScaled > std::numeric_limits<int64_t>::max() - MPS) {
            return state.DoS(100, false, REJECT_INVALID, "bad-amount-overflow");
        }
        OutputToken resolved;
        if (!MulDivUp(output.amount, MPS + nScaled, MPS, resolved.amount)) {
            return state.DoS(100, false, REJECT_INVALID, "bad-amount-overflow");
        }
        resolved.token = output.token;
        resolved.recipient = output.recipient;
        outputsRet.push_back(resolved);
    }
    return true;
}

bool CheckPriorityCurve(const std::vector<PriorityCurvePoint>& curve, std::string& strError)
{
    CAmount nPrevThreshold = 0;
    int64_t nPrevMultiplier = MPS;
    for (const PriorityCurvePoint& point : curve) {
        if (point.feeThreshold <= nPrevThreshold) {
            strError = "bad-priority-curve-threshold";
            return false;
        }
        if (point.multiplierMps < nPrevMultiplier) {
            strError = "bad-priority-curve-multiplier";
            return false;
        }
        nPrevThreshold = point.feeThreshold;
        nPrevMultiplier = point.multiplierMps;
    }
    return true;
}

bool EvaluatePriorityCurve(const std::vector<PriorityCurvePoint>& curve, CAmount nPriorityFee,
                           int64_t& nMultiplierRet, CValidationState& state)
{
    std::string strError;
    if (!CheckPriorityCurve(curve, strError)) {
        return state.DoS(100, false, REJECT_INVALID, strError);
    }

    CAmount nLowFee = 0;
    int64_t nLowMultiplier = MPS;
    for (const PriorityCurvePoint& point : curve) {
        if (nPriorityFee < point.feeThreshold) {
            return LinearDecay(nLowFee, point.feeThreshold, nPriorityFee,
                               nLowMultiplier, point.multiplierMps, nMultiplierRet, state);
        }
        nLowFee = point.feeThreshold;
        nLowMultiplier = point.multiplierMps;
    }
    nMultiplierRet = nLowMultiplier;
    return true;
}

bool ApplyMultiplierToInput(InputToken& input, int64_t nMultiplierMps, CValidationState& state)
{
    if (nMultiplierMps < MPS) {
        return state.DoS(100, false, REJECT_INVALID, "bad-priority-curve-multiplier");
    }
    if (!MulDivDown(input.amount, MPS, nMultiplierMps, input.amount)) {
        return state.DoS(100, false, REJECT_INVALID, "bad-amount-overflow");
    }
    return true;
}

bool ApplyMultiplierToOutputs(std::vector<OutputToken>& outputs, int64_t nMultiplierMps, CValidationState& state)
{
    if (nMultiplierMps < MPS) {
        return state.DoS(100, false, REJECT_INVALID, "bad-priority-curve-multiplier");
    }
    for (OutputToken& output : outputs) {
        if (!MulDivUp(output.amount, nMultiplierMps, MPS, output.amount)) {
            return state.DoS(100, false, REJECT_INVALID, "bad-amount-overflow");
        }
    }
    return true;
}
