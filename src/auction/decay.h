// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_AUCTION_DECAY_H
#define DUTCHX_AUCTION_DECAY_H

/**
 * Decay and scaling library
 *
 * Pure functions, no state. Every amount moves linearly between two bounds
 * (timestamps, block numbers or priority-fee thresholds) and every rounding
 * step leans toward the maker:
 *   - amounts decaying down (outputs) are rounded up
 *   - amounts decaying up (inputs) are rounded down
 *   - priority-fee scaled outputs round up, scaled inputs round down
 */

#include "amount.h"
#include "auction/mathutil.h"
#include "consensus/validation.h"
#include "primitives/order.h"
#include "pubkey.h"
#include "serialize.h"

#include <string>
#include <vector>

/** Dutch-style input: the maker pays startAmount, rising to endAmount */
struct DutchInput
{
    CKeyID token;
    CAmount startAmount{0};
    CAmount endAmount{0};

    bool Decays() const { return startAmount != endAmount; }

    SERIALIZE_METHODS(DutchInput, obj) { READWRITE(obj.token, obj.startAmount, obj.endAmount); }
};

/** Dutch-style output: the recipient receives startAmount, falling to endAmount */
struct DutchOutput
{
    CKeyID token;
    CAmount startAmount{0};
    CAmount endAmount{0};
    CKeyID recipient;
    uint64_t chainId{0};

    bool Decays() const { return startAmount != endAmount; }

    SERIALIZE_METHODS(DutchOutput, obj)
    {
        READWRITE(obj.token, obj.startAmount, obj.endAmount, obj.recipient, obj.chainId);
    }
};

/** Priority-fee scaled input: shrinks by mpsPerPriorityFeeWei per unit of fee */
struct PriorityInput
{
    CKeyID token;
    CAmount amount{0};
    int64_t mpsPerPriorityFeeWei{0};

    SERIALIZE_METHODS(PriorityInput, obj) { READWRITE(obj.token, obj.amount, obj.mpsPerPriorityFeeWei); }
};

/** Priority-fee scaled output: grows by mpsPerPriorityFeeWei per unit of fee */
struct PriorityOutput
{
    CKeyID token;
    CAmount amount{0};
    int64_t mpsPerPriorityFeeWei{0};
    CKeyID recipient;

    SERIALIZE_METHODS(PriorityOutput, obj)
    {
        READWRITE(obj.token, obj.amount, obj.mpsPerPriorityFeeWei, obj.recipient);
    }
};

/**
 * One breakpoint of a priority-fee curve. The curve starts at an implicit
 * (0, MPS) point; multipliers are in MPS units and never below MPS.
 */
struct PriorityCurvePoint
{
    CAmount feeThreshold{0};
    int64_t multiplierMps{MPS};

    SERIALIZE_METHODS(PriorityCurvePoint, obj) { READWRITE(obj.feeThreshold, obj.multiplierMps); }
};

/**
 * LinearDecay - interpolate between nStartAmount and nEndAmount
 *
 * Returns nEndAmount once nCurrent >= nEndBound (or when both amounts are
 * equal), nStartAmount while nCurrent <= nStartBound.
 *
 * @return false with "bad-decay-end-before-start" if nEndBound < nStartBound
 */
bool LinearDecay(int64_t nStartBound, int64_t nEndBound, int64_t nCurrent,
                 CAmount nStartAmount, CAmount nEndAmount,
                 CAmount& nAmountRet, CValidationState& state);

/** Decay a Dutch input; the resolved maxAmount is the signed end amount */
bool DecayInput(const DutchInput& input, int64_t nStartBound, int64_t nEndBound, int64_t nCurrent,
                InputToken& inputRet, CValidationState& state);

bool DecayOutputs(const std::vector<DutchOutput>& outputs, int64_t nStartBound, int64_t nEndBound, int64_t nCurrent,
                  std::vector<OutputToken>& outputsRet, CValidationState& state);

/** max(0, nPriorityFee - nBaselinePriorityFee) */
CAmount GetEffectivePriorityFee(CAmount nPriorityFee, CAmount nBaselinePriorityFee);

bool ScalePriorityInput(const PriorityInput& input, CAmount nPriorityFee, InputToken& inputRet, CValidationState& state);
bool ScalePriorityOutputs(const std::vector<PriorityOutput>& outputs, CAmount nPriorityFee,
                          std::vector<OutputToken>& outputsRet, CValidationState& state);

/** Thresholds strictly ascending and positive, multipliers >= MPS and non-decreasing */
bool CheckPriorityCurve(const std::vector<PriorityCurvePoint>& curve, std::string& strError);

/**
 * EvaluatePriorityCurve - multiplier (MPS units) for an effective priority fee
 *
 * Finds the highest breakpoint at or below nPriorityFee and interpolates
 * toward the next one with LinearDecay. Past the last breakpoint the curve
 * is flat. An empty curve always yields MPS.
 */
bool EvaluatePriorityCurve(const std::vector<PriorityCurvePoint>& curve, CAmount nPriorityFee,
                           int64_t& nMultiplierRet, CValidationState& state);

/** input.amount = floor(amount * MPS / multiplier) */
bool ApplyMultiplierToInput(InputToken& input, int64_t nMultiplierMps, CValidationState& state);
/** output.amount = ceil(amount * multiplier / MPS) */
bool ApplyMultiplierToOutputs(std::vector<OutputToken>& outputs, int64_t nMultiplierMps, CValidationState& state);

#endif // DUTCHX_AUCTION_DECAY_H
