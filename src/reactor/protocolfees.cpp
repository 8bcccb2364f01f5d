// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "reactor/protocolfees.h"

#include "auction/mathutil.h"
#include "chainparams.h"
#include "logging.h"

#include <map>
#include <set>

// Value of the order in one token: the input if it matches plus every
// output in that token.
static CAmount GetTokenValue(const ResolvedOrder& order, const CKeyID& token)
{
    CAmount nValue = 0;
    if (order.input.token == token) {
        nValue += order.input.amount;
    }
    for (const OutputToken& output : order.outputs) {
        if (output.token == token) {
            nValue += output.amount;
        }
    }
    return nValue;
}

bool InjectFees(ResolvedOrder& order, const FeeController& controller, CValidationState& state)
{
    if (!controller) {
        return true;
    }

    const std::vector<OutputToken> vFeeOutputs = controller(order);
    if (vFeeOutputs.empty()) {
        return true;
    }

    std::set<std::pair<CKeyID, CKeyID> > setSeen;
    std::map<CKeyID, CAmount> mapFeeByToken;
    for (const OutputToken& fee : vFeeOutputs) {
        if (!setSeen.insert(std::make_pair(fee.token, fee.recipient)).second) {
            return state.DoS(100, false, REJECT_INVALID, "duplicate-fee-output");
        }
        if (!AmountRange(fee.amount)) {
            return state.DoS(100, false, REJECT_INVALID, "bad-amount-range");
        }
        mapFeeByToken[fee.token] += fee.amount;
    }

    const int64_t nMaxFeeBps = Params().GetConsensus().nMaxFeeBps;
    for (const auto& entry : mapFeeByToken) {
        const CAmount nTokenValue = GetTokenValue(order, entry.first);
        if (nTokenValue == 0) {
            return state.DoS(100, false, REJECT_INVALID, "bad-fee-token");
        }
        CAmount nMaxFee = 0;
        if (!MulDivDown(nTokenValue, nMaxFeeBps, BPS, nMaxFee)) {
            return state.DoS(100, false, REJECT_INVALID, "bad-amount-overflow");
        }
        if (entry.second > nMaxFee) {
            LogPrint(BCLog::REACTOR, "InjectFees: fee %d of %s exceeds cap %d\n",
                     entry.second, entry.first.ToString(), nMaxFee);
            return state.DoS(0, false, REJECT_POLICY, "fee-too-large");
        }
    }

    for (const OutputToken& fee : vFeeOutputs) {
        OutputToken output = fee;
        output.chainId = 0;
        order.outputs.push_back(output);
    }
    return true;
}
