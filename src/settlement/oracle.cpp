// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/oracle.h"

#include "logging.h"

CFillReporter::CFillReporter(const CKeyID& idIn, uint64_t nChainIdIn, RelayCallback relayIn)
    : id(idIn), nChainId(nChainIdIn), relay(relayIn)
{
}

bool CFillReporter::FillAndReport(const uint256& orderId, const std::vector<OutputToken>& outputs, const CKeyID& filler,
                                  int64_t nTime, CTokenViewCache& view, CValidationState& state)
{
    if (IsReported(orderId)) {
        return state.DoS(0, false, REJECT_DUPLICATE, "fill-already-reported");
    }

    CTokenViewCache viewChild(&view);
    for (const OutputToken& output : outputs) {
        if (output.chainId != nChainId) {
            return state.DoS(100, false, REJECT_INVALID, "bad-output-chain");
        }
        if (!viewChild.Transfer(output.token, filler, output.recipient, output.amount, state)) {
            return false;
        }
    }
    if (!viewChild.Flush()) {
        return state.Error("reporter-flush-failed");
    }
    setReported.insert(orderId);

    SettlementFillInfo info;
    info.orderId = orderId;
    info.filler = filler;
    info.fillTimestamp = nTime;
    info.outputs = outputs;

    LogPrint(BCLog::ORACLE, "FillAndReport: %s filled by %s at %d\n",
             orderId.ToString().substr(0, 16), filler.ToString(), nTime);
    if (relay) {
        relay(info);
    }
    return true;
}

CSettlementOracle::CSettlementOracle(const CKeyID& idIn, const CKeyID& relayIn, CSettler& settlerIn)
    : id(idIn), relay(relayIn), settler(settlerIn)
{
}

bool CSettlementOracle::LogSettlementFillInfo(const CKeyID& sender, const SettlementFillInfo& info, int64_t nTime,
                                              CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state)
{
    if (sender != relay) {
        return state.DoS(100, false, REJECT_UNAUTHORIZED, "oracle-bad-relay");
    }

    ActiveSettlement settlement;
    if (!batch.ReadSettlement(info.orderId, settlement)) {
        return state.DoS(0, false, REJECT_INVALID, "settlement-not-found");
    }
    if (info.filler != settlement.destinationFiller) {
        return state.DoS(100, false, REJECT_UNAUTHORIZED, "oracle-wrong-filler");
    }
    if (info.outputs != settlement.outputs) {
        LogPrint(BCLog::ORACLE, "LogSettlementFillInfo: %s outputs differ from the settlement record\n",
                 info.orderId.ToString().substr(0, 16));
        return state.DoS(100, false, REJECT_INVALID, "oracle-outputs-mismatch");
    }

    SettlementContext ctx;
    ctx.nTime = nTime;
    ctx.caller = id;
    return settler.Finalize(info.orderId, info.fillTimestamp, ctx, view, batch, state);
}
