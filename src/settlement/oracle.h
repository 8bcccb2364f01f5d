// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_SETTLEMENT_ORACLE_H
#define DUTCHX_SETTLEMENT_ORACLE_H

/**
 * Settlement oracle
 *
 * Destination domain: CFillReporter pays a cross-chain order's outputs from
 * the destination filler and emits a SettlementFillInfo through the relay.
 *
 * Origin domain: CSettlementOracle accepts SettlementFillInfo only from its
 * trusted relay, checks it against the ActiveSettlement record and then
 * finalizes the settlement as the oracle.
 *
 * The relay itself is an authenticated channel and is not modelled here.
 */

#include "consensus/validation.h"
#include "ledger/tokenview.h"
#include "primitives/order.h"
#include "pubkey.h"
#include "serialize.h"
#include "settlement/settler.h"
#include "uint256.h"

#include <functional>
#include <set>
#include <vector>

struct SettlementFillInfo
{
    uint256 orderId;
    CKeyID filler;                  // Destination filler
    int64_t fillTimestamp{0};
    std::vector<OutputToken> outputs;

    SERIALIZE_METHODS(SettlementFillInfo, obj)
    {
        READWRITE(obj.orderId, obj.filler, obj.fillTimestamp, obj.outputs);
    }
};

typedef std::function<void(const SettlementFillInfo& info)> RelayCallback;

class CFillReporter
{
private:
    CKeyID id;
    uint64_t nChainId;
    RelayCallback relay;
    std::set<uint256> setReported;

public:
    CFillReporter(const CKeyID& idIn, uint64_t nChainIdIn, RelayCallback relayIn);

    /**
     * FillAndReport - pay every output from filler and relay the fill
     *
     * Fails with "fill-already-reported", "bad-output-chain" or a transfer
     * error. Nothing is paid or relayed on failure.
     */
    bool FillAndReport(const uint256& orderId, const std::vector<OutputToken>& outputs, const CKeyID& filler,
                       int64_t nTime, CTokenViewCache& view, CValidationState& state);

    bool IsReported(const uint256& orderId) const { return setReported.count(orderId) != 0; }
};

class CSettlementOracle
{
private:
    CKeyID id;
    CKeyID relay;
    CSettler& settler;

public:
    CSettlementOracle(const CKeyID& idIn, const CKeyID& relayIn, CSettler& settlerIn);

    const CKeyID& GetId() const { return id; }

    /**
     * LogSettlementFillInfo - handle a relayed fill attestation
     *
     * Fails with "oracle-bad-relay", "settlement-not-found",
     * "oracle-wrong-filler", "oracle-outputs-mismatch" or any Finalize error.
     * The finalized record is staged in batch like any settler transition.
     */
    bool LogSettlementFillInfo(const CKeyID& sender, const SettlementFillInfo& info, int64_t nTime,
                               CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state);
};

#endif // DUTCHX_SETTLEMENT_ORACLE_H
