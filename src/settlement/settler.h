// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_SETTLEMENT_SETTLER_H
#define DUTCHX_SETTLEMENT_SETTLER_H

#include "consensus/validation.h"
#include "ledger/tokenview.h"
#include "permit/signaturetransfer.h"
#include "primitives/order.h"
#include "reactor/hooks.h"
#include "settlement/settlement.h"
#include "settlement/settlementdb.h"

#include <functional>

/** Who is calling and when */
struct SettlementContext
{
    int64_t nTime{0};
    CKeyID caller;
};

enum class SettlementEventType : uint8_t {
    INITIATE,
    CHALLENGED,
    FINALIZE,
    FINALIZE_OPTIMISTICALLY,
    CANCEL,
};

struct CSettlementEvent
{
    SettlementEventType type;
    uint256 orderHash;
    CKeyID actor;
};

typedef std::function<void(const CSettlementEvent& event)> SettlementEventSink;

/**
 * CSettler - origin-domain escrow for cross-chain orders
 *
 * Escrowed funds are held by the settler's own identity in the token view.
 * Every transition:
 *   1. loads the record through the caller's batch and checks the
 *      transition table
 *   2. checks timing and authorization
 *   3. moves funds in a child view
 *   4. flushes the child view into the caller's view and stages the new
 *      record in the caller's batch
 * A failure at any step leaves the batch and both views untouched. Nothing
 * reaches the database until the caller commits the batch together with
 * its view (see CommitSettlementChanges); dropping both discards the
 * transition entirely.
 */
class CSettler
{
private:
    CKeyID id;
    CTransferCollaborator& permit;
    const CHookRegistry& hooks;
    CSettlementDB& db;
    SettlementEventSink eventSink;

    bool LoadSettlement(const uint256& orderHash, SettlementTransition transition, const CSettlementDB::Batch& batch,
                        ActiveSettlement& settlement, SettlementStatus& nextRet, CValidationState& state) const;
    bool StageSettlement(const ActiveSettlement& settlement, CTokenViewCache& viewChild,
                         CSettlementDB::Batch& batch, CValidationState& state);
    void NotifyEvent(SettlementEventType type, const uint256& orderHash, const CKeyID& actor) const;

public:
    CSettler(const CKeyID& idIn, CTransferCollaborator& permitIn, const CHookRegistry& hooksIn,
             CSettlementDB& dbIn, SettlementEventSink eventSinkIn = SettlementEventSink());

    const CKeyID& GetId() const { return id; }

    /**
     * InitiateSettlement - escrow the maker's input and the caller's filler
     * collateral, and open a PENDING settlement.
     *
     * Fails with "settlement-bad-settler", "initiate-deadline-passed",
     * "settlement-exists", validation hook errors or permit errors.
     */
    bool InitiateSettlement(const SignedOrder& order, const CKeyID& destinationFiller, const SettlementContext& ctx,
                            CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state,
                            uint256* pOrderHash = nullptr);

    /** Post the challenger collateral; only before challengeDeadline, never from a null caller */
    bool ChallengeSettlement(const uint256& orderHash, const SettlementContext& ctx,
                             CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state);

    /** Release escrow to the origin filler once optimisticDeadline is reached, if never challenged */
    bool FinalizeOptimistically(const uint256& orderHash, const SettlementContext& ctx,
                                CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state);

    /** Oracle attested delivery at nFillTimestamp; release escrow to the origin filler */
    bool Finalize(const uint256& orderHash, int64_t nFillTimestamp, const SettlementContext& ctx,
                  CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state);

    /** Refund after challengeDeadline passed without finalization */
    bool CancelSettlement(const uint256& orderHash, const SettlementContext& ctx,
                          CTokenViewCache& view, CSettlementDB::Batch& batch, CValidationState& state);

    /** Committed record only; staged batch writes are not visible here */
    bool GetSettlement(const uint256& orderHash, ActiveSettlement& settlement) const;
};

/**
 * CommitSettlementChanges - flush the view the transitions moved funds in,
 * then commit the batch holding their records.
 */
bool CommitSettlementChanges(CTokenViewCache& view, CSettlementDB::Batch& batch);

#endif // DUTCHX_SETTLEMENT_SETTLER_H
