// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Settlement Tests - cross-chain escrow lifecycle and DB operations
 *
 * Tests:
 *   1. Transition table
 *   2. ActiveSettlement serialization
 *   3. InitiateSettlement escrow and structural checks
 *   4. Optimistic finalization
 *   5. Challenge, then oracle finalization
 *   6. Cancellation, unchallenged and challenged
 *   7. Settlement DB persistence across reopen
 *   8. Uncommitted transitions leave no record and no escrow behind
 *   9. Cross-chain Dutch orders decay until initiation
 */

#include "auction/orders.h"
#include "chainparams.h"
#include "consensus/validation.h"
#include "ledger/tokenview.h"
#include "permit/signaturetransfer.h"
#include "random.h"
#include "reactor/hooks.h"
#include "settlement/settlement.h"
#include "settlement/settlementdb.h"
#include "settlement/settler.h"
#include "streams.h"
#include "test/test_dutchx.h"
#include "version.h"

#include <memory>

#include <boost/test/unit_test.hpp>

namespace {

static const uint64_t DESTINATION_CHAIN = 10;

struct SettlementSetup : public TestingSetup
{
    CSignatureTransfer permit;
    CHookRegistry hooks;
    CKeyID settlerId;
    CKeyID oracleId;
    CKeyID tokenA;
    CKeyID tokenB;
    CKeyID tokenC;
    TestAccount offerer;
    CKeyID originFiller;
    CKeyID destinationFiller;
    CKeyID challenger;
    CTokenLedger ledger;
    std::vector<CSettlementEvent> vEvents;
    std::unique_ptr<CSettler> settler;
    std::unique_ptr<CSettlementDB::Batch> batch;

    SettlementSetup()
        : permit(MakeTestId("permit2")),
          settlerId(MakeTestId("settler")),
          oracleId(MakeTestId("oracle")),
          tokenA(MakeTestId("tokenA")),
          tokenB(MakeTestId("tokenB")),
          tokenC(MakeTestId("tokenC")),
          offerer(MakeTestAccount()),
          originFiller(MakeTestId("origin-filler")),
          destinationFiller(MakeTestId("destination-filler")),
          challenger(MakeTestId("challenger"))
    {
        BOOST_REQUIRE(ledger.Mint(tokenA, offerer.id, 1000));
        BOOST_REQUIRE(ledger.Mint(tokenC, originFiller, 1000));
        BOOST_REQUIRE(ledger.Mint(tokenC, challenger, 1000));
        settler.reset(new CSettler(settlerId, permit, hooks, *g_settlementdb,
                                   [this](const CSettlementEvent& event) { vEvents.push_back(event); }));
        batch.reset(new CSettlementDB::Batch(*g_settlementdb));
    }

    // 100 tokenA for 500 tokenB on the destination domain.
    // Deadlines after initiating at t=1000: fill 1100, optimistic 1200, challenge 1300.
    CCrossChainLimitOrder MakeOrder() const
    {
        CCrossChainLimitOrder order;
        order.info.settler = settlerId;
        order.info.offerer = offerer.id;
        order.info.nonce = 1;
        order.info.initiateDeadline = 1500;
        order.info.fillPeriod = 100;
        order.info.optimisticPeriod = 200;
        order.info.challengePeriod = 300;
        order.info.settlementOracle = oracleId;
        order.input.token = tokenA;
        order.input.amount = 100;
        order.input.maxAmount = 100;
        order.fillerCollateral.token = tokenC;
        order.fillerCollateral.amount = 11;
        order.challengerCollateral.token = tokenC;
        order.challengerCollateral.amount = 7;

        OutputToken output;
        output.token = tokenB;
        output.amount = 500;
        output.recipient = offerer.id;
        output.chainId = DESTINATION_CHAIN;
        order.outputs.push_back(output);
        return order;
    }

    SignedOrder Sign(const CCrossChainLimitOrder& order) const
    {
        SignedOrder signedOrder;
        signedOrder.nType = ORDER_CROSSCHAIN_LIMIT;
        signedOrder.vchOrder = EncodeOrder(order);
        signedOrder.vchSig = SignPermit(offerer.key, permit, order.input.token, order.input.maxAmount,
                                        order.info.nonce, order.info.initiateDeadline, settlerId, order.GetHash());
        return signedOrder;
    }

    SettlementContext MakeContext(int64_t nTime, const CKeyID& caller) const
    {
        SettlementContext ctx;
        ctx.nTime = nTime;
        ctx.caller = caller;
        return ctx;
    }

    uint256 Initiate(CTokenViewCache& view)
    {
        uint256 orderHash;
        CValidationState state;
        BOOST_REQUIRE(settler->InitiateSettlement(Sign(MakeOrder()), destinationFiller,
                                                  MakeContext(1000, originFiller), view, *batch, state, &orderHash));
        return orderHash;
    }

    SettlementStatus GetStatus(const uint256& orderHash) const
    {
        ActiveSettlement settlement;
        BOOST_REQUIRE(batch->ReadSettlement(orderHash, settlement));
        return settlement.status;
    }

    void Commit(CTokenViewCache& view)
    {
        BOOST_REQUIRE(CommitSettlementChanges(view, *batch));
        BOOST_CHECK_EQUAL(batch->GetPendingCount(), 0U);
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(settlement_tests, SettlementSetup)

// =============================================================================
// Test 1: Transition table
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_transition_table)
{
    struct Row {
        SettlementStatus from;
        SettlementTransition transition;
        bool fAllowed;
        SettlementStatus to;
    };
    const Row rows[] = {
        {SettlementStatus::PENDING, SettlementTransition::CHALLENGE, true, SettlementStatus::CHALLENGED},
        {SettlementStatus::PENDING, SettlementTransition::FINALIZE, true, SettlementStatus::SUCCESS},
        {SettlementStatus::PENDING, SettlementTransition::FINALIZE_OPTIMISTICALLY, true, SettlementStatus::SUCCESS},
        {SettlementStatus::PENDING, SettlementTransition::CANCEL, true, SettlementStatus::CANCELLED},
        {SettlementStatus::CHALLENGED, SettlementTransition::CHALLENGE, false, SettlementStatus::PENDING},
        {SettlementStatus::CHALLENGED, SettlementTransition::FINALIZE, true, SettlementStatus::SUCCESS},
        {SettlementStatus::CHALLENGED, SettlementTransition::FINALIZE_OPTIMISTICALLY, false, SettlementStatus::PENDING},
        {SettlementStatus::CHALLENGED, SettlementTransition::CANCEL, true, SettlementStatus::CANCELLED},
    };

    for (const Row& row : rows) {
        SettlementStatus next = SettlementStatus::PENDING;
        CValidationState state;
        BOOST_CHECK_EQUAL(GetNextStatus(row.from, row.transition, next, state), row.fAllowed);
        if (row.fAllowed) {
            BOOST_CHECK(next == row.to);
        } else {
            BOOST_CHECK_EQUAL(state.GetRejectReason(), "settlement-bad-transition");
        }
    }

    // Nothing leaves a terminal state
    const SettlementTransition all[] = {
        SettlementTransition::CHALLENGE, SettlementTransition::FINALIZE,
        SettlementTransition::FINALIZE_OPTIMISTICALLY, SettlementTransition::CANCEL,
    };
    for (const SettlementTransition transition : all) {
        SettlementStatus next;
        CValidationState state;
        BOOST_CHECK(!GetNextStatus(SettlementStatus::SUCCESS, transition, next, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "settlement-terminal");
        CValidationState state2;
        BOOST_CHECK(!GetNextStatus(SettlementStatus::CANCELLED, transition, next, state2));
        BOOST_CHECK_EQUAL(state2.GetRejectReason(), "settlement-terminal");
    }

    BOOST_CHECK(IsTerminal(SettlementStatus::SUCCESS));
    BOOST_CHECK(!IsTerminal(SettlementStatus::CHALLENGED));
    BOOST_CHECK_EQUAL(SettlementStatusToString(SettlementStatus::CHALLENGED), "challenged");
}

// =============================================================================
// Test 2: Serialization
// =============================================================================
BOOST_AUTO_TEST_CASE(active_settlement_serialization)
{
    ActiveSettlement settlement;
    settlement.orderHash = GetRandHash();
    settlement.status = SettlementStatus::CHALLENGED;
    settlement.offerer = offerer.id;
    settlement.originFiller = originFiller;
    settlement.challenger = challenger;
    settlement.challengeDeadline = 1300;
    settlement.outputs = MakeOrder().outputs;

    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << settlement;

    ActiveSettlement decoded;
    ss >> decoded;
    BOOST_CHECK(ss.empty());
    BOOST_CHECK_EQUAL((int)decoded.nVersion, (int)ACTIVE_SETTLEMENT_VERSION);
    BOOST_CHECK(decoded.orderHash == settlement.orderHash);
    BOOST_CHECK(decoded.status == SettlementStatus::CHALLENGED);
    BOOST_CHECK(decoded.IsChallenged());
    BOOST_CHECK_EQUAL(decoded.challengeDeadline, 1300);
    BOOST_CHECK(decoded.outputs == settlement.outputs);
}

// =============================================================================
// Test 3: Initiate
// =============================================================================
BOOST_AUTO_TEST_CASE(initiate_escrows_input_and_collateral)
{
    CTokenViewCache view(&ledger);
    const uint256 orderHash = Initiate(view);
    BOOST_CHECK(orderHash == MakeOrder().GetHash());

    BOOST_CHECK_EQUAL(view.GetBalance(tokenA, offerer.id), 900);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenA, settlerId), 100);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, originFiller), 989);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, settlerId), 11);

    // Staged only: nothing is written until the batch is committed
    ActiveSettlement settlement;
    BOOST_CHECK(!settler->GetSettlement(orderHash, settlement));
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenA, settlerId), 0);
    BOOST_CHECK_EQUAL(batch->GetPendingCount(), 1U);
    Commit(view);
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenA, settlerId), 100);

    BOOST_REQUIRE(settler->GetSettlement(orderHash, settlement));
    BOOST_CHECK(settlement.status == SettlementStatus::PENDING);
    BOOST_CHECK(settlement.offerer == offerer.id);
    BOOST_CHECK(settlement.originFiller == originFiller);
    BOOST_CHECK(settlement.destinationFiller == destinationFiller);
    BOOST_CHECK(settlement.settlementOracle == oracleId);
    BOOST_CHECK(!settlement.IsChallenged());
    BOOST_CHECK_EQUAL(settlement.fillDeadline, 1100);
    BOOST_CHECK_EQUAL(settlement.optimisticDeadline, 1200);
    BOOST_CHECK_EQUAL(settlement.challengeDeadline, 1300);
    BOOST_CHECK_EQUAL(settlement.input.amount, 100);
    BOOST_REQUIRE_EQUAL(settlement.outputs.size(), 1U);
    BOOST_CHECK_EQUAL(settlement.outputs[0].chainId, DESTINATION_CHAIN);

    BOOST_REQUIRE_EQUAL(vEvents.size(), 1U);
    BOOST_CHECK(vEvents[0].type == SettlementEventType::INITIATE);
    BOOST_CHECK(vEvents[0].orderHash == orderHash);
    BOOST_CHECK(vEvents[0].actor == originFiller);

    // Same order again
    CValidationState state;
    BOOST_CHECK(!settler->InitiateSettlement(Sign(MakeOrder()), destinationFiller,
                                             MakeContext(1001, originFiller), view, *batch, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "settlement-exists");
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_DUPLICATE);
}

BOOST_AUTO_TEST_CASE(initiate_checks)
{
    struct Case {
        std::string strReason;
        CCrossChainLimitOrder order;
        int64_t nTime;
    };
    std::vector<Case> cases;

    {
        CCrossChainLimitOrder order = MakeOrder();
        order.info.settler = MakeTestId("other-settler");
        cases.push_back({"settlement-bad-settler", order, 1000});
    }
    cases.push_back({"initiate-deadline-passed", MakeOrder(), 1501});
    {
        CCrossChainLimitOrder order = MakeOrder();
        order.info.fillPeriod = Params().GetConsensus().nMaxFillPeriod + 1;
        cases.push_back({"bad-settlement-period", order, 1000});
    }
    {
        CCrossChainLimitOrder order = MakeOrder();
        order.info.challengePeriod = 0;
        cases.push_back({"bad-settlement-period", order, 1000});
    }
    {
        CCrossChainLimitOrder order = MakeOrder();
        order.info.settlementOracle.SetNull();
        cases.push_back({"bad-settlement-null-oracle", order, 1000});
    }
    {
        CCrossChainLimitOrder order = MakeOrder();
        order.outputs[0].chainId = 0;
        cases.push_back({"bad-output-chain", order, 1000});
    }
    {
        CCrossChainLimitOrder order = MakeOrder();
        order.fillerCollateral.amount = 1001;
        cases.push_back({"insufficient-balance", order, 1000});
    }
    {
        CCrossChainLimitOrder order = MakeOrder();
        order.info.validationContract = MakeTestId("not-deployed");
        cases.push_back({"validation-contract-unknown", order, 1000});
    }

    for (const Case& c : cases) {
        CTokenViewCache view(&ledger);
        CValidationState state;
        BOOST_CHECK(!settler->InitiateSettlement(Sign(c.order), destinationFiller,
                                                 MakeContext(c.nTime, originFiller), view, *batch, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), c.strReason);
        BOOST_CHECK(!g_settlementdb->HasSettlement(c.order.GetHash()));
        BOOST_CHECK_EQUAL(batch->GetPendingCount(), 0U);
        BOOST_CHECK_EQUAL(view.GetCacheSize(), 0U);
    }

    // Only cross-chain types are accepted
    {
        SignedOrder signedOrder = Sign(MakeOrder());
        signedOrder.nType = ORDER_LIMIT;
        CTokenViewCache view(&ledger);
        CValidationState state;
        BOOST_CHECK(!settler->InitiateSettlement(signedOrder, destinationFiller,
                                                 MakeContext(1000, originFiller), view, *batch, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-order-type");
    }
    BOOST_CHECK(vEvents.empty());
}

BOOST_AUTO_TEST_CASE(initiate_runs_validation_contract)
{
    const CKeyID validator = MakeTestId("validator");
    const CKeyID allowed = originFiller;
    hooks.RegisterCrossChainValidator(validator, [allowed](const CKeyID& filler, const ResolvedCrossChainOrder& order) {
        return filler == allowed && order.outputs.size() == 1;
    });

    CCrossChainLimitOrder order = MakeOrder();
    order.info.validationContract = validator;

    CTokenViewCache view(&ledger);
    BOOST_REQUIRE(ledger.Mint(tokenC, MakeTestId("stranger"), 100));
    CValidationState state;
    BOOST_CHECK(!settler->InitiateSettlement(Sign(order), destinationFiller,
                                             MakeContext(1000, MakeTestId("stranger")), view, *batch, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "validation-failed");

    CValidationState state2;
    BOOST_CHECK(settler->InitiateSettlement(Sign(order), destinationFiller,
                                            MakeContext(1000, originFiller), view, *batch, state2));
}

// =============================================================================
// Test 4: Optimistic finalization
// =============================================================================
BOOST_AUTO_TEST_CASE(finalize_optimistically)
{
    CTokenViewCache view(&ledger);
    const uint256 orderHash = Initiate(view);
    const CKeyID anyone = MakeTestId("anyone");

    CValidationState state;
    BOOST_CHECK(!settler->FinalizeOptimistically(orderHash, MakeContext(1199, anyone), view, *batch, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "optimistic-period-active");
    BOOST_CHECK(GetStatus(orderHash) == SettlementStatus::PENDING);

    CValidationState state2;
    BOOST_REQUIRE(settler->FinalizeOptimistically(orderHash, MakeContext(1200, anyone), view, *batch, state2));
    BOOST_CHECK(GetStatus(orderHash) == SettlementStatus::SUCCESS);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenA, originFiller), 100);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, originFiller), 1000);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenA, settlerId), 0);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, settlerId), 0);

    BOOST_REQUIRE_EQUAL(vEvents.size(), 2U);
    BOOST_CHECK(vEvents[1].type == SettlementEventType::FINALIZE_OPTIMISTICALLY);

    // Terminal: no more moves
    CValidationState state3;
    BOOST_CHECK(!settler->CancelSettlement(orderHash, MakeContext(2000, anyone), view, *batch, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "settlement-terminal");
    CValidationState state4;
    BOOST_CHECK(!settler->ChallengeSettlement(orderHash, MakeContext(1250, challenger), view, *batch, state4));
    BOOST_CHECK_EQUAL(state4.GetRejectReason(), "settlement-terminal");

    CValidationState state5;
    BOOST_CHECK(!settler->FinalizeOptimistically(GetRandHash(), MakeContext(1200, anyone), view, *batch, state5));
    BOOST_CHECK_EQUAL(state5.GetRejectReason(), "settlement-not-found");
}

// =============================================================================
// Test 5: Challenge and oracle finalization
// =============================================================================
BOOST_AUTO_TEST_CASE(challenge_then_finalize)
{
    CTokenViewCache view(&ledger);
    const uint256 orderHash = Initiate(view);

    CValidationState state;
    BOOST_REQUIRE(settler->ChallengeSettlement(orderHash, MakeContext(1150, challenger), view, *batch, state));
    BOOST_CHECK(GetStatus(orderHash) == SettlementStatus::CHALLENGED);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, challenger), 993);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, settlerId), 18);

    ActiveSettlement settlement;
    BOOST_REQUIRE(batch->ReadSettlement(orderHash, settlement));
    BOOST_CHECK(settlement.challenger == challenger);
    BOOST_CHECK(settlement.IsChallenged());

    // A challenge freezes the optimistic path and cannot be repeated
    CValidationState state2;
    BOOST_CHECK(!settler->ChallengeSettlement(orderHash, MakeContext(1160, challenger), view, *batch, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "settlement-bad-transition");
    CValidationState state3;
    BOOST_CHECK(!settler->FinalizeOptimistically(orderHash, MakeContext(1250, originFiller), view, *batch, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "settlement-bad-transition");

    CValidationState state4;
    BOOST_CHECK(!settler->Finalize(orderHash, 1090, MakeContext(1250, originFiller), view, *batch, state4));
    BOOST_CHECK_EQUAL(state4.GetRejectReason(), "finalize-not-oracle");
    BOOST_CHECK_EQUAL(state4.GetRejectCode(), REJECT_UNAUTHORIZED);

    CValidationState state5;
    BOOST_CHECK(!settler->Finalize(orderHash, 1101, MakeContext(1250, oracleId), view, *batch, state5));
    BOOST_CHECK_EQUAL(state5.GetRejectReason(), "order-fill-exceeded-deadline");

    // Filled exactly at the fill deadline
    CValidationState state6;
    BOOST_REQUIRE(settler->Finalize(orderHash, 1100, MakeContext(1250, oracleId), view, *batch, state6));
    BOOST_CHECK(GetStatus(orderHash) == SettlementStatus::SUCCESS);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenA, originFiller), 100);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, originFiller), 1007);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, challenger), 993);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, settlerId), 0);

    BOOST_REQUIRE_EQUAL(vEvents.size(), 3U);
    BOOST_CHECK(vEvents[1].type == SettlementEventType::CHALLENGED);
    BOOST_CHECK(vEvents[1].actor == challenger);
    BOOST_CHECK(vEvents[2].type == SettlementEventType::FINALIZE);
}

BOOST_AUTO_TEST_CASE(challenge_window_closes)
{
    CTokenViewCache view(&ledger);
    const uint256 orderHash = Initiate(view);

    CValidationState state;
    BOOST_CHECK(!settler->ChallengeSettlement(orderHash, MakeContext(1300, challenger), view, *batch, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "challenge-period-over");

    // Challenger without collateral
    CValidationState state2;
    BOOST_CHECK(!settler->ChallengeSettlement(orderHash, MakeContext(1150, MakeTestId("broke")), view, *batch, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "insufficient-balance");
    BOOST_CHECK(GetStatus(orderHash) == SettlementStatus::PENDING);

    // A challenge must name who posted the bond
    CValidationState state3;
    BOOST_CHECK(!settler->ChallengeSettlement(orderHash, MakeContext(1150, CKeyID()), view, *batch, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "bad-challenger");
    BOOST_CHECK(GetStatus(orderHash) == SettlementStatus::PENDING);
}

// =============================================================================
// Test 6: Cancellation
// =============================================================================
BOOST_AUTO_TEST_CASE(cancel_unchallenged)
{
    CTokenViewCache view(&ledger);
    const uint256 orderHash = Initiate(view);
    const CKeyID anyone = MakeTestId("anyone");

    CValidationState state;
    BOOST_CHECK(!settler->CancelSettlement(orderHash, MakeContext(1300, anyone), view, *batch, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "challenge-period-active");

    CValidationState state2;
    BOOST_REQUIRE(settler->CancelSettlement(orderHash, MakeContext(1301, anyone), view, *batch, state2));
    BOOST_CHECK(GetStatus(orderHash) == SettlementStatus::CANCELLED);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenA, offerer.id), 1000);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, originFiller), 1000);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenA, settlerId), 0);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, settlerId), 0);

    // Late oracle report changes nothing
    CValidationState state3;
    BOOST_CHECK(!settler->Finalize(orderHash, 1050, MakeContext(1400, oracleId), view, *batch, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "settlement-terminal");
}

BOOST_AUTO_TEST_CASE(cancel_challenged_splits_collateral)
{
    CTokenViewCache view(&ledger);
    const uint256 orderHash = Initiate(view);

    CValidationState state;
    BOOST_REQUIRE(settler->ChallengeSettlement(orderHash, MakeContext(1150, challenger), view, *batch, state));
    BOOST_REQUIRE(settler->CancelSettlement(orderHash, MakeContext(1301, MakeTestId("anyone")), view, *batch, state));
    BOOST_CHECK(GetStatus(orderHash) == SettlementStatus::CANCELLED);

    // Filler collateral 11: 5 to the challenger, 6 to the maker; challenger bond returned
    BOOST_CHECK_EQUAL(view.GetBalance(tokenA, offerer.id), 1000);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, offerer.id), 6);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, challenger), 1005);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, originFiller), 989);
    BOOST_CHECK_EQUAL(view.GetBalance(tokenC, settlerId), 0);

    BOOST_REQUIRE(view.Flush());
    BOOST_CHECK_EQUAL(ledger.GetTotalSupply(tokenC), 2000);
    BOOST_CHECK_EQUAL(ledger.GetTotalSupply(tokenA), 1000);
}

// =============================================================================
// Test 7: Persistence
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_db_persists)
{
    CTokenViewCache view(&ledger);
    const uint256 orderHash = Initiate(view);
    CValidationState state;
    BOOST_REQUIRE(settler->ChallengeSettlement(orderHash, MakeContext(1150, challenger), view, *batch, state));
    Commit(view);
    BOOST_REQUIRE(g_settlementdb->Sync());

    batch.reset();
    settler.reset();
    g_settlementdb.reset();
    BOOST_REQUIRE(InitSettlementDB(1 << 20, false));
    batch.reset(new CSettlementDB::Batch(*g_settlementdb));

    ActiveSettlement settlement;
    BOOST_REQUIRE(g_settlementdb->ReadSettlement(orderHash, settlement));
    BOOST_CHECK(settlement.status == SettlementStatus::CHALLENGED);
    BOOST_CHECK(settlement.challenger == challenger);
    BOOST_CHECK_EQUAL(settlement.challengeDeadline, 1300);

    int nRecords = 0;
    g_settlementdb->ForEachSettlement([&](const ActiveSettlement& s) {
        nRecords++;
        BOOST_CHECK(s.orderHash == orderHash);
        return true;
    });
    BOOST_CHECK_EQUAL(nRecords, 1);

    // Continue the lifecycle on the reopened database
    CSettler reopened(settlerId, permit, hooks, *g_settlementdb);
    BOOST_REQUIRE(reopened.Finalize(orderHash, 1080, MakeContext(1200, oracleId), view, *batch, state));
    BOOST_REQUIRE(reopened.GetSettlement(orderHash, settlement));
    BOOST_CHECK(settlement.status == SettlementStatus::CHALLENGED);
    Commit(view);
    BOOST_REQUIRE(reopened.GetSettlement(orderHash, settlement));
    BOOST_CHECK(settlement.status == SettlementStatus::SUCCESS);
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenC, originFiller), 1007);

    // Wipe drops every record
    batch.reset();
    g_settlementdb.reset();
    BOOST_REQUIRE(InitSettlementDB(1 << 20, true));
    BOOST_CHECK(!g_settlementdb->HasSettlement(orderHash));
}

// =============================================================================
// Test 8: Uncommitted transitions
// =============================================================================
BOOST_AUTO_TEST_CASE(dropped_transition_leaves_no_record)
{
    uint256 hashA;
    {
        CTokenViewCache view(&ledger);
        hashA = Initiate(view);
        Commit(view);
    }

    CCrossChainLimitOrder orderB = MakeOrder();
    orderB.info.nonce = 2;
    const uint256 hashB = orderB.GetHash();
    {
        // Initiated, then dropped with its view and batch
        CTokenViewCache view(&ledger);
        CSettlementDB::Batch batchB(*g_settlementdb);
        CValidationState state;
        BOOST_REQUIRE(settler->InitiateSettlement(Sign(orderB), destinationFiller,
                                                  MakeContext(1000, originFiller), view, batchB, state));
        BOOST_CHECK(batchB.HasSettlement(hashB));
        BOOST_CHECK(!g_settlementdb->HasSettlement(hashB));
    }
    BOOST_CHECK(!g_settlementdb->HasSettlement(hashB));
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenA, offerer.id), 900);
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenA, settlerId), 100);
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenC, settlerId), 11);

    // Nothing can be paid out against the dropped settlement
    CTokenViewCache view(&ledger);
    CValidationState state;
    BOOST_CHECK(!settler->FinalizeOptimistically(hashB, MakeContext(1200, originFiller), view, *batch, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "settlement-not-found");

    // Its nonce was never spent, so it can be initiated again
    CValidationState state2;
    BOOST_REQUIRE(settler->InitiateSettlement(Sign(orderB), destinationFiller,
                                              MakeContext(1000, originFiller), view, *batch, state2));
    CValidationState state3;
    BOOST_REQUIRE(settler->FinalizeOptimistically(hashA, MakeContext(1200, originFiller), view, *batch, state3));
    Commit(view);

    BOOST_CHECK(GetStatus(hashA) == SettlementStatus::SUCCESS);
    BOOST_CHECK(GetStatus(hashB) == SettlementStatus::PENDING);
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenA, originFiller), 100);
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenC, originFiller), 989);
    // The second settlement's escrow is untouched
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenA, settlerId), 100);
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenC, settlerId), 11);
    BOOST_CHECK_EQUAL(ledger.GetBalance(tokenA, offerer.id), 800);
}

// =============================================================================
// Test 9: Cross-chain Dutch orders
// =============================================================================
BOOST_AUTO_TEST_CASE(crosschain_dutch_decays_until_initiate)
{
    CCrossChainDutchOrder order;
    order.info = MakeOrder().info;
    order.decayStartTime = 1000;
    order.decayEndTime = 1400;
    order.input.token = tokenA;
    order.input.startAmount = 100;
    order.input.endAmount = 100;
    order.fillerCollateral.token = tokenC;
    order.fillerCollateral.amount = 10;

    DutchOutput output;
    output.token = tokenB;
    output.startAmount = 600;
    output.endAmount = 500;
    output.recipient = offerer.id;
    output.chainId = DESTINATION_CHAIN;
    order.outputs.push_back(output);

    {
        CCrossChainDutchOrder bad = order;
        bad.info.initiateDeadline = 1300;
        std::string strError;
        BOOST_CHECK(!bad.IsTriviallyValid(strError));
        BOOST_CHECK_EQUAL(strError, "bad-order-deadline-before-end");
    }

    SignedOrder signedOrder;
    signedOrder.nType = ORDER_CROSSCHAIN_DUTCH;
    signedOrder.vchOrder = EncodeOrder(order);
    signedOrder.vchSig = SignPermit(offerer.key, permit, tokenA, 100, order.info.nonce,
                                    order.info.initiateDeadline, settlerId, order.GetHash());

    CTokenViewCache view(&ledger);
    CValidationState state;
    uint256 orderHash;
    BOOST_REQUIRE(settler->InitiateSettlement(signedOrder, destinationFiller, MakeContext(1200, originFiller),
                                              view, *batch, state, &orderHash));
    BOOST_CHECK(orderHash == order.GetHash());

    ActiveSettlement settlement;
    BOOST_REQUIRE(batch->ReadSettlement(orderHash, settlement));
    BOOST_REQUIRE_EQUAL(settlement.outputs.size(), 1U);
    BOOST_CHECK_EQUAL(settlement.outputs[0].amount, 550);
    BOOST_CHECK_EQUAL(settlement.outputs[0].chainId, DESTINATION_CHAIN);
    BOOST_CHECK_EQUAL(settlement.fillDeadline, 1300);
    // No challenger collateral requested
    BOOST_CHECK_EQUAL(settlement.challengerCollateral.amount, 0);
}

BOOST_AUTO_TEST_SUITE_END()
