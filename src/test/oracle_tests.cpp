// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Settlement oracle tests
 *
 * Tests:
 *   1. Destination fill, relay and origin finalization end to end
 *   2. Fill reporter rejects replays, foreign outputs and short fillers
 *   3. Oracle rejects unknown relays, unknown orders, wrong fillers and
 *      mismatched outputs
 */

#include "auction/orders.h"
#include "consensus/validation.h"
#include "ledger/tokenview.h"
#include "permit/signaturetransfer.h"
#include "random.h"
#include "reactor/hooks.h"
#include "settlement/oracle.h"
#include "settlement/settlement.h"
#include "settlement/settlementdb.h"
#include "settlement/settler.h"
#include "test/test_dutchx.h"

#include <boost/test/unit_test.hpp>

namespace {

static const uint64_t DESTINATION_CHAIN = 10;

struct OracleSetup : public TestingSetup
{
    CSignatureTransfer permit;
    CHookRegistry hooks;
    CKeyID settlerId;
    CKeyID oracleId;
    CKeyID relayId;
    CKeyID tokenA;
    CKeyID tokenB;
    TestAccount offerer;
    CKeyID originFiller;
    CKeyID destinationFiller;
    CTokenLedger originLedger;
    CTokenLedger destinationLedger;
    CTokenViewCache originView;
    CTokenViewCache destinationView;
    std::vector<SettlementFillInfo> vRelayed;
    CSettler settler;
    CSettlementDB::Batch batch;
    CSettlementOracle oracle;
    CFillReporter reporter;
    uint256 orderHash;

    OracleSetup()
        : permit(MakeTestId("permit2")),
          settlerId(MakeTestId("settler")),
          oracleId(MakeTestId("oracle")),
          relayId(MakeTestId("relay")),
          tokenA(MakeTestId("tokenA")),
          tokenB(MakeTestId("tokenB")),
          offerer(MakeTestAccount()),
          originFiller(MakeTestId("origin-filler")),
          destinationFiller(MakeTestId("destination-filler")),
          originView(&originLedger),
          destinationView(&destinationLedger),
          settler(settlerId, permit, hooks, *g_settlementdb),
          batch(*g_settlementdb),
          oracle(oracleId, relayId, settler),
          reporter(MakeTestId("reporter"), DESTINATION_CHAIN,
                   [this](const SettlementFillInfo& info) { vRelayed.push_back(info); })
    {
        BOOST_REQUIRE(originLedger.Mint(tokenA, offerer.id, 1000));
        BOOST_REQUIRE(destinationLedger.Mint(tokenB, destinationFiller, 1000));

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

        OutputToken output;
        output.token = tokenB;
        output.amount = 500;
        output.recipient = offerer.id;
        output.chainId = DESTINATION_CHAIN;
        order.outputs.push_back(output);

        SignedOrder signedOrder;
        signedOrder.nType = ORDER_CROSSCHAIN_LIMIT;
        signedOrder.vchOrder = EncodeOrder(order);
        signedOrder.vchSig = SignPermit(offerer.key, permit, tokenA, 100, 1, 1500, settlerId, order.GetHash());

        SettlementContext ctx;
        ctx.nTime = 1000;
        ctx.caller = originFiller;
        CValidationState state;
        BOOST_REQUIRE(settler.InitiateSettlement(signedOrder, destinationFiller, ctx, originView, batch, state, &orderHash));
        BOOST_REQUIRE(CommitSettlementChanges(originView, batch));
    }

    std::vector<OutputToken> GetOutputs() const
    {
        ActiveSettlement settlement;
        BOOST_REQUIRE(settler.GetSettlement(orderHash, settlement));
        return settlement.outputs;
    }

    SettlementStatus GetStatus() const
    {
        ActiveSettlement settlement;
        BOOST_REQUIRE(batch.ReadSettlement(orderHash, settlement));
        return settlement.status;
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(oracle_tests, OracleSetup)

// =============================================================================
// Test 1: End to end
// =============================================================================
BOOST_AUTO_TEST_CASE(fill_relay_finalize)
{
    CValidationState state;
    BOOST_REQUIRE(reporter.FillAndReport(orderHash, GetOutputs(), destinationFiller, 1080, destinationView, state));
    BOOST_CHECK(reporter.IsReported(orderHash));
    BOOST_CHECK_EQUAL(destinationView.GetBalance(tokenB, offerer.id), 500);
    BOOST_CHECK_EQUAL(destinationView.GetBalance(tokenB, destinationFiller), 500);

    BOOST_REQUIRE_EQUAL(vRelayed.size(), 1U);
    const SettlementFillInfo& info = vRelayed[0];
    BOOST_CHECK(info.orderId == orderHash);
    BOOST_CHECK(info.filler == destinationFiller);
    BOOST_CHECK_EQUAL(info.fillTimestamp, 1080);

    BOOST_REQUIRE(oracle.LogSettlementFillInfo(relayId, info, 1150, originView, batch, state));
    BOOST_CHECK(GetStatus() == SettlementStatus::SUCCESS);
    BOOST_CHECK_EQUAL(originView.GetBalance(tokenA, originFiller), 100);
    BOOST_CHECK_EQUAL(originView.GetBalance(tokenA, settlerId), 0);

    BOOST_REQUIRE(CommitSettlementChanges(originView, batch));
    ActiveSettlement settlement;
    BOOST_REQUIRE(g_settlementdb->ReadSettlement(orderHash, settlement));
    BOOST_CHECK(settlement.status == SettlementStatus::SUCCESS);
    BOOST_CHECK_EQUAL(originLedger.GetBalance(tokenA, originFiller), 100);

    // Replayed attestation
    CValidationState state2;
    BOOST_CHECK(!oracle.LogSettlementFillInfo(relayId, info, 1160, originView, batch, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "settlement-terminal");
}

// =============================================================================
// Test 2: Fill reporter
// =============================================================================
BOOST_AUTO_TEST_CASE(fill_reporter_checks)
{
    {
        std::vector<OutputToken> outputs = GetOutputs();
        outputs[0].chainId = DESTINATION_CHAIN + 1;
        CValidationState state;
        BOOST_CHECK(!reporter.FillAndReport(orderHash, outputs, destinationFiller, 1080, destinationView, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-output-chain");
    }
    {
        CValidationState state;
        BOOST_CHECK(!reporter.FillAndReport(orderHash, GetOutputs(), MakeTestId("broke"), 1080, destinationView, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "insufficient-balance");
    }
    BOOST_CHECK(vRelayed.empty());
    BOOST_CHECK(!reporter.IsReported(orderHash));
    BOOST_CHECK_EQUAL(destinationView.GetBalance(tokenB, destinationFiller), 1000);

    CValidationState state;
    BOOST_REQUIRE(reporter.FillAndReport(orderHash, GetOutputs(), destinationFiller, 1080, destinationView, state));
    CValidationState state2;
    BOOST_CHECK(!reporter.FillAndReport(orderHash, GetOutputs(), destinationFiller, 1090, destinationView, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "fill-already-reported");
    BOOST_CHECK_EQUAL(vRelayed.size(), 1U);
    BOOST_CHECK_EQUAL(destinationView.GetBalance(tokenB, destinationFiller), 500);
}

// =============================================================================
// Test 3: Oracle
// =============================================================================
BOOST_AUTO_TEST_CASE(oracle_checks)
{
    SettlementFillInfo info;
    info.orderId = orderHash;
    info.filler = destinationFiller;
    info.fillTimestamp = 1080;
    info.outputs = GetOutputs();

    {
        CValidationState state;
        BOOST_CHECK(!oracle.LogSettlementFillInfo(MakeTestId("impostor"), info, 1150, originView, batch, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "oracle-bad-relay");
    }
    {
        SettlementFillInfo unknown = info;
        unknown.orderId = GetRandHash();
        CValidationState state;
        BOOST_CHECK(!oracle.LogSettlementFillInfo(relayId, unknown, 1150, originView, batch, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "settlement-not-found");
    }
    {
        SettlementFillInfo wrongFiller = info;
        wrongFiller.filler = originFiller;
        CValidationState state;
        BOOST_CHECK(!oracle.LogSettlementFillInfo(relayId, wrongFiller, 1150, originView, batch, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "oracle-wrong-filler");
    }
    {
        SettlementFillInfo shortPaid = info;
        shortPaid.outputs[0].amount = 499;
        CValidationState state;
        BOOST_CHECK(!oracle.LogSettlementFillInfo(relayId, shortPaid, 1150, originView, batch, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "oracle-outputs-mismatch");
    }
    {
        SettlementFillInfo late = info;
        late.fillTimestamp = 1101;
        CValidationState state;
        BOOST_CHECK(!oracle.LogSettlementFillInfo(relayId, late, 1150, originView, batch, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "order-fill-exceeded-deadline");
    }
    BOOST_CHECK(GetStatus() == SettlementStatus::PENDING);
    BOOST_CHECK_EQUAL(originView.GetBalance(tokenA, settlerId), 100);

    // The settler only accepts the oracle identity as finalizer
    SettlementContext ctx;
    ctx.nTime = 1150;
    ctx.caller = relayId;
    CValidationState state;
    BOOST_CHECK(!settler.Finalize(orderHash, 1080, ctx, originView, batch, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "finalize-not-oracle");
}

BOOST_AUTO_TEST_SUITE_END()
