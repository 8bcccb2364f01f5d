// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Token view and permit tests
 *
 * Tests:
 *   1. Transfers through a view cache, rollback by dropping the cache
 *   2. Nested caches flush one layer at a time
 *   3. Permit transfer happy path, nonce consumed
 *   4. Permit failures: expiry, amount, signature, spender, witness, nonce reuse
 *   5. Unordered nonce bitmap and bulk invalidation
 */

#include "consensus/validation.h"
#include "ledger/tokenview.h"
#include "permit/signaturetransfer.h"
#include "random.h"
#include "test/test_dutchx.h"

#include <stdexcept>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(permit_tests, BasicTestingSetup)

// =============================================================================
// Test 1: Token view transfers
// =============================================================================
BOOST_AUTO_TEST_CASE(tokenview_transfer)
{
    const CKeyID token = MakeTestId("tokenA");
    const CKeyID alice = MakeTestId("alice");
    const CKeyID bob = MakeTestId("bob");

    CTokenLedger ledger;
    BOOST_REQUIRE(ledger.Mint(token, alice, 1000));
    BOOST_CHECK(!ledger.Mint(token, alice, -1));
    BOOST_CHECK(!ledger.Mint(token, alice, MAX_TOKEN_AMOUNT + 1));

    {
        CTokenViewCache view(&ledger);
        CValidationState state;
        BOOST_REQUIRE(view.Transfer(token, alice, bob, 400, state));
        BOOST_CHECK_EQUAL(view.GetBalance(token, alice), 600);
        BOOST_CHECK_EQUAL(view.GetBalance(token, bob), 400);

        // Not yet visible below
        BOOST_CHECK_EQUAL(ledger.GetBalance(token, bob), 0);

        BOOST_CHECK(!view.Transfer(token, alice, bob, 601, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "insufficient-balance");
        BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_POLICY);

        CValidationState state2;
        BOOST_CHECK(!view.Transfer(token, alice, bob, -5, state2));
        BOOST_CHECK_EQUAL(state2.GetRejectReason(), "bad-amount-range");
        // Dropped without Flush
    }
    BOOST_CHECK_EQUAL(ledger.GetBalance(token, alice), 1000);
    BOOST_CHECK_EQUAL(ledger.GetBalance(token, bob), 0);

    {
        CTokenViewCache view(&ledger);
        CValidationState state;
        BOOST_REQUIRE(view.Transfer(token, alice, bob, 1000, state));
        // Self transfer and zero transfer are no-ops
        BOOST_REQUIRE(view.Transfer(token, bob, bob, 1000, state));
        BOOST_REQUIRE(view.Transfer(token, alice, bob, 0, state));
        BOOST_REQUIRE(view.Flush());
        BOOST_CHECK_EQUAL(view.GetCacheSize(), 0U);
    }
    BOOST_CHECK_EQUAL(ledger.GetBalance(token, alice), 0);
    BOOST_CHECK_EQUAL(ledger.GetBalance(token, bob), 1000);
    BOOST_CHECK_EQUAL(ledger.GetTotalSupply(token), 1000);
}

BOOST_AUTO_TEST_CASE(tokenview_nested_flush)
{
    const CKeyID token = MakeTestId("tokenA");
    const CKeyID alice = MakeTestId("alice");
    const CKeyID bob = MakeTestId("bob");
    const CKeyID carol = MakeTestId("carol");

    CTokenLedger ledger;
    BOOST_REQUIRE(ledger.Mint(token, alice, 100));

    CTokenViewCache outer(&ledger);
    CValidationState state;
    BOOST_REQUIRE(outer.Transfer(token, alice, bob, 60, state));

    {
        CTokenViewCache inner(&outer);
        BOOST_REQUIRE(inner.Transfer(token, bob, carol, 60, state));
        BOOST_CHECK_EQUAL(inner.GetBalance(token, carol), 60);
        BOOST_CHECK_EQUAL(outer.GetBalance(token, carol), 0);
        BOOST_REQUIRE(inner.Flush());
    }
    BOOST_CHECK_EQUAL(outer.GetBalance(token, carol), 60);
    BOOST_CHECK_EQUAL(ledger.GetBalance(token, carol), 0);

    BOOST_REQUIRE(outer.Flush());
    BOOST_CHECK_EQUAL(ledger.GetBalance(token, alice), 40);
    BOOST_CHECK_EQUAL(ledger.GetBalance(token, bob), 0);
    BOOST_CHECK_EQUAL(ledger.GetBalance(token, carol), 60);
    BOOST_CHECK_EQUAL(ledger.GetTotalSupply(token), 100);

    BOOST_CHECK_THROW(CTokenViewCache view(nullptr), std::invalid_argument);
}

// =============================================================================
// Test 2: Permit transfers
// =============================================================================
namespace {

struct PermitFixture
{
    CSignatureTransfer permit = CSignatureTransfer(MakeTestId("permit2"));
    TestAccount owner = MakeTestAccount();
    CKeyID spender = MakeTestId("reactor");
    CKeyID token = MakeTestId("tokenA");
    CKeyID recipient = MakeTestId("filler");
    uint256 witness = GetRandHash();
    CTokenLedger ledger;

    PermitTransferFrom MakePermit(uint64_t nNonce) const
    {
        PermitTransferFrom data;
        data.permitted.token = token;
        data.permitted.amount = 500;
        data.nonce = nNonce;
        data.deadline = 1000;
        return data;
    }

    SignatureTransferDetails MakeDetails(CAmount nAmount) const
    {
        SignatureTransferDetails details;
        details.to = recipient;
        details.requestedAmount = nAmount;
        return details;
    }

    std::vector<unsigned char> Sign(const PermitTransferFrom& data) const
    {
        return SignPermit(owner.key, permit, data.permitted.token, data.permitted.amount,
                          data.nonce, data.deadline, spender, witness);
    }
};

} // anonymous namespace

BOOST_AUTO_TEST_CASE(permit_transfer_succeeds_once)
{
    PermitFixture f;
    BOOST_REQUIRE(f.ledger.Mint(f.token, f.owner.id, 1000));

    const PermitTransferFrom data = f.MakePermit(7);
    const std::vector<unsigned char> vchSig = f.Sign(data);

    CTokenViewCache view(&f.ledger);
    CValidationState state;
    BOOST_REQUIRE(f.permit.PermitWitnessTransferFrom(view, data, f.MakeDetails(400), f.owner.id,
                                                     f.spender, f.witness, vchSig, 1000, state));
    BOOST_CHECK_EQUAL(view.GetBalance(f.token, f.recipient), 400);
    BOOST_CHECK_EQUAL(view.GetBalance(f.token, f.owner.id), 600);
    BOOST_CHECK(CSignatureTransfer::IsNonceUsed(view, f.owner.id, 7));
    BOOST_CHECK(!CSignatureTransfer::IsNonceUsed(view, f.owner.id, 6));

    CValidationState state2;
    BOOST_CHECK(!f.permit.PermitWitnessTransferFrom(view, data, f.MakeDetails(100), f.owner.id,
                                                    f.spender, f.witness, vchSig, 1000, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "permit-nonce-reused");
    BOOST_CHECK_EQUAL(state2.GetRejectCode(), REJECT_DUPLICATE);
}

BOOST_AUTO_TEST_CASE(permit_transfer_failures)
{
    PermitFixture f;
    BOOST_REQUIRE(f.ledger.Mint(f.token, f.owner.id, 1000));

    const PermitTransferFrom data = f.MakePermit(1);
    const std::vector<unsigned char> vchSig = f.Sign(data);

    struct Case {
        std::string strReason;
        CAmount nAmount;
        CKeyID spender;
        uint256 witness;
        int64_t nTime;
    };
    const Case cases[] = {
        {"permit-expired", 100, f.spender, f.witness, 1001},
        {"permit-amount-too-high", 501, f.spender, f.witness, 900},
        {"permit-invalid-signature", 100, MakeTestId("someone-else"), f.witness, 900},
        {"permit-invalid-signature", 100, f.spender, GetRandHash(), 900},
    };

    for (const Case& c : cases) {
        CTokenViewCache view(&f.ledger);
        CValidationState state;
        BOOST_CHECK(!f.permit.PermitWitnessTransferFrom(view, data, f.MakeDetails(c.nAmount), f.owner.id,
                                                        c.spender, c.witness, vchSig, c.nTime, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), c.strReason);
        // Failed checks never consume the nonce
        BOOST_CHECK(!CSignatureTransfer::IsNonceUsed(view, f.owner.id, 1));
    }

    // Signed by a key other than the owner
    {
        const TestAccount other = MakeTestAccount();
        const std::vector<unsigned char> vchOtherSig = SignPermit(other.key, f.permit, f.token, 500, 1, 1000,
                                                                  f.spender, f.witness);
        CTokenViewCache view(&f.ledger);
        CValidationState state;
        BOOST_CHECK(!f.permit.PermitWitnessTransferFrom(view, data, f.MakeDetails(100), f.owner.id,
                                                        f.spender, f.witness, vchOtherSig, 900, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "permit-invalid-signature");
        BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_UNAUTHORIZED);
    }

    // A permit for another permit service does not verify here
    {
        const CSignatureTransfer otherService(MakeTestId("other-permit"));
        const std::vector<unsigned char> vchOtherSig = SignPermit(f.owner.key, otherService, f.token, 500, 1, 1000,
                                                                  f.spender, f.witness);
        CTokenViewCache view(&f.ledger);
        CValidationState state;
        BOOST_CHECK(!f.permit.PermitWitnessTransferFrom(view, data, f.MakeDetails(100), f.owner.id,
                                                        f.spender, f.witness, vchOtherSig, 900, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "permit-invalid-signature");
    }

    // Valid signature, owner short of funds
    {
        CTokenLedger poorLedger;
        BOOST_REQUIRE(poorLedger.Mint(f.token, f.owner.id, 50));
        CTokenViewCache view(&poorLedger);
        CValidationState state;
        BOOST_CHECK(!f.permit.PermitWitnessTransferFrom(view, data, f.MakeDetails(100), f.owner.id,
                                                        f.spender, f.witness, vchSig, 900, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "insufficient-balance");
    }
}

// =============================================================================
// Test 3: Unordered nonces
// =============================================================================
BOOST_AUTO_TEST_CASE(unordered_nonce_bitmap)
{
    const CKeyID owner = MakeTestId("owner");
    CTokenLedger ledger;
    CTokenViewCache view(&ledger);

    CValidationState state;
    BOOST_REQUIRE(CSignatureTransfer::UseUnorderedNonce(view, owner, 0, state));
    BOOST_REQUIRE(CSignatureTransfer::UseUnorderedNonce(view, owner, 255, state));
    BOOST_REQUIRE(CSignatureTransfer::UseUnorderedNonce(view, owner, 256, state));

    // Nonce 0 and 255 share word 0, nonce 256 is bit 0 of word 1
    const uint256 word0 = view.GetNonceWord(owner, 0);
    BOOST_CHECK_EQUAL((int)word0.begin()[0], 0x01);
    BOOST_CHECK_EQUAL((int)word0.begin()[31], 0x80);
    BOOST_CHECK_EQUAL((int)view.GetNonceWord(owner, 1).begin()[0], 0x01);

    BOOST_CHECK(!CSignatureTransfer::IsNonceUsed(view, owner, 1));
    BOOST_CHECK(!CSignatureTransfer::IsNonceUsed(view, MakeTestId("other"), 0));

    BOOST_CHECK(!CSignatureTransfer::UseUnorderedNonce(view, owner, 255, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "permit-nonce-reused");

    BOOST_REQUIRE(view.Flush());
    BOOST_CHECK(CSignatureTransfer::IsNonceUsed(ledger, owner, 256));
}

BOOST_AUTO_TEST_CASE(invalidate_unordered_nonces)
{
    CSignatureTransfer permit(MakeTestId("permit2"));
    const TestAccount owner = MakeTestAccount();
    const CKeyID token = MakeTestId("tokenA");
    const CKeyID spender = MakeTestId("reactor");
    const uint256 witness = GetRandHash();

    CTokenLedger ledger;
    BOOST_REQUIRE(ledger.Mint(token, owner.id, 1000));
    CTokenViewCache view(&ledger);

    // Burn nonces 8..15 of word 2 (nonces 520..527)
    uint256 mask;
    mask.begin()[1] = 0xff;
    CValidationState state;
    BOOST_REQUIRE(CSignatureTransfer::UseUnorderedNonce(view, owner.id, 512, state));
    permit.InvalidateUnorderedNonces(view, owner.id, 2, mask);

    BOOST_CHECK(CSignatureTransfer::IsNonceUsed(view, owner.id, 512));
    for (uint64_t n = 520; n < 528; n++) {
        BOOST_CHECK(CSignatureTransfer::IsNonceUsed(view, owner.id, n));
    }
    BOOST_CHECK(!CSignatureTransfer::IsNonceUsed(view, owner.id, 519));
    BOOST_CHECK(!CSignatureTransfer::IsNonceUsed(view, owner.id, 528));

    // An order signed with a burnt nonce can no longer move funds
    PermitTransferFrom data;
    data.permitted.token = token;
    data.permitted.amount = 100;
    data.nonce = 523;
    data.deadline = 1000;
    const std::vector<unsigned char> vchSig = SignPermit(owner.key, permit, token, 100, 523, 1000, spender, witness);

    SignatureTransferDetails details;
    details.to = spender;
    details.requestedAmount = 100;
    BOOST_CHECK(!permit.PermitWitnessTransferFrom(view, data, details, owner.id, spender, witness, vchSig, 500, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "permit-nonce-reused");
    BOOST_CHECK_EQUAL(view.GetBalance(token, owner.id), 1000);
}

BOOST_AUTO_TEST_SUITE_END()
