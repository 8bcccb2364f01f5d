// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Cosigner verification tests
 *
 * Tests:
 *   1. Null cosigner accepts anything
 *   2. Valid cosignature accepted, wrong signer / digest / encoding rejected
 *   3. Digest binds the order hash, the chain id and every cosigner field
 */

#include "auction/cosigner.h"
#include "auction/orders.h"
#include "chainparams.h"
#include "consensus/validation.h"
#include "random.h"
#include "test/test_dutchx.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(cosigner_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(null_cosigner_is_optional)
{
    CValidationState state;
    std::vector<unsigned char> vchGarbage(10, 0xab);
    BOOST_CHECK(VerifyCosignature(CKeyID(), GetRandHash(), vchGarbage, state));
    BOOST_CHECK(state.IsValid());
}

BOOST_AUTO_TEST_CASE(cosignature_recovers_signer)
{
    TestAccount cosigner = MakeTestAccount();
    TestAccount other = MakeTestAccount();

    DutchCosignerData data;
    data.decayStartTime = 1200;
    data.outputOverrides.push_back(1100);
    const uint256 orderHash = uint256S("0x1234");
    const uint256 digest = GetCosignerDigest(orderHash, data);

    CKeyID signer;
    BOOST_CHECK(RecoverSigner(digest, SignDigest(cosigner.key, digest), signer));
    BOOST_CHECK(signer == cosigner.id);

    {
        CValidationState state;
        BOOST_CHECK(VerifyCosignature(cosigner.id, digest, SignDigest(cosigner.key, digest), state));
    }
    {
        CValidationState state;
        BOOST_CHECK(!VerifyCosignature(cosigner.id, digest, SignDigest(other.key, digest), state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-cosignature");
        BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_UNAUTHORIZED);
    }
    {
        // Same signer, different overrides
        DutchCosignerData tampered = data;
        tampered.outputOverrides[0] = 1101;
        CValidationState state;
        BOOST_CHECK(!VerifyCosignature(cosigner.id, GetCosignerDigest(orderHash, tampered),
                                       SignDigest(cosigner.key, digest), state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-cosignature");
    }
    {
        // Truncated signature
        std::vector<unsigned char> vchSig = SignDigest(cosigner.key, digest);
        vchSig.resize(64);
        CValidationState state;
        BOOST_CHECK(!VerifyCosignature(cosigner.id, digest, vchSig, state));
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-cosignature");
    }
}

BOOST_AUTO_TEST_CASE(cosigner_digest_binding)
{
    DutchCosignerData data;
    data.decayStartTime = 1200;
    data.decayEndTime = 1800;

    const uint256 hashA = uint256S("0x01");
    const uint256 hashB = uint256S("0x02");
    const uint256 digest = GetCosignerDigest(hashA, data);

    BOOST_CHECK(digest != GetCosignerDigest(hashB, data));

    DutchCosignerData other = data;
    other.exclusivityOverrideBps = 1;
    BOOST_CHECK(digest != GetCosignerDigest(hashA, other));

    // The chain id is part of the digest
    SelectParams(CBaseChainParams::TESTNET);
    BOOST_CHECK(digest != GetCosignerDigest(hashA, data));
    SelectParams(CBaseChainParams::REGTEST);
    BOOST_CHECK(digest == GetCosignerDigest(hashA, data));
}

BOOST_AUTO_TEST_SUITE_END()
