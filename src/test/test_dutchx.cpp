// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE DUTCHX Test Suite

#include "test/test_dutchx.h"

#include "chainparams.h"
#include "hash.h"
#include "logging.h"
#include "random.h"
#include "settlement/settlementdb.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <stdexcept>

#include <boost/test/unit_test.hpp>

BasicTestingSetup::BasicTestingSetup(const std::string& chainName)
{
    m_path_root = fs::temp_directory_path() / "test_dutchx" / strprintf("%lu_%i", (unsigned long)GetTime(), (int)GetRand(1 << 30));
    fs::create_directories(m_path_root);
    gArgs.ForceSetArg("-datadir", m_path_root.string());
    ClearDatadirCache();

    LogInstance().m_print_to_console = false;
    LogInstance().m_print_to_file = false;
    ECC_Start();
    SelectParams(chainName);
}

BasicTestingSetup::~BasicTestingSetup()
{
    ECC_Stop();
    SetMockTime(0);
    ClearDatadirCache();
    fs::remove_all(m_path_root);
}

TestingSetup::TestingSetup(const std::string& chainName) : BasicTestingSetup(chainName)
{
    if (!InitSettlementDB(1 << 20, true)) {
        throw std::runtime_error("TestingSetup: could not open settlement database");
    }
}

TestingSetup::~TestingSetup()
{
    g_settlementdb.reset();
}

CKeyID MakeTestId(const std::string& strLabel)
{
    return CKeyID(Hash160(strLabel.begin(), strLabel.end()));
}

TestAccount MakeTestAccount()
{
    TestAccount account;
    account.key.MakeNewKey(true);
    account.id = account.key.GetPubKey().GetID();
    return account;
}

std::vector<unsigned char> SignDigest(const CKey& key, const uint256& digest)
{
    std::vector<unsigned char> vchSig;
    BOOST_REQUIRE(key.SignCompact(digest, vchSig));
    return vchSig;
}

std::vector<unsigned char> SignPermit(const CKey& key, const CSignatureTransfer& permit,
                                      const CKeyID& token, CAmount nMaxAmount, uint64_t nNonce,
                                      int64_t nDeadline, const CKeyID& spender, const uint256& witness)
{
    PermitTransferFrom permitData;
    permitData.permitted.token = token;
    permitData.permitted.amount = nMaxAmount;
    permitData.nonce = nNonce;
    permitData.deadline = nDeadline;
    return SignDigest(key, permit.GetPermitDigest(permitData, spender, witness));
}
