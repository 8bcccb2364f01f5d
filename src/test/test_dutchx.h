// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_TEST_TEST_DUTCHX_H
#define DUTCHX_TEST_TEST_DUTCHX_H

#include "amount.h"
#include "chainparamsbase.h"
#include "fs.h"
#include "key.h"
#include "permit/signaturetransfer.h"
#include "pubkey.h"
#include "uint256.h"

#include <string>
#include <vector>

/** Basic testing setup.
 * This just configures logging, regtest chain params and the ECC context,
 * and points -datadir at a fresh temporary directory.
 */
struct BasicTestingSetup {
    ECCVerifyHandle globalVerifyHandle;
    fs::path m_path_root;

    explicit BasicTestingSetup(const std::string& chainName = CBaseChainParams::REGTEST);
    ~BasicTestingSetup();
};

/** Testing setup that also opens a wiped settlement database */
struct TestingSetup : public BasicTestingSetup {
    explicit TestingSetup(const std::string& chainName = CBaseChainParams::REGTEST);
    ~TestingSetup();
};

/** Deterministic identity for tokens, contracts and passive accounts */
CKeyID MakeTestId(const std::string& strLabel);

/** An account that can sign */
struct TestAccount {
    CKey key;
    CKeyID id;
};

TestAccount MakeTestAccount();

/** Compact signature by key over digest; fails the current test if signing fails */
std::vector<unsigned char> SignDigest(const CKey& key, const uint256& digest);

/** Maker permit signature for one order */
std::vector<unsigned char> SignPermit(const CKey& key, const CSignatureTransfer& permit,
                                      const CKeyID& token, CAmount nMaxAmount, uint64_t nNonce,
                                      int64_t nDeadline, const CKeyID& spender, const uint256& witness);

#endif // DUTCHX_TEST_TEST_DUTCHX_H
