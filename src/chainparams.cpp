// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"

#include "utilstrencodings.h"

#include <assert.h>
#include <stdexcept>

/**
 * Main network
 */
class CMainParams : public CChainParams
{
public:
    CMainParams()
    {
        strNetworkID = CBaseChainParams::MAIN;

        consensus.nChainId = 1;

        // Protocol fees may never exceed 5 bps of the order's value in the fee token
        consensus.nMaxFeeBps = 5;

        consensus.nMaxBatchSize = 64;
        consensus.nMaxOutputsPerOrder = 32;
        consensus.nMaxPriorityCurvePoints = 32;

        // Settlement windows
        consensus.nMaxFillPeriod = 24 * 60 * 60;            // 1 day to fill on the destination
        consensus.nMaxOptimisticPeriod = 7 * 24 * 60 * 60;  // 7 days
        consensus.nMaxChallengePeriod = 14 * 24 * 60 * 60;  // 14 days

        nDefaultSettlementDbCache = 8 << 20;
    }
};

/**
 * Testnet
 */
class CTestNetParams : public CChainParams
{
public:
    CTestNetParams()
    {
        strNetworkID = CBaseChainParams::TESTNET;

        consensus.nChainId = 11155111;
        consensus.nMaxFeeBps = 5;

        consensus.nMaxBatchSize = 64;
        consensus.nMaxOutputsPerOrder = 32;
        consensus.nMaxPriorityCurvePoints = 32;

        // Shorter windows so testers can walk a settlement in an afternoon
        consensus.nMaxFillPeriod = 60 * 60;                 // 1 hour
        consensus.nMaxOptimisticPeriod = 4 * 60 * 60;       // 4 hours
        consensus.nMaxChallengePeriod = 8 * 60 * 60;        // 8 hours

        nDefaultSettlementDbCache = 4 << 20;
    }
};

/**
 * Regression test
 */
class CRegTestParams : public CChainParams
{
public:
    CRegTestParams()
    {
        strNetworkID = CBaseChainParams::REGTEST;

        consensus.nChainId = 31337;
        consensus.nMaxFeeBps = 5;

        consensus.nMaxBatchSize = 16;
        consensus.nMaxOutputsPerOrder = 8;
        consensus.nMaxPriorityCurvePoints = 8;

        consensus.nMaxFillPeriod = 1000;
        consensus.nMaxOptimisticPeriod = 1000;
        consensus.nMaxChallengePeriod = 1000;

        nDefaultSettlementDbCache = 1 << 20;
    }
};

static std::unique_ptr<CChainParams> globalChainParams;

const CChainParams& Params()
{
    assert(globalChainParams);
    return *globalChainParams;
}

std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain)
{
    if (chain == CBaseChainParams::MAIN)
        return std::unique_ptr<CChainParams>(new CMainParams());
    else if (chain == CBaseChainParams::TESTNET)
        return std::unique_ptr<CChainParams>(new CTestNetParams());
    else if (chain == CBaseChainParams::REGTEST)
        return std::unique_ptr<CChainParams>(new CRegTestParams());
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}

void SelectParams(const std::string& network)
{
    globalChainParams = CreateChainParams(network);
}
