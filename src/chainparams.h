// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_CHAINPARAMS_H
#define DUTCHX_CHAINPARAMS_H

#include "chainparamsbase.h"
#include "consensus/params.h"

#include <memory>
#include <string>

/**
 * CChainParams defines the tweakable parameters of a given instance of the
 * system. There are three: the main network, a public test network and a
 * regression test mode used by the unit tests, which uses short settlement
 * periods so lifecycle tests stay readable.
 */
class CChainParams
{
public:
    const Consensus::Params& GetConsensus() const { return consensus; }

    /** Return the network string */
    const std::string& NetworkIDString() const { return strNetworkID; }
    bool IsRegTestNet() const { return strNetworkID == CBaseChainParams::REGTEST; }
    bool IsTestnet() const { return strNetworkID == CBaseChainParams::TESTNET; }

    /** Default cache for the settlement database, in bytes */
    size_t DefaultSettlementDbCache() const { return nDefaultSettlementDbCache; }

protected:
    CChainParams() {}

    std::string strNetworkID;
    Consensus::Params consensus;
    size_t nDefaultSettlementDbCache;
};

/**
 * Creates and returns a std::unique_ptr<CChainParams> of the chosen chain.
 * @returns a CChainParams* of the chosen chain.
 * @throws a std::runtime_error if the chain is not supported.
 */
std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CChainParams& Params();

/**
 * Sets the params returned by Params() to those for the given network.
 * @throws std::runtime_error when the chain is not supported.
 */
void SelectParams(const std::string& chain);

#endif // DUTCHX_CHAINPARAMS_H
