// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_CHAINPARAMSBASE_H
#define DUTCHX_CHAINPARAMSBASE_H

#include <string>

/**
 * CBaseChainParams defines the network names and the data directory
 * layout shared by every network.
 */
class CBaseChainParams
{
public:
    /** Chain name strings */
    static const std::string MAIN;
    static const std::string TESTNET;
    static const std::string REGTEST;

    /** Sub-directory of the data directory used by a network ("" for main) */
    static std::string DataDir(const std::string& chain);
};

#endif // DUTCHX_CHAINPARAMSBASE_H
