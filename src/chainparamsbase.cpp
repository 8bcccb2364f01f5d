// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparamsbase.h"

#include "utilstrencodings.h"

#include <stdexcept>

const std::string CBaseChainParams::MAIN = "main";
const std::string CBaseChainParams::TESTNET = "test";
const std::string CBaseChainParams::REGTEST = "regtest";

std::string CBaseChainParams::DataDir(const std::string& chain)
{
    if (chain == CBaseChainParams::MAIN)
        return "";
    else if (chain == CBaseChainParams::TESTNET)
        return "testnet";
    else if (chain == CBaseChainParams::REGTEST)
        return "regtest";
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}
