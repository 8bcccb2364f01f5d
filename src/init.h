// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_INIT_H
#define DUTCHX_INIT_H

#include <stdint.h>
#include <string>

/** Default settlement database cache, in MiB */
static const int64_t DEFAULT_SETTLEMENT_DB_CACHE = 8;

/** Apply -printtoconsole, -logtimestamps and -debuglogfile to the logger */
void InitLogging();

/**
 * Enable every category named by -debug, then disable every category named
 * by -debugexclude. "-debug=1" or "-debug=all" enables everything.
 * @return false if a category is unknown
 */
bool InitLogCategories(std::string& strError);

/** Select chain parameters from -testnet / -regtest */
bool AppInitBasicSetup(std::string& strError);

/** Start the ECC context, open the debug log and the settlement database */
bool AppInitMain(std::string& strError);

void Shutdown();

#endif // DUTCHX_INIT_H
