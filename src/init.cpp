// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "chainparams.h"
#include "key.h"
#include "logging.h"
#include "pubkey.h"
#include "settlement/settlementdb.h"
#include "util/system.h"
#include "version.h"

#include <algorithm>
#include <memory>
#include <stdexcept>

static std::unique_ptr<ECCVerifyHandle> globalVerifyHandle;

void InitLogging()
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    logger.m_print_to_file = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE) != "0";

    fs::path logfile = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
    if (logfile.is_relative()) {
        logfile = GetDataDir() / logfile;
    }
    logger.m_file_path = logfile;
}

bool InitLogCategories(std::string& strError)
{
    BCLog::Logger& logger = LogInstance();
    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (cat == "0" || cat == "none") {
            logger.DisableCategory(BCLog::ALL);
            continue;
        }
        if (cat == "1") {
            logger.EnableCategory(BCLog::ALL);
            continue;
        }
        if (!logger.EnableCategory(cat)) {
            strError = strprintf("Unsupported logging category -debug=%s", cat);
            return false;
        }
    }
    for (const std::string& cat : gArgs.GetArgs("-debugexclude")) {
        if (!logger.DisableCategory(cat)) {
            strError = strprintf("Unsupported logging category -debugexclude=%s", cat);
            return false;
        }
    }
    return true;
}

bool AppInitBasicSetup(std::string& strError)
{
    try {
        SelectParams(gArgs.GetChainName());
    } catch (const std::exception& e) {
        strError = e.what();
        return false;
    }
    return true;
}

bool AppInitMain(std::string& strError)
{
    int64_t nCacheMiB = gArgs.GetArg("-settlementdbcache", DEFAULT_SETTLEMENT_DB_CACHE);
    if (nCacheMiB <= 0) {
        strError = strprintf("Invalid -settlementdbcache=%d", nCacheMiB);
        return false;
    }

    ECC_Start();
    globalVerifyHandle.reset(new ECCVerifyHandle());
    if (!ECC_InitSanityCheck()) {
        strError = "Elliptic curve cryptography sanity check failure. Aborting.";
        return false;
    }

    if (LogInstance().m_print_to_file && !LogInstance().OpenDebugLog()) {
        strError = strprintf("Could not open debug log file %s", LogInstance().m_file_path.string());
        return false;
    }
    LogPrintf("DUTCHX version %d (protocol %d), network %s\n",
              CLIENT_VERSION, PROTOCOL_VERSION, Params().NetworkIDString());
    LogPrintf("Using data directory %s\n", GetDataDir().string());

    size_t nCache = std::max<size_t>(Params().DefaultSettlementDbCache(), (size_t)nCacheMiB << 20);
    if (!InitSettlementDB(nCache, gArgs.GetBoolArg("-wipesettlement", false))) {
        strError = "Error opening settlement database";
        return false;
    }
    return true;
}

void Shutdown()
{
    LogPrintf("%s: In progress...\n", __func__);
    if (g_settlementdb) {
        g_settlementdb->Sync();
        g_settlementdb.reset();
    }
    globalVerifyHandle.reset();
    ECC_Stop();
    LogPrintf("%s: done\n", __func__);
}
