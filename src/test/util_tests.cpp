// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utility tests
 *
 * Tests:
 *   1. Hex encoding, uint256 and hashing
 *   2. Argument parsing and config files
 *   3. Chain parameter selection
 *   4. Log category setup from -debug / -debugexclude
 *   5. Application init and shutdown against the test datadir
 */

#include "chainparams.h"
#include "hash.h"
#include "init.h"
#include "key.h"
#include "logging.h"
#include "random.h"
#include "settlement/settlement.h"
#include "settlement/settlementdb.h"
#include "test/test_dutchx.h"
#include "uint256.h"
#include "util/system.h"
#include "utilstrencodings.h"

#include <sstream>
#include <stdexcept>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

// =============================================================================
// Test 1: Encoding and hashing
// =============================================================================
BOOST_AUTO_TEST_CASE(util_hex_and_hash)
{
    const std::vector<unsigned char> vch = ParseHex("00ff10ab");
    BOOST_REQUIRE_EQUAL(vch.size(), 4U);
    BOOST_CHECK_EQUAL((int)vch[1], 0xff);
    BOOST_CHECK_EQUAL(HexStr(vch), "00ff10ab");
    BOOST_CHECK(IsHex("00ff10ab"));
    BOOST_CHECK(!IsHex("0ff"));
    BOOST_CHECK(!IsHex("zz"));

    int64_t n = 0;
    BOOST_CHECK(ParseInt64("-42", &n));
    BOOST_CHECK_EQUAL(n, -42);
    BOOST_CHECK(!ParseInt64("42x", &n));
    BOOST_CHECK(!ParseInt64("", &n));

    // Display order is byte-reversed
    const uint256 value = uint256S("0x0102");
    BOOST_CHECK_EQUAL((int)value.begin()[0], 0x02);
    BOOST_CHECK_EQUAL((int)value.begin()[1], 0x01);
    BOOST_CHECK_EQUAL(value.GetHex(), "0000000000000000000000000000000000000000000000000000000000000102");
    BOOST_CHECK(uint256() < value);
    BOOST_CHECK(uint256().IsNull());

    // Double SHA-256 of the empty string
    const std::string strEmpty;
    BOOST_CHECK_EQUAL(Hash(strEmpty.begin(), strEmpty.end()).GetHex(),
                      "56944c5d3f98413ef45cf54545538103cc9f298e0575820ad3591376e2e0f65d");

    // Identities are stable and distinct per label
    BOOST_CHECK(MakeTestId("tokenA") == MakeTestId("tokenA"));
    BOOST_CHECK(MakeTestId("tokenA") != MakeTestId("tokenB"));
}

// =============================================================================
// Test 2: Arguments
// =============================================================================
BOOST_AUTO_TEST_CASE(util_parse_parameters)
{
    ArgsManager args;
    std::string strError;
    const char* argv[] = {"dutchxd", "-regtest", "--debug=auction", "-debug=permit", "-nologtimestamps",
                          "-settlementdbcache=16", "ignored-positional", "-ignored"};
    BOOST_REQUIRE(args.ParseParameters(8, argv, strError));

    BOOST_CHECK(args.IsArgSet("-regtest"));
    BOOST_CHECK(args.GetBoolArg("-regtest", false));
    BOOST_CHECK(!args.GetBoolArg("-logtimestamps", true));
    BOOST_CHECK_EQUAL(args.GetArg("-settlementdbcache", (int64_t)8), 16);
    BOOST_CHECK_EQUAL(args.GetArg("-debug", ""), "permit");
    BOOST_CHECK_EQUAL(args.GetArgs("-debug").size(), 2U);
    // Parsing stops at the first positional argument
    BOOST_CHECK(!args.IsArgSet("-ignored"));
    BOOST_CHECK_EQUAL(args.GetChainName(), CBaseChainParams::REGTEST);

    BOOST_CHECK(!args.SoftSetArg("-settlementdbcache", "32"));
    BOOST_CHECK(args.SoftSetBoolArg("-printtoconsole", true));
    BOOST_CHECK(args.GetBoolArg("-printtoconsole", false));
    args.ForceSetArg("-settlementdbcache", "32");
    BOOST_CHECK_EQUAL(args.GetArg("-settlementdbcache", (int64_t)8), 32);

    const char* badArgv[] = {"dutchxd", "-"};
    BOOST_CHECK(!args.ParseParameters(2, badArgv, strError));

    const char* bothArgv[] = {"dutchxd", "-regtest", "-testnet"};
    BOOST_REQUIRE(args.ParseParameters(3, bothArgv, strError));
    BOOST_CHECK_THROW(args.GetChainName(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(util_read_config_stream)
{
    ArgsManager args;
    std::string strError;
    std::istringstream stream(
        "# comment\n"
        "testnet=1\n"
        "debug = reactor   # trailing comment\n"
        "debug=oracle\n"
        "\n"
        "settlementdbcache=4\n");
    BOOST_REQUIRE(args.ReadConfigStream(stream, strError));
    BOOST_CHECK_EQUAL(args.GetChainName(), CBaseChainParams::TESTNET);
    BOOST_CHECK_EQUAL(args.GetArg("-debug", ""), "reactor");
    BOOST_CHECK_EQUAL(args.GetArgs("-debug").size(), 2U);

    // Command line wins over the config file
    const char* argv[] = {"dutchxd", "-settlementdbcache=64"};
    BOOST_REQUIRE(args.ParseParameters(2, argv, strError));
    BOOST_CHECK_EQUAL(args.GetArg("-settlementdbcache", (int64_t)8), 64);

    std::istringstream badSection("[main]\nfoo=1\n");
    BOOST_CHECK(!args.ReadConfigStream(badSection, strError));
    std::istringstream badLine("justaword\n");
    BOOST_CHECK(!args.ReadConfigStream(badLine, strError));
}

// =============================================================================
// Test 3: Chain parameters
// =============================================================================
BOOST_AUTO_TEST_CASE(util_chain_params)
{
    BOOST_CHECK(Params().IsRegTestNet());
    BOOST_CHECK_EQUAL(Params().GetConsensus().nChainId, 31337U);
    BOOST_CHECK_EQUAL(Params().GetConsensus().nMaxBatchSize, 16U);

    const std::unique_ptr<CChainParams> main = CreateChainParams(CBaseChainParams::MAIN);
    BOOST_CHECK_EQUAL(main->GetConsensus().nChainId, 1U);
    BOOST_CHECK_EQUAL(main->GetConsensus().nMaxFeeBps, 5);
    BOOST_CHECK_EQUAL(main->GetConsensus().nMaxChallengePeriod, 14 * 24 * 60 * 60);

    const std::unique_ptr<CChainParams> test = CreateChainParams(CBaseChainParams::TESTNET);
    BOOST_CHECK(test->IsTestnet());
    BOOST_CHECK_EQUAL(test->GetConsensus().nChainId, 11155111U);

    BOOST_CHECK_THROW(CreateChainParams("nosuchnet"), std::runtime_error);

    BOOST_CHECK_EQUAL(CBaseChainParams::DataDir(CBaseChainParams::REGTEST), "regtest");
}

// =============================================================================
// Test 4: Log categories
// =============================================================================
BOOST_AUTO_TEST_CASE(util_log_categories)
{
    BCLog::Logger& logger = LogInstance();
    const uint32_t nSavedMask = logger.GetCategoryMask();
    logger.DisableCategory(BCLog::ALL);

    std::string strError;
    gArgs.ForceSetArg("-debug", "settlement");
    BOOST_REQUIRE(InitLogCategories(strError));
    BOOST_CHECK(logger.WillLogCategory(BCLog::SETTLEMENT));
    BOOST_CHECK(!logger.WillLogCategory(BCLog::AUCTION));

    gArgs.ForceSetArg("-debug", "1");
    gArgs.ForceSetArg("-debugexclude", "leveldb");
    BOOST_REQUIRE(InitLogCategories(strError));
    BOOST_CHECK(logger.WillLogCategory(BCLog::AUCTION));
    BOOST_CHECK(logger.WillLogCategory(BCLog::ORACLE));
    BOOST_CHECK(!logger.WillLogCategory(BCLog::LEVELDB));

    gArgs.ForceSetArg("-debug", "none");
    gArgs.ForceSetArg("-debugexclude", "auction");
    BOOST_REQUIRE(InitLogCategories(strError));
    BOOST_CHECK_EQUAL(logger.GetCategoryMask(), 0U);

    gArgs.ForceSetArg("-debug", "nosuchcategory");
    BOOST_CHECK(!InitLogCategories(strError));
    BOOST_CHECK_EQUAL(strError, "Unsupported logging category -debug=nosuchcategory");

    gArgs.ForceSetArg("-debug", "0");
    gArgs.ForceSetArg("-debugexclude", "nosuchcategory");
    BOOST_CHECK(!InitLogCategories(strError));

    gArgs.ForceSetArg("-debug", "0");
    gArgs.ForceSetArg("-debugexclude", "auction");
    logger.DisableCategory(BCLog::ALL);
    logger.EnableCategory((BCLog::LogFlags)nSavedMask);
}

// =============================================================================
// Test 5: Init and shutdown
// =============================================================================
BOOST_AUTO_TEST_CASE(util_app_init)
{
    // AppInitMain owns the ECC context
    ECC_Stop();
    gArgs.ForceSetArg("-regtest", "1");
    gArgs.ForceSetArg("-settlementdbcache", "0");
    ClearDatadirCache();

    std::string strError;
    InitLogging();
    BOOST_CHECK(LogInstance().m_print_to_file);
    BOOST_CHECK(LogInstance().m_file_path == GetDataDir() / DEFAULT_DEBUGLOGFILE);
    BOOST_REQUIRE(AppInitBasicSetup(strError));
    BOOST_CHECK(Params().IsRegTestNet());

    BOOST_CHECK(!AppInitMain(strError));
    BOOST_CHECK_EQUAL(strError, "Invalid -settlementdbcache=0");
    BOOST_CHECK(!g_settlementdb);

    gArgs.ForceSetArg("-settlementdbcache", "2");
    BOOST_REQUIRE(AppInitMain(strError));
    BOOST_REQUIRE(g_settlementdb);
    BOOST_CHECK(fs::exists(GetDataDir() / "settlement"));
    BOOST_CHECK(fs::exists(LogInstance().m_file_path));

    ActiveSettlement settlement;
    settlement.orderHash = GetRandHash();
    BOOST_REQUIRE(g_settlementdb->WriteSettlement(settlement));
    Shutdown();
    BOOST_CHECK(!g_settlementdb);
    LogInstance().DisconnectTestLogger();

    // Records survive a restart
    BOOST_REQUIRE(AppInitMain(strError));
    BOOST_CHECK(g_settlementdb->HasSettlement(settlement.orderHash));
    Shutdown();

    // -wipesettlement starts from an empty database
    gArgs.ForceSetArg("-wipesettlement", "1");
    BOOST_REQUIRE(AppInitMain(strError));
    BOOST_CHECK(!g_settlementdb->HasSettlement(settlement.orderHash));
    Shutdown();

    gArgs.ForceSetArg("-wipesettlement", "0");
    gArgs.ForceSetArg("-regtest", "0");
    ClearDatadirCache();
}

BOOST_AUTO_TEST_SUITE_END()
