// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "dbwrapper.h"
#include "fhe/coprocessor.h"
#include "logging.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "state/settlement.h"
#include "state/settlementdb.h"
#include "state/settlementman.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "version.h"

#include <algorithm>
#include <vector>

std::string GetSettlementHelpString()
{
    std::string strUsage = HelpMessageGroup("General options:");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", CIPHERBATCH_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-dbcache=<n>", strprintf("Settlement database cache size in MiB (1 to %d, default: %d)", MAX_DB_CACHE_MB, DEFAULT_DB_CACHE_MB));
    strUsage += HelpMessageOpt("-resetsettlement", "Wipe the settlement database on startup");

    strUsage += HelpMessageGroup("Settlement options:");
    strUsage += HelpMessageOpt("-admin=<hex>", "Administrator identity (40 hex characters) used when a new settlement state is created");
    strUsage += HelpMessageOpt("-cooldown=<n>", strprintf("Seconds between two submissions or two settlement requests of one actor, used when a new settlement state is created (0 to %d, default: %d)", MAX_COOLDOWN_SECONDS, DEFAULT_COOLDOWN_SECONDS));
    strUsage += HelpMessageOpt("-revenuemultiplier=<n>", strprintf("Revenue of a settled batch as a multiple of its total budget (1 to %d, default: %d)", MAX_REVENUE_MULTIPLIER, DEFAULT_REVENUE_MULTIPLIER));
    strUsage += HelpMessageOpt("-systemid=<hex>", strprintf("System identity salting every state commitment, stored when a new settlement state is created and required to match afterwards (64 hex characters, default: %s)", GetDefaultSystemIdentity().GetHex()));

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0, supplying <category> is optional). "
        "If <category> is not supplied or if <category> = 1, output all debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-debugexclude=<category>", "Exclude debugging information for a category. Can be used in conjunction with -debug=1 to output debug logs for all categories except one or more specified categories.");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend debug output with timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console instead of debug.log file");
    strUsage += HelpMessageOpt("-nodebuglogfile", "Do not write debug.log");

    return strUsage;
}

bool InitLogging(std::string& strError)
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_file = !gArgs.IsArgNegated("-debuglogfile");
    logger.m_file_path = GetDataDir() / DEFAULT_DEBUGLOGFILE;
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");

        if (std::none_of(categories.begin(), categories.end(),
            [](std::string cat) { return cat == "0" || cat == "none"; })) {
            for (const auto& cat : categories) {
                if (!logger.EnableCategory(cat)) {
                    LogPrintf("Unsupported logging category %s=%s.\n", "-debug", cat);
                }
            }
        }
    }

    // Now remove the logging categories which were explicitly excluded
    for (const std::string& cat : gArgs.GetArgs("-debugexclude")) {
        if (!logger.DisableCategory(cat)) {
            LogPrintf("Unsupported logging category %s=%s.\n", "-debugexclude", cat);
        }
    }

    if (logger.m_print_to_file && !logger.OpenDebugLog()) {
        strError = strprintf("Could not open debug log file %s", logger.m_file_path.string());
        return false;
    }

    LogPrintf("CipherBatch version %d\n", CLIENT_VERSION);
    LogPrintf("Using data directory %s\n", GetDataDir().string());
    return true;
}

bool InitSettlementParams(SettlementParams& params, std::string& strError)
{
    params = SettlementParams();

    params.nInitialCooldown = gArgs.GetArg("-cooldown", DEFAULT_COOLDOWN_SECONDS);
    if (params.nInitialCooldown < 0 || params.nInitialCooldown > MAX_COOLDOWN_SECONDS) {
        strError = strprintf("Invalid -cooldown=%s (must be between 0 and %d)", gArgs.GetArg("-cooldown", ""), MAX_COOLDOWN_SECONDS);
        return false;
    }

    params.nRevenueMultiplier = gArgs.GetArg("-revenuemultiplier", DEFAULT_REVENUE_MULTIPLIER);
    if (params.nRevenueMultiplier <= 0 || params.nRevenueMultiplier > MAX_REVENUE_MULTIPLIER) {
        strError = strprintf("Invalid -revenuemultiplier=%s (must be between 1 and %d)", gArgs.GetArg("-revenuemultiplier", ""), MAX_REVENUE_MULTIPLIER);
        return false;
    }

    if (gArgs.IsArgSet("-systemid")) {
        const std::string strSystemId = gArgs.GetArg("-systemid", "");
        if (strSystemId.size() != 64 || !IsHex(strSystemId)) {
            strError = strprintf("Invalid -systemid=%s (expected 64 hex characters)", strSystemId);
            return false;
        }
        params.systemIdentity = uint256S(strSystemId);
        if (params.systemIdentity.IsNull()) {
            strError = "Invalid -systemid: the system identity cannot be zero";
            return false;
        }
    } else {
        params.systemIdentity = GetDefaultSystemIdentity();
    }

    if (gArgs.IsArgSet("-admin")) {
        const std::string strAdmin = gArgs.GetArg("-admin", "");
        if (strAdmin.size() != 40 || !IsHex(strAdmin)) {
            strError = strprintf("Invalid -admin=%s (expected 40 hex characters)", strAdmin);
            return false;
        }
        params.initialAdmin = CActorID(uint160S(strAdmin));
    }

    LogPrintf("Settlement parameters: cooldown=%d revenuemultiplier=%d systemid=%s\n",
              params.nInitialCooldown, params.nRevenueMultiplier, params.systemIdentity.GetHex());
    return true;
}

bool InitSettlement(CHomomorphicEvaluator& evaluator, CDecryptionOracle* oracle, std::string& strError)
{
    SettlementParams params;
    if (!InitSettlementParams(params, strError)) {
        return false;
    }

    const int64_t nCacheMB = gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE_MB);
    if (nCacheMB < 1 || nCacheMB > MAX_DB_CACHE_MB) {
        strError = strprintf("Invalid -dbcache=%d (must be between 1 and %d)", nCacheMB, MAX_DB_CACHE_MB);
        return false;
    }
    const bool fReset = gArgs.GetBoolArg("-resetsettlement", false);

    g_settlementman.reset();
    g_settlementdb.reset();
    try {
        g_settlementdb.reset(new CSettlementDB((size_t)nCacheMB << 20, fReset));
    } catch (const dbwrapper_error& e) {
        strError = strprintf("Error opening settlement database: %s", e.what());
        return false;
    }

    g_settlementman.reset(new CSettlementManager(*g_settlementdb, evaluator, oracle, params));
    std::string strLoadError;
    if (!g_settlementman->Init(strLoadError)) {
        strError = strprintf("Error loading settlement state: %s. Restart with -resetsettlement to start over.", strLoadError);
        g_settlementman.reset();
        g_settlementdb.reset();
        return false;
    }

    RegisterAllCoreRPCCommands(tableRPC);
    return true;
}

void ShutdownSettlement()
{
    g_settlementman.reset();
    if (g_settlementdb) {
        g_settlementdb->Sync();
        g_settlementdb.reset();
    }
    LogPrintf("%s: done\n", __func__);
}
