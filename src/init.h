// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_INIT_H
#define CIPHERBATCH_INIT_H

#include <stdint.h>
#include <string>

class CDecryptionOracle;
class CHomomorphicEvaluator;
struct SettlementParams;

static const int64_t DEFAULT_DB_CACHE_MB = 8;
static const int64_t MAX_DB_CACHE_MB = 1024;

/** Help text of every option read by the settlement core */
std::string GetSettlementHelpString();

/** Configure the global logger from -debug, -printtoconsole, -logtimestamps and -nodebuglogfile */
bool InitLogging(std::string& strError);

/**
 * InitSettlementParams - Read and validate the settlement parameters
 *
 * -cooldown, -revenuemultiplier, -systemid and -admin. Out of range values
 * and malformed hex are init errors.
 */
bool InitSettlementParams(SettlementParams& params, std::string& strError);

/**
 * InitSettlement - Open the settlement database and load the manager
 *
 * Installs g_settlementdb and g_settlementman and registers the settlement
 * RPC commands. The collaborators must outlive ShutdownSettlement().
 */
bool InitSettlement(CHomomorphicEvaluator& evaluator, CDecryptionOracle* oracle, std::string& strError);

/** Flush and release g_settlementman and g_settlementdb */
void ShutdownSettlement();

#endif // CIPHERBATCH_INIT_H
