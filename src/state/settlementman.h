// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_STATE_SETTLEMENTMAN_H
#define CIPHERBATCH_STATE_SETTLEMENTMAN_H

#include "fhe/coprocessor.h"
#include "state/aggregation.h"
#include "state/guard.h"
#include "state/ledger.h"
#include "state/notifications.h"
#include "state/settlement.h"
#include "state/settlementdb.h"
#include "sync.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

class CValidationState;

/**
 * CSettlementManager - Owner of the authoritative settlement state
 *
 * Registry, cooldown ledger, batches, settlement requests and the
 * notification journal all live here. Every public operation:
 *   - holds cs from the guard to the commit
 *   - runs the guard (role, pause, cooldown) before anything else
 *   - performs all of its checks before any mutation
 *   - commits its writes in one CSettlementDB::Batch
 *   - fires CSettlementInterface signals after the commit, with cs released
 *
 * A failed commit is fatal: memory is restored from the database, a shutdown
 * is requested and every later operation throws dbwrapper_error.
 *
 * The single exception to "failure does not mutate" is a decryption result
 * whose batch no longer matches its commitment: the request is rejected for
 * good and the rejection is persisted even though the call fails.
 */
class CSettlementManager
{
private:
    mutable RecursiveMutex cs;

    CSettlementDB& db;
    CAggregationEngine aggregator;
    CDecryptionOracle* oracle;       // Not owned, may be null
    const SettlementParams params;
    uint256 systemIdentity;          // Stored with the state, checked against params on load
    bool fAborted;

    ActorRegistry registry;
    std::map<CActorID, CooldownEntry> mapCooldowns;
    CBatchLedger ledger;
    std::map<uint256, SettlementRequest> mapRequests;
    CNotificationJournal journal;

    // Events of the running operation, fired once it is on disk
    std::vector<SettlementNotification> vPendingNotifications;
    std::vector<std::pair<Batch, SettlementRequest>> vPendingSettled;

    template <typename Operation>
    bool GuardedOperation(const char* strOperation,
                          const CActorID& caller,
                          const GuardPolicy& policy,
                          CValidationState& state,
                          Operation&& operation);

    void Notify(CSettlementDB::Batch& dbBatch, SettlementNotification notification, int64_t nNow);
    void RejectRequest(SettlementRequest& request, const std::string& strReason,
                       CSettlementDB::Batch& dbBatch, int64_t nNow);
    void CommitOrAbort(const char* strOperation, CSettlementDB::Batch& dbBatch);
    static void FireSignals(const std::vector<SettlementNotification>& vNotifications,
                            const std::vector<std::pair<Batch, SettlementRequest>>& vSettled);

    CooldownEntry GetCooldownEntry(const CActorID& actor) const;
    bool CheckLoadedRequests(std::string& strError) const;
    void ClearState();
    bool LoadState(std::string& strError);

public:
    CSettlementManager(CSettlementDB& dbIn,
                       CHomomorphicEvaluator& evaluator,
                       CDecryptionOracle* oracleIn,
                       const SettlementParams& paramsIn);

    /**
     * Init - Load the state from disk, or create it on an empty database
     *
     * A new state gets params.initialAdmin as administrator,
     * params.nInitialCooldown as cooldown and params.systemIdentity as the
     * salt of its state hashes. A stored state whose identity differs from
     * params.systemIdentity is refused.
     *
     * @param strError Reason of the failure (corrupt or inconsistent database)
     */
    bool Init(std::string& strError);

    // -------------------------------------------------------------------------
    // Ledger (administrator)
    // -------------------------------------------------------------------------

    bool OpenBatch(const CActorID& caller, uint32_t& nBatchIdRet, CValidationState& state);
    bool CloseBatch(const CActorID& caller, uint32_t& nBatchIdRet, CValidationState& state);

    /**
     * SubmitContribution - Append an encrypted value to the open batch
     *
     * Provider only, submission cooldown applies. The handle is folded into
     * the running aggregate through the homomorphic evaluator.
     */
    bool SubmitContribution(const CActorID& caller,
                            CAmount cost,
                            CAmount budget,
                            const CCiphertextHandle& handle,
                            Contribution& contribRet,
                            CValidationState& state);

    // -------------------------------------------------------------------------
    // Settlement protocol
    // -------------------------------------------------------------------------

    /**
     * RequestSettlement - Send the aggregate of a closed batch for decryption
     *
     * Anyone may call, settlement cooldown applies. Returns at once with the
     * oracle's token; the result arrives later through OnDecryptionResult().
     */
    bool RequestSettlement(const CActorID& caller, uint32_t nBatchId, uint256& tokenRet, CValidationState& state);

    /** Callback of the decryption oracle; at most one call per token succeeds */
    bool OnDecryptionResult(const CActorID& caller,
                            const uint256& token,
                            uint64_t nCleartext,
                            const std::vector<unsigned char>& proof,
                            CValidationState& state);

    // -------------------------------------------------------------------------
    // Registry (administrator, allowed while paused)
    // -------------------------------------------------------------------------

    bool AuthorizeProvider(const CActorID& caller, const CActorID& provider, CValidationState& state);
    bool RevokeProvider(const CActorID& caller, const CActorID& provider, CValidationState& state);
    bool SetPaused(const CActorID& caller, bool fPaused, CValidationState& state);
    bool SetCooldown(const CActorID& caller, int64_t nSeconds, CValidationState& state);
    bool TransferAdmin(const CActorID& caller, const CActorID& newAdmin, CValidationState& state);
    bool SetDecryptionOracle(const CActorID& caller, const CActorID& newOracle, CValidationState& state);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    bool GetBatch(uint32_t nBatchId, Batch& batchRet) const;
    std::vector<Batch> ListBatches() const;
    uint32_t GetOpenBatchId() const;
    bool GetSettlementRequest(const uint256& token, SettlementRequest& requestRet) const;
    std::vector<SettlementRequest> ListSettlementRequests(uint32_t nBatchId) const;
    ActorRegistry GetRegistry() const;
    CooldownEntry GetCooldown(const CActorID& actor) const;
    std::vector<SettlementNotification> GetNotifications(uint64_t nFromSequence, size_t nMax) const;
    const SettlementParams& GetParams() const { return params; }
};

extern std::unique_ptr<CSettlementManager> g_settlementman;

#endif // CIPHERBATCH_STATE_SETTLEMENTMAN_H
