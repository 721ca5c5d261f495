// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/settlementman.h"

#include "consensus/validation.h"
#include "logging.h"
#include "shutdown.h"
#include "state/settlement_logic.h"
#include "util/validation.h"
#include "utiltime.h"
#include "validationinterface.h"

#include <exception>

std::unique_ptr<CSettlementManager> g_settlementman;

CSettlementManager::CSettlementManager(CSettlementDB& dbIn,
                                       CHomomorphicEvaluator& evaluator,
                                       CDecryptionOracle* oracleIn,
                                       const SettlementParams& paramsIn)
    : db(dbIn), aggregator(evaluator), oracle(oracleIn), params(paramsIn), fAborted(false)
{
}

// =============================================================================
// Guard composition
// =============================================================================

/**
 * GuardedOperation - Run one entry point under the guard
 *
 * The operation receives the current time and the DB batch of this call.
 * It returns false (with state set) to reject. Whatever it wrote to the
 * batch is committed in both cases; the cooldown slot of the caller is only
 * consumed on success. Signals are fired once cs is released.
 */
template <typename Operation>
bool CSettlementManager::GuardedOperation(const char* strOperation,
                                          const CActorID& caller,
                                          const GuardPolicy& policy,
                                          CValidationState& state,
                                          Operation&& operation)
{
    bool fSuccess = false;
    std::vector<SettlementNotification> vNotifications;
    std::vector<std::pair<Batch, SettlementRequest>> vSettled;
    {
        LOCK(cs);
        if (fAborted) {
            throw dbwrapper_error(strprintf("%s: settlement manager stopped after a database failure", strOperation));
        }

        const int64_t nNow = GetTime();

        if (!CheckGuard(registry, GetCooldownEntry(caller), caller, policy, nNow, state)) {
            LogPrint(BCLog::SETTLEMENT, "%s: rejected by guard: %s\n", strOperation, FormatStateMessage(state));
            return false;
        }

        CSettlementDB::Batch dbBatch = db.CreateBatch();
        fSuccess = operation(nNow, dbBatch);

        if (fSuccess) {
            CooldownEntry entry = GetCooldownEntry(caller);
            if (ApplyGuard(entry, policy, nNow)) {
                mapCooldowns[caller] = entry;
                dbBatch.WriteCooldown(caller, entry);
            }
        } else {
            LogPrint(BCLog::SETTLEMENT, "%s: rejected: %s\n", strOperation, FormatStateMessage(state));
        }

        if (!dbBatch.IsEmpty()) {
            CommitOrAbort(strOperation, dbBatch);
        }

        vNotifications.swap(vPendingNotifications);
        vSettled.swap(vPendingSettled);
    }

    FireSignals(vNotifications, vSettled);
    return fSuccess;
}

static void AbortSettlement(const std::string& strMessage)
{
    LogPrintf("*** %s\n", strMessage);
    StartShutdown();
}

/**
 * CommitOrAbort - Write the batch of an operation, or stop the manager
 *
 * A failed commit leaves memory ahead of disk. The pending events are
 * dropped, the state is reloaded from the database (which the failed batch
 * did not touch), every further operation is refused and a shutdown is
 * requested. The error is rethrown to the caller.
 */
void CSettlementManager::CommitOrAbort(const char* strOperation, CSettlementDB::Batch& dbBatch)
{
    std::string strDBError;
    try {
        if (dbBatch.Commit()) return;
        strDBError = "write was not acknowledged";
    } catch (const dbwrapper_error& e) {
        strDBError = e.what();
    }

    vPendingNotifications.clear();
    vPendingSettled.clear();
    fAborted = true;

    std::string strLoadError;
    if (!LoadState(strLoadError)) {
        LogPrintf("%s: could not restore the settlement state: %s\n", __func__, strLoadError);
    }

    const std::string strMessage = strprintf("%s: settlement database commit failed: %s", strOperation, strDBError);
    AbortSettlement(strMessage);
    throw dbwrapper_error(strMessage);
}

void CSettlementManager::Notify(CSettlementDB::Batch& dbBatch, SettlementNotification notification, int64_t nNow)
{
    const SettlementNotification& appended = journal.Append(std::move(notification), nNow);
    dbBatch.WriteNotification(appended);
    vPendingNotifications.push_back(appended);
}

void CSettlementManager::RejectRequest(SettlementRequest& request,
                                       const std::string& strReason,
                                       CSettlementDB::Batch& dbBatch,
                                       int64_t nNow)
{
    ApplyReject(request);
    dbBatch.WriteRequest(request);

    SettlementNotification notification(NotificationType::SETTLEMENT_REJECTED);
    notification.nBatchId = request.nBatchId;
    notification.token = request.token;
    notification.strReason = strReason;
    Notify(dbBatch, std::move(notification), nNow);

    LogPrintf("Settlement request %s for batch %u rejected: %s\n",
              request.token.ToString(), request.nBatchId, strReason);
}

void CSettlementManager::FireSignals(const std::vector<SettlementNotification>& vNotifications,
                                     const std::vector<std::pair<Batch, SettlementRequest>>& vSettled)
{
    for (const SettlementNotification& notification : vNotifications) {
        GetSettlementSignals().NotificationAppended(notification);
    }
    for (const auto& settled : vSettled) {
        GetSettlementSignals().BatchSettled(settled.first, settled.second);
    }
}

CooldownEntry CSettlementManager::GetCooldownEntry(const CActorID& actor) const
{
    auto it = mapCooldowns.find(actor);
    if (it == mapCooldowns.end()) return CooldownEntry();
    return it->second;
}

// =============================================================================
// Startup
// =============================================================================

bool CSettlementManager::Init(std::string& strError)
{
    LOCK(cs);

    fAborted = false;

    if (db.IsEmpty()) {
        ClearState();
        if (params.initialAdmin.IsNull()) {
            strError = "no administrator configured for a new settlement state (use -admin)";
            return false;
        }
        registry.admin = params.initialAdmin;
        registry.nCooldownSeconds = params.nInitialCooldown;
        systemIdentity = params.systemIdentity;

        CSettlementDB::Batch dbBatch = db.CreateBatch();
        dbBatch.WriteVersion(SETTLEMENT_DB_VERSION);
        dbBatch.WriteSystemIdentity(systemIdentity);
        dbBatch.WriteRegistry(registry);
        if (!dbBatch.Commit()) {
            strError = "failed to write the initial settlement state";
            return false;
        }
        LogPrintf("Created settlement state: admin=%s cooldown=%ds systemid=%s\n",
                  registry.admin.ToString(), registry.nCooldownSeconds, systemIdentity.ToString());
        return true;
    }

    if (!LoadState(strError)) {
        return false;
    }

    if (systemIdentity != params.systemIdentity) {
        strError = strprintf("stored system identity %s differs from the configured -systemid %s",
                             systemIdentity.ToString(), params.systemIdentity.ToString());
        return false;
    }

    if (!params.initialAdmin.IsNull() && params.initialAdmin != registry.admin) {
        LogPrintf("%s: ignoring -admin=%s, the stored administrator is %s\n", __func__,
                  params.initialAdmin.ToString(), registry.admin.ToString());
    }

    LogPrintf("Loaded settlement state: %u batches (open=%u), %u requests, %u notifications, paused=%d\n",
              ledger.GetLastBatchId(), ledger.GetOpenBatchId(), mapRequests.size(),
              journal.size(), registry.fPaused);
    return true;
}

void CSettlementManager::ClearState()
{
    registry.SetNull();
    systemIdentity.SetNull();
    mapCooldowns.clear();
    ledger.Clear();
    mapRequests.clear();
    journal.Clear();
}

bool CSettlementManager::LoadState(std::string& strError)
{
    ClearState();

    int nVersion = 0;
    if (!db.ReadVersion(nVersion)) {
        strError = "settlement database has no version record";
        return false;
    }
    if (nVersion != SETTLEMENT_DB_VERSION) {
        strError = strprintf("unsupported settlement database version %d (expected %d)", nVersion, SETTLEMENT_DB_VERSION);
        return false;
    }

    if (!db.ReadSystemIdentity(systemIdentity) || systemIdentity.IsNull()) {
        strError = "settlement database has no system identity";
        return false;
    }

    if (!db.ReadRegistry(registry)) {
        strError = "settlement database has no registry";
        return false;
    }
    if (registry.admin.IsNull()) {
        strError = "settlement registry has no administrator";
        return false;
    }

    if (!db.LoadCooldowns(mapCooldowns)) {
        strError = "failed to load the cooldown ledger";
        return false;
    }

    std::vector<Batch> vBatches;
    if (!db.LoadBatches(vBatches)) {
        strError = "failed to load batches";
        return false;
    }
    std::string strLedgerError;
    if (!ledger.Load(std::move(vBatches), strLedgerError)) {
        strError = "inconsistent batch ledger: " + strLedgerError;
        return false;
    }

    if (!db.LoadRequests(mapRequests)) {
        strError = "failed to load settlement requests";
        return false;
    }
    if (!CheckLoadedRequests(strError)) {
        return false;
    }

    std::vector<SettlementNotification> vNotifications;
    if (!db.LoadNotifications(vNotifications)) {
        strError = "failed to load the notification journal";
        return false;
    }
    std::string strJournalError;
    if (!journal.Load(std::move(vNotifications), strJournalError)) {
        strError = strJournalError;
        return false;
    }

    return true;
}

bool CSettlementManager::CheckLoadedRequests(std::string& strError) const
{
    for (const auto& entry : mapRequests) {
        const SettlementRequest& request = entry.second;
        if (request.status != RequestStatus::REQUESTED && request.status != RequestStatus::FINALIZED &&
            request.status != RequestStatus::REJECTED) {
            strError = strprintf("settlement request %s has invalid status %u",
                                 request.token.ToString(), (unsigned int)request.status);
            return false;
        }
        const Batch* batch = ledger.GetBatch(request.nBatchId);
        if (!batch || batch->IsOpen()) {
            strError = strprintf("settlement request %s refers to batch %u which is not closed",
                                 request.token.ToString(), request.nBatchId);
            return false;
        }
        if (request.processed == (request.status == RequestStatus::REQUESTED)) {
            strError = strprintf("settlement request %s: processed flag does not match status %s",
                                 request.token.ToString(), RequestStatusToString(request.status));
            return false;
        }
    }

    for (const auto& entry : ledger.GetBatches()) {
        const Batch& batch = entry.second;
        if (!batch.fSettled) continue;
        auto it = mapRequests.find(batch.settlementToken);
        if (it == mapRequests.end() || it->second.status != RequestStatus::FINALIZED ||
            it->second.nBatchId != batch.nId) {
            strError = strprintf("batch %u is settled without a finalized request", batch.nId);
            return false;
        }
    }
    return true;
}

// =============================================================================
// Ledger
// =============================================================================

bool CSettlementManager::OpenBatch(const CActorID& caller, uint32_t& nBatchIdRet, CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_ADMIN_LEDGER, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            if (!ledger.CheckOpenBatch(state)) return false;

            const Batch& batch = ledger.ApplyOpenBatch(nNow);
            dbBatch.WriteBatchHeader(batch);

            SettlementNotification notification(NotificationType::BATCH_OPENED);
            notification.nBatchId = batch.nId;
            Notify(dbBatch, std::move(notification), nNow);

            nBatchIdRet = batch.nId;
            return true;
        });
}

bool CSettlementManager::CloseBatch(const CActorID& caller, uint32_t& nBatchIdRet, CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_ADMIN_LEDGER, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            if (!ledger.CheckCloseBatch(state)) return false;

            const Batch& batch = ledger.ApplyCloseBatch(nNow);
            dbBatch.WriteBatchHeader(batch);

            SettlementNotification notification(NotificationType::BATCH_CLOSED);
            notification.nBatchId = batch.nId;
            Notify(dbBatch, std::move(notification), nNow);

            nBatchIdRet = batch.nId;
            return true;
        });
}

bool CSettlementManager::SubmitContribution(const CActorID& caller,
                                            CAmount cost,
                                            CAmount budget,
                                            const CCiphertextHandle& handle,
                                            Contribution& contribRet,
                                            CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_SUBMISSION, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            if (!ledger.CheckContribution(cost, budget, handle, state)) return false;

            const Batch* openBatch = ledger.GetBatch(ledger.GetOpenBatchId());
            CCiphertextHandle newAggregate;
            try {
                newAggregate = aggregator.Fold(openBatch->aggregate, handle);
            } catch (const std::exception& e) {
                return state.Invalid(SettlementError::ORACLE_FAILURE, "aggregate-coprocessor-failure", e.what());
            }
            if (newAggregate.IsNull()) {
                return state.Invalid(SettlementError::ORACLE_FAILURE, "aggregate-null-result");
            }

            const Contribution& contrib = ledger.ApplyContribution(cost, budget, handle, caller, nNow, newAggregate);
            dbBatch.WriteContribution(contrib);
            dbBatch.WriteBatchHeader(*ledger.GetBatch(contrib.nBatchId));

            SettlementNotification notification(NotificationType::CONTRIBUTION_RECORDED);
            notification.nBatchId = contrib.nBatchId;
            notification.nIndex = contrib.nIndex;
            notification.actor = caller;
            Notify(dbBatch, std::move(notification), nNow);

            contribRet = contrib;
            return true;
        });
}

// =============================================================================
// Settlement protocol
// =============================================================================

bool CSettlementManager::RequestSettlement(const CActorID& caller,
                                           uint32_t nBatchId,
                                           uint256& tokenRet,
                                           CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_SETTLEMENT_REQUEST, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            const Batch* batch = ledger.GetBatch(nBatchId);
            if (!CheckSettlementTrigger(batch, nBatchId, state)) return false;

            if (!oracle || registry.oracle.IsNull()) {
                return state.Invalid(SettlementError::NO_ORACLE, "settlement-no-oracle");
            }

            CCiphertextHandle recomputed;
            try {
                recomputed = aggregator.ComputeAggregate(batch->vContributions);
            } catch (const std::exception& e) {
                return state.Invalid(SettlementError::ORACLE_FAILURE, "settlement-coprocessor-failure", e.what());
            }
            if (!CheckAggregateIntegrity(*batch, recomputed, state)) return false;

            const uint256 stateHash = ComputeStateHash(systemIdentity, batch->GetOrderedHandles());

            uint256 token;
            try {
                token = oracle->RequestDecryption(std::vector<CCiphertextHandle>{batch->aggregate});
            } catch (const std::exception& e) {
                return state.Invalid(SettlementError::ORACLE_FAILURE, "settlement-oracle-unavailable", e.what());
            }
            if (!CheckOracleToken(token, mapRequests.count(token) != 0, state)) return false;

            const SettlementRequest& request = mapRequests.emplace(token,
                MakeSettlementRequest(token, *batch, stateHash, caller, nNow)).first->second;
            dbBatch.WriteRequest(request);

            SettlementNotification notification(NotificationType::SETTLEMENT_REQUESTED);
            notification.nBatchId = nBatchId;
            notification.token = token;
            notification.actor = caller;
            Notify(dbBatch, std::move(notification), nNow);

            LogPrint(BCLog::SETTLEMENT, "RequestSettlement: batch=%u token=%s stateHash=%s\n",
                     nBatchId, token.ToString(), stateHash.ToString());

            tokenRet = token;
            return true;
        });
}

bool CSettlementManager::OnDecryptionResult(const CActorID& caller,
                                            const uint256& token,
                                            uint64_t nCleartext,
                                            const std::vector<unsigned char>& proof,
                                            CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_ORACLE_CALLBACK, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            // 1-2. Known and not yet processed
            auto it = mapRequests.find(token);
            if (!CheckSettlementToken(it == mapRequests.end() ? nullptr : &it->second, token, state)) {
                return false;
            }
            SettlementRequest& request = it->second;

            const Batch* batch = ledger.GetBatch(request.nBatchId);
            if (!batch) {
                return state.Invalid(SettlementError::UNKNOWN_BATCH, "settlement-unknown-batch",
                                     strprintf("batch %u", request.nBatchId));
            }

            // 3. Another request of the same batch won already
            if (batch->fSettled) {
                RejectRequest(request, "settlement-batch-already-settled", dbBatch, nNow);
                return state.Invalid(SettlementError::BATCH_ALREADY_SETTLED, "settlement-batch-already-settled",
                                     strprintf("batch %u settled by %s", batch->nId, batch->settlementToken.ToString()));
            }

            // 4. Batch content still matches the commitment
            CCiphertextHandle recomputed;
            try {
                recomputed = aggregator.ComputeAggregate(batch->vContributions);
            } catch (const std::exception& e) {
                return state.Invalid(SettlementError::ORACLE_FAILURE, "settlement-coprocessor-failure", e.what());
            }
            const uint256 stateHash = ComputeStateHash(systemIdentity, batch->GetOrderedHandles());
            if (!CheckSettlementIntegrity(request, stateHash, recomputed, state)) {
                RejectRequest(request, state.GetRejectReason(), dbBatch, nNow);
                return false;
            }

            // 5. Proof of the cleartext
            if (!oracle) {
                return state.Invalid(SettlementError::NO_ORACLE, "settlement-no-oracle");
            }
            bool fAuthentic = false;
            try {
                fAuthentic = oracle->VerifyAuthenticity(token, nCleartext, proof);
            } catch (const std::exception& e) {
                return state.Invalid(SettlementError::ORACLE_FAILURE, "settlement-oracle-unavailable", e.what());
            }
            if (!fAuthentic) {
                return state.Invalid(SettlementError::INVALID_PROOF, "settlement-invalid-authenticity-proof",
                                     strprintf("token %s", token.ToString()));
            }

            // 6. Finalize
            CAmount revenue = 0;
            CAmount profit = 0;
            if (!ComputeSettlementFigures(batch->totalBudget, batch->totalCost, params.nRevenueMultiplier, revenue, profit)) {
                return state.Invalid(SettlementError::INVALID_AMOUNT, "settlement-figures-out-of-range",
                                     strprintf("budget=%d multiplier=%d", batch->totalBudget, params.nRevenueMultiplier));
            }

            ApplyFinalize(request);
            const Batch& settled = ledger.ApplySettled(request.nBatchId, token, nCleartext, revenue, profit);
            dbBatch.WriteRequest(request);
            dbBatch.WriteBatchHeader(settled);

            SettlementNotification notification(NotificationType::SETTLEMENT_FINALIZED);
            notification.nBatchId = settled.nId;
            notification.token = token;
            notification.nDecryptedTotal = nCleartext;
            notification.revenue = revenue;
            notification.profit = profit;
            Notify(dbBatch, std::move(notification), nNow);
            vPendingSettled.emplace_back(settled, request);

            LogPrintf("Settled batch %u: total=%u revenue=%d profit=%d token=%s\n",
                      settled.nId, nCleartext, revenue, profit, token.ToString());
            return true;
        });
}

// =============================================================================
// Registry
// =============================================================================

bool CSettlementManager::AuthorizeProvider(const CActorID& caller, const CActorID& provider, CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_ADMIN_REGISTRY, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            if (provider.IsNull()) {
                return state.Invalid(SettlementError::INVALID_ACTOR, "registry-null-actor");
            }
            if (registry.IsProvider(provider)) {
                return true;
            }

            registry.setProviders.insert(provider);
            dbBatch.WriteRegistry(registry);

            SettlementNotification notification(NotificationType::PROVIDER_AUTHORIZED);
            notification.actor = provider;
            Notify(dbBatch, std::move(notification), nNow);
            return true;
        });
}

bool CSettlementManager::RevokeProvider(const CActorID& caller, const CActorID& provider, CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_ADMIN_REGISTRY, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            if (provider.IsNull()) {
                return state.Invalid(SettlementError::INVALID_ACTOR, "registry-null-actor");
            }
            if (!registry.IsProvider(provider)) {
                return state.Invalid(SettlementError::UNKNOWN_PROVIDER, "registry-unknown-provider",
                                     provider.ToString());
            }

            registry.setProviders.erase(provider);
            dbBatch.WriteRegistry(registry);

            SettlementNotification notification(NotificationType::PROVIDER_REVOKED);
            notification.actor = provider;
            Notify(dbBatch, std::move(notification), nNow);
            return true;
        });
}

bool CSettlementManager::SetPaused(const CActorID& caller, bool fPaused, CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_ADMIN_REGISTRY, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            if (registry.fPaused == fPaused) {
                return true;
            }

            registry.fPaused = fPaused;
            dbBatch.WriteRegistry(registry);

            SettlementNotification notification(NotificationType::PAUSE_CHANGED);
            notification.nValue = fPaused ? 1 : 0;
            Notify(dbBatch, std::move(notification), nNow);
            return true;
        });
}

bool CSettlementManager::SetCooldown(const CActorID& caller, int64_t nSeconds, CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_ADMIN_REGISTRY, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            if (nSeconds < 0 || nSeconds > MAX_COOLDOWN_SECONDS) {
                return state.Invalid(SettlementError::INVALID_AMOUNT, "registry-invalid-cooldown",
                                     strprintf("%d not in [0, %d]", nSeconds, MAX_COOLDOWN_SECONDS));
            }
            if (registry.nCooldownSeconds == nSeconds) {
                return true;
            }

            registry.nCooldownSeconds = nSeconds;
            dbBatch.WriteRegistry(registry);

            SettlementNotification notification(NotificationType::COOLDOWN_CHANGED);
            notification.nValue = nSeconds;
            Notify(dbBatch, std::move(notification), nNow);
            return true;
        });
}

bool CSettlementManager::TransferAdmin(const CActorID& caller, const CActorID& newAdmin, CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_ADMIN_REGISTRY, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            if (newAdmin.IsNull()) {
                return state.Invalid(SettlementError::INVALID_ACTOR, "registry-null-actor");
            }

            registry.admin = newAdmin;
            dbBatch.WriteRegistry(registry);

            SettlementNotification notification(NotificationType::ADMIN_TRANSFERRED);
            notification.actor = newAdmin;
            Notify(dbBatch, std::move(notification), nNow);
            return true;
        });
}

bool CSettlementManager::SetDecryptionOracle(const CActorID& caller, const CActorID& newOracle, CValidationState& state)
{
    return GuardedOperation(__func__, caller, GUARD_ADMIN_REGISTRY, state,
        [&](int64_t nNow, CSettlementDB::Batch& dbBatch) {
            if (newOracle.IsNull()) {
                return state.Invalid(SettlementError::INVALID_ACTOR, "registry-null-actor");
            }

            registry.oracle = newOracle;
            dbBatch.WriteRegistry(registry);

            SettlementNotification notification(NotificationType::ORACLE_CHANGED);
            notification.actor = newOracle;
            Notify(dbBatch, std::move(notification), nNow);
            return true;
        });
}

// =============================================================================
// Queries
// =============================================================================

bool CSettlementManager::GetBatch(uint32_t nBatchId, Batch& batchRet) const
{
    LOCK(cs);
    const Batch* batch = ledger.GetBatch(nBatchId);
    if (!batch) return false;
    batchRet = *batch;
    return true;
}

std::vector<Batch> CSettlementManager::ListBatches() const
{
    LOCK(cs);
    std::vector<Batch> vBatches;
    for (const auto& entry : ledger.GetBatches()) {
        vBatches.push_back(entry.second);
    }
    return vBatches;
}

uint32_t CSettlementManager::GetOpenBatchId() const
{
    LOCK(cs);
    return ledger.GetOpenBatchId();
}

bool CSettlementManager::GetSettlementRequest(const uint256& token, SettlementRequest& requestRet) const
{
    LOCK(cs);
    auto it = mapRequests.find(token);
    if (it == mapRequests.end()) return false;
    requestRet = it->second;
    return true;
}

std::vector<SettlementRequest> CSettlementManager::ListSettlementRequests(uint32_t nBatchId) const
{
    LOCK(cs);
    std::vector<SettlementRequest> vRequests;
    for (const auto& entry : mapRequests) {
        if (entry.second.nBatchId == nBatchId) {
            vRequests.push_back(entry.second);
        }
    }
    return vRequests;
}

ActorRegistry CSettlementManager::GetRegistry() const
{
    LOCK(cs);
    return registry;
}

CooldownEntry CSettlementManager::GetCooldown(const CActorID& actor) const
{
    LOCK(cs);
    return GetCooldownEntry(actor);
}

std::vector<SettlementNotification> CSettlementManager::GetNotifications(uint64_t nFromSequence, size_t nMax) const
{
    LOCK(cs);
    return journal.GetRange(nFromSequence, nMax);
}
