// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/settlement_logic.h"

#include "consensus/validation.h"
#include "logging.h"

#include <assert.h>
#include <limits>

// =============================================================================
// Trigger
// =============================================================================

bool CheckSettlementTrigger(const Batch* batch, uint32_t nBatchId, CValidationState& state)
{
    if (!batch) {
        return state.Invalid(SettlementError::UNKNOWN_BATCH, "settlement-unknown-batch",
                             strprintf("batch %u", nBatchId));
    }
    if (batch->status != BatchStatus::CLOSED) {
        return state.Invalid(SettlementError::BATCH_NOT_CLOSED, "settlement-batch-not-closed",
                             strprintf("batch %u is %s", nBatchId, BatchStatusToString(batch->status)));
    }
    if (batch->vContributions.empty()) {
        return state.Invalid(SettlementError::EMPTY_BATCH, "settlement-empty-batch",
                             strprintf("batch %u", nBatchId));
    }
    if (batch->fSettled) {
        return state.Invalid(SettlementError::BATCH_ALREADY_SETTLED, "settlement-batch-already-settled",
                             strprintf("batch %u settled by %s", nBatchId, batch->settlementToken.ToString()));
    }
    return true;
}

bool CheckAggregateIntegrity(const Batch& batch, const CCiphertextHandle& recomputed, CValidationState& state)
{
    if (recomputed != batch.aggregate) {
        LogPrintf("ERROR: %s: batch %u aggregate mismatch running=%s recomputed=%s\n", __func__,
                  batch.nId, batch.aggregate.ToString(), recomputed.ToString());
        return state.Invalid(SettlementError::INTEGRITY_MISMATCH, "settlement-aggregate-mismatch",
                             strprintf("batch %u", batch.nId));
    }
    return true;
}

bool CheckOracleToken(const uint256& token, bool fAlreadyKnown, CValidationState& state)
{
    if (token.IsNull()) {
        return state.Invalid(SettlementError::ORACLE_FAILURE, "settlement-oracle-null-token");
    }
    if (fAlreadyKnown) {
        return state.Invalid(SettlementError::ORACLE_FAILURE, "settlement-oracle-duplicate-token",
                             token.ToString());
    }
    return true;
}

SettlementRequest MakeSettlementRequest(const uint256& token,
                                        const Batch& batch,
                                        const uint256& stateHash,
                                        const CActorID& requester,
                                        int64_t nTime)
{
    SettlementRequest request;
    request.token = token;
    request.nBatchId = batch.nId;
    request.stateHash = stateHash;
    request.aggregate = batch.aggregate;
    request.requester = requester;
    request.nTime = nTime;
    request.processed = false;
    request.status = RequestStatus::REQUESTED;
    return request;
}

// =============================================================================
// Callback
// =============================================================================

bool CheckSettlementToken(const SettlementRequest* request, const uint256& token, CValidationState& state)
{
    if (!request) {
        return state.Invalid(SettlementError::UNKNOWN_TOKEN, "settlement-unknown-token", token.ToString());
    }
    if (request->processed) {
        LogPrint(BCLog::SETTLEMENT, "CheckSettlementToken: replay of %s (status=%s)\n",
                 token.ToString(), RequestStatusToString(request->status));
        return state.Invalid(SettlementError::REPLAY_REJECTED, "settlement-replay",
                             strprintf("%s already %s", token.ToString(), RequestStatusToString(request->status)));
    }
    return true;
}

bool CheckSettlementIntegrity(const SettlementRequest& request,
                              const uint256& stateHash,
                              const CCiphertextHandle& recomputed,
                              CValidationState& state)
{
    if (stateHash != request.stateHash) {
        LogPrintf("ERROR: %s: token=%s batch=%u commitment mismatch stored=%s current=%s\n", __func__,
                  request.token.ToString(), request.nBatchId,
                  request.stateHash.ToString(), stateHash.ToString());
        return state.Invalid(SettlementError::INTEGRITY_MISMATCH, "settlement-state-hash-mismatch",
                             strprintf("batch %u", request.nBatchId));
    }
    if (recomputed != request.aggregate) {
        LogPrintf("ERROR: %s: token=%s batch=%u aggregate mismatch stored=%s current=%s\n", __func__,
                  request.token.ToString(), request.nBatchId,
                  request.aggregate.ToString(), recomputed.ToString());
        return state.Invalid(SettlementError::INTEGRITY_MISMATCH, "settlement-aggregate-mismatch",
                             strprintf("batch %u", request.nBatchId));
    }
    return true;
}

bool ComputeSettlementFigures(CAmount totalBudget,
                              CAmount totalCost,
                              int64_t nRevenueMultiplier,
                              CAmount& revenue,
                              CAmount& profit)
{
    if (totalBudget < 0 || totalCost < 0 || nRevenueMultiplier <= 0) {
        return false;
    }
    if (totalBudget > std::numeric_limits<CAmount>::max() / nRevenueMultiplier) {
        return false;
    }
    revenue = totalBudget * nRevenueMultiplier;
    // revenue >= 0 and totalCost >= 0: the difference stays in range
    profit = revenue - totalCost;
    return true;
}

void ApplyFinalize(SettlementRequest& request)
{
    assert(!request.processed);
    request.processed = true;
    request.status = RequestStatus::FINALIZED;
}

void ApplyReject(SettlementRequest& request)
{
    assert(!request.processed);
    request.processed = true;
    request.status = RequestStatus::REJECTED;
}
