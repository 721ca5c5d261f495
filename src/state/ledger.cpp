// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/ledger.h"

#include "consensus/validation.h"
#include "logging.h"

#include <algorithm>
#include <assert.h>

const Batch* CBatchLedger::GetBatch(uint32_t nBatchId) const
{
    auto it = mapBatches.find(nBatchId);
    if (it == mapBatches.end()) return nullptr;
    return &it->second;
}

// =============================================================================
// Open / Close
// =============================================================================

bool CBatchLedger::CheckOpenBatch(CValidationState& state) const
{
    if (nOpenBatchId != 0) {
        return state.Invalid(SettlementError::BATCH_ALREADY_OPEN, "ledger-batch-already-open",
                             strprintf("batch %u is open", nOpenBatchId));
    }
    return true;
}

const Batch& CBatchLedger::ApplyOpenBatch(int64_t nTime)
{
    assert(nOpenBatchId == 0);

    Batch batch;
    batch.nId = nLastBatchId + 1;
    batch.status = BatchStatus::OPEN;
    batch.nOpenTime = nTime;

    nLastBatchId = batch.nId;
    nOpenBatchId = batch.nId;

    LogPrint(BCLog::LEDGER, "ApplyOpenBatch: batch=%u\n", batch.nId);

    return mapBatches.emplace(batch.nId, std::move(batch)).first->second;
}

bool CBatchLedger::CheckCloseBatch(CValidationState& state) const
{
    if (nOpenBatchId == 0) {
        return state.Invalid(SettlementError::BATCH_NOT_OPEN, "ledger-batch-not-open");
    }
    return true;
}

const Batch& CBatchLedger::ApplyCloseBatch(int64_t nTime)
{
    assert(nOpenBatchId != 0);

    Batch& batch = mapBatches.at(nOpenBatchId);
    batch.status = BatchStatus::CLOSED;
    batch.nCloseTime = nTime;
    nOpenBatchId = 0;

    LogPrint(BCLog::LEDGER, "ApplyCloseBatch: batch=%u contributions=%u totalCost=%lld totalBudget=%lld\n",
             batch.nId, batch.GetContributionCount(),
             (long long)batch.totalCost, (long long)batch.totalBudget);

    return batch;
}

// =============================================================================
// Contributions
// =============================================================================

bool CBatchLedger::CheckContribution(CAmount cost,
                                     CAmount budget,
                                     const CCiphertextHandle& handle,
                                     CValidationState& state) const
{
    if (nOpenBatchId == 0) {
        return state.Invalid(SettlementError::BATCH_NOT_OPEN, "ledger-batch-not-open");
    }

    if (!MoneyRange(cost)) {
        return state.Invalid(SettlementError::INVALID_AMOUNT, "ledger-invalid-cost",
                             strprintf("cost=%lld", (long long)cost));
    }
    if (!MoneyRange(budget)) {
        return state.Invalid(SettlementError::INVALID_AMOUNT, "ledger-invalid-budget",
                             strprintf("budget=%lld", (long long)budget));
    }
    if (handle.IsNull()) {
        return state.Invalid(SettlementError::INVALID_HANDLE, "ledger-null-handle");
    }

    // Both terms are in [0, MAX_MONEY]: the sums cannot overflow int64_t
    const Batch& batch = mapBatches.at(nOpenBatchId);
    if (!MoneyRange(batch.totalCost + cost)) {
        return state.Invalid(SettlementError::INVALID_AMOUNT, "ledger-total-cost-overflow");
    }
    if (!MoneyRange(batch.totalBudget + budget)) {
        return state.Invalid(SettlementError::INVALID_AMOUNT, "ledger-total-budget-overflow");
    }

    return true;
}

const Contribution& CBatchLedger::ApplyContribution(CAmount cost,
                                                    CAmount budget,
                                                    const CCiphertextHandle& handle,
                                                    const CActorID& provider,
                                                    int64_t nTime,
                                                    const CCiphertextHandle& newAggregate)
{
    assert(nOpenBatchId != 0);
    Batch& batch = mapBatches.at(nOpenBatchId);

    Contribution contrib;
    contrib.nBatchId = batch.nId;
    contrib.nIndex = batch.GetContributionCount();
    contrib.handle = handle;
    contrib.cost = cost;
    contrib.budget = budget;
    contrib.provider = provider;
    contrib.nTime = nTime;

    batch.vContributions.push_back(contrib);
    batch.totalCost += cost;
    batch.totalBudget += budget;
    batch.aggregate = newAggregate;

    LogPrint(BCLog::LEDGER, "ApplyContribution: batch=%u index=%u cost=%lld budget=%lld provider=%s\n",
             batch.nId, contrib.nIndex, (long long)cost, (long long)budget, provider.ToString());

    return batch.vContributions.back();
}

const Batch& CBatchLedger::ApplySettled(uint32_t nBatchId,
                                        const uint256& token,
                                        uint64_t nDecryptedTotal,
                                        CAmount revenue,
                                        CAmount profit)
{
    Batch& batch = mapBatches.at(nBatchId);
    assert(batch.status == BatchStatus::CLOSED && !batch.fSettled);

    batch.fSettled = true;
    batch.settlementToken = token;
    batch.nDecryptedTotal = nDecryptedTotal;
    batch.revenue = revenue;
    batch.profit = profit;

    return batch;
}

// =============================================================================
// Persistence
// =============================================================================

bool CBatchLedger::Load(std::vector<Batch> vBatches, std::string& strError)
{
    Clear();

    std::sort(vBatches.begin(), vBatches.end(), [](const Batch& a, const Batch& b) {
        return a.nId < b.nId;
    });

    for (Batch& batch : vBatches) {
        if (batch.nId != nLastBatchId + 1) {
            strError = strprintf("batch id %u out of sequence (expected %u)", batch.nId, nLastBatchId + 1);
            return false;
        }
        if (batch.status != BatchStatus::OPEN && batch.status != BatchStatus::CLOSED) {
            strError = strprintf("batch %u has invalid status %u", batch.nId, (unsigned int)batch.status);
            return false;
        }

        if (batch.IsOpen()) {
            if (nOpenBatchId != 0) {
                strError = strprintf("batches %u and %u are both open", nOpenBatchId, batch.nId);
                return false;
            }
            if (batch.fSettled) {
                strError = strprintf("open batch %u is marked settled", batch.nId);
                return false;
            }
            nOpenBatchId = batch.nId;
        }

        std::sort(batch.vContributions.begin(), batch.vContributions.end(),
                  [](const Contribution& a, const Contribution& b) { return a.nIndex < b.nIndex; });

        CAmount sumCost = 0;
        CAmount sumBudget = 0;
        for (size_t i = 0; i < batch.vContributions.size(); ++i) {
            const Contribution& contrib = batch.vContributions[i];
            if (contrib.nIndex != i || contrib.nBatchId != batch.nId) {
                strError = strprintf("batch %u: contribution indices not contiguous at %u", batch.nId, i);
                return false;
            }
            sumCost += contrib.cost;
            sumBudget += contrib.budget;
            if (!MoneyRange(sumCost) || !MoneyRange(sumBudget)) {
                strError = strprintf("batch %u: totals out of range", batch.nId);
                return false;
            }
        }
        if (sumCost != batch.totalCost || sumBudget != batch.totalBudget) {
            strError = strprintf("batch %u: totals (%lld/%lld) differ from contributions (%lld/%lld)",
                                 batch.nId, (long long)batch.totalCost, (long long)batch.totalBudget,
                                 (long long)sumCost, (long long)sumBudget);
            return false;
        }

        nLastBatchId = batch.nId;
        mapBatches.emplace(batch.nId, std::move(batch));
    }

    LogPrint(BCLog::LEDGER, "CBatchLedger::Load: %u batches, open=%u\n", nLastBatchId, nOpenBatchId);
    return true;
}

void CBatchLedger::Clear()
{
    mapBatches.clear();
    nOpenBatchId = 0;
    nLastBatchId = 0;
}
