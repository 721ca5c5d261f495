// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_STATE_LEDGER_H
#define CIPHERBATCH_STATE_LEDGER_H

/**
 * Batch Ledger
 *
 * Lifecycle of sequential contribution batches:
 *   - at most one batch is Open at any time
 *   - ids are allocated 1, 2, 3, ... and never reused
 *   - contributions are only appended to the Open batch, with contiguous
 *     indices starting at 0
 *
 * Check* functions never mutate. Apply* functions assume the matching
 * Check* succeeded under the same lock.
 */

#include "state/settlement.h"

#include <map>
#include <string>
#include <vector>

class CValidationState;

class CBatchLedger
{
private:
    std::map<uint32_t, Batch> mapBatches;
    uint32_t nOpenBatchId;       // 0 when no batch is open
    uint32_t nLastBatchId;

public:
    CBatchLedger() : nOpenBatchId(0), nLastBatchId(0) {}

    // Queries
    uint32_t GetOpenBatchId() const { return nOpenBatchId; }
    uint32_t GetLastBatchId() const { return nLastBatchId; }
    bool HasOpenBatch() const { return nOpenBatchId != 0; }
    const Batch* GetBatch(uint32_t nBatchId) const;
    const std::map<uint32_t, Batch>& GetBatches() const { return mapBatches; }

    // Open
    bool CheckOpenBatch(CValidationState& state) const;
    const Batch& ApplyOpenBatch(int64_t nTime);

    // Close
    bool CheckCloseBatch(CValidationState& state) const;
    const Batch& ApplyCloseBatch(int64_t nTime);

    /**
     * CheckContribution - Validate a submission into the open batch
     *
     * Rules:
     * - a batch is Open (BatchNotOpen)
     * - cost and budget in money range, running totals too (InvalidAmount)
     * - handle is not null (InvalidHandle)
     */
    bool CheckContribution(CAmount cost,
                           CAmount budget,
                           const CCiphertextHandle& handle,
                           CValidationState& state) const;

    /**
     * ApplyContribution - Append to the open batch
     *
     * @param newAggregate Running aggregate after folding in handle
     * @return The recorded contribution
     */
    const Contribution& ApplyContribution(CAmount cost,
                                          CAmount budget,
                                          const CCiphertextHandle& handle,
                                          const CActorID& provider,
                                          int64_t nTime,
                                          const CCiphertextHandle& newAggregate);

    /** Record a finalized settlement on a closed batch */
    const Batch& ApplySettled(uint32_t nBatchId,
                              const uint256& token,
                              uint64_t nDecryptedTotal,
                              CAmount revenue,
                              CAmount profit);

    /**
     * Load - Replace the ledger with batches read from disk
     *
     * Checks the ledger invariants: sequential ids, at most one Open batch,
     * contiguous contribution indices and totals equal to the sum of the
     * contributions.
     *
     * @param strError Set on invariant violation
     */
    bool Load(std::vector<Batch> vBatches, std::string& strError);

    void Clear();
};

#endif // CIPHERBATCH_STATE_LEDGER_H
