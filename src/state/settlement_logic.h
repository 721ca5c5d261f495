// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_STATE_SETTLEMENT_LOGIC_H
#define CIPHERBATCH_STATE_SETTLEMENT_LOGIC_H

/**
 * Settlement Protocol - request / callback rules
 *
 * Per request state machine:
 *   Requested -> Finalized   (terminal)
 *   Requested -> Rejected    (terminal, the token can never be retried)
 *
 * Callback check order:
 *   1. unknown token                  -> UnknownToken, no change
 *   2. processed                      -> ReplayRejected, no change
 *   3. batch settled by another token -> BatchAlreadySettled, request Rejected
 *   4. commitment/aggregate mismatch  -> IntegrityMismatch, request Rejected
 *   5. invalid authenticity proof     -> InvalidAuthenticityProof, no change
 *   6. otherwise                      -> Finalized, figures recorded on the batch
 */

#include "state/settlement.h"

#include <stdint.h>

class CValidationState;

// =============================================================================
// Trigger
// =============================================================================

/**
 * CheckSettlementTrigger - Validate that a batch can be sent for decryption
 *
 * @param batch    Batch looked up by id, nullptr if unknown
 * @param nBatchId Requested id (for error reporting)
 * @param state    UnknownBatch, BatchNotClosed, EmptyBatch or BatchAlreadySettled
 */
bool CheckSettlementTrigger(const Batch* batch, uint32_t nBatchId, CValidationState& state);

/** The aggregate re-derived from the contributions must equal the running aggregate */
bool CheckAggregateIntegrity(const Batch& batch, const CCiphertextHandle& recomputed, CValidationState& state);

/** A token from the oracle must be non-null and never seen before */
bool CheckOracleToken(const uint256& token, bool fAlreadyKnown, CValidationState& state);

SettlementRequest MakeSettlementRequest(const uint256& token,
                                        const Batch& batch,
                                        const uint256& stateHash,
                                        const CActorID& requester,
                                        int64_t nTime);

// =============================================================================
// Callback
// =============================================================================

/** Steps 1 and 2: the token designates a request that was not processed yet */
bool CheckSettlementToken(const SettlementRequest* request, const uint256& token, CValidationState& state);

/**
 * CheckSettlementIntegrity - Step 4
 *
 * @param request    Stored request
 * @param stateHash  Commitment recomputed over the current contributions
 * @param recomputed Aggregate recomputed over the current contributions
 */
bool CheckSettlementIntegrity(const SettlementRequest& request,
                              const uint256& stateHash,
                              const CCiphertextHandle& recomputed,
                              CValidationState& state);

/**
 * ComputeSettlementFigures - revenue = totalBudget * multiplier, profit = revenue - totalCost
 *
 * @return false if the figures leave the int64_t range
 */
bool ComputeSettlementFigures(CAmount totalBudget,
                              CAmount totalCost,
                              int64_t nRevenueMultiplier,
                              CAmount& revenue,
                              CAmount& profit);

/** Terminal transitions; processed goes false -> true exactly here */
void ApplyFinalize(SettlementRequest& request);
void ApplyReject(SettlementRequest& request);

#endif // CIPHERBATCH_STATE_SETTLEMENT_LOGIC_H
