// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_STATE_AGGREGATION_H
#define CIPHERBATCH_STATE_AGGREGATION_H

#include "fhe/coprocessor.h"
#include "state/settlement.h"
#include "uint256.h"

#include <vector>

/** Domain separation tag of the state commitment */
static const char STATE_HASH_DOMAIN_TAG[] = "cipherbatch/state-commitment/v1";

/**
 * CAggregationEngine - Homomorphic running sum of a batch
 *
 * The aggregate of contributions c0..cn is the left fold
 * Add(...Add(Add(c0, c1), c2)..., cn); an empty batch has a null aggregate.
 * Nothing is ever decrypted here.
 */
class CAggregationEngine
{
private:
    CHomomorphicEvaluator& evaluator;

public:
    explicit CAggregationEngine(CHomomorphicEvaluator& evaluatorIn) : evaluator(evaluatorIn) {}

    /** Fold one more handle into a running aggregate */
    CCiphertextHandle Fold(const CCiphertextHandle& running, const CCiphertextHandle& next) const;

    /** Re-derive the aggregate of an ordered contribution list */
    CCiphertextHandle ComputeAggregate(const std::vector<Contribution>& contributions) const;
};

/**
 * ComputeStateHash - Commitment to the content of a batch
 *
 * Hash(domain tag, systemIdentity, ordered handles) with the double-SHA256
 * hash writer. Any change, addition, removal or reordering of a handle
 * changes the commitment.
 */
uint256 ComputeStateHash(const uint256& systemIdentity, const std::vector<CCiphertextHandle>& handles);

#endif // CIPHERBATCH_STATE_AGGREGATION_H
