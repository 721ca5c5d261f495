// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/aggregation.h"

#include "hash.h"
#include "logging.h"

#include <string>

CCiphertextHandle CAggregationEngine::Fold(const CCiphertextHandle& running, const CCiphertextHandle& next) const
{
    if (running.IsNull()) return next;
    return evaluator.Add(running, next);
}

CCiphertextHandle CAggregationEngine::ComputeAggregate(const std::vector<Contribution>& contributions) const
{
    CCiphertextHandle aggregate;
    for (const Contribution& contrib : contributions) {
        aggregate = Fold(aggregate, contrib.handle);
    }

    LogPrint(BCLog::AGGREGATE, "ComputeAggregate: %u handles -> %s\n",
             contributions.size(), aggregate.ToString());
    return aggregate;
}

uint256 ComputeStateHash(const uint256& systemIdentity, const std::vector<CCiphertextHandle>& handles)
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    ss << std::string(STATE_HASH_DOMAIN_TAG);
    ss << systemIdentity;
    ss << handles;
    return ss.GetHash();
}
