// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/settlement.h"

#include "hash.h"

std::string BatchStatusToString(BatchStatus status)
{
    switch (status) {
    case BatchStatus::OPEN: return "open";
    case BatchStatus::CLOSED: return "closed";
    }
    return "unknown";
}

std::string RequestStatusToString(RequestStatus status)
{
    switch (status) {
    case RequestStatus::REQUESTED: return "requested";
    case RequestStatus::FINALIZED: return "finalized";
    case RequestStatus::REJECTED: return "rejected";
    }
    return "unknown";
}

std::vector<CCiphertextHandle> Batch::GetOrderedHandles() const
{
    std::vector<CCiphertextHandle> handles;
    handles.reserve(vContributions.size());
    for (const Contribution& contrib : vContributions) {
        handles.push_back(contrib.handle);
    }
    return handles;
}

uint256 GetDefaultSystemIdentity()
{
    static const std::string strIdentity = "cipherbatch";
    return Hash(strIdentity.begin(), strIdentity.end());
}
