// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2019 The Bitcoin Core developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/validation.h"

#include "util/strprintf.h"

std::string FormatStateMessage(const CValidationState& state)
{
    if (state.IsValid()) {
        return "Valid";
    }
    return strprintf("%s%s (%s)",
        state.GetRejectReason(),
        state.GetDebugMessage().empty() ? "" : ", " + state.GetDebugMessage(),
        SettlementErrorName(state.GetError()));
}

std::string SettlementErrorName(SettlementError error)
{
    switch (error) {
    case SettlementError::NONE: return "none";
    case SettlementError::UNAUTHORIZED: return "unauthorized";
    case SettlementError::PAUSED: return "paused";
    case SettlementError::COOLDOWN_ACTIVE: return "cooldown-active";
    case SettlementError::BATCH_NOT_OPEN: return "batch-not-open";
    case SettlementError::BATCH_ALREADY_OPEN: return "batch-already-open";
    case SettlementError::BATCH_NOT_CLOSED: return "batch-not-closed";
    case SettlementError::UNKNOWN_BATCH: return "unknown-batch";
    case SettlementError::INVALID_AMOUNT: return "invalid-amount";
    case SettlementError::INVALID_HANDLE: return "invalid-handle";
    case SettlementError::EMPTY_BATCH: return "empty-batch";
    case SettlementError::BATCH_ALREADY_SETTLED: return "batch-already-settled";
    case SettlementError::UNKNOWN_TOKEN: return "unknown-token";
    case SettlementError::REPLAY_REJECTED: return "replay-rejected";
    case SettlementError::INTEGRITY_MISMATCH: return "integrity-mismatch";
    case SettlementError::INVALID_PROOF: return "invalid-authenticity-proof";
    case SettlementError::ORACLE_FAILURE: return "oracle-failure";
    case SettlementError::NO_ORACLE: return "no-oracle";
    case SettlementError::INVALID_ACTOR: return "invalid-actor";
    case SettlementError::UNKNOWN_PROVIDER: return "unknown-provider";
    } // no default case, so the compiler can warn about missing cases
    return "unknown";
}
