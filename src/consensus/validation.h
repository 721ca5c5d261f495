// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_CONSENSUS_VALIDATION_H
#define CIPHERBATCH_CONSENSUS_VALIDATION_H

#include <stdint.h>
#include <string>

/**
 * Rejection kinds of the settlement rules.
 *
 * Every kind is local, synchronous and non-retriable by the same call: the
 * caller has to satisfy the violated precondition and issue a new call.
 */
enum class SettlementError : uint8_t {
    NONE = 0,
    // Guard
    UNAUTHORIZED,
    PAUSED,
    COOLDOWN_ACTIVE,
    // Ledger
    BATCH_NOT_OPEN,
    BATCH_ALREADY_OPEN,
    BATCH_NOT_CLOSED,
    UNKNOWN_BATCH,
    INVALID_AMOUNT,
    INVALID_HANDLE,
    // Settlement
    EMPTY_BATCH,
    BATCH_ALREADY_SETTLED,
    UNKNOWN_TOKEN,
    REPLAY_REJECTED,
    INTEGRITY_MISMATCH,
    INVALID_PROOF,
    ORACLE_FAILURE,
    NO_ORACLE,
    // Registry
    INVALID_ACTOR,
    UNKNOWN_PROVIDER,
};

/** Capture information about the outcome of a settlement operation */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //! everything ok
        MODE_INVALID, //! rule violation (the operation was rejected)
        MODE_ERROR,   //! run-time error
    } mode;
    SettlementError m_error;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), m_error(SettlementError::NONE) {}

    bool Invalid(SettlementError error,
                 const std::string& strRejectReasonIn,
                 const std::string& strDebugMessageIn = "")
    {
        m_error = error;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        if (mode == MODE_ERROR)
            return false;
        mode = MODE_INVALID;
        return false;
    }
    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }
    SettlementError GetError() const { return m_error; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

#endif // CIPHERBATCH_CONSENSUS_VALIDATION_H
