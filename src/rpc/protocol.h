// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_RPC_PROTOCOL_H
#define CIPHERBATCH_RPC_PROTOCOL_H

#include "consensus/validation.h"

#include <string>

#include <univalue.h>

//! JSON-RPC error codes
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST  = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS   = -32602,
    RPC_INTERNAL_ERROR   = -32603,
    RPC_PARSE_ERROR      = -32700,

    //! General application defined errors
    RPC_MISC_ERROR                  = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR                  = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_ADDRESS_OR_KEY      = -5,  //!< Unknown batch, token or provider
    RPC_INVALID_PARAMETER           = -8,  //!< Invalid, missing or duplicate parameter
    RPC_DATABASE_ERROR              = -20, //!< Database error
    RPC_DESERIALIZATION_ERROR       = -22, //!< Error parsing or validating structure in raw format

    //! Settlement rejections
    RPC_SETTLEMENT_UNAUTHORIZED     = -40, //!< Caller lacks the required role
    RPC_SETTLEMENT_PAUSED           = -41, //!< Operations are paused
    RPC_SETTLEMENT_COOLDOWN         = -42, //!< Caller is in cooldown
    RPC_SETTLEMENT_LEDGER_STATE     = -43, //!< Batch is not in the required state
    RPC_SETTLEMENT_REJECTED         = -44, //!< Settlement request or callback rejected
    RPC_SETTLEMENT_INTEGRITY        = -45, //!< Batch content no longer matches its commitment
    RPC_SETTLEMENT_ORACLE_ERROR     = -46, //!< Oracle or coprocessor missing or failing
};

UniValue JSONRPCRequestObj(const std::string& strMethod, const UniValue& params, const UniValue& id);
UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id);
std::string JSONRPCReply(const UniValue& result, const UniValue& error, const UniValue& id);
UniValue JSONRPCError(int code, const std::string& message);

/** RPC error code reporting a settlement rejection */
RPCErrorCode RPCErrorFromSettlementError(SettlementError error);

/** Error object for a rejected settlement operation */
UniValue JSONRPCStateError(const CValidationState& state);

#endif // CIPHERBATCH_RPC_PROTOCOL_H
