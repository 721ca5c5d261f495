// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/protocol.h"

#include "util/validation.h"

/**
 * JSON-RPC 1.0 request/reply objects with the JSON-RPC 2.0 layout of the
 * 'error' member ({"code": n, "message": "..."}).
 */

UniValue JSONRPCRequestObj(const std::string& strMethod, const UniValue& params, const UniValue& id)
{
    UniValue request(UniValue::VOBJ);
    request.pushKV("method", strMethod);
    request.pushKV("params", params);
    request.pushKV("id", id);
    return request;
}

UniValue JSONRPCReplyObj(const UniValue& result, const UniValue& error, const UniValue& id)
{
    UniValue reply(UniValue::VOBJ);
    if (!error.isNull())
        reply.pushKV("result", NullUniValue);
    else
        reply.pushKV("result", result);
    reply.pushKV("error", error);
    reply.pushKV("id", id);
    return reply;
}

std::string JSONRPCReply(const UniValue& result, const UniValue& error, const UniValue& id)
{
    UniValue reply = JSONRPCReplyObj(result, error, id);
    return reply.write() + "\n";
}

UniValue JSONRPCError(int code, const std::string& message)
{
    UniValue error(UniValue::VOBJ);
    error.pushKV("code", code);
    error.pushKV("message", message);
    return error;
}

RPCErrorCode RPCErrorFromSettlementError(SettlementError error)
{
    switch (error) {
    case SettlementError::UNAUTHORIZED:
        return RPC_SETTLEMENT_UNAUTHORIZED;
    case SettlementError::PAUSED:
        return RPC_SETTLEMENT_PAUSED;
    case SettlementError::COOLDOWN_ACTIVE:
        return RPC_SETTLEMENT_COOLDOWN;
    case SettlementError::BATCH_NOT_OPEN:
    case SettlementError::BATCH_ALREADY_OPEN:
    case SettlementError::BATCH_NOT_CLOSED:
    case SettlementError::EMPTY_BATCH:
    case SettlementError::BATCH_ALREADY_SETTLED:
        return RPC_SETTLEMENT_LEDGER_STATE;
    case SettlementError::UNKNOWN_BATCH:
    case SettlementError::UNKNOWN_TOKEN:
    case SettlementError::UNKNOWN_PROVIDER:
        return RPC_INVALID_ADDRESS_OR_KEY;
    case SettlementError::INVALID_AMOUNT:
    case SettlementError::INVALID_HANDLE:
    case SettlementError::INVALID_ACTOR:
        return RPC_INVALID_PARAMETER;
    case SettlementError::REPLAY_REJECTED:
    case SettlementError::INVALID_PROOF:
        return RPC_SETTLEMENT_REJECTED;
    case SettlementError::INTEGRITY_MISMATCH:
        return RPC_SETTLEMENT_INTEGRITY;
    case SettlementError::ORACLE_FAILURE:
    case SettlementError::NO_ORACLE:
        return RPC_SETTLEMENT_ORACLE_ERROR;
    case SettlementError::NONE:
        return RPC_MISC_ERROR;
    } // no default case, so the compiler can warn about missing cases
    return RPC_MISC_ERROR;
}

UniValue JSONRPCStateError(const CValidationState& state)
{
    UniValue error = JSONRPCError(RPCErrorFromSettlementError(state.GetError()), FormatStateMessage(state));
    error.pushKV("reason", state.GetRejectReason());
    error.pushKV("kind", SettlementErrorName(state.GetError()));
    return error;
}
