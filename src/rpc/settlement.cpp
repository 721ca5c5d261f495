// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Settlement RPCs
 *
 * Mutating commands act as request.caller, which the transport sets after
 * authenticating the client. Rejections are reported as JSON-RPC errors
 * carrying the reject reason (see JSONRPCStateError()).
 *
 * Amounts are integral base units.
 */

#include "rpc/server.h"

#include "consensus/validation.h"
#include "rpc/register.h"
#include "state/notifications.h"
#include "state/settlement.h"
#include "state/settlementman.h"
#include "util/strprintf.h"
#include "utilstrencodings.h"

#include <limits>
#include <stdint.h>

static CSettlementManager& EnsureSettlementManager()
{
    if (!g_settlementman) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Settlement manager not initialized");
    }
    return *g_settlementman;
}

static uint32_t ParseBatchId(const UniValue& v)
{
    int64_t nBatchId = v.get_int64();
    if (nBatchId <= 0 || nBatchId > std::numeric_limits<uint32_t>::max()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Invalid batch id %d", nBatchId));
    }
    return (uint32_t)nBatchId;
}

// =============================================================================
// JSON helpers
// =============================================================================

static UniValue ContributionToJSON(const Contribution& contrib)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("batch_id", (int64_t)contrib.nBatchId);
    obj.pushKV("index", (int64_t)contrib.nIndex);
    obj.pushKV("handle", contrib.handle.ToString());
    obj.pushKV("cost", ValueFromAmount(contrib.cost));
    obj.pushKV("budget", ValueFromAmount(contrib.budget));
    obj.pushKV("provider", contrib.provider.GetHex());
    obj.pushKV("time", contrib.nTime);
    return obj;
}

static UniValue BatchToJSON(const Batch& batch, bool fVerbose)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("batch_id", (int64_t)batch.nId);
    obj.pushKV("status", BatchStatusToString(batch.status));
    obj.pushKV("contribution_count", (int64_t)batch.GetContributionCount());
    obj.pushKV("total_cost", ValueFromAmount(batch.totalCost));
    obj.pushKV("total_budget", ValueFromAmount(batch.totalBudget));
    obj.pushKV("aggregate", batch.aggregate.IsNull() ? "" : batch.aggregate.ToString());
    obj.pushKV("open_time", batch.nOpenTime);
    obj.pushKV("close_time", batch.nCloseTime);
    obj.pushKV("settled", batch.fSettled);
    if (batch.fSettled) {
        UniValue settlement(UniValue::VOBJ);
        settlement.pushKV("token", batch.settlementToken.GetHex());
        settlement.pushKV("decrypted_total", strprintf("%u", batch.nDecryptedTotal));
        settlement.pushKV("revenue", ValueFromAmount(batch.revenue));
        settlement.pushKV("profit", batch.profit);
        obj.pushKV("settlement", settlement);
    }
    if (fVerbose) {
        UniValue contributions(UniValue::VARR);
        for (const Contribution& contrib : batch.vContributions) {
            contributions.push_back(ContributionToJSON(contrib));
        }
        obj.pushKV("contributions", contributions);
    }
    return obj;
}

static UniValue RequestToJSON(const SettlementRequest& request)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("token", request.token.GetHex());
    obj.pushKV("batch_id", (int64_t)request.nBatchId);
    obj.pushKV("state_hash", request.stateHash.GetHex());
    obj.pushKV("aggregate", request.aggregate.ToString());
    obj.pushKV("requester", request.requester.GetHex());
    obj.pushKV("time", request.nTime);
    obj.pushKV("processed", request.processed);
    obj.pushKV("status", RequestStatusToString(request.status));
    return obj;
}

static UniValue RegistryToJSON(const ActorRegistry& registry)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("admin", registry.admin.GetHex());
    UniValue providers(UniValue::VARR);
    for (const CActorID& provider : registry.setProviders) {
        providers.push_back(provider.GetHex());
    }
    obj.pushKV("providers", providers);
    obj.pushKV("oracle", registry.oracle.IsNull() ? "" : registry.oracle.GetHex());
    obj.pushKV("paused", registry.fPaused);
    obj.pushKV("cooldown", registry.nCooldownSeconds);
    return obj;
}

static UniValue NotificationToJSON(const SettlementNotification& notification)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("sequence", (int64_t)notification.nSequence);
    obj.pushKV("time", notification.nTime);
    obj.pushKV("type", NotificationTypeToString(notification.type));
    switch (notification.type) {
    case NotificationType::BATCH_OPENED:
    case NotificationType::BATCH_CLOSED:
        obj.pushKV("batch_id", (int64_t)notification.nBatchId);
        break;
    case NotificationType::CONTRIBUTION_RECORDED:
        obj.pushKV("batch_id", (int64_t)notification.nBatchId);
        obj.pushKV("index", (int64_t)notification.nIndex);
        obj.pushKV("provider", notification.actor.GetHex());
        break;
    case NotificationType::SETTLEMENT_REQUESTED:
        obj.pushKV("batch_id", (int64_t)notification.nBatchId);
        obj.pushKV("token", notification.token.GetHex());
        obj.pushKV("requester", notification.actor.GetHex());
        break;
    case NotificationType::SETTLEMENT_FINALIZED:
        obj.pushKV("batch_id", (int64_t)notification.nBatchId);
        obj.pushKV("token", notification.token.GetHex());
        obj.pushKV("decrypted_total", strprintf("%u", notification.nDecryptedTotal));
        obj.pushKV("revenue", ValueFromAmount(notification.revenue));
        obj.pushKV("profit", notification.profit);
        break;
    case NotificationType::SETTLEMENT_REJECTED:
        obj.pushKV("batch_id", (int64_t)notification.nBatchId);
        obj.pushKV("token", notification.token.GetHex());
        obj.pushKV("reason", notification.strReason);
        break;
    case NotificationType::PAUSE_CHANGED:
        obj.pushKV("paused", notification.nValue != 0);
        break;
    case NotificationType::COOLDOWN_CHANGED:
        obj.pushKV("cooldown", notification.nValue);
        break;
    case NotificationType::PROVIDER_AUTHORIZED:
    case NotificationType::PROVIDER_REVOKED:
    case NotificationType::ADMIN_TRANSFERRED:
    case NotificationType::ORACLE_CHANGED:
        obj.pushKV("actor", notification.actor.GetHex());
        break;
    }
    return obj;
}

// =============================================================================
// Ledger
// =============================================================================

static UniValue openbatch(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "openbatch\n"
            "\nOpen the next contribution batch (administrator only).\n"
            "\nResult:\n"
            "{\n"
            "  \"batch_id\": n    (numeric) Id of the new batch\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("openbatch", "")
            + HelpExampleRpc("openbatch", ""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    uint32_t nBatchId = 0;
    CValidationState state;
    if (!manager.OpenBatch(request.caller, nBatchId, state)) {
        throw JSONRPCStateError(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("batch_id", (int64_t)nBatchId);
    return result;
}

static UniValue closebatch(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "closebatch\n"
            "\nClose the open batch (administrator only). A closed batch accepts no\n"
            "further contributions and can be sent for settlement.\n"
            "\nResult:\n"
            "{\n"
            "  \"batch_id\": n    (numeric) Id of the closed batch\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("closebatch", "")
            + HelpExampleRpc("closebatch", ""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    uint32_t nBatchId = 0;
    CValidationState state;
    if (!manager.CloseBatch(request.caller, nBatchId, state)) {
        throw JSONRPCStateError(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("batch_id", (int64_t)nBatchId);
    return result;
}

static UniValue submitcontribution(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "submitcontribution cost budget \"handle\"\n"
            "\nAppend an encrypted contribution to the open batch (provider only).\n"
            "\nArguments:\n"
            "1. cost          (numeric, required) Plaintext cost in base units\n"
            "2. budget        (numeric, required) Plaintext budget in base units\n"
            "3. \"handle\"      (string, required) Ciphertext handle issued by the coprocessor (hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"batch_id\": n,        (numeric) Batch the contribution was appended to\n"
            "  \"index\": n,           (numeric) Zero-based position in the batch\n"
            "  \"handle\": \"hex\",      (string) Ciphertext handle\n"
            "  \"cost\": n,            (numeric) Plaintext cost\n"
            "  \"budget\": n,          (numeric) Plaintext budget\n"
            "  \"provider\": \"hex\",    (string) Submitting provider\n"
            "  \"time\": n             (numeric) Submission time\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("submitcontribution", "1000 200 \"a1b2...\"")
            + HelpExampleRpc("submitcontribution", "1000, 200, \"a1b2...\""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    const CAmount cost = AmountFromValue(request.params[0]);
    const CAmount budget = AmountFromValue(request.params[1]);
    const CCiphertextHandle handle(ParseHashV(request.params[2], "handle"));

    Contribution contrib;
    CValidationState state;
    if (!manager.SubmitContribution(request.caller, cost, budget, handle, contrib, state)) {
        throw JSONRPCStateError(state);
    }
    return ContributionToJSON(contrib);
}

// =============================================================================
// Settlement protocol
// =============================================================================

static UniValue requestsettlement(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "requestsettlement batch_id\n"
            "\nSend the aggregate of a closed batch to the decryption oracle.\n"
            "Returns immediately; the oracle answers later with submitdecryptionresult.\n"
            "\nArguments:\n"
            "1. batch_id      (numeric, required) Closed, non-empty, unsettled batch\n"
            "\nResult:\n"
            "{\n"
            "  \"token\": \"hex\"    (string) Request token assigned by the oracle\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("requestsettlement", "1")
            + HelpExampleRpc("requestsettlement", "1"));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    const uint32_t nBatchId = ParseBatchId(request.params[0]);

    uint256 token;
    CValidationState state;
    if (!manager.RequestSettlement(request.caller, nBatchId, token, state)) {
        throw JSONRPCStateError(state);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("token", token.GetHex());
    return result;
}

static UniValue submitdecryptionresult(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 3) {
        throw std::runtime_error(
            "submitdecryptionresult \"token\" cleartext \"proof\"\n"
            "\nDeliver the decryption result of a settlement request (oracle only).\n"
            "At most one delivery per token is accepted.\n"
            "\nArguments:\n"
            "1. \"token\"       (string, required) Request token\n"
            "2. cleartext     (numeric or string, required) Decrypted total, 0 to 2^64-1\n"
            "3. \"proof\"       (string, required) Authenticity proof (hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"token\": \"hex\",        (string) Request token\n"
            "  \"batch_id\": n,         (numeric) Settled batch\n"
            "  \"status\": \"finalized\", (string) Request status\n"
            "  ...\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("submitdecryptionresult", "\"9f3c...\" 130 \"0a1b...\"")
            + HelpExampleRpc("submitdecryptionresult", "\"9f3c...\", 130, \"0a1b...\""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    const uint256 token = ParseHashV(request.params[0], "token");

    if (!request.params[1].isNum() && !request.params[1].isStr()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "cleartext is not a number or string");
    }
    uint64_t nCleartext = 0;
    if (!ParseUInt64(request.params[1].getValStr(), &nCleartext)) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "cleartext must be an integer between 0 and 18446744073709551615");
    }

    const std::vector<unsigned char> proof = ParseHexV(request.params[2], "proof");

    CValidationState state;
    if (!manager.OnDecryptionResult(request.caller, token, nCleartext, proof, state)) {
        throw JSONRPCStateError(state);
    }

    SettlementRequest settlementRequest;
    if (!manager.GetSettlementRequest(token, settlementRequest)) {
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Settlement request vanished");
    }
    UniValue result = RequestToJSON(settlementRequest);

    Batch batch;
    if (manager.GetBatch(settlementRequest.nBatchId, batch)) {
        result.pushKV("batch", BatchToJSON(batch, false));
    }
    return result;
}

// =============================================================================
// Registry
// =============================================================================

static UniValue authorizeprovider(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "authorizeprovider \"actor\"\n"
            "\nAllow an actor to submit contributions (administrator only).\n"
            "\nArguments:\n"
            "1. \"actor\"       (string, required) Actor identity (40 hex characters)\n"
            "\nResult: the registry (see getregistry)\n"
            "\nExamples:\n"
            + HelpExampleCli("authorizeprovider", "\"1f2e...\"")
            + HelpExampleRpc("authorizeprovider", "\"1f2e...\""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    CValidationState state;
    if (!manager.AuthorizeProvider(request.caller, ParseActorV(request.params[0], "actor"), state)) {
        throw JSONRPCStateError(state);
    }
    return RegistryToJSON(manager.GetRegistry());
}

static UniValue revokeprovider(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "revokeprovider \"actor\"\n"
            "\nWithdraw the provider role of an actor (administrator only).\n"
            "\nArguments:\n"
            "1. \"actor\"       (string, required) Actor identity (40 hex characters)\n"
            "\nResult: the registry (see getregistry)\n"
            "\nExamples:\n"
            + HelpExampleCli("revokeprovider", "\"1f2e...\"")
            + HelpExampleRpc("revokeprovider", "\"1f2e...\""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    CValidationState state;
    if (!manager.RevokeProvider(request.caller, ParseActorV(request.params[0], "actor"), state)) {
        throw JSONRPCStateError(state);
    }
    return RegistryToJSON(manager.GetRegistry());
}

static UniValue setpaused(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "setpaused paused\n"
            "\nPause or resume all non-administrative operations (administrator only).\n"
            "\nArguments:\n"
            "1. paused        (boolean, required) true to pause, false to resume\n"
            "\nResult: the registry (see getregistry)\n"
            "\nExamples:\n"
            + HelpExampleCli("setpaused", "true")
            + HelpExampleRpc("setpaused", "true"));
    }

    RPCTypeCheck(request.params, {UniValue::VBOOL});
    CSettlementManager& manager = EnsureSettlementManager();

    CValidationState state;
    if (!manager.SetPaused(request.caller, request.params[0].get_bool(), state)) {
        throw JSONRPCStateError(state);
    }
    return RegistryToJSON(manager.GetRegistry());
}

static UniValue setcooldown(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "setcooldown seconds\n"
            "\nSet the per-actor cooldown between two submissions or two settlement\n"
            "requests (administrator only).\n"
            "\nArguments:\n"
            "1. seconds       (numeric, required) Cooldown in seconds\n"
            "\nResult: the registry (see getregistry)\n"
            "\nExamples:\n"
            + HelpExampleCli("setcooldown", "60")
            + HelpExampleRpc("setcooldown", "60"));
    }

    RPCTypeCheck(request.params, {UniValue::VNUM});
    CSettlementManager& manager = EnsureSettlementManager();

    CValidationState state;
    if (!manager.SetCooldown(request.caller, request.params[0].get_int64(), state)) {
        throw JSONRPCStateError(state);
    }
    return RegistryToJSON(manager.GetRegistry());
}

static UniValue transferadmin(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "transferadmin \"actor\"\n"
            "\nHand the administrator role to another actor (administrator only).\n"
            "\nArguments:\n"
            "1. \"actor\"       (string, required) New administrator (40 hex characters)\n"
            "\nResult: the registry (see getregistry)\n"
            "\nExamples:\n"
            + HelpExampleCli("transferadmin", "\"1f2e...\"")
            + HelpExampleRpc("transferadmin", "\"1f2e...\""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    CValidationState state;
    if (!manager.TransferAdmin(request.caller, ParseActorV(request.params[0], "actor"), state)) {
        throw JSONRPCStateError(state);
    }
    return RegistryToJSON(manager.GetRegistry());
}

static UniValue setdecryptionoracle(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "setdecryptionoracle \"actor\"\n"
            "\nSet the only actor allowed to deliver decryption results (administrator only).\n"
            "\nArguments:\n"
            "1. \"actor\"       (string, required) Oracle identity (40 hex characters)\n"
            "\nResult: the registry (see getregistry)\n"
            "\nExamples:\n"
            + HelpExampleCli("setdecryptionoracle", "\"1f2e...\"")
            + HelpExampleRpc("setdecryptionoracle", "\"1f2e...\""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    CValidationState state;
    if (!manager.SetDecryptionOracle(request.caller, ParseActorV(request.params[0], "actor"), state)) {
        throw JSONRPCStateError(state);
    }
    return RegistryToJSON(manager.GetRegistry());
}

// =============================================================================
// Queries
// =============================================================================

static UniValue getbatch(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 1 || request.params.size() > 2) {
        throw std::runtime_error(
            "getbatch batch_id ( verbose )\n"
            "\nReturns a batch with its totals and settlement result.\n"
            "\nArguments:\n"
            "1. batch_id      (numeric, required) Batch id\n"
            "2. verbose       (boolean, optional, default=true) Include the contributions\n"
            "\nResult:\n"
            "{\n"
            "  \"batch_id\": n,\n"
            "  \"status\": \"open|closed\",\n"
            "  \"contribution_count\": n,\n"
            "  \"total_cost\": n,\n"
            "  \"total_budget\": n,\n"
            "  \"aggregate\": \"hex\",\n"
            "  \"open_time\": n,\n"
            "  \"close_time\": n,\n"
            "  \"settled\": true|false,\n"
            "  \"settlement\": {               (only when settled)\n"
            "    \"token\": \"hex\",\n"
            "    \"decrypted_total\": \"n\",\n"
            "    \"revenue\": n,\n"
            "    \"profit\": n\n"
            "  },\n"
            "  \"contributions\": [ ... ]      (verbose only)\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getbatch", "1")
            + HelpExampleRpc("getbatch", "1, false"));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    const uint32_t nBatchId = ParseBatchId(request.params[0]);
    bool fVerbose = true;
    if (request.params.size() > 1 && !request.params[1].isNull()) {
        fVerbose = request.params[1].get_bool();
    }

    Batch batch;
    if (!manager.GetBatch(nBatchId, batch)) {
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, strprintf("Batch %u not found", nBatchId));
    }
    return BatchToJSON(batch, fVerbose);
}

static UniValue listbatches(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "listbatches\n"
            "\nReturns every batch without its contributions.\n"
            "\nResult:\n"
            "{\n"
            "  \"open_batch\": n,      (numeric) Id of the open batch, 0 if none\n"
            "  \"batches\": [ ... ]    (array) See getbatch\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("listbatches", "")
            + HelpExampleRpc("listbatches", ""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    UniValue batches(UniValue::VARR);
    for (const Batch& batch : manager.ListBatches()) {
        batches.push_back(BatchToJSON(batch, false));
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("open_batch", (int64_t)manager.GetOpenBatchId());
    result.pushKV("batches", batches);
    return result;
}

static UniValue getsettlementrequest(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getsettlementrequest \"token\"\n"
            "\nReturns a settlement request.\n"
            "\nArguments:\n"
            "1. \"token\"       (string, required) Request token\n"
            "\nResult:\n"
            "{\n"
            "  \"token\": \"hex\",\n"
            "  \"batch_id\": n,\n"
            "  \"state_hash\": \"hex\",     (string) Commitment taken at request time\n"
            "  \"aggregate\": \"hex\",      (string) Handle sent for decryption\n"
            "  \"requester\": \"hex\",\n"
            "  \"time\": n,\n"
            "  \"processed\": true|false,\n"
            "  \"status\": \"requested|finalized|rejected\"\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getsettlementrequest", "\"9f3c...\"")
            + HelpExampleRpc("getsettlementrequest", "\"9f3c...\""));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    const uint256 token = ParseHashV(request.params[0], "token");
    SettlementRequest settlementRequest;
    if (!manager.GetSettlementRequest(token, settlementRequest)) {
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "Settlement request not found");
    }
    return RequestToJSON(settlementRequest);
}

static UniValue getregistry(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getregistry\n"
            "\nReturns the actor registry.\n"
            "\nResult:\n"
            "{\n"
            "  \"admin\": \"hex\",\n"
            "  \"providers\": [\"hex\", ...],\n"
            "  \"oracle\": \"hex\",          (string) Empty if not configured\n"
            "  \"paused\": true|false,\n"
            "  \"cooldown\": n             (numeric) Seconds\n"
            "}\n"
            "\nExamples:\n"
            + HelpExampleCli("getregistry", "")
            + HelpExampleRpc("getregistry", ""));
    }

    return RegistryToJSON(EnsureSettlementManager().GetRegistry());
}

static UniValue getnotifications(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 2) {
        throw std::runtime_error(
            "getnotifications ( from_sequence count )\n"
            "\nReturns entries of the notification journal.\n"
            "\nArguments:\n"
            "1. from_sequence (numeric, optional, default=1) First sequence number\n"
            "2. count         (numeric, optional, default=100) Maximum number of entries\n"
            "\nResult:\n"
            "[\n"
            "  {\n"
            "    \"sequence\": n,\n"
            "    \"time\": n,\n"
            "    \"type\": \"batch_opened|...\",\n"
            "    ...                        Type specific fields\n"
            "  }, ...\n"
            "]\n"
            "\nExamples:\n"
            + HelpExampleCli("getnotifications", "1 10")
            + HelpExampleRpc("getnotifications", "1, 10"));
    }

    CSettlementManager& manager = EnsureSettlementManager();

    int64_t nFrom = 1;
    if (request.params.size() > 0 && !request.params[0].isNull()) {
        nFrom = request.params[0].get_int64();
        if (nFrom < 0) {
            throw JSONRPCError(RPC_INVALID_PARAMETER, "Negative from_sequence");
        }
    }
    int64_t nCount = 100;
    if (request.params.size() > 1 && !request.params[1].isNull()) {
        nCount = request.params[1].get_int64();
        if (nCount < 0) {
            throw JSONRPCError(RPC_INVALID_PARAMETER, "Negative count");
        }
    }

    UniValue result(UniValue::VARR);
    for (const SettlementNotification& notification : manager.GetNotifications((uint64_t)nFrom, (size_t)nCount)) {
        result.push_back(NotificationToJSON(notification));
    }
    return result;
}

// clang-format off
static const CRPCCommand commands[] =
{ //  category       name                      actor (function)          okSafe argNames
  //  -------------- ------------------------- ------------------------- ------ --------
    { "ledger",      "openbatch",              &openbatch,               false, {} },
    { "ledger",      "closebatch",             &closebatch,              false, {} },
    { "ledger",      "submitcontribution",     &submitcontribution,      false, {"cost", "budget", "handle"} },
    { "settlement",  "requestsettlement",      &requestsettlement,       false, {"batch_id"} },
    { "settlement",  "submitdecryptionresult", &submitdecryptionresult,  false, {"token", "cleartext", "proof"} },
    { "registry",    "authorizeprovider",      &authorizeprovider,       false, {"actor"} },
    { "registry",    "revokeprovider",         &revokeprovider,          false, {"actor"} },
    { "registry",    "setpaused",              &setpaused,               false, {"paused"} },
    { "registry",    "setcooldown",            &setcooldown,             false, {"seconds"} },
    { "registry",    "transferadmin",          &transferadmin,           false, {"actor"} },
    { "registry",    "setdecryptionoracle",    &setdecryptionoracle,     false, {"actor"} },
    { "ledger",      "getbatch",               &getbatch,                true,  {"batch_id", "verbose"} },
    { "ledger",      "listbatches",            &listbatches,             true,  {} },
    { "settlement",  "getsettlementrequest",   &getsettlementrequest,    true,  {"token"} },
    { "registry",    "getregistry",            &getregistry,             true,  {} },
    { "settlement",  "getnotifications",       &getnotifications,        true,  {"from_sequence", "count"} },
};
// clang-format on

void RegisterSettlementRPCCommands(CRPCTable& t)
{
    for (const auto& c : commands) {
        t.appendCommand(c.name, &c);
    }
}
