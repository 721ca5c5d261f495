// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * RPC Settlement Tests - Command table over the settlement manager
 *
 * Tests:
 *   1. Full flow through RPC
 *   2. Guard and ledger errors map to settlement error codes
 *   3. Argument validation
 *   4. Registry commands and named arguments
 *   5. Notification journal queries
 *   6. Help text
 *   7. Cleartext covers the whole unsigned 64-bit range
 *   8. Database failures are reported as RPC_DATABASE_ERROR
 */

#include "rpc/protocol.h"
#include "rpc/server.h"
#include "shutdown.h"
#include "state/settlementman.h"
#include "test/test_cipherbatch.h"
#include "utilstrencodings.h"

#include <univalue.h>

#include <limits>

#include <boost/test/unit_test.hpp>

struct RPCSettlementSetup : public SettlementTestingSetup {
    UniValue CallRPC(const CActorID& caller, const std::string& strMethod, const UniValue& params = UniValue(UniValue::VARR))
    {
        JSONRPCRequest request;
        request.strMethod = strMethod;
        request.params = params;
        request.caller = caller;
        return tableRPC.execute(request);
    }

    /** Error code of a failing call, 0 if it succeeded */
    int CallRPCError(const CActorID& caller, const std::string& strMethod,
                     const UniValue& params, std::string* pstrReason = nullptr)
    {
        try {
            CallRPC(caller, strMethod, params);
        } catch (const UniValue& objError) {
            if (pstrReason) {
                const UniValue& reason = find_value(objError, "reason");
                *pstrReason = reason.isStr() ? reason.get_str() : "";
            }
            return find_value(objError, "code").get_int();
        }
        return 0;
    }

    static UniValue Params(const UniValue& a)
    {
        UniValue params(UniValue::VARR);
        params.push_back(a);
        return params;
    }

    static UniValue Params(const UniValue& a, const UniValue& b)
    {
        UniValue params = Params(a);
        params.push_back(b);
        return params;
    }

    static UniValue Params(const UniValue& a, const UniValue& b, const UniValue& c)
    {
        UniValue params = Params(a, b);
        params.push_back(c);
        return params;
    }

    UniValue SubmitRPC(const CActorID& provider, int64_t cost, int64_t budget, const CCiphertextHandle& handle)
    {
        return CallRPC(provider, "submitcontribution", Params(cost, budget, handle.GetId().GetHex()));
    }
};

BOOST_FIXTURE_TEST_SUITE(rpc_settlement_tests, RPCSettlementSetup)

// =============================================================================
// Test 1: Full flow
// =============================================================================
BOOST_AUTO_TEST_CASE(rpc_full_flow)
{
    UniValue r = CallRPC(admin, "openbatch");
    BOOST_CHECK_EQUAL(find_value(r, "batch_id").get_int(), 1);

    const CCiphertextHandle h1 = CMockEvaluator::Encrypt(100, "H1");
    const CCiphertextHandle h2 = CMockEvaluator::Encrypt(30, "H2");

    r = SubmitRPC(provider1, 1000, 200, h1);
    BOOST_CHECK_EQUAL(find_value(r, "index").get_int(), 0);
    BOOST_CHECK_EQUAL(find_value(r, "provider").get_str(), provider1.GetHex());
    BOOST_CHECK_EQUAL(find_value(r, "handle").get_str(), h1.ToString());

    r = SubmitRPC(provider2, 1500, 300, h2);
    BOOST_CHECK_EQUAL(find_value(r, "index").get_int(), 1);

    r = CallRPC(outsider, "listbatches");
    BOOST_CHECK_EQUAL(find_value(r, "open_batch").get_int(), 1);
    BOOST_CHECK_EQUAL(find_value(r, "batches").size(), 1U);

    CallRPC(admin, "closebatch");

    r = CallRPC(outsider, "requestsettlement", Params(1));
    const std::string strToken = find_value(r, "token").get_str();
    const uint256 token = uint256S(strToken);
    BOOST_CHECK(token == oracle.lastToken);

    r = CallRPC(outsider, "getsettlementrequest", Params(strToken));
    BOOST_CHECK_EQUAL(find_value(r, "status").get_str(), "requested");
    BOOST_CHECK_EQUAL(find_value(r, "processed").get_bool(), false);
    BOOST_CHECK_EQUAL(find_value(r, "requester").get_str(), outsider.GetHex());

    const uint64_t nTotal = oracle.Decrypt(token);
    BOOST_CHECK_EQUAL(nTotal, 130U);
    const std::string strProof = HexStr(oracle.MakeProof(token, nTotal));

    r = CallRPC(oracleActor, "submitdecryptionresult", Params(strToken, 130, strProof));
    BOOST_CHECK_EQUAL(find_value(r, "status").get_str(), "finalized");
    BOOST_CHECK_EQUAL(find_value(r, "processed").get_bool(), true);
    const UniValue& batch = find_value(r, "batch");
    BOOST_CHECK_EQUAL(find_value(batch, "settled").get_bool(), true);
    BOOST_CHECK(find_value(batch, "contributions").isNull());

    r = CallRPC(outsider, "getbatch", Params(1));
    const UniValue& settlement = find_value(r, "settlement");
    BOOST_CHECK_EQUAL(find_value(settlement, "token").get_str(), strToken);
    BOOST_CHECK_EQUAL(find_value(settlement, "decrypted_total").get_str(), "130");
    BOOST_CHECK_EQUAL(find_value(settlement, "revenue").get_int64(), 1500);
    BOOST_CHECK_EQUAL(find_value(settlement, "profit").get_int64(), -1000);
    BOOST_CHECK_EQUAL(find_value(r, "total_cost").get_int64(), 2500);
    BOOST_CHECK_EQUAL(find_value(r, "contributions").size(), 2U);

    // Replayed delivery, cleartext given as a string
    std::string strReason;
    BOOST_CHECK_EQUAL(CallRPCError(oracleActor, "submitdecryptionresult", Params(strToken, "130", strProof), &strReason),
                      RPC_SETTLEMENT_REJECTED);
    BOOST_CHECK_EQUAL(strReason, "settlement-replay");
}

// =============================================================================
// Test 2: Error codes
// =============================================================================
BOOST_AUTO_TEST_CASE(rpc_error_codes)
{
    const UniValue noParams(UniValue::VARR);
    std::string strReason;

    BOOST_CHECK_EQUAL(CallRPCError(outsider, "openbatch", noParams, &strReason), RPC_SETTLEMENT_UNAUTHORIZED);
    BOOST_CHECK_EQUAL(strReason, "guard-unauthorized");

    BOOST_CHECK_EQUAL(CallRPCError(admin, "closebatch", noParams, &strReason), RPC_SETTLEMENT_LEDGER_STATE);

    CallRPC(admin, "openbatch");
    BOOST_CHECK_EQUAL(CallRPCError(admin, "openbatch", noParams), RPC_SETTLEMENT_LEDGER_STATE);

    SubmitRPC(provider1, 100, 10, CMockEvaluator::Encrypt(1, "a"));
    BOOST_CHECK_EQUAL(CallRPCError(provider1, "submitcontribution",
                                   Params(100, 10, CMockEvaluator::Encrypt(2, "b").GetId().GetHex()), &strReason),
                      RPC_SETTLEMENT_COOLDOWN);
    BOOST_CHECK_EQUAL(strReason, "guard-cooldown-active");

    // Open batch cannot be settled
    BOOST_CHECK_EQUAL(CallRPCError(outsider, "requestsettlement", Params(1)), RPC_SETTLEMENT_LEDGER_STATE);
    BOOST_CHECK_EQUAL(CallRPCError(outsider, "requestsettlement", Params(7)), RPC_INVALID_ADDRESS_OR_KEY);

    CallRPC(admin, "setpaused", Params(true));
    BOOST_CHECK_EQUAL(CallRPCError(admin, "closebatch", noParams, &strReason), RPC_SETTLEMENT_PAUSED);
    BOOST_CHECK_EQUAL(strReason, "guard-paused");

    // Unknown token
    BOOST_CHECK_EQUAL(CallRPCError(outsider, "getsettlementrequest", Params(uint256S("ab").GetHex())),
                      RPC_INVALID_ADDRESS_OR_KEY);
    BOOST_CHECK_EQUAL(CallRPCError(outsider, "getbatch", Params(2)), RPC_INVALID_ADDRESS_OR_KEY);
    BOOST_CHECK_EQUAL(CallRPCError(outsider, "nosuchmethod", noParams), RPC_METHOD_NOT_FOUND);
}

// =============================================================================
// Test 3: Argument validation
// =============================================================================
BOOST_AUTO_TEST_CASE(rpc_argument_validation)
{
    CallRPC(admin, "openbatch");
    const std::string strHandle = CMockEvaluator::Encrypt(1, "a").GetId().GetHex();

    BOOST_CHECK_EQUAL(CallRPCError(provider1, "submitcontribution", Params(-1, 10, strHandle)), RPC_TYPE_ERROR);
    BOOST_CHECK_EQUAL(CallRPCError(provider1, "submitcontribution", Params("1.5", 10, strHandle)), RPC_TYPE_ERROR);
    BOOST_CHECK_EQUAL(CallRPCError(provider1, "submitcontribution", Params(100, 10, "xyz")), RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallRPCError(provider1, "submitcontribution", Params(100, 10, "abcd")), RPC_INVALID_PARAMETER);
    // The null handle is refused by the ledger
    BOOST_CHECK_EQUAL(CallRPCError(provider1, "submitcontribution", Params(100, 10, uint256().GetHex())),
                      RPC_INVALID_PARAMETER);

    BOOST_CHECK_EQUAL(CallRPCError(outsider, "requestsettlement", Params(0)), RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallRPCError(outsider, "requestsettlement", Params(-3)), RPC_INVALID_PARAMETER);

    const std::string strToken = uint256S("01").GetHex();
    BOOST_CHECK_EQUAL(CallRPCError(oracleActor, "submitdecryptionresult", Params(strToken, -5, "00")),
                      RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallRPCError(oracleActor, "submitdecryptionresult", Params(strToken, "many", "00")),
                      RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallRPCError(oracleActor, "submitdecryptionresult", Params(strToken, true, "00")),
                      RPC_TYPE_ERROR);
    BOOST_CHECK_EQUAL(CallRPCError(oracleActor, "submitdecryptionresult", Params(strToken, 5, "zz")),
                      RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallRPCError(oracleActor, "submitdecryptionresult", Params(strToken, 5, "00")),
                      RPC_INVALID_ADDRESS_OR_KEY);

    BOOST_CHECK_EQUAL(CallRPCError(admin, "authorizeprovider", Params("1234")), RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallRPCError(admin, "setpaused", Params("yes")), RPC_TYPE_ERROR);
    BOOST_CHECK_EQUAL(CallRPCError(admin, "setcooldown", Params("60")), RPC_TYPE_ERROR);
    BOOST_CHECK_EQUAL(CallRPCError(outsider, "getnotifications", Params(-1)), RPC_INVALID_PARAMETER);

    // Wrong arity shows the help text as a misc error
    BOOST_CHECK_EQUAL(CallRPCError(admin, "openbatch", Params(1)), RPC_MISC_ERROR);
}

// =============================================================================
// Test 4: Registry
// =============================================================================
BOOST_AUTO_TEST_CASE(rpc_registry)
{
    UniValue r = CallRPC(outsider, "getregistry");
    BOOST_CHECK_EQUAL(find_value(r, "admin").get_str(), admin.GetHex());
    BOOST_CHECK_EQUAL(find_value(r, "providers").size(), 2U);
    BOOST_CHECK_EQUAL(find_value(r, "oracle").get_str(), oracleActor.GetHex());
    BOOST_CHECK_EQUAL(find_value(r, "paused").get_bool(), false);

    const CActorID provider3 = TestActor(6);
    r = CallRPC(admin, "authorizeprovider", Params(provider3.GetHex()));
    BOOST_CHECK_EQUAL(find_value(r, "providers").size(), 3U);
    r = CallRPC(admin, "revokeprovider", Params(provider1.GetHex()));
    BOOST_CHECK_EQUAL(find_value(r, "providers").size(), 2U);

    r = CallRPC(admin, "setcooldown", Params(5));
    BOOST_CHECK_EQUAL(find_value(r, "cooldown").get_int64(), 5);

    r = CallRPC(admin, "setpaused", Params(true));
    BOOST_CHECK_EQUAL(find_value(r, "paused").get_bool(), true);

    // Named arguments
    UniValue named(UniValue::VOBJ);
    named.pushKV("paused", false);
    r = CallRPC(admin, "setpaused", named);
    BOOST_CHECK_EQUAL(find_value(r, "paused").get_bool(), false);

    BOOST_CHECK_EQUAL(CallRPCError(outsider, "setdecryptionoracle", Params(outsider.GetHex())),
                      RPC_SETTLEMENT_UNAUTHORIZED);

    r = CallRPC(admin, "transferadmin", Params(outsider.GetHex()));
    BOOST_CHECK_EQUAL(find_value(r, "admin").get_str(), outsider.GetHex());
    BOOST_CHECK_EQUAL(CallRPCError(admin, "setcooldown", Params(10)), RPC_SETTLEMENT_UNAUTHORIZED);

    CallRPC(outsider, "openbatch");
    UniValue getbatchNamed(UniValue::VOBJ);
    getbatchNamed.pushKV("batch_id", 1);
    getbatchNamed.pushKV("verbose", false);
    r = CallRPC(provider2, "getbatch", getbatchNamed);
    BOOST_CHECK_EQUAL(find_value(r, "status").get_str(), "open");
    BOOST_CHECK(find_value(r, "contributions").isNull());
}

// =============================================================================
// Test 5: Notifications
// =============================================================================
BOOST_AUTO_TEST_CASE(rpc_notifications)
{
    CallRPC(admin, "openbatch");

    UniValue r = CallRPC(outsider, "getnotifications");
    BOOST_REQUIRE_EQUAL(r.size(), 4U);
    BOOST_CHECK_EQUAL(find_value(r[0], "sequence").get_int(), 1);
    BOOST_CHECK_EQUAL(find_value(r[0], "type").get_str(), "provider_authorized");
    BOOST_CHECK_EQUAL(find_value(r[0], "actor").get_str(), provider1.GetHex());
    BOOST_CHECK_EQUAL(find_value(r[2], "type").get_str(), "oracle_changed");
    BOOST_CHECK_EQUAL(find_value(r[3], "type").get_str(), "batch_opened");
    BOOST_CHECK_EQUAL(find_value(r[3], "batch_id").get_int(), 1);
    BOOST_CHECK_EQUAL(find_value(r[3], "time").get_int64(), nMockTime);

    r = CallRPC(outsider, "getnotifications", Params(2, 1));
    BOOST_REQUIRE_EQUAL(r.size(), 1U);
    BOOST_CHECK_EQUAL(find_value(r[0], "sequence").get_int(), 2);

    r = CallRPC(outsider, "getnotifications", Params(50));
    BOOST_CHECK(r.empty());
}

// =============================================================================
// Test 6: Help
// =============================================================================
BOOST_AUTO_TEST_CASE(rpc_help)
{
    for (const std::string& strCommand : tableRPC.listCommands()) {
        if (strCommand == "help") continue;
        JSONRPCRequest request;
        request.strMethod = strCommand;
        request.params = UniValue(UniValue::VARR);
        request.fHelp = true;
        try {
            tableRPC.execute(request);
            BOOST_ERROR("help of " << strCommand << " did not throw");
        } catch (const UniValue& objError) {
            BOOST_CHECK_EQUAL(find_value(objError, "code").get_int(), RPC_MISC_ERROR);
            const std::string strHelp = find_value(objError, "message").get_str();
            BOOST_CHECK_MESSAGE(strHelp.compare(0, strCommand.size(), strCommand) == 0, strHelp);
            BOOST_CHECK(strHelp.find("Examples:") != std::string::npos);
        }
    }
    // Sixteen settlement commands next to help
    BOOST_CHECK_EQUAL(tableRPC.listCommands().size(), 17U);

    const UniValue r = CallRPC(outsider, "help", Params("requestsettlement"));
    BOOST_CHECK(r.get_str().find("decryption oracle") != std::string::npos);
}

// =============================================================================
// Test 7: Cleartext range
// =============================================================================
BOOST_AUTO_TEST_CASE(rpc_cleartext_uint64_range)
{
    CallRPC(admin, "openbatch");
    SubmitRPC(provider1, 100, 10, CMockEvaluator::Encrypt(1, "a"));
    CallRPC(admin, "closebatch");
    const std::string strToken = find_value(CallRPC(outsider, "requestsettlement", Params(1)), "token").get_str();
    const uint256 token = uint256S(strToken);

    const uint64_t nMax = std::numeric_limits<uint64_t>::max();
    const std::string strProof = HexStr(oracle.MakeProof(token, nMax));

    // One past the maximum and negative values are refused before the manager sees them
    BOOST_CHECK_EQUAL(CallRPCError(oracleActor, "submitdecryptionresult",
                                   Params(strToken, "18446744073709551616", strProof)),
                      RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallRPCError(oracleActor, "submitdecryptionresult", Params(strToken, "-1", strProof)),
                      RPC_INVALID_PARAMETER);

    // Above INT64_MAX
    UniValue r = CallRPC(oracleActor, "submitdecryptionresult", Params(strToken, "18446744073709551615", strProof));
    BOOST_CHECK_EQUAL(find_value(r, "status").get_str(), "finalized");

    r = CallRPC(outsider, "getbatch", Params(1));
    BOOST_CHECK_EQUAL(find_value(find_value(r, "settlement"), "decrypted_total").get_str(), "18446744073709551615");

    Batch batch;
    BOOST_REQUIRE(g_settlementman->GetBatch(1, batch));
    BOOST_CHECK_EQUAL(batch.nDecryptedTotal, nMax);
}

// =============================================================================
// Test 8: Database failure
// =============================================================================
BOOST_AUTO_TEST_CASE(rpc_database_failure)
{
    g_settlementdb->SetCommitFailureForTesting(true);
    BOOST_CHECK_EQUAL(CallRPCError(admin, "openbatch", UniValue(UniValue::VARR)), RPC_DATABASE_ERROR);
    BOOST_CHECK(ShutdownRequested());
    g_settlementdb->SetCommitFailureForTesting(false);

    // The manager stays stopped, queries still answer
    BOOST_CHECK_EQUAL(CallRPCError(admin, "openbatch", UniValue(UniValue::VARR)), RPC_DATABASE_ERROR);
    BOOST_CHECK_EQUAL(find_value(CallRPC(outsider, "listbatches"), "open_batch").get_int(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
