// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Settlement Tests - CSettlementManager end to end
 *
 * Tests:
 *   1. Full flow: open, contribute, close, request, finalize
 *   2. Replay protection on the oracle callback
 *   3. Integrity re-hash at callback time
 *   4. Settlement trigger rejections
 *   5. Oracle failures and authenticity proofs
 *   6. Guard composition (roles, pause, cooldowns)
 *   7. Registry administration
 *   8. Competing requests for one batch
 */

#include "state/settlementman.h"

#include "consensus/validation.h"
#include "init.h"
#include "state/aggregation.h"
#include "test/test_cipherbatch.h"
#include "util/system.h"

#include <boost/test/unit_test.hpp>

struct SettlementFlowSetup : public SettlementTestingSetup {
    uint32_t OpenBatch()
    {
        CValidationState state;
        uint32_t nBatchId = 0;
        BOOST_REQUIRE_MESSAGE(g_settlementman->OpenBatch(admin, nBatchId, state), state.GetRejectReason());
        return nBatchId;
    }

    void CloseBatch()
    {
        CValidationState state;
        uint32_t nBatchId = 0;
        BOOST_REQUIRE_MESSAGE(g_settlementman->CloseBatch(admin, nBatchId, state), state.GetRejectReason());
    }

    /** Open a batch, submit each handle (cost 100, budget 10) and close it */
    uint32_t BuildClosedBatch(const std::vector<CCiphertextHandle>& vHandles)
    {
        const uint32_t nBatchId = OpenBatch();
        for (size_t i = 0; i < vHandles.size(); i++) {
            AdvanceTime(DEFAULT_COOLDOWN_SECONDS);
            CValidationState state;
            BOOST_REQUIRE_MESSAGE(Submit(i % 2 ? provider2 : provider1, 100, 10, vHandles[i], state),
                                  state.GetRejectReason());
        }
        CloseBatch();
        return nBatchId;
    }

    uint256 Request(uint32_t nBatchId, const CActorID& requester)
    {
        CValidationState state;
        uint256 token;
        BOOST_REQUIRE_MESSAGE(g_settlementman->RequestSettlement(requester, nBatchId, token, state),
                              state.GetRejectReason());
        return token;
    }

    SettlementRequest GetRequest(const uint256& token)
    {
        SettlementRequest request;
        BOOST_REQUIRE(g_settlementman->GetSettlementRequest(token, request));
        return request;
    }

    Batch GetBatch(uint32_t nBatchId)
    {
        Batch batch;
        BOOST_REQUIRE(g_settlementman->GetBatch(nBatchId, batch));
        return batch;
    }
};

BOOST_FIXTURE_TEST_SUITE(settlement_tests, SettlementFlowSetup)

// =============================================================================
// Test 1: Full flow
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_full_flow)
{
    BOOST_CHECK_EQUAL(OpenBatch(), 1U);
    BOOST_CHECK_EQUAL(g_settlementman->GetOpenBatchId(), 1U);

    const CCiphertextHandle h1 = CMockEvaluator::Encrypt(100, "H1");
    const CCiphertextHandle h2 = CMockEvaluator::Encrypt(30, "H2");

    CValidationState state;
    Contribution contrib;
    BOOST_REQUIRE(g_settlementman->SubmitContribution(provider1, 1000, 200, h1, contrib, state));
    BOOST_CHECK_EQUAL(contrib.nBatchId, 1U);
    BOOST_CHECK_EQUAL(contrib.nIndex, 0U);
    BOOST_CHECK(contrib.provider == provider1);

    AdvanceTime(DEFAULT_COOLDOWN_SECONDS);
    BOOST_REQUIRE(g_settlementman->SubmitContribution(provider1, 1500, 300, h2, contrib, state));
    BOOST_CHECK_EQUAL(contrib.nIndex, 1U);

    Batch batch = GetBatch(1);
    BOOST_CHECK_EQUAL(batch.totalCost, 2500);
    BOOST_CHECK_EQUAL(batch.totalBudget, 500);
    BOOST_CHECK(batch.aggregate == CMockEvaluator().Add(h1, h2));

    CloseBatch();
    BOOST_CHECK_EQUAL(g_settlementman->GetOpenBatchId(), 0U);

    const uint256 token = Request(1, outsider);
    BOOST_CHECK(token == oracle.lastToken);

    // The call returns before any result: nothing is settled yet
    SettlementRequest request = GetRequest(token);
    BOOST_CHECK(request.status == RequestStatus::REQUESTED);
    BOOST_CHECK(!request.processed);
    BOOST_CHECK_EQUAL(request.nBatchId, 1U);
    BOOST_CHECK(request.requester == outsider);
    BOOST_CHECK(request.aggregate == batch.aggregate);
    BOOST_CHECK(request.stateHash == ComputeStateHash(GetDefaultSystemIdentity(), {h1, h2}));
    BOOST_CHECK(!GetBatch(1).fSettled);

    BOOST_CHECK_EQUAL(oracle.Decrypt(token), 130U);
    AdvanceTime(5);
    BOOST_REQUIRE(DeliverResult(token, state));

    request = GetRequest(token);
    BOOST_CHECK(request.processed);
    BOOST_CHECK(request.status == RequestStatus::FINALIZED);

    batch = GetBatch(1);
    BOOST_CHECK(batch.fSettled);
    BOOST_CHECK(batch.settlementToken == token);
    BOOST_CHECK_EQUAL(batch.nDecryptedTotal, 130U);
    BOOST_CHECK_EQUAL(batch.revenue, 1500);
    BOOST_CHECK_EQUAL(batch.profit, -1000);

    // A new batch follows the settled one
    BOOST_CHECK_EQUAL(OpenBatch(), 2U);
    BOOST_CHECK_EQUAL(g_settlementman->ListBatches().size(), 2U);
    BOOST_CHECK_EQUAL(g_settlementman->ListSettlementRequests(1).size(), 1U);
    BOOST_CHECK(g_settlementman->ListSettlementRequests(2).empty());
}

// =============================================================================
// Test 2: Replay
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_replay_rejected)
{
    const uint32_t nBatchId = BuildClosedBatch({CMockEvaluator::Encrypt(5, "a"), CMockEvaluator::Encrypt(6, "b")});
    const uint256 token = Request(nBatchId, outsider);

    CValidationState state;
    BOOST_REQUIRE(DeliverResult(token, state));
    const Batch settled = GetBatch(nBatchId);

    // Same token again, even with a valid proof of a different cleartext
    CValidationState stateReplay;
    BOOST_CHECK(!DeliverResult(token, stateReplay));
    BOOST_CHECK(stateReplay.GetError() == SettlementError::REPLAY_REJECTED);
    BOOST_CHECK_EQUAL(stateReplay.GetRejectReason(), "settlement-replay");

    CValidationState stateOther;
    BOOST_CHECK(!g_settlementman->OnDecryptionResult(oracleActor, token, 999, oracle.MakeProof(token, 999), stateOther));
    BOOST_CHECK(stateOther.GetError() == SettlementError::REPLAY_REJECTED);

    const Batch after = GetBatch(nBatchId);
    BOOST_CHECK_EQUAL(after.nDecryptedTotal, settled.nDecryptedTotal);
    BOOST_CHECK_EQUAL(after.revenue, settled.revenue);
    BOOST_CHECK(GetRequest(token).status == RequestStatus::FINALIZED);

    // A settled batch cannot be requested again
    CValidationState stateRequest;
    uint256 tokenAgain;
    BOOST_CHECK(!g_settlementman->RequestSettlement(provider1, nBatchId, tokenAgain, stateRequest));
    BOOST_CHECK(stateRequest.GetError() == SettlementError::BATCH_ALREADY_SETTLED);
}

BOOST_AUTO_TEST_CASE(settlement_unknown_token)
{
    CValidationState state;
    const uint256 token = uint256S("0badc0de");
    BOOST_CHECK(!g_settlementman->OnDecryptionResult(oracleActor, token, 1, oracle.MakeProof(token, 1), state));
    BOOST_CHECK(state.GetError() == SettlementError::UNKNOWN_TOKEN);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "settlement-unknown-token");
}

// =============================================================================
// Test 3: Integrity re-hash
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_integrity_mismatch)
{
    const uint32_t nBatchId = BuildClosedBatch({CMockEvaluator::Encrypt(1000, "H1"), CMockEvaluator::Encrypt(1500, "H2")});
    const uint256 token = Request(nBatchId, outsider);
    const uint64_t nNotifications = g_settlementman->GetNotifications(1, 1000).size();

    // The coprocessor now derives a different aggregate for the same handles
    evaluator.nEpoch = 7;

    CValidationState state;
    BOOST_CHECK(!DeliverResult(token, state));
    BOOST_CHECK(state.GetError() == SettlementError::INTEGRITY_MISMATCH);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "settlement-aggregate-mismatch");

    // The request is consumed and the rejection recorded, the batch untouched
    const SettlementRequest request = GetRequest(token);
    BOOST_CHECK(request.processed);
    BOOST_CHECK(request.status == RequestStatus::REJECTED);
    BOOST_CHECK(!GetBatch(nBatchId).fSettled);

    const std::vector<SettlementNotification> vNotifications = g_settlementman->GetNotifications(1, 1000);
    BOOST_REQUIRE_EQUAL(vNotifications.size(), nNotifications + 1);
    BOOST_CHECK(vNotifications.back().type == NotificationType::SETTLEMENT_REJECTED);
    BOOST_CHECK_EQUAL(vNotifications.back().strReason, "settlement-aggregate-mismatch");

    // A second delivery is a replay
    evaluator.nEpoch = 1;
    CValidationState stateReplay;
    BOOST_CHECK(!DeliverResult(token, stateReplay));
    BOOST_CHECK(stateReplay.GetError() == SettlementError::REPLAY_REJECTED);

    // The batch can still be settled through a fresh request
    AdvanceTime(DEFAULT_COOLDOWN_SECONDS);
    const uint256 tokenRetry = Request(nBatchId, outsider);
    CValidationState stateRetry;
    BOOST_CHECK(DeliverResult(tokenRetry, stateRetry));
    BOOST_CHECK(GetBatch(nBatchId).fSettled);
}

BOOST_AUTO_TEST_CASE(settlement_request_checks_running_aggregate)
{
    const uint32_t nBatchId = BuildClosedBatch({CMockEvaluator::Encrypt(1, "a"), CMockEvaluator::Encrypt(2, "b")});

    evaluator.nEpoch = 9;
    CValidationState state;
    uint256 token;
    BOOST_CHECK(!g_settlementman->RequestSettlement(outsider, nBatchId, token, state));
    BOOST_CHECK(state.GetError() == SettlementError::INTEGRITY_MISMATCH);
    BOOST_CHECK_EQUAL(oracle.GetRequestCount(), 0U);

    // Rejected requests do not consume the cooldown
    evaluator.nEpoch = 1;
    BOOST_CHECK(g_settlementman->RequestSettlement(outsider, nBatchId, token, state));
}

// =============================================================================
// Test 4: Trigger rejections
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_trigger_rejections)
{
    CValidationState stateUnknown;
    uint256 token;
    BOOST_CHECK(!g_settlementman->RequestSettlement(outsider, 1, token, stateUnknown));
    BOOST_CHECK(stateUnknown.GetError() == SettlementError::UNKNOWN_BATCH);

    // Empty batch
    OpenBatch();
    CValidationState stateOpen;
    BOOST_CHECK(!g_settlementman->RequestSettlement(outsider, 1, token, stateOpen));
    BOOST_CHECK(stateOpen.GetError() == SettlementError::BATCH_NOT_CLOSED);

    CloseBatch();
    CValidationState stateEmpty;
    BOOST_CHECK(!g_settlementman->RequestSettlement(outsider, 1, token, stateEmpty));
    BOOST_CHECK(stateEmpty.GetError() == SettlementError::EMPTY_BATCH);
    BOOST_CHECK_EQUAL(stateEmpty.GetRejectReason(), "settlement-empty-batch");
    BOOST_CHECK_EQUAL(oracle.GetRequestCount(), 0U);

    // Submissions outside an open batch
    CValidationState stateSubmit;
    BOOST_CHECK(!Submit(provider1, 10, 1, CMockEvaluator::Encrypt(1, "x"), stateSubmit));
    BOOST_CHECK(stateSubmit.GetError() == SettlementError::BATCH_NOT_OPEN);

    // The failed submission did not start a cooldown
    OpenBatch();
    CValidationState stateRetry;
    BOOST_CHECK(Submit(provider1, 10, 1, CMockEvaluator::Encrypt(1, "x"), stateRetry));

    CValidationState stateHandle;
    AdvanceTime(DEFAULT_COOLDOWN_SECONDS);
    BOOST_CHECK(!Submit(provider1, 10, 1, CCiphertextHandle(), stateHandle));
    BOOST_CHECK(stateHandle.GetError() == SettlementError::INVALID_HANDLE);

    CValidationState stateAmount;
    BOOST_CHECK(!Submit(provider1, -5, 1, CMockEvaluator::Encrypt(1, "y"), stateAmount));
    BOOST_CHECK(stateAmount.GetError() == SettlementError::INVALID_AMOUNT);

    CValidationState stateDoubleOpen;
    uint32_t nBatchId;
    BOOST_CHECK(!g_settlementman->OpenBatch(admin, nBatchId, stateDoubleOpen));
    BOOST_CHECK(stateDoubleOpen.GetError() == SettlementError::BATCH_ALREADY_OPEN);
}

// =============================================================================
// Test 5: Oracle failures and proofs
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_oracle_failures)
{
    const uint32_t nBatchId = BuildClosedBatch({CMockEvaluator::Encrypt(3, "a")});
    uint256 token;

    oracle.fThrow = true;
    CValidationState stateThrow;
    BOOST_CHECK(!g_settlementman->RequestSettlement(outsider, nBatchId, token, stateThrow));
    BOOST_CHECK(stateThrow.GetError() == SettlementError::ORACLE_FAILURE);
    BOOST_CHECK_EQUAL(stateThrow.GetRejectReason(), "settlement-oracle-unavailable");
    oracle.fThrow = false;

    oracle.fRefuse = true;
    CValidationState stateNull;
    BOOST_CHECK(!g_settlementman->RequestSettlement(outsider, nBatchId, token, stateNull));
    BOOST_CHECK_EQUAL(stateNull.GetRejectReason(), "settlement-oracle-null-token");
    oracle.fRefuse = false;

    const uint256 first = Request(nBatchId, outsider);

    oracle.fRepeatToken = true;
    CValidationState stateDuplicate;
    BOOST_CHECK(!g_settlementman->RequestSettlement(provider1, nBatchId, token, stateDuplicate));
    BOOST_CHECK_EQUAL(stateDuplicate.GetRejectReason(), "settlement-oracle-duplicate-token");
    oracle.fRepeatToken = false;
    BOOST_CHECK(GetRequest(first).status == RequestStatus::REQUESTED);

    // Forged proof: rejected, but the request stays open for the genuine result
    CValidationState stateProof;
    BOOST_CHECK(!g_settlementman->OnDecryptionResult(oracleActor, first, 3, oracle.MakeProof(first, 4), stateProof));
    BOOST_CHECK(stateProof.GetError() == SettlementError::INVALID_PROOF);
    BOOST_CHECK(!GetRequest(first).processed);

    // Only the oracle identity may deliver
    CValidationState stateCaller;
    BOOST_CHECK(!g_settlementman->OnDecryptionResult(outsider, first, 3, oracle.MakeProof(first, 3), stateCaller));
    BOOST_CHECK(stateCaller.GetError() == SettlementError::UNAUTHORIZED);
    BOOST_CHECK(!GetRequest(first).processed);

    CValidationState state;
    BOOST_CHECK(DeliverResult(first, state));
    BOOST_CHECK_EQUAL(GetBatch(nBatchId).nDecryptedTotal, 3U);
}

BOOST_AUTO_TEST_CASE(settlement_coprocessor_failure)
{
    OpenBatch();
    CValidationState state;
    BOOST_REQUIRE(Submit(provider1, 100, 10, CMockEvaluator::Encrypt(1, "a"), state));

    evaluator.fThrow = true;
    CValidationState stateThrow;
    BOOST_CHECK(!Submit(provider2, 100, 10, CMockEvaluator::Encrypt(2, "b"), stateThrow));
    BOOST_CHECK(stateThrow.GetError() == SettlementError::ORACLE_FAILURE);
    BOOST_CHECK_EQUAL(stateThrow.GetRejectReason(), "aggregate-coprocessor-failure");
    evaluator.fThrow = false;

    evaluator.fReturnNull = true;
    CValidationState stateNull;
    BOOST_CHECK(!Submit(provider2, 100, 10, CMockEvaluator::Encrypt(2, "b"), stateNull));
    BOOST_CHECK_EQUAL(stateNull.GetRejectReason(), "aggregate-null-result");
    evaluator.fReturnNull = false;

    // Nothing was recorded by the failed submissions
    const Batch batch = GetBatch(1);
    BOOST_CHECK_EQUAL(batch.GetContributionCount(), 1U);
    BOOST_CHECK_EQUAL(batch.totalCost, 100);

    BOOST_CHECK(Submit(provider2, 100, 10, CMockEvaluator::Encrypt(2, "b"), state));
    BOOST_CHECK_EQUAL(CMockEvaluator::Decrypt(GetBatch(1).aggregate), 3U);
}

BOOST_AUTO_TEST_CASE(settlement_without_oracle)
{
    std::string strError;
    ShutdownSettlement();
    BOOST_REQUIRE(InitSettlement(evaluator, nullptr, strError));

    const uint32_t nBatchId = BuildClosedBatch({CMockEvaluator::Encrypt(3, "a")});
    CValidationState state;
    uint256 token;
    BOOST_CHECK(!g_settlementman->RequestSettlement(outsider, nBatchId, token, state));
    BOOST_CHECK(state.GetError() == SettlementError::NO_ORACLE);
}

// =============================================================================
// Test 6: Guard composition
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_guard_roles)
{
    uint32_t nBatchId;
    CValidationState stateOpen;
    BOOST_CHECK(!g_settlementman->OpenBatch(provider1, nBatchId, stateOpen));
    BOOST_CHECK(stateOpen.GetError() == SettlementError::UNAUTHORIZED);

    OpenBatch();
    CValidationState stateSubmit;
    BOOST_CHECK(!Submit(outsider, 1, 1, CMockEvaluator::Encrypt(1, "a"), stateSubmit));
    BOOST_CHECK(stateSubmit.GetError() == SettlementError::UNAUTHORIZED);
    BOOST_CHECK(!Submit(admin, 1, 1, CMockEvaluator::Encrypt(1, "a"), stateSubmit));

    CValidationState stateClose;
    BOOST_CHECK(!g_settlementman->CloseBatch(oracleActor, nBatchId, stateClose));
    BOOST_CHECK(stateClose.GetError() == SettlementError::UNAUTHORIZED);
    BOOST_CHECK_EQUAL(g_settlementman->GetOpenBatchId(), 1U);
}

BOOST_AUTO_TEST_CASE(settlement_guard_cooldown)
{
    OpenBatch();

    CValidationState state;
    BOOST_REQUIRE(Submit(provider1, 1, 1, CMockEvaluator::Encrypt(1, "a"), state));

    AdvanceTime(DEFAULT_COOLDOWN_SECONDS - 1);
    CValidationState stateCooldown;
    BOOST_CHECK(!Submit(provider1, 1, 1, CMockEvaluator::Encrypt(1, "b"), stateCooldown));
    BOOST_CHECK(stateCooldown.GetError() == SettlementError::COOLDOWN_ACTIVE);
    BOOST_CHECK_EQUAL(stateCooldown.GetDebugMessage(), "retry in 1 seconds");

    // Cooldowns are per actor
    BOOST_CHECK(Submit(provider2, 1, 1, CMockEvaluator::Encrypt(1, "c"), state));

    AdvanceTime(1);
    BOOST_CHECK(Submit(provider1, 1, 1, CMockEvaluator::Encrypt(1, "b"), state));
    BOOST_CHECK_EQUAL(g_settlementman->GetCooldown(provider1).nLastSubmission, nMockTime);
    CloseBatch();

    // Settlement requests have their own slot
    const uint256 token = Request(1, provider1);
    BOOST_CHECK_EQUAL(g_settlementman->GetCooldown(provider1).nLastSettlementRequest, nMockTime);

    BOOST_CHECK(DeliverResult(token, state));
    OpenBatch();
    BOOST_CHECK(Submit(provider2, 1, 1, CMockEvaluator::Encrypt(2, "d"), stateCooldown) == false);
    AdvanceTime(DEFAULT_COOLDOWN_SECONDS);
    BOOST_CHECK(Submit(provider2, 1, 1, CMockEvaluator::Encrypt(2, "d"), state));
    CloseBatch();

    CValidationState stateRequest;
    uint256 tokenRet;
    BOOST_CHECK(g_settlementman->RequestSettlement(provider1, 2, tokenRet, stateRequest));

    // A zero cooldown disables the window
    CValidationState stateAdmin;
    BOOST_REQUIRE(g_settlementman->SetCooldown(admin, 0, stateAdmin));
    OpenBatch();
    BOOST_CHECK(Submit(provider2, 1, 1, CMockEvaluator::Encrypt(3, "e"), state));
    BOOST_CHECK(Submit(provider2, 1, 1, CMockEvaluator::Encrypt(4, "f"), state));
}

BOOST_AUTO_TEST_CASE(settlement_guard_pause)
{
    const uint32_t nBatchId = BuildClosedBatch({CMockEvaluator::Encrypt(3, "a")});
    const uint256 token = Request(nBatchId, outsider);

    CValidationState state;
    BOOST_REQUIRE(g_settlementman->SetPaused(admin, true, state));
    BOOST_CHECK(g_settlementman->GetRegistry().fPaused);

    uint32_t nBatchRet;
    CValidationState stateOpen;
    BOOST_CHECK(!g_settlementman->OpenBatch(admin, nBatchRet, stateOpen));
    BOOST_CHECK(stateOpen.GetError() == SettlementError::PAUSED);

    CValidationState stateDeliver;
    BOOST_CHECK(!DeliverResult(token, stateDeliver));
    BOOST_CHECK(stateDeliver.GetError() == SettlementError::PAUSED);
    BOOST_CHECK(!GetRequest(token).processed);

    // Registry administration stays available
    BOOST_CHECK(g_settlementman->AuthorizeProvider(admin, TestActor(42), state));
    BOOST_CHECK(g_settlementman->SetCooldown(admin, 10, state));

    BOOST_REQUIRE(g_settlementman->SetPaused(admin, false, state));
    BOOST_CHECK(DeliverResult(token, state));
    BOOST_CHECK(GetBatch(nBatchId).fSettled);
}

// =============================================================================
// Test 7: Registry
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_registry)
{
    const CActorID newProvider = TestActor(10);
    const CActorID newAdmin = TestActor(11);

    CValidationState stateOutsider;
    BOOST_CHECK(!g_settlementman->AuthorizeProvider(outsider, newProvider, stateOutsider));
    BOOST_CHECK(stateOutsider.GetError() == SettlementError::UNAUTHORIZED);

    CValidationState stateNull;
    BOOST_CHECK(!g_settlementman->AuthorizeProvider(admin, CActorID(), stateNull));
    BOOST_CHECK(stateNull.GetError() == SettlementError::INVALID_ACTOR);

    CValidationState state;
    BOOST_CHECK(g_settlementman->AuthorizeProvider(admin, newProvider, state));
    BOOST_CHECK(g_settlementman->GetRegistry().IsProvider(newProvider));
    const size_t nNotifications = g_settlementman->GetNotifications(1, 1000).size();
    // Authorizing twice is a no-op
    BOOST_CHECK(g_settlementman->AuthorizeProvider(admin, newProvider, state));
    BOOST_CHECK_EQUAL(g_settlementman->GetNotifications(1, 1000).size(), nNotifications);

    OpenBatch();
    BOOST_CHECK(Submit(newProvider, 1, 1, CMockEvaluator::Encrypt(1, "a"), state));

    BOOST_CHECK(g_settlementman->RevokeProvider(admin, newProvider, state));
    AdvanceTime(DEFAULT_COOLDOWN_SECONDS);
    CValidationState stateRevoked;
    BOOST_CHECK(!Submit(newProvider, 1, 1, CMockEvaluator::Encrypt(1, "b"), stateRevoked));
    BOOST_CHECK(stateRevoked.GetError() == SettlementError::UNAUTHORIZED);

    CValidationState stateUnknown;
    BOOST_CHECK(!g_settlementman->RevokeProvider(admin, newProvider, stateUnknown));
    BOOST_CHECK(stateUnknown.GetError() == SettlementError::UNKNOWN_PROVIDER);

    CValidationState stateCooldown;
    BOOST_CHECK(!g_settlementman->SetCooldown(admin, -1, stateCooldown));
    BOOST_CHECK(stateCooldown.GetError() == SettlementError::INVALID_AMOUNT);
    BOOST_CHECK(!g_settlementman->SetCooldown(admin, MAX_COOLDOWN_SECONDS + 1, stateCooldown));
    BOOST_CHECK(g_settlementman->SetCooldown(admin, MAX_COOLDOWN_SECONDS, state));
    BOOST_CHECK_EQUAL(g_settlementman->GetRegistry().nCooldownSeconds, MAX_COOLDOWN_SECONDS);

    const CActorID newOracle = TestActor(12);
    BOOST_CHECK(g_settlementman->SetDecryptionOracle(admin, newOracle, state));
    BOOST_CHECK(g_settlementman->GetRegistry().oracle == newOracle);

    // Administrator hand-over
    BOOST_CHECK(g_settlementman->TransferAdmin(admin, newAdmin, state));
    CValidationState stateOldAdmin;
    BOOST_CHECK(!g_settlementman->SetPaused(admin, true, stateOldAdmin));
    BOOST_CHECK(stateOldAdmin.GetError() == SettlementError::UNAUTHORIZED);
    BOOST_CHECK(g_settlementman->SetPaused(newAdmin, true, state));

    CValidationState stateTransferNull;
    BOOST_CHECK(!g_settlementman->TransferAdmin(newAdmin, CActorID(), stateTransferNull));
    BOOST_CHECK(stateTransferNull.GetError() == SettlementError::INVALID_ACTOR);
    BOOST_CHECK(g_settlementman->GetRegistry().admin == newAdmin);
}

// =============================================================================
// Test 8: Competing requests
// =============================================================================
BOOST_AUTO_TEST_CASE(settlement_competing_requests)
{
    const uint32_t nBatchId = BuildClosedBatch({CMockEvaluator::Encrypt(8, "a"), CMockEvaluator::Encrypt(9, "b")});

    const uint256 tokenA = Request(nBatchId, outsider);
    const uint256 tokenB = Request(nBatchId, provider1);
    BOOST_CHECK(tokenA != tokenB);
    BOOST_CHECK_EQUAL(g_settlementman->ListSettlementRequests(nBatchId).size(), 2U);

    CValidationState state;
    BOOST_REQUIRE(DeliverResult(tokenB, state));
    BOOST_CHECK(GetBatch(nBatchId).settlementToken == tokenB);

    // The late result is refused and its request closed
    CValidationState stateLate;
    BOOST_CHECK(!DeliverResult(tokenA, stateLate));
    BOOST_CHECK(stateLate.GetError() == SettlementError::BATCH_ALREADY_SETTLED);
    BOOST_CHECK(GetRequest(tokenA).status == RequestStatus::REJECTED);
    BOOST_CHECK(GetBatch(nBatchId).settlementToken == tokenB);
    BOOST_CHECK_EQUAL(GetBatch(nBatchId).nDecryptedTotal, 17U);
}

BOOST_AUTO_TEST_CASE(settlement_revenue_multiplier)
{
    gArgs.ForceSetArg("-revenuemultiplier", "5");
    std::string strError;
    BOOST_REQUIRE_MESSAGE(Reload(strError), strError);
    BOOST_CHECK_EQUAL(g_settlementman->GetParams().nRevenueMultiplier, 5);

    // Cost 100 and budget 10 per contribution
    const uint32_t nBatchId = BuildClosedBatch({CMockEvaluator::Encrypt(1, "a"), CMockEvaluator::Encrypt(1, "b")});
    CValidationState state;
    BOOST_REQUIRE(DeliverResult(Request(nBatchId, outsider), state));

    const Batch batch = GetBatch(nBatchId);
    BOOST_CHECK_EQUAL(batch.revenue, 100);
    BOOST_CHECK_EQUAL(batch.profit, -100);
}

BOOST_AUTO_TEST_SUITE_END()
