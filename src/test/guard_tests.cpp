// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Guard Tests - Role, pause and cooldown checks
 *
 * Tests:
 *   1. Role resolution for every policy
 *   2. Pause blocks everything except registry administration
 *   3. Cooldown window boundaries
 *   4. Check order (role before pause before cooldown)
 *   5. ApplyGuard only stamps the slot of the policy
 */

#include "state/guard.h"

#include "consensus/validation.h"
#include "test/test_cipherbatch.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(guard_tests, BasicTestingSetup)

static ActorRegistry MakeRegistry()
{
    ActorRegistry registry;
    registry.admin = TestActor(1);
    registry.setProviders.insert(TestActor(2));
    registry.oracle = TestActor(4);
    registry.nCooldownSeconds = 60;
    return registry;
}

static bool Passes(const ActorRegistry& registry, const CActorID& caller, const GuardPolicy& policy,
                   const CooldownEntry& entry = CooldownEntry(), int64_t nNow = TEST_START_TIME)
{
    CValidationState state;
    return CheckGuard(registry, entry, caller, policy, nNow, state);
}

// =============================================================================
// Test 1: Roles
// =============================================================================
BOOST_AUTO_TEST_CASE(guard_roles)
{
    const ActorRegistry registry = MakeRegistry();
    const CActorID admin = TestActor(1);
    const CActorID provider = TestActor(2);
    const CActorID oracle = TestActor(4);
    const CActorID outsider = TestActor(9);

    BOOST_CHECK(Passes(registry, admin, GUARD_ADMIN_REGISTRY));
    BOOST_CHECK(Passes(registry, admin, GUARD_ADMIN_LEDGER));
    BOOST_CHECK(!Passes(registry, provider, GUARD_ADMIN_LEDGER));
    BOOST_CHECK(!Passes(registry, outsider, GUARD_ADMIN_REGISTRY));

    BOOST_CHECK(Passes(registry, provider, GUARD_SUBMISSION));
    BOOST_CHECK(!Passes(registry, admin, GUARD_SUBMISSION));
    BOOST_CHECK(!Passes(registry, oracle, GUARD_SUBMISSION));

    BOOST_CHECK(Passes(registry, oracle, GUARD_ORACLE_CALLBACK));
    BOOST_CHECK(!Passes(registry, admin, GUARD_ORACLE_CALLBACK));

    BOOST_CHECK(Passes(registry, outsider, GUARD_SETTLEMENT_REQUEST));
    BOOST_CHECK(Passes(registry, provider, GUARD_SETTLEMENT_REQUEST));

    // The null identity holds no role, not even "anyone"
    BOOST_CHECK(!Passes(registry, CActorID(), GUARD_SETTLEMENT_REQUEST));
    BOOST_CHECK(!Passes(registry, CActorID(), GUARD_ADMIN_REGISTRY));

    // An unconfigured oracle matches nobody
    ActorRegistry noOracle = registry;
    noOracle.oracle.SetNull();
    BOOST_CHECK(!Passes(noOracle, CActorID(), GUARD_ORACLE_CALLBACK));
    BOOST_CHECK(!Passes(noOracle, oracle, GUARD_ORACLE_CALLBACK));

    CValidationState state;
    BOOST_CHECK(!CheckGuard(registry, CooldownEntry(), outsider, GUARD_ADMIN_LEDGER, TEST_START_TIME, state));
    BOOST_CHECK(state.GetError() == SettlementError::UNAUTHORIZED);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "guard-unauthorized");
}

// =============================================================================
// Test 2: Pause
// =============================================================================
BOOST_AUTO_TEST_CASE(guard_pause)
{
    ActorRegistry registry = MakeRegistry();
    registry.fPaused = true;

    BOOST_CHECK(Passes(registry, TestActor(1), GUARD_ADMIN_REGISTRY));
    BOOST_CHECK(!Passes(registry, TestActor(1), GUARD_ADMIN_LEDGER));
    BOOST_CHECK(!Passes(registry, TestActor(2), GUARD_SUBMISSION));
    BOOST_CHECK(!Passes(registry, TestActor(9), GUARD_SETTLEMENT_REQUEST));
    BOOST_CHECK(!Passes(registry, TestActor(4), GUARD_ORACLE_CALLBACK));

    CValidationState state;
    BOOST_CHECK(!CheckGuard(registry, CooldownEntry(), TestActor(2), GUARD_SUBMISSION, TEST_START_TIME, state));
    BOOST_CHECK(state.GetError() == SettlementError::PAUSED);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "guard-paused");
}

// =============================================================================
// Test 3: Cooldown window
// =============================================================================
BOOST_AUTO_TEST_CASE(guard_cooldown_window)
{
    // Never performed
    BOOST_CHECK(!IsCooldownActive(0, 60, TEST_START_TIME));

    const int64_t nLast = TEST_START_TIME;
    BOOST_CHECK(IsCooldownActive(nLast, 60, nLast));
    BOOST_CHECK(IsCooldownActive(nLast, 60, nLast + 59));
    BOOST_CHECK(!IsCooldownActive(nLast, 60, nLast + 60));
    BOOST_CHECK(!IsCooldownActive(nLast, 60, nLast + 3600));

    // Zero cooldown never blocks
    BOOST_CHECK(!IsCooldownActive(nLast, 0, nLast));

    const ActorRegistry registry = MakeRegistry();
    const CActorID provider = TestActor(2);

    CooldownEntry entry;
    entry.nLastSubmission = nLast;

    CValidationState state;
    BOOST_CHECK(!CheckGuard(registry, entry, provider, GUARD_SUBMISSION, nLast + 30, state));
    BOOST_CHECK(state.GetError() == SettlementError::COOLDOWN_ACTIVE);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "guard-cooldown-active");
    BOOST_CHECK_EQUAL(state.GetDebugMessage(), "retry in 30 seconds");

    BOOST_CHECK(Passes(registry, provider, GUARD_SUBMISSION, entry, nLast + 60));

    // The submission slot does not affect settlement requests
    BOOST_CHECK(Passes(registry, provider, GUARD_SETTLEMENT_REQUEST, entry, nLast + 1));

    // Policies without cooldown ignore both slots
    entry.nLastSettlementRequest = nLast;
    BOOST_CHECK(Passes(registry, TestActor(1), GUARD_ADMIN_LEDGER, entry, nLast));
    BOOST_CHECK(!Passes(registry, provider, GUARD_SETTLEMENT_REQUEST, entry, nLast + 1));
}

// =============================================================================
// Test 4: Check order
// =============================================================================
BOOST_AUTO_TEST_CASE(guard_check_order)
{
    ActorRegistry registry = MakeRegistry();
    registry.fPaused = true;

    CooldownEntry entry;
    entry.nLastSubmission = TEST_START_TIME;

    // Unauthorized and paused and cooling down: the role wins
    CValidationState state1;
    BOOST_CHECK(!CheckGuard(registry, entry, TestActor(9), GUARD_SUBMISSION, TEST_START_TIME, state1));
    BOOST_CHECK(state1.GetError() == SettlementError::UNAUTHORIZED);

    // Authorized, paused and cooling down: the pause wins
    CValidationState state2;
    BOOST_CHECK(!CheckGuard(registry, entry, TestActor(2), GUARD_SUBMISSION, TEST_START_TIME, state2));
    BOOST_CHECK(state2.GetError() == SettlementError::PAUSED);

    registry.fPaused = false;
    CValidationState state3;
    BOOST_CHECK(!CheckGuard(registry, entry, TestActor(2), GUARD_SUBMISSION, TEST_START_TIME, state3));
    BOOST_CHECK(state3.GetError() == SettlementError::COOLDOWN_ACTIVE);
}

// =============================================================================
// Test 5: ApplyGuard
// =============================================================================
BOOST_AUTO_TEST_CASE(guard_apply)
{
    CooldownEntry entry;
    BOOST_CHECK(entry.IsNull());

    BOOST_CHECK(!ApplyGuard(entry, GUARD_ADMIN_LEDGER, TEST_START_TIME));
    BOOST_CHECK(!ApplyGuard(entry, GUARD_ORACLE_CALLBACK, TEST_START_TIME));
    BOOST_CHECK(entry.IsNull());

    BOOST_CHECK(ApplyGuard(entry, GUARD_SUBMISSION, TEST_START_TIME));
    BOOST_CHECK_EQUAL(entry.nLastSubmission, TEST_START_TIME);
    BOOST_CHECK_EQUAL(entry.nLastSettlementRequest, 0);

    BOOST_CHECK(ApplyGuard(entry, GUARD_SETTLEMENT_REQUEST, TEST_START_TIME + 5));
    BOOST_CHECK_EQUAL(entry.nLastSubmission, TEST_START_TIME);
    BOOST_CHECK_EQUAL(entry.nLastSettlementRequest, TEST_START_TIME + 5);

    BOOST_CHECK_EQUAL(GuardRoleToString(GUARD_SUBMISSION.role), "provider");
    BOOST_CHECK_EQUAL(GuardRoleToString(GUARD_SETTLEMENT_REQUEST.role), "anyone");
}

BOOST_AUTO_TEST_SUITE_END()
