// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_STATE_GUARD_H
#define CIPHERBATCH_STATE_GUARD_H

/**
 * Access & Rate-Limit Guard
 *
 * One policy check composed into every mutating entry point:
 *   1. role of the caller
 *   2. pause flag (administrative registry operations are exempt)
 *   3. per-actor cooldown for submissions and settlement requests
 * The check never mutates; ApplyGuard() records the timestamp once the
 * wrapped operation succeeded.
 */

#include "state/settlement.h"

#include <stdint.h>

class CValidationState;

enum class GuardRole : uint8_t {
    ADMIN,
    PROVIDER,
    ORACLE,
    ANYONE,
};

/** Which cooldown slot an entry point consumes */
enum class GuardCooldown : uint8_t {
    NONE,
    SUBMISSION,
    SETTLEMENT,
};

struct GuardPolicy
{
    GuardRole role;
    GuardCooldown cooldown;
    bool fPauseExempt;
    const char* strName;
};

// Entry point policies
static const GuardPolicy GUARD_ADMIN_REGISTRY = {GuardRole::ADMIN, GuardCooldown::NONE, true, "registry"};
static const GuardPolicy GUARD_ADMIN_LEDGER = {GuardRole::ADMIN, GuardCooldown::NONE, false, "ledger"};
static const GuardPolicy GUARD_SUBMISSION = {GuardRole::PROVIDER, GuardCooldown::SUBMISSION, false, "submission"};
static const GuardPolicy GUARD_SETTLEMENT_REQUEST = {GuardRole::ANYONE, GuardCooldown::SETTLEMENT, false, "settlement-request"};
static const GuardPolicy GUARD_ORACLE_CALLBACK = {GuardRole::ORACLE, GuardCooldown::NONE, false, "oracle-callback"};

std::string GuardRoleToString(GuardRole role);

/** True while nNow < nLast + nCooldown; a zero nLast never blocks */
bool IsCooldownActive(int64_t nLast, int64_t nCooldownSeconds, int64_t nNow);

/**
 * CheckGuard - Authorize a call against the registry and cooldown ledger
 *
 * @param registry Current actor registry
 * @param entry    Cooldown entry of the caller (default-constructed if none)
 * @param caller   Identity of the caller
 * @param policy   Policy of the entry point
 * @param nNow     Current time
 * @param state    Receives Unauthorized, PausedState or CooldownActive
 */
bool CheckGuard(const ActorRegistry& registry,
                const CooldownEntry& entry,
                const CActorID& caller,
                const GuardPolicy& policy,
                int64_t nNow,
                CValidationState& state);

/**
 * ApplyGuard - Record the cooldown timestamp of a successful call
 *
 * @return true if entry changed and has to be persisted
 */
bool ApplyGuard(CooldownEntry& entry, const GuardPolicy& policy, int64_t nNow);

#endif // CIPHERBATCH_STATE_GUARD_H
