// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/guard.h"

#include "consensus/validation.h"
#include "logging.h"

std::string GuardRoleToString(GuardRole role)
{
    switch (role) {
    case GuardRole::ADMIN: return "admin";
    case GuardRole::PROVIDER: return "provider";
    case GuardRole::ORACLE: return "oracle";
    case GuardRole::ANYONE: return "anyone";
    }
    return "unknown";
}

bool IsCooldownActive(int64_t nLast, int64_t nCooldownSeconds, int64_t nNow)
{
    if (nLast == 0) return false;
    return nNow < nLast + nCooldownSeconds;
}

static bool HasRole(const ActorRegistry& registry, const CActorID& caller, GuardRole role)
{
    switch (role) {
    case GuardRole::ADMIN: return registry.IsAdmin(caller);
    case GuardRole::PROVIDER: return registry.IsProvider(caller);
    case GuardRole::ORACLE: return registry.IsOracle(caller);
    case GuardRole::ANYONE: return !caller.IsNull();
    }
    return false;
}

bool CheckGuard(const ActorRegistry& registry,
                const CooldownEntry& entry,
                const CActorID& caller,
                const GuardPolicy& policy,
                int64_t nNow,
                CValidationState& state)
{
    // 1. Role
    if (!HasRole(registry, caller, policy.role)) {
        LogPrint(BCLog::GUARD, "CheckGuard: %s denied to %s (requires %s)\n",
                 policy.strName, caller.ToString(), GuardRoleToString(policy.role));
        return state.Invalid(SettlementError::UNAUTHORIZED, "guard-unauthorized",
                             strprintf("%s requires role %s", policy.strName, GuardRoleToString(policy.role)));
    }

    // 2. Pause
    if (registry.fPaused && !policy.fPauseExempt) {
        return state.Invalid(SettlementError::PAUSED, "guard-paused",
                             strprintf("%s is disabled while paused", policy.strName));
    }

    // 3. Cooldown
    int64_t nLast = 0;
    switch (policy.cooldown) {
    case GuardCooldown::NONE:
        return true;
    case GuardCooldown::SUBMISSION:
        nLast = entry.nLastSubmission;
        break;
    case GuardCooldown::SETTLEMENT:
        nLast = entry.nLastSettlementRequest;
        break;
    }

    if (IsCooldownActive(nLast, registry.nCooldownSeconds, nNow)) {
        int64_t nRemaining = nLast + registry.nCooldownSeconds - nNow;
        LogPrint(BCLog::GUARD, "CheckGuard: %s cooldown for %s, %d s remaining\n",
                 policy.strName, caller.ToString(), nRemaining);
        return state.Invalid(SettlementError::COOLDOWN_ACTIVE, "guard-cooldown-active",
                             strprintf("retry in %d seconds", nRemaining));
    }

    return true;
}

bool ApplyGuard(CooldownEntry& entry, const GuardPolicy& policy, int64_t nNow)
{
    switch (policy.cooldown) {
    case GuardCooldown::NONE:
        return false;
    case GuardCooldown::SUBMISSION:
        entry.nLastSubmission = nNow;
        return true;
    case GuardCooldown::SETTLEMENT:
        entry.nLastSettlementRequest = nNow;
        return true;
    }
    return false;
}
