// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_STATE_SETTLEMENT_H
#define CIPHERBATCH_STATE_SETTLEMENT_H

/**
 * Confidential Settlement - Core data model
 *
 * Providers submit opaque ciphertext handles with plaintext cost/budget
 * figures into sequential batches. A closed batch is settled through an
 * asynchronous decryption oracle; the callback is accepted at most once and
 * only if the batch still matches the commitment taken at request time.
 *
 * DB Keys (all writes of one operation share one CDBBatch):
 * 'v'                     -> Schema version
 * 'I'                     -> System identity (uint256)
 * 'R'                     -> ActorRegistry
 * 'C' + actor             -> CooldownEntry
 * 'B' + batchId           -> Batch (header, totals, settlement result)
 * 'c' + (batchId, index)  -> Contribution
 * 'S' + token             -> SettlementRequest
 * 'N' + sequence          -> SettlementNotification
 */

#include "amount.h"
#include "fhe/ciphertext.h"
#include "serialize.h"
#include "uint256.h"

#include <set>
#include <stdint.h>
#include <string>
#include <vector>

// DB Key prefixes
static const char DB_SCHEMA_VERSION = 'v';
static const char DB_SYSTEM_IDENTITY = 'I';
static const char DB_REGISTRY = 'R';
static const char DB_COOLDOWN = 'C';
static const char DB_BATCH = 'B';
static const char DB_CONTRIBUTION = 'c';
static const char DB_REQUEST = 'S';
static const char DB_NOTIFICATION = 'N';

static const int SETTLEMENT_DB_VERSION = 1;

/** Default cooldown between two submissions (or two settlement requests) of one actor */
static const int64_t DEFAULT_COOLDOWN_SECONDS = 60;
/** Default factor applied to the total budget to obtain the revenue of a batch */
static const int64_t DEFAULT_REVENUE_MULTIPLIER = 3;
/** Keeps MAX_MONEY * multiplier inside int64_t */
static const int64_t MAX_REVENUE_MULTIPLIER = 1000;
/** One week */
static const int64_t MAX_COOLDOWN_SECONDS = 7 * 24 * 60 * 60;

/**
 * CActorID - Identity of an actor (administrator, provider, oracle, caller)
 *
 * A null identity never designates an actor.
 */
class CActorID : public uint160
{
public:
    CActorID() : uint160() {}
    explicit CActorID(const uint160& in) : uint160(in) {}
};

/**
 * Contribution - One encrypted submission into a batch
 *
 * nIndex is the append position inside the batch (0, 1, 2, ...). Immutable
 * once recorded.
 */
struct Contribution
{
    uint32_t nBatchId;
    uint32_t nIndex;
    CCiphertextHandle handle;    // Never decrypted by the core
    CAmount cost;
    CAmount budget;
    CActorID provider;
    int64_t nTime;

    Contribution() { SetNull(); }

    void SetNull()
    {
        nBatchId = 0;
        nIndex = 0;
        handle.SetNull();
        cost = 0;
        budget = 0;
        provider.SetNull();
        nTime = 0;
    }

    SERIALIZE_METHODS(Contribution, obj)
    {
        READWRITE(obj.nBatchId, obj.nIndex);
        READWRITE(obj.handle);
        READWRITE(obj.cost, obj.budget);
        READWRITE(obj.provider);
        READWRITE(obj.nTime);
    }
};

enum class BatchStatus : uint8_t {
    OPEN = 0,
    CLOSED = 1,
};

std::string BatchStatusToString(BatchStatus status);

/**
 * Batch - Sequential collection of contributions
 *
 * Ids start at 1 and increase by one. Totals and the running aggregate are
 * updated with every contribution. The settlement fields are only set once
 * a request for this batch has been finalized.
 *
 * Contributions are stored under their own keys; the serialized form
 * covers the header only.
 */
struct Batch
{
    uint32_t nId;
    BatchStatus status;
    std::vector<Contribution> vContributions;
    CAmount totalCost;
    CAmount totalBudget;
    CCiphertextHandle aggregate;     // Null while the batch is empty
    int64_t nOpenTime;
    int64_t nCloseTime;

    // Settlement result
    bool fSettled;
    uint256 settlementToken;
    uint64_t nDecryptedTotal;
    CAmount revenue;
    CAmount profit;

    Batch() { SetNull(); }

    void SetNull()
    {
        nId = 0;
        status = BatchStatus::OPEN;
        vContributions.clear();
        totalCost = 0;
        totalBudget = 0;
        aggregate.SetNull();
        nOpenTime = 0;
        nCloseTime = 0;
        fSettled = false;
        settlementToken.SetNull();
        nDecryptedTotal = 0;
        revenue = 0;
        profit = 0;
    }

    bool IsNull() const { return nId == 0; }
    bool IsOpen() const { return status == BatchStatus::OPEN; }
    uint32_t GetContributionCount() const { return vContributions.size(); }

    std::vector<CCiphertextHandle> GetOrderedHandles() const;

    SERIALIZE_METHODS(Batch, obj)
    {
        READWRITE(obj.nId);
        SER_WRITE(obj, ser_writedata8(s, static_cast<uint8_t>(obj.status)));
        SER_READ(obj, obj.status = static_cast<BatchStatus>(ser_readdata8(s)));
        READWRITE(obj.totalCost, obj.totalBudget);
        READWRITE(obj.aggregate);
        READWRITE(obj.nOpenTime, obj.nCloseTime);
        READWRITE(obj.fSettled, obj.settlementToken);
        READWRITE(obj.nDecryptedTotal, obj.revenue, obj.profit);
    }
};

enum class RequestStatus : uint8_t {
    REQUESTED = 0,
    FINALIZED = 1,
    REJECTED = 2,
};

std::string RequestStatusToString(RequestStatus status);

/**
 * SettlementRequest - Pending (or resolved) decryption of a batch aggregate
 *
 * Keyed by the token the oracle returned. Only processed and status change
 * after creation, together and exactly once.
 */
struct SettlementRequest
{
    uint256 token;
    uint32_t nBatchId;
    uint256 stateHash;               // Commitment over the ordered handles at request time
    CCiphertextHandle aggregate;     // Handle handed to the oracle
    CActorID requester;
    int64_t nTime;
    bool processed;
    RequestStatus status;

    SettlementRequest() { SetNull(); }

    void SetNull()
    {
        token.SetNull();
        nBatchId = 0;
        stateHash.SetNull();
        aggregate.SetNull();
        requester.SetNull();
        nTime = 0;
        processed = false;
        status = RequestStatus::REQUESTED;
    }

    bool IsNull() const { return token.IsNull(); }

    SERIALIZE_METHODS(SettlementRequest, obj)
    {
        READWRITE(obj.token, obj.nBatchId);
        READWRITE(obj.stateHash, obj.aggregate);
        READWRITE(obj.requester, obj.nTime);
        READWRITE(obj.processed);
        SER_WRITE(obj, ser_writedata8(s, static_cast<uint8_t>(obj.status)));
        SER_READ(obj, obj.status = static_cast<RequestStatus>(ser_readdata8(s)));
    }
};

/**
 * ActorRegistry - Roles and global switches
 *
 * Exactly one administrator. The oracle identity is the only caller allowed
 * to deliver decryption results; null until configured.
 */
struct ActorRegistry
{
    CActorID admin;
    std::set<CActorID> setProviders;
    CActorID oracle;
    bool fPaused;
    int64_t nCooldownSeconds;

    ActorRegistry() { SetNull(); }

    void SetNull()
    {
        admin.SetNull();
        setProviders.clear();
        oracle.SetNull();
        fPaused = false;
        nCooldownSeconds = DEFAULT_COOLDOWN_SECONDS;
    }

    bool IsAdmin(const CActorID& actor) const { return !actor.IsNull() && actor == admin; }
    bool IsProvider(const CActorID& actor) const { return setProviders.count(actor) != 0; }
    bool IsOracle(const CActorID& actor) const { return !oracle.IsNull() && actor == oracle; }

    SERIALIZE_METHODS(ActorRegistry, obj)
    {
        READWRITE(obj.admin);
        READWRITE(obj.setProviders);
        READWRITE(obj.oracle);
        READWRITE(obj.fPaused, obj.nCooldownSeconds);
    }
};

/**
 * CooldownEntry - Last time an actor submitted / requested settlement
 *
 * Zero means the action was never performed.
 */
struct CooldownEntry
{
    int64_t nLastSubmission;
    int64_t nLastSettlementRequest;

    CooldownEntry() : nLastSubmission(0), nLastSettlementRequest(0) {}

    bool IsNull() const { return nLastSubmission == 0 && nLastSettlementRequest == 0; }

    SERIALIZE_METHODS(CooldownEntry, obj)
    {
        READWRITE(obj.nLastSubmission, obj.nLastSettlementRequest);
    }
};

/** Startup parameters of the settlement core */
struct SettlementParams
{
    uint256 systemIdentity;          // Salt of every state commitment
    int64_t nRevenueMultiplier;
    int64_t nInitialCooldown;        // Used when the registry is created
    CActorID initialAdmin;           // Used when the registry is created

    SettlementParams() : nRevenueMultiplier(DEFAULT_REVENUE_MULTIPLIER), nInitialCooldown(DEFAULT_COOLDOWN_SECONDS) {}
};

/** Default system identity: Hash("cipherbatch") */
uint256 GetDefaultSystemIdentity();

#endif // CIPHERBATCH_STATE_SETTLEMENT_H
