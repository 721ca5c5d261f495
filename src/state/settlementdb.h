// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_STATE_SETTLEMENTDB_H
#define CIPHERBATCH_STATE_SETTLEMENTDB_H

/**
 * Settlement Database
 *
 * LevelDB store under <datadir>/settlement holding the complete settlement
 * state (see state/settlement.h for the key layout). Every mutating
 * operation of the manager goes through one CSettlementDB::Batch so that it
 * reaches disk atomically.
 */

#include "dbwrapper.h"
#include "state/notifications.h"
#include "state/settlement.h"

#include <functional>
#include <map>
#include <memory>
#include <vector>

class CSettlementDB
{
private:
    std::unique_ptr<CDBWrapper> db;
    bool fFailCommitForTesting;

    template <typename K, typename V>
    bool ForEach(char prefix, std::function<bool(const K&, const V&)> func) const;

public:
    explicit CSettlementDB(size_t nCacheSize, bool fWipe = false);
    ~CSettlementDB();

    bool IsEmpty() const;

    // Schema version
    bool WriteVersion(int nVersion);
    bool ReadVersion(int& nVersion) const;

    // Salt of the settlement state hashes, fixed when the state is created
    bool ReadSystemIdentity(uint256& identity) const;

    // Registry
    bool WriteRegistry(const ActorRegistry& registry);
    bool ReadRegistry(ActorRegistry& registry) const;

    // Cooldowns
    bool ReadCooldown(const CActorID& actor, CooldownEntry& entry) const;
    bool LoadCooldowns(std::map<CActorID, CooldownEntry>& mapCooldowns) const;

    // Batches and contributions
    bool WriteBatchHeader(const ::Batch& batch);
    bool ReadBatchHeader(uint32_t nBatchId, ::Batch& batch) const;
    bool WriteContribution(const Contribution& contrib);
    bool ReadContribution(uint32_t nBatchId, uint32_t nIndex, Contribution& contrib) const;

    /** Read every batch header with its contributions (unordered) */
    bool LoadBatches(std::vector<::Batch>& vBatches) const;

    // Settlement requests
    bool ReadRequest(const uint256& token, SettlementRequest& request) const;
    bool LoadRequests(std::map<uint256, SettlementRequest>& mapRequests) const;

    // Notification journal
    bool ReadNotification(uint64_t nSequence, SettlementNotification& notification) const;
    bool LoadNotifications(std::vector<SettlementNotification>& vNotifications) const;

    // Batch operations for atomic updates
    class Batch
    {
    private:
        CDBBatch batch;
        CSettlementDB& parent;
        size_t nWrites;

    public:
        explicit Batch(CSettlementDB& db);

        void WriteRegistry(const ActorRegistry& registry);
        void WriteCooldown(const CActorID& actor, const CooldownEntry& entry);
        void WriteBatchHeader(const ::Batch& batch);
        void WriteContribution(const Contribution& contrib);
        void WriteRequest(const SettlementRequest& request);
        void WriteNotification(const SettlementNotification& notification);
        void WriteVersion(int nVersion);
        void WriteSystemIdentity(const uint256& identity);

        bool IsEmpty() const { return nWrites == 0; }

        bool Commit();
    };

    Batch CreateBatch() { return Batch(*this); }

    // Sync to disk
    bool Sync();

    /** Make every Batch::Commit() fail with dbwrapper_error (unit tests only) */
    void SetCommitFailureForTesting(bool fFail) { fFailCommitForTesting = fFail; }
};

// Global settlement DB instance
extern std::unique_ptr<CSettlementDB> g_settlementdb;

#endif // CIPHERBATCH_STATE_SETTLEMENTDB_H
