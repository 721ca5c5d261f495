// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/settlementdb.h"

#include "fs.h"
#include "logging.h"
#include "util/system.h"

// Global settlement DB instance
std::unique_ptr<CSettlementDB> g_settlementdb;

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

std::pair<char, std::pair<uint32_t, uint32_t>> MakeContributionKey(uint32_t nBatchId, uint32_t nIndex)
{
    return std::make_pair(DB_CONTRIBUTION, std::make_pair(nBatchId, nIndex));
}

} // anonymous namespace

CSettlementDB::CSettlementDB(size_t nCacheSize, bool fWipe) : fFailCommitForTesting(false)
{
    fs::path path = GetDataDir() / "settlement";
    db = std::make_unique<CDBWrapper>(path, nCacheSize, fWipe);
}

CSettlementDB::~CSettlementDB() = default;

bool CSettlementDB::IsEmpty() const
{
    return db->IsEmpty();
}

template <typename K, typename V>
bool CSettlementDB::ForEach(char prefix, std::function<bool(const K&, const V&)> func) const
{
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(prefix);

    while (it->Valid()) {
        std::pair<char, K> key;
        if (!it->GetKey(key) || key.first != prefix) {
            break;  // No more entries under this prefix
        }
        V value;
        if (!it->GetValue(value)) {
            return error("%s: unreadable value under prefix '%c'", __func__, prefix);
        }
        if (!func(key.second, value)) {
            return false;
        }
        it->Next();
    }
    return true;
}

// =============================================================================
// Schema version / registry / cooldowns
// =============================================================================

bool CSettlementDB::WriteVersion(int nVersion)
{
    return db->Write(DB_SCHEMA_VERSION, nVersion, true);
}

bool CSettlementDB::ReadVersion(int& nVersion) const
{
    return db->Read(DB_SCHEMA_VERSION, nVersion);
}

bool CSettlementDB::ReadSystemIdentity(uint256& identity) const
{
    return db->Read(DB_SYSTEM_IDENTITY, identity);
}

bool CSettlementDB::WriteRegistry(const ActorRegistry& registry)
{
    return db->Write(DB_REGISTRY, registry);
}

bool CSettlementDB::ReadRegistry(ActorRegistry& registry) const
{
    return db->Read(DB_REGISTRY, registry);
}

bool CSettlementDB::ReadCooldown(const CActorID& actor, CooldownEntry& entry) const
{
    return db->Read(MakeKey(DB_COOLDOWN, actor), entry);
}

bool CSettlementDB::LoadCooldowns(std::map<CActorID, CooldownEntry>& mapCooldowns) const
{
    mapCooldowns.clear();
    return ForEach<CActorID, CooldownEntry>(DB_COOLDOWN, [&](const CActorID& actor, const CooldownEntry& entry) {
        mapCooldowns.emplace(actor, entry);
        return true;
    });
}

// =============================================================================
// Batches / contributions
// =============================================================================

bool CSettlementDB::WriteBatchHeader(const ::Batch& batch)
{
    return db->Write(MakeKey(DB_BATCH, batch.nId), batch);
}

bool CSettlementDB::ReadBatchHeader(uint32_t nBatchId, ::Batch& batch) const
{
    return db->Read(MakeKey(DB_BATCH, nBatchId), batch);
}

bool CSettlementDB::WriteContribution(const Contribution& contrib)
{
    return db->Write(MakeContributionKey(contrib.nBatchId, contrib.nIndex), contrib);
}

bool CSettlementDB::ReadContribution(uint32_t nBatchId, uint32_t nIndex, Contribution& contrib) const
{
    return db->Read(MakeContributionKey(nBatchId, nIndex), contrib);
}

bool CSettlementDB::LoadBatches(std::vector<::Batch>& vBatches) const
{
    std::map<uint32_t, ::Batch> mapBatches;
    bool fOk = ForEach<uint32_t, ::Batch>(DB_BATCH, [&](const uint32_t& nBatchId, const ::Batch& batch) {
        if (batch.nId != nBatchId) {
            return error("LoadBatches: batch key %u holds batch %u", nBatchId, batch.nId);
        }
        mapBatches.emplace(nBatchId, batch);
        return true;
    });
    if (!fOk) return false;

    fOk = ForEach<std::pair<uint32_t, uint32_t>, Contribution>(DB_CONTRIBUTION,
        [&](const std::pair<uint32_t, uint32_t>& key, const Contribution& contrib) {
            auto it = mapBatches.find(key.first);
            if (it == mapBatches.end()) {
                return error("LoadBatches: contribution %u/%u without batch", key.first, key.second);
            }
            if (contrib.nBatchId != key.first || contrib.nIndex != key.second) {
                return error("LoadBatches: contribution key %u/%u holds %u/%u",
                             key.first, key.second, contrib.nBatchId, contrib.nIndex);
            }
            it->second.vContributions.push_back(contrib);
            return true;
        });
    if (!fOk) return false;

    vBatches.clear();
    for (auto& entry : mapBatches) {
        vBatches.push_back(std::move(entry.second));
    }
    return true;
}

// =============================================================================
// Requests / notifications
// =============================================================================

bool CSettlementDB::ReadRequest(const uint256& token, SettlementRequest& request) const
{
    return db->Read(MakeKey(DB_REQUEST, token), request);
}

bool CSettlementDB::LoadRequests(std::map<uint256, SettlementRequest>& mapRequests) const
{
    mapRequests.clear();
    return ForEach<uint256, SettlementRequest>(DB_REQUEST, [&](const uint256& token, const SettlementRequest& request) {
        if (request.token != token) {
            return error("LoadRequests: request key %s holds %s", token.ToString(), request.token.ToString());
        }
        mapRequests.emplace(token, request);
        return true;
    });
}

bool CSettlementDB::ReadNotification(uint64_t nSequence, SettlementNotification& notification) const
{
    return db->Read(MakeKey(DB_NOTIFICATION, nSequence), notification);
}

bool CSettlementDB::LoadNotifications(std::vector<SettlementNotification>& vNotifications) const
{
    vNotifications.clear();
    return ForEach<uint64_t, SettlementNotification>(DB_NOTIFICATION,
        [&](const uint64_t& nSequence, const SettlementNotification& notification) {
            if (notification.nSequence != nSequence) {
                return error("LoadNotifications: key %u holds sequence %u", nSequence, notification.nSequence);
            }
            vNotifications.push_back(notification);
            return true;
        });
}

bool CSettlementDB::Sync()
{
    return db->Sync();
}

// =============================================================================
// Batch operations
// =============================================================================

CSettlementDB::Batch::Batch(CSettlementDB& db) : batch(*db.db), parent(db), nWrites(0) {}

void CSettlementDB::Batch::WriteRegistry(const ActorRegistry& registry)
{
    batch.Write(DB_REGISTRY, registry);
    ++nWrites;
}

void CSettlementDB::Batch::WriteCooldown(const CActorID& actor, const CooldownEntry& entry)
{
    batch.Write(MakeKey(DB_COOLDOWN, actor), entry);
    ++nWrites;
}

void CSettlementDB::Batch::WriteBatchHeader(const ::Batch& header)
{
    batch.Write(MakeKey(DB_BATCH, header.nId), header);
    ++nWrites;
}

void CSettlementDB::Batch::WriteContribution(const Contribution& contrib)
{
    batch.Write(MakeContributionKey(contrib.nBatchId, contrib.nIndex), contrib);
    ++nWrites;
}

void CSettlementDB::Batch::WriteRequest(const SettlementRequest& request)
{
    batch.Write(MakeKey(DB_REQUEST, request.token), request);
    ++nWrites;
}

void CSettlementDB::Batch::WriteNotification(const SettlementNotification& notification)
{
    batch.Write(MakeKey(DB_NOTIFICATION, notification.nSequence), notification);
    ++nWrites;
}

void CSettlementDB::Batch::WriteVersion(int nVersion)
{
    batch.Write(DB_SCHEMA_VERSION, nVersion);
    ++nWrites;
}

void CSettlementDB::Batch::WriteSystemIdentity(const uint256& identity)
{
    batch.Write(DB_SYSTEM_IDENTITY, identity);
    ++nWrites;
}

bool CSettlementDB::Batch::Commit()
{
    if (parent.fFailCommitForTesting) {
        throw dbwrapper_error("simulated write failure");
    }
    LogPrint(BCLog::DB, "CSettlementDB::Batch::Commit: %u writes, ~%u bytes\n", nWrites, batch.SizeEstimate());
    return parent.db->WriteBatch(batch, true);
}
