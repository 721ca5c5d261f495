// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_STATE_NOTIFICATIONS_H
#define CIPHERBATCH_STATE_NOTIFICATIONS_H

#include "amount.h"
#include "serialize.h"
#include "state/settlement.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

enum class NotificationType : uint8_t {
    BATCH_OPENED = 0,
    BATCH_CLOSED,
    CONTRIBUTION_RECORDED,
    SETTLEMENT_REQUESTED,
    SETTLEMENT_FINALIZED,
    SETTLEMENT_REJECTED,
    PROVIDER_AUTHORIZED,
    PROVIDER_REVOKED,
    PAUSE_CHANGED,
    COOLDOWN_CHANGED,
    ADMIN_TRANSFERRED,
    ORACLE_CHANGED,
};

std::string NotificationTypeToString(NotificationType type);

/**
 * SettlementNotification - Structured record of one state change
 *
 * Only the fields relevant to the type are set:
 *   BATCH_OPENED/CLOSED      nBatchId
 *   CONTRIBUTION_RECORDED    nBatchId, nIndex, actor (provider)
 *   SETTLEMENT_REQUESTED     nBatchId, token, actor (requester)
 *   SETTLEMENT_FINALIZED     nBatchId, token, nDecryptedTotal, revenue, profit
 *   SETTLEMENT_REJECTED      nBatchId, token, strReason
 *   PROVIDER_*, ADMIN_*, ORACLE_CHANGED   actor
 *   PAUSE_CHANGED            nValue (0/1)
 *   COOLDOWN_CHANGED         nValue (seconds)
 */
struct SettlementNotification
{
    uint64_t nSequence;
    int64_t nTime;
    NotificationType type;
    uint32_t nBatchId;
    uint32_t nIndex;
    uint256 token;
    CActorID actor;
    uint64_t nDecryptedTotal;
    CAmount revenue;
    CAmount profit;
    int64_t nValue;
    std::string strReason;

    SettlementNotification() : SettlementNotification(NotificationType::BATCH_OPENED) {}
    explicit SettlementNotification(NotificationType typeIn)
        : nSequence(0), nTime(0), type(typeIn), nBatchId(0), nIndex(0),
          nDecryptedTotal(0), revenue(0), profit(0), nValue(0) {}

    std::string ToString() const;

    SERIALIZE_METHODS(SettlementNotification, obj)
    {
        READWRITE(obj.nSequence, obj.nTime);
        SER_WRITE(obj, ser_writedata8(s, static_cast<uint8_t>(obj.type)));
        SER_READ(obj, obj.type = static_cast<NotificationType>(ser_readdata8(s)));
        READWRITE(obj.nBatchId, obj.nIndex);
        READWRITE(obj.token, obj.actor);
        READWRITE(obj.nDecryptedTotal, obj.revenue, obj.profit);
        READWRITE(obj.nValue, obj.strReason);
    }
};

/**
 * CNotificationJournal - Append-only log of notifications
 *
 * Sequence numbers start at 1 and are contiguous. Entries are never
 * retracted.
 */
class CNotificationJournal
{
private:
    std::vector<SettlementNotification> vEntries;

public:
    /** Assign the next sequence number and timestamp, then append */
    const SettlementNotification& Append(SettlementNotification notification, int64_t nTime);

    /** Up to nMax entries with nSequence >= nFromSequence */
    std::vector<SettlementNotification> GetRange(uint64_t nFromSequence, size_t nMax) const;

    uint64_t GetLastSequence() const { return vEntries.empty() ? 0 : vEntries.back().nSequence; }
    size_t size() const { return vEntries.size(); }

    bool Load(std::vector<SettlementNotification> vLoaded, std::string& strError);
    void Clear() { vEntries.clear(); }
};

#endif // CIPHERBATCH_STATE_NOTIFICATIONS_H
