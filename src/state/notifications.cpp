// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state/notifications.h"

#include "logging.h"

#include <algorithm>

std::string NotificationTypeToString(NotificationType type)
{
    switch (type) {
    case NotificationType::BATCH_OPENED: return "batch_opened";
    case NotificationType::BATCH_CLOSED: return "batch_closed";
    case NotificationType::CONTRIBUTION_RECORDED: return "contribution_recorded";
    case NotificationType::SETTLEMENT_REQUESTED: return "settlement_requested";
    case NotificationType::SETTLEMENT_FINALIZED: return "settlement_finalized";
    case NotificationType::SETTLEMENT_REJECTED: return "settlement_rejected";
    case NotificationType::PROVIDER_AUTHORIZED: return "provider_authorized";
    case NotificationType::PROVIDER_REVOKED: return "provider_revoked";
    case NotificationType::PAUSE_CHANGED: return "pause_changed";
    case NotificationType::COOLDOWN_CHANGED: return "cooldown_changed";
    case NotificationType::ADMIN_TRANSFERRED: return "admin_transferred";
    case NotificationType::ORACLE_CHANGED: return "oracle_changed";
    }
    return "unknown";
}

std::string SettlementNotification::ToString() const
{
    switch (type) {
    case NotificationType::BATCH_OPENED:
    case NotificationType::BATCH_CLOSED:
        return strprintf("#%u %s batch=%u", nSequence, NotificationTypeToString(type), nBatchId);
    case NotificationType::CONTRIBUTION_RECORDED:
        return strprintf("#%u %s batch=%u index=%u provider=%s", nSequence, NotificationTypeToString(type),
                         nBatchId, nIndex, actor.ToString());
    case NotificationType::SETTLEMENT_REQUESTED:
        return strprintf("#%u %s batch=%u token=%s", nSequence, NotificationTypeToString(type),
                         nBatchId, token.ToString());
    case NotificationType::SETTLEMENT_FINALIZED:
        return strprintf("#%u %s batch=%u token=%s total=%u revenue=%d profit=%d", nSequence,
                         NotificationTypeToString(type), nBatchId, token.ToString(),
                         nDecryptedTotal, revenue, profit);
    case NotificationType::SETTLEMENT_REJECTED:
        return strprintf("#%u %s batch=%u token=%s reason=%s", nSequence, NotificationTypeToString(type),
                         nBatchId, token.ToString(), strReason);
    case NotificationType::PAUSE_CHANGED:
    case NotificationType::COOLDOWN_CHANGED:
        return strprintf("#%u %s value=%d", nSequence, NotificationTypeToString(type), nValue);
    case NotificationType::PROVIDER_AUTHORIZED:
    case NotificationType::PROVIDER_REVOKED:
    case NotificationType::ADMIN_TRANSFERRED:
    case NotificationType::ORACLE_CHANGED:
        return strprintf("#%u %s actor=%s", nSequence, NotificationTypeToString(type), actor.ToString());
    }
    return strprintf("#%u unknown", nSequence);
}

const SettlementNotification& CNotificationJournal::Append(SettlementNotification notification, int64_t nTime)
{
    notification.nSequence = GetLastSequence() + 1;
    notification.nTime = nTime;
    vEntries.push_back(std::move(notification));

    LogPrint(BCLog::NOTIFY, "notification %s\n", vEntries.back().ToString());
    return vEntries.back();
}

std::vector<SettlementNotification> CNotificationJournal::GetRange(uint64_t nFromSequence, size_t nMax) const
{
    std::vector<SettlementNotification> result;
    // Sequence n lives at index n - 1
    size_t nStart = nFromSequence == 0 ? 0 : nFromSequence - 1;
    for (size_t i = nStart; i < vEntries.size() && result.size() < nMax; ++i) {
        result.push_back(vEntries[i]);
    }
    return result;
}

bool CNotificationJournal::Load(std::vector<SettlementNotification> vLoaded, std::string& strError)
{
    std::sort(vLoaded.begin(), vLoaded.end(), [](const SettlementNotification& a, const SettlementNotification& b) {
        return a.nSequence < b.nSequence;
    });
    for (size_t i = 0; i < vLoaded.size(); ++i) {
        if (vLoaded[i].nSequence != i + 1) {
            strError = strprintf("notification journal has a gap at sequence %u", i + 1);
            return false;
        }
        if (vLoaded[i].type > NotificationType::ORACLE_CHANGED) {
            strError = strprintf("notification %u has invalid type %u", i + 1, (unsigned int)vLoaded[i].type);
            return false;
        }
    }
    vEntries = std::move(vLoaded);
    return true;
}
