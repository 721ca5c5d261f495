// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "validationinterface.h"

#include "state/notifications.h"
#include "state/settlement.h"

#include <map>

#include <boost/signals2/signal.hpp>

struct SettlementInterfaceConnections {
    boost::signals2::scoped_connection NotificationAppended;
    boost::signals2::scoped_connection BatchSettled;
};

struct SettlementSignalsInstance {
    boost::signals2::signal<void (const SettlementNotification&)> NotificationAppended;
    boost::signals2::signal<void (const Batch&, const SettlementRequest&)> BatchSettled;

    std::map<CSettlementInterface*, SettlementInterfaceConnections> m_connections;
};

static CSettlementSignals g_signals;

CSettlementSignals::CSettlementSignals() : m_internals(new SettlementSignalsInstance()) {}

CSettlementSignals::~CSettlementSignals() {}

CSettlementSignals& GetSettlementSignals()
{
    return g_signals;
}

void RegisterSettlementInterface(CSettlementInterface* pListener)
{
    SettlementInterfaceConnections& conns = g_signals.m_internals->m_connections[pListener];
    conns.NotificationAppended = g_signals.m_internals->NotificationAppended.connect(
        [pListener](const SettlementNotification& notification) { pListener->NotificationAppended(notification); });
    conns.BatchSettled = g_signals.m_internals->BatchSettled.connect(
        [pListener](const Batch& batch, const SettlementRequest& request) { pListener->BatchSettled(batch, request); });
}

void UnregisterSettlementInterface(CSettlementInterface* pListener)
{
    g_signals.m_internals->m_connections.erase(pListener);
}

void UnregisterAllSettlementInterfaces()
{
    g_signals.m_internals->m_connections.clear();
}

void CSettlementSignals::NotificationAppended(const SettlementNotification& notification)
{
    m_internals->NotificationAppended(notification);
}

void CSettlementSignals::BatchSettled(const Batch& batch, const SettlementRequest& request)
{
    m_internals->BatchSettled(batch, request);
}
