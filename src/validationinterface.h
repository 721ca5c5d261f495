// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_VALIDATIONINTERFACE_H
#define CIPHERBATCH_VALIDATIONINTERFACE_H

#include <memory>

struct Batch;
struct SettlementNotification;
struct SettlementRequest;
class CSettlementInterface;

/** Register a listener (listener must outlive its registration) */
void RegisterSettlementInterface(CSettlementInterface* pListener);
/** Unregister a listener */
void UnregisterSettlementInterface(CSettlementInterface* pListener);
/** Unregister all listeners */
void UnregisterAllSettlementInterfaces();

/**
 * Implement this to subscribe to settlement events.
 *
 * Events are fired by the settlement manager after the operation has been
 * committed to disk and its lock released, so handlers may query the
 * manager. Concurrent operations can interleave their events; order them
 * by nSequence.
 */
class CSettlementInterface
{
public:
    virtual ~CSettlementInterface() = default;

protected:
    /** Every notification appended to the journal */
    virtual void NotificationAppended(const SettlementNotification& notification) {}
    /** A decryption result was accepted and the batch figures recorded */
    virtual void BatchSettled(const Batch& batch, const SettlementRequest& request) {}

    friend void ::RegisterSettlementInterface(CSettlementInterface*);
    friend void ::UnregisterSettlementInterface(CSettlementInterface*);
    friend void ::UnregisterAllSettlementInterfaces();
};

struct SettlementSignalsInstance;

class CSettlementSignals
{
private:
    std::unique_ptr<SettlementSignalsInstance> m_internals;

    friend void ::RegisterSettlementInterface(CSettlementInterface*);
    friend void ::UnregisterSettlementInterface(CSettlementInterface*);
    friend void ::UnregisterAllSettlementInterfaces();

public:
    CSettlementSignals();
    ~CSettlementSignals();

    void NotificationAppended(const SettlementNotification& notification);
    void BatchSettled(const Batch& batch, const SettlementRequest& request);
};

CSettlementSignals& GetSettlementSignals();

#endif // CIPHERBATCH_VALIDATIONINTERFACE_H
