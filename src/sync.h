// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_SYNC_H
#define CIPHERBATCH_SYNC_H

#include <mutex>
#include <type_traits>

/**
 * Wrapped mutex types. Every public settlement operation holds its manager's
 * RecursiveMutex for its whole duration, which serializes operations.
 *
 * Usage:
 *
 *   RecursiveMutex cs;
 *   {
 *       LOCK(cs);
 *       ...
 *   }
 */
typedef std::recursive_mutex RecursiveMutex;
typedef std::mutex Mutex;

template <typename MutexType>
class CScopedLock : public std::unique_lock<MutexType>
{
public:
    explicit CScopedLock(MutexType& mutexIn) : std::unique_lock<MutexType>(mutexIn) {}
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CScopedLock<typename std::remove_reference<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // CIPHERBATCH_SYNC_H
