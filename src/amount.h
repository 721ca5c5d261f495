// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_AMOUNT_H
#define CIPHERBATCH_AMOUNT_H

#include <stdint.h>

/** Amount in plaintext cost units (can be negative for profit) */
typedef int64_t CAmount;

/**
 * Plaintext costs and budgets are bounded so that a full batch of them,
 * multiplied by the revenue multiplier, still fits in an int64_t.
 */
static const CAmount MAX_MONEY = 1000000000000000LL;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif // CIPHERBATCH_AMOUNT_H
