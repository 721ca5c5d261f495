// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2019 The Bitcoin Core developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_UTIL_VALIDATION_H
#define CIPHERBATCH_UTIL_VALIDATION_H

#include "consensus/validation.h"

#include <string>

/** Convert CValidationState to a human-readable message for logging */
std::string FormatStateMessage(const CValidationState& state);

/** Stable lower-case name of a rejection kind ("cooldown-active", ...) */
std::string SettlementErrorName(SettlementError error);

#endif // CIPHERBATCH_UTIL_VALIDATION_H
