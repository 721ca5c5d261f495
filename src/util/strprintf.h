// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_UTIL_STRPRINTF_H
#define CIPHERBATCH_UTIL_STRPRINTF_H

#include <stdexcept>
#include <string>

// Formatting errors must never abort the process; report them as exceptions instead.
#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reasonString) throw std::runtime_error(reasonString)
#endif

#include <tinyformat.h>

#define strprintf tfm::format

#endif // CIPHERBATCH_UTIL_STRPRINTF_H
