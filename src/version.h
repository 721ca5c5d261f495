// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_VERSION_H
#define CIPHERBATCH_VERSION_H

/**
 * Serialization version of settlement records and commitments.
 * Bump when a persisted record layout changes.
 */
static const int PROTOCOL_VERSION = 10001;

//! Version written alongside on-disk records
static const int CLIENT_VERSION = 1000000;

#endif // CIPHERBATCH_VERSION_H
