// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_FHE_COPROCESSOR_H
#define CIPHERBATCH_FHE_COPROCESSOR_H

/**
 * Collaborator contracts of the settlement core.
 *
 * The homomorphic coprocessor and the decryption oracle run outside this
 * process. The core only ever sees them through these two interfaces.
 */

#include "fhe/ciphertext.h"
#include "uint256.h"

#include <stdint.h>
#include <vector>

/**
 * CHomomorphicEvaluator - Composition of ciphertext handles
 *
 * Add() must be a pure function of its inputs: deterministic, associative
 * and commutative. The aggregation engine relies on this to re-derive a
 * batch aggregate bit-for-bit at callback time.
 */
class CHomomorphicEvaluator
{
public:
    virtual ~CHomomorphicEvaluator() = default;

    /** Return a handle representing the sum of the plaintexts behind a and b */
    virtual CCiphertextHandle Add(const CCiphertextHandle& a, const CCiphertextHandle& b) = 0;
};

/**
 * CDecryptionOracle - Asynchronous, untrusted decryption channel
 *
 * RequestDecryption() returns at once with a token; the result arrives later
 * as a separate inbound call carrying that token. The oracle promises at most
 * one delivery per token under normal operation, but the core must not rely
 * on it: it honors at most one.
 */
class CDecryptionOracle
{
public:
    virtual ~CDecryptionOracle() = default;

    /**
     * RequestDecryption - Start decrypting a set of handles
     *
     * @param handles Handles to decrypt (the aggregate of a batch)
     * @return Token identifying the request; null on refusal
     */
    virtual uint256 RequestDecryption(const std::vector<CCiphertextHandle>& handles) = 0;

    /**
     * VerifyAuthenticity - Check that cleartext is the genuine decryption
     * result for the handles bound to token
     */
    virtual bool VerifyAuthenticity(const uint256& token,
                                    uint64_t cleartext,
                                    const std::vector<unsigned char>& proof) = 0;
};

#endif // CIPHERBATCH_FHE_COPROCESSOR_H
