// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_FHE_CIPHERTEXT_H
#define CIPHERBATCH_FHE_CIPHERTEXT_H

#include "serialize.h"
#include "uint256.h"

#include <string>

/**
 * CCiphertextHandle - Opaque reference to an encrypted value
 *
 * The handle is issued by the homomorphic coprocessor and is never
 * interpreted here: it can only be compared, ordered, hashed (through its
 * serialization) and passed back to the coprocessor for composition.
 * A null handle never designates a ciphertext.
 */
class CCiphertextHandle
{
private:
    uint256 m_id;

public:
    CCiphertextHandle() {}
    explicit CCiphertextHandle(const uint256& id) : m_id(id) {}

    const uint256& GetId() const { return m_id; }
    bool IsNull() const { return m_id.IsNull(); }
    void SetNull() { m_id.SetNull(); }

    std::string ToString() const { return m_id.GetHex(); }

    friend bool operator==(const CCiphertextHandle& a, const CCiphertextHandle& b) { return a.m_id == b.m_id; }
    friend bool operator!=(const CCiphertextHandle& a, const CCiphertextHandle& b) { return a.m_id != b.m_id; }
    friend bool operator<(const CCiphertextHandle& a, const CCiphertextHandle& b) { return a.m_id < b.m_id; }

    SERIALIZE_METHODS(CCiphertextHandle, obj) { READWRITE(obj.m_id); }
};

#endif // CIPHERBATCH_FHE_CIPHERTEXT_H
