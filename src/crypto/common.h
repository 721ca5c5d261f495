// Copyright (c) 2014 The Bitcoin developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CIPHERBATCH_CRYPTO_COMMON_H
#define CIPHERBATCH_CRYPTO_COMMON_H

#include <stdint.h>
#include <string.h>

static inline uint16_t ReadLE16(const unsigned char* ptr)
{
    return (uint16_t)ptr[0] | ((uint16_t)ptr[1] << 8);
}

static inline uint32_t ReadLE32(const unsigned char* ptr)
{
    return (uint32_t)ptr[0] | ((uint32_t)ptr[1] << 8) | ((uint32_t)ptr[2] << 16) | ((uint32_t)ptr[3] << 24);
}

static inline uint64_t ReadLE64(const unsigned char* ptr)
{
    return (uint64_t)ReadLE32(ptr) | ((uint64_t)ReadLE32(ptr + 4) << 32);
}

static inline void WriteLE16(unsigned char* ptr, uint16_t x)
{
    ptr[0] = x;
    ptr[1] = x >> 8;
}

static inline void WriteLE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = x;
    ptr[1] = x >> 8;
    ptr[2] = x >> 16;
    ptr[3] = x >> 24;
}

static inline void WriteLE64(unsigned char* ptr, uint64_t x)
{
    WriteLE32(ptr, (uint32_t)x);
    WriteLE32(ptr + 4, (uint32_t)(x >> 32));
}

static inline uint32_t ReadBE32(const unsigned char* ptr)
{
    return ((uint32_t)ptr[0] << 24) | ((uint32_t)ptr[1] << 16) | ((uint32_t)ptr[2] << 8) | (uint32_t)ptr[3];
}

static inline void WriteBE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = x >> 24;
    ptr[1] = x >> 16;
    ptr[2] = x >> 8;
    ptr[3] = x;
}

static inline void WriteBE64(unsigned char* ptr, uint64_t x)
{
    WriteBE32(ptr, (uint32_t)(x >> 32));
    WriteBE32(ptr + 4, (uint32_t)x);
}

#endif // CIPHERBATCH_CRYPTO_COMMON_H
