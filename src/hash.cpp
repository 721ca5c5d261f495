// Copyright (c) 2013-2014 The Bitcoin developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"

uint256 SingleSHA256(const std::vector<unsigned char>& vch)
{
    uint256 result;
    CSHA256().Write(vch.data(), vch.size()).Finalize(result.begin());
    return result;
}
