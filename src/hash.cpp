// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"

#include <openssl/sha.h>

uint256 Hash(const unsigned char* pbegin, const unsigned char* pend)
{
    unsigned char h1[SHA256_DIGEST_LENGTH];
    uint256 result;
    SHA256(pbegin, pend - pbegin, h1);
    SHA256(h1, sizeof(h1), result.begin());
    return result;
}
