// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_HASH_H
#define CHAINBILLS_HASH_H

#include "serialize.h"
#include "uint256.h"

#include <string>
#include <vector>

/** Compute the 256-bit double SHA-256 of a byte range. */
uint256 Hash(const unsigned char* pbegin, const unsigned char* pend);

/** Compute the 256-bit hash of an object's serialization. */
template <typename T1>
inline uint256 Hash(const T1 pbegin, const T1 pend)
{
    static const unsigned char pblank[1] = {};
    const unsigned char* p = (pbegin == pend) ? pblank : (const unsigned char*)&pbegin[0];
    return Hash(p, p + (pend - pbegin) * sizeof(pbegin[0]));
}

/** A writer stream (for serialization) that computes a 256-bit double SHA-256 hash. */
class CHashWriter
{
private:
    std::vector<unsigned char> buf;

    const int nType;
    const int nVersion;

public:
    CHashWriter(int nTypeIn, int nVersionIn) : nType(nTypeIn), nVersion(nVersionIn) {}

    int GetType() const { return nType; }
    int GetVersion() const { return nVersion; }

    void write(const char* pch, size_t size)
    {
        buf.insert(buf.end(), (const unsigned char*)pch, (const unsigned char*)pch + size);
    }

    // invalidates the object
    uint256 GetHash()
    {
        return Hash(buf.data(), buf.data() + buf.size());
    }

    template <typename T>
    CHashWriter& operator<<(const T& obj)
    {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }
};

/** Compute the 256-bit hash of an object's serialization. */
template <typename T>
uint256 SerializeHash(const T& obj, int nType = SER_GETHASH, int nVersion = 0)
{
    CHashWriter ss(nType, nVersion);
    ss << obj;
    return ss.GetHash();
}

#endif // CHAINBILLS_HASH_H
