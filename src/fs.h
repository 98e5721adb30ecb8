// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_FS_H
#define CHAINBILLS_FS_H

#include <stdio.h>
#include <string>

#include <boost/filesystem.hpp>

/** Filesystem operations and types */
namespace fs = boost::filesystem;

/** Bridge operations to C stdio */
namespace fsbridge {
    inline FILE* fopen(const fs::path& p, const char* mode)
    {
        return ::fopen(p.string().c_str(), mode);
    }
} // namespace fsbridge

#endif // CHAINBILLS_FS_H
