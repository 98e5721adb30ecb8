// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_FORMAT_H
#define CHAINBILLS_FORMAT_H

#include <stdexcept>
#include <string>

namespace tinyformat {
class format_error : public std::runtime_error
{
public:
    explicit format_error(const std::string& what) : std::runtime_error(what) {}
};
} // namespace tinyformat

// Bad format strings throw instead of asserting.
#define TINYFORMAT_ERROR(reasonString) throw tinyformat::format_error(reasonString)

#include <tinyformat.h>

#define strprintf tfm::format

#endif // CHAINBILLS_FORMAT_H
