// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_UTILTIME_H
#define CHAINBILLS_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the system time in seconds, or the mocked time
 * set by SetMockTime(). Ledger records are stamped with it.
 */
int64_t GetTime();
int64_t GetTimeMillis();

/** For testing. Set e.g. with the -mocktime argument. 0 disables mocking. */
void SetMockTime(int64_t nMockTimeIn);

std::string FormatISO8601DateTime(int64_t nTime);

#endif // CHAINBILLS_UTILTIME_H
