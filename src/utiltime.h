// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_UTILTIME_H
#define DUTCHX_UTILTIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime returns the system time in seconds, unless overridden with
 * SetMockTime. All deadlines and settlement periods are in these units.
 */
int64_t GetTime();
int64_t GetTimeMillis();

/** For testing. Set e.g. with the setmocktime rpc, or -mocktime argument */
void SetMockTime(int64_t nMockTimeIn);

/**
 * ISO 8601 formatting is preferred. Use the FormatISO8601{DateTime,Date}
 * helper functions if possible.
 */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // DUTCHX_UTILTIME_H
