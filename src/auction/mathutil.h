// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_AUCTION_MATHUTIL_H
#define DUTCHX_AUCTION_MATHUTIL_H

#include <stdint.h>

/** Basis points: 10000 == 100% */
static const int64_t BPS = 10000;

/** Milli-basis points: 10^7 == 100%. Unit of priority-fee scaling. */
static const int64_t MPS = 10000000;

/**
 * Fixed point a * b / d with a 128-bit intermediate.
 * Fails on negative operands, a zero divisor or a result outside int64.
 */
bool MulDivDown(int64_t a, int64_t b, int64_t d, int64_t& nResult);
bool MulDivUp(int64_t a, int64_t b, int64_t d, int64_t& nResult);

#endif // DUTCHX_AUCTION_MATHUTIL_H
