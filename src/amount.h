// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_AMOUNT_H
#define DUTCHX_AMOUNT_H

#include <stdint.h>

/** Amount of a token in its smallest unit */
typedef int64_t CAmount;

/**
 * Upper bound for any single token amount carried by an order, a permit or a
 * collateral. Keeps every product of an amount with a basis-point or MPS
 * factor inside 128-bit intermediate arithmetic.
 */
static const CAmount MAX_TOKEN_AMOUNT = 1000000000000000000LL;

inline bool AmountRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_TOKEN_AMOUNT); }

#endif // DUTCHX_AMOUNT_H
