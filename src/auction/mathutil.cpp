// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "auction/mathutil.h"

#include <limits>

typedef unsigned __int128 uint128_t;

static bool MulDiv(int64_t a, int64_t b, int64_t d, bool fRoundUp, int64_t& nResult)
{
    if (a < 0 || b < 0 || d <= 0) {
        return false;
    }
    uint128_t product = (uint128_t)a * (uint128_t)b;
    uint128_t quotient = product / (uint128_t)d;
    if (fRoundUp && (product % (uint128_t)d) != 0) {
        quotient += 1;
    }
    if (quotient > (uint128_t)std::numeric_limits<int64_t>::max()) {
        return false;
    }
    nResult = (int64_t)quotient;
    return true;
}

bool MulDivDown(int64_t a, int64_t b, int64_t d, int64_t& nResult)
{
    return MulDiv(a, b, d, false, nResult);
}

bool MulDivUp(int64_t a, int64_t b, int64_t d, int64_t& nResult)
{
    return MulDiv(a, b, d, true, nResult);
}
