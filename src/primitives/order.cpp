// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/order.h"

std::string OrderTypeToString(uint8_t nType)
{
    switch (nType) {
    case ORDER_LIMIT: return "limit";
    case ORDER_DUTCH: return "dutch";
    case ORDER_PRIORITY: return "priority";
    case ORDER_HYBRID: return "hybrid";
    case ORDER_CROSSCHAIN_LIMIT: return "crosschain-limit";
    case ORDER_CROSSCHAIN_DUTCH: return "crosschain-dutch";
    default: return "unknown";
    }
}
