// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_AUCTION_RESOLVER_H
#define DUTCHX_AUCTION_RESOLVER_H

#include "auction/orders.h"
#include "consensus/validation.h"
#include "primitives/order.h"

/**
 * Auction resolver
 *
 * Turns a signed order and a FillContext into a ResolvedOrder. The resolved
 * hash is always the hash of the order as the maker signed it, computed
 * before any cosigner override is applied.
 *
 * Cosigner path (Dutch, priority, hybrid): taken when a cosigner is declared
 * and either the cosigner supplied no target block, or the signed auction
 * start is still in the future. On that path the cosignature is verified
 * first, then overrides are clamped: an input override may not exceed the
 * signed input start, an output override may not fall below the signed
 * output start.
 */

bool ResolveLimitOrder(const CLimitOrder& order, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state);
bool ResolveDutchOrder(const CDutchOrder& order, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state);
bool ResolvePriorityOrder(const CPriorityOrder& order, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state);
bool ResolveHybridOrder(const CHybridOrder& order, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state);

/**
 * ResolveOrder - decode a SignedOrder by its discriminator and resolve it.
 * Cross-chain variants are resolved by the settler, not here.
 */
bool ResolveOrder(const SignedOrder& signedOrder, const FillContext& ctx, ResolvedOrder& resolvedRet, CValidationState& state);

/** Scale outputs by (BPS + nOverrideBps) / BPS, rounding up */
bool ApplyExclusivityOverride(std::vector<OutputToken>& outputs, int64_t nOverrideBps, CValidationState& state);

#endif // DUTCHX_AUCTION_RESOLVER_H
