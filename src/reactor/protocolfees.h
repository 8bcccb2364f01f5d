// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_REACTOR_PROTOCOLFEES_H
#define DUTCHX_REACTOR_PROTOCOLFEES_H

#include "consensus/validation.h"
#include "primitives/order.h"

#include <functional>
#include <vector>

/**
 * Fee controller: computes protocol fee outputs for a resolved order. Fee
 * outputs are not signed by the maker; they are paid by the filler on top
 * of the signed outputs.
 */
typedef std::function<std::vector<OutputToken>(const ResolvedOrder& order)> FeeController;

/**
 * InjectFees - query the controller, validate its outputs and append them.
 *
 * Each fee output must:
 *   - use a (token, recipient) pair no other fee output uses ("duplicate-fee-output")
 *   - be in a token the order already moves ("bad-fee-token")
 *   - keep the token's total fee within nMaxFeeBps of the order's value in
 *     that token ("fee-too-large")
 *
 * An empty controller leaves the order untouched.
 */
bool InjectFees(ResolvedOrder& order, const FeeController& controller, CValidationState& state);

#endif // DUTCHX_REACTOR_PROTOCOLFEES_H
