// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_CONSENSUS_PARAMS_H
#define DUTCHX_CONSENSUS_PARAMS_H

#include "amount.h"

#include <stddef.h>
#include <stdint.h>

namespace Consensus {

/**
 * Parameters that influence order resolution, execution and settlement.
 * One instance per network, owned by CChainParams.
 */
struct Params {
    /** Domain id bound into every signed digest; outputs for other ids are cross-domain */
    uint64_t nChainId;

    /** Cap on any protocol fee, in basis points of the order's value in the fee token */
    int64_t nMaxFeeBps;

    /** DoS limits */
    size_t nMaxBatchSize;
    size_t nMaxOutputsPerOrder;
    size_t nMaxPriorityCurvePoints;

    /** Upper bounds on the periods a cross-chain order may request (seconds) */
    int64_t nMaxFillPeriod;
    int64_t nMaxOptimisticPeriod;
    int64_t nMaxChallengePeriod;
};

} // namespace Consensus

#endif // DUTCHX_CONSENSUS_PARAMS_H
