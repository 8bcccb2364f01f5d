// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_SETTLEMENT_SETTLEMENT_H
#define DUTCHX_SETTLEMENT_SETTLEMENT_H

/**
 * Cross-domain settlement
 *
 * A cross-chain order is filled on a destination domain while the maker's
 * input stays escrowed on the origin domain:
 *
 *   initiate       maker input (by permit) + filler collateral -> escrow
 *   challenge      challenger collateral -> escrow, optimistic path frozen
 *   finalize       oracle attests delivery; escrow -> origin filler
 *   optimistic     no challenge before optimisticDeadline; escrow -> origin filler
 *   cancel         challengeDeadline passed; input -> maker, collateral per rules
 *
 * Lifecycle:
 *   PENDING    -> CHALLENGED | SUCCESS | CANCELLED
 *   CHALLENGED -> SUCCESS | CANCELLED
 *   SUCCESS, CANCELLED are terminal
 *
 * The transition table lives in settlement.cpp and is the only place that
 * decides whether a move is legal.
 *
 * DB Keys:
 * 'S' + orderHash -> ActiveSettlement
 */

#include "amount.h"
#include "auction/decay.h"
#include "consensus/validation.h"
#include "primitives/order.h"
#include "pubkey.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

// DB Key prefixes
static const char DB_SETTLEMENT = 'S';        // ActiveSettlement by order hash

static const uint8_t ACTIVE_SETTLEMENT_VERSION = 1;

static const char* const CROSSCHAIN_LIMIT_ORDER_TYPE =
    "CrossChainLimitOrder(SettlementInfo info,InputToken input,CollateralToken fillerCollateral,"
    "CollateralToken challengerCollateral,OutputToken[] outputs)";
static const char* const CROSSCHAIN_DUTCH_ORDER_TYPE =
    "CrossChainDutchOrder(SettlementInfo info,uint256 decayStartTime,uint256 decayEndTime,DutchInput input,"
    "CollateralToken fillerCollateral,CollateralToken challengerCollateral,DutchOutput[] outputs)";

/**
 * SettlementInfo - fields common to every cross-chain order
 */
struct SettlementInfo
{
    CKeyID settler;                 // Settler deployment this order is valid for
    CKeyID offerer;                 // Maker
    uint64_t nonce{0};              // Permit nonce
    int64_t initiateDeadline{0};    // Last timestamp at which initiate may run
    int64_t fillPeriod{0};          // Seconds the filler has to deliver
    int64_t optimisticPeriod{0};    // Seconds before an unchallenged settlement may finalize
    int64_t challengePeriod{0};     // Seconds during which a challenge may be posted
    CKeyID settlementOracle;        // Only identity allowed to call Finalize
    CKeyID validationContract;      // Null = no custom validation
    std::vector<unsigned char> validationData;

    SERIALIZE_METHODS(SettlementInfo, obj)
    {
        READWRITE(obj.settler, obj.offerer, obj.nonce, obj.initiateDeadline);
        READWRITE(obj.fillPeriod, obj.optimisticPeriod, obj.challengePeriod);
        READWRITE(obj.settlementOracle, obj.validationContract, obj.validationData);
    }

    bool IsTriviallyValid(std::string& strError) const;
};

struct CollateralToken
{
    CKeyID token;
    CAmount amount{0};

    SERIALIZE_METHODS(CollateralToken, obj) { READWRITE(obj.token, obj.amount); }
};

/** Fixed-amount cross-chain order */
struct CCrossChainLimitOrder
{
    SettlementInfo info;
    InputToken input;
    CollateralToken fillerCollateral;
    CollateralToken challengerCollateral;
    std::vector<OutputToken> outputs;

    SERIALIZE_METHODS(CCrossChainLimitOrder, obj)
    {
        READWRITE(obj.info, obj.input, obj.fillerCollateral, obj.challengerCollateral, obj.outputs);
    }

    uint256 GetHash() const;
    bool IsTriviallyValid(std::string& strError) const;
};

/** Time-decaying cross-chain order; decays until initiation */
struct CCrossChainDutchOrder
{
    SettlementInfo info;
    int64_t decayStartTime{0};
    int64_t decayEndTime{0};
    DutchInput input;
    CollateralToken fillerCollateral;
    CollateralToken challengerCollateral;
    std::vector<DutchOutput> outputs;

    SERIALIZE_METHODS(CCrossChainDutchOrder, obj)
    {
        READWRITE(obj.info, obj.decayStartTime, obj.decayEndTime, obj.input);
        READWRITE(obj.fillerCollateral, obj.challengerCollateral, obj.outputs);
    }

    uint256 GetHash() const;
    bool IsTriviallyValid(std::string& strError) const;
};

/** Concrete amounts of a cross-chain order at initiation */
struct ResolvedCrossChainOrder
{
    uint8_t nType{0};
    SettlementInfo info;
    InputToken input;
    CollateralToken fillerCollateral;
    CollateralToken challengerCollateral;
    std::vector<OutputToken> outputs;
    std::vector<unsigned char> vchSig;
    uint256 hash;
};

bool ResolveCrossChainLimitOrder(const CCrossChainLimitOrder& order, int64_t nTime,
                                 ResolvedCrossChainOrder& resolvedRet, CValidationState& state);
bool ResolveCrossChainDutchOrder(const CCrossChainDutchOrder& order, int64_t nTime,
                                 ResolvedCrossChainOrder& resolvedRet, CValidationState& state);

/** Decode a SignedOrder of a cross-chain type and resolve it at nTime */
bool ResolveCrossChainOrder(const SignedOrder& signedOrder, int64_t nTime,
                            ResolvedCrossChainOrder& resolvedRet, CValidationState& state);

/**
 * SettlementStatus - State of an ActiveSettlement
 */
enum class SettlementStatus : uint8_t {
    PENDING = 0,
    CHALLENGED = 1,
    CANCELLED = 2,
    SUCCESS = 3,
};

std::string SettlementStatusToString(SettlementStatus status);

enum class SettlementTransition : uint8_t {
    CHALLENGE,
    FINALIZE,
    FINALIZE_OPTIMISTICALLY,
    CANCEL,
};

std::string SettlementTransitionToString(SettlementTransition transition);

inline bool IsTerminal(SettlementStatus status)
{
    return status == SettlementStatus::CANCELLED || status == SettlementStatus::SUCCESS;
}

/**
 * GetNextStatus - look up a transition in the settlement transition table
 *
 * @return false with "settlement-terminal" if from is terminal, or
 *         "settlement-bad-transition" if the table has no such move
 */
bool GetNextStatus(SettlementStatus from, SettlementTransition transition,
                   SettlementStatus& toRet, CValidationState& state);

/**
 * ActiveSettlement - persisted escrow record, keyed by order hash
 */
struct ActiveSettlement
{
    uint8_t nVersion{ACTIVE_SETTLEMENT_VERSION};
    uint256 orderHash;
    SettlementStatus status{SettlementStatus::PENDING};
    CKeyID offerer;
    CKeyID originFiller;
    CKeyID destinationFiller;
    CKeyID challenger;              // Null until challenged
    CKeyID settlementOracle;
    int64_t fillDeadline{0};
    int64_t optimisticDeadline{0};
    int64_t challengeDeadline{0};
    InputToken input;
    CollateralToken fillerCollateral;
    CollateralToken challengerCollateral;
    std::vector<OutputToken> outputs;

    bool IsChallenged() const { return status == SettlementStatus::CHALLENGED; }

    SERIALIZE_METHODS(ActiveSettlement, obj)
    {
        READWRITE(obj.nVersion, obj.orderHash);
        // Serialize enum class as uint8_t
        uint8_t statusByte = static_cast<uint8_t>(obj.status);
        READWRITE(statusByte);
        SER_READ(obj, obj.status = static_cast<SettlementStatus>(statusByte));
        READWRITE(obj.offerer, obj.originFiller, obj.destinationFiller, obj.challenger, obj.settlementOracle);
        READWRITE(obj.fillDeadline, obj.optimisticDeadline, obj.challengeDeadline);
        READWRITE(obj.input, obj.fillerCollateral, obj.challengerCollateral, obj.outputs);
    }

    std::string ToString() const;
};

#endif // DUTCHX_SETTLEMENT_SETTLEMENT_H
