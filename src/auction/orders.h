// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_AUCTION_ORDERS_H
#define DUTCHX_AUCTION_ORDERS_H

/**
 * Same-domain order variants
 *
 * Each variant has:
 *   - a wire layout (SERIALIZE_METHODS), which is what the SignedOrder payload carries
 *   - a canonical hash: SHA256d(typehash || signed fields), where typehash is
 *     SHA256d of the variant's type string. Cosigner data and the cosignature
 *     are not signed by the maker and are never hashed.
 *   - IsTriviallyValid(): context free structural checks
 *
 * Variant-specific resolution lives in auction/resolver.cpp.
 */

#include "amount.h"
#include "auction/decay.h"
#include "primitives/order.h"
#include "pubkey.h"
#include "serialize.h"
#include "streams.h"
#include "uint256.h"
#include "version.h"

#include <exception>
#include <string>
#include <vector>

static const char* const LIMIT_ORDER_TYPE =
    "LimitOrder(OrderInfo info,InputToken input,OutputToken[] outputs)";
static const char* const DUTCH_ORDER_TYPE =
    "DutchOrder(OrderInfo info,address cosigner,uint256 decayStartTime,uint256 decayEndTime,"
    "address exclusiveFiller,uint256 exclusivityOverrideBps,DutchInput input,DutchOutput[] outputs)";
static const char* const PRIORITY_ORDER_TYPE =
    "PriorityOrder(OrderInfo info,address cosigner,uint256 auctionStartBlock,uint256 baselinePriorityFeeWei,"
    "PriorityInput input,PriorityOutput[] outputs)";
static const char* const HYBRID_ORDER_TYPE =
    "HybridOrder(OrderInfo info,address cosigner,uint256 auctionStartBlock,uint256 auctionEndBlock,"
    "uint256 baselinePriorityFeeWei,PriorityCurvePoint[] priorityCurve,DutchInput input,DutchOutput[] outputs)";

/** SHA256d of a type string */
uint256 GetTypeHash(const char* pszType);

/** Structural checks shared by every variant */
bool CheckOrderInfo(const OrderInfo& info, std::string& strError);

/**
 * CLimitOrder - fixed input, fixed outputs
 */
struct CLimitOrder
{
    OrderInfo info;
    InputToken input;
    std::vector<OutputToken> outputs;

    SERIALIZE_METHODS(CLimitOrder, obj) { READWRITE(obj.info, obj.input, obj.outputs); }

    uint256 GetHash() const;
    bool IsTriviallyValid(std::string& strError) const;
};

/**
 * Cosigner-supplied overrides for a Dutch order. Zero / null fields keep the
 * maker's value. Amount overrides may only tighten the maker's terms.
 */
struct DutchCosignerData
{
    int64_t decayStartTime{0};
    int64_t decayEndTime{0};
    CKeyID exclusiveFiller;
    int64_t exclusivityOverrideBps{0};
    CAmount inputOverride{0};
    std::vector<CAmount> outputOverrides;

    SERIALIZE_METHODS(DutchCosignerData, obj)
    {
        READWRITE(obj.decayStartTime, obj.decayEndTime, obj.exclusiveFiller, obj.exclusivityOverrideBps);
        READWRITE(obj.inputOverride, obj.outputOverrides);
    }
};

/**
 * CDutchOrder - time-decaying order with an optional cosigner and an
 * exclusivity window ending at decayStartTime.
 */
struct CDutchOrder
{
    OrderInfo info;
    CKeyID cosigner;
    int64_t decayStartTime{0};
    int64_t decayEndTime{0};
    CKeyID exclusiveFiller;
    int64_t exclusivityOverrideBps{0};
    DutchInput input;
    std::vector<DutchOutput> outputs;
    DutchCosignerData cosignerData;
    std::vector<unsigned char> vchCosignature;

    SERIALIZE_METHODS(CDutchOrder, obj)
    {
        READWRITE(obj.info, obj.cosigner, obj.decayStartTime, obj.decayEndTime);
        READWRITE(obj.exclusiveFiller, obj.exclusivityOverrideBps, obj.input, obj.outputs);
        READWRITE(obj.cosignerData, obj.vchCosignature);
    }

    uint256 GetHash() const;
    bool IsTriviallyValid(std::string& strError) const;
};

struct PriorityCosignerData
{
    int64_t auctionTargetBlock{0};

    SERIALIZE_METHODS(PriorityCosignerData, obj) { READWRITE(obj.auctionTargetBlock); }
};

/**
 * CPriorityOrder - amounts scale with the fill's priority fee above a
 * baseline, starting at auctionStartBlock.
 */
struct CPriorityOrder
{
    OrderInfo info;
    CKeyID cosigner;
    int64_t auctionStartBlock{0};
    CAmount baselinePriorityFee{0};
    PriorityInput input;
    std::vector<PriorityOutput> outputs;
    PriorityCosignerData cosignerData;
    std::vector<unsigned char> vchCosignature;

    SERIALIZE_METHODS(CPriorityOrder, obj)
    {
        READWRITE(obj.info, obj.cosigner, obj.auctionStartBlock, obj.baselinePriorityFee);
        READWRITE(obj.input, obj.outputs, obj.cosignerData, obj.vchCosignature);
    }

    uint256 GetHash() const;
    bool IsTriviallyValid(std::string& strError) const;
};

struct HybridCosignerData
{
    int64_t auctionTargetBlock{0};
    CAmount inputOverride{0};
    std::vector<CAmount> outputOverrides;

    SERIALIZE_METHODS(HybridCosignerData, obj)
    {
        READWRITE(obj.auctionTargetBlock, obj.inputOverride, obj.outputOverrides);
    }
};

/**
 * CHybridOrder - Dutch decay over block numbers, then a priority-fee curve
 * multiplier on the decaying side (outputs when nothing decays).
 */
struct CHybridOrder
{
    OrderInfo info;
    CKeyID cosigner;
    int64_t auctionStartBlock{0};
    int64_t auctionEndBlock{0};
    CAmount baselinePriorityFee{0};
    std::vector<PriorityCurvePoint> priorityCurve;
    DutchInput input;
    std::vector<DutchOutput> outputs;
    HybridCosignerData cosignerData;
    std::vector<unsigned char> vchCosignature;

    SERIALIZE_METHODS(CHybridOrder, obj)
    {
        READWRITE(obj.info, obj.cosigner, obj.auctionStartBlock, obj.auctionEndBlock);
        READWRITE(obj.baselinePriorityFee, obj.priorityCurve, obj.input, obj.outputs);
        READWRITE(obj.cosignerData, obj.vchCosignature);
    }

    uint256 GetHash() const;
    bool IsTriviallyValid(std::string& strError) const;
};

/**
 * Input and outputs may not both decay, inputs may only decay up and
 * outputs only down. Shared by the Dutch-style variants.
 */
bool CheckDutchAmounts(const DutchInput& input, const std::vector<DutchOutput>& outputs, std::string& strError);

/** Canonical payload bytes of an order */
template<typename T>
std::vector<unsigned char> EncodeOrder(const T& order)
{
    CDataStream ss(SER_NETWORK, PROTOCOL_VERSION);
    ss << order;
    return std::vector<unsigned char>(ss.begin(), ss.end());
}

/** Decode a payload; trailing bytes are rejected */
template<typename T>
bool DecodeOrder(const std::vector<unsigned char>& vchOrder, T& order, std::string& strError)
{
    try {
        CDataStream ss(vchOrder, SER_NETWORK, PROTOCOL_VERSION);
        ss >> order;
        if (!ss.empty()) {
            strError = "bad-order-payload";
            return false;
        }
    } catch (const std::exception&) {
        strError = "bad-order-payload";
        return false;
    }
    return true;
}

#endif // DUTCHX_AUCTION_ORDERS_H
