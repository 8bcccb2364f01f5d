// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_PRIMITIVES_ORDER_H
#define DUTCHX_PRIMITIVES_ORDER_H

/**
 * Order primitives shared by every order variant
 *
 * A maker signs one variant-specific payload; on the wire it travels as a
 * SignedOrder whose nType selects the variant. Resolution turns it into a
 * ResolvedOrder: exact input and outputs for one fill attempt, plus the
 * canonical hash the maker's permit signature commits to.
 *
 * OutputToken::chainId == 0 means "this domain". Cross-chain orders carry
 * the destination domain id on every output.
 */

#include "amount.h"
#include "pubkey.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

enum OrderType : uint8_t {
    ORDER_LIMIT = 1,
    ORDER_DUTCH = 2,
    ORDER_PRIORITY = 3,
    ORDER_HYBRID = 4,
    ORDER_CROSSCHAIN_LIMIT = 5,
    ORDER_CROSSCHAIN_DUTCH = 6,
};

std::string OrderTypeToString(uint8_t nType);

/** Fields common to every same-domain order */
struct OrderInfo
{
    CKeyID reactor;                 // Reactor deployment this order is valid for
    CKeyID swapper;                 // Maker
    uint64_t nonce{0};              // Permit nonce, single use per swapper
    int64_t deadline{0};            // Last timestamp at which the order may fill
    CKeyID validationContract;      // Null = no custom validation
    std::vector<unsigned char> validationData;
    CKeyID preExecutionHook;        // Null = none
    std::vector<unsigned char> preExecutionHookData;
    CKeyID postExecutionHook;       // Null = none
    std::vector<unsigned char> postExecutionHookData;

    SERIALIZE_METHODS(OrderInfo, obj)
    {
        READWRITE(obj.reactor, obj.swapper, obj.nonce, obj.deadline);
        READWRITE(obj.validationContract, obj.validationData);
        READWRITE(obj.preExecutionHook, obj.preExecutionHookData);
        READWRITE(obj.postExecutionHook, obj.postExecutionHookData);
    }
};

struct InputToken
{
    CKeyID token;
    CAmount amount{0};
    CAmount maxAmount{0};           // Most the permit signature may ever move

    SERIALIZE_METHODS(InputToken, obj) { READWRITE(obj.token, obj.amount, obj.maxAmount); }
};

struct OutputToken
{
    CKeyID token;
    CAmount amount{0};
    CKeyID recipient;
    uint64_t chainId{0};

    SERIALIZE_METHODS(OutputToken, obj) { READWRITE(obj.token, obj.amount, obj.recipient, obj.chainId); }

    friend bool operator==(const OutputToken& a, const OutputToken& b)
    {
        return a.token == b.token && a.amount == b.amount &&
               a.recipient == b.recipient && a.chainId == b.chainId;
    }
    friend bool operator!=(const OutputToken& a, const OutputToken& b) { return !(a == b); }
};

/** Wire form of any order: discriminator, canonical payload, maker signature */
struct SignedOrder
{
    uint8_t nType{0};
    std::vector<unsigned char> vchOrder;
    std::vector<unsigned char> vchSig;

    SERIALIZE_METHODS(SignedOrder, obj) { READWRITE(obj.nType, obj.vchOrder, obj.vchSig); }
};

/** Chain context a resolution is evaluated against */
struct FillContext
{
    int64_t nTime{0};
    int64_t nHeight{0};
    CAmount nPriorityFee{0};
    CKeyID filler;
};

/**
 * ResolvedOrder - concrete amounts for one fill attempt. Never persisted.
 * hash is the canonical hash of the unresolved order.
 */
struct ResolvedOrder
{
    uint8_t nType{0};
    OrderInfo info;
    InputToken input;
    std::vector<OutputToken> outputs;
    std::vector<unsigned char> vchSig;
    uint256 hash;
};

/** Emitted once per filled order */
struct CFillEvent
{
    uint256 orderHash;
    CKeyID filler;
    CKeyID swapper;
    uint64_t nonce{0};
};

#endif // DUTCHX_PRIMITIVES_ORDER_H
