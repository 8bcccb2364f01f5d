// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_PERMIT_SIGNATURETRANSFER_H
#define DUTCHX_PERMIT_SIGNATURETRANSFER_H

/**
 * Signature based token transfers (permits)
 *
 * A maker never approves the reactor or the settler. Instead every order
 * carries a one-shot permit signature:
 *
 *   digest = SHA256d(typehash || chainId || service id || permit || spender || witness)
 *
 * where witness is the canonical order hash, so a permit can only move funds
 * for the exact order it was signed with, and only by the declared spender.
 *
 * Nonces are unordered: nonce n is bit (n & 0xff) of word (n >> 8) in the
 * owner's bitmap. A set bit can never be cleared.
 */

#include "amount.h"
#include "consensus/validation.h"
#include "ledger/tokenview.h"
#include "pubkey.h"
#include "serialize.h"
#include "uint256.h"

#include <vector>

static const char* const PERMIT_WITNESS_TRANSFER_TYPE =
    "PermitWitnessTransferFrom(TokenPermissions permitted,address spender,uint256 nonce,uint256 deadline,bytes32 witness)";

struct TokenPermissions
{
    CKeyID token;
    CAmount amount{0};              // Most that may be requested

    SERIALIZE_METHODS(TokenPermissions, obj) { READWRITE(obj.token, obj.amount); }
};

struct PermitTransferFrom
{
    TokenPermissions permitted;
    uint64_t nonce{0};
    int64_t deadline{0};

    SERIALIZE_METHODS(PermitTransferFrom, obj) { READWRITE(obj.permitted, obj.nonce, obj.deadline); }
};

struct SignatureTransferDetails
{
    CKeyID to;
    CAmount requestedAmount{0};
};

/**
 * CTransferCollaborator - the only way the reactor and the settler move a
 * maker's funds. Implementations must consume the nonce and verify the
 * owner's signature before touching any balance.
 */
class CTransferCollaborator
{
public:
    virtual ~CTransferCollaborator() {}

    virtual bool PermitWitnessTransferFrom(CTokenViewCache& view, const PermitTransferFrom& permit,
                                           const SignatureTransferDetails& details, const CKeyID& owner,
                                           const CKeyID& spender, const uint256& witness,
                                           const std::vector<unsigned char>& vchSig, int64_t nTime,
                                           CValidationState& state) = 0;
};

/** Reference permit service */
class CSignatureTransfer : public CTransferCollaborator
{
private:
    CKeyID id;

public:
    explicit CSignatureTransfer(const CKeyID& idIn) : id(idIn) {}

    const CKeyID& GetId() const { return id; }

    /** Digest the owner signs for one permit */
    uint256 GetPermitDigest(const PermitTransferFrom& permit, const CKeyID& spender, const uint256& witness) const;

    /**
     * PermitWitnessTransferFrom - move details.requestedAmount of the
     * permitted token from owner to details.to.
     *
     * Fails with "permit-expired", "permit-amount-too-high",
     * "permit-invalid-signature", "permit-nonce-reused" or a transfer error.
     */
    bool PermitWitnessTransferFrom(CTokenViewCache& view, const PermitTransferFrom& permit,
                                   const SignatureTransferDetails& details, const CKeyID& owner,
                                   const CKeyID& spender, const uint256& witness,
                                   const std::vector<unsigned char>& vchSig, int64_t nTime,
                                   CValidationState& state) override;

    /** Burn every nonce whose bit is set in mask, cancelling the orders that use them */
    void InvalidateUnorderedNonces(CTokenViewCache& view, const CKeyID& owner, uint64_t nWordPos, const uint256& mask);

    static bool IsNonceUsed(const CTokenView& view, const CKeyID& owner, uint64_t nNonce);

    /** Mark a nonce used; false with "permit-nonce-reused" if it already was */
    static bool UseUnorderedNonce(CTokenViewCache& view, const CKeyID& owner, uint64_t nNonce, CValidationState& state);
};

#endif // DUTCHX_PERMIT_SIGNATURETRANSFER_H
