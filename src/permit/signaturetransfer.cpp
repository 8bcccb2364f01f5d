// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "permit/signaturetransfer.h"

#include "auction/cosigner.h"
#include "auction/orders.h"
#include "chainparams.h"
#include "hash.h"
#include "logging.h"
#include "version.h"

uint256 CSignatureTransfer::GetPermitDigest(const PermitTransferFrom& permit, const CKeyID& spender, const uint256& witness) const
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    ss << GetTypeHash(PERMIT_WITNESS_TRANSFER_TYPE);
    ss << Params().GetConsensus().nChainId << id;
    ss << permit << spender << witness;
    return ss.GetHash();
}

bool CSignatureTransfer::IsNonceUsed(const CTokenView& view, const CKeyID& owner, uint64_t nNonce)
{
    const uint256 word = view.GetNonceWord(owner, nNonce >> 8);
    const unsigned int nBit = nNonce & 0xff;
    return (word.begin()[nBit / 8] >> (nBit % 8)) & 1;
}

bool CSignatureTransfer::UseUnorderedNonce(CTokenViewCache& view, const CKeyID& owner, uint64_t nNonce, CValidationState& state)
{
    const uint64_t nWordPos = nNonce >> 8;
    const unsigned int nBit = nNonce & 0xff;

    uint256 word = view.GetNonceWord(owner, nWordPos);
    unsigned char& chByte = word.begin()[nBit / 8];
    if ((chByte >> (nBit % 8)) & 1) {
        return state.DoS(0, false, REJECT_DUPLICATE, "permit-nonce-reused");
    }
    chByte |= (unsigned char)(1 << (nBit % 8));
    view.SetNonceWord(owner, nWordPos, word);
    return true;
}

void CSignatureTransfer::InvalidateUnorderedNonces(CTokenViewCache& view, const CKeyID& owner, uint64_t nWordPos, const uint256& mask)
{
    uint256 word = view.GetNonceWord(owner, nWordPos);
    unsigned char* pword = word.begin();
    const unsigned char* pmask = mask.begin();
    for (unsigned int i = 0; i < word.size(); i++) {
        pword[i] |= pmask[i];
    }
    view.SetNonceWord(owner, nWordPos, word);

    LogPrint(BCLog::PERMIT, "InvalidateUnorderedNonces: owner=%s word=%d mask=%s\n",
             owner.ToString(), nWordPos, mask.GetHex());
}

bool CSignatureTransfer::PermitWitnessTransferFrom(CTokenViewCache& view, const PermitTransferFrom& permit,
                                                   const SignatureTransferDetails& details, const CKeyID& owner,
                                                   const CKeyID& spender, const uint256& witness,
                                                   const std::vector<unsigned char>& vchSig, int64_t nTime,
                                                   CValidationState& state)
{
    if (nTime > permit.deadline) {
        return state.DoS(0, false, REJECT_TIMING, "permit-expired");
    }
    if (details.requestedAmount > permit.permitted.amount) {
        return state.DoS(100, false, REJECT_INVALID, "permit-amount-too-high");
    }

    CKeyID signer;
    if (!RecoverSigner(GetPermitDigest(permit, spender, witness), vchSig, signer) || signer != owner) {
        return state.DoS(100, false, REJECT_UNAUTHORIZED, "permit-invalid-signature");
    }

    if (!UseUnorderedNonce(view, owner, permit.nonce, state)) {
        return false;
    }
    if (!view.Transfer(permit.permitted.token, owner, details.to, details.requestedAmount, state)) {
        return false;
    }

    LogPrint(BCLog::PERMIT, "PermitWitnessTransferFrom: %d of %s from %s to %s (nonce %d, witness %s)\n",
             details.requestedAmount, permit.permitted.token.ToString(), owner.ToString(),
             details.to.ToString(), permit.nonce, witness.ToString().substr(0, 16));
    return true;
}
