// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "auction/cosigner.h"

#include "logging.h"

bool RecoverSigner(const uint256& digest, const std::vector<unsigned char>& vchSig, CKeyID& signerRet)
{
    CPubKey pubkey;
    if (!pubkey.RecoverCompact(digest, vchSig)) {
        return false;
    }
    signerRet = pubkey.GetID();
    return true;
}

bool VerifyCosignature(const CKeyID& cosigner, const uint256& digest,
                       const std::vector<unsigned char>& vchSig, CValidationState& state)
{
    if (cosigner.IsNull()) {
        return true;
    }

    CKeyID signer;
    if (!RecoverSigner(digest, vchSig, signer) || signer != cosigner) {
        LogPrint(BCLog::AUCTION, "VerifyCosignature: digest %s does not recover to %s\n",
                 digest.ToString().substr(0, 16), cosigner.ToString());
        return state.DoS(100, false, REJECT_UNAUTHORIZED, "bad-cosignature");
    }
    return true;
}
