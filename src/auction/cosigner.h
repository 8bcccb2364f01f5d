// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_AUCTION_COSIGNER_H
#define DUTCHX_AUCTION_COSIGNER_H

/**
 * Cosigner verification
 *
 * A cosigner tightens an order after the maker signed it. It signs
 *   SHA256d(orderHash || chainId || cosignerData)
 * where cosignerData is the variant's canonical encoding. The encoding must
 * match the signed bytes exactly, field for field.
 */

#include "chainparams.h"
#include "consensus/validation.h"
#include "hash.h"
#include "pubkey.h"
#include "uint256.h"
#include "version.h"

#include <vector>

template<typename T>
uint256 GetCosignerDigest(const uint256& orderHash, const T& cosignerData)
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    ss << orderHash << Params().GetConsensus().nChainId << cosignerData;
    return ss.GetHash();
}

/** Recover the CKeyID that produced a 65-byte compact signature over digest */
bool RecoverSigner(const uint256& digest, const std::vector<unsigned char>& vchSig, CKeyID& signerRet);

/**
 * VerifyCosignature - succeed if the signature recovers to cosigner, or if
 * cosigner is null (cosigning is optional for that order).
 *
 * @return false with "bad-cosignature" otherwise
 */
bool VerifyCosignature(const CKeyID& cosigner, const uint256& digest,
                       const std::vector<unsigned char>& vchSig, CValidationState& state);

#endif // DUTCHX_AUCTION_COSIGNER_H
