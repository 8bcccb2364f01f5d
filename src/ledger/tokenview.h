// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_LEDGER_TOKENVIEW_H
#define DUTCHX_LEDGER_TOKENVIEW_H

/**
 * Token state views
 *
 * Layering follows the coins view pattern:
 *
 *   CTokenLedger      authoritative in-memory state of the host
 *     CTokenViewCache   one per operation (reactor call, settlement transition)
 *       CTokenViewCache   optional nested scope
 *
 * Writes land in the innermost cache. Flush() pushes them one layer down.
 * An operation that fails simply drops its cache, so no partial fund
 * movement ever reaches the ledger.
 *
 * Two kinds of state are tracked:
 *   - balances, keyed by (token, owner)
 *   - unordered permit nonce bitmaps, keyed by (owner, word position)
 */

#include "amount.h"
#include "consensus/validation.h"
#include "pubkey.h"
#include "uint256.h"

#include <map>
#include <utility>

typedef std::map<std::pair<CKeyID, CKeyID>, CAmount> CBalanceMap;
typedef std::map<std::pair<CKeyID, uint64_t>, uint256> CNonceMap;

/** Abstract view on token state */
class CTokenView
{
public:
    //! Balance of owner in token, 0 if unknown
    virtual CAmount GetBalance(const CKeyID& token, const CKeyID& owner) const;

    //! Nonce bitmap word, null if unknown
    virtual uint256 GetNonceWord(const CKeyID& owner, uint64_t nWordPos) const;

    //! Do a bulk modification. Entries are moved out of the maps.
    virtual bool BatchWrite(CBalanceMap& mapBalances, CNonceMap& mapNonces);

    //! As we use CTokenViews polymorphically, have a virtual destructor
    virtual ~CTokenView() {}
};

/** The host's authoritative token state */
class CTokenLedger : public CTokenView
{
private:
    CBalanceMap mapBalances;
    CNonceMap mapNonces;

public:
    CAmount GetBalance(const CKeyID& token, const CKeyID& owner) const override;
    uint256 GetNonceWord(const CKeyID& owner, uint64_t nWordPos) const override;
    bool BatchWrite(CBalanceMap& mapBalancesIn, CNonceMap& mapNoncesIn) override;

    //! Credit freshly issued tokens to owner
    bool Mint(const CKeyID& token, const CKeyID& owner, CAmount nAmount);

    //! Sum of every balance held in token
    CAmount GetTotalSupply(const CKeyID& token) const;
};

/** A view layered on top of another, buffering every write */
class CTokenViewCache : public CTokenView
{
private:
    CTokenView* base;
    CBalanceMap cacheBalances;
    CNonceMap cacheNonces;

    void SetBalance(const CKeyID& token, const CKeyID& owner, CAmount nAmount);

public:
    explicit CTokenViewCache(CTokenView* baseIn);

    CTokenViewCache(const CTokenViewCache&) = delete;
    CTokenViewCache& operator=(const CTokenViewCache&) = delete;

    CAmount GetBalance(const CKeyID& token, const CKeyID& owner) const override;
    uint256 GetNonceWord(const CKeyID& owner, uint64_t nWordPos) const override;
    bool BatchWrite(CBalanceMap& mapBalancesIn, CNonceMap& mapNoncesIn) override;

    void SetNonceWord(const CKeyID& owner, uint64_t nWordPos, const uint256& word);

    /**
     * Transfer - move nAmount of token from one owner to another
     *
     * @return false with "bad-amount-range", "insufficient-balance" or
     *         "bad-amount-overflow"
     */
    bool Transfer(const CKeyID& token, const CKeyID& from, const CKeyID& to, CAmount nAmount, CValidationState& state);

    //! Push the modifications down to the base view and clear this cache
    bool Flush();

    //! Number of cached entries
    size_t GetCacheSize() const { return cacheBalances.size() + cacheNonces.size(); }
};

#endif // DUTCHX_LEDGER_TOKENVIEW_H
