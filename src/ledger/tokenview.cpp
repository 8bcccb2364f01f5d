// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/tokenview.h"

#include "logging.h"

#include <limits>
#include <stdexcept>

CAmount CTokenView::GetBalance(const CKeyID& token, const CKeyID& owner) const { return 0; }
uint256 CTokenView::GetNonceWord(const CKeyID& owner, uint64_t nWordPos) const { return uint256(); }
bool CTokenView::BatchWrite(CBalanceMap& mapBalances, CNonceMap& mapNonces) { return false; }

// =============================================================================
// CTokenLedger
// =============================================================================

CAmount CTokenLedger::GetBalance(const CKeyID& token, const CKeyID& owner) const
{
    CBalanceMap::const_iterator it = mapBalances.find(std::make_pair(token, owner));
    if (it == mapBalances.end()) {
        return 0;
    }
    return it->second;
}

uint256 CTokenLedger::GetNonceWord(const CKeyID& owner, uint64_t nWordPos) const
{
    CNonceMap::const_iterator it = mapNonces.find(std::make_pair(owner, nWordPos));
    if (it == mapNonces.end()) {
        return uint256();
    }
    return it->second;
}

bool CTokenLedger::BatchWrite(CBalanceMap& mapBalancesIn, CNonceMap& mapNoncesIn)
{
    for (CBalanceMap::iterator it = mapBalancesIn.begin(); it != mapBalancesIn.end(); it = mapBalancesIn.erase(it)) {
        if (it->second == 0) {
            mapBalances.erase(it->first);
        } else {
            mapBalances[it->first] = it->second;
        }
    }
    for (CNonceMap::iterator it = mapNoncesIn.begin(); it != mapNoncesIn.end(); it = mapNoncesIn.erase(it)) {
        mapNonces[it->first] = it->second;
    }
    return true;
}

bool CTokenLedger::Mint(const CKeyID& token, const CKeyID& owner, CAmount nAmount)
{
    if (!AmountRange(nAmount)) {
        return error("%s: amount %d out of range", __func__, nAmount);
    }
    CAmount& nBalance = mapBalances[std::make_pair(token, owner)];
    if (nBalance > std::numeric_limits<CAmount>::max() - nAmount) {
        return error("%s: balance overflow for %s", __func__, owner.ToString());
    }
    nBalance += nAmount;
    return true;
}

CAmount CTokenLedger::GetTotalSupply(const CKeyID& token) const
{
    CAmount nTotal = 0;
    for (const auto& entry : mapBalances) {
        if (entry.first.first == token) {
            nTotal += entry.second;
        }
    }
    return nTotal;
}

// =============================================================================
// CTokenViewCache
// =============================================================================

CTokenViewCache::CTokenViewCache(CTokenView* baseIn) : base(baseIn)
{
    if (base == nullptr) {
        throw std::invalid_argument("CTokenViewCache: null base view");
    }
}

CAmount CTokenViewCache::GetBalance(const CKeyID& token, const CKeyID& owner) const
{
    CBalanceMap::const_iterator it = cacheBalances.find(std::make_pair(token, owner));
    if (it != cacheBalances.end()) {
        return it->second;
    }
    return base->GetBalance(token, owner);
}

uint256 CTokenViewCache::GetNonceWord(const CKeyID& owner, uint64_t nWordPos) const
{
    CNonceMap::const_iterator it = cacheNonces.find(std::make_pair(owner, nWordPos));
    if (it != cacheNonces.end()) {
        return it->second;
    }
    return base->GetNonceWord(owner, nWordPos);
}

bool CTokenViewCache::BatchWrite(CBalanceMap& mapBalancesIn, CNonceMap& mapNoncesIn)
{
    for (CBalanceMap::iterator it = mapBalancesIn.begin(); it != mapBalancesIn.end(); it = mapBalancesIn.erase(it)) {
        cacheBalances[it->first] = it->second;
    }
    for (CNonceMap::iterator it = mapNoncesIn.begin(); it != mapNoncesIn.end(); it = mapNoncesIn.erase(it)) {
        cacheNonces[it->first] = it->second;
    }
    return true;
}

void CTokenViewCache::SetBalance(const CKeyID& token, const CKeyID& owner, CAmount nAmount)
{
    cacheBalances[std::make_pair(token, owner)] = nAmount;
}

void CTokenViewCache::SetNonceWord(const CKeyID& owner, uint64_t nWordPos, const uint256& word)
{
    cacheNonces[std::make_pair(owner, nWordPos)] = word;
}

bool CTokenViewCache::Transfer(const CKeyID& token, const CKeyID& from, const CKeyID& to, CAmount nAmount, CValidationState& state)
{
    if (!AmountRange(nAmount)) {
        return state.DoS(100, false, REJECT_INVALID, "bad-amount-range");
    }

    const CAmount nFromBalance = GetBalance(token, from);
    if (nFromBalance < nAmount) {
        return state.DoS(0, false, REJECT_POLICY, "insufficient-balance",
                         strprintf("%s holds %d of %s, needs %d", from.ToString(), nFromBalance, token.ToString(), nAmount));
    }
    if (nAmount == 0 || from == to) {
        return true;
    }

    const CAmount nToBalance = GetBalance(token, to);
    if (nToBalance > std::numeric_limits<CAmount>::max() - nAmount) {
        return state.DoS(100, false, REJECT_INVALID, "bad-amount-overflow");
    }

    SetBalance(token, from, nFromBalance - nAmount);
    SetBalance(token, to, nToBalance + nAmount);
    return true;
}

bool CTokenViewCache::Flush()
{
    return base->BatchWrite(cacheBalances, cacheNonces);
}
