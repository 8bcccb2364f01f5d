// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_SETTLEMENT_SETTLEMENTDB_H
#define DUTCHX_SETTLEMENT_SETTLEMENTDB_H

/**
 * Settlement Database
 *
 * Persists ActiveSettlement records under <datadir>/settlement. Records are
 * never erased: terminal settlements stay as the proof that an order hash
 * was already settled.
 */

#include "dbwrapper.h"
#include "settlement/settlement.h"

#include <functional>
#include <map>
#include <memory>

class CSettlementDB
{
private:
    std::unique_ptr<CDBWrapper> db;

public:
    explicit CSettlementDB(size_t nCacheSize, bool fWipe = false);
    ~CSettlementDB();

    bool WriteSettlement(const ActiveSettlement& settlement);
    bool ReadSettlement(const uint256& orderHash, ActiveSettlement& settlement) const;
    bool HasSettlement(const uint256& orderHash) const;

    /**
     * ForEachSettlement - Iterate over all settlement records
     *
     * @param func Callback function (return false to stop iteration)
     */
    void ForEachSettlement(std::function<bool(const ActiveSettlement&)> func) const;

    /**
     * Batch - pending settlement writes, committed by the owner together
     * with the token view the same transitions moved funds in.
     *
     * Reads go through the pending writes first, so several transitions
     * can be staged in one batch. Dropping an uncommitted batch discards
     * every staged record.
     */
    class Batch
    {
    private:
        CDBBatch batch;
        CSettlementDB& parent;
        std::map<uint256, ActiveSettlement> mapPending;

    public:
        explicit Batch(CSettlementDB& db);

        void WriteSettlement(const ActiveSettlement& settlement);
        bool ReadSettlement(const uint256& orderHash, ActiveSettlement& settlement) const;
        bool HasSettlement(const uint256& orderHash) const;

        size_t GetPendingCount() const { return mapPending.size(); }

        bool Commit();
    };

    Batch CreateBatch() { return Batch(*this); }

    // Sync to disk
    bool Sync();
};

// Global settlement DB instance
extern std::unique_ptr<CSettlementDB> g_settlementdb;

/**
 * InitSettlementDB - Initialize the settlement database
 *
 * @param nCacheSize DB cache size in bytes
 * @param fWipe If true, wipe and recreate DB
 * @return true on success
 */
bool InitSettlementDB(size_t nCacheSize, bool fWipe = false);

#endif // DUTCHX_SETTLEMENT_SETTLEMENTDB_H
