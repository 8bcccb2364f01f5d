// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/settlementdb.h"

#include "logging.h"
#include "util/system.h"

// Global settlement DB instance
std::unique_ptr<CSettlementDB> g_settlementdb;

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

} // anonymous namespace

CSettlementDB::CSettlementDB(size_t nCacheSize, bool fWipe)
{
    fs::path path = GetDataDir() / "settlement";
    db = std::make_unique<CDBWrapper>(path, nCacheSize, fWipe);
}

CSettlementDB::~CSettlementDB() = default;

bool CSettlementDB::WriteSettlement(const ActiveSettlement& settlement)
{
    return db->Write(MakeKey(DB_SETTLEMENT, settlement.orderHash), settlement);
}

bool CSettlementDB::ReadSettlement(const uint256& orderHash, ActiveSettlement& settlement) const
{
    return db->Read(MakeKey(DB_SETTLEMENT, orderHash), settlement);
}

bool CSettlementDB::HasSettlement(const uint256& orderHash) const
{
    return db->Exists(MakeKey(DB_SETTLEMENT, orderHash));
}

void CSettlementDB::ForEachSettlement(std::function<bool(const ActiveSettlement&)> func) const
{
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_SETTLEMENT, uint256()));

    while (it->Valid()) {
        std::pair<char, uint256> key;
        if (it->GetKey(key) && key.first == DB_SETTLEMENT) {
            ActiveSettlement settlement;
            if (it->GetValue(settlement)) {
                if (!func(settlement)) {
                    break;
                }
            }
            it->Next();
        } else {
            break;
        }
    }
}

bool CSettlementDB::Sync()
{
    return db->Sync();
}

// =============================================================================
// Batch
// =============================================================================

CSettlementDB::Batch::Batch(CSettlementDB& db) : batch(*db.db), parent(db)
{
}

void CSettlementDB::Batch::WriteSettlement(const ActiveSettlement& settlement)
{
    batch.Write(MakeKey(DB_SETTLEMENT, settlement.orderHash), settlement);
    mapPending[settlement.orderHash] = settlement;
}

bool CSettlementDB::Batch::ReadSettlement(const uint256& orderHash, ActiveSettlement& settlement) const
{
    auto it = mapPending.find(orderHash);
    if (it != mapPending.end()) {
        settlement = it->second;
        return true;
    }
    return parent.ReadSettlement(orderHash, settlement);
}

bool CSettlementDB::Batch::HasSettlement(const uint256& orderHash) const
{
    return mapPending.count(orderHash) != 0 || parent.HasSettlement(orderHash);
}

bool CSettlementDB::Batch::Commit()
{
    if (!parent.db->WriteBatch(batch)) {
        return false;
    }
    batch.Clear();
    mapPending.clear();
    return true;
}

bool InitSettlementDB(size_t nCacheSize, bool fWipe)
{
    try {
        g_settlementdb.reset();
        g_settlementdb = std::make_unique<CSettlementDB>(nCacheSize, fWipe);
        LogPrintf("Settlement DB: opened %s\n", (GetDataDir() / "settlement").string());
        return true;
    } catch (const std::exception& e) {
        return error("%s: %s", __func__, e.what());
    }
}
