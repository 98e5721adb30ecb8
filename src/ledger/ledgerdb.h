// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_LEDGERDB_H
#define CHAINBILLS_LEDGERDB_H

/**
 * Ledger Database
 *
 * LevelDB storage for every ledger entity, under <datadir>/ledger.
 *
 * Key Prefixes:
 *   'c'                                   -> uint16_t (chain id marker)
 *   'p' + payable id                      -> PayableRecord
 *   'u' + (wallet, chain id)              -> UserRecord
 *   'y' + payment id                      -> UserPaymentRecord
 *   'q' + payment id                      -> PayablePaymentRecord
 *   'w' + withdrawal id                   -> WithdrawalRecord
 *   'n' + CounterKey                      -> uint64_t
 *   'i' + (wallet, chain BE, seq BE)      -> payment id (user payments list)
 *   'j' + (payable id, seq BE)            -> payment id (payable payments list)
 *   'k' + (payable id, seq BE)            -> withdrawal id (payable withdrawals list)
 *   'l' + (wallet, chain BE, seq BE)      -> withdrawal id (user withdrawals list)
 *   't' + token                           -> TokenDetails
 *   'f' + chain id                        -> ForeignContract
 *   'r' + (emitter chain BE, hash)        -> ReceivedMessageRecord (replay guard)
 *   'F' + token                           -> uint64_t (collected withdrawal fees)
 *   'a' + chain count BE                  -> ActivityRecord
 *   'g' + (wallet, chain BE, seq BE)      -> activity chain count (user activities list)
 *   'h' + (payable id, seq BE)            -> activity chain count (payable activities list)
 *
 * Every mutating ledger operation stages its writes in one Batch and
 * commits once, so a rejected operation leaves the database untouched.
 */

#include "dbwrapper.h"
#include "ledger/counters.h"
#include "ledger/ledger.h"

#include <functional>
#include <map>
#include <memory>
#include <vector>

class CLedgerDB
{
private:
    std::unique_ptr<CDBWrapper> db;

public:
    explicit CLedgerDB(size_t nCacheSize, bool fWipe = false);
    ~CLedgerDB();

    // =========================================================================
    // Chain marker
    // =========================================================================

    bool ReadChainId(uint16_t& nChainId) const;
    bool WriteChainId(uint16_t nChainId);

    // =========================================================================
    // Entity lookups
    // =========================================================================

    bool ReadPayable(const uint256& payableId, PayableRecord& payable) const;
    bool ExistsPayable(const uint256& payableId) const;

    bool ReadUser(const uint256& wallet, uint16_t nChainId, UserRecord& user) const;
    bool ExistsUser(const uint256& wallet, uint16_t nChainId) const;

    bool ReadUserPayment(const uint256& paymentId, UserPaymentRecord& payment) const;
    bool ReadPayablePayment(const uint256& paymentId, PayablePaymentRecord& payment) const;
    bool ExistsPayablePayment(const uint256& paymentId) const;

    bool ReadWithdrawal(const uint256& withdrawalId, WithdrawalRecord& withdrawal) const;

    // =========================================================================
    // Ordered lists (1-based sequence numbers)
    // =========================================================================

    bool ReadUserPaymentId(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, uint256& paymentId) const;
    bool ReadUserWithdrawalId(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, uint256& withdrawalId) const;
    bool ReadPayablePaymentId(const uint256& payableId, uint64_t nSeq, uint256& paymentId) const;
    bool ReadPayableWithdrawalId(const uint256& payableId, uint64_t nSeq, uint256& withdrawalId) const;

    /**
     * Iterate over a payable's payment ids in payment order.
     *
     * @param func Callback (return false to stop)
     */
    void ForEachPayablePaymentId(const uint256& payableId,
                                 std::function<bool(uint64_t, const uint256&)> func) const;

    // =========================================================================
    // Activity log
    // =========================================================================

    bool ReadActivity(uint64_t nChainCount, ActivityRecord& activity) const;
    bool ReadUserActivityChainCount(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, uint64_t& nChainCount) const;
    bool ReadPayableActivityChainCount(const uint256& payableId, uint64_t nSeq, uint64_t& nChainCount) const;

    // =========================================================================
    // Counters
    // =========================================================================

    /** Last allocated value of a counter, 0 if nothing was allocated yet */
    uint64_t ReadCounter(const CounterKey& key) const;

    /** Overwrite a counter. Used when importing ledger state. */
    bool WriteCounter(const CounterKey& key, uint64_t nValue);

    // =========================================================================
    // Tokens, foreign contracts, fees
    // =========================================================================

    bool ReadTokenDetails(const uint256& token, TokenDetails& details) const;
    bool WriteTokenDetails(const TokenDetails& details);
    bool IsTokenSupported(const uint256& token) const;

    bool ReadForeignContract(uint16_t nChainId, ForeignContract& contract) const;
    bool WriteForeignContract(const ForeignContract& contract);

    uint64_t ReadCollectedFees(const uint256& token) const;

    // =========================================================================
    // Replay guard
    // =========================================================================

    bool ReadReceivedMessage(uint16_t nEmitterChainId, const uint256& hash, ReceivedMessageRecord& record) const;
    bool IsMessageReceived(uint16_t nEmitterChainId, const uint256& hash) const;

    /** Number of messages applied from a chain */
    uint64_t CountReceivedMessages(uint16_t nEmitterChainId) const;

    // =========================================================================
    // Batch Operations
    // =========================================================================

    class Batch
    {
    private:
        CDBBatch batch;
        CLedgerDB& parent;
        std::map<CounterKey, uint64_t> mapCounters;
        std::map<uint256, uint64_t> mapCollectedFees;

    public:
        explicit Batch(CLedgerDB& db);

        /**
         * Allocate the next value of a counter.
         *
         * Reads through values already allocated in this batch. Returns false
         * (and stages nothing) if the counter is exhausted.
         */
        bool NextCounter(const CounterKey& key, uint64_t& nValue);

        void WritePayable(const PayableRecord& payable);
        void WriteUser(const UserRecord& user);
        void WriteUserPayment(const UserPaymentRecord& payment);
        void WritePayablePayment(const PayablePaymentRecord& payment);
        void WriteWithdrawal(const WithdrawalRecord& withdrawal);

        void WriteUserPaymentId(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, const uint256& paymentId);
        void WriteUserWithdrawalId(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, const uint256& withdrawalId);
        void WritePayablePaymentId(const uint256& payableId, uint64_t nSeq, const uint256& paymentId);
        void WritePayableWithdrawalId(const uint256& payableId, uint64_t nSeq, const uint256& withdrawalId);

        void WriteActivity(const ActivityRecord& activity);
        void WriteUserActivity(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, uint64_t nChainCount);
        void WritePayableActivity(const uint256& payableId, uint64_t nSeq, uint64_t nChainCount);

        /** Add to the fees collected in a token. Returns false on overflow. */
        bool AddCollectedFees(const uint256& token, uint64_t nAmount);

        void WriteReceivedMessage(const ReceivedMessageRecord& record);

        bool Commit();
    };

    Batch CreateBatch() { return Batch(*this); }

    // Sync to disk
    bool Sync();
};

// Global ledger DB instance
extern std::unique_ptr<CLedgerDB> g_ledgerdb;

/**
 * Initialize the ledger database.
 *
 * Writes the chain id marker of the selected network on first open and
 * refuses to open a database created for another chain.
 *
 * @param nCacheSize DB cache size in bytes
 * @param fWipe If true, wipe and recreate DB
 * @return true on success
 */
bool InitLedgerDB(size_t nCacheSize, bool fWipe = false);

/** Read the chain statistics from the chain-scope counters */
ChainStats GetChainStats(const CLedgerDB& ledgerdb);

#endif // CHAINBILLS_LEDGERDB_H
