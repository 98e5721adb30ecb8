// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledgerdb.h"

#include "chainparams.h"
#include "clientversion.h"
#include "logging.h"
#include "util/system.h"

#include <limits>

// Global ledger DB instance
std::unique_ptr<CLedgerDB> g_ledgerdb;

// DB key prefixes
static const char DB_CHAIN_ID = 'c';
static const char DB_PAYABLE = 'p';
static const char DB_USER = 'u';
static const char DB_USER_PAYMENT = 'y';
static const char DB_PAYABLE_PAYMENT = 'q';
static const char DB_WITHDRAWAL = 'w';
static const char DB_COUNTER = 'n';
static const char DB_USER_PAYMENT_INDEX = 'i';
static const char DB_PAYABLE_PAYMENT_INDEX = 'j';
static const char DB_PAYABLE_WITHDRAWAL_INDEX = 'k';
static const char DB_USER_WITHDRAWAL_INDEX = 'l';
static const char DB_TOKEN = 't';
static const char DB_FOREIGN_CONTRACT = 'f';
static const char DB_RECEIVED_MESSAGE = 'r';
static const char DB_COLLECTED_FEES = 'F';
static const char DB_ACTIVITY = 'a';
static const char DB_USER_ACTIVITY_INDEX = 'g';
static const char DB_PAYABLE_ACTIVITY_INDEX = 'h';

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

// User key: wallet + chain id
struct UserKey
{
    uint256 wallet;
    uint16_t nChainId;

    SERIALIZE_METHODS(UserKey, obj)
    {
        READWRITE(obj.wallet, obj.nChainId);
    }
};

// User list key: wallet + chain (BE) + seq (BE), iterates in sequence order
struct UserSeqKey
{
    uint256 wallet;
    uint16_t nChainId;
    uint64_t nSeq;

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        ::Serialize(s, wallet);
        ser_writedata16be(s, nChainId);
        ser_writedata64be(s, nSeq);
    }

    template <typename Stream>
    void Unserialize(Stream& s)
    {
        ::Unserialize(s, wallet);
        nChainId = ser_readdata16be(s);
        nSeq = ser_readdata64be(s);
    }
};

// Payable list key: payable id + seq (BE)
struct PayableSeqKey
{
    uint256 payableId;
    uint64_t nSeq;

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        ::Serialize(s, payableId);
        ser_writedata64be(s, nSeq);
    }

    template <typename Stream>
    void Unserialize(Stream& s)
    {
        ::Unserialize(s, payableId);
        nSeq = ser_readdata64be(s);
    }
};

// Activity key: chain count (BE), iterates in log order
struct ActivityKey
{
    uint64_t nChainCount;

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        ser_writedata64be(s, nChainCount);
    }

    template <typename Stream>
    void Unserialize(Stream& s)
    {
        nChainCount = ser_readdata64be(s);
    }
};

// Replay guard key: emitter chain (BE) + message hash
struct MessageKey
{
    uint16_t nChainId;
    uint256 hash;

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        ser_writedata16be(s, nChainId);
        ::Serialize(s, hash);
    }

    template <typename Stream>
    void Unserialize(Stream& s)
    {
        nChainId = ser_readdata16be(s);
        ::Unserialize(s, hash);
    }
};

} // anonymous namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

CLedgerDB::CLedgerDB(size_t nCacheSize, bool fWipe)
{
    fs::path path = GetDataDir() / "ledger";
    db = std::make_unique<CDBWrapper>(path, nCacheSize, fWipe);
}

CLedgerDB::~CLedgerDB() = default;

// =============================================================================
// Chain marker
// =============================================================================

bool CLedgerDB::ReadChainId(uint16_t& nChainId) const
{
    return db->Read(DB_CHAIN_ID, nChainId);
}

bool CLedgerDB::WriteChainId(uint16_t nChainId)
{
    return db->Write(DB_CHAIN_ID, nChainId, true);
}

// =============================================================================
// Entity lookups
// =============================================================================

bool CLedgerDB::ReadPayable(const uint256& payableId, PayableRecord& payable) const
{
    return db->Read(MakeKey(DB_PAYABLE, payableId), payable);
}

bool CLedgerDB::ExistsPayable(const uint256& payableId) const
{
    return db->Exists(MakeKey(DB_PAYABLE, payableId));
}

bool CLedgerDB::ReadUser(const uint256& wallet, uint16_t nChainId, UserRecord& user) const
{
    return db->Read(MakeKey(DB_USER, UserKey{wallet, nChainId}), user);
}

bool CLedgerDB::ExistsUser(const uint256& wallet, uint16_t nChainId) const
{
    return db->Exists(MakeKey(DB_USER, UserKey{wallet, nChainId}));
}

bool CLedgerDB::ReadUserPayment(const uint256& paymentId, UserPaymentRecord& payment) const
{
    return db->Read(MakeKey(DB_USER_PAYMENT, paymentId), payment);
}

bool CLedgerDB::ReadPayablePayment(const uint256& paymentId, PayablePaymentRecord& payment) const
{
    return db->Read(MakeKey(DB_PAYABLE_PAYMENT, paymentId), payment);
}

bool CLedgerDB::ExistsPayablePayment(const uint256& paymentId) const
{
    return db->Exists(MakeKey(DB_PAYABLE_PAYMENT, paymentId));
}

bool CLedgerDB::ReadWithdrawal(const uint256& withdrawalId, WithdrawalRecord& withdrawal) const
{
    return db->Read(MakeKey(DB_WITHDRAWAL, withdrawalId), withdrawal);
}

// =============================================================================
// Ordered lists
// =============================================================================

bool CLedgerDB::ReadUserPaymentId(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, uint256& paymentId) const
{
    return db->Read(MakeKey(DB_USER_PAYMENT_INDEX, UserSeqKey{wallet, nChainId, nSeq}), paymentId);
}

bool CLedgerDB::ReadUserWithdrawalId(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, uint256& withdrawalId) const
{
    return db->Read(MakeKey(DB_USER_WITHDRAWAL_INDEX, UserSeqKey{wallet, nChainId, nSeq}), withdrawalId);
}

bool CLedgerDB::ReadPayablePaymentId(const uint256& payableId, uint64_t nSeq, uint256& paymentId) const
{
    return db->Read(MakeKey(DB_PAYABLE_PAYMENT_INDEX, PayableSeqKey{payableId, nSeq}), paymentId);
}

bool CLedgerDB::ReadPayableWithdrawalId(const uint256& payableId, uint64_t nSeq, uint256& withdrawalId) const
{
    return db->Read(MakeKey(DB_PAYABLE_WITHDRAWAL_INDEX, PayableSeqKey{payableId, nSeq}), withdrawalId);
}

void CLedgerDB::ForEachPayablePaymentId(const uint256& payableId,
                                        std::function<bool(uint64_t, const uint256&)> func) const
{
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_PAYABLE_PAYMENT_INDEX, PayableSeqKey{payableId, 0}));

    while (it->Valid()) {
        std::pair<char, PayableSeqKey> key;
        if (it->GetKey(key) && key.first == DB_PAYABLE_PAYMENT_INDEX && key.second.payableId == payableId) {
            uint256 paymentId;
            if (it->GetValue(paymentId)) {
                if (!func(key.second.nSeq, paymentId)) {
                    break;  // Callback returned false, stop iteration
                }
            }
            it->Next();
        } else {
            break;  // No more entries for this payable
        }
    }
}

// =============================================================================
// Activity log
// =============================================================================

bool CLedgerDB::ReadActivity(uint64_t nChainCount, ActivityRecord& activity) const
{
    return db->Read(MakeKey(DB_ACTIVITY, ActivityKey{nChainCount}), activity);
}

bool CLedgerDB::ReadUserActivityChainCount(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, uint64_t& nChainCount) const
{
    return db->Read(MakeKey(DB_USER_ACTIVITY_INDEX, UserSeqKey{wallet, nChainId, nSeq}), nChainCount);
}

bool CLedgerDB::ReadPayableActivityChainCount(const uint256& payableId, uint64_t nSeq, uint64_t& nChainCount) const
{
    return db->Read(MakeKey(DB_PAYABLE_ACTIVITY_INDEX, PayableSeqKey{payableId, nSeq}), nChainCount);
}

// =============================================================================
// Counters
// =============================================================================

uint64_t CLedgerDB::ReadCounter(const CounterKey& key) const
{
    uint64_t nValue = 0;
    if (!db->Read(MakeKey(DB_COUNTER, key), nValue)) {
        return 0;
    }
    return nValue;
}

bool CLedgerDB::WriteCounter(const CounterKey& key, uint64_t nValue)
{
    return db->Write(MakeKey(DB_COUNTER, key), nValue);
}

// =============================================================================
// Tokens, foreign contracts, fees
// =============================================================================

bool CLedgerDB::ReadTokenDetails(const uint256& token, TokenDetails& details) const
{
    return db->Read(MakeKey(DB_TOKEN, token), details);
}

bool CLedgerDB::WriteTokenDetails(const TokenDetails& details)
{
    return db->Write(MakeKey(DB_TOKEN, details.token), details);
}

bool CLedgerDB::IsTokenSupported(const uint256& token) const
{
    TokenDetails details;
    return ReadTokenDetails(token, details) && details.fSupported;
}

bool CLedgerDB::ReadForeignContract(uint16_t nChainId, ForeignContract& contract) const
{
    return db->Read(MakeKey(DB_FOREIGN_CONTRACT, nChainId), contract);
}

bool CLedgerDB::WriteForeignContract(const ForeignContract& contract)
{
    return db->Write(MakeKey(DB_FOREIGN_CONTRACT, contract.nChainId), contract);
}

uint64_t CLedgerDB::ReadCollectedFees(const uint256& token) const
{
    uint64_t nFees = 0;
    if (!db->Read(MakeKey(DB_COLLECTED_FEES, token), nFees)) {
        return 0;
    }
    return nFees;
}

// =============================================================================
// Replay guard
// =============================================================================

bool CLedgerDB::ReadReceivedMessage(uint16_t nEmitterChainId, const uint256& hash, ReceivedMessageRecord& record) const
{
    return db->Read(MakeKey(DB_RECEIVED_MESSAGE, MessageKey{nEmitterChainId, hash}), record);
}

bool CLedgerDB::IsMessageReceived(uint16_t nEmitterChainId, const uint256& hash) const
{
    return db->Exists(MakeKey(DB_RECEIVED_MESSAGE, MessageKey{nEmitterChainId, hash}));
}

uint64_t CLedgerDB::CountReceivedMessages(uint16_t nEmitterChainId) const
{
    uint64_t nCount = 0;
    std::unique_ptr<CDBIterator> it(db->NewIterator());
    it->Seek(MakeKey(DB_RECEIVED_MESSAGE, MessageKey{nEmitterChainId, uint256()}));

    while (it->Valid()) {
        std::pair<char, MessageKey> key;
        if (it->GetKey(key) && key.first == DB_RECEIVED_MESSAGE && key.second.nChainId == nEmitterChainId) {
            nCount++;
            it->Next();
        } else {
            break;
        }
    }
    return nCount;
}

// =============================================================================
// Batch
// =============================================================================

CLedgerDB::Batch::Batch(CLedgerDB& db) : batch(CLIENT_VERSION), parent(db) {}

bool CLedgerDB::Batch::NextCounter(const CounterKey& key, uint64_t& nValue)
{
    uint64_t nCurrent;
    auto it = mapCounters.find(key);
    if (it != mapCounters.end()) {
        nCurrent = it->second;
    } else {
        nCurrent = parent.ReadCounter(key);
    }

    uint64_t nNext;
    if (!IncrementCounterValue(nCurrent, nNext)) {
        LogPrintf("ERROR: %s: %s exhausted\n", __func__, key.ToString());
        return false;
    }

    mapCounters[key] = nNext;
    batch.Write(MakeKey(DB_COUNTER, key), nNext);
    nValue = nNext;
    return true;
}

void CLedgerDB::Batch::WritePayable(const PayableRecord& payable)
{
    batch.Write(MakeKey(DB_PAYABLE, payable.id), payable);
}

void CLedgerDB::Batch::WriteUser(const UserRecord& user)
{
    batch.Write(MakeKey(DB_USER, UserKey{user.wallet, user.nChainId}), user);
}

void CLedgerDB::Batch::WriteUserPayment(const UserPaymentRecord& payment)
{
    batch.Write(MakeKey(DB_USER_PAYMENT, payment.id), payment);
}

void CLedgerDB::Batch::WritePayablePayment(const PayablePaymentRecord& payment)
{
    batch.Write(MakeKey(DB_PAYABLE_PAYMENT, payment.id), payment);
}

void CLedgerDB::Batch::WriteWithdrawal(const WithdrawalRecord& withdrawal)
{
    batch.Write(MakeKey(DB_WITHDRAWAL, withdrawal.id), withdrawal);
}

void CLedgerDB::Batch::WriteUserPaymentId(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, const uint256& paymentId)
{
    batch.Write(MakeKey(DB_USER_PAYMENT_INDEX, UserSeqKey{wallet, nChainId, nSeq}), paymentId);
}

void CLedgerDB::Batch::WriteUserWithdrawalId(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, const uint256& withdrawalId)
{
    batch.Write(MakeKey(DB_USER_WITHDRAWAL_INDEX, UserSeqKey{wallet, nChainId, nSeq}), withdrawalId);
}

void CLedgerDB::Batch::WritePayablePaymentId(const uint256& payableId, uint64_t nSeq, const uint256& paymentId)
{
    batch.Write(MakeKey(DB_PAYABLE_PAYMENT_INDEX, PayableSeqKey{payableId, nSeq}), paymentId);
}

void CLedgerDB::Batch::WritePayableWithdrawalId(const uint256& payableId, uint64_t nSeq, const uint256& withdrawalId)
{
    batch.Write(MakeKey(DB_PAYABLE_WITHDRAWAL_INDEX, PayableSeqKey{payableId, nSeq}), withdrawalId);
}

void CLedgerDB::Batch::WriteActivity(const ActivityRecord& activity)
{
    batch.Write(MakeKey(DB_ACTIVITY, ActivityKey{activity.nChainCount}), activity);
}

void CLedgerDB::Batch::WriteUserActivity(const uint256& wallet, uint16_t nChainId, uint64_t nSeq, uint64_t nChainCount)
{
    batch.Write(MakeKey(DB_USER_ACTIVITY_INDEX, UserSeqKey{wallet, nChainId, nSeq}), nChainCount);
}

void CLedgerDB::Batch::WritePayableActivity(const uint256& payableId, uint64_t nSeq, uint64_t nChainCount)
{
    batch.Write(MakeKey(DB_PAYABLE_ACTIVITY_INDEX, PayableSeqKey{payableId, nSeq}), nChainCount);
}

bool CLedgerDB::Batch::AddCollectedFees(const uint256& token, uint64_t nAmount)
{
    uint64_t nCurrent;
    auto it = mapCollectedFees.find(token);
    if (it != mapCollectedFees.end()) {
        nCurrent = it->second;
    } else {
        nCurrent = parent.ReadCollectedFees(token);
    }

    if (nAmount > std::numeric_limits<uint64_t>::max() - nCurrent) {
        LogPrintf("ERROR: %s: collected fees overflow for token %s\n", __func__, token.ToString());
        return false;
    }

    mapCollectedFees[token] = nCurrent + nAmount;
    batch.Write(MakeKey(DB_COLLECTED_FEES, token), nCurrent + nAmount);
    return true;
}

void CLedgerDB::Batch::WriteReceivedMessage(const ReceivedMessageRecord& record)
{
    batch.Write(MakeKey(DB_RECEIVED_MESSAGE, MessageKey{record.nEmitterChainId, record.hash}), record);
}

bool CLedgerDB::Batch::Commit()
{
    return parent.db->WriteBatch(batch, true);
}

bool CLedgerDB::Sync()
{
    return db->Sync();
}

// =============================================================================
// Global Functions
// =============================================================================

bool InitLedgerDB(size_t nCacheSize, bool fWipe)
{
    const uint16_t nChainId = Params().ChainId();
    try {
        g_ledgerdb.reset();
        g_ledgerdb = std::make_unique<CLedgerDB>(nCacheSize, fWipe);

        uint16_t nStoredChainId;
        if (g_ledgerdb->ReadChainId(nStoredChainId)) {
            if (nStoredChainId != nChainId) {
                LogPrintf("ERROR: InitLedgerDB: database belongs to chain %u, configured chain is %u\n",
                          nStoredChainId, nChainId);
                g_ledgerdb.reset();
                return false;
            }
        } else if (!g_ledgerdb->WriteChainId(nChainId)) {
            LogPrintf("ERROR: InitLedgerDB: failed to write chain id marker\n");
            g_ledgerdb.reset();
            return false;
        }

        LogPrintf("Ledger DB initialized (chain %u, cache=%zu bytes)\n", nChainId, nCacheSize);
        return true;
    } catch (const std::exception& e) {
        LogPrintf("ERROR: InitLedgerDB: %s\n", e.what());
        g_ledgerdb.reset();
        return false;
    }
}

ChainStats GetChainStats(const CLedgerDB& ledgerdb)
{
    ChainStats stats;
    stats.nChainId = Params().ChainId();
    stats.nUsersCount = ledgerdb.ReadCounter(ChainCounter(CounterScope::CHAIN_USERS));
    stats.nPayablesCount = ledgerdb.ReadCounter(ChainCounter(CounterScope::CHAIN_PAYABLES));
    stats.nPaymentsCount = ledgerdb.ReadCounter(ChainCounter(CounterScope::CHAIN_PAYMENTS));
    stats.nWithdrawalsCount = ledgerdb.ReadCounter(ChainCounter(CounterScope::CHAIN_WITHDRAWALS));
    stats.nActivitiesCount = ledgerdb.ReadCounter(ChainCounter(CounterScope::CHAIN_ACTIVITIES));
    return stats;
}
