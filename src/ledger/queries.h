// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_QUERIES_H
#define CHAINBILLS_QUERIES_H

/**
 * Read-only ledger lookups.
 *
 * List positions are 1-based and bounded by the owner's count; 0 or a
 * position past the count is rejected.
 */

#include "consensus/validation.h"
#include "ledger/ledger.h"
#include "ledger/ledgerdb.h"
#include "uint256.h"

#include <stdint.h>
#include <vector>

bool GetPayable(const CLedgerDB& ledgerdb, const uint256& payableId, PayableRecord& payable, CValidationState& state);
bool GetUser(const CLedgerDB& ledgerdb, const uint256& wallet, uint16_t nChainId, UserRecord& user, CValidationState& state);
bool GetUserPayment(const CLedgerDB& ledgerdb, const uint256& paymentId, UserPaymentRecord& payment, CValidationState& state);
bool GetPayablePayment(const CLedgerDB& ledgerdb, const uint256& paymentId, PayablePaymentRecord& payment, CValidationState& state);
bool GetWithdrawal(const CLedgerDB& ledgerdb, const uint256& withdrawalId, WithdrawalRecord& withdrawal, CValidationState& state);

bool GetUserPaymentId(const CLedgerDB& ledgerdb, const uint256& wallet, uint16_t nChainId, uint64_t nCount,
                      uint256& paymentId, CValidationState& state);
bool GetUserWithdrawalId(const CLedgerDB& ledgerdb, const uint256& wallet, uint16_t nChainId, uint64_t nCount,
                         uint256& withdrawalId, CValidationState& state);
bool GetPayablePaymentId(const CLedgerDB& ledgerdb, const uint256& payableId, uint64_t nCount,
                         uint256& paymentId, CValidationState& state);
bool GetPayableWithdrawalId(const CLedgerDB& ledgerdb, const uint256& payableId, uint64_t nCount,
                            uint256& withdrawalId, CValidationState& state);

/** Activity by its position in the chain-wide log */
bool GetActivity(const CLedgerDB& ledgerdb, uint64_t nChainCount, ActivityRecord& activity, CValidationState& state);
bool GetUserActivity(const CLedgerDB& ledgerdb, const uint256& wallet, uint16_t nChainId, uint64_t nCount,
                     ActivityRecord& activity, CValidationState& state);
bool GetPayableActivity(const CLedgerDB& ledgerdb, const uint256& payableId, uint64_t nCount,
                        ActivityRecord& activity, CValidationState& state);

/** All payments of a payable, in payment order */
bool ListPayablePayments(const CLedgerDB& ledgerdb, const uint256& payableId,
                         std::vector<PayablePaymentRecord>& vPayments, CValidationState& state);

/** Payments a payable received from payers on nPayerChainId */
uint64_t GetPayableChainPaymentsCount(const CLedgerDB& ledgerdb, const uint256& payableId, uint16_t nPayerChainId);

/** Withdrawal fees retained in a token */
uint64_t GetCollectedFees(const CLedgerDB& ledgerdb, const uint256& token);

#endif // CHAINBILLS_QUERIES_H
