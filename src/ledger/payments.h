// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_PAYMENTS_H
#define CHAINBILLS_PAYMENTS_H

/**
 * Payment Recorder
 *
 * A payment is checked against its payable in this order, first failure
 * wins:
 *
 *   invalid-payable-id, payable-is-closed, zero-amount-specified,
 *   invalid-token, matching-token-and-amount-not-found
 *
 * A local payment writes both views (UserPayment and PayablePayment) and
 * pulls the funds through the transfer executor before commit. A payment
 * arriving from a remote chain only writes the payable view: the payer's
 * user and UserPayment live on the origin chain, and the id is derived
 * from the origin chain and its chain count so both chains agree on it.
 */

#include "consensus/validation.h"
#include "ledger/ledger.h"
#include "ledger/ledgerdb.h"
#include "ledger/transfer.h"
#include "ledger/xchain.h"
#include "uint256.h"

/** Checks 2 to 5 of a payment against an existing payable */
bool CheckPaymentAgainstPayable(const CLedgerDB& ledgerdb, const PayableRecord& payable,
                                const TokenAndAmount& details, CValidationState& state);

bool RecordPayment(CLedgerDB& ledgerdb,
                   CTransferExecutor& transfer,
                   const uint256& payableId,
                   const uint256& payer,
                   const TokenAndAmount& details,
                   CValidationState& state,
                   uint256& paymentIdOut);

/** PAY from a payer on a remote chain */
bool RecordPaymentReceived(CLedgerDB& ledgerdb,
                           const AttestedMessage& msg,
                           const uint256& payableId,
                           CValidationState& state,
                           uint256& paymentIdOut);

#endif // CHAINBILLS_PAYMENTS_H
