// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_PAYABLES_H
#define CHAINBILLS_PAYABLES_H

/**
 * Payable Registry
 *
 * Creation, configuration and open/closed lifecycle of payables, for hosts
 * on this chain and for hosts on remote chains (through attested messages).
 *
 * A payable created from a remote chain lives on this chain: its id and
 * chain count come from this chain's CHAIN_PAYABLES counter, its host is
 * the (caller, emitter chain) pair of the message.
 *
 * Closing stops payments; withdrawals stay possible.
 */

#include "consensus/validation.h"
#include "ledger/ledger.h"
#include "ledger/ledgerdb.h"
#include "ledger/xchain.h"
#include "uint256.h"

#include <string>
#include <vector>

/** Description rules: non-empty after trimming, within the configured length */
bool CheckPayableDescription(const std::string& description, CValidationState& state);

/**
 * Allowed set rules: within the configured capacity, no zero amount, only
 * supported tokens, no repeated (token, amount) pair. An empty set is valid.
 */
bool CheckTokensAndAmounts(const CLedgerDB& ledgerdb, const std::vector<TokenAndAmount>& vTokensAndAmounts,
                           CValidationState& state);

bool CreatePayable(CLedgerDB& ledgerdb,
                   const uint256& host,
                   const std::string& description,
                   const std::vector<TokenAndAmount>& vAllowedTokensAndAmounts,
                   CValidationState& state,
                   uint256& payableIdOut);

bool ClosePayable(CLedgerDB& ledgerdb, const uint256& payableId, const uint256& caller, CValidationState& state);
bool ReopenPayable(CLedgerDB& ledgerdb, const uint256& payableId, const uint256& caller, CValidationState& state);

/** Replace the allowed set. Balances are left untouched. */
bool UpdatePayableTokensAndAmounts(CLedgerDB& ledgerdb,
                                   const uint256& payableId,
                                   const uint256& caller,
                                   const std::vector<TokenAndAmount>& vAllowedTokensAndAmounts,
                                   CValidationState& state);

/** CREATE_PAYABLE from a remote host */
bool CreatePayableReceived(CLedgerDB& ledgerdb, const AttestedMessage& msg,
                           CValidationState& state, uint256& payableIdOut);

/** CLOSE_PAYABLE, REOPEN_PAYABLE or UPDATE_PAYABLE_TOKENS_AND_AMOUNTS from a remote host */
bool UpdatePayableReceived(CLedgerDB& ledgerdb, const AttestedMessage& msg, const uint256& payableId,
                           CValidationState& state);

#endif // CHAINBILLS_PAYABLES_H
