// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_WITHDRAWALS_H
#define CHAINBILLS_WITHDRAWALS_H

/**
 * Withdrawal Processor
 *
 * Moves part of a payable balance to its host, minus a fee:
 *
 *   invalid-payable-id, not-your-payable, zero-amount-specified,
 *   no-balance-for-withdrawal-token, insufficient-withdraw-amount
 *
 * The gross amount leaves the balance, the fee stays with the fee collector
 * and the net amount is released to the host. Withdrawals requested on a
 * remote chain use the bridged fee policy and must arrive in the host's
 * withdrawal order.
 */

#include "consensus/params.h"
#include "consensus/validation.h"
#include "ledger/ledger.h"
#include "ledger/ledgerdb.h"
#include "ledger/transfer.h"
#include "ledger/xchain.h"
#include "uint256.h"

#include <stdint.h>

/** A policy is usable if 0 <= num <= den, 0 < den and both fit in 32 bits */
bool IsValidFeePolicy(const Consensus::WithdrawalFeePolicy& policy);

/**
 * Split a gross amount into fee, net and dust.
 *
 * With fNormalizeBridgedAmounts set and a token carrying more decimals than
 * the bridge, the amount is first truncated to the bridge precision; the
 * truncated part is nDust. The fee is then taken on the truncated amount.
 * nFee + nNet + nDust == nAmount. Never overflows.
 *
 * @return false if the policy is not usable
 */
bool ComputeWithdrawalAmounts(const Consensus::WithdrawalFeePolicy& policy,
                              uint64_t nAmount,
                              uint8_t nTokenDecimals,
                              uint8_t nBridgeDecimals,
                              WithdrawalAmounts& amounts);

bool Withdraw(CLedgerDB& ledgerdb,
              CTransferExecutor& transfer,
              const uint256& payableId,
              const uint256& caller,
              const TokenAndAmount& details,
              CValidationState& state,
              uint256& withdrawalIdOut);

/**
 * WITHDRAW from a host on a remote chain.
 *
 * caller, nHostCount and details are what the relayer claims the message
 * carries; they must match the decoded payload and the ledger.
 */
bool WithdrawReceived(CLedgerDB& ledgerdb,
                      CTransferExecutor& transfer,
                      const AttestedMessage& msg,
                      const uint256& payableId,
                      const uint256& caller,
                      uint64_t nHostCount,
                      const TokenAndAmount& details,
                      CValidationState& state,
                      uint256& withdrawalIdOut);

#endif // CHAINBILLS_WITHDRAWALS_H
