// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_TRANSFER_H
#define CHAINBILLS_TRANSFER_H

#include "ledger/ledger.h"
#include "uint256.h"

#include <stdint.h>
#include <string>

/**
 * WithdrawalAmounts - split of a gross withdrawal
 *
 * nGross is deducted from the payable balance. nNet goes to the host,
 * nFee + nDust stay with the fee collector. nDust is the part of the
 * amount below the bridge precision, zero for local withdrawals.
 */
struct WithdrawalAmounts
{
    uint64_t nGross{0};
    uint64_t nFee{0};
    uint64_t nNet{0};
    uint64_t nDust{0};
};

/**
 * Moves funds on behalf of the ledger.
 *
 * Called after every check has passed and before the ledger batch is
 * committed. A false return aborts the operation and nothing is written.
 * If the commit then throws dbwrapper_error the funds have already moved;
 * the operation logs the transfer it made and rethrows.
 */
class CTransferExecutor
{
public:
    virtual ~CTransferExecutor() {}

    /** Pull a payment from a payer on this chain into custody */
    virtual bool CollectPayment(const uint256& payer, const TokenAndAmount& details, std::string& strError) = 0;

    /**
     * Release a withdrawal: nNet to the host on its chain (bridging when
     * nHostChainId is not this chain), nFee + nDust to the fee collector.
     */
    virtual bool ReleaseWithdrawal(const uint256& host, uint16_t nHostChainId, const uint256& token,
                                   const WithdrawalAmounts& amounts, std::string& strError) = 0;
};

#endif // CHAINBILLS_TRANSFER_H
