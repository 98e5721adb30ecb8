// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_PARAMS_H
#define CHAINBILLS_PARAMS_H

#include <stdint.h>

namespace Consensus {

/**
 * Rounding applied when splitting a withdrawal into fee and net amount.
 *
 * FEE_FLOOR: fee = floor(amount * num / den), net = amount - fee.
 * NET_FLOOR: net = floor(amount * (den - num) / den), fee = amount - net.
 */
enum class FeeRounding : uint8_t {
    FEE_FLOOR = 0,
    NET_FLOOR = 1,
};

struct WithdrawalFeePolicy {
    uint64_t nFeeNumerator;
    uint64_t nFeeDenominator;
    FeeRounding rounding;
    // Truncate the amount to the bridge precision before taking the fee.
    bool fNormalizeBridgedAmounts;
};

/**
 * Parameters that influence ledger rules. These are the same for every
 * node of a network and cannot be changed without a coordinated upgrade.
 */
struct Params {
    // Wormhole chain id of this deployment
    uint16_t nChainId;

    // Payable limits
    unsigned int nMaxPayableTokens;
    unsigned int nMaxPayableDescriptionLength;

    // Fees for withdrawals requested on this chain and for those
    // arriving as attested messages
    WithdrawalFeePolicy localWithdrawalFee;
    WithdrawalFeePolicy bridgedWithdrawalFee;

    // Decimals carried by the message bridge for token amounts
    uint8_t nBridgeDecimals;
};

} // namespace Consensus

#endif // CHAINBILLS_PARAMS_H
