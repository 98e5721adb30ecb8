// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_CHAINPARAMS_H
#define CHAINBILLS_CHAINPARAMS_H

#include "consensus/params.h"

#include <memory>
#include <string>

/**
 * CChainParams defines various tweakable parameters of a given instance of the
 * Chainbills ledger. There are three: the main network on which payables
 * are settled, a public test network, and a regression test mode which is
 * intended for private networks and unit tests.
 */
class CChainParams
{
public:
    virtual ~CChainParams() {}

    const Consensus::Params& GetConsensus() const { return consensus; }

    /** Return the network string */
    std::string NetworkIDString() const { return strNetworkID; }
    uint16_t ChainId() const { return consensus.nChainId; }
    /** Whether fee policies may be overridden at runtime */
    bool AllowFeePolicyOverride() const { return fAllowFeePolicyOverride; }

    /** Default cache for the ledger database, in MiB */
    int64_t DefaultLedgerCache() const { return nDefaultLedgerCache; }

protected:
    CChainParams() {}

    std::string strNetworkID;
    Consensus::Params consensus;
    bool fAllowFeePolicyOverride = false;
    int64_t nDefaultLedgerCache = 0;
};

/**
 * Creates and returns a std::unique_ptr<CChainParams> of the chosen chain.
 * @returns a CChainParams* of the chosen chain.
 * @throws a std::runtime_error if the chain is not supported.
 */
std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CChainParams& Params();

/**
 * Sets the params returned by Params() to those for the given network.
 */
void SelectParams(const std::string& chain);

/**
 * Allows modifying the withdrawal fee policies (regtest only).
 */
void UpdateWithdrawalFeePolicy(bool fBridged, const Consensus::WithdrawalFeePolicy& policy);

#endif // CHAINBILLS_CHAINPARAMS_H
