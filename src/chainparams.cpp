// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"

#include "util/format.h"
#include "util/system.h"

#include <assert.h>
#include <stdexcept>

/**
 * Main network
 */
class CMainParams : public CChainParams
{
public:
    CMainParams()
    {
        strNetworkID = "main";

        consensus.nChainId = 50;                        // Xion
        consensus.nMaxPayableTokens = 20;
        consensus.nMaxPayableDescriptionLength = 3000;

        // 2% withdrawal fee. Local withdrawals round the fee down so the
        // host keeps the remainder.
        consensus.localWithdrawalFee = {2, 100, Consensus::FeeRounding::FEE_FLOOR, false};
        // TODO: switch bridged withdrawals to FEE_FLOOR once every emitter
        // chain has rolled out the matching fee calculation.
        consensus.bridgedWithdrawalFee = {2, 100, Consensus::FeeRounding::NET_FLOOR, true};
        consensus.nBridgeDecimals = 8;

        nDefaultLedgerCache = 64;
    }
};

/**
 * Testnet
 */
class CTestNetParams : public CChainParams
{
public:
    CTestNetParams()
    {
        strNetworkID = "test";

        consensus.nChainId = 50;
        consensus.nMaxPayableTokens = 20;
        consensus.nMaxPayableDescriptionLength = 3000;

        consensus.localWithdrawalFee = {2, 100, Consensus::FeeRounding::FEE_FLOOR, false};
        consensus.bridgedWithdrawalFee = {2, 100, Consensus::FeeRounding::NET_FLOOR, true};
        consensus.nBridgeDecimals = 8;

        nDefaultLedgerCache = 32;
    }
};

/**
 * Regression test
 */
class CRegTestParams : public CChainParams
{
public:
    CRegTestParams()
    {
        strNetworkID = "regtest";

        consensus.nChainId = 50;
        consensus.nMaxPayableTokens = 20;
        consensus.nMaxPayableDescriptionLength = 3000;

        consensus.localWithdrawalFee = {2, 100, Consensus::FeeRounding::FEE_FLOOR, false};
        consensus.bridgedWithdrawalFee = {2, 100, Consensus::FeeRounding::FEE_FLOOR, false};
        consensus.nBridgeDecimals = 8;

        fAllowFeePolicyOverride = true;
        nDefaultLedgerCache = 8;
    }

    void UpdateWithdrawalFeePolicy(bool fBridged, const Consensus::WithdrawalFeePolicy& policy)
    {
        if (fBridged)
            consensus.bridgedWithdrawalFee = policy;
        else
            consensus.localWithdrawalFee = policy;
    }
};

static std::unique_ptr<CChainParams> globalChainParams;

const CChainParams& Params()
{
    assert(globalChainParams);
    return *globalChainParams;
}

std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain)
{
    if (chain == CBaseChainParams::MAIN)
        return std::unique_ptr<CChainParams>(new CMainParams());
    else if (chain == CBaseChainParams::TESTNET)
        return std::unique_ptr<CChainParams>(new CTestNetParams());
    else if (chain == CBaseChainParams::REGTEST)
        return std::unique_ptr<CChainParams>(new CRegTestParams());
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}

void SelectParams(const std::string& network)
{
    globalChainParams = CreateChainParams(network);
}

void UpdateWithdrawalFeePolicy(bool fBridged, const Consensus::WithdrawalFeePolicy& policy)
{
    if (!globalChainParams || !globalChainParams->AllowFeePolicyOverride()) {
        throw std::runtime_error(strprintf("%s: fee policy overrides are only allowed on regtest", __func__));
    }
    static_cast<CRegTestParams*>(globalChainParams.get())->UpdateWithdrawalFeePolicy(fBridged, policy);
}
