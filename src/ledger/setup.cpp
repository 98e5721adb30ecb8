// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/setup.h"

#include "chainparams.h"
#include "logging.h"

bool RegisterToken(CLedgerDB& ledgerdb, const uint256& token, uint8_t nDecimals, bool fSupported,
                   CValidationState& state)
{
    if (token.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "invalid-token", "null token address");
    }

    TokenDetails details;
    details.token = token;
    details.fSupported = fSupported;
    details.nDecimals = nDecimals;
    if (!ledgerdb.WriteTokenDetails(details)) {
        return state.Error("token-write-failed");
    }

    LogPrint(BCLog::LEDGER, "RegisterToken: %s decimals=%u supported=%d\n",
             token.ToString(), nDecimals, fSupported);
    return true;
}

bool RegisterForeignContract(CLedgerDB& ledgerdb, uint16_t nChainId, const uint256& emitter,
                             CValidationState& state)
{
    if (nChainId == 0 || nChainId == Params().ChainId()) {
        return state.Invalid(false, REJECT_INVALID, "invalid-foreign-chain",
                             strprintf("chain id %u", nChainId));
    }
    if (emitter.IsNull()) {
        return state.Invalid(false, REJECT_INVALID, "invalid-foreign-emitter", "null emitter address");
    }

    ForeignContract contract;
    contract.nChainId = nChainId;
    contract.emitter = emitter;
    if (!ledgerdb.WriteForeignContract(contract)) {
        return state.Error("foreign-contract-write-failed");
    }

    LogPrint(BCLog::XCHAIN, "RegisterForeignContract: chain=%u emitter=%s\n", nChainId, emitter.ToString());
    return true;
}
