// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/payload.h"

#include "clientversion.h"
#include "streams.h"
#include "util/format.h"

const char* ActionIdName(ActionId action)
{
    switch (action) {
    case ActionId::CREATE_PAYABLE: return "create-payable";
    case ActionId::CLOSE_PAYABLE: return "close-payable";
    case ActionId::REOPEN_PAYABLE: return "reopen-payable";
    case ActionId::UPDATE_PAYABLE_TOKENS_AND_AMOUNTS: return "update-payable-tokens-and-amounts";
    case ActionId::WITHDRAW: return "withdraw";
    case ActionId::PAY: return "pay";
    }
    return "unknown";
}

bool IsKnownActionId(uint8_t nActionId)
{
    return nActionId >= static_cast<uint8_t>(ActionId::CREATE_PAYABLE) &&
           nActionId <= static_cast<uint8_t>(ActionId::PAY);
}

CrossChainPayload::CrossChainPayload() : nVersion(PAYLOAD_VERSION), action(ActionId::PAY) {}

bool CrossChainPayload::IsTriviallyValid(std::string& strError) const
{
    if (nVersion != PAYLOAD_VERSION) {
        strError = strprintf("unsupported payload version %d", (int)nVersion);
        return false;
    }
    if (action != ActionId::CREATE_PAYABLE && payableId.IsNull()) {
        strError = "null payable id";
        return false;
    }
    if (action == ActionId::PAY) {
        if (nOriginChainCount == 0) {
            strError = "zero origin chain count";
            return false;
        }
        if (nPayerCount == 0) {
            strError = "zero payer count";
            return false;
        }
    }
    return true;
}

std::vector<unsigned char> EncodePayload(const CrossChainPayload& payload)
{
    CDataStream ss(SER_NETWORK, CLIENT_VERSION);
    ss << payload;
    return std::vector<unsigned char>(ss.begin(), ss.end());
}

bool DecodePayload(const std::vector<unsigned char>& vch, CrossChainPayload& payload, std::string& strError)
{
    try {
        CDataStream ss(vch, SER_NETWORK, CLIENT_VERSION);
        ss >> payload;
        if (!ss.empty()) {
            strError = strprintf("%u trailing bytes", ss.size());
            return false;
        }
    } catch (const std::ios_base::failure& e) {
        strError = e.what();
        return false;
    }
    return true;
}
