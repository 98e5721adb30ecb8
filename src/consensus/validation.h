// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_VALIDATION_H
#define CHAINBILLS_VALIDATION_H

#include <cstdio>
#include <string>

/** "reject" codes carried by a failed ledger operation */
static const unsigned char REJECT_MALFORMED = 0x01;
static const unsigned char REJECT_INVALID = 0x10;
static const unsigned char REJECT_DUPLICATE = 0x12;
static const unsigned char REJECT_UNAUTHORIZED = 0x13;
static const unsigned char REJECT_CONFLICT = 0x14;

/** Capture information about the outcome of a ledger operation */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //! everything ok
        MODE_INVALID, //! request rejected by a ledger rule
        MODE_ERROR,   //! run-time error
    } mode;
    unsigned int chRejectCode;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), chRejectCode(0) {}

    bool Invalid(bool ret = false,
                 unsigned int _chRejectCode = 0,
                 const std::string& _strRejectReason = "",
                 const std::string& _strDebugMessage = "")
    {
        chRejectCode = _chRejectCode;
        strRejectReason = _strRejectReason;
        strDebugMessage = _strDebugMessage;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }
    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

/** Convert CValidationState to a human-readable message for logging */
inline std::string FormatStateMessage(const CValidationState& state)
{
    if (state.IsValid()) {
        return "Valid";
    }
    std::string msg = state.GetRejectReason();
    if (!state.GetDebugMessage().empty()) {
        msg += ", " + state.GetDebugMessage();
    }
    if (state.GetRejectCode() != 0) {
        char code[8];
        snprintf(code, sizeof(code), "%02x", state.GetRejectCode());
        msg += " (code " + std::string(code) + ")";
    }
    return msg;
}

#endif // CHAINBILLS_VALIDATION_H
