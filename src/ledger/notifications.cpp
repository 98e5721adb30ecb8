// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/notifications.h"

#include <algorithm>

static CLedgerSignals g_signals;

CLedgerSignals& GetLedgerSignals()
{
    return g_signals;
}

std::vector<CLedgerNotificationInterface*> CLedgerSignals::GetCallbacks()
{
    std::lock_guard<std::mutex> lock(cs_callbacks);
    return vCallbacks;
}

void RegisterLedgerInterface(CLedgerNotificationInterface* pinterface)
{
    std::lock_guard<std::mutex> lock(g_signals.cs_callbacks);
    if (std::find(g_signals.vCallbacks.begin(), g_signals.vCallbacks.end(), pinterface) == g_signals.vCallbacks.end()) {
        g_signals.vCallbacks.push_back(pinterface);
    }
}

void UnregisterLedgerInterface(CLedgerNotificationInterface* pinterface)
{
    std::lock_guard<std::mutex> lock(g_signals.cs_callbacks);
    auto& v = g_signals.vCallbacks;
    v.erase(std::remove(v.begin(), v.end(), pinterface), v.end());
}

void UnregisterAllLedgerInterfaces()
{
    std::lock_guard<std::mutex> lock(g_signals.cs_callbacks);
    g_signals.vCallbacks.clear();
}

void CLedgerSignals::PayableCreated(const PayableRecord& payable)
{
    for (auto* cb : GetCallbacks()) cb->PayableCreated(payable);
}

void CLedgerSignals::PayableClosed(const PayableRecord& payable)
{
    for (auto* cb : GetCallbacks()) cb->PayableClosed(payable);
}

void CLedgerSignals::PayableReopened(const PayableRecord& payable)
{
    for (auto* cb : GetCallbacks()) cb->PayableReopened(payable);
}

void CLedgerSignals::PayableUpdated(const PayableRecord& payable)
{
    for (auto* cb : GetCallbacks()) cb->PayableUpdated(payable);
}

void CLedgerSignals::PaymentRecorded(const PayablePaymentRecord& payablePayment, const UserPaymentRecord* userPayment)
{
    for (auto* cb : GetCallbacks()) cb->PaymentRecorded(payablePayment, userPayment);
}

void CLedgerSignals::WithdrawalRecorded(const WithdrawalRecord& withdrawal)
{
    for (auto* cb : GetCallbacks()) cb->WithdrawalRecorded(withdrawal);
}
