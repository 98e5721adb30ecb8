// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_NOTIFICATIONS_H
#define CHAINBILLS_NOTIFICATIONS_H

#include "ledger/ledger.h"

#include <mutex>
#include <vector>

class CLedgerNotificationInterface;
class CLedgerSignals;

/** Register a subscriber */
void RegisterLedgerInterface(CLedgerNotificationInterface* pinterface);
/** Unregister a subscriber */
void UnregisterLedgerInterface(CLedgerNotificationInterface* pinterface);
/** Unregister all subscribers */
void UnregisterAllLedgerInterfaces();

/**
 * Implement this to subscribe to ledger events.
 *
 * Every callback runs after the batch that produced the event has been
 * committed, on the thread that performed the operation.
 */
class CLedgerNotificationInterface
{
public:
    virtual ~CLedgerNotificationInterface() {}

protected:
    virtual void PayableCreated(const PayableRecord& payable) {}
    virtual void PayableClosed(const PayableRecord& payable) {}
    virtual void PayableReopened(const PayableRecord& payable) {}
    virtual void PayableUpdated(const PayableRecord& payable) {}
    /**
     * A payment was recorded. userPayment is null when the payment arrived
     * from another chain and only the payable side is kept here.
     */
    virtual void PaymentRecorded(const PayablePaymentRecord& payablePayment, const UserPaymentRecord* userPayment) {}
    virtual void WithdrawalRecorded(const WithdrawalRecord& withdrawal) {}

    friend class CLedgerSignals;
};

class CLedgerSignals
{
private:
    std::mutex cs_callbacks;
    std::vector<CLedgerNotificationInterface*> vCallbacks;

    std::vector<CLedgerNotificationInterface*> GetCallbacks();

    friend void ::RegisterLedgerInterface(CLedgerNotificationInterface*);
    friend void ::UnregisterLedgerInterface(CLedgerNotificationInterface*);
    friend void ::UnregisterAllLedgerInterfaces();

public:
    void PayableCreated(const PayableRecord& payable);
    void PayableClosed(const PayableRecord& payable);
    void PayableReopened(const PayableRecord& payable);
    void PayableUpdated(const PayableRecord& payable);
    void PaymentRecorded(const PayablePaymentRecord& payablePayment, const UserPaymentRecord* userPayment);
    void WithdrawalRecorded(const WithdrawalRecord& withdrawal);
};

CLedgerSignals& GetLedgerSignals();

#endif // CHAINBILLS_NOTIFICATIONS_H
