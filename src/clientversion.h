// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CHAINBILLS_CLIENTVERSION_H
#define CHAINBILLS_CLIENTVERSION_H

#define CLIENT_VERSION_MAJOR 1
#define CLIENT_VERSION_MINOR 0
#define CLIENT_VERSION_REVISION 0

static const int CLIENT_VERSION =
    1000000 * CLIENT_VERSION_MAJOR
    + 10000 * CLIENT_VERSION_MINOR
    + 100 * CLIENT_VERSION_REVISION;

#endif // CHAINBILLS_CLIENTVERSION_H
