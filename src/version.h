// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_VERSION_H
#define DUTCHX_VERSION_H

/**
 * encoding versioning
 *
 * PROTOCOL_VERSION tags every canonical order/permit encoding,
 * CLIENT_VERSION tags records written to the settlement database.
 */

static const int PROTOCOL_VERSION = 10001;

static const int CLIENT_VERSION = 1000000;

#endif // DUTCHX_VERSION_H
