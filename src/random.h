// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_RANDOM_H
#define DUTCHX_RANDOM_H

#include "uint256.h"

#include <stdint.h>

/**
 * Functions to gather random data via the OpenSSL PRNG
 */
void GetRandBytes(unsigned char* buf, int num);
uint64_t GetRand(uint64_t nMax);
uint256 GetRandHash();

#endif // DUTCHX_RANDOM_H
