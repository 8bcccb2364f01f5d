// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_CRYPTO_SHA256_H
#define DUTCHX_CRYPTO_SHA256_H

#include <stdint.h>
#include <stdlib.h>

struct evp_md_ctx_st;

/** A hasher class for SHA-256, backed by OpenSSL libcrypto. */
class CSHA256
{
private:
    evp_md_ctx_st* ctx;

public:
    static const size_t OUTPUT_SIZE = 32;

    CSHA256();
    ~CSHA256();
    CSHA256(const CSHA256&) = delete;
    CSHA256& operator=(const CSHA256&) = delete;

    CSHA256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CSHA256& Reset();
};

#endif // DUTCHX_CRYPTO_SHA256_H
