// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DUTCHX_CRYPTO_RIPEMD160_H
#define DUTCHX_CRYPTO_RIPEMD160_H

#include <stdint.h>
#include <stdlib.h>

struct evp_md_ctx_st;

/** A hasher class for RIPEMD-160, backed by OpenSSL libcrypto. */
class CRIPEMD160
{
private:
    evp_md_ctx_st* ctx;

public:
    static const size_t OUTPUT_SIZE = 20;

    CRIPEMD160();
    ~CRIPEMD160();
    CRIPEMD160(const CRIPEMD160&) = delete;
    CRIPEMD160& operator=(const CRIPEMD160&) = delete;

    CRIPEMD160& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CRIPEMD160& Reset();
};

#endif // DUTCHX_CRYPTO_RIPEMD160_H
