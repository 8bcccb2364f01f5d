// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

CSHA256::CSHA256() : ctx(EVP_MD_CTX_new())
{
    if (ctx == nullptr) {
        throw std::runtime_error("CSHA256: EVP_MD_CTX_new failed");
    }
    Reset();
}

CSHA256::~CSHA256()
{
    EVP_MD_CTX_free(ctx);
}

CSHA256& CSHA256::Write(const unsigned char* data, size_t len)
{
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int nLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &nLen) != 1 || nLen != OUTPUT_SIZE) {
        throw std::runtime_error("CSHA256: EVP_DigestFinal_ex failed");
    }
}

CSHA256& CSHA256::Reset()
{
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}
