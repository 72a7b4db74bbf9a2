/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2024-2026, The keymfa Authors.
 *
 * This file is part of keymfa, a challenge-response multi-factor authentication
 * tool based on public-key encryption.
 *
 * keymfa is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * keymfa is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * keymfa, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of keymfa authors and contributors.
 */

#include "detail/crypto-helpers.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>

namespace keymfa {

size_t
hkdf(const uint8_t* secret, size_t secretLen, const uint8_t* salt,
     size_t saltLen, uint8_t* output, size_t outputLen,
     const uint8_t* info, size_t infoLen)
{
  EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
  if (pctx == nullptr) {
    NDN_THROW(std::runtime_error("HKDF: Cannot create context when calling EVP_PKEY_CTX_new_id()"));
  }
  if (EVP_PKEY_derive_init(pctx) <= 0 ||
      EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt, static_cast<int>(saltLen)) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_key(pctx, secret, static_cast<int>(secretLen)) <= 0 ||
      EVP_PKEY_CTX_add1_hkdf_info(pctx, info, static_cast<int>(infoLen)) <= 0) {
    EVP_PKEY_CTX_free(pctx);
    NDN_THROW(std::runtime_error("HKDF: Cannot set up the derivation parameters"));
  }
  size_t outLen = outputLen;
  auto resultCode = EVP_PKEY_derive(pctx, output, &outLen);
  EVP_PKEY_CTX_free(pctx);
  if (resultCode <= 0) {
    NDN_THROW(std::runtime_error("Error when calling HKDF"));
  }
  return outLen;
}

size_t
aesGcm128Encrypt(const uint8_t* plaintext, size_t plaintextLen, const uint8_t* associated, size_t associatedLen,
                 const uint8_t* key, const uint8_t* iv, uint8_t* ciphertext, uint8_t* tag)
{
  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    NDN_THROW(std::runtime_error("Cannot create and initialise the context when calling EVP_CIPHER_CTX_new()"));
  }
  int len = 0;
  size_t ciphertextLen = 0;
  bool isOk = EVP_EncryptInit_ex(ctx, EVP_aes_128_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, AES_GCM_IV_SIZE, nullptr) == 1 &&
              EVP_EncryptInit_ex(ctx, nullptr, nullptr, key, iv) == 1 &&
              EVP_EncryptUpdate(ctx, nullptr, &len, associated, static_cast<int>(associatedLen)) == 1 &&
              EVP_EncryptUpdate(ctx, ciphertext, &len, plaintext, static_cast<int>(plaintextLen)) == 1;
  if (isOk) {
    ciphertextLen = len;
    isOk = EVP_EncryptFinal_ex(ctx, ciphertext + len, &len) == 1;
    ciphertextLen += len;
  }
  if (isOk) {
    isOk = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, AES_GCM_TAG_SIZE, tag) == 1;
  }
  EVP_CIPHER_CTX_free(ctx);
  if (!isOk) {
    NDN_THROW(std::runtime_error("Error in encryption plaintext with AES GCM"));
  }
  return ciphertextLen;
}

size_t
aesGcm128Decrypt(const uint8_t* ciphertext, size_t ciphertextLen, const uint8_t* associated, size_t associatedLen,
                 const uint8_t* tag, const uint8_t* key, const uint8_t* iv, uint8_t* plaintext)
{
  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    NDN_THROW(std::runtime_error("Cannot create and initialise the context when calling EVP_CIPHER_CTX_new()"));
  }
  int len = 0;
  size_t plaintextLen = 0;
  bool isOk = EVP_DecryptInit_ex(ctx, EVP_aes_128_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, AES_GCM_IV_SIZE, nullptr) == 1 &&
              EVP_DecryptInit_ex(ctx, nullptr, nullptr, key, iv) == 1 &&
              EVP_DecryptUpdate(ctx, nullptr, &len, associated, static_cast<int>(associatedLen)) == 1 &&
              EVP_DecryptUpdate(ctx, plaintext, &len, ciphertext, static_cast<int>(ciphertextLen)) == 1;
  if (isOk) {
    plaintextLen = len;
    isOk = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, AES_GCM_TAG_SIZE,
                               const_cast<void*>(reinterpret_cast<const void*>(tag))) == 1 &&
           EVP_DecryptFinal_ex(ctx, plaintext + len, &len) == 1;
    plaintextLen += len;
  }
  EVP_CIPHER_CTX_free(ctx);
  if (!isOk) {
    NDN_THROW(std::runtime_error("Error in decrypting ciphertext with AES GCM"));
  }
  return plaintextLen;
}

Buffer
sha256(span<const uint8_t> data)
{
  Buffer digest(EVP_MAX_MD_SIZE);
  unsigned int digestLen = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &digestLen, EVP_sha256(), nullptr) != 1) {
    NDN_THROW(std::runtime_error("Error when calling EVP_Digest()"));
  }
  digest.resize(digestLen);
  return digest;
}

bool
constantTimeEquals(span<const uint8_t> expected, span<const uint8_t> given) noexcept
{
  if (expected.size() != given.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected.data(), given.data(), expected.size()) == 0;
}

} // namespace keymfa
