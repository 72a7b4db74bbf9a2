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

#include "challenge/hybrid-encryption.hpp"
#include "detail/crypto-helpers.hpp"

#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/random.hpp>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace keymfa {

NDN_LOG_INIT(keymfa.encryption);

const std::string HybridEncryption::HKDF_INFO = "keymfa challenge";

namespace {

struct EvpPkeyCtxDeleter
{
  void
  operator()(EVP_PKEY_CTX* ctx) const
  {
    EVP_PKEY_CTX_free(ctx);
  }
};

using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;

[[noreturn]] void
throwOpenSslError(const std::string& what)
{
  std::string reason;
  auto code = ERR_get_error();
  if (code != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    reason = ": "s + buf;
  }
  ERR_clear_error();
  NDN_THROW(std::runtime_error(what + reason));
}

EvpPkeyCtxPtr
makeRsaOaepContext(EVP_PKEY* key, bool forEncryption)
{
  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(key, nullptr));
  if (ctx == nullptr) {
    throwOpenSslError("Cannot create RSA context");
  }
  int res = forEncryption ? EVP_PKEY_encrypt_init(ctx.get()) : EVP_PKEY_decrypt_init(ctx.get());
  if (res <= 0 ||
      EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0 ||
      EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), EVP_sha256()) <= 0) {
    throwOpenSslError("Cannot set up RSA-OAEP");
  }
  return ctx;
}

Buffer
deriveSharedSecret(EVP_PKEY* own, EVP_PKEY* peer)
{
  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(own, nullptr));
  if (ctx == nullptr ||
      EVP_PKEY_derive_init(ctx.get()) <= 0 ||
      EVP_PKEY_derive_set_peer(ctx.get(), peer) <= 0) {
    throwOpenSslError("Cannot set up key agreement");
  }
  size_t len = 0;
  if (EVP_PKEY_derive(ctx.get(), nullptr, &len) <= 0) {
    throwOpenSslError("Cannot determine shared secret size");
  }
  Buffer secret(len);
  if (EVP_PKEY_derive(ctx.get(), secret.data(), &len) <= 0) {
    throwOpenSslError("Key agreement failed");
  }
  secret.resize(len);
  return secret;
}

Buffer
deriveContentKey(const Buffer& sharedSecret, span<const uint8_t> salt)
{
  Buffer key(AES_128_KEY_SIZE);
  hkdf(sharedSecret.data(), sharedSecret.size(), salt.data(), salt.size(),
       key.data(), key.size(),
       reinterpret_cast<const uint8_t*>(HybridEncryption::HKDF_INFO.data()),
       HybridEncryption::HKDF_INFO.size());
  return key;
}

void
wipe(Buffer& buffer)
{
  OPENSSL_cleanse(buffer.data(), buffer.size());
}

Buffer
encodeChallengeBlock(KeyTransport transport, const std::vector<Block>& transportBlocks,
                     span<const uint8_t> plaintext, span<const uint8_t> associated,
                     const Buffer& contentKey)
{
  Buffer iv(AES_GCM_IV_SIZE);
  ndn::random::generateSecureBytes(iv);
  Buffer tag(AES_GCM_TAG_SIZE);
  Buffer payload(plaintext.size());
  aesGcm128Encrypt(plaintext.data(), plaintext.size(), associated.data(), associated.size(),
                   contentKey.data(), iv.data(), payload.data(), tag.data());

  Block block(tlv::EncryptedChallenge);
  block.push_back(ndn::encoding::makeNonNegativeIntegerBlock(tlv::KeyTransport,
                                                            static_cast<uint64_t>(transport)));
  for (const auto& b : transportBlocks) {
    block.push_back(b);
  }
  block.push_back(ndn::encoding::makeBinaryBlock(tlv::InitializationVector, iv));
  block.push_back(ndn::encoding::makeBinaryBlock(tlv::AuthenticationTag, tag));
  block.push_back(ndn::encoding::makeBinaryBlock(tlv::EncryptedPayload, payload));
  block.encode();
  return Buffer(block.data(), block.size());
}

class RsaOaepContext : public EncryptionContext
{
public:
  explicit
  RsaOaepContext(const PublicKey& key)
    : m_ctx(makeRsaOaepContext(key.getEvpKey(), true))
  {
  }

  Buffer
  encrypt(span<const uint8_t> plaintext) override
  {
    Buffer contentKey(AES_128_KEY_SIZE);
    ndn::random::generateSecureBytes(contentKey);

    size_t len = 0;
    if (EVP_PKEY_encrypt(m_ctx.get(), nullptr, &len, contentKey.data(), contentKey.size()) <= 0) {
      wipe(contentKey);
      throwOpenSslError("Cannot determine wrapped key size");
    }
    Buffer wrapped(len);
    if (EVP_PKEY_encrypt(m_ctx.get(), wrapped.data(), &len, contentKey.data(), contentKey.size()) <= 0) {
      wipe(contentKey);
      throwOpenSslError("Cannot wrap the content key");
    }
    wrapped.resize(len);

    try {
      auto result = encodeChallengeBlock(KeyTransport::RSA_OAEP,
                                         {ndn::encoding::makeBinaryBlock(tlv::WrappedKey, wrapped)},
                                         plaintext, wrapped, contentKey);
      wipe(contentKey);
      return result;
    }
    catch (const std::exception&) {
      wipe(contentKey);
      throw;
    }
  }

private:
  EvpPkeyCtxPtr m_ctx;
};

class KeyAgreementContext : public EncryptionContext
{
public:
  explicit
  KeyAgreementContext(const PublicKey& key)
    : m_ctx(EVP_PKEY_CTX_new(key.getEvpKey(), nullptr))
    , m_peer(key)
  {
    if (m_ctx == nullptr || EVP_PKEY_keygen_init(m_ctx.get()) <= 0) {
      throwOpenSslError("Cannot set up ephemeral key generation");
    }
  }

  Buffer
  encrypt(span<const uint8_t> plaintext) override
  {
    EVP_PKEY* ephemeralRaw = nullptr;
    if (EVP_PKEY_keygen(m_ctx.get(), &ephemeralRaw) <= 0) {
      throwOpenSslError("Cannot generate ephemeral key");
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> ephemeral(ephemeralRaw, &EVP_PKEY_free);

    int derLen = i2d_PUBKEY(ephemeral.get(), nullptr);
    if (derLen <= 0) {
      throwOpenSslError("Cannot encode ephemeral key");
    }
    Buffer ephemeralDer(static_cast<size_t>(derLen));
    auto out = ephemeralDer.data();
    i2d_PUBKEY(ephemeral.get(), &out);

    Buffer salt(HybridEncryption::HKDF_SALT_SIZE);
    ndn::random::generateSecureBytes(salt);

    auto shared = deriveSharedSecret(ephemeral.get(), m_peer.getEvpKey());
    Buffer contentKey;
    try {
      contentKey = deriveContentKey(shared, salt);
    }
    catch (const std::exception&) {
      wipe(shared);
      throw;
    }
    wipe(shared);

    try {
      auto result = encodeChallengeBlock(KeyTransport::KEY_AGREEMENT,
                                         {ndn::encoding::makeBinaryBlock(tlv::EphemeralPublicKey, ephemeralDer),
                                          ndn::encoding::makeBinaryBlock(tlv::Salt, salt)},
                                         plaintext, ephemeralDer, contentKey);
      wipe(contentKey);
      return result;
    }
    catch (const std::exception&) {
      wipe(contentKey);
      throw;
    }
  }

private:
  EvpPkeyCtxPtr m_ctx;
  PublicKey m_peer;
};

span<const uint8_t>
getField(const Block& block, uint32_t type, size_t expectedSize = 0)
{
  auto it = block.find(type);
  if (it == block.elements_end()) {
    NDN_THROW(std::runtime_error("Encrypted challenge lacks TLV-TYPE " + std::to_string(type)));
  }
  auto value = it->value_bytes();
  if (expectedSize != 0 && value.size() != expectedSize) {
    NDN_THROW(std::runtime_error("Encrypted challenge has a malformed TLV-TYPE " + std::to_string(type)));
  }
  return value;
}

} // namespace

std::ostream&
operator<<(std::ostream& os, KeyTransport transport)
{
  switch (transport) {
    case KeyTransport::RSA_OAEP:
      return os << "RSA-OAEP";
    case KeyTransport::KEY_AGREEMENT:
      return os << "KEY-AGREEMENT";
  }
  return os << "<Unknown Key Transport " << static_cast<uint64_t>(transport) << ">";
}

KeyTransport
HybridEncryption::getKeyTransport(const EVP_PKEY* key)
{
  if (EVP_PKEY_is_a(key, "RSA")) {
    return KeyTransport::RSA_OAEP;
  }
  if (EVP_PKEY_is_a(key, "EC") || EVP_PKEY_is_a(key, "X25519") || EVP_PKEY_is_a(key, "X448")) {
    return KeyTransport::KEY_AGREEMENT;
  }
  NDN_THROW(std::runtime_error(keyTypeToString(key) + " keys cannot be used for encryption"));
}

std::unique_ptr<EncryptionContext>
HybridEncryption::createContext(const PublicKey& key)
{
  auto transport = getKeyTransport(key.getEvpKey());
  NDN_LOG_DEBUG("Encrypting for " << key.getFingerprint() << " using " << transport);
  if (transport == KeyTransport::RSA_OAEP) {
    return std::make_unique<RsaOaepContext>(key);
  }
  return std::make_unique<KeyAgreementContext>(key);
}

Buffer
HybridEncryption::decrypt(const PrivateKey& key, span<const uint8_t> ciphertext)
{
  Block block;
  try {
    block = Block(ciphertext);
    if (block.type() != tlv::EncryptedChallenge) {
      NDN_THROW(std::runtime_error("Unexpected TLV-TYPE " + std::to_string(block.type())));
    }
    block.parse();
  }
  catch (const ndn::tlv::Error&) {
    NDN_THROW_NESTED(std::runtime_error("Malformed encrypted challenge"));
  }

  uint64_t transport = 0;
  try {
    transport = ndn::encoding::readNonNegativeInteger(block.get(tlv::KeyTransport));
  }
  catch (const ndn::tlv::Error&) {
    NDN_THROW_NESTED(std::runtime_error("Malformed key transport in encrypted challenge"));
  }
  auto iv = getField(block, tlv::InitializationVector, AES_GCM_IV_SIZE);
  auto tag = getField(block, tlv::AuthenticationTag, AES_GCM_TAG_SIZE);
  auto payload = getField(block, tlv::EncryptedPayload);

  Buffer contentKey;
  span<const uint8_t> associated;
  if (transport == static_cast<uint64_t>(KeyTransport::RSA_OAEP)) {
    auto wrapped = getField(block, tlv::WrappedKey);
    auto ctx = makeRsaOaepContext(key.getEvpKey(), false);
    size_t len = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &len, wrapped.data(), wrapped.size()) <= 0) {
      throwOpenSslError("Cannot determine content key size");
    }
    contentKey.resize(len);
    if (EVP_PKEY_decrypt(ctx.get(), contentKey.data(), &len, wrapped.data(), wrapped.size()) <= 0) {
      wipe(contentKey);
      throwOpenSslError("Cannot unwrap the content key");
    }
    contentKey.resize(len);
    if (contentKey.size() != AES_128_KEY_SIZE) {
      wipe(contentKey);
      NDN_THROW(std::runtime_error("Unwrapped content key has an unexpected size"));
    }
    associated = wrapped;
  }
  else if (transport == static_cast<uint64_t>(KeyTransport::KEY_AGREEMENT)) {
    auto ephemeralDer = getField(block, tlv::EphemeralPublicKey);
    auto salt = getField(block, tlv::Salt, HKDF_SALT_SIZE);
    auto ephemeral = PublicKey::fromDer(ephemeralDer);
    auto shared = deriveSharedSecret(key.getEvpKey(), ephemeral.getEvpKey());
    try {
      contentKey = deriveContentKey(shared, salt);
    }
    catch (const std::exception&) {
      wipe(shared);
      throw;
    }
    wipe(shared);
    associated = ephemeralDer;
  }
  else {
    NDN_THROW(std::runtime_error("Unsupported key transport " + std::to_string(transport)));
  }

  Buffer plaintext(payload.size());
  try {
    plaintext.resize(aesGcm128Decrypt(payload.data(), payload.size(), associated.data(), associated.size(),
                                      tag.data(), contentKey.data(), iv.data(), plaintext.data()));
  }
  catch (const std::exception&) {
    wipe(contentKey);
    NDN_THROW_NESTED(std::runtime_error("Encrypted challenge failed authentication"));
  }
  wipe(contentKey);
  NDN_LOG_TRACE("Decrypted challenge of " << plaintext.size() << " bytes");
  return plaintext;
}

} // namespace keymfa
