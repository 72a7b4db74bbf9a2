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

#include "detail/public-key.hpp"
#include "detail/crypto-helpers.hpp"

#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/string-helper.hpp>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <string_view>

namespace keymfa {

NDN_LOG_INIT(keymfa.key);

namespace {

struct BioDeleter
{
  void
  operator()(BIO* bio) const
  {
    BIO_free(bio);
  }
};

struct X509Deleter
{
  void
  operator()(X509* cert) const
  {
    X509_free(cert);
  }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

std::shared_ptr<EVP_PKEY>
wrapKey(EVP_PKEY* key)
{
  return std::shared_ptr<EVP_PKEY>(key, &EVP_PKEY_free);
}

BioPtr
makeMemoryBio(span<const uint8_t> input)
{
  BioPtr bio(BIO_new_mem_buf(input.data(), static_cast<int>(input.size())));
  if (bio == nullptr) {
    NDN_THROW(std::runtime_error("Cannot allocate a memory BIO"));
  }
  return bio;
}

int
noPassword(char*, int, int, void*)
{
  return 0;
}

std::shared_ptr<EVP_PKEY>
extractFromCertificate(X509* cert, const time::system_clock::time_point& now)
{
  time_t nowT = time::system_clock::to_time_t(now);
  int cmp = X509_cmp_time(X509_get0_notAfter(cert), &nowT);
  if (cmp == 0) {
    NDN_THROW(Error(ErrorCode::KEY_READ, "failed to read key: malformed certificate validity"));
  }
  if (cmp < 0) {
    NDN_THROW(Error(ErrorCode::KEY_EXPIRED));
  }
  EVP_PKEY* key = X509_get_pubkey(cert);
  if (key == nullptr) {
    NDN_THROW(Error(ErrorCode::PUBLIC_KEY));
  }
  return wrapKey(key);
}

std::shared_ptr<EVP_PKEY>
parsePem(span<const uint8_t> input, const time::system_clock::time_point& now)
{
  std::string_view text(reinterpret_cast<const char*>(input.data()), input.size());
  if (text.find("PRIVATE KEY-----") != std::string_view::npos) {
    NDN_THROW(Error(ErrorCode::KEY_PRIVATE));
  }

  auto bio = makeMemoryBio(input);
  if (text.find("-----BEGIN CERTIFICATE-----") != std::string_view::npos) {
    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, &noPassword, nullptr));
    if (cert == nullptr) {
      NDN_THROW(Error(ErrorCode::KEY_READ));
    }
    return extractFromCertificate(cert.get(), now);
  }

  EVP_PKEY* key = PEM_read_bio_PUBKEY(bio.get(), nullptr, &noPassword, nullptr);
  if (key == nullptr) {
    NDN_THROW(Error(ErrorCode::KEY_READ));
  }
  return wrapKey(key);
}

std::shared_ptr<EVP_PKEY>
parseDer(span<const uint8_t> input, const time::system_clock::time_point& now)
{
  const unsigned char* p = input.data();
  EVP_PKEY* key = d2i_PUBKEY(nullptr, &p, static_cast<long>(input.size()));
  if (key != nullptr) {
    return wrapKey(key);
  }

  p = input.data();
  X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(input.size())));
  if (cert != nullptr) {
    return extractFromCertificate(cert.get(), now);
  }

  p = input.data();
  EVP_PKEY* privateKey = d2i_AutoPrivateKey(nullptr, &p, static_cast<long>(input.size()));
  if (privateKey != nullptr) {
    EVP_PKEY_free(privateKey);
    NDN_THROW(Error(ErrorCode::KEY_PRIVATE));
  }
  NDN_THROW(Error(ErrorCode::KEY_READ));
}

bool
isPem(span<const uint8_t> input)
{
  std::string_view text(reinterpret_cast<const char*>(input.data()), input.size());
  return text.find("-----BEGIN ") != std::string_view::npos;
}

} // namespace

PublicKey::PublicKey(std::shared_ptr<EVP_PKEY> key)
  : m_key(std::move(key))
{
  m_fingerprint = ndn::toHex(sha256(toDer()), false);
}

PublicKey
PublicKey::fromBytes(span<const uint8_t> input, const time::system_clock::time_point& now)
{
  if (input.empty()) {
    NDN_THROW(Error(ErrorCode::KEY_READ));
  }
  std::shared_ptr<EVP_PKEY> key;
  try {
    key = isPem(input) ? parsePem(input, now) : parseDer(input, now);
  }
  catch (const Error&) {
    ERR_clear_error();
    throw;
  }
  PublicKey result(std::move(key));
  NDN_LOG_DEBUG("Parsed " << result.getKeyType() << " key " << result.getFingerprint());
  return result;
}

PublicKey
PublicKey::fromDer(span<const uint8_t> der)
{
  const unsigned char* p = der.data();
  EVP_PKEY* key = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
  if (key == nullptr) {
    ERR_clear_error();
    NDN_THROW(Error(ErrorCode::KEY_READ));
  }
  return PublicKey(wrapKey(key));
}

Buffer
PublicKey::toDer() const
{
  int len = i2d_PUBKEY(m_key.get(), nullptr);
  if (len <= 0) {
    NDN_THROW(Error(ErrorCode::PUBLIC_KEY));
  }
  Buffer der(static_cast<size_t>(len));
  unsigned char* p = der.data();
  i2d_PUBKEY(m_key.get(), &p);
  return der;
}

std::string
PublicKey::getKeyType() const
{
  return keyTypeToString(m_key.get());
}

int
PublicKey::getKeySize() const
{
  return EVP_PKEY_get_bits(m_key.get());
}

PrivateKey::PrivateKey(std::shared_ptr<EVP_PKEY> key)
  : m_key(std::move(key))
{
}

PrivateKey
PrivateKey::fromBytes(span<const uint8_t> input)
{
  EVP_PKEY* key = nullptr;
  if (isPem(input)) {
    auto bio = makeMemoryBio(input);
    key = PEM_read_bio_PrivateKey(bio.get(), nullptr, &noPassword, nullptr);
  }
  else {
    const unsigned char* p = input.data();
    key = d2i_AutoPrivateKey(nullptr, &p, static_cast<long>(input.size()));
  }
  if (key == nullptr) {
    ERR_clear_error();
    NDN_THROW(Error(ErrorCode::KEY_READ, "failed to read private key"));
  }
  return PrivateKey(wrapKey(key));
}

std::string
keyTypeToString(const EVP_PKEY* key)
{
  switch (EVP_PKEY_get_base_id(key)) {
    case EVP_PKEY_RSA: return "RSA";
    case EVP_PKEY_RSA_PSS: return "RSA-PSS";
    case EVP_PKEY_EC: return "EC";
    case EVP_PKEY_X25519: return "X25519";
    case EVP_PKEY_X448: return "X448";
    case EVP_PKEY_ED25519: return "ED25519";
    case EVP_PKEY_ED448: return "ED448";
    case EVP_PKEY_DH: return "DH";
    default: return "UNKNOWN";
  }
}

} // namespace keymfa
