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

#ifndef KEYMFA_DETAIL_PUBLIC_KEY_HPP
#define KEYMFA_DETAIL_PUBLIC_KEY_HPP

#include "detail/keymfa-common.hpp"

#include <memory>

#include <openssl/evp.h>

namespace keymfa {

/**
 * @brief A recipient public key.
 *
 * The key is identified by its fingerprint, the lowercase hex SHA-256 digest of
 * its DER-encoded SubjectPublicKeyInfo.
 */
class PublicKey
{
public:
  /**
   * @brief Parse and validate public key material supplied for import.
   *
   * Accepts a SubjectPublicKeyInfo or an X.509 certificate, in PEM or DER encoding.
   *
   * @param input The raw key material.
   * @param now The time against which a certificate's validity is checked.
   * @throw Error KEY_PRIVATE if the input holds private key material,
   *              KEY_EXPIRED if a certificate is no longer valid at @p now,
   *              PUBLIC_KEY if no public key can be extracted from a certificate,
   *              KEY_READ if the input cannot be parsed.
   */
  static PublicKey
  fromBytes(span<const uint8_t> input,
            const time::system_clock::time_point& now = time::system_clock::now());

  /**
   * @brief Load a key previously saved with toDer().
   * @throw Error KEY_READ
   */
  static PublicKey
  fromDer(span<const uint8_t> der);

  Buffer
  toDer() const;

  const std::string&
  getFingerprint() const
  {
    return m_fingerprint;
  }

  /**
   * @brief Algorithm name such as "RSA", "EC" or "X25519".
   */
  std::string
  getKeyType() const;

  int
  getKeySize() const;

  EVP_PKEY*
  getEvpKey() const
  {
    return m_key.get();
  }

private:
  explicit
  PublicKey(std::shared_ptr<EVP_PKEY> key);

private:
  std::shared_ptr<EVP_PKEY> m_key;
  std::string m_fingerprint;
};

/**
 * @brief The claimant's private key, used only to solve a challenge.
 */
class PrivateKey
{
public:
  /**
   * @brief Load an unencrypted private key in PEM or DER encoding.
   * @throw Error KEY_READ
   */
  static PrivateKey
  fromBytes(span<const uint8_t> input);

  EVP_PKEY*
  getEvpKey() const
  {
    return m_key.get();
  }

private:
  explicit
  PrivateKey(std::shared_ptr<EVP_PKEY> key);

private:
  std::shared_ptr<EVP_PKEY> m_key;
};

std::string
keyTypeToString(const EVP_PKEY* key);

} // namespace keymfa

#endif // KEYMFA_DETAIL_PUBLIC_KEY_HPP
