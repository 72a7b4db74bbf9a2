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

#ifndef KEYMFA_CHALLENGE_HYBRID_ENCRYPTION_HPP
#define KEYMFA_CHALLENGE_HYBRID_ENCRYPTION_HPP

#include "challenge/encryption-provider.hpp"

namespace keymfa {

enum class KeyTransport : uint64_t {
  RSA_OAEP = 1,
  KEY_AGREEMENT = 2
};

std::ostream&
operator<<(std::ostream& os, KeyTransport transport);

/**
 * @brief Hybrid public-key encryption with OpenSSL.
 *
 * The payload is sealed with AES-128-GCM under a fresh content key. The content
 * key reaches the recipient in one of two ways:
 *   - RSA keys: the content key is wrapped with RSA-OAEP (SHA-256).
 *   - EC, X25519 and X448 keys: an ephemeral key pair of the same type is
 *     generated and the content key is derived from the agreed secret with
 *     HKDF-SHA256 over a random salt.
 * The wrapped key or the ephemeral public key is authenticated as associated data.
 *
 * The ciphertext is an EncryptedChallenge TLV block:
 *
 *   EncryptedChallenge = ENCRYPTED-CHALLENGE-TYPE TLV-LENGTH
 *                          KeyTransport
 *                          (WrappedKey / (EphemeralPublicKey Salt))
 *                          InitializationVector
 *                          AuthenticationTag
 *                          EncryptedPayload
 */
class HybridEncryption : public EncryptionProvider
{
public:
  std::unique_ptr<EncryptionContext>
  createContext(const PublicKey& key) override;

  Buffer
  decrypt(const PrivateKey& key, span<const uint8_t> ciphertext) override;

  static KeyTransport
  getKeyTransport(const EVP_PKEY* key);

  static const std::string HKDF_INFO;
  static constexpr size_t HKDF_SALT_SIZE = 32;
};

} // namespace keymfa

#endif // KEYMFA_CHALLENGE_HYBRID_ENCRYPTION_HPP
