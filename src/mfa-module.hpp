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

#ifndef KEYMFA_MFA_MODULE_HPP
#define KEYMFA_MFA_MODULE_HPP

#include "challenge/challenge-session.hpp"
#include "detail/key-storage.hpp"
#include "detail/mfa-configuration.hpp"

namespace keymfa {

/**
 * @brief Chooses a key when the caller did not name one.
 *
 * Receives the stored keys, newest first, and returns the selection string
 * handed to selectKey().
 */
using SelectionSource = std::function<std::string(const std::list<KeyRecord>&)>;

/**
 * @brief Drives key import, key lookup and challenge issuance.
 *
 * The key storage and the encryption provider are owned by the caller and must
 * outlive the module.
 */
class MfaModule : boost::noncopyable
{
public:
  MfaModule(KeyStorage& storage, EncryptionProvider& provider, const MfaConfig& config);

  /**
   * @brief Validate and store a public key.
   * @throw Error KEY_READ, KEY_PRIVATE, KEY_EXPIRED, PUBLIC_KEY or KEY_ALREADY_IMPORTED
   */
  KeyRecord
  importKey(span<const uint8_t> keyBytes);

  /**
   * @brief Read a key file and import the key it holds.
   * @throw Error KEY_OPEN if the file cannot be read, and as importKey()
   */
  KeyRecord
  importKeyFile(const std::string& fileName);

  /**
   * @brief Find the key to challenge.
   *
   * With a fingerprint the key is looked up directly. Otherwise all stored keys
   * are handed to @p selectionSource and its answer is resolved with selectKey().
   *
   * @throw Error KEY_NOT_FOUND or INVALID_SELECTION
   */
  KeyRecord
  findKey(const std::optional<std::string>& fingerprint, const SelectionSource& selectionSource);

  /**
   * @brief Generate, encrypt and open a challenge of @p length symbols for @p key.
   *
   * The length is validated before anything is encrypted.
   *
   * @throw Error CHALLENGE_LENGTH, CHALLENGE_POW, RANDOM_SOURCE,
   *              ENCRYPTION_CONTEXT, ENCRYPTION or ARMOR
   */
  std::unique_ptr<ChallengeSession>
  issueChallenge(const KeyRecord& key, int64_t length);

  const MfaConfig&
  getConfig() const
  {
    return m_config;
  }

KEYMFA_PUBLIC_WITH_TESTS_ELSE_PRIVATE:
  KeyStorage& m_storage;
  EncryptionProvider& m_provider;
  MfaConfig m_config;
};

} // namespace keymfa

#endif // KEYMFA_MFA_MODULE_HPP
