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

#ifndef KEYMFA_CHALLENGE_ENCRYPTION_PROVIDER_HPP
#define KEYMFA_CHALLENGE_ENCRYPTION_PROVIDER_HPP

#include "detail/public-key.hpp"

namespace keymfa {

/**
 * @brief Encrypts data for the single recipient it was created for.
 */
class EncryptionContext : boost::noncopyable
{
public:
  virtual
  ~EncryptionContext() = default;

  /**
   * @throw std::runtime_error
   */
  virtual Buffer
  encrypt(span<const uint8_t> plaintext) = 0;
};

/**
 * @brief Public-key encryption back end used to protect challenges.
 *
 * The challenge lifecycle only relies on this interface. The armored form is
 * text safe to print on a terminal or paste into a mail.
 */
class EncryptionProvider : boost::noncopyable
{
public:
  virtual
  ~EncryptionProvider() = default;

  /**
   * @throw std::runtime_error if @p key cannot be used as a recipient
   */
  virtual std::unique_ptr<EncryptionContext>
  createContext(const PublicKey& key) = 0;

  /**
   * @brief Decrypt a ciphertext produced by a context of this provider.
   * @throw std::runtime_error on malformed input or authentication failure
   */
  virtual Buffer
  decrypt(const PrivateKey& key, span<const uint8_t> ciphertext) = 0;

  virtual std::string
  armor(span<const uint8_t> ciphertext) const;

  /**
   * @brief Recover the ciphertext from armored text.
   *
   * Text before the BEGIN line and after the END line is ignored.
   *
   * @throw std::runtime_error if no armored block is found
   */
  virtual Buffer
  dearmor(const std::string& armored) const;
};

/**
 * @brief Base64 armor with 64-column lines between BEGIN and END lines naming @p label.
 */
std::string
armorData(const std::string& label, span<const uint8_t> data);

Buffer
dearmorData(const std::string& label, const std::string& text);

} // namespace keymfa

#endif // KEYMFA_CHALLENGE_ENCRYPTION_PROVIDER_HPP
