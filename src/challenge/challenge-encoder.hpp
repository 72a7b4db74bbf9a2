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

#ifndef KEYMFA_CHALLENGE_CHALLENGE_ENCODER_HPP
#define KEYMFA_CHALLENGE_CHALLENGE_ENCODER_HPP

#include "challenge/challenge-generator.hpp"
#include "challenge/encryption-provider.hpp"

namespace keymfa {

/**
 * @brief A challenge secret encrypted for one recipient.
 */
struct EncryptedChallenge
{
  /**
   * @brief The provider's raw ciphertext.
   */
  Buffer ciphertext;
  /**
   * @brief The ciphertext in armored form, safe to display.
   */
  std::string armored;
};

/**
 * @brief Encrypt @p secret for @p key and armor the result.
 *
 * The encryption context lives only for the duration of the call.
 *
 * @throw Error ENCRYPTION_CONTEXT, ENCRYPTION or ARMOR, with the provider's
 *              exception nested
 */
EncryptedChallenge
encodeChallenge(EncryptionProvider& provider, const PublicKey& key, const Secret& secret);

} // namespace keymfa

#endif // KEYMFA_CHALLENGE_CHALLENGE_ENCODER_HPP
