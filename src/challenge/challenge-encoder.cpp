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

#include "challenge/challenge-encoder.hpp"

#include <ndn-cxx/util/logger.hpp>

namespace keymfa {

NDN_LOG_INIT(keymfa.encoder);

EncryptedChallenge
encodeChallenge(EncryptionProvider& provider, const PublicKey& key, const Secret& secret)
{
  std::unique_ptr<EncryptionContext> context;
  try {
    context = provider.createContext(key);
  }
  catch (const std::exception& e) {
    NDN_LOG_ERROR("Cannot create encryption context for " << key.getFingerprint() << ": " << e.what());
    NDN_THROW_NESTED(Error(ErrorCode::ENCRYPTION_CONTEXT));
  }
  if (context == nullptr) {
    NDN_THROW(Error(ErrorCode::ENCRYPTION_CONTEXT));
  }

  EncryptedChallenge result;
  try {
    result.ciphertext = context->encrypt(secret.bytes());
  }
  catch (const std::exception& e) {
    NDN_LOG_ERROR("Cannot encrypt challenge: " << e.what());
    NDN_THROW_NESTED(Error(ErrorCode::ENCRYPTION));
  }

  try {
    result.armored = provider.armor(result.ciphertext);
  }
  catch (const std::exception& e) {
    NDN_LOG_ERROR("Cannot armor challenge: " << e.what());
    NDN_THROW_NESTED(Error(ErrorCode::ARMOR));
  }

  NDN_LOG_DEBUG("Encrypted a " << secret.size() << "-symbol challenge for " << key.getFingerprint()
                << " (" << result.ciphertext.size() << " bytes)");
  return result;
}

} // namespace keymfa
