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

#include "mfa-module.hpp"
#include "key-selection.hpp"

#include <ndn-cxx/util/logger.hpp>

#include <fstream>
#include <iterator>

namespace keymfa {

NDN_LOG_INIT(keymfa.module);

MfaModule::MfaModule(KeyStorage& storage, EncryptionProvider& provider, const MfaConfig& config)
  : m_storage(storage)
  , m_provider(provider)
  , m_config(config)
{
}

KeyRecord
MfaModule::importKey(span<const uint8_t> keyBytes)
{
  auto now = time::system_clock::now();
  KeyRecord record(PublicKey::fromBytes(keyBytes, now), now);
  NDN_LOG_INFO("Importing key " << record.fingerprint);
  m_storage.addKey(record);
  NDN_LOG_DEBUG("Imported " << record);
  return record;
}

KeyRecord
MfaModule::importKeyFile(const std::string& fileName)
{
  std::ifstream file(fileName, std::ios::binary);
  if (!file) {
    NDN_THROW(Error(ErrorCode::KEY_OPEN, getErrorMessage(ErrorCode::KEY_OPEN) + ": " + fileName));
  }
  Buffer content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    NDN_THROW(Error(ErrorCode::KEY_OPEN, getErrorMessage(ErrorCode::KEY_OPEN) + ": " + fileName));
  }
  return importKey(content);
}

KeyRecord
MfaModule::findKey(const std::optional<std::string>& fingerprint, const SelectionSource& selectionSource)
{
  if (fingerprint) {
    return m_storage.getKey(*fingerprint);
  }

  auto keys = m_storage.listKeys();
  if (keys.empty()) {
    NDN_THROW(Error(ErrorCode::KEY_NOT_FOUND, "No keys have been imported"));
  }
  auto key = selectKey(keys, selectionSource(keys));
  NDN_LOG_DEBUG("Selected key " << key.fingerprint);
  return key;
}

std::unique_ptr<ChallengeSession>
MfaModule::issueChallenge(const KeyRecord& key, int64_t length)
{
  auto secret = generateChallenge(length);
  auto encrypted = encodeChallenge(m_provider, key.publicKey, secret);
  NDN_LOG_INFO("Issuing a " << length << "-symbol challenge to " << key.fingerprint);
  return std::make_unique<ChallengeSession>(std::move(secret), std::move(encrypted),
                                            m_config.solveWindow);
}

} // namespace keymfa
