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

#include "detail/key-memory.hpp"

#include <algorithm>

#include <boost/algorithm/string/case_conv.hpp>

namespace keymfa {

const std::string KeyMemory::STORAGE_TYPE = "key-storage-memory";
KEYMFA_REGISTER_KEY_STORAGE(KeyMemory);

KeyMemory::KeyMemory(const std::string&)
  : KeyStorage()
{
}

KeyRecord
KeyMemory::getKey(const std::string& fingerprint)
{
  auto wanted = boost::algorithm::to_lower_copy(fingerprint);
  auto it = std::find_if(m_keys.begin(), m_keys.end(),
                         [&] (const KeyRecord& r) { return r.fingerprint == wanted; });
  if (it == m_keys.end()) {
    NDN_THROW(Error(ErrorCode::KEY_NOT_FOUND, "Key " + fingerprint + " does not exist"));
  }
  return *it;
}

void
KeyMemory::addKey(const KeyRecord& record)
{
  for (const auto& r : m_keys) {
    if (r.fingerprint == record.fingerprint) {
      NDN_THROW(Error(ErrorCode::KEY_ALREADY_IMPORTED));
    }
  }
  // a key imported at the same instant as an older one is still listed first
  auto pos = std::find_if(m_keys.begin(), m_keys.end(),
                          [&] (const KeyRecord& r) { return r.createdAt <= record.createdAt; });
  m_keys.insert(pos, record);
}

void
KeyMemory::deleteKey(const std::string& fingerprint)
{
  auto wanted = boost::algorithm::to_lower_copy(fingerprint);
  m_keys.remove_if([&] (const KeyRecord& r) { return r.fingerprint == wanted; });
}

std::list<KeyRecord>
KeyMemory::listKeys()
{
  return m_keys;
}

} // namespace keymfa
