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

#include "detail/key-storage.hpp"

namespace keymfa {

bool
KeyStorage::isKeyStorageSupported(const std::string& keyStorageType)
{
  auto& factory = getFactory();
  return factory.find(keyStorageType) != factory.end();
}

std::unique_ptr<KeyStorage>
KeyStorage::createKeyStorage(const std::string& keyStorageType, const std::string& path)
{
  auto& factory = getFactory();
  auto i = factory.find(keyStorageType);
  return i == factory.end() ? nullptr : i->second(path);
}

KeyStorage::KeyStorageFactory&
KeyStorage::getFactory()
{
  static KeyStorage::KeyStorageFactory factory;
  return factory;
}

} // namespace keymfa
