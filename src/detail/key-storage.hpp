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

#ifndef KEYMFA_DETAIL_KEY_STORAGE_HPP
#define KEYMFA_DETAIL_KEY_STORAGE_HPP

#include "detail/key-record.hpp"

#include <functional>
#include <list>
#include <map>

namespace keymfa {

class KeyStorage : boost::noncopyable
{
public:
  virtual
  ~KeyStorage() = default;

  /**
   * @brief Fetch a key by fingerprint, case-insensitively.
   * @throw Error KEY_NOT_FOUND if no key has this fingerprint
   */
  virtual KeyRecord
  getKey(const std::string& fingerprint) = 0;

  /**
   * @throw Error KEY_ALREADY_IMPORTED There is an existing key with the same fingerprint
   */
  virtual void
  addKey(const KeyRecord& record) = 0;

  virtual void
  deleteKey(const std::string& fingerprint) = 0;

  /**
   * @brief All stored keys, the most recently imported first.
   */
  virtual std::list<KeyRecord>
  listKeys() = 0;

public: // factory
  template<class KeyStorageType>
  static void
  registerKeyStorage(const std::string& type = KeyStorageType::STORAGE_TYPE)
  {
    auto& factory = getFactory();
    BOOST_ASSERT(factory.count(type) == 0);
    factory[type] = [] (const std::string& path) {
      return std::make_unique<KeyStorageType>(path);
    };
  }

  static bool
  isKeyStorageSupported(const std::string& keyStorageType);

  static std::unique_ptr<KeyStorage>
  createKeyStorage(const std::string& keyStorageType, const std::string& path);

private:
  using CreateFunc = std::function<std::unique_ptr<KeyStorage>(const std::string&)>;
  using KeyStorageFactory = std::map<std::string, CreateFunc>;

  static KeyStorageFactory&
  getFactory();
};

} // namespace keymfa

#define KEYMFA_REGISTER_KEY_STORAGE(C)                         \
static class KeyMfa##C##KeyStorageRegistrationClass            \
{                                                              \
public:                                                        \
  KeyMfa##C##KeyStorageRegistrationClass()                     \
  {                                                            \
    ::keymfa::KeyStorage::registerKeyStorage<C>();             \
  }                                                            \
} g_KeyMfa##C##KeyStorageRegistrationVariable

#endif // KEYMFA_DETAIL_KEY_STORAGE_HPP
