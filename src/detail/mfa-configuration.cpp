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

#include "detail/mfa-configuration.hpp"
#include "detail/key-storage.hpp"

#include <boost/property_tree/json_parser.hpp>

namespace keymfa {

void
MfaConfig::load(const std::string& fileName)
{
  JsonSection configJson;
  try {
    boost::property_tree::read_json(fileName, configJson);
  }
  catch (const std::exception& error) {
    NDN_THROW(std::runtime_error("Failed to parse configuration file " + fileName + ", " + error.what()));
  }

  if (configJson.begin() == configJson.end()) {
    NDN_THROW(std::runtime_error("No JSON configuration found in file: " + fileName));
  }

  int64_t window = 60;
  auto windowStr = configJson.get_optional<std::string>(CONFIG_SOLVE_WINDOW);
  if (windowStr) {
    try {
      window = configJson.get<int64_t>(CONFIG_SOLVE_WINDOW);
    }
    catch (const boost::property_tree::ptree_bad_data&) {
      NDN_THROW_NESTED(std::runtime_error("Solve window must be a whole number of seconds: " + *windowStr));
    }
  }
  if (window <= 0) {
    NDN_THROW(std::runtime_error("Solve window must be a positive number of seconds"));
  }
  solveWindow = time::seconds(window);

  storageType = configJson.get(CONFIG_KEY_STORAGE, "key-storage-sqlite3");
  if (!KeyStorage::isKeyStorageSupported(storageType)) {
    NDN_THROW(std::runtime_error("Unsupported key storage type: " + storageType));
  }
  storagePath = configJson.get(CONFIG_KEY_STORAGE_PATH, "");
}

} // namespace keymfa
