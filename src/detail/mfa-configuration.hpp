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

#ifndef KEYMFA_DETAIL_MFA_CONFIGURATION_HPP
#define KEYMFA_DETAIL_MFA_CONFIGURATION_HPP

#include "detail/keymfa-common.hpp"

namespace keymfa {

const std::string CONFIG_SOLVE_WINDOW = "solve-window";
const std::string CONFIG_KEY_STORAGE = "key-storage";
const std::string CONFIG_KEY_STORAGE_PATH = "key-storage-path";

/**
 * @brief keymfa configuration.
 *
 * The format of the configuration in JSON
 * {
 *  "solve-window": "60",
 *  "key-storage": "key-storage-sqlite3",
 *  "key-storage-path": ""
 * }
 *
 * All keys are optional. The solve window is in seconds.
 */
class MfaConfig
{
public:
  /**
   * @brief Load configuration from the file.
   * @throw std::runtime_error when config file cannot be correctly parsed.
   */
  void
  load(const std::string& fileName);

public:
  /**
   * @brief How long a claimant has to solve a challenge.
   */
  time::seconds solveWindow = 60_s;
  /**
   * @brief Key storage factory type.
   */
  std::string storageType = "key-storage-sqlite3";
  /**
   * @brief Key storage location, empty for the storage default.
   */
  std::string storagePath;
};

} // namespace keymfa

#endif // KEYMFA_DETAIL_MFA_CONFIGURATION_HPP
