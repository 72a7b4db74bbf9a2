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

#ifndef KEYMFA_DETAIL_KEY_RECORD_HPP
#define KEYMFA_DETAIL_KEY_RECORD_HPP

#include "detail/public-key.hpp"

namespace keymfa {

/**
 * @brief Represents an imported public key kept by the key storage.
 */
struct KeyRecord
{
  KeyRecord(PublicKey key, const time::system_clock::time_point& importTime);

  /**
   * @brief The fingerprint of the key, lowercase hex.
   */
  std::string fingerprint;
  /**
   * @brief The public key.
   */
  PublicKey publicKey;
  /**
   * @brief When the key was imported.
   */
  time::system_clock::time_point createdAt;
};

std::ostream&
operator<<(std::ostream& os, const KeyRecord& record);

} // namespace keymfa

#endif // KEYMFA_DETAIL_KEY_RECORD_HPP
