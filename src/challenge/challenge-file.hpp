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

#ifndef KEYMFA_CHALLENGE_CHALLENGE_FILE_HPP
#define KEYMFA_CHALLENGE_CHALLENGE_FILE_HPP

#include "detail/keymfa-common.hpp"

#include <boost/filesystem/path.hpp>

namespace keymfa {

/**
 * @brief An armored challenge saved to a private file for the claimant to solve.
 *
 * The file is created exclusively, readable and writable by the owner only,
 * and removed when the object is destroyed. If it cannot be written, a warning
 * is logged and getPath() returns an empty path.
 */
class ChallengeFile : boost::noncopyable
{
public:
  /**
   * @param armored The armored challenge.
   * @param directory Where to create the file; the system temporary directory when empty.
   */
  explicit
  ChallengeFile(const std::string& armored, boost::filesystem::path directory = {});

  ~ChallengeFile();

  const boost::filesystem::path&
  getPath() const
  {
    return m_path;
  }

private:
  boost::filesystem::path m_path;
};

} // namespace keymfa

#endif // KEYMFA_CHALLENGE_CHALLENGE_FILE_HPP
