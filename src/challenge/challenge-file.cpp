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

#include "challenge/challenge-file.hpp"

#include <ndn-cxx/util/logger.hpp>

#include <boost/filesystem/operations.hpp>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace keymfa {

NDN_LOG_INIT(keymfa.file);

static bool
writeAll(int fd, const std::string& content)
{
  size_t written = 0;
  while (written < content.size()) {
    auto n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

ChallengeFile::ChallengeFile(const std::string& armored, boost::filesystem::path directory)
{
  boost::system::error_code ec;
  if (directory.empty()) {
    directory = boost::filesystem::temp_directory_path(ec);
    if (ec) {
      NDN_LOG_WARN("No temporary directory: " << ec.message());
      return;
    }
  }

  auto path = directory / boost::filesystem::unique_path("keymfa-challenge-%%%%-%%%%-%%%%.asc");
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    NDN_LOG_WARN("Cannot create " << path << ": " << std::strerror(errno));
    return;
  }
  bool isOk = writeAll(fd, armored);
  isOk = ::close(fd) == 0 && isOk;
  if (!isOk) {
    NDN_LOG_WARN("Cannot write challenge to " << path);
    boost::filesystem::remove(path, ec);
    return;
  }
  m_path = path;
  NDN_LOG_DEBUG("Challenge saved to " << m_path);
}

ChallengeFile::~ChallengeFile()
{
  if (!m_path.empty()) {
    boost::system::error_code ec;
    boost::filesystem::remove(m_path, ec);
    if (ec) {
      NDN_LOG_WARN("Cannot remove " << m_path << ": " << ec.message());
    }
  }
}

} // namespace keymfa
