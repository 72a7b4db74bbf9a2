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

#include "challenge/challenge-generator.hpp"

#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/random.hpp>

#include <openssl/crypto.h>

namespace keymfa {

NDN_LOG_INIT(keymfa.generator);

Secret::Secret(Buffer bytes)
  : m_bytes(std::move(bytes))
{
}

Secret::Secret(Secret&& other) noexcept
  : m_bytes(std::move(other.m_bytes))
{
  other.clear();
}

Secret&
Secret::operator=(Secret&& other) noexcept
{
  if (this != &other) {
    clear();
    m_bytes = std::move(other.m_bytes);
    other.clear();
  }
  return *this;
}

Secret::~Secret()
{
  clear();
}

void
Secret::clear() noexcept
{
  if (!m_bytes.empty()) {
    OPENSSL_cleanse(m_bytes.data(), m_bytes.size());
  }
  m_bytes.clear();
  m_bytes.shrink_to_fit();
}

ErrorCode
checkChallengeLength(int64_t length) noexcept
{
  if (length < 1 || length > MAX_CHALLENGE_LENGTH) {
    return ErrorCode::CHALLENGE_LENGTH;
  }
  if ((length & (length - 1)) != 0) {
    return ErrorCode::CHALLENGE_POW;
  }
  return ErrorCode::NO_ERROR;
}

Secret
ChallengeGenerator::generate(int64_t length) const
{
  auto code = checkChallengeLength(length);
  if (code != ErrorCode::NO_ERROR) {
    NDN_LOG_DEBUG("Rejected challenge length " << length << ": " << code);
    NDN_THROW(Error(code));
  }

  Buffer bytes(static_cast<size_t>(length));
  try {
    generateRandomBytes(bytes);
  }
  catch (const std::exception& e) {
    OPENSSL_cleanse(bytes.data(), bytes.size());
    NDN_LOG_ERROR("Random source failure: " << e.what());
    NDN_THROW_NESTED(Error(ErrorCode::RANDOM_SOURCE));
  }

  for (auto& b : bytes) {
    b = static_cast<uint8_t>(CHALLENGE_CHARSET[b % CHALLENGE_CHARSET.size()]);
  }
  NDN_LOG_TRACE("Generated challenge of length " << length);
  return Secret(std::move(bytes));
}

void
ChallengeGenerator::generateRandomBytes(span<uint8_t> bytes) const
{
  ndn::random::generateSecureBytes(bytes);
}

Secret
generateChallenge(int64_t length)
{
  return ChallengeGenerator().generate(length);
}

} // namespace keymfa
