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

#ifndef KEYMFA_CHALLENGE_CHALLENGE_GENERATOR_HPP
#define KEYMFA_CHALLENGE_CHALLENGE_GENERATOR_HPP

#include "detail/keymfa-common.hpp"

#include <string_view>

namespace keymfa {

/**
 * @brief Symbols a challenge secret is drawn from.
 */
constexpr std::string_view CHALLENGE_CHARSET{
  "abcdefghijklmnopqrstuvwxyz"
  "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
  "0123456789"
  "-_+/\\'\"!@#$%^&*()[]{}<>?,.;:="};
static_assert(CHALLENGE_CHARSET.size() == 91, "challenge charset must hold 91 symbols");

constexpr int64_t MAX_CHALLENGE_LENGTH = 512;

/**
 * @brief Plaintext challenge secret.
 *
 * The bytes are wiped when the secret is cleared, moved from, or destroyed.
 * Secrets cannot be copied.
 */
class Secret : boost::noncopyable
{
public:
  Secret() = default;

  explicit
  Secret(Buffer bytes);

  Secret(Secret&& other) noexcept;

  Secret&
  operator=(Secret&& other) noexcept;

  ~Secret();

  span<const uint8_t>
  bytes() const noexcept
  {
    return m_bytes;
  }

  size_t
  size() const noexcept
  {
    return m_bytes.size();
  }

  bool
  empty() const noexcept
  {
    return m_bytes.empty();
  }

  /**
   * @brief Overwrite the secret and release its storage.
   */
  void
  clear() noexcept;

private:
  Buffer m_bytes;
};

/**
 * @brief Validate a requested challenge length.
 *
 * The range 1..MAX_CHALLENGE_LENGTH is checked before the power of two, so an
 * out-of-range value always reports CHALLENGE_LENGTH.
 *
 * @return ErrorCode::NO_ERROR, ErrorCode::CHALLENGE_LENGTH or ErrorCode::CHALLENGE_POW
 */
ErrorCode
checkChallengeLength(int64_t length) noexcept;

/**
 * @brief Generates random challenges of CHALLENGE_CHARSET symbols.
 *
 * Each secure random byte is reduced modulo the charset size. The resulting
 * slight bias toward the first symbols is accepted.
 */
class ChallengeGenerator
{
public:
  virtual
  ~ChallengeGenerator() = default;

  /**
   * @throw Error CHALLENGE_LENGTH, CHALLENGE_POW or RANDOM_SOURCE
   */
  Secret
  generate(int64_t length) const;

KEYMFA_PUBLIC_WITH_TESTS_ELSE_PROTECTED:
  /**
   * @brief Fill @p bytes from the secure random source.
   * @throw std::runtime_error if the random source fails
   */
  KEYMFA_VIRTUAL_WITH_TESTS void
  generateRandomBytes(span<uint8_t> bytes) const;
};

/**
 * @brief Generate a challenge of @p length symbols with the default generator.
 * @throw Error CHALLENGE_LENGTH, CHALLENGE_POW or RANDOM_SOURCE
 */
Secret
generateChallenge(int64_t length);

} // namespace keymfa

#endif // KEYMFA_CHALLENGE_CHALLENGE_GENERATOR_HPP
