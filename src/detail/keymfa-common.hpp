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

#ifndef KEYMFA_DETAIL_KEYMFA_COMMON_HPP
#define KEYMFA_DETAIL_KEYMFA_COMMON_HPP

#include "detail/keymfa-config.hpp"

#ifdef KEYMFA_HAVE_TESTS
#define KEYMFA_VIRTUAL_WITH_TESTS virtual
#define KEYMFA_PUBLIC_WITH_TESTS_ELSE_PROTECTED public
#define KEYMFA_PUBLIC_WITH_TESTS_ELSE_PRIVATE public
#else
#define KEYMFA_VIRTUAL_WITH_TESTS
#define KEYMFA_PUBLIC_WITH_TESTS_ELSE_PROTECTED protected
#define KEYMFA_PUBLIC_WITH_TESTS_ELSE_PRIVATE private
#endif

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

#include <ndn-cxx/encoding/block.hpp>
#include <ndn-cxx/encoding/block-helpers.hpp>
#include <ndn-cxx/encoding/buffer.hpp>
#include <ndn-cxx/util/exception.hpp>
#include <ndn-cxx/util/span.hpp>
#include <ndn-cxx/util/time.hpp>

#include <boost/assert.hpp>
#include <boost/noncopyable.hpp>
#include <boost/property_tree/ptree.hpp>

namespace keymfa {

using ndn::Block;
using ndn::Buffer;
using ndn::span;

namespace time = ndn::time;
using namespace ndn::time_literals;
using namespace std::string_literals;

namespace tlv {

enum : uint32_t {
  EncryptedChallenge = 201,
  KeyTransport = 203,
  WrappedKey = 205,
  EphemeralPublicKey = 207,
  Salt = 209,
  InitializationVector = 211,
  AuthenticationTag = 213,
  EncryptedPayload = 215
};

} // namespace tlv

using JsonSection = boost::property_tree::ptree;

// keymfa error code
enum class ErrorCode : uint64_t {
  NO_ERROR = 0,
  CHALLENGE_LENGTH = 1,
  CHALLENGE_POW = 2,
  RANDOM_SOURCE = 3,
  ENCRYPTION_CONTEXT = 4,
  ENCRYPTION = 5,
  ARMOR = 6,
  KEY_OPEN = 7,
  KEY_READ = 8,
  PUBLIC_KEY = 9,
  KEY_PRIVATE = 10,
  KEY_EXPIRED = 11,
  KEY_ALREADY_IMPORTED = 12,
  KEY_NOT_FOUND = 13,
  INVALID_SELECTION = 14,
  INPUT = 15
};

// Convert error code to string
std::ostream&
operator<<(std::ostream& os, ErrorCode code);

/**
 * @brief Returns the human-readable message reported for @p code.
 */
std::string
getErrorMessage(ErrorCode code);

/**
 * @brief Failure of a keymfa operation, identified by an ErrorCode.
 */
class Error : public std::runtime_error
{
public:
  explicit
  Error(ErrorCode code)
    : Error(code, getErrorMessage(code))
  {
  }

  Error(ErrorCode code, const std::string& what)
    : std::runtime_error(what)
    , m_code(code)
  {
  }

  ErrorCode
  getCode() const noexcept
  {
    return m_code;
  }

private:
  ErrorCode m_code;
};

} // namespace keymfa

#endif // KEYMFA_DETAIL_KEYMFA_COMMON_HPP
