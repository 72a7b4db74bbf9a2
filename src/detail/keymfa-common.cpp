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

#include "detail/keymfa-common.hpp"

#include <ndn-cxx/util/backports.hpp>

namespace keymfa {

std::ostream&
operator<<(std::ostream& out, ErrorCode code)
{
  switch (code) {
    case ErrorCode::NO_ERROR: return out << "NO_ERROR";
    case ErrorCode::CHALLENGE_LENGTH: return out << "CHALLENGE_LENGTH";
    case ErrorCode::CHALLENGE_POW: return out << "CHALLENGE_POW";
    case ErrorCode::RANDOM_SOURCE: return out << "RANDOM_SOURCE";
    case ErrorCode::ENCRYPTION_CONTEXT: return out << "ENCRYPTION_CONTEXT";
    case ErrorCode::ENCRYPTION: return out << "ENCRYPTION";
    case ErrorCode::ARMOR: return out << "ARMOR";
    case ErrorCode::KEY_OPEN: return out << "KEY_OPEN";
    case ErrorCode::KEY_READ: return out << "KEY_READ";
    case ErrorCode::PUBLIC_KEY: return out << "PUBLIC_KEY";
    case ErrorCode::KEY_PRIVATE: return out << "KEY_PRIVATE";
    case ErrorCode::KEY_EXPIRED: return out << "KEY_EXPIRED";
    case ErrorCode::KEY_ALREADY_IMPORTED: return out << "KEY_ALREADY_IMPORTED";
    case ErrorCode::KEY_NOT_FOUND: return out << "KEY_NOT_FOUND";
    case ErrorCode::INVALID_SELECTION: return out << "INVALID_SELECTION";
    case ErrorCode::INPUT: return out << "INPUT";
  }
  return out << "<Unknown Error " << ndn::to_underlying(code) << ">";
}

std::string
getErrorMessage(ErrorCode code)
{
  switch (code) {
    case ErrorCode::NO_ERROR: return "no error";
    case ErrorCode::CHALLENGE_LENGTH: return "challenge length must be a power of two between 1 and 512";
    case ErrorCode::CHALLENGE_POW: return "challenge length must be a power of two";
    case ErrorCode::RANDOM_SOURCE: return "failed to generate challenge";
    case ErrorCode::ENCRYPTION_CONTEXT: return "failed to create encryption context";
    case ErrorCode::ENCRYPTION: return "failed to encrypt challenge";
    case ErrorCode::ARMOR: return "failed to armor challenge";
    case ErrorCode::KEY_OPEN: return "failed to open key file";
    case ErrorCode::KEY_READ: return "failed to read key";
    case ErrorCode::PUBLIC_KEY: return "failed to get public key";
    case ErrorCode::KEY_PRIVATE: return "key is private, only public keys are accepted";
    case ErrorCode::KEY_EXPIRED: return "key has expired, cannot import";
    case ErrorCode::KEY_ALREADY_IMPORTED: return "key already imported";
    case ErrorCode::KEY_NOT_FOUND: return "key not found";
    case ErrorCode::INVALID_SELECTION: return "invalid choice";
    case ErrorCode::INPUT: return "failed to read input";
  }
  return "unknown error";
}

} // namespace keymfa
