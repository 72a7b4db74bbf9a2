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

#include "challenge/encryption-provider.hpp"

#include <ndn-cxx/encoding/buffer-stream.hpp>
#include <ndn-cxx/security/transform/base64-decode.hpp>
#include <ndn-cxx/security/transform/base64-encode.hpp>
#include <ndn-cxx/security/transform/buffer-source.hpp>
#include <ndn-cxx/security/transform/stream-sink.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace keymfa {

const std::string CHALLENGE_ARMOR_LABEL = "KEYMFA CHALLENGE";

std::string
armorData(const std::string& label, span<const uint8_t> data)
{
  namespace t = ndn::security::transform;

  std::ostringstream os;
  os << "-----BEGIN " << label << "-----\n";
  t::bufferSource(data) >> t::base64Encode(true) >> t::streamSink(os);
  auto text = os.str();
  if (text.back() != '\n') {
    text += '\n';
  }
  return text + "-----END " + label + "-----\n";
}

Buffer
dearmorData(const std::string& label, const std::string& text)
{
  namespace t = ndn::security::transform;

  const std::string begin = "-----BEGIN " + label + "-----";
  const std::string end = "-----END " + label + "-----";

  auto beginPos = text.find(begin);
  if (beginPos == std::string::npos) {
    NDN_THROW(std::runtime_error("No " + label + " block found"));
  }
  beginPos += begin.size();
  auto endPos = text.find(end, beginPos);
  if (endPos == std::string::npos) {
    NDN_THROW(std::runtime_error("Unterminated " + label + " block"));
  }

  std::string encoded;
  std::copy_if(text.begin() + beginPos, text.begin() + endPos, std::back_inserter(encoded),
               [] (unsigned char c) { return !std::isspace(c); });
  if (encoded.empty()) {
    NDN_THROW(std::runtime_error("Empty " + label + " block"));
  }

  ndn::OBufferStream os;
  t::bufferSource(encoded) >> t::base64Decode(false) >> t::streamSink(os);
  auto decoded = os.buf();
  if (decoded->empty()) {
    NDN_THROW(std::runtime_error("Invalid base64 in " + label + " block"));
  }
  return *decoded;
}

std::string
EncryptionProvider::armor(span<const uint8_t> ciphertext) const
{
  return armorData(CHALLENGE_ARMOR_LABEL, ciphertext);
}

Buffer
EncryptionProvider::dearmor(const std::string& armored) const
{
  return dearmorData(CHALLENGE_ARMOR_LABEL, armored);
}

} // namespace keymfa
