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

#include "challenge/hybrid-encryption.hpp"

#include "tests/key-fixture.hpp"
#include "tests/test-common.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <sstream>

namespace keymfa::tests {

BOOST_FIXTURE_TEST_SUITE(TestHybridEncryption, KeyFixture)

static Buffer
encryptFor(HybridEncryption& provider, const TestKey& key, const std::string& plaintext)
{
  auto context = provider.createContext(key.getPublicKey());
  BOOST_REQUIRE(context != nullptr);
  return context->encrypt(toBytes(plaintext));
}

BOOST_AUTO_TEST_CASE(RoundTrip)
{
  HybridEncryption provider;
  const std::string plaintext = "aB3-_+/\\'\"!@#$%^&*()[]{}<>?,.;:=";

  for (const std::string type : {"RSA", "EC", "X25519", "X448"}) {
    BOOST_TEST_CONTEXT(type) {
      auto key = makeKey(type);
      auto ciphertext = encryptFor(provider, key, plaintext);
      auto decrypted = provider.decrypt(key.getPrivateKey(), ciphertext);
      BOOST_CHECK_EQUAL(std::string(decrypted.begin(), decrypted.end()), plaintext);
    }
  }
}

BOOST_AUTO_TEST_CASE(WireFormat)
{
  HybridEncryption provider;

  auto rsa = makeKey("RSA");
  Block block(encryptFor(provider, rsa, "secret"));
  BOOST_CHECK_EQUAL(block.type(), tlv::EncryptedChallenge);
  block.parse();
  BOOST_CHECK_EQUAL(ndn::encoding::readNonNegativeInteger(block.get(tlv::KeyTransport)),
                    static_cast<uint64_t>(KeyTransport::RSA_OAEP));
  BOOST_CHECK_EQUAL(block.get(tlv::WrappedKey).value_size(), 256);
  BOOST_CHECK_EQUAL(block.get(tlv::InitializationVector).value_size(), 12);
  BOOST_CHECK_EQUAL(block.get(tlv::AuthenticationTag).value_size(), 16);
  BOOST_CHECK_EQUAL(block.get(tlv::EncryptedPayload).value_size(), 6);

  auto x25519 = makeKey("X25519");
  block = Block(encryptFor(provider, x25519, "secret"));
  block.parse();
  BOOST_CHECK_EQUAL(ndn::encoding::readNonNegativeInteger(block.get(tlv::KeyTransport)),
                    static_cast<uint64_t>(KeyTransport::KEY_AGREEMENT));
  BOOST_CHECK_EQUAL(block.get(tlv::Salt).value_size(), HybridEncryption::HKDF_SALT_SIZE);
  BOOST_CHECK_NO_THROW(PublicKey::fromDer(block.get(tlv::EphemeralPublicKey).value_bytes()));
  BOOST_CHECK(block.find(tlv::WrappedKey) == block.elements_end());
}

BOOST_AUTO_TEST_CASE(FreshEncryption)
{
  HybridEncryption provider;
  auto ec = makeKey("EC");
  auto c1 = encryptFor(provider, ec, "same secret");
  auto c2 = encryptFor(provider, ec, "same secret");
  BOOST_CHECK(c1 != c2);
}

BOOST_AUTO_TEST_CASE(UnsupportedKey)
{
  HybridEncryption provider;
  auto ed25519 = makeKey("ED25519");
  BOOST_CHECK_THROW(provider.createContext(ed25519.getPublicKey()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(Tampering)
{
  HybridEncryption provider;
  for (const std::string type : {"RSA", "X25519"}) {
    BOOST_TEST_CONTEXT(type) {
      auto key = makeKey(type);
      auto ciphertext = encryptFor(provider, key, "0123456789abcdef");

      // flip a bit in the payload, the last element of the block
      auto modified = ciphertext;
      modified.back() ^= 0x01;
      BOOST_CHECK_THROW(provider.decrypt(key.getPrivateKey(), modified), std::runtime_error);

      // truncated
      Buffer truncated(ciphertext.begin(), ciphertext.begin() + ciphertext.size() / 2);
      BOOST_CHECK_THROW(provider.decrypt(key.getPrivateKey(), truncated), std::runtime_error);

      // wrong recipient
      auto other = makeKey(type);
      BOOST_CHECK_THROW(provider.decrypt(other.getPrivateKey(), ciphertext), std::runtime_error);
    }
  }
}

BOOST_AUTO_TEST_CASE(CorruptedWrappedKey)
{
  HybridEncryption provider;
  auto key = makeKey("RSA");
  auto ciphertext = encryptFor(provider, key, "0123456789abcdef");

  Block block(ciphertext);
  block.parse();
  auto wrapped = block.find(tlv::WrappedKey);
  BOOST_REQUIRE(wrapped != block.elements_end());
  auto offset = static_cast<size_t>(wrapped->value_bytes().data() - block.data());

  auto modified = ciphertext;
  modified[offset + 7] ^= 0x80;
  BOOST_CHECK_EXCEPTION(provider.decrypt(key.getPrivateKey(), modified), std::runtime_error,
                        [] (const auto& e) {
                          return boost::algorithm::contains(e.what(), "Cannot unwrap the content key");
                        });
}

BOOST_AUTO_TEST_CASE(Armor)
{
  HybridEncryption provider;
  auto key = makeKey("RSA");
  auto ciphertext = encryptFor(provider, key, std::string(512, 'x'));

  auto armored = provider.armor(ciphertext);
  BOOST_CHECK(boost::algorithm::starts_with(armored, "-----BEGIN KEYMFA CHALLENGE-----\n"));
  BOOST_CHECK(boost::algorithm::ends_with(armored, "\n-----END KEYMFA CHALLENGE-----\n"));
  std::istringstream lines(armored);
  std::string line;
  size_t nLines = 0;
  while (std::getline(lines, line)) {
    BOOST_CHECK_LE(line.size(), 64);
    ++nLines;
  }
  BOOST_CHECK_GT(nLines, 3);

  auto dearmored = provider.dearmor(armored);
  BOOST_CHECK_EQUAL_COLLECTIONS(dearmored.begin(), dearmored.end(), ciphertext.begin(), ciphertext.end());

  // surrounding text and CRLF line endings are tolerated
  std::string wrapped = "challenge follows:\r\n" + armored + "thanks\r\n";
  dearmored = provider.dearmor(wrapped);
  BOOST_CHECK_EQUAL_COLLECTIONS(dearmored.begin(), dearmored.end(), ciphertext.begin(), ciphertext.end());

  BOOST_CHECK_THROW(provider.dearmor("no armor here"), std::runtime_error);
  BOOST_CHECK_THROW(provider.dearmor("-----BEGIN KEYMFA CHALLENGE-----\nAAAA\n"), std::runtime_error);
  BOOST_CHECK_THROW(provider.dearmor("-----BEGIN KEYMFA CHALLENGE-----\n-----END KEYMFA CHALLENGE-----\n"),
                    std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END() // TestHybridEncryption

} // namespace keymfa::tests
