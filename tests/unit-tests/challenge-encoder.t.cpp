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

#include "challenge/challenge-encoder.hpp"
#include "challenge/hybrid-encryption.hpp"

#include "tests/key-fixture.hpp"
#include "tests/test-common.hpp"

namespace keymfa::tests {

/**
 * @brief Provider that fails at a chosen stage.
 */
class FailingProvider : public EncryptionProvider
{
public:
  enum class Stage {
    NONE,
    CONTEXT,
    ENCRYPT,
    ARMOR
  };

  explicit
  FailingProvider(Stage stage)
    : m_stage(stage)
  {
  }

  std::unique_ptr<EncryptionContext>
  createContext(const PublicKey&) override
  {
    ++nContexts;
    if (m_stage == Stage::CONTEXT) {
      NDN_THROW(std::runtime_error("no context for you"));
    }
    return std::make_unique<Context>(m_stage);
  }

  Buffer
  decrypt(const PrivateKey&, span<const uint8_t> ciphertext) override
  {
    return Buffer(ciphertext.begin(), ciphertext.end());
  }

  std::string
  armor(span<const uint8_t> ciphertext) const override
  {
    if (m_stage == Stage::ARMOR) {
      NDN_THROW(std::runtime_error("armor broke"));
    }
    return EncryptionProvider::armor(ciphertext);
  }

private:
  class Context : public EncryptionContext
  {
  public:
    explicit
    Context(Stage stage)
      : m_stage(stage)
    {
    }

    Buffer
    encrypt(span<const uint8_t> plaintext) override
    {
      if (m_stage == Stage::ENCRYPT) {
        NDN_THROW(std::runtime_error("cipher jammed"));
      }
      return Buffer(plaintext.begin(), plaintext.end());
    }

  private:
    Stage m_stage;
  };

public:
  int nContexts = 0;

private:
  Stage m_stage;
};

static std::string
getNestedMessage(const Error& e)
{
  try {
    std::rethrow_if_nested(e);
  }
  catch (const std::exception& nested) {
    return nested.what();
  }
  return "";
}

BOOST_FIXTURE_TEST_SUITE(TestChallengeEncoder, KeyFixture)

BOOST_AUTO_TEST_CASE(Encode)
{
  HybridEncryption provider;
  auto key = makeKey("EC");
  auto secret = generateChallenge(32);

  auto encrypted = encodeChallenge(provider, key.getPublicKey(), secret);
  BOOST_CHECK(!encrypted.ciphertext.empty());
  BOOST_CHECK(encrypted.armored.find("-----BEGIN KEYMFA CHALLENGE-----") == 0);

  auto decrypted = provider.decrypt(key.getPrivateKey(), provider.dearmor(encrypted.armored));
  BOOST_CHECK_EQUAL_COLLECTIONS(decrypted.begin(), decrypted.end(),
                                secret.bytes().begin(), secret.bytes().end());
}

BOOST_AUTO_TEST_CASE(StageErrors)
{
  auto key = makeKey("EC").getPublicKey();
  auto secret = generateChallenge(16);

  FailingProvider noContext(FailingProvider::Stage::CONTEXT);
  BOOST_CHECK_EXCEPTION(encodeChallenge(noContext, key, secret), Error, [] (const Error& e) {
    return e.getCode() == ErrorCode::ENCRYPTION_CONTEXT && getNestedMessage(e) == "no context for you";
  });

  FailingProvider noEncrypt(FailingProvider::Stage::ENCRYPT);
  BOOST_CHECK_EXCEPTION(encodeChallenge(noEncrypt, key, secret), Error, [] (const Error& e) {
    return e.getCode() == ErrorCode::ENCRYPTION && getNestedMessage(e) == "cipher jammed";
  });

  FailingProvider noArmor(FailingProvider::Stage::ARMOR);
  BOOST_CHECK_EXCEPTION(encodeChallenge(noArmor, key, secret), Error, [] (const Error& e) {
    return e.getCode() == ErrorCode::ARMOR && getNestedMessage(e) == "armor broke";
  });

  FailingProvider working(FailingProvider::Stage::NONE);
  auto encrypted = encodeChallenge(working, key, secret);
  BOOST_CHECK_EQUAL(working.nContexts, 1);
  BOOST_CHECK_EQUAL_COLLECTIONS(encrypted.ciphertext.begin(), encrypted.ciphertext.end(),
                                secret.bytes().begin(), secret.bytes().end());
}

BOOST_AUTO_TEST_CASE(UnsupportedRecipient)
{
  HybridEncryption provider;
  auto secret = generateChallenge(16);
  BOOST_CHECK_EXCEPTION(encodeChallenge(provider, makeKey("ED25519").getPublicKey(), secret),
                        Error, errorCodeIs(ErrorCode::ENCRYPTION_CONTEXT));
}

BOOST_AUTO_TEST_SUITE_END() // TestChallengeEncoder

} // namespace keymfa::tests
