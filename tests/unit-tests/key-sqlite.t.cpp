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

#include "detail/key-sqlite.hpp"

#include "tests/database-fixture.hpp"
#include "tests/test-common.hpp"

#include <boost/algorithm/string/case_conv.hpp>

namespace keymfa::tests {

BOOST_FIXTURE_TEST_SUITE(TestKeySqlite, DatabaseFixture)

BOOST_AUTO_TEST_CASE(KeyOperations)
{
  KeySqlite storage(dbPath);

  auto now = time::system_clock::now();
  KeyRecord record1(makeKey("EC").getPublicKey(), now);

  // add operation
  BOOST_CHECK_NO_THROW(storage.addKey(record1));

  // get operation
  auto result = storage.getKey(record1.fingerprint);
  BOOST_CHECK_EQUAL(result.fingerprint, record1.fingerprint);
  BOOST_CHECK_EQUAL(result.publicKey.getKeyType(), "EC");
  BOOST_CHECK_LT(time::abs(result.createdAt - record1.createdAt), 1_ms);

  // lookup is case-insensitive
  result = storage.getKey(boost::algorithm::to_upper_copy(record1.fingerprint));
  BOOST_CHECK_EQUAL(result.fingerprint, record1.fingerprint);

  BOOST_CHECK_EXCEPTION(storage.getKey(std::string(64, '0')), Error, errorCodeIs(ErrorCode::KEY_NOT_FOUND));

  // duplicate
  BOOST_CHECK_EXCEPTION(storage.addKey(record1), Error, errorCodeIs(ErrorCode::KEY_ALREADY_IMPORTED));

  KeyRecord record2(makeKey("X25519").getPublicKey(), now + 1_s);
  storage.addKey(record2);

  // list operation
  auto allKeys = storage.listKeys();
  BOOST_CHECK_EQUAL(allKeys.size(), 2);

  storage.deleteKey(record2.fingerprint);
  allKeys = storage.listKeys();
  BOOST_CHECK_EQUAL(allKeys.size(), 1);
  BOOST_CHECK_EXCEPTION(storage.getKey(record2.fingerprint), Error, errorCodeIs(ErrorCode::KEY_NOT_FOUND));
}

BOOST_AUTO_TEST_CASE(NewestFirst)
{
  KeySqlite storage(dbPath);

  auto now = time::system_clock::now();
  KeyRecord oldest(makeKey("EC").getPublicKey(), now - 2_s);
  KeyRecord middle(makeKey("EC").getPublicKey(), now - 1_s);
  KeyRecord newest(makeKey("EC").getPublicKey(), now);

  storage.addKey(middle);
  storage.addKey(newest);
  storage.addKey(oldest);

  auto keys = storage.listKeys();
  BOOST_REQUIRE_EQUAL(keys.size(), 3);
  auto it = keys.begin();
  BOOST_CHECK_EQUAL((it++)->fingerprint, newest.fingerprint);
  BOOST_CHECK_EQUAL((it++)->fingerprint, middle.fingerprint);
  BOOST_CHECK_EQUAL((it++)->fingerprint, oldest.fingerprint);

  // same import time: the later import is listed first
  KeyRecord sameTime(makeKey("EC").getPublicKey(), now);
  storage.addKey(sameTime);
  BOOST_CHECK_EQUAL(storage.listKeys().front().fingerprint, sameTime.fingerprint);
}

BOOST_AUTO_TEST_CASE(Persistence)
{
  auto key = makeKey("RSA").getPublicKey();
  {
    auto storage = KeyStorage::createKeyStorage(KeySqlite::STORAGE_TYPE, dbPath);
    BOOST_REQUIRE(storage != nullptr);
    storage->addKey(KeyRecord(key, time::system_clock::now()));
  }

  KeySqlite reopened(dbPath);
  auto keys = reopened.listKeys();
  BOOST_REQUIRE_EQUAL(keys.size(), 1);
  BOOST_CHECK_EQUAL(keys.front().fingerprint, key.getFingerprint());
  BOOST_CHECK_EQUAL(keys.front().publicKey.getKeySize(), 2048);
}

BOOST_AUTO_TEST_CASE(DefaultLocation)
{
  KeySqlite storage;
  BOOST_CHECK(boost::filesystem::exists(boost::filesystem::path(getenv("HOME")) / ".keymfa" / "keys.db"));
}

BOOST_AUTO_TEST_CASE(OpenFailure)
{
  BOOST_CHECK_EXCEPTION(KeySqlite{(dbDir / "missing-dir" / "keys.db").string()}, Error,
                        errorCodeIs(ErrorCode::KEY_OPEN));
}

BOOST_AUTO_TEST_CASE(Factory)
{
  BOOST_CHECK(KeyStorage::isKeyStorageSupported(KeySqlite::STORAGE_TYPE));
  BOOST_CHECK(!KeyStorage::isKeyStorageSupported("key-storage-unknown"));
  BOOST_CHECK(KeyStorage::createKeyStorage("key-storage-unknown", "") == nullptr);
}

BOOST_AUTO_TEST_SUITE_END() // TestKeySqlite

} // namespace keymfa::tests
