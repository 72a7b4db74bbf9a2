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

#include <sqlite3.h>

#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/sqlite3-statement.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>

namespace keymfa {

NDN_LOG_INIT(keymfa.storage);

using ndn::util::Sqlite3Statement;

const std::string KeySqlite::STORAGE_TYPE = "key-storage-sqlite3";
KEYMFA_REGISTER_KEY_STORAGE(KeySqlite);

const std::string INITIALIZATION = R"SQL(
CREATE TABLE IF NOT EXISTS
  Keys(
    id INTEGER PRIMARY KEY,
    fingerprint TEXT NOT NULL,
    pub_key BLOB NOT NULL,
    created_at TEXT NOT NULL
  );
CREATE UNIQUE INDEX IF NOT EXISTS
  KeyFingerprintIndex ON Keys(fingerprint);
)SQL";

static KeyRecord
readRecord(Sqlite3Statement& statement)
{
  auto key = PublicKey::fromDer({statement.getBlob(0), static_cast<size_t>(statement.getSize(0))});
  return KeyRecord(std::move(key), time::fromIsoString(statement.getString(1)));
}

KeySqlite::KeySqlite(const std::string& path)
  : KeyStorage()
{
  boost::filesystem::path dbPath;
  if (!path.empty()) {
    dbPath = boost::filesystem::path(path);
  }
  else {
    boost::filesystem::path dbDir;
    if (getenv("HOME") != nullptr) {
      dbDir = boost::filesystem::path(getenv("HOME")) / ".keymfa";
    }
    else {
      dbDir = boost::filesystem::current_path() / ".keymfa";
    }
    boost::system::error_code ec;
    boost::filesystem::create_directories(dbDir, ec);
    if (ec) {
      NDN_THROW(Error(ErrorCode::KEY_OPEN, "Cannot create " + dbDir.string() + ": " + ec.message()));
    }
    dbPath = dbDir / "keys.db";
  }

  int result = sqlite3_open_v2(dbPath.c_str(), &m_database,
                               SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
#ifdef NDN_CXX_DISABLE_SQLITE3_FS_LOCKING
                               "unix-dotfile"
#else
                               nullptr
#endif
  );
  if (result != SQLITE_OK) {
    sqlite3_close(m_database);
    m_database = nullptr;
    NDN_THROW(Error(ErrorCode::KEY_OPEN, "Key database cannot be opened/created: " + dbPath.string()));
  }

  char* errorMessage = nullptr;
  result = sqlite3_exec(m_database, INITIALIZATION.data(), nullptr, nullptr, &errorMessage);
  if (result != SQLITE_OK) {
    std::string reason = errorMessage != nullptr ? errorMessage : sqlite3_errstr(result);
    sqlite3_free(errorMessage);
    sqlite3_close(m_database);
    m_database = nullptr;
    NDN_THROW(Error(ErrorCode::KEY_OPEN, "Key database cannot be initialized: " + reason));
  }
  NDN_LOG_DEBUG("Opened key database " << dbPath);
}

KeySqlite::~KeySqlite()
{
  sqlite3_close(m_database);
}

KeyRecord
KeySqlite::getKey(const std::string& fingerprint)
{
  Sqlite3Statement statement(m_database,
                             R"_SQLTEXT_(SELECT pub_key, created_at
                             FROM Keys WHERE fingerprint = ?)_SQLTEXT_");
  statement.bind(1, boost::algorithm::to_lower_copy(fingerprint), SQLITE_TRANSIENT);

  if (statement.step() == SQLITE_ROW) {
    return readRecord(statement);
  }
  NDN_THROW(Error(ErrorCode::KEY_NOT_FOUND, "Key " + fingerprint + " does not exist"));
}

void
KeySqlite::addKey(const KeyRecord& record)
{
  Sqlite3Statement statement(m_database,
                             R"_SQLTEXT_(INSERT OR ABORT INTO Keys (fingerprint, pub_key, created_at)
                             VALUES (?, ?, ?))_SQLTEXT_");
  auto der = record.publicKey.toDer();
  statement.bind(1, record.fingerprint, SQLITE_TRANSIENT);
  statement.bind(2, der.data(), der.size(), SQLITE_TRANSIENT);
  statement.bind(3, time::toIsoString(record.createdAt), SQLITE_TRANSIENT);

  int result = statement.step();
  if (result == SQLITE_CONSTRAINT) {
    NDN_THROW(Error(ErrorCode::KEY_ALREADY_IMPORTED));
  }
  if (result != SQLITE_DONE) {
    NDN_THROW(std::runtime_error("Key " + record.fingerprint + " cannot be added to the database: " +
                                 sqlite3_errmsg(m_database)));
  }
}

void
KeySqlite::deleteKey(const std::string& fingerprint)
{
  Sqlite3Statement statement(m_database,
                             R"_SQLTEXT_(DELETE FROM Keys WHERE fingerprint = ?)_SQLTEXT_");
  statement.bind(1, boost::algorithm::to_lower_copy(fingerprint), SQLITE_TRANSIENT);
  if (statement.step() != SQLITE_DONE) {
    NDN_THROW(std::runtime_error("Key " + fingerprint + " cannot be deleted from the database: " +
                                 sqlite3_errmsg(m_database)));
  }
}

std::list<KeyRecord>
KeySqlite::listKeys()
{
  std::list<KeyRecord> result;
  Sqlite3Statement statement(m_database,
                             R"_SQLTEXT_(SELECT pub_key, created_at FROM Keys
                             ORDER BY created_at DESC, id DESC)_SQLTEXT_");
  while (statement.step() == SQLITE_ROW) {
    result.push_back(readRecord(statement));
  }
  return result;
}

} // namespace keymfa
