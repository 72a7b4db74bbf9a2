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
#include "challenge/hybrid-encryption.hpp"
#include "challenge/verification-loop.hpp"
#include "command.hpp"
#include "mfa-module.hpp"

#include <ndn-cxx/util/logger.hpp>

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <openssl/crypto.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>

namespace keymfa {

NDN_LOG_INIT(keymfa.tool);

static const std::string PROGRAM_NAME = "keymfa";

static Buffer
readStream(std::istream& is)
{
  Buffer content((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  if (is.bad()) {
    NDN_THROW(Error(ErrorCode::INPUT));
  }
  return content;
}

static Buffer
readKeyFile(const std::string& fileName)
{
  std::ifstream file(fileName, std::ios::binary);
  if (!file) {
    NDN_THROW(Error(ErrorCode::KEY_OPEN, getErrorMessage(ErrorCode::KEY_OPEN) + ": " + fileName));
  }
  return readStream(file);
}

static void
printError(const std::exception& e, bool isNested = false)
{
  std::cerr << (isNested ? "  caused by: " : "ERROR: ") << e.what() << std::endl;
  try {
    std::rethrow_if_nested(e);
  }
  catch (const std::exception& nested) {
    printError(nested, true);
  }
}

class CommandRunner
{
public:
  CommandRunner(const MfaConfig& config, const std::string& dbPath)
    : m_config(config)
    , m_dbPath(dbPath.empty() ? config.storagePath : dbPath)
  {
  }

  int
  operator()(const HelpCommand&)
  {
    std::cout << getCommandUsage(PROGRAM_NAME);
    return 0;
  }

  int
  operator()(const ImportCommand& cmd)
  {
    MfaModule module(getStorage(), m_provider, m_config);
    auto record = cmd.keyFile == "-" ? module.importKey(readStream(std::cin))
                                     : module.importKeyFile(cmd.keyFile);
    std::cout << "key imported: " << record.fingerprint << std::endl;
    return 0;
  }

  int
  operator()(const ListCommand&)
  {
    auto keys = getStorage().listKeys();
    if (keys.empty()) {
      std::cout << "no keys imported" << std::endl;
      return 0;
    }
    size_t i = 0;
    for (const auto& key : keys) {
      std::cout << "[" << i++ << "]: " << key << std::endl;
    }
    return 0;
  }

  int
  operator()(const ChallengeCommand& cmd)
  {
    MfaModule module(getStorage(), m_provider, m_config);
    auto key = module.findKey(cmd.fingerprint, [] (const std::list<KeyRecord>& keys) {
      size_t i = 0;
      for (const auto& k : keys) {
        std::cout << "[" << i++ << "]: " << k.fingerprint << std::endl;
      }
      std::cout << "select a key: " << std::flush;
      std::string choice;
      std::getline(std::cin, choice);
      return choice;
    });

    auto session = module.issueChallenge(key, cmd.length);
    const auto& armored = session->getEncryptedChallenge().armored;
    ChallengeFile challengeFile(armored);

    std::cout << armored << std::endl;
    if (!challengeFile.getPath().empty()) {
      std::cout << "solve with: " << PROGRAM_NAME << " solve -k <private-key> < "
                << challengeFile.getPath().string() << std::endl;
    }
    std::cout << "challenge will expire at "
              << time::toIsoExtendedString(session->getExpiryTime()) << "Z" << std::endl;

    VerificationLoop loop(*session);
    auto state = loop.run(std::cin, std::cout);
    return state == VerificationLoop::State::MATCHED ? 0 : 1;
  }

  int
  operator()(const SolveCommand& cmd)
  {
    auto privateKey = PrivateKey::fromBytes(readKeyFile(cmd.privateKeyFile));

    Buffer armored;
    if (cmd.challengeFile == "-") {
      armored = readStream(std::cin);
    }
    else {
      std::ifstream file(cmd.challengeFile, std::ios::binary);
      if (!file) {
        NDN_THROW(std::runtime_error("Cannot open challenge file " + cmd.challengeFile));
      }
      armored = readStream(file);
    }

    auto ciphertext = m_provider.dearmor(std::string(armored.begin(), armored.end()));
    auto plaintext = m_provider.decrypt(privateKey, ciphertext);
    std::cout.write(reinterpret_cast<const char*>(plaintext.data()), plaintext.size());
    std::cout << std::endl;
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return 0;
  }

private:
  KeyStorage&
  getStorage()
  {
    if (m_storage == nullptr) {
      m_storage = KeyStorage::createKeyStorage(m_config.storageType, m_dbPath);
      if (m_storage == nullptr) {
        NDN_THROW(std::runtime_error("Unsupported key storage type: " + m_config.storageType));
      }
    }
    return *m_storage;
  }

private:
  const MfaConfig& m_config;
  std::string m_dbPath;
  HybridEncryption m_provider;
  std::unique_ptr<KeyStorage> m_storage;
};

// Global options may only precede the command name.
static int
findCommandIndex(int argc, char* argv[])
{
  int i = 1;
  while (i < argc && argv[i][0] == '-' && argv[i][1] != '\0') {
    std::string arg(argv[i]);
    if (arg == "-c" || arg == "--config-file" || arg == "-d" || arg == "--database") {
      i += 2;
    }
    else {
      i += 1;
    }
  }
  return std::min(i, argc);
}

static int
main(int argc, char* argv[])
{
  namespace po = boost::program_options;
  std::string configFilePath = KEYMFA_SYSCONFDIR "/keymfa/keymfa.conf";
  std::string dbPath;

  po::options_description optsDesc("Options");
  optsDesc.add_options()
  ("help,h", "print this help message and exit")
  ("config-file,c", po::value<std::string>(&configFilePath), "path to configuration file")
  ("database,d", po::value<std::string>(&dbPath), "path to the key database");

  int commandIndex = findCommandIndex(argc, argv);
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(commandIndex, argv, optsDesc), vm);
    po::notify(vm);
  }
  catch (const po::error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }

  if (vm.count("help") != 0) {
    std::cout << getCommandUsage(PROGRAM_NAME) << "\n" << optsDesc;
    return 0;
  }

  std::vector<std::string> args(argv + commandIndex, argv + argc);
  try {
    auto command = parseCommand(args);

    MfaConfig config;
    if (vm.count("config-file") != 0 || boost::filesystem::exists(configFilePath)) {
      config.load(configFilePath);
    }

    CommandRunner runner(config, dbPath);
    return std::visit(runner, command);
  }
  catch (const UsageError& e) {
    std::cerr << "ERROR: " << e.what() << "\n\n" << getCommandUsage(PROGRAM_NAME);
    return 2;
  }
  catch (const std::exception& e) {
    printError(e);
    return 1;
  }
}

} // namespace keymfa

int
main(int argc, char* argv[])
{
  return keymfa::main(argc, argv);
}
