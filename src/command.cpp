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

#include "command.hpp"
#include "challenge/challenge-generator.hpp"

#include <sstream>

namespace keymfa {

static void
checkArgumentCount(const std::vector<std::string>& args, size_t min, size_t max)
{
  if (args.size() - 1 < min) {
    NDN_THROW(UsageError("Too few arguments for '" + args.front() + "'"));
  }
  if (args.size() - 1 > max) {
    NDN_THROW(UsageError("Too many arguments for '" + args.front() + "'"));
  }
}

static int64_t
parseLength(const std::string& str)
{
  size_t pos = 0;
  int64_t length = 0;
  try {
    length = std::stoll(str, &pos);
  }
  catch (const std::invalid_argument&) {
    NDN_THROW_NESTED(UsageError("Challenge length must be an integer: " + str));
  }
  catch (const std::out_of_range&) {
    // any out of range value is rejected by the length check below
    return str.front() == '-' ? -1 : MAX_CHALLENGE_LENGTH + 1;
  }
  if (pos != str.size()) {
    NDN_THROW(UsageError("Challenge length must be an integer: " + str));
  }
  return length;
}

static SolveCommand
parseSolve(const std::vector<std::string>& args)
{
  SolveCommand cmd;
  bool hasChallengeFile = false;
  for (size_t i = 1; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "-k" || arg == "--key") {
      if (++i == args.size()) {
        NDN_THROW(UsageError("Option " + arg + " requires a private key file"));
      }
      cmd.privateKeyFile = args[i];
    }
    else if (!hasChallengeFile) {
      cmd.challengeFile = arg;
      hasChallengeFile = true;
    }
    else {
      NDN_THROW(UsageError("Too many arguments for 'solve'"));
    }
  }
  if (cmd.privateKeyFile.empty()) {
    NDN_THROW(UsageError("'solve' requires a private key (-k FILE)"));
  }
  return cmd;
}

Command
parseCommand(const std::vector<std::string>& args)
{
  if (args.empty()) {
    NDN_THROW(UsageError("No command given"));
  }

  const auto& name = args.front();
  if (name == "help") {
    return HelpCommand{};
  }
  if (name == "import") {
    checkArgumentCount(args, 1, 1);
    return ImportCommand{args[1]};
  }
  if (name == "list") {
    checkArgumentCount(args, 0, 0);
    return ListCommand{};
  }
  if (name == "challenge") {
    checkArgumentCount(args, 1, 2);
    ChallengeCommand cmd;
    cmd.length = parseLength(args[1]);
    auto code = checkChallengeLength(cmd.length);
    if (code != ErrorCode::NO_ERROR) {
      NDN_THROW(Error(code));
    }
    if (args.size() == 3) {
      cmd.fingerprint = args[2];
    }
    return cmd;
  }
  if (name == "solve") {
    return parseSolve(args);
  }
  NDN_THROW(UsageError("Unknown command '" + name + "'"));
}

std::string
getCommandUsage(const std::string& programName)
{
  std::ostringstream os;
  os << "Usage: " << programName << " [options] <command> [args...]\n"
     << "Commands:\n"
     << "  help                              show this message\n"
     << "  import <key-file>                 import a public key or certificate, PEM or DER; - for stdin\n"
     << "  list                              list imported keys, newest first\n"
     << "  challenge <length> [fingerprint]  challenge a key; without a fingerprint you are\n"
     << "                                    prompted to select one\n"
     << "  solve -k <private-key> [file]     decrypt a challenge; - or no file for stdin\n";
  return os.str();
}

} // namespace keymfa
