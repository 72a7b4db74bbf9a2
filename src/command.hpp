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

#ifndef KEYMFA_COMMAND_HPP
#define KEYMFA_COMMAND_HPP

#include "detail/keymfa-common.hpp"

#include <variant>
#include <vector>

namespace keymfa {

struct HelpCommand
{
};

struct ImportCommand
{
  // "-" reads the key from standard input
  std::string keyFile;
};

struct ListCommand
{
};

struct ChallengeCommand
{
  int64_t length = 0;
  std::optional<std::string> fingerprint;
};

struct SolveCommand
{
  std::string privateKeyFile;
  // "-" reads the challenge from standard input
  std::string challengeFile = "-";
};

using Command = std::variant<HelpCommand, ImportCommand, ListCommand, ChallengeCommand, SolveCommand>;

/**
 * @brief The command line does not name a valid command.
 */
class UsageError : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @brief Build a command from its name and arguments.
 *
 * A challenge length is validated here, so that it is rejected before any key
 * is looked up.
 *
 * @param args The command name followed by its arguments.
 * @throw UsageError if the arguments do not form a command
 * @throw Error CHALLENGE_LENGTH or CHALLENGE_POW for an invalid challenge length
 */
Command
parseCommand(const std::vector<std::string>& args);

/**
 * @brief Usage text for all commands.
 */
std::string
getCommandUsage(const std::string& programName);

} // namespace keymfa

#endif // KEYMFA_COMMAND_HPP
