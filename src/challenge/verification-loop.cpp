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

#include "challenge/verification-loop.hpp"

#include <ndn-cxx/util/logger.hpp>

#include <boost/algorithm/string/trim.hpp>

#include <istream>
#include <ostream>

namespace keymfa {

NDN_LOG_INIT(keymfa.verification);

const std::string VerificationLoop::PROMPT = "enter your solution: ";
const std::string VerificationLoop::INPUT_CLOSED = "input closed, challenge abandoned";

std::ostream&
operator<<(std::ostream& os, VerificationLoop::State state)
{
  switch (state) {
    case VerificationLoop::State::PENDING:
      return os << "PENDING";
    case VerificationLoop::State::MATCHED:
      return os << "MATCHED";
    case VerificationLoop::State::EXPIRED:
      return os << "EXPIRED";
  }
  return os << "<Unknown State " << static_cast<int>(state) << ">";
}

VerificationLoop::VerificationLoop(ChallengeSession& session)
  : m_session(session)
{
}

std::string
VerificationLoop::getStatusMessage(VerificationOutcome outcome)
{
  switch (outcome) {
    case VerificationOutcome::MATCHED:
      return "challenge solved!";
    case VerificationOutcome::MISMATCHED:
      return "incorrect!";
    case VerificationOutcome::EXPIRED:
      return "challenge has expired, solution rejected";
  }
  return "";
}

VerificationOutcome
VerificationLoop::submit(const std::string& candidate, std::ostream& os)
{
  auto outcome = m_session.verify(boost::algorithm::trim_copy(candidate));
  switch (outcome) {
    case VerificationOutcome::MATCHED:
      m_state = State::MATCHED;
      break;
    case VerificationOutcome::EXPIRED:
      m_state = State::EXPIRED;
      break;
    case VerificationOutcome::MISMATCHED:
      break;
  }
  os << getStatusMessage(outcome) << std::endl;
  return outcome;
}

VerificationLoop::State
VerificationLoop::run(std::istream& is, std::ostream& os)
{
  while (m_state == State::PENDING) {
    os << PROMPT << std::flush;
    std::string line;
    if (!std::getline(is, line)) {
      if (is.bad() || !is.eof()) {
        NDN_THROW(Error(ErrorCode::INPUT));
      }
      NDN_LOG_DEBUG("Input closed before the challenge was solved");
      m_session.expire();
      m_state = State::EXPIRED;
      os << std::endl << INPUT_CLOSED << std::endl;
      break;
    }
    submit(line, os);
  }
  return m_state;
}

} // namespace keymfa
