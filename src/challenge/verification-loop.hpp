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

#ifndef KEYMFA_CHALLENGE_VERIFICATION_LOOP_HPP
#define KEYMFA_CHALLENGE_VERIFICATION_LOOP_HPP

#include "challenge/challenge-session.hpp"

#include <iosfwd>

namespace keymfa {

/**
 * @brief Feeds candidate solutions to a challenge session until it is solved or expires.
 *
 * A wrong candidate keeps the loop pending. There is no limit on the number of
 * attempts; the session deadline is the only bound.
 */
class VerificationLoop : boost::noncopyable
{
public:
  enum class State {
    PENDING,
    MATCHED,
    EXPIRED
  };

  explicit
  VerificationLoop(ChallengeSession& session);

  /**
   * @brief Verify one candidate and write the resulting status line to @p os.
   *
   * Surrounding whitespace is removed from the candidate first.
   */
  VerificationOutcome
  submit(const std::string& candidate, std::ostream& os);

  /**
   * @brief Prompt for and read candidates, one per line, until the loop leaves PENDING.
   *
   * Closing the input ends the session as expired.
   *
   * @throw Error INPUT if reading from @p is fails for another reason
   */
  State
  run(std::istream& is, std::ostream& os);

  State
  getState() const
  {
    return m_state;
  }

  static std::string
  getStatusMessage(VerificationOutcome outcome);

public:
  static const std::string PROMPT;
  static const std::string INPUT_CLOSED;

private:
  ChallengeSession& m_session;
  State m_state = State::PENDING;
};

std::ostream&
operator<<(std::ostream& os, VerificationLoop::State state);

} // namespace keymfa

#endif // KEYMFA_CHALLENGE_VERIFICATION_LOOP_HPP
