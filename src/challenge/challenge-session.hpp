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

#ifndef KEYMFA_CHALLENGE_CHALLENGE_SESSION_HPP
#define KEYMFA_CHALLENGE_CHALLENGE_SESSION_HPP

#include "challenge/challenge-encoder.hpp"

#include <string_view>

namespace keymfa {

enum class VerificationOutcome {
  MATCHED,
  MISMATCHED,
  EXPIRED
};

std::ostream&
operator<<(std::ostream& os, VerificationOutcome outcome);

/**
 * @brief One authentication attempt: a secret, its encrypted form and a deadline.
 *
 * The deadline is fixed when the session is created. The first MATCHED or
 * EXPIRED outcome is terminal; every later verify() returns it again and the
 * secret is wiped. A MISMATCHED outcome leaves the session pending.
 */
class ChallengeSession : boost::noncopyable
{
public:
  ChallengeSession(Secret&& secret, EncryptedChallenge&& encrypted,
                   const time::nanoseconds& solveWindow);

  /**
   * @brief Check a candidate solution.
   *
   * Expiry is checked before the candidate is looked at. The comparison takes
   * the same time whatever the content of @p candidate.
   */
  VerificationOutcome
  verify(std::string_view candidate);

  /**
   * @brief End the session as expired, if it is still pending.
   */
  void
  expire();

  bool
  isTerminated() const
  {
    return m_terminalOutcome.has_value();
  }

  const EncryptedChallenge&
  getEncryptedChallenge() const
  {
    return m_encrypted;
  }

  const time::system_clock::time_point&
  getExpiryTime() const
  {
    return m_expiryTime;
  }

private:
  void
  terminate(VerificationOutcome outcome);

private:
  Secret m_secret;
  EncryptedChallenge m_encrypted;
  time::system_clock::time_point m_expiryTime;
  std::optional<VerificationOutcome> m_terminalOutcome;
};

} // namespace keymfa

#endif // KEYMFA_CHALLENGE_CHALLENGE_SESSION_HPP
