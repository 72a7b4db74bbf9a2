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

#include "challenge/challenge-session.hpp"
#include "detail/crypto-helpers.hpp"

#include <ndn-cxx/util/logger.hpp>

namespace keymfa {

NDN_LOG_INIT(keymfa.session);

std::ostream&
operator<<(std::ostream& os, VerificationOutcome outcome)
{
  switch (outcome) {
    case VerificationOutcome::MATCHED:
      return os << "MATCHED";
    case VerificationOutcome::MISMATCHED:
      return os << "MISMATCHED";
    case VerificationOutcome::EXPIRED:
      return os << "EXPIRED";
  }
  return os << "<Unknown Outcome " << static_cast<int>(outcome) << ">";
}

ChallengeSession::ChallengeSession(Secret&& secret, EncryptedChallenge&& encrypted,
                                   const time::nanoseconds& solveWindow)
  : m_secret(std::move(secret))
  , m_encrypted(std::move(encrypted))
  , m_expiryTime(time::system_clock::now() + solveWindow)
{
  NDN_LOG_DEBUG("Challenge session opened, expires at " << time::toIsoExtendedString(m_expiryTime));
}

VerificationOutcome
ChallengeSession::verify(std::string_view candidate)
{
  if (m_terminalOutcome) {
    return *m_terminalOutcome;
  }

  if (time::system_clock::now() >= m_expiryTime) {
    terminate(VerificationOutcome::EXPIRED);
    return VerificationOutcome::EXPIRED;
  }

  span<const uint8_t> given(reinterpret_cast<const uint8_t*>(candidate.data()), candidate.size());
  if (constantTimeEquals(m_secret.bytes(), given)) {
    terminate(VerificationOutcome::MATCHED);
    return VerificationOutcome::MATCHED;
  }
  NDN_LOG_DEBUG("Candidate rejected");
  return VerificationOutcome::MISMATCHED;
}

void
ChallengeSession::expire()
{
  if (!m_terminalOutcome) {
    terminate(VerificationOutcome::EXPIRED);
  }
}

void
ChallengeSession::terminate(VerificationOutcome outcome)
{
  m_terminalOutcome = outcome;
  m_secret.clear();
  NDN_LOG_INFO("Challenge session ended: " << outcome);
}

} // namespace keymfa
