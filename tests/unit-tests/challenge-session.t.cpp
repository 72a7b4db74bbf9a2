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

#include "tests/clock-fixture.hpp"
#include "tests/test-common.hpp"

#include <chrono>

namespace keymfa::tests {

static Secret
makeSecret(const std::string& value)
{
  return Secret(Buffer(value.begin(), value.end()));
}

static std::unique_ptr<ChallengeSession>
makeSession(const std::string& value, time::nanoseconds window = 60_s)
{
  EncryptedChallenge encrypted;
  encrypted.armored = "armored " + std::to_string(value.size());
  return std::make_unique<ChallengeSession>(makeSecret(value), std::move(encrypted), window);
}

BOOST_FIXTURE_TEST_SUITE(TestChallengeSession, ClockFixture)

BOOST_AUTO_TEST_CASE(Match)
{
  auto start = time::system_clock::now();
  auto session = makeSession("s3cr3t!?");
  BOOST_CHECK(session->getExpiryTime() == start + 60_s);
  BOOST_CHECK_EQUAL(session->getEncryptedChallenge().armored, "armored 8");
  BOOST_CHECK(!session->isTerminated());

  BOOST_CHECK_EQUAL(session->verify("s3cr3t!?"), VerificationOutcome::MATCHED);
  BOOST_CHECK(session->isTerminated());

  // terminal outcome is sticky
  BOOST_CHECK_EQUAL(session->verify("wrong"), VerificationOutcome::MATCHED);
  advanceClocks(10_min);
  BOOST_CHECK_EQUAL(session->verify("s3cr3t!?"), VerificationOutcome::MATCHED);
}

BOOST_AUTO_TEST_CASE(Mismatch)
{
  auto session = makeSession("abcd");
  BOOST_CHECK_EQUAL(session->verify("abce"), VerificationOutcome::MISMATCHED);
  BOOST_CHECK_EQUAL(session->verify("abc"), VerificationOutcome::MISMATCHED);
  BOOST_CHECK_EQUAL(session->verify("abcde"), VerificationOutcome::MISMATCHED);
  BOOST_CHECK_EQUAL(session->verify(""), VerificationOutcome::MISMATCHED);
  BOOST_CHECK_EQUAL(session->verify("ABCD"), VerificationOutcome::MISMATCHED);
  BOOST_CHECK(!session->isTerminated());

  // retry after a wrong answer
  BOOST_CHECK_EQUAL(session->verify("abcd"), VerificationOutcome::MATCHED);
}

BOOST_AUTO_TEST_CASE(Expiry)
{
  auto session = makeSession("abcd", 60_s);

  advanceClocks(1_s, 59);
  BOOST_CHECK_EQUAL(session->verify("wxyz"), VerificationOutcome::MISMATCHED);

  // the deadline itself is already too late, even for the right answer
  advanceClocks(1_s);
  BOOST_CHECK_EQUAL(session->verify("abcd"), VerificationOutcome::EXPIRED);
  BOOST_CHECK(session->isTerminated());
  BOOST_CHECK_EQUAL(session->verify("abcd"), VerificationOutcome::EXPIRED);
}

BOOST_AUTO_TEST_CASE(LateCorrectAnswer)
{
  auto session = makeSession("abcd", 5_s);
  advanceClocks(6_s);
  BOOST_CHECK_EQUAL(session->verify("abcd"), VerificationOutcome::EXPIRED);
}

BOOST_AUTO_TEST_CASE(JustInTime)
{
  auto session = makeSession("abcd", 5_s);
  advanceClocks(4999_ms);
  BOOST_CHECK_EQUAL(session->verify("abcd"), VerificationOutcome::MATCHED);
}

BOOST_AUTO_TEST_CASE(Cancel)
{
  auto session = makeSession("abcd");
  session->expire();
  BOOST_CHECK(session->isTerminated());
  BOOST_CHECK_EQUAL(session->verify("abcd"), VerificationOutcome::EXPIRED);

  // expire() does not override a match
  auto solved = makeSession("abcd");
  BOOST_CHECK_EQUAL(solved->verify("abcd"), VerificationOutcome::MATCHED);
  solved->expire();
  BOOST_CHECK_EQUAL(solved->verify("abcd"), VerificationOutcome::MATCHED);
}

BOOST_AUTO_TEST_SUITE_END() // TestChallengeSession

BOOST_AUTO_TEST_SUITE(TestChallengeSessionTiming)

// Coarse check that rejection time does not depend on where the candidate
// first differs from the secret.
BOOST_AUTO_TEST_CASE(ComparisonTime)
{
  const std::string secret(512, 'k');
  auto session = makeSession(secret, 1_h);

  std::string differsFirst = secret;
  differsFirst.front() = 'x';
  std::string differsLast = secret;
  differsLast.back() = 'x';

  size_t nUnexpected = 0;
  auto measure = [&] (const std::string& candidate) {
    auto best = std::chrono::steady_clock::duration::max();
    for (int batch = 0; batch < 50; ++batch) {
      auto begin = std::chrono::steady_clock::now();
      for (int i = 0; i < 1000; ++i) {
        if (session->verify(candidate) != VerificationOutcome::MISMATCHED) {
          ++nUnexpected;
        }
      }
      best = std::min(best, std::chrono::steady_clock::now() - begin);
    }
    return std::chrono::duration<double>(best).count();
  };

  // warm up
  measure(differsLast);
  double first = measure(differsFirst);
  double last = measure(differsLast);
  BOOST_TEST_MESSAGE("first=" << first << " last=" << last);
  BOOST_CHECK_EQUAL(nUnexpected, 0);
  BOOST_CHECK_GE(first / last, 0.5);
  BOOST_CHECK_LE(first / last, 2.0);
}

BOOST_AUTO_TEST_SUITE_END() // TestChallengeSessionTiming

} // namespace keymfa::tests
