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

#include "key-selection.hpp"

#include "tests/key-fixture.hpp"
#include "tests/test-common.hpp"

namespace keymfa::tests {

BOOST_FIXTURE_TEST_SUITE(TestKeySelection, KeyFixture)

BOOST_AUTO_TEST_CASE(Select)
{
  auto now = time::system_clock::now();
  std::list<KeyRecord> candidates;
  candidates.emplace_back(makeKey("EC").getPublicKey(), now);
  candidates.emplace_back(makeKey("X25519").getPublicKey(), now - 1_s);
  candidates.emplace_back(makeKey("EC").getPublicKey(), now - 2_s);

  BOOST_CHECK_EQUAL(selectKey(candidates, "0").fingerprint, candidates.front().fingerprint);
  BOOST_CHECK_EQUAL(selectKey(candidates, "1").publicKey.getKeyType(), "X25519");
  BOOST_CHECK_EQUAL(selectKey(candidates, " 2\n").fingerprint, candidates.back().fingerprint);
  BOOST_CHECK_EQUAL(selectKey(candidates, "002").fingerprint, candidates.back().fingerprint);
}

BOOST_AUTO_TEST_CASE(InvalidSelection)
{
  std::list<KeyRecord> candidates;
  candidates.emplace_back(makeKey("EC").getPublicKey(), time::system_clock::now());

  for (const std::string selection : {"1", "-1", "", "  ", "abc", "0x0", "1.0", "0 1",
                                      "99999999999999999999999999"}) {
    BOOST_CHECK_EXCEPTION(selectKey(candidates, selection), Error,
                          errorCodeIs(ErrorCode::INVALID_SELECTION));
  }

  BOOST_CHECK_EXCEPTION(selectKey({}, "0"), Error, errorCodeIs(ErrorCode::INVALID_SELECTION));
}

BOOST_AUTO_TEST_SUITE_END() // TestKeySelection

} // namespace keymfa::tests
