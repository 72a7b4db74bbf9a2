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

#ifndef KEYMFA_TESTS_CLOCK_FIXTURE_HPP
#define KEYMFA_TESTS_CLOCK_FIXTURE_HPP

#include "detail/keymfa-common.hpp"

#include <ndn-cxx/util/time-unit-test-clock.hpp>

namespace keymfa::tests {

/**
 * @brief A test fixture that overrides steady clock and system clock.
 */
class ClockFixture
{
public:
  ClockFixture()
    : steadyClock(std::make_shared<time::UnitTestSteadyClock>())
    , systemClock(std::make_shared<time::UnitTestSystemClock>())
  {
    time::setCustomClocks(steadyClock, systemClock);
  }

  ~ClockFixture()
  {
    time::setCustomClocks(nullptr, nullptr);
  }

  /**
   * @brief Advance steady and system clocks.
   *
   * Clocks are advanced in increments of @p tick for @p nTicks ticks.
   */
  void
  advanceClocks(time::nanoseconds tick, size_t nTicks = 1)
  {
    BOOST_ASSERT(tick > time::nanoseconds::zero());
    for (size_t i = 0; i < nTicks; ++i) {
      steadyClock->advance(tick);
      systemClock->advance(tick);
    }
  }

public:
  std::shared_ptr<time::UnitTestSteadyClock> steadyClock;
  std::shared_ptr<time::UnitTestSystemClock> systemClock;
};

} // namespace keymfa::tests

#endif // KEYMFA_TESTS_CLOCK_FIXTURE_HPP
