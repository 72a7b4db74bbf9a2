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

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <iterator>

namespace keymfa {

KeyRecord
selectKey(const std::list<KeyRecord>& candidates, const std::string& selection)
{
  auto choice = boost::algorithm::trim_copy(selection);
  if (choice.empty() || !boost::algorithm::all(choice, boost::algorithm::is_digit())) {
    NDN_THROW(Error(ErrorCode::INVALID_SELECTION));
  }

  size_t index = 0;
  try {
    index = std::stoul(choice);
  }
  catch (const std::out_of_range&) {
    NDN_THROW_NESTED(Error(ErrorCode::INVALID_SELECTION));
  }
  if (index >= candidates.size()) {
    NDN_THROW(Error(ErrorCode::INVALID_SELECTION));
  }
  return *std::next(candidates.begin(), static_cast<std::ptrdiff_t>(index));
}

} // namespace keymfa
