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

#ifndef KEYMFA_KEY_SELECTION_HPP
#define KEYMFA_KEY_SELECTION_HPP

#include "detail/key-record.hpp"

#include <list>

namespace keymfa {

/**
 * @brief Pick one key out of @p candidates.
 *
 * @param candidates The keys offered, in the order they were listed.
 * @param selection A zero-based decimal index into @p candidates, possibly
 *                  surrounded by whitespace.
 * @throw Error INVALID_SELECTION if @p selection is not an index into @p candidates
 */
KeyRecord
selectKey(const std::list<KeyRecord>& candidates, const std::string& selection);

} // namespace keymfa

#endif // KEYMFA_KEY_SELECTION_HPP
