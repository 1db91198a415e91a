/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Mapping of wildcard match options to flags
/// \file "matchFlags.hpp"
#ifndef _DOTSTAR_MATCH_FLAGS_HPP_INCLUDED
#define _DOTSTAR_MATCH_FLAGS_HPP_INCLUDED
#include "dotstar/wildcardMatchOptions.hpp"
#include "wildcardPattern.hpp"
#include <vector>
#include <string>

namespace dotstar {

enum MatchFlag
{
	MatchFlagStrict = 0x1,
	MatchFlagMemoize = 0x2
};

/// \brief Get the flags of a list of options, throws on an unknown option
unsigned int getMatchFlags( const WildcardMatchOptions& opts);

/// \brief Get the names of all options known
std::vector<std::string> getMatchOptionNames();

/// \brief Get the policy for stars without preceding character
WildcardPattern::StrayStarPolicy strayStarPolicy( unsigned int flags);

}//namespace
#endif

