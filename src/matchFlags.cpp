/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Mapping of wildcard match options to flags
/// \file "matchFlags.cpp"
#include "matchFlags.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "utils.hpp"

using namespace dotstar;

unsigned int dotstar::getMatchFlags( const WildcardMatchOptions& opts)
{
	unsigned int rt = 0;
	WildcardMatchOptions::const_iterator ai = opts.begin(), ae = opts.end();
	for (; ai != ae; ++ai)
	{
		if (utils::caseInsensitiveEquals( *ai, "STRICT"))
		{
			rt |= MatchFlagStrict;
		}
		else if (utils::caseInsensitiveEquals( *ai, "MEMOIZE"))
		{
			rt |= MatchFlagMemoize;
		}
		else
		{
			throw dotstar::runtime_error(_TXT("unknown option '%s'"), ai->c_str());
		}
	}
	return rt;
}

std::vector<std::string> dotstar::getMatchOptionNames()
{
	std::vector<std::string> rt;
	rt.push_back( "STRICT");
	rt.push_back( "MEMOIZE");
	return rt;
}

WildcardPattern::StrayStarPolicy dotstar::strayStarPolicy( unsigned int flags)
{
	return (flags & MatchFlagStrict) ? WildcardPattern::StrayStarReject : WildcardPattern::StrayStarLiteral;
}

