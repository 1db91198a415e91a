/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Scanner enumerating all substrings of a text matching a pattern
/// \file "spanScanner.cpp"
#include "spanScanner.hpp"
#include "strus/debugTraceInterface.hpp"

#define DEBUG_EVENT3( NAME, FMT, X1, X2, X3)	if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2, X3);

using namespace dotstar;

std::vector<MatchSpan> SpanScanner::scan( const char* src, const UnicodeCharString& text)
{
	std::vector<MatchSpan> rt;
	const WildcardPattern* pattern = m_matcher->pattern();
	const uint32_t* chrs = text.chars();
	std::size_t textsize = text.size();
	std::size_t minlen = pattern->minLength();
	bool hasStar = pattern->hasStar();

	for (std::size_t start = 0; start <= textsize; ++start)
	{
		// Substrings shorter than the pattern minimum length cannot match, without star only the minimum length can:
		std::size_t end = start + minlen;
		std::size_t last = hasStar ? textsize : end;
		for (; end <= last && end <= textsize; ++end)
		{
			++m_nofCandidates;
			if (m_matcher->match( chrs + start, end - start))
			{
				++m_nofMatches;
				std::size_t origpos = text.origpos( start);
				std::size_t origsize = text.origpos( end) - origpos;
				std::string value;
				if (origsize) value.append( src + origpos, origsize);
				rt.push_back( MatchSpan( start, end, origpos, origsize, value));
				DEBUG_EVENT3( "span", "start=%u end=%u value='%s'", (unsigned int)start, (unsigned int)end, rt.back().value().c_str());
			}
		}
	}
	return rt;
}

