/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Scanner enumerating all substrings of a text matching a pattern
/// \file "spanScanner.hpp"
#ifndef _DOTSTAR_SPAN_SCANNER_HPP_INCLUDED
#define _DOTSTAR_SPAN_SCANNER_HPP_INCLUDED
#include "dotstar/matchSpan.hpp"
#include "fullMatcher.hpp"
#include "unicodeUtils.hpp"
#include <vector>

namespace strus {
///\brief Forward declaration
class DebugTraceContextInterface;
}

namespace dotstar {

/// \brief Scanner checking every substring [start,end) of a text for a full match, in ascending order of start, then end
/// \note Overlapping and nested matches are all reported
class SpanScanner
{
public:
	SpanScanner( FullMatcher* matcher_, strus::DebugTraceContextInterface* debugtrace_)
		:m_matcher(matcher_),m_debugtrace(debugtrace_),m_nofCandidates(0),m_nofMatches(0){}

	/// \brief Get all matching substrings
	/// \param[in] src the UTF-8 source of text
	/// \param[in] text the decoded source
	std::vector<MatchSpan> scan( const char* src, const UnicodeCharString& text);

	/// \brief Number of substrings checked for a full match
	unsigned long nofCandidates() const	{return m_nofCandidates;}
	/// \brief Number of matches found
	unsigned long nofMatches() const	{return m_nofMatches;}

private:
	FullMatcher* m_matcher;
	strus::DebugTraceContextInterface* m_debugtrace;
	unsigned long m_nofCandidates;
	unsigned long m_nofMatches;
};

}//namespace
#endif

