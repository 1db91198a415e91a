/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of compiling wildcard patterns for matching text
/// \file "wildcardMatcher.cpp"
#include "wildcardMatcher.hpp"
#include "dotstar/wildcardMatcherInstanceInterface.hpp"
#include "dotstar/wildcardMatcherContextInterface.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include "strus/base/stdint.h"
#include "wildcardPattern.hpp"
#include "fullMatcher.hpp"
#include "spanScanner.hpp"
#include "unicodeUtils.hpp"
#include "matchFlags.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include <vector>
#include <string>
#include <limits>

#define STRUS_DBGTRACE_COMPONENT_NAME "wildcard"
#define DEBUG_OPEN( NAME) if (m_debugtrace) m_debugtrace->open( NAME);
#define DEBUG_CLOSE() if (m_debugtrace) m_debugtrace->close();
#define DEBUG_EVENT2( NAME, FMT, X1, X2)                        if (m_debugtrace) m_debugtrace->event( NAME, FMT, X1, X2);

using namespace dotstar;

class WildcardMatcherContext
	:public WildcardMatcherContextInterface
{
public:
	WildcardMatcherContext( const WildcardPattern* pattern_, unsigned int flags_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_)
		,m_debugtrace(0)
		,m_matcher( pattern_, (flags_ & MatchFlagMemoize) != 0)
		,m_nofCandidates(0)
		,m_nofMatches(0)
	{
		strus::DebugTraceInterface* dbgi = m_errorhnd->debugTrace();
		if (dbgi)
		{
			m_debugtrace = dbgi->createTraceContext( STRUS_DBGTRACE_COMPONENT_NAME);
			DEBUG_EVENT2( "pattern", "%s [%s]", pattern_->expression().c_str(), pattern_->tostring().c_str())
		}
	}

	virtual ~WildcardMatcherContext()
	{
		if (m_debugtrace) delete m_debugtrace;
	}

	virtual bool isFullMatch( const char* src, std::size_t srclen)
	{
		try
		{
			checkSourceSize( srclen);
			UnicodeCharString text( src, srclen);
			++m_nofCandidates;
			bool rt = m_matcher.match( text.chars(), text.size());
			if (rt) ++m_nofMatches;
			DEBUG_EVENT2( "match", "size=%u result=%s", (unsigned int)text.size(), rt ? "true":"false")
			return rt;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to match text against wildcard pattern: %s"), *m_errorhnd, false);
	}

	virtual std::vector<MatchSpan> findAllMatches( const char* src, std::size_t srclen)
	{
		try
		{
			checkSourceSize( srclen);
			UnicodeCharString text( src, srclen);
			DEBUG_OPEN( "scan")
			SpanScanner scanner( &m_matcher, m_debugtrace);
			std::vector<MatchSpan> rt = scanner.scan( src, text);
			m_nofCandidates += scanner.nofCandidates();
			m_nofMatches += scanner.nofMatches();
			DEBUG_EVENT2( "statistics", "candidates=%u matches=%u", (unsigned int)scanner.nofCandidates(), (unsigned int)scanner.nofMatches())
			DEBUG_CLOSE()
			return rt;
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to find matches of wildcard pattern in text: %s"), *m_errorhnd, std::vector<MatchSpan>());
	}

	virtual WildcardMatchStatistics getStatistics() const
	{
		return WildcardMatchStatistics( m_matcher.nofCalls(), m_matcher.nofMemoHits(), m_nofCandidates, m_nofMatches);
	}

private:
	static void checkSourceSize( std::size_t srclen)
	{
		if (srclen >= (std::size_t)std::numeric_limits<uint32_t>::max())
		{
			throw dotstar::runtime_error( _TXT("size of string to match out of range"));
		}
	}

private:
	strus::ErrorBufferInterface* m_errorhnd;
	strus::DebugTraceContextInterface* m_debugtrace;
	FullMatcher m_matcher;
	unsigned long m_nofCandidates;
	unsigned long m_nofMatches;
};

class WildcardMatcherInstance
	:public WildcardMatcherInstanceInterface
{
public:
	WildcardMatcherInstance( const std::string& pattern_, unsigned int flags_, strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_),m_pattern( pattern_, strayStarPolicy( flags_)),m_flags(flags_){}

	virtual ~WildcardMatcherInstance(){}

	virtual const std::string& pattern() const
	{
		return m_pattern.expression();
	}

	virtual std::string tostring() const
	{
		try
		{
			return m_pattern.tostring();
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to print wildcard pattern: %s"), *m_errorhnd, std::string());
	}

	virtual WildcardMatcherContextInterface* createContext() const
	{
		try
		{
			return new WildcardMatcherContext( &m_pattern, m_flags, m_errorhnd);
		}
		CATCH_ERROR_MAP_RETURN( _TXT("failed to create wildcard matcher context: %s"), *m_errorhnd, 0);
	}

private:
	strus::ErrorBufferInterface* m_errorhnd;
	WildcardPattern m_pattern;
	unsigned int m_flags;
};

std::vector<std::string> WildcardMatcher::getCompileOptions() const
{
	try
	{
		return getMatchOptionNames();
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to get wildcard matcher options: %s"), *m_errorhnd, std::vector<std::string>());
}

WildcardMatcherInstanceInterface* WildcardMatcher::createInstance(
		const std::string& pattern,
		const WildcardMatchOptions& opts) const
{
	try
	{
		return new WildcardMatcherInstance( pattern, getMatchFlags( opts), m_errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("failed to compile wildcard pattern: %s"), *m_errorhnd, 0);
}

