/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the dotstar wildcard matching library
/// \file libdotstar_wildcard.cpp
#include "dotstar/lib/wildcard.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/base/dll_tags.hpp"
#include "wildcardMatcher.hpp"
#include "wildcardPattern.hpp"
#include "fullMatcher.hpp"
#include "spanScanner.hpp"
#include "unicodeUtils.hpp"
#include "matchFlags.hpp"
#include "internationalization.hpp"
#include "errorUtils.hpp"

using namespace dotstar;
static bool g_intl_initialized = false;

DLL_PUBLIC WildcardMatcherInterface* dotstar::createWildcardMatcher_std( strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		if (!g_intl_initialized)
		{
			dotstar::initMessageTextDomain();
			g_intl_initialized = true;
		}
		return new WildcardMatcher( errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating wildcard matcher interface: %s"), *errorhnd, 0);
}

DLL_PUBLIC bool dotstar::matches( const std::string& pattern, const std::string& text)
{
	return dotstar::matches( pattern, text, WildcardMatchOptions());
}

DLL_PUBLIC bool dotstar::matches( const std::string& pattern, const std::string& text, const WildcardMatchOptions& opts)
{
	unsigned int flags = getMatchFlags( opts);
	WildcardPattern compiled( pattern, strayStarPolicy( flags));
	UnicodeCharString chrs( text.c_str(), text.size());
	FullMatcher matcher( &compiled, (flags & MatchFlagMemoize) != 0);
	return matcher.match( chrs.chars(), chrs.size());
}

DLL_PUBLIC std::vector<MatchSpan> dotstar::findAllMatches( const std::string& pattern, const std::string& text)
{
	return dotstar::findAllMatches( pattern, text, WildcardMatchOptions());
}

DLL_PUBLIC std::vector<MatchSpan> dotstar::findAllMatches( const std::string& pattern, const std::string& text, const WildcardMatchOptions& opts)
{
	unsigned int flags = getMatchFlags( opts);
	WildcardPattern compiled( pattern, strayStarPolicy( flags));
	UnicodeCharString chrs( text.c_str(), text.size());
	FullMatcher matcher( &compiled, (flags & MatchFlagMemoize) != 0);
	SpanScanner scanner( &matcher, 0/*no debug trace*/);
	return scanner.scan( text.c_str(), chrs);
}

