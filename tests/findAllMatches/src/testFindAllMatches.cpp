/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/base/local_ptr.hpp"
#include "dotstar/lib/wildcard.hpp"
#include "dotstar/wildcardMatcherInterface.hpp"
#include "dotstar/wildcardMatcherInstanceInterface.hpp"
#include "dotstar/wildcardMatcherContextInterface.hpp"
#include "dotstar/wildcardMatchOptions.hpp"
#include "dotstar/matchSpan.hpp"
#include "testUtils.hpp"
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

#undef DOTSTAR_LOWLEVEL_DEBUG

strus::ErrorBufferInterface* g_errorBuffer = 0;

struct SpanDef
{
	unsigned int start;
	unsigned int end;
	unsigned int origpos;
	unsigned int origsize;
	const char* value;
};

struct TestDef
{
	const char* pattern;
	const char* text;
	SpanDef result[16];
};

static const TestDef g_tests[] =
{
	{"a.c","abc xyz abc",
		{{0,3,0,3,"abc"},{8,11,8,3,"abc"},{0,0,0,0,0}}},
	{"a*b","aab b ab",
		{{0,3,0,3,"aab"},{1,3,1,2,"ab"},{2,3,2,1,"b"},{4,5,4,1,"b"},{6,8,6,2,"ab"},{7,8,7,1,"b"},{0,0,0,0,0}}},
	{"","abc",
		{{0,0,0,0,""},{1,1,1,0,""},{2,2,2,0,""},{3,3,3,0,""},{0,0,0,0,0}}},
	{".*","abc",
		{{0,0,0,0,""},{0,1,0,1,"a"},{0,2,0,2,"ab"},{0,3,0,3,"abc"},{1,1,1,0,""},{1,2,1,1,"b"},{1,3,1,2,"bc"},{2,2,2,0,""},{2,3,2,1,"c"},{3,3,3,0,""},{0,0,0,0,0}}},
	{"aa","aaaa",
		{{0,2,0,2,"aa"},{1,3,1,2,"aa"},{2,4,2,2,"aa"},{0,0,0,0,0}}},
	{"b","abc",
		{{1,2,1,1,"b"},{0,0,0,0,0}}},
	{"x","abc",
		{{0,0,0,0,0}}},
	{"a*","",
		{{0,0,0,0,""},{0,0,0,0,0}}},
	{"","",
		{{0,0,0,0,""},{0,0,0,0,0}}},
	{"a","",
		{{0,0,0,0,0}}},
	{"\xC3\xA9.","x\xC3\xA9y\xC3\xA9z",
		{{1,3,1,3,"\xC3\xA9y"},{3,5,4,3,"\xC3\xA9z"},{0,0,0,0,0}}},
	{".","\xE2\x82\xAC\xC3\xA9",
		{{0,1,0,3,"\xE2\x82\xAC"},{1,2,3,2,"\xC3\xA9"},{0,0,0,0,0}}},
	{"a*.","ab",
		{{0,1,0,1,"a"},{0,2,0,2,"ab"},{1,2,1,1,"b"},{0,0,0,0,0}}},
	{0,0,{{0,0,0,0,0}}}
};

static bool compareResult( const std::vector<dotstar::MatchSpan>& result, const SpanDef* expected)
{
	std::vector<dotstar::MatchSpan>::const_iterator ri = result.begin(), re = result.end();
	std::size_t ridx = 0;
	for (; ri != re && expected[ridx].value; ++ridx,++ri)
	{
		const SpanDef& exp = expected[ridx];
		if (exp.start != ri->start()) break;
		if (exp.end != ri->end()) break;
		if (exp.origpos != ri->origpos()) break;
		if (exp.origsize != ri->origsize()) break;
		if (ri->value() != exp.value) break;
	}
	return ri == re && !expected[ridx].value;
}

static void checkSpanInvariants( const std::string& text, const std::vector<dotstar::MatchSpan>& result)
{
	std::size_t textlen = dotstar::utils::utf8length( text);
	std::vector<dotstar::MatchSpan>::const_iterator ri = result.begin(), re = result.end();
	for (; ri != re; ++ri)
	{
		if (ri->start() > ri->end() || ri->end() > textlen)
		{
			throw std::runtime_error( "span out of range");
		}
		if (ri->origpos() + ri->origsize() > text.size()
		||  text.compare( ri->origpos(), ri->origsize(), ri->value()) != 0)
		{
			throw std::runtime_error( "span value does not match the substring of the text");
		}
		if (dotstar::utils::utf8length( ri->value()) != ri->end() - ri->start())
		{
			throw std::runtime_error( "span value length does not match the span");
		}
	}
}

static std::vector<dotstar::MatchSpan> findAllInterface( const dotstar::WildcardMatcherInterface* wm, const char* pattern, const std::string& text)
{
	strus::local_ptr<dotstar::WildcardMatcherInstanceInterface> inst( wm->createInstance( pattern, dotstar::WildcardMatchOptions()));
	if (!inst.get()) throw std::runtime_error( "failed to create wildcard matcher instance");
	strus::local_ptr<dotstar::WildcardMatcherContextInterface> ctx( inst->createContext());
	if (!ctx.get()) throw std::runtime_error( "failed to create wildcard matcher context");
	std::vector<dotstar::MatchSpan> rt = ctx->findAllMatches( text.c_str(), text.size());
	if (g_errorBuffer->hasError())
	{
		throw std::runtime_error( "error searching matches");
	}
	std::vector<dotstar::MatchSpan> again = ctx->findAllMatches( text.c_str(), text.size());
	if (again != rt)
	{
		throw std::runtime_error( "search with the same context is not idempotent");
	}
	return rt;
}

int main( int argc, const char** argv)
{
	try
	{
		g_errorBuffer = strus::createErrorBuffer_standard( 0, 1);
		if (!g_errorBuffer)
		{
			std::cerr << "construction of error buffer failed" << std::endl;
			return -1;
		}
		else if (argc > 1)
		{
			std::cerr << "too many arguments" << std::endl;
			return 1;
		}
		strus::local_ptr<dotstar::WildcardMatcherInterface> wm( dotstar::createWildcardMatcher_std( g_errorBuffer));
		if (!wm.get()) throw std::runtime_error("failed to create wildcard matcher");

		std::size_t ti = 0;
		for (; g_tests[ti].pattern; ++ti)
		{
			const TestDef& test = g_tests[ ti];
			std::cerr << "executing test " << (ti+1) << " findAllMatches(\"" << test.pattern << "\", \"" << test.text << "\")" << std::endl;
			std::vector<dotstar::MatchSpan> result = dotstar::findAllMatches( test.pattern, test.text);
#ifdef DOTSTAR_LOWLEVEL_DEBUG
			std::cerr << "result " << dotstar::utils::spansToString( result) << std::endl;
#endif
			if (!compareResult( result, test.result))
			{
				std::cerr << "unexpected result " << dotstar::utils::spansToString( result) << std::endl;
				throw std::runtime_error( "test failed");
			}
			checkSpanInvariants( test.text, result);
			if (dotstar::findAllMatches( test.pattern, test.text) != result)
			{
				throw std::runtime_error( "search is not idempotent");
			}
			if (dotstar::findAllMatches( test.pattern, test.text, dotstar::WildcardMatchOptions()("MEMOIZE")) != result)
			{
				throw std::runtime_error( "search with memoization differs");
			}
			if (findAllInterface( wm.get(), test.pattern, test.text) != result)
			{
				throw std::runtime_error( "search with context interface differs");
			}
			std::vector<dotstar::MatchSpan>::const_iterator ri = result.begin(), re = result.end();
			for (; ri != re; ++ri)
			{
				if (!dotstar::matches( test.pattern, ri->value()))
				{
					throw std::runtime_error( "value of span does not match the pattern as a whole");
				}
			}
		}
		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error( "uncaught error");
		}
		std::cerr << "OK" << std::endl;
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::runtime_error& err)
	{
		if (g_errorBuffer && g_errorBuffer->hasError())
		{
			std::cerr << "error processing wildcard search: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error processing wildcard search: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory processing wildcard search" << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

