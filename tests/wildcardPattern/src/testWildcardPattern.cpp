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
#include "dotstar/invalidPatternError.hpp"
#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

strus::ErrorBufferInterface* g_errorBuffer = 0;

struct CompileDef
{
	const char* pattern;
	const char* atoms;
};

static const CompileDef g_compileTests[] =
{
	{"abc","Literal 'a' Literal 'b' Literal 'c'"},
	{"a.c","Literal 'a' Wildcard Literal 'c'"},
	{"a.*b*","Literal 'a' StarredWildcard StarredLiteral 'b'"},
	{"caf\xC3\xA9*","Literal 'c' Literal 'a' Literal 'f' StarredLiteral '\xC3\xA9'"},
	{"*a","Literal '*' Literal 'a'"},
	{"**","StarredLiteral '*'"},
	{"a**","StarredLiteral 'a' Literal '*'"},
	{"",""},
	{0,0}
};

struct StrictDef
{
	const char* pattern;
	unsigned int position;
};

static const StrictDef g_strictTests[] =
{
	{"*a",0},
	{"*",0},
	{"**",0},
	{"a**",2},
	{".*.**",4},
	{"\xC3\xA9**",2},
	{0,0}
};

static void testCompile( const dotstar::WildcardMatcherInterface* wm)
{
	std::size_t ti = 0;
	for (; g_compileTests[ti].pattern; ++ti)
	{
		const CompileDef& test = g_compileTests[ ti];
		std::cerr << "executing compile test " << (ti+1) << " \"" << test.pattern << "\"" << std::endl;
		strus::local_ptr<dotstar::WildcardMatcherInstanceInterface> inst( wm->createInstance( test.pattern, dotstar::WildcardMatchOptions()));
		if (!inst.get()) throw std::runtime_error( "failed to create wildcard matcher instance");
		if (inst->pattern() != test.pattern)
		{
			throw std::runtime_error( "pattern source of instance differs");
		}
		std::string atoms = inst->tostring();
		if (atoms != test.atoms)
		{
			std::cerr << "unexpected atoms: " << atoms << std::endl;
			throw std::runtime_error( "test failed");
		}
	}
}

static void testStrict( const dotstar::WildcardMatcherInterface* wm)
{
	std::size_t ti = 0;
	for (; g_strictTests[ti].pattern; ++ti)
	{
		const StrictDef& test = g_strictTests[ ti];
		std::cerr << "executing strict test " << (ti+1) << " \"" << test.pattern << "\"" << std::endl;
		try
		{
			(void)dotstar::matches( test.pattern, "", dotstar::WildcardMatchOptions().strict());
			throw std::runtime_error( "invalid pattern not rejected");
		}
		catch (const dotstar::InvalidPatternError& err)
		{
			if (err.position() != test.position)
			{
				std::cerr << "error at position " << err.position() << ": " << err.what() << std::endl;
				throw std::runtime_error( "unexpected error position");
			}
		}
		try
		{
			(void)dotstar::findAllMatches( test.pattern, "abc", dotstar::WildcardMatchOptions()("strict"));
			throw std::runtime_error( "invalid pattern not rejected in search");
		}
		catch (const dotstar::InvalidPatternError&){}

		strus::local_ptr<dotstar::WildcardMatcherInstanceInterface> inst( wm->createInstance( test.pattern, dotstar::WildcardMatchOptions()("STRICT")));
		if (inst.get() || !g_errorBuffer->hasError())
		{
			throw std::runtime_error( "invalid pattern not reported as error");
		}
		std::cerr << "reported error: " << g_errorBuffer->fetchError() << std::endl;

		// Without option STRICT the same pattern is accepted:
		inst.reset( wm->createInstance( test.pattern, dotstar::WildcardMatchOptions()));
		if (!inst.get()) throw std::runtime_error( "failed to create wildcard matcher instance");
	}
	if (!dotstar::matches( "a*b.c*", "aabxc", dotstar::WildcardMatchOptions()("STRICT")("MEMOIZE")))
	{
		throw std::runtime_error( "valid pattern not matched with option STRICT");
	}
}

static void testOptions( const dotstar::WildcardMatcherInterface* wm)
{
	std::cerr << "executing test of options" << std::endl;
	std::vector<std::string> optnames = wm->getCompileOptions();
	if (optnames.size() != 2 || optnames[0] != "STRICT" || optnames[1] != "MEMOIZE")
	{
		throw std::runtime_error( "unexpected option names");
	}
	strus::local_ptr<dotstar::WildcardMatcherInstanceInterface> inst( wm->createInstance( "abc", dotstar::WildcardMatchOptions()("GREEDY")));
	if (inst.get() || !g_errorBuffer->hasError())
	{
		throw std::runtime_error( "unknown option not reported as error");
	}
	std::cerr << "reported error: " << g_errorBuffer->fetchError() << std::endl;
	bool rejected = false;
	try
	{
		(void)dotstar::matches( "abc", "abc", dotstar::WildcardMatchOptions()("GREEDY"));
	}
	catch (const dotstar::InvalidPatternError&)
	{
		throw std::runtime_error( "unknown option reported as invalid pattern");
	}
	catch (const std::runtime_error& err)
	{
		std::cerr << "exception: " << err.what() << std::endl;
		rejected = true;
	}
	if (!rejected)
	{
		throw std::runtime_error( "unknown option not rejected");
	}
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

		testCompile( wm.get());
		testStrict( wm.get());
		testOptions( wm.get());

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
			std::cerr << "error in wildcard pattern test: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error in wildcard pattern test: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory in wildcard pattern test" << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

