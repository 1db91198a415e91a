/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Program matching a text or searching a text for substrings matching a wildcard pattern
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/debugTraceInterface.hpp"
#include "strus/base/fileio.hpp"
#include "strus/base/local_ptr.hpp"
#include "strus/versionBase.hpp"
#include "dotstar/lib/wildcard.hpp"
#include "dotstar/versionDotstar.hpp"
#include "dotstar/wildcardMatchOptions.hpp"
#include "dotstar/wildcardMatchStatistics.hpp"
#include "dotstar/wildcardMatcherInterface.hpp"
#include "dotstar/wildcardMatcherInstanceInterface.hpp"
#include "dotstar/wildcardMatcherContextInterface.hpp"
#include "dotstar/matchSpan.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "selfTest.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <cstring>
#include <cstdio>
#include <iostream>

static void printUsage()
{
	std::cout << "dotstarMatch [options] <pattern> [<text>]" << std::endl;
	std::cout << "options:" << std::endl;
	std::cout << "-h|--help" << std::endl;
	std::cout << "    " << _TXT("Print this usage and do nothing else") << std::endl;
	std::cout << "-v|--version" << std::endl;
	std::cout << "    " << _TXT("Print the program version and do nothing else") << std::endl;
	std::cout << "-F|--find" << std::endl;
	std::cout << "    " << _TXT("Print all substrings of the text matching the pattern") << std::endl;
	std::cout << "    " << _TXT("instead of deciding if the whole text matches") << std::endl;
	std::cout << "-f|--file <PATH>" << std::endl;
	std::cout << "    " << _TXT("Read the text to match from the file <PATH>") << std::endl;
	std::cout << "-S|--strict" << std::endl;
	std::cout << "    " << _TXT("Reject a pattern with a star '*' that has no character to repeat") << std::endl;
	std::cout << "-M|--memoize" << std::endl;
	std::cout << "    " << _TXT("Cache intermediate results of the matcher") << std::endl;
	std::cout << "-s|--statistics" << std::endl;
	std::cout << "    " << _TXT("Print the statistics of the matching to stderr") << std::endl;
	std::cout << "-G|--debug <COMP>" << std::endl;
	std::cout << "    " << _TXT("Issue debug messages for component <COMP> to stderr") << std::endl;
	std::cout << "    " << _TXT("(component of the matcher is \"wildcard\")") << std::endl;
	std::cout << "-T|--selftest" << std::endl;
	std::cout << "    " << _TXT("Run the built-in scenarios and print the results") << std::endl;
	std::cout << "<pattern> : " << _TXT("pattern with literal characters, '.' and '*'") << std::endl;
	std::cout << "<text>    : " << _TXT("text to match (if not read from file with --file)") << std::endl;
}

static strus::ErrorBufferInterface* g_errorBuffer = 0;	// error buffer

int main( int argc, const char* argv[])
{
	strus::local_ptr<strus::ErrorBufferInterface> errorBuffer;
	try
	{
		bool doExit = false;
		bool doSelfTest = false;
		bool doFind = false;
		bool printStats = false;
		int argi = 1;
		std::string inputfile;
		std::vector<std::string> debugComponents;
		dotstar::WildcardMatchOptions opts;

		// Parsing arguments:
		for (; argi < argc; ++argi)
		{
			if (0==std::strcmp( argv[argi], "-h") || 0==std::strcmp( argv[argi], "--help"))
			{
				printUsage();
				doExit = true;
			}
			else if (0==std::strcmp( argv[argi], "-v") || 0==std::strcmp( argv[argi], "--version"))
			{
				std::cerr << _TXT("dotstar version ") << DOTSTAR_VERSION_STRING << std::endl;
				std::cerr << _TXT("strus base version ") << STRUS_BASE_VERSION_STRING << std::endl;
				doExit = true;
			}
			else if (0==std::strcmp( argv[argi], "-T") || 0==std::strcmp( argv[argi], "--selftest"))
			{
				doSelfTest = true;
			}
			else if (0==std::strcmp( argv[argi], "-F") || 0==std::strcmp( argv[argi], "--find"))
			{
				doFind = true;
			}
			else if (0==std::strcmp( argv[argi], "-S") || 0==std::strcmp( argv[argi], "--strict"))
			{
				opts.strict();
			}
			else if (0==std::strcmp( argv[argi], "-M") || 0==std::strcmp( argv[argi], "--memoize"))
			{
				opts.memoize();
			}
			else if (0==std::strcmp( argv[argi], "-s") || 0==std::strcmp( argv[argi], "--statistics"))
			{
				printStats = true;
			}
			else if (0==std::strcmp( argv[argi], "-f") || 0==std::strcmp( argv[argi], "--file"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw dotstar::runtime_error( _TXT("no argument given to option --file"));
				}
				++argi;
				if (!inputfile.empty())
				{
					throw dotstar::runtime_error( _TXT("input file option --file specified twice"));
				}
				inputfile = argv[argi];
				if (inputfile.empty())
				{
					throw dotstar::runtime_error( _TXT("input file option --file argument is empty"));
				}
			}
			else if (0==std::strcmp( argv[argi], "-G") || 0==std::strcmp( argv[argi], "--debug"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw dotstar::runtime_error( _TXT("no argument given to option --debug"));
				}
				++argi;
				debugComponents.push_back( argv[argi]);
			}
			else if (argv[argi][0] == '-' && argv[argi][1] == '-' && !argv[argi][2])
			{
				++argi;
				break;
			}
			else if (argv[argi][0] == '-' && argv[argi][1])
			{
				throw dotstar::runtime_error(_TXT("unknown option %s"), argv[ argi]);
			}
			else
			{
				break;
			}
		}
		if (doExit) return 0;
		if (doSelfTest)
		{
			if (argc - argi > 0)
			{
				throw dotstar::runtime_error( _TXT("no arguments expected with option --selftest (given %u)"), argc - argi);
			}
			return dotstar::runSelfTest( std::cout) ? 0 : 1;
		}
		int nofArgsRequired = inputfile.empty() ? 2 : 1;
		if (argc - argi < nofArgsRequired)
		{
			printUsage();
			throw dotstar::runtime_error( _TXT("too few arguments (given %u, required %u)"), argc - argi, nofArgsRequired);
		}
		if (argc - argi > nofArgsRequired)
		{
			printUsage();
			throw dotstar::runtime_error( _TXT("too many arguments (given %u, required %u)"), argc - argi, nofArgsRequired);
		}
		strus::DebugTraceInterface* dbgtrace = 0;
		if (!debugComponents.empty())
		{
			dbgtrace = strus::createDebugTrace_standard( 2);
			if (!dbgtrace)
			{
				throw dotstar::runtime_error( _TXT("failed to create debug trace"));
			}
			std::vector<std::string>::const_iterator di = debugComponents.begin(), de = debugComponents.end();
			for (; di != de; ++di)
			{
				dbgtrace->enable( *di);
			}
		}
		errorBuffer.reset( strus::createErrorBuffer_standard( 0, 1, dbgtrace));
		if (!errorBuffer.get())
		{
			throw dotstar::runtime_error( _TXT("failed to create error buffer"));
		}
		g_errorBuffer = errorBuffer.get();

		// Read the arguments:
		std::string pattern( argv[ argi++]);
		std::string text;
		if (inputfile.empty())
		{
			text = argv[ argi++];
		}
		else
		{
			unsigned int ec = strus::readFile( inputfile, text);
			if (ec)
			{
				throw dotstar::runtime_error(_TXT("error (%u) reading input file %s: %s"), ec, inputfile.c_str(), ::strerror(ec));
			}
		}

		// Create objects:
		strus::local_ptr<dotstar::WildcardMatcherInterface> wmi( dotstar::createWildcardMatcher_std( g_errorBuffer));
		if (!wmi.get()) throw std::runtime_error( _TXT("failed to create wildcard matcher"));
		strus::local_ptr<dotstar::WildcardMatcherInstanceInterface> wminst( wmi->createInstance( pattern, opts));
		if (!wminst.get()) throw std::runtime_error( _TXT("failed to compile wildcard pattern"));
		strus::local_ptr<dotstar::WildcardMatcherContextInterface> wmctx( wminst->createContext());
		if (!wmctx.get()) throw std::runtime_error( _TXT("failed to create wildcard matcher context"));

		// Match:
		if (doFind)
		{
			std::vector<dotstar::MatchSpan> spans = wmctx->findAllMatches( text.c_str(), text.size());
			if (g_errorBuffer->hasError())
			{
				throw std::runtime_error( _TXT("error searching text for matches"));
			}
			std::vector<dotstar::MatchSpan>::const_iterator si = spans.begin(), se = spans.end();
			for (; si != se; ++si)
			{
				std::cout << si->start() << " " << si->end() << " '" << si->value() << "'" << std::endl;
			}
		}
		else
		{
			bool result = wmctx->isFullMatch( text.c_str(), text.size());
			if (g_errorBuffer->hasError())
			{
				throw std::runtime_error( _TXT("error matching text"));
			}
			std::cout << (result ? "true" : "false") << std::endl;
		}
		if (printStats)
		{
			wmctx->getStatistics().print( std::cerr);
		}
		if (dbgtrace)
		{
			if (!strus::dumpDebugTrace( dbgtrace, 0/*stderr*/))
			{
				throw std::runtime_error( _TXT("failed to dump the debug trace"));
			}
		}
		// Check for reported error an terminate regularly:
		if (g_errorBuffer->hasError())
		{
			throw dotstar::runtime_error( _TXT("error in wildcard matching"));
		}
		return 0;
	}
	catch (const std::exception& e)
	{
		const char* errormsg = g_errorBuffer?g_errorBuffer->fetchError():0;
		if (errormsg)
		{
			std::cerr << e.what() << ": " << errormsg << std::endl;
		}
		else
		{
			std::cerr << e.what() << std::endl;
		}
	}
	return -1;
}

