/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Structure for options describing the behaviour of the wildcard matcher
/// \file "wildcardMatchOptions.hpp"
#ifndef _DOTSTAR_WILDCARD_MATCH_OPTIONS_HPP_INCLUDED
#define _DOTSTAR_WILDCARD_MATCH_OPTIONS_HPP_INCLUDED
#include <vector>
#include <string>

namespace dotstar {

/// \brief Options to steer the compilation and evaluation of a wildcard pattern
/// \note The following options are available (case insensitive):
///		"STRICT"	reject a star '*' that has no preceding character to repeat
///		"MEMOIZE"	evaluate the match in a table per pattern and text position, without recursion and length limit
class WildcardMatchOptions
{
public:
	/// \brief Constructor
	WildcardMatchOptions(){}
	/// \brief Copy constructor
	WildcardMatchOptions( const WildcardMatchOptions& o)
		:m_opts(o.m_opts){}

	/// \brief Add an option definition by name
	WildcardMatchOptions& operator()( const std::string& opt)
	{
		m_opts.push_back( opt);
		return *this;
	}
	/// \brief Add option "STRICT", rejecting patterns with a star '*' that has no character to repeat
	WildcardMatchOptions& strict()
	{
		return operator()( "STRICT");
	}
	/// \brief Add option "MEMOIZE", evaluating the match in a table of (atom, character position) without recursion
	WildcardMatchOptions& memoize()
	{
		return operator()( "MEMOIZE");
	}

	typedef std::vector<std::string>::const_iterator const_iterator;
	/// \brief Get iterator at first element of the option list
	const_iterator begin() const	{return m_opts.begin();}
	/// \brief Get iterator marking the end of the option list
	const_iterator end() const	{return m_opts.end();}

	/// \brief Evaluate if no options are defined
	bool empty() const		{return m_opts.empty();}

private:
	std::vector<std::string> m_opts;	///< list of option strings
};

} //namespace
#endif

