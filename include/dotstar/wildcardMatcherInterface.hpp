/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for compiling wildcard patterns with literals, '.' and '*' for matching text
/// \file "wildcardMatcherInterface.hpp"
#ifndef _DOTSTAR_WILDCARD_MATCHER_INTERFACE_HPP_INCLUDED
#define _DOTSTAR_WILDCARD_MATCHER_INTERFACE_HPP_INCLUDED
#include "dotstar/wildcardMatchOptions.hpp"
#include <vector>
#include <string>

namespace dotstar
{
/// \brief Forward declaration
class WildcardMatcherInstanceInterface;

/// \brief Interface for compiling wildcard patterns for matching text
class WildcardMatcherInterface
{
public:
	/// \brief Destructor
	virtual ~WildcardMatcherInterface(){}

	/// \brief Get the list of option names you can pass to createInstance
	/// \return the option names
	virtual std::vector<std::string> getCompileOptions() const=0;

	/// \brief Compile a pattern
	/// \param[in] pattern pattern string with literal characters, '.' matching any character and '*' repeating the preceding character zero or more times
	/// \param[in] opts options for compiling and matching
	/// \return the compiled pattern or NULL in case of an error (error reported in error buffer)
	virtual WildcardMatcherInstanceInterface* createInstance(
			const std::string& pattern,
			const WildcardMatchOptions& opts) const=0;
};

} //namespace
#endif

