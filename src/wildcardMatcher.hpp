/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Implementation of compiling wildcard patterns for matching text
/// \file "wildcardMatcher.hpp"
#ifndef _DOTSTAR_WILDCARD_MATCHER_IMPLEMENTATION_HPP_INCLUDED
#define _DOTSTAR_WILDCARD_MATCHER_IMPLEMENTATION_HPP_INCLUDED
#include "dotstar/wildcardMatcherInterface.hpp"

namespace strus {
///\brief Forward declaration
class ErrorBufferInterface;
}

namespace dotstar {

/// \brief Object for compiling wildcard patterns with literals, '.' and '*' for matching text
/// \note Based on a backtracking matcher with optional memoization
class WildcardMatcher
	:public WildcardMatcherInterface
{
public:
	explicit WildcardMatcher( strus::ErrorBufferInterface* errorhnd_)
		:m_errorhnd(errorhnd_){}

	virtual ~WildcardMatcher(){}

	virtual std::vector<std::string> getCompileOptions() const;

	virtual WildcardMatcherInstanceInterface* createInstance(
			const std::string& pattern,
			const WildcardMatchOptions& opts) const;

private:
	strus::ErrorBufferInterface* m_errorhnd;
};

}//namespace
#endif

