/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the dotstar wildcard matching library
/// \file wildcard.hpp
#ifndef _DOTSTAR_WILDCARD_LIB_HPP_INCLUDED
#define _DOTSTAR_WILDCARD_LIB_HPP_INCLUDED
#include "dotstar/matchSpan.hpp"
#include "dotstar/wildcardMatchOptions.hpp"
#include <string>
#include <vector>

/// \brief strus toplevel namespace
namespace strus {
/// \brief Forward declaration
class ErrorBufferInterface;
}

/// \brief dotstar toplevel namespace
namespace dotstar {

/// \brief Forward declaration
class WildcardMatcherInterface;

/// \brief Create the interface for compiling wildcard patterns
/// \param[in] errorhnd error buffer for reporting errors of the created objects
/// \return the interface or NULL in case of an error (error reported in errorhnd)
WildcardMatcherInterface* createWildcardMatcher_std(
		strus::ErrorBufferInterface* errorhnd);

/// \brief Decide if a text as a whole matches a pattern
/// \param[in] pattern pattern with literal characters, '.' and '*'
/// \param[in] text UTF-8 encoded text
/// \return true if the text matches
/// \note A star '*' without preceding character is matched as literal character
bool matches( const std::string& pattern, const std::string& text);

/// \brief Decide if a text as a whole matches a pattern
/// \param[in] pattern pattern with literal characters, '.' and '*'
/// \param[in] text UTF-8 encoded text
/// \param[in] opts options (see WildcardMatchOptions)
/// \return true if the text matches
/// \note Throws InvalidPatternError for a malformed pattern with option "STRICT" and std::runtime_error on an unknown option
bool matches( const std::string& pattern, const std::string& text, const WildcardMatchOptions& opts);

/// \brief Get all substrings of a text that match a pattern, including overlapping and empty ones
/// \param[in] pattern pattern with literal characters, '.' and '*'
/// \param[in] text UTF-8 encoded text
/// \return the matches in ascending order of start, then end
std::vector<MatchSpan> findAllMatches( const std::string& pattern, const std::string& text);

/// \brief Get all substrings of a text that match a pattern, including overlapping and empty ones
/// \param[in] pattern pattern with literal characters, '.' and '*'
/// \param[in] text UTF-8 encoded text
/// \param[in] opts options (see WildcardMatchOptions)
/// \return the matches in ascending order of start, then end
std::vector<MatchSpan> findAllMatches( const std::string& pattern, const std::string& text, const WildcardMatchOptions& opts);

}//namespace
#endif

