/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface for matching texts against a compiled wildcard pattern
/// \file "wildcardMatcherContextInterface.hpp"
#ifndef _DOTSTAR_WILDCARD_MATCHER_CONTEXT_INTERFACE_HPP_INCLUDED
#define _DOTSTAR_WILDCARD_MATCHER_CONTEXT_INTERFACE_HPP_INCLUDED
#include "dotstar/matchSpan.hpp"
#include "dotstar/wildcardMatchStatistics.hpp"
#include <vector>
#include <cstddef>

namespace dotstar
{

/// \brief Interface for matching texts against a compiled wildcard pattern
/// \note A context holds the scratch memory of the matcher and must not be used by more than one thread at the same time
class WildcardMatcherContextInterface
{
public:
	/// \brief Destructor
	virtual ~WildcardMatcherContextInterface(){}

	/// \brief Decide if a text as a whole matches the pattern
	/// \param[in] src pointer to the UTF-8 encoded text
	/// \param[in] srclen length of src in bytes
	/// \return true if the whole text matches, false if not or in case of an error (error reported in error buffer)
	virtual bool isFullMatch( const char* src, std::size_t srclen)=0;

	/// \brief Get all substrings of a text matching the pattern, including overlapping ones
	/// \param[in] src pointer to the UTF-8 encoded text
	/// \param[in] srclen length of src in bytes
	/// \return list of matches in ascending order of start, then end
	virtual std::vector<MatchSpan> findAllMatches( const char* src, std::size_t srclen)=0;

	/// \brief Get the statistics of all matching done with this context
	/// \return the statistics
	virtual WildcardMatchStatistics getStatistics() const=0;
};

} //namespace
#endif

