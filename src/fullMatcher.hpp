/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Backtracking matcher deciding if a text as a whole matches a wildcard pattern
/// \file "fullMatcher.hpp"
#ifndef _DOTSTAR_FULL_MATCHER_HPP_INCLUDED
#define _DOTSTAR_FULL_MATCHER_HPP_INCLUDED
#include "wildcardPattern.hpp"
#include "strus/base/stdint.h"
#include <vector>
#include <cstddef>

namespace dotstar {

/// \brief Matcher of a text as a whole against a pattern
/// \note Starred atoms are matched greedy, trying the longest repetition first and backtracking to shorter ones.
/// \note Without memoization the matcher recurses once per atom and per character consumed,
///	texts (plus pattern atoms) longer than MaxRecursionDepth are rejected with an exception.
///	The worst case is exponential in the pattern and text length.
/// \note With memoization the result is computed iteratively in a table of (atom index, text index),
///	from the last atom and the end of the text backwards. There is no length limit and the cost is O(P*T).
/// \note A matcher holds scratch memory and the counters, it must not be used by two threads at the same time.
class FullMatcher
{
public:
	enum {MaxRecursionDepth = 50000};

	FullMatcher( const WildcardPattern* pattern_, bool memoize_)
		:m_pattern(pattern_)
		,m_atomar(pattern_->atoms().empty() ? 0 : &pattern_->atoms()[0])
		,m_nofAtoms(pattern_->atoms().size())
		,m_memoize(memoize_)
		,m_text(0),m_textsize(0)
		,m_table()
		,m_nofCalls(0),m_nofMemoHits(0){}

	/// \brief Decide if a text matches as a whole
	/// \param[in] text array of unicode characters
	/// \param[in] textsize number of characters in text
	bool match( const uint32_t* text, std::size_t textsize);

	/// \brief Total number of evaluation steps (calls of the recursive procedure or table cells evaluated)
	unsigned long nofCalls() const		{return m_nofCalls;}
	/// \brief Total number of results read from the memoization table
	unsigned long nofMemoHits() const	{return m_nofMemoHits;}

	const WildcardPattern* pattern() const	{return m_pattern;}

private:
	bool matchAt( std::size_t atomidx, std::size_t textidx);
	bool matchTable();

private:
	const WildcardPattern* m_pattern;
	const PatternAtom* m_atomar;
	std::size_t m_nofAtoms;
	bool m_memoize;
	const uint32_t* m_text;
	std::size_t m_textsize;
	std::vector<unsigned char> m_table;
	unsigned long m_nofCalls;
	unsigned long m_nofMemoHits;
};

}//namespace
#endif

