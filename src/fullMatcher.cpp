/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Backtracking matcher deciding if a text as a whole matches a wildcard pattern
/// \file "fullMatcher.cpp"
#include "fullMatcher.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include <limits>
#include <algorithm>

using namespace dotstar;

bool FullMatcher::match( const uint32_t* text, std::size_t textsize)
{
	m_text = text;
	m_textsize = textsize;
	bool rt;
	if (m_memoize)
	{
		if (textsize >= std::numeric_limits<std::size_t>::max() / 2 - 1)
		{
			throw dotstar::runtime_error( _TXT("size of text out of range for memoization table"));
		}
		rt = matchTable();
	}
	else
	{
		if (textsize + m_nofAtoms > (std::size_t)MaxRecursionDepth)
		{
			throw dotstar::runtime_error( _TXT("text of %u characters too long for matching a pattern of %u atoms without memoization (maximum %u), use option MEMOIZE"), (unsigned int)textsize, (unsigned int)m_nofAtoms, (unsigned int)MaxRecursionDepth);
		}
		rt = matchAt( 0, 0);
	}
	m_text = 0;
	m_textsize = 0;
	return rt;
}

bool FullMatcher::matchAt( std::size_t atomidx, std::size_t textidx)
{
	++m_nofCalls;
	if (atomidx == m_nofAtoms)
	{
		return textidx == m_textsize;
	}
	const PatternAtom& atom = m_atomar[ atomidx];
	if (atom.starred())
	{
		// Greedy: consume one more occurrence and stay on the starred atom, fall back to zero occurrencies:
		return (textidx < m_textsize && atom.accepts( m_text[ textidx]) && matchAt( atomidx, textidx+1))
			|| matchAt( atomidx+1, textidx);
	}
	else
	{
		return textidx < m_textsize && atom.accepts( m_text[ textidx]) && matchAt( atomidx+1, textidx+1);
	}
}

bool FullMatcher::matchTable()
{
	// Only two rows of the table are kept, the row of the atom evaluated and the row of its successor:
	std::size_t rowsize = m_textsize + 1;
	m_table.assign( 2 * rowsize, 0);
	unsigned char* next = &m_table[ 0];
	unsigned char* cur = &m_table[ rowsize];

	// The end of the pattern matches the end of the text only:
	next[ m_textsize] = 1;

	std::size_t atomidx = m_nofAtoms;
	while (atomidx > 0)
	{
		--atomidx;
		const PatternAtom& atom = m_atomar[ atomidx];
		bool starred = atom.starred();
		std::size_t textidx = rowsize;
		while (textidx > 0)
		{
			--textidx;
			++m_nofCalls;
			bool accepted = textidx < m_textsize && atom.accepts( m_text[ textidx]);
			bool result = false;
			if (accepted)
			{
				++m_nofMemoHits;
				result = starred ? (cur[ textidx+1] != 0) : (next[ textidx+1] != 0);
			}
			if (!result && starred)
			{
				++m_nofMemoHits;
				result = (next[ textidx] != 0);
			}
			cur[ textidx] = result ? 1 : 0;
		}
		std::swap( cur, next);
	}
	return next[ 0] != 0;
}

