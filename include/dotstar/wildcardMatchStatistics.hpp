/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Object describing the statistics of a wildcard matcher context for runtime analysis
/// \file "wildcardMatchStatistics.hpp"
#ifndef _DOTSTAR_WILDCARD_MATCH_STATISTICS_HPP_INCLUDED
#define _DOTSTAR_WILDCARD_MATCH_STATISTICS_HPP_INCLUDED
#include <iostream>

namespace dotstar {

/// \brief Counters of the matching done by one context
class WildcardMatchStatistics
{
public:
	/// \brief Default constructor
	WildcardMatchStatistics()
		:m_nofCalls(0),m_nofMemoHits(0),m_nofCandidates(0),m_nofMatches(0){}
	/// \brief Constructor
	WildcardMatchStatistics( unsigned long nofCalls_, unsigned long nofMemoHits_, unsigned long nofCandidates_, unsigned long nofMatches_)
		:m_nofCalls(nofCalls_),m_nofMemoHits(nofMemoHits_),m_nofCandidates(nofCandidates_),m_nofMatches(nofMatches_){}
	/// \brief Copy constructor
	WildcardMatchStatistics( const WildcardMatchStatistics& o)
		:m_nofCalls(o.m_nofCalls),m_nofMemoHits(o.m_nofMemoHits),m_nofCandidates(o.m_nofCandidates),m_nofMatches(o.m_nofMatches){}

	/// \brief Number of evaluation steps of the matcher (recursive calls or memoization table cells evaluated)
	unsigned long nofCalls() const		{return m_nofCalls;}
	/// \brief Number of results read from the memoization table (0 without option "MEMOIZE")
	unsigned long nofMemoHits() const	{return m_nofMemoHits;}
	/// \brief Number of texts or substrings checked for a full match
	unsigned long nofCandidates() const	{return m_nofCandidates;}
	/// \brief Number of texts or substrings that matched
	unsigned long nofMatches() const	{return m_nofMatches;}

	/// \brief Add the counters of another context, e.g. of another thread
	WildcardMatchStatistics& operator += ( const WildcardMatchStatistics& o)
	{
		m_nofCalls += o.m_nofCalls;
		m_nofMemoHits += o.m_nofMemoHits;
		m_nofCandidates += o.m_nofCandidates;
		m_nofMatches += o.m_nofMatches;
		return *this;
	}

	/// \brief Print the counters one per line as "<name>: <value>"
	/// \param[in,out] out where to print to
	/// \param[in] indent prefix of every line
	void print( std::ostream& out, const char* indent="") const
	{
		out << indent << "nofCalls: " << m_nofCalls << std::endl;
		out << indent << "nofMemoHits: " << m_nofMemoHits << std::endl;
		out << indent << "nofCandidates: " << m_nofCandidates << std::endl;
		out << indent << "nofMatches: " << m_nofMatches << std::endl;
	}

private:
	unsigned long m_nofCalls;
	unsigned long m_nofMemoHits;
	unsigned long m_nofCandidates;
	unsigned long m_nofMatches;
};

} //namespace
#endif

