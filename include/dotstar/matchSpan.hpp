/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Structure describing a substring of a text matching a wildcard pattern
/// \file "matchSpan.hpp"
#ifndef _DOTSTAR_MATCH_SPAN_HPP_INCLUDED
#define _DOTSTAR_MATCH_SPAN_HPP_INCLUDED
#include <string>
#include <cstddef>

namespace dotstar {

/// \brief Structure describing a matching substring as half open interval [start,end) of character positions
/// \note Character positions count unicode characters, not bytes
class MatchSpan
{
public:
	/// \brief Default constructor
	MatchSpan()
		:m_start(0),m_end(0),m_origpos(0),m_origsize(0),m_value(){}
	/// \brief Constructor
	MatchSpan( std::size_t start_, std::size_t end_, std::size_t origpos_, std::size_t origsize_, const std::string& value_)
		:m_start(start_),m_end(end_),m_origpos(origpos_),m_origsize(origsize_),m_value(value_){}
	/// \brief Copy constructor
	MatchSpan( const MatchSpan& o)
		:m_start(o.m_start),m_end(o.m_end),m_origpos(o.m_origpos),m_origsize(o.m_origsize),m_value(o.m_value){}
	/// \brief Destructor
	~MatchSpan(){}

	/// \brief Character position of the first character of the match
	std::size_t start() const			{return m_start;}
	/// \brief Character position after the last character of the match
	std::size_t end() const				{return m_end;}
	/// \brief Original byte position of the match in the source as UTF-8
	std::size_t origpos() const			{return m_origpos;}
	/// \brief Original byte size of the match in the source as UTF-8
	std::size_t origsize() const			{return m_origsize;}
	/// \brief The matching substring
	const std::string& value() const		{return m_value;}

	bool operator==( const MatchSpan& o) const
	{
		return m_start == o.m_start && m_end == o.m_end
			&& m_origpos == o.m_origpos && m_origsize == o.m_origsize
			&& m_value == o.m_value;
	}
	bool operator!=( const MatchSpan& o) const
	{
		return !operator==( o);
	}

private:
	std::size_t m_start;
	std::size_t m_end;
	std::size_t m_origpos;
	std::size_t m_origsize;
	std::string m_value;
};

} //namespace
#endif

