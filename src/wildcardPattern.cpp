/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Wildcard pattern compiled into a sequence of atoms
/// \file "wildcardPattern.cpp"
#include "wildcardPattern.hpp"
#include "unicodeUtils.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include <limits>
#include <sstream>

using namespace dotstar;

enum {WildcardChar='.', StarChar='*'};

WildcardPattern::WildcardPattern( const std::string& expression_, StrayStarPolicy policy_)
	:m_expression(expression_),m_atomar(),m_minlength(0),m_hasStar(false)
{
	if (m_expression.size() >= (std::size_t)std::numeric_limits<uint32_t>::max())
	{
		throw dotstar::runtime_error( _TXT("size of pattern out of range"));
	}
	UnicodeCharString chrs( m_expression.c_str(), m_expression.size());
	std::size_t ci = 0, ce = chrs.size();
	while (ci < ce)
	{
		uint32_t ch = chrs[ ci];
		if (ch == StarChar && policy_ == StrayStarReject)
		{
			if (ci == 0)
			{
				throw dotstar::invalid_pattern_error( ci, _TXT("star '*' at start of pattern has no preceding character to repeat"));
			}
			else
			{
				throw dotstar::invalid_pattern_error( ci, _TXT("star '*' at position %u follows another star and has no character to repeat"), (unsigned int)ci);
			}
		}
		uint32_t origpos = chrs.origpos( ci);
		uint32_t origsize = chrs.origpos( ci+1) - origpos;
		bool starred = (ci+1 < ce && chrs[ ci+1] == StarChar);
		PatternAtom::Type type;
		if (ch == WildcardChar)
		{
			type = starred ? PatternAtom::StarredWildcard : PatternAtom::Wildcard;
			ch = 0;
		}
		else
		{
			type = starred ? PatternAtom::StarredLiteral : PatternAtom::Literal;
		}
		m_atomar.push_back( PatternAtom( type, ch, origpos, origsize));
		if (starred)
		{
			m_hasStar = true;
			ci += 2;
		}
		else
		{
			++m_minlength;
			ci += 1;
		}
	}
}

std::string WildcardPattern::tostring() const
{
	std::ostringstream out;
	std::vector<PatternAtom>::const_iterator ai = m_atomar.begin(), ae = m_atomar.end();
	for (int aidx=0; ai != ae; ++ai,++aidx)
	{
		if (aidx) out << " ";
		out << PatternAtom::typeName( ai->type);
		if (ai->type == PatternAtom::Literal || ai->type == PatternAtom::StarredLiteral)
		{
			out << " '" << std::string( m_expression.c_str() + ai->origpos, ai->origsize) << "'";
		}
	}
	return out.str();
}

