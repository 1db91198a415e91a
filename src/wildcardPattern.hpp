/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Wildcard pattern compiled into a sequence of atoms
/// \file "wildcardPattern.hpp"
#ifndef _DOTSTAR_WILDCARD_PATTERN_HPP_INCLUDED
#define _DOTSTAR_WILDCARD_PATTERN_HPP_INCLUDED
#include "strus/base/stdint.h"
#include <string>
#include <vector>
#include <cstddef>

namespace dotstar {

/// \brief One element of a compiled pattern
struct PatternAtom
{
	enum Type
	{
		Literal,		///< matches exactly the character chr
		Wildcard,		///< matches any single character
		StarredLiteral,		///< matches zero or more occurrencies of the character chr
		StarredWildcard		///< matches any sequence of characters
	};
	static const char* typeName( Type type_)
	{
		static const char* ar[] = {"Literal","Wildcard","StarredLiteral","StarredWildcard"};
		return ar[ type_];
	}

	Type type;
	uint32_t chr;			///< character of a literal, 0 for a wildcard
	uint32_t origpos;		///< byte position of the atom in the pattern source
	uint32_t origsize;		///< byte size of the atom character in the pattern source

	PatternAtom( Type type_, uint32_t chr_, uint32_t origpos_, uint32_t origsize_)
		:type(type_),chr(chr_),origpos(origpos_),origsize(origsize_){}
	PatternAtom( const PatternAtom& o)
		:type(o.type),chr(o.chr),origpos(o.origpos),origsize(o.origsize){}

	bool starred() const
	{
		return type == StarredLiteral || type == StarredWildcard;
	}
	bool accepts( uint32_t ch) const
	{
		switch (type)
		{
			case Literal:
			case StarredLiteral:
				return ch == chr;
			case Wildcard:
			case StarredWildcard:
				return true;
		}
		return false;
	}
};

/// \brief Pattern compiled from a string with literals, '.' and '*'
class WildcardPattern
{
public:
	/// \brief How a star without preceding character to repeat is handled
	enum StrayStarPolicy
	{
		StrayStarLiteral,	///< the star is a literal character (that can be repeated by a following star)
		StrayStarReject		///< the pattern is rejected with an InvalidPatternError
	};

	WildcardPattern( const std::string& expression_, StrayStarPolicy policy_);
	WildcardPattern( const WildcardPattern& o)
		:m_expression(o.m_expression),m_atomar(o.m_atomar),m_minlength(o.m_minlength),m_hasStar(o.m_hasStar){}

	const std::string& expression() const			{return m_expression;}
	const std::vector<PatternAtom>& atoms() const		{return m_atomar;}
	/// \brief Number of characters a matching text has at least
	std::size_t minLength() const				{return m_minlength;}
	/// \brief True if the pattern contains a starred atom, false if the matching texts have a fixed length
	bool hasStar() const					{return m_hasStar;}

	/// \brief Readable representation of the atoms
	std::string tostring() const;

private:
	std::string m_expression;
	std::vector<PatternAtom> m_atomar;
	std::size_t m_minlength;
	bool m_hasStar;
};

}//namespace
#endif

