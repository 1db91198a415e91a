/*
 * Copyright (c) 2017 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Decoding of UTF-8 strings into arrays of unicode characters with their original byte positions
#include "unicodeUtils.hpp"
#include "textwolf/charset.hpp"
#include "textwolf/sourceiterator.hpp"
#include "textwolf/textscanner.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include <cstring>

using namespace dotstar;

void UnicodeCharString::decodeSegment( const char* src, std::size_t segpos, std::size_t segsize)
{
	typedef textwolf::TextScanner<textwolf::SrcIterator,textwolf::charset::UTF8> TextScanner;
	textwolf::charset::UTF8 utf8;
	textwolf::SrcIterator srcitr( src + segpos, segsize, 0);
	TextScanner itr( utf8, srcitr);
	std::size_t pos = 0;

	// A decoded value 0 (e.g. from an overlong sequence) or an invalid character is a character like any other:
	while (pos < segsize)
	{
		textwolf::UChar ch = *itr;
		++itr;
		std::size_t nextpos = itr.getPosition();
		if (nextpos <= pos)
		{
			throw dotstar::runtime_error( _TXT("failed to decode UTF-8 character at byte position %u"), (unsigned int)(segpos + pos));
		}
		if (nextpos > segsize)
		{
			// truncated multibyte character at the end of the segment
			nextpos = segsize;
		}
		m_chrar.push_back( ch);
		m_posar.push_back( segpos + nextpos);
		pos = nextpos;
	}
}

void UnicodeCharString::init( const char* src, std::size_t srcsize)
{
	m_chrar.clear();
	m_posar.clear();
	m_chrar.reserve( srcsize);
	m_posar.reserve( srcsize+1);

	m_posar.push_back( 0);
	std::size_t segpos = 0;
	while (segpos < srcsize)
	{
		// textwolf stops at a null character, so null bytes are handled here:
		const char* eos = (const char*)std::memchr( src + segpos, '\0', srcsize - segpos);
		std::size_t segsize = eos ? (std::size_t)(eos - (src + segpos)) : (srcsize - segpos);
		if (segsize)
		{
			decodeSegment( src, segpos, segsize);
		}
		segpos += segsize;
		if (eos)
		{
			m_chrar.push_back( 0);
			m_posar.push_back( ++segpos);
		}
	}
	// origpos( size()) has to be the end of the source even if the last character is truncated:
	m_posar.back() = srcsize;
}

