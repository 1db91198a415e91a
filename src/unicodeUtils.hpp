/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Decoding of UTF-8 strings into arrays of unicode characters with their original byte positions
/// \file "unicodeUtils.hpp"
#ifndef _DOTSTAR_UNICODE_UTILS_HPP_INCLUDED
#define _DOTSTAR_UNICODE_UTILS_HPP_INCLUDED
#include "strus/base/stdint.h"
#include <string>
#include <vector>
#include <cstddef>

namespace dotstar {

/// \brief Unicode character string decoded from UTF-8 with the byte position of every character in the source
class UnicodeCharString
{
public:
	UnicodeCharString()
		:m_chrar(),m_posar(){}
	UnicodeCharString( const char* src, std::size_t srcsize)
		:m_chrar(),m_posar()
	{
		init( src, srcsize);
	}

	/// \brief Decode a UTF-8 source, a null byte in the source is a character like any other
	void init( const char* src, std::size_t srcsize);

	/// \brief Number of characters
	std::size_t size() const				{return m_chrar.size();}
	/// \brief Pointer to the character array
	const uint32_t* chars() const				{return m_chrar.empty() ? 0 : &m_chrar[0];}
	uint32_t operator[]( std::size_t chidx) const		{return m_chrar[ chidx];}
	/// \brief Byte position of a character in the source, origpos(size()) is the size of the source
	std::size_t origpos( std::size_t chidx) const		{return m_posar[ chidx];}

private:
	void decodeSegment( const char* src, std::size_t segpos, std::size_t segsize);

private:
	std::vector<uint32_t> m_chrar;
	std::vector<std::size_t> m_posar;
};

}//namespace
#endif

