/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exception thrown for a pattern that cannot be compiled
/// \file "invalidPatternError.hpp"
#ifndef _DOTSTAR_INVALID_PATTERN_ERROR_HPP_INCLUDED
#define _DOTSTAR_INVALID_PATTERN_ERROR_HPP_INCLUDED
#include <stdexcept>
#include <string>
#include <cstddef>

namespace dotstar {

/// \brief Exception for a malformed wildcard pattern
/// \note Only thrown if the option "STRICT" is set, for a star '*' without preceding character
class InvalidPatternError
	:public std::runtime_error
{
public:
	/// \brief Constructor
	/// \param[in] msg error message
	/// \param[in] position_ character position of the error in the pattern
	InvalidPatternError( const std::string& msg, std::size_t position_)
		:std::runtime_error(msg),m_position(position_){}

	/// \brief Character position of the error in the pattern (counting unicode characters from 0)
	std::size_t position() const	{return m_position;}

private:
	std::size_t m_position;
};

} //namespace
#endif

