/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Helpers for building exceptions
/// \file "errorUtils.cpp"
#include "errorUtils.hpp"
#include <cstdarg>
#include <cstdio>

using namespace dotstar;

static std::string formatMessage( const char* format, va_list args)
{
	char buf[ 1024];
	int len = std::vsnprintf( buf, sizeof(buf), format, args);
	if (len < 0)
	{
		return std::string( format);
	}
	if ((std::size_t)len >= sizeof(buf))
	{
		len = sizeof(buf)-1;
	}
	return std::string( buf, len);
}

std::runtime_error dotstar::runtime_error( const char* format, ...)
{
	va_list ap;
	va_start( ap, format);
	std::string msg = formatMessage( format, ap);
	va_end( ap);
	return std::runtime_error( msg);
}

InvalidPatternError dotstar::invalid_pattern_error( std::size_t position, const char* format, ...)
{
	va_list ap;
	va_start( ap, format);
	std::string msg = formatMessage( format, ap);
	va_end( ap);
	return InvalidPatternError( msg, position);
}

