/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Helpers for building exceptions and mapping them to the error buffer
/// \file "errorUtils.hpp"
#ifndef _DOTSTAR_ERROR_UTILS_HPP_INCLUDED
#define _DOTSTAR_ERROR_UTILS_HPP_INCLUDED
#include "dotstar/invalidPatternError.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/errorCodes.hpp"
#include "internationalization.hpp"
#include <stdexcept>
#include <new>

namespace dotstar {

/// \brief Create a runtime error exception with a printf style formatted message
std::runtime_error runtime_error( const char* format, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 1, 2)))
#endif
	;

/// \brief Create an invalid pattern exception with a printf style formatted message
InvalidPatternError invalid_pattern_error( std::size_t position, const char* format, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 2, 3)))
#endif
	;

}//namespace

#define CATCH_ERROR_MAP( contextExplainText, errorBuffer)\
	catch (const dotstar::InvalidPatternError& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeSyntax, contextExplainText, err.what());\
	}\
	catch (const std::bad_alloc&)\
	{\
		(errorBuffer).report( strus::ErrorCodeOutOfMem, _TXT("memory allocation error"));\
	}\
	catch (const std::runtime_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeRuntimeError, contextExplainText, err.what());\
	}

#define CATCH_ERROR_MAP_RETURN( contextExplainText, errorBuffer, errorReturnValue)\
	catch (const dotstar::InvalidPatternError& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeSyntax, contextExplainText, err.what());\
		return errorReturnValue;\
	}\
	catch (const std::bad_alloc&)\
	{\
		(errorBuffer).report( strus::ErrorCodeOutOfMem, _TXT("memory allocation error"));\
		return errorReturnValue;\
	}\
	catch (const std::runtime_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeRuntimeError, contextExplainText, err.what());\
		return errorReturnValue;\
	}

#endif

