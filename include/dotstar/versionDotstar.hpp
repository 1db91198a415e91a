/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Version of the dotstar wildcard matching library
/// \file versionDotstar.hpp
#ifndef _DOTSTAR_VERSION_HPP_INCLUDED
#define _DOTSTAR_VERSION_HPP_INCLUDED

/// \brief dotstar toplevel namespace
namespace dotstar
{

/// \brief Version number of dotstar
#define DOTSTAR_VERSION (\
	0 * 1000000\
	+ 1 * 10000\
	+ 0\
)

/// \brief Major version number of dotstar
#define DOTSTAR_VERSION_MAJOR 0
/// \brief Minor version number of dotstar
#define DOTSTAR_VERSION_MINOR 1

/// \brief The version of the dotstar library
#define DOTSTAR_VERSION_STRING "0.1.0"

}//namespace
#endif

