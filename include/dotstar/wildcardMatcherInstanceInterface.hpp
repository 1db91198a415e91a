/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Interface of a compiled wildcard pattern
/// \file "wildcardMatcherInstanceInterface.hpp"
#ifndef _DOTSTAR_WILDCARD_MATCHER_INSTANCE_INTERFACE_HPP_INCLUDED
#define _DOTSTAR_WILDCARD_MATCHER_INSTANCE_INTERFACE_HPP_INCLUDED
#include <string>

namespace dotstar
{

/// \brief Forward declaration
class WildcardMatcherContextInterface;

/// \brief Interface of a compiled wildcard pattern
/// \note The instance is immutable and can be shared between threads, each thread creating its own context
class WildcardMatcherInstanceInterface
{
public:
	/// \brief Destructor
	virtual ~WildcardMatcherInstanceInterface(){}

	/// \brief Get the source of the compiled pattern
	/// \return the pattern string
	virtual const std::string& pattern() const=0;

	/// \brief Get a readable representation of the compiled pattern as list of atoms
	/// \return the pattern atoms as string or an empty string in case of an error (error reported in error buffer)
	virtual std::string tostring() const=0;

	/// \brief Create the context to match texts with this pattern
	/// \return the matcher context or NULL in case of an error (error reported in error buffer)
	virtual WildcardMatcherContextInterface* createContext() const=0;
};

} //namespace
#endif

