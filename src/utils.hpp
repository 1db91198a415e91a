/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Some string utility functions
/// \file "utils.hpp"
#ifndef _DOTSTAR_UTILS_HPP_INCLUDED
#define _DOTSTAR_UTILS_HPP_INCLUDED
#include <string>

namespace dotstar {
namespace utils {

bool caseInsensitiveEquals( const std::string& val1, const std::string& val2);

}}//namespace
#endif

