/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Some string utility functions
/// \file "utils.cpp"
#include "utils.hpp"
#include <cctype>

using namespace dotstar;

bool utils::caseInsensitiveEquals( const std::string& val1, const std::string& val2)
{
	if (val1.size() != val2.size()) return false;
	std::string::const_iterator vi = val1.begin(), ve = val1.end(), oi = val2.begin();
	for (; vi != ve; ++vi,++oi)
	{
		if (std::tolower( (unsigned char)*vi) != std::tolower( (unsigned char)*oi)) return false;
	}
	return true;
}

