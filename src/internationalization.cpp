/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Functions for the localization of messages with gettext
/// \file "internationalization.cpp"
#include "internationalization.hpp"

void dotstar::initMessageTextDomain()
{
	bindtextdomain( DOTSTAR_GETTEXT_PACKAGE, DOTSTAR_GETTEXT_LOCALEDIR);
	bind_textdomain_codeset( DOTSTAR_GETTEXT_PACKAGE, "UTF-8");
}

