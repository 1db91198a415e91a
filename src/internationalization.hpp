/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Macros and functions for the localization of messages with gettext
/// \file "internationalization.hpp"
#ifndef _DOTSTAR_INTERNATIONALIZATION_HPP_INCLUDED
#define _DOTSTAR_INTERNATIONALIZATION_HPP_INCLUDED
#include <libintl.h>

#define DOTSTAR_GETTEXT_PACKAGE "dotstar"
#ifndef DOTSTAR_GETTEXT_LOCALEDIR
#define DOTSTAR_GETTEXT_LOCALEDIR "/usr/local/share/locale"
#endif

#define _TXT(STRING) dgettext( DOTSTAR_GETTEXT_PACKAGE, STRING)

namespace dotstar {

/// \brief Bind the message domain of this library, has to be called once before the first message is translated
void initMessageTextDomain();

}//namespace
#endif

