// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the catalog library

   pkgInitConfig has to be called to set up the configuration before
   most other functions of the library are used.

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_INIT_H
#define PKGCAT_INIT_H

#include <pkgcat/macros.h>

class Configuration;

PKGCAT_PUBLIC extern const char *pkgcatVersion;
PKGCAT_PUBLIC extern const char *pkgcatLibVersion;

PKGCAT_PUBLIC bool pkgInitConfig(Configuration &Cnf);

#endif
