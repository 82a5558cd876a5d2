// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Version - Ordering of the version strings of catalog packages

   A version is split into numeric and alphabetic components, everything
   else only separates components:
      1.10.2-rc1
   has the components 1, 10, 2, 'rc', 1. Components are compared
   pairwise, numbers numerically and words lexically, with a number
   always newer than a word. If one version is a prefix of the other
   the longer one is newer. The version "develop" is newer than any
   other version.

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_VERSION_H
#define PKGCAT_VERSION_H

#include <pkgcat/macros.h>

#include <string>
#include <string_view>
#include <vector>

namespace PkgCat {

/** \brief compare two version strings
 *
 *  \return a value less than, equal to or greater than zero if \b A is
 *  older than, the same as or newer than \b B
 */
PKGCAT_PUBLIC int CompareVersions(std::string_view A, std::string_view B) PKGCAT_PURE;

/** \brief strict weak ordering suitable for std::sort, oldest first */
struct PKGCAT_PUBLIC VersionLess
{
   bool operator()(std::string const &A, std::string const &B) const
   {
      return CompareVersions(A, B) < 0;
   }
};

/** \brief the given versions ordered newest first */
PKGCAT_PUBLIC std::vector<std::string> SortVersionsDescending(std::vector<std::string> Versions);

}

#endif
