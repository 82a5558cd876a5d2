// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Scanner for RFC-822 type header information

   Catalog files are deb822 files: groups of "Field: value" lines
   separated by blank lines. A value continues on the following lines
   as long as they start with a space or a tab.

   pkgTagFile reads a file stanza by stanza, pkgTagSection indexes the
   fields of a single stanza for lookup.

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_TAGFILE_H
#define PKGCAT_TAGFILE_H

#include <pkgcat/macros.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

class FileFd;

/** \class pkgTagSection holds a single deb822 stanza
 *
 *  Field names are compared case-insensitively. If a field is given
 *  repeatedly it is counted multiple times, but only the last occurrence
 *  is found by the Find methods.
 */
class PKGCAT_PUBLIC pkgTagSection
{
   std::string Section;
   std::vector<std::pair<std::string, std::string>> Fields;

   public:
   /** \brief parse \b Text which contains exactly one stanza
    *
    *  \return \b false with an error on the stack for lines which are
    *  neither fields nor continuation lines
    */
   bool Scan(std::string_view Text);

   std::string_view Find(std::string_view Tag) const;
   std::string FindS(std::string_view Tag) const { return std::string{Find(Tag)}; }
   signed int FindI(std::string_view Tag,signed long Default = 0) const;
   bool FindB(std::string_view Tag, bool Default = false) const;
   bool Exists(std::string_view Tag) const;

   unsigned int Count() const { return Fields.size(); }
   void Get(std::string_view &Tag, std::string_view &Value, unsigned int I) const;
   std::string_view GetSection() const { return Section; }

   void Clear();
};

/** \class pkgTagFile steps over the stanzas of a deb822 file
 *
 *  With SUPPORT_COMMENTS lines starting with # are ignored.
 */
class PKGCAT_PUBLIC pkgTagFile
{
   FileFd * Fd;
   unsigned int Flags;
   unsigned long Line;
   unsigned long SectionLine;

   public:
   enum Flags
   {
      STRICT = 0,
      SUPPORT_COMMENTS = 1 << 0,
   };

   /** \brief read the next stanza into \b Section
    *
    *  \return \b false at the end of the file or on errors, the latter
    *  leave a message on the error stack
    */
   bool Step(pkgTagSection &Section);

   /** \brief line number the last stanza started at */
   unsigned long Offset() const { return SectionLine; }

   pkgTagFile(FileFd * const F, unsigned int const Flags = STRICT);
};

#endif
