// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   String Util - Small string helpers used all over the place

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_STRUTL_H
#define PKGCAT_STRUTL_H

#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <pkgcat/macros.h>

namespace PkgCat {
   namespace String {
      PKGCAT_PUBLIC std::string Strip(const std::string &s);
      PKGCAT_PUBLIC bool Startswith(const std::string &s, const std::string &starting);
      PKGCAT_PUBLIC std::string Join(std::vector<std::string> const &list, const std::string &sep);
   }
}

PKGCAT_PUBLIC bool ParseQuoteWord(const char *&String,std::string &Res);
PKGCAT_PUBLIC bool ParseCWord(const char *&String,std::string &Res);
PKGCAT_PUBLIC std::string QuoteString(const std::string &Str,const char *Bad);
PKGCAT_PUBLIC std::string SubstVar(const std::string &Str,const std::string &Subst,const std::string &Contents);

/** \brief escape the characters with a meaning in HTML text and attributes
 *
 *  &, < and > are always replaced, the double quote only if \b Quote is set.
 */
PKGCAT_PUBLIC std::string HtmlEscape(std::string const &Text, bool const Quote = false);

/** \brief percent-encode the characters which are not allowed in a URI
 *
 *  Unlike QuoteString existing %XX sequences are kept as they are.
 */
PKGCAT_PUBLIC std::string QuoteURI(std::string const &URI);

/** \brief reflow text into lines of at most \b Width characters
 *
 *  Runs of whitespace are collapsed, each output line is prefixed with
 *  \b Indent spaces and terminated by a newline. Lines may also break
 *  after a hyphen joining two words like "well-known". Words longer than
 *  \b Width are split, after a hyphen if one fits. A \b Width of 0
 *  gives a single line. Empty input gives an empty string.
 */
PKGCAT_PUBLIC std::string WrapText(std::string const &Text, size_t const Width, size_t const Indent);

PKGCAT_PUBLIC int StringToBool(const std::string &Text,int Default = -1);

PKGCAT_PUBLIC void ioprintf(std::ostream &out,const char *format,...) PKGCAT_PRINTF(2);

PKGCAT_PUBLIC std::vector<std::string> VectorizeString(std::string const &haystack, char const &split) PKGCAT_PURE;

PKGCAT_PUBLIC int stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd) PKGCAT_PURE;
inline int stringcasecmp(std::string const &A,const char *B,const char *BEnd) {return stringcasecmp(A.data(),A.data()+A.length(),B,BEnd);};
inline int stringcasecmp(std::string const &A,std::string const &B) {return stringcasecmp(A.data(),A.data()+A.length(),B.data(),B.data()+B.length());};
inline int stringcasecmp(const char *A,const char *B) {return stringcasecmp(A,A+strlen(A),B,B+strlen(B));};

PKGCAT_PURE static inline int tolower_ascii(int const c)
{
   return (c >= 'A' && c <= 'Z') ? c + 32 : c;
}
PKGCAT_PURE static inline int isspace_ascii(int const c)
{
   // 9='\t',10='\n',11='\v',12='\f',13='\r',32=' '
   return (c >= 9 && c <= 13) || c == ' ';
}

#endif
