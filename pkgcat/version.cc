// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Version - Ordering of the version strings of catalog packages

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <pkgcat/version.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

									/*}}}*/

namespace PkgCat {

static bool isalpha_ascii(char const c)					/*{{{*/
{
   return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}
static bool isdigit_ascii(char const c)
{
   return c >= '0' && c <= '9';
}
									/*}}}*/
// NextComponent - advance to and return the next component		/*{{{*/
// ---------------------------------------------------------------------
/* Skips separators and returns the following run of digits or letters,
   an empty view marks the end of the version. */
static std::string_view NextComponent(std::string_view &V)
{
   while (V.empty() == false && isdigit_ascii(V.front()) == false && isalpha_ascii(V.front()) == false)
      V.remove_prefix(1);
   if (V.empty() == true)
      return V;
   bool const numeric = isdigit_ascii(V.front());
   size_t len = 1;
   for (; len < V.length(); ++len)
      if ((numeric ? isdigit_ascii(V[len]) : isalpha_ascii(V[len])) == false)
	 break;
   std::string_view const Component = V.substr(0, len);
   V.remove_prefix(len);
   return Component;
}
									/*}}}*/
// CmpNumber - compare two runs of digits of arbitrary length		/*{{{*/
static int CmpNumber(std::string_view A, std::string_view B)
{
   while (A.length() > 1 && A.front() == '0')
      A.remove_prefix(1);
   while (B.length() > 1 && B.front() == '0')
      B.remove_prefix(1);
   if (A.length() != B.length())
      return A.length() < B.length() ? -1 : 1;
   return A.compare(B);
}
									/*}}}*/
int CompareVersions(std::string_view A, std::string_view B)		/*{{{*/
{
   if (A == B)
      return 0;
   if (A == "develop")
      return 1;
   if (B == "develop")
      return -1;

   std::string_view lhs = A;
   std::string_view rhs = B;
   while (true)
   {
      std::string_view const a = NextComponent(lhs);
      std::string_view const b = NextComponent(rhs);
      if (a.empty() == true || b.empty() == true)
      {
	 if (a.empty() == false)
	    return 1;
	 if (b.empty() == false)
	    return -1;
	 break;
      }

      bool const anum = isdigit_ascii(a.front());
      bool const bnum = isdigit_ascii(b.front());
      int res;
      if (anum != bnum)
	 res = anum ? 1 : -1;
      else if (anum == true)
	 res = CmpNumber(a, b);
      else
	 res = a.compare(b);
      if (res != 0)
	 return res < 0 ? -1 : 1;
   }

   // same components, e.g. 1.0 and 1-0: keep the ordering total
   int const res = A.compare(B);
   return res < 0 ? -1 : (res > 0 ? 1 : 0);
}
									/*}}}*/
std::vector<std::string> SortVersionsDescending(std::vector<std::string> Versions)/*{{{*/
{
   std::stable_sort(Versions.begin(), Versions.end(), [](std::string const &A, std::string const &B) {
      return CompareVersions(A, B) > 0;
   });
   return Versions;
}
									/*}}}*/
}
