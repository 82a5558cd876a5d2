// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/** \file catalogfilter.h
   Selecting and ordering catalog packages by name patterns and tags */
									/*}}}*/
#ifndef PKGCAT_CATALOGFILTER_H
#define PKGCAT_CATALOGFILTER_H
// Include Files							/*{{{*/
#include <pkgcat/catalog.h>
#include <pkgcat/macros.h>

#include <memory>
#include <set>
#include <string>
#include <vector>
									/*}}}*/
namespace PkgCat {
namespace CatalogFilter {

/** \class PatternMatcher
   \brief case-insensitive shell glob

   A pattern without * and ? matches anywhere in the candidate, so "ba"
   behaves like "*ba*". Other patterns have to match the whole candidate
   with the usual fnmatch(3) meaning of *, ? and [...]. */
class PKGCAT_PUBLIC PatternMatcher {
   std::string Raw;
   std::string Glob;

   explicit PatternMatcher(std::string const &Raw, std::string const &Glob);
public:
   /** \brief compile \b Raw into a matcher
    *
    *  \return \b nullptr with an error on the stack for malformed
    *  bracket expressions
    */
   static std::unique_ptr<PatternMatcher> Compile(std::string const &Raw);

   bool Matches(std::string const &Candidate) const;
   std::string const &Pattern() const { return Raw; }
   std::string const &Expanded() const { return Glob; }
};

class PKGCAT_PUBLIC Matcher {
public:
   virtual bool operator() (Package const &Pkg) = 0;
   virtual ~Matcher();
};

class PKGCAT_PUBLIC PackageNameMatchesPattern : public Matcher {	/*{{{*/
   std::shared_ptr<PatternMatcher const> const Pattern;
public:
   explicit PackageNameMatchesPattern(std::shared_ptr<PatternMatcher const> Pattern);
   bool operator() (Package const &Pkg) PKGCAT_OVERRIDE;
};
									/*}}}*/
class PKGCAT_PUBLIC PackageDescriptionMatchesPattern : public Matcher {	/*{{{*/
   std::shared_ptr<PatternMatcher const> const Pattern;
public:
   explicit PackageDescriptionMatchesPattern(std::shared_ptr<PatternMatcher const> Pattern);
   bool operator() (Package const &Pkg) PKGCAT_OVERRIDE;
};
									/*}}}*/
class PKGCAT_PUBLIC ORMatcher : public Matcher {			/*{{{*/
   std::vector<std::unique_ptr<Matcher>> matchers;
public:
   ORMatcher& OR(std::unique_ptr<Matcher> matcher);
   bool empty() const { return matchers.empty(); }
   bool operator() (Package const &Pkg) PKGCAT_OVERRIDE;
};
									/*}}}*/

/** \brief what the user asked for */
struct PKGCAT_PUBLIC FilterSpec {
   /** an empty list selects everything */
   std::vector<std::string> Patterns;
   /** patterns are matched against the descriptions, too */
   bool SearchDescription = false;
   /** an empty list disables tag filtering, otherwise any tag qualifies */
   std::vector<std::string> Tags;
};

/** \brief build the matcher for all patterns of \b Spec
 *
 *  \return \b nullptr if a pattern could not be compiled
 */
PKGCAT_PUBLIC std::unique_ptr<ORMatcher> BuildMatcher(FilterSpec const &Spec);

/** \brief sort names case-insensitively, equal names by byte value */
PKGCAT_PUBLIC void SortNames(std::vector<std::string> &Names);

/** \brief select the packages of \b AllNames matching \b Spec
 *
 *  Descriptions and tags are taken from \b Cat. The result is sorted
 *  by SortNames and free of duplicates.
 *
 *  \return \b false if a pattern was rejected
 */
PKGCAT_PUBLIC bool Filter(Catalog const &Cat, std::set<std::string> const &AllNames,
			  FilterSpec const &Spec, std::vector<std::string> &Result);
/** \brief Filter over all packages of \b Cat */
PKGCAT_PUBLIC bool Filter(Catalog const &Cat, FilterSpec const &Spec, std::vector<std::string> &Result);

}
}
#endif
