// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/** \file catalogfilter.cc
   Selecting and ordering catalog packages by name patterns and tags */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <pkgcat/catalog.h>
#include <pkgcat/catalogfilter.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/strutl.h>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <fnmatch.h>

#include <pkgcati18n.h>
									/*}}}*/
namespace PkgCat {
namespace CatalogFilter {

// CheckBrackets - reject bracket expressions fnmatch would misread	/*{{{*/
// ---------------------------------------------------------------------
/* fnmatch(3) silently treats an unterminated [ as a literal and never
   matches a reversed range, both are user errors. */
static bool CheckBrackets(std::string const &Pattern, std::string const &Raw)
{
   for (size_t I = 0; I < Pattern.length(); ++I)
   {
      if (Pattern[I] == '\\' && I + 1 < Pattern.length())
      {
	 ++I;
	 continue;
      }
      if (Pattern[I] != '[')
	 continue;

      size_t J = I + 1;
      if (J < Pattern.length() && (Pattern[J] == '!' || Pattern[J] == '^'))
	 ++J;
      size_t const First = J;
      // a ] right after the opening bracket is a member, not the end
      if (J < Pattern.length() && Pattern[J] == ']')
	 ++J;
      for (; J < Pattern.length() && Pattern[J] != ']'; ++J)
      {
	 // a - as first or last member is literal, ranges compare raw bytes
	 if (Pattern[J] == '-' && J > First && J + 1 < Pattern.length() && Pattern[J + 1] != ']' &&
	     static_cast<unsigned char>(Pattern[J - 1]) > static_cast<unsigned char>(Pattern[J + 1]))
	    return _error->Error(_("Invalid range '%c-%c' in pattern '%s'"), Pattern[J - 1], Pattern[J + 1], Raw.c_str());
      }
      if (J >= Pattern.length())
	 return _error->Error(_("Unbalanced '[' in pattern '%s'"), Raw.c_str());
      I = J;
   }
   return true;
}
									/*}}}*/
// PatternMatcher							/*{{{*/
PatternMatcher::PatternMatcher(std::string const &Raw, std::string const &Glob) :
   Raw(Raw), Glob(Glob) {}
std::unique_ptr<PatternMatcher> PatternMatcher::Compile(std::string const &Raw)
{
   std::string Glob = Raw;
   if (Raw.find_first_of("*?") == std::string::npos)
      Glob = "*" + Raw + "*";
   if (CheckBrackets(Glob, Raw) == false)
      return nullptr;
   return std::unique_ptr<PatternMatcher>(new PatternMatcher(Raw, Glob));
}
bool PatternMatcher::Matches(std::string const &Candidate) const
{
   return fnmatch(Glob.c_str(), Candidate.c_str(), FNM_CASEFOLD) == 0;
}
									/*}}}*/
Matcher::~Matcher() {}
// Package matchers							/*{{{*/
PackageNameMatchesPattern::PackageNameMatchesPattern(std::shared_ptr<PatternMatcher const> Pattern) :
   Pattern(std::move(Pattern)) {}
bool PackageNameMatchesPattern::operator() (Package const &Pkg) {
   return Pattern->Matches(Pkg.Name);
}
PackageDescriptionMatchesPattern::PackageDescriptionMatchesPattern(std::shared_ptr<PatternMatcher const> Pattern) :
   Pattern(std::move(Pattern)) {}
bool PackageDescriptionMatchesPattern::operator() (Package const &Pkg) {
   if (Pkg.Description.empty() == true)
      return false;
   return Pattern->Matches(Pkg.Description);
}
									/*}}}*/
// ORMatcher								/*{{{*/
ORMatcher& ORMatcher::OR(std::unique_ptr<Matcher> matcher) {
   matchers.push_back(std::move(matcher));
   return *this;
}
bool ORMatcher::operator() (Package const &Pkg) {
   return std::any_of(matchers.begin(), matchers.end(), [&](std::unique_ptr<Matcher> const &M) {
      return (*M)(Pkg);
   });
}
									/*}}}*/
std::unique_ptr<ORMatcher> BuildMatcher(FilterSpec const &Spec)		/*{{{*/
{
   std::unique_ptr<ORMatcher> Any(new ORMatcher());
   for (auto const &P : Spec.Patterns)
   {
      std::shared_ptr<PatternMatcher const> const Pattern = PatternMatcher::Compile(P);
      if (Pattern == nullptr)
	 return nullptr;
      Any->OR(std::unique_ptr<Matcher>(new PackageNameMatchesPattern(Pattern)));
      if (Spec.SearchDescription == true)
	 Any->OR(std::unique_ptr<Matcher>(new PackageDescriptionMatchesPattern(Pattern)));
   }
   return Any;
}
									/*}}}*/
void SortNames(std::vector<std::string> &Names)				/*{{{*/
{
   std::sort(Names.begin(), Names.end(), [](std::string const &A, std::string const &B) {
      int const Res = stringcasecmp(A, B);
      if (Res != 0)
	 return Res < 0;
      return A < B;
   });
   Names.erase(std::unique(Names.begin(), Names.end()), Names.end());
}
									/*}}}*/
// Filter - apply patterns, then tags					/*{{{*/
bool Filter(Catalog const &Cat, std::set<std::string> const &AllNames,
	    FilterSpec const &Spec, std::vector<std::string> &Result)
{
   bool const Debug = _config->FindB("Debug::CatalogFilter", false);
   Result.clear();

   if (Spec.Patterns.empty() == true)
      Result.assign(AllNames.begin(), AllNames.end());
   else
   {
      std::unique_ptr<ORMatcher> const Any = BuildMatcher(Spec);
      if (Any == nullptr)
	 return false;
      for (auto const &Name : AllNames)
      {
	 Package Unknown;
	 Package const *Pkg = Cat.Find(Name);
	 if (Pkg == nullptr)
	 {
	    Unknown.Name = Name;
	    Pkg = &Unknown;
	 }
	 if ((*Any)(*Pkg) == true)
	    Result.push_back(Name);
      }
   }
   SortNames(Result);
   if (Debug == true)
      std::clog << "CatalogFilter: " << Result.size() << " of " << AllNames.size()
		<< " packages match " << Spec.Patterns.size() << " patterns" << std::endl;

   if (Spec.Tags.empty() == true)
      return true;

   std::set<std::string> const Tagged = Cat.PackagesWithTags(Spec.Tags);
   Result.erase(std::remove_if(Result.begin(), Result.end(), [&](std::string const &Name) {
      return Tagged.find(Name) == Tagged.end();
   }), Result.end());
   SortNames(Result);
   if (Debug == true)
      std::clog << "CatalogFilter: " << Result.size() << " packages left after filtering for "
		<< PkgCat::String::Join(Spec.Tags, ", ") << std::endl;
   return true;
}
bool Filter(Catalog const &Cat, FilterSpec const &Spec, std::vector<std::string> &Result)
{
   return Filter(Cat, Cat.AllNames(), Spec, Result);
}
									/*}}}*/
}
}
