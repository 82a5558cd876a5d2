// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Catalog - In-memory store of the packages a report is built from

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <pkgcat/catalog.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/fileutl.h>
#include <pkgcat/strutl.h>
#include <pkgcat/tagfile.h>
#include <pkgcat/version.h>

#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <pkgcati18n.h>
									/*}}}*/

namespace PkgCat {

char const *DepTypeName(DepType const Type)				/*{{{*/
{
   switch (Type)
   {
      case DepType::Build: return "build";
      case DepType::Link: return "link";
      case DepType::Run: return "run";
      case DepType::Test: return "test";
   }
   return "";
}
char const *DepTypeTitle(DepType const Type)
{
   switch (Type)
   {
      case DepType::Build: return "Build";
      case DepType::Link: return "Link";
      case DepType::Run: return "Run";
      case DepType::Test: return "Test";
   }
   return "";
}
									/*}}}*/
std::set<std::string> Package::DependenciesOfType(DepType const Type) const/*{{{*/
{
   auto const D = Dependencies.find(Type);
   if (D == Dependencies.end())
      return {};
   return D->second;
}
									/*}}}*/
std::vector<std::string> Package::SortedVersions() const		/*{{{*/
{
   return SortVersionsDescending(Versions);
}
									/*}}}*/

void Catalog::Insert(Package Pkg)					/*{{{*/
{
   auto const Old = Packages.find(Pkg.Name);
   if (Old != Packages.end())
   {
      _error->Warning(_("Package %s is listed more than once, using the last entry"), Pkg.Name.c_str());
      for (auto const &T : Old->second.Tags)
	 TagIndex[T].erase(Pkg.Name);
   }
   for (auto const &T : Pkg.Tags)
      TagIndex[T].insert(Pkg.Name);
   std::string const Name = Pkg.Name;
   Packages[Name] = std::move(Pkg);
}
									/*}}}*/
std::set<std::string> Catalog::AllNames() const				/*{{{*/
{
   std::set<std::string> Names;
   for (auto const &P : Packages)
      Names.insert(P.first);
   return Names;
}
									/*}}}*/
Package const *Catalog::Find(std::string const &Name) const		/*{{{*/
{
   auto const P = Packages.find(Name);
   if (P == Packages.end())
      return nullptr;
   return &P->second;
}
Package const *Catalog::Lookup(std::string const &Name) const
{
   Package const * const P = Find(Name);
   if (P == nullptr)
      _error->Error(_("Unable to locate package %s"), Name.c_str());
   return P;
}
									/*}}}*/
std::set<std::string> Catalog::PackagesWithTags(std::vector<std::string> const &Tags) const/*{{{*/
{
   std::set<std::string> Names;
   for (auto const &T : Tags)
   {
      auto const I = TagIndex.find(T);
      if (I != TagIndex.end())
	 Names.insert(I->second.begin(), I->second.end());
   }
   return Names;
}
									/*}}}*/

// SplitList - split a field value at commas and whitespace		/*{{{*/
static std::vector<std::string> SplitList(std::string_view const Value)
{
   std::vector<std::string> List;
   std::string Word;
   for (char const C : Value)
   {
      if (C == ',' || isspace_ascii(C) != 0)
      {
	 if (Word.empty() == false)
	    List.push_back(std::move(Word));
	 Word.clear();
      }
      else
	 Word.push_back(C);
   }
   if (Word.empty() == false)
      List.push_back(std::move(Word));
   return List;
}
									/*}}}*/
// ParseDescription - undo the deb822 folding of a description		/*{{{*/
// ---------------------------------------------------------------------
/* Continuation lines lose their leading space, a line consisting of a
   single dot is an empty line. */
static std::string ParseDescription(std::string_view const Value)
{
   std::string Text;
   bool First = true;
   for (auto const &Line : VectorizeString(std::string(Value), '\n'))
   {
      std::string L = First ? Line : Line.substr(1);
      if (First == false)
      {
	 Text.push_back('\n');
	 if (L == ".")
	    L.clear();
      }
      Text.append(L);
      First = false;
   }
   return Text;
}
									/*}}}*/
// ReadCatalog - read a catalog file					/*{{{*/
bool ReadCatalog(Catalog &Cat, std::string const &FileName)
{
   bool const Debug = _config->FindB("Debug::Catalog", false);
   FileFd Fd;
   if (Fd.Open(FileName, FileFd::ReadOnly, FileFd::Extension) == false)
      return false;

   _error->PushToStack();
   pkgTagFile Tags(&Fd, pkgTagFile::SUPPORT_COMMENTS);
   pkgTagSection Section;
   unsigned long Stanza = 0;
   while (Tags.Step(Section) == true)
   {
      ++Stanza;
      Package Pkg;
      Pkg.Name = Section.FindS("Package");
      if (Pkg.Name.empty() == true)
      {
	 _error->Error(_("Catalog %s stanza %lu has no Package field"), FileName.c_str(), Stanza);
	 break;
      }
      Pkg.Homepage = Section.FindS("Homepage");
      Pkg.Description = ParseDescription(Section.Find("Description"));
      Pkg.Versions = SplitList(Section.Find("Version"));
      for (auto const Type : AllDepTypes)
      {
	 std::string const Field = std::string(DepTypeTitle(Type)) + "-Depends";
	 for (auto &D : SplitList(Section.Find(Field)))
	    Pkg.Dependencies[Type].insert(std::move(D));
      }
      for (auto &T : SplitList(Section.Find("Tags")))
	 Pkg.Tags.insert(std::move(T));

      if (Debug == true)
	 std::clog << "Catalog " << FileName << ": " << Pkg.Name << " with "
		   << Pkg.Versions.size() << " versions at line " << Tags.Offset() << std::endl;
      Cat.Insert(std::move(Pkg));
   }
   bool const Failed = _error->PendingError();
   _error->MergeWithStack();
   if (Failed == true)
      return _error->Error(_("Problem reading the catalog %s"), FileName.c_str());
   return true;
}
									/*}}}*/
}
