// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Catalog - In-memory store of the packages a report is built from

   Packages are read from deb822 catalog files, one stanza per package:

     Package: r-stringi
     Homepage: http://www.gagolewski.com/software/stringi/
     Version: 1.1.5, 1.1.3
     Build-Depends: icu4c
     Run-Depends: r
     Tags: r, text
     Description: Character String Processing Facilities
      Allows for fast, correct, consistent, portable, as well as
      convenient character string/text processing.

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_CATALOG_H
#define PKGCAT_CATALOG_H

#include <pkgcat/macros.h>

#include <array>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace PkgCat {

/** \brief the ways a package can depend on another one */
enum class DepType
{
   Build,
   Link,
   Run,
   Test
};
/** \brief all dependency types in the order reports list them */
constexpr std::array<DepType, 4> AllDepTypes{DepType::Build, DepType::Link, DepType::Run, DepType::Test};
/** \brief lowercase name, e.g. "build" */
PKGCAT_PUBLIC char const *DepTypeName(DepType const Type);
/** \brief name for headings, e.g. "Build" */
PKGCAT_PUBLIC char const *DepTypeTitle(DepType const Type);

struct PKGCAT_PUBLIC Package
{
   std::string Name;
   std::string Homepage;
   std::string Description;
   /** versions in the order the catalog lists them */
   std::vector<std::string> Versions;
   std::map<DepType, std::set<std::string>> Dependencies;
   std::set<std::string> Tags;

   /** \brief names of the packages needed for the given type, possibly none */
   std::set<std::string> DependenciesOfType(DepType const Type) const;
   /** \brief the versions, newest first */
   std::vector<std::string> SortedVersions() const;
};

class PKGCAT_PUBLIC Catalog
{
   std::map<std::string, Package> Packages;
   std::map<std::string, std::set<std::string>> TagIndex;

   public:
   /** \brief add a package, replacing an earlier one of the same name
    *
    *  A replaced package is reported as a warning.
    */
   void Insert(Package Pkg);

   /** \brief names of all packages in the catalog */
   std::set<std::string> AllNames() const;

   /** \brief the package called \b Name or \b nullptr */
   Package const *Find(std::string const &Name) const;

   /** \brief the package called \b Name
    *
    *  Fails with an error on the stack if there is no such package.
    */
   Package const *Lookup(std::string const &Name) const;

   /** \brief names of the packages having at least one of the \b Tags */
   std::set<std::string> PackagesWithTags(std::vector<std::string> const &Tags) const;

   size_t size() const { return Packages.size(); }
   bool empty() const { return Packages.empty(); }
};

/** \brief parse the catalog file \b FileName into \b Cat
 *
 *  Files ending in .gz are decompressed on the fly.
 */
PKGCAT_PUBLIC bool ReadCatalog(Catalog &Cat, std::string const &FileName);

}

#endif
