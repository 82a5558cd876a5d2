// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Formatters - write the list of selected packages in various formats

   A formatter gets the sorted names picked by the catalog filter and
   writes a report about them. Every name has to be known to the catalog,
   an unknown name is an error and nothing is written in that case.

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_PRIVATE_FORMATTERS_H
#define PKGCAT_PRIVATE_FORMATTERS_H

#include <pkgcat/catalog.h>
#include <pkgcat/macros.h>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace PkgCat {

typedef bool (*Formatter)(std::ostream &out, Catalog const &Cat, std::vector<std::string> const &Names);

class PKGCAT_PUBLIC FormatterRegistry
{
   std::vector<std::pair<std::string, Formatter>> Formatters;

   public:
   /** \brief add \b Handler as \b Name, an existing entry keeps its place */
   void Register(std::string const &Name, Formatter const Handler);
   /** \brief names in the order they were registered */
   std::vector<std::string> Names() const;
   bool Exists(std::string const &Name) const;
   /** \brief the formatter called \b Name
    *
    *  \return \b nullptr with an error listing the valid names if there
    *  is no such formatter
    */
   Formatter Get(std::string const &Name) const;

   /** \brief the registry used by the command line front-end */
   static FormatterRegistry &Global();
};

/** \brief register name_only, rst and html */
PKGCAT_PUBLIC void RegisterDefaultFormatters(FormatterRegistry &Registry);

PKGCAT_PUBLIC bool FormatNameOnly(std::ostream &out, Catalog const &Cat, std::vector<std::string> const &Names);
PKGCAT_PUBLIC bool FormatRST(std::ostream &out, Catalog const &Cat, std::vector<std::string> const &Names);
PKGCAT_PUBLIC bool FormatHTML(std::ostream &out, Catalog const &Cat, std::vector<std::string> const &Names);

/** \brief where the definition of \b Pkg can be looked at */
PKGCAT_PUBLIC std::string SourceLinkFor(Package const &Pkg);
/** \brief text shown for the SourceLinkFor link */
PKGCAT_PUBLIC std::string SourceNameFor(Package const &Pkg);
/** \brief rule for over- and underlining \b Name, never shorter than 2 */
PKGCAT_PUBLIC std::string HeadingRule(std::string const &Name);
/** \brief description reflowed to the configured width and indented */
PKGCAT_PUBLIC std::string FormatDescription(std::string const &Text, size_t const Indent);

/** \brief resolve all \b Names at once, fails on the first unknown one */
PKGCAT_PUBLIC bool LookupAll(Catalog const &Cat, std::vector<std::string> const &Names,
			     std::vector<Package const *> &Pkgs);

}

#endif
