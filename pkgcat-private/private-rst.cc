// Include files							/*{{{*/
#include <config.h>

#include <pkgcat/catalog.h>
#include <pkgcat/configuration.h>
#include <pkgcat/strutl.h>

#include <pkgcat-private/private-formatters.h>
#include <pkgcat-private/private-output.h>
#include <pkgcat-private/private-table.h>

#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>
									/*}}}*/

namespace PkgCat {

// RSTTable - the names as table with a border of = above and below	/*{{{*/
static std::string RSTTable(std::vector<std::string> const &Cells)
{
   ColumnLayout const Layout = LayoutColumns(Cells, ScreenWidth);
   std::ostringstream Rows;
   ShowColumns(Rows, Cells, Layout);

   std::string Border;
   for (auto const &W : Layout.Widths)
   {
      if (Border.empty() == false)
	 Border.append(" ");
      Border.append(W > 0 ? W - 1 : 0, '=');
   }
   return Border + "\n" + Rows.str() + Border;
}
									/*}}}*/
// FormatRST - a document for sphinx with a section per package	/*{{{*/
bool FormatRST(std::ostream &out, Catalog const &Cat, std::vector<std::string> const &Names)
{
   std::vector<Package const *> Pkgs;
   if (LookupAll(Cat, Names, Pkgs) == false)
      return false;

   std::string const Project = _config->Find("PkgCat::Report::Project", "Spack");
   std::string const SourceLabel = _config->Find("PkgCat::Report::Source-Label", "Spack package");
   std::set<std::string> const Selected(Names.begin(), Names.end());

   out << ".. _package-list:\n\n"
       << "============\n"
       << "Package List\n"
       << "============\n\n";
   ioprintf(out, "This is a list of things you can install using %s.  It is\n"
	 "automatically generated based on the packages in the latest %s\n"
	 "release.\n\n", Project.c_str(), Project.c_str());
   ioprintf(out, "%s currently has %zu mainline packages:\n\n", Project.c_str(), Pkgs.size());

   std::vector<std::string> Links;
   Links.reserve(Names.size());
   for (auto const &Name : Names)
      Links.push_back("`" + Name + "`_");
   out << RSTTable(Links) << "\n\n";

   for (auto const Pkg : Pkgs)
   {
      std::string const Rule = HeadingRule(Pkg->Name);
      out << "-----\n\n"
	  << ".. _" << Pkg->Name << ":\n\n"
	  << Rule << "\n" << Pkg->Name << "\n" << Rule << "\n\n";

      out << "Homepage:\n"
	  << "  * `" << HtmlEscape(Pkg->Homepage) << " <" << Pkg->Homepage << ">`__\n\n";
      out << SourceLabel << ":\n"
	  << "  * `" << SourceNameFor(*Pkg) << " <" << SourceLinkFor(*Pkg) << ">`__\n\n";

      std::vector<std::string> const Versions = Pkg->SortedVersions();
      if (Versions.empty() == false)
	 out << "Versions:\n"
	     << "  " << PkgCat::String::Join(Versions, ", ") << "\n\n";

      for (auto const Type : AllDepTypes)
      {
	 std::set<std::string> const Deps = Pkg->DependenciesOfType(Type);
	 if (Deps.empty() == true)
	    continue;
	 std::vector<std::string> Refs;
	 for (auto const &D : Deps)
	    Refs.push_back(Selected.find(D) != Selected.end() ? D + "_" : D);
	 out << DepTypeTitle(Type) << " Dependencies\n"
	     << "  " << PkgCat::String::Join(Refs, ", ") << "\n\n";
      }

      out << "Description:\n"
	  << FormatDescription(Pkg->Description, 2) << "\n\n";
   }
   return true;
}
									/*}}}*/
}
