// Include files							/*{{{*/
#include <config.h>

#include <pkgcat/catalog.h>
#include <pkgcat/configuration.h>
#include <pkgcat/strutl.h>

#include <pkgcat-private/private-formatters.h>
#include <pkgcat-private/private-table.h>

#include <iostream>
#include <set>
#include <string>
#include <vector>
									/*}}}*/

namespace PkgCat {

static std::string InternalLink(std::string const &Name)
{
   return "<a class=\"reference internal\" href=\"#" + QuoteURI(Name) + "\">" + HtmlEscape(Name) + "</a>";
}
static void ExternalLinkItem(std::ostream &out, std::string const &Title,
			     std::string const &URI, std::string const &Text)
{
   out << "<dt>" << Title << ":</dt>\n"
       << "<dd><ul class=\"first last simple\">\n"
       << "<li><a class=\"reference external\" href=\"" << QuoteURI(URI) << "\">"
       << HtmlEscape(Text) << "</a></li>\n"
       << "</ul></dd>\n";
}
// FormatHTML - fragment to be included into a sphinx page		/*{{{*/
// ---------------------------------------------------------------------
/* The page title and the introduction are part of the surrounding page,
   which also uses the first span id. */
bool FormatHTML(std::ostream &out, Catalog const &Cat, std::vector<std::string> const &Names)
{
   std::vector<Package const *> Pkgs;
   if (LookupAll(Cat, Names, Pkgs) == false)
      return false;

   std::string const Project = _config->Find("PkgCat::Report::Project", "Spack");
   std::string const SourceLabel = _config->Find("PkgCat::Report::Source-Label", "Spack package");
   std::set<std::string> const Selected(Names.begin(), Names.end());

   out << "<p>\n";
   ioprintf(out, "%s currently has %zu mainline packages:\n", HtmlEscape(Project).c_str(), Pkgs.size());
   out << "</p>\n";

   out << "<table border=\"1\" class=\"docutils\">\n"
       << "<tbody valign=\"top\">\n";
   size_t RowIndex = 0;
   for (auto const &Row : RowsForColumnCount(Names, 3))
   {
      out << (RowIndex++ % 2 == 0 ? "<tr class=\"row-odd\">\n" : "<tr class=\"row-even\">\n");
      for (auto const Cell : Row)
      {
	 if (Cell == nullptr)
	    continue;
	 out << "<td>\n"
	     << InternalLink(*Cell) << "</td>\n"
	     << "</td>\n";
      }
      out << "</tr>\n";
   }
   out << "</tbody>\n"
       << "</table>\n"
       << "<hr class=\"docutils\"/>\n";

   unsigned int SpanId = 2;
   for (auto const Pkg : Pkgs)
   {
      std::string const Anchor = QuoteURI(Pkg->Name);
      out << "<div class=\"section\" id=\"" << Anchor << "\">\n";
      ioprintf(out, "<span id=\"id%u\"></span><h1>%s<a class=\"headerlink\" href=\"#%s\" "
	    "title=\"Permalink to this headline\">&para;</a></h1>\n",
	    SpanId++, HtmlEscape(Pkg->Name).c_str(), Anchor.c_str());

      out << "<dl class=\"docutils\">\n";
      ExternalLinkItem(out, "Homepage", Pkg->Homepage, Pkg->Homepage);
      ExternalLinkItem(out, HtmlEscape(SourceLabel), SourceLinkFor(*Pkg), SourceNameFor(*Pkg));

      std::vector<std::string> const Versions = Pkg->SortedVersions();
      if (Versions.empty() == false)
	 out << "<dt>Versions:</dt>\n"
	     << "<dd>\n"
	     << HtmlEscape(PkgCat::String::Join(Versions, ", ")) << "\n"
	     << "</dd>\n";

      for (auto const Type : AllDepTypes)
      {
	 std::set<std::string> const Deps = Pkg->DependenciesOfType(Type);
	 if (Deps.empty() == true)
	    continue;
	 std::vector<std::string> Refs;
	 for (auto const &D : Deps)
	    Refs.push_back(Selected.find(D) != Selected.end() ? InternalLink(D) : HtmlEscape(D));
	 out << "<dt>" << DepTypeTitle(Type) << " Dependencies:</dt>\n"
	     << "<dd>\n"
	     << PkgCat::String::Join(Refs, ", ") << "\n"
	     << "</dd>\n";
      }

      out << "<dt>Description:</dt>\n"
	  << "<dd>\n"
	  << HtmlEscape(FormatDescription(Pkg->Description, 2)) << "\n"
	  << "</dd>\n"
	  << "</dl>\n";

      out << "<hr class=\"docutils\"/>\n"
	  << "</div>\n";
   }
   return true;
}
									/*}}}*/
}
