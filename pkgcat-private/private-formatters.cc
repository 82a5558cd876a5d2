// Include files							/*{{{*/
#include <config.h>

#include <pkgcat/catalog.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/strutl.h>

#include <pkgcat-private/private-formatters.h>
#include <pkgcat-private/private-output.h>
#include <pkgcat-private/private-table.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include <pkgcati18n.h>
									/*}}}*/

namespace PkgCat {

// FormatterRegistry							/*{{{*/
void FormatterRegistry::Register(std::string const &Name, Formatter const Handler)
{
   for (auto &F : Formatters)
      if (F.first == Name)
      {
	 F.second = Handler;
	 return;
      }
   Formatters.emplace_back(Name, Handler);
}
std::vector<std::string> FormatterRegistry::Names() const
{
   std::vector<std::string> List;
   List.reserve(Formatters.size());
   for (auto const &F : Formatters)
      List.push_back(F.first);
   return List;
}
bool FormatterRegistry::Exists(std::string const &Name) const
{
   return std::any_of(Formatters.begin(), Formatters.end(),
		      [&](std::pair<std::string, Formatter> const &F) { return F.first == Name; });
}
Formatter FormatterRegistry::Get(std::string const &Name) const
{
   for (auto const &F : Formatters)
      if (F.first == Name)
	 return F.second;
   _error->Error(_("Unknown output format '%s', valid formats are: %s"), Name.c_str(),
		 PkgCat::String::Join(Names(), ", ").c_str());
   return nullptr;
}
FormatterRegistry &FormatterRegistry::Global()
{
   static FormatterRegistry Registry;
   return Registry;
}
									/*}}}*/
void RegisterDefaultFormatters(FormatterRegistry &Registry)		/*{{{*/
{
   Registry.Register("name_only", FormatNameOnly);
   Registry.Register("rst", FormatRST);
   Registry.Register("html", FormatHTML);
}
									/*}}}*/
// Helpers								/*{{{*/
std::string SourceLinkFor(Package const &Pkg)
{
   return SubstVar(_config->Find("PkgCat::Report::Source-URI"), "$(PACKAGE)", Pkg.Name);
}
std::string SourceNameFor(Package const &Pkg)
{
   return SubstVar(_config->Find("PkgCat::Report::Source-Name", "$(PACKAGE)"), "$(PACKAGE)", Pkg.Name);
}
std::string HeadingRule(std::string const &Name)
{
   return std::string(std::max<size_t>(Name.length(), 2), '-');
}
std::string FormatDescription(std::string const &Text, size_t const Indent)
{
   int const Width = _config->FindI("PkgCat::Report::Description-Width", 72);
   return WrapText(Text, Width > 0 ? Width : 72, Indent);
}
bool LookupAll(Catalog const &Cat, std::vector<std::string> const &Names,
	       std::vector<Package const *> &Pkgs)
{
   Pkgs.clear();
   Pkgs.reserve(Names.size());
   for (auto const &Name : Names)
   {
      Package const * const Pkg = Cat.Lookup(Name);
      if (Pkg == nullptr)
	 return false;
      Pkgs.push_back(Pkg);
   }
   return true;
}
									/*}}}*/
// FormatNameOnly - just the names in columns				/*{{{*/
bool FormatNameOnly(std::ostream &out, Catalog const &Cat, std::vector<std::string> const &Names)
{
   std::vector<Package const *> Pkgs;
   if (LookupAll(Cat, Names, Pkgs) == false)
      return false;

   if (_config->FindB("PkgCat::Output::Terminal", false) == true)
   {
      ioprintf(out, _("%zu packages.\n"), Names.size());
      ShowWithColumns(out, Names, 0, ScreenWidth);
   }
   else
      ShowColumns(out, Names, LayoutColumns(Names, ScreenWidth, 2, 1));
   return true;
}
									/*}}}*/
}
