// Include Files							/*{{{*/
#include <config.h>

#include <pkgcat/catalog.h>
#include <pkgcat/catalogfilter.h>
#include <pkgcat/cmndline.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>

#include <pkgcat-private/private-catalogfile.h>
#include <pkgcat-private/private-formatters.h>
#include <pkgcat-private/private-list.h>
#include <pkgcat-private/private-output.h>

#include <string>
#include <vector>

#include <pkgcati18n.h>
									/*}}}*/

// DoList - select packages and write the report about them		/*{{{*/
// ---------------------------------------------------------------------
/* The format is checked before the catalog is read, so a typo doesn't
   have to wait for the catalog to be parsed. */
bool DoList(CommandLine &CmdL)
{
   std::string const Format = _config->Find("PkgCat::List::Format", "name_only");
   PkgCat::Formatter const Report = PkgCat::FormatterRegistry::Global().Get(Format);
   if (Report == nullptr)
      return false;

   PkgCat::CatalogFilter::FilterSpec Spec;
   for (const char **I = CmdL.FileList + 1; *I != nullptr; ++I)
      Spec.Patterns.emplace_back(*I);
   Spec.SearchDescription = _config->FindB("PkgCat::List::Search-Description", false);
   Spec.Tags = _config->FindVector("PkgCat::List::Tags");

   CatalogFile Catalog;
   PkgCat::Catalog const * const Cat = Catalog.GetCatalog();
   if (Cat == nullptr)
      return false;

   std::vector<std::string> Selected;
   if (PkgCat::CatalogFilter::Filter(*Cat, Spec, Selected) == false)
      return false;

   if (Report(c1out, *Cat, Selected) == false)
      return false;
   c1out.flush();
   if (c1out.bad() == true)
      return _error->Error(_("Write error while writing the report"));
   return true;
}
									/*}}}*/
