// Include files							/*{{{*/
#include <config.h>

#include <pkgcat/catalog.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/fileutl.h>

#include <pkgcat-private/private-catalogfile.h>

#include <memory>
#include <string>

#include <pkgcati18n.h>
									/*}}}*/

std::string CatalogFile::FileName()					/*{{{*/
{
   std::string const Given = _config->Find("PkgCat::List::Catalog");
   if (Given.empty() == false)
      return Given;
   return _config->FindFile("Dir::Catalog");
}
									/*}}}*/
bool CatalogFile::Open()						/*{{{*/
{
   std::string const File = FileName();
   if (RealFileExists(File) == false)
      return _error->Error(_("The catalog %s does not exist"), File.c_str());

   std::unique_ptr<PkgCat::Catalog> Parsed(new PkgCat::Catalog());
   if (PkgCat::ReadCatalog(*Parsed, File) == false)
      return false;
   Cat = std::move(Parsed);
   return true;
}
									/*}}}*/
