#ifndef PKGCAT_PRIVATE_CATALOGFILE_H
#define PKGCAT_PRIVATE_CATALOGFILE_H

#include <pkgcat/catalog.h>
#include <pkgcat/macros.h>

#include <memory>
#include <string>

// class CatalogFile - Cover class reading the configured catalog once	/*{{{*/
class PKGCAT_PUBLIC CatalogFile
{
   std::unique_ptr<PkgCat::Catalog> Cat;

   public:
   /** \brief the file given with --catalog or configured as Dir::Catalog */
   static std::string FileName();

   bool Open();
   /** \brief the parsed catalog, \b nullptr if it couldn't be read */
   PkgCat::Catalog *GetCatalog()
   {
      if (Cat == nullptr && Open() == false)
	 return nullptr;
      return Cat.get();
   }
   PkgCat::Catalog *operator->() { return GetCatalog(); }
};
									/*}}}*/

#endif
