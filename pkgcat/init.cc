// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the catalog library

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/fileutl.h>
#include <pkgcat/init.h>
#include <pkgcat/macros.h>

#include <cstdlib>
#include <string.h>
#include <string>

#include <pkgcati18n.h>
									/*}}}*/

#define Stringfy_(x) # x
#define Stringfy(x)  Stringfy_(x)
const char *pkgcatVersion = PACKAGE_VERSION;
const char *pkgcatLibVersion = Stringfy(PKGCAT_MAJOR) "."
			       Stringfy(PKGCAT_MINOR) "."
			       Stringfy(PKGCAT_RELEASE);

// pkgInitConfig - Initialize the configuration class			/*{{{*/
// ---------------------------------------------------------------------
/* Directories are specified in such a way that the FindDir function will
   understand them. That is, if they don't start with a / then their parent
   is prepended, this allows a fair degree of flexibility. */
bool pkgInitConfig(Configuration &Cnf)
{
   // General PkgCat things
   Cnf.CndSet("PkgCat::List::Format", "name_only");
   Cnf.CndSet("PkgCat::List::Search-Description", false);

   Cnf.CndSet("PkgCat::Report::Project", "Spack");
   Cnf.CndSet("PkgCat::Report::Source-Label", "Spack package");
   Cnf.CndSet("PkgCat::Report::Source-URI",
	 "https://github.com/spack/spack/blob/develop/var/spack/repos/builtin/packages/$(PACKAGE)/package.py");
   Cnf.CndSet("PkgCat::Report::Source-Name", "$(PACKAGE)/package.py");
   Cnf.CndSet("PkgCat::Report::Description-Width", 72);

   // Configuration
   Cnf.CndSet("Dir", "/");
   Cnf.CndSet("Dir::Etc", "etc/pkgcat/");
   Cnf.CndSet("Dir::Etc::main", "pkgcat.conf");
   Cnf.CndSet("Dir::Etc::parts", "pkgcat.conf.d");
   Cnf.CndSet("Dir::Catalog", "usr/share/pkgcat/catalog");

   bool Res = true;

   // Read an alternate config file
   const char *Cfg = getenv("PKGCAT_CONFIG");
   if (Cfg != nullptr && strlen(Cfg) != 0)
   {
      if (RealFileExists(Cfg) == true)
	 Res &= ReadConfigFile(Cnf,Cfg);
      else
	 _error->WarningE("RealFileExists",_("Unable to read %s"),Cfg);
   }

   // Read the configuration parts dir
   std::string const Parts = Cnf.FindDir("Dir::Etc::parts", "/dev/null");
   if (DirectoryExists(Parts) == true)
      Res &= ReadConfigDir(Cnf,Parts);

   // Read the main config file
   std::string const FName = Cnf.FindFile("Dir::Etc::main", "/dev/null");
   if (RealFileExists(FName) == true)
      Res &= ReadConfigFile(Cnf,FName);

   if (Res == false)
      return false;

   if (Cnf.FindB("Debug::pkgInitConfig",false) == true)
      Cnf.Dump();

   return true;
}
									/*}}}*/
