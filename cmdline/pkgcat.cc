// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   pkgcat - list and search the packages of a catalog

   Returns 100 on failure, 0 on success.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <pkgcat/cmndline.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/init.h>
#include <pkgcat/strutl.h>

#include <pkgcat-private/private-cmndline.h>
#include <pkgcat-private/private-formatters.h>
#include <pkgcat-private/private-list.h>
#include <pkgcat-private/private-main.h>
#include <pkgcat-private/private-output.h>

#include <iostream>
#include <vector>

#include <pkgcati18n.h>
									/*}}}*/

static bool ShowHelp(CommandLine &)					/*{{{*/
{
   std::cout <<
      _("Usage: pkgcat [options] list [filter...]\n"
	"\n"
	"pkgcat lists the packages of a catalog whose names match the\n"
	"given case-insensitive glob patterns and writes them as plain\n"
	"list or as documentation page.\n"
	"\n"
	"Options:\n"
	"  -d, --search-description  match the patterns against the descriptions, too\n"
	"  --format <format>         output format, the default is name_only\n"
	"  -t, --tags <tag,...>      only list packages with one of the tags\n"
	"  --catalog <file>          read this catalog instead of the configured one\n");
   std::cout << _("Formats:") << " "
	     << PkgCat::String::Join(PkgCat::FormatterRegistry::Global().Names(), ", ")
	     << std::endl;
   return true;
}
									/*}}}*/
static std::vector<pkgcatDispatchWithHelp> GetCommands()		/*{{{*/
{
   return {
      {"list", &DoList, _("list packages matching the filters")},
      {nullptr, nullptr, nullptr}
   };
}
									/*}}}*/
int main(int argc, const char *argv[])					/*{{{*/
{
   InitSignals();
   PkgCat::RegisterDefaultFormatters(PkgCat::FormatterRegistry::Global());

   // Parse the command line and initialize the catalog library
   CommandLine CmdL;
   auto const Cmds = ParseCommandLine(CmdL, &_config, argc, argv, &ShowHelp, &GetCommands);

   InitOutput();

   return DispatchCommandLine(CmdL, Cmds);
}
									/*}}}*/
