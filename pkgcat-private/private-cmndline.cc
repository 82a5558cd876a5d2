// Include Files							/*{{{*/
#include <config.h>

#include <pkgcat/cmndline.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/fileutl.h>
#include <pkgcat/init.h>
#include <pkgcat/strutl.h>

#include <pkgcat-private/private-cmndline.h>
#include <pkgcat-private/private-main.h>

#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <vector>

#include <pkgcati18n.h>
									/*}}}*/

PKGCAT_NONNULL(1, 2)
static bool CmdMatches_fn(char const *const Cmd, char const *const Match)
{
   return strcmp(Cmd, Match) == 0;
}
template <typename... Tail>
PKGCAT_NONNULL(1, 2)
static bool CmdMatches_fn(char const *const Cmd, char const *const Match, Tail... MoreMatches)
{
   return CmdMatches_fn(Cmd, Match) || CmdMatches_fn(Cmd, MoreMatches...);
}
#define addArg(w, x, y, z) Args.emplace_back(CommandLine::MakeArgs(w, x, y, z))
#define CmdMatches(...) (Cmd != nullptr && CmdMatches_fn(Cmd, __VA_ARGS__))

static bool addArgumentsList(std::vector<CommandLine::Args> &Args, char const * const Cmd)/*{{{*/
{
   if (CmdMatches("list") == false)
      return false;

   addArg('d', "search-description", "PkgCat::List::Search-Description", 0);
   addArg(0, "format", "PkgCat::List::Format", CommandLine::HasArg);
   addArg('t', "tags", "PkgCat::List::Tags", CommandLine::List);
   addArg(0, "tag", "PkgCat::List::Tags", CommandLine::List);
   addArg(0, "catalog", "PkgCat::List::Catalog", CommandLine::HasArg);
   return true;
}
									/*}}}*/
std::vector<CommandLine::Args> getCommandArgs(char const * const Cmd)	/*{{{*/
{
   std::vector<CommandLine::Args> Args;
   Args.reserve(50);
   if (Cmd != nullptr && strcmp(Cmd, "help") == 0)
      ; // no options for help so no need to implement it in each
   else
      addArgumentsList(Args, Cmd);

   // options without a command
   addArg('h', "help", "help", 0);
   addArg('v', "version", "version", 0);
   // general options
   addArg('q', "quiet", "quiet", CommandLine::IntLevel);
   addArg('q', "silent", "quiet", CommandLine::IntLevel);
   addArg('c', "config-file", nullptr, CommandLine::ConfigFile);
   addArg('o', "option", nullptr, CommandLine::ArbItem);
   addArg(0, nullptr, nullptr, 0);

   return Args;
}
									/*}}}*/
unsigned int getCommandRemainder(char const * const Cmd)		/*{{{*/
{
   // the command word and the first filter
   if (CmdMatches("list"))
      return 2;
   return 0;
}
									/*}}}*/
#undef addArg
#undef CmdMatches
static void ShowHelpListCommands(std::vector<pkgcatDispatchWithHelp> const &Cmds)/*{{{*/
{
   if (Cmds.empty() || Cmds[0].Match == nullptr)
      return;
   std::cout << std::endl << _("Commands:") << std::endl;
   for (auto const &c: Cmds)
   {
      if (c.Help == nullptr)
	 continue;
      std::cout << "  " << c.Match << " - " << c.Help << std::endl;
   }
}
									/*}}}*/
static bool ShowCommonHelp(CommandLine &CmdL, std::vector<pkgcatDispatchWithHelp> const &Cmds,/*{{{*/
      bool (*ShowHelp)(CommandLine &))
{
   std::cout << PACKAGE << " " << pkgcatVersion << " (libpkgcat " << pkgcatLibVersion << ")" << std::endl;
   if (_config->FindB("version") == true)
      return true;
   if (ShowHelp(CmdL) == false)
      return false;
   ShowHelpListCommands(Cmds);
   std::cout << std::endl;
   ioprintf(std::cout, _("See %s for more information about the available commands."), "pkgcat(1)");
   std::cout << std::endl <<
      _("Configuration options and syntax is detailed in pkgcat.conf(5).\n");
   return true;
}
									/*}}}*/
std::vector<CommandLine::Dispatch> ParseCommandLine(CommandLine &CmdL,	/*{{{*/
      Configuration * const * const Cnf, int const argc, const char *argv[],
      bool (*ShowHelp)(CommandLine &), std::vector<pkgcatDispatchWithHelp> (*GetCommands)(void))
{
   InitLocale();
   if (Cnf != nullptr && pkgInitConfig(**Cnf) == false)
   {
      _error->DumpErrors();
      exit(100);
   }

   if (likely(argc != 0 && argv[0] != nullptr))
      _config->Set("Binary", flNotDir(argv[0]));

   std::vector<CommandLine::Dispatch> Cmds;
   std::vector<pkgcatDispatchWithHelp> const CmdsWithHelp = GetCommands();
   if (CmdsWithHelp.empty() == false)
   {
      CommandLine::Dispatch const help = { "help", [](CommandLine &){return false;} };
      Cmds.push_back(std::move(help));
   }
   std::transform(CmdsWithHelp.begin(), CmdsWithHelp.end(), std::back_inserter(Cmds),
		  [](auto &&cmd) { return CommandLine::Dispatch{cmd.Match, cmd.Handler}; });

   char const * CmdCalled = nullptr;
   if (Cmds.empty() == false && Cmds[0].Handler != nullptr)
      CmdCalled = CommandLine::GetCommand(Cmds.data(), argc, argv);

   // Args running out of scope invalidates the pointer stored in CmdL,
   // but it is only used by Parse while still in scope here.
   auto Args = getCommandArgs(CmdCalled);
   CmdL = CommandLine(Args.data(), _config);
   CmdL.RemainderAfter = getCommandRemainder(CmdCalled);

   if (CmdL.Parse(argc,argv) == false)
   {
      if (_config->FindB("version") == true)
	 ShowCommonHelp(CmdL, CmdsWithHelp, ShowHelp);

      _error->DumpErrors();
      exit(100);
   }

   // See if the help should be shown
   if (_config->FindB("help") == true || _config->FindB("version") == true ||
	 (CmdL.FileSize() > 0 && strcmp(CmdL.FileList[0], "help") == 0))
   {
      ShowCommonHelp(CmdL, CmdsWithHelp, ShowHelp);
      exit(0);
   }
   if (Cmds.empty() == false && CmdL.FileSize() == 0)
   {
      ShowCommonHelp(CmdL, CmdsWithHelp, ShowHelp);
      exit(1);
   }
   return Cmds;
}
									/*}}}*/
unsigned short DispatchCommandLine(CommandLine &CmdL, std::vector<CommandLine::Dispatch> const &Cmds)	/*{{{*/
{
   // Match the operation
   bool const returned = Cmds.empty() ? true : CmdL.DispatchArg(Cmds.data());

   // Print any errors or warnings found during parsing
   bool const Errors = _error->PendingError();
   if (_config->FindI("quiet",0) > 0)
      _error->DumpErrors();
   else
      _error->DumpErrors(GlobalError::DEBUG);
   if (returned == false)
      return 100;
   return Errors == true ? 100 : 0;
}
									/*}}}*/
