#ifndef PKGCAT_PRIVATE_CMNDLINE_H
#define PKGCAT_PRIVATE_CMNDLINE_H

#include <pkgcat/cmndline.h>
#include <pkgcat/macros.h>

#include <vector>

class Configuration;

struct pkgcatDispatchWithHelp
{
   const char *Match;
   bool (*Handler)(CommandLine &);
   const char *Help;
};

PKGCAT_PUBLIC std::vector<CommandLine::Dispatch> ParseCommandLine(CommandLine &CmdL,
      Configuration * const * const Cnf, int const argc, const char * argv[],
      bool (*ShowHelp)(CommandLine &), std::vector<pkgcatDispatchWithHelp> (*GetCommands)(void));
PKGCAT_PUBLIC unsigned short DispatchCommandLine(CommandLine &CmdL, std::vector<CommandLine::Dispatch> const &Cmds);

PKGCAT_PUBLIC std::vector<CommandLine::Args> getCommandArgs(char const * const Cmd);
/** \brief number of words after which the command takes everything verbatim */
PKGCAT_PUBLIC unsigned int getCommandRemainder(char const * const Cmd);

#endif
