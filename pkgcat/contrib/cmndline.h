// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - Option parser feeding the configuration

   The option set is described by an array of Args which map each short
   and long option onto a configuration item. Non-option words are
   collected in FileList, the first of them is the command.

 std::vector<CommandLine::Args> Args = {
    CommandLine::MakeArgs('q',"quiet","quiet",CommandLine::IntLevel),
    CommandLine::MakeArgs(0,nullptr,nullptr,0)};

   The flags mean,
     HasArg     - the option takes a value
     IntLevel   - an integer level, -qqq (+3) -q=5 (=5) are valid
     Boolean    - true/false or yes/no, --no-long and --yes-long work
     InvBoolean - like Boolean, but a plain --long sets false
     ConfigFile - the value is a config file to read at this point
     ArbItem    - the value is an item=value pair set verbatim
     List       - the value is appended to the list item, commas
                  separate several values
   The default if the flags are 0 is Boolean.

   With RemainderAfter set to N everything following the Nth non-option
   word ends up in FileList, even words starting with a dash.

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_CMNDLINE_H
#define PKGCAT_CMNDLINE_H

#include <pkgcat/configuration.h>
#include <pkgcat/macros.h>

class PKGCAT_PUBLIC CommandLine
{
   public:
   struct Args;
   struct Dispatch;

   protected:

   Args *ArgList;
   Configuration *Conf;
   bool HandleOpt(int &I,int argc,const char *argv[],
		  const char *&Opt,Args *A,bool PreceedeMatch = false);

   public:

   enum AFlags
   {
      HasArg = (1 << 0),
      IntLevel = (1 << 1),
      Boolean = (1 << 2),
      InvBoolean = (1 << 3),
      ConfigFile = (1 << 4) | HasArg,
      ArbItem = (1 << 5) | HasArg,
      List = (1 << 6) | HasArg
   };

   const char **FileList;
   /** number of non-option words after which option parsing stops, 0 never */
   unsigned int RemainderAfter;

   bool Parse(int argc,const char **argv);
   unsigned int FileSize() const PKGCAT_PURE;
   bool DispatchArg(Dispatch const * const List,bool NoMatch = true);
   static char const * GetCommand(Dispatch const * const Map,
	 unsigned int const argc, char const * const * const argv) PKGCAT_PURE;

   static CommandLine::Args MakeArgs(char ShortOpt, char const *LongOpt,
	 char const *ConfName, unsigned long Flags) PKGCAT_PURE;

   CommandLine(Args *AList,Configuration *Conf);
   CommandLine();
   CommandLine(CommandLine const &) = delete;
   CommandLine &operator=(CommandLine const &) = delete;
   CommandLine &operator=(CommandLine &&Other);
   ~CommandLine();
};

struct CommandLine::Args
{
   char ShortOpt;
   const char *LongOpt;
   const char *ConfName;
   unsigned long Flags;

   inline bool end() {return ShortOpt == 0 && LongOpt == 0;};
   inline bool IsBoolean() {return Flags == 0 || (Flags & (Boolean|InvBoolean)) != 0;};
};

struct CommandLine::Dispatch
{
   const char *Match;
   bool (*Handler)(CommandLine &);
};

#endif
