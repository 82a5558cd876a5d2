// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - Option parser feeding the configuration

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <pkgcat/cmndline.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/strutl.h>

#include <stddef.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <utility>

#include <pkgcati18n.h>
									/*}}}*/
using namespace std;

// CommandLine::CommandLine - Constructor				/*{{{*/
CommandLine::CommandLine(Args *AList,Configuration *Conf) : ArgList(AList),
				 Conf(Conf), FileList(nullptr), RemainderAfter(0)
{
}
CommandLine::CommandLine() : ArgList(nullptr), Conf(nullptr), FileList(nullptr), RemainderAfter(0)
{
}
CommandLine &CommandLine::operator=(CommandLine &&Other)
{
   if (this == &Other)
      return *this;
   delete [] FileList;
   ArgList = Other.ArgList;
   Conf = Other.Conf;
   FileList = Other.FileList;
   RemainderAfter = Other.RemainderAfter;
   Other.FileList = nullptr;
   return *this;
}
									/*}}}*/
// CommandLine::~CommandLine - Destructor				/*{{{*/
CommandLine::~CommandLine()
{
   delete [] FileList;
}
									/*}}}*/
// CommandLine::GetCommand - return the first word naming a command	/*{{{*/
/* A -- ends the options, so the command is either before it or the word
   right after it. */
char const * CommandLine::GetCommand(Dispatch const * const Map,
      unsigned int const argc, char const * const * const argv)
{
   auto const MatchOf = [&](char const * const Word) -> char const * {
      for (size_t j = 0; Map[j].Match != nullptr; ++j)
	 if (strcmp(Word, Map[j].Match) == 0)
	    return Map[j].Match;
      return nullptr;
   };
   for (size_t i = 1; i < argc; ++i)
   {
      if (strcmp(argv[i], "--") != 0)
	 continue;
      for (size_t k = 1; k < i; ++k)
	 if (char const * const Cmd = MatchOf(argv[k]); Cmd != nullptr)
	    return Cmd;
      ++i;
      if (i < argc)
	 return MatchOf(argv[i]);
      return nullptr;
   }
   // option values like the FILE of -c FILE are words too, skip them
   for (size_t i = 1; i < argc; ++i)
   {
      if (*(argv[i]) == '-')
	 continue;
      if (char const * const Cmd = MatchOf(argv[i]); Cmd != nullptr)
	 return Cmd;
   }
   return nullptr;
}
									/*}}}*/
// CommandLine::Parse - Main action member				/*{{{*/
bool CommandLine::Parse(int argc,const char **argv)
{
   delete [] FileList;
   FileList = new const char *[argc + 1];
   const char **Files = FileList;
   unsigned int Words = 0;
   int I;
   for (I = 1; I < argc; I++)
   {
      const char *Opt = argv[I];

      // everything after the command words belongs to the command
      if (RemainderAfter != 0 && Words >= RemainderAfter)
	 break;

      // It is not an option
      if (*Opt != '-' || Opt[1] == 0)
      {
	 *Files++ = Opt;
	 ++Words;
	 continue;
      }

      Opt++;

      // Double dash signifies the end of option processing
      if (*Opt == '-' && Opt[1] == 0)
      {
	 I++;
	 break;
      }

      // Single dash is a short option
      if (*Opt != '-')
      {
	 // Iterate over each letter
	 while (*Opt != 0)
	 {
	    Args *A;
	    for (A = ArgList; A->end() == false && A->ShortOpt != *Opt; A++);
	    if (A->end() == true)
	       return _error->Error(_("Command line option '%c' [from %s] is not understood in combination with the other options."),*Opt,argv[I]);

	    if (HandleOpt(I,argc,argv,Opt,A) == false)
	       return false;
	    if (*Opt != 0)
	       Opt++;
	 }
	 continue;
      }

      Opt++;

      // Match up to a = against the list
      Args *A;
      const char *OptEnd = strchrnul(Opt, '=');
      for (A = ArgList; A->end() == false &&
	   (A->LongOpt == nullptr || stringcasecmp(Opt,OptEnd,A->LongOpt,A->LongOpt + strlen(A->LongOpt)) != 0);
	   ++A);

      // Failed, look for a word after the first - (no-foo)
      bool PreceedMatch = false;
      if (A->end() == true)
      {
	 Opt = static_cast<const char *>(memchr(Opt, '-', OptEnd - Opt));
	 if (Opt == nullptr)
	    return _error->Error(_("Command line option %s is not understood in combination with the other options"),argv[I]);
	 Opt++;

	 for (A = ArgList; A->end() == false &&
	      (A->LongOpt == nullptr || stringcasecmp(Opt,OptEnd,A->LongOpt,A->LongOpt + strlen(A->LongOpt)) != 0);
	      ++A);

	 // The option could be a single letter option prefixed by a no-..
	 if (A->end() == true && OptEnd - Opt == 1)
	    for (A = ArgList; A->end() == false && A->ShortOpt != *Opt; A++);

	 if (A->end() == true)
	    return _error->Error(_("Command line option %s is not understood in combination with the other options"),argv[I]);

	 if (A->IsBoolean() == false)
	    return _error->Error(_("Command line option %s is not boolean"),argv[I]);
	 PreceedMatch = true;
      }

      // Deal with it.
      OptEnd--;
      if (HandleOpt(I,argc,argv,OptEnd,A,PreceedMatch) == false)
	 return false;
   }

   // Copy any remaining file names over
   for (; I < argc; I++)
      *Files++ = argv[I];
   *Files = nullptr;

   return true;
}
									/*}}}*/
// CommandLine::HandleOpt - Handle a single option including all flags	/*{{{*/
// ---------------------------------------------------------------------
/* Looks at a given argument which is tokenized roughly like
   -*[yes|true|enable]-(o|longopt)[=][ ][argument] */
bool CommandLine::HandleOpt(int &I,int argc,const char *argv[],
			    const char *&Opt,Args *A,bool PreceedMatch)
{
   const char *Argument = nullptr;
   bool CertainArg = false;
   int IncI = 0;

   /* Determine the possible location of an option or 0 if there is
      no option */
   if (Opt[1] == 0)
   {
      if (I + 1 < argc && argv[I+1][0] != '-')
	 Argument = argv[I+1];

      IncI = 1;
   }
   else
   {
      if (Opt[1] == '=')
      {
	 CertainArg = true;
	 Argument = Opt + 2;
      }
      else
	 Argument = Opt + 1;
   }

   // Option is an argument set
   if ((A->Flags & HasArg) == HasArg)
   {
      if (Argument == nullptr)
	 return _error->Error(_("Option %s requires an argument."),argv[I]);
      Opt += strlen(Opt);
      I += IncI;

      if ((A->Flags & ConfigFile) == ConfigFile)
	 return ReadConfigFile(*Conf,Argument);

      if ((A->Flags & ArbItem) == ArbItem)
      {
	 const char * const J = strchr(Argument, '=');
	 if (J == nullptr)
	    return _error->Error(_("Option %s: Configuration item specification must have an =<val>."),argv[I]);

	 Conf->Set(string(Argument,J-Argument), J+1);
	 return true;
      }

      if ((A->Flags & List) == List)
      {
	 string const Item = string(A->ConfName) + "::";
	 for (auto const &Value : VectorizeString(Argument, ','))
	 {
	    string const Stripped = PkgCat::String::Strip(Value);
	    if (Stripped.empty() == false)
	       Conf->Set(Item, Stripped);
	 }
	 return true;
      }

      Conf->Set(A->ConfName,Argument);
      return true;
   }

   // Option is an integer level
   if ((A->Flags & IntLevel) == IntLevel)
   {
      if (Argument != nullptr)
      {
	 char *EndPtr;
	 long const Value = strtol(Argument,&EndPtr,10);

	 // Conversion failed and the argument was specified with an =s
	 if (EndPtr == Argument && CertainArg == true)
	    return _error->Error(_("Option %s requires an integer argument, not '%s'"),argv[I],Argument);

	 if (EndPtr != Argument && *EndPtr == 0)
	 {
	    Conf->Set(A->ConfName,static_cast<int>(Value));
	    Opt += strlen(Opt);
	    I += IncI;
	    return true;
	 }
      }

      // Increase the level
      Conf->Set(A->ConfName,Conf->FindI(A->ConfName)+1);
      return true;
   }

   // Option is a boolean
   int Sense = -1;  // -1 is unspecified, 0 is yes 1 is no
   string Preceding;

   while (true)
   {
      // Look at preceding text
      if (Argument == nullptr)
      {
	 if (PreceedMatch == false)
	    break;

	 // Skip the leading dash
	 const char *J = argv[I];
	 for (; *J != 0 && *J == '-'; J++);

	 const char *JEnd = strchr(J, '-');
	 if (JEnd == nullptr)
	    break;
	 Preceding.assign(J, JEnd - J);
	 Argument = Preceding.c_str();
	 CertainArg = true;
      }

      Sense = StringToBool(Argument);
      if (Sense >= 0)
      {
	 // Eat the argument
	 if (Argument != Preceding.c_str())
	 {
	    Opt += strlen(Opt);
	    I += IncI;
	 }
	 break;
      }

      if (CertainArg == true)
	 return _error->Error(_("Sense %s is not understood, try true or false."),Argument);

      Argument = nullptr;
   }

   // Indeterminate sense depends on the flag
   if (Sense == -1)
      Sense = ((A->Flags & InvBoolean) == InvBoolean) ? 0 : 1;

   Conf->Set(A->ConfName,Sense);
   return true;
}
									/*}}}*/
// CommandLine::FileSize - Count the number of filenames		/*{{{*/
unsigned int CommandLine::FileSize() const
{
   unsigned int Count = 0;
   for (const char **I = FileList; I != nullptr && *I != nullptr; I++)
      Count++;
   return Count;
}
									/*}}}*/
// CommandLine::DispatchArg - Do something with the first arg		/*{{{*/
bool CommandLine::DispatchArg(Dispatch const * const Map,bool NoMatch)
{
   if (FileSize() == 0)
   {
      if (NoMatch == true)
	 _error->Error(_("No operation given"));
      return false;
   }

   int I;
   for (I = 0; Map[I].Match != nullptr; I++)
   {
      if (strcmp(FileList[0],Map[I].Match) == 0)
      {
	 bool const Res = Map[I].Handler(*this);
	 if (Res == false && _error->PendingError() == false)
	    _error->Error("Handler silently failed");
	 return Res;
      }
   }

   if (NoMatch == true)
      _error->Error(_("Invalid operation %s"),FileList[0]);
   return false;
}
									/*}}}*/
CommandLine::Args CommandLine::MakeArgs(char ShortOpt, char const *LongOpt, char const *ConfName, unsigned long Flags)/*{{{*/
{
   CommandLine::Args arg;
   arg.ShortOpt = ShortOpt;
   arg.LongOpt = LongOpt;
   arg.ConfName = ConfName;
   arg.Flags = Flags;
   return arg;
}
									/*}}}*/
