// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Message stack shared by library and front-end

   Messages live in a list, the PendingFlag is set as long as the list
   contains an ERROR or FATAL item.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <pkgcat/configuration.h>
#include <pkgcat/error.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <list>
#include <string>
#include <vector>
#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
									/*}}}*/

// Global Error Object							/*{{{*/
GlobalError *_GetErrorObj()
{
   static thread_local GlobalError Obj;
   return &Obj;
}
									/*}}}*/
GlobalError::GlobalError() : PendingFlag(false) {}

// GlobalError::AddV - format a message and queue it			/*{{{*/
bool GlobalError::AddV(MsgType type, const char *Description, va_list &args)
{
   std::vector<char> S(400);
   va_list copy;
   va_copy(copy, args);
   int n = vsnprintf(S.data(), S.size(), Description, copy);
   va_end(copy);
   if (n < 0)
      return Add(type, Description);
   if (static_cast<size_t>(n) >= S.size())
   {
      S.resize(n + 1);
      vsnprintf(S.data(), S.size(), Description, args);
   }
   return Add(type, std::string(S.data(), n));
}
									/*}}}*/
// GlobalError::Add - Insert a new item at the end			/*{{{*/
bool GlobalError::Add(MsgType type, std::string &&Text)
{
   Messages.emplace_back(std::move(Text), type);
   if (type == ERROR || type == FATAL)
      PendingFlag = true;
   if (type == FATAL || type == DEBUG)
      std::clog << Messages.back() << std::endl;
   return false;
}
									/*}}}*/
// GlobalError::Errno, WarningE - Add with the errno description	/*{{{*/
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME (const char *Function, const char *Description,...) { \
   int const errsv = errno; \
   std::string Format(Description); \
   Format.append(" - ").append(Function).append(" (").append(std::to_string(errsv)); \
   Format.append(": ").append(strerror(errsv)).append(")"); \
   va_list args; \
   va_start(args, Description); \
   AddV(TYPE, Format.c_str(), args); \
   va_end(args); \
   return false; \
}
GEMessage(Errno, ERROR)
GEMessage(WarningE, WARNING)
#undef GEMessage
									/*}}}*/
// GlobalError::Fatal, Error, Warning, Notice and Debug - Add to the list/*{{{*/
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME (const char *Description,...) { \
   va_list args; \
   va_start(args, Description); \
   AddV(TYPE, Description, args); \
   va_end(args); \
   return false; \
}
GEMessage(Fatal, FATAL)
GEMessage(Error, ERROR)
GEMessage(Warning, WARNING)
GEMessage(Notice, NOTICE)
GEMessage(Debug, DEBUG)
#undef GEMessage
									/*}}}*/
bool GlobalError::Insert(MsgType const &type, const char *Description,...)/*{{{*/
{
   va_list args;
   va_start(args, Description);
   AddV(type, Description, args);
   va_end(args);
   return false;
}
									/*}}}*/
// GlobalError::PopMessage - Pulls a single message out			/*{{{*/
bool GlobalError::PopMessage(std::string &Text) {
   if (Messages.empty() == true)
      return false;

   Item const msg = Messages.front();
   Messages.pop_front();

   bool const Ret = (msg.Type == ERROR || msg.Type == FATAL);
   Text = msg.Text;
   if (PendingFlag == false || Ret == false)
      return Ret;

   PendingFlag = std::any_of(Messages.begin(), Messages.end(), [](Item const &m) {
      return m.Type == ERROR || m.Type == FATAL;
   });
   return Ret;
}
									/*}}}*/
// GlobalError::DumpErrors - Dump all of the errors/warns to out	/*{{{*/
void GlobalError::DumpErrors(std::ostream &out, MsgType const &threshold,
			     bool const &mergeStack) {
   if (mergeStack == true)
      for (auto s = Stacks.rbegin(); s != Stacks.rend(); ++s)
	 std::copy(s->Messages.rbegin(), s->Messages.rend(), std::front_inserter(Messages));

   for (auto const &m : Messages)
      if (m.Type >= threshold)
	 out << m << std::endl;

   Discard();
}
									/*}}}*/
void GlobalError::Discard() {						/*{{{*/
   Messages.clear();
   PendingFlag = false;
}
									/*}}}*/
// GlobalError::empty - does our error list include anything?		/*{{{*/
bool GlobalError::empty(MsgType const &threshold) const {
   if (PendingFlag == true)
      return false;
   return std::none_of(Messages.begin(), Messages.end(), [&threshold](Item const &m) {
      return m.Type >= threshold;
   });
}
									/*}}}*/
// GlobalError::PushToStack, RevertToStack, MergeWithStack		/*{{{*/
void GlobalError::PushToStack() {
   Stacks.emplace_back(Messages, PendingFlag);
   Discard();
}
void GlobalError::RevertToStack() {
   Discard();
   MsgStack pack = Stacks.back();
   Messages = pack.Messages;
   PendingFlag = pack.PendingFlag;
   Stacks.pop_back();
}
void GlobalError::MergeWithStack() {
   MsgStack pack = Stacks.back();
   Messages.splice(Messages.begin(), pack.Messages);
   PendingFlag = PendingFlag || pack.PendingFlag;
   Stacks.pop_back();
}
									/*}}}*/
// GlobalError::Item::operator<< - prefixed, possibly colored message	/*{{{*/
PKGCAT_HIDDEN std::ostream &operator<<(std::ostream &out, GlobalError::Item const &i)
{
   static constexpr auto COLOR_RESET = "\033[0m";
   static constexpr auto COLOR_NOTICE = "\033[33m";  // normal yellow
   static constexpr auto COLOR_WARN = "\033[1;33m";  // bold yellow
   static constexpr auto COLOR_ERROR = "\033[1;31m"; // bold red

   char const *color = nullptr;
   char prefix = 'D';
   switch (i.Type)
   {
   case GlobalError::FATAL:
   case GlobalError::ERROR:
      color = COLOR_ERROR;
      prefix = 'E';
      break;
   case GlobalError::WARNING:
      color = COLOR_WARN;
      prefix = 'W';
      break;
   case GlobalError::NOTICE:
      color = COLOR_NOTICE;
      prefix = 'N';
      break;
   case GlobalError::DEBUG:
      break;
   }
   if (color == nullptr || _config->FindB("PkgCat::Color", false) == false)
      out << prefix << ": ";
   else
      out << color << prefix << ": " << COLOR_RESET;

   // continuation lines are indented below the prefix
   std::string::size_type start = 0;
   std::string::size_type end;
   while ((end = i.Text.find('\n', start)) != std::string::npos)
   {
      out << i.Text.substr(start, end - start) << std::endl << "   ";
      start = end + 1;
   }
   out << i.Text.substr(start);
   return out;
}
									/*}}}*/
