// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Scanner for RFC-822 type header information

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <pkgcat/error.h>
#include <pkgcat/fileutl.h>
#include <pkgcat/strutl.h>
#include <pkgcat/tagfile.h>

#include <string>
#include <string_view>
#include <stdlib.h>

#include <pkgcati18n.h>
									/*}}}*/

static bool IsContinuation(std::string_view const Line)		/*{{{*/
{
   return Line.empty() == false && (Line[0] == ' ' || Line[0] == '\t');
}
									/*}}}*/
static std::string_view StripView(std::string_view S)			/*{{{*/
{
   while (S.empty() == false && isspace_ascii(S.front()) != 0)
      S.remove_prefix(1);
   while (S.empty() == false && isspace_ascii(S.back()) != 0)
      S.remove_suffix(1);
   return S;
}
									/*}}}*/
// TagSection::Scan - Scan for the end of the header information	/*{{{*/
// ---------------------------------------------------------------------
/* The value of a multi line field keeps the continuation lines as they
   are, including their leading whitespace, separated by newlines. */
bool pkgTagSection::Scan(std::string_view Text)
{
   Clear();
   Section.assign(Text.data(), Text.size());

   std::string_view Rest(Section);
   unsigned int LineNo = 0;
   while (Rest.empty() == false)
   {
      auto const newline = Rest.find('\n');
      std::string_view Line = Rest.substr(0, newline);
      Rest.remove_prefix(newline == std::string_view::npos ? Rest.size() : newline + 1);
      ++LineNo;

      if (IsContinuation(Line) == true)
      {
	 if (Fields.empty() == true)
	    return _error->Error(_("Continuation line %u without a field to continue"), LineNo);
	 auto &Value = Fields.back().second;
	 Value.push_back('\n');
	 Value.append(Line.data(), Line.length());
	 continue;
      }

      auto const colon = Line.find(':');
      if (colon == std::string_view::npos || colon == 0)
	 return _error->Error(_("Line %u is not a field: %s"), LineNo, std::string(Line).c_str());
      Fields.emplace_back(std::string(Line.substr(0, colon)), std::string(StripView(Line.substr(colon + 1))));
   }
   return true;
}
									/*}}}*/
void pkgTagSection::Clear()						/*{{{*/
{
   Section.clear();
   Fields.clear();
}
									/*}}}*/
// TagSection::Find - Locate a tag					/*{{{*/
std::string_view pkgTagSection::Find(std::string_view Tag) const
{
   for (auto F = Fields.rbegin(); F != Fields.rend(); ++F)
      if (F->first.length() == Tag.length() &&
	  stringcasecmp(F->first.data(), F->first.data() + F->first.length(), Tag.data(), Tag.data() + Tag.length()) == 0)
	 return F->second;
   return std::string_view();
}
bool pkgTagSection::Exists(std::string_view Tag) const
{
   for (auto const &F : Fields)
      if (F.first.length() == Tag.length() &&
	  stringcasecmp(F.first.data(), F.first.data() + F.first.length(), Tag.data(), Tag.data() + Tag.length()) == 0)
	 return true;
   return false;
}
									/*}}}*/
// TagSection::FindI - Find an integer					/*{{{*/
signed int pkgTagSection::FindI(std::string_view Tag,signed long Default) const
{
   std::string const Value = FindS(Tag);
   if (Value.empty() == true)
      return Default;
   char *End;
   signed long const Result = strtol(Value.c_str(), &End, 10);
   if (*End != '\0')
      return Default;
   return Result;
}
									/*}}}*/
bool pkgTagSection::FindB(std::string_view Tag, bool Default) const	/*{{{*/
{
   std::string const Value = FindS(Tag);
   if (Value.empty() == true)
      return Default;
   return StringToBool(Value, Default);
}
									/*}}}*/
void pkgTagSection::Get(std::string_view &Tag, std::string_view &Value, unsigned int I) const/*{{{*/
{
   Tag = Fields[I].first;
   Value = Fields[I].second;
}
									/*}}}*/

pkgTagFile::pkgTagFile(FileFd * const F, unsigned int const Flags) :	/*{{{*/
   Fd(F), Flags(Flags), Line(0), SectionLine(0)
{
}
									/*}}}*/
// TagFile::Step - Advance to the next section				/*{{{*/
// ---------------------------------------------------------------------
/* Blank lines before a stanza are skipped, the stanza ends at the next
   blank line or at the end of the file. */
bool pkgTagFile::Step(pkgTagSection &Section)
{
   std::string Stanza;
   std::string Input;
   while (Fd->ReadLine(Input) == true)
   {
      ++Line;
      if ((Flags & SUPPORT_COMMENTS) != 0 && Input.empty() == false && Input[0] == '#')
	 continue;
      if (PkgCat::String::Strip(Input).empty() == true)
      {
	 if (Stanza.empty() == true)
	    continue;
	 break;
      }
      if (Stanza.empty() == true)
	 SectionLine = Line;
      Stanza.append(Input).append("\n");
   }
   if (Fd->Failed() == true)
      return false;
   if (Stanza.empty() == true)
      return false;

   if (Section.Scan(Stanza) == false)
      return _error->Error(_("Unable to parse stanza starting at line %lu of %s"), SectionLine, Fd->Name().c_str());
   return true;
}
									/*}}}*/
