// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   String Util - Small string helpers used all over the place

   ##################################################################### */
									/*}}}*/
// Includes								/*{{{*/
#include <config.h>

#include <pkgcat/strutl.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include <ctype.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
									/*}}}*/

namespace PkgCat {
   namespace String {
// Strip - Remove white space from the front and back of a string	/*{{{*/
std::string Strip(const std::string &str)
{
   auto const start = std::find_if_not(str.begin(), str.end(), isspace_ascii);
   if (start == str.end())
      return "";
   auto const end = std::find_if_not(str.rbegin(), str.rend(), isspace_ascii).base();
   return std::string(start, end);
}
									/*}}}*/
bool Startswith(const std::string &s, const std::string &start)		/*{{{*/
{
   if (start.size() > s.size())
      return false;
   return (s.compare(0, start.size(), start) == 0);
}
									/*}}}*/
std::string Join(std::vector<std::string> const &list, const std::string &sep)/*{{{*/
{
   std::string joined;
   for (auto it = list.begin(); it != list.end(); ++it)
   {
      if (it != list.begin())
	 joined.append(sep);
      joined.append(*it);
   }
   return joined;
}
									/*}}}*/
   }
}

// ParseQuoteWord - Parse a single word out of a string			/*{{{*/
// ---------------------------------------------------------------------
/* Grabs a single whitespace terminated word and advances the pointer.
   Double quoted parts may contain whitespace, the quotes are removed
   and %XX escapes are decoded. */
bool ParseQuoteWord(const char *&String,std::string &Res)
{
   const char *C = String;
   for (;*C == ' '; ++C);
   if (*C == '\0')
      return false;

   std::string Word;
   for (; *C != '\0' && isspace(*C) == 0; ++C)
   {
      if (*C == '"')
      {
	 const char *End = strchr(C + 1, '"');
	 if (End == nullptr)
	    return false;
	 Word.append(C + 1, End);
	 C = End;
      }
      else if (*C == '%' && isxdigit(C[1]) != 0 && isxdigit(C[2]) != 0)
      {
	 char const Hex[3] = {C[1], C[2], '\0'};
	 Word.push_back(static_cast<char>(strtol(Hex, nullptr, 16)));
	 C += 2;
      }
      else
	 Word.push_back(*C);
   }

   for (;*C != '\0' && isspace(*C) != 0; ++C);
   Res = std::move(Word);
   String = C;
   return true;
}
									/*}}}*/
// ParseCWord - Parses a string like a C "" expression			/*{{{*/
// ---------------------------------------------------------------------
/* A series of whitespace separated "" strings is concatenated into a
   single string, anything outside of the quotes is an error. */
bool ParseCWord(const char *&String,std::string &Res)
{
   const char *C = String;
   for (;*C == ' '; ++C);
   if (*C == '\0')
      return false;

   std::string Word;
   for (; *C != '\0'; ++C)
   {
      if (*C == '"')
      {
	 const char *End = strchr(C + 1, '"');
	 if (End == nullptr)
	    return false;
	 Word.append(C + 1, End);
	 C = End;
	 continue;
      }
      if (isspace(*C) == 0)
	 return false;
      if (C != String && isspace(C[-1]) != 0)
	 continue;
      Word.push_back(' ');
   }
   Res = std::move(Word);
   String = C;
   return true;
}
									/*}}}*/
// QuoteString - Convert a string into quoted from			/*{{{*/
std::string QuoteString(const std::string &Str, const char *Bad)
{
   std::ostringstream Res;
   for (char const C : Str)
   {
      if (strchr(Bad, C) != nullptr || C == '%' || C <= 0x20 || C >= 0x7F)
	 ioprintf(Res, "%%%02hhx", C);
      else
	 Res << C;
   }
   return Res.str();
}
									/*}}}*/
// QuoteURI - percent-encode characters not allowed in a URI		/*{{{*/
std::string QuoteURI(std::string const &URI)
{
   std::ostringstream Res;
   for (char const C : URI)
   {
      if (strchr("\"<>\\^`{|}", C) != nullptr || C <= 0x20 || C >= 0x7F)
	 ioprintf(Res, "%%%02hhX", C);
      else
	 Res << C;
   }
   return Res.str();
}
									/*}}}*/
std::string HtmlEscape(std::string const &Text, bool const Quote)	/*{{{*/
{
   std::string Res;
   Res.reserve(Text.length());
   for (char const C : Text)
   {
      switch (C)
      {
	 case '&': Res.append("&amp;"); break;
	 case '<': Res.append("&lt;"); break;
	 case '>': Res.append("&gt;"); break;
	 case '"':
	    if (Quote == true)
	       Res.append("&quot;");
	    else
	       Res.push_back(C);
	    break;
	 default: Res.push_back(C); break;
      }
   }
   return Res;
}
									/*}}}*/
// WrapText - reflow text into indented lines				/*{{{*/
// ---------------------------------------------------------------------
/* A hyphen is a break opportunity if two letters (or letter, hyphen,
   letter) come before it and a letter, optionally followed by a hyphen,
   and another letter come after it. */
static bool IsHyphenBreak(std::string const &Word, size_t const I)
{
   auto const Letter = [&](size_t const P) {
      return P < Word.length() && (isalpha(static_cast<unsigned char>(Word[P])) != 0 || Word[P] == '_');
   };
   bool const Before = (I >= 2 && Letter(I - 1) && Letter(I - 2)) ||
      (I >= 3 && Letter(I - 1) && Word[I - 2] == '-' && Letter(I - 3));
   bool const After = Letter(I + 1) &&
      (Letter(I + 2) || (I + 2 < Word.length() && Word[I + 2] == '-' && Letter(I + 3)));
   return Before && After;
}
std::string WrapText(std::string const &Text, size_t const Width, size_t const Indent)
{
   // words, hyphenated words in pieces, with a " " chunk between words
   std::vector<std::string> Chunks;
   std::istringstream In(Text);
   for (std::string Word; In >> Word;)
   {
      if (Chunks.empty() == false)
	 Chunks.push_back(" ");
      size_t Start = 0;
      for (size_t I = 0; I < Word.length(); ++I)
	 if (Word[I] == '-' && IsHyphenBreak(Word, I) == true)
	 {
	    Chunks.push_back(Word.substr(Start, I + 1 - Start));
	    Start = I + 1;
	 }
      Chunks.push_back(Word.substr(Start));
   }

   std::vector<std::string> Lines;
   if (Width == 0)
   {
      if (Chunks.empty() == false)
	 Lines.push_back(PkgCat::String::Join(Chunks, ""));
      Chunks.clear();
   }
   std::reverse(Chunks.begin(), Chunks.end());
   while (Chunks.empty() == false)
   {
      std::string Line;
      if (Chunks.back() == " " && Lines.empty() == false)
	 Chunks.pop_back();
      while (Chunks.empty() == false && Line.length() + Chunks.back().length() <= Width)
      {
	 Line.append(Chunks.back());
	 Chunks.pop_back();
      }
      if (Chunks.empty() == false && Chunks.back().length() > Width)
      {
	 // fill the line with the start of a word too long for any line
	 std::string &Chunk = Chunks.back();
	 size_t const SpaceLeft = Width > Line.length() ? Width - Line.length() : 1;
	 size_t End = SpaceLeft;
	 auto const Hyphen = Chunk.rfind('-', SpaceLeft - 1);
	 if (Hyphen != std::string::npos && Hyphen > 0 && Chunk.find_first_not_of('-') < Hyphen)
	    End = Hyphen + 1;
	 Line.append(Chunk, 0, End);
	 Chunk.erase(0, End);
      }
      if (Line.empty() == false && Line.back() == ' ')
	 Line.pop_back();
      if (Line.empty() == false)
	 Lines.push_back(std::move(Line));
   }

   std::string const Prefix(Indent, ' ');
   std::string Res;
   for (auto const &L : Lines)
      Res.append(Prefix).append(L).append("\n");
   return Res;
}
									/*}}}*/
// SubstVar - Substitute a string for another string			/*{{{*/
std::string SubstVar(const std::string &Str,const std::string &Subst,const std::string &Contents)
{
   if (Subst.empty() == true)
      return Str;

   std::string Res;
   std::string::size_type Start = 0;
   for (auto Pos = Str.find(Subst); Pos != std::string::npos; Pos = Str.find(Subst, Start))
   {
      Res.append(Str, Start, Pos - Start).append(Contents);
      Start = Pos + Subst.length();
   }
   Res.append(Str, Start, std::string::npos);
   return Res;
}
									/*}}}*/
// stringcasecmp - Arbitrary case insensitive string compare		/*{{{*/
int stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd)
{
   for (; A != AEnd && B != BEnd; ++A, ++B)
      if (tolower_ascii(*A) != tolower_ascii(*B))
	 break;

   if (A == AEnd && B == BEnd)
      return 0;
   if (A == AEnd)
      return -1;
   if (B == BEnd)
      return 1;
   if (tolower_ascii(*A) < tolower_ascii(*B))
      return -1;
   return 1;
}
									/*}}}*/
// StringToBool - Converts a string into a boolean			/*{{{*/
int StringToBool(const std::string &Text,int Default)
{
   char *ParseEnd;
   int Res = strtol(Text.c_str(),&ParseEnd,0);
   if (ParseEnd == Text.c_str() + Text.size() && Text.empty() == false && Res >= 0 && Res <= 1)
      return Res;

   for (auto const no : {"no", "false", "without", "off", "disable"})
      if (strcasecmp(Text.c_str(), no) == 0)
	 return 0;
   for (auto const yes : {"yes", "true", "with", "on", "enable"})
      if (strcasecmp(Text.c_str(), yes) == 0)
	 return 1;
   return Default;
}
									/*}}}*/
// VectorizeString - split a string up by a character			/*{{{*/
std::vector<std::string> VectorizeString(std::string const &haystack, char const &split)
{
   std::vector<std::string> exploded;
   if (haystack.empty() == true)
      return exploded;
   std::string::size_type start = 0;
   for (auto end = haystack.find(split); end != std::string::npos; end = haystack.find(split, start))
   {
      exploded.emplace_back(haystack, start, end - start);
      start = end + 1;
   }
   if (start < haystack.length())
      exploded.emplace_back(haystack, start, std::string::npos);
   return exploded;
}
									/*}}}*/
// ioprintf - C format string outputter to iostreams				/*{{{*/
static std::string vstrprintf(const char *format, va_list &args)
{
   std::vector<char> S(400);
   va_list copy;
   va_copy(copy, args);
   int const n = vsnprintf(S.data(), S.size(), format, copy);
   va_end(copy);
   if (n < 0)
      return "";
   if (static_cast<size_t>(n) >= S.size())
   {
      S.resize(n + 1);
      vsnprintf(S.data(), S.size(), format, args);
   }
   return std::string(S.data(), n);
}
void ioprintf(std::ostream &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   out << vstrprintf(format, args);
   va_end(args);
}
									/*}}}*/
