// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   Storage of the configuration tree and the parser for configuration
   files.

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/fileutl.h>
#include <pkgcat/macros.h>
#include <pkgcat/strutl.h>

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <stack>
#include <string>
#include <string_view>
#include <vector>

#include <pkgcati18n.h>
									/*}}}*/

Configuration *_config = new Configuration;

// Configuration::Configuration - Constructor				/*{{{*/
Configuration::Configuration() : Root(new Item), ToFree(true)
{
}
Configuration::Configuration(const Item *Root) : Root(const_cast<Item *>(Root)), ToFree(false)
{
}
									/*}}}*/
// FreeItems - release an item and everything below and after it	/*{{{*/
static void FreeItems(Configuration::Item *I)
{
   while (I != nullptr)
   {
      FreeItems(I->Child);
      Configuration::Item *Next = I->Next;
      delete I;
      I = Next;
   }
}
									/*}}}*/
Configuration::~Configuration()						/*{{{*/
{
   if (ToFree == false)
      return;
   FreeItems(Root->Child);
   delete Root;
}
									/*}}}*/
// Configuration::Lookup - Lookup a single item				/*{{{*/
// ---------------------------------------------------------------------
/* Finds the child of Head with the given tag, tags are compared case
   insensitive. An empty tag never matches so that Create appends a new
   anonymous list item instead. */
Configuration::Item *Configuration::Lookup(Item *Head,const char *S,
					   unsigned long const &Len,bool const &Create)
{
   Item **Last = &Head->Child;
   for (Item *I = Head->Child; I != nullptr; Last = &I->Next, I = I->Next)
      if (Len != 0 && Len == I->Tag.length() && stringcasecmp(I->Tag, S, S + Len) == 0)
	 return I;

   if (Create == false)
      return nullptr;

   Item *I = new Item;
   I->Tag.assign(S,Len);
   I->Parent = Head;
   *Last = I;
   return I;
}
									/*}}}*/
// Configuration::Lookup - Lookup a fully scoped item			/*{{{*/
Configuration::Item *Configuration::Lookup(const char *Name,bool const &Create)
{
   if (Name == nullptr)
      return Root->Child;

   std::string_view Rest(Name);
   Item *Itm = Root;
   for (size_t Sep = Rest.find("::"); Sep != std::string_view::npos; Sep = Rest.find("::"))
   {
      Itm = Lookup(Itm, Rest.data(), Sep, Create);
      if (Itm == nullptr)
	 return nullptr;
      Rest.remove_prefix(Sep + 2);
   }

   // a trailing :: creates a new list item
   if (Rest.empty() == true && Create == false)
      return nullptr;
   return Lookup(Itm, Rest.data(), Rest.length(), Create);
}
									/*}}}*/
// Configuration::Find - Find a value					/*{{{*/
std::string Configuration::Find(const char *Name,const char *Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == nullptr || Itm->Value.empty() == true)
      return Default == nullptr ? "" : Default;
   return Itm->Value;
}
									/*}}}*/
// Configuration::FindFile - Find a Filename				/*{{{*/
// ---------------------------------------------------------------------
/* Relative values are prefixed with the values of the parent nodes, so
   Dir "/"; Dir::Catalog "usr/share/pkgcat/catalog"; gives an absolute
   path. RootDir is prepended to everything. */
std::string Configuration::FindFile(const char *Name,const char *Default) const
{
   std::string result = Find("RootDir");
   if (result.empty() == false && result.back() != '/')
      result.push_back('/');

   const Item *Itm = Lookup(Name);
   if (Itm == nullptr || Itm->Value.empty() == true)
   {
      if (Default != nullptr)
	 result.append(Default);
      return flNormalize(result);
   }

   std::string val = Itm->Value;
   for (; Itm->Parent != nullptr; Itm = Itm->Parent)
   {
      if (Itm->Parent->Value.empty() == true)
	 continue;
      using PkgCat::String::Startswith;
      if (val[0] == '/' || Startswith(val, "./") || Startswith(val, "../") || Startswith(val, "~/"))
	 break;
      if (Itm->Parent->Value.back() != '/')
	 val.insert(0, "/");
      val.insert(0, Itm->Parent->Value);
   }
   result.append(val);
   return flNormalize(result);
}
									/*}}}*/
// Configuration::FindDir - Find a directory name			/*{{{*/
std::string Configuration::FindDir(const char *Name,const char *Default) const
{
   std::string Res = FindFile(Name,Default);
   if (Res.empty() == true || Res.back() != '/')
      Res.push_back('/');
   return Res;
}
									/*}}}*/
// Configuration::FindVector - Find a vector of values			/*{{{*/
std::vector<std::string> Configuration::FindVector(const char *Name, std::string const &Default) const
{
   const Item *Top = Lookup(Name);
   if (Top == nullptr)
      return VectorizeString(Default, ',');
   if (Top->Value.empty() == false)
      return VectorizeString(Top->Value, ',');

   std::vector<std::string> Vec;
   for (Item const *I = Top->Child; I != nullptr; I = I->Next)
      Vec.push_back(I->Value);
   if (Vec.empty() == true)
      return VectorizeString(Default, ',');
   return Vec;
}
									/*}}}*/
int Configuration::FindI(const char *Name,int const &Default) const	/*{{{*/
{
   const Item *Itm = Lookup(Name);
   if (Itm == nullptr || Itm->Value.empty() == true)
      return Default;

   char *End;
   int Res = strtol(Itm->Value.c_str(),&End,0);
   if (End == Itm->Value.c_str())
      return Default;
   return Res;
}
									/*}}}*/
bool Configuration::FindB(const char *Name,bool const &Default) const	/*{{{*/
{
   const Item *Itm = Lookup(Name);
   if (Itm == nullptr || Itm->Value.empty() == true)
      return Default;
   return StringToBool(Itm->Value,Default);
}
									/*}}}*/
// Configuration::CndSet - Conditional Set a value			/*{{{*/
// ---------------------------------------------------------------------
/* This will not overwrite */
void Configuration::CndSet(const char *Name,const std::string &Value)
{
   Item *Itm = Lookup(Name,true);
   if (Itm != nullptr && Itm->Value.empty() == true)
      Itm->Value = Value;
}
void Configuration::CndSet(const char *Name,int const Value)
{
   CndSet(Name, std::to_string(Value));
}
									/*}}}*/
// Configuration::Set - Set a value					/*{{{*/
void Configuration::Set(const char *Name,const std::string &Value)
{
   Item *Itm = Lookup(Name,true);
   if (Itm != nullptr)
      Itm->Value = Value;
}
void Configuration::Set(const char *Name,int const &Value)
{
   Set(Name, std::to_string(Value));
}
									/*}}}*/
// Configuration::Clear - Clear an single value from a list	        /*{{{*/
void Configuration::Clear(std::string const &Name, std::string const &Value)
{
   Item *Top = Lookup(Name.c_str(),false);
   if (Top == nullptr)
      return;

   Item **Link = &Top->Child;
   while (*Link != nullptr)
   {
      Item *I = *Link;
      if (I->Value != Value)
      {
	 Link = &I->Next;
	 continue;
      }
      *Link = I->Next;
      FreeItems(I->Child);
      delete I;
   }
}
									/*}}}*/
// Configuration::Clear - Clear everything				/*{{{*/
void Configuration::Clear()
{
   FreeItems(Root->Child);
   Root->Child = nullptr;
}
									/*}}}*/
// Configuration::Clear - Clear an entire tree				/*{{{*/
void Configuration::Clear(std::string const &Name)
{
   Item *Top = Lookup(Name.c_str(),false);
   if (Top == nullptr)
      return;
   Top->Value.clear();
   FreeItems(Top->Child);
   Top->Child = nullptr;
}
									/*}}}*/
bool Configuration::Exists(const char *Name) const			/*{{{*/
{
   return Lookup(Name) != nullptr;
}
									/*}}}*/
// Configuration::Dump - Dump the config				/*{{{*/
// ---------------------------------------------------------------------
/* Writes the tree in a form ReadConfigFile can read back */
void Configuration::Dump(std::ostream& str)
{
   const Item *Top = Tree(nullptr);
   while (Top != nullptr)
   {
      str << QuoteString(Top->FullTag(), "=\"\n") << " \"" << Top->Value << "\";" << std::endl;
      if (Top->Child != nullptr)
      {
	 Top = Top->Child;
	 continue;
      }
      while (Top != nullptr && Top->Next == nullptr)
	 Top = Top->Parent;
      if (Top != nullptr)
	 Top = Top->Next;
   }
}
									/*}}}*/
// Configuration::Item::FullTag - Return the fully scoped tag		/*{{{*/
std::string Configuration::Item::FullTag(const Item *Stop) const
{
   if (Parent == nullptr || Parent->Parent == nullptr || Parent == Stop)
      return Tag;
   return Parent->FullTag(Stop) + "::" + Tag;
}
									/*}}}*/

// StripComments - remove comments outside of quotes			/*{{{*/
// ---------------------------------------------------------------------
/* Handles //, # and the multi line style. InComment carries the state of
   an unterminated multi line comment over to the next line. The # of the
   #clear and #include directives is not a comment. */
static std::string StripComments(std::string_view Line, bool &InComment)
{
   std::string Result;
   bool InQuote = false;
   for (size_t I = 0; I < Line.length(); ++I)
   {
      if (InComment == true)
      {
	 if (Line.compare(I, 2, "*/") == 0)
	 {
	    InComment = false;
	    ++I;
	 }
	 continue;
      }
      char const C = Line[I];
      if (C == '"')
	 InQuote = not InQuote;
      else if (InQuote == false)
      {
	 if (Line.compare(I, 2, "//") == 0)
	    break;
	 if (Line.compare(I, 2, "/*") == 0)
	 {
	    InComment = true;
	    ++I;
	    continue;
	 }
	 if (C == '#' && Line.compare(I + 1, 5, "clear") != 0 && Line.compare(I + 1, 7, "include") != 0)
	    break;
      }
      Result.push_back(C);
   }
   return Result;
}
									/*}}}*/
// ReadConfigFile - Read a configuration file				/*{{{*/
// ---------------------------------------------------------------------
/* Statements are terminated by ';', blocks opened by '{' and closed by
   '}'. A statement is a tag followed by an optional value, a value
   without a tag inside a block appends to the list named by the block. */
bool ReadConfigFile(Configuration &Conf,const std::string &FName,unsigned const &Depth)
{
   FileFd F;
   if (F.Open(FName, FileFd::ReadOnly) == false)
      return false;

   std::stack<std::string> Scopes;
   std::string ParentTag;
   std::string Statement;
   bool InComment = false;
   unsigned int CurLine = 0;
   std::string Input;
   while (F.ReadLine(Input) == true)
   {
      ++CurLine;
      std::string const Line = StripComments(Input, InComment);
      bool InQuote = false;
      for (char const C : Line)
      {
	 if (C == '"')
	    InQuote = not InQuote;
	 if (InQuote == true)
	 {
	    Statement.push_back(C);
	    continue;
	 }
	 if (C != '{' && C != ';' && C != '}')
	 {
	    if (isspace(C) == 0 || (Statement.empty() == false && Statement.back() != ' '))
	       Statement.push_back(isspace(C) != 0 ? ' ' : C);
	    continue;
	 }

	 Statement = PkgCat::String::Strip(Statement);
	 if (C == '{' && Statement.empty() == true)
	    return _error->Error(_("Syntax error %s:%u: Block starts with no name."),FName.c_str(),CurLine);

	 if (Statement.empty() == false)
	 {
	    std::string Tag;
	    const char *Pos = Statement.c_str();
	    if (ParseQuoteWord(Pos,Tag) == false)
	       return _error->Error(_("Syntax error %s:%u: Malformed tag"),FName.c_str(),CurLine);

	    std::string Word;
	    bool NoWord = false;
	    if (ParseCWord(Pos,Word) == false && ParseQuoteWord(Pos,Word) == false)
	    {
	       if (C == '{')
		  NoWord = true;
	       else
		  std::swap(Word, Tag);
	    }
	    if (*Pos != '\0')
	       return _error->Error(_("Syntax error %s:%u: Extra junk after value"),FName.c_str(),CurLine);

	    std::string Item = ParentTag;
	    if (C == '{')
	    {
	       Scopes.push(ParentTag);
	       ParentTag = ParentTag.empty() ? Tag : ParentTag + "::" + Tag;
	       Item = ParentTag;
	    }
	    else if (Item.empty() == true)
	       Item = Tag;
	    else
	       Item.append("::").append(Tag);

	    if (Tag.empty() == false && Tag[0] == '#')
	    {
	       if (Scopes.empty() == false)
		  return _error->Error(_("Syntax error %s:%u: Directives can only be done at the top level"),FName.c_str(),CurLine);
	       if (Tag == "#clear")
		  Conf.Clear(Word);
	       else if (Tag == "#include")
	       {
		  if (Depth > 10)
		     return _error->Error(_("Syntax error %s:%u: Too many nested includes"),FName.c_str(),CurLine);
		  bool const Okay = (Word.length() > 2 && Word.back() == '/') ?
		     ReadConfigDir(Conf, Word, Depth + 1) : ReadConfigFile(Conf, Word, Depth + 1);
		  if (Okay == false)
		     return _error->Error(_("Syntax error %s:%u: Included from here"),FName.c_str(),CurLine);
	       }
	       else
		  return _error->Error(_("Syntax error %s:%u: Unsupported directive '%s'"),FName.c_str(),CurLine,Tag.c_str());
	    }
	    else if (NoWord == false)
	       Conf.Set(Item,Word);
	    Statement.clear();
	 }

	 if (C == '}')
	 {
	    if (Scopes.empty() == true)
	       return _error->Error(_("Syntax error %s:%u: Unbalanced '}'"),FName.c_str(),CurLine);
	    ParentTag = Scopes.top();
	    Scopes.pop();
	 }
      }
      if (Statement.empty() == false)
	 Statement.push_back(' ');
   }
   if (F.Failed() == true)
      return false;

   if (PkgCat::String::Strip(Statement).empty() == false)
      return _error->Error(_("Syntax error %s:%u: Extra junk at end of file"),FName.c_str(),CurLine);
   return true;
}
									/*}}}*/
// ReadConfigDir - Read a directory of config files			/*{{{*/
bool ReadConfigDir(Configuration &Conf,const std::string &Dir,unsigned const &Depth)
{
   bool Okay = true;
   for (auto const &File : GetListOfFilesInDir(Dir, "conf", true, true))
      Okay = ReadConfigFile(Conf, File, Depth) && Okay;
   return Okay;
}
									/*}}}*/
