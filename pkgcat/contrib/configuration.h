// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   Tree-oriented store for all runtime configuration. Names are fully
   scoped strings such as
     PkgCat::List::Format
   with a text value attached. A trailing :: designates a list item, so
     PkgCat::List::Tags:: "web";
   appends to the list which is read back with FindVector.

   The configuration file format understood by ReadConfigFile is the one
   of bind's named.conf:
     PkgCat::Report { Project "Spack"; Description-Width "72"; };

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_CONFIGURATION_H
#define PKGCAT_CONFIGURATION_H

#include <iostream>
#include <string>
#include <vector>

#include <pkgcat/macros.h>

class PKGCAT_PUBLIC Configuration
{
   public:

   struct Item
   {
      std::string Value;
      std::string Tag;
      Item *Parent;
      Item *Child;
      Item *Next;

      std::string FullTag(const Item *Stop = nullptr) const;

      Item() : Parent(nullptr), Child(nullptr), Next(nullptr) {};
   };

   private:

   Item *Root;
   bool ToFree;

   Item *Lookup(Item *Head,const char *S,unsigned long const &Len,bool const &Create);
   Item *Lookup(const char *Name,const bool &Create);
   inline const Item *Lookup(const char *Name) const
   {
      return const_cast<Configuration *>(this)->Lookup(Name,false);
   }

   public:

   std::string Find(const char *Name,const char *Default = nullptr) const;
   std::string Find(std::string const &Name,const char *Default = nullptr) const {return Find(Name.c_str(),Default);};
   std::string Find(std::string const &Name, std::string const &Default) const {return Find(Name.c_str(),Default.c_str());};
   std::string FindFile(const char *Name,const char *Default = nullptr) const;
   std::string FindDir(const char *Name,const char *Default = nullptr) const;
   /** return the values of a list option
    *
    * \param Name of the parent node
    * \param Default comma separated values used if the list is empty */
   std::vector<std::string> FindVector(const char *Name, std::string const &Default = "") const;
   std::vector<std::string> FindVector(std::string const &Name, std::string const &Default = "") const { return FindVector(Name.c_str(), Default); };

   int FindI(const char *Name,int const &Default = 0) const;
   int FindI(std::string const &Name,int const &Default = 0) const {return FindI(Name.c_str(),Default);};
   bool FindB(const char *Name,bool const &Default = false) const;
   bool FindB(std::string const &Name,bool const &Default = false) const {return FindB(Name.c_str(),Default);};

   inline void Set(const std::string &Name,const std::string &Value) {Set(Name.c_str(),Value);};
   void CndSet(const char *Name,const std::string &Value);
   void CndSet(const char *Name,const int Value);
   void Set(const char *Name,const std::string &Value);
   void Set(const char *Name,const int &Value);

   inline bool Exists(const std::string &Name) const {return Exists(Name.c_str());};
   bool Exists(const char *Name) const;

   // clear a whole tree
   void Clear(const std::string &Name);
   void Clear();

   // remove a certain value from a list
   void Clear(std::string const &List, std::string const &Value);

   inline const Item *Tree(const char *Name) const {return Lookup(Name);};

   inline void Dump() { Dump(std::clog); };
   void Dump(std::ostream& str);

   explicit Configuration(const Item *Root);
   Configuration();
   ~Configuration();
};

PKGCAT_PUBLIC extern Configuration *_config;

PKGCAT_PUBLIC bool ReadConfigFile(Configuration &Conf,const std::string &FName,
		    unsigned const &Depth = 0);

PKGCAT_PUBLIC bool ReadConfigDir(Configuration &Conf,const std::string &Dir,
		   unsigned const &Depth = 0);

#endif
