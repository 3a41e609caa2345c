// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   Tree-oriented storage for all runtime options of a build. Each option
   is addressed by a fully scoped name such as
     Giftwrap::Lintian::Fatal
   and carries a text value. Lookups are case-insensitive per scope.

   A trailing :: in a name given to Set() appends an anonymous child,
   which is how ordered lists are stored; FindVector() reads them back
   and also accepts a comma separated value on the parent node.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_CONFIGURATION_H
#define GIFTWRAP_CONFIGURATION_H

#include <iostream>
#include <string>
#include <vector>

#include <giftwrap-pkg/macros.h>

class GIFTWRAP_PUBLIC Configuration
{
   public:

   struct Item
   {
      std::string Value;
      std::string Tag;
      Item *Parent;
      Item *Child;
      Item *Next;

      std::string FullTag(const Item *Stop = 0) const;

      Item() : Parent(0), Child(0), Next(0) {};
   };

   private:

   Item *Root;

   Item *Lookup(Item *Head,const char *S,unsigned long const &Len,bool const &Create);
   Item *Lookup(const char *Name,const bool &Create);
   inline const Item *Lookup(const char *Name) const
   {
      return const_cast<Configuration *>(this)->Lookup(Name,false);
   }
   void FreeChildren(Item *Top);

   public:

   std::string Find(const char *Name,const char *Default = 0) const;
   std::string Find(std::string const &Name,const char *Default = 0) const {return Find(Name.c_str(),Default);};
   std::string Find(std::string const &Name, std::string const &Default) const {return Find(Name.c_str(),Default.c_str());};
   /** return a list of child options
    *
    * \param Name of the parent node
    * \param Default list of values separated by commas, used if the
    *        node has neither a value nor children */
   std::vector<std::string> FindVector(const char *Name, std::string const &Default = "") const;
   std::vector<std::string> FindVector(std::string const &Name, std::string const &Default = "") const { return FindVector(Name.c_str(), Default); };

   int FindI(const char *Name,int const &Default = 0) const;
   int FindI(std::string const &Name,int const &Default = 0) const {return FindI(Name.c_str(),Default);};
   bool FindB(const char *Name,bool const &Default = false) const;
   bool FindB(std::string const &Name,bool const &Default = false) const {return FindB(Name.c_str(),Default);};

   inline void Set(const std::string &Name,const std::string &Value) {Set(Name.c_str(),Value);};
   void Set(const char *Name,const std::string &Value);
   void Set(const char *Name,const int &Value);
   // only sets the value if it is empty
   void CndSet(const char *Name,const std::string &Value);
   void CndSet(const char *Name,const int Value);

   inline bool Exists(const std::string &Name) const {return Exists(Name.c_str());};
   bool Exists(const char *Name) const;

   // clear a whole tree
   void Clear(const std::string &Name);
   void Clear();

   // remove a certain value from a list
   void Clear(std::string const &List, std::string const &Value);

   inline const Item *Tree(const char *Name) const {return Lookup(Name);};

   inline void Dump() { Dump(std::clog); };
   void Dump(std::ostream& str) const;

   Configuration();
   Configuration(Configuration const &) = delete;
   Configuration &operator=(Configuration const &) = delete;
   ~Configuration();
};

GIFTWRAP_PUBLIC extern Configuration *_config;

#endif
