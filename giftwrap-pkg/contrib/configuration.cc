// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   Items form a tree of singly linked sibling lists. Only storage and
   lookup live here, defaults are installed by gwInitConfig().

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/macros.h>
#include <giftwrap-pkg/strutl.h>

#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>
									/*}}}*/

Configuration *_config = new Configuration;

// Configuration::Configuration - Constructor				/*{{{*/
Configuration::Configuration() : Root(new Item)
{
}
									/*}}}*/
// Configuration::~Configuration - Destructor				/*{{{*/
Configuration::~Configuration()
{
   FreeChildren(Root);
   delete Root;
}
									/*}}}*/
// Configuration::FreeChildren - Delete everything below an item	/*{{{*/
void Configuration::FreeChildren(Item *Top)
{
   Item *I = Top->Child;
   Top->Child = 0;
   while (I != 0)
   {
      Item *Next = I->Next;
      FreeChildren(I);
      delete I;
      I = Next;
   }
}
									/*}}}*/
// Configuration::Lookup - Lookup a single item				/*{{{*/
// ---------------------------------------------------------------------
/* Finds the child of Head with the given tag, optionally creating it at
   the end of the sibling list. An empty tag never matches, so a trailing
   :: always appends a new list entry. */
Configuration::Item *Configuration::Lookup(Item *Head,const char *S,
					   unsigned long const &Len,bool const &Create)
{
   Item **Last = &Head->Child;
   for (Item *I = Head->Child; I != 0; Last = &I->Next, I = I->Next)
      if (Len != 0 && Len == I->Tag.length() &&
	  stringcasecmp(I->Tag.c_str(), I->Tag.c_str() + Len, S, S + Len) == 0)
	 return I;

   if (Create == false)
      return 0;

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
   if (Name == 0)
      return Root->Child;

   const char *Start = Name;
   const char *End = Start + strlen(Name);
   Item *Itm = Root;
   for (const char *TagEnd = Name; End - TagEnd >= 2; ++TagEnd)
   {
      if (TagEnd[0] != ':' || TagEnd[1] != ':')
	 continue;
      Itm = Lookup(Itm,Start,TagEnd - Start,Create);
      if (Itm == 0)
	 return 0;
      TagEnd = Start = TagEnd + 2;
      if (End - TagEnd < 2)
	 break;
      --TagEnd;
   }

   if (End == Start && Create == false)
      return 0;

   return Lookup(Itm,Start,End - Start,Create);
}
									/*}}}*/
// Configuration::Find - Find a value					/*{{{*/
std::string Configuration::Find(const char *Name,const char *Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == 0 || Itm->Value.empty() == true)
      return Default == 0 ? "" : Default;
   return Itm->Value;
}
									/*}}}*/
// Configuration::FindVector - Find a vector of values			/*{{{*/
std::vector<std::string> Configuration::FindVector(const char *Name, std::string const &Default) const
{
   const Item *Top = Lookup(Name);
   if (Top == 0)
      return VectorizeString(Default, ',');

   if (Top->Value.empty() == false)
      return VectorizeString(Top->Value, ',');

   std::vector<std::string> Vec;
   for (const Item *I = Top->Child; I != 0; I = I->Next)
      Vec.push_back(I->Value);
   if (Vec.empty() == true)
      return VectorizeString(Default, ',');
   return Vec;
}
									/*}}}*/
// Configuration::FindI - Find an integer value				/*{{{*/
int Configuration::FindI(const char *Name,int const &Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == 0 || Itm->Value.empty() == true)
      return Default;

   char *End;
   int const Res = strtol(Itm->Value.c_str(),&End,0);
   if (End == Itm->Value.c_str())
      return Default;
   return Res;
}
									/*}}}*/
// Configuration::FindB - Find a boolean type				/*{{{*/
bool Configuration::FindB(const char *Name,bool const &Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == 0 || Itm->Value.empty() == true)
      return Default;
   return StringToBool(Itm->Value,Default);
}
									/*}}}*/
// Configuration::CndSet - Conditional Set a value			/*{{{*/
void Configuration::CndSet(const char *Name,const std::string &Value)
{
   Item *Itm = Lookup(Name,true);
   if (Itm != 0 && Itm->Value.empty() == true)
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
   if (Itm != 0)
      Itm->Value = Value;
}
void Configuration::Set(const char *Name,int const &Value)
{
   Set(Name, std::to_string(Value));
}
									/*}}}*/
// Configuration::Clear - Clear a single value from a list		/*{{{*/
void Configuration::Clear(std::string const &Name, std::string const &Value)
{
   Item *Top = Lookup(Name.c_str(),false);
   if (Top == 0)
      return;

   Item **Link = &Top->Child;
   while (*Link != 0)
   {
      Item *I = *Link;
      if (I->Value != Value)
      {
	 Link = &I->Next;
	 continue;
      }
      *Link = I->Next;
      FreeChildren(I);
      delete I;
   }
}
									/*}}}*/
// Configuration::Clear - Clear everything				/*{{{*/
void Configuration::Clear()
{
   FreeChildren(Root);
}
									/*}}}*/
// Configuration::Clear - Clear an entire tree				/*{{{*/
// ---------------------------------------------------------------------
/* The node itself stays, but loses its value and all children */
void Configuration::Clear(std::string const &Name)
{
   Item *Top = Lookup(Name.c_str(),false);
   if (Top == 0)
      return;
   Top->Value.clear();
   FreeChildren(Top);
}
									/*}}}*/
// Configuration::Exists - Returns true if the Name exists		/*{{{*/
bool Configuration::Exists(const char *Name) const
{
   return Lookup(Name) != 0;
}
									/*}}}*/
// Configuration::Dump - Dump the config				/*{{{*/
// ---------------------------------------------------------------------
/* Writes every node with a value as 'Full::Tag "value";' */
void Configuration::Dump(std::ostream& str) const
{
   const Item *Top = Root->Child;
   while (Top != 0)
   {
      if (Top->Value.empty() == false)
	 str << Top->FullTag() << " \"" << Top->Value << "\";" << std::endl;

      if (Top->Child != 0)
      {
	 Top = Top->Child;
	 continue;
      }
      while (Top != 0 && Top->Next == 0)
	 Top = Top->Parent == Root ? 0 : Top->Parent;
      if (Top != 0)
	 Top = Top->Next;
   }
}
									/*}}}*/
// Configuration::Item::FullTag - Return the fully scoped tag		/*{{{*/
std::string Configuration::Item::FullTag(const Item *Stop) const
{
   if (Parent == 0 || Parent->Parent == 0 || Parent == Stop)
      return Tag;
   return Parent->FullTag(Stop) + "::" + Tag;
}
									/*}}}*/
