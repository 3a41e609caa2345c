// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Debian Control Record - a single deb822 stanza

   Holds the fields of a control file in the order they were set. Field
   names are compared case-insensitively. Values are stored as they
   appear after the colon, continuation lines included with their
   leading space, so a value written by Write and read back by Scan
   compares equal.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DEBCONTROL_H
#define GIFTWRAP_DEBCONTROL_H

#include <giftwrap-pkg/macros.h>

#include <string>
#include <utility>
#include <vector>

class FileFd;

class GIFTWRAP_PUBLIC debControlRecord
{
   public:
   typedef std::pair<std::string, std::string> Field;

   private:
   std::vector<Field> Fields;

   std::vector<Field>::iterator Lookup(std::string const &Tag);
   std::vector<Field>::const_iterator Lookup(std::string const &Tag) const;

   public:

   /** \brief set the value of Tag
    *
    *  An existing field keeps its position, a new one is appended.
    */
   void Set(std::string const &Tag, std::string const &Value);
   bool Remove(std::string const &Tag);
   bool Exists(std::string const &Tag) const;
   std::string Find(std::string const &Tag, std::string const &Default = "") const;

   inline std::vector<Field> const &GetFields() const { return Fields; };
   inline size_t Count() const { return Fields.size(); };
   inline bool empty() const { return Fields.empty(); };
   inline void Clear() { Fields.clear(); };

   /** \brief the stanza as "Field: value" lines, each terminated by a newline */
   std::string ToString() const;
   bool Write(FileFd &File) const;

   /** \brief parse a single stanza
    *
    *  Parsing stops at the first empty line. Existing fields are dropped.
    *  \return \b false with an error on the stack for malformed input
    */
   bool Scan(char const *Start, unsigned long long Length);
   inline bool Scan(std::string const &Text) { return Scan(Text.c_str(), Text.length()); };
};

#endif
