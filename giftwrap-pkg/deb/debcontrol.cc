// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Debian Control Record - a single deb822 stanza

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/debcontrol.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/strutl.h>

#include <algorithm>
#include <string>
#include <vector>

#include <giftwrapi18n.h>
									/*}}}*/

// ControlRecord::Lookup - Find a field by its name			/*{{{*/
std::vector<debControlRecord::Field>::iterator debControlRecord::Lookup(std::string const &Tag)
{
   return std::find_if(Fields.begin(), Fields.end(),
	 [&](Field const &F) { return stringcasecmp(F.first, Tag) == 0; });
}
std::vector<debControlRecord::Field>::const_iterator debControlRecord::Lookup(std::string const &Tag) const
{
   return std::find_if(Fields.begin(), Fields.end(),
	 [&](Field const &F) { return stringcasecmp(F.first, Tag) == 0; });
}
									/*}}}*/
void debControlRecord::Set(std::string const &Tag, std::string const &Value)/*{{{*/
{
   auto F = Lookup(Tag);
   if (F != Fields.end())
      F->second = Value;
   else
      Fields.emplace_back(Tag, Value);
}
									/*}}}*/
bool debControlRecord::Remove(std::string const &Tag)			/*{{{*/
{
   auto F = Lookup(Tag);
   if (F == Fields.end())
      return false;
   Fields.erase(F);
   return true;
}
									/*}}}*/
bool debControlRecord::Exists(std::string const &Tag) const		/*{{{*/
{
   return Lookup(Tag) != Fields.end();
}
									/*}}}*/
std::string debControlRecord::Find(std::string const &Tag, std::string const &Default) const/*{{{*/
{
   auto F = Lookup(Tag);
   if (F == Fields.end())
      return Default;
   return F->second;
}
									/*}}}*/
// ControlRecord::ToString - Render the stanza				/*{{{*/
// ---------------------------------------------------------------------
/* A value starting with a newline is a multi-line value without a
   first line, it is attached directly to the colon. */
std::string debControlRecord::ToString() const
{
   std::string Out;
   for (auto const &F : Fields)
   {
      Out.append(F.first);
      if (F.second.empty() || isspace_ascii(F.second[0]) != 0)
	 Out.append(":");
      else
	 Out.append(": ");
      Out.append(F.second);
      Out.append("\n");
   }
   return Out;
}
									/*}}}*/
bool debControlRecord::Write(FileFd &File) const			/*{{{*/
{
   return File.Write(ToString());
}
									/*}}}*/
// ControlRecord::Scan - Parse a stanza					/*{{{*/
// ---------------------------------------------------------------------
/* Leading empty lines are skipped, the first empty line after a field
   ends the stanza. Continuation lines start with a space or a tab. */
bool debControlRecord::Scan(char const *Start, unsigned long long Length)
{
   Fields.clear();
   char const * const End = Start + Length;
   char const *Stop = Start;
   unsigned int Line = 0;
   while (Stop < End)
   {
      char const *EOL = std::find(Stop, End, '\n');
      std::string Text(Stop, EOL);
      Stop = (EOL == End) ? End : EOL + 1;
      ++Line;

      // drop the trailing whitespace, this includes \r
      while (Text.empty() == false && isspace_ascii(Text.back()) != 0)
	 Text.pop_back();

      if (Text.empty() == true)
      {
	 if (Fields.empty() == true)
	    continue;
	 break;
      }

      if (isspace_ascii(Text[0]) != 0)
      {
	 if (Fields.empty() == true)
	    return _error->Error(_("Unexpected continuation line %u in control data"), Line);
	 Fields.back().second.append("\n").append(Text);
	 continue;
      }

      std::string::size_type const Colon = Text.find(':');
      if (Colon == std::string::npos)
	 return _error->Error(_("Line %u in control data has no colon"), Line);
      std::string const Tag = GiftWrap::String::Strip(Text.substr(0, Colon));
      if (Tag.empty() == true)
	 return _error->Error(_("Line %u in control data has an empty field name"), Line);
      if (Exists(Tag) == true)
	 return _error->Error(_("Duplicate field %s in control data"), Tag.c_str());

      std::string::size_type Value = Colon + 1;
      for (; Value < Text.length() && isspace_ascii(Text[Value]) != 0; ++Value)
	 ;
      Fields.emplace_back(Tag, Text.substr(Value));
   }
   return true;
}
									/*}}}*/
