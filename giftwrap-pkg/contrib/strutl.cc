// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   String Util - String helpers used while rendering control data and
   parsing archive headers

   ##################################################################### */
									/*}}}*/
// Includes								/*{{{*/
#include <config.h>

#include <giftwrap-pkg/strutl.h>

#include <sstream>
#include <string>
#include <vector>

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
									/*}}}*/

namespace GiftWrap {
   namespace String {
// Strip - Remove white space from the front and back of a string	/*{{{*/
std::string Strip(const std::string &str)
{
   size_t start = 0;
   while (start < str.length() && isspace_ascii(str[start]) != 0)
      ++start;
   size_t end = str.length();
   while (end > start && isspace_ascii(str[end - 1]) != 0)
      --end;
   return str.substr(start, end - start);
}
									/*}}}*/
bool Endswith(const std::string &s, const std::string &end)		/*{{{*/
{
   if (end.size() > s.size())
      return false;
   return (s.compare(s.size() - end.size(), end.size(), end) == 0);
}
									/*}}}*/
bool Startswith(const std::string &s, const std::string &start)	/*{{{*/
{
   if (start.size() > s.size())
      return false;
   return (s.compare(0, start.size(), start) == 0);
}
									/*}}}*/
std::string Join(std::vector<std::string> const &list, const std::string &sep)/*{{{*/
{
   std::string Res;
   for (auto it = list.begin(); it != list.end(); ++it)
   {
      if (it != list.begin())
	 Res.append(sep);
      Res.append(*it);
   }
   return Res;
}
									/*}}}*/
   }
}

// stringcasecmp - Arbitrary case insensitive string compare		/*{{{*/
int stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd)
{
   for (; A != AEnd && B != BEnd; A++, B++)
      if (tolower_ascii(*A) != tolower_ascii(*B))
	 break;

   if (A == AEnd && B == BEnd)
      return 0;
   if (A == AEnd)
      return 1;
   if (B == BEnd)
      return -1;
   if (tolower_ascii(*A) < tolower_ascii(*B))
      return -1;
   return 1;
}
									/*}}}*/
// StringToBool - Converts a string into a boolean			/*{{{*/
// ---------------------------------------------------------------------
/* Accepts 0 and 1 as well as the usual spelled out variants */
int StringToBool(const std::string &Text,int Default)
{
   char *ParseEnd;
   int const Res = strtol(Text.c_str(),&ParseEnd,0);
   if (ParseEnd == Text.c_str() + Text.size() && Res >= 0 && Res <= 1)
      return Res;

   static char const * const Negatives[] = {"no", "false", "without", "off", "disable"};
   static char const * const Positives[] = {"yes", "true", "with", "on", "enable"};
   for (auto const N : Negatives)
      if (strcasecmp(Text.c_str(), N) == 0)
	 return 0;
   for (auto const P : Positives)
      if (strcasecmp(Text.c_str(), P) == 0)
	 return 1;
   return Default;
}
									/*}}}*/
// StrToNum - Convert a fixed length string to a number			/*{{{*/
// ---------------------------------------------------------------------
/* Decodes the space or NUL padded numeric fields of tar and ar headers.
   A field consisting only of spaces is zero. */
bool StrToNum(const char *Str,unsigned long long &Res,unsigned Len,unsigned Base)
{
   char S[30];
   if (Len >= sizeof(S))
      return false;
   memcpy(S,Str,Len);
   S[Len] = 0;

   Res = 0;
   unsigned I = 0;
   for (; S[I] == ' '; ++I);
   if (S[I] == 0)
      return true;

   char *End;
   Res = strtoull(S + I,&End,Base);
   if (End == S + I)
      return false;
   return true;
}
bool StrToNum(const char *Str,unsigned long &Res,unsigned Len,unsigned Base)
{
   unsigned long long Num = 0;
   if (StrToNum(Str, Num, Len, Base) == false)
      return false;
   Res = Num;
   return Res == Num;
}
									/*}}}*/
// Base256ToNum - Convert a fixed length binary to a number		/*{{{*/
// ---------------------------------------------------------------------
/* GNU tar stores numbers too large for the octal fields in big endian
   binary with the high bit of the first byte set */
bool Base256ToNum(const char *Str,unsigned long long &Res,unsigned int Len)
{
   if ((Str[0] & 0x80) == 0)
      return false;
   Res = Str[0] & 0x7F;
   for (unsigned int i = 1; i < Len; ++i)
      Res = (Res << 8) + static_cast<unsigned char>(Str[i]);
   return true;
}
									/*}}}*/
// VectorizeString - Split a string up into a vector of strings		/*{{{*/
std::vector<std::string> VectorizeString(std::string const &haystack, char const &split)
{
   std::vector<std::string> exploded;
   if (haystack.empty() == true)
      return exploded;
   std::string::size_type start = 0;
   while (true)
   {
      auto const end = haystack.find(split, start);
      exploded.push_back(haystack.substr(start, end - start));
      if (end == std::string::npos || end + 1 == haystack.length())
	 break;
      start = end + 1;
   }
   return exploded;
}
									/*}}}*/
// {str,io}printf - C format string outputter to C++ strings/iostreams	/*{{{*/
static std::string vformat(const char *format, va_list &args)
{
   std::vector<char> S(400);
   while (true)
   {
      va_list copy;
      va_copy(copy, args);
      int const n = vsnprintf(S.data(), S.size(), format, copy);
      va_end(copy);
      if (n > -1 && static_cast<size_t>(n) < S.size())
	 return S.data();
      S.resize(n > -1 ? n + 1 : S.size() * 2);
   }
}
void ioprintf(std::ostream &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   out << vformat(format, args);
   va_end(args);
}
void strprintf(std::string &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   out = vformat(format, args);
   va_end(args);
}
									/*}}}*/
