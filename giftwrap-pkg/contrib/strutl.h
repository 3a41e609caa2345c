// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   String Util - String helpers used while rendering control data and
   parsing archive headers

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_STRUTL_H
#define GIFTWRAP_STRUTL_H

#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <stdarg.h>

#include <giftwrap-pkg/macros.h>

namespace GiftWrap {
   namespace String {
      GIFTWRAP_PUBLIC std::string Strip(const std::string &s);
      GIFTWRAP_PUBLIC bool Endswith(const std::string &s, const std::string &ending);
      GIFTWRAP_PUBLIC bool Startswith(const std::string &s, const std::string &starting);
      GIFTWRAP_PUBLIC std::string Join(std::vector<std::string> const &list, const std::string &sep);
   }
}

GIFTWRAP_PUBLIC int StringToBool(const std::string &Text,int Default = -1);
GIFTWRAP_PUBLIC bool StrToNum(const char *Str,unsigned long &Res,unsigned Len,unsigned Base = 0);
GIFTWRAP_PUBLIC bool StrToNum(const char *Str,unsigned long long &Res,unsigned Len,unsigned Base = 0);
GIFTWRAP_PUBLIC bool Base256ToNum(const char *Str,unsigned long long &Res,unsigned int Len);

// split a given string by a char
GIFTWRAP_PUBLIC std::vector<std::string> VectorizeString(std::string const &haystack, char const &split) GIFTWRAP_PURE;

GIFTWRAP_PUBLIC void ioprintf(std::ostream &out,const char *format,...) GIFTWRAP_PRINTF(2);
GIFTWRAP_PUBLIC void strprintf(std::string &out,const char *format,...) GIFTWRAP_PRINTF(2);

static inline int tolower_ascii(int const c) GIFTWRAP_PURE;
static inline int tolower_ascii(int const c)
{
   return (c >= 'A' && c <= 'Z') ? c + 32 : c;
}
static inline int isspace_ascii(int const c) GIFTWRAP_PURE;
static inline int isspace_ascii(int const c)
{
   // 9='\t',10='\n',11='\v',12='\f',13='\r',32=' '
   return (c >= 9 && c <= 13) || c == ' ';
}

GIFTWRAP_PUBLIC int stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd) GIFTWRAP_PURE;
inline int stringcasecmp(const char *A,const char *B) {return stringcasecmp(A,A+strlen(A),B,B+strlen(B));}
inline int stringcasecmp(const std::string& A,const char *B) {return stringcasecmp(A.c_str(),A.c_str()+A.length(),B,B+strlen(B));}
inline int stringcasecmp(const std::string& A,const std::string& B) {return stringcasecmp(A.c_str(),A.c_str()+A.length(),B.c_str(),B.c_str()+B.length());}

#endif
