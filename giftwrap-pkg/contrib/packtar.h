// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Pack a Tar - Tar Writer

   Writes a directory tree as a GNU tar stream into a FileFd, which
   takes care of the compression. The counterpart of ExtractTar.

   The stream is reproducible: the entries are sorted by name, owned by
   root:root and the modification times are clamped to
   SOURCE_DATE_EPOCH if it is set.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_PACKTAR_H
#define GIFTWRAP_PACKTAR_H

#include <giftwrap-pkg/macros.h>

#include <ctime>
#include <string>

class FileFd;

class GIFTWRAP_PUBLIC PackTar
{
   public:

   struct TarHeader;

   protected:

   FileFd &Out;
   bool HaveClamp;
   time_t Clamp;

   bool WriteHeader(TarHeader &Head);
   bool WriteLongRecord(char const Type, std::string const &Value);
   bool WriteData(std::string const &Path, unsigned long long const Size);
   bool AddEntry(std::string const &Root, std::string const &Rel);

   public:

   /** \brief write Root and everything below it, then the end marker
    *
    *  The members are named "./" for Root itself and "./<path>" for the
    *  entries below, directories get a trailing slash. Only regular
    *  files, directories and symlinks can be stored.
    */
   bool Go(std::string const &Root);

   explicit PackTar(FileFd &Out);
   virtual ~PackTar() {};
};

#endif
