// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Extract a Tar - Tar Extractor

   The tar extractor takes an optionally compressed tar stream from the
   given file and explodes it, passing the individual items to the
   given Directory Stream for processing.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_EXTRACTTAR_H
#define GIFTWRAP_EXTRACTTAR_H

#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/macros.h>

#include <string>

class pkgDirStream;

class GIFTWRAP_PUBLIC ExtractTar
{
   protected:

   struct TarHeader;

   // The various types items can be
   enum ItemType {NormalFile0 = '\0',NormalFile = '0',HardLink = '1',
                  SymbolicLink = '2',CharacterDevice = '3',
                  BlockDevice = '4',Directory = '5',FIFO = '6',
                  GNU_LongLink = 'K',GNU_LongName = 'L'};

   FileFd &File;
   unsigned long long MaxInSize;
   unsigned long long Consumed;
   FileFd InFd;
   std::string DecompressProg;

   bool StartDecompress();
   bool ReadBlocks(void *To, unsigned long long Size);
   bool ReadLongString(unsigned long long Length, std::string &Out);
   bool Done();

   public:

   bool Go(pkgDirStream &Stream);

   /** \param Fd is positioned at the start of the tar stream
    *  \param Max is the size of the stream in Fd, it is enforced for
    *             uncompressed streams only
    *  \param DecompressionProgram is the name of a compressor like
    *             "gzip", an empty name or "." reads the tar as is
    */
   ExtractTar(FileFd &Fd,unsigned long long Max,std::string DecompressionProgram);
   virtual ~ExtractTar();
};

#endif
