// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Directory Stream

   When reading an archive the items are passed into a directory stream
   class for processing. The low level archive handlers are only
   responsible for decoding the archive format and sending events (via
   method calls) to the specified directory stream.

   DoItem may hand back a file descriptor the data of a regular file is
   written to, -2 to get the data passed to Process instead, or leave it
   at -1 to have the data skipped. The defaults skip everything.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DIRSTREAM_H
#define GIFTWRAP_DIRSTREAM_H

#include <giftwrap-pkg/macros.h>

class GIFTWRAP_PUBLIC pkgDirStream
{
   public:

   // All possible information about a component
   struct Item
   {
      enum Type_t {File, HardLink, SymbolicLink, CharDevice, BlockDevice,
	           Directory, FIFO} Type;
      char *Name;
      char *LinkTarget;
      unsigned long Mode;
      unsigned long long UID;
      unsigned long long GID;
      unsigned long long Size;
      unsigned long long MTime;
      unsigned long Major;
      unsigned long Minor;
   };

   virtual bool DoItem(Item &Itm,int &Fd);
   virtual bool Fail(Item &Itm,int Fd);
   virtual bool FinishedFile(Item &Itm,int Fd);
   virtual bool Process(Item &/*Itm*/,const unsigned char * /*Data*/,
			unsigned long long /*Size*/,unsigned long long /*Pos*/) {return true;};

   virtual ~pkgDirStream() {};
};

#endif
