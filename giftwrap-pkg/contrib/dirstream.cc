// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Directory Stream

   The base class consumes the items without acting on them. A
   descriptor handed out by a subclass is closed here once the data
   was written.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/dirstream.h>
#include <giftwrap-pkg/error.h>

#include <unistd.h>

#include <giftwrapi18n.h>
									/*}}}*/

// DirStream::DoItem - Process an item					/*{{{*/
bool pkgDirStream::DoItem(Item &/*Itm*/,int &Fd)
{
   Fd = -1;
   return true;
}
									/*}}}*/
// DirStream::FinishedFile - Finished processing a file			/*{{{*/
bool pkgDirStream::FinishedFile(Item &Itm,int Fd)
{
   if (Fd < 0)
      return true;

   if (close(Fd) != 0)
      return _error->Errno("close",_("Failed to close file %s"),Itm.Name);
   return true;
}
									/*}}}*/
// DirStream::Fail - Failed processing a file				/*{{{*/
bool pkgDirStream::Fail(Item &/*Itm*/,int Fd)
{
   if (Fd < 0)
      return false;

   close(Fd);
   return false;
}
									/*}}}*/
