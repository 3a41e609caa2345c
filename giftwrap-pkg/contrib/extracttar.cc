// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Extract a Tar - Tar Extractor

   The decompressing FileFd is opened on the descriptor of the file the
   tar stream is embedded in, so the stream can sit in the middle of an
   ar file. The compression libraries stop at the end of the compressed
   stream and the tar stream itself ends in a block of zeros, so the
   trailing data is never looked at.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/compressors.h>
#include <giftwrap-pkg/dirstream.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/extracttar.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/strutl.h>

#include <algorithm>
#include <string>
#include <string.h>

#include <giftwrapi18n.h>
									/*}}}*/

// The on disk header for a tar file.
struct ExtractTar::TarHeader
{
   char Name[100];
   char Mode[8];
   char UserID[8];
   char GroupID[8];
   char Size[12];
   char MTime[12];
   char Checksum[8];
   char LinkFlag;
   char LinkName[100];
   char MagicNumber[8];
   char UserName[32];
   char GroupName[32];
   char Major[8];
   char Minor[8];
};

// ExtractTar::ExtractTar - Constructor					/*{{{*/
// ---------------------------------------------------------------------
/* */
ExtractTar::ExtractTar(FileFd &Fd,unsigned long long Max,std::string DecompressionProgram)
	: File(Fd), MaxInSize(Max), Consumed(0), DecompressProg(DecompressionProgram)
{
}
									/*}}}*/
// ExtractTar::ExtractTar - Destructor					/*{{{*/
// ---------------------------------------------------------------------
/* */
ExtractTar::~ExtractTar()
{
   // Error close
   Done();
}
									/*}}}*/
// ExtractTar::Done - Close the input					/*{{{*/
bool ExtractTar::Done()
{
   return InFd.Close();
}
									/*}}}*/
// ExtractTar::StartDecompress - Open the (de)compressing input	/*{{{*/
// ---------------------------------------------------------------------
/* The input is a view on the descriptor of File which stays open
   after we are done with it. */
bool ExtractTar::StartDecompress()
{
   if (DecompressProg.empty() == true || DecompressProg == ".")
      return InFd.OpenDescriptor(File.Fd(), FileFd::ReadOnly, FileFd::None, false);

   GiftWrap::Configuration::Compressor Comp;
   if (GiftWrap::Configuration::findCompressor(DecompressProg, Comp) == false)
      return _error->Error(_("Cannot find a configured compressor for '%s'"),
			   DecompressProg.c_str());
   return InFd.OpenDescriptor(File.Fd(), FileFd::ReadOnly, Comp, false);
}
									/*}}}*/
// ExtractTar::ReadBlocks - Read from the input, checking the limit	/*{{{*/
bool ExtractTar::ReadBlocks(void *To, unsigned long long Size)
{
   if (InFd.IsCompressed() == false)
   {
      if (Consumed + Size > MaxInSize)
	 return _error->Error(_("Archive is too short"));
      Consumed += Size;
   }
   return InFd.Read(To, Size);
}
									/*}}}*/
// ExtractTar::ReadLongString - Read the data of a GNU long record	/*{{{*/
bool ExtractTar::ReadLongString(unsigned long long Length, std::string &Out)
{
   Out.clear();
   unsigned char Block[512];
   while (Length > 0)
   {
      if (ReadBlocks(Block,sizeof(Block)) == false)
	 return false;
      unsigned long long const Take = std::min(Length, (unsigned long long)sizeof(Block));
      Out.append(reinterpret_cast<char *>(Block), Take);
      Length -= Take;
   }
   // the recorded length includes the terminating NUL
   std::string::size_type const Nul = Out.find('\0');
   if (Nul != std::string::npos)
      Out.erase(Nul);
   return true;
}
									/*}}}*/
// ExtractTar::Go - Perform extraction					/*{{{*/
// ---------------------------------------------------------------------
/* This reads each 512 byte block from the archive and extracts the header
   information into the Item structure. Then it invokes the correct
   processing function of the stream. */
bool ExtractTar::Go(pkgDirStream &Stream)
{
   if (StartDecompress() == false)
      return false;

   // Loop over all blocks
   std::string LastLongLink, ItemLink;
   std::string LastLongName, ItemName;
   while (1)
   {
      bool BadRecord = false;
      unsigned char Block[512];
      if (ReadBlocks(Block,sizeof(Block)) == false)
	 return false;

      // Get the checksum
      TarHeader *Tar = (TarHeader *)Block;
      unsigned long CheckSum;
      if (StrToNum(Tar->Checksum,CheckSum,sizeof(Tar->Checksum),8) == false)
	 return _error->Error(_("Corrupted archive"));

      /* Compute the checksum field. The actual checksum is blanked out
         with spaces so it is not included in the computation */
      unsigned long NewSum = 0;
      memset(Tar->Checksum,' ',sizeof(Tar->Checksum));
      for (size_t I = 0; I != sizeof(Block); ++I)
	 NewSum += Block[I];

      // A block of nulls marks the end of the archive
      if (NewSum == ' '*sizeof(Tar->Checksum))
	 return Done();

      if (NewSum != CheckSum)
	 return _error->Error(_("Tar checksum failed, archive corrupted"));

      // Decode all of the fields
      pkgDirStream::Item Itm;
      if (StrToNum(Tar->Mode,Itm.Mode,sizeof(Tar->Mode),8) == false ||
          (Base256ToNum(Tar->UserID,Itm.UID,8) == false &&
	     StrToNum(Tar->UserID,Itm.UID,sizeof(Tar->UserID),8) == false) ||
          (Base256ToNum(Tar->GroupID,Itm.GID,8) == false &&
	     StrToNum(Tar->GroupID,Itm.GID,sizeof(Tar->GroupID),8) == false) ||
          (Base256ToNum(Tar->Size,Itm.Size,12) == false &&
	     StrToNum(Tar->Size,Itm.Size,sizeof(Tar->Size),8) == false) ||
          (Base256ToNum(Tar->MTime,Itm.MTime,12) == false &&
	     StrToNum(Tar->MTime,Itm.MTime,sizeof(Tar->MTime),8) == false) ||
	  StrToNum(Tar->Major,Itm.Major,sizeof(Tar->Major),8) == false ||
	  StrToNum(Tar->Minor,Itm.Minor,sizeof(Tar->Minor),8) == false)
	 return _error->Error(_("Corrupted archive"));

      // The name fields may fill the entire 100 bytes without a NUL
      if (LastLongName.empty() == false)
	 ItemName = LastLongName;
      else
      {
	 ItemName.assign(Tar->Name, sizeof(Tar->Name));
	 ItemName.erase(std::min(ItemName.find('\0'), ItemName.length()));
      }
      if (LastLongLink.empty() == false)
	 ItemLink = LastLongLink;
      else
      {
	 ItemLink.assign(Tar->LinkName, sizeof(Tar->LinkName));
	 ItemLink.erase(std::min(ItemLink.find('\0'), ItemLink.length()));
      }
      Itm.Name = &ItemName[0];
      Itm.LinkTarget = &ItemLink[0];

      // Convert the type over
      switch (Tar->LinkFlag)
      {
	 case NormalFile0:
	 case NormalFile:
	 Itm.Type = pkgDirStream::Item::File;
	 break;

	 case HardLink:
	 Itm.Type = pkgDirStream::Item::HardLink;
	 break;

	 case SymbolicLink:
	 Itm.Type = pkgDirStream::Item::SymbolicLink;
	 break;

	 case CharacterDevice:
	 Itm.Type = pkgDirStream::Item::CharDevice;
	 break;

	 case BlockDevice:
	 Itm.Type = pkgDirStream::Item::BlockDevice;
	 break;

	 case Directory:
	 Itm.Type = pkgDirStream::Item::Directory;
	 break;

	 case FIFO:
	 Itm.Type = pkgDirStream::Item::FIFO;
	 break;

	 case GNU_LongLink:
	 if (ReadLongString(Itm.Size, LastLongLink) == false)
	    return false;
	 continue;

	 case GNU_LongName:
	 if (ReadLongString(Itm.Size, LastLongName) == false)
	    return false;
	 continue;

	 default:
	 BadRecord = true;
	 _error->Warning(_("Unknown TAR header type %u, member %s"),(unsigned)Tar->LinkFlag,Itm.Name);
	 break;
      }

      int Fd = -1;
      if (BadRecord == false)
	 if (Stream.DoItem(Itm,Fd) == false)
	    return false;

      // Copy the file over the FD
      unsigned long long Size = Itm.Size;
      while (Size != 0)
      {
	 unsigned char Junk[32*1024];
	 unsigned long long const Read = std::min(Size, (unsigned long long)sizeof(Junk));
	 if (ReadBlocks(Junk,((Read+511)/512)*512) == false)
	    return false;

	 if (BadRecord == false)
	 {
	    if (Fd >= 0)
	    {
	       if (FileFd::Write(Fd,Junk,Read) == false)
		  return Stream.Fail(Itm,Fd);
	    }
	    else if (Fd == -2)
	    {
	       // An Fd of -2 means to send to a special processing function
	       if (Stream.Process(Itm,Junk,Read,Itm.Size - Size) == false)
		  return Stream.Fail(Itm,Fd);
	    }
	 }

	 Size -= Read;
      }

      // And finish up
      if (BadRecord == false)
	 if (Stream.FinishedFile(Itm,Fd) == false)
	    return false;

      LastLongName.erase();
      LastLongLink.erase();
   }

   return Done();
}
									/*}}}*/
