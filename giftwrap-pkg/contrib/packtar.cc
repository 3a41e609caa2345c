// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Pack a Tar - Tar Writer

   Every member is a 512 byte header followed by its data padded to a
   multiple of 512 bytes. Names and link targets which do not fit into
   the header are stored in a preceding GNU ././@LongLink record. Two
   blocks of zeros end the archive.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/packtar.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <giftwrapi18n.h>
									/*}}}*/

// The on disk header for a tar file, GNU flavour
struct PackTar::TarHeader
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
   char Padding[167];
};
static_assert(sizeof(PackTar::TarHeader) == 512, "tar headers are one block");

static constexpr char GNULongLinkName[] = "././@LongLink";
static constexpr char ZeroBlock[512] = {};

// PutNumber - Store a number in a header field			/*{{{*/
// ---------------------------------------------------------------------
/* Octal with leading zeros and a terminating NUL if it fits, otherwise
   the GNU base-256 encoding: big endian with the high bit set. */
static void PutNumber(char *Field, size_t const Len, unsigned long long Value)
{
   char Buf[32];
   snprintf(Buf, sizeof(Buf), "%0*llo", static_cast<int>(Len - 1), Value);
   if (strlen(Buf) < Len)
   {
      memcpy(Field, Buf, Len);
      return;
   }
   memset(Field, 0, Len);
   for (size_t I = Len - 1; I > 0; --I)
   {
      Field[I] = static_cast<char>(Value & 0xFF);
      Value >>= 8;
   }
   Field[0] = static_cast<char>(0x80);
}
									/*}}}*/
// InitHeader - Fill the fields shared by all members			/*{{{*/
static void InitHeader(PackTar::TarHeader &Head, char const Type, unsigned long const Mode,
		       unsigned long long const Size, time_t const MTime)
{
   memset(&Head, 0, sizeof(Head));
   PutNumber(Head.Mode, sizeof(Head.Mode), Mode & 07777);
   PutNumber(Head.UserID, sizeof(Head.UserID), 0);
   PutNumber(Head.GroupID, sizeof(Head.GroupID), 0);
   PutNumber(Head.Size, sizeof(Head.Size), Size);
   PutNumber(Head.MTime, sizeof(Head.MTime), MTime < 0 ? 0 : MTime);
   Head.LinkFlag = Type;
   memcpy(Head.MagicNumber, "ustar  ", sizeof(Head.MagicNumber));
   strcpy(Head.UserName, "root");
   strcpy(Head.GroupName, "root");
}
									/*}}}*/

// PackTar::PackTar - Constructor					/*{{{*/
PackTar::PackTar(FileFd &Out) : Out(Out), HaveClamp(false), Clamp(0)
{
   HaveClamp = GetSourceDateEpoch(Clamp);
}
									/*}}}*/
// PackTar::WriteHeader - Checksum and write a header			/*{{{*/
// ---------------------------------------------------------------------
/* The checksum is computed with its own field set to spaces and stored
   as six octal digits, a NUL and a space. */
bool PackTar::WriteHeader(TarHeader &Head)
{
   memset(Head.Checksum, ' ', sizeof(Head.Checksum));
   unsigned long Sum = 0;
   unsigned char const * const Block = reinterpret_cast<unsigned char const *>(&Head);
   for (size_t I = 0; I != sizeof(Head); ++I)
      Sum += Block[I];
   char Buf[16];
   snprintf(Buf, sizeof(Buf), "%06lo", Sum);
   memcpy(Head.Checksum, Buf, 6);
   Head.Checksum[6] = '\0';
   Head.Checksum[7] = ' ';
   return Out.Write(&Head, sizeof(Head));
}
									/*}}}*/
// PackTar::WriteLongRecord - Write a GNU long name or link record	/*{{{*/
bool PackTar::WriteLongRecord(char const Type, std::string const &Value)
{
   TarHeader Head;
   // the size includes the terminating NUL
   InitHeader(Head, Type, 0644, Value.length() + 1, 0);
   memcpy(Head.Name, GNULongLinkName, sizeof(GNULongLinkName));
   if (WriteHeader(Head) == false)
      return false;

   if (Out.Write(Value.c_str(), Value.length() + 1) == false)
      return false;
   size_t const Tail = (Value.length() + 1) % sizeof(ZeroBlock);
   if (Tail != 0)
      return Out.Write(ZeroBlock, sizeof(ZeroBlock) - Tail);
   return true;
}
									/*}}}*/
// PackTar::WriteData - Copy the content of a regular file		/*{{{*/
bool PackTar::WriteData(std::string const &Path, unsigned long long const Size)
{
   FileFd In(Path, FileFd::ReadOnly);
   if (In.IsOpen() == false || In.Failed() == true)
      return false;

   std::unique_ptr<unsigned char[]> Buf(new unsigned char[GIFTWRAP_BUFFER_SIZE]);
   unsigned long long Left = Size;
   while (Left != 0)
   {
      unsigned long long const ToRead = std::min(Left, GIFTWRAP_BUFFER_SIZE);
      if (In.Read(Buf.get(), ToRead) == false)
	 return _error->Error(_("File %s changed while it was archived"), Path.c_str());
      if (Out.Write(Buf.get(), ToRead) == false)
	 return false;
      Left -= ToRead;
   }
   if (In.Close() == false)
      return false;

   size_t const Tail = Size % sizeof(ZeroBlock);
   if (Tail != 0)
      return Out.Write(ZeroBlock, sizeof(ZeroBlock) - Tail);
   return true;
}
									/*}}}*/
// PackTar::AddEntry - Write one entry and everything below it	/*{{{*/
bool PackTar::AddEntry(std::string const &Root, std::string const &Rel)
{
   std::string const Path = Rel.empty() ? Root : flCombine(Root, Rel);
   struct stat St;
   if (lstat(Path.c_str(), &St) != 0)
      return _error->Errno("lstat", _("Unable to stat %s"), Path.c_str());

   std::string Name = "./" + Rel;
   std::string Link;
   char Type;
   unsigned long long Size = 0;
   if (S_ISDIR(St.st_mode))
   {
      Type = '5';
      if (Rel.empty() == false)
	 Name.append("/");
   }
   else if (S_ISREG(St.st_mode))
   {
      Type = '0';
      Size = St.st_size;
   }
   else if (S_ISLNK(St.st_mode))
   {
      Type = '2';
      std::vector<char> Buf(St.st_size + 1);
      ssize_t const Len = readlink(Path.c_str(), Buf.data(), Buf.size());
      if (Len < 0)
	 return _error->Errno("readlink", _("Failed to readlink %s"), Path.c_str());
      if (static_cast<size_t>(Len) >= Buf.size())
	 return _error->Error(_("Symlink %s changed while it was archived"), Path.c_str());
      Link.assign(Buf.data(), Len);
   }
   else
      return _error->Error(_("Unable to archive %s, only regular files, directories and symlinks are supported"), Path.c_str());

   time_t MTime = St.st_mtime;
   if (HaveClamp == true && MTime > Clamp)
      MTime = Clamp;

   TarHeader Head;
   InitHeader(Head, Type, St.st_mode, Size, MTime);
   if (Name.length() > sizeof(Head.Name))
   {
      if (WriteLongRecord('L', Name) == false)
	 return false;
      memcpy(Head.Name, Name.c_str(), sizeof(Head.Name));
   }
   else
      memcpy(Head.Name, Name.c_str(), Name.length());
   if (Link.length() > sizeof(Head.LinkName))
   {
      if (WriteLongRecord('K', Link) == false)
	 return false;
      memcpy(Head.LinkName, Link.c_str(), sizeof(Head.LinkName));
   }
   else
      memcpy(Head.LinkName, Link.c_str(), Link.length());

   if (WriteHeader(Head) == false)
      return false;

   if (Type == '0')
      return WriteData(Path, Size);
   if (Type != '5')
      return true;

   std::vector<std::string> Entries;
   if (GetListOfEntriesInDir(Path, Entries, true) == false)
      return false;
   for (auto const &E : Entries)
      if (AddEntry(Root, Rel.empty() ? E : Rel + "/" + E) == false)
	 return false;
   return true;
}
									/*}}}*/
// PackTar::Go - Write the whole tree					/*{{{*/
bool PackTar::Go(std::string const &Root)
{
   if (DirectoryExists(Root) == false)
      return _error->Error(_("Unable to archive %s, it is not a directory"), Root.c_str());

   if (AddEntry(Root, "") == false)
      return false;

   // End of archive
   return Out.Write(ZeroBlock, sizeof(ZeroBlock)) &&
      Out.Write(ZeroBlock, sizeof(ZeroBlock));
}
									/*}}}*/
