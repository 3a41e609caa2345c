// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   AR File - Handle an 'AR' archive

   AR Archives have plain text headers at the start of each file
   section. The headers are aligned on a 2 byte boundary.

   Information about the structure of AR files can be found in ar(5)
   on a BSD system, or in the binutils source.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/arfile.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/strutl.h>

#include <algorithm>
#include <memory>
#include <string>
#include <string.h>
#include <stdio.h>

#include <giftwrapi18n.h>
									/*}}}*/

struct ARArchive::MemberHeader
{
   char Name[16];
   char MTime[12];
   char UID[6];
   char GID[6];
   char Mode[8];
   char Size[10];
   char Magic[2];
};

static constexpr char ARMagic[] = "!<arch>\012";
static constexpr char ARHeaderMagic[] = "`\012";

// ARArchive::ARArchive - Constructor					/*{{{*/
// ---------------------------------------------------------------------
/* */
ARArchive::ARArchive(FileFd &File) : List(0), Last(&List), Loaded(false), File(File)
{
   Loaded = LoadHeaders();
}
									/*}}}*/
// ARArchive::~ARArchive - Destructor					/*{{{*/
// ---------------------------------------------------------------------
/* */
ARArchive::~ARArchive()
{
   while (List != 0)
   {
      Member *Tmp = List;
      List = List->Next;
      delete Tmp;
   }
}
									/*}}}*/
// ARArchive::LoadHeaders - Load the headers from each file		/*{{{*/
// ---------------------------------------------------------------------
/* AR files are structured with a 8 byte magic string followed by a 60
   byte plain text header then the file data, another header, data, etc */
bool ARArchive::LoadHeaders()
{
   off_t Left = File.FileSize();

   // Check the magic byte
   char Magic[8];
   if (File.Read(Magic,sizeof(Magic)) == false)
      return false;
   if (memcmp(Magic,ARMagic,sizeof(Magic)) != 0)
      return _error->Error(_("Invalid archive signature"));
   Left -= sizeof(Magic);

   // Read the member list
   while (Left > 0)
   {
      MemberHeader Head;
      if (File.Read(&Head,sizeof(Head)) == false)
	 return _error->Error(_("Error reading archive member header"));
      Left -= sizeof(Head);

      // Convert all of the integer members
      std::unique_ptr<Member> Memb(new Member());
      if (memcmp(Head.Magic,ARHeaderMagic,sizeof(Head.Magic)) != 0 ||
	  StrToNum(Head.MTime,Memb->MTime,sizeof(Head.MTime)) == false ||
	  StrToNum(Head.UID,Memb->UID,sizeof(Head.UID)) == false ||
	  StrToNum(Head.GID,Memb->GID,sizeof(Head.GID)) == false ||
	  StrToNum(Head.Mode,Memb->Mode,sizeof(Head.Mode),8) == false ||
	  StrToNum(Head.Size,Memb->Size,sizeof(Head.Size)) == false)
	 return _error->Error(_("Invalid archive member header"));

      // Check for an extra long name string
      if (memcmp(Head.Name,"#1/",3) == 0)
      {
	 char S[300];
	 unsigned long Len;
	 if (StrToNum(Head.Name+3,Len,sizeof(Head.Name)-3) == false ||
	     Len >= sizeof(S) || Len > Memb->Size)
	    return _error->Error(_("Invalid archive member header"));
	 if (File.Read(S,Len) == false)
	    return false;
	 S[Len] = 0;
	 Memb->Name = S;
	 Memb->Size -= Len;
	 Left -= Len;
      }
      else
      {
	 unsigned int I = sizeof(Head.Name) - 1;
	 for (; I > 0 && (Head.Name[I] == ' ' || Head.Name[I] == '/'); I--);
	 Memb->Name = std::string(Head.Name,I+1);
      }

      // Account for the AR header alignment
      off_t const Skip = Memb->Size % 2;

      Memb->Start = File.Tell();
      if (Left < (off_t)(Memb->Size + Skip))
	 return _error->Error(_("Archive is too short"));
      if (File.Skip(Memb->Size + Skip) == false)
	 return false;
      Left -= Memb->Size + Skip;

      // Add it to the end of the list
      *Last = Memb.release();
      Last = &(*Last)->Next;
   }
   if (Left != 0)
      return _error->Error(_("Failed to read the archive headers"));

   return true;
}
									/*}}}*/
// ARArchive::FindMember - Find a name in the member list		/*{{{*/
// ---------------------------------------------------------------------
/* Find a member with the given name */
const ARArchive::Member *ARArchive::FindMember(const char *Name) const
{
   const Member *Res = List;
   while (Res != 0)
   {
      if (Res->Name == Name)
	 return Res;
      Res = Res->Next;
   }

   return 0;
}
									/*}}}*/

struct ARWriter::MemberHeader
{
   char Name[16];
   char MTime[12];
   char UID[6];
   char GID[6];
   char Mode[8];
   char Size[10];
   char Magic[2];
};

// ARWriter::ARWriter - Constructor					/*{{{*/
ARWriter::ARWriter(FileFd &File, time_t const MTime) : File(File),
   MTime(MTime), WroteMagic(false)
{
}
									/*}}}*/
// ARWriter::WriteHeader - Write the magic and a member header		/*{{{*/
// ---------------------------------------------------------------------
/* Every field is left aligned and padded with spaces. Members are always
   owned by root and have mode 100644 as dpkg-deb does it. */
bool ARWriter::WriteHeader(std::string const &Name, unsigned long long const Size)
{
   MemberHeader Head;
   if (Name.empty() == true || Name.length() > sizeof(Head.Name) ||
	 Name.find('/') != std::string::npos)
      return _error->Error(_("Invalid archive member name '%s'"), Name.c_str());
   if (Size > 9999999999ull)
      return _error->Error(_("Archive member %s is too large"), Name.c_str());

   if (WroteMagic == false)
   {
      if (File.Write(ARMagic, strlen(ARMagic)) == false)
	 return false;
      WroteMagic = true;
   }

   // snprintf writes a terminating NUL, so render one byte more and drop it
   char Buf[sizeof(Head) + 1];
   snprintf(Buf, sizeof(Buf), "%-16s%-12lu%-6lu%-6lu%-8o%-10llu%s",
	    Name.c_str(), static_cast<unsigned long>(MTime), 0lu, 0lu,
	    0100644u, Size, ARHeaderMagic);
   memcpy(&Head, Buf, sizeof(Head));
   return File.Write(&Head, sizeof(Head));
}
									/*}}}*/
// ARWriter::WritePadding - Keep the next header on an even offset	/*{{{*/
bool ARWriter::WritePadding(unsigned long long const Size)
{
   if (Size % 2 == 0)
      return true;
   return File.Write("\n", 1);
}
									/*}}}*/
// ARWriter::Add - Append a member					/*{{{*/
bool ARWriter::Add(std::string const &Name, std::string const &Data)
{
   if (WriteHeader(Name, Data.size()) == false ||
	 File.Write(Data) == false)
      return false;
   return WritePadding(Data.size());
}
bool ARWriter::Add(std::string const &Name, FileFd &Member)
{
   if (Member.IsOpen() == false || Member.Failed() == true)
      return _error->Error(_("Unable to read %s"), Member.Name().c_str());

   unsigned long long const Start = Member.Tell();
   unsigned long long const FileSize = Member.FileSize();
   if (Member.Failed() == true)
      return false;
   unsigned long long const Size = FileSize - std::min(Start, FileSize);
   if (WriteHeader(Name, Size) == false)
      return false;

   // the header promised Size bytes, a file changing under us is an error
   std::unique_ptr<unsigned char[]> Buf(new unsigned char[GIFTWRAP_BUFFER_SIZE]);
   unsigned long long Left = Size;
   while (Left != 0)
   {
      unsigned long long const ToRead = std::min(Left, GIFTWRAP_BUFFER_SIZE);
      if (Member.Read(Buf.get(), ToRead) == false)
	 return _error->Error(_("Archive member %s changed while it was added"), Name.c_str());
      if (File.Write(Buf.get(), ToRead) == false)
	 return false;
      Left -= ToRead;
   }
   return WritePadding(Size);
}
									/*}}}*/
