// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Debian Archive File (.deb)

   .DEB archives are AR files containing two tars and a marker member
   called 'debian-binary'. The two tars contain the meta data and the
   actual archive contents. Thus this class is a very simple wrapper
   around ar/tar to simply extract the right tar files.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/arfile.h>
#include <giftwrap-pkg/compressors.h>
#include <giftwrap-pkg/debfile.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/extracttar.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/strutl.h>

#include <string>
#include <string.h>

#include <giftwrapi18n.h>
									/*}}}*/

// DebFile::debDebFile - Constructor					/*{{{*/
// ---------------------------------------------------------------------
/* Open the AR file and check for consistency */
debDebFile::debDebFile(FileFd &File) : File(File), AR(File), Valid(false)
{
   Valid = CheckLayout();
}
									/*}}}*/
// DebFile::CheckLayout - Check the members and their order		/*{{{*/
// ---------------------------------------------------------------------
/* dpkg insists on debian-binary first, then the control member and the
   data member last. */
bool debDebFile::CheckLayout()
{
   if (AR.IsLoaded() == false)
      return false;

   ARArchive::Member const *Memb = AR.Members();
   if (Memb == 0)
      return _error->Error(_("This is not a valid DEB archive, missing '%s' member"), "debian-binary");

   if (Memb->Name != "debian-binary")
      return _error->Error(_("This is not a valid DEB archive, the first member is '%s' instead of '%s'"),
			   Memb->Name.c_str(), "debian-binary");
   char Version[5];
   if (Memb->Size != 4 || File.Seek(Memb->Start) == false ||
	 File.Read(Version, 4) == false)
      return _error->Error(_("This is not a valid DEB archive, unsupported format version"));
   Version[4] = '\0';
   if (strcmp(Version, "2.0\n") != 0)
      return _error->Error(_("This is not a valid DEB archive, unsupported format version"));

   Memb = Memb->Next;
   if (Memb == 0 || GiftWrap::String::Startswith(Memb->Name, "control.tar") == false)
      return _error->Error(_("This is not a valid DEB archive, missing '%s' member"), "control.tar");

   Memb = Memb->Next;
   if (Memb == 0 || GiftWrap::String::Startswith(Memb->Name, "data.tar") == false)
      return _error->Error(_("This is not a valid DEB archive, missing '%s' member"), "data.tar");

   if (Memb->Next != 0)
      return _error->Error(_("This is not a valid DEB archive, unexpected member '%s'"), Memb->Next->Name.c_str());
   return true;
}
									/*}}}*/
// DebFile::FindMember - Find a member by the start of its name	/*{{{*/
const ARArchive::Member *debDebFile::FindMember(const char *Prefix) const
{
   for (ARArchive::Member const *Memb = AR.Members(); Memb != 0; Memb = Memb->Next)
      if (GiftWrap::String::Startswith(Memb->Name, Prefix) == true)
	 return Memb;
   return 0;
}
									/*}}}*/
// DebFile::GotoMember - Jump to a Member				/*{{{*/
// ---------------------------------------------------------------------
/* Jump in the file to the start of a named member and return the information
   about that member. The caller can then read from the file up to the
   returned size. Note, since this relies on the file position this is
   a destructive operation, so don't nest them! */
const ARArchive::Member *debDebFile::GotoMember(const char *Name)
{
   // Get the archive member and position the file
   const ARArchive::Member *Member = AR.FindMember(Name);
   if (Member == 0)
      return 0;
   if (File.Seek(Member->Start) == false)
      return 0;

   return Member;
}
									/*}}}*/
// DebFile::ExtractTarMember - Stream a tar member			/*{{{*/
bool debDebFile::ExtractTarMember(pkgDirStream &Stream, const char *Prefix)
{
   if (Valid == false)
      return _error->Error(_("This is not a valid DEB archive"));

   const ARArchive::Member *Member = FindMember(Prefix);
   if (Member == 0)
      return _error->Error(_("This is not a valid DEB archive, missing '%s' member"), Prefix);

   std::string Compressor = ".";
   std::string const Extension = Member->Name.substr(strlen(Prefix));
   if (Extension.empty() == false)
   {
      GiftWrap::Configuration::Compressor Comp;
      if (GiftWrap::Configuration::findCompressor(Extension, Comp) == false)
	 return _error->Error(_("Internal error, could not locate member %s"), Member->Name.c_str());
      Compressor = Comp.Name;
   }

   if (File.Seek(Member->Start) == false)
      return false;

   // Prepare Tar
   ExtractTar Tar(File,Member->Size,Compressor);
   return Tar.Go(Stream);
}
									/*}}}*/

// MemControlExtract::DoItem - Check if it is the control file		/*{{{*/
// ---------------------------------------------------------------------
/* This sets up to extract the control block member file into memory.
   All other files go into the bit bucket. */
bool debDebFile::MemControlExtract::DoItem(Item &Itm,int &Fd)
{
   char const *Name = Itm.Name;
   if (Name[0] == '.' && Name[1] == '/')
      Name += 2;

   IsControl = (Itm.Type == Item::File && Member == Name);
   if (IsControl == true)
   {
      Control.clear();
      Control.reserve(Itm.Size);
      Found = true;
      Fd = -2; // Signal to pass to Process
   }
   return true;
}
									/*}}}*/
// MemControlExtract::Process - Process extracting the control file	/*{{{*/
bool debDebFile::MemControlExtract::Process(Item &,const unsigned char *Data,
			     unsigned long long Size,unsigned long long Pos)
{
   if (IsControl == false)
      return true;
   if (Pos != Control.length())
      return _error->Error(_("Unparsable control file"));
   Control.append(reinterpret_cast<char const *>(Data), Size);
   return true;
}
									/*}}}*/
// MemControlExtract::Extract - Read a file of the control member	/*{{{*/
bool debDebFile::MemControlExtract::Extract(debDebFile &Deb)
{
   Found = false;
   IsControl = false;
   Control.clear();
   if (Deb.ExtractControl(*this) == false)
      return false;
   if (Found == false)
      return _error->Error(_("The control member has no file %s"), Member.c_str());
   return true;
}
									/*}}}*/
// MemControlExtract::Read - Read the control information from the deb	/*{{{*/
// ---------------------------------------------------------------------
/* This uses the internal tar extractor to fetch the control file, and then
   it parses it into a control record. */
bool debDebFile::MemControlExtract::Read(debDebFile &Deb)
{
   if (Extract(Deb) == false)
      return false;
   if (Section.Scan(Control) == false)
      return _error->Error(_("Unparsable control file"));
   return true;
}
									/*}}}*/
// MemControlExtract::TakeControl - Parse a memory block		/*{{{*/
// ---------------------------------------------------------------------
/* The given memory block is loaded into the parser and parsed as a control
   record. */
bool debDebFile::MemControlExtract::TakeControl(const void *Data,unsigned long long Size)
{
   Control.assign(static_cast<char const *>(Data), Size);
   return Section.Scan(Control);
}
									/*}}}*/
