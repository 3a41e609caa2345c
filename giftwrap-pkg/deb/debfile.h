// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Debian Archive File (.deb)

   This class handles the operations performed directly on .deb files.
   It makes use of the AR and TAR classes to give the necessary external
   interface: checking the layout of the archive and streaming the
   content of its control or data member.

   The memory control file extractor is useful to extract a single file
   into memory from the control member.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DEBFILE_H
#define GIFTWRAP_DEBFILE_H

#include <giftwrap-pkg/arfile.h>
#include <giftwrap-pkg/debcontrol.h>
#include <giftwrap-pkg/dirstream.h>
#include <giftwrap-pkg/macros.h>

#include <string>

class FileFd;

class GIFTWRAP_PUBLIC debDebFile
{
   protected:

   FileFd &File;
   ARArchive AR;
   bool Valid;

   bool CheckLayout();

   public:

   class MemControlExtract;

   /** \brief the first member whose name starts with Prefix */
   const ARArchive::Member *FindMember(const char *Prefix) const;
   /** \brief position the file at the start of the member Name */
   const ARArchive::Member *GotoMember(const char *Name);
   /** \brief pass the content of the tar member starting with Prefix to Stream
    *
    *  The member is decompressed according to its extension.
    */
   bool ExtractTarMember(pkgDirStream &Stream, const char *Prefix);
   inline bool ExtractControl(pkgDirStream &Stream) { return ExtractTarMember(Stream, "control.tar"); };
   inline bool ExtractArchive(pkgDirStream &Stream) { return ExtractTarMember(Stream, "data.tar"); };

   inline FileFd &GetFile() {return File;};
   inline ARArchive const &GetArchive() const {return AR;};
   inline bool IsValid() const {return Valid;};

   explicit debDebFile(FileFd &File);
};

class GIFTWRAP_PUBLIC debDebFile::MemControlExtract : public pkgDirStream
{
   bool IsControl;
   bool Found;

   public:

   std::string Control;
   debControlRecord Section;
   std::string Member;

   // Members from DirStream
   bool DoItem(Item &Itm,int &Fd) override;
   bool Process(Item &Itm,const unsigned char *Data,
		unsigned long long Size,unsigned long long Pos) override;

   // Helpers
   /** \brief load the file Member of the control member into Control */
   bool Extract(debDebFile &Deb);
   /** \brief Extract() and parse the result into Section */
   bool Read(debDebFile &Deb);
   bool TakeControl(const void *Data,unsigned long long Size);

   MemControlExtract() : IsControl(false), Found(false), Member("control") {};
   explicit MemControlExtract(std::string const &Member) : IsControl(false), Found(false), Member(Member) {};
};

#endif
