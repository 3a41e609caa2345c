// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   AR File - Handle an 'AR' archive

   ARArchive is a reader for the common System V/GNU ar format as used
   by .deb files. It only parses and verifies the member headers, the
   member data is accessed by seeking the FileFd to Member::Start.

   ARWriter produces the same format. Members are appended in the order
   Add is called, which matters for .deb files as dpkg insists on
   debian-binary coming first.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_ARFILE_H
#define GIFTWRAP_ARFILE_H

#include <giftwrap-pkg/macros.h>

#include <ctime>
#include <string>

class FileFd;

class GIFTWRAP_PUBLIC ARArchive
{
   struct MemberHeader;
   public:
   struct Member;

   protected:

   // Linked list of members in archive order
   Member *List;
   Member **Last;
   bool Loaded;

   bool LoadHeaders();

   public:

   // The stream file
   FileFd &File;

   // Locate a member by name
   const Member *FindMember(const char *Name) const;
   inline const Member *Members() const {return List;};
   // false if the headers could not be parsed
   inline bool IsLoaded() const {return Loaded;};

   explicit ARArchive(FileFd &File);
   ~ARArchive();
};

// A member of the archive
struct ARArchive::Member
{
   // Fields from the header
   std::string Name;
   unsigned long MTime;
   unsigned long UID;
   unsigned long GID;
   unsigned long Mode;
   unsigned long long Size;

   // Location of the data.
   unsigned long long Start;
   Member *Next;

   Member() : MTime(0), UID(0), GID(0), Mode(0), Size(0), Start(0), Next(0) {};
};

class GIFTWRAP_PUBLIC ARWriter
{
   struct MemberHeader;

   FileFd &File;
   time_t const MTime;
   bool WroteMagic;

   bool WriteHeader(std::string const &Name, unsigned long long const Size);
   bool WritePadding(unsigned long long const Size);

   public:

   /** \brief append the content of the file Member as Name
    *
    *  Member is read from its current position to its end, so it
    *  should be freshly opened.
    */
   bool Add(std::string const &Name, FileFd &Member);
   bool Add(std::string const &Name, std::string const &Data);

   /** \param MTime is used for the header of every member */
   ARWriter(FileFd &File, time_t const MTime);
};

#endif
