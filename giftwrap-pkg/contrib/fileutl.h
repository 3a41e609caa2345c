// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd - file descriptor wrapper reporting through _error which
            transparently (de)compresses gzip, bzip2 and xz streams
   CopyFile - Buffered copy between two FileFds
   CreateDirectory - mkdir -p below a known parent
   RemoveDirectoryTree - rm -rf of a scratch directory
   ExecFork/ExecWait/Popen - running the external helpers

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_FILEUTL_H
#define GIFTWRAP_FILEUTL_H

#include <giftwrap-pkg/compressors.h>
#include <giftwrap-pkg/macros.h>

#include <ctime>
#include <set>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <sys/types.h>

class FileFdPrivate;
class GIFTWRAP_PUBLIC FileFd
{
   friend class FileFdPrivate;
   friend class GzipFileFdPrivate;
   friend class Bz2FileFdPrivate;
   friend class LzmaFileFdPrivate;
   friend class DirectFileFdPrivate;
   protected:
   int iFd;

   enum LocalFlags {AutoClose = (1<<0),Fail = (1<<1),DelOnFail = (1<<2),
                    HitEof = (1<<3), Compressed = (1<<4) };
   unsigned long Flags;
   std::string FileName;

   public:
   enum OpenMode {
	ReadOnly = (1 << 0),
	WriteOnly = (1 << 1),
	ReadWrite = ReadOnly | WriteOnly,

	Create = (1 << 2),
	Exclusive = (1 << 3),
	Empty = (1 << 5)
   };
   enum CompressMode
   {
      None = 'N',
      Extension = 'E',
      Gzip = 'G',
      Bzip2 = 'B',
      Xz = 'X'
   };

   inline bool Read(void *To,unsigned long long Size,bool AllowEof)
   {
      unsigned long long Jnk;
      if (AllowEof)
	 return Read(To,Size,&Jnk);
      return Read(To,Size);
   }
   bool Read(void *To,unsigned long long Size,unsigned long long *Actual = 0);
   /** read everything up to the end of the file into To */
   bool ReadAll(std::string &To);
   bool Write(const void *From,unsigned long long Size);
   inline bool Write(std::string const &From) { return Write(From.data(), From.size()); }
   bool static Write(int Fd, const void *From, unsigned long long Size);
   bool Seek(unsigned long long To);
   bool Skip(unsigned long long To);
   unsigned long long Tell();
   // the size of the file itself
   unsigned long long FileSize();

   bool Open(std::string FileName,unsigned int const Mode,CompressMode Compress,unsigned long const AccessMode = 0666);
   bool Open(std::string FileName,unsigned int const Mode,GiftWrap::Configuration::Compressor const &compressor,unsigned long const AccessMode = 0666);
   inline bool Open(std::string const &FileName,unsigned int const Mode, unsigned long const AccessMode = 0666) {
      return Open(FileName, Mode, None, AccessMode);
   };
   bool OpenDescriptor(int Fd, unsigned int const Mode, CompressMode Compress, bool AutoClose=false);
   bool OpenDescriptor(int Fd, unsigned int const Mode, GiftWrap::Configuration::Compressor const &compressor, bool AutoClose=false);
   inline bool OpenDescriptor(int Fd, unsigned int const Mode, bool AutoClose=false) {
      return OpenDescriptor(Fd, Mode, None, AutoClose);
   };
   bool Close();

   // Simple manipulators
   inline int Fd() {return iFd;};
   inline bool IsOpen() {return iFd >= 0;};
   inline bool Failed() {return (Flags & Fail) == Fail;};
   inline void EraseOnFailure() {Flags |= DelOnFail;};
   inline void OpFail() {Flags |= Fail;};
   inline bool Eof() {return (Flags & HitEof) == HitEof;};
   inline bool IsCompressed() {return (Flags & Compressed) == Compressed;};
   inline std::string &Name() {return FileName;};

   FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode = 0666);
   FileFd(std::string FileName,unsigned int const Mode, CompressMode Compress, unsigned long AccessMode = 0666);
   FileFd();
   FileFd(int const Fd, unsigned int const Mode = ReadWrite, CompressMode Compress = None);
   virtual ~FileFd();

   private:
   FileFdPrivate * d;
   GIFTWRAP_HIDDEN FileFd(const FileFd &);
   GIFTWRAP_HIDDEN FileFd & operator=(const FileFd &);
   GIFTWRAP_HIDDEN bool OpenInternDescriptor(unsigned int const Mode, GiftWrap::Configuration::Compressor const &compressor);

   // private helpers to set Fail flag and call _error->Error
   GIFTWRAP_HIDDEN bool FileFdErrno(const char* Function, const char* Description,...) GIFTWRAP_PRINTF(3) GIFTWRAP_COLD;
   GIFTWRAP_HIDDEN bool FileFdError(const char* Description,...) GIFTWRAP_PRINTF(2) GIFTWRAP_COLD;
};

GIFTWRAP_PUBLIC bool CopyFile(FileFd &From,FileFd &To);
GIFTWRAP_PUBLIC bool RemoveFile(char const * const Function, std::string const &FileName);
GIFTWRAP_PUBLIC bool FileExists(std::string const &File);
GIFTWRAP_PUBLIC bool RealFileExists(std::string const &File);
GIFTWRAP_PUBLIC bool DirectoryExists(std::string const &Path);
GIFTWRAP_PUBLIC bool CreateDirectory(std::string const &Parent, std::string const &Path);
/** \brief removes Path and everything below it, symlinks are not followed */
GIFTWRAP_PUBLIC bool RemoveDirectoryTree(std::string const &Path);

GIFTWRAP_PUBLIC std::string GetTempDir();
GIFTWRAP_PUBLIC FileFd* GetTempFile(std::string const &Prefix = "",
                    bool ImmediateUnlink = true,
		    FileFd * const TmpFd = NULL);

/** \brief names of all entries in Dir except . and ..
 *
 *  Hidden entries are included.
 */
GIFTWRAP_PUBLIC bool GetListOfEntriesInDir(std::string const &Dir, std::vector<std::string> &List, bool SortList);
/** \brief the time from the SOURCE_DATE_EPOCH environment variable
 *
 *  \return \b false if it is unset, an invalid value gives a warning
 */
GIFTWRAP_PUBLIC bool GetSourceDateEpoch(time_t &Epoch);
GIFTWRAP_PUBLIC void SetCloseExec(int Fd,bool Close);
GIFTWRAP_PUBLIC pid_t ExecFork();
GIFTWRAP_PUBLIC pid_t ExecFork(std::set<int> keep_fds);
GIFTWRAP_PUBLIC bool ExecWait(pid_t Pid,const char *Name,bool Reap = false);

/** \brief locate an executable like the shell would
 *
 *  Names containing a slash are taken as is, others are searched
 *  in $PATH.
 *
 *  \return the path of the executable or an empty string
 */
GIFTWRAP_PUBLIC std::string FindExecutableInPath(std::string const &Name);

// File string manipulators
GIFTWRAP_PUBLIC std::string flCombine(std::string Dir,std::string File);

/** \brief Popen() implementation that execv() instead of using a shell
 *
 * \param Args the execv style command to run, Args[0] must be a path
 * \param Fd is the FileFd to use for input or output
 * \param Child stores the child pid, call ExecWait() on it afterwards
 * \param Mode is either FileFd::ReadOnly or FileFd::WriteOnly
 * \param CaptureStderr True if stderr is captured in addition to stdout.
 * \return true on success, false on failure with _error set
 */
GIFTWRAP_PUBLIC bool Popen(const char *Args[], FileFd &Fd, pid_t &Child, FileFd::OpenMode Mode, bool CaptureStderr = true);

#endif
