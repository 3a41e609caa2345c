// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   CopyFile - Buffered copy of a single file
   FileExists - Returns true if the file exists

   The compressed variants of FileFd hand the descriptor to the
   respective library, which owns it from then on. To keep the caller's
   descriptor usable a duplicate is handed over unless the FileFd was
   asked to close the descriptor itself.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/compressors.h>
#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/macros.h>
#include <giftwrap-pkg/strutl.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <ctype.h>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdarg.h>
#include <stdint.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef HAVE_ZLIB
#include <zlib.h>
#endif
#ifdef HAVE_BZ2
#include <bzlib.h>
#endif
#ifdef HAVE_LZMA
#include <lzma.h>
#endif

#include <giftwrapi18n.h>
									/*}}}*/

// CopyFile - Buffered copy of a file					/*{{{*/
// ---------------------------------------------------------------------
/* The caller is expected to set things so that failure causes erasure */
bool CopyFile(FileFd &From,FileFd &To)
{
   if (From.IsOpen() == false || To.IsOpen() == false ||
	 From.Failed() == true || To.Failed() == true)
      return false;

   constexpr size_t BufSize = GIFTWRAP_BUFFER_SIZE;
   std::unique_ptr<unsigned char[]> Buf(new unsigned char[BufSize]);
   unsigned long long ToRead = 0;
   do {
      if (From.Read(Buf.get(),BufSize, &ToRead) == false ||
	  To.Write(Buf.get(),ToRead) == false)
	 return false;
   } while (ToRead != 0);

   return true;
}
									/*}}}*/
bool RemoveFile(char const * const Function, std::string const &FileName)/*{{{*/
{
   if (FileName == "/dev/null")
      return true;
   errno = 0;
   if (unlink(FileName.c_str()) != 0)
   {
      if (errno == ENOENT)
	 return true;

      return _error->WarningE(Function,_("Problem unlinking the file %s"), FileName.c_str());
   }
   return true;
}
									/*}}}*/
// FileExists - Check if a file exists					/*{{{*/
// ---------------------------------------------------------------------
/* Beware: Directories are also files! */
bool FileExists(std::string const &File)
{
   struct stat Buf;
   return stat(File.c_str(),&Buf) == 0;
}
									/*}}}*/
// RealFileExists - Check if a file exists and if it is really a file	/*{{{*/
bool RealFileExists(std::string const &File)
{
   struct stat Buf;
   if (stat(File.c_str(),&Buf) != 0)
      return false;
   return S_ISREG(Buf.st_mode);
}
									/*}}}*/
// DirectoryExists - Check if a directory exists and is really one	/*{{{*/
bool DirectoryExists(std::string const &Path)
{
   struct stat Buf;
   if (stat(Path.c_str(),&Buf) != 0)
      return false;
   return S_ISDIR(Buf.st_mode);
}
									/*}}}*/
// CreateDirectory - poor man's mkdir -p guarded by a parent directory	/*{{{*/
// ---------------------------------------------------------------------
/* Creates all directories needed for Path in mkdir -p style, but only
   below Parent: if Parent does not exist or is not a prefix of Path
   nothing is created. New directories get mode 0755 minus umask. */
bool CreateDirectory(std::string const &Parent, std::string const &Path)
{
   if (Parent.empty() == true || Path.empty() == true)
      return false;

   if (DirectoryExists(Path) == true)
      return true;

   if (DirectoryExists(Parent) == false)
      return false;

   // we are not going to create directories "into the blue"
   if (Path.compare(0, Parent.length(), Parent) != 0)
      return false;

   std::string progress = Parent;
   for (auto const &d : VectorizeString(Path.substr(Parent.size()), '/'))
   {
      if (d.empty() == true)
	 continue;

      progress.append("/").append(d);
      if (DirectoryExists(progress) == true)
	 continue;

      if (mkdir(progress.c_str(), 0755) != 0)
	 return false;
   }
   return true;
}
									/*}}}*/
// RemoveDirectoryTree - rm -rf						/*{{{*/
// ---------------------------------------------------------------------
/* Symlinks are removed, never followed. A missing Path is not an error. */
bool RemoveDirectoryTree(std::string const &Path)
{
   struct stat St;
   if (lstat(Path.c_str(), &St) != 0)
   {
      if (errno == ENOENT)
	 return true;
      return _error->Errno("lstat", _("Unable to stat %s"), Path.c_str());
   }

   if (S_ISDIR(St.st_mode) == false)
   {
      if (unlink(Path.c_str()) != 0)
	 return _error->Errno("unlink", _("Problem unlinking the file %s"), Path.c_str());
      return true;
   }

   // the directory may lack the permissions we need to clean it out
   if ((St.st_mode & S_IRWXU) != S_IRWXU)
      chmod(Path.c_str(), St.st_mode | S_IRWXU);

   std::vector<std::string> Entries;
   if (GetListOfEntriesInDir(Path, Entries, false) == false)
      return false;
   for (auto const &E : Entries)
      if (RemoveDirectoryTree(flCombine(Path, E)) == false)
	 return false;

   if (rmdir(Path.c_str()) != 0)
      return _error->Errno("rmdir", _("Unable to remove directory %s"), Path.c_str());
   return true;
}
									/*}}}*/
// GetSourceDateEpoch - parse SOURCE_DATE_EPOCH from the environment	/*{{{*/
bool GetSourceDateEpoch(time_t &Epoch)
{
   char const * const Env = getenv("SOURCE_DATE_EPOCH");
   if (Env == nullptr || *Env == '\0')
      return false;

   char *End = nullptr;
   errno = 0;
   unsigned long long const Value = strtoull(Env, &End, 10);
   if (errno != 0 || *End != '\0' || isdigit(Env[0]) == 0 ||
	 Value > static_cast<unsigned long long>(std::numeric_limits<time_t>::max()))
   {
      _error->Warning(_("Ignoring invalid SOURCE_DATE_EPOCH value '%s'"), Env);
      return false;
   }
   Epoch = Value;
   return true;
}
									/*}}}*/
// GetListOfEntriesInDir - returns the names of all entries in a dir	/*{{{*/
bool GetListOfEntriesInDir(std::string const &Dir, std::vector<std::string> &List, bool SortList)
{
   List.clear();
   DIR *D = opendir(Dir.c_str());
   if (D == 0)
      return _error->Errno("opendir",_("Unable to read %s"),Dir.c_str());
   DEFER([&] { closedir(D); });

   errno = 0;
   for (struct dirent *Ent = readdir(D); Ent != 0; Ent = readdir(D))
   {
      if (strcmp(Ent->d_name, ".") == 0 || strcmp(Ent->d_name, "..") == 0)
	 continue;
      List.push_back(Ent->d_name);
   }
   if (errno != 0)
      return _error->Errno("readdir",_("Unable to read %s"),Dir.c_str());

   if (SortList == true)
      std::sort(List.begin(),List.end());
   return true;
}
									/*}}}*/
// flCombine - Combine a file and a directory				/*{{{*/
// ---------------------------------------------------------------------
/* If the file is an absolute path then it is just returned, otherwise
   the directory is pre-pended to it. */
std::string flCombine(std::string Dir,std::string File)
{
   if (File.empty() == true)
      return std::string();

   if (File[0] == '/' || Dir.empty() == true)
      return File;
   if (File.length() >= 2 && File[0] == '.' && File[1] == '/')
      return File;
   if (Dir[Dir.length()-1] == '/')
      return Dir + File;
   return Dir + '/' + File;
}
									/*}}}*/
// SetCloseExec - Set the close on exec flag				/*{{{*/
void SetCloseExec(int Fd,bool Close)
{
   if (fcntl(Fd,F_SETFD,(Close == false)?0:FD_CLOEXEC) != 0)
      _error->Errno("fcntl", "Could not set close on exec for fd %d", Fd);
}
									/*}}}*/
// ExecFork - Magical fork that sanitizes the context before execing	/*{{{*/
// ---------------------------------------------------------------------
/* The child gets default signal handlers and every descriptor above
   stderr not listed in KeepFDs is marked close-on-exec. */
pid_t ExecFork()
{
   return ExecFork(std::set<int>());
}
pid_t ExecFork(std::set<int> KeepFDs)
{
   pid_t const Process = fork();
   if (Process != 0)
      return Process;

   signal(SIGPIPE,SIG_DFL);
   signal(SIGQUIT,SIG_DFL);
   signal(SIGINT,SIG_DFL);
   signal(SIGWINCH,SIG_DFL);
   signal(SIGCONT,SIG_DFL);
   signal(SIGTSTP,SIG_DFL);

   DIR *dir = opendir("/proc/self/fd");
   if (dir != NULL)
   {
      struct dirent *ent;
      while ((ent = readdir(dir)))
      {
	 int const fd = atoi(ent->d_name);
	 if (fd >= 3 && fd != dirfd(dir) && KeepFDs.find(fd) == KeepFDs.end())
	    fcntl(fd,F_SETFD,FD_CLOEXEC);
      }
      closedir(dir);
   }
   else
   {
      long const ScOpenMax = sysconf(_SC_OPEN_MAX);
      for (int K = 3; K < ScOpenMax; ++K)
	 if (KeepFDs.find(K) == KeepFDs.end())
	    fcntl(K,F_SETFD,FD_CLOEXEC);
   }
   return Process;
}
									/*}}}*/
// ExecWait - Fancy waitpid						/*{{{*/
// ---------------------------------------------------------------------
/* Waits for the given sub process. If Reap is set then no errors are
   generated. Otherwise a failed subprocess will generate a proper descriptive
   message */
bool ExecWait(pid_t Pid,const char *Name,bool Reap)
{
   if (Pid <= 1)
      return true;

   int Status;
   while (waitpid(Pid,&Status,0) != Pid)
   {
      if (errno == EINTR)
	 continue;

      if (Reap == true)
	 return false;

      return _error->Error(_("Waited for %s but it wasn't there"),Name);
   }

   if (WIFEXITED(Status) != 0 && WEXITSTATUS(Status) == 0)
      return true;

   if (Reap == true)
      return false;
   if (WIFSIGNALED(Status) != 0)
   {
      if (WTERMSIG(Status) == SIGSEGV)
	 return _error->Error(_("Sub-process %s received a segmentation fault."),Name);
      return _error->Error(_("Sub-process %s received signal %u."),Name, WTERMSIG(Status));
   }
   if (WIFEXITED(Status) != 0)
      return _error->Error(_("Sub-process %s returned an error code (%u)"),Name,WEXITSTATUS(Status));
   return _error->Error(_("Sub-process %s exited unexpectedly"),Name);
}
									/*}}}*/
// FindExecutableInPath - search $PATH for a binary			/*{{{*/
std::string FindExecutableInPath(std::string const &Name)
{
   if (Name.empty() == true)
      return "";
   if (Name.find('/') != std::string::npos)
      return access(Name.c_str(), X_OK) == 0 && RealFileExists(Name) ? Name : "";

   char const * const Path = getenv("PATH");
   std::string const SearchPath = (Path == nullptr) ? "/usr/local/bin:/usr/bin:/bin" : Path;
   for (auto const &Dir : VectorizeString(SearchPath, ':'))
   {
      std::string const Candidate = flCombine(Dir.empty() ? "." : Dir, Name);
      if (access(Candidate.c_str(), X_OK) == 0 && RealFileExists(Candidate) == true)
	 return Candidate;
   }
   return "";
}
									/*}}}*/
class GIFTWRAP_HIDDEN FileFdPrivate {					/*{{{*/
protected:
   FileFd * const filefd;
   GiftWrap::Configuration::Compressor compressor;
   unsigned int openmode;
   unsigned long long seekpos;
public:

   explicit FileFdPrivate(FileFd * const pfilefd) : filefd(pfilefd),
      openmode(0), seekpos(0) {};
   void set_compressor(GiftWrap::Configuration::Compressor const &compressor)
   {
      this->compressor = compressor;
   }
   void set_openmode(unsigned int openmode)
   {
      this->openmode = openmode;
   }
   unsigned long long get_seekpos() const
   {
      return seekpos;
   }
   void set_seekpos(unsigned long long seekpos)
   {
      this->seekpos = seekpos;
   }

   virtual bool InternalOpen(int const iFd, unsigned int const Mode) = 0;
   virtual ssize_t InternalRead(void * const To, unsigned long long const Size) = 0;
   virtual bool InternalReadError() { return filefd->FileFdErrno("read",_("Read error")); }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) = 0;
   virtual bool InternalWriteError() { return filefd->FileFdErrno("write",_("Write error")); }
   virtual bool InternalSeek(unsigned long long const To)
   {
      if (To < seekpos)
	 return filefd->FileFdError("Seeking backwards in the compressed file %s is not supported", filefd->FileName.c_str());
      return filefd->Skip(To - seekpos);
   }
   virtual bool InternalSkip(unsigned long long Over)
   {
      unsigned long long constexpr buffersize = 4096;
      char buffer[buffersize];
      while (Over != 0)
      {
	 unsigned long long const toread = std::min(buffersize, Over);
	 if (filefd->Read(buffer, toread) == false)
	    return filefd->FileFdError("Unable to seek ahead %llu",Over);
	 Over -= toread;
      }
      return true;
   }
   virtual unsigned long long InternalTell()
   {
      return seekpos;
   }
   virtual bool InternalClose(std::string const &FileName) = 0;
   virtual bool InternalAlwaysAutoClose() const { return true; }

   virtual ~FileFdPrivate() {}
};
									/*}}}*/
class GIFTWRAP_HIDDEN GzipFileFdPrivate: public FileFdPrivate {	/*{{{*/
#ifdef HAVE_ZLIB
public:
   gzFile gz;
   virtual bool InternalOpen(int const iFd, unsigned int const Mode) override
   {
      if ((Mode & FileFd::WriteOnly) == FileFd::WriteOnly)
	 gz = gzdopen(iFd, ("wb" + std::to_string(compressor.Level)).c_str());
      else
	 gz = gzdopen(iFd, "rb");
      filefd->Flags |= FileFd::Compressed;
      return gz != nullptr;
   }
   virtual ssize_t InternalRead(void * const To, unsigned long long const Size) override
   {
      return gzread(gz, To, Size);
   }
   virtual bool InternalReadError() override
   {
      int err;
      char const * const errmsg = gzerror(gz, &err);
      if (err != Z_ERRNO)
	 return filefd->FileFdError("gzread: %s (%d: %s)", _("Read error"), err, errmsg);
      return FileFdPrivate::InternalReadError();
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      int const Res = gzwrite(gz, From, Size);
      return Res == 0 ? -1 : Res;
   }
   virtual bool InternalWriteError() override
   {
      int err;
      char const * const errmsg = gzerror(gz, &err);
      if (err != Z_ERRNO)
	 return filefd->FileFdError("gzwrite: %s (%d: %s)", _("Write error"), err, errmsg);
      return FileFdPrivate::InternalWriteError();
   }
   virtual bool InternalSkip(unsigned long long Over) override
   {
      if (Over == 0)
	 return true;
      off_t const res = gzseek(gz, Over, SEEK_CUR);
      if (res < 0)
	 return filefd->FileFdError("Unable to seek ahead %llu",Over);
      seekpos = res;
      return true;
   }
   virtual unsigned long long InternalTell() override
   {
      return gztell(gz);
   }
   virtual bool InternalClose(std::string const &FileName) override
   {
      if (gz == nullptr)
	 return true;
      int const e = gzclose(gz);
      gz = nullptr;
      // gzclose() on empty files reports a "buffer error", ignore that
      if (e != Z_OK && e != Z_BUF_ERROR)
	 return _error->Errno("close",_("Problem closing the gzip file %s"), FileName.c_str());
      return true;
   }

   explicit GzipFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd), gz(nullptr) {}
   virtual ~GzipFileFdPrivate() { InternalClose(""); }
#endif
};
									/*}}}*/
class GIFTWRAP_HIDDEN Bz2FileFdPrivate: public FileFdPrivate {		/*{{{*/
#ifdef HAVE_BZ2
   BZFILE* bz2;
public:
   virtual bool InternalOpen(int const iFd, unsigned int const Mode) override
   {
      if ((Mode & FileFd::WriteOnly) == FileFd::WriteOnly)
	 bz2 = BZ2_bzdopen(iFd, ("w" + std::to_string(compressor.Level)).c_str());
      else
	 bz2 = BZ2_bzdopen(iFd, "r");
      filefd->Flags |= FileFd::Compressed;
      return bz2 != nullptr;
   }
   virtual ssize_t InternalRead(void * const To, unsigned long long const Size) override
   {
      return BZ2_bzread(bz2, To, Size);
   }
   virtual bool InternalReadError() override
   {
      int err;
      char const * const errmsg = BZ2_bzerror(bz2, &err);
      if (err != BZ_IO_ERROR)
	 return filefd->FileFdError("BZ2_bzread: %s %s (%d: %s)", filefd->FileName.c_str(), _("Read error"), err, errmsg);
      return FileFdPrivate::InternalReadError();
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      return BZ2_bzwrite(bz2, const_cast<void *>(From), Size);
   }
   virtual bool InternalWriteError() override
   {
      int err;
      char const * const errmsg = BZ2_bzerror(bz2, &err);
      if (err != BZ_IO_ERROR)
	 return filefd->FileFdError("BZ2_bzwrite: %s %s (%d: %s)", filefd->FileName.c_str(), _("Write error"), err, errmsg);
      return FileFdPrivate::InternalWriteError();
   }
   virtual bool InternalClose(std::string const &) override
   {
      if (bz2 == nullptr)
	 return true;
      BZ2_bzclose(bz2);
      bz2 = nullptr;
      return true;
   }

   explicit Bz2FileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd), bz2(nullptr) {}
   virtual ~Bz2FileFdPrivate() { InternalClose(""); }
#endif
};
									/*}}}*/
class GIFTWRAP_HIDDEN LzmaFileFdPrivate: public FileFdPrivate {	/*{{{*/
#ifdef HAVE_LZMA
   FILE* file;
   uint8_t buffer[4096];
   lzma_stream stream;
   lzma_ret err;
   bool eof;
   bool compressing;

   bool FinishStream()
   {
      while (true)
      {
	 stream.avail_out = sizeof(buffer);
	 stream.next_out = buffer;
	 err = lzma_code(&stream, LZMA_FINISH);
	 if (err != LZMA_OK && err != LZMA_STREAM_END)
	    return _error->Error("lzma_code: Compress finalisation failed (%d)", err);
	 size_t const n = sizeof(buffer) - stream.avail_out;
	 if (n != 0 && fwrite(buffer, 1, n, file) != n)
	    return _error->Errno("fwrite",_("Write error"));
	 if (err == LZMA_STREAM_END)
	    return true;
      }
   }
public:
   virtual bool InternalOpen(int const iFd, unsigned int const Mode) override
   {
      if ((Mode & FileFd::ReadWrite) == FileFd::ReadWrite)
	 return filefd->FileFdError("ReadWrite mode is not supported for xz files %s", filefd->FileName.c_str());

      compressing = (Mode & FileFd::WriteOnly) == FileFd::WriteOnly;
      file = fdopen(iFd, compressing ? "w" : "r");
      filefd->Flags |= FileFd::Compressed;
      if (file == nullptr)
	 return false;

      lzma_stream tmp_stream = LZMA_STREAM_INIT;
      stream = tmp_stream;
      if (compressing == true)
	 return lzma_easy_encoder(&stream, compressor.Level, LZMA_CHECK_CRC64) == LZMA_OK;
      return lzma_auto_decoder(&stream, UINT64_MAX, 0) == LZMA_OK;
   }
   virtual ssize_t InternalRead(void * const To, unsigned long long const Size) override
   {
      if (eof == true)
	 return 0;

      stream.next_out = static_cast<uint8_t *>(To);
      stream.avail_out = Size;
      if (stream.avail_in == 0)
      {
	 stream.next_in = buffer;
	 stream.avail_in = fread(buffer, 1, sizeof(buffer), file);
      }
      err = lzma_code(&stream, LZMA_RUN);
      if (err == LZMA_STREAM_END)
      {
	 eof = true;
	 return Size - stream.avail_out;
      }
      if (err != LZMA_OK)
      {
	 errno = 0;
	 return -1;
      }
      ssize_t const Res = Size - stream.avail_out;
      if (Res == 0)
      {
	 // the decoder consumed input but produced no output yet
	 errno = EINTR;
	 return -1;
      }
      return Res;
   }
   virtual bool InternalReadError() override
   {
      return filefd->FileFdError("lzma_read: %s (%d)", _("Read error"), err);
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      stream.next_in = static_cast<uint8_t const *>(From);
      stream.avail_in = Size;
      stream.next_out = buffer;
      stream.avail_out = sizeof(buffer);
      err = lzma_code(&stream, LZMA_RUN);
      if (err != LZMA_OK)
	 return -1;
      size_t const n = sizeof(buffer) - stream.avail_out;
      if (n != 0 && fwrite(buffer, 1, n, file) != n)
      {
	 errno = 0;
	 return -1;
      }
      ssize_t const Res = Size - stream.avail_in;
      if (Res == 0)
      {
	 errno = EINTR;
	 return -1;
      }
      return Res;
   }
   virtual bool InternalWriteError() override
   {
      return filefd->FileFdError("lzma_write: %s (%d)", _("Write error"), err);
   }
   virtual bool InternalClose(std::string const &) override
   {
      if (file == nullptr)
	 return true;
      bool Res = true;
      if (compressing == true && filefd->Failed() == false)
	 Res = FinishStream();
      lzma_end(&stream);
      if (fclose(file) != 0 && Res == true)
	 Res = _error->Errno("fclose", _("Write error"));
      file = nullptr;
      return Res;
   }

   explicit LzmaFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd),
      file(nullptr), err(LZMA_OK), eof(false), compressing(false)
   {
      lzma_stream tmp_stream = LZMA_STREAM_INIT;
      stream = tmp_stream;
   }
   virtual ~LzmaFileFdPrivate() { InternalClose(""); }
#endif
};
									/*}}}*/
class GIFTWRAP_HIDDEN DirectFileFdPrivate: public FileFdPrivate	/*{{{*/
{
public:
   virtual bool InternalOpen(int const, unsigned int const) override { return true; }
   virtual ssize_t InternalRead(void * const To, unsigned long long const Size) override
   {
      return read(filefd->iFd, To, Size);
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      return write(filefd->iFd, From, Size);
   }
   virtual bool InternalSeek(unsigned long long const To) override
   {
      off_t const res = lseek(filefd->iFd, To, SEEK_SET);
      if (res != (off_t)To)
	 return filefd->FileFdError("Unable to seek to %llu", To);
      seekpos = To;
      return true;
   }
   virtual bool InternalSkip(unsigned long long Over) override
   {
      if (Over == 0)
	 return true;
      off_t const res = lseek(filefd->iFd, Over, SEEK_CUR);
      if (res < 0)
	 return filefd->FileFdError("Unable to seek ahead %llu",Over);
      seekpos = res;
      return true;
   }
   virtual unsigned long long InternalTell() override
   {
      return lseek(filefd->iFd,0,SEEK_CUR);
   }
   virtual bool InternalClose(std::string const &) override { return true; }
   virtual bool InternalAlwaysAutoClose() const override { return false; }

   explicit DirectFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd) {}
   virtual ~DirectFileFdPrivate() { InternalClose(""); }
};
									/*}}}*/
// FileFd Constructors							/*{{{*/
FileFd::FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode) : iFd(-1), Flags(0), d(NULL)
{
   Open(FileName,Mode, None, AccessMode);
}
FileFd::FileFd(std::string FileName,unsigned int const Mode, CompressMode Compress, unsigned long AccessMode) : iFd(-1), Flags(0), d(NULL)
{
   Open(FileName,Mode, Compress, AccessMode);
}
FileFd::FileFd() : iFd(-1), Flags(AutoClose), d(NULL) {}
FileFd::FileFd(int const Fd, unsigned int const Mode, CompressMode Compress) : iFd(-1), Flags(0), d(NULL)
{
   OpenDescriptor(Fd, Mode, Compress);
}
									/*}}}*/
// CompressorForMode - map a CompressMode to a configured compressor	/*{{{*/
static bool CompressorForMode(FileFd::CompressMode const Compress, std::string const &FileName,
			      GiftWrap::Configuration::Compressor &compressor)
{
   std::string name;
   switch (Compress)
   {
   case FileFd::None: name = "."; break;
   case FileFd::Gzip: name = "gzip"; break;
   case FileFd::Bzip2: name = "bzip2"; break;
   case FileFd::Xz: name = "xz"; break;
   case FileFd::Extension:
      name = ".";
      for (auto const &c : GiftWrap::Configuration::getCompressors())
	 if (c.Extension.empty() == false && GiftWrap::String::Endswith(FileName, c.Extension))
	 {
	    name = c.Name;
	    break;
	 }
      break;
   }
   return GiftWrap::Configuration::findCompressor(name, compressor);
}
									/*}}}*/
// FileFd::Open - Open a file						/*{{{*/
// ---------------------------------------------------------------------
/* The most commonly used open mode combinations are given with Mode */
bool FileFd::Open(std::string FileName,unsigned int const Mode,CompressMode Compress, unsigned long const AccessMode)
{
   GiftWrap::Configuration::Compressor compressor;
   if (CompressorForMode(Compress, FileName, compressor) == false)
   {
      Close();
      return FileFdError("Can't find a configured compressor for file %s", FileName.c_str());
   }
   return Open(FileName, Mode, compressor, AccessMode);
}
bool FileFd::Open(std::string FileName,unsigned int const Mode,GiftWrap::Configuration::Compressor const &compressor, unsigned long const AccessMode)
{
   Close();
   Flags = AutoClose;

   if ((Mode & WriteOnly) != WriteOnly && (Mode & (Create | Empty | Exclusive)) != 0)
      return FileFdError("ReadOnly mode for %s doesn't accept additional flags!", FileName.c_str());
   if ((Mode & ReadWrite) == 0)
      return FileFdError("No openmode provided in FileFd::Open for %s", FileName.c_str());

   if ((Mode & (Exclusive | Create)) == (Exclusive | Create))
      RemoveFile("FileFd::Open", FileName);
   if ((Mode & Empty) == Empty)
   {
      struct stat Buf;
      if (lstat(FileName.c_str(),&Buf) == 0 && S_ISLNK(Buf.st_mode))
	 RemoveFile("FileFd::Open", FileName);
   }

   int fileflags = 0;
   #define if_FLAGGED_SET(FLAG, MODE) if ((Mode & FLAG) == FLAG) fileflags |= MODE
   if_FLAGGED_SET(ReadWrite, O_RDWR);
   else if_FLAGGED_SET(ReadOnly, O_RDONLY);
   else if_FLAGGED_SET(WriteOnly, O_WRONLY);

   if_FLAGGED_SET(Create, O_CREAT);
   if_FLAGGED_SET(Empty, O_TRUNC);
   if_FLAGGED_SET(Exclusive, O_EXCL);
   #undef if_FLAGGED_SET

   // compressed streams only go one direction
   unsigned int OpenMode = Mode;
   if (compressor.Name != "." && (OpenMode & ReadWrite) == ReadWrite)
      OpenMode &= ~ReadOnly;

   iFd = open(FileName.c_str(), fileflags, AccessMode);
   this->FileName = FileName;
   if (iFd == -1 || OpenInternDescriptor(OpenMode, compressor) == false)
   {
      if (iFd != -1)
      {
	 close (iFd);
	 iFd = -1;
      }
      return FileFdErrno("open",_("Could not open file %s"), FileName.c_str());
   }

   SetCloseExec(iFd,true);
   return true;
}
									/*}}}*/
// FileFd::OpenDescriptor - Open a filedescriptor			/*{{{*/
bool FileFd::OpenDescriptor(int Fd, unsigned int const Mode, CompressMode Compress, bool AutoClose)
{
   GiftWrap::Configuration::Compressor compressor;
   if (Compress == Extension || CompressorForMode(Compress, "", compressor) == false)
   {
      if (AutoClose == true && Fd != -1)
	 close(Fd);
      return FileFdError("Can't find a compressor for descriptor %d", Fd);
   }
   return OpenDescriptor(Fd, Mode, compressor, AutoClose);
}
bool FileFd::OpenDescriptor(int Fd, unsigned int const Mode, GiftWrap::Configuration::Compressor const &compressor, bool AutoClose)
{
   Close();
   Flags = (AutoClose) ? FileFd::AutoClose : 0;
   iFd = Fd;
   this->FileName = "";
   if (OpenInternDescriptor(Mode, compressor) == false)
   {
      if (iFd != -1 && (
	(Flags & Compressed) == Compressed ||
	AutoClose == true))
      {
	 close (iFd);
	 iFd = -1;
      }
      return FileFdError(_("Could not open file descriptor %d"), Fd);
   }
   return true;
}
bool FileFd::OpenInternDescriptor(unsigned int const Mode, GiftWrap::Configuration::Compressor const &compressor)
{
   if (iFd == -1)
      return false;

   if (d != nullptr)
   {
      d->InternalClose(FileName);
      delete d;
      d = nullptr;
   }

   if (false)
      /* dummy so that the rest can be 'else if's */;
#define GIFTWRAP_COMPRESS_INIT(NAME, CONSTRUCTOR) \
   else if (compressor.Name == NAME) \
      d = new CONSTRUCTOR(this)
#ifdef HAVE_ZLIB
   GIFTWRAP_COMPRESS_INIT("gzip", GzipFileFdPrivate);
#endif
#ifdef HAVE_BZ2
   GIFTWRAP_COMPRESS_INIT("bzip2", Bz2FileFdPrivate);
#endif
#ifdef HAVE_LZMA
   GIFTWRAP_COMPRESS_INIT("xz", LzmaFileFdPrivate);
#endif
#undef GIFTWRAP_COMPRESS_INIT
   else if (compressor.Name == ".")
      d = new DirectFileFdPrivate(this);
   else
      return FileFdError("Compressor %s is not supported by this build", compressor.Name.c_str());

   d->set_openmode(Mode);
   d->set_compressor(compressor);
   if ((Flags & AutoClose) != AutoClose && d->InternalAlwaysAutoClose())
   {
      // the library closes what it is given, so hand it a duplicate
      int const internFd = dup(iFd);
      if (internFd == -1)
	 return FileFdErrno("OpenInternDescriptor", _("Could not open file descriptor %d"), iFd);
      iFd = internFd;
   }
   return d->InternalOpen(iFd, Mode);
}
									/*}}}*/
// FileFd::~File - Closes the file					/*{{{*/
FileFd::~FileFd()
{
   Close();
   if (d != NULL)
      d->InternalClose(FileName);
   delete d;
   d = NULL;
}
									/*}}}*/
// FileFd::Read - Read a bit of the file				/*{{{*/
// ---------------------------------------------------------------------
/* We are careful to handle interruption by a signal while reading
   gracefully. */
bool FileFd::Read(void *To,unsigned long long Size,unsigned long long *Actual)
{
   if (d == nullptr || Failed())
      return false;
   ssize_t Res = 1;
   errno = 0;
   if (Actual != 0)
      *Actual = 0;
   *((char *)To) = '\0';
   while (Res > 0 && Size > 0)
   {
      Res = d->InternalRead(To, Size);

      if (Res < 0)
      {
	 if (errno == EINTR)
	 {
	    // trick the while-loop into running again
	    Res = 1;
	    errno = 0;
	    continue;
	 }
	 return d->InternalReadError();
      }

      To = (char *)To + Res;
      Size -= Res;
      d->set_seekpos(d->get_seekpos() + Res);
      if (Actual != 0)
	 *Actual += Res;
   }

   if (Size == 0)
      return true;

   // Eof handling
   if (Actual != 0)
   {
      Flags |= HitEof;
      return true;
   }

   return FileFdError(_("read, still have %llu to read but none left"), Size);
}
									/*}}}*/
// FileFd::ReadAll - Read until the end of the file			/*{{{*/
bool FileFd::ReadAll(std::string &To)
{
   To.clear();
   char Buffer[4096];
   unsigned long long Actual = 0;
   do {
      if (Read(Buffer, sizeof(Buffer), &Actual) == false)
	 return false;
      To.append(Buffer, Actual);
   } while (Actual != 0);
   return true;
}
									/*}}}*/
// FileFd::Write - Write to the file					/*{{{*/
bool FileFd::Write(const void *From,unsigned long long Size)
{
   if (d == nullptr || Failed())
      return false;
   ssize_t Res = 1;
   errno = 0;
   while (Res > 0 && Size > 0)
   {
      Res = d->InternalWrite(From, Size);

      if (Res < 0)
      {
	 if (errno == EINTR)
	 {
	    // trick the while-loop into running again
	    Res = 1;
	    errno = 0;
	    continue;
	 }
	 return d->InternalWriteError();
      }

      From = (char const *)From + Res;
      Size -= Res;
      d->set_seekpos(d->get_seekpos() + Res);
   }

   if (Size == 0)
      return true;

   return FileFdError(_("write, still have %llu to write but couldn't"), Size);
}
bool FileFd::Write(int Fd, const void *From, unsigned long long Size)
{
   ssize_t Res = 1;
   errno = 0;
   while (Res > 0 && Size > 0)
   {
      Res = write(Fd,From,Size);
      if (Res < 0 && errno == EINTR)
	 continue;
      if (Res < 0)
	 return _error->Errno("write",_("Write error"));

      From = (char const *)From + Res;
      Size -= Res;
   }

   if (Size == 0)
      return true;

   return _error->Error(_("write, still have %llu to write but couldn't"), Size);
}
									/*}}}*/
// FileFd::Seek - Seek in the file					/*{{{*/
bool FileFd::Seek(unsigned long long To)
{
   if (d == nullptr || Failed())
      return false;
   Flags &= ~HitEof;
   return d->InternalSeek(To);
}
									/*}}}*/
// FileFd::Skip - Skip over data in the file				/*{{{*/
bool FileFd::Skip(unsigned long long Over)
{
   if (d == nullptr || Failed())
      return false;
   return d->InternalSkip(Over);
}
									/*}}}*/
// FileFd::Tell - Current seek position					/*{{{*/
unsigned long long FileFd::Tell()
{
   if (d == nullptr || Failed())
      return 0;
   off_t const Res = d->InternalTell();
   if (Res == (off_t)-1)
   {
      FileFdErrno("lseek","Failed to determine the current file position");
      return 0;
   }
   d->set_seekpos(Res);
   return Res;
}
									/*}}}*/
// FileFd::FileSize - Return the size of the file			/*{{{*/
unsigned long long FileFd::FileSize()
{
   struct stat Buf;
   if (fstat(iFd,&Buf) != 0)
   {
      FileFdErrno("fstat", "Unable to determine the file size of %s", FileName.c_str());
      return 0;
   }
   return Buf.st_size;
}
									/*}}}*/
// FileFd::Close - Close the file if the close flag is set		/*{{{*/
bool FileFd::Close()
{
   if (iFd == -1)
      return true;

   bool Res = true;
   if ((Flags & AutoClose) == AutoClose)
   {
      if ((Flags & Compressed) != Compressed && iFd > 0 && close(iFd) != 0)
	 Res &= _error->Errno("close",_("Problem closing the file %s"), FileName.c_str());
   }

   if (d != NULL)
   {
      Res &= d->InternalClose(FileName);
      delete d;
      d = NULL;
   }

   iFd = -1;

   if (Res == false)
      Flags |= Fail;

   if ((Flags & Fail) == Fail && (Flags & DelOnFail) == DelOnFail &&
       FileName.empty() == false)
      Res &= RemoveFile("FileFd::Close", FileName);

   return Res;
}
									/*}}}*/
// FileFd::FileFdErrno - set Fail and call _error->Errno		/*{{{*/
bool FileFd::FileFdErrno(const char *Function, const char *Description,...)
{
   Flags |= Fail;
   int const errsv = errno;
   va_list args;
   va_start(args,Description);
   char Buf[1024];
   vsnprintf(Buf, sizeof(Buf), Description, args);
   va_end(args);
   errno = errsv;
   return _error->Errno(Function, "%s", Buf);
}
									/*}}}*/
// FileFd::FileFdError - set Fail and call _error->Error		/*{{{*/
bool FileFd::FileFdError(const char *Description,...) {
   Flags |= Fail;
   va_list args;
   va_start(args,Description);
   char Buf[1024];
   vsnprintf(Buf, sizeof(Buf), Description, args);
   va_end(args);
   return _error->Error("%s", Buf);
}
									/*}}}*/
// GetTempDir - the directory temporary files should be created in	/*{{{*/
// ---------------------------------------------------------------------
/* $TMPDIR if it is a directory we can write to, /tmp otherwise */
std::string GetTempDir()
{
   const char *tmpdir = getenv("TMPDIR");

#ifdef P_tmpdir
   if (!tmpdir)
      tmpdir = P_tmpdir;
#endif

   struct stat st;
   if (!tmpdir || strlen(tmpdir) == 0 ||
	 stat(tmpdir, &st) != 0 || S_ISDIR(st.st_mode) == false)
      tmpdir = "/tmp";
   else if (geteuid() != 0 &&
	 faccessat(AT_FDCWD, tmpdir, R_OK | W_OK | X_OK, AT_EACCESS) != 0)
      tmpdir = "/tmp";

   return std::string(tmpdir);
}
									/*}}}*/
FileFd* GetTempFile(std::string const &Prefix, bool ImmediateUnlink, FileFd * const TmpFd)	/*{{{*/
{
   std::string const tempdir = GetTempDir();
   std::string fn = tempdir + "/" + Prefix + ".XXXXXX";
   int const fd = mkstemp(&fn[0]);
   if (fd < 0)
   {
      _error->Errno("GetTempFile",_("Unable to mkstemp %s"), fn.c_str());
      return NULL;
   }
   if (ImmediateUnlink)
      unlink(fn.c_str());

   std::unique_ptr<FileFd> Owned(TmpFd == NULL ? new FileFd() : nullptr);
   FileFd * const Fd = TmpFd == NULL ? Owned.get() : TmpFd;
   if (!Fd->OpenDescriptor(fd, FileFd::ReadWrite, FileFd::None, true))
   {
      _error->Errno("GetTempFile",_("Unable to write to %s"),fn.c_str());
      return NULL;
   }
   if (ImmediateUnlink == false)
      Fd->Name() = fn;
   Owned.release();
   return Fd;
}
									/*}}}*/
bool Popen(const char* Args[], FileFd &Fd, pid_t &Child, FileFd::OpenMode Mode, bool CaptureStderr)/*{{{*/
{
   if (Mode != FileFd::ReadOnly && Mode != FileFd::WriteOnly)
      return _error->Error("Popen supports ReadOnly (x)or WriteOnly mode only");

   int Pipe[2] = {-1, -1};
   if(pipe(Pipe) != 0)
      return _error->Errno("pipe", _("Failed to create subprocess IPC"));

   std::set<int> keep_fds;
   keep_fds.insert(Pipe[0]);
   keep_fds.insert(Pipe[1]);
   Child = ExecFork(keep_fds);
   if(Child < 0)
   {
      close(Pipe[0]);
      close(Pipe[1]);
      return _error->Errno("fork", "Failed to fork");
   }
   if(Child == 0)
   {
      if(Mode == FileFd::ReadOnly)
      {
	 close(Pipe[0]);
	 dup2(Pipe[1], 1);
	 if (CaptureStderr == true)
	    dup2(Pipe[1], 2);
      }
      else
      {
	 close(Pipe[1]);
	 dup2(Pipe[0], 0);
      }

      execv(Args[0], (char**)Args);
      _exit(100);
   }

   int fd;
   if(Mode == FileFd::ReadOnly)
   {
      close(Pipe[1]);
      fd = Pipe[0];
   }
   else
   {
      close(Pipe[0]);
      fd = Pipe[1];
   }
   return Fd.OpenDescriptor(fd, Mode, FileFd::None, true);
}
									/*}}}*/
