#include <giftwrap-pkg/fileutl.h>

#include <string>

#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

void helperCreateTemporaryDirectory(std::string const &id, std::string &dir)
{
   std::string const strtempdir = GetTempDir().append("/giftwrap-tests-").append(id).append(".XXXXXX");
   char * tempdir = strdup(strtempdir.c_str());
   ASSERT_STREQ(tempdir, mkdtemp(tempdir));
   dir = tempdir;
   free(tempdir);
}
void helperRemoveDirectory(std::string const &dir)
{
   // basic sanity check to avoid removing random directories based on earlier failures
   if (dir.find("/giftwrap-") == std::string::npos || dir.find_first_of("*?") != std::string::npos)
      FAIL() << "Directory '" << dir << "' seems invalid. It is therefore not removed!";
   else
      ASSERT_TRUE(RemoveDirectoryTree(dir));
}
void helperCreateFile(std::string const &dir, std::string const &name, std::string const &content)
{
   std::string const file = flCombine(dir, name);
   FileFd fd(file, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, 0644);
   ASSERT_TRUE(fd.IsOpen());
   ASSERT_TRUE(fd.Write(content));
   ASSERT_TRUE(fd.Close());
   // independent of the umask
   ASSERT_EQ(0, chmod(file.c_str(), 0644));
}
void helperCreateExecutable(std::string const &dir, std::string const &name, std::string const &content)
{
   helperCreateFile(dir, name, content);
   ASSERT_EQ(0, chmod(flCombine(dir, name).c_str(), 0755));
}
void helperCreateDirectory(std::string const &dir, std::string const &name)
{
   std::string file = dir;
   file.append("/");
   file.append(name);
   ASSERT_TRUE(CreateDirectory(dir, file));
}
void helperCreateLink(std::string const &dir, std::string const &targetname, std::string const &linkname)
{
   std::string link = dir;
   link.append("/");
   link.append(linkname);
   ASSERT_EQ(0, symlink(targetname.c_str(), link.c_str()));
}
std::string readFile(std::string const &path)
{
   std::string content;
   FileFd fd(path, FileFd::ReadOnly);
   EXPECT_TRUE(fd.IsOpen());
   EXPECT_TRUE(fd.ReadAll(content));
   return content;
}

void openTemporaryFile(std::string const &id, FileFd &fd, char const * const content, bool const ImmediateUnlink)
{
   EXPECT_NE(nullptr, GetTempFile("giftwrap-" + id, ImmediateUnlink, &fd));
   EXPECT_TRUE(ImmediateUnlink || not fd.Name().empty());
   if (content != nullptr)
   {
      EXPECT_TRUE(fd.Write(content, strlen(content)));
      fd.Seek(0);
   }
}
ScopedFileDeleter::ScopedFileDeleter(std::string const &filename) : _filename{filename} {}
ScopedFileDeleter::ScopedFileDeleter(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter& ScopedFileDeleter::operator=(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter::~ScopedFileDeleter() {
   if (not _filename.empty())
      RemoveFile("ScopedFileDeleter", _filename.c_str());
}
[[nodiscard]] ScopedFileDeleter createTemporaryFile(std::string const &id, char const * const content)
{
   FileFd fd;
   openTemporaryFile(id, fd, content, false);
   EXPECT_TRUE(fd.IsOpen());
   EXPECT_TRUE(fd.Close());
   EXPECT_FALSE(fd.Name().empty());
   return ScopedFileDeleter{fd.Name()};
}
