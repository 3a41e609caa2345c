#include <config.h>

#include <giftwrap-pkg/compressors.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>

#include <string>
#include <vector>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

TEST(FileUtlTest, Compressors)
{
   std::vector<GiftWrap::Configuration::Compressor> const comps = GiftWrap::Configuration::getCompressors();
   ASSERT_FALSE(comps.empty());
   EXPECT_EQ(".", comps[0].Name);
   for (size_t i = 1; i < comps.size(); ++i)
      EXPECT_LE(comps[i - 1].Cost, comps[i].Cost);

   GiftWrap::Configuration::Compressor c;
   EXPECT_TRUE(GiftWrap::Configuration::findCompressor("gzip", c));
   EXPECT_EQ(".gz", c.Extension);
   EXPECT_TRUE(GiftWrap::Configuration::findCompressor(".xz", c));
   EXPECT_EQ("xz", c.Name);
   EXPECT_TRUE(GiftWrap::Configuration::findCompressor("bzip2", c));
   EXPECT_EQ(".bz2", c.Extension);
   EXPECT_FALSE(GiftWrap::Configuration::findCompressor("zstd", c));
   EXPECT_FALSE(GiftWrap::Configuration::findCompressor("", c));
   EXPECT_TRUE(_error->empty(GlobalError::DEBUG));
}

static void TestFileFd(GiftWrap::Configuration::Compressor const &compressor)
{
   std::string const content = "Package: giftwrap\nVersion: 1.0\n";
   FileFd f;
   ASSERT_NE(nullptr, GetTempFile("fileutl-" + compressor.Name, false, &f));
   std::string const name = f.Name();
   ASSERT_TRUE(f.Close());
   ScopedFileDeleter deleter(name);

   ASSERT_TRUE(f.Open(name, FileFd::WriteOnly | FileFd::Empty, compressor));
   EXPECT_TRUE(f.IsOpen());
   EXPECT_FALSE(f.Failed());
   EXPECT_EQ(compressor.Name != ".", f.IsCompressed());
   EXPECT_TRUE(f.Write(content));
   EXPECT_TRUE(f.Close());

   ASSERT_TRUE(f.Open(name, FileFd::ReadOnly, compressor));
   std::string read;
   EXPECT_TRUE(f.ReadAll(read));
   EXPECT_EQ(content, read);
   EXPECT_TRUE(f.Eof());
   EXPECT_TRUE(f.Close());

   ASSERT_TRUE(f.Open(name, FileFd::ReadOnly, compressor));
   EXPECT_TRUE(f.Seek(9));
   EXPECT_EQ(9u, f.Tell());
   char buf[9];
   EXPECT_TRUE(f.Read(buf, 8));
   buf[8] = '\0';
   EXPECT_STREQ("giftwrap", buf);
   EXPECT_TRUE(f.Close());

   if (compressor.Name != ".")
   {
      // the compressed data is not the content
      ASSERT_TRUE(f.Open(name, FileFd::ReadOnly));
      EXPECT_TRUE(f.ReadAll(read));
      EXPECT_NE(content, read);
      EXPECT_TRUE(f.Close());
   }
}
TEST(FileUtlTest, FileFdCompressed)
{
   for (auto const &c : GiftWrap::Configuration::getCompressors())
   {
      SCOPED_TRACE(c.Name);
      TestFileFd(c);
   }
}
TEST(FileUtlTest, FileFdErrors)
{
   FileFd f("/does/not/exist/at/all", FileFd::ReadOnly);
   EXPECT_FALSE(f.IsOpen());
   EXPECT_TRUE(f.Failed());
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   std::string dir;
   createTemporaryDirectory("fileutl", dir);
   std::string const file = flCombine(dir, "erased");
   {
      FileFd out(file, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, 0644);
      ASSERT_TRUE(out.IsOpen());
      out.EraseOnFailure();
      EXPECT_TRUE(out.Write("half", 4));
      out.OpFail();
      EXPECT_TRUE(out.Close());
   }
   EXPECT_FALSE(FileExists(file));
   _error->Discard();
   removeDirectory(dir);
}
TEST(FileUtlTest, CopyFile)
{
   FileFd from;
   openTemporaryFile("copyfile-from", from, "Some content which is copied over\n");
   FileFd to;
   openTemporaryFile("copyfile-to", to);
   EXPECT_TRUE(CopyFile(from, to));
   EXPECT_TRUE(to.Seek(0));
   std::string read;
   EXPECT_TRUE(to.ReadAll(read));
   EXPECT_EQ("Some content which is copied over\n", read);
}
TEST(FileUtlTest, Directories)
{
   std::string dir;
   createTemporaryDirectory("directories", dir);
   EXPECT_TRUE(DirectoryExists(dir));
   EXPECT_FALSE(RealFileExists(dir));
   EXPECT_TRUE(FileExists(dir));

   EXPECT_TRUE(CreateDirectory(dir, dir + "/usr/share/doc"));
   EXPECT_TRUE(DirectoryExists(dir + "/usr/share/doc"));
   EXPECT_FALSE(CreateDirectory(dir + "/usr", "/somewhere/else"));

   createFile(dir, "usr/share/doc/copyright", "none\n");
   createFile(dir, ".hidden", "");
   createLink(dir, "usr/share/doc/copyright", "link");
   EXPECT_TRUE(RealFileExists(dir + "/usr/share/doc/copyright"));

   std::vector<std::string> list;
   EXPECT_TRUE(GetListOfEntriesInDir(dir, list, true));
   ASSERT_EQ(3u, list.size());
   EXPECT_EQ(".hidden", list[0]);
   EXPECT_EQ("link", list[1]);
   EXPECT_EQ("usr", list[2]);

   EXPECT_FALSE(GetListOfEntriesInDir(dir + "/missing", list, true));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   // the link target must survive the removal of the link
   std::string other;
   createTemporaryDirectory("directories-other", other);
   createFile(other, "keep", "me");
   createLink(dir, other + "/keep", "usr/share/keep");
   ASSERT_EQ(0, chmod((dir + "/usr/share").c_str(), 0500));
   EXPECT_TRUE(RemoveDirectoryTree(dir));
   EXPECT_FALSE(DirectoryExists(dir));
   EXPECT_TRUE(RealFileExists(other + "/keep"));
   EXPECT_TRUE(RemoveDirectoryTree(dir));
   removeDirectory(other);
}
TEST(FileUtlTest, FileNames)
{
   EXPECT_EQ("/usr/share/doc", flCombine("/usr/share", "doc"));
   EXPECT_EQ("/usr/share/doc", flCombine("/usr/share/", "doc"));
   EXPECT_EQ("/etc/foo", flCombine("/usr", "/etc/foo"));
}
TEST(FileUtlTest, FindExecutableInPath)
{
   std::string dir;
   createTemporaryDirectory("findexec", dir);
   createExecutable(dir, "fake-dpkg", "#!/bin/sh\necho amd64\n");
   createFile(dir, "not-executable", "");

   EXPECT_EQ(dir + "/fake-dpkg", FindExecutableInPath(dir + "/fake-dpkg"));
   EXPECT_EQ("", FindExecutableInPath(dir + "/not-executable"));
   EXPECT_EQ("", FindExecutableInPath(dir));
   EXPECT_EQ("", FindExecutableInPath(""));

   char const * const oldpath = getenv("PATH");
   std::string const saved = oldpath == nullptr ? "" : oldpath;
   setenv("PATH", ("/nonexistent:" + dir).c_str(), 1);
   EXPECT_EQ(dir + "/fake-dpkg", FindExecutableInPath("fake-dpkg"));
   EXPECT_EQ("", FindExecutableInPath("not-executable"));
   EXPECT_EQ("", FindExecutableInPath("giftwrap-surely-not-installed"));
   if (oldpath == nullptr)
      unsetenv("PATH");
   else
      setenv("PATH", saved.c_str(), 1);
   removeDirectory(dir);
}
TEST(FileUtlTest, Popen)
{
   std::string dir;
   createTemporaryDirectory("popen", dir);
   createExecutable(dir, "talk", "#!/bin/sh\necho out\necho err >&2\nexit $1\n");
   std::string const talk = dir + "/talk";

   FileFd fd;
   pid_t child;
   std::string output;
   const char *okay[] = {talk.c_str(), "0", nullptr};
   ASSERT_TRUE(Popen(okay, fd, child, FileFd::ReadOnly));
   EXPECT_TRUE(fd.ReadAll(output));
   EXPECT_TRUE(fd.Close());
   EXPECT_TRUE(ExecWait(child, "talk"));
   EXPECT_NE(std::string::npos, output.find("out\n"));
   EXPECT_NE(std::string::npos, output.find("err\n"));

   const char *fails[] = {talk.c_str(), "3", nullptr};
   ASSERT_TRUE(Popen(fails, fd, child, FileFd::ReadOnly, false));
   EXPECT_TRUE(fd.ReadAll(output));
   EXPECT_TRUE(fd.Close());
   EXPECT_EQ("out\n", output);
   EXPECT_FALSE(ExecWait(child, "talk"));
   EXPECT_TRUE(_error->PendingError());
   std::string text;
   EXPECT_TRUE(_error->PopMessage(text));
   EXPECT_EQ("Sub-process talk returned an error code (3)", text);
   EXPECT_TRUE(_error->empty(GlobalError::DEBUG));

   // reaped children fail silently
   ASSERT_TRUE(Popen(fails, fd, child, FileFd::ReadOnly, false));
   EXPECT_TRUE(fd.ReadAll(output));
   EXPECT_TRUE(fd.Close());
   EXPECT_FALSE(ExecWait(child, "talk", true));
   EXPECT_TRUE(_error->empty(GlobalError::DEBUG));

   removeDirectory(dir);
}
TEST(FileUtlTest, SourceDateEpoch)
{
   time_t epoch = 42;
   unsetenv("SOURCE_DATE_EPOCH");
   EXPECT_FALSE(GetSourceDateEpoch(epoch));
   EXPECT_EQ(42, epoch);

   setenv("SOURCE_DATE_EPOCH", "1700000000", 1);
   EXPECT_TRUE(GetSourceDateEpoch(epoch));
   EXPECT_EQ(1700000000, epoch);

   setenv("SOURCE_DATE_EPOCH", "yesterday", 1);
   EXPECT_FALSE(GetSourceDateEpoch(epoch));
   EXPECT_FALSE(_error->PendingError());
   EXPECT_FALSE(_error->empty(GlobalError::WARNING));
   _error->Discard();

   setenv("SOURCE_DATE_EPOCH", "-5", 1);
   EXPECT_FALSE(GetSourceDateEpoch(epoch));
   _error->Discard();
   unsetenv("SOURCE_DATE_EPOCH");
}
