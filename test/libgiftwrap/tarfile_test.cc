#include <config.h>

#include <giftwrap-pkg/compressors.h>
#include <giftwrap-pkg/dirstream.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/extracttar.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/packtar.h>

#include <string>
#include <vector>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

namespace {
struct Entry
{
   std::string Name;
   pkgDirStream::Item::Type_t Type;
   std::string LinkTarget;
   unsigned long Mode;
   unsigned long long UID;
   unsigned long long GID;
   unsigned long long MTime;
   std::string Data;
};
class RecordingStream : public pkgDirStream
{
   public:
   std::vector<Entry> Entries;

   bool DoItem(Item &Itm, int &Fd) override
   {
      Entries.push_back({Itm.Name, Itm.Type, Itm.LinkTarget, Itm.Mode, Itm.UID, Itm.GID, Itm.MTime, ""});
      Fd = -2;
      return true;
   }
   bool Process(Item &, const unsigned char *Data, unsigned long long Size, unsigned long long) override
   {
      Entries.back().Data.append(reinterpret_cast<char const *>(Data), Size);
      return true;
   }
};

class TarFileTest : public ::testing::Test
{
   protected:
   std::string tree;

   void SetUp() override
   {
      unsetenv("SOURCE_DATE_EPOCH");
      createTemporaryDirectory("tarfile", tree);
      ASSERT_EQ(0, chmod(tree.c_str(), 0755));
      createDirectory(tree, "etc");
      createDirectory(tree, "usr/bin");
      createFile(tree, "etc/foo.conf", "key=value\n");
      createExecutable(tree, "usr/bin/tool", "#!/bin/sh\nexit 0\n");
      createLink(tree, "/usr/bin/tool", "link");
      for (auto const dir : {"etc", "usr", "usr/bin"})
	 ASSERT_EQ(0, chmod(flCombine(tree, dir).c_str(), 0755));
   }
   void TearDown() override
   {
      unsetenv("SOURCE_DATE_EPOCH");
      removeDirectory(tree);
   }
};

void PackAndExtract(std::string const &tree, GiftWrap::Configuration::Compressor const &comp, RecordingStream &stream)
{
   FileFd tar;
   ASSERT_NE(nullptr, GetTempFile("tarfile" + comp.Extension, false, &tar));
   std::string const name = tar.Name();
   ScopedFileDeleter deleter(name);
   ASSERT_TRUE(tar.Close());

   ASSERT_TRUE(tar.Open(name, FileFd::WriteOnly | FileFd::Empty, comp));
   {
      PackTar packer(tar);
      ASSERT_TRUE(packer.Go(tree));
   }
   ASSERT_TRUE(tar.Close());

   FileFd in(name, FileFd::ReadOnly);
   ASSERT_TRUE(in.IsOpen());
   if (comp.Name == ".")
      EXPECT_EQ(0u, in.FileSize() % 512);
   ExtractTar extract(in, in.FileSize(), comp.Name);
   ASSERT_TRUE(extract.Go(stream));
}
}

TEST_F(TarFileTest, PackAndExtract)
{
   for (auto const &comp : GiftWrap::Configuration::getCompressors())
   {
      SCOPED_TRACE(comp.Name);
      RecordingStream stream;
      ASSERT_NO_FATAL_FAILURE(PackAndExtract(tree, comp, stream));
      auto const &e = stream.Entries;
      ASSERT_EQ(7u, e.size());

      EXPECT_EQ("./", e[0].Name);
      EXPECT_EQ(pkgDirStream::Item::Directory, e[0].Type);
      EXPECT_EQ(0755u, e[0].Mode);
      EXPECT_EQ("./etc/", e[1].Name);
      EXPECT_EQ(pkgDirStream::Item::Directory, e[1].Type);
      EXPECT_EQ("./etc/foo.conf", e[2].Name);
      EXPECT_EQ(pkgDirStream::Item::File, e[2].Type);
      EXPECT_EQ(0644u, e[2].Mode);
      EXPECT_EQ("key=value\n", e[2].Data);
      EXPECT_EQ("./link", e[3].Name);
      EXPECT_EQ(pkgDirStream::Item::SymbolicLink, e[3].Type);
      EXPECT_EQ("/usr/bin/tool", e[3].LinkTarget);
      EXPECT_EQ("./usr/", e[4].Name);
      EXPECT_EQ("./usr/bin/", e[5].Name);
      EXPECT_EQ("./usr/bin/tool", e[6].Name);
      EXPECT_EQ(0755u, e[6].Mode);
      EXPECT_EQ("#!/bin/sh\nexit 0\n", e[6].Data);

      for (auto const &entry : e)
      {
	 EXPECT_EQ(0u, entry.UID) << entry.Name;
	 EXPECT_EQ(0u, entry.GID) << entry.Name;
      }
   }
}
TEST_F(TarFileTest, SourceDateEpochClamps)
{
   GiftWrap::Configuration::Compressor none;
   ASSERT_TRUE(GiftWrap::Configuration::findCompressor(".", none));

   RecordingStream current;
   ASSERT_NO_FATAL_FAILURE(PackAndExtract(tree, none, current));
   ASSERT_FALSE(current.Entries.empty());
   for (auto const &entry : current.Entries)
      EXPECT_LT(1000u, entry.MTime) << entry.Name;

   setenv("SOURCE_DATE_EPOCH", "1000", 1);
   RecordingStream clamped;
   ASSERT_NO_FATAL_FAILURE(PackAndExtract(tree, none, clamped));
   ASSERT_EQ(current.Entries.size(), clamped.Entries.size());
   for (auto const &entry : clamped.Entries)
      EXPECT_EQ(1000u, entry.MTime) << entry.Name;

   // only newer times are clamped
   setenv("SOURCE_DATE_EPOCH", "4000000000", 1);
   RecordingStream future;
   ASSERT_NO_FATAL_FAILURE(PackAndExtract(tree, none, future));
   ASSERT_EQ(current.Entries.size(), future.Entries.size());
   for (size_t i = 0; i < future.Entries.size(); ++i)
      EXPECT_EQ(current.Entries[i].MTime, future.Entries[i].MTime) << future.Entries[i].Name;
}
TEST_F(TarFileTest, LongNames)
{
   std::string const longname(120, 'n');
   std::string const longtarget = "/usr/share/" + std::string(150, 't');
   createFile(tree, "usr/bin/" + longname, "long\n");
   createLink(tree, longtarget, "usr/bin/longlink");

   GiftWrap::Configuration::Compressor gzip;
   ASSERT_TRUE(GiftWrap::Configuration::findCompressor("gzip", gzip));
   RecordingStream stream;
   ASSERT_NO_FATAL_FAILURE(PackAndExtract(tree, gzip, stream));

   bool seenName = false, seenLink = false;
   for (auto const &entry : stream.Entries)
   {
      if (entry.Name == "./usr/bin/" + longname)
      {
	 seenName = true;
	 EXPECT_EQ(pkgDirStream::Item::File, entry.Type);
	 EXPECT_EQ("long\n", entry.Data);
      }
      else if (entry.Name == "./usr/bin/longlink")
      {
	 seenLink = true;
	 EXPECT_EQ(pkgDirStream::Item::SymbolicLink, entry.Type);
	 EXPECT_EQ(longtarget, entry.LinkTarget);
      }
      EXPECT_NE("././@LongLink", entry.Name);
   }
   EXPECT_TRUE(seenName);
   EXPECT_TRUE(seenLink);
}
TEST_F(TarFileTest, Unsupported)
{
   ASSERT_EQ(0, mkfifo(flCombine(tree, "etc/fifo").c_str(), 0644));
   FileFd tar;
   openTemporaryFile("tarfile-fifo", tar);
   PackTar packer(tar);
   EXPECT_FALSE(packer.Go(tree));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   EXPECT_FALSE(packer.Go(flCombine(tree, "etc/foo.conf")));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
}
TEST_F(TarFileTest, TruncatedArchive)
{
   FileFd tar;
   openTemporaryFile("tarfile-truncated", tar);
   {
      PackTar packer(tar);
      ASSERT_TRUE(packer.Go(tree));
   }
   ASSERT_TRUE(tar.Seek(0));
   RecordingStream stream;
   ExtractTar extract(tar, 1024, ".");
   EXPECT_FALSE(extract.Go(stream));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   EXPECT_FALSE(stream.Entries.empty());
}
