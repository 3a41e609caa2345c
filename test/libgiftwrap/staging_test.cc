#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/debstaging.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>

#include <string>
#include <sys/stat.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

static mode_t ModeOf(std::string const &path)
{
   struct stat st;
   if (lstat(path.c_str(), &st) != 0)
      return 0;
   return st.st_mode & 07777;
}

TEST(StagingTest, Create)
{
   std::string root;
   {
      debStagingArea staging;
      EXPECT_TRUE(staging.GetRoot().empty());
      ASSERT_TRUE(staging.Create("hello"));
      root = staging.GetRoot();
      EXPECT_NE(std::string::npos, root.find("/giftwrap-hello."));
      EXPECT_TRUE(DirectoryExists(staging.DataRoot()));
      EXPECT_TRUE(DirectoryExists(staging.ControlRoot()));
      EXPECT_EQ(0755u, ModeOf(staging.DataRoot()));
      EXPECT_EQ(0755u, ModeOf(staging.ControlRoot()));
      EXPECT_EQ(root + "/control/postinst", staging.ControlPath("postinst"));

      EXPECT_FALSE(staging.Create("hello"));
      EXPECT_TRUE(_error->PendingError());
      _error->Discard();
      staging.MarkSuccessful();
   }
   EXPECT_FALSE(DirectoryExists(root));
   EXPECT_TRUE(_error->empty(GlobalError::DEBUG));
}
TEST(StagingTest, InvalidName)
{
   debStagingArea staging;
   EXPECT_FALSE(staging.Create(""));
   EXPECT_FALSE(staging.Create("../evil"));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   EXPECT_TRUE(staging.GetRoot().empty());
}
TEST(StagingTest, KeptOnFailure)
{
   std::string root;
   {
      debStagingArea staging;
      ASSERT_TRUE(staging.Create("failing"));
      root = staging.GetRoot();
   }
   EXPECT_TRUE(DirectoryExists(root));
   EXPECT_FALSE(_error->PendingError());
   EXPECT_FALSE(_error->empty(GlobalError::NOTICE));
   std::string msg;
   EXPECT_FALSE(_error->PopMessage(msg));
   EXPECT_EQ("The staging directory " + root + " was kept for inspection", msg);
   EXPECT_TRUE(RemoveDirectoryTree(root));
}
TEST(StagingTest, KeepStagingOption)
{
   _config->Set("Giftwrap::Keep-Staging", true);
   std::string root;
   {
      debStagingArea staging;
      ASSERT_TRUE(staging.Create("keep"));
      root = staging.GetRoot();
      staging.MarkSuccessful();
   }
   _config->Set("Giftwrap::Keep-Staging", false);
   EXPECT_TRUE(DirectoryExists(root));
   EXPECT_TRUE(_error->empty(GlobalError::DEBUG));
   EXPECT_TRUE(RemoveDirectoryTree(root));
}
TEST(StagingTest, DataPath)
{
   debStagingArea staging;
   EXPECT_EQ("", staging.DataPath("/etc/foo"));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   ASSERT_TRUE(staging.Create("paths"));
   std::string const data = staging.DataRoot();

   std::string const conf = staging.DataPath("/etc/hello/hello.conf");
   EXPECT_EQ(data + "/etc/hello/hello.conf", conf);
   EXPECT_TRUE(DirectoryExists(data + "/etc/hello"));
   EXPECT_FALSE(FileExists(conf));
   EXPECT_EQ(0755u, ModeOf(data + "/etc"));
   EXPECT_EQ(0755u, ModeOf(data + "/etc/hello"));

   // relative paths and duplicated slashes name the same place
   EXPECT_EQ(conf, staging.DataPath("etc//hello/./hello.conf"));

   // existing directories get the requested mode
   EXPECT_EQ(data + "/etc/hello/secret", staging.DataPath("/etc/hello/secret", 0700));
   EXPECT_EQ(0700u, ModeOf(data + "/etc"));
   EXPECT_EQ(0700u, ModeOf(data + "/etc/hello"));

   EXPECT_EQ("", staging.DataPath("/usr/../../escape"));
   EXPECT_EQ("", staging.DataPath("/"));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   createFile(data, "usr", "not a directory");
   EXPECT_EQ("", staging.DataPath("/usr/bin/tool"));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   staging.MarkSuccessful();
}
TEST(StagingTest, DataDirPath)
{
   debStagingArea staging;
   ASSERT_TRUE(staging.Create("dirs"));
   std::string const data = staging.DataRoot();

   EXPECT_EQ(data + "/var/lib/hello", staging.DataDirPath("/var/lib/hello", 0750));
   EXPECT_TRUE(DirectoryExists(data + "/var/lib/hello"));
   EXPECT_EQ(0750u, ModeOf(data + "/var/lib/hello"));

   EXPECT_EQ(data + "/srv/nothing", staging.DataDirPath("/srv/nothing", 0755, false));
   EXPECT_FALSE(FileExists(data + "/srv"));

   EXPECT_EQ(data, staging.DataDirPath("/"));
   staging.MarkSuccessful();
}
