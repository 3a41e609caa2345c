#include <config.h>

#include <giftwrap-pkg/strutl.h>

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

TEST(StrUtilTest,Strip)
{
   EXPECT_EQ("", GiftWrap::String::Strip(""));
   EXPECT_EQ("", GiftWrap::String::Strip(" \t\n "));
   EXPECT_EQ("foo bar", GiftWrap::String::Strip("  foo bar\n"));
   EXPECT_EQ("foo", GiftWrap::String::Strip("foo"));
   EXPECT_EQ("A tool.", GiftWrap::String::Strip("\tA tool.\r\n"));
}
TEST(StrUtilTest,StartAndEnd)
{
   EXPECT_TRUE(GiftWrap::String::Startswith("control.tar.gz", "control.tar"));
   EXPECT_TRUE(GiftWrap::String::Startswith("data.tar", "data.tar"));
   EXPECT_FALSE(GiftWrap::String::Startswith("data", "data.tar"));
   EXPECT_TRUE(GiftWrap::String::Startswith("anything", ""));

   EXPECT_TRUE(GiftWrap::String::Endswith("data.tar.xz", ".xz"));
   EXPECT_FALSE(GiftWrap::String::Endswith("xz", ".xz"));
   EXPECT_TRUE(GiftWrap::String::Endswith("anything", ""));
}
TEST(StrUtilTest,Join)
{
   EXPECT_EQ("", GiftWrap::String::Join({}, ", "));
   EXPECT_EQ("libc6", GiftWrap::String::Join({"libc6"}, ", "));
   EXPECT_EQ("libc6, libssl3 (>= 3.0)", GiftWrap::String::Join({"libc6", "libssl3 (>= 3.0)"}, ", "));
   EXPECT_EQ("amd64 arm64", GiftWrap::String::Join({"amd64", "arm64"}, " "));
}
TEST(StrUtilTest,VectorizeString)
{
   std::vector<std::string> vec = VectorizeString("-v,--color,always", ',');
   ASSERT_EQ(3u, vec.size());
   EXPECT_EQ("-v", vec[0]);
   EXPECT_EQ("--color", vec[1]);
   EXPECT_EQ("always", vec[2]);

   vec = VectorizeString("a,,b", ',');
   ASSERT_EQ(3u, vec.size());
   EXPECT_EQ("", vec[1]);

   vec = VectorizeString("/usr/share/doc/", '/');
   ASSERT_EQ(4u, vec.size());
   EXPECT_EQ("", vec[0]);
   EXPECT_EQ("usr", vec[1]);
   EXPECT_EQ("share", vec[2]);
   EXPECT_EQ("doc", vec[3]);

   EXPECT_TRUE(VectorizeString("", ',').empty());
}
TEST(StrUtilTest,StringToBool)
{
   EXPECT_EQ(1, StringToBool("yes"));
   EXPECT_EQ(1, StringToBool("1"));
   EXPECT_EQ(0, StringToBool("off"));
   EXPECT_EQ(0, StringToBool("0"));
   EXPECT_EQ(-1, StringToBool("2"));
   EXPECT_EQ(-1, StringToBool("perhaps"));
   EXPECT_EQ(1, StringToBool("perhaps", 1));
}
TEST(StrUtilTest,StrToNum)
{
   unsigned long long res = 42;
   EXPECT_TRUE(StrToNum("0000644\0", res, 8, 8));
   EXPECT_EQ(0644u, res);
   EXPECT_TRUE(StrToNum("1234      ", res, 10));
   EXPECT_EQ(1234u, res);
   EXPECT_TRUE(StrToNum("      ", res, 6));
   EXPECT_EQ(0u, res);
   EXPECT_FALSE(StrToNum("xyz", res, 3));

   unsigned long small = 0;
   EXPECT_TRUE(StrToNum("100644  ", small, 8, 8));
   EXPECT_EQ(0100644u, small);
}
TEST(StrUtilTest,Base256ToNum)
{
   unsigned long long res = 0;
   char const octal[] = {'0', '0', '0', '1', '2'};
   EXPECT_FALSE(Base256ToNum(octal, res, sizeof(octal)));

   char const binary[] = {static_cast<char>(0x80), 0, 0, 0x02, 0x01};
   EXPECT_TRUE(Base256ToNum(binary, res, sizeof(binary)));
   EXPECT_EQ(0x201u, res);
}
TEST(StrUtilTest,CaseCompare)
{
   EXPECT_EQ(0, stringcasecmp("Package", "package"));
   EXPECT_EQ(0, stringcasecmp(std::string("PRE-DEPENDS"), "Pre-Depends"));
   EXPECT_GT(0, stringcasecmp("Depends", "Description"));
   EXPECT_NE(0, stringcasecmp("Version", "Ver"));
   EXPECT_EQ(0, stringcasecmp(std::string(""), std::string("")));
}
TEST(StrUtilTest,Printf)
{
   std::string out;
   strprintf(out, "%s %04o", "mode", 0755u);
   EXPECT_EQ("mode 0755", out);
   std::ostringstream stream;
   ioprintf(stream, "Rule %u failed", 3u);
   EXPECT_EQ("Rule 3 failed", stream.str());
}
