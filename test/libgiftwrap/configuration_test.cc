#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/init.h>

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

TEST(ConfigurationTest,Lists)
{
	Configuration Cnf;

	Cnf.Set("Giftwrap::Lintian::Options::","-v");
	Cnf.Set("Giftwrap::Lintian::Options::","--pedantic");
	Cnf.Set("Giftwrap::Lintian::Options::2","--color");
	Cnf.Set("Giftwrap::Lintian::Options::","never");
	std::vector<std::string> opts = Cnf.FindVector("Giftwrap::Lintian::Options");
	ASSERT_EQ(4u, opts.size());
	EXPECT_EQ("-v", opts[0]);
	EXPECT_EQ("--pedantic", opts[1]);
	EXPECT_EQ("--color", opts[2]);
	EXPECT_EQ("never", opts[3]);

	EXPECT_TRUE(Cnf.Exists("Giftwrap::Lintian::Options::2"));
	EXPECT_EQ("--color", Cnf.Find("Giftwrap::Lintian::Options::2"));
	EXPECT_FALSE(Cnf.Exists("Giftwrap::Lintian::Options::3"));
	EXPECT_EQ("", Cnf.Find("Giftwrap::Lintian::Options::3"));
	EXPECT_EQ("not-set", Cnf.Find("Giftwrap::Lintian::Options::3", "not-set"));

	Cnf.Clear("Giftwrap::Lintian::Options", "--pedantic");
	opts = Cnf.FindVector("Giftwrap::Lintian::Options");
	ASSERT_EQ(3u, opts.size());
	EXPECT_EQ("-v", opts[0]);
	EXPECT_EQ("--color", opts[1]);
	EXPECT_EQ("never", opts[2]);

	Cnf.Clear("Giftwrap::Lintian::Options");
	EXPECT_TRUE(Cnf.Exists("Giftwrap::Lintian::Options"));
	EXPECT_TRUE(Cnf.FindVector("Giftwrap::Lintian::Options").empty());
}
TEST(ConfigurationTest,VectorDefaults)
{
	Configuration Cnf;
	std::vector<std::string> opts = Cnf.FindVector("Giftwrap::Lintian::Options", "-v,--pedantic");
	ASSERT_EQ(2u, opts.size());
	EXPECT_EQ("-v", opts[0]);
	EXPECT_EQ("--pedantic", opts[1]);

	// a value on the node itself wins over the children
	Cnf.Set("Giftwrap::Lintian::Options", "-i,-I");
	Cnf.Set("Giftwrap::Lintian::Options::", "ignored");
	opts = Cnf.FindVector("Giftwrap::Lintian::Options", "-v,--pedantic");
	ASSERT_EQ(2u, opts.size());
	EXPECT_EQ("-i", opts[0]);
	EXPECT_EQ("-I", opts[1]);

	EXPECT_TRUE(Cnf.FindVector("Giftwrap::Nothing").empty());
}
TEST(ConfigurationTest,Integers)
{
	Configuration Cnf;

	Cnf.CndSet("quiet", 2);
	EXPECT_EQ(2, Cnf.FindI("quiet"));
	Cnf.CndSet("quiet", 0);
	EXPECT_EQ(2, Cnf.FindI("quiet"));
	Cnf.Set("quiet", 1);
	EXPECT_EQ(1, Cnf.FindI("quiet"));
	EXPECT_EQ(7, Cnf.FindI("verbose", 7));
	Cnf.Set("verbose", "lots");
	EXPECT_EQ(7, Cnf.FindI("verbose", 7));
	Cnf.Set("verbose", "0x10");
	EXPECT_EQ(16, Cnf.FindI("verbose", 7));
}
TEST(ConfigurationTest,Booleans)
{
	Configuration Cnf;

	EXPECT_FALSE(Cnf.FindB("Giftwrap::Lintian"));
	EXPECT_TRUE(Cnf.FindB("Giftwrap::Lintian", true));
	for (auto const yes : {"1", "yes", "true", "with", "on", "enable", "TRUE"})
	{
		Cnf.Set("Giftwrap::Lintian", yes);
		EXPECT_TRUE(Cnf.FindB("Giftwrap::Lintian", false)) << yes;
	}
	for (auto const no : {"0", "no", "false", "without", "off", "disable", "No"})
	{
		Cnf.Set("Giftwrap::Lintian", no);
		EXPECT_FALSE(Cnf.FindB("Giftwrap::Lintian", true)) << no;
	}
	Cnf.Set("Giftwrap::Lintian", "maybe");
	EXPECT_TRUE(Cnf.FindB("Giftwrap::Lintian", true));
	EXPECT_FALSE(Cnf.FindB("Giftwrap::Lintian", false));
}
TEST(ConfigurationTest,CaseInsensitiveScopes)
{
	Configuration Cnf;
	Cnf.Set("Dir::Bin::dpkg", "/usr/bin/dpkg");
	EXPECT_EQ("/usr/bin/dpkg", Cnf.Find("dir::bin::DPKG"));
	EXPECT_TRUE(Cnf.Exists("DIR::Bin"));
	Cnf.Set("dir::bin::Dpkg", "/bin/false");
	EXPECT_EQ("/bin/false", Cnf.Find("Dir::Bin::dpkg"));

	std::ostringstream out;
	Cnf.Dump(out);
	EXPECT_EQ("Dir::Bin::dpkg \"/bin/false\";\n", out.str());

	Cnf.Clear();
	EXPECT_FALSE(Cnf.Exists("Dir"));
	EXPECT_EQ("", Cnf.Find("Dir::Bin::dpkg"));
}
TEST(ConfigurationTest,InitDefaults)
{
	Configuration Cnf;
	Cnf.Set("Giftwrap::Compressor", "xz");
	Cnf.Set("Dir::Bin::lintian", "/opt/lintian/bin/lintian");
	EXPECT_TRUE(gwInitConfig(Cnf));

	// values set before are kept
	EXPECT_EQ("xz", Cnf.Find("Giftwrap::Compressor"));
	EXPECT_EQ("/opt/lintian/bin/lintian", Cnf.Find("Dir::Bin::lintian"));

	EXPECT_EQ("dpkg", Cnf.Find("Dir::Bin::dpkg"));
	EXPECT_FALSE(Cnf.FindB("Giftwrap::Lintian", true));
	EXPECT_FALSE(Cnf.FindB("Giftwrap::Lintian::Fatal", true));
	EXPECT_FALSE(Cnf.FindB("Giftwrap::Keep-Staging", true));
	EXPECT_EQ(0, Cnf.FindI("quiet", 5));
	std::vector<std::string> const opts = Cnf.FindVector("Giftwrap::Lintian::Options");
	ASSERT_EQ(4u, opts.size());
	EXPECT_EQ("-v", opts[0]);
	EXPECT_EQ("--color", opts[1]);
	EXPECT_EQ("always", opts[2]);
	EXPECT_EQ("--pedantic", opts[3]);
	for (auto const debug : {"Rules", "Staging", "Control", "Pack"})
		EXPECT_FALSE(Cnf.FindB(std::string("Debug::Giftwrap::") + debug, true)) << debug;

	EXPECT_NE(std::string::npos, std::string(gwLibVersion).find('.'));
}
