// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Compressor table - which member compressions this build of
   libgiftwrap-pkg can produce and read

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/compressors.h>
#include <giftwrap-pkg/configuration.h>

#include <algorithm>
#include <string>
#include <vector>
									/*}}}*/
namespace GiftWrap {
// getCompressors - Return Vector of usable compressors			/*{{{*/
std::vector<Configuration::Compressor>
const Configuration::getCompressors(bool const Cached) {
	static std::vector<Configuration::Compressor> compressors;
	if (compressors.empty() == false) {
		if (Cached == true)
			return compressors;
		else
			compressors.clear();
	}

	compressors.emplace_back(".", "", 0, 0);
#ifdef HAVE_ZLIB
	compressors.emplace_back("gzip", ".gz", 9, 100);
#endif
#ifdef HAVE_LZMA
	compressors.emplace_back("xz", ".xz", 6, 200);
#endif
#ifdef HAVE_BZ2
	compressors.emplace_back("bzip2", ".bz2", 9, 300);
#endif

	for (auto &c : compressors)
	{
		if (c.Name == ".")
			continue;
		std::string const level = std::string("Giftwrap::Compressor::") + c.Name + "::Level";
		c.Level = std::min(9, std::max(1, _config->FindI(level.c_str(), c.Level)));
	}

	std::stable_sort(compressors.begin(), compressors.end(),
		[](Compressor const &a, Compressor const &b) { return a.Cost < b.Cost; });
	return compressors;
}
									/*}}}*/
// findCompressor - look a compressor up by name or extension		/*{{{*/
bool Configuration::findCompressor(std::string const &Name, Compressor &Result)
{
	auto const compressors = getCompressors();
	auto const c = std::find_if(compressors.begin(), compressors.end(), [&](Compressor const &c) {
		return c.Name == Name || (c.Extension.empty() == false && c.Extension == Name);
	});
	if (c == compressors.end())
		return false;
	Result = *c;
	return true;
}
									/*}}}*/
// Compressor constructor						/*{{{*/
Configuration::Compressor::Compressor(char const *name, char const *extension,
				      int const level, unsigned short const cost)
	: Name(name), Extension(extension), Level(level), Cost(cost)
{
}
									/*}}}*/
}
