// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/** \class GiftWrap::Configuration
 *  \brief Provides the compressors usable for the members of a package
 *
 *  Every compressor listed here is backed by a library linked into
 *  libgiftwrap-pkg, no external binaries are involved. The uncompressed
 *  pseudo compressor "." is always available.
 */
									/*}}}*/
#ifndef GIFTWRAP_COMPRESSORS_H
#define GIFTWRAP_COMPRESSORS_H
// Include Files							/*{{{*/
#include <giftwrap-pkg/macros.h>
#include <limits>
#include <string>
#include <vector>
									/*}}}*/
namespace GiftWrap {
namespace Configuration {						/*{{{*/
	struct GIFTWRAP_PUBLIC Compressor {
		std::string Name;
		std::string Extension;
		// compression level handed to the library, 1 (fast) to 9 (small)
		int Level;
		unsigned short Cost;

		Compressor(char const *name, char const *extension, int const level,
			   unsigned short const cost);
		Compressor() : Level(0), Cost(std::numeric_limits<unsigned short>::max()) {};
	};

	/** \brief Return a vector of Compressors sorted by Cost
	 *
	 *  The level of each compressor can be overridden with
	 *  Giftwrap::Compressor::<name>::Level.
	 *
	 *  \param Cached saves the result so we need to calculate it only once
	 *                this parameter should only be used for testing purposes.
	 */
	GIFTWRAP_PUBLIC std::vector<Compressor> const getCompressors(bool const Cached = true);

	/** \brief find a compressor by its name or extension
	 *
	 *  \param Name is e.g. "gzip" or "xz", extensions like ".gz" match too
	 *  \param[out] Result receives the compressor if one is found
	 *  \return \b true if a compressor was found, otherwise \b false
	 *          without an error being reported
	 */
	GIFTWRAP_PUBLIC bool findCompressor(std::string const &Name, Compressor &Result);
									/*}}}*/
}
									/*}}}*/
}
#endif
