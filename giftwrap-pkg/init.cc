// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the package library

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/init.h>
#include <giftwrap-pkg/macros.h>

#include <giftwrapi18n.h>
									/*}}}*/

#define Stringfy_(x) # x
#define Stringfy(x)  Stringfy_(x)
const char *gwLibVersion = Stringfy(GIFTWRAP_PKG_MAJOR) "."
                           Stringfy(GIFTWRAP_PKG_MINOR) "."
                           Stringfy(GIFTWRAP_PKG_RELEASE);

// gwInitConfig - Initialize the configuration class			/*{{{*/
// ---------------------------------------------------------------------
/* Only values which are not set already are touched, so the caller can
   set options before and after calling this. */
bool gwInitConfig(Configuration &Cnf)
{
   // Helpers
   Cnf.CndSet("Dir::Bin::dpkg", "dpkg");
   Cnf.CndSet("Dir::Bin::lintian", "lintian");

   // Packing
   Cnf.CndSet("Giftwrap::Compressor", "gzip");
   Cnf.CndSet("Giftwrap::Keep-Staging", false);
   Cnf.CndSet("Giftwrap::Lintian", false);
   Cnf.CndSet("Giftwrap::Lintian::Fatal", false);
   Cnf.CndSet("Giftwrap::Lintian::Options", "-v,--color,always,--pedantic");

   // Debug and verbosity
   Cnf.CndSet("Giftwrap::Color", false);
   Cnf.CndSet("Debug::Giftwrap::Rules", false);
   Cnf.CndSet("Debug::Giftwrap::Staging", false);
   Cnf.CndSet("Debug::Giftwrap::Control", false);
   Cnf.CndSet("Debug::Giftwrap::Pack", false);
   Cnf.CndSet("quiet", 0);

#ifdef USE_NLS
   bindtextdomain(PACKAGE, LOCALEDIR);
#endif

   return true;
}
									/*}}}*/
