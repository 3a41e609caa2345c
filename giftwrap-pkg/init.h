// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the package library

   This function must be called to configure the config class before
   building packages.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_INIT_H
#define GIFTWRAP_INIT_H

#include <giftwrap-pkg/macros.h>

class Configuration;

GIFTWRAP_PUBLIC extern const char *gwLibVersion;

GIFTWRAP_PUBLIC bool gwInitConfig(Configuration &Cnf);

#endif
