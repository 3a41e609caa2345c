// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Build - assemble a binary package from its description

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DEBBUILD_H
#define GIFTWRAP_DEBBUILD_H

#include <giftwrap-pkg/macros.h>

#include <string>

class debPackageDescription;

/** \brief build the package described by Pkg and write it to Destination
 *
 *  The description is validated, the rules are applied in a fresh
 *  staging area, the control files are rendered and everything is
 *  packed. With Giftwrap::Lintian set the result is checked by lintian.
 *
 *  On failure no file is left at Destination and the staging area is
 *  kept for inspection.
 *
 *  \param[out] LintianOutput receives the output of lintian if not NULL
 */
GIFTWRAP_PUBLIC bool debBuildPackage(debPackageDescription const &Pkg, std::string const &Destination,
				     std::string * const LintianOutput = nullptr);

#endif
