// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Archive Packer - turns a staging area into a .deb file

   The control and data trees are written as compressed tar files into
   the staging root and then combined with the debian-binary marker into
   the ar container dpkg expects.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DEBPACKER_H
#define GIFTWRAP_DEBPACKER_H

#include <giftwrap-pkg/compressors.h>
#include <giftwrap-pkg/macros.h>

#include <string>

class debStagingArea;

class GIFTWRAP_PUBLIC debArchivePacker
{
   debStagingArea &Staging;

   bool PackTree(std::string const &Tree, std::string const &TarFile,
		 GiftWrap::Configuration::Compressor const &Comp);

   public:

   /** \brief write the package to Destination
    *
    *  The data member is compressed with Giftwrap::Compressor. The
    *  control member uses it as well unless dpkg can't read a control
    *  member compressed that way, it falls back to gzip then.
    *  An existing Destination is replaced, a partially written one is
    *  removed again.
    */
   bool Pack(std::string const &Destination);

   /** \brief run Dir::Bin::lintian on the package at Destination
    *
    *  A missing lintian is only noted on the error stack.
    *
    *  \param[out] Output receives everything lintian printed
    *  \return \b false if lintian failed and Giftwrap::Lintian::Fatal is set
    */
   bool RunLintian(std::string const &Destination, std::string &Output);

   explicit debArchivePacker(debStagingArea &Staging);
};

#endif
