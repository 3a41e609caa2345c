// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Control Writer - renders the package metadata into the staging area

   Go() writes, in this order: control, postinst, the copyright file,
   conffiles and finally the symlinks collected by the rules. It runs
   after all rules were applied as conffiles reflects the staged /etc.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DEBCONTROLWRITER_H
#define GIFTWRAP_DEBCONTROLWRITER_H

#include <giftwrap-pkg/macros.h>

#include <string>
#include <vector>
#include <sys/types.h>

class debBuildContext;
class debControlRecord;
class debPackageDescription;

class GIFTWRAP_PUBLIC debControlWriter
{
   debPackageDescription const &Pkg;
   debBuildContext &Ctx;

   bool WriteControlFile(std::string const &Path, std::string const &Content, mode_t const Mode);
   bool CollectConffiles(std::string const &Dir, std::string const &InstallDir,
			 std::vector<std::string> &List);

   public:

   /** \brief the fields of the control file
    *
    *  \param Binary is \b false for the control file of a source
    *         package which has no Package field and the architecture
    *         "source" added
    */
   bool BuildRecord(debControlRecord &Record, bool const Binary = true) const;

   bool WriteControl(bool const Binary = true);
   bool WritePostInst();
   bool WriteCopyright();
   bool WriteConffiles();
   bool WriteSymlinks();

   bool Go();

   /** \brief the value of a Description field
    *
    *  Both parts end with a period, the lines of the long description
    *  are indented by a space and empty lines are written as " .".
    */
   static std::string FormatDescription(std::string const &Short, std::string const &Long);
   /** \brief the postinst script running Commands on configure */
   static std::string FormatPostInst(std::vector<std::string> const &Commands);

   debControlWriter(debPackageDescription const &Pkg, debBuildContext &Ctx);
};

#endif
