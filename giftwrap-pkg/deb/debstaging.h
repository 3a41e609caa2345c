// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Staging Area - scratch tree a package is assembled in

   The staging area is a private directory below the temporary directory
   with two subtrees: data/ mirrors the root of the installed system and
   control/ receives the files of the control member.

   The tree is removed when the object is destroyed, but only if the
   build was marked as successful. Otherwise it is kept for inspection.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DEBSTAGING_H
#define GIFTWRAP_DEBSTAGING_H

#include <giftwrap-pkg/macros.h>

#include <string>
#include <vector>
#include <sys/types.h>

class GIFTWRAP_PUBLIC debStagingArea
{
   std::string Root;
   bool Successful;

   bool SplitInstallPath(std::string const &Path, std::vector<std::string> &Components) const;
   bool MakeDirectory(std::string const &Dir, mode_t const Permissions) const;

   public:

   /** \brief create the scratch tree named after the package */
   bool Create(std::string const &PackageName);

   inline std::string const &GetRoot() const { return Root; };
   std::string DataRoot() const;
   std::string ControlRoot() const;

   /** \brief path of FileName in the control tree, nothing is created */
   std::string ControlPath(std::string const &FileName) const;

   /** \brief staging path of the file at the install path Path
    *
    *  All directories above it are created if needed and get the mode
    *  Permissions, also if they existed before.
    *
    *  \return the path or an empty string with an error on the stack
    */
   std::string DataPath(std::string const &Path, mode_t const Permissions = 0755);

   /** \brief staging path of the directory at the install path Path
    *
    *  Like DataPath(), but the directory itself is handled like its
    *  parents. With MakeIfMissing being false nothing is touched.
    */
   std::string DataDirPath(std::string const &Path, mode_t const Permissions = 0755,
			   bool const MakeIfMissing = true);

   /** \brief allows the destructor to remove the scratch tree */
   inline void MarkSuccessful() { Successful = true; };

   debStagingArea();
   debStagingArea(debStagingArea const &) = delete;
   debStagingArea &operator=(debStagingArea const &) = delete;
   ~debStagingArea();
};

#endif
