// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Rules - the actions a package is assembled with

   Every rule implements Apply, which acts on the build context and
   reports failures on the error stack. Rules don't change the package
   description and are applied strictly in the order they are listed.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DEBRULES_H
#define GIFTWRAP_DEBRULES_H

#include <giftwrap-pkg/macros.h>

#include <string>
#include <sys/types.h>

class debBuildContext;
class debPackageDescription;

class GIFTWRAP_PUBLIC debRule
{
   public:
   /** \return \b false if the build can't continue, the reason is on the error stack */
   virtual bool Apply(debPackageDescription const &Pkg, debBuildContext &Ctx) const = 0;
   // short human readable summary for debug output and error messages
   virtual std::string Describe() const = 0;
   virtual ~debRule() {};
};

/** \brief copies the host file Source to the install path Destination */
class GIFTWRAP_PUBLIC debPlaceFileRule : public debRule
{
   std::string const Source;
   std::string const Destination;
   mode_t const Mode;
   mode_t const DirMode;

   public:
   bool Apply(debPackageDescription const &Pkg, debBuildContext &Ctx) const override;
   std::string Describe() const override;

   debPlaceFileRule(std::string const &Source, std::string const &Destination,
		    mode_t const Mode = 0644, mode_t const DirMode = 0755);
};

/** \brief writes Contents to the install path Destination */
class GIFTWRAP_PUBLIC debWriteFileRule : public debRule
{
   std::string const Destination;
   std::string const Contents;
   mode_t const Mode;
   mode_t const DirMode;

   public:
   bool Apply(debPackageDescription const &Pkg, debBuildContext &Ctx) const override;
   std::string Describe() const override;

   debWriteFileRule(std::string const &Destination, std::string const &Contents,
		    mode_t const Mode = 0644, mode_t const DirMode = 0755);
};

class GIFTWRAP_PUBLIC debMakeDirectoryRule : public debRule
{
   std::string const Path;
   std::string const Owner;
   std::string const Group;

   public:
   bool Apply(debPackageDescription const &Pkg, debBuildContext &Ctx) const override;
   std::string Describe() const override;

   explicit debMakeDirectoryRule(std::string const &Path, std::string const &Owner = "",
				 std::string const &Group = "");
};

/** \brief a symlink at LinkName pointing to Source
 *
 *  Only the parent directory of Source is created right away, the link
 *  is made after all files were staged.
 */
class GIFTWRAP_PUBLIC debMakeSymlinkRule : public debRule
{
   std::string const Source;
   std::string const LinkName;

   public:
   bool Apply(debPackageDescription const &Pkg, debBuildContext &Ctx) const override;
   std::string Describe() const override;

   debMakeSymlinkRule(std::string const &Source, std::string const &LinkName);
};

class GIFTWRAP_PUBLIC debPostInstCommandRule : public debRule
{
   std::string const Command;

   public:
   bool Apply(debPackageDescription const &Pkg, debBuildContext &Ctx) const override;
   std::string Describe() const override;

   explicit debPostInstCommandRule(std::string const &Command);
};

/** \brief apply the rules of Pkg in order, stopping at the first failure */
GIFTWRAP_PUBLIC bool debApplyRules(debPackageDescription const &Pkg, debBuildContext &Ctx);

#endif
