// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Package Description - everything a binary package is built from

   debPackageDescription is filled in by the caller and then treated as
   read-only by the build. The rules it owns are applied in order.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DEBPACKAGE_H
#define GIFTWRAP_DEBPACKAGE_H

#include <giftwrap-pkg/debrules.h>
#include <giftwrap-pkg/macros.h>

#include <memory>
#include <string>
#include <vector>

/** \class debArchitectureSpec
 *  \brief the architectures a package is built for
 *
 *  Either a single architecture, an explicit list or a request to ask
 *  dpkg for the architecture of the build machine. The kind is fixed
 *  when the object is created.
 */
class GIFTWRAP_PUBLIC debArchitectureSpec
{
   public:
   enum SpecType { SINGLE, LIST, AUTODETECT };

   private:
   SpecType Type;
   std::vector<std::string> Values;

   debArchitectureSpec(SpecType const Type, std::vector<std::string> const &Values);

   public:
   static debArchitectureSpec Single(std::string const &Arch);
   static debArchitectureSpec List(std::vector<std::string> const &Archs);
   static debArchitectureSpec AutoDetect();

   inline SpecType GetType() const { return Type; };
   inline std::vector<std::string> const &GetValues() const { return Values; };

   /** \brief the architectures to write into the control file
    *
    *  Autodetection runs Dir::Bin::dpkg --print-architecture and falls
    *  back to "any" if that does not work out.
    *
    *  \param[out] Archs is never empty on success
    *  \param Source appends "source" unless it is already listed
    */
   bool Resolve(std::vector<std::string> &Archs, bool const Source = false) const;

   /** \brief checks the values for being usable in a control file */
   bool Validate() const;
};

class GIFTWRAP_PUBLIC debPackageDescription
{
   public:
   std::string Name;
   std::string Version;
   // source package name, the package name is used if empty
   std::string Source;
   debArchitectureSpec Architecture;

   std::string MaintainerName;
   std::string MaintainerEmail;
   std::string Description;
   std::string LongDescription;
   std::string Homepage;
   std::string Section;
   std::string Priority;

   // relationship fields, each entry a single relation like "libc6 (>= 2.36)"
   std::vector<std::string> PreDepends;
   std::vector<std::string> Depends;
   std::vector<std::string> Recommends;
   std::vector<std::string> Suggests;
   std::vector<std::string> Conflicts;
   std::vector<std::string> Breaks;
   std::vector<std::string> Replaces;
   std::vector<std::string> Provides;

   std::string Copyright;

   std::vector<std::unique_ptr<debRule>> Rules;

   /** \brief check the fields before anything is built
    *
    *  \return \b false with an error on the stack for each problem found
    */
   bool Validate() const;

   debPackageDescription();
   debPackageDescription(std::string const &Name, std::string const &Version,
			 debArchitectureSpec const &Architecture);
   debPackageDescription(debPackageDescription &&) = default;
   debPackageDescription &operator=(debPackageDescription &&) = default;
   ~debPackageDescription();
};

#endif
