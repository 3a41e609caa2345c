// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Build Context - the mutable state of a single package build

   Rules act on the context: they stage files in its staging area and
   collect the commands for the postinst script and the symlinks to
   create once all files are in place.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_DEBBUILDCONTEXT_H
#define GIFTWRAP_DEBBUILDCONTEXT_H

#include <giftwrap-pkg/debstaging.h>
#include <giftwrap-pkg/macros.h>

#include <string>
#include <utility>
#include <vector>

class GIFTWRAP_PUBLIC debBuildContext
{
   public:
   // the install path the link points to and the install path of the link
   struct Symlink
   {
      std::string Source;
      std::string LinkName;
   };

   private:
   debStagingArea Staging;
   std::vector<std::string> PostInstCommands;
   std::vector<Symlink> Symlinks;

   public:

   /** \brief create the staging area for the package PackageName */
   inline bool Create(std::string const &PackageName) { return Staging.Create(PackageName); };
   inline debStagingArea &GetStaging() { return Staging; };
   inline debStagingArea const &GetStaging() const { return Staging; };

   inline void AddPostInstCommand(std::string const &Command) { PostInstCommands.push_back(Command); };
   inline std::vector<std::string> const &GetPostInstCommands() const { return PostInstCommands; };

   inline void AddSymlink(std::string const &Source, std::string const &LinkName) { Symlinks.push_back({Source, LinkName}); };
   inline std::vector<Symlink> const &GetSymlinks() const { return Symlinks; };

   /** \brief create a directory in the data tree
    *
    *  If Owner is given a chown of the installed directory is added to
    *  the postinst commands, with Group if that is given as well. A
    *  Group without an Owner is ignored.
    *
    *  \return the staging path or an empty string on error
    */
   std::string MakeDataDir(std::string const &Path, std::string const &Owner = "",
			   std::string const &Group = "");
};

#endif
