// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Staging Area - scratch tree a package is assembled in

   Install paths are given as absolute paths of the installed system.
   They are mapped below data/ component by component, so a path can
   not leave the tree through "..".

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/debstaging.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/strutl.h>

#include <iostream>
#include <string>
#include <vector>
#include <errno.h>
#include <stdlib.h>
#include <sys/stat.h>

#include <giftwrapi18n.h>
									/*}}}*/

debStagingArea::debStagingArea() : Successful(false)			/*{{{*/
{
}
									/*}}}*/
// StagingArea::~debStagingArea - Remove the tree after a success	/*{{{*/
debStagingArea::~debStagingArea()
{
   if (Root.empty() == true)
      return;

   if (Successful == false)
   {
      _error->Notice(_("The staging directory %s was kept for inspection"), Root.c_str());
      return;
   }
   if (_config->FindB("Giftwrap::Keep-Staging", false) == true)
   {
      if (_config->FindB("Debug::Giftwrap::Staging", false) == true)
	 std::clog << "Keeping staging directory " << Root << std::endl;
      return;
   }

   if (_config->FindB("Debug::Giftwrap::Staging", false) == true)
      std::clog << "Removing staging directory " << Root << std::endl;
   RemoveDirectoryTree(Root);
}
									/*}}}*/
// StagingArea::Create - Create the scratch tree			/*{{{*/
bool debStagingArea::Create(std::string const &PackageName)
{
   if (Root.empty() == false)
      return _error->Error(_("The staging directory %s exists already"), Root.c_str());
   if (PackageName.empty() == true || PackageName.find('/') != std::string::npos)
      return _error->Error(_("Invalid package name '%s'"), PackageName.c_str());

   std::string Template = flCombine(GetTempDir(), "giftwrap-" + PackageName + ".XXXXXX");
   if (mkdtemp(&Template[0]) == nullptr)
      return _error->Errno("mkdtemp", _("Unable to create a staging directory in %s"), GetTempDir().c_str());
   Root = Template;
   Successful = false;

   if (_config->FindB("Debug::Giftwrap::Staging", false) == true)
      std::clog << "Created staging directory " << Root << std::endl;

   return MakeDirectory(DataRoot(), 0755) && MakeDirectory(ControlRoot(), 0755);
}
									/*}}}*/
std::string debStagingArea::DataRoot() const				/*{{{*/
{
   return flCombine(Root, "data");
}
									/*}}}*/
std::string debStagingArea::ControlRoot() const			/*{{{*/
{
   return flCombine(Root, "control");
}
									/*}}}*/
std::string debStagingArea::ControlPath(std::string const &FileName) const/*{{{*/
{
   return flCombine(ControlRoot(), FileName);
}
									/*}}}*/
// StagingArea::SplitInstallPath - Components of an install path	/*{{{*/
bool debStagingArea::SplitInstallPath(std::string const &Path, std::vector<std::string> &Components) const
{
   Components.clear();
   if (Root.empty() == true)
      return _error->Error(_("The staging directory was not created yet"));

   for (auto const &C : VectorizeString(Path, '/'))
   {
      if (C.empty() == true || C == ".")
	 continue;
      if (C == "..")
	 return _error->Error(_("The path %s leaves the package root"), Path.c_str());
      Components.push_back(C);
   }
   return true;
}
									/*}}}*/
// StagingArea::MakeDirectory - mkdir and chmod a single directory	/*{{{*/
// ---------------------------------------------------------------------
/* The mode is set explicitly as mkdir is subject to the umask and the
   directory might exist with another mode already. */
bool debStagingArea::MakeDirectory(std::string const &Dir, mode_t const Permissions) const
{
   struct stat St;
   if (lstat(Dir.c_str(), &St) == 0)
   {
      if (S_ISDIR(St.st_mode) == false)
	 return _error->Error(_("%s exists and is not a directory"), Dir.c_str());
   }
   else if (mkdir(Dir.c_str(), Permissions) != 0 && errno != EEXIST)
      return _error->Errno("mkdir", _("Unable to create directory %s"), Dir.c_str());
   else if (_config->FindB("Debug::Giftwrap::Staging", false) == true)
      std::clog << "Created directory " << Dir << std::endl;

   if (chmod(Dir.c_str(), Permissions) != 0)
      return _error->Errno("chmod", _("Unable to change the mode of %s"), Dir.c_str());
   return true;
}
									/*}}}*/
// StagingArea::DataPath - Staging path of a file			/*{{{*/
std::string debStagingArea::DataPath(std::string const &Path, mode_t const Permissions)
{
   std::vector<std::string> Components;
   if (SplitInstallPath(Path, Components) == false)
      return "";
   if (Components.empty() == true)
   {
      _error->Error(_("The path '%s' does not name a file"), Path.c_str());
      return "";
   }

   std::string Cur = DataRoot();
   for (auto C = Components.cbegin(); C + 1 != Components.cend(); ++C)
   {
      Cur.append("/").append(*C);
      if (MakeDirectory(Cur, Permissions) == false)
	 return "";
   }
   return Cur.append("/").append(Components.back());
}
									/*}}}*/
// StagingArea::DataDirPath - Staging path of a directory		/*{{{*/
std::string debStagingArea::DataDirPath(std::string const &Path, mode_t const Permissions,
					bool const MakeIfMissing)
{
   std::vector<std::string> Components;
   if (SplitInstallPath(Path, Components) == false)
      return "";

   std::string Cur = DataRoot();
   for (auto const &C : Components)
   {
      Cur.append("/").append(C);
      if (MakeIfMissing == true && MakeDirectory(Cur, Permissions) == false)
	 return "";
   }
   return Cur;
}
									/*}}}*/
