// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Rules - the actions a package is assembled with

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/debbuildcontext.h>
#include <giftwrap-pkg/debpackage.h>
#include <giftwrap-pkg/debrules.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/strutl.h>

#include <iostream>
#include <memory>
#include <string>
#include <sys/stat.h>

#include <giftwrapi18n.h>
									/*}}}*/

// ChangeMode - chmod with error reporting				/*{{{*/
// ---------------------------------------------------------------------
/* FileFd creates files subject to the umask, the final mode is set
   afterwards. */
static bool ChangeMode(std::string const &File, mode_t const Mode)
{
   if (chmod(File.c_str(), Mode) != 0)
      return _error->Errno("chmod", _("Unable to change the mode of %s"), File.c_str());
   return true;
}
									/*}}}*/
static std::string ModeString(mode_t const Mode)			/*{{{*/
{
   std::string Res;
   strprintf(Res, "%04o", static_cast<unsigned int>(Mode));
   return Res;
}
									/*}}}*/

// PlaceFileRule - copy a file from the host				/*{{{*/
debPlaceFileRule::debPlaceFileRule(std::string const &Source, std::string const &Destination,
				   mode_t const Mode, mode_t const DirMode) :
   Source(Source), Destination(Destination), Mode(Mode), DirMode(DirMode)
{
}
bool debPlaceFileRule::Apply(debPackageDescription const &, debBuildContext &Ctx) const
{
   std::string const Target = Ctx.GetStaging().DataPath(Destination, DirMode);
   if (Target.empty() == true)
      return false;

   FileFd In(Source, FileFd::ReadOnly);
   if (In.IsOpen() == false || In.Failed() == true)
      return false;
   FileFd Out(Target, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, Mode);
   if (Out.IsOpen() == false || Out.Failed() == true)
      return false;
   if (CopyFile(In, Out) == false)
   {
      Out.OpFail();
      return false;
   }
   if (Out.Close() == false || In.Close() == false)
      return false;
   return ChangeMode(Target, Mode);
}
std::string debPlaceFileRule::Describe() const
{
   return "place " + Source + " at " + Destination + " (" + ModeString(Mode) + ")";
}
									/*}}}*/
// WriteFileRule - create a file with the given content		/*{{{*/
debWriteFileRule::debWriteFileRule(std::string const &Destination, std::string const &Contents,
				   mode_t const Mode, mode_t const DirMode) :
   Destination(Destination), Contents(Contents), Mode(Mode), DirMode(DirMode)
{
}
bool debWriteFileRule::Apply(debPackageDescription const &, debBuildContext &Ctx) const
{
   std::string const Target = Ctx.GetStaging().DataPath(Destination, DirMode);
   if (Target.empty() == true)
      return false;

   FileFd Out(Target, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, Mode);
   if (Out.IsOpen() == false || Out.Failed() == true)
      return false;
   if (Out.Write(Contents) == false || Out.Close() == false)
      return false;
   return ChangeMode(Target, Mode);
}
std::string debWriteFileRule::Describe() const
{
   std::string Res;
   strprintf(Res, "write %zu bytes to %s (%s)", Contents.length(), Destination.c_str(),
	     ModeString(Mode).c_str());
   return Res;
}
									/*}}}*/
// MakeDirectoryRule - create a directory, maybe with an owner	/*{{{*/
debMakeDirectoryRule::debMakeDirectoryRule(std::string const &Path, std::string const &Owner,
					   std::string const &Group) :
   Path(Path), Owner(Owner), Group(Group)
{
}
bool debMakeDirectoryRule::Apply(debPackageDescription const &, debBuildContext &Ctx) const
{
   return Ctx.MakeDataDir(Path, Owner, Group).empty() == false;
}
std::string debMakeDirectoryRule::Describe() const
{
   std::string Res = "make directory " + Path;
   if (Owner.empty() == false)
   {
      Res.append(" owned by ").append(Owner);
      if (Group.empty() == false)
	 Res.append(":").append(Group);
   }
   return Res;
}
									/*}}}*/
// MakeSymlinkRule - record a symlink					/*{{{*/
debMakeSymlinkRule::debMakeSymlinkRule(std::string const &Source, std::string const &LinkName) :
   Source(Source), LinkName(LinkName)
{
}
bool debMakeSymlinkRule::Apply(debPackageDescription const &, debBuildContext &Ctx) const
{
   if (Source.empty() == true || LinkName.empty() == true)
      return _error->Error(_("A symlink needs a target and a name"));

   // DataPath creates the parent directory of the link target
   if (Ctx.GetStaging().DataPath(Source).empty() == true)
      return false;
   Ctx.AddSymlink(Source, LinkName);
   return true;
}
std::string debMakeSymlinkRule::Describe() const
{
   return "symlink " + LinkName + " -> " + Source;
}
									/*}}}*/
// PostInstCommandRule - run a command after installation		/*{{{*/
debPostInstCommandRule::debPostInstCommandRule(std::string const &Command) : Command(Command)
{
}
bool debPostInstCommandRule::Apply(debPackageDescription const &, debBuildContext &Ctx) const
{
   if (GiftWrap::String::Strip(Command).empty() == true)
      return _error->Error(_("Refusing to add an empty postinst command"));
   Ctx.AddPostInstCommand(Command);
   return true;
}
std::string debPostInstCommandRule::Describe() const
{
   return "postinst command " + Command;
}
									/*}}}*/

// debApplyRules - Apply all rules of a package in order		/*{{{*/
bool debApplyRules(debPackageDescription const &Pkg, debBuildContext &Ctx)
{
   bool const Debug = _config->FindB("Debug::Giftwrap::Rules", false);
   unsigned int Number = 0;
   for (auto const &Rule : Pkg.Rules)
   {
      ++Number;
      if (Rule == nullptr)
	 return _error->Error(_("The package has an empty rule"));
      if (Debug == true)
	 std::clog << "Rule " << Number << ": " << Rule->Describe() << std::endl;
      if (Rule->Apply(Pkg, Ctx) == false)
	 return _error->Error(_("Rule %u failed: %s"), Number, Rule->Describe().c_str());
   }
   return true;
}
									/*}}}*/
