// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Control Writer - renders the package metadata into the staging area

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/debbuildcontext.h>
#include <giftwrap-pkg/debcontrol.h>
#include <giftwrap-pkg/debcontrolwriter.h>
#include <giftwrap-pkg/debpackage.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/strutl.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

#include <giftwrapi18n.h>
									/*}}}*/

static std::string StripTrailing(std::string S)				/*{{{*/
{
   while (S.empty() == false && isspace_ascii(S.back()) != 0)
      S.pop_back();
   return S;
}
									/*}}}*/
static std::string EnsurePeriod(std::string S)				/*{{{*/
{
   if (S.empty() == false && S.back() != '.')
      S.push_back('.');
   return S;
}
									/*}}}*/

debControlWriter::debControlWriter(debPackageDescription const &Pkg, debBuildContext &Ctx) :/*{{{*/
   Pkg(Pkg), Ctx(Ctx)
{
}
									/*}}}*/
// ControlWriter::FormatDescription - Value of the Description field	/*{{{*/
std::string debControlWriter::FormatDescription(std::string const &Short, std::string const &Long)
{
   std::string Res = EnsurePeriod(GiftWrap::String::Strip(Short));
   std::string const Body = EnsurePeriod(GiftWrap::String::Strip(Long));
   if (Body.empty() == true)
      return Res;

   std::string::size_type Start = 0;
   while (Start <= Body.length())
   {
      std::string::size_type End = Body.find('\n', Start);
      if (End == std::string::npos)
	 End = Body.length();
      std::string const Line = StripTrailing(Body.substr(Start, End - Start));
      Res.append("\n ");
      Res.append(Line.empty() ? "." : Line);
      Start = End + 1;
   }
   return Res;
}
									/*}}}*/
// ControlWriter::FormatPostInst - The postinst script			/*{{{*/
// ---------------------------------------------------------------------
/* The commands only run on configure, the other actions dpkg calls the
   script with are accepted and ignored. */
std::string debControlWriter::FormatPostInst(std::vector<std::string> const &Commands)
{
   std::string Script =
      "#!/bin/sh\n"
      "# postinst script generated by giftwrap.\n"
      "set -e\n"
      "case \"$1\" in\n"
      "    configure)\n";
   for (auto const &C : Commands)
      Script.append("        ").append(C).append("\n");
   Script.append(
      "    ;;\n"
      "\n"
      "    abort-upgrade|abort-remove|abort-deconfigure)\n"
      "    ;;\n"
      "\n"
      "    *)\n"
      "        echo \"postinst called with unknown argument \\`$1'\" >&2\n"
      "        exit 1\n"
      "    ;;\n"
      "esac\n"
      "\n"
      "exit 0\n");
   return Script;
}
									/*}}}*/
// ControlWriter::BuildRecord - Collect the fields of the control file	/*{{{*/
bool debControlWriter::BuildRecord(debControlRecord &Record, bool const Binary) const
{
   Record.Clear();

   std::vector<std::string> Archs;
   if (Pkg.Architecture.Resolve(Archs, Binary == false) == false)
      return false;

   if (Binary == true)
      Record.Set("Package", Pkg.Name);
   // without an explicit source package the binary names its own source
   Record.Set("Source", Pkg.Source.empty() ? Pkg.Name : Pkg.Source);
   Record.Set("Version", Pkg.Version);
   Record.Set("Architecture", GiftWrap::String::Join(Archs, " "));

   if (Pkg.MaintainerEmail.empty() == false)
   {
      if (Pkg.MaintainerName.empty() == false)
	 Record.Set("Maintainer", Pkg.MaintainerName + " <" + Pkg.MaintainerEmail + ">");
      else
	 Record.Set("Maintainer", "<" + Pkg.MaintainerEmail + ">");
   }
   else if (Pkg.MaintainerName.empty() == false)
      Record.Set("Maintainer", Pkg.MaintainerName);

   if (Pkg.Description.empty() == false)
      Record.Set("Description", FormatDescription(Pkg.Description, Pkg.LongDescription));

   std::pair<char const *, std::string const *> const Simple[] = {
      {"Homepage", &Pkg.Homepage},
      {"Section", &Pkg.Section},
      {"Priority", &Pkg.Priority},
   };
   for (auto const &S : Simple)
      if (S.second->empty() == false)
	 Record.Set(S.first, *S.second);

   std::pair<char const *, std::vector<std::string> const *> const Relations[] = {
      {"Pre-Depends", &Pkg.PreDepends},
      {"Depends", &Pkg.Depends},
      {"Recommends", &Pkg.Recommends},
      {"Suggests", &Pkg.Suggests},
      {"Conflicts", &Pkg.Conflicts},
      {"Breaks", &Pkg.Breaks},
      {"Replaces", &Pkg.Replaces},
      {"Provides", &Pkg.Provides},
   };
   for (auto const &R : Relations)
      if (R.second->empty() == false)
	 Record.Set(R.first, GiftWrap::String::Join(*R.second, ", "));

   return true;
}
									/*}}}*/
// ControlWriter::WriteControlFile - Write a file with a given mode	/*{{{*/
bool debControlWriter::WriteControlFile(std::string const &Path, std::string const &Content,
					mode_t const Mode)
{
   if (Path.empty() == true)
      return false;

   FileFd Out(Path, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, Mode);
   if (Out.IsOpen() == false || Out.Failed() == true)
      return false;
   if (Out.Write(Content) == false || Out.Close() == false)
      return false;
   if (chmod(Path.c_str(), Mode) != 0)
      return _error->Errno("chmod", _("Unable to change the mode of %s"), Path.c_str());
   return true;
}
									/*}}}*/
bool debControlWriter::WriteControl(bool const Binary)			/*{{{*/
{
   debControlRecord Record;
   if (BuildRecord(Record, Binary) == false)
      return false;
   return WriteControlFile(Ctx.GetStaging().ControlPath("control"), Record.ToString(), 0644);
}
									/*}}}*/
bool debControlWriter::WritePostInst()					/*{{{*/
{
   return WriteControlFile(Ctx.GetStaging().ControlPath("postinst"),
			   FormatPostInst(Ctx.GetPostInstCommands()), 0755);
}
									/*}}}*/
bool debControlWriter::WriteCopyright()					/*{{{*/
{
   std::string const Path = Ctx.GetStaging().DataPath("/usr/share/doc/" + Pkg.Name + "/copyright");
   return WriteControlFile(Path, Pkg.Copyright, 0644);
}
									/*}}}*/
// ControlWriter::CollectConffiles - Regular files below a directory	/*{{{*/
bool debControlWriter::CollectConffiles(std::string const &Dir, std::string const &InstallDir,
					std::vector<std::string> &List)
{
   std::vector<std::string> Entries;
   if (GetListOfEntriesInDir(Dir, Entries, true) == false)
      return false;

   for (auto const &E : Entries)
   {
      std::string const Path = flCombine(Dir, E);
      struct stat St;
      if (lstat(Path.c_str(), &St) != 0)
	 return _error->Errno("lstat", _("Unable to stat %s"), Path.c_str());
      if (S_ISDIR(St.st_mode))
      {
	 if (CollectConffiles(Path, InstallDir + "/" + E, List) == false)
	    return false;
      }
      else if (S_ISREG(St.st_mode))
	 List.push_back(InstallDir + "/" + E);
   }
   return true;
}
									/*}}}*/
// ControlWriter::WriteConffiles - List the files staged below /etc	/*{{{*/
// ---------------------------------------------------------------------
/* The list is sorted as a whole, so the order doesn't depend on the
   order of the directory entries. */
bool debControlWriter::WriteConffiles()
{
   std::string const Etc = Ctx.GetStaging().DataDirPath("/etc", 0755, false);
   if (Etc.empty() == true)
      return false;

   std::vector<std::string> List;
   if (DirectoryExists(Etc) == true && CollectConffiles(Etc, "/etc", List) == false)
      return false;
   std::sort(List.begin(), List.end());

   std::string Content;
   for (auto const &F : List)
      Content.append(F).append("\n");
   return WriteControlFile(Ctx.GetStaging().ControlPath("conffiles"), Content, 0644);
}
									/*}}}*/
// ControlWriter::WriteSymlinks - Create the recorded symlinks		/*{{{*/
bool debControlWriter::WriteSymlinks()
{
   bool const Quiet = _config->FindI("quiet", 0) >= 1;
   for (auto const &S : Ctx.GetSymlinks())
   {
      if (Quiet == false)
	 std::clog << S.LinkName << " -> " << S.Source << std::endl;

      std::string const Link = Ctx.GetStaging().DataPath(S.LinkName);
      if (Link.empty() == true)
	 return false;

      struct stat St;
      if (lstat(Link.c_str(), &St) == 0)
	 return _error->Error(_("Unable to create the symlink %s, the path exists already"), S.LinkName.c_str());
      if (symlink(S.Source.c_str(), Link.c_str()) != 0)
	 return _error->Errno("symlink", _("Unable to create the symlink %s"), S.LinkName.c_str());
   }
   return true;
}
									/*}}}*/
// ControlWriter::Go - Render everything				/*{{{*/
bool debControlWriter::Go()
{
   return WriteControl() &&
      WritePostInst() &&
      WriteCopyright() &&
      WriteConffiles() &&
      WriteSymlinks();
}
									/*}}}*/
