// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Package Description - everything a binary package is built from

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/debpackage.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/strutl.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <giftwrapi18n.h>
									/*}}}*/

static bool HasWhitespace(std::string const &S)				/*{{{*/
{
   return std::find_if(S.begin(), S.end(), [](char const C) { return isspace_ascii(C) != 0; }) != S.end();
}
									/*}}}*/

// ArchitectureSpec::debArchitectureSpec - Constructors			/*{{{*/
debArchitectureSpec::debArchitectureSpec(SpecType const Type, std::vector<std::string> const &Values) :
   Type(Type), Values(Values)
{
}
debArchitectureSpec debArchitectureSpec::Single(std::string const &Arch)
{
   return debArchitectureSpec(SINGLE, {Arch});
}
debArchitectureSpec debArchitectureSpec::List(std::vector<std::string> const &Archs)
{
   return debArchitectureSpec(LIST, Archs);
}
debArchitectureSpec debArchitectureSpec::AutoDetect()
{
   return debArchitectureSpec(AUTODETECT, {});
}
									/*}}}*/
// DetectArchitecture - Ask dpkg for the native architecture		/*{{{*/
// ---------------------------------------------------------------------
/* Anything going wrong here is not an error for the build, the caller
   falls back to "any" if we return an empty string. */
static std::string DetectArchitecture()
{
   bool const Debug = _config->FindB("Debug::Giftwrap::Control", false);
   std::string const Dpkg = FindExecutableInPath(_config->Find("Dir::Bin::dpkg", "dpkg"));
   if (Dpkg.empty() == true)
   {
      if (Debug == true)
	 std::clog << "Can't find " << _config->Find("Dir::Bin::dpkg", "dpkg") << " to detect the architecture" << std::endl;
      return "";
   }

   std::string Output;
   _error->PushToStack();
   FileFd Pipe;
   pid_t Child = -1;
   const char *Args[] = {Dpkg.c_str(), "--print-architecture", nullptr};
   bool Okay = Popen(Args, Pipe, Child, FileFd::ReadOnly, false) &&
	       Pipe.ReadAll(Output);
   Okay &= Pipe.Close();
   Okay &= ExecWait(Child, Dpkg.c_str(), true);
   if (Debug == true && _error->empty() == false)
      _error->DumpErrors(std::clog, GlobalError::DEBUG, false);
   _error->RevertToStack();

   if (Okay == false)
   {
      if (Debug == true)
	 std::clog << Dpkg << " --print-architecture failed" << std::endl;
      return "";
   }

   std::string const Arch = GiftWrap::String::Strip(Output.substr(0, Output.find('\n')));
   if (Debug == true)
      std::clog << Dpkg << " --print-architecture reported '" << Arch << "'" << std::endl;
   return Arch;
}
									/*}}}*/
// ArchitectureSpec::Resolve - The architectures of the control file	/*{{{*/
bool debArchitectureSpec::Resolve(std::vector<std::string> &Archs, bool const Source) const
{
   Archs.clear();
   switch (Type)
   {
      case SINGLE:
      case LIST:
	 Archs = Values;
	 break;
      case AUTODETECT:
      {
	 std::string const Arch = DetectArchitecture();
	 Archs.push_back(Arch.empty() ? "any" : Arch);
	 break;
      }
   }

   if (Source == true && std::find(Archs.begin(), Archs.end(), "source") == Archs.end())
      Archs.push_back("source");

   if (Archs.empty() == true)
      return _error->Error(_("The package has no architecture"));
   return true;
}
									/*}}}*/
// ArchitectureSpec::Validate - Check the given values		/*{{{*/
bool debArchitectureSpec::Validate() const
{
   if (Type == AUTODETECT)
      return true;
   if (Values.empty() == true)
      return _error->Error(_("The architecture list is empty"));

   bool Okay = true;
   for (auto const &A : Values)
   {
      if (A.empty() == true)
	 Okay = _error->Error(_("The architecture list contains an empty entry"));
      else if (HasWhitespace(A) == true)
	 Okay = _error->Error(_("Architecture '%s' contains whitespace"), A.c_str());
   }
   return Okay;
}
									/*}}}*/

// PackageDescription::debPackageDescription - Constructors		/*{{{*/
debPackageDescription::debPackageDescription() :
   Architecture(debArchitectureSpec::AutoDetect())
{
}
debPackageDescription::debPackageDescription(std::string const &Name, std::string const &Version,
					     debArchitectureSpec const &Architecture) :
   Name(Name), Version(Version), Architecture(Architecture)
{
}
debPackageDescription::~debPackageDescription() {}
									/*}}}*/
// PackageDescription::Validate - Check the description		/*{{{*/
// ---------------------------------------------------------------------
/* Package names follow Debian policy 5.6.1: at least two characters,
   lower case alphanumerics, plus, minus and dot, starting with an
   alphanumeric. All problems are reported, not only the first. */
bool debPackageDescription::Validate() const
{
   bool Okay = true;

   if (Name.empty() == true)
      Okay = _error->Error(_("The package name must not be empty"));
   else
   {
      auto const NameChar = [](char const C, bool const First) {
	 if ((C >= 'a' && C <= 'z') || (C >= '0' && C <= '9'))
	    return true;
	 return First == false && (C == '+' || C == '-' || C == '.');
      };
      bool Valid = Name.length() >= 2;
      for (size_t I = 0; Valid == true && I != Name.length(); ++I)
	 Valid = NameChar(Name[I], I == 0);
      if (Valid == false)
	 Okay = _error->Error(_("Invalid package name '%s'"), Name.c_str());
   }

   if (Version.empty() == true)
      Okay = _error->Error(_("The package version must not be empty"));
   else if (HasWhitespace(Version) == true)
      Okay = _error->Error(_("Version '%s' contains whitespace"), Version.c_str());

   if (Architecture.Validate() == false)
      Okay = false;

   // single line fields, a newline would start a new field
   std::pair<char const *, std::string const *> const Lines[] = {
      {"Source", &Source},
      {"Maintainer", &MaintainerName},
      {"Maintainer", &MaintainerEmail},
      {"Description", &Description},
      {"Homepage", &Homepage},
      {"Section", &Section},
      {"Priority", &Priority},
   };
   for (auto const &L : Lines)
      if (L.second->find('\n') != std::string::npos)
	 Okay = _error->Error(_("The %s field must be a single line"), L.first);

   if (GiftWrap::String::Strip(Description).empty() == true &&
	 GiftWrap::String::Strip(LongDescription).empty() == false)
      Okay = _error->Error(_("The long description needs a short description"));

   for (auto const &R : Rules)
      if (R == nullptr)
	 Okay = _error->Error(_("The package has an empty rule"));

   return Okay;
}
									/*}}}*/
