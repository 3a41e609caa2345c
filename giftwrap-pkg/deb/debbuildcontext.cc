// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Build Context - the mutable state of a single package build

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/debbuildcontext.h>

#include <string>
									/*}}}*/

// ShellQuote - Quote a word for the postinst script			/*{{{*/
// ---------------------------------------------------------------------
/* Words made of harmless characters only are kept as they are, all
   others are put in single quotes. */
static std::string ShellQuote(std::string const &Word)
{
   auto const Harmless = [](char const C) {
      return (C >= 'a' && C <= 'z') || (C >= 'A' && C <= 'Z') || (C >= '0' && C <= '9') ||
	 C == '/' || C == '.' || C == '_' || C == '-' || C == '+' || C == ':' || C == '@';
   };
   bool Quote = Word.empty();
   for (auto const C : Word)
      if (Harmless(C) == false)
	 Quote = true;
   if (Quote == false)
      return Word;

   std::string Res = "'";
   for (auto const C : Word)
   {
      if (C == '\'')
	 Res.append("'\\''");
      else
	 Res.push_back(C);
   }
   return Res.append("'");
}
									/*}}}*/

// BuildContext::MakeDataDir - Create a directory with an owner	/*{{{*/
// ---------------------------------------------------------------------
/* The ownership can only be set on the installed system, so it becomes
   a postinst command. The chown works on the install path. */
std::string debBuildContext::MakeDataDir(std::string const &Path, std::string const &Owner,
					 std::string const &Group)
{
   std::string const Dir = Staging.DataDirPath(Path);
   if (Dir.empty() == true || Owner.empty() == true)
      return Dir;

   std::string Spec = Owner;
   if (Group.empty() == false)
      Spec.append(":").append(Group);
   std::string InstallPath = Path;
   if (InstallPath.empty() == true || InstallPath[0] != '/')
      InstallPath.insert(0, "/");
   PostInstCommands.push_back("chown -R " + ShellQuote(Spec) + " " + ShellQuote(InstallPath));
   return Dir;
}
									/*}}}*/
