// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Build - assemble a binary package from its description

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/debbuild.h>
#include <giftwrap-pkg/debbuildcontext.h>
#include <giftwrap-pkg/debcontrolwriter.h>
#include <giftwrap-pkg/debpackage.h>
#include <giftwrap-pkg/debpacker.h>
#include <giftwrap-pkg/debrules.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>

#include <string>

#include <giftwrapi18n.h>
									/*}}}*/

// debBuildPackage - Run the whole pipeline				/*{{{*/
bool debBuildPackage(debPackageDescription const &Pkg, std::string const &Destination,
		     std::string * const LintianOutput)
{
   if (Destination.empty() == true)
      return _error->Error(_("No destination given for package %s"), Pkg.Name.c_str());
   if (Pkg.Validate() == false)
      return _error->Error(_("The description of package %s is invalid"), Pkg.Name.c_str());

   debBuildContext Ctx;
   if (Ctx.Create(Pkg.Name) == false)
      return false;

   if (debApplyRules(Pkg, Ctx) == false)
      return false;

   debControlWriter Writer(Pkg, Ctx);
   if (Writer.Go() == false)
      return false;

   debArchivePacker Packer(Ctx.GetStaging());
   if (Packer.Pack(Destination) == false)
      return false;

   if (_config->FindB("Giftwrap::Lintian", false) == true)
   {
      std::string Output;
      bool const Okay = Packer.RunLintian(Destination, Output);
      if (LintianOutput != nullptr)
	 LintianOutput->swap(Output);
      if (Okay == false)
      {
	 RemoveFile("debBuildPackage", Destination);
	 return false;
      }
   }

   Ctx.GetStaging().MarkSuccessful();
   return true;
}
									/*}}}*/
