// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Archive Packer - turns a staging area into a .deb file

   A .deb is an ar archive with the members debian-binary, control.tar.*
   and data.tar.* in exactly this order, see deb(5).

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/arfile.h>
#include <giftwrap-pkg/compressors.h>
#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/debpacker.h>
#include <giftwrap-pkg/debstaging.h>
#include <giftwrap-pkg/error.h>
#include <giftwrap-pkg/fileutl.h>
#include <giftwrap-pkg/packtar.h>

#include <ctime>
#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <string.h>

#include <giftwrapi18n.h>
									/*}}}*/

static constexpr char DebianBinary[] = "2.0\n";

debArchivePacker::debArchivePacker(debStagingArea &Staging) : Staging(Staging)/*{{{*/
{
}
									/*}}}*/
// ArchivePacker::PackTree - Write a tree as compressed tar file	/*{{{*/
bool debArchivePacker::PackTree(std::string const &Tree, std::string const &TarFile,
				GiftWrap::Configuration::Compressor const &Comp)
{
   if (_config->FindB("Debug::Giftwrap::Pack", false) == true)
      std::clog << "Packing " << Tree << " into " << TarFile << " with " << Comp.Name << std::endl;

   FileFd Tar;
   if (Tar.Open(TarFile, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, Comp, 0644) == false)
      return false;
   Tar.EraseOnFailure();

   PackTar Packer(Tar);
   if (Packer.Go(Tree) == false)
   {
      Tar.OpFail();
      Tar.Close();
      return false;
   }
   return Tar.Close();
}
									/*}}}*/
// ArchivePacker::Pack - Write the .deb					/*{{{*/
bool debArchivePacker::Pack(std::string const &Destination)
{
   if (Staging.GetRoot().empty() == true)
      return _error->Error(_("The staging directory was not created yet"));

   using GiftWrap::Configuration::Compressor;
   std::string const Name = _config->Find("Giftwrap::Compressor", "gzip");
   Compressor DataComp;
   if (GiftWrap::Configuration::findCompressor(Name, DataComp) == false)
      return _error->Error(_("Unsupported compressor '%s'"), Name.c_str());
   // dpkg reads bzip2 compressed data members, but no such control members
   Compressor ControlComp = DataComp;
   if (ControlComp.Name == "bzip2" &&
	 GiftWrap::Configuration::findCompressor("gzip", ControlComp) == false)
      return _error->Error(_("Unsupported compressor '%s'"), "gzip");

   std::string const ControlMember = "control.tar" + ControlComp.Extension;
   std::string const DataMember = "data.tar" + DataComp.Extension;
   std::string const ControlTar = flCombine(Staging.GetRoot(), ControlMember);
   std::string const DataTar = flCombine(Staging.GetRoot(), DataMember);
   std::string const Marker = flCombine(Staging.GetRoot(), "debian-binary");

   if (PackTree(Staging.ControlRoot(), ControlTar, ControlComp) == false ||
	 PackTree(Staging.DataRoot(), DataTar, DataComp) == false)
      return false;

   {
      FileFd Out(Marker, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, 0644);
      if (Out.Failed() == true || Out.Write(DebianBinary, strlen(DebianBinary)) == false ||
	    Out.Close() == false)
	 return false;
   }

   if (RemoveFile("debArchivePacker::Pack", Destination) == false)
      return false;

   if (_config->FindB("Debug::Giftwrap::Pack", false) == true)
      std::clog << "Writing " << Destination << std::endl;

   FileFd Out(Destination, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, 0644);
   if (Out.IsOpen() == false || Out.Failed() == true)
      return false;
   Out.EraseOnFailure();

   time_t MTime;
   if (GetSourceDateEpoch(MTime) == false)
      MTime = time(nullptr);
   ARWriter AR(Out, MTime);

   std::pair<std::string, std::string> const Members[] = {
      {"debian-binary", Marker},
      {ControlMember, ControlTar},
      {DataMember, DataTar},
   };
   for (auto const &M : Members)
   {
      FileFd In(M.second, FileFd::ReadOnly);
      if (In.IsOpen() == false || In.Failed() == true ||
	    AR.Add(M.first, In) == false || In.Close() == false)
      {
	 Out.OpFail();
	 Out.Close();
	 return false;
      }
   }
   return Out.Close();
}
									/*}}}*/
// ArchivePacker::RunLintian - Check the package with lintian		/*{{{*/
bool debArchivePacker::RunLintian(std::string const &Destination, std::string &Output)
{
   Output.clear();
   std::string const Configured = _config->Find("Dir::Bin::lintian", "lintian");
   std::string const Lintian = FindExecutableInPath(Configured);
   if (Lintian.empty() == true)
   {
      _error->Notice(_("Can't find %s, the package is not checked"), Configured.c_str());
      return true;
   }

   std::vector<std::string> const Options = _config->FindVector("Giftwrap::Lintian::Options",
								"-v,--color,always,--pedantic");
   std::vector<const char *> Args;
   Args.push_back(Lintian.c_str());
   for (auto const &O : Options)
      Args.push_back(O.c_str());
   Args.push_back(Destination.c_str());
   Args.push_back(nullptr);

   if (_config->FindB("Debug::Giftwrap::Pack", false) == true)
   {
      std::clog << "Running";
      for (auto const A : Args)
	 if (A != nullptr)
	    std::clog << " " << A;
      std::clog << std::endl;
   }

   FileFd Pipe;
   pid_t Child = -1;
   if (Popen(Args.data(), Pipe, Child, FileFd::ReadOnly, true) == false)
      return false;
   bool const ReadOkay = Pipe.ReadAll(Output);
   bool const CloseOkay = Pipe.Close();
   bool const ExitOkay = ExecWait(Child, Lintian.c_str(), true);
   if (ReadOkay == false || CloseOkay == false)
      return false;
   if (ExitOkay == true)
      return true;

   if (_config->FindB("Giftwrap::Lintian::Fatal", false) == true)
      return _error->Error(_("lintian found problems in %s"), Destination.c_str());
   _error->Warning(_("lintian found problems in %s"), Destination.c_str());
   return true;
}
									/*}}}*/
