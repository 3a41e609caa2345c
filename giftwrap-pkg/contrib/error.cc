// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Error stack shared by every build step

   Messages are kept in a list in the order they were raised. The
   PendingFlag caches whether an ERROR or FATAL message is present.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <giftwrap-pkg/configuration.h>
#include <giftwrap-pkg/error.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <list>
#include <string>
#include <vector>
#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
									/*}}}*/

// Global Error Object							/*{{{*/
GlobalError *_GetErrorObj()
{
   static thread_local GlobalError Obj;
   return &Obj;
}
									/*}}}*/
// GlobalError::GlobalError - Constructor				/*{{{*/
GlobalError::GlobalError() : PendingFlag(false) {}
									/*}}}*/
// GlobalError::FatalE, Errno, WarningE, NoticeE and DebugE - Add to the list/*{{{*/
static std::string ErrnoSuffix(const char *Function, int const errsv)
{
   std::string S(" - ");
   S.append(Function).append(" (").append(std::to_string(errsv));
   S.append(": ").append(strerror(errsv)).append(")");
   return S;
}
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME (const char *Function, const char *Description,...) { \
	int const errsv = errno; \
	va_list args; \
	va_start(args,Description); \
	InsertV(TYPE, ErrnoSuffix(Function, errsv), Description, args); \
	va_end(args); \
	return false; \
}
GEMessage(FatalE, FATAL)
GEMessage(Errno, ERROR)
GEMessage(WarningE, WARNING)
GEMessage(NoticeE, NOTICE)
GEMessage(DebugE, DEBUG)
#undef GEMessage
									/*}}}*/
// GlobalError::InsertErrno - Add a message of any type with errno	/*{{{*/
bool GlobalError::InsertErrno(MsgType const &type, const char *Function,
				const char *Description,...) {
	int const errsv = errno;
	va_list args;
	va_start(args,Description);
	InsertV(type, ErrnoSuffix(Function, errsv), Description, args);
	va_end(args);
	return false;
}
									/*}}}*/
// GlobalError::Fatal, Error, Warning, Notice and Debug - Add to the list/*{{{*/
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME (const char *Description,...) { \
	va_list args; \
	va_start(args,Description); \
	InsertV(TYPE, "", Description, args); \
	va_end(args); \
	return false; \
}
GEMessage(Fatal, FATAL)
GEMessage(Error, ERROR)
GEMessage(Warning, WARNING)
GEMessage(Notice, NOTICE)
GEMessage(Debug, DEBUG)
#undef GEMessage
									/*}}}*/
// GlobalError::Insert - Add a message of the given type		/*{{{*/
bool GlobalError::Insert(MsgType const &type, const char *Description,...)
{
	va_list args;
	va_start(args,Description);
	InsertV(type, "", Description, args);
	va_end(args);
	return false;
}
									/*}}}*/
// GlobalError::InsertV - Format a message and append it		/*{{{*/
// Suffix is appended verbatim after the formatted text.
bool GlobalError::InsertV(MsgType type, std::string Suffix,
			  const char *Description, va_list &args)
{
	std::vector<char> S(400);
	while (true)
	{
		va_list copy;
		va_copy(copy, args);
		int const n = vsnprintf(S.data(), S.size(), Description, copy);
		va_end(copy);
		if (n > -1 && static_cast<size_t>(n) < S.size())
			break;
		S.resize(n > -1 ? n + 1 : S.size() * 2);
	}

	Item const m(std::string(S.data()).append(Suffix), type);
	Messages.push_back(m);

	if (type == ERROR || type == FATAL)
		PendingFlag = true;

	if (type == FATAL || type == DEBUG)
		std::clog << m << std::endl;

	return false;
}
									/*}}}*/
// GlobalError::PopMessage - Pulls a single message out			/*{{{*/
bool GlobalError::PopMessage(std::string &Text) {
	if (Messages.empty() == true)
		return false;

	Item const msg = Messages.front();
	Messages.pop_front();

	bool const Ret = (msg.Type == ERROR || msg.Type == FATAL);
	Text = msg.Text;
	if (PendingFlag == false || Ret == false)
		return Ret;

	PendingFlag = std::any_of(Messages.begin(), Messages.end(), [](Item const &m) {
		return m.Type == ERROR || m.Type == FATAL;
	});
	return Ret;
}
									/*}}}*/
// GlobalError::DumpErrors - Dump all of the messages to a stream	/*{{{*/
void GlobalError::DumpErrors(std::ostream &out, MsgType const &threshold,
			     bool const &mergeStack) {
	if (mergeStack == true)
		for (auto s = Stacks.rbegin(); s != Stacks.rend(); ++s)
			std::copy(s->Messages.rbegin(), s->Messages.rend(), std::front_inserter(Messages));

	for (auto const &m : Messages)
		if (m.Type >= threshold)
			out << m << std::endl;

	Discard();
}
									/*}}}*/
// GlobalError::Discard - Discard					/*{{{*/
void GlobalError::Discard() {
	Messages.clear();
	PendingFlag = false;
}
									/*}}}*/
// GlobalError::empty - does our error list include anything?		/*{{{*/
bool GlobalError::empty(MsgType const &threshold) const {
	if (PendingFlag == true)
		return false;

	return std::none_of(Messages.begin(), Messages.end(), [&threshold](Item const &m) {
		return m.Type >= threshold;
	});
}
									/*}}}*/
// GlobalError::PushToStack						/*{{{*/
void GlobalError::PushToStack() {
	Stacks.emplace_back(Messages, PendingFlag);
	Discard();
}
									/*}}}*/
// GlobalError::RevertToStack						/*{{{*/
void GlobalError::RevertToStack() {
	Discard();
	MsgStack pack = Stacks.back();
	Messages = pack.Messages;
	PendingFlag = pack.PendingFlag;
	Stacks.pop_back();
}
									/*}}}*/
// GlobalError::MergeWithStack						/*{{{*/
void GlobalError::MergeWithStack() {
	MsgStack pack = Stacks.back();
	Messages.splice(Messages.begin(), pack.Messages);
	PendingFlag = PendingFlag || pack.PendingFlag;
	Stacks.pop_back();
}
									/*}}}*/
// GlobalError::Item::operator<<					/*{{{*/
std::ostream &operator<<(std::ostream &out, GlobalError::Item const &i)
{
   bool const use_color = _config->FindB("Giftwrap::Color", false);
   if (use_color)
   {
      switch (i.Type)
      {
      case GlobalError::FATAL:
      case GlobalError::ERROR: out << "\033[1;31m"; break;
      case GlobalError::WARNING: out << "\033[1;33m"; break;
      case GlobalError::NOTICE: out << "\033[33m"; break;
      case GlobalError::DEBUG: break;
      }
   }

   switch (i.Type)
   {
   case GlobalError::FATAL:
   case GlobalError::ERROR: out << "E: "; break;
   case GlobalError::WARNING: out << "W: "; break;
   case GlobalError::NOTICE: out << "N: "; break;
   case GlobalError::DEBUG: out << "D: "; break;
   }

   if (use_color && i.Type != GlobalError::DEBUG)
      out << "\033[0m";

   // continuation lines are indented below the severity marker
   std::string::size_type start = 0;
   std::string::size_type end;
   while ((end = i.Text.find('\n', start)) != std::string::npos)
   {
      out << i.Text.substr(start, end - start) << std::endl << "   ";
      start = end + 1;
   }
   out << i.Text.substr(start);
   return out;
}
									/*}}}*/
