// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Error stack shared by every build step

   Each thread owns one instance reached through _error. A step that
   fails pushes a message describing the problem and returns false,
   its caller unwinds by returning false as well, and whoever drives
   the build decides how to present the collected messages:

     if (mkdir(...) != 0)
        return _error->Errno("mkdir", "Unable to create %s", Dir.c_str());

   All generator functions return false so they can be used directly
   in a return statement. Messages below ERROR never make
   PendingError() true, a warning does not fail a build.

   ##################################################################### */
									/*}}}*/
#ifndef GIFTWRAP_ERROR_H
#define GIFTWRAP_ERROR_H

#include <giftwrap-pkg/macros.h>

#include <iostream>
#include <list>
#include <string>

#include <cstdarg>
#include <cstddef>

class GIFTWRAP_PUBLIC GlobalError					/*{{{*/
{
public:									/*{{{*/
	/** \brief a message can have one of following severity */
	enum MsgType {
		/** \brief printed instantly in addition to being stored */
		FATAL = 40,
		/** \brief the current operation can not complete */
		ERROR = 30,
		/** \brief the operation completed, but maybe not as expected */
		WARNING = 20,
		/** \brief informational, e.g. an optional tool is missing */
		NOTICE = 10,
		/** \brief for developers only, printed instantly as well */
		DEBUG = 0
	};

	/** \brief add a message with the errno description appended
	 *
	 *  \param Function name of the system call which failed
	 *  \param Description format string for the error message
	 *
	 *  \return \b false
	 */
	bool Errno(const char *Function,const char *Description,...) GIFTWRAP_PRINTF(3) GIFTWRAP_COLD;
	bool FatalE(const char *Function,const char *Description,...) GIFTWRAP_PRINTF(3) GIFTWRAP_COLD;
	bool WarningE(const char *Function,const char *Description,...) GIFTWRAP_PRINTF(3) GIFTWRAP_COLD;
	bool NoticeE(const char *Function,const char *Description,...) GIFTWRAP_PRINTF(3) GIFTWRAP_COLD;
	bool DebugE(const char *Function,const char *Description,...) GIFTWRAP_PRINTF(3) GIFTWRAP_COLD;

	/** \brief add a message of the given type with errno appended */
	bool InsertErrno(MsgType const &type, const char* Function,
			 const char* Description,...) GIFTWRAP_PRINTF(4) GIFTWRAP_COLD;

	bool Fatal(const char *Description,...) GIFTWRAP_PRINTF(2) GIFTWRAP_COLD;
	bool Error(const char *Description,...) GIFTWRAP_PRINTF(2) GIFTWRAP_COLD;
	bool Warning(const char *Description,...) GIFTWRAP_PRINTF(2) GIFTWRAP_COLD;
	bool Notice(const char *Description,...) GIFTWRAP_PRINTF(2) GIFTWRAP_COLD;
	bool Debug(const char *Description,...) GIFTWRAP_PRINTF(2) GIFTWRAP_COLD;

	/** \brief add a message of the given type to the list */
	bool Insert(MsgType const &type, const char* Description,...) GIFTWRAP_PRINTF(3) GIFTWRAP_COLD;

	/** \brief is an ERROR or FATAL message in the list? */
	inline bool PendingError() const GIFTWRAP_PURE {return PendingFlag;};

	/** \brief does the current stack level lack messages at or above
	 *  the given threshold?
	 */
	bool empty(MsgType const &threshold = WARNING) const GIFTWRAP_PURE;

	/** \brief removes the oldest message from the list
	 *
	 *  \param[out] Text message of the removed item
	 *
	 *  \return \b true if the message was an error, \b false otherwise
	 */
	bool PopMessage(std::string &Text);

	/** \brief clears the list of messages */
	void Discard();

	/** \brief writes all messages at or above threshold to out
	 *
	 *  The list is discarded afterwards, displayed or not.
	 *
	 *  \param mergeStack if true the stacked levels are dumped as well
	 */
	void DumpErrors(std::ostream &out, MsgType const &threshold = WARNING,
			bool const &mergeStack = true);
	void inline DumpErrors(MsgType const &threshold = WARNING) {
		DumpErrors(std::cerr, threshold);
	}

	/** \brief park the current messages on a stack
	 *
	 *  Afterwards the list behaves as if it were empty. Only the
	 *  topmost level is affected by the other operations.
	 */
	void PushToStack();

	/** \brief throw away the current messages and restore the parked ones */
	void RevertToStack();

	/** \brief restore the parked messages ahead of the current ones */
	void MergeWithStack();

	size_t StackCount() const GIFTWRAP_PURE {
		return Stacks.size();
	}

	GlobalError();
									/*}}}*/
private:								/*{{{*/
	struct Item {
		std::string Text;
		MsgType Type;

		Item(std::string Text, MsgType const &Type) :
			Text(std::move(Text)), Type(Type) {};

		GIFTWRAP_HIDDEN friend std::ostream &operator<<(std::ostream &out, Item const &i);
	};

	GIFTWRAP_HIDDEN friend std::ostream &operator<<(std::ostream &out, Item const &i);

	std::list<Item> Messages;
	bool PendingFlag;

	struct MsgStack {
		std::list<Item> Messages;
		bool const PendingFlag;

		MsgStack(std::list<Item> const &Messages, bool const &Pending) :
			 Messages(Messages), PendingFlag(Pending) {};
	};

	std::list<MsgStack> Stacks;

	GIFTWRAP_HIDDEN bool InsertV(MsgType type, std::string Suffix,
				     const char *Description, va_list &args);
									/*}}}*/
};
									/*}}}*/

// The 'extra-ansi' syntax is used to help with collisions.
GIFTWRAP_PUBLIC GlobalError *_GetErrorObj();
static struct {
	inline GlobalError* operator ->() { return _GetErrorObj(); }
} _error GIFTWRAP_UNUSED;

#endif
