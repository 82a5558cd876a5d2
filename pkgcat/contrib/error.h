// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Message stack shared by library and front-end

   Every fallible operation returns a bool (or a null pointer) and leaves
   a message on this stack explaining what went wrong. The message
   generators always return false so the usual idiom is
     if (Matcher == nullptr)
        return _error->Error(_("Unable to parse pattern %s"), P.c_str());

   Warnings and notices do not make an operation fail, they are collected
   and shown to the user together with the errors once the command is
   finished. Messages are stored in a FIFO.

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_ERROR_H
#define PKGCAT_ERROR_H

#include <pkgcat/macros.h>

#include <iostream>
#include <list>
#include <string>

#include <cstdarg>
#include <cstddef>

class PKGCAT_PUBLIC GlobalError						/*{{{*/
{
public:									/*{{{*/
	/** \brief a message can have one of following severity */
	enum MsgType {
		/** \brief printed instantly in addition to being queued */
		FATAL = 40,
		/** \brief the operation failed */
		ERROR = 30,
		/** \brief unexpected, but the operation could continue */
		WARNING = 20,
		/** \brief deprecations, ignored settings, … */
		NOTICE = 10,
		/** \brief developer traces, printed instantly */
		DEBUG = 0
	};

	/** \brief add an Error message with the current errno to the list
	 *
	 *  \param Function name of the failed system call
	 *  \param Description format string for the error message
	 *
	 *  \return \b false
	 */
	bool Errno(const char *Function,const char *Description,...) PKGCAT_PRINTF(3) PKGCAT_COLD;
	bool WarningE(const char *Function,const char *Description,...) PKGCAT_PRINTF(3) PKGCAT_COLD;

	bool Fatal(const char *Description,...) PKGCAT_PRINTF(2) PKGCAT_COLD;
	bool Error(const char *Description,...) PKGCAT_PRINTF(2) PKGCAT_COLD;
	bool Warning(const char *Description,...) PKGCAT_PRINTF(2) PKGCAT_COLD;
	bool Notice(const char *Description,...) PKGCAT_PRINTF(2) PKGCAT_COLD;
	bool Debug(const char *Description,...) PKGCAT_PRINTF(2) PKGCAT_COLD;

	/** \brief adds a message with the given type
	 *
	 * \param type of the message
	 * \param Description format string for the message
	 *
	 * \return \b false
	 */
	bool Insert(MsgType const &type, const char* Description,...) PKGCAT_PRINTF(3) PKGCAT_COLD;

	/** \brief is an error in the list? */
	inline bool PendingError() const PKGCAT_PURE {return PendingFlag;};

	/** \brief is the list free of messages at or above \b threshold? */
	bool empty(MsgType const &threshold = WARNING) const PKGCAT_PURE;

	/** \brief returns and removes the first message in the list
	 *
	 *  \param[out] Text message of the first item
	 *
	 *  \return \b true if the message was an error, \b false otherwise
	 */
	bool PopMessage(std::string &Text);

	/** \brief clears the list of messages */
	void Discard();

	/** \brief outputs and discards the messages
	 *
	 *  \param[out] out output stream to write the messages in
	 *  \param threshold minimum level printed
	 *  \param mergeStack if true recursively dumps the entire stack
	 */
	void DumpErrors(std::ostream &out, MsgType const &threshold = WARNING,
			bool const &mergeStack = true);
	void inline DumpErrors(MsgType const &threshold) {
		DumpErrors(std::cerr, threshold);
	}
	void inline DumpErrors() {
		DumpErrors(WARNING);
	}

	/** \brief put the current messages aside
	 *
	 *  Until the next RevertToStack or MergeWithStack the list behaves
	 *  as if no message was ever added.
	 */
	void PushToStack();

	/** \brief throw away all current messages and restore the stacked ones */
	void RevertToStack();

	/** \brief merge current and stacked messages together */
	void MergeWithStack();

	size_t StackCount() const PKGCAT_PURE {
		return Stacks.size();
	}

	GlobalError();
									/*}}}*/
private:								/*{{{*/
	struct Item {
		std::string Text;
		MsgType Type;

		Item(std::string &&Text, MsgType const &Type) :
			Text(std::move(Text)), Type(Type) {};

		PKGCAT_HIDDEN friend std::ostream &operator<<(std::ostream &out, Item const &i);
	};

	PKGCAT_HIDDEN friend std::ostream &operator<<(std::ostream &out, Item const &i);

	std::list<Item> Messages;
	bool PendingFlag;

	struct MsgStack {
		std::list<Item> Messages;
		bool const PendingFlag;

		MsgStack(std::list<Item> const &Messages, bool const &Pending) :
			 Messages(Messages), PendingFlag(Pending) {};
	};

	std::list<MsgStack> Stacks;

	PKGCAT_HIDDEN bool Add(MsgType type, std::string &&Text);
	PKGCAT_HIDDEN bool AddV(MsgType type, const char *Description, va_list &args);
									/*}}}*/
};
									/*}}}*/

PKGCAT_PUBLIC GlobalError *_GetErrorObj();
static struct {
	inline GlobalError* operator ->() { return _GetErrorObj(); }
} _error PKGCAT_UNUSED;

#endif
