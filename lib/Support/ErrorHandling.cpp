//===-- ErrorHandling.cpp -------------------------------------------------===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#include "tacsym/Support/ErrorHandling.h"

#include "llvm/Support/raw_ostream.h"

#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <set>
#include <string>
#include <utility>

using namespace tacsym;
using namespace llvm;

FILE *tacsym::tacsym_warning_file = nullptr;
FILE *tacsym::tacsym_message_file = nullptr;

static const char *warningPrefix = "WARNING";
static const char *warningOncePrefix = "WARNING ONCE";
static const char *errorPrefix = "ERROR";
static const char *notePrefix = "NOTE";

static bool shouldSetColor(const char *pfx, const char *msg,
                           const char *prefixToSearchFor) {
  if (pfx && strcmp(pfx, prefixToSearchFor) == 0)
    return true;

  if (llvm::StringRef(msg).startswith(prefixToSearchFor))
    return true;

  return false;
}

static void tacsym_vfmessage(FILE *fp, const char *pfx, const char *msg,
                             va_list ap) {
  if (!fp)
    return;

  llvm::raw_fd_ostream fdos(fileno(fp), /*shouldClose=*/false,
                            /*unbuffered=*/true);
  bool modifyConsoleColor = fdos.is_displayed() && (fp == stderr);

  if (modifyConsoleColor) {

    // Warnings
    if (shouldSetColor(pfx, msg, warningPrefix))
      fdos.changeColor(llvm::raw_ostream::MAGENTA,
                       /*bold=*/false,
                       /*bg=*/false);

    // Warning once
    if (shouldSetColor(pfx, msg, warningOncePrefix))
      fdos.changeColor(llvm::raw_ostream::MAGENTA,
                       /*bold=*/true,
                       /*bg=*/false);

    // Errors
    if (shouldSetColor(pfx, msg, errorPrefix))
      fdos.changeColor(llvm::raw_ostream::RED,
                       /*bold=*/true,
                       /*bg=*/false);

    // Notes
    if (shouldSetColor(pfx, msg, notePrefix))
      fdos.changeColor(llvm::raw_ostream::WHITE,
                       /*bold=*/true,
                       /*bg=*/false);
  }

  fdos << "TACSym: ";
  if (pfx)
    fdos << pfx << ": ";

  // The variable arguments go through vfprintf, so flush first.
  fdos.flush();
  vfprintf(fp, msg, ap);
  fflush(fp);

  fdos << "\n";

  if (modifyConsoleColor)
    fdos.resetColor();

  fdos.flush();
}

/* Prints a message/warning.

   If pfx is nullptr, this is a regular message, and it's sent to
   tacsym_message_file (and stderr unless onlyToFile).

   Otherwise, pfx is a prefix (e.g. "WARNING") and the message goes to
   tacsym_warning_file and stderr.
*/
static void tacsym_vmessage(const char *pfx, bool onlyToFile, const char *msg,
                            va_list ap) {
  if (!onlyToFile) {
    va_list ap2;
    va_copy(ap2, ap);
    tacsym_vfmessage(stderr, pfx, msg, ap2);
    va_end(ap2);
  }

  tacsym_vfmessage(pfx ? tacsym_warning_file : tacsym_message_file, pfx, msg,
                   ap);
}

void tacsym::tacsym_message(const char *msg, ...) {
  va_list ap;
  va_start(ap, msg);
  tacsym_vmessage(nullptr, false, msg, ap);
  va_end(ap);
}

/* Message to be written only to file */
void tacsym::tacsym_message_to_file(const char *msg, ...) {
  va_list ap;
  va_start(ap, msg);
  tacsym_vmessage(nullptr, true, msg, ap);
  va_end(ap);
}

void tacsym::tacsym_error(const char *msg, ...) {
  va_list ap;
  va_start(ap, msg);
  tacsym_vmessage(errorPrefix, false, msg, ap);
  va_end(ap);
  exit(1);
}

void tacsym::tacsym_warning(const char *msg, ...) {
  va_list ap;
  va_start(ap, msg);
  tacsym_vmessage(warningPrefix, false, msg, ap);
  va_end(ap);
}

/* Prints a warning once per message. */
void tacsym::tacsym_warning_once(const void *id, const char *msg, ...) {
  static std::set<std::pair<const void *, std::string> > keys;

  // The formatted message is part of the key, so one statement can report
  // distinct problems.
  va_list ap;
  va_start(ap, msg);
  va_list ap2;
  va_copy(ap2, ap);
  char buf[1024];
  vsnprintf(buf, sizeof(buf), msg, ap2);
  va_end(ap2);

  if (keys.insert(std::make_pair(id, std::string(buf))).second)
    tacsym_vmessage(warningOncePrefix, false, msg, ap);
  va_end(ap);
}
