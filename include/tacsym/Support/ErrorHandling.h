//===-- ErrorHandling.h -----------------------------------------*- C++ -*-===//
//
//                     The TACSym Symbolic Execution Engine
//
// This file is distributed under the University of Illinois Open Source
// License. See LICENSE.TXT for details.
//
//===----------------------------------------------------------------------===//

#ifndef TACSYM_ERRORHANDLING_H
#define TACSYM_ERRORHANDLING_H

#include <stdio.h>

namespace tacsym {

extern FILE *tacsym_warning_file;
extern FILE *tacsym_message_file;

/// Print "TACSym: ERROR: " followed by the msg in printf format and a
/// newline on stderr and to the warning file, then exit with an error.
void tacsym_error(const char *msg, ...)
    __attribute__((format(printf, 1, 2), noreturn));

/// Print "TACSym: " followed by the msg in printf format and a
/// newline on stderr and to the message file.
void tacsym_message(const char *msg, ...) __attribute__((format(printf, 1, 2)));

/// Print "TACSym: " followed by the msg in printf format and a
/// newline to the message file only.
void tacsym_message_to_file(const char *msg, ...)
    __attribute__((format(printf, 1, 2)));

/// Print "TACSym: WARNING: " followed by the msg in printf format and a
/// newline on stderr and to the warning file.
void tacsym_warning(const char *msg, ...) __attribute__((format(printf, 1, 2)));

/// Print "TACSym: WARNING: " followed by the msg in printf format and a
/// newline on stderr and to the warning file. However, the warning is only
/// printed once for each unique (id, msg) pair (as pointers).
void tacsym_warning_once(const void *id, const char *msg, ...)
    __attribute__((format(printf, 2, 3)));
}

#ifdef TACSYM_ENABLE_LOG_STEPS
    #define LOG_STEPS(...) tacsym_message(__VA_ARGS__)
#else
    #define LOG_STEPS(...)
#endif

#ifdef TACSYM_ENABLE_LOG_SOLVER_TIME
    #define LOG_SOLVER_TIME(...) tacsym_message(__VA_ARGS__)
#else
    #define LOG_SOLVER_TIME(...)
#endif

#endif /* TACSYM_ERRORHANDLING_H */
