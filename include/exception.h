
#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <string>
#include "globalsdef.h"

using namespace std;


/* Thrown for anything that ends the current invocation. The exit code
   travels with the message so main() can report the failure class. */
class CBException : public std::exception {
    string message;
    int code;

public:
    CBException(string msg, int exitCode = EXIT_GENERAL) : message(msg), code(exitCode) {}

    string detail() const { return message; }
    int exitCode() const { return code; }
    const char* what() const noexcept override { return message.c_str(); }
};


#endif

