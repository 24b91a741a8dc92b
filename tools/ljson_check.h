/////////////////////////////////////////////////////////////////////////////
//
// ljson_check: parse JSON files, report the first error in each one, and
// warn about object keys that were defined more than once.
//
// Everything but main() lives here so it can be driven from the tests.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef LJSON_CHECK_H_INCLUDED
#define LJSON_CHECK_H_INCLUDED

#include <stdio.h>
#include <iosfwd>

#include "../ljson.h"

namespace ljson {

// Print a warning to err for every repeated key anywhere in the tree.
// Returns the number of warnings
int ReportDuplicateKeys( FILE *err, const char *name, const Value &val );

// Parse one input. Errors and warnings go to err, the "OK" summary goes to
// out unless quiet is set. Returns false if the input is not valid JSON
bool CheckStream( FILE *out, FILE *err, const char *name, std::istream &in, bool quiet );

// The whole command line tool. Returns the process exit code: 0 if every
// input is valid, 1 if any is not, 2 for bad arguments
int RunCheck( int argc, char **argv, FILE *out, FILE *err );

} // namespace ljson

#endif // _H
