#include <string.h>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "ljson_check.h"

namespace ljson {

static void PrintUsage( FILE *err, const char *argv0 )
{
	fprintf( err,
		"Usage:\n"
		"%s [--quiet] [<path>...]\n"
		"    Check each JSON file for errors and repeated object keys.\n"
		"    With no path, or a path of '-', read standard input.\n"
		"%s --help\n"
		"%s -h\n"
		"    Print this help message.\n",
		argv0, argv0, argv0 );
}

int ReportDuplicateKeys( FILE *err, const char *name, const Value &val )
{
	int count = 0;
	if ( val.IsObject() )
	{
		for ( const ObjectItem &item: val.AsObject() )
		{
			for ( int line: item.duplicate_lines )
			{
				fprintf( err, "%s(%d): warning: duplicate key \"%s\" ignored (first value on line %d)\n",
					name, line, item.key.c_str(), item.value.Line() );
				++count;
			}
			count += ReportDuplicateKeys( err, name, item.value );
		}
	}
	else if ( val.IsArray() )
	{
		for ( const Value &x: val.AsArray() )
			count += ReportDuplicateKeys( err, name, x );
	}
	return count;
}

bool CheckStream( FILE *out, FILE *err, const char *name, std::istream &in, bool quiet )
{
	ParseContext ctx;
	Value doc;
	if ( !doc.ParseJSON( in, &ctx ) )
	{
		fprintf( err, "%s(%d): error: %s\n", name, ctx.error_line, ctx.error_message.c_str() );
		return false;
	}

	int warnings = ReportDuplicateKeys( err, name, doc );
	if ( quiet )
		return true;

	const char *type_name = ValueTypeName( doc.Type() );
	if ( doc.IsObject() )
		fprintf( out, "%s: OK (%s, %d entries", name, type_name, doc.ObjectLen() );
	else if ( doc.IsArray() )
		fprintf( out, "%s: OK (%s, %d entries", name, type_name, doc.ArrayLen() );
	else
		fprintf( out, "%s: OK (%s", name, type_name );
	if ( warnings > 0 )
		fprintf( out, ", %d duplicate key%s", warnings, warnings == 1 ? "" : "s" );
	fprintf( out, ")\n" );
	return true;
}

int RunCheck( int argc, char **argv, FILE *out, FILE *err )
{
	bool quiet = false;
	std::vector<std::string> paths;
	for ( int i = 1 ; i < argc ; ++i )
	{
		if ( !strcmp( argv[i], "--help" ) || !strcmp( argv[i], "-h" ) )
		{
			PrintUsage( err, argv[0] );
			return 0;
		}
		if ( !strcmp( argv[i], "--quiet" ) || !strcmp( argv[i], "-q" ) )
		{
			quiet = true;
			continue;
		}
		if ( argv[i][0] == '-' && argv[i][1] != '\0' )
		{
			fprintf( err, "invalid argument: %s\n", argv[i] );
			PrintUsage( err, argv[0] );
			return 2;
		}
		paths.push_back( argv[i] );
	}
	if ( paths.empty() )
		paths.push_back( "-" );

	bool all_ok = true;
	for ( const std::string &path: paths )
	{
		if ( path == "-" )
		{
			if ( !CheckStream( out, err, "<stdin>", std::cin, quiet ) )
				all_ok = false;
			continue;
		}

		std::ifstream in( path, std::ios::binary );
		if ( !in )
		{
			fprintf( err, "%s: error: cannot open file\n", path.c_str() );
			all_ok = false;
			continue;
		}
		if ( !CheckStream( out, err, path.c_str(), in, quiet ) )
			all_ok = false;
	}

	return all_ok ? 0 : 1;
}

} // namespace ljson
