#include "../tools/ljson_check.h"

#include <stdio.h>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

// Somewhere for the checker to write, that we can read back
struct CapturedFile
{
	CapturedFile() : f( tmpfile() ) {}
	~CapturedFile() { if ( f ) fclose( f ); }

	std::string Text()
	{
		std::string result;
		if ( !f )
			return result;
		fflush( f );
		rewind( f );
		char buf[ 256 ];
		size_t n;
		while ( ( n = fread( buf, 1, sizeof(buf), f ) ) > 0 )
			result.append( buf, n );
		return result;
	}

	FILE *f;
};

static std::string WriteTempFile( const char *name, const std::string &contents )
{
	std::string path = testing::TempDir() + name;
	std::ofstream f( path, std::ios::binary );
	f << contents;
	return path;
}

static int Run( std::vector<std::string> args, CapturedFile &out, CapturedFile &err )
{
	args.insert( args.begin(), "ljson_check" );
	std::vector<char *> argv;
	for ( std::string &a: args )
		argv.push_back( &a[0] );
	argv.push_back( nullptr );
	return ljson::RunCheck( (int)args.size(), argv.data(), out.f, err.f );
}

// "a" repeats at the top level, "c" inside a nested object
static const char k_duplicates[] = "{\"a\":1,\n\"b\":{\"c\":2,\"c\":3},\n\"a\":4}";

TEST(CheckTool, NestedDuplicateKeys) {
	CapturedFile out, err;
	ASSERT_NE( out.f, nullptr );
	ASSERT_NE( err.f, nullptr );

	std::istringstream in( k_duplicates );
	EXPECT_TRUE( ljson::CheckStream( out.f, err.f, "doc.json", in, false ) );
	EXPECT_EQ( err.Text(),
		"doc.json(3): warning: duplicate key \"a\" ignored (first value on line 1)\n"
		"doc.json(2): warning: duplicate key \"c\" ignored (first value on line 2)\n" );
	EXPECT_EQ( out.Text(), "doc.json: OK (object, 2 entries, 2 duplicate keys)\n" );

	ljson::Value doc;
	ASSERT_TRUE( doc.ParseJSON( k_duplicates ) );
	CapturedFile count_err;
	ASSERT_NE( count_err.f, nullptr );
	EXPECT_EQ( ljson::ReportDuplicateKeys( count_err.f, "doc.json", doc ), 2 );

	// Duplicates inside arrays are found too
	ASSERT_TRUE( doc.ParseJSON( "[ 1, [ {\"x\":1,\"x\":2} ] ]" ) );
	EXPECT_EQ( ljson::ReportDuplicateKeys( count_err.f, "doc.json", doc ), 1 );
}

TEST(CheckTool, Summary) {
	CapturedFile out, err;
	ASSERT_NE( out.f, nullptr );
	ASSERT_NE( err.f, nullptr );

	std::istringstream num( "42" ), arr( "[1, [2]]" ), one_dup( "{\"x\": 1, \"x\": 2}" );
	EXPECT_TRUE( ljson::CheckStream( out.f, err.f, "num.json", num, false ) );
	EXPECT_TRUE( ljson::CheckStream( out.f, err.f, "arr.json", arr, false ) );
	EXPECT_TRUE( ljson::CheckStream( out.f, err.f, "one.json", one_dup, false ) );
	EXPECT_EQ( out.Text(),
		"num.json: OK (number)\n"
		"arr.json: OK (array, 2 entries)\n"
		"one.json: OK (object, 1 entries, 1 duplicate key)\n" );
}

// Quiet turns off the summary, but not warnings or errors
TEST(CheckTool, Quiet) {
	CapturedFile out, err;
	ASSERT_NE( out.f, nullptr );
	ASSERT_NE( err.f, nullptr );

	std::istringstream in( k_duplicates );
	EXPECT_TRUE( ljson::CheckStream( out.f, err.f, "doc.json", in, true ) );
	EXPECT_EQ( out.Text(), "" );
	EXPECT_NE( err.Text().find( "warning: duplicate key \"c\"" ), std::string::npos );
}

TEST(CheckTool, ParseError) {
	CapturedFile out, err;
	ASSERT_NE( out.f, nullptr );
	ASSERT_NE( err.f, nullptr );

	std::istringstream in( "{\n\"a\" 1}" );
	EXPECT_FALSE( ljson::CheckStream( out.f, err.f, "bad.json", in, false ) );
	EXPECT_EQ( err.Text(), "bad.json(2): error: Expected ':' but found '1' (0x31) instead\n" );
	EXPECT_EQ( out.Text(), "" );
}

TEST(CheckTool, ExitCodes) {
	const std::string good = WriteTempFile( "ljson_check_good.json", k_duplicates );
	const std::string bad = WriteTempFile( "ljson_check_bad.json", "[1,]" );
	const std::string missing = testing::TempDir() + "ljson_check_no_such_file.json";

	{
		CapturedFile out, err;
		ASSERT_NE( out.f, nullptr );
		ASSERT_NE( err.f, nullptr );
		EXPECT_EQ( ::Run( { good }, out, err ), 0 );
		EXPECT_EQ( out.Text(), good + ": OK (object, 2 entries, 2 duplicate keys)\n" );
	}
	{
		CapturedFile out, err;
		ASSERT_NE( out.f, nullptr );
		ASSERT_NE( err.f, nullptr );
		EXPECT_EQ( ::Run( { "-q", good }, out, err ), 0 );
		EXPECT_EQ( out.Text(), "" );
	}
	{
		CapturedFile out, err;
		ASSERT_NE( out.f, nullptr );
		ASSERT_NE( err.f, nullptr );
		EXPECT_EQ( ::Run( { good, bad }, out, err ), 1 );
		EXPECT_NE( err.Text().find( bad + "(1): error:" ), std::string::npos );
	}
	{
		CapturedFile out, err;
		ASSERT_NE( out.f, nullptr );
		ASSERT_NE( err.f, nullptr );
		EXPECT_EQ( ::Run( { missing }, out, err ), 1 );
		EXPECT_EQ( err.Text(), missing + ": error: cannot open file\n" );
	}
	{
		CapturedFile out, err;
		ASSERT_NE( out.f, nullptr );
		ASSERT_NE( err.f, nullptr );
		EXPECT_EQ( ::Run( { "--bogus", good }, out, err ), 2 );
		EXPECT_EQ( err.Text().find( "invalid argument: --bogus\n" ), 0u );
		EXPECT_EQ( out.Text(), "" );
	}
	{
		CapturedFile out, err;
		ASSERT_NE( out.f, nullptr );
		ASSERT_NE( err.f, nullptr );
		EXPECT_EQ( ::Run( { "--help" }, out, err ), 0 );
		EXPECT_EQ( err.Text().find( "Usage:" ), 0u );
	}
}
