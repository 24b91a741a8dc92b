/////////////////////////////////////////////////////////////////////////////
//
// ljson is a strict JSON parser and read-only DOM with line tracking.
//
// This file has internals and stuff that don't belong in a header.
// To *use* ljson, you should only need to read the header.
//
/////////////////////////////////////////////////////////////////////////////

#include <errno.h>
#include <locale.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

#include <istream>
#include <iterator>
#include <map>

#include "ljson.h"

namespace ljson {

// It really seems like C++ ought to make this easier, right?
// NOTE: Parens, not braces. RawArray{ other_array } would pick the
// initializer_list constructor and wrap the copy in a one-element array.
template <typename T> void InvokeDestructor( T &x ) { x.~T(); }
template <typename T, typename A> void InvokeConstructor( T &x, A&& a ) { new (&x) T( std::forward<A>( a ) ); }
template <typename T> void InvokeConstructor( T &x) { new (&x) T{}; }

const Object &GetStaticEmptyObject()
{
	static Object dummy;
	LJSON_ASSERT( dummy.ObjectSize() == 0 );
	return dummy;
}
const Array &GetStaticEmptyArray()
{
	static Array dummy;
	LJSON_ASSERT( dummy.ArraySize() == 0 );
	return dummy;
}
const Value &GetStaticNullValue()
{
	static Value dummy; // note that default constructor sets to null
	LJSON_ASSERT( dummy.IsNull() );
	return dummy;
}
const DuplicateLines &GetStaticEmptyDuplicateLines()
{
	static DuplicateLines dummy;
	return dummy;
}

const char *ValueTypeName( EValueType t )
{
	switch ( t )
	{
		case kNull: return "null";
		case kObject: return "object";
		case kArray: return "array";
		case kString: return "string";
		case kNumber: return "number";
		case kBool: return "bool";
		default: break;
	}
	return "???";
}

/////////////////////////////////////////////////////////////////////////////
//
// DOM
//
/////////////////////////////////////////////////////////////////////////////

void Value::InternalDestruct()
{
	if ( _type == kObject )
		InvokeDestructor( _object );
	else if ( _type == kArray )
		InvokeDestructor( _array );
	else if ( _type == kString )
		InvokeDestructor( _string );
	_type = kDeleted; // Not necessary, but helps to catch bugs
}

void Value::InternalConstruct( const Value &x )
{
	_type = x._type;
	_integer = x._integer;
	_line = x._line;
	if ( _type == kObject )
		InvokeConstructor( _object, x._object );
	else if ( _type == kArray )
		InvokeConstructor( _array, x._array );
	else if ( _type == kString )
		InvokeConstructor( _string, x._string );
	else
		_dummy = x._dummy; // Some other primitive -- just copy 8 bytes
	static_assert( sizeof(_dummy) >= sizeof(_double) && sizeof(_dummy) >= sizeof(_int), "_dummy must be as big as all primitives" );
}

void Value::InternalConstruct( Value &&x )
{
	_type = x._type;
	_integer = x._integer;
	_line = x._line;
	if ( _type == kObject )
		InvokeConstructor( _object, std::move( x._object ) );
	else if ( _type == kArray )
		InvokeConstructor( _array, std::move( x._array ) );
	else if ( _type == kString )
		InvokeConstructor( _string, std::move( x._string ) );
	else
		_dummy = x._dummy; // Some other primitive -- just copy 8 bytes
}

Value::Value( EValueType type ) : _type( type ), _integer( false ), _line( 0 )
{
	if ( _type == kObject )
		InvokeConstructor( _object );
	else if ( _type == kArray )
		InvokeConstructor( _array );
	else if ( _type == kString )
		InvokeConstructor( _string );
	else
	{
		// Here we assume that a zero integer is all zeros, so that the bool value will be false.
		_int = 0;
		_integer = ( _type == kNumber );
	}
}

Value::Value( const char *x ) : _type( kString ), _integer( false ), _line( 0 ), _string( x ) {}
Value::Value( const std::string &x ) : _type( kString ), _integer( false ), _line( 0 ), _string( x ) {}
Value::Value( std::string &&x ) : _type( kString ), _integer( false ), _line( 0 ), _string( std::move( x ) ) {}
Value::Value( const RawObject & x ) : _type( kObject ), _integer( false ), _line( 0 ), _object( x ) {}
Value::Value( RawObject &&      x ) : _type( kObject ), _integer( false ), _line( 0 ), _object( std::move( x ) ) {}
Value::Value( const RawArray &  x ) : _type( kArray ), _integer( false ), _line( 0 ), _array( x ) {}
Value::Value( RawArray &&       x ) : _type( kArray ), _integer( false ), _line( 0 ), _array( std::move( x ) ) {}

Value &Value::operator=( const Value &x )
{
	if ( this == &x )
		return *this;
	if ( _type == x._type )
	{
		if ( _type == kObject )
			_object = x._object;
		else if ( _type == kArray )
			_array = x._array;
		else if ( _type == kString )
			_string = x._string;
		else
			_dummy = x._dummy; // Some other primitive -- just copy 8 bytes
		_integer = x._integer;
		_line = x._line;
	}
	else
	{
		InternalDestruct();
		InternalConstruct(x);
	}
	return *this;
}

Value &Value::operator=( Value &&x )
{
	if ( this == &x )
		return *this;
	if ( _type == x._type )
	{
		if ( _type == kObject )
			_object = std::move( x._object );
		else if ( _type == kArray )
			_array = std::move( x._array );
		else if ( _type == kString )
			_string = std::move( x._string );
		else
			_dummy = x._dummy; // Some other primitive -- just copy 8 bytes
		_integer = x._integer;
		_line = x._line;
	}
	else
	{
		InternalDestruct();
		InternalConstruct( std::move( x ) );
	}
	return *this;
}

// Linear search. Objects in configuration-sized documents are small, and
// we need document order anyway.
template <typename K>
static const ObjectItem *FindItem( const RawObject &obj, const K &key )
{
	for ( const ObjectItem &item: obj )
	{
		if ( item.key == key )
			return &item;
	}
	return nullptr;
}

const Value *Value::ValuePtrAtKey( const std::string &key ) const
{
	if ( _type != kObject )
		return nullptr;
	const ObjectItem *item = FindItem( _object, key );
	return item ? &item->value : nullptr;
}

const Value *Value::ValuePtrAtKey( const char *key ) const
{
	if ( _type != kObject )
		return nullptr;
	const ObjectItem *item = FindItem( _object, key );
	return item ? &item->value : nullptr;
}

const DuplicateLines &Value::DuplicateLinesAtKey( const std::string &key ) const
{
	if ( _type != kObject )
		return GetStaticEmptyDuplicateLines();
	const ObjectItem *item = FindItem( _object, key );
	return item ? item->duplicate_lines : GetStaticEmptyDuplicateLines();
}

bool Value::operator==( const Value &x ) const
{
	if ( _type != x._type )
		return false;
	switch ( _type )
	{
		case kNull:
			return true;

		case kBool:
			return _bool == x._bool;

		case kNumber:
			if ( _integer != x._integer )
				return false;
			return _integer ? _int == x._int : _double == x._double;

		case kString:
			return _string == x._string;

		case kArray:
			return _array == x._array;

		case kObject:
			if ( _object.size() != x._object.size() )
				return false;
			for ( size_t i = 0 ; i < _object.size() ; ++i )
			{
				if ( _object[i].key != x._object[i].key || _object[i].value != x._object[i].value )
					return false;
			}
			return true;

		default:
			LJSON_ASSERT( false );
			break;
	}
	return false;
}

/////////////////////////////////////////////////////////////////////////////
//
// Parsing
//
/////////////////////////////////////////////////////////////////////////////

bool IsLegalValueStarter( int c, bool inside_object )
{
	if ( c == '\"' || c == '{' || c == '[' )
		return true;
	if ( !inside_object )
		return false;
	return ( c >= '0' && c <= '9' ) || c == 't' || c == 'f' || c == 'n';
}

// Check the text of a numeric literal against
// -?[0-9]*(\.[0-9]+)?([eE][-+]?[0-9]+)?
static bool IsNumericLiteral( const std::string &s )
{
	const char *p = s.c_str();
	const char *const e = p + s.length();
	if ( p < e && *p == '-' )
		++p;
	while ( p < e && *p >= '0' && *p <= '9' )
		++p;

	// Fraction needs at least one digit
	if ( p < e && *p == '.' )
	{
		++p;
		if ( p >= e || *p < '0' || *p > '9' )
			return false;
		while ( p < e && *p >= '0' && *p <= '9' )
			++p;
	}

	// Exponent, with optional sign
	if ( p < e && ( *p == 'e' || *p == 'E' ) )
	{
		++p;
		if ( p < e && ( *p == '-' || *p == '+' ) )
			++p;
		if ( p >= e || *p < '0' || *p > '9' )
			return false;
		while ( p < e && *p >= '0' && *p <= '9' )
			++p;
	}

	return p == e;
}

static void TrimWhitespace( std::string &s )
{
	static const char whitespace[] = " \t\r\n\f\v";
	size_t first = s.find_first_not_of( whitespace );
	if ( first == std::string::npos )
	{
		s.clear();
		return;
	}
	size_t last = s.find_last_not_of( whitespace );
	s = s.substr( first, last - first + 1 );
}

// Describe a character for an error message. Control characters and
// bytes outside of ASCII are only shown as hex, since printing a NUL with
// %c would end the message right there.
struct CharName
{
	explicit CharName( int c )
	{
		if ( c >= 0x20 && c < 0x7f )
			snprintf( buf, sizeof(buf), "'%c' (0x%02x)", c, c );
		else
			snprintf( buf, sizeof(buf), "character 0x%02x", c );
	}
	char buf[ 32 ];
};

// Copy of literal text that is safe to pass to %s. Anything not
// printable is written as \xNN
static std::string PrintableText( const std::string &text )
{
	std::string out;
	for ( char ch: text )
	{
		const unsigned char c = (unsigned char)ch;
		if ( c >= 0x20 && c < 0x7f )
		{
			out.push_back( ch );
		}
		else
		{
			char hex[ 8 ];
			snprintf( hex, sizeof(hex), "\\x%02x", c );
			out += hex;
		}
	}
	return out;
}

// Append a UTF-16 code unit as UTF-8. Surrogates are not paired up; each
// half is written out on its own.
static void AppendCodeUnit( std::string &out, unsigned x )
{
	LJSON_ASSERT( x <= 0xFFFF );
	if ( x <= 0x7F )
	{
		out.push_back( (char)x );
	}
	else if ( x <= 0x7FF )
	{
		out.push_back( (char)( (x >> 6) | 0xC0 ) );
		out.push_back( (char)( (x & 0x3F) | 0x80 ) );
	}
	else
	{
		out.push_back( (char)( (x >> 12) | 0xE0 ) );
		out.push_back( (char)( ((x >> 6) & 0x3F) | 0x80 ) );
		out.push_back( (char)( (x & 0x3F) | 0x80 ) );
	}
}

// Forward-only reader over the input. Never peeks and never backs up;
// every character is read exactly once.
struct Cursor
{
	Cursor( const char *b, const char *e ) : ptr( b ), end( e ) {}

	const char *ptr;
	const char *const end;

	int c = -1; // Current character, or -1 once we ran off the end
	bool exhausted = false;
	int line = 1;

	// Cleared while reading the body of a string, so spaces in it survive
	bool skip_spaces = true;

	// Read exactly one character, counting newlines
	inline void ReadChar()
	{
		if ( ptr >= end )
		{
			exhausted = true;
			c = -1;
			return;
		}
		c = (unsigned char)*(ptr++);
		if ( c == '\n' )
			++line;
	}

	// Move to the next character that means something. Carriage returns,
	// line feeds and tabs are always skipped. Spaces are skipped unless
	// we are inside a string.
	void Advance()
	{
		do
		{
			ReadChar();
		} while ( c == '\r' || c == '\n' || c == '\t' || ( c == ' ' && skip_spaces ) );
	}
};

struct Parser
{
	Parser( ParseContext &c, const char *b, const char *e )
	: ctx(c), cur(b, e)
	{
		ctx.error_line = 0;
		ctx.error_message.clear();

		// Prime the cursor with the first character
		cur.Advance();
	}

	ParseContext &ctx;
	Cursor cur;
	int depth = 0;

	void Error( int line, const char *msg )
	{
		ctx.error_line = line;
		ctx.error_message = msg;
	}

	void Errorf( int line, const char *fmt, ... )
	{
		char msg[ 256 ];
		va_list ap;
		va_start( ap, fmt );
		vsnprintf( msg, sizeof(msg), fmt, ap );
		va_end( ap );
		Error( line, msg );
	}

	// The current character isn't what the grammar needs here
	void ErrorExpected( const char *what )
	{
		if ( cur.exhausted )
			Errorf( cur.line, "Unexpected end-of-input; expected %s", what );
		else
			Errorf( cur.line, "Expected %s but found %s instead", what, CharName( cur.c ).buf );
	}

	// Strings, objects and arrays leave the cursor sitting on their closing
	// character. Numbers, bools and null stop on the delimiter after them.
	static bool EndsOnClosingCharacter( const Value &v )
	{
		return v._type == kString || v._type == kObject || v._type == kArray;
	}

	static bool IsDelimiter( int c )
	{
		return c == ',' || c == '}' || c == ']';
	}

	bool EnterContainer( int line )
	{
		if ( ++depth <= ctx.max_depth )
			return true;
		Errorf( line, "Objects and arrays nested more than %d deep", ctx.max_depth );
		return false;
	}

	// Parse the whole document. Only whitespace may follow the root value.
	bool ParseDocument( Value &out )
	{
		if ( !ReadValue( out ) )
			return false;
		if ( EndsOnClosingCharacter( out ) )
			cur.Advance();
		if ( cur.exhausted || ctx.allow_trailing_text )
			return true;
		Errorf( cur.line, "Extra text starting with %s", CharName( cur.c ).buf );
		return false;
	}

	// Pick a production based on the current character
	bool ReadValue( Value &out )
	{
		if ( cur.exhausted )
		{
			Error( cur.line, "Unexpected end-of-input; expected a value" );
			return false;
		}

		switch ( cur.c )
		{
			case '{':
				return ReadObject( out );

			case '[':
				return ReadArray( out );

			case '\"':
			{
				const int line = cur.line;
				std::string s;
				if ( !ReadString( s ) )
					return false;
				out = Value( std::move( s ) );
				out._line = line;
				return true;
			}

			case 't':
			case 'f':
			case 'n':
				return ReadBoolOrNull( out );
		}

		// Anything else had better be a number. If it isn't, the
		// number reader will complain.
		return ReadNumber( out );
	}

	bool ReadObject( Value &out )
	{
		LJSON_ASSERT( !cur.exhausted && cur.c == '{' );
		const int line = cur.line;
		if ( !EnterContainer( line ) )
			return false;

		Value obj( kObject );
		obj._line = line;
		RawObject &items = obj._object;

		// Key -> index into items, so we can spot repeats
		std::map<std::string, size_t> index;

		// Special case for empty object
		cur.Advance();
		if ( !cur.exhausted && cur.c == '}' )
		{
			--depth;
			out = std::move( obj );
			return true;
		}

		for (;;)
		{

			// Next character must be a quote character
			if ( cur.exhausted || cur.c != '\"' )
			{
				ErrorExpected( "'\"' to begin JSON object key" );
				return false;
			}

			std::string key;
			if ( !ReadString( key ) )
				return false;

			if ( !ReadColon( true ) )
				return false;

			Value val;
			if ( !ReadValue( val ) )
				return false;
			const bool on_closing_char = EndsOnClosingCharacter( val );

			// First one wins. For a repeat we only remember the line
			// we are on now, and the new value is dropped.
			auto it = index.find( key );
			if ( it != index.end() )
			{
				items[ it->second ].duplicate_lines.push_back( cur.line );
			}
			else
			{
				index.emplace( key, items.size() );
				items.push_back( ObjectItem{ std::move( key ), std::move( val ), DuplicateLines{} } );
			}

			if ( on_closing_char )
				cur.Advance();

			// Next thing must be a comma, or a brace to end the object
			if ( !cur.exhausted && cur.c == '}' )
				break;
			if ( cur.exhausted || cur.c != ',' )
			{
				ErrorExpected( "'}' or ','" );
				return false;
			}

			// Eat the comma. A key must follow, so "{ "a": 1, }" fails
			// on the next pass through the loop.
			cur.Advance();
		}

		--depth;
		out = std::move( obj );
		return true;
	}

	bool ReadArray( Value &out )
	{
		LJSON_ASSERT( !cur.exhausted && cur.c == '[' );
		const int line = cur.line;
		if ( !EnterContainer( line ) )
			return false;

		Value arr( kArray );
		arr._line = line;
		RawArray &elements = arr._array;

		// Special case for empty array
		cur.Advance();
		if ( !cur.exhausted && cur.c == ']' )
		{
			--depth;
			out = std::move( arr );
			return true;
		}

		for (;;)
		{
			Value val;
			if ( !ReadValue( val ) )
				return false;
			const bool on_closing_char = EndsOnClosingCharacter( val );
			elements.emplace_back( std::move( val ) );

			if ( on_closing_char )
				cur.Advance();
			if ( cur.exhausted || cur.c != ',' )
				break;
			cur.Advance();
		}

		if ( cur.exhausted || cur.c != ']' )
		{
			ErrorExpected( "']' or ','" );
			return false;
		}

		--depth;
		out = std::move( arr );
		return true;
	}

	// Read the ':' after an object key, and make sure that what comes next
	// can begin a value. Leaves the cursor on the first character of the value.
	bool ReadColon( bool inside_object )
	{
		cur.Advance();
		if ( cur.exhausted || cur.c != ':' )
		{
			ErrorExpected( "':'" );
			return false;
		}

		cur.Advance();
		if ( cur.exhausted )
		{
			ErrorExpected( "a value after ':'" );
			return false;
		}
		if ( !IsLegalValueStarter( cur.c, inside_object ) )
		{
			Errorf( cur.line, "Found %s after ':', which cannot begin a value", CharName( cur.c ).buf );
			return false;
		}
		return true;
	}

	// Cursor is on the opening quote. Leaves it on the closing quote.
	bool ReadString( std::string &out )
	{
		LJSON_ASSERT( !cur.exhausted && cur.c == '\"' );

		cur.skip_spaces = false;
		bool ok = true;
		for (;;)
		{
			cur.Advance();
			if ( cur.exhausted )
			{
				Error( cur.line, "Unterminated string" );
				ok = false;
				break;
			}

			// End of string?
			if ( cur.c == '\"' )
				break;

			if ( cur.c != '\\' )
				out.push_back( (char)cur.c );
			else if ( !ReadEscape( out ) )
			{
				ok = false;
				break;
			}
		}
		cur.skip_spaces = true;
		return ok;
	}

	// Cursor is on the backslash
	bool ReadEscape( std::string &out )
	{
		cur.Advance();
		if ( cur.exhausted )
		{
			Error( cur.line, "Unterminated string" );
			return false;
		}

		switch ( cur.c )
		{
			case '\"':
			case '\\':
			case '/':
				out.push_back( (char)cur.c );
				return true;

			case 'b': out.push_back( '\b' ); return true;
			case 'f': out.push_back( '\f' ); return true;
			case 'n': out.push_back( '\n' ); return true;
			case 'r': out.push_back( '\r' ); return true;
			case 't': out.push_back( '\t' ); return true;

			case 'u':
				return ReadUnicodeEscape( out );
		}

		if ( cur.c > 0x20 && cur.c < 128 )
			Errorf( cur.line, "Invalid escape sequence '\\%c' in string", cur.c );
		else
			Errorf( cur.line, "Character 0x%02x is not valid after '\\' in string", cur.c );
		return false;
	}

	// Parse the 4 hex digits in an \u-escaped character
	bool ReadUnicodeEscape( std::string &out )
	{
		unsigned x = 0;
		for ( int i = 0 ; i < 4 ; ++i )
		{
			cur.Advance();
			if ( cur.exhausted )
			{
				Error( cur.line, "End of input during \\u escape sequence" );
				return false;
			}

			x <<= 4;
			const int c = cur.c;
			if ( '0' <= c && c <= '9' )
				x += c - '0';
			else if ( 'a' <= c && c <= 'f' )
				x += c - 'a' + 0xa;
			else if ( 'A' <= c && c <= 'F' )
				x += c - 'A' + 0xa;
			else
			{
				Errorf( cur.line, "Character 0x%02x is not a hex digit; invalid \\u-escaped sequence", c );
				return false;
			}
		}

		AppendCodeUnit( out, x );
		return true;
	}

	// Collect the text of a number, bool or null: everything up to the next
	// ',', '}' or ']', or the end of input. Leaves the cursor on the delimiter.
	void ReadLiteral( std::string &text )
	{
		while ( !cur.exhausted && !IsDelimiter( cur.c ) )
		{
			text.push_back( (char)cur.c );
			cur.Advance();
		}
		TrimWhitespace( text );
	}

	bool ReadNumber( Value &out )
	{
		// Errors are reported on the line the literal started on, even
		// if we crossed some newlines looking for the delimiter
		const int line = cur.line;

		std::string text;
		ReadLiteral( text );
		if ( text.empty() )
		{
			ErrorExpected( "a value" );
			return false;
		}
		if ( !IsNumericLiteral( text ) )
		{
			Errorf( line, "'%s' is not a valid JSON number", PrintableText( text ).c_str() );
			return false;
		}

		// Integer, if there's no fraction or exponent and it fits
		if ( text.find_first_of( ".eE" ) == std::string::npos )
		{
			char *e;
			errno = 0;
			long long x = strtoll( text.c_str(), &e, 10 );
			if ( errno == 0 && e != text.c_str() && *e == '\0' )
			{
				out = Value( (int64_t)x );
				out._line = line;
				return true;
			}
		}

		// strtod wants whatever the locale uses as the decimal point.
		// NOTE: Here we are assuming that decimal_point will point to a string
		// of exactly one character.
		const char decimal_point = *localeconv()->decimal_point;
		for ( char &ch: text )
		{
			if ( ch == '.' )
				ch = decimal_point;
		}

		char *e;
		double x = strtod( text.c_str(), &e );
		if ( e == text.c_str() || *e != '\0' )
		{
			// Matched the pattern, but there are no digits in it. E.g. "-"
			Errorf( line, "'%s' is not a valid JSON number", PrintableText( text ).c_str() );
			return false;
		}

		// An exponent that is too big gives +/-inf. That is kept, not an error
		out = Value( x );
		out._line = line;
		return true;
	}

	bool ReadBoolOrNull( Value &out )
	{
		const int line = cur.line;

		std::string text;
		ReadLiteral( text );
		if ( text == "true" )
			out = Value( true );
		else if ( text == "false" )
			out = Value( false );
		else if ( text == "null" )
			out = Value();
		else
		{
			Errorf( cur.line, "Expected 'true', 'false' or 'null' but found '%s'", PrintableText( text ).c_str() );
			return false;
		}
		out._line = line;
		return true;
	}
};

static bool ParseValue( Value &out, const char *begin, const char *end, ParseContext *ctx )
{
	LJSON_ASSERT( begin <= end );
	ParseContext dummy_ctx;
	Parser p( ctx ? *ctx : dummy_ctx, begin, end );
	if ( !p.ParseDocument( out ) )
	{
		out = Value();
		return false;
	}
	return true;
}

static bool ParseValue( Value &out, std::istream &in, ParseContext *ctx )
{
	std::string text( ( std::istreambuf_iterator<char>( in ) ), std::istreambuf_iterator<char>() );
	if ( in.bad() )
	{
		if ( ctx )
		{
			ctx->error_line = 1;
			ctx->error_message = "Error reading input stream";
		}
		out = Value();
		return false;
	}

	// Skip a UTF-8 byte order mark
	const char *begin = text.c_str();
	const char *end = begin + text.length();
	if ( text.compare( 0, 3, "\xEF\xBB\xBF" ) == 0 )
		begin += 3;

	return ParseValue( out, begin, end, ctx );
}

static bool CheckObjectRoot( Value &out, ParseContext *ctx )
{
	if ( out.Type() == kObject )
		return true;
	if ( ctx )
	{
		ctx->error_line = out.Line() > 0 ? out.Line() : 1;
		ctx->error_message = "Failed to parse JSON object";
	}
	out = Value( kObject ); // Type safety in case caller reuses
	return false;
}

bool Value::ParseJSON( const char *begin, const char *end, ParseContext *ctx )
{
	return ParseValue( *this, begin, end, ctx );
}

bool Value::ParseJSON( std::istream &in, ParseContext *ctx )
{
	return ParseValue( *this, in, ctx );
}

bool Object::ParseJSON( const char *begin, const char *end, ParseContext *ctx )
{
	if ( !ParseValue( *this, begin, end, ctx ) )
	{
		Value::operator=( Value( kObject ) );
		return false;
	}
	return CheckObjectRoot( *this, ctx );
}

bool Object::ParseJSON( std::istream &in, ParseContext *ctx )
{
	if ( !ParseValue( *this, in, ctx ) )
	{
		Value::operator=( Value( kObject ) );
		return false;
	}
	return CheckObjectRoot( *this, ctx );
}

} // namespace ljson
