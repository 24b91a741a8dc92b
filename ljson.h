/////////////////////////////////////////////////////////////////////////////
//
// ljson is a strict JSON parser and read-only DOM that keeps track of where
// things came from. Every value remembers the line it started on, objects
// keep their keys in document order, and a key that appears more than once
// is recorded instead of silently replacing the first value.
//
// The parser reports the first problem it finds, with its line number, and
// gives up. There is no recovery and no partial result.
//
/////////////////////////////////////////////////////////////////////////////

#ifndef LJSON_H_INCLUDED
#define LJSON_H_INCLUDED

#include <string.h>
#include <stdint.h>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

// #define LJSON_ASSERT to something else if you want to customize
// assertion behaviour. Assertions are only for bugs and for misuse of the
// As*() accessors, never for malformed input.
#ifndef LJSON_ASSERT
	#include <assert.h>
	#define LJSON_ASSERT assert
#endif

// Default limit on how deeply objects and arrays may nest. The parser is
// recursive, so this is really a limit on stack usage.
#ifndef LJSON_DEFAULT_MAX_DEPTH
	#define LJSON_DEFAULT_MAX_DEPTH 512
#endif

namespace ljson {

// The different type of JSON values
enum EValueType
{
	kNull,
	kObject, // E.g. { "key1": "value1", "key2": 456 }. Keys are kept in document order
	kArray, // E.g. [ "value1", 456, { } ]
	kString,
	kNumber, // Stored as an integer when the literal allows it, otherwise as a double. See Value::IsInteger()
	kBool,
	kDeleted, // used for debugging only
};

// Internal implementation details. Nothing to see here, move along...
class Value; class Object; class Array;
struct ObjectItem; struct ParseContext; struct Parser;
using RawObject = std::vector<ObjectItem>; // Internal storage for objects, in document order
using RawArray = std::vector<Value>; // Internal storage for arrays
using DuplicateLines = std::vector<int>; // Lines where an object key was repeated

/////////////////////////////////////////////////////////////////////////////
//
// Parsing options and errors
//
/////////////////////////////////////////////////////////////////////////////

// Struct used to pass parsing options, and receive the error message
struct ParseContext
{
	// Options

	// Maximum nesting depth of objects and arrays. A deeper document
	// fails to parse, at the line of the bracket that went too deep.
	int max_depth = LJSON_DEFAULT_MAX_DEPTH;

	// If set, anything following the root value is ignored. Normally
	// only whitespace may follow it.
	bool allow_trailing_text = false;

	// If there's an error, it will be returned here
	std::string error_message;

	// Line where error occurred. 1-based. Zero if the parse succeeded
	int error_line = 0;
};

/////////////////////////////////////////////////////////////////////////////
//
// DOM classes
//
/////////////////////////////////////////////////////////////////////////////

// Return a reference to a Null value, empty array, empty object, or an
// empty list of duplicate lines.
extern const Value &GetStaticNullValue();
extern const Array &GetStaticEmptyArray();
extern const Object &GetStaticEmptyObject();
extern const DuplicateLines &GetStaticEmptyDuplicateLines();

// Return "null", "object", "array", "string", "number" or "bool"
extern const char *ValueTypeName( EValueType t );

// A Value is a "node" in the DOM, either a primitive type (null, string,
// bool, or number) or an aggregate type (object or array).
//
// A parsed tree is read-only. The only way to get an object or array with
// something in it is to parse it, or to construct it whole from raw storage.
class Value
{
public:

	//
	// Construction and assignment
	//

	// Default constructor sets us to a null value
	Value() : _type( kNull ), _integer( false ), _line( 0 ) {}

	// Construct value with the given kind and default value for that kind (0 or empty)
	Value( EValueType type );

	// Basic C++ object lifetime stuff
	Value( const Value &x ) { InternalConstruct( x ); }
	Value( Value &&x ) { InternalConstruct( std::move( x ) ); }
	~Value() { InternalDestruct(); }
	Value &operator=( const Value & x );
	Value &operator=( Value && x );

	// Construct directly from primitive values.
	Value( bool x ) : _type( kBool ), _integer( false ), _line( 0 ) { _bool = x; }
	Value( int x ) : _type( kNumber ), _integer( true ), _line( 0 ) { _int = x; }
	Value( int64_t x ) : _type( kNumber ), _integer( true ), _line( 0 ) { _int = x; }
	Value( double x ) : _type( kNumber ), _integer( false ), _line( 0 ) { _double = x; }
	Value( const char * x );
	Value( const std::string &x );
	Value( std::string && x );
	Value( std::nullptr_t ) = delete; // To avoid confusion. Use default constructor or kNull

	// Construct from internal object/array storage. If the raw object
	// has repeated keys, you get what you asked for.
	Value( const RawObject & x );
	Value( RawObject && x );
	Value( const RawArray & x );
	Value( RawArray && x );

	//
	// Type checking
	//

	// Return true if we are the specified type
	bool IsNull() const { return _type == kNull; }
	bool IsObject() const { return _type == kObject; }
	bool IsArray() const { return _type == kArray; }
	bool IsString() const { return _type == kString; }
	bool IsNumber() const { return _type == kNumber; }
	bool IsInteger() const { return _type == kNumber && _integer; } // Literal had no fraction or exponent, and fit in 64 bits
	bool IsDecimal() const { return _type == kNumber && !_integer; }
	bool IsBool() const { return _type == kBool; }

	// Return the type of thing we are
	EValueType Type() const { return _type; }

	// 1-based line where this value began in the parsed text. Values that
	// did not come from the parser return 0.
	int Line() const { return _line; }

	//
	// Read this Value as a specific data type.
	//

	// Perform a blind "static cast" of the value to the specified type. The value must
	// already be the exact type; no conversions or type checks are attempted.
	// These will assert/crash if called on the wrong type.
	const char *       AsCString() const { LJSON_ASSERT( _type == kString ); return _string.c_str(); }
	const std::string &AsString () const { LJSON_ASSERT( _type == kString ); return _string; }
	bool               AsBool   () const { LJSON_ASSERT( _type == kBool   ); return _bool; }
	int64_t            AsInteger() const { LJSON_ASSERT( IsInteger() ); return _int; }
	double             AsDouble () const { LJSON_ASSERT( IsDecimal() ); return _double; }
	const Object &     AsObject () const { LJSON_ASSERT( _type == kObject ); return *(const Object*)this; }
	const Array &      AsArray  () const { LJSON_ASSERT( _type == kArray  ); return *(const Array*)(this); }

	// Get this value as the specified type. If the value is not the exact
	// JSON type, returns a default. The only conversion is that GetDouble()
	// will widen an integer.
	const char *  GetCString      ( const char *       defaultVal = nullptr ) const { return _type == kString ? _string.c_str() : defaultVal; }
	std::string   GetString       ( const char *       defaultVal = ""      ) const { return _type == kString ? _string : std::string( defaultVal ); } // NOTE: always returns a copy
	std::string   GetString       ( const std::string &defaultVal           ) const { return _type == kString ? _string : defaultVal; }
	bool          GetBool         ( bool               defaultVal = false   ) const { return _type == kBool   ? _bool : defaultVal; }
	int64_t       GetInteger      ( int64_t            defaultVal = 0       ) const { return IsInteger() ? _int : defaultVal; }
	double        GetDouble       ( double             defaultVal = 0.0     ) const { return IsInteger() ? (double)_int : IsDecimal() ? _double : defaultVal; }
	const Object *GetObjectPtr    (                                         ) const { return _type == kObject ? (const Object *)this : nullptr; }
	const Array  *GetArrayPtr     (                                         ) const { return _type == kArray  ? (const Array  *)this : nullptr; }
	const Object &GetObjectOrEmpty(                                         ) const { return _type == kObject ? *(const Object *)this : GetStaticEmptyObject(); }
	const Array  &GetArrayOrEmpty (                                         ) const { return _type == kArray  ? *(const Array  *)this : GetStaticEmptyArray(); }

	//
	// Object access
	//
	// All functions do checking and will return a sensible "failure"
	// result if called on a non-object, or if the key is not found.
	// To iterate the key/value pairs in order, use something like
	//
	// for ( const ObjectItem &item: val.GetObjectOrEmpty() ) {}
	//

	// Return true if this is an object, and the key is present
	bool HasKey( const std::string &key ) const { return ValuePtrAtKey( key ) != nullptr; }
	bool HasKey( const char        *key ) const { return ValuePtrAtKey( key ) != nullptr; }

	// Return number of key/values pairs in object. Returns 0 if this value is not an object.
	int    ObjectLen () const;
	size_t ObjectSize() const;

	// Get pointer to Value at the specified key. If called on a Value that
	// isn't an Object, or if the key is not found, returns nullptr
	const Value *ValuePtrAtKey( const std::string &key ) const;
	const Value *ValuePtrAtKey( const char *       key ) const;

	// Return reference to the value at the specified key. If this is not an object,
	// or the key is not found, returns a reference to a statically-allocated null
	// value.
	template <typename K> const Value &AtKey( K&& key ) const { const Value *t = ValuePtrAtKey( key ); return t ? *t : GetStaticNullValue(); }

	// Get the value at the specified key as the specified type. If this is not an object,
	// or the key is not found, or the item is not the correct JSON type, returns a default
	template <typename K> const char *  CStringAtKey      ( K&& key, const char *       defaultVal = nullptr ) const { return AtKey( key ).GetCString( defaultVal ); }
	template <typename K> std::string   StringAtKey       ( K&& key, const char *       defaultVal = ""      ) const { return AtKey( key ).GetString( defaultVal ); }
	template <typename K> bool          BoolAtKey         ( K&& key, bool               defaultVal = false   ) const { return AtKey( key ).GetBool( defaultVal ); }
	template <typename K> int64_t       IntegerAtKey      ( K&& key, int64_t            defaultVal = 0       ) const { return AtKey( key ).GetInteger( defaultVal ); }
	template <typename K> double        DoubleAtKey       ( K&& key, double             defaultVal = 0.0     ) const { return AtKey( key ).GetDouble( defaultVal ); }
	template <typename K> const Object *ObjectPtrAtKey    ( K&& key                                          ) const { return AtKey( key ).GetObjectPtr(); }
	template <typename K> const Array * ArrayPtrAtKey     ( K&& key                                          ) const { return AtKey( key ).GetArrayPtr(); }

	// Lines on which the key appeared again after its first definition.
	// The values from those later appearances were discarded. Empty if the
	// key was unique, missing, or this is not an object.
	const DuplicateLines &DuplicateLinesAtKey( const std::string &key ) const;

	//
	// Array access
	//
	// All functions do checking and will return a sensible "failure" result
	// if called on non-array, or if the index is invalid.
	//

	// Get the length of the array. Returns 0 if this value is not an array.
	int    ArrayLen () const { return _type == kArray ? (int)_array.size() : 0; }
	size_t ArraySize() const { return _type == kArray ? _array.size() : 0; }

	// Return reference to the value at the specified index. If this is not an array,
	// or the index is out of bounds, returns a reference to a statically-allocated null
	// value.
	const Value &AtIndex( size_t idx ) const { return ( _type == kArray && idx < _array.size() ) ? _array[idx] : GetStaticNullValue(); }

	// Get pointer to Value at the specified index. If you call this on a Value
	// that isn't an Array, or the index is invalid, returns nullptr
	const Value *ValuePtrAtIndex( size_t idx ) const { return ( _type == kArray && idx < _array.size() ) ? &_array[idx] : nullptr; }

	// Get the value at the specified index as the specified type, or a default
	std::string   StringAtIndex       ( size_t idx, const char *       defaultVal = ""      ) const { return AtIndex( idx ).GetString( defaultVal ); }
	int64_t       IntegerAtIndex      ( size_t idx, int64_t            defaultVal = 0       ) const { return AtIndex( idx ).GetInteger( defaultVal ); }
	double        DoubleAtIndex       ( size_t idx, double             defaultVal = 0.0     ) const { return AtIndex( idx ).GetDouble( defaultVal ); }
	bool          BoolAtIndex         ( size_t idx, bool               defaultVal = false   ) const { return AtIndex( idx ).GetBool( defaultVal ); }

	//
	// Comparison
	//

	// Logical equality. Line numbers and duplicate-key records are ignored,
	// but the integer/decimal distinction is not: 1 != 1.0. Object keys
	// must appear in the same order.
	bool operator==( const Value &x ) const;
	bool operator!=( const Value &x ) const { return !( *this == x ); }

	//
	// Parsing JSON text
	//

	// Parse any legitimate JSON entity. If you don't care about good
	// error handling, you don't need to provide the ParseContext.
	// On failure, we are set to null.
	// See also Object::ParseJSON
	inline bool ParseJSON( const char *c_str, ParseContext *ctx = nullptr ) { return ParseJSON( c_str, c_str + strlen(c_str), ctx ); }
	inline bool ParseJSON( const std::string &s, ParseContext *ctx = nullptr ) { return ParseJSON( s.c_str(), s.c_str() + s.length(), ctx ); }
	bool ParseJSON( const char *begin, const char *end, ParseContext *ctx = nullptr );

	// Read the whole stream and parse it. A UTF-8 byte order mark at the
	// start of the stream is skipped.
	bool ParseJSON( std::istream &in, ParseContext *ctx = nullptr );

protected:

	EValueType _type;
	bool _integer; // kNumber only. Which of _int / _double is live
	int _line;
	union
	{
		int64_t _int;
		double _double;
		bool _bool;
		RawObject _object;
		RawArray _array;
		std::string _string;
		struct { char x[8]; } _dummy;
	};

	void InternalDestruct();
	void InternalConstruct( const Value &x );
	void InternalConstruct( Value &&x );

	// The parser builds containers in place
	friend struct Parser;
};

// One key/value pair in an object.
struct ObjectItem
{
	std::string key;
	Value value;

	// Every later line where the same key showed up again. Those values were
	// thrown away; the first one wins.
	DuplicateLines duplicate_lines;
};

// An Object is a Value that is known (or at least assumed) to be of type
// kObject. Since it is assumed to be an object, we can provide a more
// idiomatic object interface.
//
// NOTE: This is not a real, typesafe derived class!  It is just an
// interface for when you assume the Value is an Object.
class Object : public Value
{
public:
	Object() : Value( kObject ) {}
	Object( const Object &x ) : Value( x ) {}
	Object( Object &&x ) : Value( std::move( x ) ) {}
	Object( const RawObject &x ) : Value( x ) {}
	Object( RawObject &&x ) : Value( std::move( x ) ) {}
	Object &operator=( const Object & x ) { LJSON_ASSERT( x._type == kObject ); Value::operator=(x); return *this; }
	Object &operator=( Object && x ) { LJSON_ASSERT( x._type == kObject ); Value::operator=(std::move(x)); return *this; }

	// Same as Value::ParseJSON, but fails if the result isn't a single Object.
	// On failure, we are set to an empty object.
	inline bool ParseJSON( const char *c_str, ParseContext *ctx = nullptr ) { return ParseJSON( c_str, c_str + strlen(c_str), ctx ); }
	inline bool ParseJSON( const std::string &s, ParseContext *ctx = nullptr ) { return ParseJSON( s.c_str(), s.c_str() + s.length(), ctx ); }
	bool ParseJSON( const char *begin, const char *end, ParseContext *ctx = nullptr );
	bool ParseJSON( std::istream &in, ParseContext *ctx = nullptr );

	// We know we are an Object, so skip the type check
	int    Len()        const { LJSON_ASSERT( _type == kObject ); return (int)_object.size(); }
	size_t size()       const { LJSON_ASSERT( _type == kObject ); return _object.size(); }
	bool   empty()      const { LJSON_ASSERT( _type == kObject ); return _object.empty(); }

	// Lookup by key. Never inserts; a missing key gives the static null value.
	template <typename K> const Value &operator[]( K &&key ) const { return AtKey( std::forward<K>( key ) ); }

	// Access the underlying storage
	inline RawObject const &Raw() const { LJSON_ASSERT( _type == kObject ); return _object; }

	// Range-based for, in document order. Example:
	//
	// for ( const ObjectItem &item: obj )
	// {
	//   const std::string &key = item.key;
	//   const Value &val = item.value;
	// }
	RawObject::const_iterator begin() const { LJSON_ASSERT( _type == kObject ); return _object.begin(); }
	RawObject::const_iterator end()   const { LJSON_ASSERT( _type == kObject ); return _object.end(); }
};

// An Array is a Value that is known (or at least assumed) to be of type
// kArray.  See comments above the Object class for more info
class Array : public Value
{
public:
	Array() : Value( kArray ) {}
	Array( const Array &x ) : Value( x ) {}
	Array( Array &&x ) : Value( std::move( x ) ) {}
	Array( const RawArray &x ) : Value( x ) {}
	Array( RawArray && x ) : Value( std::move( x ) ) {}

	int    Len()       const { LJSON_ASSERT( _type == kArray ); return (int)_array.size(); }
	size_t size()      const { LJSON_ASSERT( _type == kArray ); return _array.size(); } // not capitalized because we want to be as similar to std::vector as possible
	bool   empty()     const { LJSON_ASSERT( _type == kArray ); return _array.empty(); }

	// Standard array access notation Operator[]
	const Value &operator[]( size_t idx ) const { LJSON_ASSERT( _type == kArray ); return _array[idx]; }

	// Get direct access to the underlying vector
	const RawArray &Raw() const { LJSON_ASSERT( _type == kArray ); return _array; }

	// Iterate all elements. Example:
	//
	// for ( const Value &val: arr ) {}
	const Value *begin() const { LJSON_ASSERT( _type == kArray ); return _array.data(); }
	const Value *end()   const { LJSON_ASSERT( _type == kArray ); return _array.data() + _array.size(); }
};

/////////////////////////////////////////////////////////////////////////////
//
// Internal stuff
//
/////////////////////////////////////////////////////////////////////////////

// These need ObjectItem to be complete
inline int    Value::ObjectLen () const { return _type == kObject ? (int)_object.size() : 0; }
inline size_t Value::ObjectSize() const { return _type == kObject ? _object.size() : 0; }

// Characters allowed to begin a value right after the ':' that follows an
// object key. Inside an object any kind of value may follow. Outside of one
// only a string, object or array is accepted.
extern bool IsLegalValueStarter( int c, bool inside_object );

} // namespace ljson

#endif // _H
