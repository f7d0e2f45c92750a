#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

/*
  Generates a schema declaration for the specified type, wire keys default to member names:

  namespace foo {
    struct Bar { int32_t x; float y; bool z; };
  }

  JBIND_CLASS(foo::Bar, x, y, z)
*/
#define JBIND_CLASS(_Name, ...)                                  \
  template <>                                                    \
  struct jbind::SchemaDeclaration<_Name>                         \
  {                                                              \
    using Self [[maybe_unused]] = _Name;                         \
    static void Declare(jbind::SchemaBuilder<_Name>& b)          \
    {                                                            \
      b.name(#_Name);                                            \
      b.fields(_JBIND_CONCAT(_JBIND_FIELD_REF, (__VA_ARGS__)));  \
    }                                                            \
  };

/*
  Generates a schema declaration for the specified type with inheritance:

  namespace foo {
    struct Base { std::string name; };
    struct Bar : Base { int32_t x; float y; bool z; };
  }

  JBIND_CLASS(foo::Base, name)
  JBIND_CLASS_INHERIT(foo::Bar, foo::Base, x, y, z)
*/
#define JBIND_CLASS_INHERIT(_Name, _Base, ...)                   \
  template <>                                                    \
  struct jbind::SchemaDeclaration<_Name>                         \
  {                                                              \
    using Self [[maybe_unused]] = _Name;                         \
    static void Declare(jbind::SchemaBuilder<_Name>& b)          \
    {                                                            \
      b.name(#_Name);                                            \
      b.extends<_Base>();                                        \
      b.fields(_JBIND_CONCAT(_JBIND_FIELD_REF, (__VA_ARGS__)));  \
    }                                                            \
  };

/////////////////////////////////////////////////////////////

#define JBIND_MEMBERS_BASE(_Extends, ...)                       \
  template <typename JbindBuilder>                              \
  static void declareJbindSchema(JbindBuilder& b)               \
  {                                                             \
    using Self [[maybe_unused]] = typename JbindBuilder::Class; \
    _Extends;                                                   \
    b.fields(_JBIND_CONCAT(_JBIND_FIELD_REF, (__VA_ARGS__)));   \
  }

/*
  Generates a schema declaration inside class:

  namespace foo {
    struct Bar {
      int32_t x; float y; bool z;
      JBIND_MEMBERS(x, y, z)
    };
  }
*/
#define JBIND_MEMBERS(...) \
  JBIND_MEMBERS_BASE((void)0, __VA_ARGS__)

/*
  Generates a schema declaration inside class with inheritance:

  namespace foo {
    struct Base {
      std::string name;
      JBIND_MEMBERS(name)
    };

    struct Bar : Base {
      int32_t x; float y; bool z;
      JBIND_MEMBERS_INHERIT(Base, x, y, z)
    };
  }
*/
#define JBIND_MEMBERS_INHERIT(_Base, ...) \
  JBIND_MEMBERS_BASE(b.template extends<_Base>(), __VA_ARGS__)

/*
  Generates an enum declaration, wire values are the constant names:

  enum class MyEnum {
    One, Two, Three
  };

  JBIND_ENUM(MyEnum, One, Two, Three)
*/
#define JBIND_ENUM(_Name, ...)                         \
  template <>                                          \
  struct jbind::SchemaDeclaration<_Name>               \
  {                                                    \
    static void Declare(jbind::EnumBuilder<_Name>& b)  \
    {                                                  \
      using enum _Name;                                \
      b.name(#_Name);                                  \
      b.values(#__VA_ARGS__, {__VA_ARGS__});           \
    }                                                  \
  };

///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

namespace jbind
{

  /* Forward declarations */
  class Adapter;
  class ClassSchema;
  class TokenStream;
  class Type;
  class Value;
  class Writer;

  template <typename T>
  class SchemaBuilder;

  template <typename T>
  class EnumBuilder;

  // Specialize (or give the class a static declareJbindSchema) to describe how a type binds
  template <typename T>
  struct SchemaDeclaration
  {
    template <typename Builder>
    static void Declare(Builder& b) { T::declareJbindSchema(b); }
  };

  //---------------------------------------------------------------------------------------------------------------------
  struct Error final
  {
    enum Type
    {
      None,                   // no error

      // Malformed input
      UnexpectedEnd,          // unexpected end of JSON data (end of stream, string or file)
      SyntaxError,            // general parsing error
      InvalidLiteral,         // invalid literal, only "true", "false", "null" allowed
      InvalidEscapeSeq,       // invalid or unsupported string escape \ sequence
      InvalidNumber,          // malformed number literal
      CommaExpected,          // expected comma ','
      ColonExpected,          // expected colon ':'
      TrailingData,           // data after the end of the root value
      CouldNotOpen,           // stream is not open

      // Schema mismatch
      BooleanExpected,        // expected boolean literal "true" or "false"
      NumberExpected,         // expected number
      IntegerExpected,        // expected a number without fraction or exponent
      StringExpected,         // expected string "..."
      ObjectExpected,         // expected object { ... }
      ArrayExpected,          // expected array [ ... ]
      NullNotAllowed,         // JSON null where the destination cannot hold one
      NumberOverflow,         // number does not fit the destination kind
      QuotedValueExpected,    // quoted field got a bare literal
      UnquotedValueExpected,  // unquoted field got a quoted literal
      WrongArraySize,         // invalid number of array elements
      InvalidEnum,            // invalid enum value or string (conversion failed)
      IncompatibleType,       // declared type does not fit the member storage
      UnresolvedTypeVariable, // generic type variable without concrete binding
      DuplicateKey,           // two fields of one schema share a wire key
      InvalidTypeMap,         // malformed polymorphic type map declaration
      MissingDiscriminator,   // polymorphic object without discriminator field
      UnknownDiscriminator,   // discriminator value not in the type map
      DuplicateDiscriminator, // discriminator key repeated inside one object
      WrapperKeyNotFound,     // wrapper key missing from the document
      UnsupportedOperation,   // operation not supported for this key or value

      // Generation
      NonFiniteNumber,        // NaN or infinity cannot be written as JSON
    };

    static constexpr const char* TypeString[] =
      {
        "none",
        "unexpected end",
        "syntax error",
        "invalid literal",
        "invalid escape sequence",
        "invalid number",
        "comma expected",
        "colon expected",
        "trailing data",
        "could not open stream",
        "boolean expected",
        "number expected",
        "integer expected",
        "string expected",
        "object expected",
        "array expected",
        "null not allowed",
        "number overflow",
        "quoted value expected",
        "unquoted value expected",
        "wrong array size",
        "invalid enum",
        "incompatible type",
        "unresolved type variable",
        "duplicate key",
        "invalid type map",
        "missing discriminator",
        "unknown discriminator",
        "duplicate discriminator",
        "wrapper key not found",
        "unsupported operation",
        "non-finite number",
    };

    int type = None;
    int line = 0;
    int column = 0;

    // Location inside the document, e.g. "/animals/1/legCount"
    std::string path;

    // Human readable explanation
    std::string detail;

    operator int() const noexcept { return type; } // NOLINT(google-explicit-constructor)

    // Ill-formed JSON, reported as an I/O failure
    bool isMalformedInput() const noexcept { return type >= UnexpectedEnd && type <= CouldNotOpen; }

    // Schema mismatch or generation failure, reported as an invalid argument
    bool isInvalidArgument() const noexcept { return type > CouldNotOpen; }
  };

  //---------------------------------------------------------------------------------------------------------------------
  struct WriterParams
  {
    // One level of indentation
    const char* indentation = "  ";

    // End of line string
    const char* eol = "\n";

    // Write all on single line, omit extra spaces
    bool compact = true;

    // Escape unicode characters in strings
    bool escapeUnicode = false;

    // Custom user data pointer
    void* userData = nullptr;
  };

  //---------------------------------------------------------------------------------------------------------------------
  enum class Charset
  {
    Utf8,
    Latin1
  };

  //---------------------------------------------------------------------------------------------------------------------
  struct ReaderParams
  {
    // Encoding of byte input
    Charset charset = Charset::Utf8;

    // Keys to descend through before binding, outermost first
    std::vector<std::string> wrapperKeys;

    // Stop binding when this key is reached, the rest of the input is left unread
    std::string stopAtKey;

    // Called for keys of classes that carry no open container
    std::function<void(std::string_view key)> onUnrecognizedKey;

    // Custom user data pointer
    void* userData = nullptr;
  };

  //---------------------------------------------------------------------------------------------------------------------
  enum class TokenType
  {
    None = 0,
    ObjectBegin,
    ObjectEnd,
    ArrayBegin,
    ArrayEnd,
    FieldName,
    String,
    NumberInt,
    NumberFloat,
    True,
    False,
    Null,
    EndOfInput
  };

  //---------------------------------------------------------------------------------------------------------------------
  enum class ValueType
  {
    Null = 0,
    Boolean,
    Number,
    Array,
    String,
    Object
  };

} // namespace jbind

///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

namespace jbind::detail
{

  class CharSource
  {
  public:
    virtual ~CharSource() = default;

    virtual int next() = 0;
    virtual int peek() = 0;
    virtual bool eof() const = 0;

    int line() const noexcept { return m_line; }
    int column() const noexcept { return m_column; }

    Error makeError(int type, std::string detail = {}) const { return Error {type, m_line, m_column, {}, std::move(detail)}; }

  protected:
    int m_line = 1;
    int m_column = 1;
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename C, typename M>
  struct FieldRef
  {
    FieldRef(const char* name, M C::*member)
      : name(name)
      , member(member)
    {}

    const char* name;
    M C::*member;
  };

  //---------------------------------------------------------------------------------------------------------------------
  inline Error WithPath(Error err, std::string_view segment)
  {
    if (err)
      err.path = "/" + std::string(segment) + err.path;

    return err;
  }

} // namespace jbind::detail

///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

/* Here be dragons... */

#define _JBIND_EXPAND(...) __VA_ARGS__
#define _JBIND_JOIN(X, Y) _JBIND_JOIN2(X, Y)
#define _JBIND_JOIN2(X, Y) X##Y
#define _JBIND_COUNT(...) _JBIND_EXPAND(_JBIND_COUNT2(__VA_ARGS__, \
  16, 15, 14, 13, 12, 11, 10, 9,                                   \
  8, 7, 6, 5, 4, 3, 2, 1, ))

#define _JBIND_COUNT2(_,                 \
  _16, _15, _14, _13, _12, _11, _10, _9, \
  _8, _7, _6, _5, _4, _3, _2, _X, ...) _X

#define _JBIND_FIRST(...) _JBIND_EXPAND(_JBIND_FIRST2(__VA_ARGS__, ))
#define _JBIND_FIRST2(X, ...) X
#define _JBIND_TAIL(...) _JBIND_EXPAND(_JBIND_TAIL2(__VA_ARGS__))
#define _JBIND_TAIL2(X, ...) (__VA_ARGS__)

#define _JBIND_CONCAT(_Prefix, _Args) _JBIND_JOIN(_JBIND_CONCAT_, _JBIND_COUNT _Args)(_Prefix, _Args)
#define _JBIND_CONCAT_1(_Prefix, _Args) _Prefix _Args
#define _JBIND_CONCAT_2(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_1(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_3(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_2(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_4(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_3(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_5(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_4(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_6(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_5(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_7(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_6(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_8(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_7(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_9(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_8(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_10(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_9(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_11(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_10(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_12(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_11(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_13(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_12(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_14(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_13(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_15(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_14(_Prefix, _JBIND_TAIL _Args)
#define _JBIND_CONCAT_16(_Prefix, _Args) _Prefix(_JBIND_FIRST _Args), _JBIND_CONCAT_15(_Prefix, _JBIND_TAIL _Args)

#define _JBIND_FIELD_REF(_X) _JBIND_FIELD_REF2(_X)
#define _JBIND_FIELD_REF2(_X) jbind::detail::FieldRef(#_X, &Self::_X)
