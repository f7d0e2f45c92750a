#pragma once

#include <cmath>
#include <cstdlib>
#include <limits>

#include "jbind_input.hpp"
#include "jbind_schema.hpp"

namespace jbind
{

  /*

  jbind::Binder

  Consumes the tokens of exactly one JSON value and stores it into typed storage.
  'bind' starts on the first token of the value and returns with the stream on its
  last token, so the caller advances with 'nextToken'.

  */
  class Binder final
  {
  public:
    explicit Binder(const ReaderParams& rp)
      : m_rp(rp)
    {}

    Error bind(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot, bool quoted = false);

    // Binds members of an object whose ObjectBegin (or some member value) was just consumed
    Error bindObjectFields(TokenStream& ts, const ClassSchema& schema, void* obj, std::string_view guardKey = {});

    Error bindOpen(TokenStream& ts, Value& out);

    // Set once 'stopAtKey' was reached, the rest of the input is left unread
    bool stopped() const noexcept { return m_stopped; }

  private:
    Error bindNull(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot);
    Error bindScalar(TokenStream& ts, const Type& type, void* slot, bool quoted);
    Error bindEnum(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot);
    Error bindSequence(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot);
    Error bindMap(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot);
    Error bindObject(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot);
    Error bindPolymorphic(TokenStream& ts, const Type& type, const PointerAdapter& pointer, void* slot);

    const ReaderParams& m_rp;
    bool m_stopped = false;
  };

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  namespace detail
  {

    //---------------------------------------------------------------------------------------------------------------------
    inline bool IsScalarToken(TokenType token)
    {
      return token == TokenType::String || token == TokenType::NumberInt || token == TokenType::NumberFloat ||
             token == TokenType::True || token == TokenType::False;
    }

    //---------------------------------------------------------------------------------------------------------------------
    template <typename T>
    Error ParseInteger(const TokenStream& ts, std::string_view text, ScalarKind kind, T& out)
    {
      const char* end = text.data() + text.size();
      auto [ptr, ec] = std::from_chars(text.data(), end, out);

      if (ec == std::errc::result_out_of_range)
        return ts.makeError(Error::NumberOverflow, std::string(text) + " does not fit " + ScalarName(kind));

      if (ec != std::errc() || ptr != end)
      {
        BigDecimal literal;
        if (BigDecimal::Parse(text, literal))
          return ts.makeError(Error::IntegerExpected, std::string(text) + " is not an integer");

        return ts.makeError(Error::NumberExpected);
      }

      return {Error::None};
    }

    //---------------------------------------------------------------------------------------------------------------------
    template <typename T>
    Error ParseFloat(const TokenStream& ts, std::string_view text, ScalarKind kind, T& out)
    {
      if (text == "NaN")
        out = std::numeric_limits<T>::quiet_NaN();
      else if (text == "Infinity")
        out = std::numeric_limits<T>::infinity();
      else if (text == "-Infinity")
        out = -std::numeric_limits<T>::infinity();
      else
      {
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, out);

        if (ec == std::errc::result_out_of_range)
        {
          // Only a magnitude above the range fails, a tiny one rounds to a subnormal or signed zero
          BigDecimal literal;
          if (!BigDecimal::Parse(text, literal))
            return ts.makeError(Error::NumberExpected);

          int64_t adjusted = int64_t(literal.unscaled().digits().size()) - 1 - literal.scale();
          if (adjusted >= 0)
            return ts.makeError(Error::NumberOverflow, std::string(text) + " does not fit " + ScalarName(kind));

          std::string copy(text);
          if constexpr (std::is_same_v<T, float>)
            out = std::strtof(copy.c_str(), nullptr);
          else
            out = std::strtod(copy.c_str(), nullptr);
          return {Error::None};
        }

        if (ec != std::errc() || ptr != end)
          return ts.makeError(Error::NumberExpected);
      }

      return {Error::None};
    }

    //---------------------------------------------------------------------------------------------------------------------
    inline bool IsNonFiniteLiteral(std::string_view text)
    {
      return text == "NaN" || text == "Infinity" || text == "-Infinity";
    }

  } // namespace detail

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bind(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot, bool quoted)
  {
    TokenType token = ts.currentToken();
    if (token == TokenType::EndOfInput || token == TokenType::None)
      return ts.makeError(Error::UnexpectedEnd);

    if (type.kind() == TypeKind::Variable)
      return ts.makeError(Error::UnresolvedTypeVariable, "type variable " + type.variableName() + " has no binding");

    if (adapter.kind() == StorageKind::Nullable)
    {
      const auto& nullable = static_cast<const NullableAdapter&>(adapter);
      if (token == TokenType::Null)
      {
        nullable.setNull(slot, SentinelFor(type));
        return {Error::None};
      }

      return bind(ts, type, nullable.inner(), nullable.emplace(slot), quoted);
    }

    if (adapter.kind() == StorageKind::Any)
    {
      Any& any = *static_cast<Any*>(slot);
      if (token == TokenType::Null)
      {
        any.setNull(SentinelFor(type));
        return {Error::None};
      }

      const Adapter& natural = NaturalAdapter(type);
      void* data = any.reset(natural);
      if (!data)
        return ts.makeError(Error::IncompatibleType, "cannot instantiate " + type.name());

      return bind(ts, type, natural, data, quoted);
    }

    if (token == TokenType::Null)
      return bindNull(ts, type, adapter, slot);

    switch (type.kind())
    {
    case TypeKind::Scalar:
      return bindScalar(ts, type, slot, quoted);

    case TypeKind::Enum:
      return bindEnum(ts, type, adapter, slot);

    case TypeKind::Array:
    case TypeKind::Collection:
      return bindSequence(ts, type, adapter, slot);

    case TypeKind::Map:
      return bindMap(ts, type, adapter, slot);

    case TypeKind::Object:
      return bindObject(ts, type, adapter, slot);

    case TypeKind::Polymorphic:
      return bindPolymorphic(ts, type, static_cast<const PointerAdapter&>(adapter), slot);

    case TypeKind::Open:
      return bindOpen(ts, *static_cast<Value*>(slot));

    case TypeKind::Variable:
      break;
    }

    return ts.makeError(Error::IncompatibleType, type.name());
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bindNull(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot)
  {
    switch (adapter.kind())
    {
    case StorageKind::Open:
      *static_cast<Value*>(slot) = Value();
      return {Error::None};

    case StorageKind::Pointer:
      static_cast<const PointerAdapter&>(adapter).setNull(slot, SentinelFor(type));
      return {Error::None};

    case StorageKind::Enum: {
      const auto& enumAdapter = static_cast<const EnumAdapter&>(adapter);
      if (const auto& constant = enumAdapter.schema().nullValue())
      {
        enumAdapter.set(slot, *constant);
        return {Error::None};
      }

      break;
    }

    case StorageKind::Scalar:
      if (type.scalarKind() == ScalarKind::Void)
        return {Error::None};

      break;

    default:
      break;
    }

    return ts.makeError(Error::NullNotAllowed, type.name() + " cannot hold null");
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bindScalar(TokenStream& ts, const Type& type, void* slot, bool quoted)
  {
    ScalarKind kind = type.scalarKind();
    TokenType token = ts.currentToken();
    const std::string& text = ts.text();

    if (kind == ScalarKind::Void)
      return ts.skipChildren();

    if (kind == ScalarKind::String)
    {
      if (token != TokenType::String)
        return ts.makeError(Error::StringExpected);

      *static_cast<std::string*>(slot) = text;
      return {Error::None};
    }

    if (!detail::IsScalarToken(token))
    {
      if (kind == ScalarKind::Boolean)
        return ts.makeError(Error::BooleanExpected);

      return ts.makeError(Error::NumberExpected);
    }

    bool isFloatKind = kind == ScalarKind::Float || kind == ScalarKind::Double;

    if (quoted && token != TokenType::String)
      return ts.makeError(Error::QuotedValueExpected, "expected \"" + text + "\"");

    if (!quoted && token == TokenType::String && !(isFloatKind && detail::IsNonFiniteLiteral(text)))
      return ts.makeError(Error::UnquotedValueExpected, "\"" + text + "\" must not be quoted");

    if (kind == ScalarKind::Boolean)
    {
      if (text == "true")
        *static_cast<bool*>(slot) = true;
      else if (text == "false")
        *static_cast<bool*>(slot) = false;
      else
        return ts.makeError(Error::BooleanExpected);

      return {Error::None};
    }

    if (token == TokenType::True || token == TokenType::False)
      return ts.makeError(Error::NumberExpected);

    bool isIntegerKind = !isFloatKind && kind != ScalarKind::BigDecimal;
    if (isIntegerKind && token == TokenType::NumberFloat)
      return ts.makeError(Error::IntegerExpected, text + " is not an integer");

    switch (kind)
    {
    case ScalarKind::Byte: return detail::ParseInteger(ts, text, kind, *static_cast<int8_t*>(slot));
    case ScalarKind::Short: return detail::ParseInteger(ts, text, kind, *static_cast<int16_t*>(slot));
    case ScalarKind::Int: return detail::ParseInteger(ts, text, kind, *static_cast<int32_t*>(slot));
    case ScalarKind::Long: return detail::ParseInteger(ts, text, kind, *static_cast<int64_t*>(slot));
    case ScalarKind::Float: return detail::ParseFloat(ts, text, kind, *static_cast<float*>(slot));
    case ScalarKind::Double: return detail::ParseFloat(ts, text, kind, *static_cast<double*>(slot));

    case ScalarKind::BigInteger:
      if (!BigInteger::Parse(text, *static_cast<BigInteger*>(slot)))
      {
        BigDecimal literal;
        return ts.makeError(BigDecimal::Parse(text, literal) ? Error::IntegerExpected : Error::NumberExpected);
      }

      return {Error::None};

    case ScalarKind::BigDecimal:
      if (!BigDecimal::Parse(text, *static_cast<BigDecimal*>(slot)))
        return ts.makeError(Error::NumberExpected);

      return {Error::None};

    default:
      break;
    }

    return ts.makeError(Error::IncompatibleType, type.name());
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bindEnum(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot)
  {
    const EnumSchema& schema = type.enumSchema();
    if (schema.error())
      return ts.makeError(schema.error().type, schema.error().detail);

    TokenType token = ts.currentToken();
    if (token != TokenType::String && token != TokenType::NumberInt)
      return ts.makeError(Error::StringExpected);

    const EnumSchema::Entry* entry = schema.findWire(ts.text());
    if (!entry)
      return ts.makeError(Error::InvalidEnum, "'" + ts.text() + "' is not a value of " + schema.name());

    static_cast<const EnumAdapter&>(adapter).set(slot, entry->value);
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bindSequence(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot)
  {
    if (ts.currentToken() != TokenType::ArrayBegin)
      return ts.makeError(Error::ArrayExpected);

    const auto& sequence = static_cast<const SequenceAdapter&>(adapter);
    auto filler = sequence.fill(slot);

    size_t count = 0;
    for (;; ++count)
    {
      if (auto err = ts.nextToken())
        return err;

      if (ts.currentToken() == TokenType::ArrayEnd)
        break;

      if (auto err = bind(ts, type.element(), sequence.element(), filler->next()))
        return detail::WithPath(err, std::to_string(count));

      if (m_stopped)
        return {Error::None};
    }

    if (type.fixedSize() != 0 && count != type.fixedSize())
      return ts.makeError(Error::WrongArraySize, "expected " + std::to_string(type.fixedSize()) + " elements, got " + std::to_string(count));

    if (auto err = filler->complete())
      return ts.makeError(err, "got " + std::to_string(count) + " elements");

    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bindMap(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot)
  {
    if (ts.currentToken() != TokenType::ObjectBegin)
      return ts.makeError(Error::ObjectExpected);

    const auto& map = static_cast<const MapAdapter&>(adapter);
    map.clear(slot);

    for (;;)
    {
      if (auto err = ts.nextToken())
        return err;

      if (ts.currentToken() == TokenType::ObjectEnd)
        return {Error::None};

      if (ts.currentToken() != TokenType::FieldName)
        return ts.makeError(Error::UnexpectedEnd);

      std::string key = ts.text();

      if (auto err = ts.nextToken())
        return err;

      if (auto err = bind(ts, type.element(), map.value(), map.slot(slot, key)))
        return detail::WithPath(err, key);

      if (m_stopped)
        return {Error::None};
    }
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bindObject(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot)
  {
    if (ts.currentToken() != TokenType::ObjectBegin)
      return ts.makeError(Error::ObjectExpected);

    const ClassSchema* schema = nullptr;
    if (auto err = SchemaFor(type, schema))
    {
      err.line = ts.line();
      err.column = ts.column();
      return err;
    }

    void* obj = slot;
    if (adapter.kind() == StorageKind::Pointer)
    {
      obj = static_cast<const PointerAdapter&>(adapter).emplace(slot);
      if (!obj)
        return ts.makeError(Error::IncompatibleType, "cannot instantiate " + schema->name());
    }

    return bindObjectFields(ts, *schema, obj);
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bindObjectFields(TokenStream& ts, const ClassSchema& schema, void* obj, std::string_view guardKey)
  {
    for (;;)
    {
      if (auto err = ts.nextToken())
        return err;

      if (ts.currentToken() == TokenType::ObjectEnd)
        return {Error::None};

      if (ts.currentToken() != TokenType::FieldName)
        return ts.makeError(Error::UnexpectedEnd);

      std::string key = ts.text();

      if (!m_rp.stopAtKey.empty() && key == m_rp.stopAtKey)
      {
        m_stopped = true;
        return {Error::None};
      }

      if (!guardKey.empty() && key == guardKey)
        return detail::WithPath(ts.makeError(Error::DuplicateDiscriminator, "discriminator key '" + key + "' repeated"), key);

      if (auto err = ts.nextToken())
        return err;

      if (const BoundField* field = schema.find(key))
      {
        if (auto err = bind(ts, field->type, *field->adapter, schema.locate(*field, obj), field->quoteAsString))
          return detail::WithPath(err, key);
      }
      else if (ArrayMap<Value>* unknownKeys = schema.unknownKeys(obj))
      {
        if (auto err = bindOpen(ts, (*unknownKeys)[key]))
          return detail::WithPath(err, key);
      }
      else
      {
        if (m_rp.onUnrecognizedKey)
          m_rp.onUnrecognizedKey(key);

        if (auto err = ts.skipChildren())
          return err;
      }

      if (m_stopped)
        return {Error::None};
    }
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bindOpen(TokenStream& ts, Value& out)
  {
    switch (ts.currentToken())
    {
    case TokenType::Null:
      out = Value();
      return {Error::None};

    case TokenType::True:
    case TokenType::False:
      out = Value(ts.currentToken() == TokenType::True);
      return {Error::None};

    case TokenType::NumberInt:
    case TokenType::NumberFloat: {
      BigDecimal number;
      if (!BigDecimal::Parse(ts.text(), number))
        return ts.makeError(Error::InvalidNumber);

      out = Value(std::move(number));
      return {Error::None};
    }

    case TokenType::String:
      out = Value(ts.text());
      return {Error::None};

    case TokenType::ArrayBegin: {
      Value::Array array;
      for (;;)
      {
        if (auto err = ts.nextToken())
          return err;

        if (ts.currentToken() == TokenType::ArrayEnd)
          break;

        if (auto err = bindOpen(ts, array.emplace_back()))
          return detail::WithPath(err, std::to_string(array.size() - 1));
      }

      out = Value(std::move(array));
      return {Error::None};
    }

    case TokenType::ObjectBegin: {
      Value::Object object;
      for (;;)
      {
        if (auto err = ts.nextToken())
          return err;

        if (ts.currentToken() == TokenType::ObjectEnd)
          break;

        if (ts.currentToken() != TokenType::FieldName)
          return ts.makeError(Error::UnexpectedEnd);

        std::string key = ts.text();

        if (auto err = ts.nextToken())
          return err;

        if (auto err = bindOpen(ts, object[key]))
          return detail::WithPath(err, key);
      }

      out = Value(std::move(object));
      return {Error::None};
    }

    default:
      break;
    }

    return ts.makeError(Error::UnexpectedEnd);
  }

} // namespace jbind

#include "jbind_polymorphic.hpp"
