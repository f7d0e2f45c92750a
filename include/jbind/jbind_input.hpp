#pragma once

#include <charconv>
#include <cstring>
#include <istream>

#include "jbind.hpp"

namespace jbind
{

  /*

  jbind::TokenStream

  Lazy, forward only producer of JSON tokens. Field names and string values
  are unescaped into 'text', number tokens keep their literal text.

  */
  class TokenStream
  {
  public:
    virtual ~TokenStream() = default;

    // Advances to the next token, EndOfInput once the root value is complete
    virtual Error nextToken() = 0;

    TokenType currentToken() const noexcept { return m_token; }
    const std::string& text() const noexcept { return m_text; }
    int line() const noexcept { return m_line; }
    int column() const noexcept { return m_column; }

    Error makeError(int type, std::string detail = {}) const { return Error {type, m_line, m_column, {}, std::move(detail)}; }

    // On ObjectBegin or ArrayBegin, advances to the matching end token. Does nothing on other tokens.
    Error skipChildren()
    {
      if (m_token != TokenType::ObjectBegin && m_token != TokenType::ArrayBegin)
        return {Error::None};

      int depth = 1;
      while (depth > 0)
      {
        if (auto err = nextToken())
          return err;

        if (m_token == TokenType::ObjectBegin || m_token == TokenType::ArrayBegin)
          ++depth;
        else if (m_token == TokenType::ObjectEnd || m_token == TokenType::ArrayEnd)
          --depth;
        else if (m_token == TokenType::EndOfInput)
          return makeError(Error::UnexpectedEnd);
      }

      return {Error::None};
    }

  protected:
    TokenType m_token = TokenType::None;
    std::string m_text;
    int m_line = 0;
    int m_column = 0;
  };

  //---------------------------------------------------------------------------------------------------------------------
  // Appends code point 'ch' to 's' as UTF-8
  inline void AppendUtf8(std::string& s, uint32_t ch)
  {
    if (ch <= 0x7f)
    {
      s += char(ch);
    }
    else if (ch <= 0x7ff)
    {
      s += char(0xc0 | (ch >> 6));
      s += char(0x80 | (ch & 0x3f));
    }
    else if (ch <= 0xffff)
    {
      s += char(0xe0 | (ch >> 12));
      s += char(0x80 | ((ch >> 6) & 0x3f));
      s += char(0x80 | (ch & 0x3f));
    }
    else if (ch <= 0x10ffff)
    {
      s += char(0xf0 | (ch >> 18));
      s += char(0x80 | ((ch >> 12) & 0x3f));
      s += char(0x80 | ((ch >> 6) & 0x3f));
      s += char(0x80 | (ch & 0x3f));
    }
  }

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  namespace detail
  {

    //---------------------------------------------------------------------------------------------------------------------
    class StlIstream : public CharSource
    {
    public:
      explicit StlIstream(std::istream& is)
        : m_is(is)
      {}

      int next() override
      {
        if (m_is.peek() == '\n')
        {
          m_column = 0;
          ++m_line;
        }

        ++m_column;
        return m_is.get();
      }

      int peek() override { return m_is.peek(); }

      bool eof() const override { return m_is.eof() || m_is.fail(); }

    protected:
      std::istream& m_is;
    };

    //---------------------------------------------------------------------------------------------------------------------
    class MemoryBlock : public CharSource
    {
    public:
      MemoryBlock(const void* ptr, size_t size)
        : m_cursor(reinterpret_cast<const char*>(ptr))
        , m_size(ptr ? size : 0)
      {
      }

      int next() override
      {
        if (m_size == 0)
          return -1;

        int ch = uint8_t(*m_cursor++);

        if (ch == '\n')
        {
          m_column = 0;
          ++m_line;
        }

        ++m_column;
        --m_size;
        return ch;
      }

      int peek() override
      {
        if (m_size == 0)
          return -1;

        return uint8_t(*m_cursor);
      }

      bool eof() const override { return m_size == 0; }

    protected:
      const char* m_cursor = nullptr;
      size_t m_size = 0;
    };

    //---------------------------------------------------------------------------------------------------------------------
    // Transcodes ISO-8859-1 bytes into UTF-8
    class Latin1Source : public CharSource
    {
    public:
      explicit Latin1Source(CharSource& bytes)
        : m_bytes(bytes)
      {}

      int next() override
      {
        if (m_pending >= 0)
        {
          int ch = m_pending;
          m_pending = -1;
          return ch;
        }

        int ch = m_bytes.next();
        m_line = m_bytes.line();
        m_column = m_bytes.column();

        if (ch >= 0x80)
        {
          m_pending = 0x80 | (ch & 0x3f);
          return 0xc0 | (ch >> 6);
        }

        return ch;
      }

      int peek() override
      {
        if (m_pending >= 0)
          return m_pending;

        int ch = m_bytes.peek();
        return ch >= 0x80 ? 0xc0 | (ch >> 6) : ch;
      }

      bool eof() const override { return m_pending < 0 && m_bytes.eof(); }

    private:
      CharSource& m_bytes;
      int m_pending = -1;
    };

    inline bool IsDigit(int ch) { return ch >= '0' && ch <= '9'; }
    inline bool IsAlpha(int ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

  } // namespace detail

  /*

  jbind::TextTokenStream

  Strict JSON (RFC 4627 subset) tokenizer over a character source. After the
  root value only whitespace may follow, anything else is reported as trailing data.

  */
  class TextTokenStream final : public TokenStream
  {
  public:
    explicit TextTokenStream(detail::CharSource& chars)
      : m_chars(chars)
    {}

    Error nextToken() override;

  private:
    enum class State
    {
      RootValue,
      FirstKeyOrEnd,
      Key,
      Colon,
      FirstValueOrEnd,
      Value,
      CommaOrEnd,
      Done
    };

    int next() { return m_chars.next(); }
    int peek() { return m_chars.peek(); }
    Error charError(int type, std::string detail = {}) const { return m_chars.makeError(type, std::move(detail)); }

    void skipWhitespace()
    {
      for (int ch = peek(); ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; ch = peek())
        next();
    }

    void markToken()
    {
      m_line = m_chars.line();
      m_column = m_chars.column();
    }

    void endContainer(TokenType type)
    {
      next(); // Consume '}' or ']'
      m_token = type;
      m_text.clear();
      m_stack.pop_back();
      m_state = State::CommaOrEnd;
    }

    Error parseValue();
    Error parseString(std::string& out);
    Error parseHex(uint32_t& out);
    Error parseNumber();
    Error parseLiteral();

    detail::CharSource& m_chars;
    State m_state = State::RootValue;
    std::vector<char> m_stack;
  };

  /*

  jbind::ValueTokenStream

  Walks an Open value tree as if it was JSON text. Object members come in
  their stored order.

  */
  class ValueTokenStream final : public TokenStream
  {
  public:
    explicit ValueTokenStream(const Value& root)
      : m_root(root)
    {}

    Error nextToken() override
    {
      if (!m_started)
      {
        m_started = true;
        emit(m_root);
        return {Error::None};
      }

      if (m_stack.empty())
      {
        m_token = TokenType::EndOfInput;
        m_text.clear();
        return {Error::None};
      }

      Frame& top = m_stack.back();
      if (top.container->isArray())
      {
        const Value::Array& array = top.container->getArray();
        if (top.index < array.size())
        {
          emit(array[top.index++]);
          return {Error::None};
        }

        m_stack.pop_back();
        m_token = TokenType::ArrayEnd;
        m_text.clear();
        return {Error::None};
      }

      const Value::Object& object = top.container->getObject();
      if (top.index < object.size())
      {
        const auto& member = *(object.begin() + top.index);
        if (!top.valuePending)
        {
          top.valuePending = true;
          m_token = TokenType::FieldName;
          m_text = member.first;
          return {Error::None};
        }

        top.valuePending = false;
        ++top.index;
        emit(member.second);
        return {Error::None};
      }

      m_stack.pop_back();
      m_token = TokenType::ObjectEnd;
      m_text.clear();
      return {Error::None};
    }

  private:
    struct Frame
    {
      const Value* container = nullptr;
      size_t index = 0;
      bool valuePending = false;
    };

    void emit(const Value& value)
    {
      m_text.clear();

      switch (value.type())
      {
      case ValueType::Null:
        m_token = TokenType::Null;
        m_text = "null";
        break;

      case ValueType::Boolean:
        m_token = value.getBool() ? TokenType::True : TokenType::False;
        m_text = value.getBool() ? "true" : "false";
        break;

      case ValueType::Number:
        m_token = value.getNumber().scale() == 0 ? TokenType::NumberInt : TokenType::NumberFloat;
        m_text = value.getNumber().toString();
        break;

      case ValueType::String:
        m_token = TokenType::String;
        m_text = value.getString();
        break;

      case ValueType::Array:
        m_token = TokenType::ArrayBegin;
        m_stack.push_back({&value, 0, false});
        break;

      case ValueType::Object:
        m_token = TokenType::ObjectBegin;
        m_stack.push_back({&value, 0, false});
        break;
      }
    }

    const Value& m_root;
    bool m_started = false;
    std::vector<Frame> m_stack;
  };

  //---------------------------------------------------------------------------------------------------------------------
  struct RecordedToken
  {
    TokenType type = TokenType::None;
    std::string text;
    int line = 0;
    int column = 0;
  };

  using TokenSpan = std::vector<RecordedToken>;

  //---------------------------------------------------------------------------------------------------------------------
  // Records the value starting at the current token and leaves the stream on its last token
  inline Error RecordValue(TokenStream& ts, TokenSpan& span)
  {
    int depth = 0;
    for (;;)
    {
      TokenType token = ts.currentToken();
      if (token == TokenType::EndOfInput || token == TokenType::None)
        return ts.makeError(Error::UnexpectedEnd);

      span.push_back({token, ts.text(), ts.line(), ts.column()});

      if (token == TokenType::ObjectBegin || token == TokenType::ArrayBegin)
        ++depth;
      else if (token == TokenType::ObjectEnd || token == TokenType::ArrayEnd)
        --depth;

      if (depth == 0)
        return {Error::None};

      if (auto err = ts.nextToken())
        return err;
    }
  }

  /*

  jbind::BufferedTokenStream

  Replays recorded tokens with their original positions.

  */
  class BufferedTokenStream final : public TokenStream
  {
  public:
    explicit BufferedTokenStream(TokenSpan tokens)
      : m_tokens(std::move(tokens))
    {}

    Error nextToken() override
    {
      if (m_position >= m_tokens.size())
      {
        m_token = TokenType::EndOfInput;
        m_text.clear();
        return {Error::None};
      }

      RecordedToken& token = m_tokens[m_position++];
      m_token = token.type;
      m_text = std::move(token.text);
      m_line = token.line;
      m_column = token.column;
      return {Error::None};
    }

  private:
    TokenSpan m_tokens;
    size_t m_position = 0;
  };

  //---------------------------------------------------------------------------------------------------------------------
  // Inside an object (on its ObjectBegin or on the last token of a member value), advances
  // to the value of 'key'. 'found' stays false when the object ends first.
  inline Error SkipToKey(TokenStream& ts, std::string_view key, bool& found)
  {
    found = false;
    for (;;)
    {
      if (auto err = ts.nextToken())
        return err;

      if (ts.currentToken() != TokenType::FieldName)
        return {Error::None};

      bool match = ts.text() == key;

      if (auto err = ts.nextToken())
        return err;

      if (match)
      {
        found = true;
        return {Error::None};
      }

      if (auto err = ts.skipChildren())
        return err;
    }
  }

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  //---------------------------------------------------------------------------------------------------------------------
  inline Error TextTokenStream::nextToken()
  {
    skipWhitespace();
    markToken();

    int ch = peek();
    switch (m_state)
    {
    case State::Done:
      if (ch < 0)
      {
        m_token = TokenType::EndOfInput;
        m_text.clear();
        return {Error::None};
      }

      return charError(Error::TrailingData);

    case State::CommaOrEnd:
      if (m_stack.empty())
      {
        m_state = State::Done;
        return nextToken();
      }

      if (ch < 0)
        return charError(Error::UnexpectedEnd);

      if (ch == ',')
      {
        next(); // Consume ','
        m_state = m_stack.back() == '{' ? State::Key : State::Value;
        return nextToken();
      }

      if (ch == '}' && m_stack.back() == '{')
      {
        endContainer(TokenType::ObjectEnd);
        return {Error::None};
      }

      if (ch == ']' && m_stack.back() == '[')
      {
        endContainer(TokenType::ArrayEnd);
        return {Error::None};
      }

      return charError(Error::CommaExpected);

    case State::FirstKeyOrEnd:
      if (ch == '}')
      {
        endContainer(TokenType::ObjectEnd);
        return {Error::None};
      }

      [[fallthrough]];

    case State::Key:
      if (ch < 0)
        return charError(Error::UnexpectedEnd);

      if (ch != '"')
        return charError(Error::SyntaxError, "object key must be a string");

      if (auto err = parseString(m_text))
        return err;

      m_token = TokenType::FieldName;
      m_state = State::Colon;
      return {Error::None};

    case State::Colon:
      if (ch < 0)
        return charError(Error::UnexpectedEnd);

      if (ch != ':')
        return charError(Error::ColonExpected);

      next(); // Consume ':'
      skipWhitespace();
      markToken();
      return parseValue();

    case State::FirstValueOrEnd:
      if (ch == ']')
      {
        endContainer(TokenType::ArrayEnd);
        return {Error::None};
      }

      [[fallthrough]];

    case State::RootValue:
    case State::Value:
      return parseValue();
    }

    return charError(Error::SyntaxError);
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error TextTokenStream::parseValue()
  {
    int ch = peek();
    if (ch < 0)
      return charError(Error::UnexpectedEnd);

    m_state = State::CommaOrEnd;

    switch (ch)
    {
    case '{':
      next(); // Consume '{'
      m_stack.push_back('{');
      m_token = TokenType::ObjectBegin;
      m_text.clear();
      m_state = State::FirstKeyOrEnd;
      return {Error::None};

    case '[':
      next(); // Consume '['
      m_stack.push_back('[');
      m_token = TokenType::ArrayBegin;
      m_text.clear();
      m_state = State::FirstValueOrEnd;
      return {Error::None};

    case '"':
      m_token = TokenType::String;
      return parseString(m_text);

    case 't':
    case 'f':
    case 'n':
      return parseLiteral();

    default:
      if (ch == '-' || detail::IsDigit(ch))
        return parseNumber();

      return charError(Error::SyntaxError);
    }
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error TextTokenStream::parseString(std::string& out)
  {
    next(); // Consume '"'
    out.clear();

    for (;;)
    {
      int ch = next();
      if (ch < 0)
        return charError(Error::UnexpectedEnd);

      if (ch == '"')
        return {Error::None};

      if (ch < 0x20)
        return charError(Error::SyntaxError, "unescaped control character in string");

      if (ch != '\\')
      {
        out += char(ch);
        continue;
      }

      ch = next();
      switch (ch)
      {
      case '"': out += '"'; break;
      case '\\': out += '\\'; break;
      case '/': out += '/'; break;
      case 'b': out += '\b'; break;
      case 'f': out += '\f'; break;
      case 'n': out += '\n'; break;
      case 'r': out += '\r'; break;
      case 't': out += '\t'; break;

      case 'u': {
        uint32_t code = 0;
        if (auto err = parseHex(code))
          return err;

        if (code >= 0xd800 && code <= 0xdbff)
        {
          uint32_t low = 0;
          if (next() != '\\' || next() != 'u')
            return charError(Error::InvalidEscapeSeq, "unpaired surrogate");

          if (auto err = parseHex(low))
            return err;

          if (low < 0xdc00 || low > 0xdfff)
            return charError(Error::InvalidEscapeSeq, "unpaired surrogate");

          code = 0x10000 + ((code - 0xd800) << 10) + (low - 0xdc00);
        }
        else if (code >= 0xdc00 && code <= 0xdfff)
        {
          return charError(Error::InvalidEscapeSeq, "unpaired surrogate");
        }

        AppendUtf8(out, code);
      }
      break;

      case -1:
        return charError(Error::UnexpectedEnd);

      default:
        return charError(Error::InvalidEscapeSeq);
      }
    }
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error TextTokenStream::parseHex(uint32_t& out)
  {
    static const constexpr char* HexChars = "0123456789abcdefABCDEF";

    char code[4] = {};
    for (char& c : code)
    {
      int ch = next();
      if (ch <= 0 || !strchr(HexChars, ch))
        return charError(ch < 0 ? Error::UnexpectedEnd : Error::InvalidEscapeSeq);

      c = char(ch);
    }

    std::from_chars(code, code + 4, out, 16);
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error TextTokenStream::parseNumber()
  {
    m_text.clear();

    auto digits = [this]() {
      size_t count = 0;
      while (detail::IsDigit(peek()))
      {
        m_text += char(next());
        ++count;
      }

      return count;
    };

    bool isFloat = false;

    if (peek() == '-')
      m_text += char(next());

    if (peek() == '0')
      m_text += char(next());
    else if (digits() == 0)
      return charError(Error::InvalidNumber);

    if (peek() == '.')
    {
      isFloat = true;
      m_text += char(next());
      if (digits() == 0)
        return charError(Error::InvalidNumber);
    }

    if (peek() == 'e' || peek() == 'E')
    {
      isFloat = true;
      m_text += char(next());
      if (peek() == '+' || peek() == '-')
        m_text += char(next());

      if (digits() == 0)
        return charError(Error::InvalidNumber);
    }

    if (int ch = peek(); detail::IsDigit(ch) || detail::IsAlpha(ch) || ch == '.')
      return charError(Error::InvalidNumber);

    m_token = isFloat ? TokenType::NumberFloat : TokenType::NumberInt;
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error TextTokenStream::parseLiteral()
  {
    m_text.clear();
    while (detail::IsAlpha(peek()))
      m_text += char(next());

    if (m_text == "true")
      m_token = TokenType::True;
    else if (m_text == "false")
      m_token = TokenType::False;
    else if (m_text == "null")
      m_token = TokenType::Null;
    else
      return makeError(Error::InvalidLiteral);

    return {Error::None};
  }

} // namespace jbind
