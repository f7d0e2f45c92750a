#pragma once

#include <iomanip>
#include <ostream>
#include <sstream>

#include "jbind.hpp"

namespace jbind
{

  /*

  jbind::Writer

  Sink for generated JSON. Numbers arrive as finished literals.

  */
  class Writer
  {
  public:
    virtual ~Writer() = default;

    virtual void writeNull() = 0;
    virtual void writeBoolean(bool boolean) = 0;
    virtual void writeNumber(std::string_view literal) = 0;
    virtual void writeString(std::string_view str) = 0;

    virtual void beginArray() = 0;
    virtual void beginArrayElement() = 0;
    virtual void endArray() = 0;
    virtual void writeEmptyArray() = 0;

    virtual void beginObject() = 0;
    virtual void beginObjectElement() = 0;
    virtual void writeObjectKey(std::string_view str) = 0;
    virtual void endObject() = 0;
    virtual void writeEmptyObject() = 0;

    virtual void complete() = 0;
  };

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  class JsonWriter : public Writer
  {
  public:
    JsonWriter(std::ostream& os, const WriterParams& wp)
      : m_os(os)
      , m_wp(wp)
    {
      m_eol = wp.eol;

      if (wp.compact)
      {
        m_depth = -1;
        m_kvSeparator = ":";
        m_eol = "";
      }
    }

    void writeNull() override { m_os << "null"; }
    void writeBoolean(bool boolean) override { m_os << (boolean ? "true" : "false"); }
    void writeNumber(std::string_view literal) override { m_os << literal; }

    void writeString(std::string_view str) override
    {
      m_os << '"';

      for (size_t i = 0; i < str.size(); ++i)
      {
        uint8_t ch = uint8_t(str[i]);

        if (ch == '"')
          m_os << "\\\"";
        else if (ch == '\\')
          m_os << "\\\\";
        else if (ch == '\n')
          m_os << "\\n";
        else if (ch == '\r')
          m_os << "\\r";
        else if (ch == '\t')
          m_os << "\\t";
        else if (ch == '\b')
          m_os << "\\b";
        else if (ch == '\f')
          m_os << "\\f";
        else if (ch < 0x20)
          writeEscaped(ch);
        else if (ch >= 0x80 && m_wp.escapeUnicode)
          i = writeCodePoint(str, i);
        else
          m_os << char(ch);
      }

      m_os << '"';
    }

    void push()
    {
      m_firstElementStack.push_back(m_firstElement);
      m_firstElement = true;
      if (m_depth != -1)
        m_depth++;
    }

    void pop()
    {
      m_firstElement = m_firstElementStack.back();
      m_firstElementStack.pop_back();
      if (m_depth != -1)
        m_depth--;
    }

    void writeSeparatorAndIndent()
    {
      if (m_firstElement)
        m_firstElement = false;
      else
        m_os << ",";

      m_os << m_eol;
      indent();
    }

    void indent()
    {
      for (int i = 0; i < m_depth; ++i) m_os << m_wp.indentation;
    }

    void beginArray() override
    {
      push();
      m_os << "[";
    }

    void beginArrayElement() override { writeSeparatorAndIndent(); }

    void endArray() override
    {
      m_os << m_eol;
      pop();
      indent();
      m_os << "]";
    }

    void writeEmptyArray() override { m_os << "[]"; }

    void beginObject() override
    {
      push();
      m_os << "{";
    }

    void writeObjectKey(std::string_view str) override
    {
      writeString(str);
      m_os << m_kvSeparator;
    }

    void endObject() override
    {
      m_os << m_eol;
      pop();
      indent();
      m_os << "}";
    }

    void beginObjectElement() override { writeSeparatorAndIndent(); }
    void writeEmptyObject() override { m_os << "{}"; }

    void complete() override { m_os << m_eol; }

  protected:
    void writeEscaped(uint32_t unit)
    {
      m_os << "\\u" << std::hex << std::setfill('0') << std::setw(4) << unit << std::dec;
    }

    // Writes the UTF-8 sequence starting at 'i' as \u escapes, returns index of its last byte
    size_t writeCodePoint(std::string_view str, size_t i)
    {
      uint8_t lead = uint8_t(str[i]);
      size_t extra = 0;
      uint32_t ch = 0;

      if ((lead & 0b1110'0000u) == 0b1100'0000u)
      {
        extra = 1;
        ch = lead & 0b0001'1111u;
      }
      else if ((lead & 0b1111'0000u) == 0b1110'0000u)
      {
        extra = 2;
        ch = lead & 0b0000'1111u;
      }
      else if ((lead & 0b1111'1000u) == 0b1111'0000u)
      {
        extra = 3;
        ch = lead & 0b0000'0111u;
      }
      else
      {
        m_os << char(lead);
        return i;
      }

      for (size_t k = 0; k < extra && i + 1 < str.size(); ++k)
        ch = (ch << 6) | (uint8_t(str[++i]) & 0b0011'1111u);

      if (ch > 0xffff)
      {
        ch -= 0x10000;
        writeEscaped(0xd800 + (ch >> 10));
        writeEscaped(0xdc00 + (ch & 0x3ff));
      }
      else
      {
        writeEscaped(ch);
      }

      return i;
    }

    std::ostream& m_os;
    const WriterParams& m_wp;

    bool m_firstElement = false;
    std::vector<bool> m_firstElementStack;
    int m_depth = 0;
    const char* m_kvSeparator = ": ";
    const char* m_eol;
  };

  /*

  jbind::ValueWriter

  Collects generated JSON into an Open value tree instead of text.

  */
  class ValueWriter : public Writer
  {
  public:
    void writeNull() override { place(Value()); }
    void writeBoolean(bool boolean) override { place(Value(boolean)); }

    void writeNumber(std::string_view literal) override
    {
      BigDecimal number;
      BigDecimal::Parse(literal, number);
      place(Value(std::move(number)));
    }

    void writeString(std::string_view str) override { place(Value(std::string(str))); }

    void beginArray() override { m_stack.push_back(&place(Value(Value::Array()))); }
    void beginArrayElement() override {}
    void endArray() override { m_stack.pop_back(); }
    void writeEmptyArray() override { place(Value(Value::Array())); }

    void beginObject() override { m_stack.push_back(&place(Value(Value::Object()))); }
    void beginObjectElement() override {}
    void writeObjectKey(std::string_view str) override { m_key = str; }
    void endObject() override { m_stack.pop_back(); }
    void writeEmptyObject() override { place(Value(Value::Object())); }

    void complete() override {}

    Value& result() noexcept { return m_root; }

  private:
    Value& place(Value value)
    {
      if (m_stack.empty())
      {
        m_root = std::move(value);
        return m_root;
      }

      Value& parent = *m_stack.back();
      if (parent.isArray())
        return parent.getArray().emplace_back(std::move(value));

      return parent.getObject().set(m_key, std::move(value));
    }

    Value m_root;
    std::vector<Value*> m_stack;
    std::string m_key;
  };

  //---------------------------------------------------------------------------------------------------------------------
  // Writes an Open value, object keys in lexicographic order
  inline void Write(Writer& writer, const Value& v)
  {
    if (v.isNull())
    {
      writer.writeNull();
    }
    else if (v.isBoolean())
    {
      writer.writeBoolean(v.getBool());
    }
    else if (v.isNumber())
    {
      writer.writeNumber(v.getNumber().toString());
    }
    else if (v.isString())
    {
      writer.writeString(v.getString());
    }
    else if (v.isArray())
    {
      if (const auto& av = v.getArray(); !av.empty())
      {
        writer.beginArray();
        for (const Value& item : av)
        {
          writer.beginArrayElement();
          Write(writer, item);
        }

        writer.endArray();
      }
      else
      {
        writer.writeEmptyArray();
      }
    }
    else if (v.isObject())
    {
      if (const auto& ov = v.getObject(); !ov.empty())
      {
        std::vector<const Value::Object::value_type*> sorted;
        for (const auto& kvp : ov)
          sorted.push_back(&kvp);

        std::sort(sorted.begin(), sorted.end(), [](auto* a, auto* b) { return a->first < b->first; });

        writer.beginObject();
        for (const auto* kvp : sorted)
        {
          writer.beginObjectElement();
          writer.writeObjectKey(kvp->first);
          Write(writer, kvp->second);
        }

        writer.endObject();
      }
      else
      {
        writer.writeEmptyObject();
      }
    }
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline void ToStream(std::ostream& os, const Error& err)
  {
    os << err.TypeString[err.type] << " at " << err.line << ":" << err.column;

    if (!err.path.empty())
      os << " [" << err.path << "]";

    if (!err.detail.empty())
      os << ": " << err.detail;
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline std::string ToString(const Error& err)
  {
    std::ostringstream os;
    ToStream(os, err);
    return os.str();
  }

} // namespace jbind
