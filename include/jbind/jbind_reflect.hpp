#pragma once

#include <fstream>
#include <sstream>

#include "jbind_binder.hpp"
#include "jbind_generator.hpp"

namespace jbind
{

  // Binds one JSON value pulled from 'ts' into 'out'
  template <typename T>
  Error FromTokens(TokenStream& ts, T& out, const ReaderParams& rp = ReaderParams());

  // Binds one JSON value pulled from 'ts' into 'out' using an explicit descriptor
  template <typename T>
  Error FromTokens(TokenStream& ts, const Type& type, T& out, const ReaderParams& rp = ReaderParams());

  //
  template <typename T>
  Error FromString(std::string_view str, T& out, const ReaderParams& rp = ReaderParams());

  //
  template <typename T>
  Error FromString(std::string_view str, const Type& type, T& out, const ReaderParams& rp = ReaderParams());

  //
  template <typename T>
  Error FromStream(std::istream& is, T& out, const ReaderParams& rp = ReaderParams());

  //
  template <typename T>
  Error FromFile(std::string_view fileName, T& out, const ReaderParams& rp = ReaderParams());

  // Binds an Open value tree into 'out'
  template <typename T>
  Error FromValue(const Value& value, T& out, const ReaderParams& rp = ReaderParams());

  // Writes canonical JSON into stream, nothing is written on failure
  template <typename T>
  Error ToStream(std::ostream& os, const T& in, const WriterParams& wp = WriterParams());

  // Converts 'in' to JSON, 'str' is only assigned on success
  template <typename T>
  Error ToString(std::string& str, const T& in, const WriterParams& wp = WriterParams());

  //
  template <typename T>
  Error ToString(std::string& str, const Type& type, const T& in, const WriterParams& wp = WriterParams());

  //
  template <typename T>
  Error ToFile(std::string_view fileName, const T& in, const WriterParams& wp = WriterParams());

  // Converts 'in' to an Open value tree
  template <typename T>
  Error ToValue(Value& out, const T& in);

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  namespace detail
  {

    //---------------------------------------------------------------------------------------------------------------------
    inline Error BindDocument(TokenStream& ts, const Type& type, const Adapter& adapter, void* slot, const ReaderParams& rp)
    {
      if (!adapter.accepts(type))
        return {Error::IncompatibleType, 0, 0, {}, "storage cannot hold " + type.name()};

      if (auto err = ts.nextToken())
        return err;

      for (const std::string& key : rp.wrapperKeys)
      {
        if (ts.currentToken() != TokenType::ObjectBegin)
          return ts.makeError(Error::ObjectExpected, "wrapper key '" + key + "'");

        bool found = false;
        if (auto err = SkipToKey(ts, key, found))
          return err;

        if (!found)
          return ts.makeError(Error::WrapperKeyNotFound, key);
      }

      Binder binder(rp);
      if (auto err = binder.bind(ts, type, adapter, slot))
        return err;

      // Content after an unwrapped value, or after the stop key, is left unread
      if (binder.stopped() || !rp.wrapperKeys.empty())
        return {Error::None};

      if (auto err = ts.nextToken())
        return err;

      if (ts.currentToken() != TokenType::EndOfInput)
        return ts.makeError(Error::TrailingData);

      return {Error::None};
    }

    //---------------------------------------------------------------------------------------------------------------------
    inline Error BindText(CharSource& chars, const Type& type, const Adapter& adapter, void* slot, const ReaderParams& rp)
    {
      if (rp.charset == Charset::Latin1)
      {
        Latin1Source utf8(chars);
        TextTokenStream ts(utf8);
        return BindDocument(ts, type, adapter, slot, rp);
      }

      TextTokenStream ts(chars);
      return BindDocument(ts, type, adapter, slot, rp);
    }

    //---------------------------------------------------------------------------------------------------------------------
    inline Error Generate(Writer& writer, const Type& type, const Adapter& adapter, const void* value)
    {
      if (!adapter.accepts(type))
        return {Error::IncompatibleType, 0, 0, {}, "storage cannot hold " + type.name()};

      Generator generator(writer);
      if (auto err = generator.write(type, adapter, value))
        return err;

      writer.complete();
      return {Error::None};
    }

    //---------------------------------------------------------------------------------------------------------------------
    template <typename T>
    Error SchemaOf(const T&, const ClassSchema*& out)
    {
      return SchemaFor(types::Of<T>(), out);
    }

  } // namespace detail

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error FromTokens(TokenStream& ts, T& out, const ReaderParams& rp)
  {
    return detail::BindDocument(ts, types::Of<T>(), AdapterOf<T>(), &out, rp);
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error FromTokens(TokenStream& ts, const Type& type, T& out, const ReaderParams& rp)
  {
    return detail::BindDocument(ts, type, AdapterOf<T>(), &out, rp);
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error FromString(std::string_view str, T& out, const ReaderParams& rp)
  {
    detail::MemoryBlock mb(str.data(), str.size());
    return detail::BindText(mb, types::Of<T>(), AdapterOf<T>(), &out, rp);
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error FromString(std::string_view str, const Type& type, T& out, const ReaderParams& rp)
  {
    detail::MemoryBlock mb(str.data(), str.size());
    return detail::BindText(mb, type, AdapterOf<T>(), &out, rp);
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error FromStream(std::istream& is, T& out, const ReaderParams& rp)
  {
    detail::StlIstream wrapper(is);
    return detail::BindText(wrapper, types::Of<T>(), AdapterOf<T>(), &out, rp);
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error FromFile(std::string_view fileName, T& out, const ReaderParams& rp)
  {
    std::ifstream ifs(std::string(fileName).c_str(), std::ios::binary);
    if (!ifs.is_open())
      return {Error::CouldNotOpen, 0, 0, {}, std::string(fileName)};

    return FromStream(ifs, out, rp);
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error FromValue(const Value& value, T& out, const ReaderParams& rp)
  {
    ValueTokenStream ts(value);
    return detail::BindDocument(ts, types::Of<T>(), AdapterOf<T>(), &out, rp);
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error ToStream(std::ostream& os, const T& in, const WriterParams& wp)
  {
    std::string str;
    if (auto err = ToString(str, in, wp))
      return err;

    os << str;
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error ToString(std::string& str, const T& in, const WriterParams& wp)
  {
    return ToString(str, types::Of<T>(), in, wp);
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error ToString(std::string& str, const Type& type, const T& in, const WriterParams& wp)
  {
    std::ostringstream os;
    JsonWriter writer(os, wp);
    if (auto err = detail::Generate(writer, type, AdapterOf<T>(), &in))
      return err;

    str = os.str();
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error ToFile(std::string_view fileName, const T& in, const WriterParams& wp)
  {
    std::string str;
    if (auto err = ToString(str, in, wp))
      return err;

    std::ofstream ofs(std::string(fileName).c_str(), std::ios::binary);
    if (!ofs.is_open())
      return {Error::CouldNotOpen, 0, 0, {}, std::string(fileName)};

    ofs << str;
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error ToValue(Value& out, const T& in)
  {
    ValueWriter writer;
    if (auto err = detail::Generate(writer, types::Of<T>(), AdapterOf<T>(), &in))
      return err;

    out = std::move(writer.result());
    return {Error::None};
  }

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  /*

  Open container access

  Merged view over declared fields and the unknown keys of a GenericData object.
  Declared keys always go through their field, never through the unknown map.

  */

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error Get(const T& obj, std::string_view key, Value& out)
  {
    const ClassSchema* schema = nullptr;
    if (auto err = detail::SchemaOf(obj, schema))
      return err;

    if (const BoundField* field = schema->find(key))
    {
      const void* value = schema->locate(*field, &obj);
      if (Generator::IsOmitted(*field, value))
        return {Error::UnsupportedOperation, 0, 0, {}, "key '" + std::string(key) + "' is not present"};

      ValueWriter writer;
      Generator generator(writer);
      if (auto err = generator.write(field->type, *field->adapter, value, field->quoteAsString))
        return detail::WithPath(err, key);

      out = std::move(writer.result());
      return {Error::None};
    }

    if (const ArrayMap<Value>* unknownKeys = schema->unknownKeys(&obj))
    {
      if (auto iter = unknownKeys->find(key); iter != unknownKeys->end())
      {
        out = iter->second;
        return {Error::None};
      }
    }

    return {Error::UnsupportedOperation, 0, 0, {}, "key '" + std::string(key) + "' is not present"};
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error Set(T& obj, std::string_view key, const Value& value)
  {
    const ClassSchema* schema = nullptr;
    if (auto err = detail::SchemaOf(obj, schema))
      return err;

    if (const BoundField* field = schema->find(key))
    {
      ValueTokenStream ts(value);
      if (auto err = ts.nextToken())
        return err;

      ReaderParams rp;
      Binder binder(rp);
      return detail::WithPath(binder.bind(ts, field->type, *field->adapter, schema->locate(*field, &obj), field->quoteAsString), key);
    }

    ArrayMap<Value>* unknownKeys = schema->unknownKeys(&obj);
    if (!unknownKeys)
      return {Error::UnsupportedOperation, 0, 0, {}, schema->name() + " keeps no unknown keys"};

    unknownKeys->set(key, value);
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  inline Error Remove(T& obj, std::string_view key)
  {
    const ClassSchema* schema = nullptr;
    if (auto err = detail::SchemaOf(obj, schema))
      return err;

    if (schema->find(key))
      return {Error::UnsupportedOperation, 0, 0, {}, "declared key '" + std::string(key) + "' cannot be removed"};

    if (ArrayMap<Value>* unknownKeys = schema->unknownKeys(&obj))
      unknownKeys->erase(key);

    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  // Declared keys holding a value in declaration order, then unknown keys in arrival order
  template <typename T>
  inline Error Keys(const T& obj, std::vector<std::string>& out)
  {
    const ClassSchema* schema = nullptr;
    if (auto err = detail::SchemaOf(obj, schema))
      return err;

    out.clear();
    for (const BoundField& field : schema->fields())
    {
      if (!Generator::IsOmitted(field, schema->locate(field, &obj)))
        out.push_back(field.wireKey);
    }

    if (const ArrayMap<Value>* unknownKeys = schema->unknownKeys(&obj))
    {
      for (const auto& kvp : *unknownKeys)
      {
        if (!schema->find(kvp.first))
          out.push_back(kvp.first);
      }
    }

    return {Error::None};
  }

} // namespace jbind
