#pragma once

#include <charconv>
#include <cmath>

#include "jbind_output.hpp"
#include "jbind_schema.hpp"

namespace jbind
{

  /*

  jbind::Generator

  Writes typed storage to a Writer. Object members, unknown keys and map
  entries are emitted in ascending key order, so equal values always produce
  equal text.

  */
  class Generator final
  {
  public:
    explicit Generator(Writer& writer)
      : m_writer(writer)
    {}

    Error write(const Type& type, const Adapter& adapter, const void* value, bool quoted = false);
    Error writeObject(const ClassSchema& schema, const void* obj);

    // Checks, if the member is left out of generated objects (absent, empty or void)
    static bool IsOmitted(const BoundField& field, const void* value);

  private:
    struct Member
    {
      std::string_view key;
      const BoundField* field = nullptr;
      const Value* unknown = nullptr;
    };

    Error writeScalar(const Type& type, const void* value, bool quoted);
    Error writeEnum(const Type& type, const Adapter& adapter, const void* value);
    Error writeSequence(const Type& type, const Adapter& adapter, const void* value);
    Error writeMap(const Type& type, const Adapter& adapter, const void* value);
    Error writePointer(const Type& type, const Adapter& adapter, const void* value);

    Writer& m_writer;
  };

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  namespace detail
  {

    //---------------------------------------------------------------------------------------------------------------------
    template <typename T>
    Error FloatLiteral(T number, std::string& out)
    {
      if (!std::isfinite(number))
        return {Error::NonFiniteNumber, 0, 0, {}, std::isnan(number) ? "NaN" : (number > 0 ? "Infinity" : "-Infinity")};

      char buff[64] = {};
      auto result = std::to_chars(buff, buff + sizeof(buff), number);
      out.assign(buff, result.ptr);
      return {Error::None};
    }

  } // namespace detail

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Generator::write(const Type& type, const Adapter& adapter, const void* value, bool quoted)
  {
    switch (adapter.kind())
    {
    case StorageKind::Nullable: {
      const auto& nullable = static_cast<const NullableAdapter&>(adapter);
      if (!nullable.isSet(value) || nullable.isNull(value))
      {
        m_writer.writeNull();
        return {Error::None};
      }

      return write(type, nullable.inner(), nullable.value(value), quoted);
    }

    case StorageKind::Any: {
      const Any& any = *static_cast<const Any*>(value);
      if (!any.hasValue())
      {
        m_writer.writeNull();
        return {Error::None};
      }

      const Adapter& inner = *any.adapter();
      return write(inner.accepts(type) ? type : inner.natural(), inner, any.data(), quoted);
    }

    case StorageKind::Open:
      Write(m_writer, *static_cast<const Value*>(value));
      return {Error::None};

    case StorageKind::Scalar:
      return writeScalar(type, value, quoted);

    case StorageKind::Enum:
      return writeEnum(type, adapter, value);

    case StorageKind::Sequence:
      return writeSequence(type, adapter, value);

    case StorageKind::Map:
      return writeMap(type, adapter, value);

    case StorageKind::Pointer:
      return writePointer(type, adapter, value);

    case StorageKind::Object: {
      const ClassSchema* schema = nullptr;
      if (auto err = SchemaFor(type, schema))
        return err;

      return writeObject(*schema, value);
    }
    }

    return {Error::IncompatibleType, 0, 0, {}, type.name()};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline bool Generator::IsOmitted(const BoundField& field, const void* value)
  {
    switch (field.adapter->kind())
    {
    case StorageKind::Nullable: return !static_cast<const NullableAdapter*>(field.adapter)->isSet(value);
    case StorageKind::Any: return !static_cast<const Any*>(value)->isSet();
    case StorageKind::Pointer: {
      const auto* pointer = static_cast<const PointerAdapter*>(field.adapter);
      return !pointer->get(value) && !pointer->isNull(value, SentinelFor(field.type));
    }
    case StorageKind::Scalar: return field.type.scalarKind() == ScalarKind::Void;
    default: return false;
    }
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Generator::writeObject(const ClassSchema& schema, const void* obj)
  {
    std::vector<Member> members;

    for (const BoundField& field : schema.fields())
    {
      if (!IsOmitted(field, schema.locate(field, obj)))
        members.push_back({field.wireKey, &field, nullptr});
    }

    if (const ArrayMap<Value>* unknownKeys = schema.unknownKeys(obj))
    {
      for (const auto& kvp : *unknownKeys)
      {
        if (!schema.find(kvp.first))
          members.push_back({kvp.first, nullptr, &kvp.second});
      }
    }

    if (members.empty())
    {
      m_writer.writeEmptyObject();
      return {Error::None};
    }

    std::sort(members.begin(), members.end(), [](const Member& a, const Member& b) { return a.key < b.key; });

    m_writer.beginObject();
    for (const Member& member : members)
    {
      m_writer.beginObjectElement();
      m_writer.writeObjectKey(member.key);

      if (member.unknown)
      {
        Write(m_writer, *member.unknown);
        continue;
      }

      const BoundField& field = *member.field;
      if (auto err = write(field.type, *field.adapter, schema.locate(field, obj), field.quoteAsString))
        return detail::WithPath(err, member.key);
    }

    m_writer.endObject();
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Generator::writeScalar(const Type& type, const void* value, bool quoted)
  {
    std::string literal;

    switch (type.scalarKind())
    {
    case ScalarKind::String:
      m_writer.writeString(*static_cast<const std::string*>(value));
      return {Error::None};

    case ScalarKind::Void:
      m_writer.writeNull();
      return {Error::None};

    case ScalarKind::Boolean:
      if (!quoted)
      {
        m_writer.writeBoolean(*static_cast<const bool*>(value));
        return {Error::None};
      }

      literal = *static_cast<const bool*>(value) ? "true" : "false";
      break;

    case ScalarKind::Byte: literal = std::to_string(*static_cast<const int8_t*>(value)); break;
    case ScalarKind::Short: literal = std::to_string(*static_cast<const int16_t*>(value)); break;
    case ScalarKind::Int: literal = std::to_string(*static_cast<const int32_t*>(value)); break;
    case ScalarKind::Long: literal = std::to_string(*static_cast<const int64_t*>(value)); break;

    case ScalarKind::Float:
      if (auto err = detail::FloatLiteral(*static_cast<const float*>(value), literal))
        return err;

      break;

    case ScalarKind::Double:
      if (auto err = detail::FloatLiteral(*static_cast<const double*>(value), literal))
        return err;

      break;

    case ScalarKind::BigInteger: literal = static_cast<const BigInteger*>(value)->toString(); break;
    case ScalarKind::BigDecimal: literal = static_cast<const BigDecimal*>(value)->toString(); break;
    }

    if (quoted)
      m_writer.writeString(literal);
    else
      m_writer.writeNumber(literal);

    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Generator::writeEnum(const Type& type, const Adapter& adapter, const void* value)
  {
    const auto& enumAdapter = static_cast<const EnumAdapter&>(adapter);
    const EnumSchema& schema = type.enumSchema();
    if (schema.error())
      return schema.error();

    int64_t constant = enumAdapter.get(value);
    if (schema.nullValue() && *schema.nullValue() == constant)
    {
      m_writer.writeNull();
      return {Error::None};
    }

    const EnumSchema::Entry* entry = schema.findValue(constant);
    if (!entry)
      return {Error::InvalidEnum, 0, 0, {}, "constant " + std::to_string(constant) + " of " + schema.name() + " has no wire value"};

    m_writer.writeString(entry->wireValue);
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Generator::writeSequence(const Type& type, const Adapter& adapter, const void* value)
  {
    const auto& sequence = static_cast<const SequenceAdapter&>(adapter);
    if (sequence.size(value) == 0)
    {
      m_writer.writeEmptyArray();
      return {Error::None};
    }

    m_writer.beginArray();

    size_t index = 0;
    auto err = sequence.forEach(value, [&](const void* item) {
      m_writer.beginArrayElement();
      return detail::WithPath(write(type.element(), sequence.element(), item), std::to_string(index++));
    });

    if (err)
      return err;

    m_writer.endArray();
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Generator::writeMap(const Type& type, const Adapter& adapter, const void* value)
  {
    const auto& map = static_cast<const MapAdapter&>(adapter);
    if (map.size(value) == 0)
    {
      m_writer.writeEmptyObject();
      return {Error::None};
    }

    std::vector<std::pair<const std::string*, const void*>> entries;
    auto collected = map.forEach(value, [&entries](const std::string& key, const void* item) {
      entries.emplace_back(&key, item);
      return Error {Error::None};
    });

    if (collected)
      return collected;

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) { return *a.first < *b.first; });

    m_writer.beginObject();
    for (const auto& [key, item] : entries)
    {
      m_writer.beginObjectElement();
      m_writer.writeObjectKey(*key);

      if (auto err = write(type.element(), map.value(), item))
        return detail::WithPath(err, *key);
    }

    m_writer.endObject();
    return {Error::None};
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Generator::writePointer(const Type& type, const Adapter& adapter, const void* value)
  {
    const auto& pointer = static_cast<const PointerAdapter&>(adapter);

    void* obj = pointer.get(value);
    if (!obj)
    {
      m_writer.writeNull();
      return {Error::None};
    }

    Type concrete = types::Object(pointer.pointee());
    if (type.kind() == TypeKind::Object)
    {
      concrete = type;
    }
    else if (type.kind() == TypeKind::Polymorphic)
    {
      // Written through the schema of the dynamic type
      if (const auto* subtype = type.polymorphic().findByType(pointer.dynamicType(value)))
      {
        concrete = types::Object(subtype->ref);
        obj = subtype->toSubtype(obj);
      }
    }

    const ClassSchema* schema = nullptr;
    if (auto err = SchemaFor(concrete, schema))
      return err;

    return writeObject(*schema, obj);
  }

} // namespace jbind
