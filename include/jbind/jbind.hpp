#pragma once

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "jbind_base.hpp"
#include "jbind_bignum.hpp"
#include "jbind_null.hpp"

namespace jbind
{

  /*

  jbind::ArrayMap

  Small map that keeps keys in insertion order. Lookups are linear, which is
  the right trade-off for the handful of keys a JSON object usually carries.

  */
  template <typename V>
  class ArrayMap final
  {
  public:
    using value_type = std::pair<std::string, V>;
    using iterator = typename std::vector<value_type>::iterator;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    ArrayMap() = default;

    ArrayMap(std::initializer_list<value_type> entries)
    {
      for (const auto& entry : entries)
        set(entry.first, entry.second);
    }

    size_t size() const noexcept { return m_entries.size(); }
    bool empty() const noexcept { return m_entries.empty(); }
    void clear() noexcept { m_entries.clear(); }

    iterator begin() noexcept { return m_entries.begin(); }
    iterator end() noexcept { return m_entries.end(); }
    const_iterator begin() const noexcept { return m_entries.begin(); }
    const_iterator end() const noexcept { return m_entries.end(); }

    iterator find(std::string_view key) noexcept
    {
      return std::find_if(m_entries.begin(), m_entries.end(), [key](const value_type& e) { return e.first == key; });
    }

    const_iterator find(std::string_view key) const noexcept
    {
      return std::find_if(m_entries.begin(), m_entries.end(), [key](const value_type& e) { return e.first == key; });
    }

    bool contains(std::string_view key) const noexcept { return find(key) != end(); }

    // Returns existing value under 'key' or appends a default constructed one
    V& operator[](std::string_view key)
    {
      if (auto iter = find(key); iter != end())
        return iter->second;

      return m_entries.emplace_back(std::string(key), V()).second;
    }

    // Replaces the value in place, or appends when 'key' is new
    V& set(std::string_view key, V value)
    {
      V& slot = (*this)[key];
      slot = std::move(value);
      return slot;
    }

    bool erase(std::string_view key)
    {
      if (auto iter = find(key); iter != end())
      {
        m_entries.erase(iter);
        return true;
      }

      return false;
    }

    // Order insensitive, like any other map
    bool operator==(const ArrayMap& other) const
    {
      if (size() != other.size())
        return false;

      for (const auto& entry : m_entries)
      {
        auto iter = other.find(entry.first);
        if (iter == other.end() || !(iter->second == entry.second))
          return false;
      }

      return true;
    }

  private:
    std::vector<value_type> m_entries;
  };

  /*

  jbind::Value

  Owning tree for untyped ("open") JSON content. Numbers are kept as BigDecimal
  so they survive a round trip with their exact text.

  */
  class Value final
  {
  public:
    using Array = std::vector<Value>;
    using Object = ArrayMap<Value>;

    // Construct null value
    Value() noexcept
      : m_data(&OpenNull())
    {}

    // Construct null value
    explicit Value(std::nullptr_t) noexcept
      : m_data(&OpenNull())
    {}

    // Construct null value tagged with a specific sentinel
    explicit Value(const NullSentinel& sentinel) noexcept
      : m_data(&sentinel)
    {}

    // Construct boolean value
    Value(bool val) noexcept // NOLINT(google-explicit-constructor)
      : m_data(val)
    {}

    // Construct number value from any integer
    template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T val) // NOLINT(google-explicit-constructor)
      : m_data(BigDecimal(int64_t(val)))
    {}

    // Construct number value from double, using its shortest round-trip text
    Value(double val) // NOLINT(google-explicit-constructor)
    {
      char buff[64] = {};
      auto result = std::to_chars(buff, buff + sizeof(buff), val);
      BigDecimal number;
      BigDecimal::Parse(std::string_view(buff, result.ptr - buff), number);
      m_data = std::move(number);
    }

    // Construct number value
    Value(BigDecimal val) // NOLINT(google-explicit-constructor)
      : m_data(std::move(val))
    {}

    // Construct string value
    Value(const char* val) // NOLINT(google-explicit-constructor)
      : m_data(std::string(val))
    {}

    // Construct string value
    Value(std::string val) // NOLINT(google-explicit-constructor)
      : m_data(std::move(val))
    {}

    // Construct array value
    Value(Array val) // NOLINT(google-explicit-constructor)
      : m_data(std::move(val))
    {}

    // Construct object value
    Value(Object val) // NOLINT(google-explicit-constructor)
      : m_data(std::move(val))
    {}

    // Return value type
    ValueType type() const noexcept
    {
      switch (m_data.index())
      {
      case 1: return ValueType::Boolean;
      case 2: return ValueType::Number;
      case 3: return ValueType::String;
      case 4: return ValueType::Array;
      case 5: return ValueType::Object;
      default: return ValueType::Null;
      }
    }

    // Checks, if value is null
    bool isNull() const noexcept { return m_data.index() == 0; }

    // Checks, if value stores boolean. Use 'getBool' for reading.
    bool isBoolean() const noexcept { return m_data.index() == 1; }

    // Checks, if value stores number. Use 'getNumber' for reading.
    bool isNumber() const noexcept { return m_data.index() == 2; }

    // Checks, if value stores string. Use 'getString' for reading.
    bool isString() const noexcept { return m_data.index() == 3; }

    // Checks, if value stores JSON array
    bool isArray() const noexcept { return m_data.index() == 4; }

    // Checks, if value stores JSON object
    bool isObject() const noexcept { return m_data.index() == 5; }

    // Sentinel of a null value, nullptr otherwise
    const NullSentinel* nullSentinel() const noexcept { return isNull() ? std::get<0>(m_data) : nullptr; }

    bool getBool() const { return std::get<1>(m_data); }
    const BigDecimal& getNumber() const { return std::get<2>(m_data); }
    const std::string& getString() const { return std::get<3>(m_data); }
    const Array& getArray() const { return std::get<4>(m_data); }
    Array& getArray() { return std::get<4>(m_data); }
    const Object& getObject() const { return std::get<5>(m_data); }
    Object& getObject() { return std::get<5>(m_data); }

    // Equality test against another value. Object keys compare regardless of order.
    bool operator==(const Value& other) const
    {
      if (isNull() || other.isNull())
        return isNull() && other.isNull();

      return m_data == other.m_data;
    }

  private:
    std::variant<const NullSentinel*, bool, BigDecimal, std::string, Array, Object> m_data;
  };

} // namespace jbind
