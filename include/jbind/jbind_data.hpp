#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <typeindex>

#include "jbind_types.hpp"

namespace jbind
{

  //---------------------------------------------------------------------------------------------------------------------
  enum class StorageKind
  {
    Scalar,
    Enum,
    Sequence,
    Map,
    Object,
    Pointer,
    Nullable,
    Open,
    Any
  };

  /*

  jbind::Adapter

  Type-erased access to one C++ storage type. The binder and the generator only
  ever see storage through an adapter and a void pointer to the storage.

  */
  class Adapter
  {
  public:
    virtual ~Adapter() = default;

    virtual StorageKind kind() const noexcept = 0;
    virtual std::type_index type() const noexcept = 0;

    // Descriptor used for members declared without an explicit type
    virtual Type natural() const = 0;

    // Checks, if a resolved descriptor can be stored here
    virtual bool accepts(const Type& type) const = 0;

    virtual std::shared_ptr<void> create() const = 0;
    virtual void assign(void* to, const void* from) const = 0;
    virtual bool equals(const void* a, const void* b) const = 0;

    std::shared_ptr<void> clone(const void* from) const
    {
      std::shared_ptr<void> result = create();
      if (result)
        assign(result.get(), from);

      return result;
    }
  };

  // Shared adapter instance for storage type 'T'
  template <typename T>
  const Adapter& AdapterOf();

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  /*

  jbind::Nullable

  Storage that tells apart a missing key, an explicit JSON null and a value:

    Nullable<int32_t> a;                               // absent
    a = 5;                                             // value
    a.setNull(jbind::SentinelFor(jbind::types::Int())); // explicit null

  */
  template <typename T>
  class Nullable final
  {
  public:
    using value_type = T;

    Nullable() = default;

    Nullable(T value) // NOLINT(google-explicit-constructor)
      : m_value(std::move(value))
    {}

    // Explicit null tagged with the natural sentinel of 'T'
    static Nullable Null();

    static Nullable Null(const NullSentinel& sentinel)
    {
      Nullable result;
      result.m_null = &sentinel;
      return result;
    }

    Nullable& operator=(T value)
    {
      m_null = nullptr;
      m_value = std::move(value);
      return *this;
    }

    // Checks, if the key was present (as value or as null)
    bool isSet() const noexcept { return m_value.has_value() || m_null; }

    bool isNull() const noexcept { return m_null != nullptr; }
    bool hasValue() const noexcept { return m_value.has_value(); }

    const NullSentinel* sentinel() const noexcept { return m_null; }

    T& value()
    {
      if (!m_value)
        throw std::logic_error("Nullable holds no value");

      return *m_value;
    }

    const T& value() const
    {
      if (!m_value)
        throw std::logic_error("Nullable holds no value");

      return *m_value;
    }

    T& emplace()
    {
      m_null = nullptr;
      return m_value.emplace();
    }

    void setNull(const NullSentinel& sentinel)
    {
      m_value.reset();
      m_null = &sentinel;
    }

    void reset() noexcept
    {
      m_value.reset();
      m_null = nullptr;
    }

    bool operator==(const Nullable& other) const { return m_null == other.m_null && m_value == other.m_value; }

  private:
    std::optional<T> m_value;
    const NullSentinel* m_null = nullptr;
  };

  /*

  jbind::Any

  Slot for members whose type is only known once a type variable is resolved.
  Holds nothing, an explicit null, or a value together with its adapter.

  */
  class Any final
  {
  public:
    Any() = default;

    Any(const Any& other)
      : m_data(other.m_data ? other.m_adapter->clone(other.m_data.get()) : nullptr)
      , m_adapter(other.m_adapter)
      , m_null(other.m_null)
    {}

    Any(Any&& other) noexcept = default;

    template <typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Any>>>
    Any(T&& value) // NOLINT(google-explicit-constructor)
    {
      emplace<std::decay_t<T>>(std::forward<T>(value));
    }

    Any& operator=(const Any& other)
    {
      if (this != &other)
        *this = Any(other);

      return *this;
    }

    Any& operator=(Any&& other) noexcept = default;

    static Any Null(const NullSentinel& sentinel)
    {
      Any result;
      result.setNull(sentinel);
      return result;
    }

    bool isSet() const noexcept { return m_data || m_null; }
    bool isNull() const noexcept { return m_null != nullptr; }
    bool hasValue() const noexcept { return m_data != nullptr; }

    const NullSentinel* sentinel() const noexcept { return m_null; }
    const Adapter* adapter() const noexcept { return m_adapter; }
    const void* data() const noexcept { return m_data.get(); }

    template <typename T>
    bool is() const noexcept
    {
      return m_data && m_adapter->type() == std::type_index(typeid(T));
    }

    template <typename T>
    T& as()
    {
      if (!is<T>())
        throw std::logic_error("Any does not hold the requested type");

      return *static_cast<T*>(m_data.get());
    }

    template <typename T>
    const T& as() const
    {
      if (!is<T>())
        throw std::logic_error("Any does not hold the requested type");

      return *static_cast<const T*>(m_data.get());
    }

    template <typename T, typename... Args>
    T& emplace(Args&&... args)
    {
      m_data = std::make_shared<T>(std::forward<Args>(args)...);
      m_adapter = &AdapterOf<T>();
      m_null = nullptr;
      return *static_cast<T*>(m_data.get());
    }

    // Replaces content with a default constructed value of the adapter's type
    void* reset(const Adapter& adapter)
    {
      m_data = adapter.create();
      m_adapter = m_data ? &adapter : nullptr;
      m_null = nullptr;
      return m_data.get();
    }

    void setNull(const NullSentinel& sentinel)
    {
      m_data.reset();
      m_adapter = nullptr;
      m_null = &sentinel;
    }

    void clear() noexcept
    {
      m_data.reset();
      m_adapter = nullptr;
      m_null = nullptr;
    }

    bool operator==(const Any& other) const
    {
      if (m_null || other.m_null)
        return m_null == other.m_null;

      if (!m_data || !other.m_data)
        return !m_data && !other.m_data;

      return m_adapter == other.m_adapter && m_adapter->equals(m_data.get(), other.m_data.get());
    }

  private:
    std::shared_ptr<void> m_data;
    const Adapter* m_adapter = nullptr;
    const NullSentinel* m_null = nullptr;
  };

  /*

  jbind::GenericData

  Derive from it to keep keys no declared field covers. They are stored in
  arrival order and written back, merged with the declared fields.

  */
  class GenericData
  {
  public:
    ArrayMap<Value>& unknownKeys() noexcept { return m_unknownKeys; }
    const ArrayMap<Value>& unknownKeys() const noexcept { return m_unknownKeys; }

    bool operator==(const GenericData& other) const { return m_unknownKeys == other.m_unknownKeys; }

  private:
    ArrayMap<Value> m_unknownKeys;
  };

  // Storage for members whose content is skipped
  struct Void
  {
    bool operator==(const Void&) const noexcept { return true; }
  };

} // namespace jbind
