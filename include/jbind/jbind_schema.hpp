#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <deque>
#include <list>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>

#include "jbind_data.hpp"

namespace jbind
{

  //---------------------------------------------------------------------------------------------------------------------
  class ScalarAdapter : public Adapter
  {
  public:
    virtual ScalarKind scalarKind() const noexcept = 0;
  };

  //---------------------------------------------------------------------------------------------------------------------
  class EnumAdapter : public Adapter
  {
  public:
    virtual const EnumSchema& schema() const = 0;
    virtual int64_t get(const void* value) const = 0;
    virtual void set(void* value, int64_t constant) const = 0;
  };

  //---------------------------------------------------------------------------------------------------------------------
  class SequenceFiller
  {
  public:
    virtual ~SequenceFiller() = default;

    // Storage for the next element, valid until the following call
    virtual void* next() = 0;

    // Commits the collected elements into the target sequence
    virtual Error::Type complete() = 0;
  };

  //---------------------------------------------------------------------------------------------------------------------
  class SequenceAdapter : public Adapter
  {
  public:
    virtual const Adapter& element() const = 0;
    virtual std::unique_ptr<SequenceFiller> fill(void* sequence) const = 0;
    virtual size_t size(const void* sequence) const = 0;
    virtual Error forEach(const void* sequence, const std::function<Error(const void*)>& func) const = 0;
  };

  //---------------------------------------------------------------------------------------------------------------------
  class MapAdapter : public Adapter
  {
  public:
    virtual const Adapter& value() const = 0;
    virtual void clear(void* map) const = 0;

    // Returns existing value under 'key' or inserts a default constructed one
    virtual void* slot(void* map, std::string_view key) const = 0;

    virtual size_t size(const void* map) const = 0;
    virtual Error forEach(const void* map, const std::function<Error(const std::string&, const void*)>& func) const = 0;
  };

  //---------------------------------------------------------------------------------------------------------------------
  class ObjectAdapter : public Adapter
  {
  public:
    virtual ClassRef classRef() const = 0;
  };

  //---------------------------------------------------------------------------------------------------------------------
  class PointerAdapter : public Adapter
  {
  public:
    virtual ClassRef pointee() const = 0;

    // Raw pointee, nullptr when empty
    virtual void* get(const void* pointer) const = 0;

    virtual void reset(void* pointer, std::shared_ptr<void> object) const = 0;

    // Empty, but remembers that null was read
    virtual void setNull(void* pointer, const NullSentinel& sentinel) const = 0;
    virtual bool isNull(const void* pointer, const NullSentinel& sentinel) const = 0;

    // Points to a new default constructed pointee, nullptr when the pointee is abstract
    virtual void* emplace(void* pointer) const = 0;

    virtual std::type_index dynamicType(const void* pointer) const = 0;
  };

  //---------------------------------------------------------------------------------------------------------------------
  class NullableAdapter : public Adapter
  {
  public:
    virtual const Adapter& inner() const = 0;
    virtual bool isSet(const void* nullable) const = 0;
    virtual bool isNull(const void* nullable) const = 0;
    virtual const void* value(const void* nullable) const = 0;
    virtual void* emplace(void* nullable) const = 0;
    virtual void setNull(void* nullable, const NullSentinel& sentinel) const = 0;
  };

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  /*

  jbind::EnumSchema

  Wire value table of a registered enum, plus the constant that stands for JSON null.

  */
  class EnumSchema final
  {
  public:
    struct Entry
    {
      std::string wireValue;
      int64_t value = 0;
    };

    const std::string& name() const noexcept { return m_name; }
    const std::vector<Entry>& entries() const noexcept { return m_entries; }
    const std::optional<int64_t>& nullValue() const noexcept { return m_nullValue; }
    const Error& error() const noexcept { return m_error; }
    const Adapter& adapter() const { return m_adapter(); }

    const Entry* findWire(std::string_view wireValue) const
    {
      for (const Entry& entry : m_entries)
      {
        if (entry.wireValue == wireValue)
          return &entry;
      }

      return nullptr;
    }

    const Entry* findValue(int64_t value) const
    {
      for (const Entry& entry : m_entries)
      {
        if (entry.value == value)
          return &entry;
      }

      return nullptr;
    }

  private:
    template <typename E>
    friend class EnumBuilder;

    std::string m_name;
    std::vector<Entry> m_entries;
    std::optional<int64_t> m_nullValue;
    Error m_error;
    const Adapter& (*m_adapter)() = nullptr;
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename E>
  class EnumBuilder final
  {
  public:
    explicit EnumBuilder(EnumSchema& schema)
      : m_schema(schema)
    {
      m_schema.m_name = typeid(E).name();
      m_schema.m_adapter = &AdapterOf<E>;
    }

    EnumBuilder& name(std::string_view name)
    {
      m_schema.m_name = name;
      return *this;
    }

    EnumBuilder& value(E constant, std::string_view wireValue)
    {
      if (m_schema.findWire(wireValue) && !m_schema.m_error)
        m_schema.m_error = {Error::InvalidEnum, 0, 0, {}, "duplicate wire value '" + std::string(wireValue) + "' in enum " + m_schema.m_name};

      m_schema.m_entries.push_back({std::string(wireValue), int64_t(constant)});
      return *this;
    }

    // Splits a comma separated list of wire values, one per constant
    EnumBuilder& values(std::string_view names, std::initializer_list<E> constants)
    {
      auto iter = constants.begin();
      while (!names.empty() && iter != constants.end())
      {
        size_t comma = names.find(',');
        std::string_view name = names.substr(0, comma);
        names = comma == std::string_view::npos ? std::string_view() : names.substr(comma + 1);

        while (!name.empty() && uint8_t(name.front()) <= 32)
          name.remove_prefix(1);

        while (!name.empty() && uint8_t(name.back()) <= 32)
          name.remove_suffix(1);

        value(*iter++, name);
      }

      return *this;
    }

    EnumBuilder& nullValue(E constant)
    {
      m_schema.m_nullValue = int64_t(constant);
      return *this;
    }

  private:
    EnumSchema& m_schema;
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename E>
  const EnumSchema& EnumSchemaOf()
  {
    static const EnumSchema schema = [] {
      EnumSchema result;
      EnumBuilder<E> builder(result);
      SchemaDeclaration<E>::Declare(builder);
      return result;
    }();

    return schema;
  }

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  /*

  jbind::PolymorphicSchema

  Discriminator key and wire value to subtype table of a polymorphic class.
  'Host' is the class declaring the discriminator member, every subtype derives from it.

  */
  class PolymorphicSchema final
  {
  public:
    struct Subtype
    {
      std::string wireValue;
      ClassRef ref;

      // New subtype instance, pointing at its host subobject
      std::shared_ptr<void> (*create)();

      // Host subobject to subtype object
      void* (*toSubtype)(void* host);
    };

    PolymorphicSchema(std::string discriminatorKey, ClassRef host, const Adapter& (*hostPointer)())
      : m_discriminatorKey(std::move(discriminatorKey))
      , m_host(host)
      , m_hostPointer(hostPointer)
    {}

    const std::string& discriminatorKey() const noexcept { return m_discriminatorKey; }
    const ClassRef& host() const noexcept { return m_host; }
    const std::vector<Subtype>& subtypes() const noexcept { return m_subtypes; }

    // Adapter of std::shared_ptr<Host>
    const Adapter& hostPointerAdapter() const { return m_hostPointer(); }

    const Subtype* find(std::string_view wireValue) const
    {
      for (const Subtype& subtype : m_subtypes)
      {
        if (subtype.wireValue == wireValue)
          return &subtype;
      }

      return nullptr;
    }

    const Subtype* findByType(std::type_index type) const
    {
      for (const Subtype& subtype : m_subtypes)
      {
        if (subtype.ref.type == type)
          return &subtype;
      }

      return nullptr;
    }

    // Sorted, comma separated discriminator values
    std::string knownValues() const
    {
      std::vector<std::string_view> values;
      for (const Subtype& subtype : m_subtypes)
        values.push_back(subtype.wireValue);

      std::sort(values.begin(), values.end());

      std::string result;
      for (std::string_view value : values)
      {
        if (!result.empty())
          result += ", ";

        result += value;
      }

      return result;
    }

    // Returns 'false' when the wire value is taken
    bool add(Subtype subtype)
    {
      if (find(subtype.wireValue))
        return false;

      m_subtypes.push_back(std::move(subtype));
      return true;
    }

  private:
    std::string m_discriminatorKey;
    ClassRef m_host;
    const Adapter& (*m_hostPointer)() = nullptr;
    std::vector<Subtype> m_subtypes;
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename Sub>
  struct TypeDef
  {
    explicit TypeDef(std::string wireValue)
      : wireValue(std::move(wireValue))
    {}

    std::string wireValue;
  };

} // namespace jbind

///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

namespace jbind::detail
{

  struct FieldDeclaration
  {
    std::string wireKey;
    const Adapter* adapter = nullptr;

    // Empty when the member binds to its natural type
    Type declaredType;

    bool quoted = false;
    bool discriminatorHost = false;
    std::function<void*(void*)> locate;
  };

  struct SupertypeDeclaration
  {
    ClassRef ref;
    std::vector<Type> arguments;
    void* (*upcast)(void*) = nullptr;
  };

  struct ClassDeclaration
  {
    std::string name;
    std::type_index type = typeid(void);
    std::vector<std::string> typeParameters;
    std::optional<SupertypeDeclaration> supertype;
    std::vector<FieldDeclaration> fields;
    std::shared_ptr<const PolymorphicSchema> typeMap;
    ArrayMap<Value>* (*unknownKeys)(void*) = nullptr;
    Error error;

    void fail(int type, std::string detail)
    {
      if (!error)
        error = {type, 0, 0, {}, std::move(detail)};
    }
  };

  template <typename T>
  const ClassDeclaration& DeclarationOf();

  template <typename Derived, typename Base>
  void* Upcast(void* obj)
  {
    return static_cast<Base*>(static_cast<Derived*>(obj));
  }

  template <typename T>
  ArrayMap<Value>* UnknownKeysOf(void* obj)
  {
    return &static_cast<GenericData*>(static_cast<T*>(obj))->unknownKeys();
  }

  template <typename Host, typename Sub>
  std::shared_ptr<void> CreateSubtype()
  {
    return std::static_pointer_cast<void>(std::shared_ptr<Host>(std::make_shared<Sub>()));
  }

  template <typename Host, typename Sub>
  void* ToSubtype(void* host)
  {
    return static_cast<Sub*>(static_cast<Host*>(host));
  }

} // namespace jbind::detail

///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

namespace jbind
{

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  ClassRef ClassRefOf()
  {
    return ClassRef {typeid(T), &detail::DeclarationOf<T>, &AdapterOf<T>};
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  class FieldBuilder final
  {
  public:
    FieldBuilder(detail::ClassDeclaration& decl, size_t index)
      : m_decl(decl)
      , m_index(index)
    {}

    // Number or boolean travels as a JSON string, e.g. "123"
    FieldBuilder& quoted()
    {
      field().quoted = true;
      return *this;
    }

    // Overrides the natural descriptor, may reference type parameters
    FieldBuilder& type(Type declared)
    {
      field().declaredType = std::move(declared);
      return *this;
    }

    // Marks this member as the discriminator of 'T' and lists its subtypes
    template <typename... Subs>
    FieldBuilder& typeMap(const TypeDef<Subs>&... subtypes)
    {
      static_assert((std::is_base_of_v<T, Subs> && ...), "Every subtype must derive from the class declaring the type map");

      detail::FieldDeclaration& f = field();

      const Adapter* discriminator = f.adapter;
      if (discriminator->kind() == StorageKind::Nullable)
        discriminator = &static_cast<const NullableAdapter*>(discriminator)->inner();

      if (discriminator->kind() != StorageKind::Scalar && discriminator->kind() != StorageKind::Enum)
        m_decl.fail(Error::InvalidTypeMap, "discriminator '" + f.wireKey + "' must be a scalar or an enum");

      if constexpr (sizeof...(Subs) == 0)
        m_decl.fail(Error::InvalidTypeMap, "type map of '" + f.wireKey + "' is empty");

      if (m_decl.typeMap)
        m_decl.fail(Error::InvalidTypeMap, "class " + m_decl.name + " declares more than one type map");

      auto schema = std::make_shared<PolymorphicSchema>(f.wireKey, ClassRefOf<T>(), &AdapterOf<std::shared_ptr<T>>);
      (addSubtype(*schema, subtypes), ...);

      f.discriminatorHost = true;
      m_decl.typeMap = std::move(schema);
      return *this;
    }

  private:
    detail::FieldDeclaration& field() { return m_decl.fields[m_index]; }

    template <typename Sub>
    void addSubtype(PolymorphicSchema& schema, const TypeDef<Sub>& def)
    {
      PolymorphicSchema::Subtype subtype {def.wireValue, ClassRefOf<Sub>(), &detail::CreateSubtype<T, Sub>, &detail::ToSubtype<T, Sub>};
      if (!schema.add(std::move(subtype)))
        m_decl.fail(Error::InvalidTypeMap, "duplicate discriminator value '" + def.wireValue + "'");
    }

    detail::ClassDeclaration& m_decl;
    size_t m_index;
  };

  /*

  jbind::SchemaBuilder

  Collects the declaration of class 'T':

    b.name("Item");
    b.typeParameters({"T"});
    b.extends<Base>({jbind::types::Var("T")});
    b.field("id", &Item::id).quoted();
    b.field("payload", &Item::payload).type(jbind::types::Var("T"));

  */
  template <typename T>
  class SchemaBuilder final
  {
  public:
    using Class = T;

    explicit SchemaBuilder(detail::ClassDeclaration& decl)
      : m_decl(decl)
    {}

    SchemaBuilder& name(std::string_view name)
    {
      m_decl.name = name;
      return *this;
    }

    SchemaBuilder& typeParameters(std::vector<std::string> parameters)
    {
      m_decl.typeParameters = std::move(parameters);
      return *this;
    }

    template <typename Base>
    SchemaBuilder& extends(std::vector<Type> arguments = {})
    {
      static_assert(std::is_base_of_v<Base, T> && !std::is_same_v<Base, T>, "Supertype must be a base class");
      m_decl.supertype = detail::SupertypeDeclaration {ClassRefOf<Base>(), std::move(arguments), &detail::Upcast<T, Base>};
      return *this;
    }

    template <typename C, typename M>
    FieldBuilder<T> field(std::string_view wireKey, M C::*member)
    {
      static_assert(std::is_base_of_v<C, T>, "Member must belong to the declared class");

      detail::FieldDeclaration& f = m_decl.fields.emplace_back();
      f.wireKey = wireKey;
      f.adapter = &AdapterOf<M>();
      f.locate = [member](void* obj) -> void* { return &(static_cast<T*>(obj)->*member); };

      return FieldBuilder<T>(m_decl, m_decl.fields.size() - 1);
    }

    template <typename... Refs>
    SchemaBuilder& fields(const Refs&... refs)
    {
      (field(refs.name, refs.member), ...);
      return *this;
    }

  private:
    detail::ClassDeclaration& m_decl;
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  const detail::ClassDeclaration& detail::DeclarationOf()
  {
    static const ClassDeclaration declaration = [] {
      ClassDeclaration result;
      result.type = typeid(T);
      result.name = typeid(T).name();

      if constexpr (std::is_base_of_v<GenericData, T>)
        result.unknownKeys = &UnknownKeysOf<T>;

      SchemaBuilder<T> builder(result);
      SchemaDeclaration<T>::Declare(builder);
      return result;
    }();

    return declaration;
  }

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  //---------------------------------------------------------------------------------------------------------------------
  struct BoundField
  {
    std::string wireKey;

    // As declared, may reference type parameters
    Type declaredType;

    // After substitution
    Type type;

    bool quoteAsString = false;
    bool isPolymorphicDiscriminatorHost = false;
    const Adapter* adapter = nullptr;

    // Field storage inside an instance of the schema's class
    std::function<void*(void*)> locate;
  };

  /*

  jbind::ClassSchema

  Immutable binding schema of one concrete class (plus type arguments).
  Fields are ordered base class first, each level in declaration order.

  */
  class ClassSchema final
  {
  public:
    const std::string& name() const noexcept { return m_name; }
    const ClassRef& classRef() const noexcept { return *m_classRef; }
    const std::vector<BoundField>& fields() const noexcept { return m_fields; }
    const Substitution& substitution() const noexcept { return m_substitution; }
    const std::shared_ptr<const PolymorphicSchema>& typeMap() const noexcept { return m_typeMap; }

    const BoundField* find(std::string_view wireKey) const
    {
      for (const BoundField& field : m_fields)
      {
        if (field.wireKey == wireKey)
          return &field;
      }

      return nullptr;
    }

    // Checks, if instances keep undeclared keys
    bool hasUnknownKeys() const noexcept { return m_unknownKeys != nullptr; }

    ArrayMap<Value>* unknownKeys(void* obj) const { return m_unknownKeys ? m_unknownKeys(obj) : nullptr; }
    const ArrayMap<Value>* unknownKeys(const void* obj) const { return m_unknownKeys ? m_unknownKeys(const_cast<void*>(obj)) : nullptr; }

    void* locate(const BoundField& field, void* obj) const { return field.locate(obj); }
    const void* locate(const BoundField& field, const void* obj) const { return field.locate(const_cast<void*>(obj)); }

  private:
    friend class ClassRegistry;

    std::string m_name;
    std::optional<ClassRef> m_classRef;
    std::vector<BoundField> m_fields;
    Substitution m_substitution;
    std::shared_ptr<const PolymorphicSchema> m_typeMap;
    ArrayMap<Value>* (*m_unknownKeys)(void*) = nullptr;
  };

  /*

  jbind::ClassRegistry

  Process wide cache of class schemas keyed by the canonical descriptor name.
  Failed builds are cached too, so a broken declaration fails the same way every time.

  */
  class ClassRegistry final
  {
  public:
    static ClassRegistry& Instance()
    {
      static ClassRegistry registry;
      return registry;
    }

    Error schemaFor(const Type& type, const ClassSchema*& out)
    {
      out = nullptr;
      if (type.kind() != TypeKind::Object)
        return {Error::ObjectExpected, 0, 0, {}, "no class schema for " + type.name()};

      {
        std::shared_lock lock(m_mutex);
        if (auto iter = m_entries.find(type.name()); iter != m_entries.end())
        {
          out = iter->second->schema.get();
          return iter->second->error;
        }
      }

      auto entry = std::make_unique<Entry>();
      entry->schema = std::make_unique<ClassSchema>();
      entry->error = Build(type, *entry->schema);

      if (entry->error)
        entry->schema.reset();

      std::unique_lock lock(m_mutex);
      auto iter = m_entries.try_emplace(type.name(), std::move(entry)).first;
      out = iter->second->schema.get();
      return iter->second->error;
    }

  private:
    struct Entry
    {
      Error error;
      std::unique_ptr<ClassSchema> schema;
    };

    using Locator = std::function<void*(void*)>;

    ClassRegistry() = default;

    static Error Fail(const ClassSchema& schema, int type, const std::string& detail)
    {
      return {type, 0, 0, {}, schema.m_name + ": " + detail};
    }

    static Error Build(const Type& type, ClassSchema& schema)
    {
      const ClassRef& ref = type.classRef();
      const detail::ClassDeclaration& decl = ref.declaration();

      schema.m_name = decl.name;
      schema.m_classRef = ref;
      schema.m_unknownKeys = decl.unknownKeys;

      const std::vector<Type>& arguments = type.arguments();
      if (!arguments.empty() && arguments.size() != decl.typeParameters.size())
      {
        return Fail(schema, Error::UnresolvedTypeVariable,
                    "expects " + std::to_string(decl.typeParameters.size()) + " type arguments, got " + std::to_string(arguments.size()));
      }

      for (size_t i = 0; i < arguments.size(); ++i)
        schema.m_substitution[decl.typeParameters[i]] = arguments[i];

      return Collect(decl, schema.m_substitution, {}, schema);
    }

    static Error Collect(const detail::ClassDeclaration& decl, const Substitution& substitution, const Locator& upcast, ClassSchema& schema)
    {
      if (decl.error)
        return Fail(schema, decl.error.type, decl.error.detail);

      if (decl.supertype)
      {
        const detail::SupertypeDeclaration& super = *decl.supertype;
        const detail::ClassDeclaration& superDecl = super.ref.declaration();

        if (super.arguments.size() > superDecl.typeParameters.size())
          return Fail(schema, Error::UnresolvedTypeVariable, "too many type arguments for supertype " + superDecl.name);

        Substitution superSubstitution;
        for (size_t i = 0; i < super.arguments.size(); ++i)
        {
          Type resolved;
          if (auto err = Resolve(super.arguments[i], substitution, resolved))
            return Fail(schema, err.type, "supertype " + superDecl.name + ": " + err.detail);

          superSubstitution[superDecl.typeParameters[i]] = std::move(resolved);
        }

        Locator superUpcast = [upcast, step = super.upcast](void* obj) { return step(upcast ? upcast(obj) : obj); };
        if (auto err = Collect(superDecl, superSubstitution, superUpcast, schema))
          return err;
      }

      for (const detail::FieldDeclaration& field : decl.fields)
      {
        BoundField bound;
        bound.wireKey = field.wireKey;
        bound.declaredType = field.declaredType ? field.declaredType : field.adapter->natural();
        bound.quoteAsString = field.quoted;
        bound.isPolymorphicDiscriminatorHost = field.discriminatorHost;
        bound.adapter = field.adapter;

        if (auto err = Resolve(bound.declaredType, substitution, bound.type))
          return Fail(schema, err.type, "field '" + field.wireKey + "': " + err.detail);

        if (!field.adapter->accepts(bound.type))
          return Fail(schema, Error::IncompatibleType, "field '" + field.wireKey + "' cannot store " + bound.type.name());

        if (schema.find(field.wireKey))
          return Fail(schema, Error::DuplicateKey, "wire key '" + field.wireKey + "' is declared twice");

        if (upcast)
          bound.locate = [upcast, locate = field.locate](void* obj) { return locate(upcast(obj)); };
        else
          bound.locate = field.locate;

        schema.m_fields.push_back(std::move(bound));
      }

      if (decl.typeMap && !schema.m_typeMap)
        schema.m_typeMap = decl.typeMap;

      return {Error::None};
    }

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<Entry>> m_entries;
  };

  //---------------------------------------------------------------------------------------------------------------------
  inline Error SchemaFor(const Type& type, const ClassSchema*& out)
  {
    return ClassRegistry::Instance().schemaFor(type, out);
  }

} // namespace jbind

///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

namespace jbind::detail
{

  template <typename T, typename Enable = void>
  struct IsComparable : std::bool_constant<std::equality_comparable<T>>
  {
  };

  template <typename T, typename A>
  struct IsComparable<std::vector<T, A>> : IsComparable<T>
  {
  };

  template <typename T, typename A>
  struct IsComparable<std::list<T, A>> : IsComparable<T>
  {
  };

  template <typename T, typename A>
  struct IsComparable<std::deque<T, A>> : IsComparable<T>
  {
  };

  template <typename T, typename C, typename A>
  struct IsComparable<std::set<T, C, A>> : IsComparable<T>
  {
  };

  template <typename T, size_t N>
  struct IsComparable<std::array<T, N>> : IsComparable<T>
  {
  };

  template <typename V, typename C, typename A>
  struct IsComparable<std::map<std::string, V, C, A>> : IsComparable<V>
  {
  };

  template <typename V, typename H, typename EQ, typename A>
  struct IsComparable<std::unordered_map<std::string, V, H, EQ, A>> : IsComparable<V>
  {
  };

  template <typename V>
  struct IsComparable<ArrayMap<V>> : IsComparable<V>
  {
  };

  template <typename T>
  struct IsComparable<Nullable<T>> : IsComparable<T>
  {
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T, typename Interface>
  class TypedAdapter : public Interface
  {
  public:
    std::type_index type() const noexcept override { return typeid(T); }

    std::shared_ptr<void> create() const override
    {
      if constexpr (std::is_default_constructible_v<T> && !std::is_abstract_v<T>)
        return std::make_shared<T>();
      else
        return nullptr;
    }

    void assign(void* to, const void* from) const override
    {
      if constexpr (std::is_copy_assignable_v<T>)
        *static_cast<T*>(to) = *static_cast<const T*>(from);
    }

    bool equals(const void* a, const void* b) const override
    {
      if constexpr (IsComparable<T>::value)
        return *static_cast<const T*>(a) == *static_cast<const T*>(b);
      else
        return a == b;
    }
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  struct ScalarTraits
  {
    static constexpr bool IsScalar = false;
  };

  template <ScalarKind K>
  struct ScalarTraitsBase
  {
    static constexpr bool IsScalar = true;
    static constexpr ScalarKind Kind = K;
  };

  template <> struct ScalarTraits<bool> : ScalarTraitsBase<ScalarKind::Boolean> {};
  template <> struct ScalarTraits<int8_t> : ScalarTraitsBase<ScalarKind::Byte> {};
  template <> struct ScalarTraits<int16_t> : ScalarTraitsBase<ScalarKind::Short> {};
  template <> struct ScalarTraits<int32_t> : ScalarTraitsBase<ScalarKind::Int> {};
  template <> struct ScalarTraits<int64_t> : ScalarTraitsBase<ScalarKind::Long> {};
  template <> struct ScalarTraits<float> : ScalarTraitsBase<ScalarKind::Float> {};
  template <> struct ScalarTraits<double> : ScalarTraitsBase<ScalarKind::Double> {};
  template <> struct ScalarTraits<BigInteger> : ScalarTraitsBase<ScalarKind::BigInteger> {};
  template <> struct ScalarTraits<BigDecimal> : ScalarTraitsBase<ScalarKind::BigDecimal> {};
  template <> struct ScalarTraits<std::string> : ScalarTraitsBase<ScalarKind::String> {};
  template <> struct ScalarTraits<Void> : ScalarTraitsBase<ScalarKind::Void> {};

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  class ScalarAdapterImpl final : public TypedAdapter<T, ScalarAdapter>
  {
  public:
    StorageKind kind() const noexcept override { return StorageKind::Scalar; }
    ScalarKind scalarKind() const noexcept override { return ScalarTraits<T>::Kind; }
    Type natural() const override { return types::Scalar(ScalarTraits<T>::Kind); }
    bool accepts(const Type& type) const override { return type.kind() == TypeKind::Scalar && type.scalarKind() == ScalarTraits<T>::Kind; }
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename E>
  class EnumAdapterImpl final : public TypedAdapter<E, EnumAdapter>
  {
  public:
    StorageKind kind() const noexcept override { return StorageKind::Enum; }
    const EnumSchema& schema() const override { return EnumSchemaOf<E>(); }
    Type natural() const override { return types::Enum(schema(), schema().name()); }
    bool accepts(const Type& type) const override { return type.kind() == TypeKind::Enum && &type.enumSchema() == &schema(); }

    int64_t get(const void* value) const override { return int64_t(*static_cast<const E*>(value)); }
    void set(void* value, int64_t constant) const override { *static_cast<E*>(value) = E(std::underlying_type_t<E>(constant)); }
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename C>
  struct SequenceTraits
  {
    static constexpr bool IsSequence = false;
  };

  template <typename T, typename A>
  struct SequenceTraits<std::vector<T, A>>
  {
    using Element = T;
    static constexpr bool IsSequence = true;
    static constexpr bool Staged = std::is_same_v<T, bool>; // no addressable elements
    static constexpr size_t FixedSize = 0;
    static Type Natural() { return types::Array(types::Of<T>()); }
  };

  template <typename T, size_t N>
  struct SequenceTraits<std::array<T, N>>
  {
    using Element = T;
    static constexpr bool IsSequence = true;
    static constexpr bool Staged = true;
    static constexpr size_t FixedSize = N;
    static Type Natural() { return types::Array(types::Of<T>(), N); }
  };

  template <typename T, typename A>
  struct SequenceTraits<std::list<T, A>>
  {
    using Element = T;
    static constexpr bool IsSequence = true;
    static constexpr bool Staged = false;
    static constexpr size_t FixedSize = 0;
    static Type Natural() { return types::Collection(types::Of<T>(), CollectionKind::List); }
  };

  template <typename T, typename A>
  struct SequenceTraits<std::deque<T, A>>
  {
    using Element = T;
    static constexpr bool IsSequence = true;
    static constexpr bool Staged = false;
    static constexpr size_t FixedSize = 0;
    static Type Natural() { return types::Collection(types::Of<T>(), CollectionKind::Deque); }
  };

  template <typename T, typename C, typename A>
  struct SequenceTraits<std::set<T, C, A>>
  {
    using Element = T;
    static constexpr bool IsSequence = true;
    static constexpr bool Staged = true;
    static constexpr size_t FixedSize = 0;
    static Type Natural() { return types::Collection(types::Of<T>(), CollectionKind::SortedSet); }
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename C>
  class SequenceFillerImpl final : public SequenceFiller
  {
  public:
    using Traits = SequenceTraits<C>;
    using Element = typename Traits::Element;

    explicit SequenceFillerImpl(C& target)
      : m_target(target)
    {
      if constexpr (!Traits::Staged)
        m_target.clear();
    }

    void* next() override
    {
      if constexpr (Traits::Staged)
        return &m_staged.emplace_back();
      else
        return &m_target.emplace_back();
    }

    Error::Type complete() override
    {
      if constexpr (Traits::FixedSize != 0)
      {
        if (m_staged.size() != Traits::FixedSize)
          return Error::WrongArraySize;

        std::move(m_staged.begin(), m_staged.end(), m_target.begin());
      }
      else if constexpr (Traits::Staged)
      {
        m_target = C(m_staged.begin(), m_staged.end());
      }

      return Error::None;
    }

  private:
    C& m_target;
    std::deque<Element> m_staged;
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename C>
  class SequenceAdapterImpl final : public TypedAdapter<C, SequenceAdapter>
  {
  public:
    using Traits = SequenceTraits<C>;
    using Element = typename Traits::Element;

    StorageKind kind() const noexcept override { return StorageKind::Sequence; }
    const Adapter& element() const override { return AdapterOf<Element>(); }
    Type natural() const override { return Traits::Natural(); }

    bool accepts(const Type& type) const override
    {
      if (type.kind() != TypeKind::Array && type.kind() != TypeKind::Collection)
        return false;

      if (Traits::FixedSize != 0 && type.fixedSize() != 0 && type.fixedSize() != Traits::FixedSize)
        return false;

      return element().accepts(type.element());
    }

    std::unique_ptr<SequenceFiller> fill(void* sequence) const override
    {
      return std::make_unique<SequenceFillerImpl<C>>(*static_cast<C*>(sequence));
    }

    size_t size(const void* sequence) const override { return static_cast<const C*>(sequence)->size(); }

    Error forEach(const void* sequence, const std::function<Error(const void*)>& func) const override
    {
      for (const auto& item : *static_cast<const C*>(sequence))
      {
        if constexpr (std::is_same_v<Element, bool>)
        {
          bool value = item;
          if (auto err = func(&value))
            return err;
        }
        else if (auto err = func(&item))
        {
          return err;
        }
      }

      return {Error::None};
    }
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename C>
  struct MapTraits
  {
    static constexpr bool IsMap = false;
  };

  template <typename V, typename C, typename A>
  struct MapTraits<std::map<std::string, V, C, A>>
  {
    using Value = V;
    static constexpr bool IsMap = true;
    static constexpr MapKind Kind = MapKind::Sorted;
  };

  template <typename V>
  struct MapTraits<ArrayMap<V>>
  {
    using Value = V;
    static constexpr bool IsMap = true;
    static constexpr MapKind Kind = MapKind::Ordered;
  };

  template <typename V, typename H, typename EQ, typename A>
  struct MapTraits<std::unordered_map<std::string, V, H, EQ, A>>
  {
    using Value = V;
    static constexpr bool IsMap = true;
    static constexpr MapKind Kind = MapKind::Hashed;
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename C>
  class MapAdapterImpl final : public TypedAdapter<C, MapAdapter>
  {
  public:
    using Traits = MapTraits<C>;
    using ValueType = typename Traits::Value;

    StorageKind kind() const noexcept override { return StorageKind::Map; }
    const Adapter& value() const override { return AdapterOf<ValueType>(); }
    Type natural() const override { return types::Map(types::Of<ValueType>(), Traits::Kind); }
    bool accepts(const Type& type) const override { return type.kind() == TypeKind::Map && value().accepts(type.element()); }

    void clear(void* map) const override { static_cast<C*>(map)->clear(); }

    void* slot(void* map, std::string_view key) const override
    {
      if constexpr (Traits::Kind == MapKind::Ordered)
        return &(*static_cast<C*>(map))[key];
      else
        return &(*static_cast<C*>(map))[std::string(key)];
    }

    size_t size(const void* map) const override { return static_cast<const C*>(map)->size(); }

    Error forEach(const void* map, const std::function<Error(const std::string&, const void*)>& func) const override
    {
      for (const auto& kvp : *static_cast<const C*>(map))
      {
        if (auto err = func(kvp.first, &kvp.second))
          return err;
      }

      return {Error::None};
    }
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  class ObjectAdapterImpl final : public TypedAdapter<T, ObjectAdapter>
  {
  public:
    StorageKind kind() const noexcept override { return StorageKind::Object; }
    ClassRef classRef() const override { return ClassRefOf<T>(); }
    Type natural() const override { return types::Object(ClassRefOf<T>()); }
    bool accepts(const Type& type) const override { return type.kind() == TypeKind::Object && type.classRef().type == typeid(T); }
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename B>
  class PointerAdapterImpl final : public TypedAdapter<std::shared_ptr<B>, PointerAdapter>
  {
  public:
    StorageKind kind() const noexcept override { return StorageKind::Pointer; }
    ClassRef pointee() const override { return ClassRefOf<B>(); }

    // Polymorphic when 'B' itself declares the type map
    Type natural() const override
    {
      const ClassDeclaration& decl = DeclarationOf<B>();
      if (decl.typeMap && decl.typeMap->host().type == typeid(B))
        return types::Polymorphic(decl.typeMap, ClassRefOf<B>());

      return types::Object(ClassRefOf<B>());
    }

    bool accepts(const Type& type) const override
    {
      return (type.kind() == TypeKind::Object || type.kind() == TypeKind::Polymorphic) && type.classRef().type == typeid(B);
    }

    void* get(const void* pointer) const override
    {
      return const_cast<std::remove_const_t<B>*>(static_cast<const std::shared_ptr<B>*>(pointer)->get());
    }

    void reset(void* pointer, std::shared_ptr<void> object) const override
    {
      *static_cast<std::shared_ptr<B>*>(pointer) = std::static_pointer_cast<B>(std::move(object));
    }

    void setNull(void* pointer, const NullSentinel& sentinel) const override
    {
      *static_cast<std::shared_ptr<B>*>(pointer) = std::shared_ptr<B>(sentinel.owner(), static_cast<B*>(nullptr));
    }

    bool isNull(const void* pointer, const NullSentinel& sentinel) const override
    {
      const auto& ptr = *static_cast<const std::shared_ptr<B>*>(pointer);
      return !ptr && sentinel.owns(ptr);
    }

    void* emplace(void* pointer) const override
    {
      if constexpr (std::is_default_constructible_v<B> && !std::is_abstract_v<B>)
      {
        auto& ptr = *static_cast<std::shared_ptr<B>*>(pointer);
        ptr = std::make_shared<B>();
        return ptr.get();
      }
      else
      {
        return nullptr;
      }
    }

    std::type_index dynamicType(const void* pointer) const override
    {
      const B* obj = static_cast<const std::shared_ptr<B>*>(pointer)->get();
      if constexpr (std::is_polymorphic_v<B>)
      {
        if (obj)
          return typeid(*obj);
      }

      return typeid(B);
    }
  };

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  class NullableAdapterImpl final : public TypedAdapter<Nullable<T>, NullableAdapter>
  {
  public:
    StorageKind kind() const noexcept override { return StorageKind::Nullable; }
    const Adapter& inner() const override { return AdapterOf<T>(); }
    Type natural() const override { return inner().natural(); }
    bool accepts(const Type& type) const override { return inner().accepts(type); }

    bool isSet(const void* nullable) const override { return static_cast<const Nullable<T>*>(nullable)->isSet(); }
    bool isNull(const void* nullable) const override { return static_cast<const Nullable<T>*>(nullable)->isNull(); }
    const void* value(const void* nullable) const override { return &static_cast<const Nullable<T>*>(nullable)->value(); }
    void* emplace(void* nullable) const override { return &static_cast<Nullable<T>*>(nullable)->emplace(); }
    void setNull(void* nullable, const NullSentinel& sentinel) const override { static_cast<Nullable<T>*>(nullable)->setNull(sentinel); }
  };

  //---------------------------------------------------------------------------------------------------------------------
  class ValueAdapter final : public TypedAdapter<Value, Adapter>
  {
  public:
    StorageKind kind() const noexcept override { return StorageKind::Open; }
    Type natural() const override { return types::Open(); }
    bool accepts(const Type& type) const override { return type.kind() == TypeKind::Open; }
  };

  //---------------------------------------------------------------------------------------------------------------------
  class AnyAdapter final : public TypedAdapter<Any, Adapter>
  {
  public:
    StorageKind kind() const noexcept override { return StorageKind::Any; }
    Type natural() const override { return types::Open(); }
    bool accepts(const Type& type) const override { return true; }
  };

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  template <typename T, typename Enable = void>
  struct AdapterSelector
  {
    using Type = ObjectAdapterImpl<T>;
  };

  template <typename T>
  struct AdapterSelector<T, std::enable_if_t<ScalarTraits<T>::IsScalar>>
  {
    using Type = ScalarAdapterImpl<T>;
  };

  template <typename T>
  struct AdapterSelector<T, std::enable_if_t<std::is_enum_v<T>>>
  {
    using Type = EnumAdapterImpl<T>;
  };

  template <typename T>
  struct AdapterSelector<T, std::enable_if_t<SequenceTraits<T>::IsSequence>>
  {
    using Type = SequenceAdapterImpl<T>;
  };

  template <typename T>
  struct AdapterSelector<T, std::enable_if_t<MapTraits<T>::IsMap>>
  {
    using Type = MapAdapterImpl<T>;
  };

  template <typename B>
  struct AdapterSelector<std::shared_ptr<B>>
  {
    using Type = PointerAdapterImpl<B>;
  };

  template <typename T>
  struct AdapterSelector<Nullable<T>>
  {
    using Type = NullableAdapterImpl<T>;
  };

  template <>
  struct AdapterSelector<Value>
  {
    using Type = ValueAdapter;
  };

  template <>
  struct AdapterSelector<Any>
  {
    using Type = AnyAdapter;
  };

} // namespace jbind::detail

///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

namespace jbind
{

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  const Adapter& AdapterOf()
  {
    static const typename detail::AdapterSelector<T>::Type adapter {};
    return adapter;
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  Type types::Of()
  {
    return AdapterOf<T>().natural();
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  Type types::Object(std::vector<Type> arguments)
  {
    return types::Object(ClassRefOf<T>(), std::move(arguments));
  }

  //---------------------------------------------------------------------------------------------------------------------
  template <typename T>
  Nullable<T> Nullable<T>::Null()
  {
    return Null(SentinelFor(types::Of<T>()));
  }

  //---------------------------------------------------------------------------------------------------------------------
  // Storage the binder creates for a resolved descriptor when the destination is an Any slot
  inline const Adapter& NaturalAdapter(const Type& type)
  {
    switch (type.kind())
    {
    case TypeKind::Scalar:
      switch (type.scalarKind())
      {
      case ScalarKind::Boolean: return AdapterOf<bool>();
      case ScalarKind::Byte: return AdapterOf<int8_t>();
      case ScalarKind::Short: return AdapterOf<int16_t>();
      case ScalarKind::Int: return AdapterOf<int32_t>();
      case ScalarKind::Long: return AdapterOf<int64_t>();
      case ScalarKind::Float: return AdapterOf<float>();
      case ScalarKind::Double: return AdapterOf<double>();
      case ScalarKind::BigInteger: return AdapterOf<BigInteger>();
      case ScalarKind::BigDecimal: return AdapterOf<BigDecimal>();
      case ScalarKind::String: return AdapterOf<std::string>();
      case ScalarKind::Void: return AdapterOf<Void>();
      }
      break;

    case TypeKind::Enum: return type.enumSchema().adapter();
    case TypeKind::Array:
    case TypeKind::Collection: return AdapterOf<std::vector<Any>>();

    case TypeKind::Map:
      if (type.mapKind() == MapKind::Ordered)
        return AdapterOf<ArrayMap<Any>>();
      else if (type.mapKind() == MapKind::Hashed)
        return AdapterOf<std::unordered_map<std::string, Any>>();

      return AdapterOf<std::map<std::string, Any>>();

    case TypeKind::Object: return type.classRef().adapter();
    case TypeKind::Polymorphic: return type.polymorphic().hostPointerAdapter();
    default: break;
    }

    return AdapterOf<Value>();
  }

} // namespace jbind
