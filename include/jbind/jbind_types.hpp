#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

#include "jbind.hpp"

namespace jbind
{

  class EnumSchema;
  class PolymorphicSchema;

  namespace detail
  {
    struct ClassDeclaration;
    struct TypeNode;
  } // namespace detail

  //---------------------------------------------------------------------------------------------------------------------
  enum class TypeKind
  {
    Scalar,
    Enum,
    Array,
    Collection,
    Map,
    Object,
    Open,
    Polymorphic,
    Variable
  };

  //---------------------------------------------------------------------------------------------------------------------
  enum class ScalarKind
  {
    Boolean,
    Byte,
    Short,
    Int,
    Long,
    Float,
    Double,
    BigInteger,
    BigDecimal,
    String,
    Void
  };

  //---------------------------------------------------------------------------------------------------------------------
  enum class CollectionKind
  {
    List,
    Deque,
    SortedSet
  };

  //---------------------------------------------------------------------------------------------------------------------
  enum class MapKind
  {
    Sorted,
    Ordered,
    Hashed
  };

  //---------------------------------------------------------------------------------------------------------------------
  // Type-erased handle to a bindable class
  struct ClassRef
  {
    std::type_index type;
    const detail::ClassDeclaration& (*declaration)();
    const Adapter& (*adapter)();

    bool operator==(const ClassRef& other) const noexcept { return type == other.type; }
  };

  /*

  jbind::Type

  Immutable descriptor of a bindable value shape. Copies share the same node.

  */
  class Type final
  {
  public:
    Type() = default;

    explicit operator bool() const noexcept { return m_node != nullptr; }

    TypeKind kind() const noexcept;
    ScalarKind scalarKind() const noexcept;

    // Element of Array and Collection, value of Map
    const Type& element() const noexcept;

    // Array size, 0 when dynamic
    size_t fixedSize() const noexcept;

    CollectionKind collectionKind() const noexcept;
    MapKind mapKind() const noexcept;
    const EnumSchema& enumSchema() const noexcept;
    const ClassRef& classRef() const noexcept;
    const std::vector<Type>& arguments() const noexcept;
    const PolymorphicSchema& polymorphic() const noexcept;
    const std::string& variableName() const noexcept;

    // Canonical name, doubles as cache key and null sentinel shape
    const std::string& name() const noexcept;

    // True when a Variable appears anywhere inside
    bool hasVariables() const noexcept;

    bool operator==(const Type& other) const noexcept { return name() == other.name(); }

  private:
    friend Type MakeType(detail::TypeNode node);

    std::shared_ptr<const detail::TypeNode> m_node;
  };

  using Substitution = std::map<std::string, Type, std::less<>>;

} // namespace jbind

///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

namespace jbind::detail
{

  struct TypeNode
  {
    TypeKind kind = TypeKind::Open;
    ScalarKind scalar = ScalarKind::Void;
    Type element;
    size_t fixedSize = 0;
    CollectionKind collection = CollectionKind::List;
    MapKind map = MapKind::Sorted;
    const EnumSchema* enumSchema = nullptr;
    std::optional<ClassRef> classRef;
    std::vector<Type> arguments;
    std::shared_ptr<const PolymorphicSchema> polymorphic;
    std::string variable;
    std::string name;
    bool hasVariables = false;
  };

  inline const char* ScalarName(ScalarKind kind)
  {
    static constexpr const char* Names[] = {
      "boolean", "byte", "short", "int", "long", "float", "double", "biginteger", "bigdecimal", "string", "void"};

    return Names[int(kind)];
  }

  inline const char* CollectionName(CollectionKind kind)
  {
    static constexpr const char* Names[] = {"list", "deque", "sortedset"};
    return Names[int(kind)];
  }

  inline const char* MapName(MapKind kind)
  {
    static constexpr const char* Names[] = {"sortedmap", "orderedmap", "hashmap"};
    return Names[int(kind)];
  }

} // namespace jbind::detail

///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

namespace jbind
{

  //---------------------------------------------------------------------------------------------------------------------
  inline Type MakeType(detail::TypeNode node)
  {
    Type result;
    result.m_node = std::make_shared<const detail::TypeNode>(std::move(node));
    return result;
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline TypeKind Type::kind() const noexcept { return m_node->kind; }
  inline ScalarKind Type::scalarKind() const noexcept { return m_node->scalar; }
  inline const Type& Type::element() const noexcept { return m_node->element; }
  inline size_t Type::fixedSize() const noexcept { return m_node->fixedSize; }
  inline CollectionKind Type::collectionKind() const noexcept { return m_node->collection; }
  inline MapKind Type::mapKind() const noexcept { return m_node->map; }
  inline const EnumSchema& Type::enumSchema() const noexcept { return *m_node->enumSchema; }
  inline const ClassRef& Type::classRef() const noexcept { return *m_node->classRef; }
  inline const std::vector<Type>& Type::arguments() const noexcept { return m_node->arguments; }
  inline const PolymorphicSchema& Type::polymorphic() const noexcept { return *m_node->polymorphic; }
  inline const std::string& Type::variableName() const noexcept { return m_node->variable; }
  inline const std::string& Type::name() const noexcept { return m_node->name; }
  inline bool Type::hasVariables() const noexcept { return m_node->hasVariables; }

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  namespace types
  {

    //---------------------------------------------------------------------------------------------------------------------
    inline Type Scalar(ScalarKind kind)
    {
      detail::TypeNode node;
      node.kind = TypeKind::Scalar;
      node.scalar = kind;
      node.name = detail::ScalarName(kind);
      return MakeType(std::move(node));
    }

    inline Type Bool() { return Scalar(ScalarKind::Boolean); }
    inline Type Byte() { return Scalar(ScalarKind::Byte); }
    inline Type Short() { return Scalar(ScalarKind::Short); }
    inline Type Int() { return Scalar(ScalarKind::Int); }
    inline Type Long() { return Scalar(ScalarKind::Long); }
    inline Type Float() { return Scalar(ScalarKind::Float); }
    inline Type Double() { return Scalar(ScalarKind::Double); }
    inline Type BigInt() { return Scalar(ScalarKind::BigInteger); }
    inline Type BigDec() { return Scalar(ScalarKind::BigDecimal); }
    inline Type String() { return Scalar(ScalarKind::String); }
    inline Type Void() { return Scalar(ScalarKind::Void); }

    //---------------------------------------------------------------------------------------------------------------------
    inline Type Array(Type element, size_t fixedSize = 0)
    {
      detail::TypeNode node;
      node.kind = TypeKind::Array;
      node.fixedSize = fixedSize;
      node.hasVariables = element.hasVariables();
      node.name = "array<" + element.name() + (fixedSize ? "," + std::to_string(fixedSize) : "") + ">";
      node.element = std::move(element);
      return MakeType(std::move(node));
    }

    //---------------------------------------------------------------------------------------------------------------------
    inline Type Collection(Type element, CollectionKind kind)
    {
      detail::TypeNode node;
      node.kind = TypeKind::Collection;
      node.collection = kind;
      node.hasVariables = element.hasVariables();
      node.name = std::string(detail::CollectionName(kind)) + "<" + element.name() + ">";
      node.element = std::move(element);
      return MakeType(std::move(node));
    }

    inline Type List(Type element) { return Collection(std::move(element), CollectionKind::List); }

    //---------------------------------------------------------------------------------------------------------------------
    inline Type Map(Type value, MapKind kind = MapKind::Sorted)
    {
      detail::TypeNode node;
      node.kind = TypeKind::Map;
      node.map = kind;
      node.hasVariables = value.hasVariables();
      node.name = std::string(detail::MapName(kind)) + "<" + value.name() + ">";
      node.element = std::move(value);
      return MakeType(std::move(node));
    }

    //---------------------------------------------------------------------------------------------------------------------
    inline Type Open()
    {
      static const Type open = [] {
        detail::TypeNode node;
        node.kind = TypeKind::Open;
        node.name = "open";
        return MakeType(std::move(node));
      }();

      return open;
    }

    //---------------------------------------------------------------------------------------------------------------------
    inline Type Var(std::string name)
    {
      detail::TypeNode node;
      node.kind = TypeKind::Variable;
      node.hasVariables = true;
      node.name = "var<" + name + ">";
      node.variable = std::move(name);
      return MakeType(std::move(node));
    }

    //---------------------------------------------------------------------------------------------------------------------
    inline Type Object(const ClassRef& ref, std::vector<Type> arguments = {})
    {
      detail::TypeNode node;
      node.kind = TypeKind::Object;
      node.classRef = ref;
      node.name = std::string("object<") + ref.type.name();

      for (const Type& arg : arguments)
      {
        node.name += "," + arg.name();
        node.hasVariables = node.hasVariables || arg.hasVariables();
      }

      node.name += ">";
      node.arguments = std::move(arguments);
      return MakeType(std::move(node));
    }

    //---------------------------------------------------------------------------------------------------------------------
    inline Type Enum(const EnumSchema& schema, std::string_view typeName)
    {
      detail::TypeNode node;
      node.kind = TypeKind::Enum;
      node.enumSchema = &schema;
      node.name = "enum<" + std::string(typeName) + ">";
      return MakeType(std::move(node));
    }

    //---------------------------------------------------------------------------------------------------------------------
    inline Type Polymorphic(std::shared_ptr<const PolymorphicSchema> schema, const ClassRef& host)
    {
      detail::TypeNode node;
      node.kind = TypeKind::Polymorphic;
      node.classRef = host;
      node.name = std::string("polymorphic<") + host.type.name() + ">";
      node.polymorphic = std::move(schema);
      return MakeType(std::move(node));
    }

    // Natural descriptor of a C++ type, defined with the storage adapters
    template <typename T>
    Type Of();

    // Object descriptor of a generic class bound to concrete arguments
    template <typename T>
    Type Object(std::vector<Type> arguments = {});

  } // namespace types

  ///////////////////////////////////////////////////////////////////////////////////////////////////////////////////////

  //---------------------------------------------------------------------------------------------------------------------
  // Replaces type variables with their bindings, fails on a variable with no binding
  inline Error Resolve(const Type& declared, const Substitution& substitution, Type& out)
  {
    if (!declared.hasVariables())
    {
      out = declared;
      return {Error::None};
    }

    switch (declared.kind())
    {
    case TypeKind::Variable: {
      auto iter = substitution.find(declared.variableName());
      if (iter == substitution.end())
        return {Error::UnresolvedTypeVariable, 0, 0, {}, "type variable " + declared.variableName() + " has no binding"};

      out = iter->second;
      return {Error::None};
    }

    case TypeKind::Array:
    case TypeKind::Collection:
    case TypeKind::Map: {
      Type element;
      if (auto err = Resolve(declared.element(), substitution, element))
        return err;

      if (declared.kind() == TypeKind::Array)
        out = types::Array(std::move(element), declared.fixedSize());
      else if (declared.kind() == TypeKind::Collection)
        out = types::Collection(std::move(element), declared.collectionKind());
      else
        out = types::Map(std::move(element), declared.mapKind());

      return {Error::None};
    }

    case TypeKind::Object: {
      std::vector<Type> arguments;
      for (const Type& arg : declared.arguments())
      {
        if (auto err = Resolve(arg, substitution, arguments.emplace_back()))
          return err;
      }

      out = types::Object(declared.classRef(), std::move(arguments));
      return {Error::None};
    }

    default:
      out = declared;
      return {Error::None};
    }
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline const NullSentinel& SentinelFor(const Type& type)
  {
    return SentinelFor(type.name());
  }

} // namespace jbind
