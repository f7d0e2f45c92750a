#include "JbindTestUtils.hpp"

namespace poly_tests
{

  struct Animal
  {
    std::string name;
    int32_t legCount = 0;
    std::string type;

    virtual ~Animal() = default;

    static void declareJbindSchema(jbind::SchemaBuilder<Animal>& b);
  };

  struct Dog : Animal
  {
    int32_t tricksKnown = 0;
    jbind::Nullable<std::vector<std::string>> toys;

    JBIND_MEMBERS_INHERIT(Animal, tricksKnown, toys)
  };

  struct Cat : Animal
  {
    bool indoor = false;

    JBIND_MEMBERS_INHERIT(Animal, indoor)
  };

  void Animal::declareJbindSchema(jbind::SchemaBuilder<Animal>& b)
  {
    b.name("Animal");
    b.field("name", &Animal::name);
    b.field("legCount", &Animal::legCount);
    b.field("type", &Animal::type).typeMap(jbind::TypeDef<Dog>("dog"), jbind::TypeDef<Cat>("cat"));
  }

  struct Zoo
  {
    std::string city;
    std::vector<std::shared_ptr<Animal>> animals;
    std::shared_ptr<Animal> star;

    JBIND_MEMBERS(city, animals, star)
  };

  struct Owner
  {
    std::string name;
    std::shared_ptr<Animal> pet;

    JBIND_MEMBERS(name, pet)
  };

  using AnimalPtr = std::shared_ptr<Animal>;

  AnimalPtr Parse(std::string_view json, jbind::Error& err)
  {
    AnimalPtr animal;
    err = jbind::FromString(json, animal);
    return animal;
  }

} // namespace poly_tests

using namespace poly_tests;
using jbind::Error;

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, DiscriminatorPositionIndependence)
{
  const std::string_view inputs[] = {
    R"({"type":"dog","name":"Fido","legCount":4,"tricksKnown":3})",
    R"({"name":"Fido","type":"dog","legCount":4,"tricksKnown":3})",
    R"({"name":"Fido","legCount":4,"tricksKnown":3,"type":"dog"})",
  };

  for (std::string_view json : inputs)
  {
    Error err;
    AnimalPtr animal = Parse(json, err);
    ASSERT_FALSE(PrintError(err)) << json;

    auto dog = std::dynamic_pointer_cast<Dog>(animal);
    ASSERT_TRUE(dog) << json;
    EXPECT_EQ(dog->name, "Fido");
    EXPECT_EQ(dog->legCount, 4);
    EXPECT_EQ(dog->tricksKnown, 3);
    EXPECT_EQ(dog->type, "dog");
    EXPECT_FALSE(dog->toys.isSet());

    EXPECT_EQ(Canonical(animal), R"({"legCount":4,"name":"Fido","tricksKnown":3,"type":"dog"})");
  }
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, SelectsSubtype)
{
  Error err;
  AnimalPtr animal = Parse(R"({"indoor":true,"name":"Tom","type":"cat","legCount":4})", err);
  ASSERT_FALSE(PrintError(err));

  auto cat = std::dynamic_pointer_cast<Cat>(animal);
  ASSERT_TRUE(cat);
  EXPECT_TRUE(cat->indoor);
  EXPECT_EQ(cat->name, "Tom");
  EXPECT_FALSE(std::dynamic_pointer_cast<Dog>(animal));

  animal = Parse(R"({"type":"dog","toys":["ball","rope"],"name":"Rex"})", err);
  ASSERT_FALSE(PrintError(err));

  auto dog = std::dynamic_pointer_cast<Dog>(animal);
  ASSERT_TRUE(dog);
  ASSERT_TRUE(dog->toys.hasValue());
  EXPECT_EQ(dog->toys.value(), (std::vector<std::string> {"ball", "rope"}));
  EXPECT_EQ(Canonical(animal), R"({"legCount":0,"name":"Rex","toys":["ball","rope"],"tricksKnown":0,"type":"dog"})");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, MissingDiscriminator)
{
  Error err;
  AnimalPtr animal = Parse(R"({"name":"Rex","legCount":4})", err);
  EXPECT_EQ(err.type, Error::MissingDiscriminator);
  EXPECT_EQ(err.detail, "heterogeneous schema without type field specified ('type' in Animal)");
  EXPECT_FALSE(animal);

  Parse(R"({})", err);
  EXPECT_EQ(err.type, Error::MissingDiscriminator);

  Parse(R"({"name":"Rex","type":null})", err);
  EXPECT_EQ(err.type, Error::MissingDiscriminator);
  EXPECT_EQ(err.path, "/type");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, UnknownDiscriminator)
{
  Error err;
  Parse(R"({"name":"Tweety","type":"bird"})", err);
  EXPECT_EQ(err.type, Error::UnknownDiscriminator);
  EXPECT_EQ(err.detail, "'bird' is not one of: cat, dog");
  EXPECT_EQ(err.path, "/type");

  Parse(R"({"type":"Dog"})", err);
  EXPECT_EQ(err.type, Error::UnknownDiscriminator);

  Parse(R"({"type":["dog"]})", err);
  EXPECT_EQ(err.type, Error::UnknownDiscriminator);

  Parse(R"(["dog"])", err);
  EXPECT_EQ(err.type, Error::ObjectExpected);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, DuplicateDiscriminator)
{
  Error err;
  Parse(R"({"type":"dog","name":"Rex","type":"cat"})", err);
  EXPECT_EQ(err.type, Error::DuplicateDiscriminator);
  EXPECT_EQ(err.path, "/type");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, ReplayedErrorKeepsPosition)
{
  Error err;
  Parse(R"({"legCount":"4","type":"dog"})", err);
  EXPECT_EQ(err.type, Error::UnquotedValueExpected);
  EXPECT_EQ(err.path, "/legCount");
  EXPECT_EQ(err.line, 1);
  EXPECT_EQ(err.column, 13);

  Parse("{\"name\":\"Rex\",\n\"type\":\"dog\",\n\"legCount\":true}", err);
  EXPECT_EQ(err.type, Error::NumberExpected);
  EXPECT_EQ(err.path, "/legCount");
  EXPECT_EQ(err.line, 3);
  EXPECT_EQ(err.column, 12);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, NullPointer)
{
  Error err;
  AnimalPtr animal = std::make_shared<Cat>();
  err = jbind::FromString("null", animal);
  ASSERT_FALSE(PrintError(err));
  EXPECT_FALSE(animal);

  EXPECT_EQ(Canonical(animal), "null");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, NullPointerMember)
{
  Owner owner;
  ASSERT_FALSE(PrintError(jbind::FromString(R"({"name":"Ann","pet":null})", owner)));
  EXPECT_FALSE(owner.pet);
  EXPECT_EQ(Canonical(owner), R"({"name":"Ann","pet":null})");

  jbind::Value value("x");
  ASSERT_FALSE(PrintError(jbind::Get(owner, "pet", value)));
  EXPECT_TRUE(value.isNull());

  std::vector<std::string> keys;
  ASSERT_FALSE(PrintError(jbind::Keys(owner, keys)));
  EXPECT_EQ(keys, (std::vector<std::string> {"name", "pet"}));

  Owner absent;
  ASSERT_FALSE(PrintError(jbind::FromString(R"({"name":"Ann"})", absent)));
  EXPECT_FALSE(absent.pet);
  EXPECT_EQ(Canonical(absent), R"({"name":"Ann"})");
  EXPECT_EQ(jbind::Get(absent, "pet", value).type, Error::UnsupportedOperation);

  // A plain reset forgets the null
  owner.pet.reset();
  EXPECT_EQ(Canonical(owner), R"({"name":"Ann"})");

  ASSERT_FALSE(PrintError(jbind::Set(owner, "pet", jbind::Value())));
  EXPECT_EQ(Canonical(owner), R"({"name":"Ann","pet":null})");

  Owner adopted;
  ASSERT_FALSE(PrintError(jbind::FromString(R"({"pet":{"type":"cat","name":"Tom"},"name":"Ann"})", adopted)));
  ASSERT_TRUE(std::dynamic_pointer_cast<Cat>(adopted.pet));
  EXPECT_EQ(Canonical(adopted), R"({"name":"Ann","pet":{"indoor":false,"legCount":0,"name":"Tom","type":"cat"}})");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, NestedCollection)
{
  std::string_view json = R"({
    "city": "Springfield",
    "animals": [
      {"type": "dog", "name": "Fido", "legCount": 4, "tricksKnown": 3},
      {"name": "Tom", "type": "cat", "indoor": true, "legCount": 4},
      null
    ],
    "star": {"legCount": 3, "type": "cat", "name": "Tripod"}
  })";

  Zoo zoo;
  ASSERT_FALSE(PrintError(jbind::FromString(json, zoo)));
  ASSERT_EQ(zoo.animals.size(), 3u);
  EXPECT_TRUE(std::dynamic_pointer_cast<Dog>(zoo.animals[0]));
  EXPECT_TRUE(std::dynamic_pointer_cast<Cat>(zoo.animals[1]));
  EXPECT_FALSE(zoo.animals[2]);
  ASSERT_TRUE(std::dynamic_pointer_cast<Cat>(zoo.star));
  EXPECT_EQ(zoo.star->legCount, 3);

  std::string canonical = Canonical(zoo);
  EXPECT_EQ(canonical, R"({"animals":[{"legCount":4,"name":"Fido","tricksKnown":3,"type":"dog"},)"
                       R"({"indoor":true,"legCount":4,"name":"Tom","type":"cat"},null],)"
                       R"("city":"Springfield","star":{"indoor":false,"legCount":3,"name":"Tripod","type":"cat"}})");

  Zoo again;
  ASSERT_FALSE(PrintError(jbind::FromString(canonical, again)));
  EXPECT_EQ(Canonical(again), canonical);

  again.star.reset();
  EXPECT_EQ(Canonical(again).find("star"), std::string::npos);

  Zoo empty;
  ASSERT_FALSE(PrintError(jbind::FromString(R"({"city":"Shelbyville","animals":[],"star":null})", empty)));
  EXPECT_FALSE(empty.star);
  EXPECT_EQ(Canonical(empty), R"({"animals":[],"city":"Shelbyville","star":null})");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, NestedErrorPath)
{
  Zoo zoo;
  Error err = jbind::FromString(R"({"animals":[{"type":"cat"},{"type":"cat","indoor":"yes"}]})", zoo);
  EXPECT_EQ(err.type, Error::UnquotedValueExpected);
  EXPECT_EQ(err.path, "/animals/1/indoor");

  err = jbind::FromString(R"({"star":{"type":"fish"}})", zoo);
  EXPECT_EQ(err.type, Error::UnknownDiscriminator);
  EXPECT_EQ(err.path, "/star/type");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, UnknownKeysInBothPhases)
{
  std::vector<std::string> dropped;
  jbind::ReaderParams rp;
  rp.onUnrecognizedKey = [&dropped](std::string_view key) { dropped.emplace_back(key); };

  AnimalPtr animal;
  ASSERT_FALSE(PrintError(jbind::FromString(R"({"color":"grey","type":"cat","owner":{"id":1},"indoor":false})", animal, rp)));
  EXPECT_TRUE(std::dynamic_pointer_cast<Cat>(animal));
  EXPECT_EQ(dropped, (std::vector<std::string> {"color", "owner"}));
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindPolymorphic, WrittenThroughDynamicType)
{
  auto dog = std::make_shared<Dog>();
  dog->name = "Lassie";
  dog->legCount = 4;
  dog->type = "dog";
  dog->tricksKnown = 12;

  AnimalPtr animal = dog;
  EXPECT_EQ(Canonical(animal), R"({"legCount":4,"name":"Lassie","tricksKnown":12,"type":"dog"})");
  EXPECT_EQ(Canonical(*dog), Canonical(animal));

  Error err;
  AnimalPtr back = Parse(Canonical(animal), err);
  ASSERT_FALSE(PrintError(err));
  EXPECT_EQ(std::dynamic_pointer_cast<Dog>(back)->tricksKnown, 12);
}
