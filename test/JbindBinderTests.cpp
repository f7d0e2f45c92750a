#include "JbindTestUtils.hpp"

#include <cmath>
#include <filesystem>
#include <sstream>

namespace binder_tests
{

  struct Point
  {
    int32_t x = 0;
    int32_t y = 0;

    JBIND_MEMBERS(x, y)
  };

  struct Polygon
  {
    std::string name;
    std::vector<Point> points;

    JBIND_MEMBERS(name, points)
  };

  struct Optional
  {
    jbind::Nullable<int32_t> a;
    jbind::Nullable<std::vector<int32_t>> list;
    std::vector<jbind::Nullable<int32_t>> slots;
    int32_t plain = 0;

    JBIND_MEMBERS(a, list, slots, plain)
  };

  struct Skipping
  {
    jbind::Void ignored;
    int32_t n = 0;

    JBIND_MEMBERS(ignored, n)
  };

  struct Account
  {
    int64_t id = 0;
    bool active = false;
    double ratio = 0;

    static void declareJbindSchema(jbind::SchemaBuilder<Account>& b)
    {
      b.name("Account");
      b.field("id", &Account::id).quoted();
      b.field("active", &Account::active).quoted();
      b.field("ratio", &Account::ratio).quoted();
    }
  };

  struct Person
  {
    std::string name;
    int32_t age = 0;

    JBIND_MEMBERS(name, age)
  };

  struct Pet : jbind::GenericData
  {
    std::string name;

    JBIND_MEMBERS(name)
  };

  struct Document
  {
    std::string title;
    std::vector<int32_t> body;

    JBIND_MEMBERS(title, body)
  };

  enum class Color
  {
    Red,
    Green,
    Blue
  };

  enum class Level
  {
    Unknown,
    Low,
    High
  };

  struct Paint
  {
    Color color = Color::Red;
    Level level = Level::Low;

    JBIND_MEMBERS(color, level)
  };

  template <typename T>
  jbind::Error Bind(std::string_view json, T& out)
  {
    return jbind::FromString(json, out);
  }

  template <typename T>
  int BindError(std::string_view json)
  {
    T out {};
    return jbind::FromString(json, out).type;
  }

} // namespace binder_tests

JBIND_ENUM(binder_tests::Color, Red, Green, Blue)

template <>
struct jbind::SchemaDeclaration<binder_tests::Level>
{
  static void Declare(jbind::EnumBuilder<binder_tests::Level>& b)
  {
    b.name("Level");
    b.value(binder_tests::Level::Low, "low");
    b.value(binder_tests::Level::High, "high");
    b.nullValue(binder_tests::Level::Unknown);
  }
};

using namespace binder_tests;
using jbind::Error;

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, Scalars)
{
  int32_t i = 0;
  EXPECT_FALSE(PrintError(Bind("-42", i)));
  EXPECT_EQ(i, -42);

  double d = 0;
  EXPECT_FALSE(PrintError(Bind("2.5", d)));
  EXPECT_EQ(d, 2.5);
  EXPECT_FALSE(PrintError(Bind("3", d)));
  EXPECT_EQ(d, 3.0);
  EXPECT_FALSE(PrintError(Bind("-1.25e2", d)));
  EXPECT_EQ(d, -125.0);

  float f = 0;
  EXPECT_FALSE(PrintError(Bind("0.5", f)));
  EXPECT_EQ(f, 0.5f);

  bool flag = false;
  EXPECT_FALSE(PrintError(Bind("true", flag)));
  EXPECT_TRUE(flag);

  std::string text;
  EXPECT_FALSE(PrintError(Bind(R"("line\nbreak")", text)));
  EXPECT_EQ(text, "line\nbreak");

  EXPECT_EQ(BindError<bool>("1"), Error::BooleanExpected);
  EXPECT_EQ(BindError<bool>("null"), Error::NullNotAllowed);
  EXPECT_EQ(BindError<bool>("[]"), Error::BooleanExpected);
  EXPECT_EQ(BindError<int32_t>("true"), Error::NumberExpected);
  EXPECT_EQ(BindError<int32_t>("{}"), Error::NumberExpected);
  EXPECT_EQ(BindError<std::string>("5"), Error::StringExpected);
  EXPECT_EQ(BindError<std::string>("{}"), Error::StringExpected);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, IntegerOverflow)
{
  int8_t b = 0;
  EXPECT_FALSE(PrintError(Bind("127", b)));
  EXPECT_EQ(b, 127);
  EXPECT_FALSE(PrintError(Bind("-128", b)));
  EXPECT_EQ(b, -128);
  EXPECT_EQ(BindError<int8_t>("128"), Error::NumberOverflow);
  EXPECT_EQ(BindError<int8_t>("-129"), Error::NumberOverflow);

  int16_t s = 0;
  EXPECT_FALSE(PrintError(Bind("32767", s)));
  EXPECT_EQ(s, 32767);
  EXPECT_EQ(BindError<int16_t>("32768"), Error::NumberOverflow);
  EXPECT_EQ(BindError<int16_t>("-32769"), Error::NumberOverflow);

  int32_t i = 0;
  EXPECT_FALSE(PrintError(Bind("-2147483648", i)));
  EXPECT_EQ(i, std::numeric_limits<int32_t>::min());
  EXPECT_EQ(BindError<int32_t>("2147483648"), Error::NumberOverflow);

  int64_t l = 0;
  EXPECT_FALSE(PrintError(Bind("9223372036854775807", l)));
  EXPECT_EQ(l, std::numeric_limits<int64_t>::max());
  EXPECT_EQ(BindError<int64_t>("9223372036854775808"), Error::NumberOverflow);
  EXPECT_EQ(BindError<int64_t>("-9223372036854775809"), Error::NumberOverflow);

  Error err = Bind("300", b);
  EXPECT_EQ(err.detail, "300 does not fit byte");
  EXPECT_TRUE(err.isInvalidArgument());
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, IntegerExpected)
{
  EXPECT_EQ(BindError<int32_t>("1.5"), Error::IntegerExpected);
  EXPECT_EQ(BindError<int32_t>("1e3"), Error::IntegerExpected);
  EXPECT_EQ(BindError<int64_t>("-0.0"), Error::IntegerExpected);
  EXPECT_EQ(BindError<jbind::BigInteger>("2.5"), Error::IntegerExpected);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, QuotingMismatch)
{
  EXPECT_EQ(BindError<int32_t>(R"("5")"), Error::UnquotedValueExpected);
  EXPECT_EQ(BindError<bool>(R"("true")"), Error::UnquotedValueExpected);
  EXPECT_EQ(BindError<double>(R"("2.5")"), Error::UnquotedValueExpected);
  EXPECT_EQ(BindError<double>(R"("nan")"), Error::UnquotedValueExpected);

  Account account;
  ASSERT_FALSE(PrintError(Bind(R"({"id":"123","active":"true","ratio":"0.25"})", account)));
  EXPECT_EQ(account.id, 123);
  EXPECT_TRUE(account.active);
  EXPECT_EQ(account.ratio, 0.25);

  Error err = Bind(R"({"id":123})", account);
  EXPECT_EQ(err.type, Error::QuotedValueExpected);
  EXPECT_EQ(err.path, "/id");

  EXPECT_EQ(BindError<Account>(R"({"active":true})"), Error::QuotedValueExpected);
  EXPECT_EQ(BindError<Account>(R"({"id":"abc"})"), Error::NumberExpected);
  EXPECT_EQ(BindError<Account>(R"({"id":"99999999999999999999"})"), Error::NumberOverflow);
  EXPECT_EQ(BindError<Account>(R"({"id":"1.5"})"), Error::IntegerExpected);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, FloatingPoint)
{
  double d = 0;
  EXPECT_FALSE(PrintError(Bind(R"("NaN")", d)));
  EXPECT_TRUE(std::isnan(d));
  EXPECT_FALSE(PrintError(Bind(R"("Infinity")", d)));
  EXPECT_EQ(d, std::numeric_limits<double>::infinity());
  EXPECT_FALSE(PrintError(Bind(R"("-Infinity")", d)));
  EXPECT_EQ(d, -std::numeric_limits<double>::infinity());

  float f = 0;
  EXPECT_FALSE(PrintError(Bind(R"("NaN")", f)));
  EXPECT_TRUE(std::isnan(f));

  EXPECT_EQ(BindError<float>("1e39"), Error::NumberOverflow);
  EXPECT_EQ(BindError<double>("1e400"), Error::NumberOverflow);
  EXPECT_EQ(BindError<double>("-1e400"), Error::NumberOverflow);
  EXPECT_EQ(BindError<double>("true"), Error::NumberExpected);

  // Underflow rounds toward zero
  d = 1;
  EXPECT_FALSE(PrintError(Bind("1e-400", d)));
  EXPECT_EQ(d, 0.0);
  EXPECT_FALSE(std::signbit(d));

  EXPECT_FALSE(PrintError(Bind("-1e-400", d)));
  EXPECT_EQ(d, 0.0);
  EXPECT_TRUE(std::signbit(d));

  EXPECT_FALSE(PrintError(Bind("1e-310", d)));
  EXPECT_GT(d, 0.0);
  EXPECT_LT(d, std::numeric_limits<double>::min());

  f = 1;
  EXPECT_FALSE(PrintError(Bind("1e-50", f)));
  EXPECT_EQ(f, 0.0f);
  EXPECT_FALSE(PrintError(Bind("0.00000000000000000000000000000000000000000000000001", f)));
  EXPECT_EQ(f, 0.0f);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, BigNumbers)
{
  jbind::BigInteger big;
  EXPECT_FALSE(PrintError(Bind("-123456789012345678901234567890", big)));
  EXPECT_EQ(big.toString(), "-123456789012345678901234567890");

  jbind::BigDecimal dec;
  EXPECT_FALSE(PrintError(Bind("3.14159265358979323846264338327950288", dec)));
  EXPECT_EQ(dec.toString(), "3.14159265358979323846264338327950288");

  EXPECT_FALSE(PrintError(Bind("1e400", dec)));
  EXPECT_EQ(dec.scale(), -400);

  EXPECT_FALSE(PrintError(Bind("42", dec)));
  EXPECT_TRUE(dec.isIntegral());

  EXPECT_EQ(Canonical(big), "-123456789012345678901234567890");
  EXPECT_EQ(BindError<jbind::BigDecimal>(R"("1.5")"), Error::UnquotedValueExpected);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, VoidSkipsValue)
{
  Skipping s;
  ASSERT_FALSE(PrintError(Bind(R"({"ignored":{"deep":[1,{"x":null}]},"n":1})", s)));
  EXPECT_EQ(s.n, 1);

  ASSERT_FALSE(PrintError(Bind(R"({"ignored":null,"n":2})", s)));
  EXPECT_EQ(s.n, 2);

  ASSERT_FALSE(PrintError(Bind(R"({"n":3,"ignored":"text"})", s)));
  EXPECT_EQ(s.n, 3);
  EXPECT_EQ(Canonical(s), R"({"n":3})");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, Sequences)
{
  std::array<int32_t, 3> fixed = {};
  EXPECT_FALSE(PrintError(Bind("[1,2,3]", fixed)));
  EXPECT_EQ(fixed, (std::array<int32_t, 3> {1, 2, 3}));

  Error err = Bind("[1,2]", fixed);
  EXPECT_EQ(err.type, Error::WrongArraySize);
  EXPECT_EQ(err.detail, "expected 3 elements, got 2");
  EXPECT_EQ((BindError<std::array<int32_t, 3>>("[1,2,3,4]")), Error::WrongArraySize);

  std::vector<bool> flags;
  EXPECT_FALSE(PrintError(Bind("[true,false,true]", flags)));
  EXPECT_EQ(flags, (std::vector<bool> {true, false, true}));

  std::set<int32_t> unique;
  EXPECT_FALSE(PrintError(Bind("[3,1,2,1]", unique)));
  EXPECT_EQ(unique, (std::set<int32_t> {1, 2, 3}));

  std::list<std::string> names;
  EXPECT_FALSE(PrintError(Bind(R"(["b","a"])", names)));
  EXPECT_EQ(names, (std::list<std::string> {"b", "a"}));

  std::deque<int64_t> queue = {9, 9, 9, 9};
  EXPECT_FALSE(PrintError(Bind("[5]", queue)));
  EXPECT_EQ(queue, (std::deque<int64_t> {5}));

  std::vector<std::vector<int32_t>> nested;
  EXPECT_FALSE(PrintError(Bind("[[],[1],[2,3]]", nested)));
  ASSERT_EQ(nested.size(), 3u);
  EXPECT_TRUE(nested[0].empty());
  EXPECT_EQ(nested[2], (std::vector<int32_t> {2, 3}));

  EXPECT_EQ(BindError<std::vector<int32_t>>("{}"), Error::ArrayExpected);
  EXPECT_EQ(BindError<std::vector<int32_t>>("null"), Error::NullNotAllowed);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, Maps)
{
  std::map<std::string, int32_t> sorted;
  EXPECT_FALSE(PrintError(Bind(R"({"b":2,"a":1})", sorted)));
  EXPECT_EQ(sorted, (std::map<std::string, int32_t> {{"a", 1}, {"b", 2}}));

  jbind::ArrayMap<int32_t> ordered;
  EXPECT_FALSE(PrintError(Bind(R"({"b":2,"a":1})", ordered)));
  ASSERT_EQ(ordered.size(), 2u);
  EXPECT_EQ(ordered.begin()->first, "b");

  std::unordered_map<std::string, std::vector<std::string>> hashed;
  EXPECT_FALSE(PrintError(Bind(R"({"k":["v1","v2"],"e":[]})", hashed)));
  EXPECT_EQ(hashed["k"].size(), 2u);
  EXPECT_TRUE(hashed["e"].empty());

  Error err = Bind(R"({"a":1,"b":"x"})", sorted);
  EXPECT_EQ(err.type, Error::UnquotedValueExpected);
  EXPECT_EQ(err.path, "/b");

  EXPECT_EQ((BindError<std::map<std::string, int32_t>>("[]")), Error::ObjectExpected);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, ErrorPath)
{
  Polygon polygon;
  Error err = Bind(R"({"name":"tri","points":[{"x":1,"y":2},{"x":3,"y":null}]})", polygon);

  EXPECT_EQ(err.type, Error::NullNotAllowed);
  EXPECT_EQ(err.path, "/points/1/y");
  EXPECT_EQ(err.line, 1);
  EXPECT_EQ(err.column, 50);
  EXPECT_EQ(err.detail, "int cannot hold null");
  EXPECT_EQ(jbind::ToString(err), "null not allowed at 1:50 [/points/1/y]: int cannot hold null");

  err = Bind(R"({"name":"tri","points":[{"x":1,"y":2},{"x":3,"y":4.5}]})", polygon);
  EXPECT_EQ(err.type, Error::IntegerExpected);
  EXPECT_EQ(err.path, "/points/1/y");

  err = Bind(R"({"name":"tri","points":{}})", polygon);
  EXPECT_EQ(err.type, Error::ArrayExpected);
  EXPECT_EQ(err.path, "/points");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, NullVersusAbsence)
{
  Optional isNull, absent, zero;
  ASSERT_FALSE(PrintError(Bind(R"({"a":null})", isNull)));
  ASSERT_FALSE(PrintError(Bind(R"({})", absent)));
  ASSERT_FALSE(PrintError(Bind(R"({"a":0})", zero)));

  EXPECT_TRUE(isNull.a.isNull());
  EXPECT_EQ(isNull.a.sentinel(), &jbind::SentinelFor(jbind::types::Int()));
  EXPECT_FALSE(absent.a.isSet());
  EXPECT_TRUE(zero.a.hasValue());
  EXPECT_EQ(zero.a.value(), 0);

  EXPECT_FALSE(isNull.a == absent.a);
  EXPECT_FALSE(isNull.a == zero.a);
  EXPECT_FALSE(absent.a == zero.a);

  EXPECT_EQ(Canonical(isNull), R"({"a":null,"plain":0,"slots":[]})");
  EXPECT_EQ(Canonical(absent), R"({"plain":0,"slots":[]})");
  EXPECT_EQ(Canonical(zero), R"({"a":0,"plain":0,"slots":[]})");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, NullContainersAndElements)
{
  Optional opt;
  ASSERT_FALSE(PrintError(Bind(R"({"list":null,"slots":[1,null,3]})", opt)));

  EXPECT_TRUE(opt.list.isNull());
  EXPECT_EQ(opt.list.sentinel(), &jbind::SentinelFor("array<int>"));
  EXPECT_NE(opt.list.sentinel(), &jbind::SentinelFor(jbind::types::Int()));

  ASSERT_EQ(opt.slots.size(), 3u);
  EXPECT_EQ(opt.slots[0].value(), 1);
  EXPECT_TRUE(opt.slots[1].isNull());
  EXPECT_EQ(opt.slots[1].sentinel(), &jbind::SentinelFor(jbind::types::Int()));
  EXPECT_EQ(opt.slots[2].value(), 3);

  Error err = Bind(R"({"plain":null})", opt);
  EXPECT_EQ(err.type, Error::NullNotAllowed);
  EXPECT_EQ(err.path, "/plain");

  jbind::Any any;
  ASSERT_FALSE(PrintError(jbind::FromString("null", jbind::types::List(jbind::types::String()), any)));
  EXPECT_TRUE(any.isNull());
  EXPECT_EQ(any.sentinel(), &jbind::SentinelFor("list<string>"));
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, Enums)
{
  Paint paint;
  ASSERT_FALSE(PrintError(Bind(R"({"color":"Blue","level":"high"})", paint)));
  EXPECT_EQ(paint.color, Color::Blue);
  EXPECT_EQ(paint.level, Level::High);

  ASSERT_FALSE(PrintError(Bind(R"({"level":null})", paint)));
  EXPECT_EQ(paint.level, Level::Unknown);

  Error err = Bind(R"({"color":"Purple"})", paint);
  EXPECT_EQ(err.type, Error::InvalidEnum);
  EXPECT_EQ(err.path, "/color");
  EXPECT_EQ(err.detail, "'Purple' is not a value of binder_tests::Color");

  err = Bind(R"({"color":null})", paint);
  EXPECT_EQ(err.type, Error::NullNotAllowed);

  EXPECT_EQ(BindError<Paint>(R"({"color":"blue"})"), Error::InvalidEnum);
  EXPECT_EQ(BindError<Paint>(R"({"color":true})"), Error::StringExpected);
  EXPECT_EQ(BindError<Paint>(R"({"level":"Low"})"), Error::InvalidEnum);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, UnrecognizedKeys)
{
  std::vector<std::string> dropped;
  jbind::ReaderParams rp;
  rp.onUnrecognizedKey = [&dropped](std::string_view key) { dropped.emplace_back(key); };

  Person person;
  ASSERT_FALSE(PrintError(jbind::FromString(R"({"name":"Ann","height":1.7,"tags":["a",{"b":[]}],"age":30})", person, rp)));
  EXPECT_EQ(person.name, "Ann");
  EXPECT_EQ(person.age, 30);
  EXPECT_EQ(dropped, (std::vector<std::string> {"height", "tags"}));

  ASSERT_FALSE(PrintError(Bind(R"({"name":"Bob","nickname":"B"})", person)));
  EXPECT_EQ(person.name, "Bob");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, GenericDataKeepsUnknownKeys)
{
  Pet pet;
  ASSERT_FALSE(PrintError(Bind(R"({"name":"Fido","extra":{"x":1},"tags":[true,null]})", pet)));
  EXPECT_EQ(pet.name, "Fido");
  EXPECT_EQ(pet.unknownKeys().size(), 2u);
  EXPECT_FALSE(pet.unknownKeys().contains("name"));
  ASSERT_TRUE(pet.unknownKeys().contains("extra"));

  const jbind::Value& extra = pet.unknownKeys().find("extra")->second;
  EXPECT_TRUE(extra.isObject());
  EXPECT_EQ(extra.getObject().find("x")->second.getNumber().toString(), "1");

  EXPECT_EQ(Canonical(pet), R"({"extra":{"x":1},"name":"Fido","tags":[true,null]})");
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, TrailingData)
{
  Person person;
  Error err = Bind(R"({"name":"Ann"} {})", person);
  EXPECT_EQ(err.type, Error::TrailingData);
  EXPECT_TRUE(err.isMalformedInput());

  EXPECT_EQ(BindError<int32_t>("5 5"), Error::TrailingData);
  EXPECT_EQ(BindError<int32_t>(" 5 \n"), Error::None);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, WrapperKeys)
{
  jbind::ReaderParams rp;
  rp.wrapperKeys = {"data", "person"};

  Person person;
  ASSERT_FALSE(PrintError(jbind::FromString(R"({"meta":{"v":[1]},"data":{"count":1,"person":{"name":"Zed","age":5}},"tail":0})", person, rp)));
  EXPECT_EQ(person.name, "Zed");
  EXPECT_EQ(person.age, 5);

  Error err = jbind::FromString(R"({"data":{"count":1}})", person, rp);
  EXPECT_EQ(err.type, Error::WrapperKeyNotFound);
  EXPECT_EQ(err.detail, "person");

  err = jbind::FromString(R"({"data":5})", person, rp);
  EXPECT_EQ(err.type, Error::ObjectExpected);

  err = jbind::FromString(R"([1])", person, rp);
  EXPECT_EQ(err.type, Error::ObjectExpected);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, StopAtKey)
{
  jbind::ReaderParams rp;
  rp.stopAtKey = "body";

  Document doc;
  ASSERT_FALSE(PrintError(jbind::FromString(R"({"title":"Report","body":[1,2,)", doc, rp)));
  EXPECT_EQ(doc.title, "Report");
  EXPECT_TRUE(doc.body.empty());

  EXPECT_EQ(jbind::FromString(R"({"title":"Report","body":[1,2,)", doc).type, Error::UnexpectedEnd);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, IncompatibleDescriptor)
{
  int32_t i = 0;
  Error err = jbind::FromString("5", jbind::types::String(), i);
  EXPECT_EQ(err.type, Error::IncompatibleType);
  EXPECT_EQ(err.detail, "storage cannot hold string");

  std::vector<int32_t> v;
  EXPECT_EQ(jbind::FromString("[1]", jbind::types::List(jbind::types::Long()), v).type, Error::IncompatibleType);
  EXPECT_FALSE(PrintError(jbind::FromString("[1]", jbind::types::List(jbind::types::Int()), v)));
  EXPECT_EQ(v, (std::vector<int32_t> {1}));
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, InputBackends)
{
  std::string_view json = R"({"name":"Ann","age":41})";

  jbind::Value tree;
  ASSERT_FALSE(PrintError(jbind::FromString(json, tree)));

  Person fromString, fromStream, fromValue, fromTokens;
  EXPECT_FALSE(PrintError(jbind::FromString(json, fromString)));

  std::istringstream is {std::string(json)};
  EXPECT_FALSE(PrintError(jbind::FromStream(is, fromStream)));

  EXPECT_FALSE(PrintError(jbind::FromValue(tree, fromValue)));

  jbind::ValueTokenStream ts(tree);
  EXPECT_FALSE(PrintError(jbind::FromTokens(ts, fromTokens)));

  for (const Person* p : {&fromString, &fromStream, &fromValue, &fromTokens})
  {
    EXPECT_EQ(p->name, "Ann");
    EXPECT_EQ(p->age, 41);
  }

  jbind::Value list(jbind::Value::Array {1, 2, 3});
  jbind::ValueTokenStream listTokens(list);
  jbind::Any any;
  ASSERT_FALSE(PrintError(jbind::FromTokens(listTokens, jbind::types::List(jbind::types::Long()), any)));
  ASSERT_TRUE(any.is<std::vector<jbind::Any>>());
  EXPECT_EQ(any.as<std::vector<jbind::Any>>()[2].as<int64_t>(), 3);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, Files)
{
  Person person;
  Error err = jbind::FromFile("does/not/exist.json", person);
  EXPECT_EQ(err.type, Error::CouldNotOpen);
  EXPECT_EQ(err.detail, "does/not/exist.json");

  std::filesystem::path path = std::filesystem::temp_directory_path() / "jbind_binder_person.json";

  person.name = "Written";
  person.age = 7;
  ASSERT_FALSE(PrintError(jbind::ToFile(path.string(), person)));

  Person loaded;
  EXPECT_FALSE(PrintError(jbind::FromFile(path.string(), loaded)));
  EXPECT_EQ(loaded.name, "Written");
  EXPECT_EQ(loaded.age, 7);

  std::filesystem::remove(path);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, Latin1Input)
{
  jbind::ReaderParams rp;
  rp.charset = jbind::Charset::Latin1;

  Person person;
  ASSERT_FALSE(PrintError(jbind::FromString("{\"name\":\"Ren\xe9\",\"age\":3}", person, rp)));
  EXPECT_EQ(person.name, "Ren\xc3\xa9");
  EXPECT_EQ(person.age, 3);
}

/////////////////////////////////////////////////////////////////////////////////////////
TEST(JbindBinder, OpenValues)
{
  std::string_view json = R"({"z":[1,-2.50,"s",true,null],"a":{"big":123456789012345678901234567890},"m":{}})";

  jbind::Value value;
  ASSERT_FALSE(PrintError(jbind::FromString(json, value)));
  ASSERT_TRUE(value.isObject());

  const jbind::Value::Object& object = value.getObject();
  EXPECT_EQ(object.begin()->first, "z");

  const jbind::Value::Array& array = object.find("z")->second.getArray();
  ASSERT_EQ(array.size(), 5u);
  EXPECT_EQ(array[1].getNumber().toString(), "-2.50");
  EXPECT_TRUE(array[4].isNull());
  EXPECT_EQ(array[4].nullSentinel(), &jbind::OpenNull());

  EXPECT_EQ(Canonical(value), R"({"a":{"big":123456789012345678901234567890},"m":{},"z":[1,-2.50,"s",true,null]})");
}
