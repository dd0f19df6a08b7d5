#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "test_types.hpp"
#include <format>
#include <sstream>

using namespace reflector;
using namespace std::chrono_literals;

//=============================================================================
// Kind tests
//=============================================================================

TEST_SUITE("Kind") {

TEST_CASE("fundamental kinds") {
    CHECK(reflect(true).kind() == Kind::boolean);
    CHECK(reflect(int8_t{1}).kind() == Kind::int8);
    CHECK(reflect(int16_t{1}).kind() == Kind::int16);
    CHECK(reflect(5).kind() == Kind::int32);
    CHECK(reflect(int64_t{1}).kind() == Kind::int64);
    CHECK(reflect(uint8_t{1}).kind() == Kind::uint8);
    CHECK(reflect(5u).kind() == Kind::uint32);
    CHECK(reflect(uint64_t{1}).kind() == Kind::uint64);
    CHECK(reflect(2.5f).kind() == Kind::float32);
    CHECK(reflect(2.5).kind() == Kind::float64);
    CHECK(reflect(std::string("abc")).kind() == Kind::string);
}

TEST_CASE("text inputs are captured as std::string") {
    CHECK(reflect("abc").type() == typeid(std::string));
    CHECK(reflect(std::string_view("abc")).type() == typeid(std::string));
    CHECK(*reflect("abc").get<std::string>() == "abc");
}

TEST_CASE("composite kinds") {
    int x = 0;
    auto fn = std::function<void()>([] {});

    CHECK(reflect(Point{}).kind() == Kind::record);
    CHECK(reflect(std::vector<int>{}).kind() == Kind::sequence);
    CHECK(reflect(std::array<int, 3>{}).kind() == Kind::array);
    CHECK(reflect(std::map<std::string, int>{}).kind() == Kind::map);
    CHECK(reflect(&x).kind() == Kind::pointer);
    CHECK(reflect(std::make_shared<int>(1)).kind() == Kind::pointer);
    CHECK(reflect(std::optional<int>(1)).kind() == Kind::pointer);
    CHECK(reflect(fn).kind() == Kind::function);
    CHECK(reflect(Channel<int>::make(1)).kind() == Kind::channel);
    CHECK(reflect(Version{}).kind() == Kind::other);
}

TEST_CASE("enums and durations take their underlying kind") {
    CHECK(reflect(Color::green).kind() == Kind::uint8);
    CHECK(reflect(std::chrono::seconds(5)).kind() == Kind::int64);
    CHECK(reflect(std::chrono::seconds(5)).isDuration());
    CHECK(reflect(std::chrono::seconds(5)).isNumeric());
}

TEST_CASE("timestamps") {
    auto v = reflect(Timestamp(10s));
    CHECK(v.kind() == Kind::other);
    CHECK(v.isTimestamp());
    CHECK_FALSE(reflect(10).isTimestamp());
}

TEST_CASE("dynamic kind") {
    Any box(5);
    CHECK(reflect(&box).dereference().kind() == Kind::dynamic);
    CHECK(reflect(&box).dereference().isDynamic());
}

TEST_CASE("kind predicates") {
    Point p;
    CHECK(reflect(&p).isPointer());
    CHECK(reflect(&p).isRecordPointer());
    CHECK_FALSE(reflect(&p).isRecord());
    CHECK(reflect(p).isRecord());
    CHECK(reflect(std::vector<int>{}).isSequence());
    CHECK(reflect(std::map<int, int>{}).isMap());
    CHECK(reflect(std::array<int, 1>{}).isFixedArray());
    CHECK(reflect(false).isBoolean());
    CHECK(reflect(1.0).isNumeric());
    CHECK_FALSE(reflect(true).isNumeric());
    CHECK_FALSE(reflect("1").isNumeric());
    CHECK(reflect(std::string()).isString());
    CHECK(reflect(Channel<int>()).isChannel());
    CHECK(reflect(std::function<int()>()).isFunction());
}

TEST_CASE("numeric kind helpers") {
    CHECK(isNumericKind(Kind::int8));
    CHECK(isNumericKind(Kind::float64));
    CHECK_FALSE(isNumericKind(Kind::boolean));
    CHECK_FALSE(isNumericKind(Kind::string));
    CHECK(isSignedKind(Kind::int64));
    CHECK_FALSE(isSignedKind(Kind::uint64));
    CHECK(isUnsignedKind(Kind::uint16));
    CHECK(isFloatingKind(Kind::float32));
}

TEST_CASE("toString") {
    CHECK(toString(Kind::int32) == "int32");
    CHECK(toString(Kind::dynamic) == "dynamic");
    CHECK(toString(Kind::record) == "record");
}

TEST_CASE("iterables and length") {
    CHECK(reflect(std::string("abc")).isIterable());
    CHECK(reflect(std::string("abc")).length() == 3);
    CHECK(reflect(std::vector<int>{1, 2}).length() == 2);
    CHECK(reflect(std::array<int, 4>{}).length() == 4);
    CHECK(reflect(std::map<int, int>{{1, 1}}).length() == 1);
    CHECK_FALSE(reflect(5).isIterable());
    CHECK(reflect(5).length() == 0);
}

} // TEST_SUITE("Kind")

//=============================================================================
// Invalid tests
//=============================================================================

TEST_SUITE("Invalid") {

TEST_CASE("kInvalid is not valid") {
    CHECK_FALSE(Value::kInvalid.isValid());
    CHECK_FALSE(static_cast<bool>(Value()));
    CHECK(Value::kInvalid.kind() == Kind::invalid);
}

TEST_CASE("kInvalid type is void") {
    CHECK(Value::kInvalid.type() == typeid(void));
}

TEST_CASE("reflect nullptr is the absent sentinel") {
    CHECK_FALSE(reflect(nullptr).isValid());
}

TEST_CASE("reflect of a null character pointer is the absent sentinel") {
    char const* none = nullptr;
    CHECK_FALSE(reflect(none).isValid());
    CHECK_FALSE(Any(none).hasValue());
}

TEST_CASE("reflect of an empty Any is the absent sentinel") {
    CHECK_FALSE(reflect(Any()).isValid());
}

TEST_CASE("absent values are nil, zero and empty") {
    CHECK(Value::kInvalid.isNil());
    CHECK(Value::kInvalid.isZero());
    CHECK(Value::kInvalid.isDeepZero());
    CHECK(Value::kInvalid.isEmpty());
}

TEST_CASE("navigation on kInvalid returns kInvalid") {
    CHECK_FALSE(Value::kInvalid.dereference().isValid());
    CHECK_FALSE(Value::kInvalid.address().isValid());
    CHECK_FALSE(Value::kInvalid.index(0).isValid());
    CHECK_FALSE(Value::kInvalid.field("x").isValid());
}

TEST_CASE("set on kInvalid fails") {
    Value v;
    auto result = v.set(reflect(1));
    REQUIRE_FALSE(result);
    CHECK(result.error().kind == ErrorKind::invalidValue);
}

TEST_CASE("toString") {
    CHECK(Value::kInvalid.toString() == "<invalid Value>");
}

} // TEST_SUITE("Invalid")

//=============================================================================
// Nil, zero and empty tests
//=============================================================================

TEST_SUITE("Zero") {

TEST_CASE("isNil") {
    int* raw = nullptr;
    CHECK(reflect(raw).isNil());
    CHECK(reflect(std::shared_ptr<int>()).isNil());
    CHECK(reflect(std::optional<int>()).isNil());
    CHECK(reflect(std::function<void()>()).isNil());
    CHECK(reflect(Channel<int>()).isNil());

    Any empty;
    CHECK(reflect(&empty).dereference().isNil());
}

TEST_CASE("isNil never faults on kinds that cannot be nil") {
    CHECK_FALSE(reflect(5).isNil());
    CHECK_FALSE(reflect(std::string()).isNil());
    CHECK_FALSE(reflect(Point{}).isNil());
    CHECK_FALSE(reflect(std::vector<int>()).isNil());
    CHECK_FALSE(reflect(std::map<int, int>()).isNil());
}

TEST_CASE("isZero") {
    CHECK(reflect(0).isZero());
    CHECK_FALSE(reflect(1).isZero());
    CHECK(reflect(0.0).isZero());
    CHECK(reflect(false).isZero());
    CHECK(reflect(std::string()).isZero());
    CHECK_FALSE(reflect(std::string("a")).isZero());
    CHECK(reflect(Timestamp()).isZero());
    CHECK(reflect(Point{}).isZero());
    CHECK(reflect(Version{}).isZero());

    Point p;
    p.x = 1.0f;
    CHECK_FALSE(reflect(p).isZero());
}

TEST_CASE("containers are never zero") {
    CHECK_FALSE(reflect(std::vector<int>()).isZero());
    CHECK_FALSE(reflect(std::array<int, 2>{}).isZero());
    CHECK_FALSE(reflect(std::map<int, int>()).isZero());
}

TEST_CASE("nil values are zero") {
    int* raw = nullptr;
    CHECK(reflect(raw).isZero());
    CHECK(reflect(std::function<void()>()).isZero());
}

TEST_CASE("isDeepZero follows indirection") {
    int zero = 0;
    int one = 1;

    CHECK_FALSE(reflect(&zero).isZero());
    CHECK(reflect(&zero).isDeepZero());
    CHECK_FALSE(reflect(&one).isDeepZero());
    CHECK(reflect(std::make_shared<std::string>()).isDeepZero());

    Any box(0);
    CHECK(reflect(&box).dereference().isDeepZero());
}

TEST_CASE("isEmpty") {
    CHECK(reflect(0).isEmpty());
    CHECK(reflect(std::vector<int>()).isEmpty());
    CHECK_FALSE(reflect(std::vector<int>{1}).isEmpty());
    CHECK(reflect(std::map<int, int>()).isEmpty());
    CHECK(reflect(Channel<int>::make(2)).isEmpty());
    CHECK_FALSE(reflect(std::string("a")).isEmpty());
}

} // TEST_SUITE("Zero")

//=============================================================================
// Navigation tests
//=============================================================================

TEST_SUITE("Navigation") {

TEST_CASE("dereference writes through") {
    int x = 5;
    auto v = reflect(&x).dereference();

    REQUIRE(v.isValid());
    CHECK(v.kind() == Kind::int32);
    CHECK(v.isAddressable());
    CHECK(v.setValue(7));
    CHECK(x == 7);
}

TEST_CASE("dereference of non-indirecting and nil values") {
    int* raw = nullptr;
    CHECK_FALSE(reflect(5).dereference().isValid());
    CHECK_FALSE(reflect(raw).dereference().isValid());
}

TEST_CASE("dynamic content is read only") {
    Any box(5);
    auto content = reflect(&box).dereference().dereference();

    REQUIRE(content.isValid());
    CHECK(*content.get<int>() == 5);
    CHECK_FALSE(content.isAddressable());
}

TEST_CASE("address") {
    int x = 5;
    auto v = reflect(&x).dereference();
    auto p = v.address();

    REQUIRE(p.isValid());
    CHECK(p.isPointer());
    CHECK(*p.get<int*>() == &x);
    CHECK_FALSE(reflect(5).address().isValid());
}

TEST_CASE("index") {
    std::vector<int> v { 1, 2 };
    CHECK(*reflect(v).index(1).get<int>() == 2);
    CHECK_FALSE(reflect(v).index(2).isValid());
    CHECK_FALSE(reflect(5).index(0).isValid());
}

TEST_CASE("sequence elements are addressable") {
    std::vector<int> v { 1, 2 };
    auto element = reflect(&v).dereference().index(0);

    CHECK(element.isAddressable());
    CHECK(element.setValue(9));
    CHECK(v[0] == 9);
}

TEST_CASE("array elements follow the array") {
    std::array<int, 2> a { 1, 2 };
    CHECK_FALSE(reflect(a).index(0).isAddressable());
    CHECK(reflect(&a).dereference().index(0).setValue(5));
    CHECK(a[0] == 5);
}

TEST_CASE("field") {
    Point p;
    p.x = 1.5f;

    CHECK(reflect(p).field("x").kind() == Kind::float32);
    CHECK(*reflect(p).field("x").get<float>() == 1.5f);
    CHECK_FALSE(reflect(p).field("z").isValid());
    CHECK_FALSE(reflect(5).field("x").isValid());
}

TEST_CASE("nested fields") {
    Line line;
    line.finish->y = 4.0f;
    CHECK(*reflect(line).field("finish").field("y").get<float>() == 4.0f);
}

} // TEST_SUITE("Navigation")

//=============================================================================
// Map tests
//=============================================================================

TEST_SUITE("Map") {

TEST_CASE("set and look up map keys") {
    std::map<std::string, int> m;
    auto v = reflect(&m).dereference();

    CHECK(v.setMapIndex(reflect("a"), reflect(1)));
    CHECK(m["a"] == 1);
    CHECK(*v.mapIndex(reflect("a")).get<int>() == 1);
    CHECK_FALSE(v.mapIndex(reflect("missing")).isValid());
}

TEST_CASE("set map key by converting") {
    std::map<std::string, int> m;
    auto v = reflect(&m).dereference();

    auto mismatch = v.setMapIndex(reflect(1), reflect("2"));
    REQUIRE_FALSE(mismatch);
    CHECK(mismatch.error().kind == ErrorKind::typeMismatch);

    CHECK(v.setMapIndex(reflect(1), reflect("2"), true));
    CHECK(m["1"] == 2);
}

TEST_CASE("map lookups convert the key") {
    std::map<int, std::string> m { { 3, "three" } };
    CHECK(*reflect(m).mapIndex(reflect("3")).get<std::string>() == "three");
}

TEST_CASE("maps with dynamic values accept any value") {
    std::map<std::string, Any> m;
    auto v = reflect(&m).dereference();

    CHECK(v.setMapIndex(reflect("n"), reflect(3)));
    CHECK(v.setMapIndex(reflect("s"), reflect("text")));
    CHECK(*m["n"].get<int>() == 3);
    CHECK(*m["s"].get<std::string>() == "text");
}

TEST_CASE("wrong key type and wrong value fail") {
    std::map<std::string, int> m;
    auto v = reflect(&m).dereference();

    auto result = v.setMapIndex(reflect("a"), reflect("not a number"), true);
    REQUIRE_FALSE(result);
    CHECK(result.error().kind == ErrorKind::unconvertible);
    CHECK(m.empty());
}

TEST_CASE("setMapIndex on non-maps") {
    auto result = reflect(5).setMapIndex(reflect(1), reflect(1));
    REQUIRE_FALSE(result);
    CHECK(result.error().kind == ErrorKind::invalidValue);
}

} // TEST_SUITE("Map")

//=============================================================================
// Set tests
//=============================================================================

TEST_SUITE("Set") {

TEST_CASE("set on a copy is unsettable") {
    auto result = reflect(5).setValue(6);
    REQUIRE_FALSE(result);
    CHECK(result.error().kind == ErrorKind::unsettable);
}

TEST_CASE("set with different types") {
    int x = 1;
    auto v = reflect(&x).dereference();

    auto mismatch = v.setValue(std::string("12"));
    REQUIRE_FALSE(mismatch);
    CHECK(mismatch.error().kind == ErrorKind::typeMismatch);
    CHECK(x == 1);

    CHECK(v.setValue("12", true));
    CHECK(x == 12);
}

TEST_CASE("set from an absent value") {
    int x = 1;
    auto result = reflect(&x).dereference().set(Value::kInvalid);
    REQUIRE_FALSE(result);
    CHECK(result.error().kind == ErrorKind::invalidValue);
}

TEST_CASE("set through owning pointers") {
    std::shared_ptr<int> sp;
    CHECK(reflect(&sp).dereference().setValue(5, true));
    REQUIRE(sp != nullptr);
    CHECK(*sp == 5);

    std::optional<std::string> opt;
    CHECK(reflect(&opt).dereference().setValue("x", true));
    CHECK(opt == "x");
}

TEST_CASE("raw pointers refuse freshly allocated pointees") {
    int* target = nullptr;
    auto result = reflect(&target).dereference().setValue(5, true);
    REQUIRE_FALSE(result);
    CHECK(result.error().kind == ErrorKind::unconvertible);
    CHECK(target == nullptr);

    auto mismatch = reflect(&target).dereference().setValue(5);
    REQUIRE_FALSE(mismatch);
    CHECK(mismatch.error().kind == ErrorKind::typeMismatch);
    CHECK(target == nullptr);

    int x = 3;
    CHECK(reflect(&target).dereference().setValue(&x));
    CHECK(target == &x);
}

TEST_CASE("dynamic destinations accept any value") {
    Any box;
    auto v = reflect(&box).dereference();

    CHECK(v.setValue(42));
    CHECK(*box.get<int>() == 42);

    CHECK(v.setValue(std::string("text")));
    CHECK(*box.get<std::string>() == "text");
}

TEST_CASE("mustSet") {
    auto const restore = cxxutils::callAtEndOfScope(logger()->level(), [] (spdlog::level::level_enum previous) { setLogLevel(previous); });
    setLogLevel(spdlog::level::off);

    int x = 0;
    reflect(&x).dereference().mustSet(reflect(4));
    CHECK(x == 4);
    CHECK_THROWS_AS(reflect(5).mustSet(reflect(6)), Exception);
}

TEST_CASE("created values are addressable") {
    auto v = Value::create(typeOf<std::string>());
    REQUIRE(v.isValid());
    CHECK(v.isAddressable());
    CHECK(v.setValue("hello"));
    CHECK(*v.get<std::string>() == "hello");
}

} // TEST_SUITE("Set")

//=============================================================================
// Access tests
//=============================================================================

TEST_SUITE("Access") {

TEST_CASE("get") {
    auto v = reflect(5);
    REQUIRE(v.get<int>() != nullptr);
    CHECK(*v.get<int>() == 5);
    CHECK(v.get<long long>() == nullptr);
    CHECK(v.get<std::string>() == nullptr);
}

TEST_CASE("to") {
    CHECK(reflect("22").to<int>() == 22);
    CHECK(reflect(22).to<std::string>() == "22");

    auto failed = reflect("abc").to<int>();
    REQUIRE_FALSE(failed);
    CHECK(failed.error().kind == ErrorKind::unconvertible);
}

TEST_CASE("toAny") {
    auto box = reflect(5).toAny();
    REQUIRE(box.hasValue());
    CHECK(*box.get<int>() == 5);
    CHECK_FALSE(Value::kInvalid.toAny().hasValue());
}

TEST_CASE("clone is independent") {
    int x = 5;
    auto v = reflect(&x).dereference();
    auto copy = v.clone();

    CHECK(v.setValue(6));
    CHECK(*copy.get<int>() == 5);
    CHECK_FALSE(copy.isAddressable());
}

TEST_CASE("equals") {
    Point a;
    a.x = 1.0f;
    Point b;
    b.x = 1.0f;

    CHECK(reflect(5).equals(5));
    CHECK_FALSE(reflect(5).equals(6));
    CHECK_FALSE(reflect(5).equals(int64_t{5}));
    CHECK(reflect(5).equals(reflect(5)));
    CHECK(reflect(5).equals(Any(5)));
    CHECK(reflect(a).equals(b));
    CHECK(reflect(std::vector<int>{1, 2}).equals(std::vector<int>{1, 2}));
    CHECK_FALSE(reflect(std::vector<int>{1, 2}).equals(std::vector<int>{1}));
}

TEST_CASE("visit") {
    auto doubled = reflect(5).visit([] (int32_t i) { return i * 2; });
    CHECK(doubled == 10);

    auto none = reflect(std::string("a")).visit([] (int32_t i) { return i * 2; });
    CHECK_FALSE(none.has_value());

    std::string seen;
    CHECK(reflect(std::string("abc")).visit([&seen] (std::string const& s) { seen = s; }));
    CHECK(seen == "abc");
}

TEST_CASE("toString") {
    Point p;
    p.x = 1.0f;
    p.y = 2.5f;

    CHECK(reflect(5).toString() == "5");
    CHECK(reflect(true).toString() == "true");
    CHECK(reflect(2.5).toString() == "2.5");
    CHECK(reflect(0.1f).toString() == "0.1");
    CHECK(reflect(std::string("abc")).toString() == "abc");
    CHECK(reflect(p).toString() == "{ .x = 1, .y = 2.5 }");
    CHECK(reflect(std::vector<int>{1, 2}).toString() == "[1, 2]");
    CHECK(reflect(std::map<std::string, int>{{"a", 1}}).toString() == "{a: 1}");
    CHECK(reflect(std::shared_ptr<int>()).toString() == "<nil>");
}

TEST_CASE("stream output") {
    std::ostringstream ss;
    ss << reflect(42) << " " << Any(7) << " " << Any();
    CHECK(ss.str() == "42 7 <nil>");
}

TEST_CASE("std::format") {
    CHECK(std::format("{}", reflect(42)) == "42");
    CHECK(std::format("{}", Any(std::string("x"))) == "x");
    CHECK(std::format("{}", Error { ErrorKind::unsettable, "nope" }) == "unsettable: nope");
}

} // TEST_SUITE("Access")

//=============================================================================
// Any tests
//=============================================================================

TEST_SUITE("Any") {

TEST_CASE("default construction") {
    Any a;
    CHECK_FALSE(a.hasValue());
    CHECK(a.type() == typeid(void));
    CHECK(Any(nullptr) == a);
}

TEST_CASE("typed access") {
    Any a(5);
    CHECK(a.type() == typeid(int));
    CHECK(*a.get<int>() == 5);
    CHECK(a.get<double>() == nullptr);
    CHECK(*Any("text").get<std::string>() == "text");
}

TEST_CASE("copies are deep") {
    Any a(std::string("a"));
    Any b = a;

    *b.get<std::string>() = "b";
    CHECK(*a.get<std::string>() == "a");
    CHECK_FALSE(a == b);
}

TEST_CASE("equality") {
    CHECK(Any(5) == Any(5));
    CHECK_FALSE(Any(5) == Any(6));
    CHECK_FALSE(Any(5) == Any(5.0));
    CHECK_FALSE(Any(5) == Any());
}

TEST_CASE("cv-qualified Any is dynamic") {
    CHECK(&typeOf<Any const>() == &typeOf<Any>());
    CHECK(typeOf<Any const>().kind() == Kind::dynamic);
    CHECK(&typeOf<int const volatile>() == &typeOf<int>());
}

TEST_CASE("reflect unwraps the box") {
    auto v = reflect(Any(2.5));
    CHECK(v.kind() == Kind::float64);
    CHECK_FALSE(v.isDynamic());
}

} // TEST_SUITE("Any")

//=============================================================================
// Channel tests
//=============================================================================

TEST_SUITE("Channel") {

TEST_CASE("bounded buffer") {
    auto ch = Channel<int>::make(1);
    CHECK(ch.trySend(1));
    CHECK_FALSE(ch.trySend(2));
    CHECK(ch.size() == 1);
    CHECK(ch.tryReceive() == 1);
    CHECK_FALSE(ch.tryReceive().has_value());
}

TEST_CASE("copies share the buffer") {
    auto ch = Channel<int>::make(2);
    auto copy = ch;
    CHECK(copy.trySend(3));
    CHECK(ch.size() == 1);
    CHECK(reflect(ch).equals(copy));
}

TEST_CASE("reflected length") {
    auto ch = Channel<std::string>::make(4);
    CHECK(ch.trySend("a"));
    CHECK(reflect(ch).length() == 1);
    CHECK_FALSE(reflect(ch).isEmpty());
    CHECK(reflect(ch).metaType().capacity(reflect(ch).unsafePointer()) == 4);
}

} // TEST_SUITE("Channel")

//=============================================================================
// Error tests
//=============================================================================

TEST_SUITE("Error") {

TEST_CASE("tags") {
    CHECK(toString(ErrorKind::invalidValue) == "invalid_value");
    CHECK(toString(ErrorKind::typeMismatch) == "type_mismatch");
    CHECK(toString(ErrorKind::unconvertible) == "unconvertible");
    CHECK(toString(ErrorKind::invalidTime) == "invalid_time");
    CHECK(toString(ErrorKind::unsettable) == "unsettable");
    CHECK(toString(ErrorKind::notARecord) == "not_a_record");
    CHECK(toString(ErrorKind::notASequence) == "not_a_sequence");
    CHECK(toString(ErrorKind::unknownField) == "unknown_field");
    CHECK(toString(ErrorKind::unknownOperator) == "unknown_operator");
    CHECK(toString(ErrorKind::invalidComparison) == "invalid_comparison");
    CHECK(toString(ErrorKind::indexOutOfBounds) == "index_out_of_bounds");
    CHECK(toString(ErrorKind::cannotAppendToNonReference) == "cannot_append_to_non_reference");
}

TEST_CASE("message") {
    CHECK(Error { ErrorKind::unknownField, "foo" }.message() == "unknown_field: foo");
    CHECK(Error { ErrorKind::unknownField, "" }.message() == "unknown_field");
}

TEST_CASE("exception carries the error") {
    try
    {
        throw Exception(Error { ErrorKind::typeMismatch, "int and string" });
    }
    catch (Exception const& e)
    {
        CHECK(e.error().kind == ErrorKind::typeMismatch);
        CHECK(std::string(e.what()) == "type_mismatch: int and string");
    }
}

} // TEST_SUITE("Error")

//=============================================================================
// Timestamp tests
//=============================================================================

TEST_SUITE("Timestamp") {

TEST_CASE("parse applies the zone offset") {
    auto ts = parseTimestamp("2012-05-23T18:30:00.000-05:00");
    REQUIRE(ts);
    CHECK(*ts == Timestamp(std::chrono::sys_days(std::chrono::year(2012) / 5 / 23)) + 23h + 30min);
    CHECK(formatTimestamp(*ts) == "2012-05-23T23:30:00Z");
}

TEST_CASE("fractional seconds") {
    auto ts = parseTimestamp("2012-05-23T18:30:00.123456789Z");
    REQUIRE(ts);
    CHECK(formatTimestamp(*ts) == "2012-05-23T18:30:00.123456789Z");

    auto shorter = parseTimestamp("2012-05-23T18:30:00.5+01:00");
    REQUIRE(shorter);
    CHECK(formatTimestamp(*shorter) == "2012-05-23T17:30:00.5Z");
}

TEST_CASE("formatting reproduces the instant") {
    for (auto text : { "1999-12-31T23:59:59Z", "2012-05-23T18:30:00.000-05:00", "2020-02-29T12:00:00.25+09:30" })
    {
        auto ts = parseTimestamp(text);
        REQUIRE(ts);

        auto reparsed = parseTimestamp(formatTimestamp(*ts));
        REQUIRE(reparsed);
        CHECK(*reparsed == *ts);
    }
}

TEST_CASE("malformed timestamps") {
    for (auto text : { "", "garbage", "2012-05-23", "2012-05-23 18:30:00Z", "2012-02-30T00:00:00Z",
                       "2012-05-23T24:00:00Z", "2012-05-23T18:30:00", "2012-05-23T18:30:00.Z", "2012-05-23T18:30:00+0500" })
    {
        auto ts = parseTimestamp(text);
        REQUIRE_FALSE(ts);
        CHECK(ts.error().kind == ErrorKind::invalidTime);
    }
}

TEST_CASE("earliest and latest representable days") {
    for (auto text : { "1677-09-24T00:00:00Z", "1700-01-01T00:00:00.5+02:00", "2262-01-01T00:00:00Z", "2262-04-08T23:59:59.999999999-23:59" })
    {
        CAPTURE(text);
        auto ts = parseTimestamp(text);
        REQUIRE(ts);

        auto reparsed = parseTimestamp(formatTimestamp(*ts));
        REQUIRE(reparsed);
        CHECK(*reparsed == *ts);
    }

    auto const earliest = parseTimestamp("1700-01-01T00:00:00Z");
    REQUIRE(earliest);
    CHECK(std::chrono::year_month_day(std::chrono::floor<std::chrono::days>(*earliest)).year() == std::chrono::year(1700));
}

TEST_CASE("timestamps outside the nanosecond range") {
    for (auto text : { "0001-01-01T00:00:00Z", "9999-12-31T23:59:59Z", "1677-01-01T00:00:00Z", "2263-01-01T00:00:00Z" })
    {
        CAPTURE(text);
        auto ts = parseTimestamp(text);
        REQUIRE_FALSE(ts);
        CHECK(ts.error().kind == ErrorKind::invalidTime);
    }
}

} // TEST_SUITE("Timestamp")

//=============================================================================
// Logging tests
//=============================================================================

TEST_SUITE("Logging") {

TEST_CASE("logger") {
    REQUIRE(logger() != nullptr);
    CHECK(logger()->name() == "reflector");
    CHECK(logger() == logger());
}

TEST_CASE("setLogLevel") {
    auto const restore = cxxutils::callAtEndOfScope(logger()->level(), [] (spdlog::level::level_enum previous) { setLogLevel(previous); });

    setLogLevel(spdlog::level::debug);
    CHECK(logger()->level() == spdlog::level::debug);
}

} // TEST_SUITE("Logging")
