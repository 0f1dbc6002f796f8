#include <catch2/catch_test_macros.hpp>

#include <sjson/sjson.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace sjson;

namespace {

    Document parse_ok(const std::string_view json) {
        auto doc = Document::parse(json);
        INFO("input: " << json);
        INFO(doc.error().to_string());
        REQUIRE(doc.ok());
        return doc;
    }

} // namespace

TEST_CASE("document exposes the parsed tree", "[sjson][value]") {
    const auto doc = parse_ok(R"({"n":null,"t":true,"u":7,"i":-7,"f":2.5,"s":"a\tb","a":[1,[2]],"o":{}})");
    const auto root = doc.root();

    REQUIRE(root.is_object());
    CHECK(root.size() == 8);
    CHECK(root["n"].is_null());
    CHECK(*root["t"].as_bool());
    CHECK(*root["u"].as_u64() == 7);
    CHECK(root["i"].is_i64());
    CHECK(*root["i"].as_i64() == -7);
    CHECK(*root["f"].as_f64() == 2.5);
    CHECK(*root["s"].as_string() == "a\tb");
    CHECK(root["a"].size() == 2);
    CHECK(*root["a"][1][0].as_u64() == 2);
    CHECK(root["o"].is_object());
    CHECK(root["o"].empty());
    CHECK(root.type() == Type::Object);
}

TEST_CASE("missing members and type mismatches", "[sjson][value]") {
    const auto doc = parse_ok(R"({"a":[1,2],"s":"x"})");
    const auto root = doc.root();

    CHECK_FALSE(root.get("zz").valid());
    CHECK_FALSE(root.get("zz").is_null());
    CHECK_FALSE(root["a"].at(2).valid());
    CHECK_FALSE(root["s"].at(0).valid());
    CHECK_FALSE(root["s"].as_u64().has_value());
    CHECK_FALSE(root["a"].as_string().has_value());
    CHECK_FALSE(root.get("zz").get("deeper").valid());
    CHECK(root.contains("s"));
    CHECK_FALSE(root.contains("t"));
}

TEST_CASE("duplicate keys are kept in order", "[sjson][value]") {
    const auto doc = parse_ok(R"({"a":1,"b":2,"a":3})");
    const auto root = doc.root();

    CHECK(root.size() == 3);
    CHECK(*root["a"].as_u64() == 1);

    std::vector<std::string> keys;
    std::vector<std::uint64_t> values;
    for (const auto& [k, v] : root.members()) {
        keys.emplace_back(k);
        values.push_back(*v.as_u64());
    }
    CHECK(keys == std::vector<std::string> {"a", "b", "a"});
    CHECK(values == std::vector<std::uint64_t> {1, 2, 3});
}

TEST_CASE("pointer lookup on a document", "[sjson][value]") {
    const auto doc = parse_ok(R"({"a":{"b":[10,{"c":"deep"}]}})");

    CHECK(*doc.root().pointer({"a", "b", 1, "c"}).as_string() == "deep");
    CHECK(*doc.root().pointer({"a", "b", 0}).as_u64() == 10);
    CHECK_FALSE(doc.root().pointer({"a", "x"}).valid());
    CHECK_FALSE(doc.root().pointer({"a", 0}).valid());

    const JsonPointer path {"a", "b"};
    CHECK(doc.root().pointer(path).size() == 2);
}

TEST_CASE("document arrays iterate in order", "[sjson][value]") {
    const auto doc = parse_ok("[1,2,3,4]");
    std::uint64_t sum = 0;
    for (const auto v : doc.root().items())
        sum += *v.as_u64();
    CHECK(sum == 10);
    CHECK(doc.root().items().size() == 4);
    CHECK(doc.root().members().size() == 0);
}

TEST_CASE("parse errors are reported against the caller input", "[sjson][value]") {
    const std::string json = R"({"a": [1, 2,]})";
    const auto doc = Document::parse(json);
    REQUIRE_FALSE(doc.ok());
    CHECK(doc.error().code == ErrorCode::TrailingComma);
    CHECK(doc.error().offset() == json.find(']'));
    CHECK(doc.error().line() == 1);

    CHECK(Document::parse("[1] 2").error().code == ErrorCode::TrailingCharacters);
    CHECK(Document::parse("").error().code == ErrorCode::EofWhileParsing);
}

TEST_CASE("invalid utf8 is rejected before parsing", "[sjson][value]") {
    const std::string json = "{\"a\":\"\xff\"}";
    const auto doc = Document::parse(json);
    CHECK(doc.error().code == ErrorCode::InvalidUtf8);
    CHECK(doc.error().offset() == 6);

    const auto loose = Document::parse_unchecked(json);
    REQUIRE(loose.ok());
    CHECK(loose.root()["a"].as_string()->size() == 1);
}

TEST_CASE("build a document from scratch", "[sjson][value]") {
    Document doc;
    REQUIRE(doc.ok());
    auto root = doc.root_mut();

    REQUIRE(root.set_object());
    REQUIRE(root.insert("name", "sjson"));
    REQUIRE(root.insert("count", 3));
    REQUIRE(root.insert("neg", -3));
    REQUIRE(root.insert("ratio", 0.5));
    REQUIRE(root.insert("flag", true));
    REQUIRE(root.insert("none", nullptr));

    auto list = root.insert("list", nullptr);
    REQUIRE(list.push_back(1));
    REQUIRE(list.push_back(std::string("two")));
    REQUIRE(list.push_back(Number::from_f64(3.0)));

    const auto view = doc.root();
    CHECK(view.size() == 7);
    CHECK(*view["name"].as_string() == "sjson");
    CHECK(view["count"].is_u64());
    CHECK(view["neg"].is_i64());
    CHECK(view["ratio"].is_f64());
    CHECK(view["none"].is_null());
    CHECK(view["list"].size() == 3);
    CHECK(encode(doc) == R"({"name":"sjson","count":3,"neg":-3,"ratio":0.5,"flag":true,"none":null,"list":[1,"two",3.0]})");
}

TEST_CASE("node subscript creates members and pads arrays", "[sjson][value]") {
    Document doc;
    auto root = doc.root_mut();

    REQUIRE(root["a"]["b"].set(1));
    REQUIRE(root["list"][3].set("x"));
    CHECK(encode(doc) == R"({"a":{"b":1},"list":[null,null,null,"x"]})");

    REQUIRE(doc.root_mut()["a"]["b"].set(2));
    CHECK(doc.root().size() == 2);
    CHECK(*doc.root()["a"]["b"].as_u64() == 2);
}

TEST_CASE("erase and clear", "[sjson][value]") {
    auto doc = parse_ok(R"({"a":1,"b":2,"a":3,"c":[1,2,3]})");
    auto root = doc.root_mut();

    CHECK(root.erase("a"));
    CHECK(*doc.root()["a"].as_u64() == 3);
    CHECK_FALSE(root.erase("zz"));

    auto c = root.get("c");
    REQUIRE(c);
    CHECK(c.erase(1));
    CHECK_FALSE(c.erase(5));
    CHECK(encode(doc) == R"({"b":2,"a":3,"c":[1,3]})");

    c.clear();
    CHECK(doc.root()["c"].empty());
    CHECK(doc.root()["c"].is_array());
}

TEST_CASE("string storage kinds", "[sjson][value]") {
    static constexpr std::string_view kStatic = "static text";
    std::string borrowed = "borrowed text";

    Document doc;
    auto root = doc.root_mut();
    REQUIRE(root.set_array());

    root.push_back(nullptr).set_static_string(kStatic);
    root.push_back(nullptr).set_borrowed_string(borrowed);
    REQUIRE(root.push_back(nullptr).set_string("copied"));

    CHECK(doc.root()[0].raw()->storage() == StringStorage::Static);
    CHECK(doc.root()[1].raw()->storage() == StringStorage::Borrowed);
    CHECK(doc.root()[2].raw()->storage() == StringStorage::Arena);
    CHECK(doc.root()[1].as_string()->data() == borrowed.data());
}

TEST_CASE("copies share the arena until one of them writes", "[sjson][value]") {
    auto doc = parse_ok(R"({"a":[1,2],"b":{"c":true}})");
    Document copy = doc;
    CHECK(copy.arena() == doc.arena());

    REQUIRE(copy.root_mut()["a"].push_back(3));
    REQUIRE(copy.root_mut()["b"]["c"].set(false));

    CHECK(encode(doc) == R"({"a":[1,2],"b":{"c":true}})");
    CHECK(encode(copy) == R"({"a":[1,2,3],"b":{"c":false}})");

    REQUIRE(doc.root_mut()["a"].set("replaced"));
    CHECK(encode(doc) == R"({"a":"replaced","b":{"c":true}})");
    CHECK(encode(copy) == R"({"a":[1,2,3],"b":{"c":false}})");
}

TEST_CASE("a subtree assigned twice is copied on write", "[sjson][value]") {
    auto doc = parse_ok(R"({"orig":[1,2]})");

    auto slot = doc.root_mut()["copy"];
    REQUIRE(slot);
    REQUIRE(slot.set(doc.root().get("orig")));
    CHECK(doc.arena()->combined());

    REQUIRE(doc.root_mut()["copy"].push_back(3));
    CHECK(encode(doc) == R"({"orig":[1,2],"copy":[1,2,3]})");

    REQUIRE(doc.root_mut()["orig"][0].set(9));
    CHECK(encode(doc) == R"({"orig":[9,2],"copy":[1,2,3]})");
}

TEST_CASE("values from another arena are deep copied", "[sjson][value]") {
    Document target;
    REQUIRE(target.root_mut().set_object());
    {
        const auto source = parse_ok(R"({"k":{"s":"esc\"aped","l":[1,{"m":null}]}})");
        REQUIRE(target.root_mut().insert("copied", source.root()["k"]));
        CHECK_FALSE(target.arena()->combined());
    }

    CHECK(encode(target) == R"({"copied":{"s":"esc\"aped","l":[1,{"m":null}]}})");
    CHECK(target.arena()->retained_count() == 0);
}

TEST_CASE("moving a document in grafts its arena", "[sjson][value]") {
    Document outer;
    REQUIRE(outer.root_mut().set_array());

    auto inner = parse_ok(R"({"k":"v","n":[1,2]})");
    SharedArena* inner_arena = inner.arena();

    REQUIRE(outer.root_mut().push_back(std::move(inner)));
    CHECK(outer.arena()->combined());
    CHECK(outer.arena()->retains(inner_arena));
    CHECK(inner_arena->use_count() == 1);
    CHECK(*outer.root()[0]["k"].as_string() == "v");

    REQUIRE(outer.root_mut()[0]["n"].push_back(3));
    CHECK(encode(outer) == R"([{"k":"v","n":[1,2,3]}])");
}

TEST_CASE("graft cycles fall back to a copy", "[sjson][value]") {
    Document a;
    REQUIRE(a.root_mut().set_array());
    Document b = parse_ok(R"([1])");

    // a retains b; grafting a into b would close a loop
    Document b_copy = b;
    REQUIRE(a.root_mut().push_back(std::move(b_copy)));
    REQUIRE(a.arena()->retains(b.arena()));

    REQUIRE(b.root_mut().push_back(Document {a}));
    CHECK_FALSE(b.arena()->retains(a.arena()));
    CHECK(encode(b) == "[1,[[1]]]");
}

TEST_CASE("lvalue documents are copied", "[sjson][value]") {
    Document outer;
    const auto inner = parse_ok("[true]");
    REQUIRE(outer.root_mut().insert("x", inner));
    CHECK(outer.arena()->retained_count() == 0);
    CHECK(encode(outer) == R"({"x":[true]})");
}

TEST_CASE("share builds a document over an existing subtree", "[sjson][value]") {
    auto doc = parse_ok(R"({"a":{"b":[1,2]}})");
    Document sub = Document::share(doc.root()["a"]);

    CHECK(sub.arena() == doc.arena());
    CHECK(doc.arena()->use_count() == 2);
    CHECK(sub.root() == doc.root()["a"]);

    REQUIRE(sub.root_mut()["b"].push_back(3));
    CHECK(encode(sub) == R"({"b":[1,2,3]})");
    CHECK(encode(doc) == R"({"a":{"b":[1,2]}})");
}

TEST_CASE("structural equality", "[sjson][value]") {
    const auto a = parse_ok(R"({"a":1,"b":[1,2,{"c":null}],"a":3})");
    const auto b = parse_ok(R"({"b":[1,2,{"c":null}],"a":1,"a":3})");
    const auto c = parse_ok(R"({"a":3,"b":[1,2,{"c":null}],"a":1})");
    const auto d = parse_ok(R"({"a":1,"b":[1,2,{"c":null}]})");

    CHECK(a.root() == b.root());
    CHECK_FALSE(a.root() == c.root());
    CHECK_FALSE(a.root() == d.root());
    CHECK(parse_ok("[1,2]").root() == parse_ok(" [ 1 , 2 ] ").root());
    CHECK_FALSE(parse_ok("[1,2]").root() == parse_ok("[2,1]").root());
    CHECK_FALSE(parse_ok("1").root() == parse_ok("1.0").root());
    CHECK_FALSE(parse_ok("1").root() == ValueRef {});
}

TEST_CASE("equality walks very deep documents", "[sjson][value]") {
    constexpr std::size_t depth = 100000;
    const std::string open(depth, '[');
    const std::string close(depth, ']');

    const auto a = parse_ok(open + "1" + close);
    const auto b = parse_ok(open + " 1 " + close);
    const auto c = parse_ok(open + "2" + close);

    CHECK(a.root() == a.root());
    CHECK(a.root() == b.root());
    CHECK_FALSE(a.root() == c.root());
}

TEST_CASE("encode after parse gives back compact text", "[sjson][value]") {
    const char* inputs[] = {
        R"({"a":[1,-2,3.5,true,false,null],"b":{"c":"d\n"}})",
        R"([[],{},[[]],""])",
        R"("\u0001\"\\")",
        R"({"dup":1,"dup":2})",
    };

    for (const char* json : inputs) {
        INFO("input: " << json);
        const auto doc = parse_ok(json);
        const auto text = encode(doc);
        CHECK(text == json);
        CHECK(parse_ok(text).root() == doc.root());
    }
}
