#include <catch2/catch_test_macros.hpp>

#include <sjson/sjson.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace sjson;

namespace {

    struct RecordingHandler {
        std::vector<std::string> events;

        bool on_null() {
            events.emplace_back("null");
            return true;
        }

        bool on_bool(const bool b) {
            events.emplace_back(b ? "true" : "false");
            return true;
        }

        bool on_u64(const std::uint64_t v) {
            events.emplace_back("u64:" + std::to_string(v));
            return true;
        }

        bool on_i64(const std::int64_t v) {
            events.emplace_back("i64:" + std::to_string(v));
            return true;
        }

        bool on_f64(const double d) {
            std::ostringstream ss;
            ss << "f64:" << d;
            events.emplace_back(ss.str());
            return true;
        }

        bool on_string(const std::string_view s) {
            events.emplace_back("str:" + std::string(s));
            return true;
        }

        bool on_borrowed_string(const std::string_view s) {
            events.emplace_back("bstr:" + std::string(s));
            return true;
        }

        bool on_key(const std::string_view k) {
            events.emplace_back("key:" + std::string(k));
            return true;
        }

        bool on_borrowed_key(const std::string_view k) {
            events.emplace_back("bkey:" + std::string(k));
            return true;
        }

        bool on_array_begin(std::size_t) {
            events.emplace_back("[");
            return true;
        }

        bool on_array_end(const std::size_t count) {
            events.emplace_back("]" + std::to_string(count));
            return true;
        }

        bool on_object_begin(std::size_t) {
            events.emplace_back("{");
            return true;
        }

        bool on_object_end(const std::size_t count) {
            events.emplace_back("}" + std::to_string(count));
            return true;
        }
    };

    struct StopAtString : RecordingHandler {
        bool on_borrowed_string(std::string_view) {
            return false;
        }
    };

    std::vector<std::string> record_recursive(const std::string& json) {
        RecordingHandler h;
        const auto err = sax_parse(json, h);
        REQUIRE(err.ok());
        return h.events;
    }

    std::vector<std::string> record_iterative(const std::string& json) {
        Parser p {json};
        RecordingHandler h;
        REQUIRE(p.parse_document(h));
        REQUIRE(p.parse_trailing());
        return h.events;
    }

    ErrorCode sax_error(const std::string& json) {
        RecordingHandler h;
        return sax_parse(json, h).code;
    }

    RawSpan skip_checked(const std::string& json) {
        Parser p {json};
        RawSpan span;
        REQUIRE(p.skip_one(span));
        return span;
    }

    RawSpan skip_unchecked(const std::string& json) {
        Parser p {json};
        RawSpan span;
        REQUIRE(p.skip_one_unchecked(span));
        return span;
    }

} // namespace

TEST_CASE("sax object events", "[sjson][parser]") {
    const std::vector<std::string> expected = {"{", "bkey:a", "u64:1", "bkey:b", "true", "bkey:c", "bstr:x", "}3"};
    CHECK(record_recursive(R"({"a":1,"b":true,"c":"x"})") == expected);
    CHECK(record_iterative(R"({"a":1,"b":true,"c":"x"})") == expected);
}

TEST_CASE("sax nested events", "[sjson][parser]") {
    const std::string json = R"( { "a" : [ 1 , -2 , { "b" : 3.5 } , [ ] , null ] } )";
    const std::vector<std::string> expected = {"{", "bkey:a", "[", "u64:1", "i64:-2", "{", "bkey:b", "f64:3.5", "}1", "[", "]0", "null", "]5", "}1"};
    CHECK(record_recursive(json) == expected);
    CHECK(record_iterative(json) == expected);
}

TEST_CASE("escaped strings use the copied events", "[sjson][parser]") {
    const std::vector<std::string> expected = {"[", "str:a\nb", "bstr:plain", "]2"};
    CHECK(record_recursive(R"(["a\nb","plain"])") == expected);
}

TEST_CASE("in place parse borrows every string", "[sjson][parser]") {
    std::string json = R"({"k\"ey":["a\nb","plain"]})";
    Parser p {json.data(), json.data() + json.size()};
    RecordingHandler h;
    REQUIRE(p.parse_document_inplace(h));

    const std::vector<std::string> expected = {"{", "bkey:k\"ey", "[", "bstr:a\nb", "bstr:plain", "]2", "}1"};
    CHECK(h.events == expected);
}

TEST_CASE("scalar roots produce one event", "[sjson][parser]") {
    CHECK(record_recursive("null") == std::vector<std::string> {"null"});
    CHECK(record_recursive(" 42 ") == std::vector<std::string> {"u64:42"});
    CHECK(record_iterative("\"s\"") == std::vector<std::string> {"bstr:s"});
    CHECK(record_iterative("false") == std::vector<std::string> {"false"});
}

TEST_CASE("multiple roots are trailing characters", "[sjson][parser]") {
    CHECK(sax_error(R"(null true)") == ErrorCode::TrailingCharacters);
    CHECK(validate("[1] [2]").code == ErrorCode::TrailingCharacters);
    CHECK(validate("{} x").code == ErrorCode::TrailingCharacters);
}

TEST_CASE("syntax errors", "[sjson][parser]") {
    CHECK(sax_error("") == ErrorCode::EofWhileParsing);
    CHECK(sax_error("   ") == ErrorCode::EofWhileParsing);
    CHECK(sax_error("[1,2") == ErrorCode::EofWhileParsing);
    CHECK(sax_error(R"({"a" 1})") == ErrorCode::ExpectedColon);
    CHECK(sax_error("[1 2]") == ErrorCode::ExpectedArrayCommaOrEnd);
    CHECK(sax_error(R"({"a":1 "b":2})") == ErrorCode::ExpectedObjectCommaOrEnd);
    CHECK(sax_error("{1:2}") == ErrorCode::ExpectedObjectKeyOrEnd);
    CHECK(sax_error("[1,]") == ErrorCode::TrailingComma);
    CHECK(sax_error(R"({"a":1,})") == ErrorCode::TrailingComma);
    CHECK(sax_error("[tru]") == ErrorCode::InvalidLiteral);
    CHECK(sax_error("nul") == ErrorCode::EofWhileParsing);
    CHECK(sax_error("[?]") == ErrorCode::InvalidJsonValue);
    CHECK(sax_error("[01]") == ErrorCode::InvalidNumber);
    CHECK(sax_error("[1e999]") == ErrorCode::FloatMustBeFinite);
    CHECK(sax_error(R"(["\x"])") == ErrorCode::InvalidEscape);
    CHECK(sax_error("[\"a\x01\"]") == ErrorCode::ControlCharacterInString);
    CHECK(sax_error("[\"\xc3\"]") == ErrorCode::InvalidUtf8);
}

TEST_CASE("iterative driver reports the same errors", "[sjson][parser]") {
    for (const char* json : {"[1,]", R"({"a":1,})", "[1 2]", R"({"a" 1})", "{1:2}", "[tru]", "[01]", "[", R"({"a":)"}) {
        INFO("input: " << json);
        const auto recursive = sax_error(json);
        const auto iterative = validate(json).code;
        CHECK(recursive == iterative);
        CHECK(iterative != ErrorCode::None);
    }
}

TEST_CASE("error location is computed from the offset", "[sjson][parser]") {
    const std::string json = "{\n  \"a\": [1,\n    2,,\n  ]\n}";
    const auto err = validate(json);
    REQUIRE(err.code == ErrorCode::InvalidJsonValue);
    CHECK(err.line() == 3);
    CHECK(err.column() == 7);
    CHECK(err.offset() == json.find(",,") + 1);
    CHECK(err.category() == ErrorCategory::Syntax);
    CHECK(format_error(json, err).find("InvalidJsonValue") != std::string::npos);
}

TEST_CASE("recursive depth limit", "[sjson][parser]") {
    RecordingHandler h;
    CHECK(sax_parse("[[[[[]]]]]", h, 5).ok());

    RecordingHandler deep;
    const auto err = sax_parse("[[[[[[]]]]]]", deep, 5);
    CHECK(err.code == ErrorCode::DepthExceeded);
    CHECK(err.category() == ErrorCategory::Depth);
}

TEST_CASE("iterative mode has no depth limit", "[sjson][parser]") {
    const std::size_t depth = 100000;
    const std::string json = std::string(depth, '[') + std::string(depth, ']');
    CHECK(validate(json).ok());

    RecordingHandler h;
    CHECK(sax_parse(json, h).code == ErrorCode::DepthExceeded);
}

TEST_CASE("visitor rejection stops the parse", "[sjson][parser]") {
    StopAtString h;
    const auto err = sax_parse(R"([1,"x",2])", h);
    CHECK(err.code == ErrorCode::UnexpectedVisitType);
    CHECK(err.offset() == 3);
    CHECK(h.events == std::vector<std::string> {"[", "u64:1"});
}

TEST_CASE("skip one returns the raw span", "[sjson][parser]") {
    CHECK(skip_checked(R"(  {"a":[1,2,"]"]} , 3)").raw == R"({"a":[1,2,"]"]})");
    CHECK(skip_checked("-12.5e3,").raw == "-12.5e3");
    CHECK(skip_checked("true]").raw == "true");

    const auto s = skip_checked(R"("a\"b" x)");
    CHECK(s.raw == R"("a\"b")");
    CHECK(s.escape == HasEscape::Yes);
    CHECK(skip_checked(R"("ab")").escape == HasEscape::None);
}

TEST_CASE("checked and unchecked skips agree on valid input", "[sjson][parser]") {
    const char* inputs[] = {
        R"({"a":{"b":[1,{"c":"}]"}]},"d":"\\"} ,)",
        R"([[],[[]],"[",{"x":"]"}] )",
        R"("long string with \" escapes \\ and more")",
        "12345.678e-9 ,",
        "-0 ]",
        "null",
        "false,",
    };

    for (const char* json : inputs) {
        INFO("input: " << json);
        const auto a = skip_checked(json);
        const auto b = skip_unchecked(json);
        CHECK(a.raw == b.raw);
    }
}

TEST_CASE("unchecked skip over long containers crosses windows", "[sjson][parser]") {
    std::string json = "{";
    for (int i = 0; i < 50; ++i) {
        if (i)
            json += ',';
        json += "\"key" + std::to_string(i) + "\":[\"}\\\"]\",{\"n\":" + std::to_string(i) + "}]";
    }
    json += "} tail";

    const auto a = skip_checked(json);
    const auto b = skip_unchecked(json);
    CHECK(a.raw == b.raw);
    CHECK(a.raw.size() == json.size() - 5);
}

TEST_CASE("checked skip validates what unchecked skip ignores", "[sjson][parser]") {
    Parser p {std::string_view {R"([1,"\q",x])"}};
    RawSpan span;
    CHECK_FALSE(p.skip_one(span));
    CHECK(p.error().code == ErrorCode::InvalidEscape);

    Parser u {std::string_view {R"([1,"\q",x])"}};
    CHECK(u.skip_one_unchecked(span));
    CHECK(span.raw == R"([1,"\q",x])");
}

TEST_CASE("validate unchecked checks structure only", "[sjson][parser]") {
    CHECK(validate_unchecked(R"({"a":[1,2]})").ok());
    CHECK(validate_unchecked("[1,2").code == ErrorCode::EofWhileParsing);
    CHECK(validate_unchecked("[1] 2").code == ErrorCode::TrailingCharacters);
}

TEST_CASE("get from follows a path", "[sjson][parser]") {
    const std::string json = R"({"a":{"b":[10,{"c":"x"},30]},"a":5})";

    Parser p {json};
    RawSpan span;
    REQUIRE(p.get_from(JsonPointer {"a", "b", 1, "c"}, span));
    CHECK(span.raw == R"("x")");

    Parser q {json};
    REQUIRE(q.get_from(JsonPointer {"a", "b", 2}, span));
    CHECK(span.raw == "30");
}

TEST_CASE("get from failure codes", "[sjson][parser]") {
    auto code = [](const std::string& json, const JsonPointer& path) {
        Parser p {json};
        RawSpan span;
        CHECK_FALSE(p.get_from(path, span));
        return p.error().code;
    };

    CHECK(code(R"({"a":1})", {"b"}) == ErrorCode::GetUnknownKeyInObject);
    CHECK(code(R"({})", {"a"}) == ErrorCode::GetInEmptyObject);
    CHECK(code(R"([1,2])", {2}) == ErrorCode::GetIndexOutOfArray);
    CHECK(code(R"([])", {0}) == ErrorCode::GetInEmptyArray);
    CHECK(code(R"([1, ])", {1}) == ErrorCode::TrailingComma);
    CHECK(code(R"({"a":1})", {0}) == ErrorCode::TypeMismatch);
    CHECK(code(R"([1])", {"a"}) == ErrorCode::TypeMismatch);
    CHECK(error_category(ErrorCode::GetUnknownKeyInObject) == ErrorCategory::NotFound);
    CHECK(error_category(ErrorCode::TypeMismatch) == ErrorCategory::TypeUnmatched);
}

TEST_CASE("get does not read past the target", "[sjson][parser]") {
    const std::string json = R"({"a":1, garbage)";
    Parser p {json};
    RawSpan span;
    REQUIRE(p.get_from(JsonPointer {"a"}, span));
    CHECK(span.raw == "1");
}

TEST_CASE("get many resolves every path in one pass", "[sjson][parser]") {
    const std::string json = R"({"a":{"x":1,"y":[true,false,null]},"b":"s","a":{"x":2}})";

    PointerTree tree;
    tree.add_path({"a", "y", 2});
    tree.add_path({"b"});
    tree.add_path({"a", "x"});
    tree.add_path({"a", "y", 2});
    REQUIRE(tree.size() == 4);

    Parser p {json};
    std::vector<RawSpan> out;
    REQUIRE(p.get_many(tree, true, out));
    REQUIRE(out.size() == 4);
    CHECK(out[0].raw == "null");
    CHECK(out[1].raw == R"("s")");
    CHECK(out[2].raw == "1");
    CHECK(out[3].raw == "null");
}

TEST_CASE("get many matches get for every path", "[sjson][parser]") {
    const std::string json = R"({"k":[{"v":1},{"v":[2,3]},{"w":"z"}],"m":{"n":{"o":"p"}},"k":0})";
    const std::vector<JsonPointer> paths = {
        {"k", 0, "v"},
        {"k", 1, "v", 1},
        {"k", 2},
        {"m", "n"},
        {"m", "n", "o"},
        {"k"},
    };

    PointerTree tree;
    for (const auto& path : paths)
        tree.add_path(path);

    for (const bool checked : {true, false}) {
        Parser many {json};
        std::vector<RawSpan> out;
        REQUIRE(many.get_many(tree, checked, out));

        for (std::size_t i = 0; i < paths.size(); ++i) {
            Parser one {json};
            RawSpan span;
            REQUIRE((checked ? one.get_from(paths[i], span) : one.get_from_unchecked(paths[i], span)));
            CHECK(out[i].raw == span.raw);
        }
    }
}

TEST_CASE("get many fails when a path is missing", "[sjson][parser]") {
    PointerTree tree;
    tree.add_path({"a"});
    tree.add_path({"missing"});

    Parser p {std::string_view {R"({"a":1,"b":2})"}};
    std::vector<RawSpan> out;
    CHECK_FALSE(p.get_many(tree, true, out));
    CHECK(p.error().code == ErrorCode::GetUnknownKeyInObject);

    PointerTree idx;
    idx.add_path({5});
    Parser q {std::string_view {"[1,2]"}};
    CHECK_FALSE(q.get_many(idx, true, out));
    CHECK(q.error().code == ErrorCode::GetIndexOutOfArray);
}

TEST_CASE("whitespace kernels agree", "[sjson][parser]") {
    std::string json = "[";
    for (int i = 0; i < 200; ++i) {
        json += std::string(static_cast<std::size_t>(i % 70), ' ');
        json += "\t\n" + std::to_string(i) + "\r\n,";
    }
    json += "0   ]";

    for (const auto& k : detail::kernels()) {
        INFO("kernel: " << k.name);
        Parser p {json};
        p.set_kernel(k);
        detail::IgnoreVisitor vis;
        CHECK(p.parse_document(vis));
        CHECK(p.parse_trailing());
    }
}
