#include <catch2/catch_test_macros.hpp>

#include <sjson/sjson.hpp>

#include <string>
#include <string_view>

using namespace sjson;

TEST_CASE("escape short forms and control bytes", "[sjson][string]") {
    CHECK(escape("plain") == R"("plain")");
    CHECK(escape("a\"b\\c") == R"("a\"b\\c")");
    CHECK(escape("\b\f\n\r\t") == R"("\b\f\n\r\t")");
    CHECK(escape(std::string_view {"\x01\x1f", 2}) == R"("\u0001\u001F")");
    CHECK(escape("") == R"("")");
}

TEST_CASE("escape keeps non-ascii and slash as is", "[sjson][string]") {
    CHECK(escape("caf\xc3\xa9 / x") == "\"caf\xc3\xa9 / x\"");
}

TEST_CASE("escape long runs cross window boundaries", "[sjson][string]") {
    std::string text(150, 'a');
    text[63] = '"';
    text[64] = '\n';
    text[128] = '\\';

    std::string want = "\"";
    for (const char c : text) {
        if (c == '"')
            want += "\\\"";
        else if (c == '\n')
            want += "\\n";
        else if (c == '\\')
            want += "\\\\";
        else
            want += c;
    }
    want += '"';

    CHECK(escape(text) == want);
}

TEST_CASE("escape into a fixed buffer reports overflow", "[sjson][string]") {
    char buf[4];
    FixedBufferSink sink {buf, sizeof(buf), 0};
    CHECK_FALSE(escape_string(sink, "abcdef"));

    char big[16];
    FixedBufferSink ok {big, sizeof(big), 0};
    REQUIRE(escape_string(ok, "ab"));
    CHECK(ok.finish() == R"("ab")");
}

TEST_CASE("unescape simple escapes", "[sjson][string]") {
    std::string out;
    REQUIRE(unescape(R"("a\"b\\c\/d\b\f\n\r\t")", out) == ErrorCode::None);
    CHECK(out == "a\"b\\c/d\b\f\n\r\t");
}

TEST_CASE("unescape unicode escapes", "[sjson][string]") {
    std::string out;

    REQUIRE(unescape(R"("\u0041\u00e9\u20ac")", out) == ErrorCode::None);
    CHECK(out == "A\xc3\xa9\xe2\x82\xac");

    REQUIRE(unescape(R"("\ud83d\ude00")", out) == ErrorCode::None);
    CHECK(out == "\xf0\x9f\x98\x80");

    REQUIRE(unescape(R"("\u0000")", out) == ErrorCode::None);
    CHECK(out == std::string_view {"\0", 1});
}

TEST_CASE("unescape rejects bad escapes", "[sjson][string]") {
    std::string out;

    CHECK(unescape(R"("\q")", out) == ErrorCode::InvalidEscape);
    CHECK(unescape(R"("\uZZZZ")", out) == ErrorCode::InvalidUnicodeCodePoint);
    CHECK(unescape(R"("\ud83d")", out) == ErrorCode::InvalidSurrogate);
    CHECK(unescape(R"("\ud83dx")", out) == ErrorCode::InvalidSurrogate);
    CHECK(unescape(R"("\ud83dA")", out) == ErrorCode::InvalidSurrogate);
    CHECK(unescape(R"("\ude00")", out) == ErrorCode::InvalidSurrogate);
    CHECK(unescape(R"("\u12")", out) == ErrorCode::EofWhileParsing);
}

TEST_CASE("unescape rejects raw control bytes and bad utf8", "[sjson][string]") {
    std::string out;

    CHECK(unescape("\"a\nb\"", out) == ErrorCode::ControlCharacterInString);
    CHECK(unescape("\"a\xff\"", out) == ErrorCode::InvalidUtf8);
    CHECK(unescape("\"abc", out) == ErrorCode::EofWhileParsing);
    CHECK(unescape("\"abc\" ", out) == ErrorCode::TrailingCharacters);
    CHECK(unescape("abc", out) == ErrorCode::InvalidJsonValue);
}

TEST_CASE("escape then unescape returns the original text", "[sjson][string]") {
    const std::string text = "line1\nline2\t\"quoted\" \\ \x01 caf\xc3\xa9";
    std::string out;
    REQUIRE(unescape(escape(text), out) == ErrorCode::None);
    CHECK(out == text);
}

TEST_CASE("skip string reports escapes", "[sjson][string]") {
    const auto& k = detail::active_kernel();

    const std::string plain = R"(abc" tail)";
    const char* p = plain.data();
    bool escaped = false;
    REQUIRE(detail::skip_string(k, p, plain.data() + plain.size(), escaped, true) == ErrorCode::None);
    CHECK_FALSE(escaped);
    CHECK(p == plain.data() + 4);

    const std::string esc = R"(a\"b" tail)";
    p = esc.data();
    REQUIRE(detail::skip_string(k, p, esc.data() + esc.size(), escaped, true) == ErrorCode::None);
    CHECK(escaped);
    CHECK(p == esc.data() + 5);
}

TEST_CASE("unchecked skip follows quote parity only", "[sjson][string]") {
    const auto& k = detail::active_kernel();

    // \q is not a valid escape; the unchecked skip does not look at it
    std::string text = R"(a\qb\\")";
    text += std::string(100, ' ');
    const char* p = text.data();
    bool escaped = false;
    REQUIRE(detail::skip_string_unchecked(k, p, text.data() + text.size(), escaped) == ErrorCode::None);
    CHECK(escaped);
    CHECK(p == text.data() + 7);

    const char* q = text.data();
    CHECK(detail::skip_string(k, q, text.data() + text.size(), escaped, true) == ErrorCode::InvalidEscape);
}

TEST_CASE("unchecked skip carries escapes across windows", "[sjson][string]") {
    std::string text(63, 'a');
    text += "\\\"bc\"";
    text += std::string(80, ' ');

    const char* p = text.data();
    bool escaped = false;
    REQUIRE(detail::skip_string_unchecked(detail::active_kernel(), p, text.data() + text.size(), escaped) == ErrorCode::None);
    CHECK(escaped);
    CHECK(p == text.data() + 68);
}

TEST_CASE("unescape in place compacts the buffer", "[sjson][string]") {
    std::string buf = R"(ab\ncd\u00e9" rest)";
    char* p = buf.data();
    std::size_t len = 0;

    REQUIRE(detail::unescape_inplace(detail::active_kernel(), p, buf.data() + buf.size(), len) == ErrorCode::None);
    CHECK(std::string_view {buf.data(), len} == "ab\ncd\xc3\xa9");
    CHECK(std::string_view {p} == " rest");
}

TEST_CASE("unescape in place over long strings", "[sjson][string]") {
    std::string body;
    std::string want;
    for (int i = 0; i < 40; ++i) {
        body += "xyz\\t";
        want += "xyz\t";
    }
    std::string buf = body + "\"";
    char* p = buf.data();
    std::size_t len = 0;

    REQUIRE(detail::unescape_inplace(detail::active_kernel(), p, buf.data() + buf.size(), len) == ErrorCode::None);
    CHECK(std::string_view {buf.data(), len} == want);
    CHECK(p == buf.data() + buf.size());
}
