#include <catch2/catch_test_macros.hpp>

#include <sjson/sjson.hpp>

#include <cstring>
#include <random>
#include <string>

using namespace sjson;

namespace {

    std::string window_of(const std::string& s) {
        std::string w = s;
        w.resize(detail::kWindow, ' ');
        return w;
    }

    std::uint64_t bits_of(const std::string& w, const char c) {
        std::uint64_t m = 0;
        for (std::size_t i = 0; i < w.size() && i < detail::kWindow; ++i) {
            if (w[i] == c)
                m |= 1ull << i;
        }
        return m;
    }

} // namespace

TEST_CASE("scalar kernel classifies every structural byte", "[sjson][scan]") {
    const std::string w = window_of(R"({"a":[1,2],"b\"c":"x\ty"})");
    detail::Block64 b;
    detail::scalar_kernel().classify(w.data(), b);

    CHECK(b.quote == bits_of(w, '"'));
    CHECK(b.backslash == bits_of(w, '\\'));
    CHECK(b.comma == bits_of(w, ','));
    CHECK(b.lbrace == bits_of(w, '{'));
    CHECK(b.rbrace == bits_of(w, '}'));
    CHECK(b.lbracket == bits_of(w, '['));
    CHECK(b.rbracket == bits_of(w, ']'));
    CHECK(b.control == 0);
    CHECK((b.space & 1) == 0);
}

TEST_CASE("control bytes include tab and newline", "[sjson][scan]") {
    std::string w = window_of("a");
    w[3] = '\t';
    w[7] = '\n';
    w[9] = '\x01';

    detail::Block64 b;
    detail::scalar_kernel().classify(w.data(), b);

    CHECK(b.control == ((1ull << 3) | (1ull << 7) | (1ull << 9)));
    CHECK((b.space & (1ull << 3)) != 0);
    CHECK((b.space & (1ull << 7)) != 0);
    CHECK((b.space & (1ull << 9)) == 0);
}

TEST_CASE("every kernel matches the scalar kernel", "[sjson][scan]") {
    std::mt19937_64 rng {12345};
    const char alphabet[] = "{}[],:\"\\ \t\n\r0123456789abcdefxyz\x01\x1f\x7f\xc3\xa9";
    const std::size_t alpha_len = sizeof(alphabet) - 1;

    for (const auto& k : detail::kernels()) {
        INFO("kernel: " << k.name);
        for (int round = 0; round < 500; ++round) {
            char w[detail::kWindow];
            for (auto& c : w)
                c = alphabet[rng() % alpha_len];

            detail::Block64 want;
            detail::Block64 got;
            detail::scalar_kernel().classify(w, want);
            k.classify(w, got);
            REQUIRE(got == want);
        }
    }
}

TEST_CASE("active kernel is one of the compiled kernels", "[sjson][scan]") {
    const auto ks = detail::kernels();
    REQUIRE(!ks.empty());
    CHECK(std::strcmp(ks.front().name, "scalar") == 0);
    CHECK(&detail::active_kernel() == &ks.back());
}

TEST_CASE("prefix xor marks string interiors", "[sjson][scan]") {
    // quotes at 0 and 3: bytes 0..2 are inside, the closing quote is not
    CHECK(detail::prefix_xor64(0b1001) == 0b0111);
    CHECK(detail::prefix_xor64(0) == 0);
    CHECK(detail::prefix_xor64(1) == ~0ull);
}

TEST_CASE("escaped mask handles backslash runs", "[sjson][scan]") {
    std::uint64_t prev = 0;

    SECTION("single backslash escapes the next byte") {
        CHECK(detail::escaped_mask64(0b1, prev) == 0b10);
        CHECK(prev == 0);
    }

    SECTION("double backslash escapes only the second one") {
        CHECK(detail::escaped_mask64(0b11, prev) == 0b10);
        CHECK(prev == 0);
    }

    SECTION("triple backslash escapes the byte after the run") {
        CHECK(detail::escaped_mask64(0b111, prev) == 0b1010);
    }

    SECTION("run ending on the last byte carries into the next window") {
        CHECK(detail::escaped_mask64(1ull << 63, prev) == 0);
        CHECK(prev == 1);
        CHECK(detail::escaped_mask64(0, prev) == 1);
        CHECK(prev == 0);
    }
}

TEST_CASE("string bits across windows", "[sjson][scan]") {
    std::string text(detail::kWindow * 2, ' ');
    text[60] = '"';
    text[70] = '"';

    std::uint64_t in_string = 0;
    std::uint64_t escaped = 0;

    detail::Block64 b;
    detail::scalar_kernel().classify(text.data(), b);
    const auto first = detail::string_bits(b, in_string, escaped);
    CHECK(first == (~0ull << 60));
    CHECK(in_string == ~0ull);

    detail::scalar_kernel().classify(text.data() + detail::kWindow, b);
    const auto second = detail::string_bits(b, in_string, escaped);
    CHECK(second == ((1ull << 6) - 1));
    CHECK(in_string == 0);
}

TEST_CASE("escaped quote does not close a string", "[sjson][scan]") {
    const std::string w = window_of(R"("a\"b")");
    detail::Block64 b;
    detail::scalar_kernel().classify(w.data(), b);

    std::uint64_t in_string = 0;
    std::uint64_t escaped = 0;
    CHECK(detail::string_bits(b, in_string, escaped) == 0b011111);
}

TEST_CASE("short windows are padded with spaces", "[sjson][scan]") {
    const std::string text = R"([1,"x"])";
    detail::Block64 b;
    const auto valid = detail::classify_window(detail::active_kernel(), text.data(), text.data() + text.size(), b);

    CHECK(valid == detail::valid_mask(text.size()));
    CHECK(b.rbracket == (1ull << 6));
    CHECK((b.space & ~valid) == ~valid);
    CHECK(detail::valid_mask(detail::kWindow) == ~0ull);
}
