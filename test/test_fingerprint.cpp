#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include <cctype>
#include <string>
#include <string_view>
#include <type_traits>

#include <fingerprint.hpp>

TEST_SUITE("fingerprint") {
    TEST_CASE("sha256") {
        CHECK(fingerprint("").hex() == "E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855");
        CHECK(fingerprint("abc").hex() == "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
    }

    TEST_CASE("deterministic") {
        std::string const s = "Foobar Candy";
        auto const a = fingerprint(s);
        auto const b = fingerprint(s);
        CHECK(a == b);
        CHECK(a != fingerprint("Foobar Andy"));
        CHECK(fingerprint(std::string_view("a\0b", 3)) != fingerprint("a"));
    }

    TEST_CASE("incremental") {
        Fingerprinter f;
        f.update("Olympics");
        f.update(" ");
        f.update("2012");
        CHECK(f.digest() == fingerprint("Olympics 2012"));

        // digest resets the context
        f.update("PGA");
        CHECK(f.digest() == fingerprint("PGA"));
        CHECK(f.digest() == fingerprint(""));
    }

    TEST_CASE("hex") {
        auto const fp = fingerprint("hello there");
        auto const hex = fp.hex();
        REQUIRE(hex.length() == Fingerprint::NUM_HEX_DIGITS);

        auto const parsed = Fingerprint::from_hex(hex);
        REQUIRE(parsed.has_value());
        CHECK(*parsed == fp);

        std::string lower = hex;
        for(auto& c : lower) c = (char)std::tolower((unsigned char)c);
        CHECK(Fingerprint::from_hex(lower) == fp);

        CHECK(!Fingerprint::from_hex(hex.substr(1)).has_value());
        CHECK(!Fingerprint::from_hex(hex + "0").has_value());
        CHECK(!Fingerprint::from_hex("G" + hex.substr(1)).has_value());
    }

    TEST_CASE("order follows hex") {
        auto const a = fingerprint("a b c");
        auto const b = fingerprint("hello there");
        CHECK((a < b) == (a.hex() < b.hex()));
        CHECK((b < a) == (b.hex() < a.hex()));
    }

    TEST_CASE("digest errors") {
        // failures of the crypto library are reported like any other run failure
        CHECK((std::is_base_of_v<TopPhrasesError, DigestError>));
        CHECK_THROWS_AS(throw DigestError("EVP_DigestUpdate failed"), TopPhrasesError);
    }
}
