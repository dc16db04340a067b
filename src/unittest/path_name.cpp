/// \file unittest/path_name.cpp
///
/// Unit tests for reading coordinate ranges out of path names.
///

#include <string>

#include "../path_name.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("Path names can carry a sequence and range", "[pathname]") {

    string seq_id;
    size_t start = 0;
    size_t end = 0;

    SECTION("A full sample#seq:start-end name parses") {
        REQUIRE(path_name_chr_range("HG002#chr1:100-250", seq_id, start, end));
        REQUIRE(seq_id == "chr1");
        REQUIRE(start == 100);
        REQUIRE(end == 250);
    }

    SECTION("Only the first '#' separates the sample") {
        REQUIRE(path_name_chr_range("HG002#1#chr7:5-9", seq_id, start, end));
        REQUIRE(seq_id == "1#chr7");
        REQUIRE(start == 5);
        REQUIRE(end == 9);
    }

    SECTION("Names without the pieces don't parse") {
        REQUIRE(!path_name_chr_range("chr1:100-250", seq_id, start, end));
        REQUIRE(!path_name_chr_range("HG002#", seq_id, start, end));
        REQUIRE(!path_name_chr_range("HG002#chr1", seq_id, start, end));
        REQUIRE(!path_name_chr_range("HG002#chr1:100", seq_id, start, end));
        REQUIRE(!path_name_chr_range("HG002#chr1:abc-250", seq_id, start, end));
        REQUIRE(!path_name_chr_range("HG002#chr1:100-", seq_id, start, end));
        REQUIRE(seq_id.empty());
    }

    SECTION("The range alone can be read from a name with no sample") {
        REQUIRE(path_name_range("chr1:100-250", start, end));
        REQUIRE(start == 100);
        REQUIRE(end == 250);
        REQUIRE(!path_name_range("chr1", start, end));
    }

    SECTION("The offset is the start of the range") {
        size_t offset = 7;
        REQUIRE(path_name_offset("P#chr1:100-250", offset));
        REQUIRE(offset == 100);
        offset = 7;
        REQUIRE(!path_name_offset("P", offset));
        REQUIRE(offset == 7);
    }
}

TEST_CASE("Unsigned numbers parse strictly", "[pathname]") {
    size_t value = 3;
    REQUIRE(parse_unsigned("0", value));
    REQUIRE(value == 0);
    REQUIRE(parse_unsigned("18446744073709551615", value));
    REQUIRE(value == 18446744073709551615ull);
    REQUIRE(!parse_unsigned("18446744073709551616", value));
    REQUIRE(!parse_unsigned("", value));
    REQUIRE(!parse_unsigned("-1", value));
    REQUIRE(!parse_unsigned("12a", value));
}

}
}
