/// \file unittest/utility.cpp
///
/// Unit tests for string and argument helpers.
///

#include <string>
#include <vector>

#include "../utility.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("Annotation lines split into columns", "[utility]") {

    SECTION("Tabs separate columns and keep empty ones") {
        REQUIRE(split_columns("chr1\t10\t20") == vector<string>{"chr1", "10", "20"});
        REQUIRE(split_columns("a\t\tb\t") == vector<string>{"a", "", "b", ""});
        REQUIRE(split_columns("a b\tc") == vector<string>{"a b", "c"});
    }

    SECTION("Without tabs, runs of spaces separate columns") {
        REQUIRE(split_columns("chr1  10 20") == vector<string>{"chr1", "10", "20"});
        REQUIRE(split_columns("  lead") == vector<string>{"lead"});
        REQUIRE(split_columns("").empty());
    }
}

TEST_CASE("split_delims only cuts as often as asked", "[utility]") {
    REQUIRE(split_delims("a;b;c", ";") == vector<string>{"a", "b", "c"});
    REQUIRE(split_delims("a;b;c", ";", 1) == vector<string>{"a", "b;c"});
    REQUIRE(split_delims("a;;b", ";") == vector<string>{"a", "b"});
}

TEST_CASE("Strings join with a separator", "[utility]") {
    REQUIRE(join({"a", "b", "c"}, ";") == "a;b;c");
    REQUIRE(join({"only"}, ", ") == "only");
    REQUIRE(join({}, ";") == "");
}

TEST_CASE("File names break into their parts", "[utility]") {
    REQUIRE(split_ext("graph.hg") == make_pair(string("graph"), string("hg")));
    REQUIRE(split_ext("dir/graph") == make_pair(string("dir/graph"), string()));
    REQUIRE(file_name_only("/data/genes.gff3") == "genes.gff3");
    REQUIRE(file_name_only("genes.gff3") == "genes.gff3");
    REQUIRE(starts_with("P#chr1", "P#"));
    REQUIRE(!starts_with("P", "P#"));
    REQUIRE(ends_with("genes.bed", ".bed"));
}

TEST_CASE("Arguments parse strictly", "[utility]") {
    size_t unsigned_value = 0;
    REQUIRE(parse<size_t>("42", unsigned_value));
    REQUIRE(unsigned_value == 42);
    REQUIRE(!parse<size_t>("-1", unsigned_value));
    REQUIRE(!parse<size_t>("12x", unsigned_value));

    int signed_value = 0;
    REQUIRE(parse<int>("-7", signed_value));
    REQUIRE(signed_value == -7);

    double real = 0;
    REQUIRE(parse<double>("2.5", real));
    REQUIRE(real == 2.5);
    REQUIRE(parse<float>("3") == 3.0f);
}

}
}
