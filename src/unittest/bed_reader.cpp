/// \file unittest/bed_reader.cpp
///
/// Unit tests for reading BED annotations.
///

#include <iostream>
#include <sstream>
#include <string>

#include "../bed_reader.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("BED records parse from their fields", "[bed][annotations]") {

    BedRecord record;

    SECTION("The three mandatory fields are enough") {
        REQUIRE(BedRecord::from_fields({"chr2", "5", "15"}, record));
        REQUIRE(record.seq_id() == "chr2");
        REQUIRE(record.start() == 5);
        REQUIRE(record.end() == 15);
        REQUIRE(record.extra_field_count() == 0);
        double score;
        REQUIRE(!record.score(score));
        string value;
        REQUIRE(!record.get_first(BedColumn(BedColumn::Name), value));
    }

    SECTION("Optional fields are read by index") {
        REQUIRE(BedRecord::from_fields({"chr2", "5", "15", "peak1", "960", "+"}, record));
        REQUIRE(record.columns().size() == 6);
        REQUIRE(record.columns()[3] == BedColumn((size_t) 3));

        string value;
        REQUIRE(record.get_first(BedColumn(BedColumn::Name), value));
        REQUIRE(value == "peak1");
        REQUIRE(record.get_first(BedColumn((size_t) 5), value));
        REQUIRE(value == "+");
        REQUIRE(!record.get_first(BedColumn((size_t) 6), value));
        REQUIRE(record.get_all(BedColumn(BedColumn::Start)) == vector<string>({"5"}));

        double score = 0.0;
        REQUIRE(record.score(score));
        REQUIRE(score == 960.0);
    }

    SECTION("A score that isn't a number is no score") {
        REQUIRE(BedRecord::from_fields({"chr2", "5", "15", "peak1", "high"}, record));
        double score;
        REQUIRE(!record.score(score));
    }

    SECTION("Bad coordinates are rejected") {
        REQUIRE(!BedRecord::from_fields({"chr2", "5"}, record));
        REQUIRE(!BedRecord::from_fields({"chr2", "x", "15"}, record));
        REQUIRE(!BedRecord::from_fields({"chr2", "-5", "15"}, record));
        REQUIRE(!BedRecord::from_fields({"chr2", "15", "5"}, record));
        REQUIRE(!BedRecord::from_fields({"", "5", "15"}, record));
    }
}

TEST_CASE("BED files are read into collections", "[bed][annotations]") {

    SECTION("Bad lines are skipped and counted") {
        stringstream in("track name=peaks\n"
                        "browser position chr1\n"
                        "chr1\t10\t20\ta\t5\n"
                        "chr1\tten\t20\n"
                        "\n"
                        "chr1 30 40 b\n"
                        "chr1\t50\t40\n"
                        "chr1\t60\t70\tc\t1\t-");

        BedRecords records = BedRecords::parse(in, "peaks.bed");
        REQUIRE(records.size() == 3);
        REQUIRE(records.skipped_lines() == 2);
        REQUIRE(!records.has_headers());

        SECTION("An unterminated last line is kept") {
            REQUIRE(records[2].start() == 60);
        }

        SECTION("Whitespace-separated lines work") {
            REQUIRE(records[1].get_all(BedColumn(BedColumn::Name)) == vector<string>({"b"}));
        }

        SECTION("There are index columns for the widest line") {
            auto& columns = records.all_columns();
            REQUIRE(columns.size() == 6);
            REQUIRE(columns[5] == BedColumn((size_t) 5));
            REQUIRE(records.mandatory_columns().size() == 3);
            REQUIRE(records.optional_columns().size() == 3);
        }
    }

    SECTION("A comment on the first line names the columns") {
        stringstream in("#chrom\tstart\tend\tname\t score\n"
                        "chr1\t10\t20\ta\t5\n"
                        "# another comment\n"
                        "chr1\t30\t40\tb\t6\n");

        BedRecords records = BedRecords::parse(in, "named.bed");
        REQUIRE(records.size() == 2);
        REQUIRE(records.has_headers());
        REQUIRE(records.headers() == vector<string>({"chrom", "start", "end", "name", "score"}));

        auto& columns = records.all_columns();
        REQUIRE(columns.size() == 5);
        REQUIRE(columns[3] == BedColumn(3, "name"));

        BedColumn column;
        REQUIRE(records.header_to_column("score", column));
        REQUIRE(column == BedColumn(4, "score"));
        REQUIRE(records[1].get_all(column) == vector<string>({"6"}));

        REQUIRE(records.header_to_column("chrom", column));
        REQUIRE(column == BedColumn(BedColumn::Chr));
        REQUIRE(!records.header_to_column("strand", column));

        REQUIRE(records.find_column("name", column));
        REQUIRE(records[0].get_all(column) == vector<string>({"a"}));
    }
}

}
}
