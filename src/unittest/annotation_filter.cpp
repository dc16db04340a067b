/// \file unittest/annotation_filter.cpp
///
/// Unit tests for filtering annotation records.
///

#include <iostream>
#include <sstream>
#include <string>

#include "../annotation_filter.hpp"
#include "../gff_reader.hpp"
#include "../bed_reader.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("String filters compare against their argument", "[filter]") {

    REQUIRE(FilterString().matches("anything"));
    REQUIRE(FilterString(StringOp::None, "x").matches("anything"));

    REQUIRE(FilterString(StringOp::Equal, "gene").matches("gene"));
    REQUIRE(!FilterString(StringOp::Equal, "gene").matches("genes"));

    REQUIRE(FilterString(StringOp::Contains, "RCA").matches("BRCA1"));
    REQUIRE(!FilterString(StringOp::Contains, "BRCA1").matches("RCA"));

    REQUIRE(FilterString(StringOp::ContainedIn, "BRCA1").matches("RCA"));
    REQUIRE(!FilterString(StringOp::ContainedIn, "RCA").matches("BRCA1"));

    REQUIRE(FilterString(StringOp::NotContained, "pseudo").matches("gene"));
    REQUIRE(!FilterString(StringOp::NotContained, "pseudo").matches("pseudogene"));
}

TEST_CASE("Number filters compare against their arguments", "[filter]") {

    REQUIRE(FilterNum<size_t>().matches(12));
    REQUIRE(FilterNum<size_t>(NumOp::LT, 10).matches(9));
    REQUIRE(!FilterNum<size_t>(NumOp::LT, 10).matches(10));
    REQUIRE(FilterNum<size_t>(NumOp::LE, 10).matches(10));
    REQUIRE(FilterNum<size_t>(NumOp::EQ, 10).matches(10));
    REQUIRE(!FilterNum<size_t>(NumOp::EQ, 10).matches(11));
    REQUIRE(FilterNum<size_t>(NumOp::GE, 10).matches(10));
    REQUIRE(!FilterNum<size_t>(NumOp::GT, 10).matches(10));

    SECTION("Ranges include both ends") {
        FilterNum<double> range(NumOp::InRange, 1.5, 2.5);
        REQUIRE(range.matches(1.5));
        REQUIRE(range.matches(2.5));
        REQUIRE(!range.matches(2.6));
        REQUIRE(!range.matches(1.4));
    }

    SECTION("Filters can be made from text") {
        auto filter = FilterNum<size_t>::from_strings(NumOp::GT, "100");
        REQUIRE(filter.op == NumOp::GT);
        REQUIRE(filter.arg1 == 100);

        auto range = FilterNum<double>::from_strings(NumOp::InRange, "0.5", "1e3");
        REQUIRE(range.op == NumOp::InRange);
        REQUIRE(range.arg2 == 1000.0);
    }

    SECTION("Text that doesn't parse makes a filter that passes everything") {
        REQUIRE(FilterNum<size_t>::from_strings(NumOp::GT, "lots").op == NumOp::None);
        REQUIRE(FilterNum<size_t>::from_strings(NumOp::GT, "-5").op == NumOp::None);
        REQUIRE(FilterNum<size_t>::from_strings(NumOp::GT, "").op == NumOp::None);
        REQUIRE(FilterNum<double>::from_strings(NumOp::InRange, "1", "two").op == NumOp::None);
        REQUIRE(FilterNum<double>::from_strings(NumOp::InRange, "1", "two").matches(-100.0));
    }
}

TEST_CASE("Record filters pick out GFF3 records", "[filter][gff]") {

    stringstream in("chr1\tsrc\tgene\t1\t100\t.\t+\t.\tID=g1;Name=BRCA1\n"
                    "chr1\tsrc\tCDS\t10\t50\t7\t+\t0\tID=c1;Parent=g1\n"
                    "chr1\tsrc\texon\t10\t60\t.\t+\t.\tID=BRCA1-e1;Parent=g1\n"
                    "chr1\tsrc\tgene\t200\t300\t2\t-\t.\tID=g2;Name=TP53\n"
                    "chr2\tsrc\tCDS\t5\t25\t.\t+\t0\tID=BRCA2-c;Parent=g3\n");
    Gff3Records records = Gff3Records::parse(in, "filter.gff3");
    REQUIRE(records.size() == 5);

    RecordFilter<Gff3Column> filter;

    SECTION("An empty filter passes everything") {
        REQUIRE(filter_records(records, filter) == vector<size_t>({0, 1, 2, 3, 4}));
    }

    SECTION("Column filters and the quick filter must both pass") {
        filter.set_column_filter(Gff3Column::Type, FilterString(StringOp::ContainedIn, "gene,CDS"));
        filter.quick_filter = QuickFilter<Gff3Column>(FilterString(StringOp::Contains, "BRCA"),
                                                      {Gff3Column("Name"), Gff3Column("ID")});
        REQUIRE(filter_records(records, filter) == vector<size_t>({0, 4}));
    }

    SECTION("A quick filter with no columns passes everything") {
        filter.quick_filter = QuickFilter<Gff3Column>(FilterString(StringOp::Contains, "BRCA"), {});
        REQUIRE(filter_records(records, filter).size() == 5);
    }

    SECTION("Records without a filtered column fail") {
        filter.set_column_filter(Gff3Column("Parent"), FilterString(StringOp::NotContained, "g3"));
        REQUIRE(filter_records(records, filter) == vector<size_t>({1, 2}));
    }

    SECTION("Setting a None column filter removes it") {
        filter.set_column_filter(Gff3Column("Parent"), FilterString(StringOp::Equal, "g1"));
        FilterString found;
        REQUIRE(filter.get_column_filter(Gff3Column("Parent"), found));
        REQUIRE(found.arg == "g1");
        filter.set_column_filter(Gff3Column("Parent"), FilterString());
        REQUIRE(!filter.get_column_filter(Gff3Column("Parent"), found));
        REQUIRE(filter_records(records, filter).size() == 5);
    }

    SECTION("Scores filter out records without one") {
        filter.score_filter = FilterNum<double>(NumOp::GE, 2.0);
        REQUIRE(filter_records(records, filter) == vector<size_t>({1, 3}));
    }

    SECTION("Ranges keep records on the sequence within the bounds") {
        filter.set_range("chr1", 5, 100);
        REQUIRE(filter_records(records, filter) == vector<size_t>({1, 2}));

        filter.clear();
        REQUIRE(filter_records(records, filter).size() == 5);
    }
}

TEST_CASE("Record filters pick out BED records", "[filter][bed]") {

    stringstream in("chr1\t0\t10\tpeak1\t100\n"
                    "chr1\t20\t30\tpeak2\t900\n"
                    "chr1\t40\t50\n");
    BedRecords records = BedRecords::parse(in, "filter.bed");

    RecordFilter<BedColumn> filter;
    filter.set_column_filter(BedColumn(BedColumn::Name), FilterString(StringOp::Contains, "peak"));
    REQUIRE(filter_records(records, filter) == vector<size_t>({0, 1}));

    filter.score_filter = FilterNum<double>::from_strings(NumOp::GT, "500");
    REQUIRE(filter_records(records, filter) == vector<size_t>({1}));

    filter.start_filter = FilterNum<size_t>(NumOp::LT, 20);
    REQUIRE(filter_records(records, filter).empty());
}

}
}
