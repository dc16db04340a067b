/// \file unittest/gff_reader.cpp
///
/// Unit tests for reading GFF3 annotations.
///

#include <iostream>
#include <sstream>
#include <string>
#include <set>
#include <algorithm>

#include "../gff_reader.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("GFF3 records parse from their fields", "[gff][annotations]") {

    string line = "chr1\tHAVANA\tgene\t11869\t14409\t.\t+\t.\tID=ENSG00000223972.5;gene_name=DDX11L1;level=2";

    stringstream in(line + "\n");
    vector<GFFRecord> records;
    GFFReader(in).for_each_gff_record([&](const GFFRecord& record) {
        records.push_back(record);
    });
    REQUIRE(records.size() == 1);
    auto& record = records.front();

    SECTION("Coordinates are 0-based and half-open") {
        REQUIRE(record.seq_id() == "chr1");
        REQUIRE(record.start() == 11868);
        REQUIRE(record.end() == 14409);
    }

    SECTION("Fixed columns come back as written") {
        REQUIRE(record.source() == "HAVANA");
        REQUIRE(record.type() == "gene");
        REQUIRE(record.strand() == Strand::Pos);
        REQUIRE(record.frame() == ".");

        string value;
        REQUIRE(record.get_first(Gff3Column::Start, value));
        REQUIRE(value == "11869");
        REQUIRE(record.get_first(Gff3Column::Strand, value));
        REQUIRE(value == "+");
    }

    SECTION("A '.' score is no score") {
        double score;
        REQUIRE(!record.score(score));
        string value;
        REQUIRE(!record.get_first(Gff3Column::Score, value));
        auto columns = record.columns();
        REQUIRE(find(columns.begin(), columns.end(), Gff3Column(Gff3Column::Score)) == columns.end());
    }

    SECTION("Attributes are columns of their own") {
        string value;
        REQUIRE(record.get_first(Gff3Column("gene_name"), value));
        REQUIRE(value == "DDX11L1");
        REQUIRE(!record.get_first(Gff3Column("Name"), value));
        REQUIRE(record.get_all(Gff3Column("Name")).empty());
        REQUIRE(record.attribute_keys() == vector<string>({"ID", "gene_name", "level"}));
    }

    SECTION("The line can be written back out the same") {
        REQUIRE(record.to_line() == line);
    }
}

TEST_CASE("GFF3 attributes can have several values", "[gff][annotations]") {
    vector<string> fields {"ctg", "src", "CDS", "1", "10", "0.5", "-", "2", "Parent=a;Parent=b;;ID=c"};
    GFFRecord record = GFFRecord::from_fields(fields, 1);

    REQUIRE(record.get_all(Gff3Column("Parent")) == vector<string>({"a", "b"}));
    REQUIRE(record.get_all(Gff3Column("ID")) == vector<string>({"c"}));
    REQUIRE(record.strand() == Strand::Neg);
    REQUIRE(record.frame() == "2");

    double score = 0.0;
    REQUIRE(record.score(score));
    REQUIRE(score == 0.5);

    SECTION("Values of a key are written together") {
        REQUIRE(record.to_line() == "ctg\tsrc\tCDS\t1\t10\t0.5\t-\t2\tParent=a;Parent=b;ID=c");
    }
}

TEST_CASE("Structural GFF3 errors are reported with their line", "[gff][annotations]") {

    SECTION("Too few fields") {
        stringstream in("##gff-version 3\nchr1\tsrc\tgene\t1\t10\t.\t+\t.\n");
        GFFReader reader(in);
        try {
            reader.for_each_gff_record([](const GFFRecord& record) {});
            FAIL("no exception thrown");
        } catch (GFFParseError& e) {
            REQUIRE(e.line_number() == 2);
        }
    }

    SECTION("Bad values") {
        vector<string> fields {"chr1", "src", "gene", "1", "10", ".", "+", ".", "ID=x"};
        REQUIRE_NOTHROW(GFFRecord::from_fields(fields, 1));

        auto bad = fields;
        bad[3] = "0";
        REQUIRE_THROWS_AS(GFFRecord::from_fields(bad, 1), GFFParseError);
        bad = fields;
        bad[3] = "12";
        REQUIRE_THROWS_AS(GFFRecord::from_fields(bad, 1), GFFParseError);
        bad = fields;
        bad[5] = "high";
        REQUIRE_THROWS_AS(GFFRecord::from_fields(bad, 1), GFFParseError);
        bad = fields;
        bad[6] = "x";
        REQUIRE_THROWS_AS(GFFRecord::from_fields(bad, 1), GFFParseError);
        bad = fields;
        bad[7] = "3";
        REQUIRE_THROWS_AS(GFFRecord::from_fields(bad, 1), GFFParseError);
        bad = fields;
        bad[8] = "ID";
        REQUIRE_THROWS_AS(GFFRecord::from_fields(bad, 1), GFFParseError);
    }

    SECTION("A record covering no bases is fine") {
        vector<string> fields {"chr1", "src", "gene", "11", "10", ".", ".", ".", "."};
        GFFRecord record = GFFRecord::from_fields(fields, 1);
        REQUIRE(record.start() == 10);
        REQUIRE(record.end() == 10);
        REQUIRE(record.strand() == Strand::None);
    }
}

TEST_CASE("GFF3 files are read into collections", "[gff][annotations]") {

    stringstream in("##gff-version 3\n"
                    "# a comment\n"
                    "\n"
                    "P\tsrc\tgene\t16\t70\t.\t+\t.\tID=g1;Name=BRCA1\r\n"
                    "P\tsrc\tCDS\t20\t40\t3\t+\t0\tID=c1;Parent=g1\n"
                    "P\tsrc\tgene\t100\t120\t.\t-\t.\tID=g2");

    Gff3Records records = Gff3Records::parse(in, "test.gff3");

    SECTION("Comments, blank lines and an unterminated last line are skipped") {
        REQUIRE(records.size() == 2);
        REQUIRE(records.file_name() == "test.gff3");
        REQUIRE(records[0].type() == "gene");
        REQUIRE(records[1].type() == "CDS");
    }

    SECTION("Carriage returns are dropped") {
        REQUIRE(records[0].get_all(Gff3Column("Name")) == vector<string>({"BRCA1"}));
    }

    SECTION("Columns include every attribute seen") {
        REQUIRE(records.attribute_keys() == set<string>({"ID", "Name", "Parent"}));
        auto& columns = records.all_columns();
        REQUIRE(columns.size() == 11);
        REQUIRE(columns[0] == Gff3Column::seq_id_column());

        auto mandatory = records.mandatory_columns();
        auto optional = records.optional_columns();
        REQUIRE(mandatory.size() + optional.size() == columns.size());
        REQUIRE(find(optional.begin(), optional.end(), Gff3Column("Parent")) != optional.end());
        REQUIRE(find(mandatory.begin(), mandatory.end(), Gff3Column(Gff3Column::Start)) != mandatory.end());
        REQUIRE(find(mandatory.begin(), mandatory.end(), Gff3Column(Gff3Column::Type)) == mandatory.end());
    }

    SECTION("Columns can be found by name") {
        Gff3Column column;
        REQUIRE(records.find_column("Parent", column));
        REQUIRE(column == Gff3Column("Parent"));
        REQUIRE(records.find_column("type", column));
        REQUIRE(column == Gff3Column(Gff3Column::Type));
        REQUIRE(!records.find_column("gene_name", column));
    }
}

}
}
