#ifndef GFAESTUS_BED_READER_HPP_INCLUDED
#define GFAESTUS_BED_READER_HPP_INCLUDED

#include <iostream>
#include <string>
#include <vector>
#include <functional>

#include "annotations.hpp"

namespace gfaestus {

using namespace std;

/**
 * One line of a BED file: the three mandatory fields plus whatever else was on
 * the line. Coordinates are 0-based and half-open, as in the file.
 */
class BedRecord : public AnnotationRecord<BedColumn> {
public:
    BedRecord() = default;
    ~BedRecord() = default;

    /// Try to make a record out of the fields of a line. Returns false if the
    /// mandatory fields aren't there or don't parse.
    static bool from_fields(const vector<string>& fields, BedRecord& record);

    virtual vector<BedColumn> columns() const;
    virtual const string& seq_id() const;
    virtual size_t start() const;
    virtual size_t end() const;
    /// The score comes from field 4, if that is a number.
    virtual bool score(double& score) const;
    virtual bool get_first(const BedColumn& key, string& value) const;
    virtual vector<string> get_all(const BedColumn& key) const;

    /// Number of fields after the mandatory ones.
    size_t extra_field_count() const;

private:
    string chr;
    size_t start_pos = 0;
    size_t end_pos = 0;
    /// Fields 3 and up
    vector<string> rest;
};

/**
 * A class that can parse and iterate over a BED file.
 *
 * Blank lines and "track" and "browser" lines are skipped, as are lines whose
 * chr, start and end don't parse. Comment lines are handed to a separate
 * callback so the first one can be read as a header.
 */
class BedReader {
public:
    BedReader(istream& in);
    ~BedReader() = default;

    /// Call the lambda on each record in the file, in order, and the comment
    /// lambda on each '#' line with its line number. Returns the number of
    /// lines that were skipped because they couldn't be parsed.
    size_t for_each_bed_record(const function<void(const BedRecord&)>& lambda,
                               const function<void(const string&, size_t)>& comment_lambda);

    /// Same, ignoring comments.
    size_t for_each_bed_record(const function<void(const BedRecord&)>& lambda);

private:
    istream& in;
};

/**
 * All the records from a BED file. If the file's first line is a '#' line,
 * its fields name the columns.
 */
class BedRecords : public AnnotationCollection<BedRecord, BedColumn> {
public:
    BedRecords() = default;
    BedRecords(const string& file_name);

    /// Read a whole BED file from the stream.
    static BedRecords parse(istream& in, const string& file_name);

    /// Read a whole BED file from disk. Throws runtime_error if the file can't
    /// be opened.
    static BedRecords parse_file(const string& path);

    bool has_headers() const;

    /// The names from the header line, including those of the mandatory
    /// columns.
    const vector<string>& headers() const;

    /// Find the column with the given header name. Returns false if no column
    /// has that name.
    bool header_to_column(const string& header, BedColumn& column) const;

    /// How many lines were skipped as unparseable.
    size_t skipped_lines() const;

private:
    vector<string> header_names;
    size_t skipped = 0;
};

}

#endif
