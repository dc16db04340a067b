#ifndef GFAESTUS_GFF_READER_HPP_INCLUDED
#define GFAESTUS_GFF_READER_HPP_INCLUDED

#include <iostream>
#include <string>
#include <vector>
#include <set>
#include <stdexcept>
#include <functional>

#include "annotations.hpp"

namespace gfaestus {

using namespace std;

/**
 * Thrown when a non-comment line of a GFF3 file can't be parsed.
 */
class GFFParseError : public runtime_error {
public:
    GFFParseError(size_t line_number, const string& message);

    /// 1-based number of the offending line
    size_t line_number() const;

private:
    size_t line;
};

/**
 * A package of the information contained in a GFF3 record.
 *
 * The coordinates are stored 0-based and half-open, unlike the file. Reading
 * the Start and End columns gives back the 1-based, inclusive numbers that
 * were in the file.
 */
class GFFRecord : public AnnotationRecord<Gff3Column> {
public:
    GFFRecord() = default;
    ~GFFRecord() = default;

    /// Parse a GFF3 record from the 9 fields of its line. Throws
    /// GFFParseError if the fields don't make a valid record.
    static GFFRecord from_fields(const vector<string>& fields, size_t line_number);

    virtual vector<Gff3Column> columns() const;
    virtual const string& seq_id() const;
    virtual size_t start() const;
    virtual size_t end() const;
    virtual bool score(double& score) const;
    virtual bool get_first(const Gff3Column& key, string& value) const;
    virtual vector<string> get_all(const Gff3Column& key) const;

    const string& source() const;
    const string& type() const;
    Strand strand() const;
    const string& frame() const;

    /// Get the attribute names in the order they first appeared.
    vector<string> attribute_keys() const;

    /// Produce the tab-separated GFF3 line for the record, without the
    /// newline. Repeated attributes are written together, in the order their
    /// key first appeared.
    string to_line() const;

private:
    string sequence_id;
    string source_text;
    string type_text;
    // 0-based, half-open
    size_t start_pos = 0;
    size_t end_pos = 0;
    // Kept as text so it comes back out the way it went in. "." if absent.
    string score_text = ".";
    double score_value = 0.0;
    bool has_score = false;
    Strand strand_value = Strand::None;
    string frame_text = ".";
    // Attribute values by key, in first-seen key order
    vector<pair<string, vector<string>>> attributes;
};

/**
 * A class that can parse and iterate over a GFF3 file.
 *
 * Comment lines and blank lines are skipped. A last line without a newline
 * after it is taken to be truncated and ignored.
 */
class GFFReader {
public:
    GFFReader(istream& in);
    ~GFFReader() = default;

    /// Call the lambda on each record in the file, in order. Throws
    /// GFFParseError at the first line that isn't a valid record.
    void for_each_gff_record(const function<void(const GFFRecord&)>& lambda);

private:
    istream& in;
};

/**
 * All the records from a GFF3 file, with the attribute names used anywhere
 * in it.
 */
class Gff3Records : public AnnotationCollection<GFFRecord, Gff3Column> {
public:
    Gff3Records() = default;
    Gff3Records(const string& file_name);

    /// Read a whole GFF3 file from the stream. Throws GFFParseError.
    static Gff3Records parse(istream& in, const string& file_name);

    /// Read a whole GFF3 file from disk. Throws GFFParseError, or
    /// runtime_error if the file can't be opened.
    static Gff3Records parse_file(const string& path);

    /// Every attribute name seen in the file.
    const set<string>& attribute_keys() const;

private:
    set<string> attribute_names;
};

}

#endif
