#ifndef GFAESTUS_ANNOTATIONS_HPP_INCLUDED
#define GFAESTUS_ANNOTATIONS_HPP_INCLUDED

/** \file
 * annotations.hpp: the common shape of records parsed from annotation files
 * (GFF3 and BED), their column keys, and collections of them.
 *
 * Records expose 0-based, half-open [start, end) coordinates no matter what
 * the file format uses.
 */

#include <string>
#include <vector>
#include <iostream>

namespace gfaestus {

using namespace std;

enum class Strand {
    Pos,
    Neg,
    None
};

/// Parse a strand from "+", "-" or ".". Returns false on anything else.
bool parse_strand(const string& text, Strand& strand);

/// Get the character for a strand.
char strand_char(Strand strand);

/**
 * Interface for a single annotation record, keyed by the column type of its
 * file format. Columns a record doesn't have produce false or an empty
 * vector rather than an error.
 */
template<typename ColumnKey>
class AnnotationRecord {
public:
    virtual ~AnnotationRecord() = default;

    /// The columns this record has values for, in file order.
    virtual vector<ColumnKey> columns() const = 0;

    /// The name of the sequence the record annotates.
    virtual const string& seq_id() const = 0;

    /// 0-based first base covered.
    virtual size_t start() const = 0;

    /// 0-based past-the-end base.
    virtual size_t end() const = 0;

    /// Get the record's score. Returns false if it doesn't have one.
    virtual bool score(double& score) const = 0;

    /// Get the first value in the given column, if there is one.
    virtual bool get_first(const ColumnKey& key, string& value) const = 0;

    /// Get all the values in the given column.
    virtual vector<string> get_all(const ColumnKey& key) const = 0;
};

/// Can records get by without a value in this column?
template<typename ColumnKey>
inline bool is_column_optional(const ColumnKey& key) {
    return key.is_optional();
}

/**
 * Column key for GFF3 records. The eight fixed columns are plain kinds; the
 * ninth column is broken out into one key per attribute name.
 */
struct Gff3Column {
    enum Kind {
        SeqId,
        Source,
        Type,
        Start,
        End,
        Score,
        Strand,
        Frame,
        Attribute
    };

    Kind kind = SeqId;
    /// Only set for Attribute keys
    string attribute;

    Gff3Column() = default;
    Gff3Column(Kind kind) : kind(kind) {}
    Gff3Column(const string& attribute) : kind(Attribute), attribute(attribute) {}

    /// The key holding the sequence name.
    static Gff3Column seq_id_column() {
        return Gff3Column(SeqId);
    }

    bool is_optional() const;

    /// Name of the column as a user would type it: the attribute name for
    /// attributes, and the lowercase field name otherwise.
    string to_string() const;

    bool operator==(const Gff3Column& other) const;
    bool operator!=(const Gff3Column& other) const;
    bool operator<(const Gff3Column& other) const;
};

ostream& operator<<(ostream& out, const Gff3Column& column);

/**
 * Column key for BED records. Index keys and header keys count fields from
 * the start of the line, so the first optional column is index 3.
 */
struct BedColumn {
    enum Kind {
        Chr,
        Start,
        End,
        Name,
        Index,
        Header
    };

    Kind kind = Chr;
    /// Field number, for Index and Header keys
    size_t index = 0;
    /// Name from the file's header line, for Header keys
    string name;

    BedColumn() = default;
    BedColumn(Kind kind) : kind(kind) {}
    BedColumn(size_t index) : kind(Index), index(index) {}
    BedColumn(size_t index, const string& name) : kind(Header), index(index), name(name) {}

    /// The key holding the sequence name.
    static BedColumn seq_id_column() {
        return BedColumn(Chr);
    }

    /// Get the field this key reads, counting from 0 at the chr field.
    size_t field_index() const;

    bool is_optional() const;

    string to_string() const;

    bool operator==(const BedColumn& other) const;
    bool operator!=(const BedColumn& other) const;
    bool operator<(const BedColumn& other) const;
};

ostream& operator<<(ostream& out, const BedColumn& column);

/**
 * All the records parsed out of one annotation file, along with the columns
 * that appear in them. Every record has a value for every mandatory column.
 */
template<typename Record, typename ColumnKey>
class AnnotationCollection {
public:
    AnnotationCollection() = default;
    AnnotationCollection(const string& file_name) : name(file_name) {}
    virtual ~AnnotationCollection() = default;

    const string& file_name() const {
        return name;
    }

    const vector<Record>& records() const {
        return record_list;
    }

    size_t size() const {
        return record_list.size();
    }

    bool empty() const {
        return record_list.empty();
    }

    const Record& operator[](size_t i) const {
        return record_list[i];
    }

    /// All the columns, mandatory ones first.
    const vector<ColumnKey>& all_columns() const {
        return column_keys;
    }

    vector<ColumnKey> mandatory_columns() const {
        vector<ColumnKey> mandatory;
        for (auto& key : column_keys) {
            if (!is_column_optional(key)) {
                mandatory.push_back(key);
            }
        }
        return mandatory;
    }

    /// Find a column by the name a user would type for it. Returns false if
    /// no column in the collection has that name.
    bool find_column(const string& column_name, ColumnKey& column) const {
        for (auto& key : column_keys) {
            if (key.to_string() == column_name) {
                column = key;
                return true;
            }
        }
        return false;
    }

    vector<ColumnKey> optional_columns() const {
        vector<ColumnKey> optional;
        for (auto& key : column_keys) {
            if (is_column_optional(key)) {
                optional.push_back(key);
            }
        }
        return optional;
    }

protected:
    string name;
    vector<Record> record_list;
    vector<ColumnKey> column_keys;
};

}

#endif
