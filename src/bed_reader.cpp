#include "bed_reader.hpp"
#include "path_name.hpp"
#include "utility.hpp"
#include "log.hpp"

#include <fstream>
#include <algorithm>

//#define debug

namespace gfaestus {

using namespace std;

static const Logger logger("bed");

bool BedRecord::from_fields(const vector<string>& fields, BedRecord& record) {
    if (fields.size() < 3 || fields[0].empty()) {
        return false;
    }
    size_t start;
    size_t end;
    if (!parse_unsigned(fields[1], start) || !parse_unsigned(fields[2], end) || start > end) {
        return false;
    }
    record.chr = fields[0];
    record.start_pos = start;
    record.end_pos = end;
    record.rest.assign(fields.begin() + 3, fields.end());
    return true;
}

vector<BedColumn> BedRecord::columns() const {
    vector<BedColumn> columns{BedColumn::Chr, BedColumn::Start, BedColumn::End};
    for (size_t i = 0; i < rest.size(); i++) {
        columns.emplace_back(i + 3);
    }
    return columns;
}

const string& BedRecord::seq_id() const {
    return chr;
}

size_t BedRecord::start() const {
    return start_pos;
}

size_t BedRecord::end() const {
    return end_pos;
}

bool BedRecord::score(double& score) const {
    if (rest.size() < 2) {
        return false;
    }
    try {
        return parse<double>(rest[1], score);
    } catch (exception& e) {
        // Not a number, so no score
        return false;
    }
}

bool BedRecord::get_first(const BedColumn& key, string& value) const {
    switch (key.kind) {
    case BedColumn::Chr:
        value = chr;
        return true;
    case BedColumn::Start:
        value = to_string(start_pos);
        return true;
    case BedColumn::End:
        value = to_string(end_pos);
        return true;
    default:
        {
            size_t field = key.field_index();
            if (field < 3 || field - 3 >= rest.size()) {
                return false;
            }
            value = rest[field - 3];
            return true;
        }
    }
}

vector<string> BedRecord::get_all(const BedColumn& key) const {
    vector<string> values;
    string value;
    if (get_first(key, value)) {
        values.push_back(value);
    }
    return values;
}

size_t BedRecord::extra_field_count() const {
    return rest.size();
}

BedReader::BedReader(istream& in) : in(in) {

}

size_t BedReader::for_each_bed_record(const function<void(const BedRecord&)>& lambda) {
    return for_each_bed_record(lambda, [](const string& comment, size_t line_number) {
        // Nothing to do
    });
}

size_t BedReader::for_each_bed_record(const function<void(const BedRecord&)>& lambda,
                                      const function<void(const string&, size_t)>& comment_lambda) {
    string line;
    size_t line_number = 0;
    size_t skipped = 0;
    while (getline(in, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == string::npos) {
            continue;
        }
        if (line[0] == '#') {
            comment_lambda(line, line_number);
            continue;
        }
        if (starts_with(line, "track") || starts_with(line, "browser")) {
            continue;
        }

        BedRecord record;
        if (!BedRecord::from_fields(split_columns(line), record)) {
#ifdef debug
            cerr << "Skipping unparseable BED line " << line_number << ": " << line << endl;
#endif
            skipped++;
            continue;
        }
        lambda(record);
    }
    return skipped;
}

BedRecords::BedRecords(const string& file_name) : AnnotationCollection<BedRecord, BedColumn>(file_name) {
    // Nothing to do
}

BedRecords BedRecords::parse(istream& in, const string& file_name) {
    BedRecords parsed(file_name);

    size_t max_extra_fields = 0;
    BedReader reader(in);
    parsed.skipped = reader.for_each_bed_record([&](const BedRecord& record) {
        max_extra_fields = max(max_extra_fields, record.extra_field_count());
        parsed.record_list.push_back(record);
    }, [&](const string& comment, size_t line_number) {
        if (line_number == 1) {
            // A comment on the first line names the columns
            for (auto& field : split_columns(comment.substr(1))) {
                size_t first = field.find_first_not_of(" ");
                size_t last = field.find_last_not_of(" ");
                parsed.header_names.push_back(first == string::npos ? "" : field.substr(first, last - first + 1));
            }
        }
    });

    parsed.column_keys = {BedColumn::Chr, BedColumn::Start, BedColumn::End};
    if (parsed.header_names.empty()) {
        for (size_t i = 0; i < max_extra_fields; i++) {
            parsed.column_keys.emplace_back(i + 3);
        }
    } else {
        for (size_t i = 3; i < parsed.header_names.size(); i++) {
            parsed.column_keys.emplace_back(i, parsed.header_names[i]);
        }
    }

    if (parsed.skipped > 0) {
        logger.warn() << "skipped " << parsed.skipped << " unparseable lines in " << file_name << endl;
    }
    logger.info() << "read " << parsed.size() << " records from " << file_name << endl;

    return parsed;
}

BedRecords BedRecords::parse_file(const string& path) {
    ifstream in(path);
    if (!in.is_open()) {
        throw runtime_error("could not open BED file \"" + path + "\"");
    }
    return parse(in, file_name_only(path));
}

bool BedRecords::has_headers() const {
    return !header_names.empty();
}

const vector<string>& BedRecords::headers() const {
    return header_names;
}

bool BedRecords::header_to_column(const string& header, BedColumn& column) const {
    for (size_t i = 0; i < header_names.size(); i++) {
        if (header_names[i] != header) {
            continue;
        }
        switch (i) {
        case 0:
            column = BedColumn(BedColumn::Chr);
            break;
        case 1:
            column = BedColumn(BedColumn::Start);
            break;
        case 2:
            column = BedColumn(BedColumn::End);
            break;
        default:
            column = BedColumn(i, header);
            break;
        }
        return true;
    }
    return false;
}

size_t BedRecords::skipped_lines() const {
    return skipped;
}

}
