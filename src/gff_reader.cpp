#include "gff_reader.hpp"
#include "path_name.hpp"
#include "utility.hpp"
#include "log.hpp"

#include <fstream>
#include <sstream>

//#define debug

namespace gfaestus {

using namespace std;

static const Logger logger("gff");

GFFParseError::GFFParseError(size_t line_number, const string& message) :
    runtime_error("GFF3 line " + to_string(line_number) + ": " + message), line(line_number) {
    // Nothing to do
}

size_t GFFParseError::line_number() const {
    return line;
}

GFFRecord GFFRecord::from_fields(const vector<string>& fields, size_t line_number) {

    if (fields.size() != 9) {
        throw GFFParseError(line_number, "expected 9 fields but found " + to_string(fields.size()));
    }

    GFFRecord record;
    record.sequence_id = fields[0];
    if (record.sequence_id.empty()) {
        throw GFFParseError(line_number, "empty sequence ID");
    }
    record.source_text = fields[1];
    record.type_text = fields[2];

    // parse the coordinates, going from 1-based inclusive to 0-based half-open
    size_t file_start;
    size_t file_end;
    if (!parse_unsigned(fields[3], file_start) || file_start == 0) {
        throw GFFParseError(line_number, "bad start coordinate \"" + fields[3] + "\"");
    }
    if (!parse_unsigned(fields[4], file_end)) {
        throw GFFParseError(line_number, "bad end coordinate \"" + fields[4] + "\"");
    }
    record.start_pos = file_start - 1;
    record.end_pos = file_end;
    if (record.start_pos > record.end_pos) {
        throw GFFParseError(line_number, "start " + fields[3] + " is after end " + fields[4]);
    }

    // parse score
    record.score_text = fields[5];
    if (fields[5] != ".") {
        bool parsed;
        try {
            parsed = parse<double>(fields[5], record.score_value);
        } catch (exception& e) {
            parsed = false;
        }
        if (!parsed) {
            throw GFFParseError(line_number, "bad score \"" + fields[5] + "\"");
        }
        record.has_score = true;
    }

    // parse strand
    if (!parse_strand(fields[6], record.strand_value)) {
        throw GFFParseError(line_number, "bad strand \"" + fields[6] + "\"");
    }

    // parse phase
    if (fields[7] != "." && fields[7] != "0" && fields[7] != "1" && fields[7] != "2") {
        throw GFFParseError(line_number, "bad phase \"" + fields[7] + "\"");
    }
    record.frame_text = fields[7];

    // parse attributes
    if (fields[8] != ".") {
        for (auto& attribute : split_delims(fields[8], ";")) {
            size_t equals = attribute.find('=');
            if (equals == string::npos || equals == 0) {
                throw GFFParseError(line_number, "bad attribute \"" + attribute + "\"");
            }
            string key = attribute.substr(0, equals);
            string value = attribute.substr(equals + 1);

            auto found = record.attributes.begin();
            while (found != record.attributes.end() && found->first != key) {
                ++found;
            }
            if (found == record.attributes.end()) {
                record.attributes.emplace_back(key, vector<string>());
                found = record.attributes.end() - 1;
            }
            found->second.push_back(value);
        }
    }

    return record;
}

vector<Gff3Column> GFFRecord::columns() const {
    vector<Gff3Column> columns{Gff3Column::SeqId, Gff3Column::Source, Gff3Column::Type,
                               Gff3Column::Start, Gff3Column::End};
    if (has_score) {
        columns.emplace_back(Gff3Column::Score);
    }
    columns.emplace_back(Gff3Column::Strand);
    columns.emplace_back(Gff3Column::Frame);
    for (auto& attribute : attributes) {
        columns.emplace_back(attribute.first);
    }
    return columns;
}

const string& GFFRecord::seq_id() const {
    return sequence_id;
}

size_t GFFRecord::start() const {
    return start_pos;
}

size_t GFFRecord::end() const {
    return end_pos;
}

bool GFFRecord::score(double& score) const {
    if (!has_score) {
        return false;
    }
    score = score_value;
    return true;
}

const string& GFFRecord::source() const {
    return source_text;
}

const string& GFFRecord::type() const {
    return type_text;
}

Strand GFFRecord::strand() const {
    return strand_value;
}

const string& GFFRecord::frame() const {
    return frame_text;
}

bool GFFRecord::get_first(const Gff3Column& key, string& value) const {
    switch (key.kind) {
    case Gff3Column::SeqId:
        value = sequence_id;
        return true;
    case Gff3Column::Source:
        value = source_text;
        return true;
    case Gff3Column::Type:
        value = type_text;
        return true;
    case Gff3Column::Start:
        value = to_string(start_pos + 1);
        return true;
    case Gff3Column::End:
        value = to_string(end_pos);
        return true;
    case Gff3Column::Score:
        if (!has_score) {
            return false;
        }
        value = score_text;
        return true;
    case Gff3Column::Strand:
        value = string(1, strand_char(strand_value));
        return true;
    case Gff3Column::Frame:
        value = frame_text;
        return true;
    default:
        for (auto& attribute : attributes) {
            if (attribute.first == key.attribute) {
                value = attribute.second.front();
                return true;
            }
        }
        return false;
    }
}

vector<string> GFFRecord::get_all(const Gff3Column& key) const {
    if (key.kind == Gff3Column::Attribute) {
        for (auto& attribute : attributes) {
            if (attribute.first == key.attribute) {
                return attribute.second;
            }
        }
        return vector<string>();
    }
    vector<string> values;
    string value;
    if (get_first(key, value)) {
        values.push_back(value);
    }
    return values;
}

vector<string> GFFRecord::attribute_keys() const {
    vector<string> keys;
    for (auto& attribute : attributes) {
        keys.push_back(attribute.first);
    }
    return keys;
}

string GFFRecord::to_line() const {
    stringstream line;
    line << sequence_id << '\t' << source_text << '\t' << type_text << '\t'
         << (start_pos + 1) << '\t' << end_pos << '\t' << score_text << '\t'
         << strand_char(strand_value) << '\t' << frame_text << '\t';
    if (attributes.empty()) {
        line << '.';
    } else {
        bool first = true;
        for (auto& attribute : attributes) {
            for (auto& value : attribute.second) {
                if (!first) {
                    line << ';';
                }
                line << attribute.first << '=' << value;
                first = false;
            }
        }
    }
    return line.str();
}

GFFReader::GFFReader(istream& in) : in(in) {

}

void GFFReader::for_each_gff_record(const function<void(const GFFRecord&)>& lambda) {

    string line;
    size_t line_number = 0;
    while (getline(in, line)) {
        line_number++;
        if (in.eof()) {
            // There was no newline after this line, so it may have been cut off.
#ifdef debug
            cerr << "Discarding unterminated line " << line_number << endl;
#endif
            break;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // skip header lines and blank lines
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.find_first_not_of(" \t") == string::npos) {
            continue;
        }

        // execute the iteratee
        lambda(GFFRecord::from_fields(split_columns(line), line_number));
    }
}

Gff3Records::Gff3Records(const string& file_name) : AnnotationCollection<GFFRecord, Gff3Column>(file_name) {
    // Nothing to do
}

Gff3Records Gff3Records::parse(istream& in, const string& file_name) {
    Gff3Records parsed(file_name);

    GFFReader reader(in);
    reader.for_each_gff_record([&](const GFFRecord& record) {
        for (auto& key : record.attribute_keys()) {
            parsed.attribute_names.insert(key);
        }
        parsed.record_list.push_back(record);
    });

    parsed.column_keys = {Gff3Column::SeqId, Gff3Column::Start, Gff3Column::End,
                          Gff3Column::Source, Gff3Column::Type, Gff3Column::Score,
                          Gff3Column::Strand, Gff3Column::Frame};
    for (auto& key : parsed.attribute_names) {
        parsed.column_keys.emplace_back(key);
    }

    logger.info() << "read " << parsed.size() << " records from " << file_name << endl;

    return parsed;
}

Gff3Records Gff3Records::parse_file(const string& path) {
    ifstream in(path);
    if (!in.is_open()) {
        throw runtime_error("could not open GFF3 file \"" + path + "\"");
    }
    return parse(in, file_name_only(path));
}

const set<string>& Gff3Records::attribute_keys() const {
    return attribute_names;
}

}
