#include "annotations.hpp"

#include <tuple>

namespace gfaestus {

using namespace std;

bool parse_strand(const string& text, Strand& strand) {
    if (text == "+") {
        strand = Strand::Pos;
    } else if (text == "-") {
        strand = Strand::Neg;
    } else if (text == ".") {
        strand = Strand::None;
    } else {
        return false;
    }
    return true;
}

char strand_char(Strand strand) {
    switch (strand) {
    case Strand::Pos:
        return '+';
    case Strand::Neg:
        return '-';
    default:
        return '.';
    }
}

bool Gff3Column::is_optional() const {
    return !(kind == SeqId || kind == Start || kind == End);
}

string Gff3Column::to_string() const {
    switch (kind) {
    case SeqId:
        return "seq_id";
    case Source:
        return "source";
    case Type:
        return "type";
    case Start:
        return "start";
    case End:
        return "end";
    case Score:
        return "score";
    case Strand:
        return "strand";
    case Frame:
        return "frame";
    default:
        return attribute;
    }
}

bool Gff3Column::operator==(const Gff3Column& other) const {
    return kind == other.kind && attribute == other.attribute;
}

bool Gff3Column::operator!=(const Gff3Column& other) const {
    return !(*this == other);
}

bool Gff3Column::operator<(const Gff3Column& other) const {
    return tie(kind, attribute) < tie(other.kind, other.attribute);
}

ostream& operator<<(ostream& out, const Gff3Column& column) {
    return out << column.to_string();
}

size_t BedColumn::field_index() const {
    switch (kind) {
    case Chr:
        return 0;
    case Start:
        return 1;
    case End:
        return 2;
    case Name:
        return 3;
    default:
        return index;
    }
}

bool BedColumn::is_optional() const {
    return !(kind == Chr || kind == Start || kind == End);
}

string BedColumn::to_string() const {
    switch (kind) {
    case Chr:
        return "chr";
    case Start:
        return "start";
    case End:
        return "end";
    case Name:
        return "name";
    case Index:
        return std::to_string(index);
    default:
        return name;
    }
}

bool BedColumn::operator==(const BedColumn& other) const {
    return kind == other.kind && index == other.index && name == other.name;
}

bool BedColumn::operator!=(const BedColumn& other) const {
    return !(*this == other);
}

bool BedColumn::operator<(const BedColumn& other) const {
    return tie(kind, index, name) < tie(other.kind, other.index, other.name);
}

ostream& operator<<(ostream& out, const BedColumn& column) {
    return out << column.to_string();
}

}
