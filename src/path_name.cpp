#include "path_name.hpp"

#include <limits>

namespace gfaestus {

using namespace std;

bool parse_unsigned(const string& text, size_t& value) {
    if (text.empty()) {
        return false;
    }
    size_t parsed = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        size_t digit = c - '0';
        if (parsed > (numeric_limits<size_t>::max() - digit) / 10) {
            // Would overflow
            return false;
        }
        parsed = parsed * 10 + digit;
    }
    value = parsed;
    return true;
}

/// Parse "start-end" out of the given substring of a path name.
static bool parse_range_part(const string& range_text, size_t& start, size_t& end) {
    size_t dash = range_text.find('-');
    if (dash == string::npos) {
        return false;
    }
    size_t parsed_start;
    size_t parsed_end;
    if (!parse_unsigned(range_text.substr(0, dash), parsed_start) ||
        !parse_unsigned(range_text.substr(dash + 1), parsed_end)) {
        return false;
    }
    start = parsed_start;
    end = parsed_end;
    return true;
}

bool path_name_chr_range(const string& path_name, string& seq_id, size_t& start, size_t& end) {
    size_t hash = path_name.find('#');
    if (hash == string::npos || hash + 1 >= path_name.size()) {
        // No '#' or nothing after it
        return false;
    }
    size_t colon = path_name.find(':', hash + 1);
    if (colon == string::npos) {
        return false;
    }

    size_t parsed_start;
    size_t parsed_end;
    if (!parse_range_part(path_name.substr(colon + 1), parsed_start, parsed_end)) {
        return false;
    }

    seq_id = path_name.substr(hash + 1, colon - hash - 1);
    start = parsed_start;
    end = parsed_end;
    return true;
}

bool path_name_range(const string& path_name, size_t& start, size_t& end) {
    size_t colon = path_name.find(':');
    if (colon == string::npos) {
        return false;
    }
    return parse_range_part(path_name.substr(colon + 1), start, end);
}

bool path_name_offset(const string& path_name, size_t& offset) {
    size_t start;
    size_t end;
    if (!path_name_range(path_name, start, end)) {
        return false;
    }
    offset = start;
    return true;
}

}
