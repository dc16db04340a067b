#ifndef GFAESTUS_ANNOTATION_FILTER_HPP_INCLUDED
#define GFAESTUS_ANNOTATION_FILTER_HPP_INCLUDED

/** \file
 * annotation_filter.hpp: predicates for picking out annotation records by the
 * values in their columns.
 */

#include <string>
#include <vector>
#include <map>
#include <set>
#include <exception>

#include "annotations.hpp"
#include "utility.hpp"

namespace gfaestus {

using namespace std;

enum class StringOp {
    None,
    Equal,
    Contains,
    ContainedIn,
    NotContained
};

enum class NumOp {
    None,
    LT,
    LE,
    EQ,
    GE,
    GT,
    InRange
};

/**
 * A test on a string value. None lets everything through. NotContained
 * passes values that don't have the argument in them.
 */
struct FilterString {
    StringOp op = StringOp::None;
    string arg;

    FilterString() = default;
    FilterString(StringOp op, const string& arg) : op(op), arg(arg) {}

    bool matches(const string& value) const;
};

/**
 * A test on a number. InRange includes both ends.
 */
template<typename T>
struct FilterNum {
    NumOp op = NumOp::None;
    T arg1 = T();
    T arg2 = T();

    FilterNum() = default;
    FilterNum(NumOp op, T arg1, T arg2 = T()) : op(op), arg1(arg1), arg2(arg2) {}

    bool matches(const T& value) const;

    /// Make a filter from user-entered arguments. If the arguments the
    /// operation needs don't parse, the filter lets everything through.
    static FilterNum<T> from_strings(NumOp op, const string& arg1, const string& arg2 = "");
};

/**
 * One string test applied to a chosen set of columns. A record passes if any
 * value in any of the columns passes. With no columns chosen, or no test, it
 * lets everything through.
 */
template<typename ColumnKey>
struct QuickFilter {
    FilterString filter;
    set<ColumnKey> columns;

    QuickFilter() = default;
    QuickFilter(const FilterString& filter, const set<ColumnKey>& columns) : filter(filter), columns(columns) {}

    bool matches(const AnnotationRecord<ColumnKey>& record) const;
};

/**
 * Everything a record has to pass to be shown: a string test per column, tests
 * on the coordinates and score, and a QuickFilter. All of them have to pass.
 */
template<typename ColumnKey>
class RecordFilter {
public:
    RecordFilter() = default;

    /// Replace the test on a column. A None test removes it.
    void set_column_filter(const ColumnKey& column, const FilterString& filter);

    /// Get the test on a column. False if there isn't one.
    bool get_column_filter(const ColumnKey& column, FilterString& filter) const;

    /// Only pass records on the given sequence that lie within [start, end].
    void set_range(const string& seq_id, size_t start, size_t end);

    /// Go back to passing everything.
    void clear();

    bool matches(const AnnotationRecord<ColumnKey>& record) const;

    FilterNum<size_t> start_filter;
    FilterNum<size_t> end_filter;
    /// A record without a score fails this unless it lets everything through.
    FilterNum<double> score_filter;
    QuickFilter<ColumnKey> quick_filter;

private:
    map<ColumnKey, FilterString> column_filters;
};

/// Get the indexes of all the records in the collection that pass the filter,
/// in order.
template<typename Collection, typename ColumnKey>
vector<size_t> filter_records(const Collection& collection, const RecordFilter<ColumnKey>& filter) {
    vector<size_t> passing;
    auto& records = collection.records();
    for (size_t i = 0; i < records.size(); i++) {
        if (filter.matches(records[i])) {
            passing.push_back(i);
        }
    }
    return passing;
}

template<typename T>
bool FilterNum<T>::matches(const T& value) const {
    switch (op) {
    case NumOp::LT:
        return value < arg1;
    case NumOp::LE:
        return value <= arg1;
    case NumOp::EQ:
        return value == arg1;
    case NumOp::GE:
        return value >= arg1;
    case NumOp::GT:
        return value > arg1;
    case NumOp::InRange:
        return arg1 <= value && value <= arg2;
    default:
        return true;
    }
}

template<typename T>
FilterNum<T> FilterNum<T>::from_strings(NumOp op, const string& arg1, const string& arg2) {
    FilterNum<T> filter;
    if (op == NumOp::None) {
        return filter;
    }
    try {
        if (!parse<T>(arg1, filter.arg1)) {
            return FilterNum<T>();
        }
        if (op == NumOp::InRange && !parse<T>(arg2, filter.arg2)) {
            return FilterNum<T>();
        }
    } catch (exception& e) {
        // Couldn't parse at all
        return FilterNum<T>();
    }
    filter.op = op;
    return filter;
}

template<typename ColumnKey>
bool QuickFilter<ColumnKey>::matches(const AnnotationRecord<ColumnKey>& record) const {
    if (filter.op == StringOp::None || columns.empty()) {
        return true;
    }
    for (auto& column : columns) {
        for (auto& value : record.get_all(column)) {
            if (filter.matches(value)) {
                return true;
            }
        }
    }
    return false;
}

template<typename ColumnKey>
void RecordFilter<ColumnKey>::set_column_filter(const ColumnKey& column, const FilterString& filter) {
    if (filter.op == StringOp::None) {
        column_filters.erase(column);
    } else {
        column_filters[column] = filter;
    }
}

template<typename ColumnKey>
bool RecordFilter<ColumnKey>::get_column_filter(const ColumnKey& column, FilterString& filter) const {
    auto found = column_filters.find(column);
    if (found == column_filters.end()) {
        return false;
    }
    filter = found->second;
    return true;
}

template<typename ColumnKey>
void RecordFilter<ColumnKey>::set_range(const string& seq_id, size_t start, size_t end) {
    set_column_filter(ColumnKey::seq_id_column(), FilterString(StringOp::Equal, seq_id));
    start_filter = FilterNum<size_t>(NumOp::GE, start);
    end_filter = FilterNum<size_t>(NumOp::LE, end);
}

template<typename ColumnKey>
void RecordFilter<ColumnKey>::clear() {
    column_filters.clear();
    start_filter = FilterNum<size_t>();
    end_filter = FilterNum<size_t>();
    score_filter = FilterNum<double>();
    quick_filter = QuickFilter<ColumnKey>();
}

template<typename ColumnKey>
bool RecordFilter<ColumnKey>::matches(const AnnotationRecord<ColumnKey>& record) const {
    if (!quick_filter.matches(record)) {
        return false;
    }
    if (!start_filter.matches(record.start()) || !end_filter.matches(record.end())) {
        return false;
    }
    if (score_filter.op != NumOp::None) {
        double score;
        if (!record.score(score) || !score_filter.matches(score)) {
            return false;
        }
    }
    for (auto& column_filter : column_filters) {
        bool any_match = false;
        for (auto& value : record.get_all(column_filter.first)) {
            if (column_filter.second.matches(value)) {
                any_match = true;
                break;
            }
        }
        if (!any_match) {
            // Includes not having the column at all
            return false;
        }
    }
    return true;
}

}

#endif
