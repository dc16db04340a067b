#ifndef GFAESTUS_UTILITY_HPP_INCLUDED
#define GFAESTUS_UTILITY_HPP_INCLUDED

#include <string>
#include <vector>
#include <limits>
#include <functional>
#include <type_traits>
#include <iostream>
#include <typeinfo>
#include <omp.h>

namespace gfaestus {

using namespace std;

/// Return the number of threads that OMP will produce for a parallel section.
int get_thread_count(void);
/// Decide on and apply a sensible OMP thread count. Pay attention to
/// OMP_NUM_THREADS if set, the container quota in /proc, and the "hardware
/// concurrency".
void choose_good_thread_count();

// split a string on any character found in the string of delimiters (delims)
// if max_cuts specified, only split at the first <max_cuts> delimiter occurrences
std::vector<std::string>& split_delims(const std::string &s, const std::string& delims, std::vector<std::string> &elems,
                                       size_t max_cuts = numeric_limits<size_t>::max());
std::vector<std::string> split_delims(const std::string &s, const std::string& delims,
                                      size_t max_cuts = numeric_limits<size_t>::max());

/// Split a line of an annotation file into its columns. If the line has a tab
/// in it, it is split on every tab, and empty columns are kept. Otherwise it
/// is split on runs of spaces.
vector<string> split_columns(const string& line);

/// Join strings together with the given separator between them.
string join(const vector<string>& parts, const string& separator);

/// Check if a string starts with another string
bool starts_with(const std::string& value, const std::string& prefix);

/// Check if a string ends with another string
bool ends_with(const std::string& value, const std::string& suffix);

/// Parse out the name of an input file (i.e. the next positional argument), or
/// exit with an error. File name must be nonempty, but may be "-".
string get_input_file_name(int& optind, int argc, char** argv, bool test_open = true);

/// Get a callback with an istream& to an open file. Handles "-" as a filename as
/// indicating standard input. The reference passed is guaranteed to be valid
/// only until the callback returns.
void get_input_file(const string& file_name, function<void(istream&)> callback);

/// Split off the extension from a filename and return both parts.
pair<string, string> split_ext(const string& filename);

/// Get the file name without any leading directories.
string file_name_only(const string& filename);

/// Parse a command-line argument string. Exits with an error if the string
/// does not contain exactly an item of the appropriate type.
template<typename Result>
Result parse(const string& arg);

/// Parse a command-line argument C string. Exits with an error if the string
/// does not contain exactly an item of the appropriate type.
template<typename Result>
Result parse(const char* arg);

/// Parse the appropriate type from the string to the destination value.
/// Return true if parsing is successful and false (or throw something) otherwise.
template<typename Result>
bool parse(const string& arg, Result& dest);

// Do one generic implementation for signed integers that fit in a long long.
// Cram the constraint into the type of the output parameter.
template<typename Result>
bool parse(const string& arg, typename enable_if<sizeof(Result) <= sizeof(long long) &&
    is_integral<Result>::value &&
    is_signed<Result>::value, Result>::type& dest) {

    // This will hold the next character after the number parsed
    size_t after;
    long long buffer = std::stoll(arg, &after);
    if (buffer > numeric_limits<Result>::max() || buffer < numeric_limits<Result>::min()) {
        // Out of range
        return false;
    }
    dest = (Result) buffer;
    return(after == arg.size());
}

// Do another generic implementation for unsigned integers
template<typename Result>
bool parse(const string& arg, typename enable_if<sizeof(Result) <= sizeof(unsigned long long) &&
    is_integral<Result>::value &&
    !is_signed<Result>::value, Result>::type& dest) {

    if (!arg.empty() && arg[0] == '-') {
        // stoull would happily wrap this around
        return false;
    }
    // This will hold the next character after the number parsed
    size_t after;
    unsigned long long buffer = std::stoull(arg, &after);
    if (buffer > numeric_limits<Result>::max()) {
        // Out of range
        return false;
    }
    dest = (Result) buffer;
    return(after == arg.size());
}

// We also have implementations for floating point (defined in the cpp)
template<>
bool parse(const string& arg, double& dest);

template<>
bool parse(const string& arg, float& dest);

// Implement the first version in terms of the second, for any type
template<typename Result>
Result parse(const string& arg) {
    Result to_return;
    bool success;
    try {
        success = parse<Result>(arg, to_return);
    } catch(exception& e) {
        success = false;
    }
    if (success) {
        // Parsing worked
        return to_return;
    } else {
        // Parsing failed
        cerr << "error: could not parse " << typeid(to_return).name() << " from argument \"" << arg << "\"" << endl;
        exit(1);
    }
}

// Implement the C string version in terms of that
template<typename Result>
Result parse(const char* arg) {
    return parse<Result>(string(arg));
}

}

#endif
