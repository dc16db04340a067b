#include "utility.hpp"
#include "log.hpp"

#include <fstream>
#include <thread>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <algorithm>
#include <sched.h>
#include <unistd.h>

namespace gfaestus {

using namespace std;

int get_thread_count(void) {
    int thread_count = 1;
#pragma omp parallel
    {
#pragma omp master
        thread_count = omp_get_num_threads();
    }
    return thread_count;
}

void choose_good_thread_count() {
    // If we leave this at 0, we won't apply any thread count and leave whatever OMP defaults to.
    int count = 0;

    if (count == 0) {
        // First priority: OMP_NUM_THREADS
        const char* value = getenv("OMP_NUM_THREADS");
        if (value && *value != '\0') {
            bool parsed;
            try {
                parsed = parse<int>(string(value), count);
            } catch (exception& e) {
                parsed = false;
            }
            if (!parsed || count < 0) {
                logging::warn("gfaestus") << "ignoring unparseable OMP_NUM_THREADS value \"" << value << "\"" << endl;
                count = 0;
            }
        }
    }

    if (count == 0) {
        // Next priority: /sys/fs/cgroup/cpu/cpu.cfs_quota_us over /sys/fs/cgroup/cpu/cpu.cfs_period_us
        ifstream quota_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
        ifstream period_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");

        if (quota_file && period_file) {
            // Read the period and quota
            int64_t quota;
            quota_file >> quota;
            int64_t period;
            period_file >> period;

            if (quota >= 0 && period != 0) {
                // Compute how many threads we may use.
                // May come out to 0, in which case it is ignored.
                count = (int) ceil(quota / (double) period);
            }
        }
    }

#if !defined(__APPLE__) && defined(_GNU_SOURCE)
    if (count == 0) {
        // Next priority: CPU affinity mask
        cpu_set_t mask;
        if (sched_getaffinity(getpid(), sizeof(cpu_set_t), &mask)) {
            auto problem = errno;
            logging::warn("gfaestus") << "cannot determine CPU count from affinity mask: " << strerror(problem) << endl;
        } else {
            count = CPU_COUNT(&mask);
        }
    }
#endif

    if (count == 0) {
        // Next priority: hardware concurrency as reported by the STL.
        // This may itself be 0 if ungettable.
        count = std::thread::hardware_concurrency();
    }

    if (count != 0) {
        omp_set_num_threads(count);
    }
}

std::vector<std::string> &split_delims(const std::string &s, const std::string& delims, std::vector<std::string> &elems, size_t max_cuts) {
    size_t start = string::npos;
    size_t cuts = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (delims.find(s[i]) != string::npos && cuts < max_cuts) {
            if (start != string::npos && i > start) {
                elems.push_back(s.substr(start, i - start));
            }
            start = string::npos;
            ++cuts;
        } else if (start == string::npos) {
            start = i;
        }
    }
    if (start != string::npos && start < s.size()) {
        elems.push_back(s.substr(start, s.size() - start));
    }
    return elems;
}

std::vector<std::string> split_delims(const std::string &s, const std::string& delims, size_t max_cuts) {
    std::vector<std::string> elems;
    return split_delims(s, delims, elems, max_cuts);
}

vector<string> split_columns(const string& line) {
    vector<string> columns;
    if (line.find('\t') == string::npos) {
        // Whitespace-separated; runs of spaces count as one separator
        return split_delims(line, " ", columns);
    }
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == string::npos) {
            columns.push_back(line.substr(start));
            break;
        }
        columns.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return columns;
}

string join(const vector<string>& parts, const string& separator) {
    string joined;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    if (value.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), value.begin());
}

bool ends_with(const std::string& value, const std::string& suffix) {
    if (value.size() < suffix.size()) {
        return false;
    }
    return std::equal(suffix.rbegin(), suffix.rend(), value.rbegin());
}

/// Determine if a file can be opened for reading.
static bool file_exists(const string& filename) {
    if (filename == "-") {
        // Standard input is always open
        return true;
    }
    ifstream in(filename);
    return in.is_open();
}

string get_input_file_name(int& optind, int argc, char** argv, bool test_open) {

    if (optind >= argc) {
        // Complain that the user didn't specify a filename
        logging::error("get_input_file_name") << "specify input filename, or \"-\" for standard input" << endl;
    }

    string file_name(argv[optind++]);

    if (file_name.empty()) {
        logging::error("get_input_file_name") << "specify a non-empty input filename" << endl;
    }

    if (test_open && !file_exists(file_name)) {
        logging::error("get_input_file_name") << "file \"" << file_name << "\" does not exist" << endl;
    }

    return file_name;

}

void get_input_file(const string& file_name, function<void(istream&)> callback) {

    if (file_name == "-") {
        // Just use standard input
        callback(std::cin);
    } else {
        // Open a file
        ifstream in;
        in.open(file_name.c_str());
        if (!in.is_open()) {
            // The user gave us a bad filename
            logging::error("get_input_file") << "could not open file \"" << file_name << "\"" << endl;
        }
        callback(in);
    }
}

pair<string, string> split_ext(const string& filename) {
    pair<string, string> parts;

    size_t dot = filename.rfind('.');

    if (dot == string::npos) {
        // Put it all in the first part
        parts.first = filename;
    } else {
        // Split on either side of the dot.
        parts.first = filename.substr(0, dot);
        parts.second = filename.substr(dot + 1);
    }

    return parts;
}

string file_name_only(const string& filename) {
    size_t slash = filename.rfind('/');
    if (slash == string::npos) {
        return filename;
    }
    return filename.substr(slash + 1);
}

template<>
bool parse(const string& arg, double& dest) {
    size_t after;
    dest = std::stod(arg, &after);
    return(after == arg.size());
}

template<>
bool parse(const string& arg, float& dest) {
    size_t after;
    dest = std::stof(arg, &after);
    return(after == arg.size());
}

}
