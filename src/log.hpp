#ifndef GFAESTUS_LOG_HPP_INCLUDED
#define GFAESTUS_LOG_HPP_INCLUDED

#include <string>
#include <iostream>
#include <cstdlib>

/** \file
 * log.hpp: defines a basic logging system for gfaestus.
 *
 * There are three options here:
 * - info(): prefix the message with a context string. Used for progress
 *   messages, e.g. when an index finishes building.
 * - warn(): emit a warning message with a given context
 * - error(): emit an error message with a given context, then exit
 *
 * Errors/warnings are output to std::cerr as:
 * error[<context>]: message
 * warning[<context>]: message
 * where "context" is a string like "gfaestus annotate"
 *
 * These functions return a cerrWrapper object that behaves like a stream.
 * You can stream things to it with operator<<, and when the object goes out
 * of scope, it will exit the program with a failure code (in the case of
 * error) or do nothing (in the case of warn() and info()).
 *
 * Library code should only use info() and warn(); error() is for the
 * subcommands, where exiting is the right thing to do.
 */

namespace gfaestus {

class cerrWrapper {
private:
    bool exit_on_destruct;
    // Swallow everything streamed to us?
    bool silent;

public:
    cerrWrapper(const std::string& prefix, bool exit_on_destruct, bool silent = false) :
        exit_on_destruct(exit_on_destruct), silent(silent) {
        if (!silent) {
            std::cerr << prefix;
        }
    }

    template <typename T>
    cerrWrapper& operator<<(const T& t) {
        if (!silent) {
            std::cerr << t;
        }
        return *this;
    }

    cerrWrapper& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (!silent) {
            std::cerr << manip;
        }
        return *this;
    }

    ~cerrWrapper() {
        if (exit_on_destruct) {
            std::cerr << std::flush;
            exit(EXIT_FAILURE);
        }
    }
};

namespace logging {

/// Log to cerr with a standard format
/// "context" is caller context, e.g. "gfaestus stats"
cerrWrapper info(const std::string& context);
/// Emit a warning with a standard format
cerrWrapper warn(const std::string& context);
/// Error with a standard format
/// Once the cerrWrapper goes out of scope,
/// the program will exit with an error code.
cerrWrapper error(const std::string& context);

/// Turn info() messages off (or back on). Warnings and errors always print.
void set_quiet(bool quiet);

}

/// Class to set up at the start of a file
/// when you want to generate a bunch of loggers
class Logger {
private:
    std::string context;

public:
    Logger(const std::string& context) : context(context) {}

    inline cerrWrapper info() const {
        return logging::info(context);
    }
    inline cerrWrapper warn() const {
        return logging::warn(context);
    }
    inline cerrWrapper error() const {
        return logging::error(context);
    }
};

}

#endif
