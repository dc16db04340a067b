#ifndef GFAESTUS_PATH_NAME_HPP_INCLUDED
#define GFAESTUS_PATH_NAME_HPP_INCLUDED

#include <string>
#include <cstdint>

/** \file
 * path_name.hpp: decode the coordinate range that pangenome path names often
 * carry, as in "grch38#chr1:100-250".
 *
 * All of these are total: on malformed input they return false and leave
 * their outputs alone.
 */

namespace gfaestus {

using namespace std;

/**
 * Parse a path name of the form name#seq_id:start-end. The seq_id is whatever
 * sits between the first '#' and the following ':'; start and end must be
 * unsigned decimal numbers and the end must run to the end of the name.
 */
bool path_name_chr_range(const string& path_name, string& seq_id, size_t& start, size_t& end);

/// Parse just the start-end range after the first ':' in the path name.
bool path_name_range(const string& path_name, size_t& start, size_t& end);

/// Get the start of the range encoded in the path name: the amount to subtract
/// from sequence coordinates to get positions along the path.
bool path_name_offset(const string& path_name, size_t& offset);

/// Parse a strictly unsigned decimal number that fills the whole string.
bool parse_unsigned(const string& text, size_t& value);

}

#endif
