#ifndef LOCID_EMIT
#define LOCID_EMIT
#include <ostream>
#include <string>
#include <boost/filesystem/path.hpp>
#include "types.hpp"

std::string format_id(IdNum n);

/**
 * Print the identifier that follows max_id to out. When nothing was found,
 * say so on diag first and print L1.
 */
void emit_next_id(bool found, IdNum max_id, std::ostream& out, std::ostream& diag);

/** Scan base_dir and print its next free identifier. */
void next_id(const boost::filesystem::path& base_dir, std::ostream& out, std::ostream& diag);

#endif
