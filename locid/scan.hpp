#ifndef LOCID_SCAN
#define LOCID_SCAN
#include <boost/filesystem/path.hpp>
#include "types.hpp"

/**
 * Collect every "- id: L<digits>" line found in the files under base_dir.
 * A missing or empty directory gives an empty result, never an error.
 */
StrVec scan_identifier_lines(const boost::filesystem::path& base_dir);

/**
 * Find the largest identifier number among lines. Lines that are not
 * identifier lines are ignored. Returns false when none was found, in which
 * case max_id is left untouched.
 */
bool find_max_id(const StrVec& lines, IdNum& max_id);

#endif
