#ifndef LOCID_TYPES
#define LOCID_TYPES
#include <cstdint>
#include <vector>
#include <string>

/** Numeric part of an L<N> location identifier */
typedef std::uint64_t IdNum;
typedef std::vector<std::string> StrVec;

#endif
