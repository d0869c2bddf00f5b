#include "id_line.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <boost/regex.hpp>
#include <boost/algorithm/string/predicate.hpp>

using namespace std;

namespace
{
    const char* const id_prefix = "- id: L";
}

IdLine::IdLine()
{
    init();
}

IdLine::IdLine(const string& s)
{
    init();
    //line format:
    //- id: L<digits>[anything]
    //the prefix must start at column 0
    if (!boost::starts_with(s, id_prefix))
        return;
    interpret_suffix(s);
}

void IdLine::interpret_suffix(const string& s)
{
    static const boost::regex id_pattern("\\A- id: L([0-9]+)");
    boost::smatch result;
    if (!boost::regex_search(s, result, id_pattern))
        return;

    string digits = result[1];
    errno = 0;
    unsigned long long value = strtoull(digits.c_str(), NULL, 10);
    //the largest value has no successor
    if (errno == ERANGE || value >= numeric_limits<IdNum>::max())
        return;

    number = value;
    identifier = true;
}

bool IdLine::is_identifier() const
{
    return identifier;
}

IdNum IdLine::get_number() const
{
    return number;
}

void IdLine::init()
{
    number = 0;
    identifier = false;
}
