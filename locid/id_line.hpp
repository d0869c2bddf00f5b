#ifndef LOCID_ID_LINE
#define LOCID_ID_LINE
#include <string>
#include "types.hpp"

using std::string;

/**
 * One line of a data file, classified as a location identifier line or not.
 */
class IdLine
{
    private:
        IdNum number;
        bool identifier;

    public:
        IdLine();
        IdLine(const string& s);
        bool is_identifier() const;
        IdNum get_number() const;

    private:
        void init();
        void interpret_suffix(const string& s);
};

#endif
