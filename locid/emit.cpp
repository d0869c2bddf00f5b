#include "emit.hpp"
#include "scan.hpp"
#include "log.hpp"
#include <sstream>

using namespace std;

string format_id(IdNum n)
{
    stringstream sstr;
    sstr << "L" << n;
    return sstr.str();
}

void emit_next_id(bool found, IdNum max_id, ostream& out, ostream& diag)
{
    if (!found)
    {
        diag << "No IDs found, starting with " << format_id(1) << endl;
        out << format_id(1) << endl;
        return;
    }
    out << format_id(max_id + 1) << endl;
}

void next_id(const boost::filesystem::path& base_dir, ostream& out, ostream& diag)
{
    StrVec lines = scan_identifier_lines(base_dir);
    IdNum max_id = 0;
    bool found = find_max_id(lines, max_id);
    if (found)
        Log::debug() << "Highest identifier is " << format_id(max_id) << endl;
    emit_next_id(found, max_id, out, diag);
}
