#include "scan.hpp"
#include "corpus_stream.hpp"
#include "id_line.hpp"
#include "log.hpp"

using namespace std;

StrVec scan_identifier_lines(const boost::filesystem::path& base_dir)
{
    StrVec matches;
    CorpusStream corpus(base_dir);
    string s;
    while (corpus.feedline(s))
    {
        IdLine oneline(s);
        if (oneline.is_identifier())
            matches.push_back(s);
    }
    Log::info() << "Found " << matches.size() << " identifier lines in "
        << corpus.file_count() - corpus.skipped_count() << " files ("
        << corpus.skipped_count() << " skipped)" << endl;
    return matches;
}

bool find_max_id(const StrVec& lines, IdNum& max_id)
{
    bool found = false;
    IdNum cur_max = 0;
    for (auto it = lines.begin(); it != lines.end(); it++)
    {
        IdLine oneline(*it);
        if (!oneline.is_identifier())
            continue;
        if (!found || oneline.get_number() > cur_max)
            cur_max = oneline.get_number();
        found = true;
    }
    if (found)
        max_id = cur_max;
    return found;
}
