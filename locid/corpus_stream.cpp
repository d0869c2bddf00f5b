#include "corpus_stream.hpp"
#include "log.hpp"
#include <algorithm>
#include <cstring>
#include <boost/filesystem/operations.hpp>

using namespace std;
namespace fs = boost::filesystem;

namespace
{
    // a NUL byte in the first block marks a binary file
    const std::size_t sniff_size = 4096;
}

CorpusStream::CorpusStream(const fs::path& base_dir)
    :cur_file_no(0),
    skipped(0)
{
    boost::system::error_code ec;
    fs::file_status st = fs::status(base_dir, ec);
    if (!fs::exists(st))
    {
        Log::info() << "Data directory " << base_dir.string() << " does not exist. Nothing to scan." << endl;
        return;
    }
    if (!fs::is_directory(st))
    {
        Log::warning() << base_dir.string() << " is not a directory. Nothing to scan." << endl;
        return;
    }

    collect(base_dir);
    sort(files.begin(), files.end());
    Log::info() << "Scanning " << files.size() << " files under " << base_dir.string() << endl;
}

void CorpusStream::collect(const fs::path& dir)
{
    boost::system::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        Log::debug() << "Cannot list " << dir.string() << ": " << ec.message() << endl;
        return;
    }

    fs::directory_iterator end;
    while (it != end)
    {
        boost::system::error_code st_ec;
        fs::file_status st = it->symlink_status(st_ec);
        if (st_ec)
        {
            Log::debug() << "Cannot stat " << it->path().string() << ": " << st_ec.message() << endl;
        }
        else if (fs::is_directory(st))
        {
            collect(it->path());
        }
        else if (fs::is_regular_file(st))
        {
            files.push_back(it->path());
        }

        it.increment(ec);
        if (ec)
        {
            Log::debug() << "Stopped listing " << dir.string() << ": " << ec.message() << endl;
            break;
        }
    }
}

bool CorpusStream::feedline(string& str)
{
    while (true)
    {
        if (cur_is.is_open() && getline(cur_is, str))
            return true;
        if (!open_next())
            return false;
    }
}

bool CorpusStream::open_next()
{
    if (cur_is.is_open())
        cur_is.close();

    while (cur_file_no < files.size())
    {
        const fs::path& filename = files[cur_file_no++];
        cur_is.clear();
        cur_is.open(filename, ios::in | ios::binary);
        if (!cur_is)
        {
            Log::debug() << "Cannot open " << filename.string() << ", skipped" << endl;
            ++skipped;
            continue;
        }
        if (looks_binary())
        {
            Log::debug() << "Binary file " << filename.string() << ", skipped" << endl;
            cur_is.close();
            ++skipped;
            continue;
        }
        return true;
    }
    return false;
}

bool CorpusStream::looks_binary()
{
    char buffer[sniff_size];
    cur_is.read(buffer, sizeof(buffer));
    streamsize rd = cur_is.gcount();
    bool binary = memchr(buffer, '\0', static_cast<size_t>(rd)) != NULL;

    cur_is.clear();
    cur_is.seekg(0, ios::beg);
    return binary;
}

size_t CorpusStream::file_count() const
{
    return files.size();
}

size_t CorpusStream::skipped_count() const
{
    return skipped;
}
