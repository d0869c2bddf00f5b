#ifndef LOCID_CORPUS_STREAM
#define LOCID_CORPUS_STREAM
#include <cstddef>
#include <string>
#include <vector>
#include <boost/filesystem/path.hpp>
#include <boost/filesystem/fstream.hpp>

/**
 * Feeds the lines of every text file under a base directory, one file after
 * another. Files are collected up front by a recursive walk that does not
 * follow symbolic links. Unreadable and binary files are skipped.
 */
class CorpusStream
{
    private:
        std::vector<boost::filesystem::path> files;
        std::size_t cur_file_no;
        std::size_t skipped;
        boost::filesystem::ifstream cur_is;

    public:
        explicit CorpusStream(const boost::filesystem::path& base_dir);
        bool feedline(std::string& str);
        std::size_t file_count() const;
        std::size_t skipped_count() const;

    private:
        void collect(const boost::filesystem::path& dir);
        bool open_next();
        bool looks_binary();
};

#endif
