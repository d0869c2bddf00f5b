#ifndef LOCID_TEST_TEMPCORPUS_HPP
#define LOCID_TEST_TEMPCORPUS_HPP

#include <string>
#include <boost/filesystem/path.hpp>

/**
 * A throwaway data directory under the system temp directory, removed again
 * when the object goes away.
 */
class TempCorpus {
public:
    TempCorpus();
    ~TempCorpus();

    /**
     * Write a file at the given path relative to the corpus root, creating
     * parent directories as needed.
     */
    boost::filesystem::path write(const std::string& relative,
        const std::string& contents);

    const boost::filesystem::path& root() const;

private:
    boost::filesystem::path rootDir;

    TempCorpus(const TempCorpus&);
    TempCorpus& operator=(const TempCorpus&);
};

#endif
