#ifndef LOCID_LOG
#define LOCID_LOG

/**
 * Static logging system. Everything goes to stderr so that stdout only ever
 * carries the identifier the tool prints.
 */

#include <iostream>
#include <ostream>
#include <string>

/**
 * Type of ostream manipulators like std::endl, once instantiated for a plain
 * std::ostream.
 */
typedef std::ostream& (*OstreamManipulator)(std::ostream&);

/**
 * A stream that forwards to stderr while enabled and discards everything
 * otherwise.
 */
class LogStream
{
    private:
        bool enabled;

    public:
        explicit LogStream(bool on);
        void set_enabled(bool on);
        bool is_enabled() const;

        template<typename T>
        LogStream& operator<<(const T& thing)
        {
            if (enabled)
                std::cerr << thing;
            return *this;
        }

        /** Pass manipulators (std::endl and friends) through. */
        LogStream& operator<<(OstreamManipulator manipulator);
};

/**
 * Stream-style log levels. Call once per line and finish with std::endl.
 * Error and warning are always on; info and debug follow set_verbose().
 */
class Log
{
    public:
        static LogStream& error();
        static LogStream& warning();
        static LogStream& info();
        static LogStream& debug();

        static void set_verbose(bool verbose);

    private:
        static LogStream error_stream;
        static LogStream warning_stream;
        static LogStream info_stream;
        static LogStream debug_stream;

        static const std::string time_format;
        static std::ostream& timestamp(std::ostream& stream);

        // static only
        Log();
};

#endif
