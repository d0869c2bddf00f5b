#include "log.hpp"
#include <ctime>

using namespace std;

LogStream::LogStream(bool on)
    :enabled(on)
{
}

void LogStream::set_enabled(bool on)
{
    enabled = on;
}

bool LogStream::is_enabled() const
{
    return enabled;
}

LogStream& LogStream::operator<<(OstreamManipulator manipulator)
{
    if (enabled)
        cerr << manipulator;
    return *this;
}

const string Log::time_format = "[%Y-%m-%d %H:%M:%S] ";

LogStream Log::error_stream(true);
LogStream Log::warning_stream(true);
LogStream Log::info_stream(false);
LogStream Log::debug_stream(false);

LogStream& Log::error()
{
    return error_stream << timestamp << "ERROR: ";
}

LogStream& Log::warning()
{
    return warning_stream << timestamp << "WARNING: ";
}

LogStream& Log::info()
{
    return info_stream << timestamp << "INFO: ";
}

LogStream& Log::debug()
{
    return debug_stream << timestamp << "DEBUG: ";
}

void Log::set_verbose(bool verbose)
{
    info_stream.set_enabled(verbose);
    debug_stream.set_enabled(verbose);
}

ostream& Log::timestamp(ostream& stream)
{
    time_t global_time;
    time(&global_time);
    struct tm* local_time = localtime(&global_time);

    char buffer[80];
    if (local_time && strftime(buffer, sizeof(buffer), time_format.c_str(), local_time))
        stream << buffer;
    else
        stream << "(no time) ";
    return stream;
}
