#include "cli.hpp"
#include "emit.hpp"
#include "log.hpp"
#include <string>
#include <boost/program_options.hpp>

using namespace std;
namespace po = boost::program_options;

int run_next_id(int argc, char** argv, ostream& out, ostream& diag)
{
    string appDescription =
        string("Print the next available location identifier.\n") +
        "Usage: next_id [data directory]";

    po::options_description description("Options");
    description.add_options()
        ("help,h", "Print help messages")
        ("data-dir", po::value<string>()->default_value("data"),
            "Directory scanned recursively for \"- id: L<N>\" lines")
        ("verbose,v", "Log scanning progress on stderr");

    po::positional_options_description positionals;
    positionals.add("data-dir", 1);

    po::variables_map options;
    try
    {
        po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positionals)
                .run(),
            options);
        po::notify(options);
    }
    catch (po::error& error)
    {
        Log::error() << "Option parsing error: " << error.what() << endl;
        diag << appDescription << endl;
        diag << description << endl;
        return 1;
    }

    if (options.count("help"))
    {
        out << appDescription << endl;
        out << description << endl;
        return 0;
    }

    Log::set_verbose(options.count("verbose") > 0);

    //every scan outcome, including an empty or missing directory, exits 0
    next_id(options["data-dir"].as<string>(), out, diag);
    return 0;
}
