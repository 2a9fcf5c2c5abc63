#include "fortune/utils/fortune-tool/arg-options.h"

#include <boost/program_options.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace fortune::utils::fortune_tool {

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "all,a", po::bool_switch(), "Choose from all fortunes, offensive too")(
        "offensive,o", po::bool_switch(), "Choose only offensive fortunes")(
        "equal,e",
        po::bool_switch(),
        "Give every source the same probability regardless of size")(
        "files,f",
        po::bool_switch(),
        "Print the sources that would be searched and their probabilities")(
        "long,l", po::bool_switch(), "Only long fortunes")(
        "short,s", po::bool_switch(), "Only short fortunes")(
        "length,n",
        po::value<size_t>()->default_value(selector::DEFAULT_LENGTH_THRESHOLD),
        "Length in bytes separating short from long fortunes")(
        "match,m",
        po::value<std::string>(),
        "Print every fortune matching the regular expression")(
        "ignore-case,i", po::bool_switch(), "Case-insensitive -m matching")(
        "show-source,c",
        po::bool_switch(),
        "Show the file the fortune was read from")(
        "wait,w",
        po::bool_switch(),
        "Wait after printing, long enough to read the fortune")(
        "version,v", po::bool_switch(), "Print the version and exit")(
        "log-level",
        po::value<std::string>()->default_value("error"),
        "Log level (error, warn, info, debug)");

    po::options_description hidden;
    hidden.add_options()(
        "source", po::value<std::vector<std::string>>(), "Fortune sources");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("source", -1);

    std::ostringstream help_stream;
    help_stream << "Print a random, hopefully interesting, adage" << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "fortune")
                << " [options] [[N%] file/directory/all]..." << std::endl
                << desc << std::endl
                << "A source may be prefixed with a percentage (\"30% "
                   "science\") to fix its share of"
                << std::endl
                << "the selection. The remaining share is split among the "
                   "other sources."
                << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        options.show_version = vm["version"].as<bool>();
        options.all_fortunes = vm["all"].as<bool>();
        options.offensive_only = vm["offensive"].as<bool>();
        options.equal_probability = vm["equal"].as<bool>();
        options.list_files = vm["files"].as<bool>();
        options.long_only = vm["long"].as<bool>();
        options.short_only = vm["short"].as<bool>();
        options.ignore_case = vm["ignore-case"].as<bool>();
        options.show_source = vm["show-source"].as<bool>();
        options.wait = vm["wait"].as<bool>();
        options.length_threshold = vm["length"].as<size_t>();

        if (vm.count("source"))
        {
            options.sources = vm["source"].as<std::vector<std::string>>();
        }

        if (vm.count("match"))
        {
            options.pattern = vm["match"].as<std::string>();
        }

        if (options.long_only && options.short_only)
        {
            options.valid = false;
            options.error_message = "-l and -s cannot be combined";
            return options;
        }

        if (options.ignore_case && !options.pattern)
        {
            options.valid = false;
            options.error_message = "-i requires -m <pattern>";
            return options;
        }

        std::string level = vm["log-level"].as<std::string>();
        if (level != "error" && level != "warn" && level != "info" &&
            level != "debug")
        {
            options.valid = false;
            options.error_message =
                "Log level must be one of: error, warn, info, debug";
            return options;
        }
        options.log_level = level;
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }
    catch (const std::exception& e)
    {
        options.valid = false;
        options.error_message = std::string("Unexpected error: ") + e.what();
    }

    return options;
}

catalogue::OffensiveMode
offensive_mode(const CommandLineOptions& options)
{
    if (options.offensive_only)
        return catalogue::OffensiveMode::Only;
    if (options.all_fortunes)
        return catalogue::OffensiveMode::All;
    return catalogue::OffensiveMode::Exclude;
}

selector::SelectionRequest
to_selection_request(const CommandLineOptions& options)
{
    selector::SelectionRequest request;
    if (options.long_only)
        request.filter = selector::LengthFilter::LongOnly;
    else if (options.short_only)
        request.filter = selector::LengthFilter::ShortOnly;
    request.length_threshold = options.length_threshold;
    request.offensive = offensive_mode(options);
    request.equal_probability = options.equal_probability;
    request.pattern = options.pattern;
    request.ignore_case = options.ignore_case;
    request.list_sources = options.list_files;
    return request;
}

}  // namespace fortune::utils::fortune_tool
