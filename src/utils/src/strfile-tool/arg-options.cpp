#include "fortune/utils/strfile-tool/arg-options.h"

#include <boost/program_options.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;
namespace fortune::utils::strfile_tool {

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "delimiter,c",
        po::value<std::string>()->default_value(
            std::string(1, strfile::DEFAULT_DELIMITER)),
        "Delimiter character")(
        "randomize,r", po::bool_switch(), "Randomize the offset table")(
        "rotated,x", po::bool_switch(), "Mark the text as ROT13-encoded")(
        "silent,s", po::bool_switch(), "Do not print the summary")(
        "allow-empty",
        po::bool_switch(),
        "Keep empty entries between consecutive delimiters")(
        "log-level",
        po::value<std::string>()->default_value("error"),
        "Log level (error, warn, info, debug)");

    po::options_description hidden;
    hidden.add_options()("input", po::value<std::string>(), "Corpus text")(
        "output", po::value<std::string>(), "Index file");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("input", 1).add("output", 1);

    std::ostringstream help_stream;
    help_stream << "Build the random access index of a fortune file"
                << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "strfile")
                << " [options] <input> [output]" << std::endl
                << desc << std::endl
                << "The index is written to <input>.dat unless an output "
                   "path is given."
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

        if (vm.count("input"))
        {
            options.input_file = vm["input"].as<std::string>();
        }
        else
        {
            options.valid = false;
            options.error_message = "No input file specified";
            return options;
        }

        if (vm.count("output"))
        {
            options.output_file = vm["output"].as<std::string>();
        }

        std::string delimiter = vm["delimiter"].as<std::string>();
        if (delimiter.size() != 1)
        {
            options.valid = false;
            options.error_message =
                "Delimiter must be a single byte, got '" + delimiter + "'";
            return options;
        }
        options.delimiter = delimiter[0];

        options.randomize = vm["randomize"].as<bool>();
        options.rotated = vm["rotated"].as<bool>();
        options.silent = vm["silent"].as<bool>();
        options.allow_empty = vm["allow-empty"].as<bool>();

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

}  // namespace fortune::utils::strfile_tool
