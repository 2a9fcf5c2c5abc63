#include "fortune/catalogue/corpus-text.h"
#include "fortune/core/logger.h"
#include "fortune/rng/rng-provider.h"
#include "fortune/strfile/strfile-codec.h"
#include "fortune/utils/strfile-tool/arg-options.h"

#include <boost/filesystem.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace fortune;
using namespace fortune::utils::strfile_tool;
namespace fs = boost::filesystem;

namespace {

void
run(const CommandLineOptions& options)
{
    fs::path input(*options.input_file);
    fs::path output = options.output_file ? fs::path(*options.output_file)
                                          : strfile::dat_path_for(input);

    catalogue::CorpusText text = catalogue::CorpusText::open(input);

    strfile::BuildOptions build;
    build.delimiter = options.delimiter;
    build.randomize = options.randomize;
    build.rotated = options.rotated;
    build.allow_empty = options.allow_empty;

    std::unique_ptr<rng::RngProvider> rng;
    if (options.randomize)
    {
        rng = rng::make_provider(rng::RngConfig::from_env());
        build.draw = [&rng](uint32_t bound) {
            return rng->next_u32_below(bound);
        };
    }

    strfile::StrfileIndex index = strfile::build_index(text.view(), build);
    if (index.header.num_strings == 0)
    {
        throw strfile::StrfileError(
            "No strings found in " + input.string());
    }

    strfile::write_index_file(output, index);
    LOGI(
        "Indexed ",
        index.header.num_strings,
        " strings of ",
        input.string(),
        " into ",
        output.string());

    if (!options.silent)
    {
        std::cout << "\"" << output.string() << "\" created" << std::endl
                  << index.header.num_strings << " strings" << std::endl
                  << "longest string: " << index.header.longest_len
                  << " bytes" << std::endl
                  << "shortest string: " << index.header.shortest_len
                  << " bytes" << std::endl;
    }
}

}  // namespace

int
main(int argc, char* argv[])
{
    CommandLineOptions options = parse_argv(argc, argv);

    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "strfile: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 1;
    }

    try
    {
        if (!Logger::set_level(options.log_level))
        {
            Logger::set_level(LogLevel::ERROR);
            std::cerr << "Unrecognized log level: " << options.log_level
                      << ", falling back to 'error'" << std::endl;
        }
        run(options);
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "strfile: " << e.what() << std::endl;
        return 1;
    }
}
