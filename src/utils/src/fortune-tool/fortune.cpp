#include "fortune/catalogue/catalogue.h"
#include "fortune/core/logger.h"
#include "fortune/rng/rng-provider.h"
#include "fortune/selector/selector.h"
#include "fortune/utils/fortune-tool/arg-options.h"
#include "fortune/utils/fortune-tool/output.h"

#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

using namespace fortune;
using namespace fortune::utils::fortune_tool;
namespace fs = boost::filesystem;

namespace {

/**
 * Print every entry the request's pattern matches, each followed by a "%"
 * line. Source paths go to stderr ahead of their first match.
 *
 * @throws selector::NoMatchingQuotationError if nothing matched
 */
void
print_matches(const selector::Selector& engine)
{
    std::set<fs::path> announced;
    size_t count = 0;
    for (const auto& match : engine.enumerate_matches())
    {
        if (announced.insert(match.source_path).second)
        {
            std::cerr << match.source_path.string() << std::endl;
        }
        print_record(match.text, std::cout);
        std::cout << "%" << std::endl;
        count++;
    }
    LOGI("Printed ", count, " matching fortune(s)");
    if (count == 0)
    {
        throw selector::NoMatchingQuotationError("No fortunes matched");
    }
}

void
run(const CommandLineOptions& options)
{
    selector::SelectionRequest request = to_selection_request(options);

    catalogue::DiscoveryConfig config = catalogue::DiscoveryConfig::from_env();
    config.offensive = request.offensive;

    catalogue::Catalogue discovered =
        catalogue::discover(options.sources, config);
    catalogue::Catalogue weighted = catalogue::normalize_weights(
        discovered, request.weight_mode(), request.length_limit());

    // Compiles the pattern before anything is printed
    selector::Selector engine(weighted, request);

    if (request.list_sources)
    {
        print_probabilities(selector::list_probabilities(weighted), std::cerr);
        return;
    }

    if (request.pattern)
    {
        print_matches(engine);
        return;
    }

    auto rng = rng::make_provider(rng::RngConfig::from_env());
    selector::Quotation quotation = engine.select_one(*rng);

    if (options.show_source)
    {
        std::cout << "(" << absolute_display_path(quotation.source_path).string()
                  << ")" << std::endl
                  << "%" << std::endl;
    }
    print_record(quotation.text, std::cout);
    std::cout.flush();
    LOGI(
        "Printed entry ",
        quotation.entry_index,
        " of ",
        quotation.source_path.string());

    if (options.wait)
    {
        size_t seconds = wait_seconds_for_text(quotation.text);
        LOGD("Waiting ", seconds, "s");
        std::this_thread::sleep_for(std::chrono::seconds(seconds));
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
            std::cerr << "fortune: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 1;
    }

    if (options.show_version)
    {
        std::cout << "fortune-tools " << FORTUNE_TOOLS_VERSION << std::endl;
        return 0;
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
        std::cerr << "fortune: " << e.what() << std::endl;
        return 1;
    }
}
