#include <optional>
#include <string>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include "options.hpp"

std::optional<CommandLine> parseCommandLine(int argc, const char* const* argv)
{
    cxxopts::Options cmd_options("forumdb", "Forum database tool");
    cmd_options.add_options()
        ("c,config", "Config file",
         cxxopts::value<std::string>()->default_value("forumdb.yaml"))
        ("h,help", "Print this message.");

    CommandLine result;
    try
    {
        auto opts = cmd_options.parse(argc, argv);
        result.help = opts.count("help") > 0;
        result.config_path = opts["config"].as<std::string>();
    }
    catch(const cxxopts::exceptions::exception& e)
    {
        spdlog::error("Invalid command line: {}", e.what());
        return std::nullopt;
    }
    result.usage = cmd_options.help();
    return result;
}
