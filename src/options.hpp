#pragma once

#include <optional>
#include <string>

struct CommandLine
{
    std::string config_path = "forumdb.yaml";
    bool help = false;
    // Usage text, for printing with --help.
    std::string usage;
};

// Parse the command line of the forumdb tool. Returns nullopt (after
// logging why) when it cannot be parsed.
std::optional<CommandLine> parseCommandLine(int argc, const char* const* argv);
