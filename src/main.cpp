#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "config.hpp"
#include "database.hpp"
#include "error.hpp"
#include "options.hpp"

namespace {

E<void> report(Database& db)
{
    ASSIGN_OR_RETURN(auto users, db.users());
    ASSIGN_OR_RETURN(auto posts, db.posts());
    ASSIGN_OR_RETURN(auto tags, db.tags());
    ASSIGN_OR_RETURN(auto comments, db.comments());
    ASSIGN_OR_RETURN(auto post_tags, db.postTags());
    std::cout << "Users: " << users.size() << "\n"
              << "Posts: " << posts.size() << "\n"
              << "Tags: " << tags.size() << "\n"
              << "Comments: " << comments.size() << "\n"
              << "PostTags: " << post_tags.size() << std::endl;
    return {};
}

} // namespace

int main(int argc, char** argv)
{
    auto cmd = parseCommandLine(argc, argv);
    if(!cmd.has_value())
    {
        return 1;
    }
    if(cmd->help)
    {
        std::cout << cmd->usage << std::endl;
        return 0;
    }

    Config& config = Config::get();
    try
    {
        config.load(cmd->config_path);
    }
    catch(const std::runtime_error& e)
    {
        spdlog::error("Failed to load config: {}", e.what());
        return 1;
    }
    auto level = config.logLevel();
    if(!level.has_value())
    {
        spdlog::warn("Unknown log level {}. Using info.", config.log_level);
    }
    spdlog::set_level(level.value_or(spdlog::level::info));

    auto db = Database::connectFile(config.databasePath(),
                                    config.password_rounds);
    if(!db.has_value())
    {
        spdlog::error("Failed to open database at {}: {}",
                      config.databasePath(), errorMsg(db.error()));
        return 1;
    }
    auto result = report(**db);
    if(!result.has_value())
    {
        spdlog::error(errorMsg(result.error()));
        return 1;
    }
    return 0;
}
