#pragma once
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

struct Config
{
    std::string data_dir = ".";
    // Empty means “forum.db” inside data_dir.
    std::string db_path;
    std::string log_level = "info";
    int password_rounds = 25000;

    static Config& get();
    void load(const std::string& path);
    // The database file to open, with the default applied.
    std::string databasePath() const;
    // The spdlog level named by log_level, or nullopt if it names none.
    std::optional<spdlog::level::level_enum> logLevel() const;
};
