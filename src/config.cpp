#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support

namespace {

std::string readFile(const std::string& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) throw std::runtime_error("Cannot open config file: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

Config& Config::get() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::string content = readFile(path);
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::NodeRef root = tree.rootref();

    if (root.has_child("data_dir")) root["data_dir"] >> data_dir;
    if (root.has_child("db_path")) root["db_path"] >> db_path;
    if (root.has_child("log_level")) root["log_level"] >> log_level;
    if (root.has_child("password_rounds")) {
        root["password_rounds"] >> password_rounds;
        if (password_rounds <= 0) {
            throw std::runtime_error("password_rounds must be positive");
        }
    }
}

std::string Config::databasePath() const {
    if (!db_path.empty()) return db_path;
    return (std::filesystem::path(data_dir) / "forum.db").string();
}

std::optional<spdlog::level::level_enum> Config::logLevel() const {
    // from_str() maps anything it does not know to “off”.
    spdlog::level::level_enum level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") return std::nullopt;
    return level;
}
