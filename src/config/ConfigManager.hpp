#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

namespace config
{

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

/**
 * @brief Loads the TOML configuration and hands each registered table to its owner.
 *
 * A missing or unreadable file fails load(). Tables absent from a file that
 * does load still reach their handler as an empty table, which applies defaults.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    bool loadFromString(std::string_view content);
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    void dispatch();
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};

} // namespace config
