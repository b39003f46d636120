#ifndef STEER_SETTINGS_HPP
#define STEER_SETTINGS_HPP

#include <steer/types.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace steer
{

// Defaults applied to every query unless the session or the call overrides them.
struct Settings
{
    std::string permission_mode = "default"; // default, acceptEdits, bypassPermissions, plan
    std::optional<int> max_turns;
    std::optional<std::string> model;
    std::string cli_path; // Empty: STEER_CLI_PATH, then PATH lookup
    std::string working_directory;
    std::string system_prompt;
    std::vector<std::string> allowed_tools;

    // Unknown keys are ignored; a known key of the wrong type raises ConfigurationError.
    static Settings from_json(const json& j);
    json to_json() const;
};

// Reads a JSON settings file. Throws ConfigurationError if the file is missing,
// unreadable or malformed.
Settings load_settings(const std::string& path);

class SettingsProvider
{
  public:
    virtual ~SettingsProvider() = default;
    virtual Settings current() const = 0;
};

class StaticSettingsProvider : public SettingsProvider
{
  public:
    StaticSettingsProvider() = default;
    explicit StaticSettingsProvider(Settings settings);

    Settings current() const override;
    void update(Settings settings);

  private:
    mutable std::mutex mutex_;
    Settings settings_;
};

} // namespace steer

#endif // STEER_SETTINGS_HPP
