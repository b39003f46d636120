#include <steer/errors.hpp>
#include <steer/settings.hpp>

#include <fstream>

namespace steer
{

namespace
{

const json* field(const json& j, const char* key)
{
    if (!j.contains(key) || j[key].is_null())
        return nullptr;
    return &j[key];
}

std::string string_field(const json& value, const char* key)
{
    if (!value.is_string())
        throw ConfigurationError(std::string("Setting \"") + key + "\" must be a string");
    return value.get<std::string>();
}

} // namespace

Settings Settings::from_json(const json& j)
{
    if (!j.is_object())
        throw ConfigurationError("Settings must be a JSON object");

    Settings settings;

    if (auto* v = field(j, "permission_mode"))
        settings.permission_mode = string_field(*v, "permission_mode");
    if (auto* v = field(j, "model"))
        settings.model = string_field(*v, "model");
    if (auto* v = field(j, "cli_path"))
        settings.cli_path = string_field(*v, "cli_path");
    if (auto* v = field(j, "working_directory"))
        settings.working_directory = string_field(*v, "working_directory");
    if (auto* v = field(j, "system_prompt"))
        settings.system_prompt = string_field(*v, "system_prompt");

    if (auto* v = field(j, "max_turns"))
    {
        if (!v->is_number_integer() || v->get<int>() <= 0)
            throw ConfigurationError("Setting \"max_turns\" must be a positive integer");
        settings.max_turns = v->get<int>();
    }

    if (auto* v = field(j, "allowed_tools"))
    {
        if (!v->is_array())
            throw ConfigurationError("Setting \"allowed_tools\" must be an array of strings");
        for (const auto& tool : *v)
            settings.allowed_tools.push_back(string_field(tool, "allowed_tools"));
    }

    return settings;
}

json Settings::to_json() const
{
    json j = {{"permission_mode", permission_mode},
              {"cli_path", cli_path},
              {"working_directory", working_directory},
              {"system_prompt", system_prompt},
              {"allowed_tools", allowed_tools}};
    if (max_turns)
        j["max_turns"] = *max_turns;
    if (model)
        j["model"] = *model;
    return j;
}

Settings load_settings(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigurationError("Cannot open settings file: " + path);

    json j;
    try
    {
        in >> j;
    }
    catch (const json::exception& e)
    {
        throw ConfigurationError("Malformed settings file " + path + ": " + e.what());
    }
    return Settings::from_json(j);
}

StaticSettingsProvider::StaticSettingsProvider(Settings settings) : settings_(std::move(settings))
{
}

Settings StaticSettingsProvider::current() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void StaticSettingsProvider::update(Settings settings)
{
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(settings);
}

} // namespace steer
