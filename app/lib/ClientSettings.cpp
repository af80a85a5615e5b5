#include "ClientSettings.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace {

constexpr const char* kProviderKey = "provider";
constexpr const char* kTypeKey = "type";
constexpr const char* kModelKey = "model";
constexpr const char* kEndpointKey = "endpoint";
constexpr const char* kApiKeyEnvKey = "api_key_env";
constexpr const char* kTimeoutKey = "timeout";

long parse_timeout(const std::string& profile, const std::string& value)
{
    if (value.empty()) {
        return LLMClient::kDefaultTimeoutSeconds;
    }
    try {
        std::size_t consumed = 0;
        const long seconds = std::stol(value, &consumed);
        if (consumed == value.size() && seconds > 0) {
            return seconds;
        }
    } catch (const std::logic_error&) {
        // std::stol: invalid_argument / out_of_range, reported below
    }
    throw LlmError(LlmErrorKind::InvalidInput,
                   "Profile '" + profile + "': timeout must be a positive number of seconds, got '" + value + "'");
}

} // namespace


ClientSettings::ClientSettings()
    : config_path_(define_config_path())
{
}

ClientSettings::ClientSettings(std::string config_path)
    : config_path_(std::move(config_path))
{
}

std::string ClientSettings::define_config_path()
{
    if (const char* explicit_path = std::getenv("LLM_BRIDGE_CONFIG"); explicit_path && *explicit_path) {
        return explicit_path;
    }
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = std::filesystem::current_path();
    }
    return (base / "llm-bridge" / "profiles.ini").string();
}

bool ClientSettings::load()
{
    if (!std::filesystem::exists(config_path_)) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Config file {} does not exist", config_path_);
        }
        return false;
    }
    return config_.load(config_path_);
}

bool ClientSettings::save()
{
    const std::filesystem::path path(config_path_);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->error("Cannot create config directory {}: {}", path.parent_path().string(), ec.message());
            }
            return false;
        }
    }
    return config_.save(config_path_);
}

std::vector<std::string> ClientSettings::profile_names() const
{
    return config_.sections();
}

bool ClientSettings::has_profile(const std::string& name) const
{
    return config_.has_section(name);
}

ClientProfile ClientSettings::get_profile(const std::string& name) const
{
    if (!has_profile(name)) {
        throw LlmError(LlmErrorKind::InvalidInput,
                       "Profile '" + name + "' not found in " + config_path_);
    }

    ClientProfile profile;
    profile.name = name;

    const std::string provider_name = config_.get_value(name, kProviderKey);
    const auto provider = parse_provider(provider_name);
    if (!provider) {
        throw LlmError(LlmErrorKind::InvalidInput,
                       "Profile '" + name + "': unknown provider '" + provider_name + "'");
    }
    profile.provider = *provider;

    const std::string type_name = config_.get_value(name, kTypeKey, "chat");
    const auto type = parse_llm_type(type_name);
    if (!type) {
        throw LlmError(LlmErrorKind::InvalidInput,
                       "Profile '" + name + "': unknown type '" + type_name + "'");
    }
    profile.type = *type;

    profile.model = config_.get_value(name, kModelKey);
    if (profile.model.empty()) {
        throw LlmError(LlmErrorKind::InvalidInput, "Profile '" + name + "' has no model");
    }
    profile.endpoint = config_.get_value(name, kEndpointKey);
    profile.api_key_env = config_.get_value(name, kApiKeyEnvKey);
    profile.timeout_seconds = parse_timeout(name, config_.get_value(name, kTimeoutKey));
    return profile;
}

void ClientSettings::upsert_profile(const ClientProfile& profile)
{
    config_.set_value(profile.name, kProviderKey, to_string(profile.provider));
    config_.set_value(profile.name, kTypeKey, to_string(profile.type));
    config_.set_value(profile.name, kModelKey, profile.model);
    if (!profile.endpoint.empty()) {
        config_.set_value(profile.name, kEndpointKey, profile.endpoint);
    }
    if (!profile.api_key_env.empty()) {
        config_.set_value(profile.name, kApiKeyEnvKey, profile.api_key_env);
    }
    if (profile.timeout_seconds != LLMClient::kDefaultTimeoutSeconds) {
        config_.set_value(profile.name, kTimeoutKey, std::to_string(profile.timeout_seconds));
    }
}

LLMClient ClientSettings::make_client(const std::string& name) const
{
    const ClientProfile profile = get_profile(name);
    const std::string env_name = profile.api_key_env.empty()
        ? default_api_key_env(profile.provider)
        : profile.api_key_env;

    std::string api_key;
    if (const char* value = std::getenv(env_name.c_str()); value && *value) {
        api_key = value;
    } else if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("Profile '{}': environment variable {} is not set; sending no API key",
                     name, env_name);
    }

    return LLMClient(profile.provider, std::move(api_key), profile.endpoint, profile.model, profile.type)
        .with_timeout(profile.timeout_seconds);
}
