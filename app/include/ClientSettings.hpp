#ifndef CLIENT_SETTINGS_HPP
#define CLIENT_SETTINGS_HPP

#include <IniConfig.hpp>
#include <LLMClient.hpp>
#include <string>
#include <vector>

/**
 * One named connection profile. Holds the *name* of the environment
 * variable with the API key, never the key itself.
 */
struct ClientProfile {
    std::string name;
    LLMProvider provider{LLMProvider::OpenAI};
    LLMType type{LLMType::Chat};
    std::string model;
    std::string endpoint;       ///< empty = default_endpoint(provider)
    std::string api_key_env;    ///< empty = default_api_key_env(provider)
    long timeout_seconds{LLMClient::kDefaultTimeoutSeconds};
};

class ClientSettings
{
public:
    ClientSettings();
    explicit ClientSettings(std::string config_path);

    bool load();
    bool save();

    const std::string& config_path() const { return config_path_; }
    static std::string define_config_path();

    std::vector<std::string> profile_names() const;
    bool has_profile(const std::string& name) const;

    /// Throws LlmError(InvalidInput) for a missing profile or bad values.
    ClientProfile get_profile(const std::string& name) const;
    void upsert_profile(const ClientProfile& profile);

    /**
     * Resolves a profile into a client, reading the API key from the
     * profile's environment variable at this moment.
     */
    LLMClient make_client(const std::string& name) const;

private:
    std::string config_path_;
    IniConfig config_;
};

#endif
