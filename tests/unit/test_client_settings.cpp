#include <catch2/catch_test_macros.hpp>
#include "ClientSettings.hpp"
#include "LLMErrors.hpp"
#include "TestHelpers.hpp"

#include <fstream>

namespace {

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << text;
}

} // namespace

TEST_CASE("Config path honours LLM_BRIDGE_CONFIG, then XDG_CONFIG_HOME") {
    TempDir dir;
    {
        EnvVarGuard explicit_guard("LLM_BRIDGE_CONFIG", (dir.path() / "custom.ini").string());
        REQUIRE(ClientSettings::define_config_path() == (dir.path() / "custom.ini").string());
    }
    EnvVarGuard explicit_guard("LLM_BRIDGE_CONFIG", std::nullopt);
    EnvVarGuard xdg_guard("XDG_CONFIG_HOME", dir.path().string());
    REQUIRE(ClientSettings::define_config_path() ==
            (dir.path() / "llm-bridge" / "profiles.ini").string());
}

TEST_CASE("Profiles are parsed from the INI file") {
    TempDir dir;
    const auto path = dir.path() / "profiles.ini";
    write_text(path,
               "; connection profiles\n"
               "[writer]\n"
               "provider = claude\n"
               "model = claude-test\n"
               "api_key_env = WRITER_KEY\n"
               "timeout = 30\n"
               "\n"
               "[vectors]\n"
               "provider = gemini\n"
               "type = embedding\n"
               "model = text-embedding-004 ; inline comment\n");

    ClientSettings settings(path.string());
    REQUIRE(settings.load());
    REQUIRE(settings.profile_names() == std::vector<std::string>{"writer", "vectors"});

    const ClientProfile writer = settings.get_profile("writer");
    REQUIRE(writer.provider == LLMProvider::Anthropic);
    REQUIRE(writer.type == LLMType::Chat);
    REQUIRE(writer.timeout_seconds == 30);

    const ClientProfile vectors = settings.get_profile("vectors");
    REQUIRE(vectors.type == LLMType::Embedding);
    REQUIRE(vectors.model == "text-embedding-004");

    EnvVarGuard key_guard("WRITER_KEY", std::string("from-env"));
    const LLMClient client = settings.make_client("writer");
    REQUIRE(client.api_key() == "from-env");
    REQUIRE(client.endpoint() == default_endpoint(LLMProvider::Anthropic));
    REQUIRE(client.timeout_seconds() == 30);
}

TEST_CASE("Bad profiles are InvalidInput") {
    TempDir dir;
    const auto path = dir.path() / "profiles.ini";
    write_text(path,
               "[unknown]\nprovider = mistral\nmodel = m\n"
               "[nomodel]\nprovider = openai\n"
               "[badtimeout]\nprovider = openai\nmodel = m\ntimeout = soon\n");

    ClientSettings settings(path.string());
    REQUIRE(settings.load());
    for (const char* name : {"unknown", "nomodel", "badtimeout", "absent"}) {
        try {
            settings.get_profile(name);
            FAIL(std::string("expected InvalidInput for ") + name);
        } catch (const LlmError& ex) {
            REQUIRE(ex.kind() == LlmErrorKind::InvalidInput);
        }
    }
}

TEST_CASE("Profiles survive save and reload") {
    TempDir dir;
    const auto path = dir.path() / "nested" / "profiles.ini";

    ClientSettings settings(path.string());
    REQUIRE_FALSE(settings.load());

    ClientProfile profile;
    profile.name = "local";
    profile.provider = LLMProvider::OpenAI;
    profile.model = "llama-3.1";
    profile.endpoint = "http://localhost:1234/v1";
    profile.timeout_seconds = 15;
    settings.upsert_profile(profile);
    REQUIRE(settings.save());

    ClientSettings reloaded(path.string());
    REQUIRE(reloaded.load());
    const ClientProfile loaded = reloaded.get_profile("local");
    REQUIRE(loaded.provider == LLMProvider::OpenAI);
    REQUIRE(loaded.model == "llama-3.1");
    REQUIRE(loaded.endpoint == "http://localhost:1234/v1");
    REQUIRE(loaded.timeout_seconds == 15);
}
