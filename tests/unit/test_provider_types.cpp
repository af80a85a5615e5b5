#include <catch2/catch_test_macros.hpp>
#include "IniConfig.hpp"
#include "LLMClient.hpp"
#include "ProviderTypes.hpp"

#include <sstream>

TEST_CASE("Provider and type names parse case-insensitively with aliases") {
    REQUIRE(parse_provider("OpenAI") == LLMProvider::OpenAI);
    REQUIRE(parse_provider("claude") == LLMProvider::Anthropic);
    REQUIRE(parse_provider("Google") == LLMProvider::Gemini);
    REQUIRE_FALSE(parse_provider("mistral").has_value());

    REQUIRE(parse_llm_type("chat") == LLMType::Chat);
    REQUIRE(parse_llm_type("Embeddings") == LLMType::Embedding);
    REQUIRE_FALSE(parse_llm_type("completion").has_value());

    for (LLMProvider provider : {LLMProvider::OpenAI, LLMProvider::Anthropic, LLMProvider::Gemini}) {
        REQUIRE(parse_provider(to_string(provider)) == provider);
    }
}

TEST_CASE("Capabilities describe what each provider can do") {
    REQUIRE(has_capability(provider_capabilities(LLMProvider::OpenAI), ProviderCapability::Embeddings));
    REQUIRE(has_capability(provider_capabilities(LLMProvider::Gemini), ProviderCapability::ImageOutput));
    REQUIRE(has_capability(provider_capabilities(LLMProvider::Anthropic), ProviderCapability::Vision));
    REQUIRE_FALSE(has_capability(provider_capabilities(LLMProvider::Anthropic),
                                 ProviderCapability::Embeddings));
}

TEST_CASE("LLMClient normalises its endpoint") {
    const LLMClient defaulted(LLMProvider::Gemini, "k", "", "m", LLMType::Chat);
    REQUIRE(defaulted.endpoint() == default_endpoint(LLMProvider::Gemini));

    const LLMClient custom(LLMProvider::OpenAI, "k", "http://localhost:8080/v1///", "m", LLMType::Chat);
    REQUIRE(custom.endpoint() == "http://localhost:8080/v1");
    REQUIRE(custom.timeout_seconds() == LLMClient::kDefaultTimeoutSeconds);
    REQUIRE(custom.with_timeout(5).timeout_seconds() == 5);
    REQUIRE_FALSE(custom.has_request_hook());
}

TEST_CASE("IniConfig keeps section order and strips comments") {
    std::istringstream input(
        "# header\n"
        "[b]\n"
        "key = value ; note\n"
        "url = http://host/#anchor\n"
        "garbage line\n"
        "[a]\n"
        "x=1\n");
    IniConfig config;
    config.parse(input);

    REQUIRE(config.sections() == std::vector<std::string>{"b", "a"});
    REQUIRE(config.get_value("b", "key") == "value");
    REQUIRE(config.get_value("b", "url") == "http://host/#anchor");
    REQUIRE(config.get_value("a", "x") == "1");
    REQUIRE(config.get_value("a", "missing", "fallback") == "fallback");
    REQUIRE_FALSE(config.has_value("b", "garbage line"));
}
