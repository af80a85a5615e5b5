#include "ProviderTypes.hpp"
#include "Utils.hpp"

std::optional<LLMProvider> parse_provider(const std::string& name)
{
    const std::string key = Utils::to_lower_copy(Utils::trim_copy(name));
    if (key == "openai") {
        return LLMProvider::OpenAI;
    }
    if (key == "anthropic" || key == "claude") {
        return LLMProvider::Anthropic;
    }
    if (key == "gemini" || key == "google") {
        return LLMProvider::Gemini;
    }
    return std::nullopt;
}

std::optional<LLMType> parse_llm_type(const std::string& name)
{
    const std::string key = Utils::to_lower_copy(Utils::trim_copy(name));
    if (key == "chat") {
        return LLMType::Chat;
    }
    if (key == "embedding" || key == "embeddings" || key == "embed") {
        return LLMType::Embedding;
    }
    return std::nullopt;
}
