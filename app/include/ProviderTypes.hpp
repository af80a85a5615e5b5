#pragma once
#include <cstdint>
#include <optional>
#include <string>

enum class LLMProvider {
    OpenAI,
    Anthropic,
    Gemini
};

enum class LLMType {
    Chat,
    Embedding
};

/**
 * Provider capability flags
 */
enum class ProviderCapability : uint32_t {
    None        = 0,
    Chat        = 1 << 0,
    Vision      = 1 << 1,   // Accepts image parts
    Embeddings  = 1 << 2,   // Has a native embedding endpoint
    ImageOutput = 1 << 3,   // May answer with image parts
};

inline ProviderCapability operator|(ProviderCapability a, ProviderCapability b) {
    return static_cast<ProviderCapability>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline ProviderCapability operator&(ProviderCapability a, ProviderCapability b) {
    return static_cast<ProviderCapability>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline bool has_capability(ProviderCapability caps, ProviderCapability flag) {
    return (static_cast<uint32_t>(caps) & static_cast<uint32_t>(flag)) != 0;
}

inline ProviderCapability provider_capabilities(LLMProvider provider) {
    switch (provider) {
        case LLMProvider::OpenAI:
            return ProviderCapability::Chat | ProviderCapability::Vision |
                   ProviderCapability::Embeddings | ProviderCapability::ImageOutput;
        case LLMProvider::Anthropic:
            // No embedding endpoint: embedding calls return an empty result.
            return ProviderCapability::Chat | ProviderCapability::Vision;
        case LLMProvider::Gemini:
            return ProviderCapability::Chat | ProviderCapability::Vision |
                   ProviderCapability::Embeddings | ProviderCapability::ImageOutput;
    }
    return ProviderCapability::None;
}

inline std::string to_string(LLMProvider provider) {
    switch (provider) {
        case LLMProvider::OpenAI: return "openai";
        case LLMProvider::Anthropic: return "anthropic";
        case LLMProvider::Gemini: return "gemini";
    }
    return "unknown";
}

inline std::string to_string(LLMType type) {
    switch (type) {
        case LLMType::Chat: return "chat";
        case LLMType::Embedding: return "embedding";
    }
    return "unknown";
}

/// Documented base URL of each vendor API.
inline std::string default_endpoint(LLMProvider provider) {
    switch (provider) {
        case LLMProvider::OpenAI: return "https://api.openai.com/v1";
        case LLMProvider::Anthropic: return "https://api.anthropic.com/v1";
        case LLMProvider::Gemini: return "https://generativelanguage.googleapis.com/v1beta";
    }
    return {};
}

inline std::string default_api_key_env(LLMProvider provider) {
    switch (provider) {
        case LLMProvider::OpenAI: return "OPENAI_API_KEY";
        case LLMProvider::Anthropic: return "ANTHROPIC_API_KEY";
        case LLMProvider::Gemini: return "GEMINI_API_KEY";
    }
    return {};
}

/// Case-insensitive; also accepts "claude" and "google" as aliases.
std::optional<LLMProvider> parse_provider(const std::string& name);
std::optional<LLMType> parse_llm_type(const std::string& name);
