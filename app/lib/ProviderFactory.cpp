#include "ProviderFactory.hpp"
#include "AnthropicAdapter.hpp"
#include "GeminiAdapter.hpp"
#include "LLMErrors.hpp"
#include "OpenAIAdapter.hpp"

std::shared_ptr<const ILLMAdapter> ProviderFactory::create_adapter(LLMProvider provider)
{
    switch (provider) {
        case LLMProvider::OpenAI:
            return std::make_shared<OpenAIAdapter>();
        case LLMProvider::Anthropic:
            return std::make_shared<AnthropicAdapter>();
        case LLMProvider::Gemini:
            return std::make_shared<GeminiAdapter>();
    }
    throw LlmError(LlmErrorKind::InvalidInput, "Unknown LLM provider");
}
