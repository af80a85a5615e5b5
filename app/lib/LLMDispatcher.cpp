#include "LLMDispatcher.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"
#include "ProviderFactory.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace {

void require_type(const LLMClient& client, LLMType expected)
{
    if (client.llm_type() != expected) {
        throw LlmError(LlmErrorKind::InvalidInput,
                       "Client for " + to_string(client.provider()) + " model '" + client.model() +
                       "' is configured for " + to_string(client.llm_type()) +
                       ", not " + to_string(expected));
    }
}

} // namespace


ChatFn get_llm_chat(const LLMClient& client)
{
    require_type(client, LLMType::Chat);
    std::shared_ptr<const ILLMAdapter> adapter = ProviderFactory::create_adapter(client.provider());

    return [adapter, client](std::vector<LLMMessage> messages) {
        return std::async(std::launch::async, [adapter, client, messages = std::move(messages)]() {
            return adapter->chat(client, messages);
        });
    };
}


EmbeddingFn get_llm_embedding(const LLMClient& client)
{
    require_type(client, LLMType::Embedding);
    std::shared_ptr<const ILLMAdapter> adapter = ProviderFactory::create_adapter(client.provider());

    return [adapter, client](std::vector<std::string> inputs) {
        return std::async(std::launch::async, [adapter, client, inputs = std::move(inputs)]() {
            try {
                return adapter->embed(client, inputs);
            } catch (const LlmError& ex) {
                if (auto logger = Logger::get_logger("core_logger")) {
                    logger->warn("{} embedding failed ({}): {}",
                                 to_string(client.provider()), to_string(ex.kind()), ex.what());
                }
                return std::vector<std::vector<float>>{};
            }
        });
    };
}
