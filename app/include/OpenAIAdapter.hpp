#ifndef OPENAI_ADAPTER_HPP
#define OPENAI_ADAPTER_HPP

#include "ILLMAdapter.hpp"
#include "JsonSupport.hpp"

/**
 * OpenAI-style REST: bearer auth, {endpoint}/chat/completions and
 * {endpoint}/embeddings. Also fits OpenAI-compatible servers.
 */
class OpenAIAdapter : public ILLMAdapter {
public:
    static constexpr int kMaxTokens = 1024;

    LLMProvider provider() const override { return LLMProvider::OpenAI; }

    std::vector<LLMMessageType> chat(const LLMClient& client,
                                     const std::vector<LLMMessage>& messages) const override;
    std::vector<std::vector<float>> embed(const LLMClient& client,
                                          const std::vector<std::string>& inputs) const override;

    static Json::Value make_chat_payload(const LLMClient& client,
                                         const std::vector<LLMMessage>& messages);
    static std::vector<LLMMessageType> parse_chat_response(const std::string& body);
    static std::vector<std::vector<float>> parse_embedding_response(const std::string& body);

private:
    static Json::Value convert_message(const LLMMessage& message);
    static std::vector<LLMMessageType> convert_content_items(const Json::Value& items);
};

#endif
