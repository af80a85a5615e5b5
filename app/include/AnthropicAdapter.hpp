#ifndef ANTHROPIC_ADAPTER_HPP
#define ANTHROPIC_ADAPTER_HPP

#include "ILLMAdapter.hpp"
#include "JsonSupport.hpp"

/**
 * Anthropic Messages API.
 *
 * The API has a single top-level `system` slot: the text of every system
 * message is merged into it in order, separated by '\n'. The remaining
 * messages become user/assistant turns; consecutive messages with the same
 * role are folded into one turn so turns always alternate.
 *
 * Anthropic has no embedding endpoint. embed() returns an empty result and
 * never touches the network (see provider_capabilities()).
 */
class AnthropicAdapter : public ILLMAdapter {
public:
    static constexpr int kMaxTokens = 1024;
    static constexpr const char* kApiVersion = "2023-06-01";

    LLMProvider provider() const override { return LLMProvider::Anthropic; }

    std::vector<LLMMessageType> chat(const LLMClient& client,
                                     const std::vector<LLMMessage>& messages) const override;
    std::vector<std::vector<float>> embed(const LLMClient& client,
                                          const std::vector<std::string>& inputs) const override;

    static Json::Value make_chat_payload(const LLMClient& client,
                                         const std::vector<LLMMessage>& messages);
    static std::vector<LLMMessageType> parse_chat_response(const std::string& body);
};

#endif
