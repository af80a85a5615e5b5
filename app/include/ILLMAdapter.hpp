#pragma once
#include "LLMClient.hpp"
#include "LLMMessage.hpp"

#include <string>
#include <vector>

/**
 * Translates the neutral message/embedding contract to one vendor's wire
 * format. Implementations keep no per-call state, so one instance serves
 * concurrent calls. Failures are thrown as LlmError.
 */
class ILLMAdapter {
public:
    virtual ~ILLMAdapter() = default;

    virtual LLMProvider provider() const = 0;

    virtual std::vector<LLMMessageType> chat(const LLMClient& client,
                                             const std::vector<LLMMessage>& messages) const = 0;

    /**
     * One vector per input, aligned by index. An empty input list yields an
     * empty result without a request.
     */
    virtual std::vector<std::vector<float>> embed(const LLMClient& client,
                                                  const std::vector<std::string>& inputs) const = 0;
};
