#ifndef GEMINI_ADAPTER_HPP
#define GEMINI_ADAPTER_HPP

#include "GeminiResponse.hpp"
#include "ILLMAdapter.hpp"
#include "JsonSupport.hpp"

/**
 * Google Generative Language API (x-goog-api-key header auth).
 *
 * Chat replies may mix inline images and text; the neutral reply lists every
 * image first, then one text part with the first candidate's text.
 *
 * Embeddings: one input goes to :embedContent, two or more to
 * :batchEmbedContents. Both paths return one vector per input.
 */
class GeminiAdapter : public ILLMAdapter {
public:
    LLMProvider provider() const override { return LLMProvider::Gemini; }

    std::vector<LLMMessageType> chat(const LLMClient& client,
                                     const std::vector<LLMMessage>& messages) const override;
    std::vector<std::vector<float>> embed(const LLMClient& client,
                                          const std::vector<std::string>& inputs) const override;

    /// generateContent without the neutral conversion, for callers that want every projection.
    GeminiResponse generate(const LLMClient& client, const std::vector<LLMMessage>& messages) const;

    static Json::Value make_generate_payload(const std::vector<LLMMessage>& messages);
    static std::vector<LLMMessageType> to_message_parts(const GeminiResponse& response);

    /// "{endpoint}/models/{model}:{method}", tolerating a "models/" prefix on either side.
    static std::string model_url(const LLMClient& client, const std::string& method);
    /// Model id in the "models/..." form the embedding bodies expect.
    static std::string qualified_model(const LLMClient& client);
};

#endif // GEMINI_ADAPTER_HPP
