#ifndef LLM_DISPATCHER_HPP
#define LLM_DISPATCHER_HPP

#include "LLMClient.hpp"
#include "LLMMessage.hpp"

#include <functional>
#include <future>
#include <string>
#include <vector>

using ChatFn = std::function<std::future<std::vector<LLMMessageType>>(std::vector<LLMMessage>)>;
using EmbeddingFn = std::function<std::future<std::vector<std::vector<float>>>(std::vector<std::string>)>;

/**
 * Binds `client` to its provider's adapter once and returns a reusable
 * callable. Every invocation runs on its own std::async task and shares no
 * state with other invocations. Failures are rethrown by future::get() as
 * LlmError; nothing is retried.
 *
 * Throws LlmError(InvalidInput) if `client` is not a Chat client.
 */
ChatFn get_llm_chat(const LLMClient& client);

/**
 * Same binding for embeddings. The future yields one vector per input, or an
 * empty result when the call failed (the failure is logged) or the provider
 * has no embedding endpoint (Anthropic). A result whose size differs from
 * the input count means failure.
 *
 * Throws LlmError(InvalidInput) if `client` is not an Embedding client.
 */
EmbeddingFn get_llm_embedding(const LLMClient& client);

#endif
