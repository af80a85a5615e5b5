#include <catch2/catch_test_macros.hpp>
#include "LLMDispatcher.hpp"
#include "LLMErrors.hpp"
#include "ProviderFactory.hpp"
#include "TestHelpers.hpp"

#include <mutex>

namespace {

std::vector<LLMMessage> hello() {
    return {LLMMessage(std::nullopt, "user", {LLMMessageType::text("hello")})};
}

} // namespace

TEST_CASE("ProviderFactory returns the adapter for each provider") {
    for (LLMProvider provider : {LLMProvider::OpenAI, LLMProvider::Anthropic, LLMProvider::Gemini}) {
        const auto adapter = ProviderFactory::create_adapter(provider);
        REQUIRE(adapter);
        REQUIRE(adapter->provider() == provider);
    }
}

TEST_CASE("Requesting the wrong call family throws InvalidInput") {
    const LLMClient chat_client(LLMProvider::OpenAI, "k", "", "gpt", LLMType::Chat);
    const LLMClient embed_client(LLMProvider::OpenAI, "k", "", "emb", LLMType::Embedding);

    try {
        get_llm_embedding(chat_client);
        FAIL("expected InvalidInput");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::InvalidInput);
    }
    try {
        get_llm_chat(embed_client);
        FAIL("expected InvalidInput");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::InvalidInput);
    }
}

TEST_CASE("Chat callable is reusable and resolves through the future") {
    HttpProbeGuard probe;
    probe.respond(200, R"({"content":[{"type":"text","text":"first"}]})");
    probe.respond(200, R"({"content":[{"type":"text","text":"second"}]})");

    const LLMClient client(LLMProvider::Anthropic, "k", "", "claude", LLMType::Chat);
    ChatFn chat = get_llm_chat(client);

    REQUIRE(chat(hello()).get()[0].as_text() == "first");
    REQUIRE(chat(hello()).get()[0].as_text() == "second");
    REQUIRE(probe.request_count() == 2);
}

TEST_CASE("Chat failures surface from future::get without retry") {
    HttpProbeGuard probe;
    const std::string vendor = R"({"error":{"message":"quota exceeded"}})";
    probe.respond(429, vendor);

    const LLMClient client(LLMProvider::OpenAI, "k", "", "gpt", LLMType::Chat);
    auto pending = get_llm_chat(client)(hello());
    try {
        pending.get();
        FAIL("expected ProviderError");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::ProviderError);
        REQUIRE(ex.http_status() == 429);
        REQUIRE(ex.provider_body() == vendor);
    }
    REQUIRE(probe.request_count() == 1);
}

TEST_CASE("Invalid chat input is reported through the future") {
    HttpProbeGuard probe;
    const LLMClient client(LLMProvider::Gemini, "k", "", "gemini", LLMType::Chat);
    auto pending = get_llm_chat(client)({});
    try {
        pending.get();
        FAIL("expected InvalidInput");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::InvalidInput);
    }
    REQUIRE(probe.request_count() == 0);
}

TEST_CASE("Embedding failures become an empty result") {
    HttpProbeGuard probe;
    probe.respond(500, R"({"error":{"message":"internal"}})");

    const LLMClient client(LLMProvider::OpenAI, "k", "", "emb", LLMType::Embedding);
    const auto vectors = get_llm_embedding(client)({"a", "b"}).get();
    REQUIRE(vectors.empty());
    REQUIRE(probe.request_count() == 1);
}

TEST_CASE("Anthropic embedding callable yields an empty result") {
    HttpProbeGuard probe;
    const LLMClient client(LLMProvider::Anthropic, "k", "", "claude", LLMType::Embedding);
    REQUIRE(get_llm_embedding(client)({"a"}).get().empty());
    REQUIRE(probe.request_count() == 0);
    REQUIRE_FALSE(has_capability(provider_capabilities(LLMProvider::Anthropic),
                                 ProviderCapability::Embeddings));
}

TEST_CASE("Concurrent calls on one callable do not interfere") {
    HttpProbeGuard probe;
    probe.respond(200, R"({"embedding":{"values":[1,2,3]}})");

    const LLMClient client(LLMProvider::Gemini, "k", "", "emb", LLMType::Embedding);
    EmbeddingFn embed = get_llm_embedding(client);

    std::vector<std::future<std::vector<std::vector<float>>>> pending;
    for (int i = 0; i < 8; ++i) {
        pending.push_back(embed({"text " + std::to_string(i)}));
    }
    for (auto& result : pending) {
        const auto vectors = result.get();
        REQUIRE(vectors.size() == 1);
        REQUIRE(vectors[0].size() == 3);
    }
    REQUIRE(probe.request_count() == 8);
}

TEST_CASE("Request hook sees the URL and body before sending") {
    HttpProbeGuard probe;
    probe.respond(200, R"({"choices":[{"message":{"content":"hi"}}]})");

    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> seen;
    const LLMClient client = LLMClient(LLMProvider::OpenAI, "secret", "http://localhost:9999/v1",
                                       "gpt", LLMType::Chat)
        .with_request_hook([&](const std::string& url, const std::string& body) {
            std::lock_guard<std::mutex> lock(mutex);
            seen.emplace_back(url, body);
        });

    get_llm_chat(client)(hello()).get();
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].first == "http://localhost:9999/v1/chat/completions");
    REQUIRE(seen[0].second == probe.last_request().body);
    REQUIRE(seen[0].second.find("secret") == std::string::npos);
}
