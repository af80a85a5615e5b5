#include <catch2/catch_test_macros.hpp>
#include "GeminiAdapter.hpp"
#include "JsonSupport.hpp"
#include "LLMErrors.hpp"
#include "TestHelpers.hpp"

namespace {

LLMClient make_client(LLMType type, std::string model = "gemini-test") {
    return LLMClient(LLMProvider::Gemini, "g-test", "", std::move(model), type);
}

std::string image_and_text_response() {
    const std::string b64 = Utils::encode_base64(tiny_png_bytes());
    return R"({"candidates":[{"content":{"role":"model","parts":[)"
           R"({"text":"Here is "},)"
           R"({"inlineData":{"mimeType":"image/png","data":")" + b64 + R"("}},)"
           R"({"text":"your cat."}]},"finishReason":"STOP"}],)"
           R"("usageMetadata":{"promptTokenCount":4,"candidatesTokenCount":8,"totalTokenCount":12}})";
}

} // namespace

TEST_CASE("model_url tolerates the models/ prefix on either side") {
    const std::string base = "https://generativelanguage.googleapis.com/v1beta";
    REQUIRE(GeminiAdapter::model_url(make_client(LLMType::Chat), "generateContent") ==
            base + "/models/gemini-test:generateContent");
    REQUIRE(GeminiAdapter::model_url(make_client(LLMType::Chat, "models/gemini-test"), "embedContent") ==
            base + "/models/gemini-test:embedContent");

    const LLMClient with_models(LLMProvider::Gemini, "k", base + "/models/", "m", LLMType::Chat);
    REQUIRE(GeminiAdapter::model_url(with_models, "generateContent") ==
            base + "/models/m:generateContent");
    REQUIRE(GeminiAdapter::qualified_model(make_client(LLMType::Embedding)) == "models/gemini-test");
}

TEST_CASE("Gemini chat sends roles, system instruction and inline images") {
    HttpProbeGuard probe;
    probe.respond(200, image_and_text_response());

    GeminiAdapter adapter;
    adapter.chat(make_client(LLMType::Chat), {
        LLMMessage(std::nullopt, "system", {LLMMessageType::text("Draw well.")}),
        LLMMessage(std::nullopt, "user", {LLMMessageType::text("A cat"),
                                          LLMMessageType::image_from_bytes(tiny_png_bytes())}),
        LLMMessage(std::nullopt, "assistant", {LLMMessageType::text("Sure")}),
    });

    const HttpRequest request = probe.last_request();
    REQUIRE(request.header("x-goog-api-key") == std::optional<std::string>("g-test"));
    REQUIRE(request.url.find(":generateContent") != std::string::npos);

    const Json::Value body = JsonSupport::parse_or_throw(request.body, "request");
    REQUIRE(body["systemInstruction"]["parts"][0]["text"].asString() == "Draw well.");
    REQUIRE(body["contents"].size() == 2);
    REQUIRE(body["contents"][0]["role"].asString() == "user");
    REQUIRE(body["contents"][0]["parts"][1]["inlineData"]["mimeType"].asString() == "image/png");
    REQUIRE(body["contents"][1]["role"].asString() == "model");
}

TEST_CASE("Gemini replies list images first, then the text") {
    HttpProbeGuard probe;
    probe.respond(200, image_and_text_response());

    GeminiAdapter adapter;
    const auto parts = adapter.chat(make_client(LLMType::Chat),
                                    {LLMMessage(std::nullopt, "user", {LLMMessageType::text("cat")})});
    REQUIRE(parts.size() == 2);
    REQUIRE(parts[0].as_image().bytes == tiny_png_bytes());
    REQUIRE(parts[0].as_image().mime_type == "image/png");
    REQUIRE(parts[1].as_text() == "Here is your cat.");
}

TEST_CASE("Gemini response projections are repeatable") {
    const GeminiResponse response = GeminiResponse::parse(image_and_text_response());
    REQUIRE(response.usage.total_tokens == 12);

    const auto images_first = response_to_image_data(response);
    const auto text_first = response_to_text_data(response);
    REQUIRE(response_to_image_data(response) == images_first);
    REQUIRE(response_to_text_data(response) == text_first);
    REQUIRE(response_to_base64_images(response).size() == 1);
    REQUIRE(response_to_image_mime_types(response) == std::vector<std::string>{"image/png"});
    REQUIRE(GeminiAdapter::to_message_parts(response) == GeminiAdapter::to_message_parts(response));
}

TEST_CASE("Gemini without candidates is a DecodeFailure") {
    for (const std::string body : {std::string(R"({"promptFeedback":{"blockReason":"SAFETY"}})"),
                                   std::string(R"({"candidates":"nope"})")}) {
        try {
            GeminiResponse::parse(body);
            FAIL("expected DecodeFailure");
        } catch (const LlmError& ex) {
            REQUIRE(ex.kind() == LlmErrorKind::DecodeFailure);
        }
    }

    const GeminiResponse empty = GeminiResponse::parse(R"({"candidates":[]})");
    try {
        response_to_text_data(empty);
        FAIL("expected DecodeFailure");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::DecodeFailure);
    }
}

TEST_CASE("Gemini single input uses embedContent") {
    HttpProbeGuard probe;
    probe.respond(200, R"({"embedding":{"values":[0.1,0.2,0.3]}})");

    GeminiAdapter adapter;
    const auto vectors = adapter.embed(make_client(LLMType::Embedding), {"only"});
    REQUIRE(vectors.size() == 1);
    REQUIRE(vectors[0].size() == 3);

    const HttpRequest request = probe.last_request();
    REQUIRE(request.url.ends_with("/models/gemini-test:embedContent"));
    const Json::Value body = JsonSupport::parse_or_throw(request.body, "request");
    REQUIRE(body["model"].asString() == "models/gemini-test");
    REQUIRE(body["content"]["parts"][0]["text"].asString() == "only");
}

TEST_CASE("Gemini several inputs use batchEmbedContents") {
    HttpProbeGuard probe;
    probe.respond(200, R"({"embeddings":[{"values":[1,2]},{"values":[3,4]},{"values":[5,6]}]})");

    GeminiAdapter adapter;
    const auto vectors = adapter.embed(make_client(LLMType::Embedding), {"a", "b", "c"});
    REQUIRE(vectors.size() == 3);
    REQUIRE(vectors[2] == std::vector<float>{5.0f, 6.0f});
    REQUIRE(probe.request_count() == 1);

    const HttpRequest request = probe.last_request();
    REQUIRE(request.url.ends_with(":batchEmbedContents"));
    const Json::Value body = JsonSupport::parse_or_throw(request.body, "request");
    REQUIRE(body["requests"].size() == 3);
    REQUIRE(body["requests"][1]["content"]["parts"][0]["text"].asString() == "b");
}

TEST_CASE("Gemini embedding count mismatch is a DecodeFailure") {
    HttpProbeGuard probe;
    probe.respond(200, R"({"embeddings":[{"values":[1,2]}]})");

    GeminiAdapter adapter;
    try {
        adapter.embed(make_client(LLMType::Embedding), {"a", "b"});
        FAIL("expected DecodeFailure");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::DecodeFailure);
    }
}

TEST_CASE("Gemini usage counts that are not integers are a DecodeFailure") {
    const std::string prefix = R"({"candidates":[{"content":{"parts":[{"text":"hi"}]}}],"usageMetadata":)";
    for (const std::string usage : {std::string(R"({"totalTokenCount":"12"})"),
                                    std::string(R"({"totalTokenCount":3000000000})"),
                                    std::string(R"({"promptTokenCount":[1]})")}) {
        try {
            GeminiResponse::parse(prefix + usage + "}");
            FAIL("expected DecodeFailure for " + usage);
        } catch (const LlmError& ex) {
            REQUIRE(ex.kind() == LlmErrorKind::DecodeFailure);
        }
    }

    const GeminiResponse partial = GeminiResponse::parse(prefix + R"({"totalTokenCount":7})" + "}");
    REQUIRE(partial.usage.total_tokens == 7);
    REQUIRE(partial.usage.prompt_tokens == 0);
}

TEST_CASE("Gemini chat reports a malformed usage block through the future") {
    HttpProbeGuard probe;
    probe.respond(200, R"({"candidates":[{"content":{"parts":[{"text":"hi"}]}}],)"
                       R"("usageMetadata":{"totalTokenCount":"12"}})");

    GeminiAdapter adapter;
    try {
        adapter.chat(make_client(LLMType::Chat),
                     {LLMMessage(std::nullopt, "user", {LLMMessageType::text("hello")})});
        FAIL("expected DecodeFailure");
    } catch (const LlmError& ex) {
        REQUIRE(ex.kind() == LlmErrorKind::DecodeFailure);
    }
    REQUIRE(probe.request_count() == 1);
}
