#include "ClientSettings.hpp"
#include "ImageUtils.hpp"
#include "JsonSupport.hpp"
#include "LLMDispatcher.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>


bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitConfig = 2;
constexpr int kExitCallFailed = 3;
constexpr std::size_t kPreviewValues = 4;

struct ParsedArguments {
    std::string config_path;
    bool verbose{false};
    std::string dump_requests_dir;
    std::string system_prompt;
    std::vector<std::string> images;
    std::string save_images_dir;
    std::vector<std::string> positional;
    std::string error;
};

void print_usage()
{
    std::cout <<
        "Usage: llm-bridge [--config FILE] [--verbose] [--dump-requests DIR] <command> ...\n"
        "\n"
        "Commands:\n"
        "  profiles                                 List configured profiles\n"
        "  chat <profile> [--system TEXT] [--image SRC]... [--save-images DIR] <prompt>\n"
        "  embed <profile> <text>...\n"
        "\n"
        "SRC may be a file path, an http(s) URL or base64 data.\n";
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;

    auto take_value = [&](int& i, std::string& out) {
        if (i + 1 >= argc) {
            parsed.error = std::string("Missing value for ") + argv[i];
            return false;
        }
        out = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (!take_value(i, parsed.config_path)) break;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            parsed.verbose = true;
        } else if (std::strcmp(argv[i], "--dump-requests") == 0) {
            if (!take_value(i, parsed.dump_requests_dir)) break;
        } else if (std::strcmp(argv[i], "--system") == 0) {
            if (!take_value(i, parsed.system_prompt)) break;
        } else if (std::strcmp(argv[i], "--image") == 0) {
            std::string source;
            if (!take_value(i, source)) break;
            parsed.images.push_back(std::move(source));
        } else if (std::strcmp(argv[i], "--save-images") == 0) {
            if (!take_value(i, parsed.save_images_dir)) break;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            parsed.positional.clear();
            parsed.positional.emplace_back("help");
            break;
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            parsed.error = std::string("Unknown option ") + argv[i];
            break;
        } else {
            parsed.positional.emplace_back(argv[i]);
        }
    }
    return parsed;
}

LLMClient::RequestHook make_dump_hook(const std::string& directory)
{
    return [directory](const std::string& url, const std::string& json_body) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        const auto path = std::filesystem::path(directory) / "last_request.json";

        Json::Value record(Json::objectValue);
        record["url"] = url;
        try {
            record["body"] = JsonSupport::parse_or_throw(json_body, "request");
        } catch (const LlmError&) {
            record["body"] = json_body;
        }

        std::ofstream out(path, std::ios::trunc);
        out << JsonSupport::to_pretty_string(record) << "\n";
        if (!out) {
            if (auto logger = Logger::get_logger("cli_logger")) {
                logger->warn("Could not write request dump {}", path.string());
            }
        }
    };
}

std::string join_words(const std::vector<std::string>& words, std::size_t first)
{
    std::string joined;
    for (std::size_t i = first; i < words.size(); ++i) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += words[i];
    }
    return joined;
}

int report_error(const LlmError& ex)
{
    std::cerr << "Error (" << to_string(ex.kind()) << "): " << ex.what() << "\n";
    if (ex.kind() == LlmErrorKind::ProviderError && !ex.provider_body().empty()) {
        std::cerr << ex.provider_body() << "\n";
    }
    if (auto logger = Logger::get_logger("cli_logger")) {
        logger->error("{}: {}", to_string(ex.kind()), ex.what());
    }
    return ex.kind() == LlmErrorKind::InvalidInput ? kExitUsage : kExitCallFailed;
}

int run_chat(const LLMClient& client, const ParsedArguments& args)
{
    const std::string prompt = join_words(args.positional, 2);
    if (prompt.empty() && args.images.empty()) {
        std::cerr << "chat needs a prompt or at least one --image\n";
        return kExitUsage;
    }

    std::vector<LLMMessage> messages;
    if (!args.system_prompt.empty()) {
        messages.emplace_back(std::nullopt, "system",
                              std::vector<LLMMessageType>{LLMMessageType::text(args.system_prompt)});
    }
    std::vector<LLMMessageType> parts;
    if (!prompt.empty()) {
        parts.push_back(LLMMessageType::text(prompt));
    }
    for (const auto& source : args.images) {
        parts.push_back(LLMMessageType::image(source));
    }
    messages.emplace_back(std::nullopt, "user", std::move(parts));

    ChatFn chat = get_llm_chat(client);
    const std::vector<LLMMessageType> reply = chat(std::move(messages)).get();

    std::vector<Utils::Bytes> images;
    for (const auto& part : reply) {
        if (part.is_text()) {
            if (!part.as_text().empty()) {
                std::cout << part.as_text() << "\n";
            }
        } else {
            images.push_back(part.as_image().bytes);
            if (args.save_images_dir.empty()) {
                std::cout << "[image " << images.size() - 1 << ": " << part.as_image().mime_type
                          << ", " << part.as_image().bytes.size() << " bytes]\n";
            }
        }
    }

    if (!args.save_images_dir.empty() && !images.empty()) {
        for (const auto& path : ImageUtils::save_images_to_output_dir(images, args.save_images_dir)) {
            std::cout << "Saved " << path.string() << "\n";
        }
    }
    return kExitOk;
}

int run_embed(const LLMClient& client, const ParsedArguments& args)
{
    std::vector<std::string> inputs(args.positional.begin() + 2, args.positional.end());
    if (inputs.empty()) {
        std::cerr << "embed needs at least one text\n";
        return kExitUsage;
    }
    if (!has_capability(provider_capabilities(client.provider()), ProviderCapability::Embeddings)) {
        std::cerr << to_string(client.provider()) << " has no embedding endpoint\n";
        return kExitCallFailed;
    }

    const std::size_t expected = inputs.size();
    EmbeddingFn embed = get_llm_embedding(client);
    const auto vectors = embed(std::move(inputs)).get();
    if (vectors.size() != expected) {
        std::cerr << "Embedding failed: got " << vectors.size() << " vector(s) for "
                  << expected << " input(s); see the log for details\n";
        return kExitCallFailed;
    }

    for (std::size_t i = 0; i < vectors.size(); ++i) {
        std::cout << i << ": " << vectors[i].size() << " dims [";
        for (std::size_t j = 0; j < vectors[i].size() && j < kPreviewValues; ++j) {
            std::cout << (j ? ", " : "") << vectors[i][j];
        }
        std::cout << (vectors[i].size() > kPreviewValues ? ", ...]\n" : "]\n");
    }
    return kExitOk;
}

int run_application(const ParsedArguments& args)
{
    const std::string& command = args.positional.front();
    if (command == "help") {
        print_usage();
        return kExitOk;
    }

    ClientSettings settings = args.config_path.empty()
        ? ClientSettings()
        : ClientSettings(args.config_path);
    if (!settings.load()) {
        std::cerr << "Cannot read config file " << settings.config_path() << "\n";
        return kExitConfig;
    }

    if (command == "profiles") {
        int status = kExitOk;
        for (const auto& name : settings.profile_names()) {
            try {
                const ClientProfile profile = settings.get_profile(name);
                std::cout << name << "\t" << to_string(profile.provider) << "\t"
                          << to_string(profile.type) << "\t" << profile.model << "\n";
            } catch (const LlmError& ex) {
                std::cerr << "Configuration error: " << ex.what() << "\n";
                status = kExitConfig;
            }
        }
        return status;
    }

    if (command != "chat" && command != "embed") {
        std::cerr << "Unknown command '" << command << "'\n";
        print_usage();
        return kExitUsage;
    }
    if (args.positional.size() < 2) {
        std::cerr << command << " needs a profile name\n";
        return kExitUsage;
    }

    std::optional<LLMClient> resolved;
    try {
        resolved = settings.make_client(args.positional[1]);
    } catch (const LlmError& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return kExitConfig;
    }
    LLMClient client = *resolved;
    if (!args.dump_requests_dir.empty()) {
        client = client.with_request_hook(make_dump_hook(args.dump_requests_dir));
    }

    if (auto logger = Logger::get_logger("cli_logger")) {
        logger->info("Running {} with profile '{}' ({} / {})", command, args.positional[1],
                     to_string(client.provider()), client.model());
    }
    return command == "chat" ? run_chat(client, args) : run_embed(client, args);
}

} // namespace


int main(int argc, char** argv)
{
    const ParsedArguments args = parse_command_line(argc, argv);
    if (!args.error.empty()) {
        std::cerr << args.error << "\n";
        print_usage();
        return kExitUsage;
    }
    if (args.positional.empty()) {
        print_usage();
        return kExitUsage;
    }

    initialize_loggers();
    if (args.verbose) {
        for (const char* name : {"core_logger", "cli_logger"}) {
            if (auto logger = Logger::get_logger(name)) {
                logger->set_level(spdlog::level::debug);
            }
        }
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    struct CurlCleanup {
        ~CurlCleanup() { curl_global_cleanup(); }
    } curl_cleanup;

    try {
        return run_application(args);
    } catch (const LlmError& ex) {
        return report_error(ex);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("cli_logger")) {
            logger->critical("Error: {}", ex.what());
        }
        std::fprintf(stderr, "Error: %s\n", ex.what());
        return kExitCallFailed;
    }
}
