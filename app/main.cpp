/*
 * inference-hub command line front end
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "BackendHub.hpp"
#include "KeyValueStore.hpp"
#include "Logger.hpp"
#include "Settings.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

std::atomic<bool> g_cancel_requested{false};

void handle_interrupt(int signal)
{
    if (signal == SIGINT) {
        g_cancel_requested = true;
    }
}

struct ParsedArguments {
    std::string config_path;
    std::optional<std::string> session_token;
    bool use_cloud{false};
    bool disable_local{false};
    std::vector<std::pair<std::string, std::optional<std::string>>> added_backends;
    std::vector<std::string> removed_backends;
    bool show_status{false};
    bool list_models{false};
    bool show_quota{false};
    std::string model;
    std::string prompt;
    std::vector<std::string> image_files;
    bool stream{false};
    bool show_help{false};
    std::string error;
};

void print_usage(const char* program)
{
    std::cout
        << "Usage: " << program << " [options]\n"
        << "\n"
        << "Options:\n"
        << "  --config <path>       Use this config.ini instead of the default\n"
        << "  --token <token>       Cloud session token\n"
        << "  --use-cloud           Enable the cloud backend (requires --token)\n"
        << "  --no-local            Disable the local daemon\n"
        << "  --add <url>           Register a custom backend\n"
        << "  --api-key <key>       Credential for the preceding --add\n"
        << "  --remove <url>        Forget a custom backend\n"
        << "  --status              Print backend health and connectivity\n"
        << "  --models              Print the merged model catalog\n"
        << "  --quota               Print the cloud quota\n"
        << "  --model <name>        Model to send the prompt to\n"
        << "  --prompt <text>       Prompt to send\n"
        << "  --image <file>        File holding a base64 PNG to attach (repeatable)\n"
        << "  --stream              Print the answer as it arrives\n"
        << "  -h, --help            Show this help\n";
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;

    auto next_value = [&](int& i, const char* flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            parsed.error = std::string("Missing value for ") + flag;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc && parsed.error.empty(); ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--config") == 0) {
            if (auto value = next_value(i, arg)) parsed.config_path = *value;
        } else if (std::strcmp(arg, "--token") == 0) {
            parsed.session_token = next_value(i, arg);
        } else if (std::strcmp(arg, "--use-cloud") == 0) {
            parsed.use_cloud = true;
        } else if (std::strcmp(arg, "--no-local") == 0) {
            parsed.disable_local = true;
        } else if (std::strcmp(arg, "--add") == 0) {
            if (auto value = next_value(i, arg)) parsed.added_backends.emplace_back(*value, std::nullopt);
        } else if (std::strcmp(arg, "--api-key") == 0) {
            auto value = next_value(i, arg);
            if (value && parsed.added_backends.empty()) {
                parsed.error = "--api-key must follow --add";
            } else if (value) {
                parsed.added_backends.back().second = *value;
            }
        } else if (std::strcmp(arg, "--remove") == 0) {
            if (auto value = next_value(i, arg)) parsed.removed_backends.push_back(*value);
        } else if (std::strcmp(arg, "--status") == 0) {
            parsed.show_status = true;
        } else if (std::strcmp(arg, "--models") == 0) {
            parsed.list_models = true;
        } else if (std::strcmp(arg, "--quota") == 0) {
            parsed.show_quota = true;
        } else if (std::strcmp(arg, "--model") == 0) {
            if (auto value = next_value(i, arg)) parsed.model = *value;
        } else if (std::strcmp(arg, "--prompt") == 0) {
            if (auto value = next_value(i, arg)) parsed.prompt = *value;
        } else if (std::strcmp(arg, "--image") == 0) {
            if (auto value = next_value(i, arg)) parsed.image_files.push_back(*value);
        } else if (std::strcmp(arg, "--stream") == 0) {
            parsed.stream = true;
        } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            parsed.show_help = true;
        } else {
            parsed.error = std::string("Unknown option: ") + arg;
        }
    }

    if (parsed.error.empty() && !parsed.prompt.empty() && parsed.model.empty()) {
        parsed.error = "--prompt requires --model";
    }
    if (parsed.error.empty() && parsed.use_cloud && !parsed.session_token) {
        parsed.error = "--use-cloud requires --token";
    }
    return parsed;
}

bool initialize_loggers(const Settings& settings)
{
    try {
        Logger::setup_loggers(settings.get_config_dir(), settings.get_log_level());
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

std::optional<std::string> read_image_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    std::string data = contents.str();
    while (!data.empty() && (data.back() == '\n' || data.back() == '\r')) {
        data.pop_back();
    }
    return data;
}

/**
 * Prints hub notifications the user should see.
 */
class ConsoleObserver : public HubObserver {
public:
    void on_quota_threshold_crossed(const QuotaSnapshot& snapshot) override
    {
        std::cerr << "You have used " << snapshot.used << " of " << snapshot.limit
                  << " cloud requests. Consider upgrading your plan.\n";
    }

    void on_session_expired() override
    {
        std::cerr << "Your cloud session has expired. Please sign in again.\n";
    }

    void on_empty_local_catalog(const std::string& address) override
    {
        std::cerr << "The local daemon at " << address << " has no models installed.\n";
    }
};

void print_status(const BackendHub& hub)
{
    for (const auto& backend : hub.registry().list()) {
        std::cout << to_string(backend.role) << "\t" << backend.address << "\t"
                  << (backend.enabled ? "enabled" : "disabled") << "\t"
                  << to_string(backend.health);
        if (!backend.detail.empty()) {
            std::cout << "\t" << backend.detail;
        }
        std::cout << "\n";
    }
    std::cout << "connectivity\t" << to_string(hub.connectivity()) << "\n";
}

void print_models(const ModelList& models)
{
    if (models.empty()) {
        std::cout << "No models available\n";
        return;
    }
    for (const auto& model : models) {
        std::cout << model.name << "\t" << model.server;
        if (model.parameter_size) {
            std::cout << "\t" << *model.parameter_size;
        }
        if (model.multimodal) {
            std::cout << "\tvision";
        }
        if (model.pro) {
            std::cout << "\tpro";
        }
        std::cout << "\n";
    }
}

void print_quota(const QuotaRefreshResult& result)
{
    if (result.status != QuotaRefreshStatus::Ok || !result.snapshot) {
        std::cout << "Quota unavailable: " << result.error_message << "\n";
        return;
    }
    const QuotaSnapshot& snapshot = *result.snapshot;
    std::cout << "Tier: " << snapshot.tier_name << "\n"
              << "Used: " << snapshot.used << "\n"
              << "Remaining: " << snapshot.remaining << " of " << snapshot.limit << "\n";
}

int send_prompt(BackendHub& hub, const ParsedArguments& args)
{
    CompletionRequest request;
    request.model = args.model;
    request.prompt = args.prompt;
    request.stream = args.stream;
    request.cancel_flag = &g_cancel_requested;
    if (args.stream) {
        request.on_chunk = [](const std::string& chunk) {
            std::cout << chunk << std::flush;
        };
    }

    for (const auto& path : args.image_files) {
        auto image = read_image_file(path);
        if (!image) {
            std::cerr << "Cannot read image file: " << path << "\n";
            return 1;
        }
        request.images.push_back(std::move(*image));
    }

    std::signal(SIGINT, handle_interrupt);
    const CompletionResponse response = hub.send(std::move(request));
    std::signal(SIGINT, SIG_DFL);

    if (!response.success) {
        if (args.stream) {
            std::cout << "\n";
        }
        std::cerr << "Error (" << to_string(response.error) << "): " << response.error_message << "\n";
        return response.error == CompletionError::Cancelled ? 130 : 1;
    }

    if (args.stream) {
        std::cout << "\n";
    } else {
        std::cout << response.text << "\n";
    }
    if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
        logger->info("'{}' answered by {} in {}ms", response.model_used, response.server,
                     response.latency.count());
    }
    return 0;
}

int run(const ParsedArguments& args)
{
    Settings settings(args.config_path);
    settings.load();
    if (!initialize_loggers(settings)) {
        return 1;
    }

    auto store = std::make_shared<JsonFileStore>(settings.get_state_file());
    BackendHub hub(settings, store);
    hub.add_observer(std::make_shared<ConsoleObserver>());
    hub.load_persisted();

    for (const auto& [address, credential] : args.added_backends) {
        if (!hub.add_custom_backend(address, credential)) {
            std::cerr << "Backend already registered or invalid: " << address << "\n";
        }
    }
    for (const auto& address : args.removed_backends) {
        if (!hub.remove_custom_backend(address)) {
            std::cerr << "No custom backend at " << address << "\n";
        }
    }

    if (args.disable_local) {
        hub.set_local_enabled(false);
    }
    if (args.session_token) {
        hub.set_session_token(args.session_token);
    }
    if (args.use_cloud && !hub.set_cloud_enabled(true)) {
        std::cerr << "Cannot enable the cloud backend without a session token\n";
        return 1;
    }

    hub.check_all_backends();
    const ModelList models = hub.refresh_models();

    if (args.show_status) {
        print_status(hub);
    }
    if (args.list_models) {
        print_models(models);
    }
    if (args.show_quota) {
        print_quota(hub.refresh_quota());
    }
    if (!args.prompt.empty()) {
        return send_prompt(hub, args);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    const ParsedArguments args = parse_command_line(argc, argv);
    if (!args.error.empty()) {
        std::cerr << args.error << "\n\n";
        print_usage(argv[0]);
        return 2;
    }
    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        return run(args);
    } catch (const std::exception& e) {
        if (auto logger = Logger::get_logger(Logger::kCoreLogger)) {
            logger->critical("Fatal error: {}", e.what());
        }
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
