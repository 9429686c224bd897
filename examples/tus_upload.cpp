#include "tusup/core/config.hpp"
#include "tusup/network/asio_http_client.hpp"
#include "tusup/upload/file_source.hpp"
#include "tusup/upload/session_store.hpp"
#include "tusup/upload/tus_client.hpp"

#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --file <path> [options]\n"
              << "  -f, --file <path>      File to upload\n"
              << "  -c, --config <path>    JSON configuration file\n"
              << "  -t, --token <token>    Access token (default: $" << tusup::kAccessTokenEnv << ")\n"
              << "  -s, --store <path>     Remember upload URLs here so uploads can be resumed\n"
              << "      --folder <id>      Move the video into this folder when done\n"
              << "      --poll             Wait for transcoding and print the HLS link\n"
              << "  -v, --verbose          Debug logging\n";
}

std::string creation_body(std::uint64_t size) {
    json body;
    body["upload"]["approach"] = "tus";
    body["upload"]["size"] = size;
    return body.dump();
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> config_path;
    std::optional<fs::path> store_override;
    std::optional<std::string> token_override;
    std::optional<std::string> folder_override;
    fs::path file_path;
    bool poll = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-f" || arg == "--file") && i + 1 < argc) {
            file_path = fs::path(argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-t" || arg == "--token") && i + 1 < argc) {
            token_override = argv[++i];
        } else if ((arg == "-s" || arg == "--store") && i + 1 < argc) {
            store_override = fs::path(argv[++i]);
        } else if (arg == "--folder" && i + 1 < argc) {
            folder_override = argv[++i];
        } else if (arg == "--poll") {
            poll = true;
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    if (file_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    tusup::ClientConfig config;
    if (config_path) {
        auto loaded = tusup::load_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return 1;
        }
        config = loaded.take_value();
    }
    if (token_override) {
        config.access_token = *token_override;
    }
    if (store_override) {
        config.store_path = *store_override;
    }
    if (folder_override) {
        config.folder_id = *folder_override;
    }
    tusup::apply_environment(config);

    auto valid = tusup::validate_config(config);
    if (valid.is_error()) {
        spdlog::error("Invalid configuration: {}", valid.error().message);
        return 1;
    }

    tusup::upload::LocalFileSource file(file_path);
    auto size = file.length();
    if (size.is_error()) {
        spdlog::error("{}", size.error().describe());
        return 1;
    }

    tusup::upload::TusClientOptions options;
    options.creation_endpoint = tusup::network::Url::parse(config.creation_endpoint).take_value();
    options.api_base = tusup::network::Url::parse(config.api_base).take_value();
    options.access_token = config.access_token;
    options.creation_body = creation_body(size.value());
    options.max_chunk_size = config.default_chunk_size;
    options.accept_media_type = config.accept_media_type;

    tusup::network::AsioHttpClientOptions http_options;
    http_options.timeout = config.request_timeout;
    http_options.verify_peer = config.verify_tls;
    tusup::network::AsioHttpClient http(http_options);

    std::unique_ptr<tusup::upload::FileSessionStore> store;
    if (!config.store_path.empty()) {
        store = std::make_unique<tusup::upload::FileSessionStore>(config.store_path);
    }

    tusup::upload::TusClient client(options, file, http, store.get());

    // Ctrl-C pauses the upload, which also discards the remote video
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&client](const boost::system::error_code& ec, int) {
        if (!ec) {
            spdlog::warn("Interrupted, pausing upload");
            auto paused = client.pause();
            if (paused.is_error()) {
                spdlog::error("Pausing failed: {}", paused.error().describe());
            }
        }
    });
    std::thread signal_thread([&signal_context] { signal_context.run(); });

    bool completed = false;
    auto uploaded = client.upload(
        [](double percent) { spdlog::info("Uploaded {:.2f}%", percent); },
        [&completed] { completed = true; });

    signal_context.stop();
    signal_thread.join();

    if (uploaded.is_error()) {
        spdlog::error("Upload failed: {}", uploaded.error().describe());
        return 1;
    }
    if (!completed) {
        spdlog::warn("Upload did not complete");
        return 2;
    }

    if (!config.folder_id.empty()) {
        auto moved = client.move_to_folder(config.folder_id);
        if (moved.is_error()) {
            spdlog::error("Moving video failed: {}", moved.error().describe());
            return 1;
        }
    }

    if (poll) {
        tusup::upload::PollPolicy policy;
        policy.interval = config.poll_interval;
        policy.max_attempts = config.poll_max_attempts;
        auto link = client.playback_link(policy);
        if (link.is_error()) {
            spdlog::error("Waiting for playback link failed: {}", link.error().describe());
            return 1;
        }
        if (link.value()) {
            std::cout << *link.value() << std::endl;
        } else {
            spdlog::warn("No HLS playback link available");
        }
    }

    return 0;
}
