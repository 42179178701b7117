/**
 * @file offline_retry_example.cpp
 * @brief Inspect and replay the durable retry queue
 *
 * This example demonstrates:
 * - Opening the retry queue left behind by earlier runs
 * - Subscribing to queue lifecycle events
 * - Replaying pending uploads once connectivity returns
 * - Removing a single entry by id
 */

#include <kcenon/bulk_upload/bulk_upload.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace kcenon::bulk_upload;

namespace {

void print_entry(const retry_queue_entry& entry) {
    auto t = std::chrono::system_clock::to_time_t(entry.enqueued_at);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::cout << "  " << entry.id << "  " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
              << "  retries=" << entry.retry_count
              << "  " << entry.request.relative_path
              << " (" << entry.request.file.data.size() << " bytes)" << std::endl;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Offline Retry Example" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <command>" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  list                List pending entries" << std::endl;
    std::cout << "  replay              Replay every pending entry now" << std::endl;
    std::cout << "  remove <id>         Drop one entry" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -d, --dir <path>    Queue directory (default: system temp)" << std::endl;
    std::cout << "  -r, --retries <n>   Replays before an entry is discarded (default: 3)" << std::endl;
}

int main(int argc, char* argv[]) {
    retry_queue_config config;
    std::string command;
    std::string entry_id;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-d" || arg == "--dir") {
            if (++i >= argc) {
                std::cerr << "Error: --dir requires an argument" << std::endl;
                return 1;
            }
            config.directory = argv[i];
        } else if (arg == "-r" || arg == "--retries") {
            if (++i >= argc) {
                std::cerr << "Error: --retries requires an argument" << std::endl;
                return 1;
            }
            config.max_retries = static_cast<uint32_t>(std::stoul(argv[i]));
        } else if (command.empty()) {
            command = arg;
        } else {
            entry_id = arg;
        }
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    config.replay_on_status = false;
    retry_queue queue(config, std::make_shared<network_http_transport>());

    queue.on_event([](const retry_queue_event& event) {
        std::cout << "[" << to_string(event.kind) << "] " << event.file_name
                  << " (" << event.entry_id << ", retries=" << event.retry_count << ")";
        if (event.error) {
            std::cout << ": " << *event.error;
        }
        std::cout << std::endl;
    });

    if (command == "list") {
        auto status = queue.status();
        if (!status) {
            std::cerr << "Failed to read queue: " << status.error().message << std::endl;
            return 1;
        }
        std::cout << status.value().pending << " pending upload(s) in "
                  << config.directory << std::endl;
        for (const auto& entry : status.value().entries) {
            print_entry(entry);
        }
        return 0;
    }

    if (command == "replay") {
        auto report = queue.on_connectivity_restored();
        if (!report) {
            std::cerr << "Replay failed: " << report.error().message << std::endl;
            return 1;
        }
        const auto& r = report.value();
        if (r.skipped) {
            std::cout << "Another replay is already running" << std::endl;
            return 0;
        }
        std::cout << "Attempted " << r.attempted << ": " << r.succeeded << " succeeded, "
                  << r.retried << " will retry, " << r.exhausted << " discarded" << std::endl;
        std::cout << queue.pending_count() << " upload(s) still pending" << std::endl;
        return 0;
    }

    if (command == "remove") {
        if (entry_id.empty()) {
            std::cerr << "Error: remove requires an entry id" << std::endl;
            return 1;
        }
        auto removed = queue.remove(entry_id);
        if (!removed) {
            std::cerr << "Failed to remove " << entry_id << ": " << removed.error().message
                      << std::endl;
            return 1;
        }
        std::cout << "Removed " << entry_id << std::endl;
        return 0;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    return 1;
}
