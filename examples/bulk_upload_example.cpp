/**
 * @file bulk_upload_example.cpp
 * @brief Upload every file of a directory with live progress
 *
 * This example demonstrates:
 * - Building an upload engine against a destination API
 * - Consuming progress events from the bounded progress channel
 * - Cancelling a run with Ctrl+C
 * - Reading per-file results and batch statistics
 */

#include <kcenon/bulk_upload/bulk_upload.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::bulk_upload;

namespace {

std::atomic<upload_engine*> g_engine{nullptr};

void on_signal(int /*signal*/) {
    if (auto* engine = g_engine.load()) {
        engine->cancel();
    }
}

auto mime_type_for(const std::filesystem::path& path) -> std::string {
    auto ext = path.extension().string();
    if (ext == ".jpg" || ext == ".jpeg" || ext == ".JPG" || ext == ".JPEG") return "image/jpeg";
    if (ext == ".png" || ext == ".PNG") return "image/png";
    if (ext == ".heic" || ext == ".HEIC") return "image/heic";
    if (ext == ".mp4" || ext == ".MP4") return "video/mp4";
    if (ext == ".mov" || ext == ".MOV") return "video/quicktime";
    return "application/octet-stream";
}

/**
 * @brief Collect regular files under @p root, keeping their relative paths
 */
auto collect_files(const std::filesystem::path& root) -> std::vector<file_descriptor> {
    std::vector<file_descriptor> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        file_descriptor file;
        file.name = entry.path().filename().string();
        file.size_bytes = entry.file_size();
        file.mime_type = mime_type_for(entry.path());
        file.relative_path = std::filesystem::relative(entry.path(), root).generic_string();
        file.source_path = entry.path();
        files.push_back(std::move(file));
    }
    return files;
}

void print_progress(const progress_event& event) {
    constexpr int bar_width = 40;
    int filled = static_cast<int>(event.percent / 100.0 * bar_width);

    std::cout << "\r[";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << event.percent << "% "
              << event.completed_files << "/" << event.total_files << " " << event.message
              << "     " << std::flush;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Bulk Upload Example" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <directory>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -a, --api <url>        Destination API base (default: http://localhost:8080)" << std::endl;
    std::cout << "  -t, --token <token>    Bearer token (default: $BULK_UPLOAD_TOKEN)" << std::endl;
    std::cout << "  -b, --batch <n>        Files per destination request (default: by memory)" << std::endl;
    std::cout << "  -j, --jobs <n>         Cap on parallel uploads per chunk" << std::endl;
    std::cout << "  --queue-on-timeout     Also queue uploads that timed out" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string api_base = "http://localhost:8080";
    std::string token;
    if (const char* env = std::getenv("BULK_UPLOAD_TOKEN")) {
        token = env;
    }
    std::size_t batch_size = 0;
    std::size_t jobs = 0;
    bool queue_on_timeout = false;
    std::string directory;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-a" || arg == "--api") {
            if (++i >= argc) {
                std::cerr << "Error: --api requires an argument" << std::endl;
                return 1;
            }
            api_base = argv[i];
        } else if (arg == "-t" || arg == "--token") {
            if (++i >= argc) {
                std::cerr << "Error: --token requires an argument" << std::endl;
                return 1;
            }
            token = argv[i];
        } else if (arg == "-b" || arg == "--batch") {
            if (++i >= argc) {
                std::cerr << "Error: --batch requires an argument" << std::endl;
                return 1;
            }
            batch_size = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            jobs = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "--queue-on-timeout") {
            queue_on_timeout = true;
        } else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        } else {
            directory = arg;
        }
    }

    if (directory.empty() || !std::filesystem::is_directory(directory)) {
        print_usage(argv[0]);
        return 1;
    }

    auto files = collect_files(directory);
    std::cout << "Found " << files.size() << " files in " << directory << std::endl;
    std::cout << "Device batch size: " << default_batch_size() << std::endl;

    auto built = upload_engine::builder()
                     .with_api_base(api_base)
                     .with_batch_size(batch_size)
                     .with_concurrency_hint(jobs)
                     .with_queue_on_timeout(queue_on_timeout)
                     .build();
    if (!built) {
        std::cerr << "Failed to create engine: " << built.error().message << std::endl;
        return 1;
    }
    auto& engine = built.value();

    g_engine.store(&engine);
    std::signal(SIGINT, on_signal);

    auto channel = engine.progress();
    auto future = engine.run_upload_async(files, token);

    while (true) {
        auto event = channel->pop_for(std::chrono::milliseconds(200));
        if (event) {
            print_progress(*event);
            if (is_terminal(event->kind)) {
                break;
            }
        } else if (future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            break;
        }
    }
    std::cout << std::endl;

    auto completion = future.get();
    g_engine.store(nullptr);

    if (!completion) {
        std::cerr << "Upload run failed: " << completion.error().message << std::endl;
        return 1;
    }

    const auto& c = completion.value();
    std::cout << std::endl;
    std::cout << "Session:   " << c.session_id << std::endl;
    std::cout << "Status:    " << to_string(c.status) << std::endl;
    std::cout << "Files:     " << c.stats.success_count << " succeeded, "
              << c.stats.fail_count << " failed" << std::endl;
    std::cout << "Size:      " << std::fixed << std::setprecision(2) << c.stats.total_size_mb
              << " MB in " << c.stats.total_time_sec << " s" << std::endl;
    std::cout << "Speed:     " << c.stats.avg_speed_mbps << " MB/s" << std::endl;
    if (c.queued_for_retry > 0) {
        std::cout << "Queued:    " << c.queued_for_retry << " upload(s) for retry" << std::endl;
    }

    for (const auto& r : c.results) {
        if (!r.success && !r.is_cancelled()) {
            std::cout << "  FAILED " << r.relative_path << ": " << r.error.value_or("") << std::endl;
        }
    }

    return c.status == upload_run_status::completed ? 0 : 2;
}
