#include "resumedl/completion_handler.hpp"
#include "resumedl/config.hpp"
#include "resumedl/console_view.hpp"
#include "resumedl/detail/curl_utils.hpp"
#include "resumedl/logging.hpp"
#include "resumedl/resume_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) { g_interrupted = true; }

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url>\n"
              << "       " << programName << " [options] --resume\n"
              << "       " << programName << " [options] --cancel" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Save finished files here (default: current directory)\n"
              << "  -s <directory>   Keep resume state and partial files here\n"
              << "  -i <ms>          Minimum interval between progress updates (default: 100)\n"
              << "  -r <retries>     Retry a failed transfer automatically (default: 0)\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message\n"
              << "Ctrl-C pauses the download; run again to resume." << std::endl;
}

bool isTerminal(resumedl::JobState state) {
    return state != resumedl::JobState::Active;
}

int exitCodeFor(const resumedl::DownloadJob& job) {
    switch (job.state) {
    case resumedl::JobState::Completed:
    case resumedl::JobState::Paused:
    case resumedl::JobState::Idle:
        return 0;
    case resumedl::JobState::Interrupted:
        return 2;
    default:
        return 1;
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        resumedl::detail::ensureCurlInitialized();
        resumedl::EngineConfig config = resumedl::EngineConfig::defaults();
        resumedl::LogConfig log_config;
        log_config.level = spdlog::level::warn;
        bool resume_only = false;
        bool cancel_only = false;
        std::optional<std::string> url;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-d" || option == "-s" || option == "-i" || option == "-r") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                const std::string value = argv[arg_index + 1];

                if (option == "-d") {
                    config.download_dir = value;
                } else if (option == "-s") {
                    const auto download_dir = config.download_dir;
                    config = resumedl::EngineConfig::underRoot(value);
                    config.download_dir = download_dir;
                } else {
                    int number = 0;
                    try {
                        number = std::stoi(value);
                    } catch (const std::exception&) {
                        throw std::runtime_error("Invalid number for " + option + ": " + value);
                    }
                    if (number < 0) {
                        throw std::runtime_error("Negative value for " + option);
                    }
                    if (option == "-i") {
                        config.progress_interval = std::chrono::milliseconds(number);
                    } else {
                        config.retry.max_attempts = number;
                    }
                }
                arg_index += 2;
            } else if (option == "-v") {
                log_config.level = spdlog::level::debug;
                ++arg_index;
            } else if (option == "--resume") {
                resume_only = true;
                ++arg_index;
            } else if (option == "--cancel") {
                cancel_only = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (arg_index < argc) {
            url = argv[arg_index++];
        }
        if (arg_index != argc || (url && (resume_only || cancel_only)) ||
            (!url && !resume_only && !cancel_only)) {
            printUsage(argv[0]);
            return 1;
        }

        resumedl::initLogging(log_config);
        resumedl::ResumeCoordinator coordinator(config);

        if (cancel_only) {
            coordinator.cancel();
            std::cout << "Cancelled; resume state cleared." << std::endl;
            return 0;
        }

        const auto restored = coordinator.snapshot();
        if (resume_only && !restored.resumable()) {
            std::cerr << "Nothing to resume." << std::endl;
            return 1;
        }

        const std::string source = restored.resumable() ? restored.source_url : url.value_or("");
        resumedl::ConsoleView view(std::cout, resumedl::CompletionHandler::destinationName(source));

        std::mutex done_mutex;
        std::condition_variable done_cv;
        bool done = false;
        const auto subscription = coordinator.publisher().subscribe([&](const resumedl::StatusView& status) {
            view.render(status);
            if (isTerminal(status.state)) {
                std::lock_guard<std::mutex> lock(done_mutex);
                done = true;
                done_cv.notify_all();
            }
        });

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        coordinator.start(url);

        while (true) {
            std::unique_lock<std::mutex> lock(done_mutex);
            done_cv.wait_for(lock, std::chrono::milliseconds(100));
            const auto job = coordinator.snapshot();
            if (job.state == resumedl::JobState::Active) {
                done = false;
            }
            if (g_interrupted) {
                lock.unlock();
                coordinator.pause();
                break;
            }
            if (done && isTerminal(job.state) && !coordinator.retryPending()) {
                break;
            }
        }

        coordinator.publisher().flush();
        coordinator.publisher().unsubscribe(subscription);
        view.finish();

        const auto final_job = coordinator.snapshot();
        std::cout << coordinator.status().status << std::endl;
        return exitCodeFor(final_job);

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
