#include "config.h"
#include "gateway_server.h"
#include "health_reporter.h"
#include "logger.h"
#include "providers/pipeline.h"
#include "session_registry.h"
#include "task_tracker.h"
#include <csignal>
#include <fstream>
#include <pthread.h>
#include <unistd.h>

namespace {

// Prefer config/gateway.json next to the executable (e.g. build/../config)
std::string default_config_path() {
    std::string config_path = "config/gateway.json";
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            std::string candidate = exe_dir.substr(0, pos) + "/../config/gateway.json";
            std::ifstream test(candidate);
            if (test.good()) {
                config_path = candidate;
            }
        }
    }
    return config_path;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    voicegate::Logger::initialize(voicegate::LogLevel::INFO);

    std::string config_path = argc > 1 ? std::string(argv[1]) : default_config_path();

    auto loaded = voicegate::Config::load_from_file(config_path);
    if (!loaded) {
        voicegate::Logger::error(loaded.error().message);
        voicegate::Logger::shutdown();
        return 1;
    }
    voicegate::Config config = loaded.value();

    voicegate::Logger::initialize(voicegate::Logger::parse_level(config.log.level), config.log.file);

    auto valid = config.validate();
    if (!valid) {
        voicegate::Logger::error(valid.error().message);
        voicegate::Logger::shutdown();
        return 1;
    }

    // Block termination signals in every thread; main collects them with sigwait
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    int exit_code = 0;
    {
        auto transport = std::make_shared<voicegate::CurlHttpTransport>();
        voicegate::Pipeline pipeline(config, transport);
        voicegate::TaskTracker tasks(static_cast<size_t>(config.automation.max_tracked_tasks));
        voicegate::SessionRegistry registry(config, pipeline, &tasks);
        voicegate::HealthReporter health(config, registry, pipeline.health());
        voicegate::GatewayServer server(config, registry, health, tasks, pipeline);

        auto started = server.start();
        if (!started) {
            voicegate::Logger::error(started.error().message);
            exit_code = 1;
        } else {
            registry.start_sweeper();

            int received = 0;
            sigwait(&signals, &received);
            voicegate::Logger::info("Received signal " + std::to_string(received) + ", shutting down...");

            server.stop();
            registry.stop_sweeper();
        }
    }

    voicegate::Logger::shutdown();
    return exit_code;
}
