#include <chrono>
#include <csignal>
#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "posture/config.hpp"
#include "posture/diagnostics.hpp"
#include "posture/service.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void signalHandler(int signal) {
    gSignalStatus = signal;
}

void printUsage(const char* executable) {
    std::cout << "Usage: " << executable << " [--config <path>] [--diagnose]\n"
              << "Watches the user's posture through the camera and publishes posture events over MQTT.\n"
              << "  --config <path>  configuration file (default: posture.config.json)\n"
              << "  --diagnose       check camera access, print the findings and exit" << std::endl;
}

int runDiagnostics(const posture::AppConfig& config) {
    posture::CaptureDiagnostics diagnostics;
    std::optional<posture::CaptureDiagnostic> problem = diagnostics.preflight(config.camera.device);
    if (problem) {
        std::cout << posture::formatDiagnostic(*problem) << std::endl;
        return 1;
    }

    std::cout << "camera OK: " << diagnostics.devicePath(config.camera.device) << std::endl;
    for (const auto& camera : diagnostics.listCameras()) {
        std::cout << "  " << camera.device_path << (camera.readable ? "" : " (not readable)") << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::string configPath = "posture.config.json";
    bool diagnose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--diagnose") {
            diagnose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        posture::AppConfig config = posture::loadConfig(configPath);
        if (diagnose) {
            return runDiagnostics(config);
        }

        posture::MonitorService service(config);

        std::promise<void> runPromise;
        std::future<void> runFuture = runPromise.get_future();
        std::thread worker([&service, &runPromise]() {
            try {
                service.run();
                runPromise.set_value();
            } catch (const std::exception&) {
                runPromise.set_exception(std::current_exception());
            }
        });

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (runFuture.wait_for(std::chrono::milliseconds(200)) == std::future_status::timeout) {
            if (gSignalStatus != 0) {
                service.stop();
            }
        }

        worker.join();
        runFuture.get();
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
