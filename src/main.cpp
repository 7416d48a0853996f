#include <iostream>
#include <memory>
#include <signal.h>
#include <chrono>
#include <string>
#include <thread>
#include <atomic>
#include <spdlog/spdlog.h>

// Core components
#include "core/common/Logging.hpp"
#include "core/coordinator/Coordinator.hpp"
#include "core/coordinator/CoordinatorConfig.hpp"
#include "core/crypto/HmacCryptoBackend.hpp"

using namespace qsynth::core;

// Global variables for graceful shutdown
std::atomic<bool> g_running{true};
std::unique_ptr<coordinator::Coordinator> g_coordinator;

// Signal handler for graceful shutdown
void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

// Initialize core components
void initializeComponents(const std::string& configPath) {
    spdlog::info("Initializing core components...");

    try {
        coordinator::CoordinatorConfig config;
        if (!configPath.empty()) {
            config = coordinator::CoordinatorConfig::loadFromFile(configPath);
            spdlog::info("Configuration loaded from {}", configPath);
        }

        // Single node without peers: own vote is the quorum
        auto backend = std::make_shared<crypto::HmacCryptoBackend>();
        g_coordinator = std::make_unique<coordinator::Coordinator>(config, backend);

        g_coordinator->addListener([](const coordinator::CoordinatorEvent& event) {
            if (event.type == coordinator::CoordinatorEventType::ComponentError ||
                event.type == coordinator::CoordinatorEventType::FailoverTriggered) {
                spdlog::warn("Coordinator event {} [{}]: {}",
                             coordinator::toString(event.type), event.component, event.detail);
            }
        });

        spdlog::info("Coordinator initialized: node {}, {} workers",
                     config.resourceManager.nodeId, config.workerPool.poolSize);

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize components: {}", e.what());
        throw;
    }
}

// One pass of the sample workload
void runWorkload() {
    std::vector<uint8_t> payload{'q', 's', 'y', 'n', 't', 'h'};

    auto resource = g_coordinator->createResource(mpz_class("12345678901234567890"), mpz_class(3));
    spdlog::info("Resource {} created, tier {}", resource.id, crypto::toString(resource.complexityTier));

    auto signature = g_coordinator->deriveSignature(resource.id, payload);
    bool valid = g_coordinator->verifySignature(resource.id, signature, payload);
    spdlog::info("Signature of {} bytes, valid: {}", signature.size(), valid);

    auto outcome = g_coordinator->proposeAdaptation(resource.id, mpz_class(42), mpz_class(1));
    spdlog::info("Adaptation: {}", outcome.toJson().dump());

    std::vector<coordinator::Operation> operations{
        coordinator::CreateOp{mpz_class(500), mpz_class(1)},
        coordinator::SignOp{resource.id, payload},
        coordinator::SignOp{resource.id, payload},
        coordinator::VerifyOp{resource.id, signature, payload},
        coordinator::SignOp{"res-missing", payload}
    };
    auto results = g_coordinator->processBatch(operations);
    for (size_t i = 0; i < results.size(); ++i) {
        spdlog::info("Batch op #{} ({}): {}", i, coordinator::operationName(operations[i]),
                     results[i].toJson().dump());
    }
}

// Main service loop
void runServiceLoop(bool once) {
    spdlog::info("Starting service loop...");

    auto lastMetricsUpdate = std::chrono::steady_clock::now();
    auto lastWorkload = std::chrono::steady_clock::time_point{};

    while (g_running) {
        try {
            auto now = std::chrono::steady_clock::now();

            if (now - lastWorkload > std::chrono::seconds(10)) {
                runWorkload();
                lastWorkload = now;
                if (once) break;
            }

            // Update metrics every 5 seconds
            if (now - lastMetricsUpdate > std::chrono::seconds(5)) {
                g_coordinator->workerPool().updateMetrics();
                spdlog::debug("Stats: {}", g_coordinator->getStats().toJson().dump());
                lastMetricsUpdate = now;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(100));

        } catch (const std::exception& e) {
            spdlog::error("Error in service loop: {}", e.what());
            if (once) throw;
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Service loop stopped");
}

// Graceful shutdown
void shutdown() {
    spdlog::info("Initiating graceful shutdown...");

    try {
        if (g_coordinator) {
            std::cout << g_coordinator->getStats().toJson().dump(2) << std::endl;
            bool drained = g_coordinator->shutdown(std::chrono::seconds(5));
            if (!drained) {
                spdlog::warn("Some work was abandoned at shutdown");
            }
            g_coordinator.reset();
        }
        spdlog::info("All components shut down successfully");

    } catch (const std::exception& e) {
        spdlog::error("Error during shutdown: {}", e.what());
    }
}

int main(int argc, char* argv[]) {
    try {
        // Set up signal handlers
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        std::string configPath;
        bool once = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--once") {
                once = true;
            } else {
                configPath = arg;
            }
        }

        common::initializeLogging("logs", spdlog::level::info);
        spdlog::info("=== QSynth Service Starting ===");

        initializeComponents(configPath);

        runServiceLoop(once);

        shutdown();

        spdlog::info("=== QSynth Service Shutdown Complete ===");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        shutdown();
        return 1;
    }
}
