// SPDX-License-Identifier: Apache-2.0
#include "optimizer_config.hpp"
#include "optimizer_engine.hpp"
#include "simulated_devices.hpp"

#include <everest/logging.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

std::string parse_config_path(int argc, char* argv[]) {
    std::string path = "configs/pv_optimizer.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            path = argv[i + 1];
        }
    }
    return path;
}
} // namespace

int main(int argc, char* argv[]) {
    const auto config_path = parse_config_path(argc, argv);

    pvo::OptimizerConfig cfg;
    try {
        cfg = pvo::load_optimizer_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    Everest::Logging::init(cfg.logging_config.string(), "pv-optimizer");

    if (!cfg.simulation_mode) {
        EVLOG_error << "No device backend other than the simulator is built in; set simulationMode to true";
        return 1;
    }
    auto devices = std::make_shared<pvo::SimulatedDevices>(cfg.devices);
    devices->set_pv_production(cfg.simulated_pv_w);
    devices->set_base_load(cfg.simulated_base_load_w);
    EVLOG_info << "Simulated plant: " << cfg.simulated_pv_w << " W PV, " << cfg.simulated_base_load_w
               << " W base load";

    std::unique_ptr<pvo::OptimizerEngine> engine;
    try {
        engine = std::make_unique<pvo::OptimizerEngine>(cfg, devices);
    } catch (const std::exception& e) {
        EVLOG_error << "Failed to create optimizer: " << e.what();
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    engine->start();
    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    engine->stop();
    return 0;
}
