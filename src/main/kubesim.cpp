#include "engine/simulator.h"
#include <atomic>
#include <csignal>
#include <iostream>

using namespace kubesim;

std::atomic<bool> interrupted(false);

void signal_handler(int signal) {
    (void)signal;
    interrupted = true;
}

int main(int argc, char* argv[]) {
    // 设置信号处理
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // 解析命令行参数：kubesim [config.json] [ticks]
    SimulatorConfig config;
    int ticks = 10;
    if (argc > 1) {
        try {
            config = SimulatorConfig::from_file(argv[1]);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Failed to load configuration: " << e.what() << std::endl;
            return 1;
        }
    }

    if (argc > 2) {
        try {
            ticks = std::stoi(argv[2]);
        } catch (const std::exception&) {
            std::cerr << "Invalid tick count: " << argv[2] << std::endl;
            return 1;
        }
        if (ticks < 0) {
            std::cerr << "Invalid tick count: " << argv[2] << std::endl;
            return 1;
        }
    }

    std::cerr << "Starting kubesim..." << std::endl;
    std::cerr << "Nodes: " << config.node_pool.count << ", ticks: " << ticks << std::endl;

    try {
        Simulator simulator(config);
        for (int i = 0; i < ticks && !interrupted; ++i) {
            simulator.tick();
        }

        if (interrupted) {
            std::cerr << "Interrupted at tick " << simulator.current_tick() << std::endl;
        }

        std::cout << simulator.snapshot().dump(2) << std::endl;
    } catch (const InvariantViolation& e) {
        std::cerr << "Invariant violation: " << e.what() << std::endl;
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
