
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <egress/core/config/loader.hpp>
#include <egress/core/events/local_bus.hpp>
#include <egress/core/pipeline/loopback_pipeline.hpp>
#include <egress/core/admission/cpu_sampler.hpp>
#include <egress/core/admission/admission_controller.hpp>
#include <egress/core/service/service.hpp>
#include <egress/core/service/rpc_server.hpp>
#include <egress/core/admin/admin_loop.hpp>
#include <egress/microservice/health_server.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};
static std::atomic<int> g_signal{0};

static void signalHandler(int signum) {
    g_signal.store(signum, std::memory_order_relaxed);
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("egressd v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void applyLogLevel(const AppConfig::AppConfiguration& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: servers go before the service they call
    std::unique_ptr<Egress::LocalBus> bus;
    std::unique_ptr<Egress::LoopbackPipelineFactory> pipelineFactory;
    std::unique_ptr<Egress::ProcStatCpuSampler> cpuSampler;
    std::unique_ptr<Egress::Service> service;
    std::unique_ptr<Egress::RpcServer> rpcServer;
    std::unique_ptr<Egress::Admin> admin;
    std::unique_ptr<egress::microservice::HealthServer> healthServer;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    c.bus = std::make_unique<Egress::LocalBus>();

    Egress::LoopbackOptions loopback;
    loopback.startup_delay = config.pipeline.startup_delay;
    loopback.shutdown_delay = config.pipeline.shutdown_delay;
    c.pipelineFactory = std::make_unique<Egress::LoopbackPipelineFactory>(loopback);

    double cpus = Egress::AdmissionController::hardwareCpus();
    c.cpuSampler = std::make_unique<Egress::ProcStatCpuSampler>(cpus);

    Egress::ServiceOptions options;
    options.node_id = config.node_id;
    options.cpu_cost = config.cpu_cost;
    options.num_cpus = cpus;
    options.update_topic = config.bus.update_topic;
    options.shutdown_timeout = config.lifecycle.shutdown_timeout;
    options.terminal_retention = config.lifecycle.terminal_retention;
    c.service = std::make_unique<Egress::Service>(options, *c.bus, *c.pipelineFactory);

    c.rpcServer = std::make_unique<Egress::RpcServer>(
        *c.bus, *c.service, config.bus.request_topic,
        static_cast<size_t>(config.bus.handler_threads));

    c.admin = std::make_unique<Egress::Admin>(*c.service, config.lifecycle.report_interval);

    if (config.health_port > 0) {
        Egress::Service* service = c.service.get();
        c.healthServer = std::make_unique<egress::microservice::HealthServer>(
            config.health_port, [service]() { return service->status(); });
        spdlog::info("Health endpoint configured on port {}", config.health_port);
    }

    return c;
}

static void startComponents(Components& c) {
    spdlog::info("Starting components...");

    // Throws on an unusable CPU configuration
    c.service->start(c.cpuSampler.get());
    c.rpcServer->start();
    c.admin->start();

    if (c.healthServer && !c.healthServer->start()) {
        spdlog::warn("Health endpoint failed to start, continuing without it");
        c.healthServer.reset();
    }

    spdlog::info("All components started successfully");
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Stop intake first, then drain jobs, then the rest in reverse order
    if (c.rpcServer) c.rpcServer->stop();
    if (c.service) c.service->shutdown(true);
    if (c.healthServer) c.healthServer->stop();
    if (c.admin) c.admin->stop();

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        applyLogLevel(config);
        spdlog::info("Configuration loaded successfully for node {}", config.node_id);

        auto components = initializeComponents(config);
        startComponents(components);

        spdlog::info("egressd running. Press Ctrl+C to shutdown.");

        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        spdlog::info("Signal {} received, initiating shutdown...", g_signal.load());

        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("egressd terminated gracefully");
    return EXIT_SUCCESS;
}
