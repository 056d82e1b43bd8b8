#pragma once
#include <egress/core/admission/cpu_cost.hpp>
#include <chrono>
#include <string>

namespace AppConfig {

struct BusConfig {
    std::string request_topic = "egress_requests";
    std::string update_topic = "egress_updates";
    int handler_threads = 4;
};

struct LifecycleConfig {
    std::chrono::milliseconds shutdown_timeout{30000};
    std::chrono::milliseconds terminal_retention{10000};
    std::chrono::milliseconds report_interval{10000};
};

struct PipelineConfig {
    std::chrono::milliseconds startup_delay{500};
    std::chrono::milliseconds shutdown_delay{200};
};

struct AppConfiguration {
    std::string node_id;
    std::string log_level = "info";
    int health_port = 0;    // 0 disables the health endpoint

    Egress::CpuCostConfig cpu_cost;
    BusConfig bus;
    LifecycleConfig lifecycle;
    PipelineConfig pipeline;
};

} // namespace AppConfig
