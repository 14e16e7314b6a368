#include "Environment.h"

#include <sched.h>

#include <thread>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

uint64_t host_parallelism() {
    cpu_set_t cpus;
    CPU_ZERO(&cpus);

    if (sched_getaffinity(0, sizeof(cpus), &cpus) == 0) {
        int count = CPU_COUNT(&cpus);
        if (count > 0) {
            return static_cast<uint64_t>(count);
        }
    } else {
        spdlog::debug("sched_getaffinity() failed");
    }

    unsigned int hw = std::thread::hardware_concurrency();
    if (hw == 0) {
        spdlog::warn("Unable to detect the number of CPUs, assuming 1");
        return 1;
    }
    return hw;
}

void setup_logging() {
    spdlog::set_default_logger(spdlog::stderr_color_mt("trigrams"));
    spdlog::set_level(spdlog::level::warn);
}
