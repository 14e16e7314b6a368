#pragma once

#include <cstdint>

// Number of CPUs that can run worker threads, at least 1.
uint64_t host_parallelism();

// Routes the default logger to stderr, so stdout only carries the report.
void setup_logging();
