#pragma once

#include <QLoggingCategory>

namespace chronoid {

// "chronoid.generator": clock regressions, counter rollover, per-call trace.
Q_DECLARE_LOGGING_CATEGORY(chronoidGeneratorLog)

// "chronoid.entropy": random source initialisation.
Q_DECLARE_LOGGING_CATEGORY(chronoidEntropyLog)

// True when CHRONOID_DEBUG_GENERATOR is set in the environment. Read once per process.
[[nodiscard]] bool generator_trace_enabled();

} // namespace chronoid
