#include "core/logging.hpp"

#include <QtGlobal>

namespace chronoid {

Q_LOGGING_CATEGORY(chronoidGeneratorLog, "chronoid.generator", QtInfoMsg)
Q_LOGGING_CATEGORY(chronoidEntropyLog, "chronoid.entropy", QtInfoMsg)

bool generator_trace_enabled() {
    static const bool enabled = qEnvironmentVariableIsSet("CHRONOID_DEBUG_GENERATOR");
    return enabled;
}

} // namespace chronoid
