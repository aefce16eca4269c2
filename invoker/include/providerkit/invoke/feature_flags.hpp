#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace providerkit {
namespace invoke {

/**
 * Feature Flags
 *
 * Optional behaviors are gated behind environment variables and default to `false`:
 * - PROVIDERKIT_STRICT_CONTRACT_ENABLED
 * - PROVIDERKIT_METRICS_ENABLED
 */
class FeatureFlags {
public:
    /**
     * Check if strict contract mode is enabled
     *
     * When set, contract warnings on a SUCCESS event (errorCode or a non-empty
     * callbackContext) are treated as validation errors that end the run.
     */
    static bool is_strict_contract_enabled() {
        return get_env_bool("PROVIDERKIT_STRICT_CONTRACT_ENABLED", false);
    }

    /**
     * Check if Prometheus metrics collection is enabled
     *
     * Metrics are always collected when a metrics file is requested on the
     * command line; this flag enables collection without one.
     */
    static bool is_metrics_enabled() {
        return get_env_bool("PROVIDERKIT_METRICS_ENABLED", false);
    }

private:
    /**
     * Returns `true` if the variable is "true", "1" or "yes" (case-insensitive),
     * `default_value` if it is unset, `false` otherwise.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }
};

} // namespace invoke
} // namespace providerkit
