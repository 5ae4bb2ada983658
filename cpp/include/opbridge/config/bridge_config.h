#ifndef OPBRIDGE_CONFIG_BRIDGE_CONFIG_H
#define OPBRIDGE_CONFIG_BRIDGE_CONFIG_H

#include <opbridge/opbridge_export.h>
#include <opbridge/types/value/dynamic_value.h>
#include <opbridge/util/log.h>

#include <cstddef>

namespace opbridge {

    /**
     * Process-wide settings. Read through BridgeConfig::instance(), replaced as a
     * whole through BridgeConfig::set() (which also applies the log level).
     */
    struct OPBRIDGE_EXPORT BridgeConfig {
        // maxResults used by batch operations when the payload does not name one
        size_t default_max_results{1000};
        LogLevel log_level{LogLevel::Info};
        // Absorbed conversion failures are reported as warnings
        bool log_conversion_failures{true};
        bool warn_on_handler_overwrite{true};

        [[nodiscard]] static const BridgeConfig &instance();
        static void set(BridgeConfig config);

        /**
         * Overlay the recognised keys of ``mapping`` onto ``base``:
         * defaultMaxResults, logLevel, logConversionFailures, warnOnHandlerOverwrite.
         * Unknown keys are ignored, a known key of the wrong kind raises ValidationError.
         */
        [[nodiscard]] static BridgeConfig from_mapping(const value::Mapping &mapping, BridgeConfig base);
        // Overlay onto the defaults
        [[nodiscard]] static BridgeConfig from_mapping(const value::Mapping &mapping);

        [[nodiscard]] value::Mapping to_mapping() const;
    };

    [[nodiscard]] OPBRIDGE_EXPORT LogLevel parse_log_level(std::string_view text);

}  // namespace opbridge

#endif  // OPBRIDGE_CONFIG_BRIDGE_CONFIG_H
