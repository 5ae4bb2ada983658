#include <opbridge/config/bridge_config.h>
#include <opbridge/types/error_type.h>
#include <opbridge/util/errors.h>
#include <opbridge/util/string_utils.h>

namespace opbridge {

    namespace {
        BridgeConfig &mutable_instance() {
            static BridgeConfig config;
            return config;
        }

        bool read_bool(const value::Mapping &mapping, std::string_view key, bool fallback) {
            auto it = mapping.find(key);
            if (it == mapping.end()) return fallback;
            if (!it->second.is_bool()) {
                throw_error<ValidationError>("config key '{}' must be a Bool, got {}", key, it->second.kind_name());
            }
            return it->second.as_bool();
        }
    }  // namespace

    const BridgeConfig &BridgeConfig::instance() { return mutable_instance(); }

    void BridgeConfig::set(BridgeConfig config) {
        set_log_level(config.log_level);
        mutable_instance() = config;
    }

    LogLevel parse_log_level(std::string_view text) {
        for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::Off}) {
            if (iequals(text, to_string(level))) return level;
        }
        throw_error<ValidationError>("unknown log level '{}', expected debug, info, warning, error or off", text);
    }

    BridgeConfig BridgeConfig::from_mapping(const value::Mapping &mapping, BridgeConfig base) {
        if (auto it = mapping.find("defaultMaxResults"); it != mapping.end()) {
            if (!it->second.is_int() || it->second.as_int() <= 0) {
                throw_error<ValidationError>("config key 'defaultMaxResults' must be a positive Int");
            }
            base.default_max_results = static_cast<size_t>(it->second.as_int());
        }
        if (auto it = mapping.find("logLevel"); it != mapping.end()) {
            if (!it->second.is_string()) {
                throw_error<ValidationError>("config key 'logLevel' must be a String, got {}", it->second.kind_name());
            }
            base.log_level = parse_log_level(it->second.as_string());
        }
        base.log_conversion_failures = read_bool(mapping, "logConversionFailures", base.log_conversion_failures);
        base.warn_on_handler_overwrite = read_bool(mapping, "warnOnHandlerOverwrite", base.warn_on_handler_overwrite);
        return base;
    }

    BridgeConfig BridgeConfig::from_mapping(const value::Mapping &mapping) {
        return from_mapping(mapping, BridgeConfig{});
    }

    value::Mapping BridgeConfig::to_mapping() const {
        return {
            {"defaultMaxResults", default_max_results},
            {"logLevel", std::string(to_string(log_level))},
            {"logConversionFailures", log_conversion_failures},
            {"warnOnHandlerOverwrite", warn_on_handler_overwrite},
        };
    }

}  // namespace opbridge
