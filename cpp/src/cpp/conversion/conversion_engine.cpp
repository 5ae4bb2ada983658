#include <opbridge/config/bridge_config.h>
#include <opbridge/conversion/conversion_engine.h>
#include <opbridge/conversion/converters.h>
#include <opbridge/types/error_type.h>
#include <opbridge/util/errors.h>
#include <opbridge/util/log.h>

#include <algorithm>

namespace opbridge {

    using value::DynamicValue;
    using value::TypeMeta;
    using value::Value;

    ConversionEngine::ConversionEngine(ConversionContext context) : _context(context) {
        add_converter(std::make_unique<ReferenceConverter>());
        add_converter(std::make_unique<SequenceConverter>());
        add_converter(std::make_unique<CompositeConverter>());
        add_converter(std::make_unique<EnumConverter>());
        add_converter(std::make_unique<PrimitiveConverter>());
        add_converter(std::make_unique<StructuralConverter>());
    }

    ConversionEngine::~ConversionEngine() = default;

    ConversionEngine::ConversionEngine(ConversionEngine &&) noexcept = default;

    ConversionEngine &ConversionEngine::operator=(ConversionEngine &&) noexcept = default;

    void ConversionEngine::add_converter(std::unique_ptr<ValueConverter> converter) {
        if (!converter) throw std::invalid_argument("ConversionEngine::add_converter: converter is null");
        auto position = std::upper_bound(_converters.begin(), _converters.end(), converter->priority(),
                                         [](int priority, const std::unique_ptr<ValueConverter> &existing) {
                                             return priority > existing->priority();
                                         });
        _converters.insert(position, std::move(converter));
    }

    void ConversionEngine::assign_default(void *dest, const TypeMeta *target) {
        Value fresh(target);
        target->move_assign_at(dest, fresh.data());
    }

    void ConversionEngine::convert_into(void *dest, const DynamicValue &value, const TypeMeta *target) const {
        if (target == nullptr) throw_error<ConversionError>("cannot convert {}: no target type", value.kind_name());

        if (value.is_null()) {
            assign_default(dest, target);
            return;
        }

        if (target->accepts_exact(value)) {
            target->assign_exact_at(dest, value);
            return;
        }

        std::string failures;
        for (const auto &converter : _converters) {
            if (!converter->can_convert(value, target)) continue;
            try {
                converter->convert(dest, value, target, *this);
                return;
            } catch (const std::exception &e) {
                if (!failures.empty()) failures += "; ";
                failures += fmt::format("{}: {}", converter->name(), e.what());
            }
        }

        if (failures.empty()) {
            throw_error<ConversionError>("no converter accepts {} for type '{}'", value.kind_name(), target->name);
        }
        throw_error<ConversionError>("cannot convert {} to '{}' ({})", value.kind_name(), target->name, failures);
    }

    void ConversionEngine::convert_tolerant_into(void *dest, const DynamicValue &value, const TypeMeta *target) const {
        try {
            convert_into(dest, value, target);
        } catch (const ConversionError &e) {
            if (BridgeConfig::instance().log_conversion_failures) {
                log_warning("Failed to convert {} to '{}', using the default value: {}", value.to_string(),
                            target != nullptr ? target->name : std::string("<none>"), e.what());
            }
            if (target != nullptr) assign_default(dest, target);
        }
    }

    ConversionResult ConversionEngine::try_convert(const DynamicValue &value, const TypeMeta *target) const {
        if (target == nullptr) {
            return {Value{}, fmt::format("cannot convert {}: no target type", value.kind_name())};
        }
        Value result(target);
        try {
            convert_into(result.data(), value, target);
        } catch (const ConversionError &e) {
            return {Value(target), std::string(e.what())};
        }
        return {std::move(result), std::nullopt};
    }

    Value ConversionEngine::convert(const DynamicValue &value, const TypeMeta *target) const {
        auto result = try_convert(value, target);
        if (!result.ok() && BridgeConfig::instance().log_conversion_failures) {
            log_warning("Failed to convert {} to '{}', using the default value: {}", value.to_string(),
                        target != nullptr ? target->name : std::string("<none>"), *result.error);
        }
        return std::move(result.value);
    }

}  // namespace opbridge
