#include <opbridge/conversion/conversion_engine.h>
#include <opbridge/conversion/converters.h>
#include <opbridge/runtime/resolvers.h>
#include <opbridge/types/error_type.h>
#include <opbridge/types/value/bundle_type.h>
#include <opbridge/types/value/enum_type.h>
#include <opbridge/types/value/list_type.h>
#include <opbridge/types/value/opaque_type.h>
#include <opbridge/types/value/ref_type.h>
#include <opbridge/types/value/scalar_type.h>
#include <opbridge/util/errors.h>
#include <opbridge/util/log.h>
#include <opbridge/util/string_utils.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace opbridge {

    using value::BundleTypeMeta;
    using value::DynamicKind;
    using value::DynamicValue;
    using value::EnumTypeMeta;
    using value::ListTypeMeta;
    using value::Mapping;
    using value::MemberMeta;
    using value::OpaqueTypeMeta;
    using value::PrimitiveKind;
    using value::ReferenceDescriptor;
    using value::RefTypeMeta;
    using value::ScalarTypeMeta;
    using value::TypeKind;
    using value::TypeMeta;
    using value::Value;

    // ============================================================================
    // Primitive coercions
    // ============================================================================

    bool coerce_to_bool(const DynamicValue &value) {
        switch (value.kind()) {
            case DynamicKind::Bool: return value.as_bool();
            case DynamicKind::Int: return value.as_int() != 0;
            case DynamicKind::Float: return value.as_float() != 0.0;
            case DynamicKind::String: {
                auto text = trim(value.as_string());
                if (iequals(text, "true")) return true;
                if (iequals(text, "false")) return false;
                throw_error<ConversionError>("'{}' is not a valid Bool", value.as_string());
            }
            default: throw_error<ConversionError>("cannot convert {} to a Bool", value.kind_name());
        }
    }

    int64_t coerce_to_int64(const DynamicValue &value) {
        switch (value.kind()) {
            case DynamicKind::Bool: return value.as_bool() ? 1 : 0;
            case DynamicKind::Int: return value.as_int();
            case DynamicKind::Float: {
                const double truncated = std::trunc(value.as_float());
                if (!std::isfinite(truncated) || truncated < -std::ldexp(1.0, 63) || truncated >= std::ldexp(1.0, 63)) {
                    throw_error<ConversionError>("{} is out of range for an integer", value.to_string());
                }
                return static_cast<int64_t>(truncated);
            }
            case DynamicKind::String: {
                if (auto parsed = parse_int64(value.as_string()); parsed.has_value()) return *parsed;
                throw_error<ConversionError>("'{}' is not a valid integer", value.as_string());
            }
            default: throw_error<ConversionError>("cannot convert {} to an integer", value.kind_name());
        }
    }

    double coerce_to_double(const DynamicValue &value) {
        switch (value.kind()) {
            case DynamicKind::Bool: return value.as_bool() ? 1.0 : 0.0;
            case DynamicKind::Int: return static_cast<double>(value.as_int());
            case DynamicKind::Float: return value.as_float();
            case DynamicKind::String: {
                if (auto parsed = parse_double(value.as_string()); parsed.has_value()) return *parsed;
                throw_error<ConversionError>("'{}' is not a valid number", value.as_string());
            }
            default: throw_error<ConversionError>("cannot convert {} to a number", value.kind_name());
        }
    }

    namespace {

        // Floats truncate toward zero; every source must fit T without wrapping
        template<typename T>
        T integral_from(const DynamicValue &value, const TypeMeta *target) {
            if (value.is_float()) {
                const double truncated = std::trunc(value.as_float());
                const double upper = std::ldexp(1.0, std::numeric_limits<T>::digits);
                const double lower = std::is_signed_v<T> ? -upper : 0.0;
                if (!std::isfinite(truncated) || truncated < lower || truncated >= upper) {
                    throw_error<ConversionError>("{} is out of range for '{}'", value.to_string(), target->name);
                }
                return static_cast<T>(truncated);
            }
            const int64_t raw = coerce_to_int64(value);
            if (!std::in_range<T>(raw)) {
                throw_error<ConversionError>("{} is out of range for '{}'", raw, target->name);
            }
            return static_cast<T>(raw);
        }

        // Infinities and NaN carry over, finite values must be representable as float
        float float_from(const DynamicValue &value, const TypeMeta *target) {
            const double raw = coerce_to_double(value);
            if (std::isfinite(raw) && std::abs(raw) > static_cast<double>(std::numeric_limits<float>::max())) {
                throw_error<ConversionError>("{} is out of range for '{}'", value.to_string(), target->name);
            }
            return static_cast<float>(raw);
        }

        template<typename T>
        void store(void *dest, T value) {
            *static_cast<T *>(dest) = value;
        }

        const DynamicValue *find_member_value(const Mapping &mapping, std::string_view name) {
            if (auto it = mapping.find(name); it != mapping.end()) return &it->second;
            for (const auto &[key, item] : mapping) {
                if (iequals(key, name)) return &item;
            }
            return nullptr;
        }

        std::optional<value::Instance> resolve_reference(const ReferenceDescriptor &descriptor,
                                                         const ConversionContext &context) {
            if (descriptor.has_path()) {
                if (context.objects != nullptr) {
                    if (auto instance = context.objects->try_resolve_path(descriptor.path)) return instance;
                }
                if (context.assets != nullptr) {
                    if (auto instance = context.assets->try_resolve(descriptor.path)) return instance;
                }
            }
            if (descriptor.has_id()) {
                if (context.objects != nullptr) {
                    if (auto instance = context.objects->try_resolve_id(descriptor.id)) return instance;
                }
                if (context.assets != nullptr) {
                    if (auto instance = context.assets->try_resolve(descriptor.id)) return instance;
                }
            }
            return std::nullopt;
        }

        std::string id_text(const DynamicValue &value) {
            if (value.is_string()) return value.as_string();
            if (value.is_int()) return std::to_string(value.as_int());
            throw_error<ConversionError>("reference id must be a String or Int, got {}", value.kind_name());
        }

        // Locator keys, most specific first
        std::string path_from_mapping(const DynamicValue &value) {
            auto string_at = [&](std::string_view key) -> const DynamicValue * {
                auto *entry = value.find(key);
                return entry != nullptr && entry->is_string() ? entry : nullptr;
            };

            if (auto *type = string_at("$type"); type != nullptr && type->as_string() == "reference") {
                if (auto *path = string_at("$path"); path != nullptr) return std::string(trim(path->as_string()));
            }
            for (std::string_view key : {ReferenceDescriptor::path_key, std::string_view("_gameObjectPath"),
                                         std::string_view("path"), std::string_view("gameObjectPath"),
                                         std::string_view("objectPath"), std::string_view("target"),
                                         std::string_view("reference")}) {
                if (auto *path = string_at(key); path != nullptr) return std::string(trim(path->as_string()));
            }
            return {};
        }

    }  // namespace

    std::optional<ReferenceDescriptor> extract_reference(const DynamicValue &value) {
        switch (value.kind()) {
            case DynamicKind::Reference: return value.as_reference();
            case DynamicKind::String: return ReferenceDescriptor{.path = std::string(trim(value.as_string()))};
            case DynamicKind::Mapping: {
                ReferenceDescriptor descriptor;
                descriptor.path = path_from_mapping(value);
                for (std::string_view key : {ReferenceDescriptor::id_key, std::string_view("globalObjectId"),
                                             std::string_view("guid")}) {
                    if (auto *id = value.find(key); id != nullptr && !id->is_null()) {
                        descriptor.id = id_text(*id);
                        break;
                    }
                }
                // A lone string entry under any other key is taken as the path
                const auto &entries = value.as_mapping();
                if (descriptor.empty() && entries.size() == 1 && entries.begin()->second.is_string()) {
                    descriptor.path = std::string(trim(entries.begin()->second.as_string()));
                }
                if (descriptor.empty()) return std::nullopt;
                return descriptor;
            }
            default: return std::nullopt;
        }
    }

    // ============================================================================
    // ReferenceConverter
    // ============================================================================

    bool ReferenceConverter::can_convert(const DynamicValue &, const TypeMeta *target) const {
        return target->kind == TypeKind::Ref;
    }

    void ReferenceConverter::convert(void *dest, const DynamicValue &value, const TypeMeta *target,
                                     const ConversionEngine &engine) const {
        auto *ref = static_cast<const RefTypeMeta *>(target);
        auto descriptor = extract_reference(value);
        if (!descriptor.has_value()) {
            throw_error<ConversionError>("{} does not describe a reference to '{}'", value.to_string(), ref->target->name);
        }
        if (descriptor->empty()) {
            ref->store(dest, nullptr);
            return;
        }

        auto instance = resolve_reference(*descriptor, engine.context());
        if (!instance.has_value() || !instance->valid()) {
            log_debug("Reference {} to '{}' did not resolve", value.to_string(), ref->target->name);
            ref->store(dest, nullptr);
            return;
        }

        void *object = instance->cast_to(ref->target);
        if (object == nullptr) {
            log_warning("Reference {} resolved to a '{}', which is not a '{}'", value.to_string(), instance->meta->name,
                        ref->target->name);
        }
        ref->store(dest, object);
    }

    // ============================================================================
    // SequenceConverter
    // ============================================================================

    bool SequenceConverter::can_convert(const DynamicValue &value, const TypeMeta *target) const {
        return value.is_sequence() && (target->kind == TypeKind::List || target->kind == TypeKind::DynamicList);
    }

    void SequenceConverter::convert(void *dest, const DynamicValue &value, const TypeMeta *target,
                                    const ConversionEngine &engine) const {
        auto *list = static_cast<const ListTypeMeta *>(target);
        list->clear(dest);
        if (list->element_type == nullptr) {
            log_debug("Element type of '{}' is unknown, producing an empty collection", target->name);
            return;
        }

        const auto &items = value.as_sequence();
        size_t count = items.size();
        if (list->is_fixed()) {
            if (count > list->fixed_size) {
                log_debug("{} elements supplied for '{}', keeping the first {}", count, target->name, list->fixed_size);
            }
            count = std::min(count, list->fixed_size);
        } else {
            list->resize(dest, count);
        }

        for (size_t i = 0; i < count; ++i) {
            engine.convert_tolerant_into(list->element_at(dest, i), items[i], list->element_type);
        }
    }

    // ============================================================================
    // CompositeConverter
    // ============================================================================

    bool CompositeConverter::can_convert(const DynamicValue &value, const TypeMeta *target) const {
        return value.is_mapping() && target->kind == TypeKind::Bundle;
    }

    void CompositeConverter::convert(void *dest, const DynamicValue &value, const TypeMeta *target,
                                     const ConversionEngine &engine) const {
        auto *bundle = static_cast<const BundleTypeMeta *>(target);
        const auto &mapping = value.as_mapping();
        bundle->for_each_member(dest, [&](const MemberMeta &member, void *owner) {
            if (!member.is_visible()) return;
            const DynamicValue *item = find_member_value(mapping, member.name);
            if (item == nullptr) return;

            if (member.is_field()) {
                engine.convert_tolerant_into(member.field_ptr(owner), *item, member.type);
                return;
            }
            if (!member.is_writable()) return;
            Value converted(member.type);
            engine.convert_tolerant_into(converted.data(), *item, member.type);
            member.setter(owner, converted.data());
        });
    }

    // ============================================================================
    // EnumConverter
    // ============================================================================

    bool EnumConverter::can_convert(const DynamicValue &value, const TypeMeta *target) const {
        return target->kind == TypeKind::Enum && (value.is_string() || value.is_number());
    }

    void EnumConverter::convert(void *dest, const DynamicValue &value, const TypeMeta *target,
                                const ConversionEngine &) const {
        auto *enum_meta = static_cast<const EnumTypeMeta *>(target);
        int64_t raw = 0;
        if (value.is_string()) {
            auto text = trim(value.as_string());
            if (auto *symbol = enum_meta->find_symbol(text); symbol != nullptr) {
                raw = symbol->value;
            } else if (auto parsed = parse_int64(text); parsed.has_value()) {
                raw = *parsed;
            } else {
                throw_error<ConversionError>("'{}' is not a value of enum '{}'", value.as_string(), target->name);
            }
        } else if (value.is_int()) {
            raw = value.as_int();
        } else {
            const double number = value.as_float();
            if (number != std::trunc(number)) {
                throw_error<ConversionError>("{} is not an integral value of enum '{}'", value.to_string(), target->name);
            }
            raw = coerce_to_int64(value);
        }

        if (!enum_meta->fits_underlying(raw)) {
            throw_error<ConversionError>("{} does not fit the underlying type of enum '{}'", raw, target->name);
        }
        enum_meta->store_raw(dest, raw);
    }

    // ============================================================================
    // PrimitiveConverter
    // ============================================================================

    bool PrimitiveConverter::can_convert(const DynamicValue &, const TypeMeta *target) const {
        return target->kind == TypeKind::Scalar;
    }

    void PrimitiveConverter::convert(void *dest, const DynamicValue &value, const TypeMeta *target,
                                     const ConversionEngine &) const {
        auto *scalar = static_cast<const ScalarTypeMeta *>(target);
        switch (scalar->primitive) {
            case PrimitiveKind::Bool: store(dest, coerce_to_bool(value)); break;
            case PrimitiveKind::Int8: store(dest, integral_from<int8_t>(value, target)); break;
            case PrimitiveKind::Int16: store(dest, integral_from<int16_t>(value, target)); break;
            case PrimitiveKind::Int32: store(dest, integral_from<int32_t>(value, target)); break;
            case PrimitiveKind::Int64: store(dest, integral_from<int64_t>(value, target)); break;
            case PrimitiveKind::UInt8: store(dest, integral_from<uint8_t>(value, target)); break;
            case PrimitiveKind::UInt16: store(dest, integral_from<uint16_t>(value, target)); break;
            case PrimitiveKind::UInt32: store(dest, integral_from<uint32_t>(value, target)); break;
            case PrimitiveKind::UInt64: store(dest, integral_from<uint64_t>(value, target)); break;
            case PrimitiveKind::Float32: store(dest, float_from(value, target)); break;
            case PrimitiveKind::Float64: store(dest, coerce_to_double(value)); break;
            case PrimitiveKind::String: store(dest, value.to_string()); break;
        }
    }

    // ============================================================================
    // StructuralConverter
    // ============================================================================

    bool StructuralConverter::can_convert(const DynamicValue &, const TypeMeta *target) const {
        return target->kind == TypeKind::Bundle || target->kind == TypeKind::Opaque;
    }

    void StructuralConverter::convert(void *dest, const DynamicValue &value, const TypeMeta *target,
                                      const ConversionEngine &) const {
        if (target->kind == TypeKind::Opaque) {
            auto *opaque = static_cast<const OpaqueTypeMeta *>(target);
            if (!opaque->decode) throw_error<ConversionError>("type '{}' has no structural decoder", target->name);
            opaque->decode(dest, value::to_structural(value));
            return;
        }
        auto *bundle = static_cast<const BundleTypeMeta *>(target);
        if (!bundle->structural_decoder) {
            throw_error<ConversionError>("type '{}' has no structural decoder for {}", target->name, value.kind_name());
        }
        bundle->structural_decoder(dest, value::to_structural(value));
    }

}  // namespace opbridge
