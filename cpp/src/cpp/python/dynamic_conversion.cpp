#include <opbridge/python/dynamic_conversion.h>
#include <opbridge/types/error_type.h>
#include <opbridge/util/errors.h>

#include <nanobind/stl/string.h>

namespace opbridge::python {

    using value::DynamicKind;
    using value::DynamicValue;
    using value::Mapping;
    using value::ReferenceDescriptor;
    using value::Sequence;

    value::Mapping mapping_from_python(nb::handle obj) {
        if (!nb::isinstance<nb::dict>(obj)) {
            throw_error<ConversionError>("expected a dict, got {}", nb::type_name(obj.type()).c_str());
        }
        Mapping mapping;
        for (auto [key, val] : nb::borrow<nb::dict>(obj)) {
            auto name = nb::isinstance<nb::str>(key) ? nb::cast<std::string>(key) : std::string(nb::str(key).c_str());
            mapping.insert_or_assign(std::move(name), from_python(val));
        }
        return mapping;
    }

    DynamicValue from_python(nb::handle obj) {
        if (obj.is_none()) return {};
        // bool before int, Python bools are ints
        if (nb::isinstance<nb::bool_>(obj)) return nb::cast<bool>(obj);
        if (nb::isinstance<nb::int_>(obj)) return nb::cast<int64_t>(obj);
        if (nb::isinstance<nb::float_>(obj)) return nb::cast<double>(obj);
        if (nb::isinstance<nb::str>(obj)) return nb::cast<std::string>(obj);
        if (nb::isinstance<nb::dict>(obj)) return mapping_from_python(obj);
        if (nb::isinstance<nb::list>(obj) || nb::isinstance<nb::tuple>(obj)) {
            Sequence sequence;
            sequence.reserve(nb::len(obj));
            for (auto item : obj) sequence.push_back(from_python(item));
            return sequence;
        }
        throw_error<ConversionError>("cannot convert Python {} to a dynamic value", nb::type_name(obj.type()).c_str());
    }

    nb::object to_python(const DynamicValue &value) {
        switch (value.kind()) {
            case DynamicKind::Null: return nb::none();
            case DynamicKind::Bool: return nb::bool_(value.as_bool());
            case DynamicKind::Int: return nb::int_(value.as_int());
            case DynamicKind::Float: return nb::float_(value.as_float());
            case DynamicKind::String: return nb::str(value.as_string().c_str(), value.as_string().size());
            case DynamicKind::Sequence: {
                nb::list result;
                for (const auto &item : value.as_sequence()) result.append(to_python(item));
                return result;
            }
            case DynamicKind::Mapping: {
                nb::dict result;
                for (const auto &[key, item] : value.as_mapping()) {
                    result[nb::str(key.c_str(), key.size())] = to_python(item);
                }
                return result;
            }
            case DynamicKind::Reference: {
                const auto &reference = value.as_reference();
                nb::dict result;
                const auto &id_key = ReferenceDescriptor::id_key;
                const auto &path_key = ReferenceDescriptor::path_key;
                if (reference.has_id()) result[nb::str(id_key.data(), id_key.size())] = nb::str(reference.id.c_str());
                if (reference.has_path()) {
                    result[nb::str(path_key.data(), path_key.size())] = nb::str(reference.path.c_str());
                }
                return result;
            }
        }
        return nb::none();
    }

}  // namespace opbridge::python
