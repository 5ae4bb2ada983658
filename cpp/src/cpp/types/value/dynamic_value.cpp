#include <opbridge/types/value/dynamic_value.h>
#include <opbridge/util/string_utils.h>

#include <fmt/format.h>

namespace opbridge::value {

    std::string_view to_string(DynamicKind kind) {
        switch (kind) {
            case DynamicKind::Null: return "Null";
            case DynamicKind::Bool: return "Bool";
            case DynamicKind::Int: return "Int";
            case DynamicKind::Float: return "Float";
            case DynamicKind::String: return "String";
            case DynamicKind::Sequence: return "Sequence";
            case DynamicKind::Mapping: return "Mapping";
            case DynamicKind::Reference: return "Reference";
        }
        return "Unknown";
    }

    double DynamicValue::as_number() const {
        if (is_int()) return static_cast<double>(as_int());
        return as_float();
    }

    const DynamicValue *DynamicValue::find(std::string_view key) const {
        auto *mapping = std::get_if<Mapping>(&_value);
        if (mapping == nullptr) return nullptr;
        auto it = mapping->find(key);
        return it != mapping->end() ? &it->second : nullptr;
    }

    namespace {
        void append_text(std::string &out, const DynamicValue &value, bool quote_strings) {
            switch (value.kind()) {
                case DynamicKind::Null: out += "null"; break;
                case DynamicKind::Bool: out += value.as_bool() ? "true" : "false"; break;
                case DynamicKind::Int: out += fmt::format("{}", value.as_int()); break;
                case DynamicKind::Float: out += format_double(value.as_float()); break;
                case DynamicKind::String:
                    if (quote_strings) {
                        out += fmt::format("\"{}\"", value.as_string());
                    } else {
                        out += value.as_string();
                    }
                    break;
                case DynamicKind::Sequence: {
                    out += '[';
                    bool first = true;
                    for (const auto &item : value.as_sequence()) {
                        if (!first) out += ", ";
                        first = false;
                        append_text(out, item, true);
                    }
                    out += ']';
                    break;
                }
                case DynamicKind::Mapping: {
                    out += '{';
                    bool first = true;
                    for (const auto &[key, item] : value.as_mapping()) {
                        if (!first) out += ", ";
                        first = false;
                        out += fmt::format("\"{}\": ", key);
                        append_text(out, item, true);
                    }
                    out += '}';
                    break;
                }
                case DynamicKind::Reference: {
                    const auto &ref = value.as_reference();
                    out += '{';
                    if (ref.has_id()) out += fmt::format("\"{}\": \"{}\"", ReferenceDescriptor::id_key, ref.id);
                    if (ref.has_id() && ref.has_path()) out += ", ";
                    if (ref.has_path()) out += fmt::format("\"{}\": \"{}\"", ReferenceDescriptor::path_key, ref.path);
                    out += '}';
                    break;
                }
            }
        }
    }  // namespace

    std::string DynamicValue::to_string() const {
        std::string out;
        append_text(out, *this, false);
        return out;
    }

    bool DynamicValue::operator==(const DynamicValue &other) const { return _value == other._value; }

    DynamicValue to_structural(const DynamicValue &value) {
        switch (value.kind()) {
            case DynamicKind::Sequence: {
                Sequence result;
                result.reserve(value.as_sequence().size());
                for (const auto &item : value.as_sequence()) result.push_back(to_structural(item));
                return result;
            }
            case DynamicKind::Mapping: {
                Mapping result;
                for (const auto &[key, item] : value.as_mapping()) result.emplace(key, to_structural(item));
                return result;
            }
            case DynamicKind::Reference: {
                const auto &ref = value.as_reference();
                Mapping result;
                if (ref.has_id()) result.emplace(std::string(ReferenceDescriptor::id_key), ref.id);
                if (ref.has_path()) result.emplace(std::string(ReferenceDescriptor::path_key), ref.path);
                return result;
            }
            default: return value;
        }
    }

}  // namespace opbridge::value
