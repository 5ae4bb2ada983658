#ifndef OPBRIDGE_VALUE_VALUE_H
#define OPBRIDGE_VALUE_VALUE_H

#include <opbridge/types/value/ref_type.h>
#include <opbridge/types/value/type_meta.h>
#include <opbridge/util/errors.h>

#include <cassert>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>

namespace opbridge::value {

    // Deleter for Value storage: destroys the object and frees the aligned allocation
    struct ValueStorageRelease {
        const TypeMeta* schema{nullptr};

        void operator()(void* storage) const {
            schema->destruct_at(storage);
            ::operator delete(storage, std::align_val_t{schema->alignment});
        }
    };

    /**
     * Value - Owning type-erased storage for a single value of a described type
     *
     * Conversions produce Values: storage is allocated with the schema's size and
     * alignment, default constructed, and then written by the converters. An empty
     * Value (no schema) stands for "no result".
     *
     * Values are move-only, Value::copy makes an explicit deep copy.
     */
    class Value {
        static void* allocate(const TypeMeta* schema) {
            return ::operator new(schema->size, std::align_val_t{schema->alignment});
        }

    public:
        Value() = default;

        explicit Value(const TypeMeta* schema) {
            if (schema == nullptr) return;
            if (!schema->is_default_constructible()) {
                throw_error<std::invalid_argument>("type '{}' is not default constructible", schema->name);
            }
            void* storage = allocate(schema);
            try {
                schema->construct_at(storage);
            } catch (...) {
                ::operator delete(storage, std::align_val_t{schema->alignment});
                throw;
            }
            _storage = std::unique_ptr<void, ValueStorageRelease>(storage, ValueStorageRelease{schema});
        }

        Value(Value&&) noexcept = default;
        Value& operator=(Value&&) noexcept = default;

        [[nodiscard]] static Value copy(const Value& source) {
            if (!source.valid()) return {};
            Value result(source.schema());
            source.schema()->copy_assign_at(result.data(), source.data());
            return result;
        }

        [[nodiscard]] bool valid() const { return _storage != nullptr; }
        [[nodiscard]] const TypeMeta* schema() const { return valid() ? _storage.get_deleter().schema : nullptr; }
        // Scalar for an empty Value
        [[nodiscard]] TypeKind kind() const { return valid() ? schema()->kind : TypeKind::Scalar; }

        [[nodiscard]] bool is_type(const TypeMeta* other) const { return valid() && schema() == other; }

        template<typename T>
        [[nodiscard]] bool is_type() const { return valid() && schema()->is_type<T>(); }

        [[nodiscard]] void* data() { return _storage.get(); }
        [[nodiscard]] const void* data() const { return _storage.get(); }

        [[nodiscard]] TypedPtr ptr() { return {data(), schema()}; }
        [[nodiscard]] ConstTypedPtr const_ptr() const { return {data(), schema()}; }

        template<typename T>
        [[nodiscard]] T& as() {
            assert(is_type<T>() && "Value::as<T>() on an empty or differently typed Value");
            return *static_cast<T*>(data());
        }

        template<typename T>
        [[nodiscard]] const T& as() const {
            assert(is_type<T>() && "Value::as<T>() on an empty or differently typed Value");
            return *static_cast<const T*>(data());
        }

        // nullptr unless the Value holds a T
        template<typename T>
        [[nodiscard]] T* try_as() { return is_type<T>() ? static_cast<T*>(data()) : nullptr; }

        template<typename T>
        [[nodiscard]] const T* try_as() const { return is_type<T>() ? static_cast<const T*>(data()) : nullptr; }

        template<typename T>
        [[nodiscard]] const T& checked_as() const {
            if (!valid()) throw std::runtime_error("Value::checked_as<T>() on an empty Value");
            if (!is_type<T>()) {
                throw_error<std::runtime_error>("Value::checked_as<T>() type mismatch, value is '{}'", schema()->name);
            }
            return *static_cast<const T*>(data());
        }

        // True for an empty value and for a reference that resolved to nothing
        [[nodiscard]] bool is_null() const {
            if (!valid()) return true;
            return schema()->kind == TypeKind::Ref && static_cast<const RefTypeMeta*>(schema())->is_null_at(data());
        }

        [[nodiscard]] bool equals(const Value& other) const {
            if (!valid() || !other.valid()) return valid() == other.valid();
            return schema() == other.schema() && schema()->equals_at(data(), other.data());
        }

        [[nodiscard]] std::string to_string() const { return valid() ? schema()->to_string_at(data()) : "<invalid>"; }

        [[nodiscard]] DynamicValue to_dynamic() const { return valid() ? schema()->to_dynamic_at(data()) : DynamicValue{}; }

    private:
        std::unique_ptr<void, ValueStorageRelease> _storage;
    };

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_VALUE_H
