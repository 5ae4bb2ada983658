#ifndef OPBRIDGE_VALUE_LIST_TYPE_H
#define OPBRIDGE_VALUE_LIST_TYPE_H

#include <opbridge/types/value/type_meta.h>

#include <array>
#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

namespace opbridge::value {

    /**
     * ListTypeMeta - Extended TypeMeta for sequence-shaped types
     *
     * kind == DynamicList describes a std::vector<E>, kind == List a std::array<E, N>
     * (``fixed_size`` is N). ``element_type`` may be nullptr when the element type
     * could not be described; such lists only ever hold default elements.
     */
    struct ListTypeMeta : TypeMeta {
        const TypeMeta* element_type;
        size_t fixed_size;

        size_t (*length)(const void* list);
        void (*resize)(void* list, size_t count);   // nullptr for fixed-size lists
        void (*clear)(void* list);                  // resets every element
        void* (*element_at)(void* list, size_t index);
        const void* (*const_element_at)(const void* list, size_t index);

        [[nodiscard]] bool is_fixed() const { return kind == TypeKind::List; }
    };

    template<typename>
    struct is_std_vector : std::false_type {};

    template<typename E, typename A>
    struct is_std_vector<std::vector<E, A>> : std::true_type {};

    template<typename>
    struct is_std_array : std::false_type {};

    template<typename E, size_t N>
    struct is_std_array<std::array<E, N>> : std::true_type {};

    template<typename C>
        requires (is_std_vector<C>::value || is_std_array<C>::value)
    struct ListTypeOps {
        using element_type = typename C::value_type;

        static_assert(!std::is_same_v<element_type, bool>,
                      "std::vector<bool> has no addressable elements, use std::vector<uint8_t>");

        static size_t length(const void* list) { return static_cast<const C*>(list)->size(); }

        static void resize(void* list, size_t count) {
            if constexpr (is_std_vector<C>::value) static_cast<C*>(list)->resize(count);
        }

        static void clear(void* list) {
            if constexpr (is_std_vector<C>::value) {
                static_cast<C*>(list)->clear();
            } else {
                static_cast<C*>(list)->fill(element_type{});
            }
        }

        static void* element_at(void* list, size_t index) { return &(*static_cast<C*>(list))[index]; }

        static const void* const_element_at(const void* list, size_t index) {
            return &(*static_cast<const C*>(list))[index];
        }

        static std::string to_string(const void* v, const TypeMeta* meta) {
            return to_dynamic(v, meta).to_string();
        }

        static DynamicValue to_dynamic(const void* v, const TypeMeta* meta) {
            auto* list_meta = static_cast<const ListTypeMeta*>(meta);
            Sequence result;
            if (list_meta->element_type == nullptr) return result;
            const size_t count = length(v);
            result.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                result.push_back(list_meta->element_type->to_dynamic_at(const_element_at(v, i)));
            }
            return result;
        }

        static bool equals(const void* a, const void* b, const TypeMeta* meta) {
            auto* list_meta = static_cast<const ListTypeMeta*>(meta);
            const size_t count = length(a);
            if (count != length(b)) return false;
            if (list_meta->element_type == nullptr) return true;
            for (size_t i = 0; i < count; ++i) {
                if (!list_meta->element_type->equals_at(const_element_at(a, i), const_element_at(b, i))) return false;
            }
            return true;
        }

        static constexpr TypeOps make_ops() {
            TypeOps ops = ObjectTypeOps<C>::template make_ops<false>(&to_string, &to_dynamic);
            ops.equals = &equals;
            return ops;
        }

        static const TypeOps ops;
    };

    template<typename C>
        requires (is_std_vector<C>::value || is_std_array<C>::value)
    const TypeOps ListTypeOps<C>::ops = ListTypeOps<C>::make_ops();

}  // namespace opbridge::value

#endif  // OPBRIDGE_VALUE_LIST_TYPE_H
