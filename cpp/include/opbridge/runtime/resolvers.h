#ifndef OPBRIDGE_RUNTIME_RESOLVERS_H
#define OPBRIDGE_RUNTIME_RESOLVERS_H

#include <opbridge/opbridge_export.h>
#include <opbridge/types/error_type.h>
#include <opbridge/types/value/instance.h>
#include <opbridge/types/value/type_registry.h>
#include <opbridge/util/errors.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace opbridge {

    using value::Instance;

    /**
     * ResourceResolver - Locates resources owned outside this library
     *
     * Implementations provide try_resolve; resolve raises TargetNotFoundError when
     * the identifier does not resolve.
     */
    template<typename T>
    class ResourceResolver {
    public:
        virtual ~ResourceResolver() = default;

        [[nodiscard]] virtual std::optional<T> try_resolve(std::string_view identifier) const = 0;

        [[nodiscard]] virtual T resolve(std::string_view identifier) const {
            if (auto resource = try_resolve(identifier); resource.has_value()) return *resource;
            throw_error<TargetNotFoundError>("{} not found: {}", resource_kind(), identifier);
        }

        [[nodiscard]] virtual bool exists(std::string_view identifier) const {
            return try_resolve(identifier).has_value();
        }

        // Resolved resources in identifier order, identifiers that do not resolve are skipped
        [[nodiscard]] std::vector<T> resolve_many(const std::vector<std::string>& identifiers) const {
            std::vector<T> resources;
            resources.reserve(identifiers.size());
            for (const auto& identifier : identifiers) {
                if (auto resource = try_resolve(identifier); resource.has_value()) resources.push_back(*resource);
            }
            return resources;
        }

        [[nodiscard]] virtual std::string_view resource_kind() const = 0;
    };

    /**
     * ObjectResolver - Locates live objects by locator path or opaque id, and
     * enumerates them by pattern for batch operations.
     */
    class OPBRIDGE_EXPORT ObjectResolver : public ResourceResolver<Instance> {
    public:
        // Locator path first, opaque id second
        [[nodiscard]] std::optional<Instance> try_resolve(std::string_view identifier) const override;

        [[nodiscard]] virtual std::optional<Instance> try_resolve_path(std::string_view path) const = 0;
        [[nodiscard]] virtual std::optional<Instance> try_resolve_id(std::string_view id) const = 0;

        /**
         * Every instance matching ``pattern`` in enumeration order. ``use_regex`` selects a
         * case-insensitive regular expression, otherwise ``*`` and ``?`` are wildcards.
         */
        [[nodiscard]] virtual std::vector<Instance> find_by_pattern(std::string_view pattern, bool use_regex) const = 0;

        // Human readable label of an instance, used in responses
        [[nodiscard]] virtual std::string describe(const Instance& instance) const { return instance.label(); }

        [[nodiscard]] std::string_view resource_kind() const override { return "Object"; }
    };

    class OPBRIDGE_EXPORT AssetResolver : public ResourceResolver<Instance> {
    public:
        // Structural check of an asset path, says nothing about existence
        [[nodiscard]] virtual bool validate_path(std::string_view path) const;

        [[nodiscard]] std::string_view resource_kind() const override { return "Asset"; }
    };

    class OPBRIDGE_EXPORT TypeResolver : public ResourceResolver<const value::TypeMeta*> {
    public:
        [[nodiscard]] std::string_view resource_kind() const override { return "Type"; }
    };

    /**
     * Resolves type names against a TypeRegistry, exact match first, then
     * case-insensitive.
     */
    class OPBRIDGE_EXPORT RegistryTypeResolver : public TypeResolver {
    public:
        explicit RegistryTypeResolver(const value::TypeRegistry& registry) : _registry(registry) {}

        [[nodiscard]] std::optional<const value::TypeMeta*> try_resolve(std::string_view identifier) const override;

    private:
        const value::TypeRegistry& _registry;
    };

}  // namespace opbridge

#endif  // OPBRIDGE_RUNTIME_RESOLVERS_H
