#ifndef OPBRIDGE_RUNTIME_INSTANCE_DIRECTORY_H
#define OPBRIDGE_RUNTIME_INSTANCE_DIRECTORY_H

#include <opbridge/runtime/resolvers.h>

#include <string>
#include <string_view>
#include <vector>

namespace opbridge {

    /**
     * InstanceDirectory - In-process index of live objects
     *
     * Each object is recorded under a locator path ("Parent/Child/Target") and an
     * optional opaque id. Enumeration follows insertion order. Paths are stored
     * without a leading separator and lookups ignore one.
     *
     * The directory does not own the objects, callers remove entries before the
     * objects they describe are destroyed.
     */
    class OPBRIDGE_EXPORT InstanceDirectory : public ObjectResolver {
    public:
        struct Entry {
            std::string path;
            std::string id;
            Instance instance;
        };

        // Throws std::invalid_argument for an invalid instance, an empty path or a duplicate path / id
        const Entry& add(std::string_view path, std::string_view id, Instance instance);

        template<typename T>
        const Entry& add(std::string_view path, std::string_view id, T& object, const value::BundleTypeMeta* meta) {
            return add(path, id, Instance::of(object, meta));
        }

        bool remove(std::string_view path);
        void clear() { _entries.clear(); }

        [[nodiscard]] size_t size() const { return _entries.size(); }
        [[nodiscard]] bool empty() const { return _entries.empty(); }
        [[nodiscard]] const std::vector<Entry>& entries() const { return _entries; }

        [[nodiscard]] const Entry* find_entry(const Instance& instance) const;

        [[nodiscard]] std::optional<Instance> try_resolve_path(std::string_view path) const override;
        [[nodiscard]] std::optional<Instance> try_resolve_id(std::string_view id) const override;

        /**
         * A pattern matches an entry when it matches either the full path or the last
         * path segment, so "Light*" selects "Stage/Light_01".
         */
        [[nodiscard]] std::vector<Instance> find_by_pattern(std::string_view pattern, bool use_regex) const override;

        // The recorded path, falling back to the instance's own label for unknown instances
        [[nodiscard]] std::string describe(const Instance& instance) const override;

        [[nodiscard]] static std::string_view normalize_path(std::string_view path);

    private:
        std::vector<Entry> _entries;
    };

    /**
     * AssetDirectory - In-process index of loadable assets keyed by asset path
     */
    class OPBRIDGE_EXPORT AssetDirectory : public AssetResolver {
    public:
        // Throws std::invalid_argument for an invalid instance, a malformed path or a duplicate path
        void add(std::string_view path, Instance instance);

        [[nodiscard]] std::optional<Instance> try_resolve(std::string_view identifier) const override;

        [[nodiscard]] size_t size() const { return _assets.size(); }

    private:
        std::vector<std::pair<std::string, Instance>> _assets;
    };

}  // namespace opbridge

#endif  // OPBRIDGE_RUNTIME_INSTANCE_DIRECTORY_H
