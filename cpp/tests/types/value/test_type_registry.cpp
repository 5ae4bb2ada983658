/**
 * Unit tests for opbridge::value type descriptors and the TypeRegistry
 */

#include <catch2/catch_test_macros.hpp>
#include <fixtures/scene_fixture.h>
#include <opbridge/types/value/instance.h>
#include <opbridge/types/value/value.h>

#include <algorithm>
#include <utility>

using namespace opbridge::value;
using namespace opbridge::testing;

// ============================================================================
// Scalars
// ============================================================================

TEST_CASE("TypeRegistry - scalars are always present", "[value][registry]") {
    TypeRegistry registry;

    REQUIRE(registry.find<int32_t>() == scalar_type_meta<int32_t>());
    REQUIRE(registry.get_by_name("int32") == scalar_type_meta<int32_t>());
    REQUIRE(registry.get_by_name("double") == scalar_type_meta<double>());
    REQUIRE(registry.get_by_name("string") == scalar_type_meta<std::string>());
    REQUIRE(registry.contains("dynamic"));
    REQUIRE_FALSE(registry.contains("Vec3"));
}

TEST_CASE("ScalarTypeMeta - primitive classification", "[value][scalar]") {
    const auto* meta = scalar_type_meta<uint16_t>();

    REQUIRE(meta->kind == TypeKind::Scalar);
    REQUIRE(meta->primitive == PrimitiveKind::UInt16);
    REQUIRE(meta->is_integral());
    REQUIRE_FALSE(meta->is_floating_point());
    REQUIRE(scalar_type_meta<float>()->is_floating_point());
}

TEST_CASE("Value - empty value owns nothing", "[value]") {
    Value empty;
    REQUIRE_FALSE(empty.valid());
    REQUIRE(empty.schema() == nullptr);
    REQUIRE(empty.is_null());
    REQUIRE(empty.to_string() == "<invalid>");
    REQUIRE_FALSE(Value(nullptr).valid());
    REQUIRE_FALSE(Value::copy(empty).valid());

    Value source(scalar_type_meta<int64_t>());
    source.as<int64_t>() = 7;
    Value moved(std::move(source));
    REQUIRE_FALSE(source.valid());
    REQUIRE(source.schema() == nullptr);
    REQUIRE(moved.schema() == scalar_type_meta<int64_t>());
    REQUIRE(moved.as<int64_t>() == 7);

    moved = Value{};
    REQUIRE_FALSE(moved.valid());
}

TEST_CASE("Value - default constructed scalar", "[value][scalar]") {
    Value value(scalar_type_meta<int64_t>());

    REQUIRE(value.valid());
    REQUIRE(value.as<int64_t>() == 0);
    value.as<int64_t>() = 12;
    REQUIRE(value.to_dynamic() == DynamicValue(12));
    REQUIRE(value.to_string() == "12");

    auto copy = Value::copy(value);
    REQUIRE(copy.equals(value));
    copy.as<int64_t>() = 13;
    REQUIRE_FALSE(copy.equals(value));
}

TEST_CASE("Value - checked access rejects other types", "[value][scalar]") {
    Value value(scalar_type_meta<double>());

    REQUIRE(value.try_as<int64_t>() == nullptr);
    REQUIRE(value.try_as<double>() != nullptr);
    REQUIRE_THROWS(value.checked_as<std::string>());
}

// ============================================================================
// Bundles
// ============================================================================

TEST_CASE("BundleTypeBuilder - members and lookup", "[value][bundle]") {
    const auto& types = scene_types();

    REQUIRE(types.vec3->kind == TypeKind::Bundle);
    REQUIRE(types.vec3->member_count() == 3);
    REQUIRE(types.vec3->member_by_name("y") != nullptr);
    REQUIRE(types.vec3->member_by_name("w") == nullptr);
    REQUIRE(types.registry.get_by_name("Vec3") == types.vec3);
    REQUIRE(types.registry.bundle_meta_for<Node>() == types.node);
}

TEST_CASE("BundleTypeBuilder - member visibility flags", "[value][bundle]") {
    const auto* node = scene_types().node;

    const auto* name = node->member_by_name("name");
    REQUIRE(name->is_field());
    REQUIRE(name->is_serializable());
    REQUIRE(name->is_visible());

    const auto* note = node->member_by_name("internal_note");
    REQUIRE(note->is_field());
    REQUIRE_FALSE(note->is_serializable());
    REQUIRE_FALSE(note->is_visible());

    const auto* opacity = node->member_by_name("opacity");
    REQUIRE(opacity->is_property());
    REQUIRE(opacity->is_writable());

    const auto* revision = node->member_by_name("revision");
    REQUIRE(revision->is_property());
    REQUIRE_FALSE(revision->is_writable());
}

TEST_CASE("BundleTypeBuilder - rejects duplicate names", "[value][bundle]") {
    TypeRegistry registry;
    registry.bundle<Vec3>("Vec3").serialized_field("x", &Vec3::x).build();

    REQUIRE_THROWS_AS(registry.bundle<Color>("Vec3").serialized_field("r", &Color::r).build(), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.bundle<Vec3>("Other").build(), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.bundle<Color>("Color").serialized_field("r", &Color::r).serialized_field("r", &Color::g),
                      std::invalid_argument);
}

TEST_CASE("BundleTypeBuilder - unregistered member type is a programming error", "[value][bundle]") {
    TypeRegistry registry;
    REQUIRE_THROWS_AS(registry.bundle<Light>("Light").serialized_field("color", &Light::color), std::invalid_argument);
}

TEST_CASE("BundleTypeMeta - base chain", "[value][bundle]") {
    const auto& types = scene_types();
    Light light;
    light.name = "key";

    REQUIRE(types.light->base == types.node);
    REQUIRE(types.light->is_a(types.node));
    REQUIRE_FALSE(types.node->is_a(types.light));

    auto found = types.light->find_member(&light, "name");
    REQUIRE(found.valid());
    REQUIRE(found.object == static_cast<Node*>(&light));
    REQUIRE(*static_cast<std::string*>(found.member->field_ptr(found.object)) == "key");

    REQUIRE(types.light->cast_to(&light, types.node) == static_cast<void*>(static_cast<Node*>(&light)));
    REQUIRE(types.node->cast_to(&light, types.light) == nullptr);
}

TEST_CASE("BundleTypeMeta - visible members to dynamic", "[value][bundle]") {
    const auto& types = scene_types();
    Light light;
    light.name = "fill";
    light.kind = LightKind::Spot;
    light.internal_note = "hidden";

    auto members = types.light->members_to_dynamic(&light);

    REQUIRE(members.at("name") == DynamicValue("fill"));
    REQUIRE(members.at("kind") == DynamicValue("Spot"));
    REQUIRE(members.at("opacity") == DynamicValue(1.0));
    REQUIRE(members.at("revision") == DynamicValue(7));
    REQUIRE(members.at("scale") == DynamicValue(Sequence{1.0, 1.0, 1.0}));
    REQUIRE(members.at("target").is_null());
    REQUIRE_FALSE(members.contains("internal_note"));
}

TEST_CASE("Instance - label and identity", "[value][bundle]") {
    const auto& types = scene_types();
    Node node;
    node.id = "n-1";

    auto instance = Instance::of(node, types.node);
    REQUIRE(instance.valid());
    REQUIRE(instance.describe().id == "n-1");
    REQUIRE(instance.label() == "n-1");

    Node anonymous;
    REQUIRE(Instance::of(anonymous, types.node).label() == "Node");
    REQUIRE(Instance{}.label() == "<null>");
}

// ============================================================================
// Enumerations, lists and references
// ============================================================================

namespace {

    enum PlainKind { PlainFirst, PlainSecond };

    template<typename E>
    concept registrable_enum = requires(TypeRegistry& registry) { registry.enumeration<E>("E"); };

}  // namespace

TEST_CASE("TypeRegistry - only scoped enumerations register", "[value][enum]") {
    STATIC_REQUIRE(registrable_enum<LightKind>);
    STATIC_REQUIRE_FALSE(registrable_enum<PlainKind>);
}

TEST_CASE("EnumTypeMeta - symbols", "[value][enum]") {
    const auto* meta = scene_types().light_kind;

    REQUIRE(meta->kind == TypeKind::Enum);
    REQUIRE(meta->symbols.size() == 3);
    REQUIRE(meta->find_symbol("directional") != nullptr);
    REQUIRE(meta->find_symbol("directional")->value == 2);
    REQUIRE(meta->find_symbol(int64_t{1})->name == "Spot");
    REQUIRE(meta->find_symbol(int64_t{9}) == nullptr);
    REQUIRE(meta->fits_underlying(int64_t{1} << 20));
    REQUIRE_FALSE(meta->fits_underlying(int64_t{1} << 40));
}

TEST_CASE("TypeRegistry - collections are described on first use", "[value][list]") {
    TypeRegistry registry;

    const auto* list = registry.meta_for<std::vector<int32_t>>();
    REQUIRE(list->kind == TypeKind::DynamicList);
    REQUIRE(list->name == "List[int32]");
    REQUIRE(registry.meta_for<std::vector<int32_t>>() == list);

    const auto* array = registry.meta_for<std::array<float, 4>>();
    REQUIRE(array->kind == TypeKind::List);
    REQUIRE(array->name == "Array[float, 4]");
    REQUIRE(static_cast<const ListTypeMeta*>(array)->fixed_size == 4);

    REQUIRE_THROWS_AS(registry.meta_for<Vec3>(), std::invalid_argument);
}

TEST_CASE("RefTypeMeta - null and bound references", "[value][ref]") {
    const auto& types = scene_types();
    Node node;
    node.id = "n-2";

    Value ref(types.node_ref);
    REQUIRE(types.node_ref->name == "Ref[Node]");
    REQUIRE(ref.is_null());
    REQUIRE(ref.to_dynamic().is_null());

    types.node_ref->store(ref.data(), &node);
    REQUIRE_FALSE(ref.is_null());
    REQUIRE(ref.as<Node*>() == &node);
    REQUIRE(ref.to_dynamic() == DynamicValue(ReferenceDescriptor{.id = "n-2", .path = {}}));
}
