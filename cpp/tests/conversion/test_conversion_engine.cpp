/**
 * Unit tests for the ConversionEngine and its default converter chain
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <fixtures/scene_fixture.h>
#include <opbridge/config/bridge_config.h>
#include <opbridge/conversion/conversion_engine.h>
#include <opbridge/conversion/converters.h>
#include <opbridge/types/value/value.h>
#include <opbridge/util/scope.h>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace opbridge;
using namespace opbridge::value;
using namespace opbridge::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

    ConversionEngine engine_for(const Scene& scene) {
        return ConversionEngine(ConversionContext{.objects = scene.directory.get(), .assets = nullptr});
    }

}  // namespace

// ============================================================================
// Short circuits
// ============================================================================

TEST_CASE("ConversionEngine - values of the target shape are unchanged", "[conversion][identity]") {
    LogCapture logs;
    ConversionEngine engine;
    const auto& types = scene_types();

    REQUIRE(engine.convert(DynamicValue(41), scalar_type_meta<int64_t>()).to_dynamic() == DynamicValue(41));
    REQUIRE(engine.convert(DynamicValue(0.5), scalar_type_meta<double>()).to_dynamic() == DynamicValue(0.5));
    REQUIRE(engine.convert(DynamicValue(true), scalar_type_meta<bool>()).to_dynamic() == DynamicValue(true));
    REQUIRE(engine.convert(DynamicValue("abc"), scalar_type_meta<std::string>()).to_dynamic() == DynamicValue("abc"));

    DynamicValue point(Mapping{{"x", 1.0}, {"y", -2.0}, {"z", 3.5}});
    REQUIRE(engine.convert(point, types.vec3).to_dynamic() == point);

    DynamicValue kind("Directional");
    REQUIRE(engine.convert(kind, types.light_kind).to_dynamic() == kind);
}

TEST_CASE("ConversionEngine - converting a value's own dynamic form is idempotent", "[conversion][identity]") {
    LogCapture logs;
    ConversionEngine engine;
    const auto& types = scene_types();

    Value light(types.light);
    auto& l = light.as<Light>();
    l.name = "key";
    l.position = Vec3{1.0, 2.0, 3.0};
    l.tags = {"a", "b"};
    l.kind = LightKind::Spot;
    l.color = Color{0.5f, 0.25f, 1.0f, 1.0f};
    l.intensity = 2.5f;

    auto once = engine.convert(light.to_dynamic(), types.light);
    auto twice = engine.convert(once.to_dynamic(), types.light);

    REQUIRE(once.to_dynamic() == light.to_dynamic());
    REQUIRE(twice.to_dynamic() == once.to_dynamic());
}

TEST_CASE("ConversionEngine - null converts to the default value", "[conversion][null]") {
    ConversionEngine engine;
    const auto& types = scene_types();

    REQUIRE(engine.convert(DynamicValue{}, scalar_type_meta<int32_t>()).as<int32_t>() == 0);
    REQUIRE(engine.convert(DynamicValue{}, scalar_type_meta<double>()).as<double>() == 0.0);
    REQUIRE(engine.convert(DynamicValue{}, scalar_type_meta<bool>()).as<bool>() == false);
    REQUIRE(engine.convert(DynamicValue{}, scalar_type_meta<std::string>()).as<std::string>().empty());
    REQUIRE(engine.convert(DynamicValue{}, types.node_ref).is_null());
    REQUIRE(engine.convert(DynamicValue{}, types.vec3).as<Vec3>() == Vec3{});

    TypeRegistry registry;
    REQUIRE(engine.convert(DynamicValue{}, registry.meta_for<std::vector<int32_t>>()).as<std::vector<int32_t>>().empty());
}

// ============================================================================
// Primitives
// ============================================================================

TEST_CASE("PrimitiveConverter - numeric widening and narrowing", "[conversion][primitive]") {
    LogCapture logs;
    ConversionEngine engine;

    REQUIRE(engine.convert(DynamicValue(7), scalar_type_meta<double>()).as<double>() == 7.0);
    REQUIRE(engine.convert(DynamicValue(7.9), scalar_type_meta<int32_t>()).as<int32_t>() == 7);
    REQUIRE(engine.convert(DynamicValue(-7.9), scalar_type_meta<int32_t>()).as<int32_t>() == -7);
    REQUIRE(engine.convert(DynamicValue(200), scalar_type_meta<uint8_t>()).as<uint8_t>() == 200);
    REQUIRE(engine.convert(DynamicValue(" 12 "), scalar_type_meta<int16_t>()).as<int16_t>() == 12);
    REQUIRE(engine.convert(DynamicValue("2.5"), scalar_type_meta<float>()).as<float>() == Catch::Approx(2.5f));
    REQUIRE(engine.convert(DynamicValue(1), scalar_type_meta<bool>()).as<bool>());
    REQUIRE(engine.convert(DynamicValue("TRUE"), scalar_type_meta<bool>()).as<bool>());
    REQUIRE(engine.convert(DynamicValue(true), scalar_type_meta<int64_t>()).as<int64_t>() == 1);
}

TEST_CASE("PrimitiveConverter - out of range values are rejected", "[conversion][primitive]") {
    ConversionEngine engine;

    REQUIRE_THROWS_AS(engine.convert_into(nullptr, DynamicValue(300), scalar_type_meta<uint8_t>()), ConversionError);

    auto result = engine.try_convert(DynamicValue(-1), scalar_type_meta<uint32_t>());
    REQUIRE_FALSE(result.ok());
    REQUIRE_THAT(*result.error, ContainsSubstring("uint32"));
    REQUIRE(result.value.as<uint32_t>() == 0);
}

TEST_CASE("PrimitiveConverter - single precision targets reject finite overflow", "[conversion][primitive]") {
    ConversionEngine engine;
    const auto* single = scalar_type_meta<float>();

    auto result = engine.try_convert(DynamicValue(1e300), single);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.value.as<float>() == 0.0f);
    REQUIRE_FALSE(engine.try_convert(DynamicValue("-1e39"), single).ok());

    REQUIRE(engine.convert(DynamicValue(3.0e38), single).as<float>() == Catch::Approx(3.0e38f));
    REQUIRE(std::isinf(engine.convert(DynamicValue(std::numeric_limits<double>::infinity()), single).as<float>()));
}

TEST_CASE("PrimitiveConverter - any value converts to text", "[conversion][primitive]") {
    ConversionEngine engine;
    const auto* text = scalar_type_meta<std::string>();

    REQUIRE(engine.convert(DynamicValue(42), text).as<std::string>() == "42");
    REQUIRE(engine.convert(DynamicValue(1.5), text).as<std::string>() == "1.5");
    REQUIRE(engine.convert(DynamicValue(false), text).as<std::string>() == "false");
    REQUIRE(engine.convert(DynamicValue(Sequence{1, 2}), text).as<std::string>() == "[1, 2]");
    REQUIRE(engine.convert(DynamicValue(Mapping{{"k", "v"}}), text).as<std::string>() == "{\"k\": \"v\"}");
}

// ============================================================================
// Enumerations
// ============================================================================

TEST_CASE("EnumConverter - symbolic names are case-insensitive", "[conversion][enum]") {
    ConversionEngine engine;
    const auto* meta = scene_types().light_kind;

    REQUIRE(engine.convert(DynamicValue("spot"), meta).as<LightKind>() == LightKind::Spot);
    REQUIRE(engine.convert(DynamicValue("DIRECTIONAL"), meta).as<LightKind>() == LightKind::Directional);
    REQUIRE(engine.convert(DynamicValue(1), meta).as<LightKind>() == LightKind::Spot);
    REQUIRE(engine.convert(DynamicValue("2"), meta).as<LightKind>() == LightKind::Directional);
    REQUIRE(engine.convert(DynamicValue(2.0), meta).as<LightKind>() == LightKind::Directional);
}

TEST_CASE("EnumConverter - undeclared integral values pass through", "[conversion][enum]") {
    ConversionEngine engine;
    const auto* meta = scene_types().light_kind;

    auto result = engine.try_convert(DynamicValue(42), meta);

    REQUIRE(result.ok());
    REQUIRE(static_cast<int32_t>(result.value.as<LightKind>()) == 42);
    REQUIRE(result.value.to_dynamic() == DynamicValue(42));

    auto negative = engine.try_convert(DynamicValue(-3), meta);
    REQUIRE(negative.ok());
    REQUIRE(negative.value.to_dynamic() == DynamicValue(-3));
}

TEST_CASE("EnumConverter - unknown names and oversized values fail", "[conversion][enum]") {
    ConversionEngine engine;
    const auto* meta = scene_types().light_kind;

    REQUIRE_FALSE(engine.try_convert(DynamicValue("Ambient"), meta).ok());
    REQUIRE_FALSE(engine.try_convert(DynamicValue(int64_t{1} << 40), meta).ok());
    REQUIRE_FALSE(engine.try_convert(DynamicValue(1.5), meta).ok());
}

// ============================================================================
// Collections
// ============================================================================

TEST_CASE("SequenceConverter - elements convert recursively", "[conversion][sequence]") {
    LogCapture logs;
    ConversionEngine engine;
    TypeRegistry registry;

    auto ints = engine.convert(DynamicValue(Sequence{1, 2.7, "3"}), registry.meta_for<std::vector<int32_t>>());
    REQUIRE(ints.as<std::vector<int32_t>>() == std::vector<int32_t>{1, 2, 3});

    auto words = engine.convert(DynamicValue(Sequence{"a", 2, true}), registry.meta_for<std::vector<std::string>>());
    REQUIRE(words.as<std::vector<std::string>>() == std::vector<std::string>{"a", "2", "true"});
}

TEST_CASE("SequenceConverter - a bad element degrades to its default", "[conversion][sequence]") {
    LogCapture logs;
    ConversionEngine engine;
    TypeRegistry registry;

    auto ints = engine.convert(DynamicValue(Sequence{1, "x", 3}), registry.meta_for<std::vector<int32_t>>());

    REQUIRE(ints.as<std::vector<int32_t>>() == std::vector<int32_t>{1, 0, 3});
    REQUIRE(logs.contains("Failed to convert"));
}

TEST_CASE("SequenceConverter - fixed arrays keep their size", "[conversion][sequence]") {
    LogCapture logs;
    ConversionEngine engine;
    TypeRegistry registry;
    const auto* meta = registry.meta_for<std::array<double, 3>>();

    REQUIRE(engine.convert(DynamicValue(Sequence{1, 2, 3, 4}), meta).as<std::array<double, 3>>() ==
            std::array<double, 3>{1.0, 2.0, 3.0});
    REQUIRE(engine.convert(DynamicValue(Sequence{5}), meta).as<std::array<double, 3>>() ==
            std::array<double, 3>{5.0, 0.0, 0.0});
}

TEST_CASE("SequenceConverter - unknown element type yields an empty collection", "[conversion][sequence]") {
    LogCapture logs;
    ConversionEngine engine;
    TypeRegistry registry;
    const auto* meta = registry.dynamic_list<int32_t>(nullptr);

    auto result = engine.try_convert(DynamicValue(Sequence{1, 2}), meta);

    REQUIRE(result.ok());
    REQUIRE(result.value.as<std::vector<int32_t>>().empty());
}

// ============================================================================
// Composites
// ============================================================================

TEST_CASE("CompositeConverter - nested members in one pass", "[conversion][composite]") {
    LogCapture logs;
    ConversionEngine engine;
    const auto& types = scene_types();

    DynamicValue input(Mapping{
        {"name", "rim"},
        {"position", Mapping{{"x", 1}, {"y", "2"}, {"z", 3.0}}},
        {"color", Mapping{{"r", 1}, {"g", 0.5}}},
        {"kind", "spot"},
        {"tags", Sequence{"a"}},
        {"opacity", 0.25},
    });

    auto light = engine.convert(input, types.light);
    const auto& l = light.as<Light>();

    REQUIRE(l.name == "rim");
    REQUIRE(l.position == Vec3{1.0, 2.0, 3.0});
    REQUIRE(l.color == Color{1.0f, 0.5f, 0.0f, 1.0f});
    REQUIRE(l.kind == LightKind::Spot);
    REQUIRE(l.tags == std::vector<std::string>{"a"});
    REQUIRE(l.opacity() == 0.25);
    REQUIRE(l.intensity == 1.0f);
}

TEST_CASE("CompositeConverter - keys match case-insensitively, unknown keys are ignored", "[conversion][composite]") {
    ConversionEngine engine;
    const auto& types = scene_types();

    auto point = engine.convert(DynamicValue(Mapping{{"X", 4}, {"y", 5}, {"w", 6}}), types.vec3);

    REQUIRE(point.as<Vec3>() == Vec3{4.0, 5.0, 0.0});
}

TEST_CASE("CompositeConverter - invisible and read-only members are not written", "[conversion][composite]") {
    ConversionEngine engine;
    const auto& types = scene_types();

    auto node = engine.convert(DynamicValue(Mapping{{"internal_note", "x"}, {"revision", 99}, {"name", "n"}}),
                               types.node);

    REQUIRE(node.as<Node>().internal_note.empty());
    REQUIRE(node.as<Node>().revision() == 7);
    REQUIRE(node.as<Node>().name == "n");
}

TEST_CASE("CompositeConverter - a bad member degrades while siblings convert", "[conversion][composite]") {
    LogCapture logs;
    ConversionEngine engine;
    const auto& types = scene_types();

    auto point = engine.convert(DynamicValue(Mapping{{"x", "wide"}, {"y", 2}}), types.vec3);

    REQUIRE(point.as<Vec3>() == Vec3{0.0, 2.0, 0.0});
    REQUIRE(logs.count(LogLevel::Warning) == 1);
}

// ============================================================================
// References
// ============================================================================

TEST_CASE("ReferenceConverter - resolves paths and ids", "[conversion][reference]") {
    LogCapture logs;
    Scene scene;
    auto& cube = scene.add_node("Stage/Cube", "101");
    auto engine = engine_for(scene);
    const auto* ref = scene_types().node_ref;

    REQUIRE(engine.convert(DynamicValue(ReferenceDescriptor{.id = {}, .path = "Stage/Cube"}), ref).as<Node*>() == &cube);
    REQUIRE(engine.convert(DynamicValue(ReferenceDescriptor{.id = "101", .path = {}}), ref).as<Node*>() == &cube);
    REQUIRE(engine.convert(DynamicValue(Mapping{{"$ref", "/Stage/Cube"}}), ref).as<Node*>() == &cube);
    REQUIRE(engine.convert(DynamicValue(Mapping{{"globalObjectId", "101"}}), ref).as<Node*>() == &cube);
    REQUIRE(engine.convert(DynamicValue(Mapping{{"guid", 101}}), ref).as<Node*>() == &cube);
    REQUIRE(engine.convert(DynamicValue("Stage/Cube"), ref).as<Node*>() == &cube);
}

TEST_CASE("ReferenceConverter - accepts every locator key", "[conversion][reference]") {
    LogCapture logs;
    Scene scene;
    auto& cube = scene.add_node("Stage/Cube", "101");
    auto& sphere = scene.add_node("Stage/Sphere", "102");
    auto engine = engine_for(scene);
    const auto* ref = scene_types().node_ref;

    auto typed = Mapping{{"$type", "reference"}, {"$path", "Stage/Cube"}};
    REQUIRE(engine.convert(DynamicValue(typed), ref).as<Node*>() == &cube);
    REQUIRE(engine.convert(DynamicValue(Mapping{{"_gameObjectPath", "Stage/Cube"}}), ref).as<Node*>() == &cube);
    for (const char* key : {"path", "gameObjectPath", "objectPath", "target", "reference"}) {
        INFO(key);
        REQUIRE(engine.convert(DynamicValue(Mapping{{key, "Stage/Sphere"}}), ref).as<Node*>() == &sphere);
    }
    REQUIRE(engine.convert(DynamicValue(Mapping{{"name", "Stage/Sphere"}}), ref).as<Node*>() == &sphere);
}

TEST_CASE("ReferenceConverter - earlier locator keys take precedence", "[conversion][reference]") {
    LogCapture logs;
    Scene scene;
    auto& cube = scene.add_node("Stage/Cube", "101");
    auto& sphere = scene.add_node("Stage/Sphere", "102");
    auto engine = engine_for(scene);
    const auto* ref = scene_types().node_ref;

    auto typed_first = Mapping{{"$type", "reference"}, {"$path", "Stage/Cube"}, {"$ref", "Stage/Sphere"}};
    REQUIRE(engine.convert(DynamicValue(typed_first), ref).as<Node*>() == &cube);
    auto ref_first = Mapping{{"$ref", "Stage/Sphere"}, {"_gameObjectPath", "Stage/Cube"}};
    REQUIRE(engine.convert(DynamicValue(ref_first), ref).as<Node*>() == &sphere);
    auto path_first = Mapping{{"path", "Stage/Cube"}, {"target", "Stage/Sphere"}};
    REQUIRE(engine.convert(DynamicValue(path_first), ref).as<Node*>() == &cube);

    // $path only counts when tagged as a reference
    auto untagged = Mapping{{"$type", "other"}, {"$path", "Stage/Cube"}};
    REQUIRE_FALSE(engine.try_convert(DynamicValue(untagged), ref).ok());
    // A lone id is never read as a path
    REQUIRE(engine.convert(DynamicValue(Mapping{{"$id", "102"}}), ref).as<Node*>() == &sphere);
    REQUIRE_FALSE(engine.try_convert(DynamicValue(Mapping{{"name", 5}}), ref).ok());
}

TEST_CASE("ReferenceConverter - the locator path wins over the id", "[conversion][reference]") {
    LogCapture logs;
    Scene scene;
    auto& cube = scene.add_node("Stage/Cube", "101");
    auto& sphere = scene.add_node("Stage/Sphere", "102");
    auto engine = engine_for(scene);
    const auto* ref = scene_types().node_ref;

    auto both = DynamicValue(ReferenceDescriptor{.id = "102", .path = "Stage/Cube"});
    REQUIRE(engine.convert(both, ref).as<Node*>() == &cube);

    auto stale_path = DynamicValue(ReferenceDescriptor{.id = "102", .path = "Stage/Gone"});
    REQUIRE(engine.convert(stale_path, ref).as<Node*>() == &sphere);
}

TEST_CASE("ReferenceConverter - unresolved references are null, not errors", "[conversion][reference]") {
    LogCapture logs;
    Scene scene;
    auto engine = engine_for(scene);
    const auto* ref = scene_types().node_ref;

    auto result = engine.try_convert(DynamicValue(ReferenceDescriptor{.id = "404", .path = {}}), ref);

    REQUIRE(result.ok());
    REQUIRE(result.value.is_null());

    ConversionEngine detached;
    REQUIRE(detached.convert(DynamicValue("Stage/Cube"), ref).is_null());
}

TEST_CASE("ReferenceConverter - derived objects resolve through their base", "[conversion][reference]") {
    LogCapture logs;
    Scene scene;
    auto& lamp = scene.add_light("Stage/Lamp", "201");
    auto engine = engine_for(scene);

    auto node = engine.convert(DynamicValue("Stage/Lamp"), scene_types().node_ref);

    REQUIRE(node.as<Node*>() == static_cast<Node*>(&lamp));
}

TEST_CASE("ReferenceConverter - objects of an unrelated kind stay unresolved", "[conversion][reference]") {
    LogCapture logs;
    Scene scene;
    scene.add_node("Stage/Cube", "101");
    auto engine = engine_for(scene);
    TypeRegistry registry;
    registry.bundle<Node>("Node").serialized_field("name", &Node::name).build();
    registry.bundle<Light>("Light").base<Node>().build();

    auto light_ref = engine.convert(DynamicValue("Stage/Cube"), registry.ref<Light>());

    REQUIRE(light_ref.is_null());
    REQUIRE(logs.contains("which is not a"));
}

TEST_CASE("ReferenceConverter - reference members inside composites", "[conversion][reference]") {
    LogCapture logs;
    Scene scene;
    auto& cube = scene.add_node("Stage/Cube", "101");
    auto engine = engine_for(scene);

    auto light = engine.convert(DynamicValue(Mapping{{"target", Mapping{{"$id", "101"}}}}), scene_types().light);

    REQUIRE(light.as<Light>().target == &cube);
}

// ============================================================================
// Structural fallback and tolerance
// ============================================================================

TEST_CASE("StructuralConverter - decodes shapes no narrow converter handles", "[conversion][structural]") {
    LogCapture logs;
    ConversionEngine engine;
    const auto* color = scene_types().color;

    REQUIRE(engine.convert(DynamicValue("#FF0000"), color).as<Color>() == Color{1.0f, 0.0f, 0.0f, 1.0f});
    REQUIRE(engine.convert(DynamicValue(Sequence{0, 1, 0, 0.5}), color).as<Color>() == Color{0.0f, 1.0f, 0.0f, 0.5f});
}

TEST_CASE("StructuralConverter - opaque types decode the structural form", "[conversion][structural]") {
    struct Tag {
        std::string text;
    };
    ConversionEngine engine;
    TypeRegistry registry;
    const auto* meta = registry.opaque<Tag>("Tag", [](Tag& tag, const DynamicValue& structural) {
        tag.text = structural.find("$id") != nullptr ? "ref:" + structural.find("$id")->as_string() : structural.to_string();
    });

    REQUIRE(engine.convert(DynamicValue(ReferenceDescriptor{.id = "5", .path = {}}), meta).as<Tag>().text == "ref:5");
    REQUIRE(engine.convert(DynamicValue(12), meta).as<Tag>().text == "12");
}

TEST_CASE("ConversionEngine - the dynamic pass-through type accepts anything", "[conversion][structural]") {
    ConversionEngine engine;
    DynamicValue input(Mapping{{"free", Sequence{1, "form"}}});

    REQUIRE(engine.convert(input, dynamic_type_meta()).as<DynamicValue>() == input);
}

TEST_CASE("ConversionEngine - failures are absorbed by convert", "[conversion][tolerance]") {
    LogCapture logs;
    ConversionEngine engine;
    const auto& types = scene_types();

    auto color = engine.convert(DynamicValue("not a colour"), types.color);
    REQUIRE(color.as<Color>() == Color{});
    REQUIRE(logs.contains("Failed to convert"));

    REQUIRE_THROWS_AS(engine.convert_into(nullptr, DynamicValue(true), types.vec3), ConversionError);
}

TEST_CASE("ConversionEngine - conversion failure logging can be disabled", "[conversion][tolerance]") {
    LogCapture logs;
    BridgeConfig quiet;
    quiet.log_conversion_failures = false;
    quiet.log_level = LogLevel::Debug;
    BridgeConfig::set(quiet);
    auto restore = make_scope_exit([] {
        BridgeConfig defaults;
        defaults.log_level = LogLevel::Debug;
        BridgeConfig::set(defaults);
    });

    ConversionEngine engine;
    auto value = engine.convert(DynamicValue("x"), scalar_type_meta<int32_t>());

    REQUIRE(value.as<int32_t>() == 0);
    REQUIRE_FALSE(logs.contains("Failed to convert"));
}

// ============================================================================
// Chain customisation
// ============================================================================

namespace {

    // Reads "a,b,c" strings into Vec3
    class CsvVec3Converter : public ValueConverter {
    public:
        [[nodiscard]] int priority() const override { return 250; }
        [[nodiscard]] std::string_view name() const override { return "csv"; }

        [[nodiscard]] bool can_convert(const DynamicValue& value, const TypeMeta* target) const override {
            return value.is_string() && target == scene_types().vec3;
        }

        void convert(void* dest, const DynamicValue& value, const TypeMeta*, const ConversionEngine&) const override {
            auto& point = *static_cast<Vec3*>(dest);
            const auto& text = value.as_string();
            auto first = text.find(',');
            auto second = text.find(',', first + 1);
            if (first == std::string::npos || second == std::string::npos) {
                throw_error<ConversionError>("'{}' is not x,y,z", text);
            }
            point = Vec3{*parse_double(text.substr(0, first)), *parse_double(text.substr(first + 1, second - first - 1)),
                         *parse_double(text.substr(second + 1))};
        }
    };

}  // namespace

TEST_CASE("ConversionEngine - converters are ordered by priority", "[conversion][chain]") {
    ConversionEngine engine;
    engine.add_converter(std::make_unique<CsvVec3Converter>());

    std::vector<int> priorities;
    for (const auto& converter : engine.converters()) priorities.push_back(converter->priority());
    REQUIRE(std::is_sorted(priorities.rbegin(), priorities.rend()));
    REQUIRE(engine.converters()[2]->name() == "csv");

    REQUIRE(engine.convert(DynamicValue("1,2,3"), scene_types().vec3).as<Vec3>() == Vec3{1.0, 2.0, 3.0});
    REQUIRE_THROWS_AS(engine.add_converter(nullptr), std::invalid_argument);
}
