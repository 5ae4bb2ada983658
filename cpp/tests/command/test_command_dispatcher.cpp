/**
 * Unit tests for CommandDispatcher routing
 */

#include <catch2/catch_test_macros.hpp>
#include <fixtures/scene_fixture.h>
#include <opbridge/command/command_dispatcher.h>
#include <opbridge/types/error_type.h>

#include <stdexcept>

using namespace opbridge;
using namespace opbridge::value;
using namespace opbridge::testing;

namespace {

    class RecordingHandler : public CommandHandler {
    public:
        [[nodiscard]] const std::vector<std::string>& supported_operations() const override {
            static const std::vector<std::string> operations{"inspect", "update"};
            return operations;
        }
        [[nodiscard]] std::string_view category() const override { return "scene"; }

        Mapping last_payload;

    protected:
        Mapping execute_operation(const std::string& operation, const Mapping& payload) override {
            last_payload = payload;
            return Mapping{{"operation", operation}};
        }
    };

    struct DispatcherFixture {
        LogCapture logs;
        CommandRegistry registry;
        RecordingHandler& handler{registry.emplace<RecordingHandler>("sceneManage")};
        CommandDispatcher dispatcher{registry};
    };

}  // namespace

TEST_CASE("CommandDispatcher - routes by tool name", "[command][dispatcher]") {
    DispatcherFixture f;

    auto response = f.dispatcher.execute({.tool = "sceneManage", .operation = {},
                                          .payload = Mapping{{"operation", "inspect"}, {"path", "a"}}});

    REQUIRE(response.at("success") == DynamicValue(true));
    REQUIRE(response.at("operation") == DynamicValue("inspect"));
    REQUIRE(f.handler.last_payload.at("path") == DynamicValue("a"));
}

TEST_CASE("CommandDispatcher - the request operation fills the payload", "[command][dispatcher]") {
    DispatcherFixture f;

    auto bare = f.dispatcher.execute({.tool = "sceneManage", .operation = "update", .payload = std::nullopt});
    REQUIRE(bare.at("operation") == DynamicValue("update"));

    auto null_operation = f.dispatcher.execute(
        {.tool = "sceneManage", .operation = "inspect", .payload = Mapping{{"operation", nullptr}}});
    REQUIRE(null_operation.at("operation") == DynamicValue("inspect"));

    auto agreeing = f.dispatcher.execute(
        {.tool = "sceneManage", .operation = "inspect", .payload = Mapping{{"operation", "inspect"}}});
    REQUIRE(agreeing.at("success") == DynamicValue(true));
}

TEST_CASE("CommandDispatcher - conflicting operations are rejected", "[command][dispatcher]") {
    DispatcherFixture f;

    auto response = f.dispatcher.execute(
        {.tool = "sceneManage", .operation = "update", .payload = Mapping{{"operation", "inspect"}}});

    REQUIRE(response.at("success") == DynamicValue(false));
    REQUIRE(response.at("errorType") == DynamicValue("ValidationError"));
    REQUIRE(response.at("error") == DynamicValue("Operation 'update' conflicts with payload operation 'inspect'"));
    REQUIRE(response.at("category") == DynamicValue("dispatcher"));
    REQUIRE(f.handler.last_payload.empty());
}

TEST_CASE("CommandDispatcher - an unknown tool never throws", "[command][dispatcher]") {
    DispatcherFixture f;

    auto response = f.dispatcher.execute({.tool = "lightManage", .operation = "inspect", .payload = std::nullopt});

    REQUIRE(response == Mapping{{"success", false},
                                {"error", "No handler registered for tool: lightManage. Available handlers: sceneManage"},
                                {"errorType", "UnsupportedOperationError"},
                                {"category", "dispatcher"}});
}

TEST_CASE("CommandDispatcher - requests rejected before routing use the dispatcher envelope", "[command][dispatcher]") {
    auto rejected = CommandDispatcher::failure(ValidationError("Invalid payload: expected a dict, got list"));

    REQUIRE(rejected == Mapping{{"success", false},
                                {"error", "Invalid payload: expected a dict, got list"},
                                {"errorType", "ValidationError"},
                                {"category", "dispatcher"}});
    REQUIRE(CommandDispatcher::failure(std::runtime_error("boom")).at("errorType") ==
            DynamicValue("HandlerExecutionError"));
}

TEST_CASE("CommandDispatcher - handler failures keep the handler's category", "[command][dispatcher]") {
    DispatcherFixture f;

    auto response = f.dispatcher.execute({.tool = "sceneManage", .operation = "delete", .payload = std::nullopt});

    REQUIRE(response.at("errorType") == DynamicValue("UnsupportedOperationError"));
    REQUIRE(response.at("category") == DynamicValue("scene"));
}

TEST_CASE("CommandDispatcher - statistics", "[command][dispatcher]") {
    DispatcherFixture f;

    auto stats = f.dispatcher.statistics();

    REQUIRE(stats.at("totalHandlers") == DynamicValue(1));
    REQUIRE(stats.at("initialized") == DynamicValue(false));
    REQUIRE(&f.dispatcher.registry() == &f.registry);
}
