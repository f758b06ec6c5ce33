#include "fake_window_host.hpp"
#include "fpanel/commands/floating_windows.hpp"
#include "fpanel/core/error.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace fpanel;
using fpanel::test::FakeWindowHost;

namespace {

struct Fixture
{
    FakeWindowHost host;
    WindowRegistry registry;
    WindowIdGenerator ids{ []() -> int64_t { return 1700000000000; } };
    FloatingWindowService service{ host, registry, ids };

    Fixture()
    {
        host.on_window_destroyed([this](std::string const& label) { service.handle_window_destroyed(label); });
    }
};

ErrorKind error_kind_of(auto&& operation)
{
    try
    {
        operation();
    }
    catch (CommandError const& e)
    {
        return e.kind();
    }
    FAIL("operation did not throw CommandError");
    return ErrorKind::InvalidRequest;
}

std::string error_message_of(auto&& operation)
{
    try
    {
        operation();
    }
    catch (CommandError const& e)
    {
        return e.what();
    }
    FAIL("operation did not throw CommandError");
    return {};
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// create
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("create registers the window and returns a prefixed id", "[service][create]")
{
    Fixture f;

    auto id = f.service.create();

    REQUIRE(id.starts_with("floating-"));
    REQUIRE(f.registry.size() == 1);
    REQUIRE(f.host.has_window(id));
}

TEST_CASE("create uses the panel defaults", "[service][create]")
{
    Fixture f;

    auto id = f.service.create();
    auto created = f.host.created();

    REQUIRE(created.size() == 1);
    auto const& options = created.front();
    REQUIRE(options.label == id);
    REQUIRE(options.title == "Floating Panel");
    REQUIRE(options.size == LogicalSize{ 400.0, 300.0 });
    REQUIRE(options.position == LogicalPosition{ 100.0, 100.0 });
    REQUIRE(options.resizable);
    REQUIRE(options.decorations);
    REQUIRE(options.always_on_top);
    REQUIRE_FALSE(options.skip_taskbar);
}

TEST_CASE("create honours a configured panel", "[service][create]")
{
    FakeWindowHost host;
    WindowRegistry registry;
    WindowIdGenerator ids;
    PanelConfig panel;
    panel.title = "Translator";
    panel.width = 320.0;
    panel.height = 200.0;
    panel.always_on_top = false;
    panel.min_width = 250.0;
    FloatingWindowService service(host, registry, ids, panel);

    service.create();

    auto const& options = host.created().front();
    REQUIRE(options.title == "Translator");
    REQUIRE(options.size == LogicalSize{ 320.0, 200.0 });
    REQUIRE_FALSE(options.always_on_top);
    REQUIRE(options.min_size.has_value());
    REQUIRE(options.min_size->width == 250.0);
    REQUIRE_FALSE(options.max_size.has_value());
}

TEST_CASE("create announces the floating panel role to the new window", "[service][create]")
{
    Fixture f;

    auto id = f.service.create();
    auto emitted = f.host.emitted();

    REQUIRE(emitted.size() == 1);
    REQUIRE(emitted.front().label == id);
    REQUIRE(emitted.front().event == "window-type");
    REQUIRE(emitted.front().payload == "floating-panel");
}

TEST_CASE("create fails cleanly when the host cannot build the window", "[service][create][error]")
{
    Fixture f;
    f.service.create();
    f.host.fail_create = true;

    REQUIRE(error_kind_of([&] { f.service.create(); }) == ErrorKind::HostWindowCreation);
    REQUIRE(error_message_of([&] { f.service.create(); }) == "Failed to create window: resource exhaustion");
    REQUIRE(f.registry.size() == 1);
    REQUIRE(f.host.emitted().size() == 1);
}

TEST_CASE("create still succeeds when the role event is lost", "[service][create][edge]")
{
    Fixture f;
    f.host.fail_emit = true;

    auto id = f.service.create();

    REQUIRE(f.registry.contains(id));
}

TEST_CASE("create within one millisecond yields distinct windows", "[service][create][edge]")
{
    Fixture f;

    auto first = f.service.create();
    auto second = f.service.create();

    REQUIRE(first == "floating-1700000000000");
    REQUIRE(second == "floating-1700000000001");
    REQUIRE(f.service.list() == std::vector<WindowId>{ first, second });
}

// ─────────────────────────────────────────────────────────────────────────────
// close
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("create then close round trip", "[service][close]")
{
    Fixture f;

    auto id = f.service.create();
    REQUIRE(id == "floating-1700000000000");
    REQUIRE(f.service.list() == std::vector<WindowId>{ "floating-1700000000000" });

    f.service.close(id);

    REQUIRE(f.service.list().empty());
    REQUIRE_FALSE(f.host.has_window(id));
    REQUIRE(f.host.closed() == std::vector<std::string>{ id });
}

TEST_CASE("close of an unknown id is NotFound and changes nothing", "[service][close][error]")
{
    Fixture f;
    auto id = f.service.create();

    REQUIRE(error_kind_of([&] { f.service.close("floating-nonexistent"); }) == ErrorKind::NotFound);
    REQUIRE(error_message_of([&] { f.service.close("floating-nonexistent"); }) == "Window not found");
    REQUIRE(f.service.list() == std::vector<WindowId>{ id });
    REQUIRE(f.host.closed().empty());
}

TEST_CASE("close failure on the host keeps the registry entry", "[service][close][error]")
{
    Fixture f;
    auto id = f.service.create();
    f.host.fail_close = true;

    REQUIRE(error_kind_of([&] { f.service.close(id); }) == ErrorKind::HostWindowClose);
    REQUIRE(error_message_of([&] { f.service.close(id); }) == "Failed to close window: window refused to close");
    REQUIRE(f.registry.contains(id));
}

TEST_CASE("close twice reports NotFound the second time", "[service][close][edge]")
{
    Fixture f;
    auto id = f.service.create();

    f.service.close(id);

    REQUIRE(error_kind_of([&] { f.service.close(id); }) == ErrorKind::NotFound);
}

TEST_CASE("close works on host windows the registry never tracked", "[service][close][edge]")
{
    Fixture f;
    auto id = f.service.create();
    f.host.add_foreign_window("settings");

    f.service.close("settings");

    REQUIRE_FALSE(f.host.has_window("settings"));
    REQUIRE(f.service.list() == std::vector<WindowId>{ id });
}

// ─────────────────────────────────────────────────────────────────────────────
// list
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("list keeps creation order across interleaved closes", "[service][list]")
{
    Fixture f;

    auto a = f.service.create();
    auto b = f.service.create();
    auto c = f.service.create();
    f.service.close(b);
    auto d = f.service.create();

    REQUIRE(f.service.list() == std::vector<WindowId>{ a, c, d });
}

// ─────────────────────────────────────────────────────────────────────────────
// reposition / resize
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("reposition moves the host window", "[service][update]")
{
    Fixture f;
    auto id = f.service.create();

    f.service.reposition(id, { 250.5, 40.0 });

    REQUIRE(f.host.window(id).position == LogicalPosition{ 250.5, 40.0 });
    REQUIRE(f.service.list() == std::vector<WindowId>{ id });
}

TEST_CASE("resize changes the host window size", "[service][update]")
{
    Fixture f;
    auto id = f.service.create();

    f.service.resize(id, { 640.0, 480.0 });

    REQUIRE(f.host.window(id).size == LogicalSize{ 640.0, 480.0 });
    REQUIRE(f.service.list() == std::vector<WindowId>{ id });
}

TEST_CASE("updates on unknown ids are NotFound", "[service][update][error]")
{
    Fixture f;
    auto id = f.service.create();

    REQUIRE(error_kind_of([&] { f.service.reposition("floating-nonexistent", { 1.0, 2.0 }); }) == ErrorKind::NotFound);
    REQUIRE(error_kind_of([&] { f.service.resize("floating-nonexistent", { 10.0, 20.0 }); }) == ErrorKind::NotFound);
    REQUIRE(f.service.list() == std::vector<WindowId>{ id });
}

TEST_CASE("host update failures are HostWindowUpdate errors", "[service][update][error]")
{
    Fixture f;
    auto id = f.service.create();
    f.host.fail_update = true;

    REQUIRE(error_kind_of([&] { f.service.reposition(id, { 1.0, 2.0 }); }) == ErrorKind::HostWindowUpdate);
    REQUIRE(
        error_message_of([&] { f.service.reposition(id, { 1.0, 2.0 }); })
        == "Failed to update position: configure rejected"
    );
    REQUIRE(error_kind_of([&] { f.service.resize(id, { 10.0, 20.0 }); }) == ErrorKind::HostWindowUpdate);
    REQUIRE(error_message_of([&] { f.service.resize(id, { 10.0, 20.0 }); }) == "Failed to update size: configure rejected");
    REQUIRE(f.registry.contains(id));
}

// ─────────────────────────────────────────────────────────────────────────────
// Reconciliation with the host
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("windows destroyed by the host leave the registry", "[service][reconcile]")
{
    Fixture f;
    auto a = f.service.create();
    auto b = f.service.create();

    f.host.destroy_externally(a);

    REQUIRE(f.service.list() == std::vector<WindowId>{ b });
    REQUIRE(error_kind_of([&] { f.service.close(a); }) == ErrorKind::NotFound);
}

TEST_CASE("a window destroyed during create is not registered", "[service][reconcile][edge]")
{
    // Destroys every window as soon as it is built, before create() records it
    class VanishingHost : public FakeWindowHost
    {
    public:
        void create_window(WindowOptions const& options) override
        {
            FakeWindowHost::create_window(options);
            destroy_externally(options.label);
        }
    };

    VanishingHost host;
    WindowRegistry registry;
    WindowIdGenerator ids{ []() -> int64_t { return 1700000000000; } };
    FloatingWindowService service{ host, registry, ids };
    host.on_window_destroyed([&](std::string const& label) { service.handle_window_destroyed(label); });

    auto id = service.create();

    REQUIRE(id == "floating-1700000000000");
    REQUIRE_FALSE(host.has_window(id));
    REQUIRE_FALSE(registry.contains(id));
    REQUIRE(service.list().empty());
    REQUIRE(error_kind_of([&] { service.close(id); }) == ErrorKind::NotFound);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("destruction of untracked windows leaves the registry alone", "[service][reconcile][edge]")
{
    Fixture f;
    auto id = f.service.create();
    f.host.add_foreign_window("main");

    f.host.destroy_externally("main");

    REQUIRE(f.service.list() == std::vector<WindowId>{ id });
}

TEST_CASE("greet formats the greeting", "[greet]")
{
    REQUIRE(greet("Ada") == "Hello, Ada! You've been greeted from fpanel!");
    REQUIRE(greet("") == "Hello, ! You've been greeted from fpanel!");
}
