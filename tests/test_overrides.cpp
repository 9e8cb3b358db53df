#include <catch2/catch_test_macros.hpp>
#include <libctdi.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace {

struct IClock {
    virtual ~IClock() = default;
    virtual int now() const = 0;
};

struct SystemClock : IClock {
    static std::atomic<int> constructed;
    struct parameters {
        int epoch = 1000;
    };
    explicit SystemClock(const parameters& p) : epoch_(p.epoch) { ++constructed; }
    int now() const override { return epoch_; }
    int epoch_;
};
std::atomic<int> SystemClock::constructed{0};

struct FixedClock : IClock {
    explicit FixedClock(int t) : t_(t) {}
    int now() const override { return t_; }
    int t_;
};

struct IScheduler {
    virtual ~IScheduler() = default;
    virtual IClock& clock() const = 0;
};

struct Scheduler : IScheduler {
    explicit Scheduler(IClock& clock) : clock_(clock) {}
    IClock& clock() const override { return clock_; }
    IClock& clock_;
};

struct IConnection {
    virtual ~IConnection() = default;
    virtual std::string endpoint() const = 0;
};

struct TcpConnection : IConnection {
    std::string endpoint() const override { return "tcp"; }
};

struct FakeConnection : IConnection {
    std::string endpoint() const override { return "fake"; }
};

struct ISession {
    virtual ~ISession() = default;
    virtual std::string endpoint() const = 0;
};

struct Session : ISession {
    explicit Session(std::unique_ptr<IConnection> conn) : conn_(std::move(conn)) {}
    std::string endpoint() const override { return conn_->endpoint(); }
    std::unique_ptr<IConnection> conn_;
};

struct IAudit {
    virtual ~IAudit() = default;
    virtual std::string tag() const = 0;
};

struct Audit : IAudit {
    std::string tag() const override { return "audit"; }
};

std::shared_ptr<const libctdi::composition> make_bindings() {
    libctdi::binding_table table;
    table.add_component<IClock, SystemClock>();
    table.add_component<IScheduler, Scheduler>(libctdi::deps<IClock>);
    table.add_provider<IConnection, TcpConnection>();
    table.add_provider<ISession, Session>(libctdi::deps<libctdi::provided<IConnection>>);
    table.add_provider<IAudit, Audit>();
    return table.compose();
}

std::unique_ptr<IConnection> make_fake(const libctdi::module& /*m*/) {
    return std::make_unique<FakeConnection>();
}

} // namespace

TEST_CASE("component override is returned by resolve", "[overrides]") {
    SystemClock::constructed = 0;

    auto fixed = std::make_unique<FixedClock>(42);
    IClock* expected = fixed.get();
    auto m = libctdi::module::builder(make_bindings())
                 .with_component_override<IClock>(std::move(fixed))
                 .build();

    REQUIRE(&m->resolve<IClock>() == expected);
    REQUIRE(m->resolve<IClock>().now() == 42);
    REQUIRE(SystemClock::constructed == 0);
}

TEST_CASE("dependents receive the overridden component", "[overrides]") {
    auto m = libctdi::module::builder(make_bindings())
                 .with_component_override<IClock>(std::make_unique<FixedClock>(7))
                 .build();

    REQUIRE(&m->resolve<IScheduler>().clock() == &m->resolve<IClock>());
    REQUIRE(m->resolve<IScheduler>().clock().now() == 7);
}

TEST_CASE("component override wins over a parameter overlay", "[overrides]") {
    SystemClock::constructed = 0;

    SECTION("override staged first") {
        auto m = libctdi::module::builder(make_bindings())
                     .with_component_override<IClock>(std::make_unique<FixedClock>(1))
                     .with_component_parameters<SystemClock>({.epoch = 5})
                     .build();
        REQUIRE(m->resolve<IClock>().now() == 1);
    }

    SECTION("parameters staged first") {
        auto m = libctdi::module::builder(make_bindings())
                     .with_component_parameters<SystemClock>({.epoch = 5})
                     .with_component_override<IClock>(std::make_unique<FixedClock>(1))
                     .build();
        REQUIRE(m->resolve<IClock>().now() == 1);
    }

    REQUIRE(SystemClock::constructed == 0);
}

TEST_CASE("provider override replaces the bound factory", "[overrides]") {
    auto m = libctdi::module::builder(make_bindings())
                 .with_provider_override<IConnection>(make_fake)
                 .build();

    REQUIRE(m->provide<IConnection>()->endpoint() == "fake");
    REQUIRE(m->provide<IConnection>()->endpoint() == "fake");
    // Providers depending on the overridden one see the override too
    REQUIRE(m->provide<ISession>()->endpoint() == "fake");
    REQUIRE(m->provide<IAudit>()->tag() == "audit");
}

TEST_CASE("provider override may resolve from the module", "[overrides]") {
    struct ClockedConnection : IConnection {
        explicit ClockedConnection(int t) : t_(t) {}
        std::string endpoint() const override { return "at-" + std::to_string(t_); }
        int t_;
    };

    auto m = libctdi::module::builder(make_bindings())
                 .with_component_override<IClock>(std::make_unique<FixedClock>(9))
                 .with_provider_override<IConnection>([](const libctdi::module& mod) {
                     return std::make_unique<ClockedConnection>(mod.resolve<IClock>().now());
                 })
                 .build();

    REQUIRE(m->provide<IConnection>()->endpoint() == "at-9");
}

TEST_CASE("overrides are local to the module they were staged on", "[overrides]") {
    auto bindings = make_bindings();
    auto tested = libctdi::module::builder(bindings)
                      .with_provider_override<IConnection>(make_fake)
                      .build();
    auto live = libctdi::module::builder(bindings).build();

    REQUIRE(tested->provide<IConnection>()->endpoint() == "fake");
    REQUIRE(live->provide<IConnection>()->endpoint() == "tcp");
}

TEST_CASE("override targets must be bound with the matching kind", "[overrides]") {
    struct IUnbound {
        virtual ~IUnbound() = default;
    };
    struct Unbound : IUnbound {};

    auto builder = libctdi::module::builder(make_bindings());

    REQUIRE_THROWS_AS(builder.with_component_override<IConnection>(
                          std::make_unique<FakeConnection>()),
                      libctdi::not_found);
    REQUIRE_THROWS_AS(builder.with_component_override<IUnbound>(
                          std::make_unique<Unbound>()),
                      libctdi::not_found);
    REQUIRE_THROWS_AS(builder.with_provider_override<IClock>(
                          [](const libctdi::module&) { return std::make_unique<FixedClock>(0); }),
                      libctdi::not_found);
}

TEST_CASE("null component override is rejected", "[overrides]") {
    auto builder = libctdi::module::builder(make_bindings());

    REQUIRE_THROWS_AS(builder.with_component_override<IClock>(nullptr), libctdi::di_error);
}

TEST_CASE("provider override returning null is rejected", "[overrides]") {
    auto m = libctdi::module::builder(make_bindings())
                 .with_provider_override<IConnection>([](const libctdi::module&) {
                     return std::unique_ptr<IConnection>{};
                 })
                 .build();

    REQUIRE_THROWS_AS(m->provide<IConnection>(), libctdi::di_error);
    // Dependents never receive the empty pointer either
    REQUIRE_THROWS_AS(m->provide<ISession>(), libctdi::di_error);
}

TEST_CASE("custom provide function returning null is rejected", "[overrides]") {
    struct NullFactory {
        static std::unique_ptr<IConnection> provide(const libctdi::module& /*m*/) {
            return nullptr;
        }
    };

    libctdi::binding_table table;
    table.add_provider<IConnection, NullFactory>();
    auto m = libctdi::module::builder(table.compose()).build();

    try {
        m->provide<IConnection>();
        FAIL("Expected di_error");
    } catch (const libctdi::di_error& e) {
        REQUIRE(std::string(e.what()).find("IConnection") != std::string::npos);
    }
}

TEST_CASE("builder cannot be used after build", "[overrides]") {
    auto builder = libctdi::module::builder(make_bindings());
    auto m = std::move(builder).build();

    REQUIRE(m != nullptr);
    REQUIRE_THROWS_AS(std::move(builder).build(), libctdi::di_error);
    REQUIRE_THROWS_AS(builder.with_component_parameters<SystemClock>({.epoch = 1}),
                      libctdi::di_error);
}

TEST_CASE("builder requires a composition", "[overrides]") {
    REQUIRE_THROWS_AS(libctdi::module::builder(nullptr), libctdi::di_error);
}
