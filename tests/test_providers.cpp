#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libctdi.hpp>

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

struct IConfig {
    virtual ~IConfig() = default;
    virtual std::string dsn() const = 0;
};

struct StaticConfig : IConfig {
    std::string dsn() const override { return "db://local"; }
};

struct IConnection {
    virtual ~IConnection() = default;
    virtual std::string dsn() const = 0;
};

struct Connection : IConnection {
    explicit Connection(IConfig& config) : dsn_(config.dsn()) {}
    std::string dsn() const override { return dsn_; }
    std::string dsn_;
};

struct IRepository {
    virtual ~IRepository() = default;
    virtual IConnection& connection() const = 0;
};

struct Repository : IRepository {
    explicit Repository(std::unique_ptr<IConnection> conn) : conn_(std::move(conn)) {}
    IConnection& connection() const override { return *conn_; }
    std::unique_ptr<IConnection> conn_;
};

struct connection_refused : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct RefusingProvider {
    static std::unique_ptr<IConnection> provide(const libctdi::module& /*m*/) {
        throw connection_refused("refused by db://local");
    }
};

struct WrappingProvider {
    static std::unique_ptr<IConnection> provide(const libctdi::module& /*m*/) {
        try {
            throw std::runtime_error("socket closed");
        } catch (const std::runtime_error&) {
            std::throw_with_nested(libctdi::provision_error("could not open connection"));
        }
    }
};

struct ConfiguredProvider {
    static std::unique_ptr<IConnection> provide(const libctdi::module& m) {
        return std::make_unique<Connection>(m.resolve<IConfig>());
    }
};

} // namespace

TEST_CASE("provider constructed from its dependencies", "[providers]") {
    libctdi::binding_table table;
    table.add_component<IConfig, StaticConfig>();
    table.add_provider<IConnection, Connection>(libctdi::deps<IConfig>);
    auto m = libctdi::module::builder(table.compose()).build();

    REQUIRE(m->provide<IConnection>()->dsn() == "db://local");
}

TEST_CASE("provided dependencies are fresh for every consumer", "[providers]") {
    libctdi::binding_table table;
    table.add_component<IConfig, StaticConfig>();
    table.add_provider<IConnection, Connection>(libctdi::deps<IConfig>);
    table.add_provider<IRepository, Repository>(
        libctdi::deps<libctdi::provided<IConnection>>);
    auto m = libctdi::module::builder(table.compose()).build();

    auto a = m->provide<IRepository>();
    auto b = m->provide<IRepository>();
    REQUIRE(&a->connection() != &b->connection());
}

TEST_CASE("custom provider function builds the instance", "[providers]") {
    libctdi::binding_table table;
    table.add_component<IConfig, StaticConfig>();
    table.add_provider<IConnection, ConfiguredProvider>(libctdi::deps<IConfig>);
    auto bindings = table.compose();

    REQUIRE(bindings->find(typeid(IConnection))->impl_type
            == std::type_index(typeid(ConfiguredProvider)));

    auto m = libctdi::module::builder(bindings).build();
    REQUIRE(m->provide<IConnection>()->dsn() == "db://local");
}

TEST_CASE("custom provider dependencies are validated", "[providers]") {
    libctdi::binding_table table;
    table.add_provider<IConnection, ConfiguredProvider>(libctdi::deps<IConfig>);

    REQUIRE_THROWS_AS(table.compose(), libctdi::not_found);
}

TEST_CASE("provider errors propagate unchanged", "[providers]") {
    libctdi::binding_table table;
    table.add_provider<IConnection, RefusingProvider>();
    auto m = libctdi::module::builder(table.compose()).build();

    REQUIRE_THROWS_AS(m->provide<IConnection>(), connection_refused);
}

TEST_CASE("nested provider errors propagate unchanged", "[providers]") {
    libctdi::binding_table table;
    table.add_provider<IConnection, RefusingProvider>();
    table.add_provider<IRepository, Repository>(
        libctdi::deps<libctdi::provided<IConnection>>);
    auto m = libctdi::module::builder(table.compose()).build();

    try {
        m->provide<IRepository>();
        FAIL("Expected connection_refused");
    } catch (const connection_refused& e) {
        REQUIRE(std::string(e.what()) == "refused by db://local");
    }
}

TEST_CASE("provision_error carries its cause", "[providers]") {
    libctdi::binding_table table;
    table.add_provider<IConnection, WrappingProvider>();
    auto m = libctdi::module::builder(table.compose()).build();

    try {
        m->provide<IConnection>();
        FAIL("Expected provision_error");
    } catch (const libctdi::provision_error& e) {
        REQUIRE(libctdi::describe_error_chain(e)
                == "could not open connection: socket closed");
    }
}

TEST_CASE("failing provider does not poison later calls", "[providers]") {
    static int attempts = 0;
    attempts = 0;

    struct FlakyProvider {
        static std::unique_ptr<IConnection> provide(const libctdi::module& /*m*/) {
            if (++attempts == 1) throw connection_refused("first attempt");
            StaticConfig config;
            return std::make_unique<Connection>(config);
        }
    };

    libctdi::binding_table table;
    table.add_provider<IConnection, FlakyProvider>();
    auto m = libctdi::module::builder(table.compose()).build();

    REQUIRE_THROWS_AS(m->provide<IConnection>(), connection_refused);
    REQUIRE(m->provide<IConnection>()->dsn() == "db://local");
    REQUIRE(attempts == 2);
}

TEST_CASE("component failure inside a provider surfaces as resolution_error",
          "[providers]") {
    struct BrokenConfig : IConfig {
        BrokenConfig() { throw std::runtime_error("config file missing"); }
        std::string dsn() const override { return {}; }
    };

    libctdi::binding_table table;
    table.add_component<IConfig, BrokenConfig>();
    table.add_provider<IConnection, Connection>(libctdi::deps<IConfig>);
    auto m = libctdi::module::builder(table.compose()).build();

    try {
        m->provide<IConnection>();
        FAIL("Expected resolution_error");
    } catch (const libctdi::resolution_error& e) {
        REQUIRE_THAT(std::string(e.what()),
                     Catch::Matchers::ContainsSubstring("config file missing"));
    }
}
