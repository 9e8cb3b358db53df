/// basic_usage.cpp: libctdi introductory example.
///
/// Walks through the bind, compose, build, resolve workflow:
///   1. Define interfaces and implementations (no framework base classes).
///   2. Bind components and providers, declaring dependencies via deps<>.
///   3. compose() validates the graph once; modules are built from it.
///   4. Per-module parameters and overrides tailor a module without
///      touching the composition.

#include <libctdi.hpp>

#include <spdlog/spdlog.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace libctdi;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_output {
    virtual ~i_output() = default;
    virtual void write(const std::string& line) = 0;
};

struct i_date_writer {
    virtual ~i_date_writer() = default;
    virtual void write_date() = 0;
};

struct i_request_context {
    virtual ~i_request_context() = default;
    virtual std::string request_id() const = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct console_output : i_output {
    void write(const std::string& line) override {
        std::cout << line << '\n';
    }
};

struct today_writer : i_date_writer {
    struct parameters {
        std::string today = "Jan 1";
        int year = 1970;
    };

    today_writer(i_output& out, const parameters& p)
        : out_(out), today_(p.today), year_(p.year) {}

    void write_date() override {
        out_.write("Today is " + today_ + ", " + std::to_string(year_));
    }

private:
    i_output& out_;
    std::string today_;
    int year_;
};

struct request_context : i_request_context {
    inline static int counter = 0;
    int id_;

    explicit request_context(i_output& out) : id_(++counter) {
        out.write("opened request " + request_id());
    }

    std::string request_id() const override {
        return "req-" + std::to_string(id_);
    }
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    // Surface the library's composition and build records.
    get_logger()->set_level(spdlog::level::debug);

    // ── Binding phase ─────────────────────────────────────────────────
    binding_table table;

    // console_output: component, one instance per module.
    table.add_component<i_output, console_output>();

    // today_writer: component, depends on i_output, tunable via parameters.
    table.add_component<i_date_writer, today_writer>(deps<i_output>);

    // request_context: provider, a fresh instance per provide() call.
    table.add_provider<i_request_context, request_context>(deps<i_output>);

    // ── Compose phase (validates the dependency graph) ────────────────
    auto bindings = table.compose();

    // ── Module with declared defaults ─────────────────────────────────
    auto plain = module::builder(bindings).build();
    plain->resolve<i_date_writer>().write_date();

    // ── Module with a parameter overlay ───────────────────────────────
    auto tuned = module::builder(bindings)
                     .with_component_parameters<today_writer>({.today = "June 19", .year = 2020})
                     .build();
    tuned->resolve<i_date_writer>().write_date();

    // Components are shared within a module, providers are not.
    auto& w1 = tuned->resolve<i_date_writer>();
    auto& w2 = tuned->resolve<i_date_writer>();
    assert(&w1 == &w2 && "component must return the same instance");

    const auto ctx1 = tuned->provide<i_request_context>();
    const auto ctx2 = tuned->provide<i_request_context>();
    assert(ctx1.get() != ctx2.get() && "provider must return fresh instances");
    (void)w1;
    (void)w2;

    // ── Module with an instance override ──────────────────────────────
    struct silent_output : i_output {
        void write(const std::string&) override {}
    };
    auto quiet = module::builder(bindings)
                     .with_component_override<i_output>(std::make_unique<silent_output>())
                     .build();
    quiet->resolve<i_date_writer>().write_date();

    std::cout << "Done.\n";
    return 0;
}
