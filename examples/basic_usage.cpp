/// basic_usage.cpp — microdi introductory example.
///
/// Demonstrates the configure → resolve workflow:
///   1. Define interfaces and implementations; implementations describe
///      their injectable fields, scope and post-construct hooks in a
///      static manifest.
///   2. Bind interfaces, providers and instances on a container.
///   3. Resolve services by interface; singletons are shared, everything
///      else is built fresh per request.

#include <microdi.hpp>
#include <spdlog/spdlog.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct i_greeter {
    virtual ~i_greeter() = default;
    virtual std::string greet(const std::string& name) = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct app_config {
    std::string greeting = "Hello";

    static void describe(microdi::manifest<app_config>& m) {
        m.singleton();
    }
};

struct console_logger : i_logger {
    void log(const std::string& message) override {
        std::cout << "[LOG] " << message << '\n';
    }
};

class greeter : public i_greeter {
public:
    std::string greet(const std::string& name) override {
        const auto msg = config_->greeting + ", " + name + '!';
        logger_->log(msg);
        return msg;
    }

    static void describe(microdi::manifest<greeter>& m) {
        m.singleton()
         .inject("logger", &greeter::logger_)
         .inject("config", &greeter::config_)
         .post_construct("announce", &greeter::announce);
    }

private:
    void announce() { logger_->log("greeter ready"); }

    std::shared_ptr<i_logger> logger_;
    std::shared_ptr<app_config> config_;
};

struct request_context {
    inline static int counter = 0;
    int id = ++counter;
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    spdlog::set_level(spdlog::level::debug);

    microdi::container container;

    // ── Configuration ────────────────────────────────────────────────
    container.bind_interface<i_logger, console_logger>()
             .bind_interface<i_greeter, greeter>();

    // ── Resolution ───────────────────────────────────────────────────

    // greeter is declared singleton: every request shares one instance.
    const auto g1 = container.get_instance<i_greeter>();
    const auto g2 = container.get_instance<i_greeter>();
    assert(g1.get() == g2.get() && "singleton must return the same instance");
    std::cout << g1->greet("World") << '\n';

    // request_context has no manifest: a new instance per request.
    const auto ctx1 = container.get_instance<request_context>();
    const auto ctx2 = container.get_instance<request_context>();
    assert(ctx1.get() != ctx2.get());
    std::cout << "request ids: " << ctx1->id << ", " << ctx2->id << '\n';

    // Unbound interfaces are reported, never defaulted.
    struct i_unbound {
        virtual ~i_unbound() = default;
        virtual void run() = 0;
    };
    try {
        container.get_instance<i_unbound>();
    } catch (const microdi::unresolved_interface& e) {
        std::cout << "expected error: " << e.what() << '\n';
    }

    return 0;
}
