#include <catch2/catch_test_macros.hpp>
#include <microdi.hpp>
#include <memory>
#include <string>

namespace {

struct Config {
    std::string environment = "test";
};

struct DeclaredSingleton {
    static void describe(microdi::manifest<DeclaredSingleton>& m) {
        m.singleton();
    }
};

struct Consumer {
    std::shared_ptr<Config> config;

    static void describe(microdi::manifest<Consumer>& m) {
        m.inject("config", &Consumer::config);
    }
};

struct ICache {
    virtual ~ICache() = default;
    virtual int hits() const = 0;
};

struct MemoryCache : ICache {
    int hits() const override { return 0; }

    static void describe(microdi::manifest<MemoryCache>& m) {
        m.singleton();
    }
};

struct Counted {
    inline static int hooks = 0;
    void init() { ++hooks; }

    std::shared_ptr<Config> config;

    static void describe(microdi::manifest<Counted>& m) {
        m.inject("config", &Counted::config)
         .post_construct("init", &Counted::init);
    }
};

} // namespace

TEST_CASE("declared singleton returns the same instance", "[lifetime]") {
    microdi::container c;
    auto a = c.get_instance<DeclaredSingleton>();
    auto b = c.get_instance<DeclaredSingleton>();
    REQUIRE(a.get() == b.get());
    REQUIRE(c.is_singleton<DeclaredSingleton>());
    REQUIRE(c.singleton_count() == 1);
}

TEST_CASE("mark_singleton forces singleton scope", "[lifetime]") {
    microdi::container c;
    REQUIRE_FALSE(c.is_singleton<Config>());
    c.mark_singleton<Config>();
    REQUIRE(c.is_singleton<Config>());

    auto a = c.get_instance<Config>();
    auto b = c.get_instance<Config>();
    REQUIRE(a.get() == b.get());
}

TEST_CASE("injected singleton is the cached instance", "[lifetime]") {
    microdi::container c;
    c.mark_singleton<Config>();

    auto config = c.get_instance<Config>();
    auto consumer = c.get_instance<Consumer>();
    REQUIRE(consumer->config.get() == config.get());

    auto other = c.get_instance<Consumer>();
    REQUIRE(other.get() != consumer.get());
    REQUIRE(other->config.get() == config.get());
}

TEST_CASE("singleton is shared between interface and implementation requests", "[lifetime]") {
    microdi::container c;
    c.bind_interface<ICache, MemoryCache>();

    auto via_interface = c.get_instance<ICache>();
    auto direct = c.get_instance<MemoryCache>();
    REQUIRE(static_cast<ICache*>(direct.get()) == via_interface.get());
    REQUIRE(c.singleton_count() == 1);
}

TEST_CASE("cached singleton is not re-injected nor re-initialised", "[lifetime]") {
    Counted::hooks = 0;
    microdi::container c;
    c.mark_singleton<Counted>();

    auto first = c.get_instance<Counted>();
    auto config = first->config;
    auto second = c.get_instance<Counted>();

    REQUIRE(first.get() == second.get());
    REQUIRE(second->config == config);
    REQUIRE(Counted::hooks == 1);
}

TEST_CASE("provider result is cached for singleton-scoped types", "[lifetime]") {
    microdi::container c;
    int calls = 0;
    c.bind_provider<Config>([&calls] {
        ++calls;
        return std::make_shared<Config>();
    });
    c.mark_singleton<Config>();

    auto a = c.get_instance<Config>();
    auto b = c.get_instance<Config>();
    REQUIRE(a.get() == b.get());
    REQUIRE(calls == 1);
}

TEST_CASE("provider for a declared singleton is invoked once", "[lifetime]") {
    microdi::container c;
    int calls = 0;
    c.bind_provider<DeclaredSingleton>([&calls] {
        ++calls;
        return std::make_shared<DeclaredSingleton>();
    });

    auto a = c.get_instance<DeclaredSingleton>();
    auto b = c.get_instance<DeclaredSingleton>();
    REQUIRE(a.get() == b.get());
    REQUIRE(calls == 1);
}

TEST_CASE("provider for a non-singleton type is invoked on every request", "[lifetime]") {
    microdi::container c;
    int calls = 0;
    c.bind_provider<Config>([&calls] {
        ++calls;
        return std::make_shared<Config>();
    });

    auto a = c.get_instance<Config>();
    auto b = c.get_instance<Config>();
    REQUIRE(a.get() != b.get());
    REQUIRE(calls == 2);
    REQUIRE(c.singleton_count() == 0);
}

TEST_CASE("bound instance is returned unchanged", "[lifetime]") {
    Counted::hooks = 0;
    microdi::container c;

    auto prebuilt = std::make_shared<Counted>();
    c.bind_instance(prebuilt);

    auto a = c.get_instance<Counted>();
    auto b = c.get_instance<Counted>();
    REQUIRE(a == prebuilt);
    REQUIRE(b == prebuilt);
    // neither injected nor initialised by the container
    REQUIRE(a->config == nullptr);
    REQUIRE(Counted::hooks == 0);
}

TEST_CASE("singletons are released with the container", "[lifetime]") {
    std::weak_ptr<DeclaredSingleton> observer;
    {
        microdi::container c;
        observer = c.get_instance<DeclaredSingleton>();
        REQUIRE_FALSE(observer.expired());
    }
    REQUIRE(observer.expired());
}

TEST_CASE("separate containers keep separate singletons", "[lifetime]") {
    microdi::container c1;
    microdi::container c2;
    REQUIRE(c1.get_instance<DeclaredSingleton>().get()
            != c2.get_instance<DeclaredSingleton>().get());
}
