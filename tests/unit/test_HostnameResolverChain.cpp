#include <catch2/catch_test_macros.hpp>

#include "core/identity/HostnameResolverChain.hpp"
#include "support/Fakes.hpp"

#include <stdexcept>

using namespace netledger::core;
using netledger::testing::FakeHostnameResolver;

namespace {

class FailingResolver : public IHostnameResolver {
public:
    std::optional<std::string> resolve(const std::string&, std::chrono::milliseconds) override {
        throw std::runtime_error("lookup exploded");
    }

    std::string name() const override { return "failing"; }
};

} // namespace

TEST_CASE("HostnameResolverChain order", "[HostnameResolverChain]") {
    HostnameResolverChain chain(std::chrono::milliseconds(250));

    auto first = std::make_unique<FakeHostnameResolver>(
        "dns", std::map<std::string, std::string>{{"10.0.0.1", "router.lan."}});
    auto second = std::make_unique<FakeHostnameResolver>(
        "getent", std::map<std::string, std::string>{{"10.0.0.1", "other"}, {"10.0.0.2", "nas"}});
    auto* firstPtr = first.get();
    auto* secondPtr = second.get();
    chain.addResolver(std::move(first));
    chain.addResolver(std::move(second));
    REQUIRE(chain.size() == 2);

    SECTION("First non-empty result wins, trailing dot stripped") {
        REQUIRE(chain.resolve("10.0.0.1") == "router.lan");
        REQUIRE(secondPtr->calls() == 0);
    }

    SECTION("Later strategies are consulted when earlier ones come up empty") {
        REQUIRE(chain.resolve("10.0.0.2") == "nas");
        REQUIRE(firstPtr->calls() == 1);
        REQUIRE(secondPtr->calls() == 1);
    }

    SECTION("Every strategy gets the per-method timeout") {
        chain.resolve("10.0.0.2");
        REQUIRE(firstPtr->lastTimeout() == std::chrono::milliseconds(250));
        REQUIRE(secondPtr->lastTimeout() == std::chrono::milliseconds(250));
    }

    SECTION("Unresolvable hosts get the deterministic fallback") {
        REQUIRE(chain.resolve("10.0.0.99") == "host-10-0-0-99");
    }
}

TEST_CASE("HostnameResolverChain tolerates failures", "[HostnameResolverChain]") {
    HostnameResolverChain chain;
    chain.addResolver(std::make_unique<FailingResolver>());
    chain.addResolver(std::make_unique<FakeHostnameResolver>(
        "echo", std::map<std::string, std::string>{{"10.0.0.3", "10.0.0.3"}}));
    chain.addResolver(nullptr);

    REQUIRE(chain.size() == 2);
    REQUIRE(chain.resolve("10.0.0.3") == "host-10-0-0-3");
}

TEST_CASE("HostnameResolverChain with no strategies", "[HostnameResolverChain]") {
    HostnameResolverChain chain;
    REQUIRE(chain.resolve("192.168.1.1") == "host-192-168-1-1");
}

TEST_CASE("HostnameResolverChain::sanitize", "[HostnameResolverChain]") {
    REQUIRE(HostnameResolverChain::sanitize("10.0.0.1", "  printer.local.\n") == "printer.local");
    REQUIRE(HostnameResolverChain::sanitize("10.0.0.1", "   ").empty());
    REQUIRE(HostnameResolverChain::sanitize("10.0.0.1", "").empty());
    REQUIRE(HostnameResolverChain::sanitize("10.0.0.1", "10.0.0.1").empty());
    REQUIRE(HostnameResolverChain::sanitize("10.0.0.1", "STANDALONE").empty());
    REQUIRE(HostnameResolverChain::sanitize("10.0.0.1", "nas;backup.lan") == "nasbackup.lan");
    REQUIRE(HostnameResolverChain::sanitize("10.0.0.1", " ; ").empty());
}
