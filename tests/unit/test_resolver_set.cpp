#include <catch2/catch_test_macros.hpp>
#include "network/resolver_set.hpp"

#include <vector>

using namespace ledmark::network;

namespace {

struct FakeResolver {
    int id = 0;
};

ServiceInstanceKey instance(std::string name, int interface = 2) {
    return ServiceInstanceKey{.interface = interface, .protocol = 0, .name = std::move(name)};
}

} // namespace

TEST_CASE("ResolverSet keeps resolvers until their instance goes away", "[discovery][resolver]") {
    FakeResolver alpha{1};
    FakeResolver beta{2};
    std::vector<int> released;

    ResolverSet<FakeResolver> set([&](FakeResolver* r) { released.push_back(r->id); });

    REQUIRE(set.add(instance("alpha"), &alpha));
    REQUIRE(set.add(instance("beta"), &beta));
    REQUIRE(set.size() == 2);
    REQUIRE(released.empty());
    REQUIRE(set.contains(instance("alpha")));

    SECTION("Removing one instance releases only its resolver") {
        REQUIRE(set.remove(instance("alpha")));
        REQUIRE(released == std::vector<int>{1});
        REQUIRE_FALSE(set.contains(instance("alpha")));
        REQUIRE_FALSE(set.remove(instance("alpha")));
        REQUIRE(released.size() == 1);
    }

    SECTION("Clearing releases everything once") {
        set.clear();
        REQUIRE(released.size() == 2);
        REQUIRE(set.size() == 0);
        set.clear();
        REQUIRE(released.size() == 2);
    }
}

TEST_CASE("ResolverSet releases a duplicate resolver for a known instance", "[discovery][resolver]") {
    FakeResolver first{1};
    FakeResolver second{2};
    FakeResolver other_interface{3};
    std::vector<int> released;

    ResolverSet<FakeResolver> set([&](FakeResolver* r) { released.push_back(r->id); });

    REQUIRE(set.add(instance("alpha"), &first));
    REQUIRE_FALSE(set.add(instance("alpha"), &second));
    REQUIRE(released == std::vector<int>{2});

    // The same name on another interface is a separate instance.
    REQUIRE(set.add(instance("alpha", 3), &other_interface));
    REQUIRE(set.size() == 2);

    REQUIRE_FALSE(set.add(instance("gamma"), nullptr));
    REQUIRE(set.size() == 2);
}

TEST_CASE("ResolverSet releases what it still owns on destruction", "[discovery][resolver]") {
    FakeResolver alpha{1};
    std::vector<int> released;
    {
        ResolverSet<FakeResolver> set([&](FakeResolver* r) { released.push_back(r->id); });
        REQUIRE(set.add(instance("alpha"), &alpha));
    }
    REQUIRE(released == std::vector<int>{1});
}
