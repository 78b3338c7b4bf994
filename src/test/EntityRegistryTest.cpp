#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "domain/EntityRegistry.hpp"

using namespace geoflow::domain;

namespace {

struct Item {
    explicit Item(std::string v) : value(std::move(v)) {}
    std::string value;
};

struct Expected {
    CollisionPolicy policy;
    bool existing;
    std::string finalValue;
    bool warned;
    bool failed;
};

void TestCollisionTruthTable() {
    std::cout << "[Test] Collision policy truth table..." << std::endl;
    const Expected table[] = {
        {CollisionPolicy::Replace, false, "new", false, false},
        {CollisionPolicy::Replace, true, "new", false, false},
        {CollisionPolicy::ReplaceAndWarn, false, "new", false, false},
        {CollisionPolicy::ReplaceAndWarn, true, "new", true, false},
        {CollisionPolicy::Warn, false, "new", false, false},
        {CollisionPolicy::Warn, true, "old", true, false},
        {CollisionPolicy::Fail, false, "new", false, false},
        {CollisionPolicy::Fail, true, "old", false, true},
    };

    for (const auto& row : table) {
        EntityRegistry<Item> registry;
        if (row.existing) {
            registry.registerEntity("L1", std::make_unique<Item>("old"), CollisionPolicy::Replace);
        }
        const RegisterOutcome outcome = registry.registerEntity("L1", std::make_unique<Item>("new"), row.policy);
        assert(registry.size() == 1);
        assert(registry.get("L1")->value == row.finalValue);
        assert(outcome.warned == row.warned);
        assert(outcome.failed == row.failed);
        assert(outcome.inserted == (row.finalValue == "new"));
    }
    std::cout << "[PASS] Truth table." << std::endl;
}

void TestRemoveAndIds() {
    std::cout << "[Test] remove is idempotent..." << std::endl;
    EntityRegistry<Item> registry;
    registry.registerEntity("b", std::make_unique<Item>("1"), CollisionPolicy::Fail);
    registry.registerEntity("a", std::make_unique<Item>("2"), CollisionPolicy::Fail);
    assert(registry.ids().size() == 2);
    assert(registry.ids()[0] == "a");

    registry.remove("a");
    registry.remove("a");
    assert(!registry.exists("a"));
    assert(registry.get("a") == nullptr);
    assert(registry.exists("b"));

    const EntityRegistry<Item>& constRef = registry;
    assert(constRef.get("b")->value == "1");

    registry.clear();
    assert(registry.size() == 0);
    std::cout << "[PASS] Remove." << std::endl;
}

void TestRejectsBadInput() {
    std::cout << "[Test] Empty IDs and null entities are rejected..." << std::endl;
    EntityRegistry<Item> registry;
    bool threw = false;
    try {
        registry.registerEntity("", std::make_unique<Item>("x"), CollisionPolicy::Replace);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        registry.registerEntity("id", nullptr, CollisionPolicy::Replace);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(registry.size() == 0);

    assert(CollisionPolicyFromString("replaceAndWarn") == CollisionPolicy::ReplaceAndWarn);
    assert(CollisionPolicyFromString("FAIL") == CollisionPolicy::Fail);
    assert(!CollisionPolicyFromString("Overwrite").has_value());
    std::cout << "[PASS] Bad input." << std::endl;
}

} // namespace

int main() {
    TestCollisionTruthTable();
    TestRemoveAndIds();
    TestRejectsBadInput();
    std::cout << "[PASS] EntityRegistryTest" << std::endl;
    return 0;
}
