#include <catch2/catch_all.hpp>
#include "ktnsync/core/identity/device_identity.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/hex.hpp"
#include "ktnsync/store/memory_store.hpp"

using namespace ktnsync;

TEST_CASE("First use creates and persists an identity", "[identity]") {
    MemoryStore store;
    DeviceIdentityManager mgr(store);
    REQUIRE_FALSE(mgr.available());

    auto id = mgr.ensureIdentity();
    REQUIRE(id.size() == 32);
    REQUIRE(isHex128(id));
    REQUIRE(mgr.available());
    REQUIRE(mgr.keys() != nullptr);

    auto rec = store.getSetting(DeviceIdentityManager::kSettingKey);
    REQUIRE(rec.has_value());
    REQUIRE(rec->at("id") == id);
    REQUIRE(rec->at("publicKey").get<std::string>() == mgr.identity()->publicKey);
    REQUIRE_FALSE(rec->at("createdAt").get<std::string>().empty());

    // Cached on the second call.
    REQUIRE(mgr.ensureIdentity() == id);
}

TEST_CASE("A stored identity is loaded unchanged", "[identity]") {
    MemoryStore store;
    std::string id;
    {
        DeviceIdentityManager first(store);
        id = first.ensureIdentity();
    }
    DeviceIdentityManager second(store);
    REQUIRE(second.ensureIdentity() == id);
    REQUIRE(second.keys()->exportPublicKey() == second.identity()->publicKey);
}

TEST_CASE("A malformed stored record is replaced by a new identity", "[identity]") {
    MemoryStore store;
    store.setSetting(DeviceIdentityManager::kSettingKey, { {"id", "not-hex"}, {"publicKey", "x"} });

    DeviceIdentityManager mgr(store);
    auto id = mgr.ensureIdentity();
    REQUIRE(isHex128(id));
    REQUIRE(store.getSetting(DeviceIdentityManager::kSettingKey)->at("id") == id);
}

TEST_CASE("Keys that do not import are replaced", "[identity]") {
    MemoryStore store;
    store.setSetting(DeviceIdentityManager::kSettingKey, {
        {"id", "00112233445566778899aabbccddeeff"},
        {"publicKey", "AAAA"},
        {"privateKey", "AAAA"}
    });

    DeviceIdentityManager mgr(store);
    REQUIRE(mgr.ensureIdentity() != "00112233445566778899aabbccddeeff");
}

TEST_CASE("Store failures surface as IdentityStore", "[identity]") {
    MemoryStore store;
    DeviceIdentityManager mgr(store);

    SECTION("unreadable store") {
        store.setUnavailable(true);
        try {
            mgr.ensureIdentity();
            FAIL("expected IdentityStore");
        }
        catch (const SyncError& e) {
            REQUIRE(e.code() == SyncErr::IdentityStore);
        }
        REQUIRE_FALSE(mgr.available());
    }

    SECTION("rejected write") {
        store.failNextWrites(1);
        REQUIRE_THROWS_AS(mgr.ensureIdentity(), SyncError);
        REQUIRE_FALSE(mgr.available());
        REQUIRE(mgr.keys() == nullptr);
        // The store recovers and the next call succeeds.
        REQUIRE(isHex128(mgr.ensureIdentity()));
    }
}

TEST_CASE("reset forgets the identity", "[identity]") {
    MemoryStore store;
    DeviceIdentityManager mgr(store);
    auto first = mgr.ensureIdentity();

    mgr.reset();
    REQUIRE_FALSE(mgr.available());
    REQUIRE_FALSE(store.getSetting(DeviceIdentityManager::kSettingKey).has_value());
    REQUIRE(mgr.ensureIdentity() != first);
}

TEST_CASE("Exported keys import back as the same pair", "[identity][keys]") {
    auto keys = DeviceKeyPair::generate();
    auto again = DeviceKeyPair::import(keys.exportPublicKey(), keys.exportPrivateKey());
    REQUIRE(again.exportPublicKey() == keys.exportPublicKey());

    auto other = DeviceKeyPair::generate();
    REQUIRE_THROWS_AS(DeviceKeyPair::import(other.exportPublicKey(), keys.exportPrivateKey()), SyncError);
}
