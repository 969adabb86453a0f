#include <catch2/catch_test_macros.hpp>
#include "cache/secret_cache_hook.hpp"
#include "client/secret_cache.hpp"
#include "fake_backend.hpp"
#include <algorithm>
#include <atomic>

using namespace secretcache;
using secretcache::testing::FakeBackend;

namespace {

const char* const VERSION_ID = "01234567890123456789012345678901";

// Marks payloads on the way in and on the way out
class MarkingHook : public SecretCacheHook {
public:
    using SecretCacheHook::get;
    using SecretCacheHook::put;

    SecretValue put(SecretValue value) override {
        puts++;
        if (value.secret_string) {
            *value.secret_string += "+hook_put";
        }
        if (value.secret_binary) {
            value.secret_binary->push_back(0x11);
        }
        return value;
    }

    SecretValue get(const SecretValue& cached) override {
        gets++;
        SecretValue value = cached;
        if (value.secret_string) {
            *value.secret_string += "+hook_get";
        }
        if (value.secret_binary) {
            value.secret_binary->push_back(0x00);
        }
        return value;
    }

    std::atomic<int> puts{0};
    std::atomic<int> gets{0};
};

// Keeps only an obfuscated copy of secret strings in memory
class XorHook : public SecretCacheHook {
public:
    using SecretCacheHook::get;
    using SecretCacheHook::put;

    SecretValue put(SecretValue value) override {
        if (value.secret_string) {
            *value.secret_string = scramble(*value.secret_string);
            last_stored = *value.secret_string;
        }
        return value;
    }

    SecretValue get(const SecretValue& cached) override {
        SecretValue value = cached;
        if (value.secret_string) {
            *value.secret_string = scramble(*value.secret_string);
        }
        return value;
    }

    std::string last_stored;

private:
    static std::string scramble(std::string text) {
        for (char& c : text) {
            c = static_cast<char>(c ^ 0x5a);
        }
        return text;
    }
};

// Hides one stage from the cached metadata
class StageFilterHook : public SecretCacheHook {
public:
    using SecretCacheHook::get;
    using SecretCacheHook::put;

    SecretMetadata put(SecretMetadata metadata) override {
        for (auto& [version_id, stages] : metadata.version_ids_to_stages) {
            stages.erase(std::remove(stages.begin(), stages.end(), "AWSPREVIOUS"), stages.end());
        }
        return metadata;
    }
};

} // namespace

TEST_CASE("Hook transforms string payloads", "[cache_hook]") {
    testing::quiet_logger();
    auto backend = std::make_shared<FakeBackend>();
    backend->set_stages("test", {{VERSION_ID, {"AWSCURRENT"}}});
    backend->set_string("test", VERSION_ID, "mysecret");

    auto hook = std::make_shared<MarkingHook>();
    SecretCache cache(make_cache_config({}, hook), backend);

    for (int i = 0; i < 10; ++i) {
        REQUIRE(*cache.get_secret_string("test") == "mysecret+hook_put+hook_get");
    }

    // Stored once, loaded on every read
    REQUIRE(hook->puts == 1);
    REQUIRE(hook->gets == 10);
}

TEST_CASE("Hook transforms binary payloads", "[cache_hook]") {
    testing::quiet_logger();
    auto backend = std::make_shared<FakeBackend>();
    backend->set_stages("test", {{VERSION_ID, {"AWSCURRENT"}}});
    backend->set_binary("test", VERSION_ID, {0x01, 0x02});

    SecretCache cache(make_cache_config({}, std::make_shared<MarkingHook>()), backend);

    for (int i = 0; i < 10; ++i) {
        REQUIRE(*cache.get_secret_binary("test") == SecretBinary{0x01, 0x02, 0x11, 0x00});
    }
}

TEST_CASE("Hook can keep only an encoded copy in memory", "[cache_hook]") {
    testing::quiet_logger();
    auto backend = std::make_shared<FakeBackend>();
    backend->set_stages("test", {{VERSION_ID, {"AWSCURRENT"}}});
    backend->set_string("test", VERSION_ID, "mysecret");

    auto hook = std::make_shared<XorHook>();
    SecretCache cache(make_cache_config({}, hook), backend);

    REQUIRE(*cache.get_secret_string("test") == "mysecret");
    REQUIRE_FALSE(hook->last_stored.empty());
    REQUIRE(hook->last_stored != "mysecret");
}

TEST_CASE("Hook applies to secret metadata", "[cache_hook]") {
    testing::quiet_logger();
    auto backend = std::make_shared<FakeBackend>();
    backend->set_stages("test", {{"v1", {"AWSPREVIOUS"}}, {"v2", {"AWSCURRENT"}}});
    backend->set_string("test", "v1", "old");
    backend->set_string("test", "v2", "new");

    SecretCache cache(make_cache_config({}, std::make_shared<StageFilterHook>()), backend);

    REQUIRE(*cache.get_secret_string("test") == "new");
    REQUIRE_FALSE(cache.get_secret_string("test", "AWSPREVIOUS").has_value());
}
