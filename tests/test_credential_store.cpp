#include <catch2/catch.hpp>
#include "credential_store.hpp"
#include "errors.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <thread>

using namespace maxproxy;
using json = nlohmann::json;

namespace {

constexpr uint64_t kMinute = 60 * 1000;

// In-memory source that records saves.
class FakeSource : public CredentialSource {
public:
    std::optional<Credential> value;
    bool durable = false;
    bool save_ok = true;
    std::atomic<int> loads{0};
    std::chrono::milliseconds delay{0}; // simulates a slow keychain lookup
    std::vector<Credential> saved;

    std::optional<Credential> load() override {
        ++loads;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        return value;
    }
    std::string name() const override { return "fake"; }
    bool writable() const override { return durable; }
    bool save(const Credential& c) override {
        saved.push_back(c);
        return save_ok;
    }
};

struct ManualClock {
    std::shared_ptr<std::atomic<uint64_t>> now =
        std::make_shared<std::atomic<uint64_t>>(1'000'000'000);
    Clock fn() const {
        auto p = now;
        return [p]() { return p->load(); };
    }
};

Credential make_credential(const std::string& access, const std::string& refresh,
                           uint64_t expires_at) {
    Credential c;
    c.access_token = access;
    c.refresh_token = refresh;
    c.expires_at = expires_at;
    return c;
}

HttpResponse token_response(const std::string& access, const std::string& refresh,
                            uint64_t expires_in) {
    json body = {{"access_token", access}, {"expires_in", expires_in}};
    if (!refresh.empty()) body["refresh_token"] = refresh;
    return {200, body.dump()};
}

std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "maxproxy_cred_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

} // namespace

// ── Resolution order ─────────────────────────────────────────────

TEST_CASE("CredentialStore: no source yields unavailable", "[credentials]") {
    MockHttpClient http;
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::make_unique<FakeSource>());
    CredentialStore store(std::move(sources), http);

    REQUIRE_THROWS_AS(store.resolve(), CredentialUnavailable);
    REQUIRE(http.call_count == 0);
}

TEST_CASE("CredentialStore: first source with a credential wins", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    auto first = std::make_unique<FakeSource>();
    auto second = std::make_unique<FakeSource>();
    auto* second_ptr = second.get();
    second->value = make_credential("second", "", 0);
    auto third = std::make_unique<FakeSource>();
    third->value = make_credential("third", "", 0);
    auto* third_ptr = third.get();

    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(first));
    sources.push_back(std::move(second));
    sources.push_back(std::move(third));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    REQUIRE(store.resolve().access_token == "second");
    REQUIRE(second_ptr->loads.load() == 1);
    REQUIRE(third_ptr->loads.load() == 0);
}

TEST_CASE("CredentialStore: cached credential reused inside validity window", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    auto src = std::make_unique<FakeSource>();
    auto* src_ptr = src.get();
    src->value = make_credential("tok", "ref", clock.now->load() + 60 * kMinute);

    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    REQUIRE(store.resolve().access_token == "tok");
    REQUIRE(store.resolve().access_token == "tok");
    REQUIRE(src_ptr->loads.load() == 1);
    REQUIRE(http.call_count == 0);
}

TEST_CASE("CredentialStore: no refresh token keeps the cached credential", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    auto src = std::make_unique<FakeSource>();
    src->value = make_credential("tok", "", clock.now->load() + kMinute);

    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    REQUIRE(store.resolve().access_token == "tok");
    *clock.now += 10 * kMinute; // now past expiry
    REQUIRE(store.resolve().access_token == "tok");
    REQUIRE(http.call_count == 0);
}

// ── Refresh ──────────────────────────────────────────────────────

TEST_CASE("CredentialStore: refresh inside window posts token exchange", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    http.next_response = token_response("new-tok", "new-ref", 3600);

    auto src = std::make_unique<FakeSource>();
    src->value = make_credential("old-tok", "old-ref", clock.now->load() + 2 * kMinute);
    src->durable = true;
    auto* src_ptr = src.get();

    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    auto c = store.resolve();
    REQUIRE(c.access_token == "new-tok");
    REQUIRE(c.refresh_token == "new-ref");
    REQUIRE(c.expires_at == clock.now->load() + 3600 * 1000);

    REQUIRE(http.call_count == 1);
    REQUIRE(http.last_url == "https://console.anthropic.com/v1/oauth/token");
    REQUIRE(http.header("Content-Type") == "application/json");
    auto body = json::parse(http.last_body);
    REQUIRE(body["grant_type"] == "refresh_token");
    REQUIRE(body["refresh_token"] == "old-ref");
    REQUIRE(body["client_id"] == "ce88c5c9-c4b6-402a-9f87-b667b4583d19");

    REQUIRE(src_ptr->saved.size() == 1);
    REQUIRE(src_ptr->saved[0].access_token == "new-tok");

    // Cached afterwards
    REQUIRE(store.resolve().access_token == "new-tok");
    REQUIRE(http.call_count == 1);
}

TEST_CASE("CredentialStore: refresh keeps old refresh token when none returned", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    http.next_response = token_response("new-tok", "", 600);

    auto src = std::make_unique<FakeSource>();
    src->value = make_credential("old", "keep-me", clock.now->load() + kMinute);
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    auto c = store.resolve();
    REQUIRE(c.access_token == "new-tok");
    REQUIRE(c.refresh_token == "keep-me");
}

TEST_CASE("CredentialStore: custom token endpoint and client id", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    http.next_response = token_response("t2", "", 600);

    auto src = std::make_unique<FakeSource>();
    src->value = make_credential("t1", "r1", clock.now->load());
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));

    CredentialStoreOptions opts;
    opts.token_url = "http://localhost:9/token";
    opts.client_id = "custom-client";
    CredentialStore store(std::move(sources), http, opts, clock.fn());

    store.resolve();
    REQUIRE(http.last_url == "http://localhost:9/token");
    REQUIRE(json::parse(http.last_body)["client_id"] == "custom-client");
}

TEST_CASE("CredentialStore: failed persist does not fail the call", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    http.next_response = token_response("fresh", "", 600);

    auto src = std::make_unique<FakeSource>();
    src->value = make_credential("stale", "r", clock.now->load() + kMinute);
    src->durable = true;
    src->save_ok = false;
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    REQUIRE(store.resolve().access_token == "fresh");
}

TEST_CASE("CredentialStore: refresh failure falls back before hard expiry", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    http.next_response = {500, "oops"};

    auto src = std::make_unique<FakeSource>();
    src->value = make_credential("stale", "r", clock.now->load() + kMinute);
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    REQUIRE(store.resolve().access_token == "stale");
    REQUIRE(http.call_count == 1);
}

TEST_CASE("CredentialStore: refresh failure after expiry is CredentialExpired", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    http.next_response = {400, R"({"error":"invalid_grant"})"};

    auto src = std::make_unique<FakeSource>();
    src->value = make_credential("dead", "r", clock.now->load() - kMinute);
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    REQUIRE_THROWS_AS(store.resolve(), CredentialExpired);
}

TEST_CASE("CredentialStore: malformed token response is a refresh failure", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    http.next_response = {200, "not json"};

    auto src = std::make_unique<FakeSource>();
    src->value = make_credential("stale", "r", clock.now->load() + kMinute);
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    REQUIRE(store.resolve().access_token == "stale");
}

TEST_CASE("CredentialStore: newer credential in storage skips the exchange", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;

    auto src = std::make_unique<FakeSource>();
    auto* src_ptr = src.get();
    src->value = make_credential("old", "r", clock.now->load() + kMinute);
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    REQUIRE(store.resolve().access_token == "old");
    REQUIRE(http.call_count == 1); // exchange failed, stale token kept

    // Another process writes a fresh token
    src_ptr->value = make_credential("other-process", "r2", clock.now->load() + 60 * kMinute);
    REQUIRE(store.resolve().access_token == "other-process");
    REQUIRE(http.call_count == 1);
}

TEST_CASE("CredentialStore: concurrent callers share one refresh", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    http.next_response = token_response("shared", "", 3600);
    http.delay = std::chrono::milliseconds(200);

    auto src = std::make_unique<FakeSource>();
    src->value = make_credential("old", "r", clock.now->load() + kMinute);
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    std::string a, b;
    std::thread t1([&]() { a = store.resolve().access_token; });
    std::thread t2([&]() { b = store.resolve().access_token; });
    t1.join();
    t2.join();

    REQUIRE(a == "shared");
    REQUIRE(b == "shared");
    REQUIRE(http.call_count == 1);
}

TEST_CASE("CredentialStore: concurrent first callers share one source load", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    auto src = std::make_unique<FakeSource>();
    auto* src_ptr = src.get();
    src->value = make_credential("tok", "", 0);
    src->delay = std::chrono::milliseconds(200);
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    std::string a, b;
    std::thread t1([&]() { a = store.resolve().access_token; });
    std::thread t2([&]() { b = store.resolve().access_token; });
    t1.join();
    t2.join();

    REQUIRE(a == "tok");
    REQUIRE(b == "tok");
    REQUIRE(src_ptr->loads.load() == 1);
}

TEST_CASE("CredentialStore: failed first load is retried on the next call", "[credentials]") {
    ManualClock clock;
    MockHttpClient http;
    auto src = std::make_unique<FakeSource>();
    auto* src_ptr = src.get();
    std::vector<std::unique_ptr<CredentialSource>> sources;
    sources.push_back(std::move(src));
    CredentialStore store(std::move(sources), http, {}, clock.fn());

    REQUIRE_THROWS_AS(store.resolve(), CredentialUnavailable);
    src_ptr->value = make_credential("late", "", 0);
    REQUIRE(store.resolve().access_token == "late");
    REQUIRE(src_ptr->loads.load() == 2);
}

// ── Sources ──────────────────────────────────────────────────────

TEST_CASE("OverrideCredentialSource: empty token yields nothing", "[credentials]") {
    OverrideCredentialSource src("", "", nullptr);
    REQUIRE_FALSE(src.load().has_value());
}

TEST_CASE("OverrideCredentialSource: valid for 24 hours from first load", "[credentials]") {
    ManualClock clock;
    OverrideCredentialSource src("env-tok", "env-ref", clock.fn());
    uint64_t start = clock.now->load();

    auto c = src.load();
    REQUIRE(c.has_value());
    REQUIRE(c->access_token == "env-tok");
    REQUIRE(c->refresh_token == "env-ref");
    REQUIRE(c->expires_at == start + kOverrideLifetimeMs);

    *clock.now += 5 * kMinute;
    REQUIRE(src.load()->expires_at == start + kOverrideLifetimeMs);
}

TEST_CASE("FileCredentialSource: save then load", "[credentials]") {
    auto dir = make_temp_dir();
    REQUIRE_FALSE(dir.empty());
    std::string path = dir + "/nested/creds.json";

    FileCredentialSource src(path);
    REQUIRE_FALSE(src.load().has_value());

    Credential c = make_credential("a", "b", 1234567890123ULL);
    REQUIRE(src.save(c));

    struct stat st{};
    REQUIRE(::stat(path.c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0600);

    std::ifstream f(path);
    auto j = json::parse(f);
    REQUIRE(j["accessToken"] == "a");
    REQUIRE(j["refreshToken"] == "b");
    REQUIRE(j["expiresAt"] == 1234567890123ULL);

    auto loaded = src.load();
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->access_token == "a");
    REQUIRE(loaded->expires_at == 1234567890123ULL);

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileCredentialSource: malformed file yields nothing", "[credentials]") {
    auto dir = make_temp_dir();
    std::string path = dir + "/creds.json";
    {
        std::ofstream f(path);
        f << "{not json";
    }
    FileCredentialSource src(path);
    REQUIRE_FALSE(src.load().has_value());
    std::filesystem::remove_all(dir);
}

TEST_CASE("KeychainCredentialSource: parses claudeAiOauth payload", "[credentials]") {
    auto c = KeychainCredentialSource::parse_payload(
        R"({"claudeAiOauth":{"accessToken":"kc","refreshToken":"kr",)"
        R"("expiresAt":1700000000000,"subscriptionType":"max"}})");
    REQUIRE(c.has_value());
    REQUIRE(c->access_token == "kc");
    REQUIRE(c->refresh_token == "kr");
    REQUIRE(c->expires_at == 1700000000000ULL);
    REQUIRE(c->subscription_label == "max");

    REQUIRE_FALSE(KeychainCredentialSource::parse_payload("{}").has_value());
    REQUIRE_FALSE(KeychainCredentialSource::parse_payload("garbage").has_value());
}

TEST_CASE("KeychainCredentialSource: reads command output", "[credentials]") {
    KeychainCredentialSource src(
        {"/bin/sh", "-c", R"(printf '{"claudeAiOauth":{"accessToken":"from-cmd"}}')"}, true);
    auto c = src.load();
    REQUIRE(c.has_value());
    REQUIRE(c->access_token == "from-cmd");
}

TEST_CASE("KeychainCredentialSource: failing or slow command yields nothing", "[credentials]") {
    KeychainCredentialSource failing({"/bin/sh", "-c", "exit 44"}, true);
    REQUIRE_FALSE(failing.load().has_value());

    KeychainCredentialSource slow({"/bin/sh", "-c", "sleep 5"}, true, 200);
    REQUIRE_FALSE(slow.load().has_value());

    KeychainCredentialSource disabled({"/bin/sh", "-c", "exit 0"}, false);
    REQUIRE_FALSE(disabled.load().has_value());
}
