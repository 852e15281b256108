#pragma once
#include "http.hpp"
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace maxproxy {

// ── Constants ────────────────────────────────────────────────────
constexpr const char* kDefaultTokenUrl = "https://console.anthropic.com/v1/oauth/token";
constexpr const char* kDefaultOAuthClientId = "ce88c5c9-c4b6-402a-9f87-b667b4583d19";
constexpr const char* kKeychainService = "Claude Code-credentials";
constexpr uint64_t kOverrideLifetimeMs = 24ULL * 60 * 60 * 1000;

struct Credential {
    std::string access_token;
    std::string refresh_token;      // empty = none
    uint64_t expires_at = 0;        // epoch millis, 0 = unknown
    std::string subscription_label; // empty = none
};

// Milliseconds since the epoch; injectable so tests can move time.
using Clock = std::function<uint64_t()>;

// ── Sources ──────────────────────────────────────────────────────

class CredentialSource {
public:
    virtual ~CredentialSource() = default;

    virtual std::optional<Credential> load() = 0;
    virtual std::string name() const = 0;

    // Durable sources accept refreshed credentials.
    virtual bool writable() const { return false; }
    virtual bool save(const Credential&) { return false; }
};

// Operator-supplied tokens (environment or config). Without a known expiry the
// token is considered valid for 24 hours from the first load.
class OverrideCredentialSource : public CredentialSource {
public:
    OverrideCredentialSource(std::string access_token, std::string refresh_token,
                             Clock clock);

    std::optional<Credential> load() override;
    std::string name() const override { return "override"; }

private:
    std::string access_token_;
    std::string refresh_token_;
    Clock clock_;
    uint64_t first_loaded_ = 0;
};

// JSON file {"accessToken","refreshToken","expiresAt"[,"subscriptionType"]}
class FileCredentialSource : public CredentialSource {
public:
    explicit FileCredentialSource(std::string path);

    std::optional<Credential> load() override;
    std::string name() const override { return "file"; }
    bool writable() const override { return true; }
    bool save(const Credential& credential) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Platform secure store. The default command reads the macOS keychain and is
// only enabled on Apple platforms.
class KeychainCredentialSource : public CredentialSource {
public:
    KeychainCredentialSource();
    KeychainCredentialSource(std::vector<std::string> command, bool enabled,
                             int timeout_ms = 5000);

    std::optional<Credential> load() override;
    std::string name() const override { return "keychain"; }

    // Extracts the claudeAiOauth object from the keychain payload.
    static std::optional<Credential> parse_payload(const std::string& payload);

private:
    std::vector<std::string> command_;
    bool enabled_;
    int timeout_ms_;
};

// ── Store ────────────────────────────────────────────────────────

struct CredentialStoreOptions {
    std::string token_url = kDefaultTokenUrl;
    std::string client_id = kDefaultOAuthClientId;
    uint64_t refresh_window_ms = 5 * 60 * 1000;
    long timeout_seconds = 30;
};

// Resolves an access credential from ranked sources, caches it for the life
// of the process and refreshes it near expiry. At most one refresh runs at a
// time; concurrent callers wait on the in-flight exchange.
class CredentialStore {
public:
    CredentialStore(std::vector<std::unique_ptr<CredentialSource>> sources,
                    HttpClient& http,
                    CredentialStoreOptions options = {},
                    Clock clock = nullptr);

    // Throws CredentialUnavailable or CredentialExpired.
    Credential resolve();

private:
    std::optional<Credential> load_from_sources();
    bool needs_refresh(const Credential& credential, uint64_t now) const;
    Credential load_and_refresh(std::optional<Credential> current);
    Credential refresh_or_fallback(const Credential& stale);
    Credential exchange_refresh_token(const Credential& stale);
    void persist(const Credential& credential);

    std::vector<std::unique_ptr<CredentialSource>> sources_;
    HttpClient& http_;
    CredentialStoreOptions options_;
    Clock clock_;

    std::mutex mutex_;
    std::optional<Credential> cached_;
    std::optional<std::shared_future<Credential>> in_flight_;
};

} // namespace maxproxy
