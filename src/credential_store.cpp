#include "credential_store.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <array>
#include <csignal>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace maxproxy {

namespace {

uint64_t json_millis(const json& obj, const char* key) {
    if (!obj.contains(key)) return 0;
    const auto& v = obj[key];
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        return n > 0 ? static_cast<uint64_t>(n) : 0;
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        return d > 0 ? static_cast<uint64_t>(d) : 0;
    }
    return 0;
}

// Reads the camelCase credential layout shared by the file and the keychain.
std::optional<Credential> credential_from_json(const json& obj) {
    if (!obj.is_object()) return std::nullopt;
    Credential c;
    c.access_token = obj.value("accessToken", "");
    if (c.access_token.empty()) return std::nullopt;
    c.refresh_token = obj.value("refreshToken", "");
    c.expires_at = json_millis(obj, "expiresAt");
    c.subscription_label = obj.value("subscriptionType", "");
    return c;
}

// Runs argv[0] with the given arguments and returns its stdout, or nullopt on
// spawn failure, non-zero exit or timeout.
std::optional<std::string> run_command(const std::vector<std::string>& argv,
                                       int timeout_ms) {
    if (argv.empty()) return std::nullopt;

    int out_pipe[2];
    if (pipe(out_pipe) != 0) return std::nullopt;

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        close(out_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        close(out_pipe[1]);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(out_pipe[1]);

    std::string output;
    std::array<char, 4096> buffer;
    uint64_t deadline = epoch_millis() + static_cast<uint64_t>(timeout_ms);
    bool timed_out = false;

    while (true) {
        uint64_t now = epoch_millis();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        struct pollfd pfd;
        pfd.fd = out_pipe[0];
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(deadline - now));
        if (ret < 0) break;
        if (ret == 0) {
            timed_out = true;
            break;
        }
        ssize_t n = read(out_pipe[0], buffer.data(), buffer.size());
        if (n <= 0) break; // EOF
        output.append(buffer.data(), static_cast<size_t>(n));
    }
    close(out_pipe[0]);

    int status = 0;
    if (timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        return std::nullopt;
    }
    waitpid(pid, &status, 0);
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) return std::nullopt;
    return output;
}

} // namespace

// ── OverrideCredentialSource ────────────────────────────────────

OverrideCredentialSource::OverrideCredentialSource(std::string access_token,
                                                   std::string refresh_token,
                                                   Clock clock)
    : access_token_(std::move(access_token)),
      refresh_token_(std::move(refresh_token)),
      clock_(clock ? std::move(clock) : Clock(epoch_millis)) {}

std::optional<Credential> OverrideCredentialSource::load() {
    if (access_token_.empty()) return std::nullopt;
    if (first_loaded_ == 0) first_loaded_ = clock_();

    Credential c;
    c.access_token = access_token_;
    c.refresh_token = refresh_token_;
    c.expires_at = first_loaded_ + kOverrideLifetimeMs;
    return c;
}

// ── FileCredentialSource ────────────────────────────────────────

FileCredentialSource::FileCredentialSource(std::string path)
    : path_(std::move(path)) {}

std::optional<Credential> FileCredentialSource::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return std::nullopt;
    try {
        return credential_from_json(json::parse(file));
    } catch (const json::exception& e) {
        std::cerr << "[credentials] Ignoring malformed " << path_ << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

bool FileCredentialSource::save(const Credential& credential) {
    json j = {
        {"accessToken", credential.access_token},
        {"refreshToken", credential.refresh_token},
        {"expiresAt", credential.expires_at}
    };
    if (!credential.subscription_label.empty()) {
        j["subscriptionType"] = credential.subscription_label;
    }
    return atomic_write_file(path_, j.dump(2) + "\n", 0600);
}

// ── KeychainCredentialSource ────────────────────────────────────

KeychainCredentialSource::KeychainCredentialSource()
    : command_{"security", "find-generic-password", "-s", kKeychainService, "-w"},
#ifdef __APPLE__
      enabled_(true),
#else
      enabled_(false),
#endif
      timeout_ms_(5000) {}

KeychainCredentialSource::KeychainCredentialSource(std::vector<std::string> command,
                                                   bool enabled, int timeout_ms)
    : command_(std::move(command)), enabled_(enabled), timeout_ms_(timeout_ms) {}

std::optional<Credential> KeychainCredentialSource::load() {
    if (!enabled_) return std::nullopt;
    auto output = run_command(command_, timeout_ms_);
    if (!output) return std::nullopt;
    return parse_payload(trim(*output));
}

std::optional<Credential> KeychainCredentialSource::parse_payload(const std::string& payload) {
    try {
        auto j = json::parse(payload);
        if (!j.is_object() || !j.contains("claudeAiOauth")) return std::nullopt;
        return credential_from_json(j["claudeAiOauth"]);
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ── CredentialStore ─────────────────────────────────────────────

CredentialStore::CredentialStore(std::vector<std::unique_ptr<CredentialSource>> sources,
                                 HttpClient& http,
                                 CredentialStoreOptions options,
                                 Clock clock)
    : sources_(std::move(sources)), http_(http), options_(std::move(options)),
      clock_(clock ? std::move(clock) : Clock(epoch_millis)) {
    if (options_.token_url.empty()) options_.token_url = kDefaultTokenUrl;
    if (options_.client_id.empty()) options_.client_id = kDefaultOAuthClientId;
}

std::optional<Credential> CredentialStore::load_from_sources() {
    for (auto& source : sources_) {
        auto c = source->load();
        if (c) {
            std::cerr << "[credentials] Loaded credential from " << source->name() << "\n";
            return c;
        }
    }
    return std::nullopt;
}

bool CredentialStore::needs_refresh(const Credential& credential, uint64_t now) const {
    if (credential.expires_at == 0) return false;
    return now + options_.refresh_window_ms >= credential.expires_at;
}

Credential CredentialStore::resolve() {
    std::unique_lock<std::mutex> lock(mutex_);
    std::optional<Credential> current = cached_;
    if (current && (!needs_refresh(*current, clock_()) || current->refresh_token.empty())) {
        // Nothing to refresh with means keep using what we have.
        return *current;
    }

    if (in_flight_) {
        auto pending = *in_flight_;
        lock.unlock();
        return pending.get();
    }

    // First load and refresh share one in-flight slot; source I/O runs unlocked.
    std::promise<Credential> promise;
    in_flight_ = promise.get_future().share();
    lock.unlock();

    Credential result;
    std::exception_ptr error;
    try {
        result = load_and_refresh(std::move(current));
    } catch (const std::exception&) {
        error = std::current_exception();
    }

    lock.lock();
    if (!error) cached_ = result;
    in_flight_.reset();
    lock.unlock();

    if (error) {
        promise.set_exception(error);
        std::rethrow_exception(error);
    }
    promise.set_value(result);
    return result;
}

Credential CredentialStore::load_and_refresh(std::optional<Credential> current) {
    if (!current) {
        current = load_from_sources();
        if (!current) {
            throw CredentialUnavailable(
                "No credentials found. Set CLAUDE_ACCESS_TOKEN or sign in with Claude Code.");
        }
    }
    if (!needs_refresh(*current, clock_()) || current->refresh_token.empty()) return *current;
    return refresh_or_fallback(*current);
}

Credential CredentialStore::refresh_or_fallback(const Credential& stale) {
    try {
        // Another process may already have refreshed and written a newer token.
        auto reread = load_from_sources();
        if (reread && reread->access_token != stale.access_token &&
            !needs_refresh(*reread, clock_())) {
            std::cerr << "[credentials] Adopted newer credential from storage\n";
            return *reread;
        }

        auto fresh = exchange_refresh_token(stale);
        persist(fresh);
        std::cerr << "[credentials] Token refreshed\n";
        return fresh;
    } catch (const std::exception& e) {
        std::cerr << "[credentials] Refresh failed: " << e.what() << "\n";
    }

    if (clock_() < stale.expires_at) {
        std::cerr << "[credentials] Using unrefreshed credential until it expires\n";
        return stale;
    }
    throw CredentialExpired("Access token expired and refresh failed");
}

Credential CredentialStore::exchange_refresh_token(const Credential& stale) {
    json body = {
        {"grant_type", "refresh_token"},
        {"refresh_token", stale.refresh_token},
        {"client_id", options_.client_id}
    };

    auto resp = http_.post(options_.token_url, body.dump(),
                           {{"Content-Type", "application/json"}},
                           options_.timeout_seconds);

    if (resp.status_code < 200 || resp.status_code >= 300) {
        throw std::runtime_error("token endpoint returned HTTP " +
                                 std::to_string(resp.status_code));
    }

    auto tok = json::parse(resp.body);
    std::string access = tok.value("access_token", "");
    if (access.empty()) {
        throw std::runtime_error("token response missing access_token");
    }

    Credential fresh = stale;
    fresh.access_token = access;
    std::string rotated = tok.value("refresh_token", "");
    if (!rotated.empty()) fresh.refresh_token = rotated;
    uint64_t expires_in = tok.value("expires_in", 3600u);
    fresh.expires_at = clock_() + expires_in * 1000;
    return fresh;
}

void CredentialStore::persist(const Credential& credential) {
    for (auto& source : sources_) {
        if (!source->writable()) continue;
        if (!source->save(credential)) {
            std::cerr << "[credentials] Could not persist refreshed credential to "
                      << source->name() << "\n";
        }
        return;
    }
}

} // namespace maxproxy
