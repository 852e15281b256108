#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace maxproxy {

namespace {

const char* const kOpus = "claude-opus-4-5-20251101";
const char* const kSonnet = "claude-sonnet-4-5-20250929";
const char* const kHaiku = "claude-3-5-haiku-20241022";

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object() && key != "models") {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

template <typename T>
void read_number(const nlohmann::json& obj, const char* key, T& out) {
    if (obj.contains(key) && obj[key].is_number_integer() && obj[key].template get<int64_t>() >= 0)
        out = static_cast<T>(obj[key].template get<int64_t>());
}

void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

} // namespace

nlohmann::json Config::defaults_json() {
    return {
        {"host", "127.0.0.1"},
        {"port", 3456},
        {"max_body", 10 * 1024 * 1024},
        {"upstream", {
            {"base_url", "https://api.anthropic.com/v1"},
            {"default_max_tokens", 8192},
            {"timeout_seconds", 300}
        }},
        {"oauth", {
            {"token_url", ""},
            {"client_id", ""},
            {"refresh_window_seconds", 300}
        }},
        {"credentials", {
            {"file", "~/.claude-max-proxy.json"},
            {"access_token", ""},
            {"refresh_token", ""}
        }},
        {"default_model", "claude-sonnet-4"},
        {"models", {
            {"claude-opus-4", kOpus},
            {"claude-sonnet-4", kSonnet},
            {"claude-haiku-4", kHaiku},
            {"opus", kOpus},
            {"sonnet", kSonnet},
            {"haiku", kHaiku},
            {"gpt-4", kOpus},
            {"gpt-4o", kSonnet},
            {"gpt-3.5-turbo", kHaiku},
            {"openai/claude-opus-4", kOpus},
            {"openai/claude-sonnet-4", kSonnet},
            {"openai/claude-haiku-4", kHaiku}
        }}
    };
}

void Config::apply_json(const nlohmann::json& j) {
    read_string(j, "host", host);
    read_number(j, "port", port);
    read_number(j, "max_body", max_body);
    read_string(j, "default_model", default_model);

    if (j.contains("upstream") && j["upstream"].is_object()) {
        const auto& u = j["upstream"];
        read_string(u, "base_url", upstream.base_url);
        read_number(u, "default_max_tokens", upstream.default_max_tokens);
        read_number(u, "timeout_seconds", upstream.timeout_seconds);
    }

    if (j.contains("oauth") && j["oauth"].is_object()) {
        const auto& o = j["oauth"];
        read_string(o, "token_url", oauth.token_url);
        read_string(o, "client_id", oauth.client_id);
        read_number(o, "refresh_window_seconds", oauth.refresh_window_seconds);
    }

    if (j.contains("credentials") && j["credentials"].is_object()) {
        const auto& c = j["credentials"];
        read_string(c, "file", credentials.file);
        read_string(c, "access_token", credentials.access_token);
        read_string(c, "refresh_token", credentials.refresh_token);
    }

    if (j.contains("models") && j["models"].is_object()) {
        models.clear();
        for (auto& [alias, target] : j["models"].items()) {
            if (target.is_string())
                models[alias] = target.get<std::string>();
        }
    }
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.maxproxy/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n", 0600);
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n", 0600)) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    cfg.apply_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("HOST"))
        cfg.host = v;
    if (const char* v = std::getenv("PORT")) {
        try {
            int p = std::stoi(v);
            if (p > 0 && p <= 65535) cfg.port = static_cast<uint16_t>(p);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid PORT: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("CLAUDE_ACCESS_TOKEN"))
        cfg.credentials.access_token = v;
    if (const char* v = std::getenv("CLAUDE_REFRESH_TOKEN"))
        cfg.credentials.refresh_token = v;
    if (const char* v = std::getenv("ANTHROPIC_BASE_URL"))
        cfg.upstream.base_url = v;
    if (const char* v = std::getenv("MAXPROXY_CREDENTIALS_FILE"))
        cfg.credentials.file = v;

    return cfg;
}

std::string Config::resolve_model(const std::string& requested) const {
    auto it = models.find(requested);
    if (it != models.end()) return it->second;
    it = models.find(default_model);
    if (it != models.end()) return it->second;
    return kSonnet;
}

} // namespace maxproxy
