/**
 * \file daemon/SpeakerLinkOptions.cpp
 * \brief Implementation of speakerlinkd CLI and configuration option helpers.
 */

#include "SpeakerLinkOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace SpeakerLink { namespace link_opts {

namespace {

std::mutex g_mtx;
/// Speakers listed in the JSON config.
std::vector<DeviceConfig> g_config_speakers;
/// Problems found in the JSON speaker list; reported by current_settings().
std::vector<std::string> g_config_errors;
/// Raw --speaker values.
std::vector<std::string> g_cli_speakers;

std::optional<int> g_check_interval_s;
std::optional<int> g_stale_after_s;
std::optional<int> g_reconnect_base_s;
std::optional<int> g_reconnect_cap_exponent;
std::optional<int> g_reconnect_max_s;
std::optional<int> g_group_settle_ms;
std::optional<int> g_group_post_commit_ms;
std::optional<std::string> g_log_level;
std::optional<std::string> g_log_file;
std::optional<bool> g_interactive;
std::optional<std::string> g_client;

/// Integer from `link.<key>` when present and of the right type.
int link_int(const nlohmann::json& j, const char* key, int fallback) {
    if (j.contains("link") && j["link"].is_object() && j["link"].contains(key) && j["link"][key].is_number_integer()) {
        return j["link"][key].get<int>();
    }
    return fallback;
}

std::optional<std::string> link_string(const nlohmann::json& j, const char* key) {
    if (j.contains("link") && j["link"].is_object() && j["link"].contains(key) && j["link"][key].is_string()) {
        return j["link"][key].get<std::string>();
    }
    return std::nullopt;
}

void load_config_speakers(const nlohmann::json& j) {
    g_config_speakers.clear();
    g_config_errors.clear();
    if (!j.contains("speakers")) return;
    if (!j["speakers"].is_array()) {
        g_config_errors.push_back("'speakers' must be an array");
        return;
    }
    std::size_t index = 0;
    for (const auto& s : j["speakers"]) {
        const std::string where = "speakers[" + std::to_string(index++) + "]";
        if (!s.is_object() || !s.contains("id") || !s["id"].is_string() || !s.contains("host") || !s["host"].is_string()) {
            g_config_errors.push_back(where + " needs string 'id' and 'host'");
            continue;
        }
        DeviceConfig cfg;
        cfg.id = s["id"].get<std::string>();
        cfg.host = s["host"].get<std::string>();
        if (s.contains("port") && s["port"].is_number_integer()) cfg.port = s["port"].get<int>();
        cfg.name = (s.contains("name") && s["name"].is_string()) ? s["name"].get<std::string>() : cfg.id;
        if (cfg.id.empty() || cfg.host.empty()) {
            g_config_errors.push_back(where + " has an empty 'id' or 'host'");
            continue;
        }
        g_config_speakers.push_back(std::move(cfg));
    }
}

} // namespace

std::optional<DeviceConfig> parse_speaker_spec(const std::string& spec) {
    const auto eq = spec.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) return std::nullopt;

    DeviceConfig cfg;
    cfg.id = spec.substr(0, eq);
    std::string rest = spec.substr(eq + 1);
    const auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        const std::string port = rest.substr(colon + 1);
        if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5) {
            return std::nullopt;
        }
        cfg.port = std::stoi(port);
        if (cfg.port <= 0 || cfg.port > 65535) return std::nullopt;
        rest = rest.substr(0, colon);
    }
    if (rest.empty()) return std::nullopt;
    cfg.host = rest;
    cfg.name = cfg.id;
    return cfg;
}

LinkSettings current_settings() {
    std::lock_guard<std::mutex> lk(g_mtx);
    if (!g_config_errors.empty()) {
        std::string msg = "invalid speaker configuration:";
        for (const auto& e : g_config_errors) msg += " " + e + ";";
        throw std::invalid_argument(msg);
    }

    LinkSettings s;
    s.speakers = g_config_speakers;
    for (const auto& raw : g_cli_speakers) {
        auto cfg = parse_speaker_spec(raw);
        if (!cfg) throw std::invalid_argument("invalid --speaker '" + raw + "' (expected id=host[:port])");
        // Command line entries override config file entries with the same id.
        auto it = std::find_if(s.speakers.begin(), s.speakers.end(),
                               [&cfg](const DeviceConfig& d) { return d.id == cfg->id; });
        if (it != s.speakers.end()) *it = *cfg;
        else s.speakers.push_back(*cfg);
    }

    s.health.check_interval = std::chrono::seconds(g_check_interval_s.value_or(3600));
    s.health.stale_after = std::chrono::seconds(g_stale_after_s.value_or(3660));
    s.reconnect.base = std::chrono::seconds(g_reconnect_base_s.value_or(10));
    s.reconnect.cap_exponent = static_cast<unsigned>(g_reconnect_cap_exponent.value_or(6));
    s.reconnect.max_interval = std::chrono::seconds(g_reconnect_max_s.value_or(640));
    s.grouping.settle = std::chrono::milliseconds(g_group_settle_ms.value_or(1000));
    s.grouping.post_commit = std::chrono::milliseconds(g_group_post_commit_ms.value_or(1000));

    if (s.health.check_interval.count() <= 0 || s.health.stale_after.count() <= 0) {
        throw std::invalid_argument("health check intervals must be positive");
    }
    if (s.reconnect.base.count() <= 0 || s.reconnect.max_interval < s.reconnect.base) {
        throw std::invalid_argument("reconnect base must be positive and not exceed the maximum interval");
    }

    if (g_log_level) {
        auto level = log_level_from_string(*g_log_level);
        if (!level) throw std::invalid_argument("unknown log level '" + *g_log_level + "'");
        s.log_level = *level;
    }
    if (g_log_file && !g_log_file->empty()) {
        std::filesystem::path path(*g_log_file);
        if (path.is_relative()) {
            if (auto dir = shared_opts::Options::get_config_dir()) path = *dir / path;
        }
        s.log_file = path.string();
    }
    s.interactive = g_interactive.value_or(false);
    if (g_client) {
        auto type = parse_client_type(*g_client);
        if (!type) throw std::invalid_argument("unknown client backend '" + *g_client + "'");
        s.client = *type;
    }
    return s;
}

void register_options() {
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        std::lock_guard<std::mutex> lk(g_mtx);

        load_config_speakers(j);
        g_cli_speakers.clear();
        app.add_option("--speaker", g_cli_speakers, "Speaker to manage as id=host[:port] (repeatable)")
            ->check(CLI::Validator(
                [](std::string& value) -> std::string {
                    return parse_speaker_spec(value) ? std::string{} : "expected id=host[:port], got '" + value + "'";
                },
                "ID=HOST[:PORT]"))
            ->group("Speakers");

        g_check_interval_s = link_int(j, "check_interval_s", 3600);
        g_stale_after_s = link_int(j, "stale_after_s", 3660);
        app.add_option("--check-interval", g_check_interval_s, "Seconds between health checks")
            ->check(CLI::PositiveNumber)
            ->group("Link");
        app.add_option("--stale-after", g_stale_after_s, "Probe a speaker silent for this many seconds")
            ->check(CLI::PositiveNumber)
            ->group("Link");

        g_reconnect_base_s = link_int(j, "reconnect_base_s", 10);
        g_reconnect_cap_exponent = link_int(j, "reconnect_cap_exponent", 6);
        g_reconnect_max_s = link_int(j, "reconnect_max_s", 640);
        app.add_option("--reconnect-base", g_reconnect_base_s, "Base reconnect delay in seconds")
            ->check(CLI::PositiveNumber)
            ->group("Link");
        app.add_option("--reconnect-cap-exponent", g_reconnect_cap_exponent, "Highest backoff exponent")
            ->check(CLI::Range(0, 30))
            ->group("Link");
        app.add_option("--reconnect-max", g_reconnect_max_s, "Longest reconnect delay in seconds")
            ->check(CLI::PositiveNumber)
            ->group("Link");

        g_group_settle_ms = link_int(j, "group_settle_ms", 1000);
        g_group_post_commit_ms = link_int(j, "group_post_commit_ms", 1000);
        app.add_option("--group-settle-ms", g_group_settle_ms, "Collect grouping requests for this long")
            ->check(CLI::NonNegativeNumber)
            ->group("Grouping");
        app.add_option("--group-post-commit-ms", g_group_post_commit_ms, "Wait after a grouping call")
            ->check(CLI::NonNegativeNumber)
            ->group("Grouping");

        g_log_level = link_string(j, "log_level").value_or("info");
        app.add_option("--log-level", g_log_level, "Console log level: debug|info|warning|error|critical")
            ->group("General");
        g_log_file = link_string(j, "log_file");
        app.add_option("--log-file", g_log_file, "Also append log lines to this file")
            ->group("General");

        bool interactive_default = false;
        if (j.contains("link") && j["link"].is_object() && j["link"].contains("interactive") && j["link"]["interactive"].is_boolean()) {
            interactive_default = j["link"]["interactive"].get<bool>();
        }
        g_interactive = interactive_default;
        app.add_flag("--interactive,!--no-interactive", g_interactive, "Read commands from the console")
            ->group("General");

        g_client = link_string(j, "client").value_or("simulated");
        app.add_option("--client", g_client, "Speaker client backend (simulated)")
            ->group("General");
    });
}

} } // namespace SpeakerLink::link_opts

namespace {
    struct LinkOptsAutoReg {
        LinkOptsAutoReg() { SpeakerLink::link_opts::register_options(); }
    } link_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
