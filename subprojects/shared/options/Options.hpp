#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

namespace shared_opts {
/**
 * \brief Process-wide option registry of speakerlinkd.
 *
 * Each subsystem registers a provider from a static object. At startup the
 * JSON file named by `-c/--config` is read once; every provider receives it to
 * seed its defaults (the `speakers` array, the `link` object) and adds its
 * flags to the shared \c CLI::App, so command-line values override the file.
 * Providers keep the parsed values themselves; see \c link_opts::current_settings.
 */
class Options {
public:
    using Provider = std::function<void(CLI::App&, const nlohmann::json&)>;

    enum class ParseResult { Ok, Help, Version, Error };

    static void add_provider(Provider p);
    /// Parse `-c/--config` JSON first, let every provider register its options against it,
    /// then run the strict command-line parse.
    static ParseResult load_and_parse(int argc, char** argv, std::string& err);
    /// Directory of the loaded config file; relative paths in it (e.g. `link.log_file`) resolve here.
    static std::optional<std::filesystem::path> get_config_dir();

private:
    static std::mutex& providers_mutex();
};
}
