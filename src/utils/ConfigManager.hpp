#pragma once

#include <absl/status/status.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "CommandLine.hpp"

namespace MediaUpload {

// Resolves uploader settings from three sources, in priority order:
// command line, environment (MEDIAUPLOAD_<NAME>), and an ini file.
class ConfigManager {
   public:
    enum class Configs {
        SERVICE_URL,
        SESSION_KEY,
        CHUNK_SIZE_KB,
        ADAPTIVE_CHUNKING,
        TARGET_UPLOAD_TIME,
        MIN_CHUNK_SIZE_KB,
        MAX_CHUNK_SIZE_KB,
        REQUEST_TIMEOUT,
        LOG_FILE,
        VERBOSE,
        HELP,
        FILE,
        MAX
    };
    static constexpr size_t CONFIG_MAX = static_cast<int>(Configs::MAX);
    static constexpr std::string_view kEnvPrefix = "MEDIAUPLOAD_";
    static constexpr std::string_view kConfigFileName = "mediaupload.ini";

    /**
     * get - Retrieve the value of a configuration from the first backend
     * that has it.
     *
     * @param config The configuration to look up.
     * @return The raw string value, or std::nullopt if no backend sets it.
     */
    std::optional<std::string> get(Configs config) const;

    /**
     * serializeHelpToOStream - Print the command line help to @p out.
     */
    static void serializeHelpToOStream(std::ostream& out);

    // $HOME/mediaupload.ini, or empty when HOME is not set.
    static std::filesystem::path defaultConfigFile();

    explicit ConfigManager(CommandLine line,
                           std::filesystem::path configFile = defaultConfigFile());

    // Non-OK when the command line could not be parsed.
    [[nodiscard]] const absl::Status& status() const { return _status; }

    struct Entry {
        static constexpr char ALIAS_NONE = '\0';

        Configs config;
        std::string_view name;
        std::string_view description;
        char alias;
        // FLAG options may be given without a value, meaning "true".
        enum class ArgType { STRING, FLAG } type;
        // Only accepted on the command line.
        bool cmdlineOnly;
    };

    static constexpr std::array<Entry, CONFIG_MAX> kConfigMap = {
        Entry{
            Configs::SERVICE_URL,
            "SERVICE_URL",
            "Media platform base URL",
            's',
            Entry::ArgType::STRING,
            false,
        },
        {
            Configs::SESSION_KEY,
            "SESSION_KEY",
            "Session key (ks) used to authorize uploads",
            'k',
            Entry::ArgType::STRING,
            false,
        },
        {
            Configs::CHUNK_SIZE_KB,
            "CHUNK_SIZE_KB",
            "Initial chunk size in KB",
            'c',
            Entry::ArgType::STRING,
            false,
        },
        {
            Configs::ADAPTIVE_CHUNKING,
            "ADAPTIVE_CHUNKING",
            "Adapt chunk size to measured speed (true/false)",
            'a',
            Entry::ArgType::FLAG,
            false,
        },
        {
            Configs::TARGET_UPLOAD_TIME,
            "TARGET_UPLOAD_TIME",
            "Target seconds per chunk for adaptive chunking",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
            false,
        },
        {
            Configs::MIN_CHUNK_SIZE_KB,
            "MIN_CHUNK_SIZE_KB",
            "Minimum adaptive chunk size in KB",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
            false,
        },
        {
            Configs::MAX_CHUNK_SIZE_KB,
            "MAX_CHUNK_SIZE_KB",
            "Maximum adaptive chunk size in KB",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
            false,
        },
        {
            Configs::REQUEST_TIMEOUT,
            "REQUEST_TIMEOUT",
            "Per-request timeout in seconds",
            't',
            Entry::ArgType::STRING,
            false,
        },
        {
            Configs::LOG_FILE,
            "LOG_FILE",
            "Log file path",
            'f',
            Entry::ArgType::STRING,
            false,
        },
        {
            Configs::VERBOSE,
            "VERBOSE",
            "Enable debug logging",
            'v',
            Entry::ArgType::FLAG,
            false,
        },
        {
            Configs::HELP,
            "HELP",
            "Display help information",
            'h',
            Entry::ArgType::FLAG,
            true,
        },
        {
            Configs::FILE,
            "FILE",
            "File to upload",
            Entry::ALIAS_NONE,
            Entry::ArgType::STRING,
            true,
        },
    };

    static constexpr const Entry& entryOf(Configs config) {
        return *std::ranges::find_if(
            kConfigMap, [config](const Entry& e) { return e.config == config; });
    }

    struct Backend {
        virtual ~Backend() = default;

        virtual bool load() { return true; }
        virtual std::optional<std::string> get(const std::string_view name) = 0;

        // Backend name such as "Cmdline" or "File", used for logging.
        [[nodiscard]] virtual std::string_view name() const = 0;
    };

   private:
    enum class BackendType { COMMAND_LINE, ENV, FILE, MAX };

    class BackendStorage {
        std::array<std::unique_ptr<Backend>, static_cast<int>(BackendType::MAX)>
            backends;

       public:
        std::unique_ptr<Backend>& operator[](const BackendType type) {
            return backends[static_cast<int>(type)];
        }

        [[nodiscard]] decltype(backends)::const_iterator begin() const {
            return backends.cbegin();
        }

        [[nodiscard]] decltype(backends)::const_iterator end() const {
            return backends.cend();
        }

        [[nodiscard]] size_t size() const {
            return std::ranges::count_if(
                backends, [](const auto& ent) { return ent != nullptr; });
        }
    } storage;
    absl::Status _status;
};

}  // namespace MediaUpload
