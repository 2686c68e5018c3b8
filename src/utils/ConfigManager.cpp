#include <absl/strings/str_cat.h>
#include <fmt/format.h>

#include <ConfigManager.hpp>
#include <LogCompat.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <utility>

#include "Env.hpp"

namespace po = boost::program_options;

namespace MediaUpload {

namespace {

void AddOption(po::options_description &desc,
               const ConfigManager::Entry &entry) {
    const std::string name =
        entry.alias != ConfigManager::Entry::ALIAS_NONE
            ? fmt::format("{},{}", entry.name, entry.alias)
            : std::string(entry.name);

    auto *value = po::value<std::string>();
    if (entry.type == ConfigManager::Entry::ArgType::FLAG) {
        value->implicit_value("true");
    }
    desc.add_options()(name.c_str(), value, entry.description.data());
}

struct ConfigBackendEnv : public ConfigManager::Backend {
    ~ConfigBackendEnv() override = default;
    ConfigBackendEnv() = default;

    std::optional<std::string> get(const std::string_view name) override {
        Env env;
        const auto entry = env[absl::StrCat(std::string(ConfigManager::kEnvPrefix), std::string(name))];
        if (entry.has()) {
            return entry.get();
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string_view name() const override { return "Env"; }
};

struct ConfigBackendBoostPOBase : public ConfigManager::Backend {
    // Options shared by every source.
    static po::options_description getSharedOptionsDesc() {
        po::options_description desc("MediaUpload Configs");
        for (const auto &entry : ConfigManager::kConfigMap) {
            if (!entry.cmdlineOnly) {
                AddOption(desc, entry);
            }
        }
        return desc;
    }

    std::optional<std::string> get(const std::string_view name) override {
        if (const auto it = mp.find(std::string(name));
            it != mp.end() && !it->second.empty()) {
            return it->second.as<std::string>();
        }
        return std::nullopt;
    }

    ConfigBackendBoostPOBase() = default;
    ~ConfigBackendBoostPOBase() override = default;

   protected:
    po::variables_map mp;
};

struct ConfigBackendFile : public ConfigBackendBoostPOBase {
    std::filesystem::path _path;

    bool load() override {
        if (_path.empty()) {
            DLOG(INFO) << "No config file location";
            return false;
        }
        std::ifstream ifs(_path);
        if (ifs.fail()) {
            DLOG(INFO) << "Opening " << _path << " failed";
            return false;
        }
        try {
            po::store(po::parse_config_file(ifs, getSharedOptionsDesc()), mp);
            po::notify(mp);
        } catch (const po::error &e) {
            LOG(ERROR) << "File backend failed to parse: " << e.what();
            return false;
        }

        LOG(INFO) << "Loaded " << mp.size() << " entries from " << _path;
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "File"; }

    explicit ConfigBackendFile(std::filesystem::path path)
        : _path(std::move(path)) {}
    ~ConfigBackendFile() override = default;
};

struct ConfigBackendCmdline : public ConfigBackendBoostPOBase {
    CommandLine _line;
    std::string _error;

    static po::options_description getCmdlineOptionsDesc() {
        auto desc = getSharedOptionsDesc();
        for (const auto &entry : ConfigManager::kConfigMap) {
            if (entry.cmdlineOnly) {
                AddOption(desc, entry);
            }
        }
        return desc;
    }

    bool load() override {
        po::positional_options_description positional;
        positional.add(
            ConfigManager::entryOf(ConfigManager::Configs::FILE).name.data(),
            1);
        try {
            po::store(po::command_line_parser(_line.argc(), _line.argv())
                          .options(getCmdlineOptionsDesc())
                          .positional(positional)
                          .run(),
                      mp);
            po::notify(mp);
        } catch (const po::error &e) {
            LOG(ERROR) << "Cmdline backend failed to parse: " << e.what();
            _error = e.what();
            return false;
        }

        DLOG(INFO) << "Loaded " << mp.size() << " entries (cmdline)";
        return true;
    }
    [[nodiscard]] std::string_view name() const override { return "Cmdline"; }

    explicit ConfigBackendCmdline(CommandLine line) : _line(std::move(line)) {}
    ~ConfigBackendCmdline() override = default;
};

}  // namespace

std::filesystem::path ConfigManager::defaultConfigFile() {
    Env env;
    if (!env["HOME"].has()) {
        return {};
    }
    return std::filesystem::path(env["HOME"].get()) / kConfigFileName;
}

ConfigManager::ConfigManager(CommandLine line,
                             std::filesystem::path configFile) {
    auto cmdline = std::make_unique<ConfigBackendCmdline>(std::move(line));
    if (cmdline->load()) {
        storage[BackendType::COMMAND_LINE] = std::move(cmdline);
    } else {
        _status = absl::InvalidArgumentError(cmdline->_error);
    }
    auto env = std::make_unique<ConfigBackendEnv>();
    if (env->load()) {
        storage[BackendType::ENV] = std::move(env);
    }
    auto file = std::make_unique<ConfigBackendFile>(std::move(configFile));
    if (file->load()) {
        storage[BackendType::FILE] = std::move(file);
    }
    DLOG(INFO) << "Loaded " << storage.size() << " config sources";
}

std::optional<std::string> ConfigManager::get(Configs config) const {
    const auto &entry = entryOf(config);
    const std::string_view name = entry.name;

    for (const auto &bit : storage) {
        if (!bit) {
            continue;
        }
        if (entry.cmdlineOnly && bit != *storage.begin()) {
            break;
        }
        auto result = bit->get(name);
        if (result.has_value()) {
            DLOG(DEBUG) << fmt::format("Used '{}' backend for variable {}",
                                       bit->name(), name);
            return result;
        }
    }

    return std::nullopt;
}

void ConfigManager::serializeHelpToOStream(std::ostream &out) {
    out << "Usage: mediaupload [options] FILE\n"
        << ConfigBackendCmdline::getCmdlineOptionsDesc() << std::endl;
}

}  // namespace MediaUpload
