#include "backup_config.hpp"
#include "fs_util.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

std::optional<std::string> optionalString(const Json::Value& value, const char* key) {
    if (!value.isObject() || !value.isMember(key) || !value[key].isString() || value[key].asString().empty()) {
        return std::nullopt;
    }
    return toLower(value[key].asString());
}

std::vector<std::string> stringList(const Json::Value& value) {
    std::vector<std::string> result;
    if (value.isArray()) {
        for (const auto& item : value) {
            if (item.isString()) {
                result.push_back(item.asString());
            }
        }
    }
    return result;
}

std::string userDataPath(const std::string& relative) {
    return expandPath("~/ReStore/" + relative);
}

} // namespace

BackupConfig::BackupConfig()
    : excludedPatterns({"*.tmp", "*.temp", "~$*", "Thumbs.db", ".DS_Store", "*.log", "*.crdownload", "*.partial", "*.swp"}),
      stateFile(userDataPath("state/backup_state.json")),
      logFile(userDataPath("logs/restore.log")),
      errorLogFile(userDataPath("logs/errors.log")) {
    storageSources["local"] = {{"path", userDataPath("backups")}};
}

BackupConfig::BackupConfig(const std::string& configFile) : BackupConfig() {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + configFile);
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error("Failed to parse config file: " + configFile + ": " + reader.getFormattedErrorMessages());
    }
    *this = fromJson(configJson);
}

std::string BackupConfig::defaultConfigPath() {
    return userDataPath("config.json");
}

BackupConfig BackupConfig::fromJson(const Json::Value& root) {
    BackupConfig config;
    if (!root.isObject()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    for (const auto& entry : root["watchDirectories"]) {
        BackupTarget target;
        if (entry.isString()) {
            target.path = entry.asString();
        } else if (entry.isObject()) {
            target.path = entry.get("path", "").asString();
            target.storageType = optionalString(entry, "storageType");
        }
        if (target.path.empty()) {
            continue;
        }
        target.path = normalizeSourcePath(target.path);
        config.watchDirectories.push_back(target);
    }

    const Json::Value& sources = root["storageSources"];
    if (sources.isObject()) {
        config.storageSources.clear();
        for (const auto& name : sources.getMemberNames()) {
            const Json::Value& source = sources[name];
            StorageOptions options;
            const Json::Value& optionJson = source["options"];
            if (optionJson.isObject()) {
                for (const auto& key : optionJson.getMemberNames()) {
                    const Json::Value& value = optionJson[key];
                    options[key] = value.isString() ? expandPath(value.asString()) : value.asString();
                }
            }
            std::string path = source.get("path", "").asString();
            if (!path.empty() && options.find("path") == options.end()) {
                options["path"] = expandPath(path);
            }
            config.storageSources[toLower(name)] = options;
        }
    }

    if (root.isMember("globalStorageType")) {
        config.globalStorageType = toLower(root.get("globalStorageType", "local").asString());
    } else if (!config.storageSources.empty()) {
        config.globalStorageType = config.storageSources.begin()->first;
    }

    const Json::Value& system = root["systemBackup"];
    config.components.storageType = optionalString(system, "storageType");
    config.components.programsStorageType = optionalString(system, "programsStorageType");
    config.components.environmentStorageType = optionalString(system, "environmentStorageType");
    config.components.settingsStorageType = optionalString(system, "settingsStorageType");

    std::string type = root.get("backupType", "full").asString();
    auto parsedType = parseBackupType(type);
    if (!parsedType) {
        throw std::runtime_error("Unsupported backup type: " + type + " (use full, incremental or differential)");
    }
    config.backupType = *parsedType;

    std::string format = root.get("archiveFormat", "tar").asString();
    auto parsedFormat = parseArchiveFormat(format);
    if (!parsedFormat) {
        throw std::runtime_error("Unsupported archive format: " + format + " (use tar or zip)");
    }
    config.archiveFormat = *parsedFormat;
    config.compress = root.get("compress", true).asBool();

    const Json::Value& encryption = root["encryption"];
    if (encryption.isObject()) {
        config.encryption.enabled = encryption.get("enabled", false).asBool();
        int iterations = encryption.get("keyDerivationIterations", 100000).asInt();
        if (iterations <= 0) {
            throw std::runtime_error("encryption.keyDerivationIterations must be positive");
        }
        config.encryption.iterations = static_cast<std::uint32_t>(iterations);
    }

    if (root.isMember("excludedPatterns")) {
        config.excludedPatterns = stringList(root["excludedPatterns"]);
    }
    for (const auto& path : stringList(root["excludedPaths"])) {
        config.excludedPaths.push_back(expandPath(path));
    }
    config.maxFileSizeMB = root.get("maxFileSizeMB", 100).asUInt64();
    config.skipHidden = root.get("skipHidden", true).asBool();
    config.sizeThresholdMB = root.get("sizeThresholdMB", 500).asUInt64();

    const Json::Value& retention = root["retention"];
    if (retention.isObject()) {
        config.retention.enabled = retention.get("enabled", false).asBool();
        config.retention.keepLast = std::max(1, retention.get("keepLastPerDirectory", 10).asInt());
        config.retention.maxAgeDays = std::max(0, retention.get("maxAgeDays", 30).asInt());
    }

    const Json::Value& watch = root["watch"];
    if (watch.isObject()) {
        double seconds = watch.get("debounceSeconds", 10.0).asDouble();
        if (seconds < 0) {
            throw std::runtime_error("watch.debounceSeconds must not be negative");
        }
        config.watch.debounce = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
        config.watch.initialBackup = watch.get("initialBackup", true).asBool();
    }

    if (root.isMember("stateFile")) {
        config.stateFile = expandPath(root["stateFile"].asString());
    }
    if (root.isMember("logFile")) {
        config.logFile = expandPath(root["logFile"].asString());
    }
    if (root.isMember("errorLogFile")) {
        config.errorLogFile = expandPath(root["errorLogFile"].asString());
    }
    config.logLevel = toLower(root.get("logLevel", "info").asString());
    if (!Logger::parseLevel(config.logLevel)) {
        throw std::runtime_error("Unknown log level: " + config.logLevel);
    }
    return config;
}

std::string BackupConfig::resolveStorageType(const std::string& sourcePath,
                                             const std::optional<std::string>& storageOverride) const {
    if (storageOverride && !storageOverride->empty()) {
        return toLower(*storageOverride);
    }
    std::string key = normalizeSourcePath(sourcePath);
    for (const auto& target : watchDirectories) {
        if (target.path == key && target.storageType) {
            return *target.storageType;
        }
    }
    return globalStorageType;
}

StorageOptions BackupConfig::storageOptions(const std::string& storageType) const {
    auto it = storageSources.find(toLower(storageType));
    if (it == storageSources.end()) {
        return {};
    }
    return it->second;
}

std::string BackupConfig::componentStorage(const std::string& component) const {
    std::string name = toLower(component);
    const std::optional<std::string>* specific = nullptr;
    if (name == "programs") {
        specific = &components.programsStorageType;
    } else if (name == "environment") {
        specific = &components.environmentStorageType;
    } else if (name == "settings") {
        specific = &components.settingsStorageType;
    }
    if (specific && *specific) {
        return **specific;
    }
    if (components.storageType) {
        return *components.storageType;
    }
    return globalStorageType;
}

FileSelectionRules BackupConfig::selectionRules() const {
    FileSelectionRules rules;
    rules.excludedPatterns = excludedPatterns;
    rules.excludedPaths = excludedPaths;
    rules.maxFileSizeMB = maxFileSizeMB;
    rules.skipHidden = skipHidden;
    return rules;
}
