#include "config/query_config.hpp"

#include <cstdint>

#include <QFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace jobhist {

namespace {

std::string describe(const QString &origin)
{
    return origin.isEmpty() ? std::string("configuration") : origin.toStdString();
}

std::string requireString(const nlohmann::json &doc, const char *key, const QString &origin)
{
    const auto &value = doc.at(key);
    if (!value.is_string()) {
        throw ConfigError(describe(origin) + ": '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

} // namespace

const std::string &QueryConfig::fieldsFor(OutputMode mode) const
{
    switch (mode) {
    case OutputMode::Tabular:
        return tableFields;
    case OutputMode::Csv:
        return csvFields;
    case OutputMode::Long:
    case OutputMode::Json:
        return longFields;
    }
    return tableFields;
}

void applyConfigJson(QueryConfig &config, const std::string &text, const QString &origin)
{
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &error) {
        throw ConfigError(describe(origin) + ": invalid JSON: " + error.what());
    }
    if (!doc.is_object()) {
        throw ConfigError(describe(origin) + ": top level must be an object");
    }

    for (const auto &[key, value] : doc.items()) {
        if (key == "logRoot") {
            config.logRoot = QString::fromStdString(requireString(doc, "logRoot", origin));
        } else if (key == "format") {
            const std::string format = requireString(doc, "format", origin);
            const auto mode = parseOutputMode(format);
            if (!mode.has_value()) {
                throw ConfigError(describe(origin) + ": unknown format '" + format + "'");
            }
            config.format = *mode;
        } else if (key == "tableFields") {
            config.tableFields = requireString(doc, "tableFields", origin);
        } else if (key == "longFields") {
            config.longFields = requireString(doc, "longFields", origin);
        } else if (key == "csvFields") {
            config.csvFields = requireString(doc, "csvFields", origin);
        } else if (key == "blockSize") {
            if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0) {
                throw ConfigError(describe(origin) + ": 'blockSize' must be a positive integer");
            }
            config.blockSize = value.get<std::size_t>();
        } else if (key == "reverse") {
            if (!value.is_boolean()) {
                throw ConfigError(describe(origin) + ": 'reverse' must be true or false");
            }
            config.reverse = value.get<bool>();
        } else {
            JLOG_WARN(QStringLiteral("QueryConfig"),
                      QStringLiteral("applyConfigJson"),
                      QStringLiteral("config_key_ignored"),
                      QStringLiteral("unknown_key"),
                      (nlohmann::json{{"key", key}, {"origin", describe(origin)}}));
        }
    }
}

QueryConfig loadQueryConfig(const QString &path)
{
    QueryConfig config;

    QString configPath = path;
    if (configPath.isEmpty()) {
        configPath = qEnvironmentVariable("JOBHIST_CONFIG");
    }

    if (!configPath.isEmpty()) {
        QFile file(configPath);
        if (!file.open(QIODevice::ReadOnly)) {
            throw ConfigError("cannot read config file " + configPath.toStdString() + ": "
                              + file.errorString().toStdString());
        }
        applyConfigJson(config, file.readAll().toStdString(), configPath);
    }

    const QString rootOverride = qEnvironmentVariable("JOBHIST_LOG_ROOT");
    if (!rootOverride.isEmpty()) {
        config.logRoot = rootOverride;
    }

    JLOG_DEBUG(QStringLiteral("QueryConfig"),
               QStringLiteral("loadQueryConfig"),
               QStringLiteral("config_loaded"),
               QStringLiteral("query_setup"),
               (nlohmann::json{{"path", configPath.toStdString()},
                               {"logRoot", config.logRoot.toStdString()},
                               {"format", toOutputModeString(config.format)},
                               {"blockSize", config.blockSize},
                               {"reverse", config.reverse}}));
    return config;
}

} // namespace jobhist
