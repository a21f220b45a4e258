// EN: NDJSON logger for HV-Cleanup. Instances are created by the application and injected into collaborators.
// FR: Logger NDJSON pour HV-Cleanup. Les instances sont créées par l'application et injectées dans les collaborateurs.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace HVC {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Thread-safe logger with NDJSON output and correlation IDs.
// FR: Logger thread-safe avec sortie NDJSON et IDs de corrélation.
class Logger {
public:
    // EN: Structure representing a log entry.
    // FR: Structure représentant une entrée de log.
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level;
        std::string message;
        std::string correlation_id;
        std::string module;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Logger writing to the console until an output file or stream is set.
    // FR: Logger écrivant sur la console tant qu'aucun fichier ou flux n'est défini.
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // EN: Set the minimum log level.
    // FR: Définit le niveau de log minimum.
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Set output file for logging (disables console output). Returns false if the file cannot be opened.
    // FR: Définit le fichier de sortie (désactive la sortie console). Retourne false si le fichier ne peut être ouvert.
    bool setOutputFile(const std::string& filename);

    // EN: Redirect output to an external stream (tests, embedding). The stream must outlive the logger.
    // FR: Redirige la sortie vers un flux externe (tests, intégration). Le flux doit survivre au logger.
    void setOutputStream(std::ostream* stream);

    // EN: Enable or disable console output.
    // FR: Active ou désactive la sortie console.
    void setConsoleOutput(bool enabled);

    // EN: Set correlation ID for all subsequent log entries.
    // FR: Définit l'ID de corrélation pour toutes les entrées suivantes.
    void setCorrelationId(const std::string& correlation_id);
    std::string getCorrelationId() const;

    // EN: Add global metadata that will be included in all log entries.
    // FR: Ajoute des métadonnées globales incluses dans toutes les entrées.
    void addGlobalMetadata(const std::string& key, const std::string& value);

    // EN: Log a message with specified level.
    // FR: Enregistre un message avec le niveau spécifié.
    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    // EN: Log convenience methods for different levels.
    // FR: Méthodes de log pratiques pour différents niveaux.
    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    // EN: Log convenience methods with metadata.
    // FR: Méthodes de log pratiques avec métadonnées.
    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    // EN: Flush all pending log entries to output.
    // FR: Vide toutes les entrées en attente vers la sortie.
    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    static std::string generateCorrelationId();

    // EN: Parse a level name (debug, info, warn, error). Unknown names map to INFO.
    // FR: Analyse un nom de niveau (debug, info, warn, error). Les noms inconnus donnent INFO.
    static LogLevel levelFromString(const std::string& name);
    static std::string levelToString(LogLevel level);

    // EN: Format log entry as NDJSON string.
    // FR: Formate l'entrée de log en chaîne NDJSON.
    static std::string formatAsNDJSON(const LogEntry& entry);

private:
    // EN: Write a log entry to the configured output.
    // FR: Écrit une entrée de log vers la sortie configurée.
    void writeEntry(const LogEntry& entry);

    // EN: Convert timestamp to ISO8601 format.
    // FR: Convertit le timestamp au format ISO8601.
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    std::ostream* external_stream_ = nullptr;
    mutable std::mutex mutex_;
    bool console_output_ = true;
};

#define HVC_LOG_DEBUG(logger, module, message) (logger).debug(module, message)
#define HVC_LOG_INFO(logger, module, message) (logger).info(module, message)
#define HVC_LOG_WARN(logger, module, message) (logger).warn(module, message)
#define HVC_LOG_ERROR(logger, module, message) (logger).error(module, message)

#define HVC_LOG_INFO_META(logger, module, message, metadata) (logger).info(module, message, metadata)
#define HVC_LOG_WARN_META(logger, module, message, metadata) (logger).warn(module, message, metadata)
#define HVC_LOG_ERROR_META(logger, module, message, metadata) (logger).error(module, message, metadata)

} // namespace HVC
