// EN: NDJSON logger for AreaLint - thread-safe singleton shared by every engine module.
// FR: Logger NDJSON pour AreaLint - singleton thread-safe partagé par tous les modules du moteur.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ARL {

// EN: Log levels enumeration.
// FR: Énumération des niveaux de log.
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Destination for log lines when no file is configured.
// FR: Destination des lignes de log quand aucun fichier n'est configuré.
enum class LogSink {
    STDOUT,
    STDERR,
    NONE
};

// EN: Parse a textual log level ("debug", "INFO", "warning"...). Returns nullopt when unknown.
// FR: Parse un niveau de log textuel ("debug", "INFO", "warning"...). Retourne nullopt si inconnu.
std::optional<LogLevel> parseLogLevel(const std::string& text);

// EN: Thread-safe singleton logger with NDJSON output and correlation IDs.
// FR: Logger singleton thread-safe avec sortie NDJSON et IDs de corrélation.
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
        std::string thread_id;
        std::unordered_map<std::string, std::string> metadata;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // EN: Set output file for logging (disables console output). Returns false if the file cannot be opened.
    // FR: Définit le fichier de sortie (désactive la console). Retourne false si le fichier ne peut être ouvert.
    bool setOutputFile(const std::string& filename);

    // EN: Route console output (used by the CLI so reports on stdout stay clean).
    // FR: Route la sortie console (utilisé par la CLI pour garder stdout propre).
    void setConsoleSink(LogSink sink);

    // EN: Set correlation ID for all subsequent log entries.
    // FR: Définit l'ID de corrélation pour toutes les entrées suivantes.
    void setCorrelationId(const std::string& correlation_id);

    // EN: Add global metadata that will be included in all log entries.
    // FR: Ajoute des métadonnées globales incluses dans toutes les entrées.
    void addGlobalMetadata(const std::string& key, const std::string& value);

    void log(LogLevel level, const std::string& module, const std::string& message);
    void log(LogLevel level, const std::string& module, const std::string& message,
             const std::unordered_map<std::string, std::string>& metadata);

    void debug(const std::string& module, const std::string& message);
    void info(const std::string& module, const std::string& message);
    void warn(const std::string& module, const std::string& message);
    void error(const std::string& module, const std::string& message);

    void debug(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);
    void info(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void warn(const std::string& module, const std::string& message,
              const std::unordered_map<std::string, std::string>& metadata);
    void error(const std::string& module, const std::string& message,
               const std::unordered_map<std::string, std::string>& metadata);

    void flush();

    // EN: Generate a new correlation ID (UUID-like format).
    // FR: Génère un nouvel ID de corrélation (format UUID).
    std::string generateCorrelationId();

    // EN: Format an entry as one NDJSON line (exposed for tests).
    // FR: Formate une entrée en une ligne NDJSON (exposé pour les tests).
    std::string formatAsNDJSON(const LogEntry& entry) const;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeEntry(const LogEntry& entry);

    static std::string levelToString(LogLevel level);
    static std::string timestampToISO8601(const std::chrono::system_clock::time_point& tp);
    static std::string getThreadId();

    LogLevel current_level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unordered_map<std::string, std::string> global_metadata_;
    std::unique_ptr<std::ofstream> log_file_;
    mutable std::mutex mutex_;
    LogSink console_sink_ = LogSink::STDOUT;
};

#define LOG_DEBUG(module, message) ARL::Logger::getInstance().debug(module, message)
#define LOG_INFO(module, message) ARL::Logger::getInstance().info(module, message)
#define LOG_WARN(module, message) ARL::Logger::getInstance().warn(module, message)
#define LOG_ERROR(module, message) ARL::Logger::getInstance().error(module, message)

#define LOG_DEBUG_META(module, message, metadata) ARL::Logger::getInstance().debug(module, message, metadata)
#define LOG_INFO_META(module, message, metadata) ARL::Logger::getInstance().info(module, message, metadata)
#define LOG_WARN_META(module, message, metadata) ARL::Logger::getInstance().warn(module, message, metadata)
#define LOG_ERROR_META(module, message, metadata) ARL::Logger::getInstance().error(module, message, metadata)

} // namespace ARL
