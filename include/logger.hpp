#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and starts the background
 * writer thread. Messages logged before this call, or after
 * shutdown_logger(), are discarded.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files instead of keeping them as plain text. */
void set_log_compression(bool enable);

/** @return `true` if the logger is ready to use. */
bool logger_initialized();

/** @brief Block until every queued message has been written. */
void flush_logger();

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Parse a level name such as "debug" or "WARN".
 *
 * @throws std::runtime_error for an unknown name.
 */
LogLevel parse_log_level(const std::string& name);

/** @brief Shut down the logging subsystem and release resources. */
void shutdown_logger();

#endif // LOGGER_HPP
