#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace {

struct LogMessage {
    LogLevel level;
    std::string msg;
    std::map<std::string, std::string> fields;
};

std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<size_t> g_max_size{0};
std::atomic<size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};

std::queue<LogMessage> g_log_queue;
size_t g_pending = 0; // queued or being written, guarded by g_queue_mtx
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_drained_cv;
std::atomic<bool> g_running{false};
std::thread g_log_thread;
std::mutex g_init_mtx;

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

// Shift name.1 -> name.2 ... and move the active file to name.1.
void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    if (keep > 0) {
        for (size_t i = keep; i > 0; --i) {
            fs::path src = g_log_path + "." + std::to_string(i) + suffix;
            if (i == keep) {
                fs::remove(src, ec);
            } else {
                fs::path dst = g_log_path + "." + std::to_string(i + 1) + suffix;
                fs::rename(src, dst, ec);
            }
        }
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (g_compress_logs.load()) {
            fs::path gz = first;
            gz += ".gz";
            if (gzip_file(first.string(), gz.string()))
                fs::remove(first, ec);
        }
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

std::string format_entry(const LogMessage& m) {
    const std::string ts = timestamp();
    if (g_json_log.load()) {
        nlohmann::json j{{"timestamp", ts}, {"level", level_label(m.level)}, {"msg", m.msg}};
        for (const auto& [k, v] : m.fields)
            j[k] = v;
        return j.dump();
    }
    std::string line = "[" + ts + "] [" + level_label(m.level) + "] " + m.msg;
    for (const auto& [k, v] : m.fields)
        line += " " + k + "=" + v;
    return line;
}

void write_log_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open() || m.level < g_min_level.load())
        return;
    g_log_ofs << format_entry(m) << '\n';
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (!ec && size > g_max_size.load()) {
        g_log_ofs.close();
        rotate_files();
    }
}

void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (!g_running.load() && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        lk.unlock();
        for (const auto& m : batch)
            write_log_entry(m);
        g_log_ofs.flush();
        lk.lock();
        g_pending -= batch.size();
        batch.clear();
        if (g_pending == 0)
            g_drained_cv.notify_all();
    }
    g_log_ofs.flush();
}

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void enqueue(LogLevel level, const std::string& msg,
             const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load() || !g_running.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (!g_running.load())
            return;
        g_log_queue.push(LogMessage{level, msg, fields});
        ++g_pending;
    }
    g_queue_cv.notify_one();
}

} // namespace

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_min_level.store(level);
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path())
        fs::create_directories(p.parent_path(), ec);
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return;
    }
    g_log_path = path;
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open() && g_running.load();
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait(lk, [] { return g_pending == 0 || !g_running.load(); });
}

LogLevel parse_log_level(const std::string& name) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (val == "DEBUG")
        return LogLevel::DEBUG;
    if (val == "INFO")
        return LogLevel::INFO;
    if (val == "WARNING" || val == "WARN")
        return LogLevel::WARNING;
    if (val == "ERROR")
        return LogLevel::ERR;
    throw std::runtime_error("Invalid log level: " + name);
}

void log_debug(const std::string& msg) { enqueue(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { enqueue(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { enqueue(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { enqueue(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    while (!g_log_queue.empty())
        g_log_queue.pop();
    g_pending = 0;
    g_drained_cv.notify_all();
}
