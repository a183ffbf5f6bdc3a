#include <zlib.h>
#include <nlohmann/json.hpp>
#include "test_common.hpp"

struct LoggerGuard {
    ~LoggerGuard() { shutdown_logger(); }
};

static std::string read_file(const fs::path& p) {
    std::ifstream ifs(p);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

TEST_CASE("Logger writes plain entries with fields") {
    fs::path log = fs::temp_directory_path() / "orgclone_logger_plain.log";
    FS_REMOVE(log);
    init_logger(log.string(), LogLevel::INFO);
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    log_info("Cloned repository", {{"repo", "alpha"}});
    log_debug("hidden");
    flush_logger();
    shutdown_logger();
    std::string text = read_file(log);
    REQUIRE(text.find("[INFO] Cloned repository repo=alpha") != std::string::npos);
    REQUIRE(text.find("hidden") == std::string::npos);
    FS_REMOVE(log);
}

TEST_CASE("Logger JSON output") {
    fs::path log = fs::temp_directory_path() / "orgclone_logger_json.log";
    FS_REMOVE(log);
    init_logger(log.string(), LogLevel::DEBUG);
    LoggerGuard guard;
    set_json_logging(true);
    log_warning("Rate limited", {{"wait_s", "30"}});
    flush_logger();
    shutdown_logger();
    set_json_logging(false);
    std::ifstream ifs(log);
    std::string line;
    REQUIRE(std::getline(ifs, line));
    auto j = nlohmann::json::parse(line);
    REQUIRE(j["level"] == "WARNING");
    REQUIRE(j["msg"] == "Rate limited");
    REQUIRE(j["wait_s"] == "30");
    FS_REMOVE(log);
}

TEST_CASE("Logger rotates and limits files") {
    fs::path log = fs::temp_directory_path() / "orgclone_logger_rotate.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::path log2 = log;
    log2 += ".2";
    fs::path log3 = log;
    log3 += ".3";
    for (const auto& p : {log, log1, log2, log3})
        FS_REMOVE(p);

    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));
    REQUIRE_FALSE(fs::exists(log3));
    for (const auto& p : {log, log1, log2})
        FS_REMOVE(p);
}

TEST_CASE("Logger compresses rotated files") {
    fs::path log = fs::temp_directory_path() / "orgclone_logger_gzip.log";
    fs::path gz = log;
    gz += ".1.gz";
    FS_REMOVE(log);
    FS_REMOVE(gz);
    init_logger(log.string(), LogLevel::INFO, 64, 1);
    LoggerGuard guard;
    set_log_compression(true);
    for (int i = 0; i < 20; ++i)
        log_info("compressed entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    set_log_compression(false);
    REQUIRE(fs::exists(gz));
    gzFile f = gzopen(gz.string().c_str(), "rb");
    REQUIRE(f != nullptr);
    char buf[256];
    int n = gzread(f, buf, sizeof(buf) - 1);
    gzclose(f);
    REQUIRE(n > 0);
    buf[n] = '\0';
    REQUIRE(std::string(buf).find("compressed entry") != std::string::npos);
    FS_REMOVE(log);
    FS_REMOVE(gz);
}

TEST_CASE("Logger drops messages when not initialized") {
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    log_error("nobody listens");
    flush_logger();
}

TEST_CASE("parse_log_level names") {
    REQUIRE(parse_log_level("debug") == LogLevel::DEBUG);
    REQUIRE(parse_log_level("WARN") == LogLevel::WARNING);
    REQUIRE(parse_log_level("Error") == LogLevel::ERR);
    REQUIRE_THROWS_AS(parse_log_level("loud"), std::runtime_error);
}
