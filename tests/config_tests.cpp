#include "test_common.hpp"
#include <stdexcept>

TEST_CASE("YAML config loader reads flat and sectioned keys") {
    fs::path cfg = fs::temp_directory_path() / "orgclone_cfg.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "org: acme\n";
        ofs << "clone:\n";
        ofs << "  workers: 4\n";
        ofs << "  mirror: true\n";
        ofs << "ignored:\n  - a\n";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, err));
    REQUIRE(opts["--org"] == "acme");
    REQUIRE(opts["--workers"] == "4");
    REQUIRE(opts["--mirror"] == "true");
    REQUIRE(opts.count("--ignored") == 0);
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config loader") {
    fs::path cfg = fs::temp_directory_path() / "orgclone_cfg.json";
    {
        std::ofstream ofs(cfg);
        ofs << R"({"dest": "mirror-dir", "workers": 3, "ssh": true, "logging": {"json-log": false}})";
    }
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, err));
    REQUIRE(opts["--dest"] == "mirror-dir");
    REQUIRE(opts["--workers"] == "3");
    REQUIRE(opts["--ssh"] == "true");
    REQUIRE(opts["--json-log"] == "false");
    FS_REMOVE(cfg);
}

TEST_CASE("Config loaders report errors") {
    std::map<std::string, std::string> opts;
    std::string err;
    REQUIRE_FALSE(load_yaml_config("/nonexistent/orgclone.yaml", opts, err));
    REQUIRE(err == "Failed to open file");
    fs::path cfg = fs::temp_directory_path() / "orgclone_cfg_bad.json";
    std::ofstream(cfg) << "[1, 2]";
    err.clear();
    REQUIRE_FALSE(load_json_config(cfg.string(), opts, err));
    REQUIRE(err == "Root JSON value is not an object");
    FS_REMOVE(cfg);
}

TEST_CASE("Config file values yield to the command line") {
    fs::path cfg = fs::temp_directory_path() / "orgclone_cfg_merge.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "org: from-config\n";
        ofs << "workers: 2\n";
        ofs << "mirror: yes\n";
        ofs << "ssh: false\n";
    }
    Argv args({"orgclone", "--config-yaml", cfg.string(), "--workers", "5"});
    Options opts = parse_options(args.argc(), args.argv());
    REQUIRE(opts.organization == "from-config");
    REQUIRE(opts.workers == 5);
    REQUIRE(opts.mirror);
    REQUIRE_FALSE(opts.use_ssh);
    REQUIRE(opts.config_file == cfg);
    FS_REMOVE(cfg);
}

TEST_CASE("Config file with unknown key is rejected") {
    fs::path cfg = fs::temp_directory_path() / "orgclone_cfg_unknown.json";
    std::ofstream(cfg) << R"({"frobnicate": 1})";
    Argv args({"orgclone", "--config-json", cfg.string()});
    REQUIRE_THROWS_AS(parse_options(args.argc(), args.argv()), std::runtime_error);
    FS_REMOVE(cfg);
}
