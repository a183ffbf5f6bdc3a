#include "test_common.hpp"
#include <algorithm>

namespace {

WorkerPoolConfig make_config(const fs::path& dest) {
    WorkerPoolConfig cfg;
    cfg.destination_directory = dest;
    return cfg;
}

} // namespace

TEST_CASE("clone_command shallow HTTPS by default") {
    auto cfg = make_config("/tmp/dest");
    auto cmd = clone_command(cfg, descriptor("alpha"));
    REQUIRE(cmd == std::vector<std::string>{"git", "clone", "--depth", "1", "--no-single-branch",
                                            "https://example.test/org/alpha.git",
                                            "/tmp/dest/alpha"});
}

TEST_CASE("clone_command mirror over SSH") {
    auto cfg = make_config("/tmp/dest");
    cfg.mirror = true;
    cfg.shallow = false;
    cfg.use_ssh = true;
    cfg.git_executable = "/usr/bin/git";
    auto cmd = clone_command(cfg, descriptor("alpha"));
    REQUIRE(cmd == std::vector<std::string>{"/usr/bin/git", "clone", "--mirror",
                                            "git@example.test:org/alpha.git",
                                            "/tmp/dest/alpha.git"});
}

TEST_CASE("clone_command full clone") {
    auto cfg = make_config("/tmp/dest");
    cfg.shallow = false;
    auto cmd = clone_command(cfg, descriptor("alpha"));
    REQUIRE(cmd.size() == 4);
    REQUIRE(cmd[2] == "https://example.test/org/alpha.git");
}

TEST_CASE("update_commands per checkout kind") {
    auto cfg = make_config("/tmp/dest");
    auto cmds = update_commands(cfg);
    REQUIRE(cmds.size() == 2);
    REQUIRE(cmds[0] == std::vector<std::string>{"git", "fetch", "--all", "--prune"});
    REQUIRE(cmds[1] == std::vector<std::string>{"git", "pull", "--ff-only"});
    cfg.mirror = true;
    cfg.shallow = false;
    cmds = update_commands(cfg);
    REQUIRE(cmds.size() == 1);
    REQUIRE(cmds[0] == std::vector<std::string>{"git", "remote", "update", "--prune"});
}

TEST_CASE("process_one clones a missing target") {
    fs::path dest = fresh_dir("orgclone_worker_clone");
    ScriptedHooks sh;
    auto outcome = process_one(descriptor("alpha"), make_config(dest), sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Cloned);
    REQUIRE(outcome.name == "alpha");
    REQUIRE(sh.runner.calls.size() == 1);
    REQUIRE(sh.runner.calls[0].cwd.empty());
    REQUIRE(sh.lines == std::vector<std::string>{"clone output"});
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one retries with doubling backoff") {
    fs::path dest = fresh_dir("orgclone_worker_retry");
    ScriptedHooks sh;
    sh.runner.script("clone", {128, 128, 0});
    auto cfg = make_config(dest);
    auto outcome = process_one(descriptor("alpha"), cfg, sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Cloned);
    REQUIRE(sh.runner.calls_for("clone").size() == 3);
    REQUIRE(sh.sleeps == std::vector<std::chrono::seconds>{std::chrono::seconds(5),
                                                           std::chrono::seconds(10)});
    REQUIRE(std::find(sh.lines.begin(), sh.lines.end(),
                      "[alpha] clone failed with exit code 128. Retrying in 5s (attempt 1/2)...") !=
            sh.lines.end());
    REQUIRE(std::find(sh.lines.begin(), sh.lines.end(),
                      "[alpha] clone failed with exit code 128. Retrying in 10s (attempt 2/2)...") !=
            sh.lines.end());
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one fails after exhausting retries") {
    fs::path dest = fresh_dir("orgclone_worker_exhaust");
    ScriptedHooks sh;
    sh.runner.script("clone", {128, 128, 128, 128});
    auto cfg = make_config(dest);
    cfg.retry_limit = 3;
    auto outcome = process_one(descriptor("alpha"), cfg, sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Failed);
    REQUIRE(outcome.reason == "exit code 128");
    REQUIRE(sh.runner.calls_for("clone").size() == 4);
    REQUIRE(sh.sleeps == std::vector<std::chrono::seconds>{std::chrono::seconds(5),
                                                           std::chrono::seconds(10),
                                                           std::chrono::seconds(20)});
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one with zero retries tries once") {
    fs::path dest = fresh_dir("orgclone_worker_noretry");
    ScriptedHooks sh;
    sh.runner.script("clone", {1});
    auto cfg = make_config(dest);
    cfg.retry_limit = 0;
    auto outcome = process_one(descriptor("alpha"), cfg, sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Failed);
    REQUIRE(sh.runner.calls.size() == 1);
    REQUIRE(sh.sleeps.empty());
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one reports a git that cannot start") {
    fs::path dest = fresh_dir("orgclone_worker_nostart");
    ScriptedHooks sh;
    sh.runner.fail_to_start("clone");
    auto cfg = make_config(dest);
    cfg.retry_limit = 1;
    auto outcome = process_one(descriptor("alpha"), cfg, sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Failed);
    REQUIRE(outcome.reason == "failed to start git: No such file or directory");
    REQUIRE(sh.sleeps.size() == 1);
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one updates an existing checkout") {
    fs::path dest = fresh_dir("orgclone_worker_update");
    fs::create_directories(dest / "alpha");
    ScriptedHooks sh;
    auto hooks = sh.hooks();
    hooks.read_head = [](const fs::path&) { return std::string("abc1234"); };
    auto outcome = process_one(descriptor("alpha"), make_config(dest), hooks);
    REQUIRE(outcome.kind == OutcomeKind::Updated);
    REQUIRE(outcome.commit == "abc1234");
    REQUIRE(sh.runner.calls.size() == 2);
    REQUIRE(sh.runner.calls[0].args[1] == "fetch");
    REQUIRE(sh.runner.calls[0].cwd == dest / "alpha");
    REQUIRE(sh.runner.calls[1].args[1] == "pull");
    REQUIRE(sh.runner.calls_for("clone").empty());
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one is lenient about a failed fast-forward") {
    fs::path dest = fresh_dir("orgclone_worker_lenient");
    fs::create_directories(dest / "alpha");
    ScriptedHooks sh;
    sh.runner.script("pull", {1});
    auto outcome = process_one(descriptor("alpha"), make_config(dest), sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Updated);
    REQUIRE(sh.runner.calls_for("clone").empty());
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one strict pull marks failure") {
    fs::path dest = fresh_dir("orgclone_worker_strict");
    fs::create_directories(dest / "alpha");
    ScriptedHooks sh;
    sh.runner.script("pull", {1});
    auto cfg = make_config(dest);
    cfg.strict_pull = true;
    auto outcome = process_one(descriptor("alpha"), cfg, sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Failed);
    REQUIRE(outcome.reason == "fast-forward pull failed (exit 1)");
    REQUIRE(sh.runner.calls_for("clone").empty());
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one falls back to clone when fetch fails") {
    fs::path dest = fresh_dir("orgclone_worker_fallback");
    fs::create_directories(dest / "alpha");
    ScriptedHooks sh;
    sh.runner.script("fetch", {128});
    auto hooks = sh.hooks();
    bool probed = false;
    hooks.is_repository = [&probed](const fs::path&) {
        probed = true;
        return false;
    };
    auto outcome = process_one(descriptor("alpha"), make_config(dest), hooks);
    REQUIRE(probed);
    REQUIRE(outcome.kind == OutcomeKind::Cloned);
    REQUIRE(sh.runner.calls_for("pull").empty());
    REQUIRE(sh.runner.calls_for("clone").size() == 1);
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one falls back to clone when update cannot start") {
    fs::path dest = fresh_dir("orgclone_worker_fallback_start");
    fs::create_directories(dest / "alpha");
    ScriptedHooks sh;
    sh.runner.fail_to_start("fetch");
    auto outcome = process_one(descriptor("alpha"), make_config(dest), sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Cloned);
    REQUIRE(sh.runner.calls_for("clone").size() == 1);
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one updates a mirror with remote update") {
    fs::path dest = fresh_dir("orgclone_worker_mirror");
    fs::create_directories(dest / "alpha.git");
    ScriptedHooks sh;
    auto cfg = make_config(dest);
    cfg.mirror = true;
    cfg.shallow = false;
    auto outcome = process_one(descriptor("alpha"), cfg, sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Updated);
    REQUIRE(sh.runner.calls.size() == 1);
    REQUIRE(sh.runner.calls[0].args ==
            std::vector<std::string>{"git", "remote", "update", "--prune"});
    REQUIRE(sh.runner.calls[0].cwd == dest / "alpha.git");
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one with real git clones and updates") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    fs::path root = fresh_dir("orgclone_worker_real");
    fs::path upstream = root / "upstream";
    REQUIRE(std::system(("git init -q " + upstream.string()).c_str()) == 0);
    std::system(("git -C " + upstream.string() + " config user.email you@example.com").c_str());
    std::system(("git -C " + upstream.string() + " config user.name tester").c_str());
    std::ofstream(upstream / "file.txt") << "hello";
    std::system(("git -C " + upstream.string() + " add file.txt").c_str());
    REQUIRE(std::system(("git -C " + upstream.string() + " commit -q -m init" REDIR).c_str()) ==
            0);

    RepositoryDescriptor repo{"upstream", "file://" + upstream.string(),
                              "file://" + upstream.string(), false};
    WorkerPoolConfig cfg = make_config(root / "dest");
    fs::create_directories(cfg.destination_directory);
    auto hooks = default_clone_hooks({});

    auto first = process_one(repo, cfg, hooks);
    REQUIRE(first.kind == OutcomeKind::Cloned);
    REQUIRE(first.commit.size() == 7);
    REQUIRE(git::is_git_repo(cfg.destination_directory / "upstream"));

    auto second = process_one(repo, cfg, hooks);
    REQUIRE(second.kind == OutcomeKind::Updated);
    REQUIRE(second.commit == first.commit);
    FS_REMOVE_ALL(root);
}

TEST_CASE("process_one caps the retry delay") {
    fs::path dest = fresh_dir("orgclone_worker_backoff_cap");
    ScriptedHooks sh;
    sh.runner.always_fail("alpha.git", 128);
    auto cfg = make_config(dest);
    cfg.retry_limit = 100;
    auto outcome = process_one(descriptor("alpha"), cfg, sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Failed);
    REQUIRE(sh.runner.calls_for("clone").size() == 101);
    REQUIRE(sh.sleeps.size() == 100);
    REQUIRE(sh.sleeps[0] == std::chrono::seconds(5));
    REQUIRE(sh.sleeps[5] == std::chrono::seconds(160));
    REQUIRE(sh.sleeps[6] == cfg.max_backoff);
    REQUIRE(sh.sleeps.back() == cfg.max_backoff);
    for (const auto& s : sh.sleeps)
        REQUIRE(s <= cfg.max_backoff);
    FS_REMOVE_ALL(dest);
}

TEST_CASE("process_one falls back to clone when pull cannot start") {
    fs::path dest = fresh_dir("orgclone_worker_pull_nostart");
    fs::create_directories(dest / "alpha");
    ScriptedHooks sh;
    sh.runner.fail_to_start("pull");
    auto outcome = process_one(descriptor("alpha"), make_config(dest), sh.hooks());
    REQUIRE(outcome.kind == OutcomeKind::Cloned);
    REQUIRE(sh.runner.calls_for("fetch").size() == 1);
    REQUIRE(sh.runner.calls_for("pull").size() == 1);
    REQUIRE(sh.runner.calls_for("clone").size() == 1);
    FS_REMOVE_ALL(dest);
}
