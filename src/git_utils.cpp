#include "git_utils.hpp"

using namespace std;

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

static git_repository* open_exact(const fs::path& p, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, p.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH,
                                nullptr) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_directory(p, ec))
        return false;
    repo_ptr r(open_exact(p, nullptr));
    return r.get() != nullptr;
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    repo_ptr r(open_exact(repo, error));
    if (!r.get())
        return nullopt;
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

string short_head(const fs::path& repo) {
    string hash = get_local_hash(repo).value_or("");
    if (hash.size() > 7)
        hash = hash.substr(0, 7);
    return hash;
}

} // namespace git
