#include "github_client.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <thread>

#include "logger.hpp"
#include "version.hpp"

namespace {

std::string to_lower_copy(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n";
    auto first = value.find_first_not_of(ws);
    if (first == std::string::npos)
        return "";
    auto last = value.find_last_not_of(ws);
    return value.substr(first, last - first + 1);
}

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
    auto* hdrs = static_cast<std::vector<std::string>*>(userdata);
    // A new status line starts a new header block (redirects, 100-continue).
    if (line.rfind("HTTP/", 0) == 0)
        hdrs->clear();
    else if (!line.empty())
        hdrs->push_back(line);
    return total;
}

using slist_ptr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    const std::string wanted = to_lower_copy(name);
    for (const auto& h : headers) {
        auto colon = h.find(':');
        if (colon == std::string::npos)
            continue;
        if (to_lower_copy(trim(h.substr(0, colon))) == wanted)
            return trim(h.substr(colon + 1));
    }
    return std::nullopt;
}

CurlGlobalGuard::CurlGlobalGuard() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlGlobalGuard::~CurlGlobalGuard() { curl_global_cleanup(); }

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout)
    : curl_(nullptr, &curl_easy_cleanup), timeout_(timeout) {}

HttpResponse CurlHttpClient::get(const std::string& url, const std::vector<std::string>& headers) {
    if (!curl_) {
        curl_.reset(curl_easy_init());
        if (!curl_)
            throw NetworkError("Failed to initialize libcurl");
    }
    CURL* curl = curl_.get();
    curl_easy_reset(curl);
    HttpResponse resp;
    slist_ptr header_list(nullptr, &curl_slist_free_all);
    for (const auto& h : headers) {
        curl_slist* next = curl_slist_append(header_list.get(), h.c_str());
        if (!next)
            throw NetworkError("Failed to build request headers");
        header_list.release();
        header_list.reset(next);
    }
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';
    const std::string user_agent = std::string("orgclone/") + ORGCLONE_VERSION;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp.headers);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::ostringstream oss;
        oss << "GET " << url << " failed: " << curl_easy_strerror(res);
        if (errbuf[0] != '\0')
            oss << " - " << errbuf;
        throw NetworkError(oss.str());
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status_code);
    return resp;
}

RepositoryLister::RepositoryLister(HttpClient& http, std::string organization, std::string api_url)
    : http_(http), organization_(std::move(organization)), api_url_(std::move(api_url)),
      sleeper_([](std::chrono::seconds s) { std::this_thread::sleep_for(s); }),
      clock_([] { return std::time(nullptr); }) {
    while (!api_url_.empty() && api_url_.back() == '/')
        api_url_.pop_back();
}

std::string RepositoryLister::page_url(int page) const {
    return api_url_ + "/orgs/" + organization_ + "/repos?per_page=" + std::to_string(kPerPage) +
           "&page=" + std::to_string(page) + "&type=all&sort=full_name&direction=asc";
}

std::vector<std::string>
RepositoryLister::request_headers(const std::optional<std::string>& token) {
    std::vector<std::string> headers{"Accept: application/vnd.github+json"};
    if (token) {
        std::string t = trim(*token);
        if (!t.empty())
            headers.push_back("Authorization: Bearer " + t);
    }
    return headers;
}

bool RepositoryLister::is_rate_limited(const HttpResponse& resp) const {
    if (resp.status_code == 429)
        return true;
    return resp.status_code == 403 &&
           to_lower_copy(resp.body).find("rate limit") != std::string::npos;
}

std::chrono::seconds RepositoryLister::rate_limit_wait(const HttpResponse& resp) const {
    auto reset = resp.header("X-RateLimit-Reset");
    if (!reset || reset->empty())
        return kDefaultRateLimitWait;
    try {
        size_t pos = 0;
        long long at = std::stoll(*reset, &pos);
        if (pos != reset->size())
            return kDefaultRateLimitWait;
        long long wait = at - static_cast<long long>(clock_());
        return std::chrono::seconds(std::max<long long>(1, wait));
    } catch (const std::exception&) {
        return kDefaultRateLimitWait;
    }
}

std::vector<RepositoryDescriptor>
RepositoryLister::list_repositories(const std::optional<std::string>& token,
                                    bool include_archived) {
    const auto headers = request_headers(token);
    std::vector<RepositoryDescriptor> repos;
    std::set<std::string> seen;
    int page = 1;
    while (true) {
        const std::string url = page_url(page);
        log_debug("Requesting repository page", {{"page", std::to_string(page)}, {"url", url}});
        HttpResponse resp = http_.get(url, headers);
        if (is_rate_limited(resp)) {
            auto wait = rate_limit_wait(resp);
            if (notice_cb_)
                notice_cb_("Hit rate limit. Sleeping " + std::to_string(wait.count()) +
                           " seconds...");
            log_warning("Rate limited while listing repositories",
                        {{"page", std::to_string(page)}, {"wait_s", std::to_string(wait.count())}});
            sleeper_(wait);
            continue;
        }
        if (resp.status_code < 200 || resp.status_code >= 300) {
            std::string snippet = resp.body.substr(0, 500);
            throw ApiError("GET " + url + " failed with HTTP " +
                               std::to_string(resp.status_code) +
                               (snippet.empty() ? "" : ": " + snippet),
                           resp.status_code);
        }
        auto entries = parse_repository_page(resp.body);
        if (entries.empty())
            break;
        for (auto& repo : entries) {
            if (!include_archived && repo.archived)
                continue;
            if (!seen.insert(repo.name).second) {
                log_debug("Skipping repository listed twice", {{"name", repo.name}});
                continue;
            }
            repos.push_back(std::move(repo));
        }
        if (page_cb_)
            page_cb_(page, entries.size());
        ++page;
    }
    log_info("Listed repositories", {{"org", organization_}, {"count", std::to_string(repos.size())}});
    return repos;
}

RepositoryDescriptor parse_repository(const nlohmann::json& entry) {
    if (!entry.is_object())
        throw ApiError("Unexpected repository entry: " + entry.dump().substr(0, 200));
    auto require_string = [&](const char* key) {
        auto it = entry.find(key);
        if (it == entry.end() || !it->is_string())
            throw ApiError(std::string("Repository entry has missing or non-string field '") + key +
                           "': " + entry.dump().substr(0, 200));
        return it->get<std::string>();
    };
    RepositoryDescriptor repo;
    repo.name = require_string("name");
    repo.http_clone_url = require_string("clone_url");
    repo.ssh_clone_url = require_string("ssh_url");
    auto archived = entry.find("archived");
    if (archived == entry.end() || !archived->is_boolean())
        throw ApiError("Repository '" + repo.name +
                       "' has missing or non-boolean field 'archived'");
    repo.archived = archived->get<bool>();
    if (repo.name.empty())
        throw ApiError("Repository entry has an empty name");
    return repo;
}

std::vector<RepositoryDescriptor> parse_repository_page(const std::string& body) {
    nlohmann::json data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded())
        throw ApiError("Response is not valid JSON: " + body.substr(0, 4000));
    if (!data.is_array())
        throw ApiError("Unexpected response: " + data.dump(2).substr(0, 4000));
    std::vector<RepositoryDescriptor> repos;
    repos.reserve(data.size());
    for (const auto& entry : data)
        repos.push_back(parse_repository(entry));
    return repos;
}
