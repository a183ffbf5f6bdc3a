#ifndef GITHUB_CLIENT_HPP
#define GITHUB_CLIENT_HPP

#include <chrono>
#include <ctime>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "repo.hpp"

/**
 * @brief Transport-level failure (DNS, TLS, timeout, connection reset).
 */
class NetworkError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Fatal API response: unexpected HTTP status or malformed payload.
 */
class ApiError : public std::runtime_error {
  public:
    explicit ApiError(const std::string& msg, long status = 0)
        : std::runtime_error(msg), status_(status) {}
    /** @return HTTP status of the offending response, 0 for payload errors. */
    long status() const { return status_; }

  private:
    long status_;
};

/**
 * @brief Raw HTTP response.
 *
 * Header lines are kept verbatim (`Name: value`) without the trailing CRLF.
 */
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::vector<std::string> headers;

    /** @return Value of the first header named @p name (case-insensitive). */
    std::optional<std::string> header(const std::string& name) const;
};

/**
 * @brief Minimal HTTP interface used by the repository lister.
 *
 * Implementations return every completed response regardless of status and
 * throw NetworkError only when no response was received.
 */
class HttpClient {
  public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url, const std::vector<std::string>& headers) = 0;
};

/**
 * @brief RAII helper for `curl_global_init` / `curl_global_cleanup`.
 */
struct CurlGlobalGuard {
    CurlGlobalGuard();
    ~CurlGlobalGuard();
    CurlGlobalGuard(const CurlGlobalGuard&) = delete;
    CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};

/**
 * @brief libcurl backed HttpClient. Not thread-safe; the lister runs on one
 *        thread.
 *
 * The easy handle is created by the first get(), so initialization failures
 * surface as NetworkError from the request.
 */
class CurlHttpClient : public HttpClient {
  public:
    explicit CurlHttpClient(std::chrono::seconds timeout = std::chrono::seconds(60));
    HttpResponse get(const std::string& url, const std::vector<std::string>& headers) override;

  private:
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
    std::chrono::seconds timeout_;
};

/**
 * @brief Enumerates the repositories of one organization.
 *
 * Pages of 100 entries are requested in ascending name order until an empty
 * page arrives. Rate-limited pages are retried after sleeping until the
 * advertised reset time.
 */
class RepositoryLister {
  public:
    using Sleeper = std::function<void(std::chrono::seconds)>;
    using PageCallback = std::function<void(int page, size_t entries)>;
    using NoticeCallback = std::function<void(const std::string&)>;
    using Clock = std::function<std::time_t()>;

    static constexpr int kPerPage = 100;
    static constexpr std::chrono::seconds kDefaultRateLimitWait{60};

    RepositoryLister(HttpClient& http, std::string organization,
                     std::string api_url = "https://api.github.com");

    /** @brief Replace the blocking sleep used while rate limited. */
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    /** @brief Replace the wall clock used to interpret reset timestamps. */
    void set_clock(Clock clock) { clock_ = std::move(clock); }
    /** @brief Called once per fetched non-empty page. */
    void on_page(PageCallback cb) { page_cb_ = std::move(cb); }
    /** @brief Receives user-visible notices such as rate-limit waits. */
    void on_notice(NoticeCallback cb) { notice_cb_ = std::move(cb); }

    /**
     * @brief Fetch every repository of the organization.
     *
     * @param token            Optional bearer token.
     * @param include_archived Keep archived repositories.
     * @throws NetworkError, ApiError
     */
    std::vector<RepositoryDescriptor> list_repositories(const std::optional<std::string>& token,
                                                        bool include_archived);

    /** @return URL of listing page @p page. */
    std::string page_url(int page) const;

    /** @return Request headers for @p token. */
    static std::vector<std::string> request_headers(const std::optional<std::string>& token);

  private:
    bool is_rate_limited(const HttpResponse& resp) const;
    std::chrono::seconds rate_limit_wait(const HttpResponse& resp) const;

    HttpClient& http_;
    std::string organization_;
    std::string api_url_;
    Sleeper sleeper_;
    Clock clock_;
    PageCallback page_cb_;
    NoticeCallback notice_cb_;
};

/**
 * @brief Convert one JSON listing entry into a descriptor.
 *
 * @throws ApiError when `name`, `clone_url`, `ssh_url` or `archived` is
 *         missing or has the wrong type.
 */
RepositoryDescriptor parse_repository(const nlohmann::json& entry);

/**
 * @brief Parse a listing page body.
 *
 * @throws ApiError when the body is not valid JSON, not an array, or holds a
 *         malformed entry.
 */
std::vector<RepositoryDescriptor> parse_repository_page(const std::string& body);

#endif // GITHUB_CLIENT_HPP
