#pragma once
#include <string>
#include <map>
#include <vector>

// HTTP transport layer.
// HttpTransport is the seam every component sends requests through; HttpClient
// is the libcurl implementation. Redirects are never followed implicitly unless
// the caller opts in, so that login redirects stay inspectable.

// Where an injectable value lives in a request.
enum class ParamOrigin {
    NONE,
    QUERY,
    FORM,
    PATH
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> cookies;
    std::string body;
    long timeout_ms = 0;                       // 0 = transport default
    std::string target_param;                  // parameter under test, if any
    ParamOrigin target_origin = ParamOrigin::NONE;
};

struct HttpResponse {
    long status = 0;
    std::vector<std::pair<std::string, std::string>> headers;   // names lower-cased
    std::string body;
    std::string effective_url;
    std::string error;
    bool timed_out = false;
    double total_time = 0.0;                   // seconds
    size_t body_bytes = 0;

    /**
     * @brief Look up the first header with the given (lower-case) name
     * @param name Header name, compared case-insensitively
     * @return Header value or empty string
     */
    std::string header(const std::string& name) const;

    bool is_redirect() const { return status >= 300 && status < 400; }
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Perform one request without retries
     * @param req Request details
     * @param resp Populated with whatever was received
     * @return true if a response was received, false on transport failure
     */
    virtual bool perform(const HttpRequest& req, HttpResponse& resp) const = 0;
};

class HttpClient : public HttpTransport {
public:
    struct Options {
        long timeout_seconds;
        long connect_timeout_seconds;
        bool follow_redirects;
        long max_redirects;
        bool verify_tls;
        std::string user_agent;
        bool accept_encoding;

        Options()
            : timeout_seconds(30),
              connect_timeout_seconds(10),
              follow_redirects(false),
              max_redirects(5),
              verify_tls(true),
              user_agent("injscan/0.1 (Security Testing)"),
              accept_encoding(true)
        {}
    };

    /**
     * @brief Create an HTTP client with the given options
     * @param opts Client configuration (timeouts, redirects, TLS)
     */
    explicit HttpClient(const Options& opts = Options());

    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Make an HTTP request and fill in the response
     * @param req Request details (method, URL, headers, cookies, body)
     * @param resp Response object that gets populated
     * @return true if request succeeded, false on error
     */
    bool perform(const HttpRequest& req, HttpResponse& resp) const override;

    /**
     * @brief Build a Cookie header string from a map of cookies
     * @param cookies Map of cookie name -> value
     * @return Cookie header value string (e.g., "name1=value1; name2=value2")
     */
    static std::string build_cookie_header(const std::map<std::string, std::string>& cookies);

private:
    Options opts_;
};
