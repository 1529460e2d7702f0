#pragma once
#include "request_executor.h"
#include <schema/crawl_result.h>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Web crawler that follows links and extracts forms from HTML pages.
// Breadth-first from one seed URL, level by level, bounded by max_depth and
// max_urls. Only URLs on the seed's registrable domain are kept. Honours the
// "User-agent: *" Disallow rules of robots.txt when enabled.

class Crawler {
public:
    struct Options {
        int max_depth;
        int max_urls;
        bool respect_robots;
        int parallel_fetches;       // pages fetched at once within a level

        Options()
            : max_depth(3),
              max_urls(100),
              respect_robots(true),
              parallel_fetches(4)
        {}
    };

    using PageObserver = std::function<void(const std::string& url)>;

    /**
     * @brief Create a new crawler that fetches through a request executor
     * @param executor Executor used for robots.txt and every page
     * @param opts Crawl options (max depth, url budget, robots.txt handling)
     */
    Crawler(RequestExecutor& executor, const Options& opts = Options());

    /**
     * @brief Crawl from a seed URL
     * @param seed Absolute http(s) URL to start from
     * @return Normalized in-scope URLs discovered (visited or not)
     */
    std::set<std::string> crawl(const std::string& seed);

    /// Forms found on visited pages, one entry per distinct form.
    const std::vector<CrawlResult>& forms() const { return forms_; }

    /// Pages that were actually fetched.
    const std::set<std::string>& visited() const { return visited_; }

    /**
     * @brief Scan surface: one entry per query-bearing URL, per page with a
     *        numeric path segment, and per form
     */
    std::vector<CrawlResult> surface() const;

    /// Called with each page URL just before it is fetched.
    void set_page_observer(PageObserver observer) { observer_ = std::move(observer); }

    /**
     * @brief Check a URL against the robots.txt rules loaded by crawl()
     * @return true if allowed or robots handling is disabled
     */
    bool robots_allows(const std::string& u) const;

    /**
     * @brief Parse robots.txt content
     * @param body robots.txt content
     * @return Disallow prefixes that apply to "User-agent: *"
     */
    static std::vector<std::string> parse_robots(const std::string& body);

    /**
     * @brief Extract candidate links from a page
     *
     * Looks at href/src/action/data/location attributes, url/location
     * assignments in scripts and CSS url() references. Fragment-only links and
     * javascript:, mailto:, tel:, data:, sms: and ftp: references are dropped.
     *
     * @param html Page content
     * @param base_url URL of the page, for relative references
     * @return Absolute, normalized URLs (scope not checked)
     */
    static std::set<std::string> extract_links(const std::string& html, const std::string& base_url);

    /**
     * @brief Extract <form> elements with their fields
     * @param html Page content
     * @param page_url URL of the page the forms live on
     * @return One CrawlResult per form (source "form")
     */
    static std::vector<CrawlResult> extract_forms(const std::string& html, const std::string& page_url);

    /**
     * @brief Static assets and VCS/IDE/dependency directories are never crawled
     */
    static bool is_ignored(const std::string& u);

private:
    RequestExecutor& executor_;
    Options opts_;
    PageObserver observer_;

    std::string seed_;
    std::vector<std::string> disallowed_;
    std::set<std::string> found_;
    std::set<std::string> visited_;
    std::vector<CrawlResult> pages_;
    std::vector<CrawlResult> forms_;
    std::map<std::string, std::vector<std::string>> discovery_;   // url -> path from seed
    std::set<std::string> form_hashes_;
    mutable std::mutex mutex_;

    void load_robots();

    bool in_scope(const std::string& u) const;

    /**
     * @brief Fetch one page and record its links and forms
     */
    void visit(const std::string& u, int depth);
};
