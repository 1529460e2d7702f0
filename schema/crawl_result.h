#pragma once
#include <string>
#include <utility>
#include <vector>

/**
 * @file crawl_result.h
 * @brief Data structure representing one piece of injectable surface
 *
 * The crawler emits one entry per query-bearing URL and one per form. Each
 * entry is handed to the scanner plugins as a scan target.
 */

struct FormField {
    std::string name;
    std::string type;     // lower-cased input type, "textarea" or "select"
    std::string value;    // default value from the markup
};

struct CrawlResult {
    std::string url;
    std::string method;
    std::vector<std::pair<std::string, std::string>> params;
    std::vector<FormField> fields;             // populated for forms only
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<std::string> cookies;
    std::string source;                        // "page", "query" or "form"
    std::string page_url;                      // page the form was found on
    std::vector<std::string> discovery_path;
    int depth = 0;
    std::string timestamp;
    std::string hash;
};
