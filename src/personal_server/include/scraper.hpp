#pragma once
#include <string>

struct FetchResult {
    std::string final_url;
    std::string html;
    std::string title;
    long status = 0;
};

// GET `url`, following redirects. Throws ScrapeError on transport failure or
// an HTTP status >= 400.
FetchResult fetch_url(const std::string& url, long timeout_sec);

// Visible text of the document: one trimmed text node per line.
std::string html_to_text(const std::string& html);

// Trimmed text of the first <title> element, entities decoded, or "".
std::string extract_title(const std::string& html);

// Call once from main before any thread starts fetching.
void scraper_global_init();
void scraper_global_cleanup();
