#include "scraper.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <memory>
#include <vector>
#include <curl/curl.h>
#include <gumbo.h>

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct GumboDeleter {
    void operator()(GumboOutput* out) const { gumbo_destroy_output(&kGumboDefaultOptions, out); }
};
using GumboDoc = std::unique_ptr<GumboOutput, GumboDeleter>;

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

GumboDoc parse(const std::string& html) {
    return GumboDoc(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
}

bool is_text(const GumboNode* node) {
    return node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA ||
           node->type == GUMBO_NODE_WHITESPACE;
}

void collect_text(const GumboNode* node, std::vector<std::string>& chunks) {
    if (is_text(node)) {
        std::string t = trim(node->v.text.text);
        if (!t.empty()) chunks.push_back(std::move(t));
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT) return;
    if (node->type == GUMBO_NODE_ELEMENT &&
        (node->v.element.tag == GUMBO_TAG_SCRIPT || node->v.element.tag == GUMBO_TAG_STYLE))
        return;

    const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT
                                      ? &node->v.document.children
                                      : &node->v.element.children;
    for (unsigned i = 0; i < children->length; i++)
        collect_text(static_cast<const GumboNode*>(children->data[i]), chunks);
}

const GumboNode* find_tag(const GumboNode* node, GumboTag tag) {
    if (node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag) return node;
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT) return nullptr;
    const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT
                                      ? &node->v.document.children
                                      : &node->v.element.children;
    for (unsigned i = 0; i < children->length; i++) {
        if (auto* found = find_tag(static_cast<const GumboNode*>(children->data[i]), tag)) return found;
    }
    return nullptr;
}

}

void scraper_global_init() { curl_global_init(CURL_GLOBAL_DEFAULT); }
void scraper_global_cleanup() { curl_global_cleanup(); }

FetchResult fetch_url(const std::string& url, long timeout_sec) {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw ScrapeError("curl_easy_init failed");

    FetchResult res;
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, cfg::USER_AGENT.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &res.html);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK)
        throw ScrapeError(errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc)));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &res.status);
    if (res.status >= 400) throw ScrapeError("HTTP Error " + std::to_string(res.status));

    char* final_url = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &final_url);
    res.final_url = final_url ? final_url : url;
    res.title = extract_title(res.html);
    return res;
}

std::string html_to_text(const std::string& html) {
    GumboDoc doc = parse(html);
    std::vector<std::string> chunks;
    collect_text(doc->document, chunks);

    std::string text;
    for (size_t i = 0; i < chunks.size(); i++) {
        if (i) text += '\n';
        text += chunks[i];
    }
    return text;
}

std::string extract_title(const std::string& html) {
    GumboDoc doc = parse(html);
    const GumboNode* title = find_tag(doc->root, GUMBO_TAG_TITLE);
    if (!title) return "";
    std::string text;
    const GumboVector* children = &title->v.element.children;
    for (unsigned i = 0; i < children->length; i++) {
        auto* child = static_cast<const GumboNode*>(children->data[i]);
        if (is_text(child)) text += child->v.text.text;
    }
    return trim(text);
}
