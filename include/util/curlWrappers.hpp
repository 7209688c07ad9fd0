#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sdbx::util {

inline void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_CONNECTTIMEOUT, 10L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    long     retryAfter = 0;   // seconds, from a Retry-After header on 429/503
    std::string body;
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
};

// Picks Retry-After out of the response headers.
inline size_t captureRetryAfter(char* p, size_t s, size_t n, void* ud) {
    constexpr std::string_view key = "retry-after:";
    const std::string_view line(p, s * n);
    if (line.size() > key.size()) {
        std::string name(line.substr(0, key.size()));
        std::ranges::transform(name, name.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == key) {
            const auto value = line.substr(key.size());
            long secs = 0;
            const auto first = value.find_first_not_of(' ');
            if (first != std::string_view::npos)
                std::from_chars(value.data() + first, value.data() + value.size(), secs);
            *static_cast<long*>(ud) = secs;
        }
    }
    return s * n;
}

// setup() runs after the default body and header sinks are installed and may replace them.
template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    ensureCurlGlobalInit();

    CurlEasy h;
    HttpResponse r;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, +[](char* p, size_t s, size_t n, void* ud) {
        static_cast<std::string*>(ud)->append(p, s * n);
        return s * n;
    });
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &r.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, captureRetryAfter);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &r.retryAfter);

    setup(static_cast<CURL*>(h));

    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    return r;
}

}
