#pragma once

#include <curl/curl.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace es::util {

inline void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

inline size_t writeToString(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* buf = static_cast<std::string*>(userdata);
    buf->append(ptr, size * nmemb);
    return size * nmemb;
}

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
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

// Owns a curl_mime built on a specific handle.
class Mime {
public:
    explicit Mime(CURL* h) : mime_(curl_mime_init(h)) {
        if (!mime_) throw std::runtime_error("curl_mime_init failed");
    }
    ~Mime() { curl_mime_free(mime_); }

    Mime(const Mime&) = delete;
    Mime& operator=(const Mime&) = delete;

    void addField(const char* name, const std::string& value) {
        curl_mimepart* part = curl_mime_addpart(mime_);
        curl_mime_name(part, name);
        curl_mime_data(part, value.data(), value.size());
    }

    void addFile(const char* name, const char* filename, const void* data, const size_t len) {
        curl_mimepart* part = curl_mime_addpart(mime_);
        curl_mime_name(part, name);
        curl_mime_filename(part, filename);
        curl_mime_type(part, "application/octet-stream");
        curl_mime_data(part, static_cast<const char*>(data), len);
    }

    curl_mime* get() const { return mime_; }

private:
    curl_mime* mime_;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    double   totalSeconds = 0.0;
    std::string body;
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
    bool transportFailed() const { return curl != CURLE_OK; }
};

template <class SetupFn>
HttpResponse performCurl(CurlEasy& h, SetupFn&& setup) {
    std::string bodyBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);

    setup(static_cast<CURL*>(h));  // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    curl_easy_getinfo(h, CURLINFO_TOTAL_TIME, &r.totalSeconds);
    r.body.swap(bodyBuf);
    return r;
}

template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    CurlEasy h;                    // RAII handle
    return performCurl(h, std::forward<SetupFn>(setup));
}

}
