#pragma once

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace fdrop::util {

void ensureCurlGlobalInit();

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

}

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);   // handles live on worker threads
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

// Owns a multipart/form-data body bound to one easy handle.
class CurlMime {
public:
    explicit CurlMime(CURL* h) : mime_(curl_mime_init(h)) {
        if (!mime_) throw std::runtime_error("curl_mime_init failed");
    }
    ~CurlMime() { curl_mime_free(mime_); }

    CurlMime(const CurlMime&) = delete;
    CurlMime& operator=(const CurlMime&) = delete;

    void addPart(const std::string& name, const std::string& data,
                 const std::string& filename = {}, const std::string& contentType = {}) {
        curl_mimepart* part = curl_mime_addpart(mime_);
        curl_mime_name(part, name.c_str());
        curl_mime_data(part, data.data(), data.size());
        if (!filename.empty()) curl_mime_filename(part, filename.c_str());
        if (!contentType.empty()) curl_mime_type(part, contentType.c_str());
    }

    curl_mime* get() const { return mime_; }

private:
    curl_mime* mime_;
};

struct CurlResult {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    std::string hdr;
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
};

template <class SetupFn>
static CurlResult performCurl(SetupFn&& setup) {
    CurlEasy h;                    // RAII handle
    std::string bodyBuf, hdrBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, fdrop::util::writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, fdrop::util::writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);

    setup(h);                      // caller-specific tweaks

    CurlResult r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    r.hdr.swap(hdrBuf);
    return r;
}
