#pragma once

#include <string>
#include <curl/curl.h>

/*
  NOTE: This is a really primitive blocking client meant only for probing status end-points of cluster nodes.
*/
class HttpClient {
private:
    HttpClient() = default;

    ~HttpClient() = default;

    static size_t curl_write(char *contents, size_t size, size_t nmemb, std::string *s);

    static CURL* init_curl(const std::string& url, std::string& response, const std::string& ca_cert_path,
                           const long timeout_ms);

    static long perform_curl(CURL *curl);

public:
    static HttpClient & get_instance() {
        static HttpClient instance;
        return instance;
    }

    HttpClient(HttpClient const&) = delete;
    void operator=(HttpClient const&) = delete;

    // must be called once before any other thread is started
    void init();

    void dispose();

    // Returns the HTTP status code, 408 on a timeout and 500 when the request could not be performed.
    // An empty `ca_cert_path` verifies against the system trust store.
    static long get_response(const std::string& url, std::string& response,
                             const std::string& ca_cert_path,
                             long timeout_ms=5000);
};
