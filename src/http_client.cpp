#include "http_client.h"
#include "file_utils.h"
#include "logger.h"

void HttpClient::init() {
    curl_global_init(CURL_GLOBAL_SSL);
}

void HttpClient::dispose() {
    curl_global_cleanup();
}

long HttpClient::get_response(const std::string &url, std::string &response,
                              const std::string& ca_cert_path, long timeout_ms) {
    CURL *curl = init_curl(url, response, ca_cert_path, timeout_ms);
    if(curl == nullptr) {
        return 500;
    }

    return perform_curl(curl);
}

long HttpClient::perform_curl(CURL *curl) {
    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        char* url = nullptr;
        curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &url);

        long status_code = 0;

        if(res == CURLE_OPERATION_TIMEDOUT) {
            double total_time;
            curl_easy_getinfo(curl, CURLINFO_TOTAL_TIME, &total_time);
            LOG(WARNING) << "CURL timeout. Time taken: " << total_time << ", url: " << (url ? url : "");
            status_code = 408;
        } else {
            LOG(WARNING) << "CURL failed. Code: " << res << ", strerror: " << curl_easy_strerror(res)
                         << ", url: " << (url ? url : "");
            status_code = 500;
        }

        curl_easy_cleanup(curl);
        return status_code;
    }

    long http_code = 500;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_easy_cleanup(curl);

    return http_code == 0 ? 500 : http_code;
}

CURL *HttpClient::init_curl(const std::string& url, std::string& response, const std::string& ca_cert_path,
                            const long timeout_ms) {
    CURL *curl = curl_easy_init();

    if(curl == nullptr) {
        LOG(ERROR) << "Failed to initialize HTTP client.";
        return nullptr;
    }

    if(!ca_cert_path.empty()) {
        if(!file_exists(ca_cert_path)) {
            LOG(WARNING) << "CA certificate not found at " << ca_cert_path << ", verification will fail.";
        }
        curl_easy_setopt(curl, CURLOPT_CAINFO, ca_cert_path.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // node certificates are issued for the private IP, so both peer and host are verified
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, HttpClient::curl_write);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    return curl;
}

size_t HttpClient::curl_write(char *contents, size_t size, size_t nmemb, std::string *s) {
    s->append(contents, size*nmemb);
    return size*nmemb;
}
