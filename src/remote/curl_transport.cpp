#include "remote/curl_transport.hpp"
#include <curl/curl.h>
#include <glog/logging.h>
#include <memory>
#include <vector>

namespace submitter::remote {
using namespace std;

curl_transport::curl_transport(const judge_endpoint &endpoint, const credentials &creds)
    : endpoint(endpoint), creds(creds) {}

static size_t append_body(char *data, size_t size, size_t nmemb, void *userp) {
    static_cast<string *>(userp)->append(data, size * nmemb);
    return size * nmemb;
}

static bool is_configuration_error(CURLcode code) {
    switch (code) {
        case CURLE_FAILED_INIT:
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_NOT_BUILT_IN:
        case CURLE_BAD_FUNCTION_ARGUMENT:
            return true;
        default:
            return false;
    }
}

struct curl_deleter {
    void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};

struct slist_deleter {
    void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

http_response curl_transport::execute(const http_request &request) {
    http_response response;
    VLOG(1) << request.method << " " << request.url;

    unique_ptr<CURL, curl_deleter> curl(curl_easy_init());
    if (!curl) {
        response.status = transport_status::CONFIGURATION_ERROR;
        response.error = "unable to initialize curl";
        return response;
    }

    string origin = endpoint.base_url;
    while (!origin.empty() && origin.back() == '/') origin.pop_back();

    // clang-format off
    vector<string> headers = {
        "Accept: application/json, text/plain, */*",
        "Accept-Encoding: gzip, deflate, br",
        "Accept-Language: en-US,en;q=0.9",
        "Cache-Control: no-cache",
        "Connection: keep-alive",
        "Content-Type: application/json",
        "DNT: 1",
        "Origin: " + origin,
        "Pragma: no-cache",
        "Sec-Ch-Ua: \"Not_A Brand\";v=\"8\", \"Chromium\";v=\"120\", \"Google Chrome\";v=\"120\"",
        "Sec-Ch-Ua-Mobile: ?0",
        "Sec-Ch-Ua-Platform: \"Linux\"",
        "Sec-Fetch-Dest: empty",
        "Sec-Fetch-Mode: cors",
        "Sec-Fetch-Site: same-origin",
        "User-Agent: " + endpoint.user_agent,
        "X-CSRFToken: " + creds.csrf_token,
        "X-Requested-With: XMLHttpRequest",
        "Referer: " + make_referer(request.url),
    };
    // clang-format on

    string cookie = "LEETCODE_SESSION=" + creds.session;
    if (!creds.csrf_token.empty())
        cookie += "; csrftoken=" + creds.csrf_token;

    unique_ptr<curl_slist, slist_deleter> header_list;
    for (auto &header : headers) {
        curl_slist *appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            response.status = transport_status::CONFIGURATION_ERROR;
            response.error = "unable to build request headers";
            return response;
        }
        header_list.release();
        header_list.reset(appended);
    }

    CURL *handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(handle, CURLOPT_COOKIE, cookie.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, endpoint.timeout);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, endpoint.connect_timeout);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    if (request.method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)request.body.size());
    } else if (request.method != "GET") {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode res = curl_easy_perform(handle);
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status_code);

    if (res != CURLE_OK) {
        response.status = is_configuration_error(res) ? transport_status::CONFIGURATION_ERROR : transport_status::NETWORK_ERROR;
        response.error = string("failed to do the request: ") + curl_easy_strerror(res);
        LOG(WARNING) << request.method << " " << request.url << ": " << response.error;
        return response;
    }

    VLOG(1) << "http response " << response.status_code << ", got " << response.body.size() << " bytes body";
    return response;
}

}  // namespace submitter::remote
