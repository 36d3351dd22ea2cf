#include "curl_http_client.h"

#include <curl/curl.h>

#include <iostream>

using namespace std;

namespace aclock {

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

} // namespace

CurlGlobal::CurlGlobal() {
    ok_ = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    if (!ok_) {
        cerr << "[weather] curl_global_init failed" << endl;
    }
}

CurlGlobal::~CurlGlobal() {
    if (ok_) curl_global_cleanup();
}

CurlHttpClient::CurlHttpClient(const CurlGlobal& global, long timeoutSec)
    : global_(global), timeoutSec_(timeoutSec) {
}

bool CurlHttpClient::get(const string& url, HttpResponse& response, string& error) {
    if (!global_.ok()) {
        error = "libcurl is not initialized";
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        error = "curl_easy_init failed";
        return false;
    }

    string body;
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSec_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // wttr.in answers curl with plain text
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "curl/" LIBCURL_VERSION);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        error = errbuf[0] ? string(errbuf) : string(curl_easy_strerror(res));
        curl_easy_cleanup(curl);
        return false;
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    response.status = status;
    response.body = body;
    return true;
}

} // namespace aclock
