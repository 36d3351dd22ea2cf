#ifndef ACLOCK_CURL_HTTP_CLIENT_H
#define ACLOCK_CURL_HTTP_CLIENT_H

#include <string>

#include "weather.h"

namespace aclock {

// curl_global_init / curl_global_cleanup for the lifetime of main().
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return ok_; }

private:
    bool ok_;
};

class CurlHttpClient : public HttpClient {
public:
    // Every request fails as a transport error if global init failed.
    CurlHttpClient(const CurlGlobal& global, long timeoutSec);

    bool get(const std::string& url, HttpResponse& response, std::string& error) override;

private:
    const CurlGlobal& global_;
    long timeoutSec_;
};

} // namespace aclock

#endif
