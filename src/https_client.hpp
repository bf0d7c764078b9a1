#pragma once
#include <string>
#include <map>

namespace termineer {

struct HttpsResponse {
    int status = 0;             // 0 = transport failure
    std::string body;
    std::map<std::string, std::string> headers;  // lowercase names
    std::string error;          // transport error text when status == 0

    bool ok() const { return status >= 200 && status < 300; }
    std::string header(const std::string& name) const;
};

using HttpHeaders = std::map<std::string, std::string>;

struct ParsedUrl {
    std::string scheme = "https";
    std::string host;
    int port = 443;
    std::string path = "/";  // includes query string
};

// Splits scheme://host[:port]/path?query.
ParsedUrl parse_url(const std::string& url);

// httplib + OpenSSL. http:// URLs use a plain client.
HttpsResponse https_post(const std::string& url, const HttpHeaders& headers,
                         const std::string& body,
                         const std::string& content_type = "application/json",
                         int timeout_sec = 180);

HttpsResponse https_get(const std::string& url, const HttpHeaders& headers = {},
                        int timeout_sec = 30);

} // namespace termineer
