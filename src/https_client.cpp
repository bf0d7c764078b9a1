#include "https_client.hpp"
#include "utils.hpp"
#include <httplib.h>

namespace termineer {

std::string HttpsResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? "" : it->second;
}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl u;
    size_t pos = 0;
    if (starts_with(url, "https://")) {
        u.scheme = "https"; pos = 8; u.port = 443;
    } else if (starts_with(url, "http://")) {
        u.scheme = "http"; pos = 7; u.port = 80;
    }

    size_t slash = url.find_first_of("/?", pos);
    std::string host_port = slash != std::string::npos ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        u.path = url.substr(slash);
        if (u.path[0] == '?') u.path = "/" + u.path;
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        u.host = host_port.substr(0, colon);
        u.port = std::atoi(host_port.substr(colon + 1).c_str());
    } else {
        u.host = host_port;
    }
    return u;
}

static httplib::Headers to_httplib(const HttpHeaders& headers) {
    httplib::Headers h;
    for (auto& [k, v] : headers) h.emplace(k, v);
    return h;
}

static HttpsResponse from_result(const httplib::Result& res) {
    HttpsResponse resp;
    if (!res) {
        resp.error = "connection failed: " + httplib::to_string(res.error());
        return resp;
    }
    resp.status = res->status;
    resp.body = res->body;
    for (auto& [k, v] : res->headers) resp.headers[to_lower(k)] = v;
    return resp;
}

HttpsResponse https_post(const std::string& url, const HttpHeaders& headers,
                         const std::string& body, const std::string& content_type,
                         int timeout_sec) {
    auto u = parse_url(url);
    if (u.host.empty()) {
        HttpsResponse resp;
        resp.error = "invalid url: " + url;
        return resp;
    }
    httplib::Client cli(u.scheme + "://" + u.host + ":" + std::to_string(u.port));
    cli.set_connection_timeout(30);
    cli.set_read_timeout(timeout_sec);
    cli.set_write_timeout(timeout_sec);

    auto res = cli.Post(u.path, to_httplib(headers), body, content_type);
    return from_result(res);
}

HttpsResponse https_get(const std::string& url, const HttpHeaders& headers, int timeout_sec) {
    auto u = parse_url(url);
    if (u.host.empty()) {
        HttpsResponse resp;
        resp.error = "invalid url: " + url;
        return resp;
    }
    httplib::Client cli(u.scheme + "://" + u.host + ":" + std::to_string(u.port));
    cli.set_connection_timeout(timeout_sec);
    cli.set_read_timeout(timeout_sec);
    cli.set_follow_location(true);

    auto res = cli.Get(u.path, to_httplib(headers));
    return from_result(res);
}

} // namespace termineer
