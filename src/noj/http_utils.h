#ifndef NOJ_HTTP_UTILS_H_
#define NOJ_HTTP_UTILS_H_

/// Log HTTP requests sent to workers

#include <string>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::MultipartFormDataItems&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);

// "http://host:port/" -> "http://host:port"
std::string TrimBaseUrl(std::string url);

} // namespace http_utils

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Get(endpoint.c_str(), std::forward<T>(params)...);
  }
};
struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint.c_str(), std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  auto res = Method()(cli, endpoint, std::forward<T>(params)...);
  if (res) {
    spdlog::trace("{} {} -> {} {}", Method::method_name, endpoint, res->status, res->body);
  } else {
    spdlog::debug("{} {} failed: {}", Method::method_name, endpoint, httplib::to_string(res.error()));
  }
  return res;
}

#endif  // NOJ_HTTP_UTILS_H_
