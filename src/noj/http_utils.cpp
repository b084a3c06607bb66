#include "http_utils.h"

#include <fmt/format.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  return str;
}
std::string FormatOneParam(const httplib::MultipartFormDataItems& items) {
  std::string ret = "{";
  for (auto& item : items) {
    if (ret.size() > 1) ret += ", ";
    // file contents and credentials are not logged
    if (item.name == "token") {
      ret += fmt::format("{}: <hidden>", item.name);
    } else if (item.filename.size()) {
      ret += fmt::format("{}: <{} bytes>", item.name, item.content.size());
    } else {
      ret += fmt::format("{}: {}", item.name, item.content);
    }
  }
  return ret + "}";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

std::string TrimBaseUrl(std::string url) {
  while (url.size() && url.back() == '/') url.pop_back();
  return url;
}

} // namespace http_utils
