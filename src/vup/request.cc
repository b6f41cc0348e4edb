// SPDX-License-Identifier: MIT
#include "vup/request.hh"

#include <curl/curl.h>

#include "absl/strings/str_replace.h"

namespace vup {

namespace {

std::string UrlEscape(const std::string_view sv) {
  char* ptr = curl_easy_escape(nullptr, sv.data(), sv.size());
  std::string escaped(ptr);
  curl_free(ptr);

  return escaped;
}

}  // namespace

std::string TemplateRequest::Url(std::string_view url_template) const {
  return absl::StrReplaceAll(url_template,
                             {
                                 {"{category}", UrlEscape(category_)},
                                 {"{name}", UrlEscape(pkgname_)},
                             });
}

}  // namespace vup
