// SPDX-License-Identifier: MIT
#ifndef VUP_REQUEST_HH_
#define VUP_REQUEST_HH_

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace vup {

// Abstract class describing a request for a resource.
class Request {
 public:
  virtual ~Request() = default;

  virtual std::string Url(std::string_view baseurl) const = 0;
};

// A GET request for the package index. The baseurl is the full location of
// the index document. If an entity tag from an earlier fetch is supplied, the
// request is made conditional on the index having changed since.
class IndexRequest : public Request {
 public:
  IndexRequest() = default;
  explicit IndexRequest(std::optional<std::string> if_none_match)
      : if_none_match_(std::move(if_none_match)) {}

  IndexRequest(const IndexRequest&) = delete;
  IndexRequest& operator=(const IndexRequest&) = delete;

  IndexRequest(IndexRequest&&) = default;
  IndexRequest& operator=(IndexRequest&&) = default;

  const std::optional<std::string>& if_none_match() const {
    return if_none_match_;
  }

  std::string Url(std::string_view baseurl) const override {
    return std::string(baseurl);
  }

 private:
  std::optional<std::string> if_none_match_;
};

// A GET request for the build template of a single package. The baseurl is a
// URL template in which "{category}" and "{name}" are substituted.
class TemplateRequest : public Request {
 public:
  TemplateRequest(std::string category, std::string pkgname)
      : category_(std::move(category)), pkgname_(std::move(pkgname)) {}

  TemplateRequest(const TemplateRequest&) = delete;
  TemplateRequest& operator=(const TemplateRequest&) = delete;

  TemplateRequest(TemplateRequest&&) = default;
  TemplateRequest& operator=(TemplateRequest&&) = default;

  const std::string& category() const { return category_; }
  const std::string& pkgname() const { return pkgname_; }

  std::string Url(std::string_view url_template) const override;

 private:
  std::string category_;
  std::string pkgname_;
};

}  // namespace vup

#endif  // VUP_REQUEST_HH_
