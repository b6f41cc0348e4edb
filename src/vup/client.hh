// SPDX-License-Identifier: MIT
#ifndef VUP_CLIENT_HH_
#define VUP_CLIENT_HH_

#include <memory>
#include <string>

#include "absl/functional/any_invocable.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "vup/request.hh"
#include "vup/response.hh"

namespace vup {

constexpr std::string_view kDefaultIndexUrl =
    "https://vup-linux.github.io/vup/index.json";
constexpr std::string_view kDefaultTemplateUrl =
    "https://raw.githubusercontent.com/VUP-Linux/vup/main/vup/srcpkgs/"
    "{category}/{name}/template";

class Client {
 public:
  template <typename ResponseType>
  using ResponseCallback =
      absl::AnyInvocable<int(absl::StatusOr<ResponseType>) &&>;

  using IndexResponseCallback = ResponseCallback<IndexResponse>;
  using RawResponseCallback = ResponseCallback<RawResponse>;

  struct Options {
    Options();

    Options(const Options&) = default;
    Options& operator=(const Options&) = default;

    Options(Options&&) = default;
    Options& operator=(Options&&) = default;

    Options& set_index_url(std::string index_url) {
      this->index_url = std::move(index_url);
      return *this;
    }
    std::string index_url = std::string(kDefaultIndexUrl);

    Options& set_template_url(std::string template_url) {
      this->template_url = std::move(template_url);
      return *this;
    }
    std::string template_url = std::string(kDefaultTemplateUrl);

    Options& set_useragent(std::string useragent) {
      this->useragent = std::move(useragent);
      return *this;
    }
    std::string useragent;

    // Upper bound on a single transfer. Exceeding it fails the request.
    Options& set_timeout(absl::Duration timeout) {
      this->timeout = timeout;
      return *this;
    }
    absl::Duration timeout = absl::Seconds(60);
  };

  static std::unique_ptr<Client> New(Client::Options options = {});

  Client() = default;
  virtual ~Client() = default;

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  Client(Client&&) = default;
  Client& operator=(Client&&) = default;

  // Queue a fetch of the package index. A "304 Not Modified" reply is
  // delivered as a successful IndexResponse with not_modified set. A payload
  // which fails to decode is delivered as an error.
  virtual void QueueIndexRequest(const IndexRequest& request,
                                 IndexResponseCallback callback) = 0;

  // Queue a fetch of a package's build template.
  virtual void QueueTemplateRequest(const TemplateRequest& request,
                                    RawResponseCallback callback) = 0;

  // Wait for all pending requests to complete. Returns non-zero if any request
  // failed or was cancelled by a callback.
  virtual int Wait() = 0;
};

inline Client::Options::Options() = default;

}  // namespace vup

#endif  // VUP_CLIENT_HH_
