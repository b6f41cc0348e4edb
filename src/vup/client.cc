// SPDX-License-Identifier: MIT
#include "vup/client.hh"

#include <curl/curl.h>
#include <systemd/sd-event.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string_view>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"

namespace vup {

class ClientImpl : public Client {
 public:
  explicit ClientImpl(Client::Options options = Options());
  ~ClientImpl() override;

  ClientImpl(const ClientImpl&) = delete;
  ClientImpl& operator=(const ClientImpl&) = delete;

  ClientImpl(ClientImpl&&) = default;
  ClientImpl& operator=(ClientImpl&&) = default;

  void QueueIndexRequest(const IndexRequest& request,
                         IndexResponseCallback callback) override;

  void QueueTemplateRequest(const TemplateRequest& request,
                            RawResponseCallback callback) override;

  // Wait for all pending requests to complete. Returns non-zero if any request
  // failed or was cancelled by a callback.
  int Wait() override;

 private:
  using ActiveRequests = absl::flat_hash_set<CURL*>;

  template <typename ResponseHandlerType>
  void QueueHttpRequest(const Request& request, std::string_view baseurl,
                        curl_slist* headers,
                        typename ResponseHandlerType::CallbackType callback);

  int FinishRequest(CURL* curl, CURLcode result, bool dispatch_callback);

  int CheckFinished();
  void CancelAll();

  enum class DebugLevel {
    // No debugging.
    NONE,

    // Enable Curl's verbose output to stderr
    VERBOSE_STDERR,

    // Enable Curl debug handler, write outbound requests made to a file
    REQUESTS,
  };

  static int SocketCallback(CURLM* curl, curl_socket_t s, int action,
                            void* userdata, void* socketptr);
  int DispatchSocketCallback(curl_socket_t s, int action, sd_event_source* io);

  static int TimerCallback(CURLM* curl, long timeout_ms, void* userdata);
  int DispatchTimerCallback(long timeout_ms);

  static int OnCurlIO(sd_event_source* s, int fd, uint32_t revents,
                      void* userdata);
  static int OnCurlTimer(sd_event_source* s, uint64_t usec, void* userdata);
  static int OnCancel(sd_event_source* s, void* userdata);

  Options options_;

  CURLM* curl_multi_;
  ActiveRequests active_requests_;

  sd_event* event_ = nullptr;
  sd_event_source* timer_ = nullptr;
  sd_event_source* cancel_ = nullptr;
  bool cancelled_ = false;

  DebugLevel debug_level_ = DebugLevel::NONE;
  std::ofstream debug_stream_;
};

namespace {

std::string_view GetEnv(const char* name) {
  const auto* value = getenv(name);
  return value ? std::string_view(value) : std::string_view();
}

absl::Status StatusFromHttpCode(long http_status) {
  // Most statuses don't need to be specially handled, but some should be
  // classified and/or given a more descriptive message.
  switch (http_status) {
    case 200:
    case 304:
      return absl::OkStatus();
    case 404:
      // Let clients distinguish a missing template from other failures.
      return absl::NotFoundError("Not Found");
    case 429:
      return absl::ResourceExhaustedError(
          "Too many requests: the server has throttled your IP.");
  }

  return absl::InternalError(absl::StrCat("HTTP ", http_status));
}

class ResponseHandler {
 public:
  ResponseHandler() = default;
  virtual ~ResponseHandler() { curl_slist_free_all(headers); }

  ResponseHandler(const ResponseHandler&) = delete;
  ResponseHandler& operator=(const ResponseHandler&) = delete;

  ResponseHandler(ResponseHandler&&) = default;
  ResponseHandler& operator=(ResponseHandler&&) = default;

  static size_t BodyCallback(char* ptr, size_t size, size_t nmemb,
                             void* userdata) {
    auto* handler = static_cast<ResponseHandler*>(userdata);

    handler->body.append(ptr, size * nmemb);
    return size * nmemb;
  }

  static size_t HeaderCallback(char* ptr, size_t size, size_t nmemb,
                               void* userdata) {
    auto* handler = static_cast<ResponseHandler*>(userdata);

    std::string_view line(ptr, size * nmemb);
    const auto colon = line.find(':');
    if (colon != line.npos &&
        absl::EqualsIgnoreCase(line.substr(0, colon), "etag")) {
      handler->etag =
          std::string(absl::StripAsciiWhitespace(line.substr(colon + 1)));
    }

    return size * nmemb;
  }

  static int DebugCallback(CURL*, curl_infotype type, char* data, size_t size,
                           void* userdata) {
    auto* stream = static_cast<std::ofstream*>(userdata);

    if (type != CURLINFO_HEADER_OUT) {
      return 0;
    }

    stream->write(data, size);
    return 0;
  }

  int Finalize(absl::Status status) {
    int r = RunCallback(std::move(status));
    delete this;
    return r;
  }

  std::string body;
  std::string etag;
  long http_status = 0;
  curl_slist* headers = nullptr;
  std::array<char, CURL_ERROR_SIZE> error_buffer = {};

 private:
  virtual int RunCallback(absl::Status status) = 0;
};

template <typename ResponseT>
class TypedResponseHandler : public ResponseHandler {
 public:
  using CallbackType = Client::ResponseCallback<ResponseT>;

  explicit TypedResponseHandler(CallbackType callback)
      : callback_(std::move(callback)) {}

 protected:
  int RunCallback(absl::Status status) override {
    if (!status.ok()) {
      return std::move(callback_)(std::move(status));
    }

    return std::move(callback_)(ResponseT::Parse(std::move(body)));
  }

  CallbackType callback_;
};

class IndexResponseHandler : public TypedResponseHandler<IndexResponse> {
 public:
  using TypedResponseHandler<IndexResponse>::TypedResponseHandler;

 protected:
  int RunCallback(absl::Status status) override {
    if (!status.ok()) {
      // Error pages are not index payloads, don't try to decode them.
      body.clear();
      return std::move(callback_)(std::move(status));
    }

    if (http_status == 304) {
      return std::move(callback_)(IndexResponse::NotModified());
    }

    auto response = IndexResponse::Parse(std::move(body));
    if (response.ok()) {
      response->etag = std::move(etag);
    }

    return std::move(callback_)(std::move(response));
  }
};

using RawResponseHandler = TypedResponseHandler<RawResponse>;

}  // namespace

ClientImpl::ClientImpl(Options options) : options_(std::move(options)) {
  curl_global_init(CURL_GLOBAL_SSL);
  curl_multi_ = curl_multi_init();

  curl_multi_setopt(curl_multi_, CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
  curl_multi_setopt(curl_multi_, CURLMOPT_MAX_TOTAL_CONNECTIONS, 5L);

  curl_multi_setopt(curl_multi_, CURLMOPT_SOCKETFUNCTION,
                    &ClientImpl::SocketCallback);
  curl_multi_setopt(curl_multi_, CURLMOPT_SOCKETDATA, this);

  curl_multi_setopt(curl_multi_, CURLMOPT_TIMERFUNCTION,
                    &ClientImpl::TimerCallback);
  curl_multi_setopt(curl_multi_, CURLMOPT_TIMERDATA, this);

  sd_event_default(&event_);

  std::string_view debug = GetEnv("VURU_DEBUG");
  if (absl::ConsumePrefix(&debug, "requests:")) {
    debug_level_ = DebugLevel::REQUESTS;
    debug_stream_.open(std::string(debug), std::ofstream::trunc);
  } else if (!debug.empty()) {
    debug_level_ = DebugLevel::VERBOSE_STDERR;
  }
}

ClientImpl::~ClientImpl() {
  while (!active_requests_.empty()) {
    FinishRequest(*active_requests_.begin(), CURLE_ABORTED_BY_CALLBACK,
                  /*dispatch_callback=*/false);
  }

  curl_multi_cleanup(curl_multi_);
  curl_global_cleanup();

  sd_event_source_unref(cancel_);
  sd_event_source_unref(timer_);
  sd_event_unref(event_);

  if (debug_stream_.is_open()) {
    debug_stream_.close();
  }
}

// static
int ClientImpl::OnCancel(sd_event_source*, void* userdata) {
  auto* client = static_cast<ClientImpl*>(userdata);

  while (!client->active_requests_.empty()) {
    client->FinishRequest(*client->active_requests_.begin(),
                          CURLE_ABORTED_BY_CALLBACK,
                          /*dispatch_callback=*/false);
  }

  return 0;
}

void ClientImpl::CancelAll() {
  if (cancelled_) {
    return;
  }

  cancelled_ = true;

  cancel_ = sd_event_source_unref(cancel_);
  sd_event_add_defer(event_, &cancel_, &ClientImpl::OnCancel, this);
}

// static
int ClientImpl::SocketCallback(CURLM*, curl_socket_t s, int action,
                               void* userdata, void* sockptr) {
  auto* client = static_cast<ClientImpl*>(userdata);
  auto* io = static_cast<sd_event_source*>(sockptr);
  return client->DispatchSocketCallback(s, action, io);
}

int ClientImpl::DispatchSocketCallback(curl_socket_t s, int action,
                                       sd_event_source* io) {
  if (action == CURL_POLL_REMOVE) {
    sd_event_source_unref(io);
    return 0;
  }

  uint32_t events = 0;
  if (action & CURL_POLL_IN) {
    events |= EPOLLIN;
  }
  if (action & CURL_POLL_OUT) {
    events |= EPOLLOUT;
  }

  if (io != nullptr) {
    if (sd_event_source_set_io_events(io, events) < 0) {
      return -1;
    }

    if (sd_event_source_set_enabled(io, SD_EVENT_ON) < 0) {
      return -1;
    }
  } else {
    if (sd_event_add_io(event_, &io, s, events, &ClientImpl::OnCurlIO, this) <
        0) {
      return -1;
    }

    if (curl_multi_assign(curl_multi_, s, io) != CURLM_OK) {
      return -1;
    }
  }

  return 0;
}

// static
int ClientImpl::OnCurlIO(sd_event_source*, int fd, uint32_t revents,
                         void* userdata) {
  auto* client = static_cast<ClientImpl*>(userdata);

  int action = 0;
  if (revents & EPOLLIN) {
    action |= CURL_CSELECT_IN;
  }
  if (revents & EPOLLOUT) {
    action |= CURL_CSELECT_OUT;
  }

  int unused;
  if (curl_multi_socket_action(client->curl_multi_, fd, action, &unused) !=
      CURLM_OK) {
    return -EINVAL;
  }

  return client->CheckFinished();
}

// static
int ClientImpl::OnCurlTimer(sd_event_source*, uint64_t, void* userdata) {
  auto* client = static_cast<ClientImpl*>(userdata);

  int unused;
  if (curl_multi_socket_action(client->curl_multi_, CURL_SOCKET_TIMEOUT, 0,
                               &unused) != CURLM_OK) {
    return -EINVAL;
  }

  return client->CheckFinished();
}

// static
int ClientImpl::TimerCallback(CURLM*, long timeout_ms, void* userdata) {
  auto* client = static_cast<ClientImpl*>(userdata);
  return client->DispatchTimerCallback(timeout_ms);
}

int ClientImpl::DispatchTimerCallback(long timeout_ms) {
  if (timeout_ms < 0) {
    if (timer_ != nullptr &&
        sd_event_source_set_enabled(timer_, SD_EVENT_OFF) < 0) {
      return -1;
    }

    return 0;
  }

  uint64_t usec =
      absl::ToUnixMicros(absl::Now() + absl::Milliseconds(timeout_ms));

  if (timer_ != nullptr) {
    if (sd_event_source_set_time(timer_, usec) < 0) {
      return -1;
    }

    if (sd_event_source_set_enabled(timer_, SD_EVENT_ONESHOT) < 0) {
      return -1;
    }
  } else {
    if (sd_event_add_time(event_, &timer_, CLOCK_REALTIME, usec, 0,
                          &ClientImpl::OnCurlTimer, this) < 0) {
      return -1;
    }
  }

  return 0;
}

int ClientImpl::FinishRequest(CURL* curl, CURLcode result,
                              bool dispatch_callback) {
  ResponseHandler* handler;
  curl_easy_getinfo(curl, CURLINFO_PRIVATE, &handler);

  absl::Status status;
  if (result == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &handler->http_status);
    status = StatusFromHttpCode(handler->http_status);
  } else {
    status = absl::UnavailableError(handler->error_buffer[0] != '\0'
                                        ? handler->error_buffer.data()
                                        : curl_easy_strerror(result));
  }

  // Release the transfer before running the callback: the handler owns the
  // header list curl still points at.
  active_requests_.erase(curl);
  curl_multi_remove_handle(curl_multi_, curl);
  curl_easy_cleanup(curl);

  if (!dispatch_callback) {
    delete handler;
    return 0;
  }

  return handler->Finalize(std::move(status));
}

int ClientImpl::CheckFinished() {
  int unused;

  int r = 0;
  while (true) {
    auto* msg = curl_multi_info_read(curl_multi_, &unused);
    if (msg == nullptr || msg->msg != CURLMSG_DONE) {
      break;
    }

    r = FinishRequest(msg->easy_handle, msg->data.result,
                      /* dispatch_callback = */ true);
    if (r < 0) {
      CancelAll();
      break;
    }
  }

  return r;
}

int ClientImpl::Wait() {
  cancelled_ = false;

  while (!active_requests_.empty()) {
    if (sd_event_run(event_, 10000) < 0) {
      return -EIO;
    }
  }

  return cancelled_ ? -ECANCELED : 0;
}

template <typename ResponseHandlerType>
void ClientImpl::QueueHttpRequest(
    const Request& request, std::string_view baseurl, curl_slist* headers,
    typename ResponseHandlerType::CallbackType callback) {
  auto* curl = curl_easy_init();
  auto* handler = new ResponseHandlerType(std::move(callback));
  handler->headers = headers;

  using RH = ResponseHandler;
  curl_easy_setopt(curl, CURLOPT_URL, request.Url(baseurl).c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                   static_cast<long>(absl::ToInt64Seconds(options_.timeout)));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.useragent.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &RH::BodyCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, handler);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &RH::HeaderCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, handler);
  curl_easy_setopt(curl, CURLOPT_PRIVATE, handler);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, handler->error_buffer.data());

  if (handler->headers != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, handler->headers);
  }

  switch (debug_level_) {
    case DebugLevel::NONE:
      break;
    case DebugLevel::REQUESTS:
      curl_easy_setopt(curl, CURLOPT_DEBUGFUNCTION,
                       &ResponseHandler::DebugCallback);
      curl_easy_setopt(curl, CURLOPT_DEBUGDATA, &debug_stream_);
      [[fallthrough]];
    case DebugLevel::VERBOSE_STDERR:
      curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
      break;
  }

  curl_multi_add_handle(curl_multi_, curl);
  active_requests_.emplace(curl);
}

void ClientImpl::QueueIndexRequest(const IndexRequest& request,
                                   IndexResponseCallback callback) {
  curl_slist* headers = nullptr;
  if (request.if_none_match().has_value()) {
    headers = curl_slist_append(
        headers,
        absl::StrCat("If-None-Match: ", *request.if_none_match()).c_str());
  }

  QueueHttpRequest<IndexResponseHandler>(request, options_.index_url, headers,
                                         std::move(callback));
}

void ClientImpl::QueueTemplateRequest(const TemplateRequest& request,
                                      RawResponseCallback callback) {
  QueueHttpRequest<RawResponseHandler>(request, options_.template_url,
                                       /*headers=*/nullptr,
                                       std::move(callback));
}

std::unique_ptr<Client> Client::New(Client::Options options) {
  return std::make_unique<ClientImpl>(std::move(options));
}

}  // namespace vup

/* vim: set et ts=2 sw=2: */
