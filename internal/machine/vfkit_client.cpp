#include "vfkit_client.hpp"

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include <memory>
#include <mutex>

#include "internal/util/errors.hpp"

namespace berth::machine {

namespace {

constexpr char kStatePath[] = "/vm/state";

size_t AppendBody(char* data, size_t size, size_t count, void* user) {
  static_cast<std::string*>(user)->append(data, size * count);
  return size * count;
}

void GlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

VfkitClient::VfkitClient(const std::string& endpoint, std::chrono::milliseconds timeout) : endpoint_(endpoint), timeout_(timeout) {
  if (StartsWith(endpoint, "unix://") && endpoint.size() > 7) {
    socket_path_ = endpoint.substr(7);
    url_         = std::string("http://localhost") + kStatePath;
  } else if (StartsWith(endpoint, "tcp://")) {
    url_ = "http://" + endpoint.substr(6) + kStatePath;
  } else if (StartsWith(endpoint, "http://")) {
    url_ = endpoint + kStatePath;
  } else {
    throw util::Internal("unsupported vfkit endpoint \"" + endpoint + "\"");
  }
  GlobalInit();
}

std::optional<VfkitClient::Response> VfkitClient::Send(bool post, const std::string& body) const {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw util::Internal("vfkit: failed to initialize curl");
  }

  Response response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  if (!socket_path_.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, socket_path_.c_str());
  }

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
  if (post) {
    headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  }

  const CURLcode code = curl_easy_perform(curl.get());
  if (code == CURLE_COULDNT_CONNECT) {
    return std::nullopt;
  }
  if (code != CURLE_OK) {
    throw util::Internal("vfkit " + endpoint_ + ": " + curl_easy_strerror(code));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

std::optional<berth::machine::v1::VfkitState> VfkitClient::State() const {
  const auto response = Send(false, "");
  if (!response) {
    return std::nullopt;
  }
  if (response->status != 200) {
    throw util::Internal("vfkit " + endpoint_ + ": state request returned HTTP " + std::to_string(response->status));
  }

  berth::machine::v1::VfkitState                state;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status            = google::protobuf::util::JsonStringToMessage(response->body, &state, options);
  if (!status.ok()) {
    throw util::Internal("vfkit " + endpoint_ + ": invalid state response: " + std::string(status.message()));
  }
  return state;
}

void VfkitClient::ChangeState(const std::string& state) const {
  const auto response = Send(true, "{\"state\":\"" + state + "\"}");
  if (!response) {
    throw util::Internal("vfkit " + endpoint_ + ": not listening");
  }
  if (response->status < 200 || response->status >= 300) {
    throw util::Internal("vfkit " + endpoint_ + ": " + state + " returned HTTP " + std::to_string(response->status));
  }
}

} // namespace berth::machine
