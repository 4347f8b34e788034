#pragma once

#include <vinfer/core/batch_result.hpp>
#include <vinfer/net/http_client.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace vinfer::net {

struct CallbackOptions {
  /// HMAC key; empty disables signing (unsigned delivery, not an error).
  std::string shared_secret;
  /// Per-attempt POST timeout.
  std::chrono::milliseconds timeout{std::chrono::seconds(60)};
  /// Extra attempts after the first failure. 0 = at most one POST.
  int max_retries{0};
  /// Linear backoff: attempt n waits retry_backoff * n before retrying.
  std::chrono::milliseconds retry_backoff{1500};
  /// Decimal places for floats in the payload.
  int precision{5};
};

struct DeliveryOutcome {
  bool delivered{false};
  int attempts{0};
  /// Status of the last response, 0 if none was received.
  long http_status{0};
  /// Reason of the last failure; empty when delivered.
  std::string error;
};

/// Posts a BatchResult to a caller-supplied URL.
///
/// The payload is serialized once; the X-Signature header is computed over those
/// exact bytes. Transport errors and non-2xx responses count as failed attempts.
/// deliver() never throws for delivery problems; the outcome carries them.
class CallbackDispatcher {
 public:
  CallbackDispatcher(std::shared_ptr<IHttpClient> client, CallbackOptions options);

  [[nodiscard]] DeliveryOutcome deliver(const vinfer::core::BatchResult& batch,
                                        const std::string& callback_url) const;

  /// Build the signed POST without sending it.
  [[nodiscard]] HttpRequest build_request(const std::string& payload,
                                          const std::string& callback_url) const;

  [[nodiscard]] const CallbackOptions& options() const noexcept { return options_; }

 private:
  std::shared_ptr<IHttpClient> client_;
  CallbackOptions options_;
};

}  // namespace vinfer::net
