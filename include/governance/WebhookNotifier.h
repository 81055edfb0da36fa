#ifndef WEBHOOK_NOTIFIER_H
#define WEBHOOK_NOTIFIER_H

#include "catalog/catalog_store.h"
#include "governance/HttpClient.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Best-effort "transfer.finalized" delivery. Every failure is logged and
// swallowed; nothing is retried and transfer state is never touched.
class WebhookNotifier {
  ICatalogStore &catalog_;
  IHttpClient &http_;

public:
  static constexpr const char *SIGNATURE_HEADER = "X-ShareSync-Signature";
  static constexpr const char *EVENT_TYPE = "transfer.finalized";

  WebhookNotifier(ICatalogStore &catalog, IHttpClient &http)
      : catalog_(catalog), http_(http) {}

  // Returns the number of successful deliveries.
  size_t notifyAll(int64_t transferId);

  bool notify(int64_t transferId, const Webhook &webhook);

  static json buildPayload(const TransferSnapshot &snapshot);

  // hex(HMAC-SHA256(secretKey, body))
  static std::string sign(const std::string &secretKey,
                          const std::string &body);
};

#endif
