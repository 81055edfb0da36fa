#include "governance/WebhookNotifier.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <stdexcept>

size_t WebhookNotifier::notifyAll(int64_t transferId) {
  std::vector<Webhook> webhooks;
  try {
    webhooks = catalog_.listWebhooks();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::WEBHOOK, "WebhookNotifier::notifyAll",
                  "Could not list webhooks for transfer " +
                      std::to_string(transferId) + ": " +
                      std::string(e.what()));
    return 0;
  }

  size_t delivered = 0;
  for (const auto &webhook : webhooks) {
    if (notify(transferId, webhook))
      ++delivered;
  }
  return delivered;
}

bool WebhookNotifier::notify(int64_t transferId, const Webhook &webhook) {
  try {
    auto snapshot = catalog_.loadTransferSnapshot(transferId);
    if (!snapshot) {
      Logger::warning(LogCategory::WEBHOOK, "WebhookNotifier::notify",
                      "Transfer " + std::to_string(transferId) +
                          " not found, webhook " + std::to_string(webhook.id) +
                          " skipped");
      return false;
    }

    std::string body = buildPayload(*snapshot).dump();
    std::vector<std::string> headers = {
        "Content-Type: application/json",
        std::string(SIGNATURE_HEADER) + ": " + sign(webhook.secretKey, body)};

    HttpResponse response = http_.post(webhook.url, headers, body);
    if (response.status < 200 || response.status >= 300) {
      Logger::warning(LogCategory::WEBHOOK, "WebhookNotifier::notify",
                      "Webhook " + std::to_string(webhook.id) +
                          " returned status " +
                          std::to_string(response.status) + " for " +
                          webhook.url);
      return false;
    }

    Logger::info(LogCategory::WEBHOOK, "WebhookNotifier::notify",
                 "Delivered transfer " + std::to_string(transferId) + " to " +
                     webhook.url);
    return true;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::WEBHOOK, "WebhookNotifier::notify",
                  "Webhook " + std::to_string(webhook.id) + " to " +
                      webhook.url + " failed: " + std::string(e.what()));
    return false;
  }
}

json WebhookNotifier::buildPayload(const TransferSnapshot &snapshot) {
  json object;
  object["id"] = snapshot.transfer.id;
  object["status"] = transferStatusToString(snapshot.transfer.status);
  object["shareId"] = snapshot.transfer.shareId;

  if (snapshot.result) {
    json result;
    result["finalizedAt"] = TimeUtils::formatIso8601(snapshot.result->finalizedAt);
    if (snapshot.result->objectUrl)
      result["objectUrl"] = *snapshot.result->objectUrl;
    else
      result["objectUrl"] = nullptr;
    object["result"] = result;
  } else {
    object["result"] = nullptr;
  }

  json payload;
  payload["type"] = EVENT_TYPE;
  payload["object"] = object;
  return payload;
}

std::string WebhookNotifier::sign(const std::string &secretKey,
                                  const std::string &body) {
  unsigned char hmac[SHA256_DIGEST_LENGTH];
  unsigned int hmacLen = 0;
  if (!HMAC(EVP_sha256(), secretKey.data(), static_cast<int>(secretKey.size()),
            reinterpret_cast<const unsigned char *>(body.data()), body.size(),
            hmac, &hmacLen)) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }
  return StringUtils::toHex(hmac, hmacLen);
}
