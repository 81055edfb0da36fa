#ifndef HTTP_CLIENT_H
#define HTTP_CLIENT_H

#include <string>
#include <vector>

struct HttpResponse {
  long status = 0;
  std::string body;
};

class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  // Throws std::runtime_error on transport failures (DNS, connect, TLS,
  // timeout). Any HTTP status, including errors, is returned.
  virtual HttpResponse post(const std::string &url,
                            const std::vector<std::string> &headers,
                            const std::string &body) = 0;
};

// One easy handle per request. curl_global_init must have run.
class CurlHttpClient : public IHttpClient {
  long timeoutSeconds_;

public:
  explicit CurlHttpClient(long timeoutSeconds = 10)
      : timeoutSeconds_(timeoutSeconds) {}

  HttpResponse post(const std::string &url,
                    const std::vector<std::string> &headers,
                    const std::string &body) override;
};

#endif
