#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "exchange/exchange_client.h"

namespace exchange {

class BinanceFuturesClientTestPeer;

// Maps a Binance order status string onto the client-side lifecycle.
OrderStatus mapOrderStatus(const std::string& exchange_status);

// BinanceFuturesClient talks to the USD-M futures REST API. Signed endpoints
// carry an HMAC-SHA256 signature of the query string; the HTTP transport can be
// replaced (tests script responses through it). Read-only requests are retried
// with exponential backoff, order placement and cancellation never are.
class BinanceFuturesClient : public ExchangeClient {
 public:
  struct HttpRequest {
    std::string method;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
  };

  struct HttpResponse {
    long status = 0;
    std::string body;
  };

  using HttpFunction = std::function<HttpResponse(const HttpRequest& request)>;
  using EpochMillisFunction = std::function<long long()>;

  // Throws common::ConnectionError when either credential is empty.
  BinanceFuturesClient(std::string base_url,
                       std::string api_key,
                       std::string api_secret,
                       long recv_window_ms = 5000,
                       HttpFunction http = {});
  ~BinanceFuturesClient() override;

  BinanceFuturesClient(const BinanceFuturesClient&) = delete;
  BinanceFuturesClient& operator=(const BinanceFuturesClient&) = delete;
  BinanceFuturesClient(BinanceFuturesClient&&) = delete;
  BinanceFuturesClient& operator=(BinanceFuturesClient&&) = delete;

  void ping() override;

  std::optional<SymbolFilters> getSymbolFilters(const std::string& symbol) override;
  double getCurrentPrice(const std::string& symbol) override;

  OrderAck submitOrder(const OrderIntent& intent) override;
  OrderStatus getOrderStatus(const std::string& symbol, const std::string& order_id) override;
  void cancelOrder(const std::string& symbol, const std::string& order_id) override;

  AccountInfo getAccountInfo() override;
  std::vector<PositionInfo> getOpenPositions(const std::optional<std::string>& symbol) override;
  std::vector<OpenOrder> getOpenOrders(const std::optional<std::string>& symbol) override;

  void setRetryPolicy(std::size_t max_attempts, std::chrono::milliseconds initial_backoff);

  // Overrides the timestamp used for request signing.
  void setClock(EpochMillisFunction clock);

  // Hex encoded HMAC-SHA256 of |payload| keyed with |secret|.
  static std::string sign(const std::string& secret, const std::string& payload);

  // Decimal rendering accepted by the exchange (no exponent, at most 8 places).
  static std::string formatDecimal(double value);

 private:
  friend class BinanceFuturesClientTestPeer;

  using QueryParams = std::vector<std::pair<std::string, std::string>>;

  nlohmann::json publicGet(const std::string& path, const QueryParams& params,
                           const std::string& context) const;
  nlohmann::json signedRequest(const std::string& method,
                               const std::string& path,
                               QueryParams params,
                               const std::string& context,
                               bool retryable) const;
  nlohmann::json execute(const HttpRequest& request, const std::string& context, bool retryable) const;
  nlohmann::json executeOnce(const HttpRequest& request, const std::string& context) const;

  std::string buildQuery(const QueryParams& params) const;
  std::string buildUrl(const std::string& path, const std::string& query) const;
  static std::string encodeQueryParam(const std::string& value);

  HttpResponse performCurl(const HttpRequest& request) const;
  static size_t curlWriteCallback(void* contents, size_t size, size_t nmemb, void* userp);

  std::string base_url_;
  std::string api_key_;
  std::string api_secret_;
  long recv_window_ms_;

  HttpFunction http_;
  EpochMillisFunction clock_;

  std::atomic<std::size_t> max_attempts_{3};
  std::atomic<long long> retry_backoff_ms_{200};

  bool curl_initialized_ = false;
};

}  // namespace exchange
