#include "exchange/binance_client.h"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "common/errors.h"
#include "common/logging.h"

namespace exchange {
namespace {
constexpr const char* kPingPath = "/fapi/v1/ping";
constexpr const char* kExchangeInfoPath = "/fapi/v1/exchangeInfo";
constexpr const char* kTickerPricePath = "/fapi/v1/ticker/price";
constexpr const char* kOrderPath = "/fapi/v1/order";
constexpr const char* kOpenOrdersPath = "/fapi/v1/openOrders";
constexpr const char* kAccountPath = "/fapi/v2/account";
constexpr const char* kPositionRiskPath = "/fapi/v2/positionRisk";

nlohmann::json parseJsonOrThrow(const std::string& payload, const std::string& context) {
  try {
    if (payload.empty()) {
      return nlohmann::json::object();
    }
    return nlohmann::json::parse(payload);
  } catch (const nlohmann::json::exception& ex) {
    const std::string snippet = payload.size() > 256 ? payload.substr(0, 256) + "..." : payload;
    throw ExchangeError("Failed to parse " + context + " response: " + std::string(ex.what()) +
                        " (payload snippet: " + snippet + ")");
  }
}

std::string normalizeBaseUrl(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

std::string toUpper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

// Binance encodes most decimals as strings; accept both representations.
double numberField(const nlohmann::json& json, const char* key, double fallback = 0.0) {
  const auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return fallback;
  }
  if (it->is_number()) {
    return it->get<double>();
  }
  if (it->is_string()) {
    const std::string& text = it->get_ref<const std::string&>();
    if (text.empty()) {
      return fallback;
    }
    try {
      return std::stod(text);
    } catch (const std::exception&) {
      throw ExchangeError(std::string("Malformed numeric field '") + key + "': " + text);
    }
  }
  return fallback;
}

std::string idField(const nlohmann::json& json, const char* key) {
  const auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<long long>());
  }
  return it->dump();
}

long long systemEpochMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool isRetryable(const ExchangeError& error) {
  return error.httpStatus() == 0 || error.httpStatus() == 429 || error.httpStatus() >= 500;
}
}  // namespace

OrderStatus mapOrderStatus(const std::string& exchange_status) {
  const std::string status = toUpper(exchange_status);
  if (status == "NEW" || status == "PARTIALLY_FILLED") {
    return OrderStatus::Placed;
  }
  if (status == "FILLED") {
    return OrderStatus::Filled;
  }
  if (status == "CANCELED" || status == "EXPIRED" || status == "EXPIRED_IN_MATCH") {
    return OrderStatus::Canceled;
  }
  if (status == "REJECTED") {
    return OrderStatus::Failed;
  }
  return OrderStatus::Pending;
}

BinanceFuturesClient::BinanceFuturesClient(std::string base_url,
                                           std::string api_key,
                                           std::string api_secret,
                                           long recv_window_ms,
                                           HttpFunction http)
    : base_url_(normalizeBaseUrl(std::move(base_url))),
      api_key_(std::move(api_key)),
      api_secret_(std::move(api_secret)),
      recv_window_ms_(recv_window_ms),
      http_(std::move(http)),
      clock_(&systemEpochMillis) {
  if (api_key_.empty() || api_secret_.empty()) {
    throw common::ConnectionError("Binance API credentials are missing (BINANCE_API_KEY / BINANCE_SECRET_KEY)");
  }

  if (!http_) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != 0) {
      throw common::ConnectionError("Failed to initialize cURL");
    }
    curl_initialized_ = true;
  }
}

BinanceFuturesClient::~BinanceFuturesClient() {
  if (curl_initialized_) {
    curl_global_cleanup();
    curl_initialized_ = false;
  }
}

void BinanceFuturesClient::setRetryPolicy(std::size_t max_attempts,
                                          std::chrono::milliseconds initial_backoff) {
  max_attempts_.store(std::max<std::size_t>(1, max_attempts));
  retry_backoff_ms_.store(initial_backoff.count());
}

void BinanceFuturesClient::setClock(EpochMillisFunction clock) {
  clock_ = clock ? std::move(clock) : EpochMillisFunction(&systemEpochMillis);
}

void BinanceFuturesClient::ping() {
  publicGet(kPingPath, {}, "ping");
}

std::optional<SymbolFilters> BinanceFuturesClient::getSymbolFilters(const std::string& symbol) {
  const nlohmann::json info = publicGet(kExchangeInfoPath, {}, "exchange info");
  const std::string wanted = toUpper(symbol);

  const auto symbols = info.find("symbols");
  if (symbols == info.end() || !symbols->is_array()) {
    throw ExchangeError("Exchange info response does not list symbols");
  }

  for (const auto& entry : *symbols) {
    if (entry.value("symbol", "") != wanted) {
      continue;
    }

    SymbolFilters filters;
    filters.symbol = wanted;
    filters.trading = entry.value("status", "") == "TRADING";

    const auto filter_list = entry.find("filters");
    if (filter_list != entry.end() && filter_list->is_array()) {
      for (const auto& filter : *filter_list) {
        const std::string type = filter.value("filterType", "");
        if (type == "PRICE_FILTER") {
          filters.tickSize = numberField(filter, "tickSize");
        } else if (type == "LOT_SIZE") {
          filters.stepSize = numberField(filter, "stepSize");
          filters.minQty = numberField(filter, "minQty");
          filters.maxQty = numberField(filter, "maxQty");
        } else if (type == "MIN_NOTIONAL") {
          filters.minNotional = numberField(filter, "notional", numberField(filter, "minNotional"));
        }
      }
    }
    return filters;
  }

  return std::nullopt;
}

double BinanceFuturesClient::getCurrentPrice(const std::string& symbol) {
  const nlohmann::json ticker = publicGet(kTickerPricePath, {{"symbol", toUpper(symbol)}}, "ticker price");
  const double price = numberField(ticker, "price");
  if (price <= 0.0) {
    throw ExchangeError("Ticker price for " + toUpper(symbol) + " is missing or non-positive");
  }
  return price;
}

OrderAck BinanceFuturesClient::submitOrder(const OrderIntent& intent) {
  QueryParams params = {
      {"symbol", toUpper(intent.symbol)},
      {"side", toString(intent.side)},
      {"type", toString(intent.kind)},
      {"quantity", formatDecimal(intent.quantity)},
  };
  if (intent.price) {
    params.emplace_back("price", formatDecimal(*intent.price));
  }
  if (intent.stopPrice) {
    params.emplace_back("stopPrice", formatDecimal(*intent.stopPrice));
  }
  if (intent.timeInForce) {
    params.emplace_back("timeInForce", toString(*intent.timeInForce));
  }
  if (intent.reduceOnly) {
    params.emplace_back("reduceOnly", "true");
  }
  params.emplace_back("newOrderRespType", "RESULT");

  const nlohmann::json response = signedRequest("POST", kOrderPath, std::move(params), "order placement", false);

  OrderAck ack;
  ack.orderId = idField(response, "orderId");
  if (ack.orderId.empty()) {
    throw ExchangeError("Order placement response carried no orderId");
  }
  ack.status = mapOrderStatus(response.value("status", "NEW"));
  ack.executedQty = numberField(response, "executedQty");
  ack.averagePrice = numberField(response, "avgPrice");
  ack.price = numberField(response, "price");
  return ack;
}

OrderStatus BinanceFuturesClient::getOrderStatus(const std::string& symbol, const std::string& order_id) {
  const nlohmann::json response = signedRequest(
      "GET", kOrderPath, {{"symbol", toUpper(symbol)}, {"orderId", order_id}}, "order query", true);
  return mapOrderStatus(response.value("status", ""));
}

void BinanceFuturesClient::cancelOrder(const std::string& symbol, const std::string& order_id) {
  signedRequest("DELETE", kOrderPath, {{"symbol", toUpper(symbol)}, {"orderId", order_id}}, "order cancel",
                false);
}

AccountInfo BinanceFuturesClient::getAccountInfo() {
  const nlohmann::json response = signedRequest("GET", kAccountPath, {}, "account", true);
  AccountInfo info;
  info.totalWalletBalance = numberField(response, "totalWalletBalance");
  info.availableBalance = numberField(response, "availableBalance");
  info.totalUnrealizedProfit = numberField(response, "totalUnrealizedProfit");
  info.totalMarginBalance = numberField(response, "totalMarginBalance");
  return info;
}

std::vector<PositionInfo> BinanceFuturesClient::getOpenPositions(const std::optional<std::string>& symbol) {
  QueryParams params;
  if (symbol) {
    params.emplace_back("symbol", toUpper(*symbol));
  }
  const nlohmann::json response = signedRequest("GET", kPositionRiskPath, std::move(params), "position risk", true);

  std::vector<PositionInfo> positions;
  if (!response.is_array()) {
    return positions;
  }
  for (const auto& entry : response) {
    PositionInfo position;
    position.symbol = entry.value("symbol", "");
    position.positionSide = entry.value("positionSide", "BOTH");
    position.positionAmt = numberField(entry, "positionAmt");
    position.entryPrice = numberField(entry, "entryPrice");
    position.unrealizedProfit = numberField(entry, "unRealizedProfit");
    position.leverage = numberField(entry, "leverage");
    if (position.positionAmt != 0.0) {
      positions.push_back(std::move(position));
    }
  }
  return positions;
}

std::vector<OpenOrder> BinanceFuturesClient::getOpenOrders(const std::optional<std::string>& symbol) {
  QueryParams params;
  if (symbol) {
    params.emplace_back("symbol", toUpper(*symbol));
  }
  const nlohmann::json response = signedRequest("GET", kOpenOrdersPath, std::move(params), "open orders", true);

  std::vector<OpenOrder> orders;
  if (!response.is_array()) {
    return orders;
  }
  orders.reserve(response.size());
  for (const auto& entry : response) {
    OpenOrder order;
    order.orderId = idField(entry, "orderId");
    order.symbol = entry.value("symbol", "");
    order.side = entry.value("side", "");
    order.type = entry.value("type", "");
    order.status = entry.value("status", "");
    order.origQty = numberField(entry, "origQty");
    order.price = numberField(entry, "price");
    order.stopPrice = numberField(entry, "stopPrice");
    orders.push_back(std::move(order));
  }
  return orders;
}

std::string BinanceFuturesClient::sign(const std::string& secret, const std::string& payload) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
           reinterpret_cast<const unsigned char*>(payload.data()), payload.size(), digest,
           &digest_len) == nullptr) {
    throw std::runtime_error("Unable to compute HMAC-SHA256 request signature");
  }

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_len; ++i) {
    oss << std::setw(2) << static_cast<int>(digest[i]);
  }
  return oss.str();
}

std::string BinanceFuturesClient::formatDecimal(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(8) << value;
  std::string text = oss.str();
  const auto dot = text.find('.');
  if (dot != std::string::npos) {
    while (!text.empty() && text.back() == '0') {
      text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
      text.pop_back();
    }
  }
  if (text == "-0") {
    text = "0";
  }
  return text;
}

nlohmann::json BinanceFuturesClient::publicGet(const std::string& path,
                                               const QueryParams& params,
                                               const std::string& context) const {
  HttpRequest request;
  request.method = "GET";
  request.url = buildUrl(path, buildQuery(params));
  return execute(request, context, true);
}

nlohmann::json BinanceFuturesClient::signedRequest(const std::string& method,
                                                   const std::string& path,
                                                   QueryParams params,
                                                   const std::string& context,
                                                   bool retryable) const {
  params.emplace_back("recvWindow", std::to_string(recv_window_ms_));
  params.emplace_back("timestamp", std::to_string(clock_()));
  const std::string query = buildQuery(params);
  const std::string signed_query = query + "&signature=" + sign(api_secret_, query);

  HttpRequest request;
  request.method = method;
  request.url = buildUrl(path, signed_query);
  request.headers.emplace_back("X-MBX-APIKEY", api_key_);
  return execute(request, context, retryable);
}

nlohmann::json BinanceFuturesClient::execute(const HttpRequest& request,
                                             const std::string& context,
                                             bool retryable) const {
  const std::size_t attempts = retryable ? max_attempts_.load() : 1;
  auto backoff = std::chrono::milliseconds(retry_backoff_ms_.load());

  for (std::size_t attempt = 1;; ++attempt) {
    try {
      return executeOnce(request, context);
    } catch (const ExchangeError& ex) {
      if (attempt >= attempts || !isRetryable(ex)) {
        throw;
      }
      LOG_WARN("Binance " + context + " attempt " + std::to_string(attempt) + " failed, retrying: " + ex.what());
    }
    if (backoff.count() > 0) {
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }
}

nlohmann::json BinanceFuturesClient::executeOnce(const HttpRequest& request, const std::string& context) const {
  const HttpResponse response = http_ ? http_(request) : performCurl(request);
  nlohmann::json json;
  try {
    json = parseJsonOrThrow(response.body, context);
  } catch (const ExchangeError&) {
    if (response.status < 400) {
      throw;
    }
    json = nlohmann::json::object();
  }

  int api_code = 0;
  std::string message;
  if (json.is_object() && json.contains("code") && json["code"].is_number_integer()) {
    api_code = json["code"].get<int>();
    message = json.value("msg", "");
  }

  if (response.status >= 400 || api_code < 0) {
    std::string text = "Binance " + context + " failed";
    if (response.status > 0) {
      text += " (HTTP " + std::to_string(response.status) + ")";
    }
    if (api_code != 0) {
      text += " [" + std::to_string(api_code) + "] " + message;
    } else if (!response.body.empty()) {
      text += ": " + response.body.substr(0, 256);
    }
    throw ExchangeError(text, response.status, api_code);
  }

  return json;
}

std::string BinanceFuturesClient::buildQuery(const QueryParams& params) const {
  std::string query;
  bool first = true;
  for (const auto& [key, value] : params) {
    if (!first) {
      query.push_back('&');
    }
    first = false;
    query += encodeQueryParam(key);
    query.push_back('=');
    query += encodeQueryParam(value);
  }
  return query;
}

std::string BinanceFuturesClient::buildUrl(const std::string& path, const std::string& query) const {
  std::string url = base_url_;
  if (!path.empty() && path.front() != '/') {
    url.push_back('/');
  }
  url += path;
  if (!query.empty()) {
    url.push_back('?');
    url += query;
  }
  return url;
}

std::string BinanceFuturesClient::encodeQueryParam(const std::string& value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << c;
    } else {
      escaped << '%' << std::uppercase << std::setw(2) << static_cast<int>(c) << std::nouppercase;
    }
  }

  return escaped.str();
}

BinanceFuturesClient::HttpResponse BinanceFuturesClient::performCurl(const HttpRequest& request) const {
  CURL* curl = curl_easy_init();
  if (!curl) {
    throw ExchangeError("Failed to initialize CURL easy handle");
  }

  HttpResponse response;
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &BinanceFuturesClient::curlWriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  if (request.method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
  } else if (request.method != "GET") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }

  struct curl_slist* header_list = nullptr;
  for (const auto& [key, value] : request.headers) {
    header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
  }
  header_list = curl_slist_append(header_list, "Accept: application/json");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

  const CURLcode result = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);

  if (result != CURLE_OK) {
    throw ExchangeError(std::string("cURL request failed: ") + curl_easy_strerror(result));
  }

  return response;
}

size_t BinanceFuturesClient::curlWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  const size_t total_size = size * nmemb;
  auto* buffer = static_cast<std::string*>(userp);
  buffer->append(static_cast<char*>(contents), total_size);
  return total_size;
}

}  // namespace exchange
