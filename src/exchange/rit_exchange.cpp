#include "rit_exchange.hpp"
#include "exchange_exception.hpp"
#include "../network/network_exception.hpp"
#include "../utils/logger.hpp"

#include <iomanip>
#include <sstream>

namespace etfarb {

namespace rit {

namespace {

std::vector<BookLevel> parse_levels(const nlohmann::json& levels) {
    std::vector<BookLevel> parsed;
    if (!levels.is_array()) {
        throw MalformedResponseException("book side is not an array");
    }
    parsed.reserve(levels.size());
    for (const auto& level : levels) {
        BookLevel book_level;
        book_level.price = level.at("price").get<double>();
        long long quantity = static_cast<long long>(level.at("quantity").get<double>());
        long long filled = static_cast<long long>(level.value("quantity_filled", 0.0));
        book_level.quantity = quantity - filled;
        if (book_level.quantity > 0) {
            parsed.push_back(book_level);
        }
    }
    return parsed;
}

std::string format_price(double price) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << price;
    return oss.str();
}

} // namespace

TickStatus parse_case(const nlohmann::json& payload) {
    try {
        TickStatus status;
        status.tick = payload.at("tick").get<int>();
        status.status = status_from_string(payload.at("status").get<std::string>());
        return status;
    } catch (const nlohmann::json::exception& e) {
        throw MalformedResponseException(std::string("/case: ") + e.what());
    }
}

OrderBook parse_book(Instrument instrument, const nlohmann::json& payload) {
    try {
        OrderBook book;
        book.instrument = instrument;
        book.bids = parse_levels(payload.at("bids"));
        book.asks = parse_levels(payload.at("asks"));
        return book;
    } catch (const nlohmann::json::exception& e) {
        throw MalformedResponseException("/securities/book " + to_string(instrument) + ": " + e.what());
    }
}

PositionMap parse_positions(const nlohmann::json& payload) {
    if (!payload.is_array()) {
        throw MalformedResponseException("/securities: expected an array");
    }
    try {
        PositionMap positions;
        for (const auto& security : payload) {
            std::string ticker = security.at("ticker").get<std::string>();
            double position = security.value("position", 0.0);
            auto instrument = instrument_from_string(ticker);
            if (instrument) {
                positions.shares[*instrument] = static_cast<long long>(position);
            } else {
                positions.cash[ticker] = position;
            }
        }
        return positions;
    } catch (const nlohmann::json::exception& e) {
        throw MalformedResponseException(std::string("/securities: ") + e.what());
    }
}

std::vector<TenderOffer> parse_tenders(const nlohmann::json& payload) {
    if (!payload.is_array()) {
        throw MalformedResponseException("/tenders: expected an array");
    }
    std::vector<TenderOffer> offers;
    try {
        for (const auto& entry : payload) {
            auto side = side_from_string(entry.at("action").get<std::string>());
            if (!side) {
                ETFARB_LOG_WARN("Skipping tender with unknown action: {}", entry.dump());
                continue;
            }
            if (entry.at("price").is_null()) {
                // Competitive auctions carry no fixed price.
                continue;
            }
            TenderOffer offer;
            offer.id = entry.at("tender_id").get<long long>();
            offer.side = *side;
            offer.price = entry.at("price").get<double>();
            offer.quantity = static_cast<long long>(entry.at("quantity").get<double>());
            offers.push_back(offer);
        }
    } catch (const nlohmann::json::exception& e) {
        throw MalformedResponseException(std::string("/tenders: ") + e.what());
    }
    return offers;
}

} // namespace rit

RitExchange::RitExchange(const ExchangeConfig& config)
    : config_(config)
    , client_(std::make_unique<RestClient>()) {
    client_->SetBaseUrl(config_.base_url);
    client_->SetDefaultTimeout(config_.timeout_ms);
    client_->SetConnectTimeout(config_.timeout_ms);
    client_->SetUserAgent("etfarb/1.0");
    client_->AddHeader("X-API-key", config_.api_key);
    ETFARB_LOG_INFO("RIT exchange adapter targeting {}", config_.base_url);
}

std::string RitExchange::get_name() const {
    return config_.name;
}

nlohmann::json RitExchange::get_json(const std::string& endpoint,
                                     const std::map<std::string, std::string>& params) {
    HttpResponse response = client_->Get(endpoint, params);
    if (!response.IsSuccess()) {
        throw HttpStatusException(response.status_code, client_->BuildUrl(endpoint, params));
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedResponseException(endpoint + ": " + e.what());
    }
}

TickStatus RitExchange::get_status() {
    return rit::parse_case(get_json("/case"));
}

OrderBook RitExchange::get_book(Instrument instrument) {
    return rit::parse_book(instrument, get_json("/securities/book", {{"ticker", to_string(instrument)}}));
}

PositionMap RitExchange::get_positions() {
    return rit::parse_positions(get_json("/securities"));
}

std::vector<TenderOffer> RitExchange::get_open_tenders() {
    return rit::parse_tenders(get_json("/tenders"));
}

bool RitExchange::submit_order(const OrderIntent& order) {
    std::map<std::string, std::string> params = {
        {"ticker", to_string(order.instrument)},
        {"type", to_string(order.type)},
        {"quantity", std::to_string(order.quantity)},
        {"action", to_string(order.side)}
    };
    if (order.type == OrderType::LIMIT && order.price) {
        params["price"] = rit::format_price(*order.price);
    }

    HttpResponse response = client_->Post("/orders", params);
    if (response.IsServerError()) {
        ETFARB_LOG_WARN("Order endpoint failing ({}): {}", response.status_code, response.body);
        return false;
    }
    if (!response.IsSuccess()) {
        ETFARB_LOG_DEBUG("Order rejected by venue ({}): {}", response.status_code, response.body);
        return false;
    }
    return true;
}

bool RitExchange::accept_tender(long long tender_id) {
    HttpResponse response = client_->Post("/tenders/" + std::to_string(tender_id));
    if (!response.IsSuccess()) {
        ETFARB_LOG_WARN("Tender {} acceptance refused ({}): {}", tender_id, response.status_code, response.body);
        return false;
    }
    return true;
}

bool RitExchange::cancel_open_orders(Instrument instrument) {
    HttpResponse response = client_->Post("/commands/cancel", {{"ticker", to_string(instrument)}});
    if (!response.IsSuccess()) {
        ETFARB_LOG_WARN("Cancel on {} refused ({}): {}", to_string(instrument), response.status_code, response.body);
        return false;
    }
    return true;
}

void RitExchange::log_statistics() const {
    ETFARB_LOG_INFO("RIT transport: {} requests, {} failed, {:.1f} ms average",
                    client_->GetTotalRequests(), client_->GetFailedRequests(),
                    client_->GetAverageResponseTime());
}

} // namespace etfarb
