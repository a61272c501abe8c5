#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "exchange_interface.hpp"
#include "../network/rest_client.hpp"
#include "../utils/config_types.hpp"

namespace etfarb {

// Payload decoding for the RIT client API. Each function throws
// MalformedResponseException when a required field is missing or mistyped.
namespace rit {

TickStatus parse_case(const nlohmann::json& payload);
OrderBook parse_book(Instrument instrument, const nlohmann::json& payload);
PositionMap parse_positions(const nlohmann::json& payload);
std::vector<TenderOffer> parse_tenders(const nlohmann::json& payload);

} // namespace rit

class RitExchange : public ExchangeInterface {
public:
    explicit RitExchange(const ExchangeConfig& config);
    ~RitExchange() override = default;

    std::string get_name() const override;
    TickStatus get_status() override;
    OrderBook get_book(Instrument instrument) override;
    PositionMap get_positions() override;
    std::vector<TenderOffer> get_open_tenders() override;
    bool submit_order(const OrderIntent& order) override;
    bool accept_tender(long long tender_id) override;
    bool cancel_open_orders(Instrument instrument) override;

    void log_statistics() const;

private:
    nlohmann::json get_json(const std::string& endpoint,
                            const std::map<std::string, std::string>& params = {});

    ExchangeConfig config_;
    std::unique_ptr<RestClient> client_;
};

} // namespace etfarb
