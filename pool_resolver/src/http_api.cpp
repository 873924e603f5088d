#include "http_api.hpp"
#include "lookup_key.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>

namespace {

std::optional<std::string> param(const httplib::Request& req, const char* name) {
    if (!req.has_param(name)) {
        return std::nullopt;
    }
    auto value = util::trim(req.get_param_value(name));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

int64_t require_int(const std::string& value, const char* name) {
    auto parsed = util::parse_int(value);
    if (!parsed) {
        throw std::invalid_argument(std::string("'") + name + "' must be an integer");
    }
    return *parsed;
}

double require_double(const std::string& value, const char* name) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
        // reported below
    }
    throw std::invalid_argument(std::string("'") + name + "' must be a number");
}

} // namespace

HttpApi::HttpApi(const Config& config, PoolResolver& resolver)
    : config_(config), resolver_(resolver), running_(false) {
    server_ = std::make_unique<httplib::Server>();
}

HttpApi::~HttpApi() {
    stop();
}

int HttpApi::status_for(bool success, ErrorKind kind) {
    if (success) return 200;
    switch (kind) {
        case ErrorKind::InvalidRequest: return 400;
        case ErrorKind::NotFound: return 404;
        default: return 503;
    }
}

int64_t HttpApi::parse_chain(const httplib::Request& req) {
    auto chain = param(req, "chain");
    return chain ? require_int(*chain, "chain") : 1;
}

std::vector<FeeTier> HttpApi::parse_fee_tiers(const std::string& value) {
    std::vector<FeeTier> tiers;
    for (const auto& part : util::split_string(value, ',')) {
        auto tier = fee_tier_from_int(require_int(part, "fee"));
        if (!tier) {
            throw std::invalid_argument("unsupported fee tier '" + part + "'");
        }
        tiers.push_back(*tier);
    }
    return tiers;
}

PoolQuery HttpApi::parse_pool_query(const httplib::Request& req) {
    PoolQuery query;

    if (auto v = param(req, "token0")) query.token_a = *v;
    if (auto v = param(req, "token1")) query.token_b = *v;
    if (auto v = param(req, "token")) query.tokens = util::split_string(*v, ',');
    if (auto v = param(req, "fee")) query.fee_tiers = parse_fee_tiers(*v);
    if (auto v = param(req, "min_tvl")) query.min_tvl_usd = require_double(*v, "min_tvl");
    if (auto v = param(req, "min_volume")) query.min_volume_usd = require_double(*v, "min_volume");

    if (auto v = param(req, "order_by")) {
        auto order_by = pool_order_by_from_string(*v);
        if (!order_by) {
            throw std::invalid_argument("unknown order_by '" + *v + "'");
        }
        query.order_by = *order_by;
    }
    if (auto v = param(req, "order_direction")) {
        auto dir = util::to_lower(*v);
        if (dir != "asc" && dir != "desc") {
            throw std::invalid_argument("order_direction must be asc or desc");
        }
        query.order_direction = dir == "asc" ? OrderDirection::Asc : OrderDirection::Desc;
    }
    if (auto v = param(req, "first")) {
        auto first = require_int(*v, "first");
        if (first < 1 || first > 1000) {
            throw std::invalid_argument("'first' must be between 1 and 1000");
        }
        query.first = static_cast<int>(first);
    }
    if (auto v = param(req, "skip")) {
        auto skip = require_int(*v, "skip");
        if (skip < 0) {
            throw std::invalid_argument("'skip' must not be negative");
        }
        if (skip > std::numeric_limits<int>::max()) {
            throw std::invalid_argument("'skip' is too large");
        }
        query.skip = static_cast<int>(skip);
    }

    return query;
}

SearchOptions HttpApi::parse_search_options(const httplib::Request& req) {
    SearchOptions options;

    if (auto v = param(req, "fee")) options.fee_tiers = parse_fee_tiers(*v);
    if (auto v = param(req, "min_tvl")) options.min_tvl_usd = require_double(*v, "min_tvl");
    if (auto v = param(req, "min_volume")) options.min_volume_usd = require_double(*v, "min_volume");
    if (auto v = param(req, "limit")) {
        auto limit = require_int(*v, "limit");
        if (limit < 1 || limit > 1000) {
            throw std::invalid_argument("'limit' must be between 1 and 1000");
        }
        options.limit = static_cast<int>(limit);
    }

    return options;
}

void HttpApi::respond_error(httplib::Response& res, int status, const std::string& message) {
    nlohmann::json body = {
        {"success", false},
        {"error", message},
        {"error_kind", to_string(status == 400 ? ErrorKind::InvalidRequest : ErrorKind::Unavailable)},
        {"timestamp", util::current_timestamp_ms()}
    };
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void HttpApi::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json health = {
            {"ok", true},
            {"service", config_.service_name},
            {"timestamp", util::current_iso8601()},
            {"cache", resolver_.cache_stats()}
        };
        res.status = 200;
        res.set_content(health.dump(), "application/json");
    });

    server_->Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json stats = resolver_.cache_stats();
        res.status = 200;
        res.set_content(stats.dump(), "application/json");
    });

    server_->Get(R"(/pools/(0x[0-9a-fA-F]{40}))", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            respond(res, resolver_.get_pool(req.matches[1].str(), parse_chain(req)));
        } catch (const std::invalid_argument& e) {
            respond_error(res, 400, e.what());
        }
    });

    server_->Get("/pools", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            respond(res, resolver_.get_pools(parse_chain(req), parse_pool_query(req)));
        } catch (const std::invalid_argument& e) {
            respond_error(res, 400, e.what());
        }
    });

    server_->Get("/pair", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            auto token_a = param(req, "token_a");
            auto token_b = param(req, "token_b");
            if (!token_a || !token_b) {
                respond_error(res, 400, "token_a and token_b are required");
                return;
            }

            FeeTier fee = FeeTier::Medium;
            if (auto v = param(req, "fee")) {
                auto tiers = parse_fee_tiers(*v);
                if (tiers.size() != 1) {
                    throw std::invalid_argument("exactly one fee tier expected");
                }
                fee = tiers.front();
            }

            respond(res, resolver_.get_pool_by_tokens(*token_a, *token_b, fee, parse_chain(req)));
        } catch (const std::invalid_argument& e) {
            respond_error(res, 400, e.what());
        }
    });

    server_->Get("/search", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            auto q = param(req, "q");
            if (!q) {
                respond_error(res, 400, "q is required");
                return;
            }
            respond(res, resolver_.search_pools(*q, parse_chain(req), parse_search_options(req)));
        } catch (const std::invalid_argument& e) {
            respond_error(res, 400, e.what());
        }
    });

    server_->Post("/batch", [this](const httplib::Request& req, httplib::Response& res) {
        std::vector<PoolRequest> requests;
        try {
            auto body = nlohmann::json::parse(req.body);
            if (!body.is_array()) {
                respond_error(res, 400, "Body must be a JSON array of pool requests");
                return;
            }
            for (const auto& item : body) {
                requests.push_back(item.get<PoolRequest>());
            }
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("Rejected batch with invalid JSON: {}", e.what());
            respond_error(res, 400, "Invalid JSON");
            return;
        } catch (const std::invalid_argument& e) {
            respond_error(res, 400, e.what());
            return;
        }

        respond(res, resolver_.batch_get_pools(requests));
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Internal server error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        }
        spdlog::error("Unhandled error serving {}: {}", req.path, message);
        res.status = 500;
        res.set_content(nlohmann::json{{"success", false}, {"error", message}}.dump(), "application/json");
    });
}

void HttpApi::start() {
    if (running_) {
        return;
    }

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("HTTP API listening on {}:{}", config_.http_host, config_.http_port);
        if (!server_->listen(config_.http_host.c_str(), config_.http_port)) {
            spdlog::error("HTTP API failed to bind {}:{}", config_.http_host, config_.http_port);
        }
    });
}

void HttpApi::stop() {
    if (running_) {
        running_ = false;
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("HTTP API stopped");
    }
}
