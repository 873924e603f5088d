#pragma once
#include "config.hpp"
#include "pool_resolver.hpp"
#include "types.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <thread>

// HTTP surface over the resolver
class HttpApi {
public:
    HttpApi(const Config& config, PoolResolver& resolver);
    ~HttpApi();

    void start();
    void stop();

    // 200 on success, 400 invalid request, 404 not found, 503 otherwise
    static int status_for(bool success, ErrorKind kind);

    // Query-string parsing; throws std::invalid_argument on bad values
    static int64_t parse_chain(const httplib::Request& req);
    static PoolQuery parse_pool_query(const httplib::Request& req);
    static SearchOptions parse_search_options(const httplib::Request& req);
    static std::vector<FeeTier> parse_fee_tiers(const std::string& value);

private:
    void setup_routes();

    template <typename T>
    void respond(httplib::Response& res, const FetchResult<T>& result) {
        nlohmann::json body = result;
        res.status = status_for(result.success, result.error_kind);
        res.set_content(body.dump(), "application/json");
    }

    void respond_error(httplib::Response& res, int status, const std::string& message);

    const Config& config_;
    PoolResolver& resolver_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
};
