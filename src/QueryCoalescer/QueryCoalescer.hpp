#pragma once

#include "../SingleFlight/SingleFlight.hpp"

#include <functional>
#include <memory>
#include <string>

// Coalesces identical string queries. Queries are keyed by their MD5 digest,
// and results live only as long as the call that produced them.
class QueryCoalescer {
public:
    using FetchFunction = std::function<std::string(const CancellationToken&, const std::string&)>;
    using KeyFunction = std::function<std::string(const std::string&)>;
    using Group = SingleFlight<std::string, std::string>;
    using Stats = Group::Stats;

    // key maps a query to its group key and may throw; it defaults to hash_query.
    QueryCoalescer(FetchFunction fetch, size_t worker_threads,
                   KeyFunction key = &QueryCoalescer::hash_query);
    QueryCoalescer(FetchFunction fetch, boost::asio::any_io_executor executor,
                   KeyFunction key = &QueryCoalescer::hash_query);

    QueryCoalescer(const QueryCoalescer&) = delete;
    QueryCoalescer& operator=(const QueryCoalescer&) = delete;

    Result<std::string> fetch(const CancellationToken& token, const std::string& query);

    ResultChannel<std::string> fetchAsync(const CancellationToken& token, const std::string& query);

    bool forget(const std::string& query);

    Stats getStats() const;

    static std::string hash_query(const std::string& query);

private:
    Group::Function bind(const std::string& query) const;

    FetchFunction fetch_;
    KeyFunction key_;
    std::unique_ptr<Group> singleflight_;
};
