#include "QueryCoalescer.hpp"
#include <spdlog/spdlog.h>
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

QueryCoalescer::QueryCoalescer(FetchFunction fetch, size_t worker_threads, KeyFunction key)
    : fetch_(std::move(fetch)),
      key_(std::move(key)),
      singleflight_(std::make_unique<Group>(worker_threads)) {
    spdlog::info("[QueryCoalescer] Using {} async worker threads", worker_threads);
}

QueryCoalescer::QueryCoalescer(FetchFunction fetch, boost::asio::any_io_executor executor,
                               KeyFunction key)
    : fetch_(std::move(fetch)),
      key_(std::move(key)),
      singleflight_(std::make_unique<Group>(std::move(executor))) {
}

std::string QueryCoalescer::hash_query(const std::string& query) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(query.data(), query.size(), digest, &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < digest_len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)digest[i];
    }
    return ss.str();
}

QueryCoalescer::Group::Function QueryCoalescer::bind(const std::string& query) const {
    FetchFunction fetch = fetch_;
    return [fetch, query](const CancellationToken& token) {
        spdlog::debug("[QueryCoalescer] Fetching query: {}", query);
        return fetch(token, query);
    };
}

Result<std::string> QueryCoalescer::fetch(const CancellationToken& token, const std::string& query) {
    auto result = singleflight_->doCall(token, key_(query), bind(query));
    if (result.shared) {
        spdlog::debug("[QueryCoalescer] Shared result for query: {}", query);
    }
    return result;
}

ResultChannel<std::string> QueryCoalescer::fetchAsync(const CancellationToken& token,
                                                      const std::string& query) {
    return singleflight_->doAsync(token, key_(query), bind(query));
}

bool QueryCoalescer::forget(const std::string& query) {
    bool forgotten = singleflight_->forgetUnshared(key_(query));
    spdlog::debug("[QueryCoalescer] Forget {} for query: {}",
                  forgotten ? "succeeded" : "refused (shared)", query);
    return forgotten;
}

QueryCoalescer::Stats QueryCoalescer::getStats() const {
    return singleflight_->getStats();
}
