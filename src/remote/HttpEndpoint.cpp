#include "remote/HttpEndpoint.hpp"
#include "util/curlWrappers.hpp"
#include "util/files.hpp"
#include "crypto/random.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using namespace es::remote;
using namespace es::util;
using namespace es::logging;

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string describe(const HttpResponse& resp) {
    if (resp.transportFailed()) return std::string("transport error: ") + curl_easy_strerror(resp.curl);
    std::string body = resp.body.substr(0, 256);
    return "HTTP " + std::to_string(resp.http) + (body.empty() ? "" : ": " + body);
}

}

HttpEndpoint::HttpEndpoint(config::RemoteConfig cfg) : cfg_(std::move(cfg)), baseUrl_(cfg_.base_url) {
    ensureCurlGlobalInit();
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
    if (baseUrl_.empty()) throw std::invalid_argument("remote.base_url must not be empty");

    if (!cfg_.auth_token_file.empty()) {
        auto token = readFile(cfg_.auth_token_file);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) token.pop_back();
        if (token.empty()) throw std::runtime_error("Auth token file is empty: " + cfg_.auth_token_file.string());
        bearer_ = "Authorization: Bearer " + token;
    }

    LogRegistry::transfer()->debug("[HttpEndpoint] Remote endpoint {} (auth: {})", baseUrl_, bearer_ ? "bearer" : "none");
}

std::string HttpEndpoint::url(const std::string& path) const {
    if (path.starts_with("/")) return baseUrl_ + path;
    return baseUrl_ + "/" + path;
}

EndpointReply HttpEndpoint::classify(const HttpResponse& resp, const bool chunkUpload) {
    if (resp.ok()) return EndpointReply::success();

    using Status = EndpointReply::Status;
    const auto msg = describe(resp);

    if (resp.transportFailed() || resp.http == 0 || resp.http >= 500 || resp.http == 408 || resp.http == 429)
        return EndpointReply::failure(Status::NetworkError, msg);

    if (chunkUpload) {
        const auto body = lower(resp.body);
        const bool mentionsDigest = body.find("hash") != std::string::npos || body.find("checksum") != std::string::npos;
        if (resp.http == 422 || (resp.http == 400 && mentionsDigest))
            return EndpointReply::failure(Status::ChecksumMismatch, msg);
    }

    return EndpointReply::failure(Status::Rejected, msg);
}

HttpResponse HttpEndpoint::postJson(const std::string& path, const std::string& body, const std::chrono::seconds timeout) const {
    const auto target = url(path);

    SList hdrs;
    hdrs.add("Content-Type: application/json");
    hdrs.add("Accept: application/json");
    if (bearer_) hdrs.add(*bearer_);

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, target.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout.count()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    });
}

EndpointReply HttpEndpoint::initiate(const std::string& resourceId, const uint64_t fileSize, const uint64_t chunkCount,
                                     const sync::model::Metadata& metadata) {
    const nlohmann::json req = {
        {"slide_id", resourceId},
        {"file_size", fileSize},
        {"chunks_total", chunkCount},
        {"metadata", metadata}
    };

    const auto resp = postJson("/sync/initiate", req.dump(), cfg_.initiate_timeout);
    auto reply = classify(resp, false);
    if (!reply.ok()) {
        LogRegistry::transfer()->warn("[HttpEndpoint] initiate for {} failed: {}", resourceId, reply.message);
        return reply;
    }

    try {
        const auto body = nlohmann::json::parse(resp.body);
        reply.value = body.at("upload_id").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        return EndpointReply::failure(EndpointReply::Status::Rejected,
                                      std::string("initiate returned an unusable body: ") + e.what());
    }

    if (reply.value.empty())
        return EndpointReply::failure(EndpointReply::Status::Rejected, "initiate returned an empty upload_id");

    return reply;
}

EndpointReply HttpEndpoint::uploadChunk(const std::string& transferId, const uint64_t index,
                                        const std::string& bytes, const std::string& checksum) {
    const auto target = url("/sync/upload-chunk");
    const auto indexStr = std::to_string(index);
    const auto filename = "chunk_" + indexStr;

    SList hdrs;
    hdrs.add("Accept: application/json");
    if (bearer_) hdrs.add(*bearer_);

    CurlEasy handle;
    Mime form(handle);
    form.addField("upload_id", transferId);
    form.addField("chunk_index", indexStr);
    form.addField("chunk_hash", checksum);
    form.addFile("chunk", filename.c_str(), bytes.data(), bytes.size());

    const auto resp = performCurl(handle, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, target.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_MIMEPOST, form.get());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout.count()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.chunk_timeout.count()));
    });

    auto reply = classify(resp, true);
    if (!reply.ok())
        LogRegistry::transfer()->warn("[HttpEndpoint] Chunk {} of {} failed: {}", index, transferId, reply.message);
    return reply;
}

EndpointReply HttpEndpoint::complete(const std::string& transferId, const std::string& resourceId) {
    const nlohmann::json req = {
        {"upload_id", transferId},
        {"slide_id", resourceId}
    };

    auto reply = classify(postJson("/sync/complete", req.dump(), cfg_.complete_timeout), false);
    if (!reply.ok())
        LogRegistry::transfer()->warn("[HttpEndpoint] complete for {} failed: {}", transferId, reply.message);
    return reply;
}

ProbeResult HttpEndpoint::probe(const uint32_t payloadBytes, const std::chrono::seconds timeout) {
    crypto::ensure_sodium_init();
    std::string payload(payloadBytes, '\0');
    randombytes_buf(payload.data(), payload.size());

    const auto target = url(cfg_.probe_path);

    SList hdrs;
    hdrs.add("Content-Type: application/octet-stream");
    if (bearer_) hdrs.add(*bearer_);

    const auto begin = std::chrono::steady_clock::now();
    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, target.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(std::min(timeout, cfg_.connect_timeout).count()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    });
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - begin;

    if (!resp.ok()) return {false, 0, elapsed, describe(resp)};
    return {true, payload.size(), elapsed, {}};
}
