#pragma once

#include "sync/model/Job.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace es::remote {

struct EndpointReply {
    enum class Status {
        Ok,
        NetworkError,      // timeout, reset, refused, 5xx: try again later
        ChecksumMismatch,  // remote computed a different digest for the chunk
        Rejected           // remote refused the request or no longer knows the handle
    };

    Status status{Status::Ok};
    std::string value{};    // initiate: transfer id
    std::string message{};

    [[nodiscard]] bool ok() const { return status == Status::Ok; }

    static EndpointReply success(std::string v = {}) { return {Status::Ok, std::move(v), {}}; }
    static EndpointReply failure(const Status s, std::string msg) { return {s, {}, std::move(msg)}; }
};

struct ProbeResult {
    bool ok{false};
    uint64_t bytes{};
    std::chrono::duration<double> elapsed{};
    std::string message{};
};

// The remote side of a chunked transfer. Implementations never throw for
// network failures; they report them through EndpointReply.
class Endpoint {
public:
    virtual ~Endpoint() = default;

    virtual EndpointReply initiate(const std::string& resourceId, uint64_t fileSize, uint64_t chunkCount,
                                   const sync::model::Metadata& metadata) = 0;

    virtual EndpointReply uploadChunk(const std::string& transferId, uint64_t index,
                                      const std::string& bytes, const std::string& checksum) = 0;

    virtual EndpointReply complete(const std::string& transferId, const std::string& resourceId) = 0;

    virtual ProbeResult probe(uint32_t payloadBytes, std::chrono::seconds timeout) = 0;
};

}
