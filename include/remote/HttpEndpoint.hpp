#pragma once

#include "remote/Endpoint.hpp"
#include "config/Config.hpp"

#include <optional>
#include <string>

namespace es::util { struct HttpResponse; }

namespace es::remote {

// JSON + multipart over HTTP(S), relative to remote.base_url:
//   POST /sync/initiate       {slide_id, file_size, chunks_total, metadata} -> {upload_id}
//   POST /sync/upload-chunk   form: upload_id, chunk_index, chunk_hash, chunk
//   POST /sync/complete       {upload_id, slide_id}
//   POST <probe_path>         opaque body
class HttpEndpoint final : public Endpoint {
public:
    explicit HttpEndpoint(config::RemoteConfig cfg);

    EndpointReply initiate(const std::string& resourceId, uint64_t fileSize, uint64_t chunkCount,
                           const sync::model::Metadata& metadata) override;

    EndpointReply uploadChunk(const std::string& transferId, uint64_t index,
                              const std::string& bytes, const std::string& checksum) override;

    EndpointReply complete(const std::string& transferId, const std::string& resourceId) override;

    ProbeResult probe(uint32_t payloadBytes, std::chrono::seconds timeout) override;

    // Shared by all calls: transport errors, 408, 429 and 5xx are network faults.
    static EndpointReply classify(const util::HttpResponse& resp, bool chunkUpload);

private:
    config::RemoteConfig cfg_;
    std::string baseUrl_;
    std::optional<std::string> bearer_;

    [[nodiscard]] std::string url(const std::string& path) const;

    util::HttpResponse postJson(const std::string& path, const std::string& body, std::chrono::seconds timeout) const;
};

}
