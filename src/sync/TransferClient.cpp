#include "sync/TransferClient.hpp"
#include "remote/Endpoint.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <stdexcept>

using namespace es::sync;
using namespace es::sync::model;
using namespace es::remote;
using namespace es::logging;

namespace {

TransferResult fromReply(const EndpointReply& reply) {
    switch (reply.status) {
        case EndpointReply::Status::Ok: return TransferResult::success();
        case EndpointReply::Status::NetworkError: return TransferResult::failure(TransferResult::Kind::Network, reply.message);
        case EndpointReply::Status::ChecksumMismatch: return TransferResult::failure(TransferResult::Kind::Integrity, reply.message);
        case EndpointReply::Status::Rejected: return TransferResult::failure(TransferResult::Kind::Rejected, reply.message);
    }
    return TransferResult::failure(TransferResult::Kind::Rejected, "unknown endpoint status");
}

}

std::string_view TransferResult::toString(const Kind k) {
    switch (k) {
        case Kind::Ok: return "ok";
        case Kind::Network: return "network";
        case Kind::Integrity: return "integrity";
        case Kind::Rejected: return "rejected";
        case Kind::Source: return "source";
        default: return "unknown";
    }
}

TransferClient::TransferClient(std::shared_ptr<Endpoint> endpoint, const crypto::Hash::Algorithm checksumAlgorithm,
                               const unsigned int checksumRetries)
    : endpoint_(std::move(endpoint)), algorithm_(checksumAlgorithm), checksumRetries_(checksumRetries) {
    if (!endpoint_) throw std::invalid_argument("TransferClient requires an endpoint");
}

TransferResult TransferClient::initiate(SyncJob& job) const {
    if (job.remote_transfer_id) return TransferResult::success();

    const auto reply = endpoint_->initiate(job.resource_id, job.file_size, job.chunk_count, job.metadata);
    if (!reply.ok()) return fromReply(reply);

    job.remote_transfer_id = reply.value;
    LogRegistry::transfer()->info("[TransferClient] Initiated transfer {} for job {} ({} chunks of {} bytes)",
                                  reply.value, job.job_id, job.chunk_count, job.chunk_size);
    return TransferResult::success();
}

TransferResult TransferClient::readChunk(const SyncJob& job, const uint64_t index, std::string& out) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(job.source_path, ec);
    if (ec) return TransferResult::failure(TransferResult::Kind::Source, "cannot stat " + job.source_path.string() + ": " + ec.message());
    if (size != job.file_size)
        return TransferResult::failure(TransferResult::Kind::Source,
            "source changed size since enqueue (" + std::to_string(job.file_size) + " -> " + std::to_string(size) + " bytes)");

    try {
        if (!util::readExactAt(job.source_path, job.chunkOffset(index), job.chunkLength(index), out))
            return TransferResult::failure(TransferResult::Kind::Source, "short read on chunk " + std::to_string(index));
    } catch (const std::system_error& e) {
        return TransferResult::failure(TransferResult::Kind::Source, std::string("cannot read source: ") + e.what());
    }

    return TransferResult::success();
}

TransferResult TransferClient::uploadChunk(const SyncJob& job, const uint64_t index) const {
    if (index >= job.chunk_count)
        throw std::out_of_range("chunk " + std::to_string(index) + " outside plan of job " + job.job_id);
    if (!job.remote_transfer_id)
        return TransferResult::failure(TransferResult::Kind::Rejected, "job has no remote transfer handle");

    std::string bytes;
    for (unsigned int attempt = 0; attempt <= checksumRetries_; ++attempt) {
        if (const auto read = readChunk(job, index, bytes); !read.ok()) return read;

        const auto checksum = crypto::Hash::hex(algorithm_, reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
        const auto reply = endpoint_->uploadChunk(*job.remote_transfer_id, index, bytes, checksum);

        if (reply.ok()) {
            LogRegistry::transfer()->debug("[TransferClient] Job {} chunk {}/{} acknowledged ({} bytes, {} {})",
                                           job.job_id, index + 1, job.chunk_count, bytes.size(),
                                           crypto::Hash::toString(algorithm_), checksum);
            return TransferResult::success();
        }

        if (reply.status != EndpointReply::Status::ChecksumMismatch) return fromReply(reply);

        LogRegistry::transfer()->warn("[TransferClient] Checksum mismatch on job {} chunk {} (attempt {} of {}): {}",
                                      job.job_id, index, attempt + 1, checksumRetries_ + 1, reply.message);
    }

    return TransferResult::failure(TransferResult::Kind::Integrity,
        "checksum mismatch on chunk " + std::to_string(index) + " after " + std::to_string(checksumRetries_ + 1) + " attempts");
}

TransferResult TransferClient::complete(const SyncJob& job) const {
    if (!job.allChunksDone())
        throw std::logic_error("complete() called for job " + job.job_id + " with chunks outstanding");
    if (!job.remote_transfer_id)
        return TransferResult::failure(TransferResult::Kind::Rejected, "job has no remote transfer handle");

    const auto reply = endpoint_->complete(*job.remote_transfer_id, job.resource_id);
    if (!reply.ok()) return fromReply(reply);

    LogRegistry::transfer()->info("[TransferClient] Completed transfer {} for job {}", *job.remote_transfer_id, job.job_id);
    return TransferResult::success();
}
