#pragma once

#include "crypto/Hash.hpp"
#include "sync/model/Job.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace es::remote { class Endpoint; }

namespace es::sync {

struct TransferResult {
    enum class Kind {
        Ok,
        Network,    // transient, link is probably down
        Integrity,  // checksum still mismatched after the immediate retries
        Rejected,   // remote refused; the handle is unusable
        Source      // local file missing, changed or unreadable
    };

    Kind kind{Kind::Ok};
    std::string message{};

    [[nodiscard]] bool ok() const { return kind == Kind::Ok; }

    static TransferResult success() { return {}; }
    static TransferResult failure(const Kind k, std::string msg) { return {k, std::move(msg)}; }

    static std::string_view toString(Kind k);
};

class TransferClient {
public:
    TransferClient(std::shared_ptr<remote::Endpoint> endpoint,
                   crypto::Hash::Algorithm checksumAlgorithm = crypto::Hash::Algorithm::MD5,
                   unsigned int checksumRetries = 1);

    // Sets job.remote_transfer_id. No-op when the job already has a handle.
    TransferResult initiate(model::SyncJob& job) const;

    // Does not touch job; the caller records the chunk as done.
    TransferResult uploadChunk(const model::SyncJob& job, uint64_t index) const;

    // Requires every chunk to be done.
    TransferResult complete(const model::SyncJob& job) const;

    [[nodiscard]] crypto::Hash::Algorithm checksumAlgorithm() const { return algorithm_; }

private:
    std::shared_ptr<remote::Endpoint> endpoint_;
    crypto::Hash::Algorithm algorithm_;
    unsigned int checksumRetries_;

    TransferResult readChunk(const model::SyncJob& job, uint64_t index, std::string& out) const;
};

}
