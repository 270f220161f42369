#pragma once

#include "remote/Endpoint.hpp"

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace es::test {

// Scriptable in-memory remote. Scripted replies are consumed in order; once a
// queue is empty every call succeeds.
class FakeEndpoint final : public remote::Endpoint {
public:
    using Status = remote::EndpointReply::Status;

    struct ChunkCall {
        std::string transfer_id;
        uint64_t index;
        std::string bytes;
        std::string checksum;
    };

    std::deque<Status> initiateScript;
    std::deque<Status> chunkScript;
    std::deque<Status> completeScript;
    std::deque<bool> probeScript;

    // Runs before each uploadChunk reply; lets a test act between chunks.
    std::function<void(uint64_t index)> onChunk;

    uint64_t probeBytes = 64 * 1024;
    double probeSeconds = 0.1;

    std::vector<std::string> initiated;
    std::vector<ChunkCall> chunks;
    std::vector<std::string> completed;
    unsigned int probes = 0;

    remote::EndpointReply initiate(const std::string& resourceId, uint64_t, uint64_t,
                                   const sync::model::Metadata&) override {
        std::scoped_lock lock(mutex_);
        if (const auto s = next(initiateScript); s != Status::Ok) return remote::EndpointReply::failure(s, "scripted initiate failure");
        const auto id = "UPL_" + std::to_string(++counter_) + "_" + resourceId;
        initiated.push_back(id);
        return remote::EndpointReply::success(id);
    }

    remote::EndpointReply uploadChunk(const std::string& transferId, const uint64_t index,
                                      const std::string& bytes, const std::string& checksum) override {
        std::function<void(uint64_t)> hook;
        {
            std::scoped_lock lock(mutex_);
            hook = onChunk;
        }
        if (hook) hook(index);

        std::scoped_lock lock(mutex_);
        if (const auto s = next(chunkScript); s != Status::Ok) return remote::EndpointReply::failure(s, "scripted chunk failure");
        chunks.push_back({transferId, index, bytes, checksum});
        return remote::EndpointReply::success();
    }

    remote::EndpointReply complete(const std::string& transferId, const std::string&) override {
        std::scoped_lock lock(mutex_);
        if (const auto s = next(completeScript); s != Status::Ok) return remote::EndpointReply::failure(s, "scripted complete failure");
        completed.push_back(transferId);
        return remote::EndpointReply::success();
    }

    remote::ProbeResult probe(uint32_t, std::chrono::seconds) override {
        std::scoped_lock lock(mutex_);
        ++probes;
        bool ok = true;
        if (!probeScript.empty()) {
            ok = probeScript.front();
            probeScript.pop_front();
        }
        if (!ok) return {false, 0, std::chrono::duration<double>(0), "scripted probe timeout"};
        return {true, probeBytes, std::chrono::duration<double>(probeSeconds), {}};
    }

    std::set<uint64_t> uploadedIndices() const {
        std::scoped_lock lock(mutex_);
        std::set<uint64_t> out;
        for (const auto& c : chunks) out.insert(c.index);
        return out;
    }

    std::vector<uint64_t> uploadOrder() const {
        std::scoped_lock lock(mutex_);
        std::vector<uint64_t> out;
        for (const auto& c : chunks) out.push_back(c.index);
        return out;
    }

    // Probe result that the estimator turns into exactly `mbps`.
    void setLinkSpeed(const double mbps) {
        std::scoped_lock lock(mutex_);
        probeBytes = 1'000'000;
        probeSeconds = 8.0 / mbps;
    }

private:
    mutable std::mutex mutex_;
    unsigned int counter_ = 0;

    static Status next(std::deque<Status>& script) {
        if (script.empty()) return Status::Ok;
        const auto s = script.front();
        script.pop_front();
        return s;
    }
};

}
