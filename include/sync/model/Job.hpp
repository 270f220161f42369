#pragma once

#include <boost/dynamic_bitset.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace es::sync::model {

enum class Status : uint8_t {
    QUEUED,
    TRANSFERRING,
    PAUSED,
    COMPLETED,
    FAILED
};

using Metadata = std::map<std::string, std::string>;
using TimePoint = std::chrono::system_clock::time_point;

struct SyncJob {
    static constexpr int DEFAULT_PRIORITY = 5;

    std::string job_id{}, resource_id{};
    std::filesystem::path source_path{};

    // Fixed at enqueue
    uint64_t file_size{}, chunk_size{}, chunk_count{};

    // bit i set => chunk i acknowledged by the remote and persisted
    boost::dynamic_bitset<> chunks_done{};

    Status status{Status::QUEUED};
    int priority{DEFAULT_PRIORITY};
    unsigned int retry_count{};
    std::optional<std::string> last_error{};
    TimePoint created_at{}, updated_at{};
    std::optional<std::string> remote_transfer_id{};
    Metadata metadata{};

    // PAUSED only: not selectable before this instant
    std::optional<TimePoint> next_attempt_at{};

    // PAUSED only: excluded from scheduling until explicitly re-queued
    bool cancelled{false};

    [[nodiscard]] uint64_t chunksDoneCount() const { return chunks_done.count(); }
    [[nodiscard]] bool allChunksDone() const { return chunk_count > 0 && chunks_done.count() == chunk_count; }
    [[nodiscard]] std::vector<uint64_t> doneChunks() const;
    [[nodiscard]] std::vector<uint64_t> missingChunks() const;
    [[nodiscard]] bool isChunkDone(uint64_t index) const;

    void markChunkDone(uint64_t index);

    // The remote handle is gone; chunks uploaded under it are gone with it.
    void resetTransfer();

    [[nodiscard]] uint64_t chunkOffset(uint64_t index) const;
    [[nodiscard]] uint64_t chunkLength(uint64_t index) const;

    [[nodiscard]] bool isTerminal() const { return status == Status::COMPLETED || status == Status::FAILED; }
    [[nodiscard]] bool isEligible(TimePoint now) const;

    void touch();

    static std::string_view toString(Status s);
    static bool tryParseStatus(std::string_view str, Status& out);
};

// Scheduling order: priority ASC, created_at ASC, job_id ASC.
[[nodiscard]] bool schedulesBefore(const SyncJob& a, const SyncJob& b);

void to_json(nlohmann::json& j, const SyncJob& job);
void from_json(const nlohmann::json& j, SyncJob& job);

}
