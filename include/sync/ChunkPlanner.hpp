#pragma once

#include "config/Config.hpp"

#include <cstdint>

namespace es::sync {

struct ChunkPlan {
    uint64_t chunk_size{};
    uint64_t chunk_count{};
};

// Pure function of (fileSize, bandwidth). Tiers:
//   mbps <  slow_link_mbps                  -> small_chunk_bytes
//   slow_link_mbps <= mbps <= fast_link_mbps -> medium_chunk_bytes
//   mbps >  fast_link_mbps                  -> large_chunk_bytes
class ChunkPlanner {
public:
    explicit ChunkPlanner(const config::ChunkingConfig& cfg = {});

    [[nodiscard]] ChunkPlan plan(uint64_t fileSize, double bandwidthMbps) const;

    [[nodiscard]] uint64_t chunkSizeFor(double bandwidthMbps) const;

private:
    config::ChunkingConfig cfg_;
};

}
