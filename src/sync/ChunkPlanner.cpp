#include "sync/ChunkPlanner.hpp"

#include <cmath>
#include <stdexcept>

using namespace es::sync;

ChunkPlanner::ChunkPlanner(const config::ChunkingConfig& cfg) : cfg_(cfg) {
    if (cfg_.small_chunk_bytes == 0 || cfg_.medium_chunk_bytes == 0 || cfg_.large_chunk_bytes == 0)
        throw std::invalid_argument("Chunk sizes must be > 0");
    if (!(cfg_.slow_link_mbps <= cfg_.fast_link_mbps))
        throw std::invalid_argument("chunking.slow_link_mbps must not exceed chunking.fast_link_mbps");
}

uint64_t ChunkPlanner::chunkSizeFor(const double bandwidthMbps) const {
    // Readings that cannot be trusted plan for the worst link
    if (!std::isfinite(bandwidthMbps) || bandwidthMbps < 0) return cfg_.small_chunk_bytes;

    if (bandwidthMbps < cfg_.slow_link_mbps) return cfg_.small_chunk_bytes;
    if (bandwidthMbps <= cfg_.fast_link_mbps) return cfg_.medium_chunk_bytes;
    return cfg_.large_chunk_bytes;
}

ChunkPlan ChunkPlanner::plan(const uint64_t fileSize, const double bandwidthMbps) const {
    if (fileSize == 0) throw std::invalid_argument("Cannot plan chunks for an empty file");

    const auto size = chunkSizeFor(bandwidthMbps);
    return {size, (fileSize + size - 1) / size};
}
