#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace es::crypto {

class Hash {
public:
    enum class Algorithm { MD5, SHA256 };

    static std::string hex(Algorithm algo, const uint8_t* data, size_t len);

    static std::string hex(const Algorithm algo, const std::vector<uint8_t>& data) {
        return hex(algo, data.data(), data.size());
    }

    static Algorithm parseAlgorithm(std::string_view name);
    static std::string_view toString(Algorithm algo);
};

}
