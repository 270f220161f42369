#pragma once

#include <stdexcept>
#include <string>

namespace es::store {

// Raised by any JobStore operation whose backing I/O failed. Never raised for
// "not found"; lookups return an empty optional instead.
class StorageFault : public std::runtime_error {
public:
    explicit StorageFault(const std::string& what) : std::runtime_error(what) {}
};

}
