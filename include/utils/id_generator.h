#pragma once

#include <string>

namespace fiscus {
namespace utils {

/// Random (version 4) UUIDs for entity primary keys
class IdGenerator {
public:
    /// Lowercase canonical form; throws std::runtime_error if the CSPRNG fails
    static std::string uuidV4();
};

} // namespace utils
} // namespace fiscus
