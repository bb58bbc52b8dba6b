#pragma once

#include <optional>
#include <string>
#include "ledger/models.h"
#include "utils/password_hasher.h"
#include "validation/requests.h"

namespace fiscus {

class ConnectionManager;

namespace ledger {

/// Users: the owners every other entity hangs off. Passwords are stored
/// only as PasswordHasher encodings.
class UserRepository {
public:
    UserRepository(ConnectionManager& conn, utils::PasswordHasher hasher = utils::PasswordHasher());

    /// Throws ValidationFailed, ConflictError (username or email taken)
    User create(const validation::CreateUserRequest& request);

    std::optional<User> findById(const std::string& id);
    std::optional<User> findByUsername(const std::string& username);

    /// False for unknown users as well as wrong passwords
    bool verifyPassword(const std::string& username, const std::string& password);

private:
    ConnectionManager& conn_;
    utils::PasswordHasher hasher_;
};

} // namespace ledger
} // namespace fiscus
