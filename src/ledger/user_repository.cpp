#include "ledger/user_repository.h"
#include "ledger/repository_support.h"
#include "transaction/connection_manager.h"
#include "utils/id_generator.h"
#include "utils/logger.h"
#include "validation/request_validators.h"
#include "validation/validator.h"

namespace fiscus {
namespace ledger {

using storage::toValue;

namespace {

const char* kUserColumns = "id, username, email, password_hash, created_at, updated_at";

} // namespace

UserRepository::UserRepository(ConnectionManager& conn, utils::PasswordHasher hasher)
    : conn_(conn)
    , hasher_(hasher) {}

User UserRepository::create(const validation::CreateUserRequest& request) {
    requireValid(validation::validateCreateUserRequest(request));

    const std::string username = validation::trim(request.username);
    std::optional<std::string> email;
    if (request.email && !validation::trim(*request.email).empty()) {
        email = validation::trim(*request.email);
    }

    if (conn_.queryOne("SELECT id FROM users WHERE username = ?", {toValue(username)})) {
        throw ConflictError("Username already exists: " + username);
    }
    if (email && conn_.queryOne("SELECT id FROM users WHERE email = ?", {toValue(*email)})) {
        throw ConflictError("Email already registered");
    }

    const std::string id = utils::IdGenerator::uuidV4();
    conn_.runTransactionOrThrow({
        {"INSERT INTO users (id, username, email, password_hash) VALUES (?, ?, ?, ?)",
         {toValue(id), toValue(username), toValue(email), toValue(hasher_.hash(request.password))}}
    });

    FISCUS_INFO("Created user {}", id);
    auto created = findById(id);
    if (!created) {
        throw NotFoundError("User", id);
    }
    return *created;
}

std::optional<User> UserRepository::findById(const std::string& id) {
    auto row = conn_.queryOne(std::string("SELECT ") + kUserColumns + " FROM users WHERE id = ?",
                              {toValue(id)});
    if (!row) return std::nullopt;
    return User::fromRow(*row);
}

std::optional<User> UserRepository::findByUsername(const std::string& username) {
    auto row = conn_.queryOne(std::string("SELECT ") + kUserColumns + " FROM users WHERE username = ?",
                              {toValue(validation::trim(username))});
    if (!row) return std::nullopt;
    return User::fromRow(*row);
}

bool UserRepository::verifyPassword(const std::string& username, const std::string& password) {
    auto user = findByUsername(username);
    if (!user) return false;
    return hasher_.verify(password, user->password_hash);
}

} // namespace ledger
} // namespace fiscus
