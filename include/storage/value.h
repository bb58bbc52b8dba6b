#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace fiscus {
namespace storage {

/// Bindable / readable SQL value
using Value = std::variant<
    std::monostate,           // NULL
    bool,                     // bound as INTEGER 0/1
    int64_t,                  // INTEGER
    double,                   // REAL
    std::string               // TEXT
>;

using Params = std::vector<Value>;

// Explicit conversions. Plain string literals would otherwise pick bool.
inline Value toValue(const std::string& s) { return Value{s}; }
inline Value toValue(const char* s) { return s ? Value{std::string(s)} : Value{}; }
inline Value toValue(double d) { return Value{d}; }
inline Value toValue(int64_t i) { return Value{i}; }
inline Value toValue(int i) { return Value{static_cast<int64_t>(i)}; }
inline Value toValue(bool b) { return Value{b}; }
inline Value toValue(std::nullopt_t) { return Value{}; }

template<typename T>
Value toValue(const std::optional<T>& opt) {
    return opt ? toValue(*opt) : Value{};
}

bool isNull(const Value& v);
/// Diagnostic rendering: NULL, numbers, 'quoted text'
std::string renderValue(const Value& v);
std::string renderParams(const Params& params);
nlohmann::json valueToJson(const Value& v);

/// One result row: column name -> value, with lenient typed accessors.
class Row {
public:
    Row() = default;

    void set(const std::string& column, Value v) { columns_[column] = std::move(v); }
    bool has(const std::string& column) const { return columns_.count(column) > 0; }
    bool isNull(const std::string& column) const;
    const Value& get(const std::string& column) const;

    std::string getString(const std::string& column, const std::string& def = {}) const;
    std::optional<std::string> getOptionalString(const std::string& column) const;
    int64_t getInt(const std::string& column, int64_t def = 0) const;
    std::optional<int64_t> getOptionalInt(const std::string& column) const;
    double getDouble(const std::string& column, double def = 0.0) const;
    bool getBool(const std::string& column, bool def = false) const;

    size_t size() const { return columns_.size(); }
    const std::map<std::string, Value>& columns() const { return columns_; }

    nlohmann::json toJson() const;

private:
    std::map<std::string, Value> columns_;
};

/// Positional-parameter statement (`?` placeholders)
struct Statement {
    std::string sql;
    Params params;
};

/// Outcome of a single write
struct CommandResult {
    int64_t rows_affected = 0;
    int64_t last_insert_id = 0;
};

} // namespace storage
} // namespace fiscus
