#include "storage/value.h"

#include <sstream>

namespace fiscus {
namespace storage {

namespace {
const Value kNull{};
}

bool isNull(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

std::string renderValue(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + x + "'";
        } else {
            std::ostringstream os;
            os << x;
            return os.str();
        }
    }, v);
}

std::string renderParams(const Params& params) {
    std::string out = "[";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) out += ", ";
        out += renderValue(params[i]);
    }
    out += "]";
    return out;
}

nlohmann::json valueToJson(const Value& v) {
    return std::visit([](const auto& x) -> nlohmann::json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return x;
        }
    }, v);
}

bool Row::isNull(const std::string& column) const {
    auto it = columns_.find(column);
    return it == columns_.end() || storage::isNull(it->second);
}

const Value& Row::get(const std::string& column) const {
    auto it = columns_.find(column);
    return it == columns_.end() ? kNull : it->second;
}

std::string Row::getString(const std::string& column, const std::string& def) const {
    auto s = getOptionalString(column);
    return s ? *s : def;
}

std::optional<std::string> Row::getOptionalString(const std::string& column) const {
    const Value& v = get(column);
    if (auto s = std::get_if<std::string>(&v)) return *s;
    if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) {
        std::ostringstream os;
        os << *d;
        return os.str();
    }
    if (auto b = std::get_if<bool>(&v)) return std::string(*b ? "1" : "0");
    return std::nullopt;
}

int64_t Row::getInt(const std::string& column, int64_t def) const {
    auto i = getOptionalInt(column);
    return i ? *i : def;
}

std::optional<int64_t> Row::getOptionalInt(const std::string& column) const {
    const Value& v = get(column);
    if (auto i = std::get_if<int64_t>(&v)) return *i;
    if (auto d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    if (auto b = std::get_if<bool>(&v)) return *b ? 1 : 0;
    if (auto s = std::get_if<std::string>(&v)) {
        try {
            return std::stoll(*s);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

double Row::getDouble(const std::string& column, double def) const {
    const Value& v = get(column);
    if (auto d = std::get_if<double>(&v)) return *d;
    if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (auto s = std::get_if<std::string>(&v)) {
        try {
            return std::stod(*s);
        } catch (const std::exception&) {
            return def;
        }
    }
    return def;
}

bool Row::getBool(const std::string& column, bool def) const {
    const Value& v = get(column);
    if (auto b = std::get_if<bool>(&v)) return *b;
    if (auto i = std::get_if<int64_t>(&v)) return *i != 0;
    if (auto d = std::get_if<double>(&v)) return *d != 0.0;
    return def;
}

nlohmann::json Row::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [k, v] : columns_) {
        j[k] = valueToJson(v);
    }
    return j;
}

} // namespace storage
} // namespace fiscus
