#include "tools/ArgumentReader.h"
#include "core/Errors.h"

namespace {
bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}
} // namespace

ArgumentReader::ArgumentReader(const nlohmann::json& raw) {
    if (raw.is_null()) {
        args = nlohmann::json::object();
    } else if (raw.is_object()) {
        args = raw;
    } else {
        throw ValidationError("Arguments must be a JSON object.");
    }
}

std::string ArgumentReader::requireString(const std::string& key, const std::string& fallback,
                                          const std::string& message) const {
    std::string value = fallback;
    if (args.contains(key) && !args[key].is_null()) {
        if (!args[key].is_string()) throw ValidationError(message);
        value = args[key].get<std::string>();
    }
    if (isBlank(value)) throw ValidationError(message);
    return value;
}

std::optional<std::string> ArgumentReader::optionalString(const std::string& key, const std::string& message) const {
    if (!args.contains(key) || args[key].is_null()) return std::nullopt;
    if (!args[key].is_string() || isBlank(args[key].get<std::string>())) {
        throw ValidationError(message);
    }
    return args[key].get<std::string>();
}

std::string ArgumentReader::stringOr(const std::string& key, const std::string& fallback) const {
    if (args.contains(key) && args[key].is_string()) return args[key].get<std::string>();
    return fallback;
}

int ArgumentReader::integer(const std::string& key, int fallback, int min, int max, const std::string& message) const {
    int value = fallback;
    if (args.contains(key) && !args[key].is_null()) {
        const auto& v = args[key];
        if (v.is_number_integer()) {
            value = v.get<int>();
        } else if (v.is_string()) {
            try {
                std::size_t used = 0;
                value = std::stoi(v.get<std::string>(), &used);
                if (used != v.get<std::string>().size()) throw ValidationError(message);
            } catch (const std::logic_error&) {
                throw ValidationError(message);
            }
        } else {
            throw ValidationError(message);
        }
    }
    if (value < min || value > max) throw ValidationError(message);
    return value;
}

const nlohmann::json& ArgumentReader::array(const std::string& key, const std::string& missingMessage,
                                            const std::string& emptyMessage) const {
    if (!args.contains(key) || !args[key].is_array()) throw ValidationError(missingMessage);
    if (args[key].empty()) throw ValidationError(emptyMessage);
    return args[key];
}

std::vector<std::string> ArgumentReader::stringArray(const std::string& key, const std::string& missingMessage,
                                                     const std::string& emptyMessage) const {
    std::vector<std::string> out;
    for (const auto& item : array(key, missingMessage, emptyMessage)) {
        if (!item.is_string() || isBlank(item.get<std::string>())) throw ValidationError(missingMessage);
        out.push_back(item.get<std::string>());
    }
    return out;
}
