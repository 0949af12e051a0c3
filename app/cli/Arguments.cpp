#include "Arguments.h"

#include <stdexcept>

namespace Chunkwise {

Result<Arguments> Arguments::parse(const std::vector<std::string>& tokens,
                                   const std::set<std::string>& valueOptions,
                                   const std::set<std::string>& flags) {
    Arguments args;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];
        if (token.size() < 2 || token.compare(0, 2, "--") != 0) {
            args.positional_.push_back(token);
            continue;
        }

        if (valueOptions.count(token)) {
            if (i + 1 >= tokens.size()) {
                return Err<Arguments>(ErrorCode::InvalidArgument, "Option " + token + " needs a value");
            }
            args.values_[token] = tokens[++i];
        } else if (flags.count(token)) {
            args.flags_.insert(token);
        } else {
            return Err<Arguments>(ErrorCode::InvalidArgument, "Unknown option " + token);
        }
    }
    return args;
}

std::optional<std::string> Arguments::value(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Arguments::valueOr(const std::string& name, const std::string& fallback) const {
    auto found = value(name);
    return found ? *found : fallback;
}

Result<int> Arguments::intValue(const std::string& name, int fallback, int min, int max) const {
    auto found = value(name);
    if (!found) {
        return fallback;
    }

    int parsed = 0;
    try {
        size_t pos = 0;
        parsed = std::stoi(*found, &pos);
        if (pos != found->size()) {
            return Err<int>(ErrorCode::InvalidArgument, name + " expects a number, got '" + *found + "'");
        }
    } catch (const std::invalid_argument&) {
        return Err<int>(ErrorCode::InvalidArgument, name + " expects a number, got '" + *found + "'");
    } catch (const std::out_of_range&) {
        return Err<int>(ErrorCode::InvalidArgument, name + " value out of range");
    }

    if (parsed < min || parsed > max) {
        return Err<int>(ErrorCode::InvalidArgument, name + " must be between " + std::to_string(min) +
                                                    " and " + std::to_string(max));
    }
    return parsed;
}

} // namespace Chunkwise
