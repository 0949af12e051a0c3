#pragma once

#include "Result.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Chunkwise {

/**
 * @brief Options and positionals of one CLI command
 *
 * `--name value` for value options, `--name` for flags; everything else
 * is positional. Unknown options are rejected.
 */
class Arguments {
public:
    Arguments() = default;

    static Result<Arguments> parse(const std::vector<std::string>& tokens,
                                   const std::set<std::string>& valueOptions,
                                   const std::set<std::string>& flags);

    const std::vector<std::string>& positional() const { return positional_; }

    std::optional<std::string> value(const std::string& name) const;
    std::string valueOr(const std::string& name, const std::string& fallback) const;
    bool flag(const std::string& name) const { return flags_.count(name) > 0; }

    /// Integer option in [@p min, @p max]; InvalidArgument otherwise
    Result<int> intValue(const std::string& name, int fallback, int min, int max) const;

private:
    std::vector<std::string> positional_;
    std::map<std::string, std::string> values_;
    std::set<std::string> flags_;
};

} // namespace Chunkwise
