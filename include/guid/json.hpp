#pragma once

#include <guid/guid.hpp>
#include <guid/result.hpp>
#include <nlohmann/json.hpp>

namespace guid {

// A guid is a JSON string holding its text form.
void to_json(nlohmann::json& j, const Guid& g);

// Throws std::invalid_argument for a non-string or unparsable value, so
// j.get<Guid>() fails the way other nlohmann conversions do.
void from_json(const nlohmann::json& j, Guid& g);

// Non-throwing counterpart of from_json
Result<Guid> guid_from_json(const nlohmann::json& j);

} // namespace guid
