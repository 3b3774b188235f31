#include <guid/json.hpp>
#include <stdexcept>

namespace guid {

void to_json(nlohmann::json& j, const Guid& g) {
    j = g.to_string();
}

Result<Guid> guid_from_json(const nlohmann::json& j) {
    if (!j.is_string()) {
        return GuidError(GuidError::Parse,
            std::string("guid must be a JSON string, got ") + j.type_name());
    }
    return Guid::parse(j.get<std::string>());
}

void from_json(const nlohmann::json& j, Guid& g) {
    auto r = guid_from_json(j);
    if (r.is_err()) {
        throw std::invalid_argument(r.error().format());
    }
    g = r.value();
}

} // namespace guid
