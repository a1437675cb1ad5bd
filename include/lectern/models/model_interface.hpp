#pragma once

#include "../export.hpp"
#include <json.hpp>

namespace lectern
{

// Common shape of request and response bodies.
class LECTERN_SERVER_API IModel
{
public:
    virtual ~IModel() = default;

    virtual bool validate() const = 0;
    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;
};

} // namespace lectern
