#include "with_uint64.hpp"
#include "nlohmann/json.hpp"

IsUint64::operator nlohmann::json() const
{
    return nlohmann::json(val);
}
