#include <shared_data/log_message.hpp>
#include <shared_data/shared_data.hpp>

namespace SharedData
{
    void to_json(nlohmann::json& j, LogMessage const& message)
    {
        j = nlohmann::json{
            {"data", message.data},
            {"type", message.type},
        };
    }
    void from_json(nlohmann::json const& j, LogMessage& message)
    {
        const auto& data = j.at("data");
        message.data = data.is_string() ? data.get<std::string>() : data.dump();
        message.type = valueOr(j, "type", std::string{"info"});
    }
}
