#include <shared_data/file_operations/progress_update.hpp>

namespace SharedData
{
    namespace
    {
        std::uint64_t nonNegative(nlohmann::json const& j)
        {
            if (j.is_number_unsigned())
                return j.get<std::uint64_t>();
            const auto value = j.get<std::int64_t>();
            return value < 0 ? 0 : static_cast<std::uint64_t>(value);
        }
    }

    void to_json(nlohmann::json& j, ProgressUpdate const& progress)
    {
        j = nlohmann::json{
            {"current", progress.current},
            {"total", progress.total},
        };
    }
    void from_json(nlohmann::json const& j, ProgressUpdate& progress)
    {
        progress.current = nonNegative(j.at("current"));
        progress.total = nonNegative(j.at("total"));
    }
}
