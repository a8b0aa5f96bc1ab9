#include <shared_data/file_operations/operation_kind.hpp>

#include <stdexcept>

namespace SharedData
{
    std::string_view toWireName(OperationKind kind)
    {
        switch (kind)
        {
            case OperationKind::Copy:
                return "copy";
            case OperationKind::Move:
                return "move";
            case OperationKind::FindDuplicates:
                return "find_duplicates";
            case OperationKind::CloudBackup:
                return "cloud_backup";
            case OperationKind::CloudRestore:
                return "cloud_restore";
        }
        throw std::invalid_argument("Invalid operation kind");
    }

    std::optional<OperationKind> operationKindFromWireName(std::string_view name)
    {
        if (name == "copy" || name == "copying")
            return OperationKind::Copy;
        if (name == "move" || name == "moving")
            return OperationKind::Move;
        if (name == "find_duplicates")
            return OperationKind::FindDuplicates;
        if (name == "cloud_backup")
            return OperationKind::CloudBackup;
        if (name == "cloud_restore")
            return OperationKind::CloudRestore;
        return std::nullopt;
    }

    std::string toDisplayString(OperationKind kind)
    {
        switch (kind)
        {
            case OperationKind::Copy:
                return "Copy";
            case OperationKind::Move:
                return "Move";
            case OperationKind::FindDuplicates:
                return "Find duplicates";
            case OperationKind::CloudBackup:
                return "Cloud backup";
            case OperationKind::CloudRestore:
                return "Cloud restore";
        }
        return "Unknown";
    }

    void to_json(nlohmann::json& j, OperationKind const& kind)
    {
        j = std::string{toWireName(kind)};
    }
    void from_json(nlohmann::json const& j, OperationKind& kind)
    {
        const auto name = j.get<std::string>();
        const auto decoded = operationKindFromWireName(name);
        if (!decoded)
            throw std::invalid_argument("Invalid operation name: " + name);
        kind = *decoded;
    }
}
