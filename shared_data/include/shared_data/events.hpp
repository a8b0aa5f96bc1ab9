#pragma once

#include <string_view>

/**
 * Names of the events travelling over the worker event channel.
 */
namespace SharedData::Events
{
    // client -> worker
    constexpr std::string_view startOperation{"start_operation"};
    constexpr std::string_view resolveConflicts{"resolve_conflicts"};
    constexpr std::string_view cancelOperation{"cancel_operation"};

    // worker -> client
    constexpr std::string_view progressUpdate{"progress_update"};
    constexpr std::string_view logMessage{"log_message"};
    constexpr std::string_view operationComplete{"operation_complete"};
    constexpr std::string_view operationCancelled{"operation_cancelled"};
    constexpr std::string_view scanComplete{"scan_complete"};
    constexpr std::string_view askForOverwrite{"ask_for_overwrite"};
}
