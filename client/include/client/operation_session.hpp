#pragma once

#include <shared_data/file_operations/operation_request.hpp>
#include <ids/ids.hpp>

#include <chrono>
#include <cstdint>

namespace Client
{
    /**
     * @brief The operation currently in flight.
     */
    struct OperationSession
    {
        Ids::OperationId id;
        SharedData::OperationRequest request;
        std::uint64_t progressCurrent{0};
        std::uint64_t progressTotal{0};
        std::chrono::steady_clock::time_point startTime{std::chrono::steady_clock::now()};
    };
}
