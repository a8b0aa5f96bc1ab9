#pragma once

#include <client/control_surface.hpp>
#include <client/duplicate_scan_session.hpp>

#include <gmock/gmock.h>

namespace Client::Test
{
    class ControlSurfaceMock : public Client::ControlSurface
    {
      public:
        MOCK_METHOD(void, operationControlsEnabled, (bool enabled), (override));
        MOCK_METHOD(void, cancelEnabled, (bool enabled), (override));
        MOCK_METHOD(void, cloudControlsEnabled, (bool enabled), (override));
        MOCK_METHOD(void, notify, (Severity severity, std::string const& message), (override));
        MOCK_METHOD(void, showProgress, (std::uint64_t current, std::uint64_t total), (override));
        MOCK_METHOD(void, promptConflict, (std::string const& path, std::size_t index, std::size_t count), (override));
        MOCK_METHOD(void, closeConflictPrompt, (), (override));
        MOCK_METHOD(void, showDuplicateScanResult, (DuplicateScanSession const& session), (override));
        MOCK_METHOD(void, appendWorkerLog, (std::string const& type, std::string const& message), (override));
        MOCK_METHOD(void, requestListingRefresh, (), (override));
    };
}
