#pragma once

#include <ids/id.hpp>

DEFINE_ID_TYPE(OperationId)
DEFINE_ID_TYPE(ConflictSessionId)
