#pragma once

#include <string_view>

#include <gmock/gmock.h>

#include "wfroute/internal/invocation/signal_with_start_batch.h"

namespace wfroute::tests {

struct SignalWithStartBatchMock
    : public ::wfroute::internal::invocation::SignalWithStartBatch {
  MOCK_METHOD(void, start,
              (::wfroute::internal::handle::WorkflowHandle &,
               const ::wfroute::internal::handle::Arguments &),
              (override));
  MOCK_METHOD(void, signal,
              (::wfroute::internal::handle::WorkflowHandle &, std::string_view,
               const ::wfroute::internal::handle::Arguments &),
              (override));
};

} // namespace wfroute::tests
