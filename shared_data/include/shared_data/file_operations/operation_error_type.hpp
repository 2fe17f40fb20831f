#pragma once

#include <utility/describe.hpp>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        OperationErrorType,
        ImplementationError, // This should never occur, it indicates a bug in the program:
        ConnectionError,
        ProtocolError,
        TransferError,
        PartialFailure,
        InvalidPath,
        OpenFailure,
        TargetFileNotGood,
        MergeFailure,
        ShortTransfer,
        Canceled);
}
