#include <limen/sync/LimiterError.hpp>

namespace limen {

ReentrancyError::ReentrancyError()
    : LimiterError("the current task is already holding one of this capacity limiter's tokens") {}

NotHoldingError::NotHoldingError()
    : LimiterError("the current task is not holding any of this capacity limiter's tokens") {}

OverReleaseError::OverReleaseError()
    : LimiterError("capacity limiter released too many times") {}

}
