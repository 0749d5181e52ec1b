#pragma once
#include <stdexcept>
#include <string>

/*
-------------------------------------------------------------------------------
 errors.hpp - Exception taxonomy
-------------------------------------------------------------------------------
  - NoDataError        aggregation/analytics found zero qualifying records.
                       Services recover by returning an empty/absent result.
  - NotTrainedError    a model was asked to predict before train/load.
                       The ML service recovers by training lazily.
  - InvalidInputError  malformed feature rows, out-of-range scores, bad config.
                       Reported to the caller.
  - StorageError       the record store failed a query.

The low-level db_* functions keep returning bool; the classes above are thrown
from the analytics/ML layers and from the record-source adapters.
-------------------------------------------------------------------------------
*/

struct InsightError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct NoDataError : InsightError {
    using InsightError::InsightError;
};

struct NotTrainedError : InsightError {
    using InsightError::InsightError;
};

struct InvalidInputError : InsightError {
    using InsightError::InsightError;
};

struct StorageError : InsightError {
    using InsightError::InsightError;
};
