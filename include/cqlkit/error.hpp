// SPDX-License-Identifier: MIT

// include/cqlkit/error.hpp
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cqlkit {

/// Error codes for statement generation and Op execution.
enum class ErrorCode {
    // Validation (nothing was generated or dispatched)
    InvalidArgument,         ///< Malformed call argument (empty assignment, empty field list)
    InvalidKeys,             ///< Key layout rejected by TableDescriptor::Create
    MissingKeyField,         ///< Write omits a required id/index/time/key field
    IncompletePartitionKey,  ///< Relations do not fix every partition-key field
    IncompletePrimaryKey,    ///< Update relations do not fix the full primary key
    KeyFieldUpdate,          ///< Partial write tries to assign a primary-key field
    InvalidBucketRange,      ///< Time range start after end, or bucketer does not advance

    // Generation (operation incompatible with the table layout)
    UnknownField,            ///< Field is not declared on the table
    InvalidRelation,         ///< Relation cannot be expressed against this key layout
    ReadInBatch,             ///< Atomic batch contains a read
    MixedExecutors,          ///< Atomic batch spans steps bound to different executors

    // Execution (surfaced from the executor boundary or result handling)
    ExecutionFailed,         ///< Executor reported a failure
    Cancelled,               ///< Stop was requested before a statement was dispatched
    DeadlineExceeded,        ///< Deadline passed before a statement was dispatched
    NotFound,                ///< Single-row read matched no row
    DecodeFailed,            ///< Row codec could not populate the output value
};

/// Coarse classification of an ErrorCode.
enum class ErrorKind {
    Validation,
    Generation,
    Execution,
};

/// What the store may have applied when an Op failed.
enum class Effect {
    None,          ///< Nothing happened
    Partial,       ///< Sequential run failed after a write was dispatched; earlier writes may be applied
    AllOrNothing,  ///< Atomic batch failed; the store applied all of it or none of it
};

/// Error payload carried by every std::expected result in cqlkit.
struct Error {
    ErrorCode code;                    ///< Classified error code
    std::string message;               ///< Human-readable description
    Effect effect = Effect::None;      ///< Side effects that may have taken place
    std::size_t statements_applied = 0;  ///< Statements dispatched before the failure
};

/// Return the kind (validation, generation, execution) of an error code.
constexpr ErrorKind error_kind(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidKeys:
        case ErrorCode::MissingKeyField:
        case ErrorCode::IncompletePartitionKey:
        case ErrorCode::IncompletePrimaryKey:
        case ErrorCode::KeyFieldUpdate:
        case ErrorCode::InvalidBucketRange:
            return ErrorKind::Validation;
        case ErrorCode::UnknownField:
        case ErrorCode::InvalidRelation:
        case ErrorCode::ReadInBatch:
        case ErrorCode::MixedExecutors:
            return ErrorKind::Generation;
        case ErrorCode::ExecutionFailed:
        case ErrorCode::Cancelled:
        case ErrorCode::DeadlineExceeded:
        case ErrorCode::NotFound:
        case ErrorCode::DecodeFailed:
            return ErrorKind::Execution;
    }
    return ErrorKind::Execution;
}

/// Return a short category string for an error code (e.g. "validation", "result").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidKeys:
            return "definition";
        case ErrorCode::MissingKeyField:
        case ErrorCode::IncompletePartitionKey:
        case ErrorCode::IncompletePrimaryKey:
        case ErrorCode::KeyFieldUpdate:
        case ErrorCode::InvalidBucketRange:
            return "validation";
        case ErrorCode::UnknownField:
        case ErrorCode::InvalidRelation:
            return "generation";
        case ErrorCode::ReadInBatch:
        case ErrorCode::MixedExecutors:
            return "batch";
        case ErrorCode::ExecutionFailed:
            return "execution";
        case ErrorCode::Cancelled:
        case ErrorCode::DeadlineExceeded:
            return "cancellation";
        case ErrorCode::NotFound:
        case ErrorCode::DecodeFailed:
            return "result";
    }
    return "unknown";
}

/// Return the enumerator name of an error code.
constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidKeys: return "InvalidKeys";
        case ErrorCode::MissingKeyField: return "MissingKeyField";
        case ErrorCode::IncompletePartitionKey: return "IncompletePartitionKey";
        case ErrorCode::IncompletePrimaryKey: return "IncompletePrimaryKey";
        case ErrorCode::KeyFieldUpdate: return "KeyFieldUpdate";
        case ErrorCode::InvalidBucketRange: return "InvalidBucketRange";
        case ErrorCode::UnknownField: return "UnknownField";
        case ErrorCode::InvalidRelation: return "InvalidRelation";
        case ErrorCode::ReadInBatch: return "ReadInBatch";
        case ErrorCode::MixedExecutors: return "MixedExecutors";
        case ErrorCode::ExecutionFailed: return "ExecutionFailed";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::DeadlineExceeded: return "DeadlineExceeded";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::DecodeFailed: return "DecodeFailed";
    }
    return "Unknown";
}

}  // namespace cqlkit
