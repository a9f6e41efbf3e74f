#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace vtdesigner {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        InvalidData,
        InvalidState,
        PoolValidation,
        IdConflict,
        IdSpaceExhausted,
        ObjectNotFound,
        IllegalChild,
        InvalidName,
        FileError,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error invalid_data(dp::String msg = "") noexcept { return Error(ErrorCode::InvalidData, std::move(msg)); }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error pool_validation(dp::String msg = "") noexcept {
            return Error(ErrorCode::PoolValidation, std::move(msg));
        }
        static Error id_conflict(ObjectID id) noexcept {
            return Error(ErrorCode::IdConflict, "object ID already in use: " + dp::String(std::to_string(id)));
        }
        static Error id_space_exhausted() noexcept {
            return Error(ErrorCode::IdSpaceExhausted, "no free object ID left in the 16-bit range");
        }
        static Error object_not_found(ObjectID id) noexcept {
            return Error(ErrorCode::ObjectNotFound, "object not found: " + dp::String(std::to_string(id)));
        }
        static Error illegal_child(dp::String msg = "") noexcept {
            return Error(ErrorCode::IllegalChild, std::move(msg));
        }
        static Error invalid_name(dp::String msg = "") noexcept { return Error(ErrorCode::InvalidName, std::move(msg)); }
        static Error file_error(dp::String msg = "") noexcept { return Error(ErrorCode::FileError, std::move(msg)); }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace vtdesigner
