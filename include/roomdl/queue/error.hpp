// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace roomdl::queue {

enum class QueueErrc {
    success = 0,
    not_found,
    invalid_state,
    resolve_failed,
    invalid_name,
    state_unreadable,
    state_unwritable,
};

namespace detail {

struct QueueErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "roomdl::queue";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<QueueErrc>(ev)) {
            case QueueErrc::success:            return "Success";
            case QueueErrc::not_found:          return "No such item";
            case QueueErrc::invalid_state:      return "Operation not allowed in the item's current state";
            case QueueErrc::resolve_failed:     return "Could not resolve a download URL";
            case QueueErrc::invalid_name:       return "Item name is not a plain file name";
            case QueueErrc::state_unreadable:   return "Saved room state could not be read";
            case QueueErrc::state_unwritable:   return "Room state could not be saved";
            default:                            return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::QueueErrcCategory& queue_errc_category() noexcept {
    static detail::QueueErrcCategory category;
    return category;
}

inline std::error_code make_error_code(QueueErrc e) noexcept {
    return {static_cast<int>(e), queue_errc_category()};
}

} // namespace roomdl::queue

namespace std {

template<>
struct is_error_code_enum<roomdl::queue::QueueErrc> : true_type {};

} // namespace std
