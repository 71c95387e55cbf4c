/**
 * @file control.cpp
 * @brief Naming and description helpers for control-plane types
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "meshdir/control.hpp"

#include <type_traits>

namespace meshdir {

namespace {

template <typename T>
inline constexpr bool always_false = false;

} // namespace

std::string admin_command_name(const AdminCommand& command) {
    return std::visit([](const auto& cmd) -> std::string {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, command::ListCachedItems>) return "ListCachedItems";
        else if constexpr (std::is_same_v<T, command::GetItem>) return "GetItem";
        else if constexpr (std::is_same_v<T, command::ListTextItems>) return "ListTextItems";
        else if constexpr (std::is_same_v<T, command::GetTextItem>) return "GetTextItem";
        else if constexpr (std::is_same_v<T, command::ListMediaItems>) return "ListMediaItems";
        else if constexpr (std::is_same_v<T, command::GetMediaItem>) return "GetMediaItem";
        else if constexpr (std::is_same_v<T, command::InsertItem>) return "InsertItem";
        else if constexpr (std::is_same_v<T, command::RemoveItem>) return "RemoveItem";
        else static_assert(always_false<T>, "unhandled admin command");
    }, command);
}

std::string describe_admin_result(const AdminResult& result) {
    return std::visit([](const auto& res) -> std::string {
        using T = std::decay_t<decltype(res)>;
        if constexpr (std::is_same_v<T, admin::Listing>) {
            return "Listing(" + std::to_string(res.items.size()) + " items)";
        } else if constexpr (std::is_same_v<T, admin::Record>) {
            return "Record(" + std::to_string(res.json.size()) + " bytes)";
        } else if constexpr (std::is_same_v<T, admin::NotFound>) {
            return "NotFound(" + res.id + ")";
        } else if constexpr (std::is_same_v<T, admin::InvalidId>) {
            return "InvalidId(" + res.id + ")";
        } else if constexpr (std::is_same_v<T, admin::Inserted>) {
            return std::string(res.replaced ? "Replaced(" : "Inserted(") + res.id + ")";
        } else if constexpr (std::is_same_v<T, admin::Removed>) {
            return "Removed(" + res.id + ")";
        } else if constexpr (std::is_same_v<T, admin::Unsupported>) {
            return "Unsupported(" + res.command + " on " + server_type_to_string(res.server_type) + ")";
        } else if constexpr (std::is_same_v<T, admin::Failed>) {
            return "Failed(" + res.reason + ")";
        } else {
            static_assert(always_false<T>, "unhandled admin result");
        }
    }, result);
}

} // namespace meshdir
