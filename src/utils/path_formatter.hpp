/**
 * @file    path_formatter.hpp
 * @brief   UTF-8 conversions for std::filesystem::path and its fmt formatter
 * @license MIT
 *
 * @details
 * Paths reach the application as UTF-8 from SDL, the native dialogs, JSON
 * settings and the command line. They leave it as UTF-8 towards spdlog,
 * ImGui and JSON. On Windows path::string() yields the ANSI code page, so
 * every crossing goes through these helpers instead.
 *
 * Usage:
 *   spdlog::info("[ImageSource] Opened {}", dir);       // formatter below
 *   ImGui::TextUnformatted(bba::filename_utf8(p).c_str());
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace bba {

/**
 * Path as a UTF-8 std::string (u8string() is char8_t based in C++20)
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(reinterpret_cast<const char*>(u8str.data()), u8str.size());
}

inline std::string filename_utf8(const std::filesystem::path& path) {
    return to_utf8(path.filename());
}

/**
 * Build a path from UTF-8 text. Windows would otherwise read a narrow
 * string in the system code page and corrupt CJK file names.
 */
inline std::filesystem::path path_from_utf8(std::string_view utf8) {
    if (utf8.empty()) return {};
#ifdef _WIN32
    const int len = MultiByteToWideChar(CP_UTF8, 0, utf8.data(),
                                        static_cast<int>(utf8.size()), nullptr, 0);
    if (len <= 0) return std::filesystem::path(std::string(utf8));

    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()),
                        wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(std::string(utf8));
#endif
}

}  // namespace bba

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        const std::string u8 = bba::to_utf8(p);
        return fmt::formatter<std::string_view>::format(std::string_view(u8), ctx);
    }
};
