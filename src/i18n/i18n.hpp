/**
 * @file    i18n.hpp
 * @brief   Internationalization (i18n) support for the annotation tool
 * @license MIT
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <optional>
#include <fmt/core.h>
#include <fmt/format.h>

namespace bba::i18n {

// =============================================================================
// Supported Languages
// =============================================================================

enum class Language {
    English,       // en
    ChineseSimp,   // zh-CN
    ChineseTrad    // zh-TW
};

// =============================================================================
// Core API
// =============================================================================

/**
 * Initialize i18n system
 * @param lang_dir Directory containing language JSON files
 * @param lang Initial language (default: English)
 * @return true if the English fallback could be loaded
 */
bool init(const std::filesystem::path& lang_dir, Language lang = Language::English);

bool is_initialized();

Language current_language();

/**
 * Set language (reloads the language file)
 * @return false if the file is missing or invalid; English stays active
 */
bool set_language(Language lang);

/**
 * (Language, native display name) pairs for the language menu
 */
std::vector<std::pair<Language, std::string>> available_languages();

/**
 * Language code string ("en", "zh-CN", "zh-TW")
 */
const char* language_code(Language lang);

/**
 * Inverse of language_code; nullopt for an unknown code
 */
std::optional<Language> language_from_code(std::string_view code);

/**
 * Locate the language directory: next to the executable, then the
 * working directory, then the install prefix
 */
std::filesystem::path find_lang_dir();

/**
 * Translate a string key
 * @return Translated string, or the key itself if not found
 */
const char* tr(std::string_view key);

/**
 * Translate and format with fmt syntax. A broken translation falls back
 * to the unformatted text.
 */
template<typename... Args>
std::string trf(std::string_view key, Args&&... args) {
    try {
        return fmt::format(fmt::runtime(tr(key)), std::forward<Args>(args)...);
    } catch (const fmt::format_error&) {
        return std::string(tr(key));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

// For ImGui and other const char* consumers
#define TR(key) ::bba::i18n::tr(key)

// Formatted, returns std::string
#define TRF(key, ...) ::bba::i18n::trf(key, __VA_ARGS__)

}  // namespace bba::i18n
