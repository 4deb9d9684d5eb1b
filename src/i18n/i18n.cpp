/**
 * @file    i18n.cpp
 * @brief   Translation tables: JSON loading and key lookup
 * @license MIT
 */

#include "i18n.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <unordered_map>
#include <unordered_set>

namespace bba::i18n {

namespace fs = std::filesystem;

namespace {

using StringTable = std::unordered_map<std::string, std::string>;

// =============================================================================
// Tables
// =============================================================================

struct Tables {
    bool ready = false;
    Language active = Language::English;
    fs::path dir;
    StringTable english;
    StringTable active_strings;

    // Keys without a translation; node storage keeps their c_str() valid
    std::unordered_set<std::string> untranslated;
};

Tables& tables() {
    static Tables t;
    return t;
}

/**
 * JSON pointer "/menu/file.open_image" -> lookup key "menu.file.open_image"
 */
std::string pointer_to_key(const std::string& pointer) {
    std::string key;
    key.reserve(pointer.size());
    for (size_t i = 1; i < pointer.size(); ++i) {
        const char c = pointer[i];
        if (c == '/') {
            key += '.';
        } else if (c == '~' && i + 1 < pointer.size()) {
            key += pointer[++i] == '1' ? '/' : '~';
        } else {
            key += c;
        }
    }
    return key;
}

/**
 * Read one language table. Nested objects become dot keys; the top-level
 * "meta" block and non-string leaves are skipped.
 */
std::optional<StringTable> read_table(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("[i18n] Cannot open language file: {}", path);
        return std::nullopt;
    }

    const auto doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        spdlog::error("[i18n] Invalid language file: {}", path);
        return std::nullopt;
    }

    const auto flat = doc.flatten();
    StringTable table;
    for (const auto& [pointer, value] : flat.items()) {
        if (!value.is_string() || pointer.rfind("/meta/", 0) == 0) {
            continue;
        }
        table.emplace(pointer_to_key(pointer), value.get<std::string>());
    }

    spdlog::debug("[i18n] {} strings in {}", table.size(), path);
    return table;
}

fs::path executable_dir() {
    std::error_code ec;
    const fs::path self = fs::read_symlink("/proc/self/exe", ec);
    return ec ? fs::current_path(ec) : self.parent_path();
}

}  // namespace

// =============================================================================
// Language Selection
// =============================================================================

bool init(const fs::path& lang_dir, Language lang) {
    auto& t = tables();
    t = Tables{};
    t.dir = lang_dir;

    auto english = read_table(lang_dir / "en.json");
    if (!english) {
        spdlog::error("[i18n] English table missing in {}", lang_dir);
        return false;
    }
    t.english = std::move(*english);
    t.active_strings = t.english;
    t.ready = true;

    if (lang == Language::English) {
        spdlog::info("[i18n] Using English");
        return true;
    }
    return set_language(lang);
}

bool is_initialized() {
    return tables().ready;
}

Language current_language() {
    return tables().active;
}

bool set_language(Language lang) {
    auto& t = tables();
    if (!t.ready) {
        spdlog::warn("[i18n] set_language called before init");
        return false;
    }

    std::optional<StringTable> strings;
    if (lang == Language::English) {
        strings = t.english;
    } else {
        strings = read_table(t.dir / (std::string(language_code(lang)) + ".json"));
    }

    if (!strings) {
        spdlog::warn("[i18n] Keeping English, no usable table for {}", language_code(lang));
        t.active_strings = t.english;
        t.active = Language::English;
        return false;
    }

    t.active_strings = std::move(*strings);
    t.active = lang;
    spdlog::info("[i18n] Language set to {}", language_code(lang));
    return true;
}

std::vector<std::pair<Language, std::string>> available_languages() {
    return {
        {Language::English,     "English"},
        {Language::ChineseSimp, "简体中文"},
        {Language::ChineseTrad, "繁體中文"}
    };
}

const char* language_code(Language lang) {
    switch (lang) {
        case Language::English:     return "en";
        case Language::ChineseSimp: return "zh-CN";
        case Language::ChineseTrad: return "zh-TW";
    }
    return "en";
}

std::optional<Language> language_from_code(std::string_view code) {
    for (const auto& entry : available_languages()) {
        if (code == language_code(entry.first)) {
            return entry.first;
        }
    }
    return std::nullopt;
}

fs::path find_lang_dir() {
    std::error_code ec;
    const fs::path exe = executable_dir();
    const fs::path cwd = fs::current_path(ec);

    const fs::path candidates[] = {
        exe / "lang",
        cwd / "lang",
        cwd / "resources" / "lang",
        exe.parent_path() / "lang",
        "/usr/share/bbox-annotator/lang",
    };
    for (const auto& dir : candidates) {
        if (fs::exists(dir / "en.json", ec)) {
            return dir;
        }
    }

    // init() reports the missing table
    return candidates[0];
}

// =============================================================================
// Lookup
// =============================================================================

const char* tr(std::string_view key) {
    auto& t = tables();
    const std::string k(key);

    if (auto it = t.active_strings.find(k); it != t.active_strings.end()) {
        return it->second.c_str();
    }
    if (auto it = t.english.find(k); it != t.english.end()) {
        return it->second.c_str();
    }

    const auto [it, inserted] = t.untranslated.insert(k);
    if (inserted && !k.empty()) {
        spdlog::debug("[i18n] Missing translation: {}", k);
    }
    return it->c_str();
}

}  // namespace bba::i18n
