/**
 * @file    label_registry.cpp
 * @brief   Label bookkeeping
 * @license MIT
 */

#include "core/label_registry.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <set>

namespace bba {

namespace fs = std::filesystem;

namespace {

// Labels of a raw document in either layout, without full decoding
void collect_labels(const nlohmann::json& doc, std::set<std::string>& out) {
    const nlohmann::json* items = nullptr;
    if (doc.is_array()) {
        items = &doc;
    } else if (doc.is_object()) {
        auto it = doc.find("annotations");
        if (it != doc.end() && it->is_array()) {
            items = &*it;
        }
    }
    if (!items) return;

    for (const auto& item : *items) {
        if (!item.is_object()) continue;
        auto label = item.find("label");
        if (label != item.end() && label->is_string()) {
            auto text = label->get<std::string>();
            if (!text.empty()) {
                out.insert(std::move(text));
            }
        }
    }
}

}  // anonymous namespace

LabelRegistry::LabelRegistry(fs::path output_dir)
    : m_output_dir(std::move(output_dir))
{
}

LabelRegistry::ObserverId LabelRegistry::subscribe(Observer observer) {
    const ObserverId id = m_next_observer_id++;
    m_observers.emplace_back(id, std::move(observer));
    return id;
}

void LabelRegistry::unsubscribe(ObserverId id) {
    m_observers.erase(
        std::remove_if(m_observers.begin(), m_observers.end(),
                       [id](const auto& entry) { return entry.first == id; }),
        m_observers.end());
}

void LabelRegistry::set_current_label(const std::string& label) {
    if (label == m_current_label) return;

    m_current_label = label;
    spdlog::debug("[LabelRegistry] Current label: '{}'", label);

    auto observers = m_observers;
    for (auto& [id, observer] : observers) {
        observer(m_current_label);
    }
}

std::vector<std::string> LabelRegistry::all_unique_labels() const {
    std::set<std::string> labels;

    std::error_code ec;
    if (m_output_dir.empty() || !fs::is_directory(m_output_dir, ec)) {
        return {};
    }

    for (const auto& entry : fs::directory_iterator(m_output_dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;

        std::ifstream file(entry.path());
        if (!file.is_open()) continue;

        try {
            collect_labels(nlohmann::json::parse(file), labels);
        } catch (const nlohmann::json::exception& e) {
            spdlog::debug("[LabelRegistry] Skipping {}: {}", entry.path(), e.what());
        }
    }

    return {labels.begin(), labels.end()};
}

std::vector<std::pair<std::string, size_t>> LabelRegistry::label_counts(
    const Annotations& annotations)
{
    std::vector<std::pair<std::string, size_t>> counts;
    for (const auto& ann : annotations) {
        if (ann.label.empty()) continue;

        auto it = std::find_if(counts.begin(), counts.end(),
                               [&ann](const auto& c) { return c.first == ann.label; });
        if (it == counts.end()) {
            counts.emplace_back(ann.label, 1);
        } else {
            ++it->second;
        }
    }
    return counts;
}

std::vector<LabelEntry> LabelRegistry::build_label_list(const Annotations& annotations,
                                                        bool group_similar) {
    std::vector<LabelEntry> rows;

    if (group_similar) {
        for (const auto& [label, count] : label_counts(annotations)) {
            LabelEntry row;
            row.text = count > 1 ? fmt::format("{} ({})", label, count) : label;
            row.label = label;
            row.count = count;
            rows.push_back(std::move(row));
        }
        return rows;
    }

    for (size_t i = 0; i < annotations.size(); ++i) {
        const auto& label = annotations[i].label;
        if (label.empty()) continue;

        LabelEntry row;
        row.text = fmt::format("{} #{}", label, i + 1);
        row.label = label;
        row.index = i;
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace bba
