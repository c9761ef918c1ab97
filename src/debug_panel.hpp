#pragma once
#include <functional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel — sectioned provider registry for the debug overlay.
//
// Stored as a World resource. Modules call watch(section, label, fn) while
// installing; DebugSystem evaluates every provider each render frame while
// the panel is visible. Visibility is flipped by the mapped ToggleDebug
// action.
//
// Zero engine dependencies — safe to include in any target.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
    };

    // One evaluated row, as drawn.
    struct Line {
        std::string section;
        std::string label;
        std::string value;
    };

    bool visible = false;

    void toggle() { visible = !visible; }

    // Appends a provider under section, creating the section on first use.
    // A second watch() with the same section and label replaces the provider.
    void watch(const std::string& section,
               const std::string& label,
               Provider fn) {
        for (auto& s : sections_) {
            if (s.title != section) continue;
            for (auto& r : s.rows) {
                if (r.label == label) { r.fn = std::move(fn); return; }
            }
            s.rows.push_back({label, std::move(fn)});
            return;
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    const std::vector<Section>& sections() const { return sections_; }

    // Evaluates every provider in registration order.
    std::vector<Line> snapshot() const {
        std::vector<Line> lines;
        for (const auto& s : sections_) {
            for (const auto& r : s.rows) lines.push_back({s.title, r.label, r.fn ? r.fn() : "-"});
        }
        return lines;
    }

private:
    std::vector<Section> sections_;
};
