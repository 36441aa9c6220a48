#pragma once
#include <functional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// StatusPanel — named value providers for the F3 status overlay.
//
// Stored as a World resource. Modules call watch(section, label, fn) while
// installing; StatusSystem evaluates every provider each frame the overlay
// is visible. value() looks a row up by name, mostly for tests.
//
// No Raylib dependency.
// ---------------------------------------------------------------------------

struct StatusPanel {
    using Provider = std::function<std::string()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string      title;
        std::vector<Row> rows;
    };

    bool visible = false;

    // Adds a row, creating the section on first use. A second watch() of the
    // same section/label pair replaces the provider.
    void watch(const std::string& section,
               const std::string& label,
               Provider fn) {
        for (auto& s : sections_) {
            if (s.title != section) continue;
            for (auto& r : s.rows) {
                if (r.label == label) {
                    r.fn = std::move(fn);
                    return;
                }
            }
            s.rows.push_back({label, std::move(fn)});
            return;
        }
        sections_.push_back({section, {{label, std::move(fn)}}});
    }

    // Current value of a row, or "-" if there is no such row.
    std::string value(const std::string& section, const std::string& label) const {
        for (const auto& s : sections_) {
            if (s.title != section) continue;
            for (const auto& r : s.rows) {
                if (r.label == label) return r.fn();
            }
        }
        return "-";
    }

    const std::vector<Section>& sections() const { return sections_; }

private:
    std::vector<Section> sections_;
};
