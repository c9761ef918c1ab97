#include "debug.hpp"
#include "../debug_panel.hpp"
#include <raylib.h>
#include <string>

static constexpr int   PAD      = 8;
static constexpr int   PANEL_W  = 230;
static constexpr int   ROW_H    = 15;
static constexpr int   FONT_SM  = 10;
static constexpr int   FONT_MD  = 11;
static constexpr int   LABEL_W  = 112;  // pixels from content-left to value column
static constexpr Color BG       = {20,  20,  20,  210};
static constexpr Color DIVIDER  = {80,  80,  80,  200};
static constexpr Color C_TITLE  = {160, 160, 160, 255};
static constexpr Color C_HEADER = {210, 190, 80,  255};
static constexpr Color C_LABEL  = {180, 180, 180, 255};
static constexpr Color C_VALUE  = {255, 255, 255, 255};

void DebugSystem::Update(ecs::World& world) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel || !panel->visible) return;

    const auto& sections = panel->sections();
    const auto lines = panel->snapshot();

    // --- Panel height: title, one header per section, one row per line ---
    const int title_area = ROW_H + PAD;
    const int content_h  = static_cast<int>(sections.size() + lines.size()) * ROW_H
                         + static_cast<int>(sections.size()) * 4;
    const int panel_h    = PAD + title_area + content_h + PAD;

    const int ox = GetScreenWidth() - PANEL_W - 10, oy = 10;
    DrawRectangle(ox, oy, PANEL_W, panel_h, BG);
    DrawRectangleLines(ox, oy, PANEL_W, panel_h, DIVIDER);

    int cy = oy + PAD;
    DrawText("DEBUG", ox + PAD, cy, FONT_MD, C_TITLE);
    DrawText("[F3]", ox + PANEL_W - PAD - MeasureText("[F3]", FONT_SM) - 2, cy + 1, FONT_SM, DIVIDER);
    cy += ROW_H + PAD;

    const std::string* current = nullptr;
    for (const auto& line : lines) {
        if (!current || *current != line.section) {
            current = &line.section;
            DrawLine(ox + PAD, cy, ox + PANEL_W - PAD, cy, DIVIDER);
            cy += 4;
            DrawText(line.section.c_str(), ox + PAD, cy, FONT_MD, C_HEADER);
            cy += ROW_H;
        }
        DrawText(line.label.c_str(), ox + PAD + 4, cy, FONT_SM, C_LABEL);
        DrawText(line.value.c_str(), ox + PAD + 4 + LABEL_W, cy, FONT_SM, C_VALUE);
        cy += ROW_H;
    }
}
