// Waveform plot renderer for ImGui
#pragma once

#include <imgui.h>
#include <vector>

namespace gui {

class WaveformView {
public:
    // Options
    float y_range = 1.0f;           // fixed amplitude axis [-y_range, y_range]
    bool show_grid = true;
    bool show_axis_labels = true;
    float line_thickness = 1.5f;
    ImVec4 color_line = ImVec4(0.27f, 0.62f, 0.96f, 1.00f);
    ImVec4 color_grid = ImVec4(0.40f, 0.40f, 0.40f, 0.60f);

    // Draw samples (oldest first) spanning `duration_seconds` within the given canvas
    void draw(ImDrawList* dl,
              const ImVec2& canvas_pos,
              float width,
              float height,
              const std::vector<float>& samples,
              float duration_seconds);

private:
    std::vector<ImVec2> points_;   // reused across frames

    static inline ImU32 to_u32(const ImVec4& c) {
        return IM_COL32((int)(c.x*255), (int)(c.y*255), (int)(c.z*255), (int)(c.w*255));
    }
};

} // namespace gui
