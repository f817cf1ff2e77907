#include "waveform_view.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <cstdio>

namespace gui {

void WaveformView::draw(ImDrawList* dl,
                        const ImVec2& canvas_pos,
                        float width,
                        float height,
                        const std::vector<float>& samples,
                        float duration_seconds) {
    if (!dl || width <= 0 || height <= 0) return;

    // Background frame
    dl->AddRectFilled(canvas_pos, ImVec2(canvas_pos.x + width, canvas_pos.y + height), IM_COL32(20,20,20,255));
    dl->AddRect(canvas_pos, ImVec2(canvas_pos.x + width, canvas_pos.y + height), IM_COL32(60,60,60,255));

    const float mid_y = canvas_pos.y + height * 0.5f;
    const float half_h = height * 0.5f;
    const float range = y_range > 0.0f ? y_range : 1.0f;
    auto y_for = [&](float v) {
        float c = std::clamp(v / range, -1.0f, 1.0f);
        return mid_y - c * half_h;
    };

    if (show_grid) {
        ImU32 col = to_u32(color_grid);
        dl->AddLine(ImVec2(canvas_pos.x, mid_y), ImVec2(canvas_pos.x + width, mid_y), col, 1.0f);
        for (float v : {-0.5f, 0.5f}) {
            float y = y_for(v * range);
            dl->AddLine(ImVec2(canvas_pos.x, y), ImVec2(canvas_pos.x + width, y), col, 0.5f);
        }
        // Ten time divisions
        for (int i = 1; i < 10; ++i) {
            float x = canvas_pos.x + width * (float)i / 10.0f;
            dl->AddLine(ImVec2(x, canvas_pos.y), ImVec2(x, canvas_pos.y + height), col, 0.5f);
        }
    }

    if (show_axis_labels) {
        ImU32 col = IM_COL32(200,200,200,220);
        char buf[32];
        for (int i = 0; i <= 10; i += 2) {
            float x = canvas_pos.x + width * (float)i / 10.0f;
            std::snprintf(buf, sizeof(buf), "%.2f s", duration_seconds * (float)i / 10.0f);
            ImVec2 ts = ImGui::CalcTextSize(buf);
            float tx = std::clamp(x - ts.x * 0.5f, canvas_pos.x + 2.0f, canvas_pos.x + width - ts.x - 2.0f);
            dl->AddText(ImVec2(tx, canvas_pos.y + height - ts.y - 2.0f), col, buf);
        }
        std::snprintf(buf, sizeof(buf), "%+.1f", range);
        dl->AddText(ImVec2(canvas_pos.x + 4.0f, canvas_pos.y + 2.0f), col, buf);
        std::snprintf(buf, sizeof(buf), "%+.1f", -range);
        dl->AddText(ImVec2(canvas_pos.x + 4.0f, canvas_pos.y + height - 2.0f * ImGui::GetFontSize()), col, buf);
    }

    const int n = static_cast<int>(samples.size());
    if (n < 2) return;

    // One min/max pair per pixel column keeps long windows cheap to draw
    const int columns = std::max(1, static_cast<int>(width));
    points_.clear();
    if (n <= columns * 2) {
        points_.reserve(n);
        for (int i = 0; i < n; ++i) {
            float x = canvas_pos.x + width * (float)i / (float)(n - 1);
            points_.push_back(ImVec2(x, y_for(samples[i])));
        }
    } else {
        points_.reserve(columns * 2);
        for (int c = 0; c < columns; ++c) {
            int i0 = (int)((long long)c * n / columns);
            int i1 = std::max(i0 + 1, (int)((long long)(c + 1) * n / columns));
            float lo = FLT_MAX, hi = -FLT_MAX;
            for (int i = i0; i < i1 && i < n; ++i) { lo = std::min(lo, samples[i]); hi = std::max(hi, samples[i]); }
            float x = canvas_pos.x + (float)c;
            points_.push_back(ImVec2(x, y_for(hi)));
            points_.push_back(ImVec2(x, y_for(lo)));
        }
    }
    dl->AddPolyline(points_.data(), (int)points_.size(), to_u32(color_line), ImDrawFlags_None, line_thickness);
}

} // namespace gui
