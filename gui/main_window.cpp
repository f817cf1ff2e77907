#include "audio_input.hpp"
#include "app_settings_io.hpp"
#include "capture.hpp"
#include "cli.hpp"
#include "pitch_mapper.hpp"
#include "dsp/block_pipeline.hpp"
#include "views/waveform_view.hpp"
#include <iostream>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

// ImGui + OpenGL ES 3
#include <GLES3/gl3.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <fstream>

using namespace pitchscope;

class PitchScopeGUI {
public:
    PitchScopeGUI(const AppSettings& st, const CliOptions& opt)
        : settings(st), options(opt), pipeline(to_pipeline_config(st)) {
        plot_samples = static_cast<size_t>(std::lround(settings.plot_seconds * settings.sample_rate));
    }

    bool init_gui() {
        if (!glfwInit()) return false;

        // Request OpenGL ES 3.0 context via EGL
        glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_ES_API);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

        window = glfwCreateWindow(1000, 600, "Live Waveform - Dominant frequency: -- Hz", nullptr, nullptr);
        if (!window) {
            glfwTerminate();
            return false;
        }

        glfwMakeContextCurrent(window);
        glfwSwapInterval(1); // Enable vsync

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGuiIO& io = ImGui::GetIO();
        io.IniFilename = nullptr;

        ImGui::StyleColorsDark();

        auto file_exists = [](const char* path) -> bool {
            std::ifstream f(path, std::ios::binary); return (bool)f;
        };
        const char* font_paths[] = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/truetype/roboto/Roboto-Regular.ttf",
        };
        const char* font_used = nullptr;
        for (const char* p : font_paths) { if (file_exists(p)) { font_used = p; break; } }
        // The en dash in the readout needs a font beyond the default's Latin-1 range
        static const ImWchar ranges[] = { 0x0020, 0x00FF, 0x2010, 0x2015, 0 };
        if (font_used) {
            io.Fonts->AddFontFromFileTTF(font_used, 18.0f, nullptr, ranges);
            readout_font = io.Fonts->AddFontFromFileTTF(font_used, 40.0f, nullptr, ranges);
        } else {
            io.Fonts->AddFontDefault();
        }

        ImGui_ImplGlfw_InitForOpenGL(window, true);
        ImGui_ImplOpenGL3_Init("#version 300 es");
        return true;
    }

    int run() {
        std::string error;
        if (!pipeline.start(&error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }
        audio_input = start_capture(settings, options, pipeline, &error);
        if (!audio_input) {
            std::cerr << "Configuration error: " << error << std::endl;
            pipeline.stop();
            return 1;
        }
        if (!init_gui()) {
            std::cerr << "Failed to create window" << std::endl;
            audio_input->stop();
            pipeline.stop();
            return 1;
        }

        std::cout << "Starting audio stream. Close the window to stop." << std::endl;
        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();
            if (!audio_input->is_running()) {
                std::cout << "Capture source closed" << std::endl;
                break;
            }

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            render_gui();
            report_losses();

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }

        audio_input->stop();
        pipeline.stop();
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        std::cout << "Stopped." << std::endl;
        return 0;
    }

private:
    AppSettings settings;
    CliOptions options;
    dsp::BlockPipeline pipeline;
    std::unique_ptr<IAudioInput> audio_input;

    GLFWwindow* window = nullptr;
    ImFont* readout_font = nullptr;
    gui::WaveformView waveform_view;
    size_t plot_samples = 0;
    std::string window_title;
    uint64_t reported_drops = 0;
    int reported_xruns = 0;

    void render_gui() {
        const ImGuiViewport* vp = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(vp->WorkPos);
        ImGui::SetNextWindowSize(vp->WorkSize);
        ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                 ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus;
        if (ImGui::Begin("Live Waveform", nullptr, flags)) {
            // Published reading is an immutable snapshot; hold the pointer for the whole frame
            auto reading = pipeline.current_pitch();
            const std::string title = reading ? format_title(*reading) : format_no_signal_title();

            if (readout_font) ImGui::PushFont(readout_font);
            if (reading) {
                ImGui::TextUnformatted(title.c_str());
            } else {
                ImGui::TextDisabled("%s", title.c_str());
            }
            if (readout_font) ImGui::PopFont();

            if (reading) {
                // Tuning meter: +/-50 cents
                float frac = static_cast<float>((reading->cents + 50.0) / 100.0);
                ImGui::ProgressBar(frac, ImVec2(-1.0f, 6.0f), "");
            } else {
                ImGui::Dummy(ImVec2(0.0f, 6.0f));
            }

            auto stats = pipeline.stats();
            ImGui::Text("%d Hz, %d-sample blocks (%.2f Hz/bin) | processed %llu, silent %llu, dropped %llu",
                        settings.sample_rate, settings.block_size,
                        static_cast<double>(settings.sample_rate) / settings.block_size,
                        (unsigned long long)stats.processed, (unsigned long long)stats.silent,
                        (unsigned long long)stats.dropped);

            ImVec2 canvas_pos = ImGui::GetCursorScreenPos();
            ImVec2 avail = ImGui::GetContentRegionAvail();
            auto samples = pipeline.current_waveform(plot_samples);
            waveform_view.draw(ImGui::GetWindowDrawList(), canvas_pos, avail.x, avail.y,
                               samples, settings.plot_seconds);
            ImGui::Dummy(avail);

            update_window_title(reading ? "Live Waveform - " + title
                                        : std::string("Live Waveform - Dominant frequency: -- Hz"));
        }
        ImGui::End();
    }

    void update_window_title(const std::string& title) {
        if (title == window_title) return;
        window_title = title;
        glfwSetWindowTitle(window, window_title.c_str());
    }

    void report_losses() {
        auto stats = pipeline.stats();
        if (stats.dropped != reported_drops) {
            std::cerr << "Warning: analysis fell behind, " << stats.dropped << " blocks dropped" << std::endl;
            reported_drops = stats.dropped;
        }
        int xruns = audio_input->get_latency_stats().xruns;
        if (xruns != reported_xruns) {
            std::cerr << "Warning: " << xruns << " capture overruns" << std::endl;
            reported_xruns = xruns;
        }
    }
};

int main(int argc, char* argv[]) {
    AppSettings settings;
    CliOptions options;
    int code = resolve_settings(argc, argv, settings, options);
    if (code >= 0) return code;

    PitchScopeGUI app(settings, options);
    return app.run();
}
