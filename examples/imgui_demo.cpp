// Interactive workspace: drag frame title strips to dock, drag splitters to
// resize, right-click a frame for its menu, click header buttons to open
// pinned panels. Escape closes menus, popovers and the modal.

#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <paneldock/logger.hpp>
#include <paneldock/storage.hpp>
#include <paneldock/workspace_config.hpp>

#include "console_host.hpp"
#include "ui/glfw_adapter.hpp"
#include "ui/imgui/workspace_view.hpp"
#include "ui/panel_workspace.hpp"

using namespace paneldock;

int main()
{
    WorkspaceConfig config;
    config.load(WorkspaceConfig::default_path());

    Logger::instance().set_level(config.log_level);
    Logger::instance().add_sink(sinks::console_sink());

    GlfwAdapter window;
    if (!window.init(1280, 800, "paneldock"))
        return 1;
    window.set_on_resize([](int w, int h) { PANELDOCK_LOG_DEBUG("demo", "Framebuffer resized to {}x{}", w, h); });

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(static_cast<GLFWwindow*>(window.native_window()), true);
    ImGui_ImplOpenGL3_Init("#version 130");

    FileStorage storage(config.resolved_storage_dir());

    PanelRegistry registry;
    demo::register_demo_panels(registry);
    demo::ConsoleHost host;

    WorkspaceOptions options;
    options.registry = &registry;
    options.host     = &host;
    options.storage  = &storage;
    options.config   = config;

    PanelWorkspace workspace(options);
    WorkspaceView  view(workspace);
    view.set_content_callback(
        [&](const PanelId& panel_id, const Rect& content)
        {
            ImDrawList* dl   = ImGui::GetBackgroundDrawList();
            auto        type = workspace.panel_type(panel_id).value_or("?");
            std::string text = panel_id + " (" + type + ")";
            dl->PushClipRect(ImVec2(content.x, content.y), ImVec2(content.x + content.w, content.y + content.h), true);
            dl->AddText(ImVec2(content.x + 10.0f, content.y + 10.0f), IM_COL32(150, 156, 166, 255), text.c_str());
            dl->PopClipRect();
        });

    bool attached = false;
    while (!window.should_close())
    {
        window.poll_events();
        if (window.is_minimized())
        {
            window.wait_events();
            continue;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        view.draw();
        // Attach after the first layout pass so mounts carry real bounds.
        if (!attached)
        {
            workspace.attach();
            attached = true;
        }

        if (ImGui::BeginMainMenuBar())
        {
            if (ImGui::BeginMenu("Panels"))
            {
                for (const auto& manifest : registry.list_manifests())
                {
                    bool open = workspace.is_panel_type_open(manifest.type);
                    if (ImGui::MenuItem(manifest.title.c_str(), nullptr, open))
                        workspace.toggle_panel(manifest.type);
                }
                ImGui::Separator();
                if (ImGui::MenuItem("Settings (modal)"))
                    workspace.open_modal_panel("settings");
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("Layout"))
            {
                if (ImGui::MenuItem("Auto grid"))
                    workspace.apply_layout_preset(LayoutPreset::automatic());
                if (ImGui::MenuItem("Two columns"))
                    workspace.apply_layout_preset(LayoutPreset::with_columns(2));
                if (ImGui::MenuItem("Reset"))
                    workspace.reset_layout();
                ImGui::EndMenu();
            }
            ImGui::EndMainMenuBar();
        }

        ImGui::Render();
        uint32_t w = 0, h = 0;
        window.framebuffer_size(w, h);
        glViewport(0, 0, static_cast<int>(w), static_cast<int>(h));
        glClearColor(0.08f, 0.09f, 0.10f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        window.swap_buffers();
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    window.shutdown();
    return 0;
}
