#pragma once

#ifdef PANELDOCK_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <string>

struct GLFWwindow;

namespace paneldock
{

// Window and GL context for the ImGui frontend. Input goes through the
// ImGui GLFW backend; only resize is forwarded here.
class GlfwAdapter
{
   public:
    GlfwAdapter() = default;
    ~GlfwAdapter();

    GlfwAdapter(const GlfwAdapter&)            = delete;
    GlfwAdapter& operator=(const GlfwAdapter&) = delete;

    bool init(uint32_t width, uint32_t height, const std::string& title);
    void shutdown();

    void poll_events();
    void wait_events();
    void swap_buffers();
    bool should_close() const;

    // GLFWwindow*, for the ImGui backend.
    void* native_window() const;

    void framebuffer_size(uint32_t& width, uint32_t& height) const;
    bool is_minimized() const;

    void set_on_resize(std::function<void(int width, int height)> callback);

   private:
    GLFWwindow*                                window_ = nullptr;
    std::function<void(int width, int height)> on_resize_;

    static void framebuffer_size_callback(GLFWwindow* window, int width, int height);
};

}   // namespace paneldock

#endif   // PANELDOCK_USE_GLFW
