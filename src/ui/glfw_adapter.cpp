#ifdef PANELDOCK_USE_GLFW

    #include "glfw_adapter.hpp"

    #include <GLFW/glfw3.h>
    #include <paneldock/logger.hpp>

namespace paneldock
{

GlfwAdapter::~GlfwAdapter()
{
    shutdown();
}

bool GlfwAdapter::init(uint32_t width, uint32_t height, const std::string& title)
{
    glfwSetErrorCallback([](int code, const char* description)
                         { PANELDOCK_LOG_ERROR("imgui", "GLFW error {}: {}", code, description); });

    if (!glfwInit())
    {
        PANELDOCK_LOG_ERROR("imgui", "Failed to initialize GLFW");
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    window_ = glfwCreateWindow(
        static_cast<int>(width), static_cast<int>(height), title.c_str(), nullptr, nullptr);
    if (!window_)
    {
        PANELDOCK_LOG_ERROR("imgui", "Failed to create GLFW window");
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);
    glfwSetWindowUserPointer(window_, this);
    glfwSetFramebufferSizeCallback(window_, framebuffer_size_callback);

    PANELDOCK_LOG_INFO("imgui", "Window created ({}x{})", width, height);
    return true;
}

void GlfwAdapter::shutdown()
{
    if (!window_)
        return;
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

void GlfwAdapter::poll_events()
{
    glfwPollEvents();
}

void GlfwAdapter::wait_events()
{
    glfwWaitEvents();
}

void GlfwAdapter::swap_buffers()
{
    if (window_)
        glfwSwapBuffers(window_);
}

bool GlfwAdapter::should_close() const
{
    return window_ ? glfwWindowShouldClose(window_) : true;
}

void* GlfwAdapter::native_window() const
{
    return static_cast<void*>(window_);
}

void GlfwAdapter::framebuffer_size(uint32_t& width, uint32_t& height) const
{
    if (window_)
    {
        int w = 0, h = 0;
        glfwGetFramebufferSize(window_, &w, &h);
        width  = static_cast<uint32_t>(w);
        height = static_cast<uint32_t>(h);
    }
    else
    {
        width  = 0;
        height = 0;
    }
}

bool GlfwAdapter::is_minimized() const
{
    uint32_t w = 0, h = 0;
    framebuffer_size(w, h);
    return w == 0 || h == 0;
}

void GlfwAdapter::set_on_resize(std::function<void(int width, int height)> callback)
{
    on_resize_ = std::move(callback);
}

// ─── Static callback trampolines ─────────────────────────────────────────────

void GlfwAdapter::framebuffer_size_callback(GLFWwindow* window, int width, int height)
{
    auto* adapter = static_cast<GlfwAdapter*>(glfwGetWindowUserPointer(window));
    if (adapter && adapter->on_resize_)
        adapter->on_resize_(width, height);
}

}   // namespace paneldock

#endif   // PANELDOCK_USE_GLFW
