module;
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <string>
#include <vector>

module Core:Window.Impl;
import :Logging;
import :Window;

namespace Core::Windowing
{
    static bool s_GLFWInitialized = false;

    class GLFWLifetime
    {
    public:
        static GLFWLifetime& Instance()
        {
            static GLFWLifetime instance;
            return instance;
        }

        ~GLFWLifetime()
        {
            if (s_GLFWInitialized)
            {
                glfwTerminate();
                s_GLFWInitialized = false;
            }
        }

    private:
        GLFWLifetime() = default;
        GLFWLifetime(const GLFWLifetime&) = delete;
        GLFWLifetime& operator=(const GLFWLifetime&) = delete;
    };

    static void GLFWErrorCallback(int error, const char* description)
    {
        Log::Error("GLFW Error ({0}): {1}", error, description);
    }

    static bool EnsureGLFW()
    {
        [[maybe_unused]] auto& lifetime = GLFWLifetime::Instance();
        if (!s_GLFWInitialized)
        {
            if (!glfwInit())
            {
                Log::Error("Could not initialize GLFW!");
                return false;
            }
            glfwSetErrorCallback(GLFWErrorCallback);
            s_GLFWInitialized = true;
        }
        return true;
    }

    Window::Window(const WindowProps& props)
    {
        Init(props);
    }

    Window::~Window()
    {
        Shutdown();
    }

    void Window::Init(const WindowProps& props)
    {
        m_Data.Title = props.Title;
        m_Data.WindowWidth = props.WindowWidth;
        m_Data.WindowHeight = props.WindowHeight;

        Log::Info("Creating Window {0} ({1}x{2})", props.Title, props.WindowWidth, props.WindowHeight);

        if (!EnsureGLFW())
        {
            m_IsValid = false;
            return;
        }

        // Vulkan only, no OpenGL context
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

        auto glfwWindow = glfwCreateWindow(m_Data.WindowWidth, m_Data.WindowHeight, m_Data.Title.c_str(), nullptr,
                                           nullptr);
        if (!glfwWindow)
        {
            Log::Error("Failed to create GLFW window!");
            m_IsValid = false;
            return;
        }

        m_Window = glfwWindow;
        m_IsValid = true;
        glfwGetFramebufferSize(glfwWindow, &m_Data.FramebufferWidth, &m_Data.FramebufferHeight);

        // Callbacks find our data through the user pointer
        glfwSetWindowUserPointer(glfwWindow, &m_Data);

        glfwSetFramebufferSizeCallback(glfwWindow, [](GLFWwindow* window, int width, int height)
        {
            WindowData& data = *static_cast<WindowData*>(glfwGetWindowUserPointer(window));
            data.FramebufferWidth = width;
            data.FramebufferHeight = height;
            if (data.Callback)
            {
                data.Callback(WindowResizeEvent{width, height});
            }
        });

        glfwSetWindowCloseCallback(glfwWindow, [](GLFWwindow* window)
        {
            WindowData& data = *static_cast<WindowData*>(glfwGetWindowUserPointer(window));
            if (data.Callback)
            {
                data.Callback(WindowCloseEvent{});
            }
        });

        glfwSetKeyCallback(glfwWindow, [](GLFWwindow* window, int key, [[maybe_unused]] int scancode, int action,
                                          [[maybe_unused]] int mods)
        {
            WindowData& data = *static_cast<WindowData*>(glfwGetWindowUserPointer(window));
            if ((action == GLFW_PRESS || action == GLFW_RELEASE) && data.Callback)
            {
                data.Callback(KeyEvent{key, action == GLFW_PRESS});
            }
        });

        glfwSetScrollCallback(glfwWindow, [](GLFWwindow* window, double xoffset, double yoffset)
        {
            WindowData& data = *static_cast<WindowData*>(glfwGetWindowUserPointer(window));
            if (data.Callback)
            {
                data.Callback(ScrollEvent{xoffset, yoffset});
            }
        });

        glfwSetCursorPosCallback(glfwWindow, [](GLFWwindow* window, double xpos, double ypos)
        {
            WindowData& data = *static_cast<WindowData*>(glfwGetWindowUserPointer(window));
            if (data.Callback)
            {
                data.Callback(CursorEvent{xpos, ypos});
            }
        });
    }

    void Window::Shutdown()
    {
        if (m_Window)
        {
            glfwDestroyWindow(static_cast<GLFWwindow*>(m_Window));
            m_Window = nullptr;
        }
    }

    void Window::OnUpdate()
    {
        if (!m_IsValid) return;
        glfwPollEvents();
        glfwGetWindowSize(static_cast<GLFWwindow*>(m_Window), &m_Data.WindowWidth, &m_Data.WindowHeight);
        glfwGetFramebufferSize(static_cast<GLFWwindow*>(m_Window), &m_Data.FramebufferWidth, &m_Data.FramebufferHeight);
    }

    void Window::WaitEvents() const
    {
        if (!m_IsValid) return;
        glfwWaitEvents();
    }

    bool Window::ShouldClose() const
    {
        if (!m_IsValid) return true;
        return glfwWindowShouldClose(static_cast<GLFWwindow*>(m_Window));
    }

    bool Window::CreateSurface(void* instance, void* allocator, void* surfaceOut)
    {
        auto vkInst = static_cast<VkInstance>(instance);
        auto vkAlloc = static_cast<VkAllocationCallbacks*>(allocator);
        auto vkSurf = static_cast<VkSurfaceKHR*>(surfaceOut);
        VkResult result = glfwCreateWindowSurface(vkInst, static_cast<GLFWwindow*>(m_Window), vkAlloc, vkSurf);
        if (result != VK_SUCCESS)
        {
            Log::Error("Failed to create Window Surface! Error: {}", static_cast<int>(result));
            return false;
        }
        return true;
    }

    std::vector<const char*> Window::GetRequiredInstanceExtensions()
    {
        if (!EnsureGLFW()) return {};

        uint32_t count = 0;
        const char** names = glfwGetRequiredInstanceExtensions(&count);
        if (!names) return {};
        return {names, names + count};
    }

    void Window::SetTitle(const std::string& title) const
    {
        glfwSetWindowTitle(static_cast<GLFWwindow*>(GetNativeHandle()), title.c_str());
    }
}
