module;
#include <string>
#include <functional>
#include <variant>
#include <vector>

export module Core:Window;

export namespace Core::Windowing
{
    struct WindowProps
    {
        std::string Title = "Mosaic";
        int WindowWidth = 1280;
        int WindowHeight = 720;
    };

    struct WindowCloseEvent
    {
    };

    struct WindowResizeEvent
    {
        int Width;
        int Height;
    };

    struct KeyEvent
    {
        int KeyCode;
        bool IsPressed; // true = pressed, false = released
    };

    struct ScrollEvent
    {
        double XOffset;
        double YOffset;
    };

    struct CursorEvent
    {
        double XPos;
        double YPos;
    };

    using Event = std::variant<
        WindowCloseEvent,
        WindowResizeEvent,
        KeyEvent,
        ScrollEvent,
        CursorEvent
    >;

    using EventCallbackFn = std::function<void(const Event&)>;

    class Window
    {
    public:
        explicit Window(const WindowProps& props);
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;

        void OnUpdate(); // Polls events, refreshes cached sizes

        [[nodiscard]] bool ShouldClose() const;
        [[nodiscard]] void* GetNativeHandle() const { return m_Window; } // GLFWwindow*
        [[nodiscard]] int GetWindowWidth() const { return m_Data.WindowWidth; }
        [[nodiscard]] int GetWindowHeight() const { return m_Data.WindowHeight; }
        [[nodiscard]] int GetFramebufferWidth() const { return m_Data.FramebufferWidth; }
        [[nodiscard]] int GetFramebufferHeight() const { return m_Data.FramebufferHeight; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] bool IsMinimized() const { return m_Data.FramebufferWidth == 0 || m_Data.FramebufferHeight == 0; }

        void SetEventCallback(const EventCallbackFn& callback) { m_Data.Callback = callback; }

        void SetTitle(const std::string& title) const;

        // Blocks until at least one event arrives (used while minimized).
        void WaitEvents() const;

        // void* keeps vulkan.h out of the module interface.
        // instance is a VkInstance, allocator is VkAllocationCallbacks*, surfaceOut is VkSurfaceKHR*.
        [[nodiscard]] bool CreateSurface(void* instance, void* allocator, void* surfaceOut);

        // Instance extensions the windowing system needs for presentation.
        [[nodiscard]] static std::vector<const char*> GetRequiredInstanceExtensions();

    private:
        void* m_Window = nullptr;
        bool m_IsValid = false;

        struct WindowData
        {
            std::string Title;
            int WindowWidth = 0;
            int WindowHeight = 0;
            int FramebufferWidth = 0;
            int FramebufferHeight = 0;
            EventCallbackFn Callback;
        };

        WindowData m_Data;

        void Init(const WindowProps& props);
        void Shutdown();
    };
}
