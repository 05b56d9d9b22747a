module;
#include <memory>
#include <string>

export module Runtime.Engine;

import Core;
import ECS;
import Runtime.GraphicsBackend;
import Runtime.RenderOrchestrator;

export namespace Runtime
{
    struct EngineConfig
    {
        std::string AppName = "Mosaic App";
        int Width = 1280;
        int Height = 720;
#ifdef NDEBUG
        bool EnableValidation = false;
#else
        bool EnableValidation = true;
#endif
        std::string ShaderDirectory = "shaders";
    };

    // Window + GPU stack + render facade + scene, and the loop that ties
    // them together:
    //
    //   poll -> OnUpdate -> camera sync -> culling -> extraction -> OnRender
    //        -> RenderFrame
    class Engine
    {
    public:
        explicit Engine(const EngineConfig& config);
        virtual ~Engine();

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        // Returns non-zero when the loop ended on a fatal render error or
        // the engine failed to start.
        int Run();

        // To be implemented by the Client (Sandbox)
        virtual void OnStart() = 0;
        virtual void OnUpdate(float deltaTime) = 0;
        // Immediate-mode submissions on top of the extracted scene.
        virtual void OnRender() {}

        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] ECS::Scene& GetScene() { return m_Scene; }
        [[nodiscard]] RenderOrchestrator& GetRenderer() { return *m_Renderer; }
        [[nodiscard]] Core::Windowing::Window& GetWindow() { return *m_Window; }

        void RequestExit() { m_Running = false; }

    protected:
        ECS::Scene m_Scene;

    private:
        std::unique_ptr<Core::Windowing::Window> m_Window;
        std::unique_ptr<GraphicsBackend> m_Backend;
        std::unique_ptr<RenderOrchestrator> m_Renderer;

        ECS::Systems::Visibility::Scratch m_VisibilityScratch;
        ECS::Systems::VisualExtraction::Scratch m_ExtractionScratch;

        bool m_IsValid = false;
        bool m_Running = true;
        bool m_FramebufferResized = false;

        void ExtractScene();
    };
}
