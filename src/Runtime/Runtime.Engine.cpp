module;
#include <chrono>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <variant>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module Runtime.Engine;

import Core;
import RHI;
import Graphics;
import ECS;
import Runtime.GraphicsBackend;
import Runtime.RenderOrchestrator;

namespace Runtime
{
    namespace
    {
        constexpr int kEscapeKey = 256;
    }

    Engine::Engine(const EngineConfig& config)
    {
        Core::Log::Info("Initializing Engine...");

        // 1. Window
        Core::Windowing::WindowProps props{config.AppName, config.Width, config.Height};
        m_Window = std::make_unique<Core::Windowing::Window>(props);
        if (!m_Window->IsValid())
        {
            Core::Log::Error("FATAL: Window initialization failed");
            return;
        }

        m_Window->SetEventCallback([this](const Core::Windowing::Event& e)
        {
            std::visit([this](auto&& event)
            {
                using T = std::decay_t<decltype(event)>;
                if constexpr (std::is_same_v<T, Core::Windowing::WindowCloseEvent>)
                {
                    m_Running = false;
                }
                else if constexpr (std::is_same_v<T, Core::Windowing::WindowResizeEvent>)
                {
                    m_FramebufferResized = true;
                }
                else if constexpr (std::is_same_v<T, Core::Windowing::KeyEvent>)
                {
                    if (event.IsPressed && event.KeyCode == kEscapeKey) m_Running = false;
                }
            }, e);
        });

        // 2. GPU stack
        m_Backend = std::make_unique<GraphicsBackend>(*m_Window, GraphicsBackendConfig{
            .AppName = config.AppName,
            .EnableValidation = config.EnableValidation
        });
        if (!m_Backend->IsValid()) return;

        // 3. Render facade
        m_Renderer = std::make_unique<RenderOrchestrator>(m_Backend->GetRenderDevice(), RenderOrchestratorConfig{
            .ShaderDirectory = config.ShaderDirectory,
            .Batcher = {},
            .Frame = {}
        });
        if (auto r = m_Renderer->Initialize(); !r)
        {
            Core::Log::Error("FATAL: Renderer initialization failed ({})", Core::ErrorCodeToString(r.error()));
            return;
        }

        m_IsValid = true;
    }

    Engine::~Engine()
    {
        // Order matters: scene data first, then everything holding GPU
        // resources, then the device, then the window.
        m_Scene.GetRegistry().clear();
        m_Renderer.reset();
        m_Backend.reset();
        m_Window.reset();
    }

    int Engine::Run()
    {
        if (!m_IsValid)
        {
            Core::Log::Error("Engine::Run: engine failed to initialize");
            return 1;
        }

        OnStart();
        auto lastTime = std::chrono::high_resolution_clock::now();
        int exitCode = 0;

        while (m_Running && !m_Window->ShouldClose())
        {
            m_Window->OnUpdate();

            if (m_Window->IsMinimized())
            {
                m_Window->WaitEvents();
                continue;
            }

            if (m_FramebufferResized)
            {
                m_Renderer->Resize(static_cast<uint32_t>(m_Window->GetFramebufferWidth()),
                                   static_cast<uint32_t>(m_Window->GetFramebufferHeight()));
                m_FramebufferResized = false;
            }

            auto currentTime = std::chrono::high_resolution_clock::now();
            float dt = std::chrono::duration<float>(currentTime - lastTime).count();
            lastTime = currentTime;

            OnUpdate(dt);
            ExtractScene();
            OnRender();

            auto frame = m_Renderer->RenderFrame();
            if (!frame)
            {
                Core::Log::Error("Engine: render loop ended ({})", Core::ErrorCodeToString(frame.error()));
                exitCode = 1;
                break;
            }
        }

        m_Backend->WaitIdle();
        return exitCode;
    }

    void Engine::ExtractScene()
    {
        entt::registry& registry = m_Scene.GetRegistry();
        Graphics::Camera2D& camera = m_Renderer->GetCamera();

        ECS::Systems::VisualExtraction::SyncCamera(registry, camera);
        ECS::Systems::Visibility::AssignMissingCullSizes(registry, m_Renderer->GetTextures(), m_VisibilityScratch);
        ECS::Systems::Visibility::OnUpdate(registry, camera.GetFrustum(), m_VisibilityScratch);
        ECS::Systems::VisualExtraction::OnUpdate(registry, m_Renderer->GetViewport(),
            [this](const Graphics::VisualRecord& record)
            {
                m_Renderer->SubmitVisual(record);
            },
            m_ExtractionScratch);
    }
}
