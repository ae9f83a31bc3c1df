#pragma once

#include "HostContainer.hpp"
#include "Scene.hpp"
#include "SceneConfig.hpp"

#include <memory>
#include <string>

struct GLFWwindow;

namespace skyline {

class Renderer;

// Native host: a GLFW window that drives one SceneContext with the Vulkan
// back end, and serves as the scene's container.
class Engine : public HostContainer {
public:
    Engine();
    ~Engine() override;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    bool initialize(int width, int height, const std::string &title, const std::string &configPath);
    void run();
    void shutdown();

    // HostContainer
    int width() const override;
    int height() const override;
    float devicePixelRatio() const override;
    DeviceInfo deviceInfo() const override;
    void setBackground(const GradientBackground& background) override;

    // Window events (forwarded from GLFW callbacks)
    void onResize();
    void onIconify(bool iconified);

private:
    void poll();
    void reloadConfigIfChanged(double now);
    double nowMs() const;

    GLFWwindow* window_ = nullptr;
    std::unique_ptr<Renderer> renderer_;
    SceneContext scene_;
    SceneConfig config_;
    std::string configPath_;
    double lastConfigCheck_ = 0.0;
    bool running_ = false;
    bool glfwReady_ = false;
};

}
