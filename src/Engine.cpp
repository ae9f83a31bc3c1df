#include "Engine.hpp"
#include "Renderer.hpp"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <vector>

namespace skyline {

namespace {

const int kFallbackIconSize = 64;
const double kConfigCheckIntervalMs = 1000.0;

const char* platformName() {
#if defined(__APPLE__)
    return "macOS";
#elif defined(_WIN32)
    return "Windows";
#else
    return "Linux";
#endif
}

} // namespace

static void glfwErrorCallback(int code, const char* description) {
    fprintf(stderr, "GLFW error %d: %s\n", code, description);
}

static void framebufferSizeCallback(GLFWwindow* window, int width, int height) {
    (void)width; (void)height;
    auto* engine = static_cast<skyline::Engine*>(glfwGetWindowUserPointer(window));
    engine->onResize();
}

static void contentScaleCallback(GLFWwindow* window, float xscale, float yscale) {
    (void)xscale; (void)yscale;
    auto* engine = static_cast<skyline::Engine*>(glfwGetWindowUserPointer(window));
    engine->onResize();
}

static void iconifyCallback(GLFWwindow* window, int iconified) {
    auto* engine = static_cast<skyline::Engine*>(glfwGetWindowUserPointer(window));
    engine->onIconify(iconified == GLFW_TRUE);
}

Engine::Engine() = default;
Engine::~Engine() { shutdown(); }

bool Engine::initialize(int width, int height, const std::string &title, const std::string &configPath) {
    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit()) {
        return false;
    }
    glfwReady_ = true;

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

    window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!window_) {
        return false;
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetFramebufferSizeCallback(window_, framebufferSizeCallback);
    glfwSetWindowContentScaleCallback(window_, contentScaleCallback);
    glfwSetWindowIconifyCallback(window_, iconifyCallback);

    // Missing file keeps the built-in defaults
    configPath_ = configPath;
    config_.loadFromFile(configPath_.c_str());
    lastConfigCheck_ = nowMs();

    renderer_ = std::make_unique<Renderer>(window_);
    scene_.initScene(*renderer_, *this, config_);
    printf("Scene state: %s\n", sceneStateName(scene_.getState()));

    running_ = true;
    return true;
}

double Engine::nowMs() const {
    return glfwGetTime() * 1000.0;
}

void Engine::poll() {
    glfwPollEvents();
    if (glfwWindowShouldClose(window_)) {
        running_ = false;
    }
}

void Engine::reloadConfigIfChanged(double now) {
    if (now - lastConfigCheck_ < kConfigCheckIntervalMs) return;
    lastConfigCheck_ = now;
    if (!config_.checkAndReload(configPath_.c_str())) return;

    // A changed config only applies to a freshly built scene
    scene_.disposeScene();
    scene_.initScene(*renderer_, *this, config_);
    printf("Scene rebuilt: %s\n", sceneStateName(scene_.getState()));
}

void Engine::run() {
    while (running_) {
        switch (scene_.getState()) {
            case SceneState::Running:
                poll();
                reloadConfigIfChanged(nowMs());
                scene_.frame(nowMs());
                break;

            case SceneState::Paused:
            case SceneState::Fallback:
                // Nothing to draw: sleep until the window wakes us
                glfwWaitEvents();
                if (glfwWindowShouldClose(window_)) running_ = false;
                break;

            case SceneState::Uninitialized:
            case SceneState::Disposed:
                running_ = false;
                break;
        }
    }
    if (renderer_) renderer_->waitIdle();
}

void Engine::shutdown() {
    scene_.disposeScene();
    renderer_.reset();
    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    if (glfwReady_) {
        glfwTerminate();
        glfwReady_ = false;
    }
}

void Engine::onResize() {
    scene_.notifyResize(nowMs());
}

void Engine::onIconify(bool iconified) {
    scene_.setVisible(!iconified, nowMs());
}

int Engine::width() const {
    int w = 0, h = 0;
    if (window_) glfwGetWindowSize(window_, &w, &h);
    return w;
}

int Engine::height() const {
    int w = 0, h = 0;
    if (window_) glfwGetWindowSize(window_, &w, &h);
    return h;
}

// Physical pixels per logical unit (2 on Retina, 1 on most X11 setups)
float Engine::devicePixelRatio() const {
    if (!window_) return 1.0f;
    int winW = 0, winH = 0, fbW = 0, fbH = 0;
    glfwGetWindowSize(window_, &winW, &winH);
    glfwGetFramebufferSize(window_, &fbW, &fbH);
    if (winW <= 0 || fbW <= 0) return 1.0f;
    return static_cast<float>(fbW) / static_cast<float>(winW);
}

DeviceInfo Engine::deviceInfo() const {
    DeviceInfo info;
    info.viewportWidth = width();
    GLFWmonitor* monitor = glfwGetPrimaryMonitor();
    if (monitor) {
        int x = 0, y = 0, w = 0, h = 0;
        glfwGetMonitorWorkarea(monitor, &x, &y, &w, &h);
        if (w > 0) info.viewportWidth = w;
    }
    info.hasTouch = false;
    const char* agent = std::getenv("SKYLINE_USER_AGENT");
    info.userAgent = agent ? agent : platformName();
    return info;
}

// The window has no client API, so without Vulkan the gradient can only
// be shown as the icon
void Engine::setBackground(const GradientBackground& background) {
    if (!window_) return;
    std::vector<uint8_t> pixels = background.rasterize(kFallbackIconSize, kFallbackIconSize);
    if (pixels.empty()) return;

    GLFWimage icon;
    icon.width = kFallbackIconSize;
    icon.height = kFallbackIconSize;
    icon.pixels = pixels.data();
    glfwSetWindowIcon(window_, 1, &icon);
}

}
