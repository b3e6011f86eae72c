// Lucent - Host Application
// Window, WebGPU device, frame loop and collaborator wiring

#include <lucent/control_bridge.h>
#include <lucent/frame_clock.h>
#include <lucent/midi_macro_input.h>
#include <lucent/palette.h>
#include <lucent/palette_requester.h>
#include <lucent/phrase_tracker.h>
#include <lucent/presenter.h>
#include <lucent/scene_manager.h>
#include <lucent/settings.h>
#include <lucent/gpu/gpu_common.h>
#include <webgpu/webgpu.h>
#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <glfw3webgpu.h>
#include <GLFW/glfw3.h>
#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lucent;

// -----------------------------------------------------------------------------
// WebGPU Initialization Helpers
// -----------------------------------------------------------------------------

static std::string fromStringView(WGPUStringView message, const char* fallback) {
    if (!message.data) return fallback;
    size_t len = message.length == WGPU_STRLEN ? std::strlen(message.data) : message.length;
    return std::string(message.data, len);
}

struct AdapterUserData {
    WGPUAdapter adapter = nullptr;
    bool done = false;
};

void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* data = static_cast<AdapterUserData*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        data->adapter = adapter;
    } else {
        std::cerr << "[Lucent] Failed to request adapter: " << fromStringView(message, "unknown error") << std::endl;
    }
    data->done = true;
}

struct DeviceUserData {
    WGPUDevice device = nullptr;
    bool done = false;
};

void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* data = static_cast<DeviceUserData*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        data->device = device;
    } else {
        std::cerr << "[Lucent] Failed to request device: " << fromStringView(message, "unknown error") << std::endl;
    }
    data->done = true;
}

void onDeviceLost(WGPUDevice const* /*device*/, WGPUDeviceLostReason /*reason*/,
                  WGPUStringView message, void* /*userdata1*/, void* /*userdata2*/) {
    std::cerr << "[Lucent] WebGPU device lost: " << fromStringView(message, "unknown") << std::endl;
}

void onDeviceError(WGPUDevice const* /*device*/, WGPUErrorType /*type*/,
                   WGPUStringView message, void* /*userdata1*/, void* /*userdata2*/) {
    std::cerr << "[Lucent] WebGPU error: " << fromStringView(message, "unknown") << std::endl;
}

// -----------------------------------------------------------------------------
// Options
// -----------------------------------------------------------------------------

struct Options {
    int width = 1280;
    int height = 720;
    std::string scene = "particles";
    double crossfade = SceneManager::DEFAULT_CROSSFADE_SECONDS;
    double cycle = 0.0;
    std::string settingsPath = "lucent-settings.json";
    std::string art;
    std::string fallbackArt;
    int controlPort = ControlBridge::DEFAULT_PORT;
    bool noControl = false;
    std::string midiPort;
    double tempo = 120.0;
    int barsPerPhrase = PhraseTracker::DEFAULT_BARS_PER_PHRASE;
    bool headless = false;
    int frames = 0;
};

// -----------------------------------------------------------------------------
// Main Loop Context
// -----------------------------------------------------------------------------

struct MainLoopContext {
    // WebGPU infrastructure
    WGPUSurface surface = nullptr;
    WGPUDevice device = nullptr;
    WGPUQueue queue = nullptr;
    WGPUTextureFormat surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    WGPUSurfaceConfiguration config = {};

    // Window state
    GLFWwindow* window = nullptr;
    int framebufferWidth = 0;
    int framebufferHeight = 0;
    float contentScale = 0.0f;
    std::vector<int> pressedKeys;

    // Timing
    double lastTitleTime = 0.0;
    double lastCycleTime = 0.0;

    const Options* options = nullptr;

    // Core runtime objects (non-owning pointers)
    SceneManager* manager = nullptr;
    Presenter* presenter = nullptr;
    FrameClock* clock = nullptr;
    PhraseTracker* phrases = nullptr;
    PaletteRequester* palettes = nullptr;
    ControlBridge* bridge = nullptr;
    MidiMacroInput* midi = nullptr;
};

static void requestCrossfade(MainLoopContext& mlc, SceneKind kind) {
    try {
        mlc.manager->crossfadeTo(kind, mlc.options->crossfade);
    } catch (const std::exception& e) {
        std::cerr << "[Lucent] Crossfade to " << sceneKindName(kind) << " failed: " << e.what() << std::endl;
    }
}

static void handleKey(MainLoopContext& mlc, int key) {
    switch (key) {
        case GLFW_KEY_1: requestCrossfade(mlc, SceneKind::Fluid); break;
        case GLFW_KEY_2: requestCrossfade(mlc, SceneKind::Particles); break;
        case GLFW_KEY_3: requestCrossfade(mlc, SceneKind::Tunnel); break;
        case GLFW_KEY_4: requestCrossfade(mlc, SceneKind::Terrain); break;
        case GLFW_KEY_5: requestCrossfade(mlc, SceneKind::Typography); break;
        case GLFW_KEY_N: requestCrossfade(mlc, mlc.manager->nextScene()); break;
        case GLFW_KEY_ESCAPE: glfwSetWindowShouldClose(mlc.window, GLFW_TRUE); break;
        default: break;
    }
}

static void syncViewport(MainLoopContext& mlc) {
    int width = 0, height = 0;
    glfwGetFramebufferSize(mlc.window, &width, &height);

    float xscale = 1.0f, yscale = 1.0f;
    glfwGetWindowContentScale(mlc.window, &xscale, &yscale);

    if (width == mlc.framebufferWidth && height == mlc.framebufferHeight && xscale == mlc.contentScale) {
        return;
    }

    mlc.framebufferWidth = width;
    mlc.framebufferHeight = height;
    mlc.contentScale = xscale;
    if (width <= 0 || height <= 0) return;

    mlc.config.width = static_cast<uint32_t>(width);
    mlc.config.height = static_cast<uint32_t>(height);
    wgpuSurfaceConfigure(mlc.surface, &mlc.config);

    // Manager works in logical size; the pixel ratio maps it to drawing-buffer size
    float scale = xscale > 0.0f ? xscale : 1.0f;
    mlc.manager->setDevicePixelRatio(scale);
    mlc.manager->resize(static_cast<int>(std::lround(width / scale)),
                        static_cast<int>(std::lround(height / scale)));
}

// Runs one iteration of the main loop. Returns false when the loop should exit.
static bool mainLoopIteration(MainLoopContext& mlc) {
    glfwPollEvents();
    if (glfwWindowShouldClose(mlc.window)) {
        return false;
    }

    std::vector<int> keys;
    keys.swap(mlc.pressedKeys);
    for (int key : keys) {
        handleKey(mlc, key);
    }

    double dt = mlc.clock->tick();
    double now = mlc.clock->elapsed();

    // Collaborator input, applied on this thread only
    if (mlc.bridge) {
        mlc.bridge->poll(*mlc.manager, *mlc.palettes);
    }
    if (mlc.midi) {
        mlc.midi->poll(*mlc.manager);
    }
    mlc.palettes->poll(*mlc.manager);
    mlc.phrases->advance(now, [&mlc](int bar, double tempo) {
        mlc.manager->onPhrase(bar, tempo);
    });

    if (mlc.options->cycle > 0.0 && now - mlc.lastCycleTime >= mlc.options->cycle) {
        mlc.lastCycleTime = now;
        requestCrossfade(mlc, mlc.manager->nextScene());
    }

    syncViewport(mlc);
    mlc.manager->update(dt);

    // Skip drawing while minimized
    if (mlc.framebufferWidth <= 0 || mlc.framebufferHeight <= 0) {
        return true;
    }

    WGPUSurfaceTexture surfaceTexture;
    wgpuSurfaceGetCurrentTexture(mlc.surface, &surfaceTexture);
    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        if (surfaceTexture.texture) {
            wgpuTextureRelease(surfaceTexture.texture);
        }
        return true;
    }
    WGPUTextureView view = gpu::createView(surfaceTexture.texture, mlc.surfaceFormat);

    mlc.presenter->resizeCanvas(mlc.manager->renderWidth(), mlc.manager->renderHeight());

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = gpu::toStringView("Lucent Frame");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(mlc.device, &encoderDesc);

    mlc.manager->render(mlc.presenter->canvasTarget(encoder));
    mlc.presenter->present(encoder, view, mlc.framebufferWidth, mlc.framebufferHeight);

    WGPUCommandBufferDescriptor cmdBufferDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    wgpuQueueSubmit(mlc.queue, 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);

    wgpuSurfacePresent(mlc.surface);
    wgpuDevicePoll(mlc.device, false, nullptr);

    // For wgpu-native, release the surface texture AFTER presenting
    wgpuTextureViewRelease(view);
    wgpuTextureRelease(surfaceTexture.texture);

    if (now - mlc.lastTitleTime >= 1.0) {
        mlc.lastTitleTime = now;
        std::ostringstream title;
        title << "Lucent - " << (mlc.manager->primary() ? mlc.manager->primary()->name() : "idle")
              << " - " << std::fixed << std::setprecision(1) << mlc.clock->fps() << " fps";
        glfwSetWindowTitle(mlc.window, title.str().c_str());
        if (mlc.bridge) {
            mlc.bridge->broadcastFps(mlc.clock->fps());
        }
    }

    if (mlc.options->frames > 0 && mlc.clock->frameCount() >= static_cast<uint64_t>(mlc.options->frames)) {
        std::cout << "[Lucent] Reached frame limit (" << mlc.options->frames << "), exiting" << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    Options opts;

    CLI::App app{"Lucent - real-time generative visuals"};
    app.add_option("--width", opts.width, "Window width")->check(CLI::PositiveNumber);
    app.add_option("--height", opts.height, "Window height")->check(CLI::PositiveNumber);
    app.add_option("--scene", opts.scene, "Initial scene (particles, fluid, tunnel, terrain, typography)");
    app.add_option("--crossfade", opts.crossfade, "Crossfade duration in seconds")->check(CLI::NonNegativeNumber);
    app.add_option("--cycle", opts.cycle, "Advance to the next scene every N seconds (0 = off)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--settings", opts.settingsPath, "Settings file loaded at start and saved on exit");
    app.add_option("--art", opts.art, "Image path or URL to extract the palette from");
    app.add_option("--fallback-art", opts.fallbackArt, "Image used for the palette when --art fails");
    app.add_option("--control-port", opts.controlPort, "Control bridge WebSocket port")->check(CLI::Range(1, 65535));
    app.add_flag("--no-control", opts.noControl, "Disable the control bridge");
    app.add_option("--midi-port", opts.midiPort, "MIDI input port name or index");
    app.add_option("--tempo", opts.tempo, "Tempo in BPM for phrase tracking")->check(CLI::PositiveNumber);
    app.add_option("--bars-per-phrase", opts.barsPerPhrase, "Bars per phrase")->check(CLI::PositiveNumber);
    app.add_flag("--headless", opts.headless, "Run with an invisible window");
    app.add_option("--frames", opts.frames, "Exit after N frames (0 = unlimited)")->check(CLI::NonNegativeNumber);

    CLI11_PARSE(app, argc, argv);

    auto initialScene = parseSceneKind(opts.scene);
    if (!initialScene) {
        std::cerr << "[Lucent] Unknown scene: " << opts.scene << std::endl;
        return 1;
    }

    std::cout << "Lucent - Starting..." << std::endl;
    if (opts.headless) {
        if (opts.frames == 0) {
            std::cerr << "Warning: --headless without --frames will run indefinitely." << std::endl;
        }
        std::cout << "Running in headless mode" << std::endl;
    }

    // Initialize GLFW
    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return 1;
    }

    // No OpenGL context - we're using WebGPU
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    if (opts.headless) {
        glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    }

    GLFWwindow* window = glfwCreateWindow(opts.width, opts.height, "Lucent", nullptr, nullptr);
    if (!window) {
        std::cerr << "Failed to create window" << std::endl;
        glfwTerminate();
        return 1;
    }

    WGPUInstanceDescriptor instanceDesc = {};
    WGPUInstance instance = wgpuCreateInstance(&instanceDesc);
    if (!instance) {
        std::cerr << "Failed to create WebGPU instance" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    WGPUSurface surface = glfwCreateWindowWGPUSurface(instance, window);
    if (!surface) {
        std::cerr << "Failed to create surface" << std::endl;
        wgpuInstanceRelease(instance);
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // Request adapter
    std::cout << "Requesting adapter..." << std::endl;
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = surface;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    AdapterUserData adapterData;
    WGPURequestAdapterCallbackInfo adapterCallback = {};
    adapterCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallback.callback = onAdapterRequestEnded;
    adapterCallback.userdata1 = &adapterData;
    wgpuInstanceRequestAdapter(instance, &adapterOpts, adapterCallback);

    // wgpu-native completes the request synchronously with AllowSpontaneous
    while (!adapterData.done) {
        wgpuInstanceProcessEvents(instance);
    }

    if (!adapterData.adapter) {
        std::cerr << "Failed to get adapter" << std::endl;
        wgpuSurfaceRelease(surface);
        wgpuInstanceRelease(instance);
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }
    WGPUAdapter adapter = adapterData.adapter;

    // Request device
    std::cout << "Requesting device..." << std::endl;
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = gpu::toStringView("Lucent Device");
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;

    DeviceUserData deviceData;
    WGPURequestDeviceCallbackInfo deviceCallback = {};
    deviceCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallback.callback = onDeviceRequestEnded;
    deviceCallback.userdata1 = &deviceData;
    wgpuAdapterRequestDevice(adapter, &deviceDesc, deviceCallback);

    while (!deviceData.done) {
        wgpuInstanceProcessEvents(instance);
    }

    if (!deviceData.device) {
        std::cerr << "Failed to get device" << std::endl;
        wgpuAdapterRelease(adapter);
        wgpuSurfaceRelease(surface);
        wgpuInstanceRelease(instance);
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }
    WGPUDevice device = deviceData.device;
    WGPUQueue queue = wgpuDeviceGetQueue(device);

    // Configure surface
    int fbWidth = 0, fbHeight = 0;
    glfwGetFramebufferSize(window, &fbWidth, &fbHeight);

    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(surface, adapter, &capabilities);

    WGPUTextureFormat surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    if (capabilities.formatCount > 0) {
        surfaceFormat = capabilities.formats[0];
    }
    WGPUPresentMode presentMode = opts.headless ? WGPUPresentMode_Immediate : WGPUPresentMode_Fifo;
    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    WGPUSurfaceConfiguration config = {};
    config.device = device;
    config.format = surfaceFormat;
    config.width = static_cast<uint32_t>(fbWidth);
    config.height = static_cast<uint32_t>(fbHeight);
    config.presentMode = presentMode;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    config.usage = WGPUTextureUsage_RenderAttachment;
    wgpuSurfaceConfigure(surface, &config);

    std::cout << "WebGPU initialized (" << fbWidth << "x" << fbHeight << ")" << std::endl;

    int exitCode = 0;
    {
        std::unique_ptr<Presenter> presenter;
        try {
            presenter = std::make_unique<Presenter>(device, queue, surfaceFormat);
        } catch (const std::exception& e) {
            std::cerr << "[Lucent] " << e.what() << std::endl;
            exitCode = 1;
        }

        if (presenter) {
            SceneManager manager(presenter->context());

            SettingsStore settings(opts.settingsPath);
            try {
                if (settings.load(manager)) {
                    std::cout << "[Lucent] Loaded settings from " << settings.path() << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "[Lucent] " << e.what() << "; using defaults" << std::endl;
            }

            PaletteExtractor extractor;
            PaletteRequester palettes;
            if (!opts.fallbackArt.empty()) {
                try {
                    palettes.setFallback(extractor.fromSource(opts.fallbackArt));
                } catch (const std::exception& e) {
                    std::cerr << "[Lucent] Fallback art unusable: " << e.what() << std::endl;
                }
            }
            if (!opts.art.empty()) {
                palettes.request(opts.art);
            }

            FrameClock clock;
            PhraseTracker phrases(opts.tempo, opts.barsPerPhrase);

            std::unique_ptr<ControlBridge> bridge;
            if (!opts.noControl) {
                bridge = std::make_unique<ControlBridge>();
                if (!bridge->start(opts.controlPort)) {
                    bridge.reset();
                }
            }

            std::unique_ptr<MidiMacroInput> midi;
            if (!opts.midiPort.empty()) {
                midi = std::make_unique<MidiMacroInput>();
                bool opened = false;
                bool numeric = std::all_of(opts.midiPort.begin(), opts.midiPort.end(),
                                           [](unsigned char c) { return std::isdigit(c) != 0; });
                if (numeric) {
                    try {
                        opened = midi->openPort(static_cast<unsigned int>(std::stoul(opts.midiPort)));
                    } catch (const std::out_of_range&) {
                        std::cerr << "[Lucent] MIDI port index out of range: " << opts.midiPort << std::endl;
                    }
                } else {
                    opened = midi->openPortByName(opts.midiPort);
                }
                if (!opened) {
                    midi.reset();
                }
            }

            MainLoopContext mlc;
            mlc.surface = surface;
            mlc.device = device;
            mlc.queue = queue;
            mlc.surfaceFormat = surfaceFormat;
            mlc.config = config;
            mlc.window = window;
            mlc.options = &opts;
            mlc.manager = &manager;
            mlc.presenter = presenter.get();
            mlc.clock = &clock;
            mlc.phrases = &phrases;
            mlc.palettes = &palettes;
            mlc.bridge = bridge.get();
            mlc.midi = midi.get();

            glfwSetWindowUserPointer(window, &mlc);
            glfwSetKeyCallback(window, [](GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/) {
                auto* ctx = static_cast<MainLoopContext*>(glfwGetWindowUserPointer(w));
                if (ctx && action == GLFW_PRESS) ctx->pressedKeys.push_back(key);
            });

            syncViewport(mlc);
            try {
                manager.loadScene(*initialScene);
            } catch (const std::exception& e) {
                std::cerr << "[Lucent] Initial scene " << sceneKindName(*initialScene)
                          << " failed: " << e.what() << std::endl;
            }

            clock.reset();
            while (mainLoopIteration(mlc)) {
            }

            glfwSetKeyCallback(window, nullptr);
            glfwSetWindowUserPointer(window, nullptr);

            try {
                settings.save(manager);
                std::cout << "[Lucent] Saved settings to " << settings.path() << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[Lucent] " << e.what() << std::endl;
            }

            if (bridge) {
                bridge->stop();
            }
        }
    }

    wgpuQueueRelease(queue);
    wgpuDeviceRelease(device);
    wgpuAdapterRelease(adapter);
    wgpuSurfaceRelease(surface);
    wgpuInstanceRelease(instance);
    glfwDestroyWindow(window);
    glfwTerminate();

    std::cout << "Lucent - Shutdown complete" << std::endl;
    return exitCode;
}
