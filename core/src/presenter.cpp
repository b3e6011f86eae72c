// Lucent - Presenter

#include <lucent/presenter.h>
#include <lucent/gpu/gpu_common.h>
#include <lucent/gpu/pipeline_builder.h>
#include <iostream>
#include <stdexcept>
#include <string>

namespace lucent {

namespace {

const char* BLIT_FRAGMENT_SHADER = R"(
@group(0) @binding(0) var canvasSampler: sampler;
@group(0) @binding(1) var canvasTexture: texture_2d<f32>;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let uv = vec2f(input.uv.x, 1.0 - input.uv.y);
    return vec4f(textureSample(canvasTexture, canvasSampler, uv).rgb, 1.0);
}
)";

} // namespace

Presenter::Presenter(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat)
    : m_device(device)
    , m_queue(queue)
    , m_surfaceFormat(surfaceFormat) {
    createBlitPipeline();
}

GpuContext Presenter::context() const {
    GpuContext ctx;
    ctx.device = m_device;
    ctx.queue = m_queue;
    ctx.format = CANVAS_FORMAT;
    return ctx;
}

void Presenter::createBlitPipeline() {
    std::string shaderSource = std::string(gpu::FULLSCREEN_VERTEX_SHADER) + BLIT_FRAGMENT_SHADER;

    gpu::PipelineBuilder builder(m_device);
    builder.shader(shaderSource)
           .colorTarget(m_surfaceFormat)
           .sampler(0)
           .texture(1);

    m_blitPipeline.reset(builder.build());
    m_blitBindGroupLayout.reset(builder.bindGroupLayout());
    if (!m_blitPipeline) {
        throw std::runtime_error("failed to create blit pipeline");
    }

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.label = gpu::toStringView("Canvas Sampler");
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Linear;
    samplerDesc.minFilter = WGPUFilterMode_Linear;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 1.0f;
    samplerDesc.maxAnisotropy = 1;
    m_sampler.reset(wgpuDeviceCreateSampler(m_device, &samplerDesc));
}

void Presenter::resizeCanvas(int width, int height) {
    if (width <= 0 || height <= 0) return;
    if (width == m_width && height == m_height && m_canvas) return;

    m_blitBindGroup.reset();
    m_canvasView.reset();

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = gpu::toStringView("Lucent Canvas");
    texDesc.size.width = static_cast<uint32_t>(width);
    texDesc.size.height = static_cast<uint32_t>(height);
    texDesc.size.depthOrArrayLayers = 1;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = CANVAS_FORMAT;
    texDesc.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding;
    m_canvas.reset(wgpuDeviceCreateTexture(m_device, &texDesc));
    if (!m_canvas) {
        throw std::runtime_error("failed to create " + std::to_string(width) + "x" +
                                 std::to_string(height) + " canvas");
    }
    m_canvasView.reset(gpu::createView(m_canvas, CANVAS_FORMAT));
    m_width = width;
    m_height = height;

    WGPUBindGroupEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].sampler = m_sampler;
    entries[1].binding = 1;
    entries[1].textureView = m_canvasView;

    WGPUBindGroupDescriptor bindGroupDesc = {};
    bindGroupDesc.label = gpu::toStringView("Blit Bind Group");
    bindGroupDesc.layout = m_blitBindGroupLayout;
    bindGroupDesc.entryCount = 2;
    bindGroupDesc.entries = entries;
    m_blitBindGroup.reset(wgpuDeviceCreateBindGroup(m_device, &bindGroupDesc));

    std::cout << "[Presenter] Canvas " << width << "x" << height << std::endl;
}

RenderTarget Presenter::canvasTarget(WGPUCommandEncoder encoder) const {
    RenderTarget target;
    target.encoder = encoder;
    target.view = m_canvasView;
    target.format = CANVAS_FORMAT;
    target.width = m_width;
    target.height = m_height;
    return target;
}

void Presenter::present(WGPUCommandEncoder encoder, WGPUTextureView surfaceView, int width, int height) {
    if (!m_blitBindGroup || !surfaceView) return;

    RenderTarget surface;
    surface.encoder = encoder;
    surface.view = surfaceView;
    surface.format = m_surfaceFormat;
    surface.width = width;
    surface.height = height;
    gpu::clearTarget(surface, 0.0, 0.0, 0.0);

    WGPURenderPassEncoder pass = gpu::beginLoadPass(surface);
    wgpuRenderPassEncoderSetViewport(pass, 0, 0, static_cast<float>(width), static_cast<float>(height), 0, 1);
    wgpuRenderPassEncoderSetPipeline(pass, m_blitPipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_blitBindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
    gpu::endPass(pass);
}

} // namespace lucent
