// Lucent - GPU Common Helpers

#include <lucent/gpu/gpu_common.h>

namespace lucent::gpu {

static WGPUBuffer createBuffer(WGPUDevice device, uint64_t size, WGPUBufferUsage usage,
                               const char* label) {
    WGPUBufferDescriptor desc = {};
    desc.label = toStringView(label);
    desc.size = (size + 3) & ~uint64_t(3);  // writeBuffer needs 4-byte multiples
    desc.usage = usage;
    desc.mappedAtCreation = false;
    return wgpuDeviceCreateBuffer(device, &desc);
}

WGPUBuffer createUniformBuffer(WGPUDevice device, uint64_t size, const char* label) {
    return createBuffer(device, size, WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst, label);
}

WGPUBuffer createVertexBuffer(WGPUDevice device, WGPUQueue queue,
                              const void* data, uint64_t size, const char* label) {
    WGPUBuffer buffer = createBuffer(device, size, WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst, label);
    if (buffer) {
        wgpuQueueWriteBuffer(queue, buffer, 0, data, size);
    }
    return buffer;
}

WGPUBuffer createIndexBuffer(WGPUDevice device, WGPUQueue queue,
                             const void* data, uint64_t size, const char* label) {
    WGPUBuffer buffer = createBuffer(device, size, WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst, label);
    if (buffer) {
        wgpuQueueWriteBuffer(queue, buffer, 0, data, size);
    }
    return buffer;
}

WGPUBindGroup createUniformBindGroup(WGPUDevice device, WGPUBindGroupLayout layout,
                                     WGPUBuffer buffer, uint64_t size, const char* label) {
    WGPUBindGroupEntry entry = {};
    entry.binding = 0;
    entry.buffer = buffer;
    entry.offset = 0;
    entry.size = size;

    WGPUBindGroupDescriptor desc = {};
    desc.label = toStringView(label);
    desc.layout = layout;
    desc.entryCount = 1;
    desc.entries = &entry;
    return wgpuDeviceCreateBindGroup(device, &desc);
}

WGPUTexture createDepthTexture(WGPUDevice device, int width, int height,
                               WGPUTextureFormat format, const char* label) {
    WGPUTextureDescriptor desc = {};
    desc.label = toStringView(label);
    desc.usage = WGPUTextureUsage_RenderAttachment;
    desc.dimension = WGPUTextureDimension_2D;
    desc.size = {static_cast<uint32_t>(width > 0 ? width : 1),
                 static_cast<uint32_t>(height > 0 ? height : 1), 1};
    desc.format = format;
    desc.mipLevelCount = 1;
    desc.sampleCount = 1;
    return wgpuDeviceCreateTexture(device, &desc);
}

WGPUTextureView createView(WGPUTexture texture, WGPUTextureFormat format) {
    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = format;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    return wgpuTextureCreateView(texture, &viewDesc);
}

WGPURenderPassEncoder beginLoadPass(const RenderTarget& target, WGPUTextureView depthView) {
    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = target.view;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Load;
    colorAttachment.storeOp = WGPUStoreOp_Store;

    WGPURenderPassDepthStencilAttachment depthAttachment = {};
    depthAttachment.view = depthView;
    depthAttachment.depthLoadOp = WGPULoadOp_Clear;
    depthAttachment.depthStoreOp = WGPUStoreOp_Discard;
    depthAttachment.depthClearValue = 1.0f;

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;
    passDesc.depthStencilAttachment = depthView ? &depthAttachment : nullptr;

    return wgpuCommandEncoderBeginRenderPass(target.encoder, &passDesc);
}

void endPass(WGPURenderPassEncoder pass) {
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
}

void clearTarget(const RenderTarget& target, double r, double g, double b) {
    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = target.view;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {r, g, b, 1.0};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(target.encoder, &passDesc);
    endPass(pass);
}

} // namespace lucent::gpu
