// Lucent - Pipeline Builder Implementation

#include <lucent/gpu/pipeline_builder.h>
#include <lucent/gpu/gpu_common.h>
#include <stdexcept>

namespace lucent::gpu {

PipelineBuilder::PipelineBuilder(WGPUDevice device)
    : m_device(device) {}

PipelineBuilder::~PipelineBuilder() {
    // m_bindGroupLayout and m_pipeline are returned to the caller, who owns them
    if (m_shaderModule) {
        wgpuShaderModuleRelease(m_shaderModule);
    }
    if (m_pipelineLayout) {
        wgpuPipelineLayoutRelease(m_pipelineLayout);
    }
}

PipelineBuilder& PipelineBuilder::shader(const char* wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::shader(const std::string& wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format, BlendMode blend) {
    m_colorFormat = format;
    m_blend = blend;
    return *this;
}

PipelineBuilder& PipelineBuilder::depth(WGPUTextureFormat format, bool write, WGPUCompareFunction compare) {
    m_useDepth = true;
    m_depthFormat = format;
    m_depthWrite = write;
    m_depthCompare = compare;
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexBuffer(uint64_t stride, WGPUVertexStepMode stepMode) {
    VertexLayout layout;
    layout.stride = stride;
    layout.stepMode = stepMode;
    m_vertexLayouts.push_back(layout);
    return *this;
}

PipelineBuilder& PipelineBuilder::attribute(uint32_t location, WGPUVertexFormat format, uint64_t offset) {
    if (m_vertexLayouts.empty()) {
        throw std::logic_error("PipelineBuilder: attribute() before vertexBuffer()");
    }
    WGPUVertexAttribute attr = {};
    attr.shaderLocation = location;
    attr.format = format;
    attr.offset = offset;
    m_vertexLayouts.back().attributes.push_back(attr);
    return *this;
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size) {
    return uniform(binding, size, WGPUShaderStage_Fragment);
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility) {
    m_bindings.push_back({binding, BindingType::Uniform, size, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::texture(uint32_t binding) {
    m_bindings.push_back({binding, BindingType::Texture, 0, WGPUShaderStage_Fragment});
    return *this;
}

PipelineBuilder& PipelineBuilder::sampler(uint32_t binding) {
    m_bindings.push_back({binding, BindingType::Sampler, 0, WGPUShaderStage_Fragment});
    return *this;
}

void PipelineBuilder::createShaderModule() {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(m_shaderSource.c_str());

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    m_shaderModule = wgpuDeviceCreateShaderModule(m_device, &shaderDesc);
}

void PipelineBuilder::createBindGroupLayout() {
    std::vector<WGPUBindGroupLayoutEntry> entries(m_bindings.size());

    for (size_t i = 0; i < m_bindings.size(); ++i) {
        auto& entry = entries[i];
        auto& binding = m_bindings[i];

        entry = {};
        entry.binding = binding.binding;
        entry.visibility = binding.visibility;

        switch (binding.type) {
            case BindingType::Uniform:
                entry.buffer.type = WGPUBufferBindingType_Uniform;
                entry.buffer.minBindingSize = binding.size;
                break;
            case BindingType::Texture:
                entry.texture.sampleType = WGPUTextureSampleType_Float;
                entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                break;
            case BindingType::Sampler:
                entry.sampler.type = WGPUSamplerBindingType_Filtering;
                break;
        }
    }

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.entryCount = entries.size();
    layoutDesc.entries = entries.data();
    m_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);
}

void PipelineBuilder::createPipelineLayout() {
    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_bindGroupLayout;
    m_pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);
}

WGPURenderPipeline PipelineBuilder::build() {
    createShaderModule();
    createBindGroupLayout();
    createPipelineLayout();

    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = m_blend == BlendMode::Additive ? WGPUBlendFactor_One
                                                                : WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_colorFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;
    if (m_blend != BlendMode::None) {
        colorTarget.blend = &blendState;
    }

    WGPUFragmentState fragmentState = {};
    fragmentState.module = m_shaderModule;
    fragmentState.entryPoint = toStringView("fs_main");
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    std::vector<WGPUVertexBufferLayout> bufferLayouts(m_vertexLayouts.size());
    for (size_t i = 0; i < m_vertexLayouts.size(); ++i) {
        bufferLayouts[i] = {};
        bufferLayouts[i].arrayStride = m_vertexLayouts[i].stride;
        bufferLayouts[i].stepMode = m_vertexLayouts[i].stepMode;
        bufferLayouts[i].attributeCount = m_vertexLayouts[i].attributes.size();
        bufferLayouts[i].attributes = m_vertexLayouts[i].attributes.data();
    }

    WGPUDepthStencilState depthState = {};
    depthState.format = m_depthFormat;
    depthState.depthWriteEnabled = m_depthWrite ? WGPUOptionalBool_True : WGPUOptionalBool_False;
    depthState.depthCompare = m_depthCompare;
    depthState.stencilFront.compare = WGPUCompareFunction_Always;
    depthState.stencilBack.compare = WGPUCompareFunction_Always;
    depthState.stencilReadMask = 0;
    depthState.stencilWriteMask = 0;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.layout = m_pipelineLayout;
    pipelineDesc.vertex.module = m_shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView("vs_main");
    pipelineDesc.vertex.bufferCount = bufferLayouts.size();
    pipelineDesc.vertex.buffers = bufferLayouts.empty() ? nullptr : bufferLayouts.data();
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.depthStencil = m_useDepth ? &depthState : nullptr;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragmentState;

    m_pipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);
    return m_pipeline;
}

} // namespace lucent::gpu
