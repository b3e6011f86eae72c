// Lucent - Pipeline Builder Utility
// Fluent API for creating scene render pipelines with less boilerplate

#pragma once

#include <webgpu/webgpu.h>
#include <vector>
#include <string>

namespace lucent::gpu {

// Binding types for the builder
enum class BindingType {
    Uniform,
    Texture,
    Sampler
};

struct BindingEntry {
    uint32_t binding;
    BindingType type;
    uint64_t size;  // For uniform buffers
    WGPUShaderStage visibility;
};

// How a scene's output combines with what is already in the target
enum class BlendMode {
    None,       // overwrite
    Alpha,      // src * a + dst * (1 - a)
    Additive    // src * a + dst
};

struct VertexLayout {
    uint64_t stride = 0;
    WGPUVertexStepMode stepMode = WGPUVertexStepMode_Vertex;
    std::vector<WGPUVertexAttribute> attributes;
};

// Pipeline builder with fluent interface
class PipelineBuilder {
public:
    explicit PipelineBuilder(WGPUDevice device);
    ~PipelineBuilder();

    // Shader configuration
    PipelineBuilder& shader(const char* wgslSource);
    PipelineBuilder& shader(const std::string& wgslSource);

    // Output configuration
    PipelineBuilder& colorTarget(WGPUTextureFormat format, BlendMode blend = BlendMode::None);
    PipelineBuilder& depth(WGPUTextureFormat format, bool write = true,
                           WGPUCompareFunction compare = WGPUCompareFunction_Less);

    // Vertex input; attributes are added to the most recent vertexBuffer()
    PipelineBuilder& vertexBuffer(uint64_t stride, WGPUVertexStepMode stepMode = WGPUVertexStepMode_Vertex);
    PipelineBuilder& attribute(uint32_t location, WGPUVertexFormat format, uint64_t offset);

    // Binding configuration - fragment stage by default
    PipelineBuilder& uniform(uint32_t binding, uint64_t size);
    PipelineBuilder& texture(uint32_t binding);
    PipelineBuilder& sampler(uint32_t binding);

    // Binding configuration with explicit visibility
    PipelineBuilder& uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility);

    // Build the pipeline
    WGPURenderPipeline build();

    // Access the bind group layout after build()
    WGPUBindGroupLayout bindGroupLayout() const { return m_bindGroupLayout; }

private:
    void createBindGroupLayout();
    void createPipelineLayout();
    void createShaderModule();

    WGPUDevice m_device;
    std::string m_shaderSource;
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_RGBA8Unorm;
    BlendMode m_blend = BlendMode::None;

    bool m_useDepth = false;
    WGPUTextureFormat m_depthFormat = WGPUTextureFormat_Depth24Plus;
    bool m_depthWrite = true;
    WGPUCompareFunction m_depthCompare = WGPUCompareFunction_Less;

    std::vector<BindingEntry> m_bindings;
    std::vector<VertexLayout> m_vertexLayouts;

    // Created resources
    WGPUShaderModule m_shaderModule = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPURenderPipeline m_pipeline = nullptr;
};

} // namespace lucent::gpu
