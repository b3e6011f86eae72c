#pragma once

/**
 * @file terrain.h
 * @brief Rolling height-field ground plane seen from an orbiting camera
 */

#include <lucent/camera.h>
#include <lucent/scene.h>
#include <lucent/gpu/gpu_handle.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace lucent::scenes {

// Uniform buffer structure (must match shader, 16-byte aligned)
struct TerrainUniforms {
    float viewProj[16];
    float colorA[4];
    float colorB[4];
    float time;
    float weight;
    float _pad[2];
};

class Terrain : public Scene {
public:
    static constexpr int SEGMENTS = 256;
    static constexpr float SIZE = 8.0f;
    static constexpr WGPUTextureFormat DEPTH_FORMAT = WGPUTextureFormat_Depth24Plus;

    Terrain();

    void init(SceneManager& manager) override;
    void update(double dt, SceneManager& manager) override;
    void render(const RenderTarget& target, const Camera& camera, float weight,
                SceneManager& manager) override;

    uint32_t capabilities() const override {
        return SceneCapability::Resize | SceneCapability::Palette;
    }
    void resize(int width, int height) override;
    void setPalette(const Palette& palette) override;

    /// @brief XZ positions of a (segments + 1)^2 grid centred on the origin
    static std::vector<float> gridVertices(int segments, float size);

    /// @brief Two triangles per cell, row-major
    static std::vector<uint32_t> gridIndices(int segments);

    /// @brief Surface displacement at (x, z) and time t
    static float heightAt(float x, float z, float t);

    /// @brief Orbit position at time t; the camera always looks at the origin
    static glm::vec3 cameraPosition(float t);

    const Camera& camera() const { return m_camera; }
    const TerrainUniforms& uniforms() const { return m_uniforms; }

protected:
    void onDispose() override;

private:
    void createPipeline(SceneManager& manager);
    void createGeometry(SceneManager& manager);
    void createDepthBuffer(int width, int height);
    void refresh(SceneManager& manager);

    Camera m_camera;
    TerrainUniforms m_uniforms = {};
    double m_time = 0.0;
    uint32_t m_indexCount = 0;
    int m_depthWidth = 0;
    int m_depthHeight = 0;

    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    gpu::RenderPipelineHandle m_pipeline;
    gpu::BindGroupLayoutHandle m_bindGroupLayout;
    gpu::BufferHandle m_uniformBuffer;
    gpu::BufferHandle m_vertexBuffer;
    gpu::BufferHandle m_indexBuffer;
    gpu::BindGroupHandle m_bindGroup;
    gpu::TextureHandle m_depthTexture;
    gpu::TextureViewHandle m_depthView;
};

} // namespace lucent::scenes
