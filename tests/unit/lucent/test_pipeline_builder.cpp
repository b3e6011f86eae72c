/**
 * @file test_pipeline_builder.cpp
 * @brief PipelineBuilder configuration checks that need no device
 */

#include <catch2/catch_test_macros.hpp>
#include <lucent/gpu/pipeline_builder.h>
#include <stdexcept>

using namespace lucent;

TEST_CASE("PipelineBuilder attributes need a vertex buffer", "[gpu][builder]") {
    gpu::PipelineBuilder builder(nullptr);

    REQUIRE_THROWS_AS(builder.attribute(0, WGPUVertexFormat_Float32x2, 0), std::logic_error);

    builder.vertexBuffer(16, WGPUVertexStepMode_Instance);
    REQUIRE_NOTHROW(builder
        .attribute(0, WGPUVertexFormat_Float32x2, 0)
        .attribute(1, WGPUVertexFormat_Float32x2, 8));
    REQUIRE(builder.bindGroupLayout() == nullptr);
}
