#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace lucent {

/// Perspective camera with a look-at view
class Camera {
public:
    Camera();

    /// Set perspective projection
    /// @param fovDegrees Vertical field of view in degrees
    /// @param aspectRatio Width / height ratio
    /// @param nearPlane Near clipping plane distance
    /// @param farPlane Far clipping plane distance
    void setPerspective(float fovDegrees, float aspectRatio, float nearPlane = 0.1f, float farPlane = 1000.0f);

    /// Update aspect ratio (e.g., on window resize)
    void setAspectRatio(float aspectRatio);

    /// Set camera position and look target
    void lookAt(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up = glm::vec3(0, 1, 0));

    const glm::vec3& position() const { return position_; }
    const glm::vec3& target() const { return target_; }
    float aspectRatio() const { return aspectRatio_; }
    float fov() const { return fovDegrees_; }

    const glm::mat4& projectionMatrix() const { return projectionMatrix_; }
    const glm::mat4& viewMatrix() const { return viewMatrix_; }

    /// Get combined view-projection matrix
    glm::mat4 viewProjectionMatrix() const { return projectionMatrix_ * viewMatrix_; }

private:
    void updateViewMatrix();
    void updateProjectionMatrix();

    float fovDegrees_ = 60.0f;
    float aspectRatio_ = 16.0f / 9.0f;
    float nearPlane_ = 0.1f;
    float farPlane_ = 1000.0f;

    glm::vec3 position_{0, 0, 5};
    glm::vec3 target_{0, 0, 0};
    glm::vec3 worldUp_{0, 1, 0};

    glm::mat4 viewMatrix_{1.0f};
    glm::mat4 projectionMatrix_{1.0f};
};

} // namespace lucent
