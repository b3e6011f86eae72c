// Camera implementation

#include <lucent/camera.h>

namespace lucent {

Camera::Camera() {
    updateProjectionMatrix();
    updateViewMatrix();
}

void Camera::setPerspective(float fovDegrees, float aspectRatio, float nearPlane, float farPlane) {
    fovDegrees_ = fovDegrees;
    aspectRatio_ = aspectRatio;
    nearPlane_ = nearPlane;
    farPlane_ = farPlane;
    updateProjectionMatrix();
}

void Camera::setAspectRatio(float aspectRatio) {
    if (aspectRatio <= 0.0f) {
        return;
    }
    aspectRatio_ = aspectRatio;
    updateProjectionMatrix();
}

void Camera::lookAt(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up) {
    position_ = eye;
    target_ = target;
    worldUp_ = up;
    updateViewMatrix();
}

void Camera::updateViewMatrix() {
    viewMatrix_ = glm::lookAt(position_, target_, worldUp_);
}

void Camera::updateProjectionMatrix() {
    // WebGPU clip space has depth in [0, 1]
    projectionMatrix_ = glm::perspectiveRH_ZO(glm::radians(fovDegrees_), aspectRatio_, nearPlane_, farPlane_);
}

} // namespace lucent
