#include "Viewport.h"
#include <algorithm>

namespace Planform {

Viewport::Viewport()
    : m_originX(0.0f), m_originY(0.0f), m_zoom(DEFAULT_ZOOM),
      m_cmPerPixel(BASE_CM_PER_PIXEL / DEFAULT_ZOOM),
      m_pixelsPerCm(DEFAULT_ZOOM / BASE_CM_PER_PIXEL),
      m_deviceW(0), m_deviceH(0)
{
}

Point2D Viewport::WorldFromDevice(float dx, float dy) const {
    return Point2D(
        dx * m_cmPerPixel + m_originX * m_cmPerPixel,
        dy * m_cmPerPixel + m_originY * m_cmPerPixel
    );
}

Point2D Viewport::DeviceFromWorld(float wx, float wy) const {
    return Point2D(
        (wx - m_originX * m_cmPerPixel) * m_pixelsPerCm,
        (wy - m_originY * m_cmPerPixel) * m_pixelsPerCm
    );
}

void Viewport::Pan(float dDevX, float dDevY) {
    m_originX -= dDevX;
    m_originY -= dDevY;
}

void Viewport::ZoomAt(float wheelDelta, float deviceX, float deviceY) {
    Point2D worldBefore = WorldFromDevice(deviceX, deviceY);

    float factor = (wheelDelta > 0.0f) ? ZOOM_OUT_FACTOR : ZOOM_IN_FACTOR;
    SetZoom(m_zoom * factor);

    // Solve the origin so deviceX/Y maps back onto worldBefore
    m_originX = worldBefore.x / m_cmPerPixel - deviceX;
    m_originY = worldBefore.y / m_cmPerPixel - deviceY;
}

void Viewport::SetZoom(float newZoom) {
    m_zoom = std::clamp(newZoom, MIN_ZOOM, MAX_ZOOM);
    UpdateScale();
}

void Viewport::SetOrigin(float x, float y) {
    m_originX = x;
    m_originY = y;
}

void Viewport::SetDeviceSize(int width, int height) {
    m_deviceW = std::max(0, width);
    m_deviceH = std::max(0, height);
}

void Viewport::UpdateScale() {
    m_cmPerPixel = BASE_CM_PER_PIXEL / m_zoom;
    m_pixelsPerCm = m_zoom / BASE_CM_PER_PIXEL;
}

} // namespace Planform
