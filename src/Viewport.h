#pragma once

#include "Geometry.h"

namespace Planform {

/**
 * Viewport manages the pan/zoom mapping between world centimeters and
 * device pixels.
 *
 * The origin is a device-pixel offset expressed in world-cm-scaled units:
 * device (0, 0) maps to world (originX * cmPerPixel, originY * cmPerPixel).
 * cmPerPixel and pixelsPerCm are always derived together from zoom.
 */
class Viewport {
public:
    Viewport();

    static constexpr float BASE_CM_PER_PIXEL = 2.0f;
    static constexpr float MIN_ZOOM = 0.2f;
    static constexpr float MAX_ZOOM = 8.0f;
    static constexpr float DEFAULT_ZOOM = 1.0f;

    // Multipliers applied per wheel notch (deliberately not reciprocal)
    static constexpr float ZOOM_OUT_FACTOR = 0.8f;
    static constexpr float ZOOM_IN_FACTOR = 1.25f;

    // Coordinate transformations
    Point2D WorldFromDevice(float dx, float dy) const;
    Point2D DeviceFromWorld(float wx, float wy) const;
    Point2D WorldFromDevice(const Point2D& device) const {
        return WorldFromDevice(device.x, device.y);
    }
    Point2D DeviceFromWorld(const Point2D& world) const {
        return DeviceFromWorld(world.x, world.y);
    }

    // View manipulation
    void Pan(float dDevX, float dDevY);

    /**
     * Zoom around a device-space anchor.
     * @param wheelDelta > 0 zooms out, otherwise zooms in
     * @param deviceX, deviceY Cursor position; the world point under it
     *        stays fixed
     */
    void ZoomAt(float wheelDelta, float deviceX, float deviceY);

    void SetZoom(float newZoom);
    void SetOrigin(float x, float y);

    // Rendering surface size in device pixels (set on resize)
    void SetDeviceSize(int width, int height);
    int GetDeviceWidth() const { return m_deviceW; }
    int GetDeviceHeight() const { return m_deviceH; }

    // Queries
    float GetOriginX() const { return m_originX; }
    float GetOriginY() const { return m_originY; }
    float GetZoom() const { return m_zoom; }
    float GetCmPerPixel() const { return m_cmPerPixel; }
    float GetPixelsPerCm() const { return m_pixelsPerCm; }

private:
    void UpdateScale();

    float m_originX;
    float m_originY;
    float m_zoom;
    float m_cmPerPixel;
    float m_pixelsPerCm;
    int m_deviceW;
    int m_deviceH;
};

} // namespace Planform
