#pragma once

#include <cstddef>

namespace Planform {

/**
 * Security limits for file loading and input validation.
 * These constants prevent malicious files from causing memory exhaustion
 * or other denial-of-service conditions.
 */
namespace Limits {

// Maximum JSON file size before parsing (50 MB)
constexpr size_t MAX_DOCUMENT_JSON_SIZE = 50 * 1024 * 1024;

// Collection size limits from JSON (prevents OOM from malicious files)
constexpr size_t MAX_CORNERS = 100000;         // 100K corners
constexpr size_t MAX_WALLS = 200000;           // 200K walls
constexpr size_t MAX_ROOMS = 10000;            // 10K rooms
constexpr size_t MAX_ITEMS = 100000;           // 100K items
constexpr size_t MAX_ITEM_METADATA = 1000;     // Entries per item

// Largest absolute world coordinate accepted from a document (1000 km)
constexpr float MAX_COORDINATE = 1.0e8f;

}  // namespace Limits
}  // namespace Planform
