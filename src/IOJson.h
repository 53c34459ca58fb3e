#pragma once

#include <string>

namespace Planform {

class Model;

/**
 * JSON serialization for floor plan documents.
 * Handles reading/writing the version 1 document with stable ordering.
 */
class IOJson {
public:
    static constexpr int DOCUMENT_VERSION = 1;

    /**
     * Save model to JSON string.
     * @param model Model to save
     * @return JSON string
     */
    static std::string SaveToString(const Model& model);
    
    /**
     * Load model from JSON string.
     * Walls referencing a missing corner are dropped and logged; corner
     * adjacency is rebuilt from the surviving walls.
     * @param json JSON string
     * @param outModel Output model (unchanged on failure)
     * @param errorMsg Receives the reason on failure
     * @return true on success, false on error
     */
    static bool LoadFromString(
        const std::string& json,
        Model& outModel,
        std::string& errorMsg
    );
    
    /**
     * Save model to JSON file.
     * @param model Model to save
     * @param path File path
     * @param errorMsg Receives the reason on failure
     * @return true on success
     */
    static bool SaveToFile(
        const Model& model,
        const std::string& path,
        std::string& errorMsg
    );
    
    /**
     * Load model from JSON file.
     * @param path File path
     * @param outModel Output model (unchanged on failure)
     * @param errorMsg Receives the reason on failure
     * @return true on success
     */
    static bool LoadFromFile(
        const std::string& path,
        Model& outModel,
        std::string& errorMsg
    );
};

} // namespace Planform
