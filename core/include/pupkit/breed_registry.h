#pragma once

/**
 * @file breed_registry.h
 * @brief Registry holding exactly one immutable BreedSkeleton per breed id
 *
 * The built-in registry carries every stock breed. Additional breeds can be
 * loaded from JSON breed files:
 *
 * @code
 * {
 *   "breeds": [
 *     { "breedId": "beagle", "heightScale": 0.6, "torsoAspectRatio": 1.5,
 *       "legLengthRatio": 0.36, "legThicknessRatio": 0.2, "headSizeRatio": 0.5,
 *       "snoutLengthRatio": 0.4, "earHeightRatio": 0.7, "tailLengthRatio": 0.4,
 *       "earsFloppy": true, "primaryColor": "#A0522D",
 *       "secondaryColor": "#FFFFFF", "accentColor": "#1A0A00",
 *       "animationSpeedMultiplier": 1.1 }
 *   ]
 * }
 * @endcode
 */

#include <pupkit/breed_skeleton.h>
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pupkit {

/**
 * @brief Breed id to skeleton lookup
 *
 * Entries are heap-allocated and never replaced, so references returned by
 * configFor() stay valid for the registry's lifetime. Registering an id that
 * already exists is a configuration error.
 */
class BreedRegistry {
public:
    BreedRegistry() = default;

    /// @brief Shared registry pre-populated with the stock breeds
    static const BreedRegistry& builtin();

    /// @brief Registry with the stock breeds, for callers that add their own
    static BreedRegistry withBuiltins();

    /**
     * @brief Look up a breed
     * @throw std::runtime_error if the id is not registered
     */
    const BreedSkeleton& configFor(const std::string& breedId) const;

    /// @brief Check whether a breed id is registered
    bool contains(const std::string& breedId) const;

    /// @brief All registered ids, sorted
    std::vector<std::string> breedIds() const;

    size_t size() const { return m_breeds.size(); }

    /**
     * @brief Add a breed
     * @throw std::runtime_error if the skeleton is out of range or the id is taken
     */
    const BreedSkeleton& registerBreed(BreedSkeleton skeleton);

    /**
     * @brief Register every breed in a parsed breed document
     * @return Number of breeds added
     * @throw std::runtime_error on malformed documents or invalid breeds
     */
    size_t loadJson(const nlohmann::json& doc);

    /**
     * @brief Load a JSON breed file
     * @param path Path to breed file
     * @param error Receives the failure reason
     * @return false if the file cannot be read, parsed or validated
     */
    bool loadFile(const std::string& path, std::string& error);

    // Assigning over a registry would free skeletons that controllers borrow
    BreedRegistry(BreedRegistry&&) = default;
    BreedRegistry& operator=(BreedRegistry&&) = delete;
    BreedRegistry(const BreedRegistry&) = delete;
    BreedRegistry& operator=(const BreedRegistry&) = delete;

private:
    std::map<std::string, std::unique_ptr<const BreedSkeleton>> m_breeds;
};

/// @brief Shorthand for BreedRegistry::builtin().configFor()
const BreedSkeleton& configFor(const std::string& breedId);

} // namespace pupkit
