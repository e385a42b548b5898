// Breed Registry
// Stock breed table and JSON breed-file loading

#include <pupkit/breed_registry.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace pupkit {

namespace {

BreedSkeleton makeBreed(const char* id,
                        float height, float torso, float leg, float thick,
                        float head, float snout, float ear, float tail,
                        uint32_t primary, uint32_t secondary, uint32_t accent,
                        float speed) {
    BreedSkeleton s;
    s.breedId = id;
    s.heightScale = height;
    s.torsoAspectRatio = torso;
    s.legLengthRatio = leg;
    s.legThicknessRatio = thick;
    s.headSizeRatio = head;
    s.snoutLengthRatio = snout;
    s.earHeightRatio = ear;
    s.tailLengthRatio = tail;
    s.primaryColor = Color::fromHex(primary);
    s.secondaryColor = Color::fromHex(secondary);
    s.accentColor = Color::fromHex(accent);
    s.animationSpeedMultiplier = speed;
    return s;
}

// Stock breeds. German Shepherd is the reference dog (heightScale 1.0).
std::vector<BreedSkeleton> stockBreeds() {
    std::vector<BreedSkeleton> breeds;

    //                       id                 height torso leg   thick head  snout ear   tail  primary   secondary accent    speed
    auto golden   = makeBreed("goldenRetriever", 0.85f, 1.40f, 0.44f, 0.19f, 0.48f, 0.42f, 0.48f, 0.45f, 0xDAA520, 0xF5E0A0, 0x3E2200, 1.00f);
    golden.earsFloppy = true;
    breeds.push_back(golden);

    auto shepherd = makeBreed("germanShepherd",  1.00f, 1.40f, 0.48f, 0.18f, 0.44f, 0.48f, 0.75f, 0.48f, 0x8B6914, 0x1A1A1A, 0x3E2200, 1.00f);
    breeds.push_back(shepherd);

    // Sausage dog: the torso aspect ratio is the whole look
    auto dachshund = makeBreed("dachshund",      0.50f, 3.20f, 0.18f, 0.22f, 0.50f, 0.40f, 0.65f, 0.30f, 0x8B4513, 0xC87941, 0x1A0800, 1.20f);
    dachshund.earsFloppy = true;
    breeds.push_back(dachshund);

    auto corgi    = makeBreed("corgi",           0.55f, 1.90f, 0.20f, 0.22f, 0.52f, 0.38f, 0.85f, 0.15f, 0xE08A3C, 0xFFF5E6, 0x2B1600, 1.25f);
    breeds.push_back(corgi);

    auto husky    = makeBreed("husky",           0.95f, 1.45f, 0.46f, 0.19f, 0.46f, 0.45f, 0.70f, 0.55f, 0x6E7B8B, 0xF2F2F2, 0x101820, 1.10f);
    husky.tailCurledOverBack = true;
    breeds.push_back(husky);

    auto shiba    = makeBreed("shibaInu",        0.65f, 1.35f, 0.40f, 0.20f, 0.50f, 0.38f, 0.65f, 0.45f, 0xD2773A, 0xFFF0DC, 0x2A1200, 1.15f);
    shiba.tailCurledOverBack = true;
    breeds.push_back(shiba);

    auto bulldog  = makeBreed("bulldog",         0.55f, 1.60f, 0.22f, 0.30f, 0.62f, 0.05f, 0.25f, 0.10f, 0xE3C9A8, 0xFFFFFF, 0x2B1B10, 0.70f);
    bulldog.earsFloppy = true;
    bulldog.hasFlatFace = true;
    breeds.push_back(bulldog);

    auto pug      = makeBreed("pug",             0.45f, 1.30f, 0.24f, 0.28f, 0.62f, 0.08f, 0.30f, 0.15f, 0xD8C3A0, 0x2E2620, 0x1A1410, 0.85f);
    pug.earsFloppy = true;
    pug.hasFlatFace = true;
    pug.tailCurledOverBack = true;
    breeds.push_back(pug);

    auto poodle   = makeBreed("poodle",          0.80f, 1.20f, 0.55f, 0.15f, 0.45f, 0.50f, 0.60f, 0.30f, 0xF5F0E6, 0xFFFFFF, 0x222222, 1.00f);
    poodle.earsFloppy = true;
    poodle.hasPoodleFuzz = true;
    breeds.push_back(poodle);

    auto dalmatian = makeBreed("dalmatian",      0.90f, 1.40f, 0.48f, 0.17f, 0.44f, 0.48f, 0.50f, 0.45f, 0xFAFAFA, 0xFFFFFF, 0x111111, 1.05f);
    dalmatian.earsFloppy = true;
    dalmatian.hasSpots = true;
    breeds.push_back(dalmatian);

    auto collie   = makeBreed("borderCollie",    0.85f, 1.45f, 0.44f, 0.18f, 0.45f, 0.55f, 0.55f, 0.50f, 0x1E1E1E, 0xFFFFFF, 0x3A2A20, 1.15f);
    breeds.push_back(collie);

    return breeds;
}

const char* typeName(const json& j) {
    return j.type_name();
}

float readRatio(const json& entry, const char* key, float fallback, const std::string& where) {
    if (!entry.contains(key)) {
        return fallback;
    }
    const json& v = entry[key];
    if (!v.is_number()) {
        throw std::runtime_error(where + ": '" + key + "' must be a number, got " + typeName(v));
    }
    return v.get<float>();
}

bool readFlag(const json& entry, const char* key, const std::string& where) {
    if (!entry.contains(key)) {
        return false;
    }
    const json& v = entry[key];
    if (!v.is_boolean()) {
        throw std::runtime_error(where + ": '" + key + "' must be a boolean, got " + typeName(v));
    }
    return v.get<bool>();
}

Color readColor(const json& entry, const char* key, const std::string& where) {
    if (!entry.contains(key)) {
        throw std::runtime_error(where + ": missing color '" + key + "'");
    }
    const json& v = entry[key];
    if (v.is_number_unsigned() || v.is_number_integer()) {
        auto hex = v.get<int64_t>();
        if (hex < 0 || hex > 0xFFFFFF) {
            throw std::runtime_error(where + ": '" + key + "' must be 0xRRGGBB");
        }
        return Color::fromHex(static_cast<uint32_t>(hex));
    }
    Color c;
    if (v.is_string() && Color::parseHex(v.get<std::string>(), c)) {
        return c;
    }
    throw std::runtime_error(where + ": '" + key + "' is not a #RRGGBB color");
}

} // namespace

// -------------------------------------------------------------------------
// Construction
// -------------------------------------------------------------------------

const BreedRegistry& BreedRegistry::builtin() {
    static const BreedRegistry registry = withBuiltins();
    return registry;
}

BreedRegistry BreedRegistry::withBuiltins() {
    BreedRegistry registry;
    for (auto& breed : stockBreeds()) {
        registry.registerBreed(std::move(breed));
    }
    return registry;
}

// -------------------------------------------------------------------------
// Lookup
// -------------------------------------------------------------------------

const BreedSkeleton& BreedRegistry::configFor(const std::string& breedId) const {
    auto it = m_breeds.find(breedId);
    if (it == m_breeds.end()) {
        std::ostringstream msg;
        msg << "No skeleton config registered for breed '" << breedId << "' (registered:";
        for (const auto& entry : m_breeds) {
            msg << " " << entry.first;
        }
        msg << ")";
        throw std::runtime_error(msg.str());
    }
    return *it->second;
}

bool BreedRegistry::contains(const std::string& breedId) const {
    return m_breeds.find(breedId) != m_breeds.end();
}

std::vector<std::string> BreedRegistry::breedIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_breeds.size());
    for (const auto& entry : m_breeds) {
        ids.push_back(entry.first);
    }
    return ids;
}

// -------------------------------------------------------------------------
// Registration
// -------------------------------------------------------------------------

const BreedSkeleton& BreedRegistry::registerBreed(BreedSkeleton skeleton) {
    std::string error;
    if (!validateSkeleton(skeleton, error)) {
        throw std::runtime_error("Invalid breed skeleton: " + error);
    }
    if (contains(skeleton.breedId)) {
        throw std::runtime_error("Breed '" + skeleton.breedId + "' is already registered");
    }

    std::string id = skeleton.breedId;
    auto stored = std::make_unique<const BreedSkeleton>(std::move(skeleton));
    const BreedSkeleton& ref = *stored;
    m_breeds.emplace(id, std::move(stored));
    return ref;
}

size_t BreedRegistry::loadJson(const json& doc) {
    if (!doc.is_object() || !doc.contains("breeds") || !doc["breeds"].is_array()) {
        throw std::runtime_error("Breed document must be an object with a 'breeds' array");
    }

    // Parse and validate everything first so a bad entry leaves the registry untouched
    std::vector<BreedSkeleton> parsed;
    const json& breeds = doc["breeds"];
    for (size_t i = 0; i < breeds.size(); ++i) {
        const json& entry = breeds[i];
        std::string where = "breeds[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            throw std::runtime_error(where + ": expected an object");
        }
        if (!entry.contains("breedId") || !entry["breedId"].is_string()) {
            throw std::runtime_error(where + ": missing string 'breedId'");
        }

        BreedSkeleton s;
        s.breedId = entry["breedId"].get<std::string>();
        where += " (" + s.breedId + ")";

        s.heightScale = readRatio(entry, "heightScale", s.heightScale, where);
        s.torsoAspectRatio = readRatio(entry, "torsoAspectRatio", s.torsoAspectRatio, where);
        s.legLengthRatio = readRatio(entry, "legLengthRatio", s.legLengthRatio, where);
        s.legThicknessRatio = readRatio(entry, "legThicknessRatio", s.legThicknessRatio, where);
        s.headSizeRatio = readRatio(entry, "headSizeRatio", s.headSizeRatio, where);
        s.snoutLengthRatio = readRatio(entry, "snoutLengthRatio", s.snoutLengthRatio, where);
        s.earHeightRatio = readRatio(entry, "earHeightRatio", s.earHeightRatio, where);
        s.tailLengthRatio = readRatio(entry, "tailLengthRatio", s.tailLengthRatio, where);
        s.animationSpeedMultiplier =
            readRatio(entry, "animationSpeedMultiplier", s.animationSpeedMultiplier, where);

        s.earsFloppy = readFlag(entry, "earsFloppy", where);
        s.tailCurledOverBack = readFlag(entry, "tailCurledOverBack", where);
        s.hasFlatFace = readFlag(entry, "hasFlatFace", where);
        s.hasSpots = readFlag(entry, "hasSpots", where);
        s.hasPoodleFuzz = readFlag(entry, "hasPoodleFuzz", where);

        s.primaryColor = readColor(entry, "primaryColor", where);
        s.secondaryColor = readColor(entry, "secondaryColor", where);
        s.accentColor = readColor(entry, "accentColor", where);

        std::string error;
        if (!validateSkeleton(s, error)) {
            throw std::runtime_error(where + ": " + error);
        }
        if (contains(s.breedId)) {
            throw std::runtime_error(where + ": breed is already registered");
        }
        for (const auto& other : parsed) {
            if (other.breedId == s.breedId) {
                throw std::runtime_error(where + ": duplicate breed id in document");
            }
        }
        parsed.push_back(std::move(s));
    }

    for (auto& s : parsed) {
        registerBreed(std::move(s));
    }
    return parsed.size();
}

bool BreedRegistry::loadFile(const std::string& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open breed file: " + path;
        std::cerr << "[BreedRegistry] " << error << "\n";
        return false;
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::parse_error& e) {
        error = "Failed to parse " + path + ": " + e.what();
        std::cerr << "[BreedRegistry] " << error << "\n";
        return false;
    }

    try {
        size_t added = loadJson(doc);
        std::cout << "[BreedRegistry] Loaded " << added << " breed(s) from " << path << "\n";
    } catch (const std::runtime_error& e) {
        error = path + ": " + e.what();
        std::cerr << "[BreedRegistry] " << error << "\n";
        return false;
    }
    return true;
}

const BreedSkeleton& configFor(const std::string& breedId) {
    return BreedRegistry::builtin().configFor(breedId);
}

} // namespace pupkit
