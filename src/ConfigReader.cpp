#include "ConfigReader.hpp"
#include "MeasurementErrors.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace QMSIM {

using namespace SimulationConstants;

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const char* sectionFor(ExperimentKind kind) {
    switch (kind) {
        case ExperimentKind::COINS:         return "COINS";
        case ExperimentKind::BLOCH_SPHERE:  return "BLOCH_SPHERE";
        case ExperimentKind::STERN_GERLACH: return "STERN_GERLACH";
        case ExperimentKind::PHOTONS:       return "PHOTONS";
    }
    return "";
}

double degreesToRadians(double degrees) {
    return degrees * PI / 180.0;
}

} // anonymous namespace

ExperimentKind parseExperimentKind(const std::string& text) {
    std::string t = lowercase(text);
    if (t == "coins" || t == "coin") return ExperimentKind::COINS;
    if (t == "bloch" || t == "bloch_sphere") return ExperimentKind::BLOCH_SPHERE;
    if (t == "spin" || t == "stern_gerlach") return ExperimentKind::STERN_GERLACH;
    if (t == "photons" || t == "photon") return ExperimentKind::PHOTONS;
    throw InvalidConfigurationError("unknown experiment '" + text + "'");
}

std::string experimentKindName(ExperimentKind kind) {
    switch (kind) {
        case ExperimentKind::COINS:         return "coins";
        case ExperimentKind::BLOCH_SPHERE:  return "bloch";
        case ExperimentKind::STERN_GERLACH: return "spin";
        case ExperimentKind::PHOTONS:       return "photons";
    }
    return "unknown";
}

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    bool ok = parseStream(file);
    file.close();
    return ok;
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream input(content);
    return parseStream(input);
}

bool ConfigReader::parseStream(std::istream& input) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

std::uint64_t ConfigReader::getUInt64(const std::string& section, const std::string& key,
                                      std::uint64_t default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        if (val[0] == '-') {
            throw std::invalid_argument("negative value");
        }
        return static_cast<std::uint64_t>(std::stoull(val));
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as unsigned integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = lowercase(getString(section, key));
    if (val.empty()) return default_val;

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Experiment Configuration Parsers
// =============================================================================

bool ConfigReader::parseSimulationConfig(SimulationConfig& config) const {
    if (!hasSection("SIMULATION")) return false;

    if (hasKey("SIMULATION", "experiment")) {
        config.experiment = parseExperimentKind(getString("SIMULATION", "experiment"));
    }

    config.dt = getDouble("SIMULATION", "dt", config.dt);
    config.max_dt = getDouble("SIMULATION", "max_dt", config.max_dt);
    config.max_steps = getInt("SIMULATION", "max_steps", config.max_steps);
    config.report_interval = getInt("SIMULATION", "report_interval", config.report_interval);
    config.trials = getInt("SIMULATION", "trials", config.trials);
    config.seed = getUInt64("SIMULATION", "seed", config.seed);

    return true;
}

bool ConfigReader::parseCoinConfig(CoinExperimentScene::Config& config) const {
    if (!hasSection("COINS")) return false;

    if (hasKey("COINS", "system_type")) {
        config.system_type = parseSystemType(getString("COINS", "system_type"));
        // Keep the default initial state valid for the chosen coin type
        config.initial_state = config.system_type == SystemType::CLASSICAL
                                   ? InitialCoinState::HEADS
                                   : InitialCoinState::SUPERPOSED;
    }
    if (hasKey("COINS", "initial_state")) {
        config.initial_state = parseInitialCoinState(getString("COINS", "initial_state"));
    }

    config.bias = getDouble("COINS", "bias", config.bias);

    int count = getInt("COINS", "coin_count", static_cast<int>(config.coin_count));
    if (count < 1) {
        throw InvalidConfigurationError("coin_count must be positive, got " + std::to_string(count));
    }
    config.coin_count = static_cast<std::size_t>(count);

    return true;
}

bool ConfigReader::parseBlochSphereConfig(BlochSphereExperiment::Config& config) const {
    if (!hasSection("BLOCH_SPHERE")) return false;

    const std::string section = "BLOCH_SPHERE";
    if (hasKey(section, "initial_direction")) {
        config.initial_direction = parseStateDirection(getString(section, "initial_direction"));
    }
    if (hasKey(section, "scene")) {
        config.scene = parseBlochSphereScene(getString(section, "scene"));
    }
    if (hasKey(section, "measurement_basis")) {
        config.measurement_basis = parseMeasurementAxis(getString(section, "measurement_basis"));
    }

    config.magnetic_field_strength = getDouble(section, "magnetic_field", config.magnetic_field_strength);
    config.single_measurement_mode = getBool(section, "single_measurement", config.single_measurement_mode);
    config.time_to_measurement = getDouble(section, "time_to_measurement", config.time_to_measurement);

    return true;
}

bool ConfigReader::parseSternGerlachConfig(SternGerlachExperiment::Config& config) const {
    if (!hasSection("STERN_GERLACH")) return false;

    const std::string section = "STERN_GERLACH";
    SpinExperimentPreset preset = parseSpinExperimentPreset(getString(section, "preset", "1"));
    config.stages = SternGerlachExperiment::presetStages(preset);

    double custom_polar = degreesToRadians(getDouble(section, "custom_polar", 0.0));
    double custom_azimuthal = degreesToRadians(getDouble(section, "custom_azimuthal", 0.0));

    // An explicitly configured stage is active
    auto configureStage = [&](SternGerlachDeviceConfig& stage, const std::string& value) {
        stage.orientation = parseDeviceOrientation(value);
        stage.active = true;
        if (*stage.orientation == DeviceOrientation::CUSTOM) {
            stage.custom_polar_angle = custom_polar;
            stage.custom_azimuthal_angle = custom_azimuthal;
        }
    };

    if (hasKey(section, "stage1")) {
        configureStage(config.stages[0], getString(section, "stage1"));
    }

    if (hasKey(section, "stage2")) {
        std::string stage2 = getString(section, "stage2");
        if (lowercase(stage2) == "none") {
            config.stages.resize(1);
        } else {
            if (config.stages.size() < 2) {
                config.stages.push_back(SternGerlachDeviceConfig());
            }
            configureStage(config.stages[1], stage2);
        }
    }

    if (config.stages.size() > 1 && hasKey(section, "stage2_active")) {
        config.stages[1].active = getBool(section, "stage2_active", true);
    }

    if (hasKey(section, "source_direction")) {
        config.source_direction = parseStateDirection(getString(section, "source_direction"));
    }
    if (config.source_direction == StateDirection::CUSTOM) {
        std::vector<double> v = getDoubleArray(section, "source_vector");
        if (v.size() != 3) {
            throw InvalidConfigurationError("source_vector needs 3 components for a custom source");
        }
        config.custom_source_direction = Vector3D(v[0], v[1], v[2]);
    }

    if (hasKey(section, "source_mode")) {
        config.source_mode = parseSourceMode(getString(section, "source_mode"));
    }
    if (hasKey(section, "blocking")) {
        config.blocking_mode = parseBlockingMode(getString(section, "blocking"));
    }
    config.particle_amount = getDouble(section, "particle_amount", config.particle_amount);

    return true;
}

bool ConfigReader::parsePhotonConfig(PhotonExperiment::Config& config) const {
    if (!hasSection("PHOTONS")) return false;

    if (hasKey("PHOTONS", "emission_mode")) {
        config.emission_mode = parsePhotonEmissionMode(getString("PHOTONS", "emission_mode"));
    }
    if (hasKey("PHOTONS", "polarization")) {
        config.polarization = parsePolarizationPreset(getString("PHOTONS", "polarization"));
    }

    config.emission_rate = getDouble("PHOTONS", "emission_rate", config.emission_rate);
    config.custom_polarization_angle = getDouble("PHOTONS", "custom_angle", config.custom_polarization_angle);
    config.splitter_axis_angle = getDouble("PHOTONS", "splitter_angle", config.splitter_axis_angle);
    config.field_half_extent = getDouble("PHOTONS", "field_half_extent", config.field_half_extent);

    return true;
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection("SIMULATION")) {
        result.warnings.push_back("No [SIMULATION] section found - using defaults");
    }

    ExperimentKind kind = ExperimentKind::COINS;
    std::string experiment = getString("SIMULATION", "experiment", "coins");
    try {
        kind = parseExperimentKind(experiment);
    } catch (const InvalidConfigurationError& e) {
        result.errors.push_back(e.what());
        result.valid = false;
    }

    if (result.valid && !hasSection(sectionFor(kind))) {
        result.warnings.push_back(std::string("No [") + sectionFor(kind) +
                                  "] section found - using defaults");
    }

    if (getDouble("SIMULATION", "dt", 1.0) <= 0.0) {
        result.errors.push_back("Invalid dt (must be positive)");
        result.valid = false;
    }
    if (getDouble("SIMULATION", "max_dt", 1.0) <= 0.0) {
        result.errors.push_back("Invalid max_dt (must be positive)");
        result.valid = false;
    }
    if (getInt("SIMULATION", "max_steps", 0) < 0) {
        result.errors.push_back("Invalid max_steps (must be non-negative)");
        result.valid = false;
    }
    if (getInt("SIMULATION", "report_interval", 1) <= 0) {
        result.errors.push_back("Invalid report_interval (must be positive)");
        result.valid = false;
    }

    if (hasSection("COINS")) {
        double bias = getDouble("COINS", "bias", 0.5);
        if (bias < 0.0 || bias > 1.0) {
            result.errors.push_back("Invalid coin bias (must be 0-1)");
            result.valid = false;
        }
    }

    if (hasSection("PHOTONS")) {
        double rate = getDouble("PHOTONS", "emission_rate", 0.0);
        if (rate < 0.0 || rate > MAX_PHOTON_EMISSION_RATE) {
            result.errors.push_back("Invalid photon emission_rate (must be 0-200)");
            result.valid = false;
        }
    }

    return result;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);

    file << "# QMSIM Configuration File\n";
    file << "# Lengths in meters, times in seconds, polarization angles in degrees\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[SIMULATION]\n";
    file << "experiment = coins                    # coins, bloch, spin, photons\n";
    file << "dt = 0.016666667                      # frame time step\n";
    file << "max_dt = 0.033333333                  # frames longer than this are clamped\n";
    file << "max_steps = 600\n";
    file << "report_interval = 100\n";
    file << "trials = 100                          # measurement rounds (coins, bloch)\n";
    file << "seed = 5489                           # each MPI rank uses seed + rank\n\n";

    file << "[COINS]\n";
    file << "system_type = quantum                 # classical or quantum\n";
    file << "initial_state = superposed            # heads/tails or up/down/superposed\n";
    file << "bias = 0.5                            # probability of heads / up\n";
    file << "coin_count = 100                      # 10, 100 or 10000\n\n";

    file << "[BLOCH_SPHERE]\n";
    file << "initial_direction = +x                # +x, -x, +y, -y, +z, -z\n";
    file << "scene = measurement                   # measurement or precession\n";
    file << "magnetic_field = 1.0                  # -1 to 1, precession rate in rad/s\n";
    file << "measurement_basis = z                 # x, y or z\n";
    file << "single_measurement = false            # false measures 10 states per trial\n";
    file << "time_to_measurement = 0.0             # 0 to 1 s\n\n";

    file << "[STERN_GERLACH]\n";
    file << "preset = 3                            # 1-6 or custom\n";
    file << "# stage1 = z                          # z, x or custom\n";
    file << "# stage2 = x                          # z, x, custom or none\n";
    file << "# stage2_active = true\n";
    file << "# custom_polar = 45.0                 # degrees, custom stages\n";
    file << "# custom_azimuthal = 0.0              # degrees, custom stages\n";
    file << "source_direction = +z                 # +x, -x, +y, -y, +z, -z or custom\n";
    file << "# source_vector = 1.0, 0.0, 1.0       # custom source direction\n";
    file << "source_mode = continuous              # single or continuous\n";
    file << "particle_amount = 1.0                 # 0 to 1 of 300 particles/s\n";
    file << "blocking = none                       # none, up or down\n\n";

    file << "[PHOTONS]\n";
    file << "emission_mode = many                  # single or many\n";
    file << "emission_rate = 100.0                 # 0 to 200 photons/s\n";
    file << "polarization = 45                     # horizontal, vertical, 45 or custom\n";
    file << "custom_angle = 30.0                   # degrees, custom polarization\n";
    file << "splitter_angle = 0.0                  # degrees, transmitted polarization\n";

    file.close();
}

} // namespace QMSIM
