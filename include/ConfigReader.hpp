#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "QMSIM.hpp"
#include "CoinExperiment.hpp"
#include "BlochSphereExperiment.hpp"
#include "SternGerlach.hpp"
#include "PhotonExperiment.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>
#include <cstdint>

namespace QMSIM {

/**
 * @brief INI-style configuration reader
 *
 * Every experiment can be configured from a single text file:
 *
 *   [SIMULATION]      experiment, time stepping, seed
 *   [COINS]           coin scene
 *   [BLOCH_SPHERE]    Bloch sphere experiment
 *   [STERN_GERLACH]   spin experiment
 *   [PHOTONS]         photon polarization experiment
 *
 * Missing keys keep the defaults of the target struct. Unknown enumeration
 * values raise InvalidConfigurationError; range checks are left to the
 * constructors of the experiments.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();

    // =========================================================================
    // Loading
    // =========================================================================

    bool loadFile(const std::string& filename);

    /// Parse configuration text held in memory
    bool loadString(const std::string& content);

    // =========================================================================
    // Experiment Configuration Parsers
    // =========================================================================

    bool parseSimulationConfig(SimulationConfig& config) const;
    bool parseCoinConfig(CoinExperimentScene::Config& config) const;
    bool parseBlochSphereConfig(BlochSphereExperiment::Config& config) const;

    /**
     * @brief Stern-Gerlach configuration
     *
     * `preset` selects the stage list; `stage1` / `stage2` override the
     * orientation of a stage (`stage2 = none` leaves a single stage).
     * Custom angles are given in degrees.
     */
    bool parseSternGerlachConfig(SternGerlachExperiment::Config& config) const;
    bool parsePhotonConfig(PhotonExperiment::Config& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key, int default_val = 0) const;
    std::uint64_t getUInt64(const std::string& section, const std::string& key,
                            std::uint64_t default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key, bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section, const std::string& key) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    ValidationResult validate() const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    bool parseStream(std::istream& input);
    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

ExperimentKind parseExperimentKind(const std::string& text);
std::string experimentKindName(ExperimentKind kind);

} // namespace QMSIM

#endif // CONFIG_READER_HPP
