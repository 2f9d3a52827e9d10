#ifndef SIMULATOR_HPP
#define SIMULATOR_HPP

#include "QMSIM.hpp"
#include "ConfigReader.hpp"
#include "CoinExperiment.hpp"
#include "BlochSphereExperiment.hpp"
#include "SternGerlach.hpp"
#include "PhotonExperiment.hpp"
#include <petsc.h>
#include <memory>
#include <string>

namespace QMSIM {

/**
 * @brief Aggregate outcome counts of a run
 *
 * Outcome A / B are heads / tails, up / down or horizontal / vertical
 * detections depending on the experiment. `lost` counts blocked spin
 * particles or absorbed photons; `completed` counts finished trials,
 * retired particles or launched photons.
 */
struct RunTotals {
    long long outcome_a = 0;
    long long outcome_b = 0;
    long long stage2_a = 0;
    long long stage2_b = 0;
    long long lost = 0;
    long long completed = 0;
};

/**
 * @brief Batch driver for one experiment
 *
 * Every MPI rank runs an independent replica seeded with seed + rank.
 * writeSummary() reduces the totals of all replicas onto rank 0.
 */
class Simulator {
public:
    Simulator(MPI_Comm comm);
    ~Simulator();

    // Initialization
    PetscErrorCode initialize(const SimulationConfig& config);
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);
    PetscErrorCode setupExperiment();

    // Run simulation
    PetscErrorCode run();

    // Output
    PetscErrorCode writeSummary();

    const SimulationConfig& getConfig() const { return config; }
    ExperimentKind experimentKind() const { return config.experiment; }
    std::uint64_t replicaSeed() const;
    int stepsTaken() const { return timestep; }
    double simulatedTime() const { return current_time; }

    /// Totals of this rank's replica
    const RunTotals& localTotals() const { return totals; }

    /// Totals over all ranks; valid on rank 0 after writeSummary()
    const RunTotals& globalTotals() const { return global_totals; }

    /// Expected fraction of outcome A; false when the run has no fixed expectation
    bool expectedFractionA(double& value) const;

    CoinExperimentScene* coinScene() const { return coins.get(); }
    BlochSphereExperiment* blochExperiment() const { return bloch.get(); }
    SternGerlachExperiment* spinExperiment() const { return spin.get(); }
    PhotonExperiment* photonExperiment() const { return photons.get(); }

private:
    PetscErrorCode applyCommandLineOptions();
    PetscErrorCode runCoins();
    PetscErrorCode runBlochSphere();
    PetscErrorCode runSternGerlach();
    PetscErrorCode runPhotons();

    double frameDt() const;
    void advanceClock(double dt);
    void collectTotals();
    void reportProgress(int step, int total) const;
    void outcomeLabels(std::string& a, std::string& b) const;

    MPI_Comm comm;
    int rank, size;

    SimulationConfig config;
    CoinExperimentScene::Config coin_config;
    BlochSphereExperiment::Config bloch_config;
    SternGerlachExperiment::Config spin_config;
    PhotonExperiment::Config photon_config;

    std::unique_ptr<CoinExperimentScene> coins;
    std::unique_ptr<BlochSphereExperiment> bloch;
    std::unique_ptr<SternGerlachExperiment> spin;
    std::unique_ptr<PhotonExperiment> photons;

    RunTotals totals;
    RunTotals global_totals;
    int timestep;
    double current_time;
};

} // namespace QMSIM

#endif // SIMULATOR_HPP
