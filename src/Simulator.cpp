#include "Simulator.hpp"
#include "ConfigReader.hpp"
#include "MeasurementErrors.hpp"
#include <algorithm>
#include <cmath>

namespace QMSIM {

Simulator::Simulator(MPI_Comm comm_in)
    : comm(comm_in), rank(0), size(1), timestep(0), current_time(0.0) {

    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);

    // Defaults that run out of the box
    spin_config.stages = SternGerlachExperiment::presetStages(SpinExperimentPreset::EXPERIMENT_1);
    photon_config.emission_rate = SimulationConstants::MAX_PHOTON_EMISSION_RATE / 2.0;
}

Simulator::~Simulator() {}

std::uint64_t Simulator::replicaSeed() const {
    return config.seed + static_cast<std::uint64_t>(rank);
}

PetscErrorCode Simulator::initialize(const SimulationConfig& config_in) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    config = config_in;
    ierr = applyCommandLineOptions(); CHKERRQ(ierr);

    if (!(config.dt > 0.0) || !(config.max_dt > 0.0)) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "SIMULATION.dt and SIMULATION.max_dt must be positive");
    }
    if (config.max_steps < 0 || config.trials < 0) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "SIMULATION.max_steps and SIMULATION.trials must be non-negative");
    }
    if (config.report_interval <= 0) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "SIMULATION.report_interval must be positive");
    }

    timestep = 0;
    current_time = 0.0;
    totals = RunTotals();
    global_totals = RunTotals();

    if (rank == 0) {
        PetscPrintf(comm, "Configuration:\n");
        PetscPrintf(comm, "  Experiment: %s\n", experimentKindName(config.experiment).c_str());
        PetscPrintf(comm, "  Frame dt: %g (max %g)\n", config.dt, config.max_dt);
        PetscPrintf(comm, "  Max steps: %d\n", config.max_steps);
        PetscPrintf(comm, "  Trials: %d\n", config.trials);
        PetscPrintf(comm, "  Seed: %llu (+ rank, %d replicas)\n",
                    static_cast<unsigned long long>(config.seed), size);
    }

    ierr = setupExperiment(); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (rank == 0) {
        PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());
    }

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
    }

    ConfigReader::ValidationResult validation = reader.validate();
    if (rank == 0) {
        for (const auto& warning : validation.warnings) {
            PetscPrintf(comm, "Warning: %s\n", warning.c_str());
        }
        for (const auto& error : validation.errors) {
            PetscPrintf(comm, "Error: %s\n", error.c_str());
        }
    }
    if (!validation.valid) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Invalid configuration file");
    }

    SimulationConfig parsed;
    try {
        reader.parseSimulationConfig(parsed);
        reader.parseCoinConfig(coin_config);
        reader.parseBlochSphereConfig(bloch_config);
        reader.parseSternGerlachConfig(spin_config);
        reader.parsePhotonConfig(photon_config);
    } catch (const InvalidConfigurationError& e) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "%s", e.what());
    }

    ierr = initialize(parsed); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::applyCommandLineOptions() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    char experiment[256] = "";
    PetscBool experiment_set = PETSC_FALSE;
    ierr = PetscOptionsGetString(nullptr, nullptr, "-experiment", experiment,
                                 sizeof(experiment), &experiment_set); CHKERRQ(ierr);
    if (experiment_set) {
        try {
            config.experiment = parseExperimentKind(experiment);
        } catch (const InvalidConfigurationError& e) {
            SETERRQ(comm, PETSC_ERR_ARG_WRONG, "%s", e.what());
        }
    }

    PetscInt steps = 0;
    PetscBool steps_set = PETSC_FALSE;
    ierr = PetscOptionsGetInt(nullptr, nullptr, "-steps", &steps, &steps_set); CHKERRQ(ierr);
    if (steps_set) {
        config.max_steps = static_cast<int>(steps);
    }

    PetscInt seed = 0;
    PetscBool seed_set = PETSC_FALSE;
    ierr = PetscOptionsGetInt(nullptr, nullptr, "-seed", &seed, &seed_set); CHKERRQ(ierr);
    if (seed_set) {
        if (seed < 0) {
            SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "-seed must be non-negative");
        }
        config.seed = static_cast<std::uint64_t>(seed);
    }

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::setupExperiment() {
    PetscFunctionBeginUser;

    coins.reset();
    bloch.reset();
    spin.reset();
    photons.reset();

    const std::uint64_t seed = replicaSeed();

    try {
        switch (config.experiment) {
            case ExperimentKind::COINS: {
                CoinExperimentScene::Config c = coin_config;
                c.seed = seed;
                coins = std::make_unique<CoinExperimentScene>(c);
                break;
            }
            case ExperimentKind::BLOCH_SPHERE: {
                BlochSphereExperiment::Config c = bloch_config;
                c.seed = seed;
                bloch = std::make_unique<BlochSphereExperiment>(c);
                break;
            }
            case ExperimentKind::STERN_GERLACH: {
                SternGerlachExperiment::Config c = spin_config;
                c.seed = seed;
                spin = std::make_unique<SternGerlachExperiment>(c);
                break;
            }
            case ExperimentKind::PHOTONS: {
                PhotonExperiment::Config c = photon_config;
                c.seed = seed;
                photons = std::make_unique<PhotonExperiment>(c);
                break;
            }
        }
    } catch (const InvalidConfigurationError& e) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "%s", e.what());
    }

    if (rank == 0 && spin) {
        PetscPrintf(comm, "  Stern-Gerlach stages: %d\n", static_cast<int>(spin->stageCount()));
    }

    PetscFunctionReturn(0);
}

// =============================================================================
// Run
// =============================================================================

double Simulator::frameDt() const {
    return std::min(config.dt, config.max_dt);
}

void Simulator::advanceClock(double dt) {
    timestep++;
    current_time += dt;
}

PetscErrorCode Simulator::run() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (!coins && !bloch && !spin && !photons) {
        SETERRQ(comm, PETSC_ERR_ORDER, "Simulator::run called before initialize");
    }

    switch (config.experiment) {
        case ExperimentKind::COINS:
            ierr = runCoins(); CHKERRQ(ierr);
            break;
        case ExperimentKind::BLOCH_SPHERE:
            ierr = runBlochSphere(); CHKERRQ(ierr);
            break;
        case ExperimentKind::STERN_GERLACH:
            ierr = runSternGerlach(); CHKERRQ(ierr);
            break;
        case ExperimentKind::PHOTONS:
            ierr = runPhotons(); CHKERRQ(ierr);
            break;
    }

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::runCoins() {
    PetscFunctionBeginUser;

    const double dt = frameDt();
    CoinSet& set = coins->coinSet();

    for (int trial = 0; trial < config.trials; ++trial) {
        // Flip, wait for the coins to land, then look
        set.startPreparation(true);
        while (set.measurementState() == ExperimentMeasurementState::PREPARING_TO_BE_MEASURED) {
            coins->step(dt);
            advanceClock(dt);
        }

        const OutcomeCounts& counts = set.coins().counts();
        totals.outcome_a += static_cast<long long>(counts.count_a);
        totals.outcome_b += static_cast<long long>(counts.count_b);
        totals.completed++;

        if ((trial + 1) % config.report_interval == 0) {
            reportProgress(trial + 1, config.trials);
        }
    }

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::runBlochSphere() {
    PetscFunctionBeginUser;

    const double dt = frameDt();

    for (int trial = 0; trial < config.trials; ++trial) {
        bloch->reprepare();
        bloch->startTimedObservation();
        while (bloch->measurementState() == SpinMeasurementState::TIMING_OBSERVATION) {
            bloch->step(dt);
            advanceClock(dt);
        }
        totals.completed++;

        if ((trial + 1) % config.report_interval == 0) {
            collectTotals();
            reportProgress(trial + 1, config.trials);
        }
    }
    collectTotals();

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::runSternGerlach() {
    PetscFunctionBeginUser;

    const double dt = frameDt();

    for (int step = 0; step < config.max_steps; ++step) {
        if (spin->sourceMode() == SourceMode::SINGLE && spin->particles().empty()) {
            spin->shootSingleParticle();
        }
        spin->step(dt);
        advanceClock(dt);

        if (timestep % config.report_interval == 0) {
            collectTotals();
            reportProgress(timestep, config.max_steps);
        }
    }
    collectTotals();

    PetscFunctionReturn(0);
}

PetscErrorCode Simulator::runPhotons() {
    PetscFunctionBeginUser;

    const double dt = frameDt();

    for (int step = 0; step < config.max_steps; ++step) {
        if (photons->laser().emissionMode() == PhotonEmissionMode::SINGLE_PHOTON &&
            photons->photons().empty()) {
            photons->emitPhoton();
        }
        photons->step(dt);
        advanceClock(dt);

        if (timestep % config.report_interval == 0) {
            collectTotals();
            reportProgress(timestep, config.max_steps);
        }
    }
    collectTotals();

    PetscFunctionReturn(0);
}

void Simulator::collectTotals() {
    switch (config.experiment) {
        case ExperimentKind::COINS:
            // Accumulated per trial in runCoins()
            break;
        case ExperimentKind::BLOCH_SPHERE:
            totals.outcome_a = bloch->upCount();
            totals.outcome_b = bloch->downCount();
            break;
        case ExperimentKind::STERN_GERLACH:
            totals.outcome_a = spin->device(0).upCount();
            totals.outcome_b = spin->device(0).downCount();
            if (spin->stageCount() > 1) {
                totals.stage2_a = spin->device(1).upCount();
                totals.stage2_b = spin->device(1).downCount();
            }
            totals.lost = spin->blockedCount();
            totals.completed = spin->retiredCount();
            break;
        case ExperimentKind::PHOTONS:
            totals.outcome_a = photons->horizontalDetector().detectionCount();
            totals.outcome_b = photons->verticalDetector().detectionCount();
            totals.lost = static_cast<long long>(photons->absorbedCount());
            totals.completed = static_cast<long long>(photons->launchedCount());
            break;
    }
}

void Simulator::reportProgress(int step, int total) const {
    if (rank != 0) return;

    std::string label_a, label_b;
    outcomeLabels(label_a, label_b);
    PetscPrintf(comm, "Step %d/%d, Time = %g: %s = %lld, %s = %lld\n",
                step, total, current_time,
                label_a.c_str(), totals.outcome_a, label_b.c_str(), totals.outcome_b);
}

void Simulator::outcomeLabels(std::string& a, std::string& b) const {
    switch (config.experiment) {
        case ExperimentKind::COINS: {
            OutcomeLabels labels = coin_config.system_type == SystemType::CLASSICAL
                                       ? OutcomeLabels::classicalCoin()
                                       : OutcomeLabels::quantumCoin();
            a = labels.first;
            b = labels.second;
            return;
        }
        case ExperimentKind::BLOCH_SPHERE:
        case ExperimentKind::STERN_GERLACH:
            a = "up";
            b = "down";
            return;
        case ExperimentKind::PHOTONS:
            a = "horizontal";
            b = "vertical";
            return;
    }
}

bool Simulator::expectedFractionA(double& value) const {
    switch (config.experiment) {
        case ExperimentKind::COINS:
            if (!coins) return false;
            value = coins->bias();
            return true;
        case ExperimentKind::BLOCH_SPHERE:
            // Precession about z changes x/y statistics during the timed wait
            if (!bloch || (bloch->scene() == BlochSphereScene::PRECESSION &&
                           bloch->measurementBasis() != MeasurementAxis::Z)) {
                return false;
            }
            value = bloch->preparationState().upProbability(bloch->measurementBasis());
            return true;
        case ExperimentKind::STERN_GERLACH:
            if (!spin || !spin->device(0).isActive()) return false;
            value = spin->expectedUpProbabilities().stage1_up;
            return true;
        case ExperimentKind::PHOTONS:
            if (!photons) return false;
            value = photons->expectedHorizontalFraction();
            return true;
    }
    return false;
}

// =============================================================================
// Output
// =============================================================================

PetscErrorCode Simulator::writeSummary() {
    PetscFunctionBeginUser;

    long long local[6] = {totals.outcome_a, totals.outcome_b, totals.stage2_a,
                          totals.stage2_b, totals.lost, totals.completed};
    long long global[6] = {0, 0, 0, 0, 0, 0};

    int mpi_err = MPI_Reduce(local, global, 6, MPI_LONG_LONG, MPI_SUM, 0, comm);
    if (mpi_err != MPI_SUCCESS) {
        SETERRQ(comm, PETSC_ERR_LIB, "MPI_Reduce of run totals failed");
    }

    if (rank == 0) {
        global_totals.outcome_a = global[0];
        global_totals.outcome_b = global[1];
        global_totals.stage2_a = global[2];
        global_totals.stage2_b = global[3];
        global_totals.lost = global[4];
        global_totals.completed = global[5];

        std::string label_a, label_b;
        outcomeLabels(label_a, label_b);

        long long measured = global_totals.outcome_a + global_totals.outcome_b;
        double fraction = measured > 0 ? static_cast<double>(global_totals.outcome_a) / measured : 0.0;

        PetscPrintf(comm, "\nSimulation Summary\n");
        PetscPrintf(comm, "==================\n");
        PetscPrintf(comm, "Experiment: %s (%d replicas)\n",
                    experimentKindName(config.experiment).c_str(), size);
        PetscPrintf(comm, "Steps per replica: %d, simulated time: %g s\n", timestep, current_time);
        PetscPrintf(comm, "%s: %lld\n", label_a.c_str(), global_totals.outcome_a);
        PetscPrintf(comm, "%s: %lld\n", label_b.c_str(), global_totals.outcome_b);
        PetscPrintf(comm, "Fraction %s: %.4f\n", label_a.c_str(), fraction);

        double expected = 0.0;
        if (expectedFractionA(expected)) {
            PetscPrintf(comm, "Expected fraction %s: %.4f\n", label_a.c_str(), expected);
        }

        if (spin && spin->stageCount() > 1) {
            PetscPrintf(comm, "Stage 2 up: %lld\n", global_totals.stage2_a);
            PetscPrintf(comm, "Stage 2 down: %lld\n", global_totals.stage2_b);
            PetscPrintf(comm, "Blocked: %lld\n", global_totals.lost);
        }
        if (photons) {
            PetscPrintf(comm, "Launched: %lld\n", global_totals.completed);
            PetscPrintf(comm, "Absorbed: %lld\n", global_totals.lost);
            PetscPrintf(comm, "Normalized outcome (rank 0): %.4f\n", photons->normalizedOutcomeValue());
        }
    }

    PetscFunctionReturn(0);
}

} // namespace QMSIM
