#include "QMSIM.hpp"
#include "Simulator.hpp"
#include "ConfigReader.hpp"
#include <petsc.h>
#include <iostream>
#include <string>

static char help[] = "QMSIM - Quantum Measurement Simulator\n"
                    "Usage: qmsim [options]\n\n"
                    "Options:\n"
                    "  -c <file>                 Configuration file (.config)\n"
                    "  -generate_config <file>   Write a commented configuration template\n"
                    "  -experiment <name>        Override the experiment: coins, bloch, spin, photons\n"
                    "  -steps <n>                Override SIMULATION.max_steps\n"
                    "  -seed <n>                 Override SIMULATION.seed (each rank adds its rank)\n\n"
                    "Examples:\n"
                    "  # Run a configuration\n"
                    "  qmsim -c config/stern_gerlach.config\n\n"
                    "  # Pool statistics over 4 independent replicas\n"
                    "  mpirun -np 4 qmsim -c config/photons.config -steps 6000\n\n"
                    "  # Generate template configuration\n"
                    "  qmsim -generate_config my_config.config\n\n";

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                QMSIM::ConfigReader::generateTemplate(generate_config);
                PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                PetscPrintf(comm, "Edit this file to customize your experiment.\n");
            }
            ierr = PetscFinalize();
            return ierr;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  QMSIM - Quantum Measurement Simulator\n");
            PetscPrintf(comm, "  Version 1.0.0\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
            if (config_provided) {
                PetscPrintf(comm, "Config file: %s\n", config_file);
            } else {
                PetscPrintf(comm, "No configuration file (-c), using built-in defaults\n");
            }
            PetscPrintf(comm, "\n");
        }

        try {
            QMSIM::Simulator sim(comm);

            if (config_provided) {
                ierr = sim.initializeFromConfigFile(config_file); CHKERRQ(ierr);
            } else {
                QMSIM::SimulationConfig config;
                ierr = sim.initialize(config); CHKERRQ(ierr);
            }

            if (rank == 0) {
                int replicas = 1;
                MPI_Comm_size(comm, &replicas);
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "Running %s experiment on %d replica(s)\n",
                            QMSIM::experimentKindName(sim.experimentKind()).c_str(), replicas);
                PetscPrintf(comm, "------------------------------------------------------------\n");
            }

            double start_time = MPI_Wtime();
            ierr = sim.run(); CHKERRQ(ierr);
            double end_time = MPI_Wtime();

            if (rank == 0) {
                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "%d frames, %.3f s simulated, %.2f s wall time\n",
                            sim.stepsTaken(), sim.simulatedTime(), end_time - start_time);
            }

            ierr = sim.writeSummary(); CHKERRQ(ierr);

            if (rank == 0) {
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "============================================================\n");
            }

        } catch (const std::exception& e) {
            if (rank == 0) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
            }
            ierr = PetscFinalize();
            return 1;
        }
    }

    ierr = PetscFinalize();
    return ierr;
}
