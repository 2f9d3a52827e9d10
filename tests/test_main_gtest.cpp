/**
 * @file test_main_gtest.cpp
 * @brief GTest entry point with PETSc/MPI initialization
 *
 * Every rank runs the whole suite; only rank 0 prints results. A failure on
 * any rank fails the run.
 */

#include <gtest/gtest.h>
#include <mpi.h>
#include <petsc.h>

int main(int argc, char **argv) {
    // GTest strips its own --gtest_* flags before PETSc reads the rest
    ::testing::InitGoogleTest(&argc, argv);

    PetscErrorCode ierr = PetscInitialize(&argc, &argv, nullptr, nullptr);
    if (ierr) {
        return static_cast<int>(ierr);
    }

    int rank = 0;
    MPI_Comm_rank(PETSC_COMM_WORLD, &rank);

    if (rank != 0) {
        ::testing::TestEventListeners& listeners =
            ::testing::UnitTest::GetInstance()->listeners();
        delete listeners.Release(listeners.default_result_printer());
    }

    int result = RUN_ALL_TESTS();

    int global_result = 0;
    MPI_Allreduce(&result, &global_result, 1, MPI_INT, MPI_MAX, PETSC_COMM_WORLD);

    PetscFinalize();
    return global_result;
}
