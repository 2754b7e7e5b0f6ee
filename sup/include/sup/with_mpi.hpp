#pragma once

#include <exception>

#include <mpi.h>

#include <laminar/communication/mpi_error.hpp>

namespace sup {

// Initializes MPI on construction and finalizes it on destruction.
struct with_mpi {
    with_mpi(int& argc, char**& argv, bool fatal_errors = true) {
        init(&argc, &argv, fatal_errors);
    }

    explicit with_mpi(bool fatal_errors = true) {
        init(nullptr, nullptr, fatal_errors);
    }

    ~with_mpi() {
        // If the stack is being unwound because of an exception that other
        // ranks did not see, MPI_Finalize would hang; leave it to the
        // runtime so that the error message can still be printed.
        if (std::uncaught_exceptions()==0) {
            MPI_Finalize();
        }
    }

private:
    void init(int* argcp, char*** argvp, bool fatal_errors) {
        int ev = MPI_Init(argcp, argvp);
        if (ev) {
            throw lam::mpi_error(ev, "MPI_Init");
        }

        if (!fatal_errors) {
            MPI_Comm_set_errhandler(MPI_COMM_WORLD, MPI_ERRORS_RETURN);
        }
    }
};

} // namespace sup
