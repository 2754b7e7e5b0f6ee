/*
 * Generate the M1 cortical microcircuit network and report on it.
 *
 * Cells and connections are registered with a recording engine; the
 * driver prints the population sizes and connection statistics of the
 * local partition.
 */

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <tinyopt/tinyopt.h>

#include <laminar/connectivity.hpp>
#include <laminar/context.hpp>
#include <laminar/engine.hpp>
#include <laminar/network.hpp>
#include <laminar/parameters.hpp>
#include <laminar/population.hpp>
#include <laminar/warning.hpp>

#include <laminario/jsonio.hpp>

#include <sup/ioutil.hpp>

#ifdef LAM_MPI_ENABLED
#include <mpi.h>
#include <sup/with_mpi.hpp>
#endif

const char* usage_str =
"[OPTION]...\n"
"\n"
"  -s, --seed=N         Global random seed (default 1).\n"
"  -c, --scale=X        Network size in thousands of cells (default 1).\n"
"  -f, --file=FILE      Read network parameters and populations from JSON FILE.\n"
"  -p, --partition=I    Generate partition I of those given by --partitions.\n"
"  -n, --partitions=N   Number of partitions (default 1).\n"
"  -t, --toroidal       Treat the model footprint as periodic.\n"
"  -v, --verbose        Print parameters, populations and connections.\n"
"  -h, --help           Emit this message and exit.\n"
"\n"
"Generate the cells and connections of a cortical microcircuit.\n"
"\n"
"When built with MPI, each rank generates its own partition and the\n"
"--partition and --partitions options are ignored.\n";

struct cl_options {
    std::optional<lam::seed_type> seed;
    std::optional<double> scale;
    std::optional<std::string> file;
    unsigned partition = 0;
    unsigned num_partitions = 1;
    bool toroidal = false;
    bool verbose = false;
    bool help = false;
};

cl_options read_options(int argc, char** argv);
lam::context make_context(const cl_options&);
void banner(const lam::context&);
void report(const lam::network&, const lam::recording_engine&, bool verbose);

int main(int argc, char** argv) {
    bool root = true;

    try {
#ifdef LAM_MPI_ENABLED
        sup::with_mpi guard(argc, argv, false);
#endif

        auto opt = read_options(argc, argv);
        if (opt.help) {
            to::usage(argv[0], usage_str);
            return 0;
        }

        auto ctx = make_context(opt);
        root = lam::rank(ctx)==0 || !lam::has_mpi(ctx);

        std::cout << sup::mask_stream(root);
        banner(ctx);

        laminario::network_description desc;
        if (opt.file) {
            if (opt.scale) {
                throw std::runtime_error("--scale can't be combined with --file; set \"scale\" in the file instead");
            }
            auto in = sup::open_or_throw(*opt.file, std::ios_base::in, false);
            desc = laminario::load_network_description(in);
        }
        else {
            desc.parameters = lam::default_parameters(opt.scale.value_or(1.));
            desc.populations = lam::default_populations();
        }

        auto& params = desc.parameters;
        if (opt.seed) params.seed = *opt.seed;
        if (opt.toroidal) params.toroidal = true;

        if (opt.verbose) {
            std::cout << params << "\n";
            for (const auto& p: desc.populations) {
                std::cout << p << "\n";
            }
        }

        lam::recording_engine engine;
        auto net = lam::build_network(std::move(desc.populations),
                                      lam::default_connectivity_rules(),
                                      params, ctx, engine,
                                      [](const lam::generation_warning& w) { std::cout << w << "\n"; });

        report(net, engine, opt.verbose);
    }
    catch (to::option_error& e) {
        std::cerr << sup::mask_stream(root);
        std::cerr << argv[0] << ": " << e.what() << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    }
    catch (std::exception& e) {
        // only print errors on master
        std::cerr << sup::mask_stream(root);
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}

cl_options read_options(int argc, char** argv) {
    cl_options opt;

    for (auto arg = argv+1; *arg; ) {
        bool ok = false;
        ok |= (opt.seed << to::parse<lam::seed_type>(arg, "-s", "--seed")).has_value();
        ok |= (opt.scale << to::parse<double>(arg, "-c", "--scale")).has_value();
        ok |= (opt.file << to::parse<std::string>(arg, "-f", "--file")).has_value();
        ok |= (opt.partition << to::parse<unsigned>(arg, "-p", "--partition")).has_value();
        ok |= (opt.num_partitions << to::parse<unsigned>(arg, "-n", "--partitions")).has_value();
        ok |= (opt.toroidal << to::parse(arg, "-t", "--toroidal")).has_value();
        ok |= (opt.verbose << to::parse(arg, "-v", "--verbose")).has_value();
        ok |= (opt.help << to::parse(arg, "-h", "--help")).has_value();
        if (!ok) throw to::option_error("unrecognized argument", *arg);
    }

    return opt;
}

lam::context make_context(const cl_options& opt) {
#ifdef LAM_MPI_ENABLED
    return lam::make_context(MPI_COMM_WORLD);
#else
    if (opt.num_partitions==1 && opt.partition==0) {
        return lam::make_context();
    }
    return lam::make_context(lam::partition_info{opt.partition, opt.num_partitions});
#endif
}

void banner(const lam::context& ctx) {
    std::cout << "==========================================\n";
    std::cout << "  Cortical microcircuit generator\n";
    std::cout << "  - partitions  : " << lam::num_ranks(ctx)
              << " (" << lam::distribution_type(ctx) << ")\n";
    std::cout << "  - partition   : " << lam::rank(ctx) << "\n";
    std::cout << "==========================================\n";
}

void report(const lam::network& net, const lam::recording_engine& engine, bool verbose) {
    std::cout << "\nPopulations:\n";
    for (std::size_t i = 0; i<net.population_sizes.size(); ++i) {
        std::cout << "  " << std::setw(4) << i << std::setw(10) << net.population_sizes[i] << " cells\n";
    }
    std::cout << "  total" << std::setw(9) << net.num_cells << " cells, "
              << net.cells.size() << " on this partition\n";

    std::cout << "\nConnections onto local cells: " << net.connections.size() << "\n";
    if (!net.connections.empty()) {
        double total_delay = 0;
        for (const auto& c: net.connections) total_delay += c.delay;
        std::cout << "  mean delay     : " << total_delay/net.connections.size() << " ms\n";
        std::cout << "  per local cell : " << double(net.connections.size())/net.cells.size() << "\n";
    }
    for (std::size_t pre = 0; pre<lam::num_top_classes; ++pre) {
        for (std::size_t post = 0; post<lam::num_top_classes; ++post) {
            if (auto n = net.class_connections[pre][post]) {
                std::cout << "  " << std::setw(4) << lam::top_class(pre) << " -> "
                          << std::setw(4) << lam::top_class(post) << std::setw(10) << n << "\n";
            }
        }
    }

    std::cout << "\nRegistered " << engine.num_units() << " units and "
              << engine.sources().size() << " spike sources.\n";
    if (!net.warnings.empty()) {
        std::cout << "There were " << net.warnings.size() << " warnings.\n";
    }

    if (verbose) {
        for (const auto& c: engine.connections()) {
            std::cout << c << "\n";
        }
    }
}
