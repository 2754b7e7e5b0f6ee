#include <gtest/gtest.h>

#include <set>
#include <utility>
#include <vector>

#include <laminar/cell_generation.hpp>
#include <laminar/lamexcept.hpp>
#include <laminar/parameters.hpp>
#include <laminar/population.hpp>
#include <laminar/population_manager.hpp>
#include <laminar/warning.hpp>

using namespace lam;

namespace {
std::vector<population> small_table() {
    using E = excitability;
    using T = top_class;
    using S = sub_class;
    const auto izhi = cell_model::izhi2007;

    return {
        {0, E::E, T::IT,  S::other,  {0.10, 0.26}, linear_density(2e3), izhi},
        {1, E::E, T::PT,  S::other,  {0.52, 0.77}, constant_density(0), izhi},
        {2, E::I, T::Pva, S::Basket, {0.10, 0.31}, constant_density(500), izhi},
    };
}
}

TEST(population_manager, gid_offsets) {
    network_parameters params;
    population_manager m(small_table(), params);
    EXPECT_FALSE(m.generated());

    auto warnings = m.generate();
    EXPECT_TRUE(m.generated());

    // Population 1 has zero density everywhere.
    ASSERT_EQ(1u, warnings.size());
    EXPECT_EQ(warning_kind::empty_population, warnings[0].kind);
    EXPECT_EQ(1u, warnings[0].pop);

    EXPECT_EQ(0u, m.first_gid(0));
    EXPECT_EQ(m.last_gid(0), m.first_gid(1));
    EXPECT_EQ(m.first_gid(1), m.last_gid(1));
    EXPECT_EQ(m.last_gid(1), m.first_gid(2));
    EXPECT_EQ(m.num_cells(), m.last_gid(2));

    // Each population gets the cells it would get on its own.
    auto pop0 = generate_cells(small_table()[0], params, 0, 0, 1);
    auto pop2 = generate_cells(small_table()[2], params, pop0.next_gid, 0, 1);
    EXPECT_EQ(pop0.next_gid, m.first_gid(2));
    EXPECT_EQ(pop2.next_gid, m.num_cells());

    for (cell_gid_type gid = 0; gid<m.num_cells(); ++gid) {
        const auto& c = m.cell(gid);
        EXPECT_EQ(gid, c.gid);
        EXPECT_EQ(c.pop, m.population_of(gid));
        EXPECT_NE(1u, m.population_of(gid));
    }
    EXPECT_EQ(m.cells(), m.local_cells());
}

TEST(population_manager, ownership) {
    network_parameters params;
    const unsigned n = 3;

    population_manager whole(small_table(), params);
    whole.generate();

    cell_size_type total_local = 0;
    for (partition_id_type p = 0; p<n; ++p) {
        population_manager m(small_table(), params, p, n);

        std::vector<cell_gid_type> seen;
        m.generate([&](const cell_description& c) { seen.push_back(c.gid); });

        EXPECT_EQ(whole.cells(), m.cells());
        EXPECT_EQ(m.num_local_cells(), seen.size());
        total_local += m.num_local_cells();

        for (auto gid: seen) {
            EXPECT_TRUE(m.is_local(gid));
            EXPECT_EQ(p, m.gid_partition(gid));
        }
        for (const auto& c: m.cells()) {
            EXPECT_EQ(m.is_local(c.gid), m.gid_partition(c.gid)==p);
        }

        // Local gids are recorded on their population.
        std::size_t recorded = 0;
        for (const auto& pop: m.populations()) {
            for (auto gid: pop.cell_gids) {
                EXPECT_TRUE(m.is_local(gid));
                EXPECT_EQ(pop.id, m.population_of(gid));
            }
            recorded += pop.cell_gids.size();
        }
        EXPECT_EQ(seen.size(), recorded);
    }
    EXPECT_EQ(whole.num_cells(), total_local);
}

TEST(population_manager, errors) {
    network_parameters params;

    EXPECT_THROW(population_manager m(small_table(), params, 3, 3), bad_partition);
    EXPECT_THROW(population_manager m(small_table(), params, 0, 0), bad_partition);

    auto table = small_table();
    table[2].id = 5;
    EXPECT_THROW(population_manager m(table, params), bad_population_table);

    table = small_table();
    table[0].depth = {0.3, 0.1};
    EXPECT_THROW(population_manager m(table, params), bad_depth_range);

    population_manager m(small_table(), params);
    EXPECT_THROW(m.first_gid(0), laminar_internal_error);

    m.generate();
    EXPECT_THROW(m.generate(), laminar_internal_error);
    EXPECT_THROW(m.cell(m.num_cells()), bad_gid);
    EXPECT_THROW(m.population_of(m.num_cells()+10), bad_gid);
    EXPECT_THROW(m.get_population(3), bad_population_table);
}

TEST(population_manager, distinct_locations) {
    network_parameters params;
    params.sparseness = 0.1;

    population_manager m(default_populations(), params);
    m.generate();
    ASSERT_GT(m.num_cells(), 200u);

    std::set<std::pair<double, double>> locations;
    for (const auto& c: m.cells()) {
        locations.insert({c.location.x, c.location.z});
    }
    EXPECT_EQ(m.num_cells(), locations.size());
}
