#include <gtest/gtest.h>

#include "test.hpp"

#include <hetfeat/error.hpp>
#include <hetfeat/feature_table.hpp>

TEST(ResolveSelector, by_kind)
{
    HetNetwork const network = toy_network();
    NodeSelection const selection = resolve_selector(network, NodeSelector::of_kind("Beta"));
    EXPECT_EQ(selection.indices, (std::vector<NodeIndex>{ 2, 3, 4 }));
    EXPECT_EQ(selection.ids, (std::vector<std::string>{ "b1", "b2", "b3" }));
    EXPECT_EQ(selection.kind, "Beta");
    EXPECT_EQ(selection.column_name, "beta_id");
}

TEST(ResolveSelector, by_ids_and_indices)
{
    HetNetwork const network = toy_network();
    NodeSelection const by_ids = resolve_selector(network, NodeSelector::of_ids({ "c2", "c1" }));
    EXPECT_EQ(by_ids.indices, (std::vector<NodeIndex>{ 6, 5 }));
    EXPECT_EQ(by_ids.column_name, "gamma_id");

    NodeSelection const by_indices = resolve_selector(network, NodeSelector::of_indices({ 1 }));
    EXPECT_EQ(by_indices.ids, std::vector<std::string>{ "a2" });
}

TEST(ResolveSelector, invalid)
{
    HetNetwork const network = toy_network();
    EXPECT_THROW(resolve_selector(network, NodeSelector::of_kind("Delta")), InvalidSelector);
    EXPECT_THROW(resolve_selector(network, NodeSelector::of_ids({ "a1", "z9" })), InvalidSelector);
    EXPECT_THROW(resolve_selector(network, NodeSelector::of_ids({})), InvalidSelector);
    EXPECT_THROW(resolve_selector(network, NodeSelector::of_indices({ 7 })), InvalidSelector);
}

TEST(RestrictProduct, picks_selected_block)
{
    HetNetwork const network = toy_network();
    SparseMatrix product(7, 7);
    std::vector<Eigen::Triplet<real_t, int64_t>> entries = { { 0, 5, 1.5 }, { 1, 6, 2.5 }, { 0, 2, 9 } };
    product.setFromTriplets(entries.begin(), entries.end());

    NodeSelection const start = resolve_selector(network, NodeSelector::of_kind("Alpha"));
    NodeSelection const end = resolve_selector(network, NodeSelector::of_ids({ "c1", "c2", "c1" }));
    std::vector<real_t> const block = restrict_product(product, start, end);
    EXPECT_EQ(block, (std::vector<real_t>{ 1.5, 0, 1.5, 0, 2.5, 0 }));
}

TEST(PairTable, layout)
{
    HetNetwork const network = toy_network();
    NodeSelection const start = resolve_selector(network, NodeSelector::of_kind("Alpha"));
    NodeSelection const end = resolve_selector(network, NodeSelector::of_kind("Gamma"));
    FeatureTable table(start, end, { "x", "y" });

    ASSERT_EQ(table.get_row_num(), 4u);
    EXPECT_EQ(table.get_column_num(), 2u);
    EXPECT_EQ(table.get_start_column(), "alpha_id");
    EXPECT_EQ(table.get_end_column(), "gamma_id");
    EXPECT_EQ(table.get_start_id(1), "a1");
    EXPECT_EQ(table.get_end_id(1), "c2");
    EXPECT_EQ(table.get_start_id(2), "a2");

    table.set_column(1, { 1, 2, 3, 4 });
    EXPECT_EQ(table.at(2, 1), 3);
    EXPECT_EQ(table.at(2, 0), 0);
    EXPECT_EQ(table.column("y"), (std::vector<real_t>{ 1, 2, 3, 4 }));
    EXPECT_EQ(table.column_index("x"), 0u);
    EXPECT_THROW(table.column("z"), std::out_of_range);
    EXPECT_THROW(table.set_column(0, { 1 }), std::invalid_argument);
}

GTEST_API_ int main(int argc, char* argv[])
{
    MPI_Instance mpi_instance(&argc, &argv);
    ::testing::InitGoogleTest(&argc, argv);
    mute_nonroot_gtest_events();
    int result = RUN_ALL_TESTS();
    return result;
}
